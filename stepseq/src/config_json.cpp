#include "stepseq/config_json.hpp"
#include <algorithm>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

using nlohmann::json;

namespace stepseq {

namespace {

[[noreturn]] void fail(std::string_view origin, const std::string& message) {
    throw std::runtime_error(std::string(origin) + ": " + message);
}

// Wide read of an integral JSON number, saturated to the int64 range
std::int64_t wide_integer(const json& v) {
    if (v.is_number_unsigned()) {
        auto u = v.get<std::uint64_t>();
        if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::numeric_limits<std::int64_t>::max();
        }
        return static_cast<std::int64_t>(u);
    }
    return v.get<std::int64_t>();
}

int integer_field(const json& j, const char* key, int fallback, std::string_view origin,
                  const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return fallback;
    if (!j.at(key).is_number_integer()) {
        fail(origin, where + " field '" + key + "' must be an integer");
    }
    auto value = wide_integer(j.at(key));
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
        fail(origin, where + " field '" + key + "' is out of range");
    }
    return static_cast<int>(value);
}

// Notes are clamped to 0..127 later; saturate here so huge values stay high
int note_value(const json& v) {
    return static_cast<int>(std::clamp<std::int64_t>(wide_integer(v),
                                                     std::numeric_limits<int>::min(),
                                                     std::numeric_limits<int>::max()));
}

std::optional<bool> optional_bool(const json& j, const char* key, std::string_view origin,
                                  const std::string& where) {
    if (!j.contains(key) || j.at(key).is_null()) return std::nullopt;
    if (!j.at(key).is_boolean()) {
        fail(origin, where + " field '" + key + "' must be a boolean");
    }
    return j.at(key).get<bool>();
}

std::vector<int> note_list(const json& j, std::string_view origin, const std::string& where) {
    if (j.is_number_integer()) return {note_value(j)};
    if (!j.is_array()) {
        fail(origin, where + " must be null, a note, a list of notes or an object");
    }
    std::vector<int> notes;
    for (const auto& entry : j) {
        if (!entry.is_number_integer()) {
            fail(origin, where + " notes must be integers");
        }
        notes.push_back(note_value(entry));
    }
    return notes;
}

Step parse_step(const json& j, std::string_view origin, const std::string& where) {
    if (j.is_null()) return Step{};
    if (!j.is_object()) return make_step(note_list(j, origin, where));

    std::vector<int> notes;
    if (j.contains("notes") && !j.at("notes").is_null()) {
        notes = note_list(j.at("notes"), origin, where);
    } else if (j.contains("note") && !j.at("note").is_null()) {
        notes = note_list(j.at("note"), origin, where);
    }
    bool hold = optional_bool(j, "hold", origin, where).value_or(false);
    std::optional<int> velocity;
    if (j.contains("velocity") && !j.at("velocity").is_null()) {
        velocity = integer_field(j, "velocity", 0, origin, where);
    }
    return make_step(notes, hold, velocity);
}

PadConfig parse_pad(const json& j, int step_count, std::string_view origin,
                    const std::string& track_id) {
    if (!j.is_object()) {
        fail(origin, "track '" + track_id + "' pad must be an object");
    }
    PadConfig pad;
    pad.pad_index = integer_field(j, "pad_index", 0, origin, "track '" + track_id + "' pad");
    const std::string where = "track '" + track_id + "' pad " + std::to_string(pad.pad_index);

    if (j.contains("steps")) {
        if (!j.at("steps").is_array()) {
            fail(origin, where + " steps must be an array");
        }
        int index = 0;
        for (const auto& entry : j.at("steps")) {
            pad.steps.push_back(parse_step(entry, origin, where + " step " + std::to_string(index)));
            ++index;
        }
    }
    pad.steps = normalize_steps(std::move(pad.steps), step_count);
    return pad;
}

TrackConfig parse_track(const json& j, std::string_view origin) {
    if (!j.is_object()) {
        fail(origin, "track must be an object");
    }
    if (!j.contains("track_id") || !j.at("track_id").is_string()) {
        fail(origin, "track requires string field 'track_id'");
    }

    TrackConfig track;
    track.track_id = j.at("track_id").get<std::string>();
    const std::string where = "track '" + track.track_id + "'";

    track.midi_channel = integer_field(j, "midi_channel", track.midi_channel, origin, where);
    track.step_count = integer_field(j, "step_count", track.step_count, origin, where);
    track.velocity = integer_field(j, "velocity", track.velocity, origin, where);
    if (j.contains("gate_ratio") && !j.at("gate_ratio").is_null()) {
        if (!j.at("gate_ratio").is_number()) {
            fail(origin, where + " field 'gate_ratio' must be a number");
        }
        track.gate_ratio = j.at("gate_ratio").get<double>();
    }
    track.enabled = optional_bool(j, "enabled", origin, where).value_or(true);
    track.queued_enabled = optional_bool(j, "queued_enabled", origin, where);
    track.active_pad = integer_field(j, "active_pad", 0, origin, where);
    if (j.contains("queued_pad") && !j.at("queued_pad").is_null()) {
        track.queued_pad = integer_field(j, "queued_pad", 0, origin, where);
    }

    if (j.contains("pads")) {
        if (!j.at("pads").is_array()) {
            fail(origin, where + " pads must be an array");
        }
        for (const auto& pad : j.at("pads")) {
            track.pads.push_back(parse_pad(pad, track.step_count, origin, track.track_id));
        }
    }
    return track;
}

json optional_json(const std::optional<int>& value) {
    return value ? json(*value) : json(nullptr);
}

json optional_json(const std::optional<bool>& value) {
    return value ? json(*value) : json(nullptr);
}

} // namespace

SequencerConfig parse_performance(std::string_view text, std::string_view origin) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        fail(origin, std::string("invalid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        fail(origin, "performance document must be an object");
    }

    // The transport length is derived from the enabled tracks, so a
    // top-level "step_count" is accepted and ignored.
    SequencerConfig config;
    config.bpm = integer_field(j, "bpm", DEFAULT_BPM, origin, "performance");

    if (j.contains("tracks")) {
        if (!j.at("tracks").is_array()) {
            fail(origin, "tracks must be an array");
        }
        for (const auto& track : j.at("tracks")) {
            config.tracks.push_back(parse_track(track, origin));
        }
    }
    return config;
}

SequencerConfig load_performance_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Failed to open file: " + path);
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return parse_performance(ss.str(), path);
}

json status_to_json(const SequencerStatus& status) {
    json tracks = json::array();
    for (const auto& track : status.tracks) {
        tracks.push_back({
            {"track_id", track.track_id},
            {"midi_channel", track.midi_channel},
            {"step_count", track.step_count},
            {"local_step", track.local_step},
            {"velocity", track.velocity},
            {"gate_ratio", track.gate_ratio},
            {"active_pad", track.active_pad},
            {"queued_pad", optional_json(track.queued_pad)},
            {"enabled", track.enabled},
            {"queued_enabled", optional_json(track.queued_enabled)},
            {"active_notes", track.active_notes},
        });
    }
    return {
        {"session_id", status.session_id},
        {"running", status.running},
        {"bpm", status.bpm},
        {"step_count", status.step_count},
        {"current_step", status.current_step},
        {"cycle", status.cycle},
        {"tracks", std::move(tracks)},
    };
}

json event_to_json(const Event& event) {
    json payload;
    if (const auto* step = std::get_if<StepEvent>(&event.payload)) {
        payload = {{"step", step->step}, {"next_step", step->next_step},
                   {"cycle", step->cycle}, {"track_count", step->track_count}};
    } else if (const auto* pad = std::get_if<PadSwitchedEvent>(&event.payload)) {
        payload = {{"track_id", pad->track_id}, {"active_pad", pad->active_pad},
                   {"cycle", pad->cycle}};
    } else if (const auto* error = std::get_if<MidiErrorEvent>(&event.payload)) {
        payload = {{"message", error->message}};
    }
    return {
        {"session_id", event.session_id},
        {"type", std::string(event_type(event.payload))},
        {"payload", std::move(payload)},
    };
}

} // namespace stepseq
