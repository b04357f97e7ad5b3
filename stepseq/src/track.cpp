#include "stepseq/track.hpp"
#include "stepseq/error.hpp"
#include "stepseq/midi.hpp"
#include <algorithm>
#include <set>

namespace stepseq {

namespace {

[[noreturn]] void invalid(const std::string& message) {
    throw SequencerError(SequencerError::Kind::InvalidConfig, message);
}

} // namespace

Step make_step(const std::vector<int>& notes, bool hold, std::optional<int> velocity) {
    Step step;
    step.hold = hold;
    for (int value : notes) {
        auto note = clamp_data_byte(value);
        if (std::find(step.notes.begin(), step.notes.end(), note) == step.notes.end()) {
            step.notes.push_back(note);
        }
    }
    if (velocity) {
        step.velocity = static_cast<std::uint8_t>(std::clamp(*velocity, 1, 127));
    }
    return step;
}

std::vector<Step> normalize_steps(std::vector<Step> steps, int step_count) {
    steps.resize(static_cast<std::size_t>(std::clamp(step_count, 0, MAX_STEP_COUNT)));
    return steps;
}

void validate_config(const SequencerConfig& config) {
    if (config.bpm < MIN_BPM || config.bpm > MAX_BPM) {
        invalid("BPM must be between " + std::to_string(MIN_BPM) + " and " +
                std::to_string(MAX_BPM) + " (got " + std::to_string(config.bpm) + ").");
    }

    std::set<std::string> seen;
    for (const auto& track : config.tracks) {
        if (track.track_id.empty()) {
            invalid("Track id must not be empty.");
        }
        if (!seen.insert(track.track_id).second) {
            invalid("Track '" + track.track_id + "' is configured more than once.");
        }
        const std::string prefix = "Track '" + track.track_id + "': ";
        if (track.midi_channel < 1 || track.midi_channel > 16) {
            invalid(prefix + "MIDI channel must be between 1 and 16.");
        }
        if (track.step_count != 16 && track.step_count != 32) {
            invalid(prefix + "step count must be 16 or 32.");
        }
        if (track.velocity < 1 || track.velocity > 127) {
            invalid(prefix + "velocity must be between 1 and 127.");
        }
        if (!(track.gate_ratio > 0.0 && track.gate_ratio <= 1.0)) {
            invalid(prefix + "gate ratio must be in (0, 1].");
        }
        if (track.active_pad < 0 || track.active_pad >= MAX_PADS) {
            invalid(prefix + "active pad must be between 0 and 7.");
        }
        if (track.queued_pad && (*track.queued_pad < 0 || *track.queued_pad >= MAX_PADS)) {
            invalid(prefix + "queued pad must be between 0 and 7.");
        }
        if (track.pads.size() > static_cast<std::size_t>(MAX_PADS)) {
            invalid(prefix + "at most 8 pads are allowed.");
        }
        for (const auto& pad : track.pads) {
            if (pad.pad_index < 0 || pad.pad_index >= MAX_PADS) {
                invalid(prefix + "pad index must be between 0 and 7 (got " +
                        std::to_string(pad.pad_index) + ").");
            }
        }
    }
}

SequencerConfig default_config() {
    TrackConfig track;
    track.track_id = "voice-1";
    track.midi_channel = 1;
    track.pads.push_back(PadConfig{0, std::vector<Step>(DEFAULT_STEP_COUNT)});

    SequencerConfig config;
    config.tracks.push_back(std::move(track));
    return config;
}

} // namespace stepseq
