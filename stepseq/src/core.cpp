#include "stepseq/core.hpp"
#include "stepseq/error.hpp"
#include "stepseq/transport.hpp"
#include <algorithm>

namespace stepseq {

SequencerCore::TrackState SequencerCore::build_track(const TrackConfig& config) {
    TrackState track;
    track.track_id = config.track_id;
    track.midi_channel = config.midi_channel;
    track.step_count = config.step_count;
    track.velocity = config.velocity;
    track.gate_ratio = config.gate_ratio;
    track.enabled = config.enabled;
    track.queued_enabled = config.queued_enabled;
    track.active_pad = config.active_pad;

    // Every pad slot exists; unconfigured pads are empty patterns
    for (int index = 0; index < MAX_PADS; ++index) {
        track.pads[index] = std::vector<Step>(static_cast<std::size_t>(config.step_count));
    }
    for (const auto& pad : config.pads) {
        track.pads[pad.pad_index] = normalize_steps(pad.steps, config.step_count);
    }
    track.queued_pad = config.queued_pad;
    return track;
}

void SequencerCore::configure(const SequencerConfig& config, StepOutput& out) {
    validate_config(config);

    std::vector<TrackState> next;
    next.reserve(config.tracks.size());
    for (const auto& track_config : config.tracks) {
        next.push_back(build_track(track_config));
    }

    for (auto& old : tracks_) {
        auto it = std::find_if(next.begin(), next.end(), [&](const TrackState& t) {
            return t.track_id == old.track_id;
        });
        bool keep = it != next.end() &&
                    it->midi_channel == old.midi_channel &&
                    (it->enabled || !old.enabled);
        if (keep) {
            it->sounding = std::move(old.sounding);
        } else if (!old.sounding.empty()) {
            silence(old, out);
        }
    }

    tracks_ = std::move(next);
    bpm_ = config.bpm;
    configured_ = true;
    refresh_transport();
    current_step_ %= transport_steps_;
}

void SequencerCore::ensure_configured() {
    if (configured_) return;
    StepOutput unused;
    configure(default_config(), unused);
}

void SequencerCore::queue_pad(const std::string& track_id, int pad_index, bool running) {
    TrackState* track = find_track(track_id);
    if (!track) {
        throw SequencerError(SequencerError::Kind::InvalidReference,
                             "Track '" + track_id + "' is not configured.");
    }
    if (pad_index < 0 || pad_index >= MAX_PADS) {
        throw SequencerError(SequencerError::Kind::InvalidReference,
                             "Pad '" + std::to_string(pad_index) +
                             "' is out of range for track '" + track_id + "'.");
    }

    if (running) {
        track->queued_pad = pad_index;
    } else {
        track->active_pad = pad_index;
        track->queued_pad.reset();
        current_step_ = 0;
    }
}

void SequencerCore::perform_step(StepOutput& out) {
    const int step_index = current_step_;
    int playing = 0;

    for (auto& track : tracks_) {
        auto pad = track.pads.find(track.active_pad);
        if (!track.enabled || pad == track.pads.end()) {
            release(track, out);
            continue;
        }
        ++playing;

        const Step& step = pad->second[static_cast<std::size_t>(step_index % track.step_count)];
        if (!step.empty()) {
            release(track, out);
            auto velocity = step.velocity.value_or(static_cast<std::uint8_t>(track.velocity));
            for (auto note : step.notes) {
                out.messages.push_back(note_on(track.midi_channel, note, velocity));
                track.sounding.insert(note);
            }
        } else if (!step.hold) {
            release(track, out);
        }
    }

    const int next_step = (current_step_ + 1) % transport_steps_;
    if (next_step == 0) {
        ++cycle_;
    }

    std::vector<EventPayload> switches;
    for (auto& track : tracks_) {
        const bool boundary = is_local_boundary(next_step, track.step_count);

        if (track.queued_enabled) {
            if (*track.queued_enabled) {
                if (can_enable_at(track, next_step)) {
                    track.enabled = true;
                    track.queued_enabled.reset();
                }
            } else if (!track.enabled) {
                track.queued_enabled.reset();
            } else if (boundary) {
                track.enabled = false;
                track.queued_enabled.reset();
                release(track, out);
            }
        }

        if (boundary && track.queued_pad) {
            if (*track.queued_pad != track.active_pad) {
                track.active_pad = *track.queued_pad;
                switches.push_back(PadSwitchedEvent{track.track_id, track.active_pad, cycle_});
            }
            track.queued_pad.reset();
        }
    }

    current_step_ = next_step;
    refresh_transport();
    current_step_ %= transport_steps_;

    out.events.push_back(StepEvent{step_index, current_step_, cycle_, playing});
    for (auto& event : switches) {
        out.events.push_back(std::move(event));
    }
}

void SequencerCore::flush(StepOutput& out) {
    for (auto& track : tracks_) {
        silence(track, out);
    }
}

SequencerStatus SequencerCore::status(bool running) const {
    SequencerStatus status;
    status.running = running;
    status.bpm = bpm_;
    status.step_count = transport_steps_;
    status.current_step = current_step_;
    status.cycle = cycle_;

    status.tracks.reserve(tracks_.size());
    for (const auto& track : tracks_) {
        status.tracks.push_back(TrackStatus{
            .track_id = track.track_id,
            .midi_channel = track.midi_channel,
            .step_count = track.step_count,
            .local_step = current_step_ % track.step_count,
            .velocity = track.velocity,
            .gate_ratio = track.gate_ratio,
            .active_pad = track.active_pad,
            .queued_pad = track.queued_pad,
            .enabled = track.enabled,
            .queued_enabled = track.queued_enabled,
            .active_notes = {track.sounding.begin(), track.sounding.end()}
        });
    }
    return status;
}

SequencerCore::TrackState* SequencerCore::find_track(const std::string& track_id) {
    for (auto& track : tracks_) {
        if (track.track_id == track_id) return &track;
    }
    return nullptr;
}

void SequencerCore::release(TrackState& track, StepOutput& out) {
    for (auto note : track.sounding) {
        out.messages.push_back(note_off(track.midi_channel, note));
    }
    track.sounding.clear();
}

void SequencerCore::silence(TrackState& track, StepOutput& out) {
    release(track, out);
    out.messages.push_back(control_change(track.midi_channel, CC_ALL_NOTES_OFF, 0));
    out.messages.push_back(control_change(track.midi_channel, CC_ALL_SOUND_OFF, 0));
}

bool SequencerCore::can_enable_at(const TrackState& candidate, int next_step) const {
    for (const auto& other : tracks_) {
        if (&other == &candidate || !other.enabled) continue;
        if (!is_local_boundary(next_step, other.step_count)) return false;
    }
    return true;
}

void SequencerCore::refresh_transport() {
    std::vector<int> counts;
    for (const auto& track : tracks_) {
        if (track.enabled) counts.push_back(track.step_count);
    }
    transport_steps_ = stepseq::transport_step_count(counts);
}

} // namespace stepseq
