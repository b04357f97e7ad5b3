#pragma once

#include "track.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stepseq {

struct TrackStatus {
    std::string track_id;
    int midi_channel = 1;
    int step_count = DEFAULT_STEP_COUNT;
    int local_step = 0;   // current_step mod step_count
    int velocity = 100;
    double gate_ratio = 0.8;
    int active_pad = 0;
    std::optional<int> queued_pad;
    bool enabled = false;
    std::optional<bool> queued_enabled;
    std::vector<std::uint8_t> active_notes;  // ascending
};

/// Snapshot of the sequencer, safe to hand to another thread
struct SequencerStatus {
    std::string session_id;
    bool running = false;
    int bpm = DEFAULT_BPM;
    int step_count = DEFAULT_STEP_COUNT;  // transport step count
    int current_step = 0;
    std::uint64_t cycle = 0;
    std::vector<TrackStatus> tracks;

    /// Track by id, nullptr if absent
    [[nodiscard]] const TrackStatus* find_track(const std::string& id) const {
        for (const auto& track : tracks) {
            if (track.track_id == id) return &track;
        }
        return nullptr;
    }
};

} // namespace stepseq
