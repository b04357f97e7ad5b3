#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stepseq {

constexpr int MAX_PADS = 8;
constexpr int MIN_BPM = 30;
constexpr int MAX_BPM = 300;
constexpr int DEFAULT_BPM = 120;
constexpr int DEFAULT_STEP_COUNT = 16;
constexpr int MAX_STEP_COUNT = 32;

/// One slot of a pattern: zero or more notes, optionally holding the
/// previous notes when empty
struct Step {
    std::vector<std::uint8_t> notes;        // distinct, in listed order
    bool hold = false;
    std::optional<std::uint8_t> velocity;   // overrides the track velocity

    [[nodiscard]] bool empty() const { return notes.empty(); }
};

/// Pattern stored under a pad index
struct PadConfig {
    int pad_index = 0;
    std::vector<Step> steps;  // padded or truncated to the track's step count
};

struct TrackConfig {
    std::string track_id;
    int midi_channel = 1;                 // 1..16
    int step_count = DEFAULT_STEP_COUNT;  // 16 or 32
    int velocity = 100;                   // 1..127
    double gate_ratio = 0.8;              // (0, 1]
    bool enabled = true;
    std::optional<bool> queued_enabled;
    int active_pad = 0;
    std::optional<int> queued_pad;
    std::vector<PadConfig> pads;
};

struct SequencerConfig {
    int bpm = DEFAULT_BPM;
    std::vector<TrackConfig> tracks;
};

/// Build a step from a note list, clamping to 0..127 and dropping repeats
Step make_step(const std::vector<int>& notes, bool hold = false,
               std::optional<int> velocity = std::nullopt);

/// Pad or truncate `steps` to exactly `step_count` entries
std::vector<Step> normalize_steps(std::vector<Step> steps, int step_count);

/// Check ranges and uniqueness of a configuration
/// @throws SequencerError (InvalidConfig)
void validate_config(const SequencerConfig& config);

/// Configuration used when start() is called before configure():
/// track "voice-1" on channel 1 with one empty 16-step pad
SequencerConfig default_config();

} // namespace stepseq
