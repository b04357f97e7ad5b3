#pragma once

#include "events.hpp"
#include "midi.hpp"
#include "status.hpp"
#include "track.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace stepseq {

/// Messages and events produced by one core operation, in emission order
struct StepOutput {
    std::vector<MidiMessage> messages;
    std::vector<EventPayload> events;
};

/// Sequencer state machine without threads or I/O.
///
/// Every operation appends the MIDI it wants sent to a StepOutput; the caller
/// owns locking, timing and delivery.
class SequencerCore {
public:
    [[nodiscard]] bool configured() const { return configured_; }

    /// Replace the configuration in place. Tracks that disappear, change
    /// channel or become disabled are silenced first; the others keep their
    /// sounding notes.
    /// @throws SequencerError (InvalidConfig) before anything changes
    void configure(const SequencerConfig& config, StepOutput& out);

    /// Install default_config() if nothing was configured yet
    void ensure_configured();

    /// While running the pad is queued for the track's next local boundary;
    /// while stopped it becomes active at once and the transport rewinds.
    /// @throws SequencerError (InvalidReference) for an unknown track or pad
    void queue_pad(const std::string& track_id, int pad_index, bool running);

    /// Play the current step, then advance the transport and commit queued
    /// pad and enable changes at their boundaries
    void perform_step(StepOutput& out);

    /// Note off for every sounding note, then all-notes-off and
    /// all-sound-off on every track's channel
    void flush(StepOutput& out);

    void reset_position() { current_step_ = 0; }

    [[nodiscard]] SequencerStatus status(bool running) const;

    [[nodiscard]] int bpm() const { return bpm_; }
    [[nodiscard]] int transport_step_count() const { return transport_steps_; }
    [[nodiscard]] int current_step() const { return current_step_; }
    [[nodiscard]] std::uint64_t cycle() const { return cycle_; }

private:
    struct TrackState {
        std::string track_id;
        int midi_channel = 1;
        int step_count = DEFAULT_STEP_COUNT;
        int velocity = 100;
        double gate_ratio = 0.8;
        bool enabled = false;
        std::optional<bool> queued_enabled;
        int active_pad = 0;
        std::optional<int> queued_pad;
        std::map<int, std::vector<Step>> pads;  // all MAX_PADS slots
        std::set<std::uint8_t> sounding;
    };

    static TrackState build_track(const TrackConfig& config);

    [[nodiscard]] TrackState* find_track(const std::string& track_id);

    /// Note off for each sounding note, ascending
    static void release(TrackState& track, StepOutput& out);

    /// release() plus the controller safety pair on the track's channel
    static void silence(TrackState& track, StepOutput& out);

    /// Every other enabled track sits on its own local boundary
    [[nodiscard]] bool can_enable_at(const TrackState& candidate, int next_step) const;

    void refresh_transport();

    bool configured_ = false;
    int bpm_ = DEFAULT_BPM;
    int transport_steps_ = DEFAULT_STEP_COUNT;
    int current_step_ = 0;
    std::uint64_t cycle_ = 0;
    std::vector<TrackState> tracks_;  // configuration order
};

} // namespace stepseq
