#pragma once

#include "core.hpp"
#include "events.hpp"
#include "midi.hpp"
#include "status.hpp"
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <string>

namespace stepseq {

/// Threaded step sequencer for one session.
///
/// All state sits behind a single recursive mutex. start() spawns the
/// scheduling thread once; stop() signals it, waits up to STOP_TIMEOUT
/// without holding the lock, then flushes sounding notes and rewinds the
/// transport. MIDI failures are logged as warnings and published as
/// sequencer_midi_error events; they never stop the scheduler.
class SequencerEngine {
public:
    static constexpr std::chrono::seconds STOP_TIMEOUT{1};

    /// @param publisher may be null, events are then dropped
    SequencerEngine(std::string session_id, std::shared_ptr<MidiSink> sink,
                    std::string midi_input, std::shared_ptr<EventPublisher> publisher);
    ~SequencerEngine();

    SequencerEngine(const SequencerEngine&) = delete;
    SequencerEngine& operator=(const SequencerEngine&) = delete;

    /// Apply a configuration immediately, running or not
    /// @throws SequencerError (InvalidConfig)
    SequencerStatus configure(const SequencerConfig& config);

    /// Idempotent; installs the default configuration when none was given
    SequencerStatus start();

    SequencerStatus stop();

    /// Stop and release every note; the engine stays usable
    void shutdown();

    /// @throws SequencerError (InvalidReference)
    SequencerStatus queue_pad(const std::string& track_id, int pad_index);

    [[nodiscard]] SequencerStatus status() const;

    /// Rebind the MIDI input selector passed to the sink
    void set_midi_input(std::string selector);

    [[nodiscard]] bool running() const;
    [[nodiscard]] const std::string& session_id() const { return session_id_; }

private:
    struct State;
    struct LoopHandle;

    static void run_loop(std::shared_ptr<State> state,
                         std::shared_ptr<std::atomic<bool>> stop,
                         std::promise<void> done);

    std::string session_id_;
    std::shared_ptr<State> state_;       // shared with the scheduling thread
    std::unique_ptr<LoopHandle> loop_;   // present while a thread is running
};

} // namespace stepseq
