#include "stepseq/engine.hpp"
#include "stepseq/clock.hpp"
#include <atomic>
#include <future>
#include <iostream>
#include <mutex>
#include <thread>

namespace stepseq {

// ============================================================================
// Shared state
// ============================================================================

struct SequencerEngine::State {
    std::string session_id;
    mutable std::recursive_mutex mutex;
    SequencerCore core;
    bool running = false;
    std::shared_ptr<MidiSink> sink;
    std::string midi_input;
    std::shared_ptr<EventPublisher> publisher;

    /// Send every message of `out`; failures are appended as events.
    /// Caller holds the mutex.
    void deliver(StepOutput& out) {
        for (const auto& message : out.messages) {
            std::string failure;
            try {
                if (!sink) {
                    failure = "no MIDI sink attached";
                } else if (!sink->send(midi_input, message)) {
                    failure = "MIDI sink rejected " + format_midi(message);
                }
            } catch (const std::exception& e) {
                failure = e.what();
            }
            if (!failure.empty()) {
                std::cerr << "warning: sequencer MIDI message failed: " << failure << "\n";
                out.events.push_back(MidiErrorEvent{std::move(failure)});
            }
        }
        out.messages.clear();
    }

    /// Hand events to the publisher. Called without the mutex.
    void publish(std::vector<EventPayload> events) {
        if (!publisher) return;
        for (auto& event : events) {
            try {
                publisher->publish(session_id, std::move(event));
            } catch (const std::exception& e) {
                std::cerr << "warning: sequencer event dropped: " << e.what() << "\n";
            }
        }
    }

    [[nodiscard]] SequencerStatus status_locked() const {
        auto status = core.status(running);
        status.session_id = session_id;
        return status;
    }
};

struct SequencerEngine::LoopHandle {
    std::shared_ptr<std::atomic<bool>> stop;
    std::thread thread;
    std::future<void> done;
};

namespace {

// Join a finished loop, or detach one that outlived the timeout. The thread
// keeps its own reference to the shared state.
void finish_loop(std::thread& thread, std::future<void>& done,
                 std::chrono::milliseconds timeout) {
    if (!thread.joinable()) return;
    if (done.wait_for(timeout) == std::future_status::ready) {
        thread.join();
    } else {
        std::cerr << "warning: sequencer thread did not stop within "
                  << timeout.count() << " ms; detaching\n";
        thread.detach();
    }
}

} // namespace

// ============================================================================
// Scheduling loop
// ============================================================================

void SequencerEngine::run_loop(std::shared_ptr<State> state,
                               std::shared_ptr<std::atomic<bool>> stop,
                               std::promise<void> done) {
    try {
        StepClock clock;
        clock.reset(StepClock::Clock::now());

        while (!stop->load(std::memory_order_acquire)) {
            const auto now = StepClock::Clock::now();
            StepClock::Seconds step{};
            {
                std::lock_guard<std::recursive_mutex> lock(state->mutex);
                if (!state->running) break;
                step = step_duration(state->core.bpm());
            }

            const auto poll = clock.poll(now);
            if (poll.action == StepClock::Action::Sleep) {
                std::this_thread::sleep_for(poll.sleep_for);
                continue;
            }
            if (poll.action == StepClock::Action::Spin) {
                continue;
            }

            StepOutput out;
            {
                std::lock_guard<std::recursive_mutex> lock(state->mutex);
                if (!state->running || stop->load(std::memory_order_acquire)) break;
                state->core.perform_step(out);
                state->deliver(out);
            }
            state->publish(std::move(out.events));
            clock.advance(now, step);
        }
    } catch (const std::exception& e) {
        std::cerr << "error: sequencer loop stopped: " << e.what() << "\n";
        std::lock_guard<std::recursive_mutex> lock(state->mutex);
        state->running = false;
    }
    done.set_value();
}

// ============================================================================
// SequencerEngine
// ============================================================================

SequencerEngine::SequencerEngine(std::string session_id, std::shared_ptr<MidiSink> sink,
                                 std::string midi_input,
                                 std::shared_ptr<EventPublisher> publisher)
    : session_id_(std::move(session_id)), state_(std::make_shared<State>()) {
    state_->session_id = session_id_;
    state_->sink = std::move(sink);
    state_->midi_input = std::move(midi_input);
    state_->publisher = std::move(publisher);
}

SequencerEngine::~SequencerEngine() {
    shutdown();
    if (loop_) {
        finish_loop(loop_->thread, loop_->done, STOP_TIMEOUT);
    }
}

SequencerStatus SequencerEngine::configure(const SequencerConfig& config) {
    StepOutput out;
    SequencerStatus status;
    {
        std::lock_guard<std::recursive_mutex> lock(state_->mutex);
        state_->core.configure(config, out);
        state_->deliver(out);
        status = state_->status_locked();
    }
    state_->publish(std::move(out.events));
    return status;
}

SequencerStatus SequencerEngine::start() {
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    state_->core.ensure_configured();
    if (state_->running) {
        return state_->status_locked();
    }

    // A loop that ended on its own is already done
    if (loop_) {
        finish_loop(loop_->thread, loop_->done, STOP_TIMEOUT);
        loop_.reset();
    }

    auto handle = std::make_unique<LoopHandle>();
    handle->stop = std::make_shared<std::atomic<bool>>(false);
    std::promise<void> done;
    handle->done = done.get_future();

    state_->running = true;
    handle->thread = std::thread(run_loop, state_, handle->stop, std::move(done));
    loop_ = std::move(handle);
    return state_->status_locked();
}

SequencerStatus SequencerEngine::stop() {
    std::unique_ptr<LoopHandle> loop;
    {
        std::lock_guard<std::recursive_mutex> lock(state_->mutex);
        if (!state_->running) {
            state_->core.reset_position();
            return state_->status_locked();
        }
        state_->running = false;
        loop = std::move(loop_);
        if (loop) {
            loop->stop->store(true, std::memory_order_release);
        }
    }

    // The loop takes the mutex on every iteration; wait without holding it
    if (loop) {
        finish_loop(loop->thread, loop->done, STOP_TIMEOUT);
    }

    StepOutput out;
    SequencerStatus status;
    {
        std::lock_guard<std::recursive_mutex> lock(state_->mutex);
        state_->core.reset_position();
        state_->core.flush(out);
        state_->deliver(out);
        status = state_->status_locked();
    }
    state_->publish(std::move(out.events));
    return status;
}

void SequencerEngine::shutdown() {
    stop();
}

SequencerStatus SequencerEngine::queue_pad(const std::string& track_id, int pad_index) {
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    state_->core.ensure_configured();
    state_->core.queue_pad(track_id, pad_index, state_->running);
    return state_->status_locked();
}

SequencerStatus SequencerEngine::status() const {
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    return state_->status_locked();
}

void SequencerEngine::set_midi_input(std::string selector) {
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    state_->midi_input = std::move(selector);
}

bool SequencerEngine::running() const {
    std::lock_guard<std::recursive_mutex> lock(state_->mutex);
    return state_->running;
}

} // namespace stepseq
