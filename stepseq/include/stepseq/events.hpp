#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace stepseq {

/// Transport advanced by one step
struct StepEvent {
    int step = 0;        // step that was just performed
    int next_step = 0;
    std::uint64_t cycle = 0;
    int track_count = 0; // tracks that played this step
};

/// A queued pad became active at a local boundary
struct PadSwitchedEvent {
    std::string track_id;
    int active_pad = 0;
    std::uint64_t cycle = 0;
};

/// A MIDI send failed; the sequencer kept running
struct MidiErrorEvent {
    std::string message;
};

using EventPayload = std::variant<StepEvent, PadSwitchedEvent, MidiErrorEvent>;

struct Event {
    std::string session_id;
    EventPayload payload;
};

/// Wire name of an event: "sequencer_step", "sequencer_pad_switched"
/// or "sequencer_midi_error"
[[nodiscard]] std::string_view event_type(const EventPayload& payload);

/// Receiver of sequencer events.
///
/// publish() is called from the scheduling thread and must not block.
class EventPublisher {
public:
    virtual ~EventPublisher() = default;
    virtual void publish(const std::string& session_id, EventPayload payload) = 0;
};

/// Bounded queue handing events from the scheduling thread to the thread
/// that owns the session. When full the oldest event is dropped; after
/// close() every event is dropped.
class EventChannel : public EventPublisher {
public:
    static constexpr std::size_t DEFAULT_CAPACITY = 256;

    explicit EventChannel(std::size_t capacity = DEFAULT_CAPACITY);

    void publish(const std::string& session_id, EventPayload payload) override;

    /// Take every queued event, oldest first
    [[nodiscard]] std::vector<Event> drain();

    /// Stop accepting events; queued events can still be drained
    void close();

    [[nodiscard]] bool closed() const;
    [[nodiscard]] std::size_t size() const;
    [[nodiscard]] std::size_t capacity() const { return capacity_; }

    /// Events lost to overflow or closure
    [[nodiscard]] std::uint64_t dropped() const;

private:
    mutable std::mutex mutex_;
    std::deque<Event> queue_;
    std::size_t capacity_;
    bool closed_ = false;
    std::uint64_t dropped_ = 0;
};

} // namespace stepseq
