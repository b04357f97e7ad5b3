#include "stepseq/events.hpp"
#include <algorithm>
#include <iterator>

namespace stepseq {

std::string_view event_type(const EventPayload& payload) {
    if (std::holds_alternative<StepEvent>(payload)) return "sequencer_step";
    if (std::holds_alternative<PadSwitchedEvent>(payload)) return "sequencer_pad_switched";
    return "sequencer_midi_error";
}

EventChannel::EventChannel(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)) {}

void EventChannel::publish(const std::string& session_id, EventPayload payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        ++dropped_;
        return;
    }
    if (queue_.size() >= capacity_) {
        queue_.pop_front();
        ++dropped_;
    }
    queue_.push_back(Event{session_id, std::move(payload)});
}

std::vector<Event> EventChannel::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Event> events(std::make_move_iterator(queue_.begin()),
                              std::make_move_iterator(queue_.end()));
    queue_.clear();
    return events;
}

void EventChannel::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
}

bool EventChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

std::size_t EventChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

std::uint64_t EventChannel::dropped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}

} // namespace stepseq
