#include <catch2/catch_test_macros.hpp>
#include "stepseq/engine.hpp"
#include "stepseq/error.hpp"
#include <chrono>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace stepseq;
using namespace std::chrono_literals;

namespace {

class RecordingSink : public MidiSink {
public:
    bool send(std::string_view selector, const MidiMessage& message) override {
        std::lock_guard<std::mutex> lock(mutex_);
        selectors_.emplace_back(selector);
        messages_.push_back(message);
        return true;
    }

    std::vector<MidiMessage> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    std::string last_selector() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return selectors_.empty() ? std::string{} : selectors_.back();
    }

    bool contains(const MidiMessage& message) const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& m : messages_) {
            if (m == message) return true;
        }
        return false;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> selectors_;
    std::vector<MidiMessage> messages_;
};

class FailingSink : public MidiSink {
public:
    bool send(std::string_view, const MidiMessage& message) override {
        if (message[0] == 0x90) throw std::runtime_error("device unplugged");
        return false;
    }
};

SequencerConfig fast_pattern() {
    TrackConfig track;
    track.track_id = "lead";
    track.midi_channel = 1;
    std::vector<Step> steps(16);
    steps[0] = make_step({60});
    steps[2] = make_step({67});
    track.pads.push_back(PadConfig{0, steps});
    track.pads.push_back(PadConfig{1, std::vector<Step>(16)});

    SequencerConfig config;
    config.bpm = 300;  // 50 ms per step
    config.tracks.push_back(std::move(track));
    return config;
}

template<typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

TEST_CASE("Engine lifecycle", "[engine][thread]") {
    auto sink = std::make_shared<RecordingSink>();
    auto events = std::make_shared<EventChannel>();
    SequencerEngine engine("session-1", sink, "0", events);

    SECTION("status before configuration") {
        auto status = engine.status();
        CHECK(status.session_id == "session-1");
        CHECK_FALSE(status.running);
        CHECK(status.bpm == 120);
        CHECK(status.tracks.empty());
    }

    SECTION("runs a full cycle and stops cleanly") {
        engine.configure(fast_pattern());
        auto started = engine.start();
        CHECK(started.running);

        REQUIRE(wait_until([&] { return engine.status().cycle >= 1; }, 3000ms));
        auto stopped = engine.stop();

        CHECK_FALSE(stopped.running);
        CHECK(stopped.current_step == 0);
        for (const auto& track : stopped.tracks) {
            CHECK(track.active_notes.empty());
        }

        CHECK(sink->contains({0x90, 60, 100}));
        CHECK(sink->contains({0x80, 60, 0}));
        auto messages = sink->messages();
        REQUIRE(messages.size() >= 2);
        CHECK(messages[messages.size() - 2] == MidiMessage{0xB0, 123, 0});
        CHECK(messages.back() == MidiMessage{0xB0, 120, 0});

        auto drained = events->drain();
        REQUIRE_FALSE(drained.empty());
        CHECK(event_type(drained.front().payload) == "sequencer_step");
        CHECK(drained.front().session_id == "session-1");
    }

    SECTION("start is idempotent") {
        engine.configure(fast_pattern());
        engine.start();
        auto again = engine.start();
        CHECK(again.running);
        CHECK(engine.running());
        engine.stop();
        CHECK_FALSE(engine.running());
    }

    SECTION("start without configuration uses the default track") {
        auto status = engine.start();
        REQUIRE(status.tracks.size() == 1);
        CHECK(status.tracks[0].track_id == "voice-1");
        engine.stop();
    }

    SECTION("stop while idle only rewinds") {
        engine.configure(fast_pattern());
        auto status = engine.stop();
        CHECK(status.current_step == 0);
        CHECK(sink->messages().empty());
    }

    SECTION("engine can be restarted") {
        engine.configure(fast_pattern());
        engine.start();
        engine.stop();
        engine.start();
        REQUIRE(wait_until([&] { return engine.status().current_step > 0; }, 2000ms));
        engine.stop();
        CHECK(engine.status().current_step == 0);
    }
}

TEST_CASE("Engine commands while running", "[engine][thread]") {
    auto sink = std::make_shared<RecordingSink>();
    auto events = std::make_shared<EventChannel>();
    SequencerEngine engine("session-2", sink, "0", events);
    engine.configure(fast_pattern());
    engine.start();

    SECTION("queued pad is reported until its boundary") {
        auto status = engine.queue_pad("lead", 1);
        const auto* track = status.find_track("lead");
        REQUIRE(track != nullptr);
        CHECK(track->queued_pad.has_value());

        bool switched = false;
        REQUIRE(wait_until([&] {
            for (const auto& event : events->drain()) {
                if (event_type(event.payload) == "sequencer_pad_switched") switched = true;
            }
            return switched;
        }, 3000ms));
        CHECK(engine.status().tracks[0].active_pad == 1);
    }

    SECTION("invalid references do not stop the scheduler") {
        CHECK_THROWS_AS(engine.queue_pad("ghost", 0), SequencerError);
        CHECK_THROWS_AS(engine.queue_pad("lead", 8), SequencerError);
        CHECK(engine.running());
    }

    SECTION("any pad slot can be queued") {
        auto status = engine.queue_pad("lead", 5);
        CHECK(status.tracks[0].queued_pad == 5);
    }

    SECTION("reconfiguration applies immediately") {
        auto config = fast_pattern();
        config.bpm = 200;
        auto status = engine.configure(config);
        CHECK(status.running);
        CHECK(status.bpm == 200);
    }

    engine.stop();
}

TEST_CASE("MIDI failures are not fatal", "[engine][thread]") {
    auto events = std::make_shared<EventChannel>();
    SequencerEngine engine("session-3", std::make_shared<FailingSink>(), "0", events);
    engine.configure(fast_pattern());
    engine.start();

    REQUIRE(wait_until([&] { return engine.status().current_step >= 3; }, 3000ms));
    CHECK(engine.running());
    engine.stop();

    bool reported = false;
    for (const auto& event : events->drain()) {
        if (const auto* error = std::get_if<MidiErrorEvent>(&event.payload)) {
            reported = true;
            CHECK_FALSE(error->message.empty());
        }
    }
    CHECK(reported);
}

TEST_CASE("MIDI input selector", "[engine]") {
    auto sink = std::make_shared<RecordingSink>();
    SequencerEngine engine("session-4", sink, "0", nullptr);
    engine.configure(fast_pattern());

    engine.set_midi_input("loopback:1");
    engine.start();
    engine.stop();
    CHECK(sink->last_selector() == "loopback:1");
}

TEST_CASE("Destroying a running engine", "[engine][thread]") {
    auto sink = std::make_shared<RecordingSink>();
    {
        SequencerEngine engine("session-5", sink, "0", nullptr);
        engine.configure(fast_pattern());
        engine.start();
        std::this_thread::sleep_for(30ms);
    }
    auto messages = sink->messages();
    REQUIRE_FALSE(messages.empty());
    CHECK(messages.back() == MidiMessage{0xB0, 120, 0});
}
