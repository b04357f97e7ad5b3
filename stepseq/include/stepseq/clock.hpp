#pragma once

#include <chrono>

namespace stepseq {

/// Absolute-deadline step timer.
///
/// The scheduling loop polls the clock: far from the deadline it sleeps in
/// short slices, inside the spin threshold it busy-waits, and once the
/// deadline has passed it fires a step and advances by one step duration.
class StepClock {
public:
    using Clock = std::chrono::steady_clock;
    using Seconds = std::chrono::duration<double>;

    static constexpr Seconds SPIN_THRESHOLD{0.0008};
    static constexpr Seconds SLEEP_SLICE{0.001};
    static constexpr Seconds START_DELAY{0.01};

    enum class Action {
        Sleep,  // sleep for sleep_for, then poll again
        Spin,   // poll again without sleeping
        Fire,   // perform the step now
    };

    struct Poll {
        Action action = Action::Sleep;
        Seconds sleep_for{0.0};
    };

    /// First deadline is `now + START_DELAY`
    void reset(Clock::time_point now);

    [[nodiscard]] Poll poll(Clock::time_point now) const;

    /// Move the deadline one step forward. If that leaves it more than two
    /// steps behind `now`, resynchronize to `now + step` instead of firing
    /// the missed steps back to back.
    /// @return true when the deadline was resynchronized
    bool advance(Clock::time_point now, Seconds step);

    [[nodiscard]] Clock::time_point deadline() const { return deadline_; }

private:
    Clock::time_point deadline_{};
};

/// Duration of one sixteenth note: 60 / bpm / 4 seconds
[[nodiscard]] StepClock::Seconds step_duration(int bpm);

} // namespace stepseq
