#include "stepseq/clock.hpp"
#include <algorithm>

namespace stepseq {

namespace {

StepClock::Clock::duration to_clock(StepClock::Seconds seconds) {
    return std::chrono::duration_cast<StepClock::Clock::duration>(seconds);
}

} // namespace

void StepClock::reset(Clock::time_point now) {
    deadline_ = now + to_clock(START_DELAY);
}

StepClock::Poll StepClock::poll(Clock::time_point now) const {
    Seconds wait = deadline_ - now;
    if (wait > SPIN_THRESHOLD) {
        return Poll{Action::Sleep, std::min(wait, SLEEP_SLICE)};
    }
    if (wait > Seconds::zero()) {
        return Poll{Action::Spin, Seconds::zero()};
    }
    return Poll{Action::Fire, Seconds::zero()};
}

bool StepClock::advance(Clock::time_point now, Seconds step) {
    deadline_ += to_clock(step);
    if (deadline_ < now - to_clock(step * 2.0)) {
        deadline_ = now + to_clock(step);
        return true;
    }
    return false;
}

StepClock::Seconds step_duration(int bpm) {
    return StepClock::Seconds(60.0 / static_cast<double>(bpm) / 4.0);
}

} // namespace stepseq
