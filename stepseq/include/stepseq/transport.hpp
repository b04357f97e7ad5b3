#pragma once

#include <numeric>
#include <span>

namespace stepseq {

/// Shared cycle length for the given enabled step counts: 16 when their
/// least common multiple fits in 16 steps, otherwise 32
[[nodiscard]] inline int transport_step_count(std::span<const int> enabled_step_counts) {
    if (enabled_step_counts.empty()) return 16;
    int loop = enabled_step_counts.front();
    for (int count : enabled_step_counts.subspan(1)) {
        loop = std::lcm(loop, count);
    }
    return loop <= 16 ? 16 : 32;
}

/// A track's pattern restarts at `position`
[[nodiscard]] constexpr bool is_local_boundary(int position, int step_count) noexcept {
    return position % step_count == 0;
}

} // namespace stepseq
