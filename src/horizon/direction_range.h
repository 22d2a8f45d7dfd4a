#pragma once
#include <vector>

namespace skyline {

constexpr double DEFAULT_HALF_FOV_DEG = 45.0;

/* Inclusive window of integer compass directions. start > end means the
   window runs through north: [start, 359] U [0, end]. */
struct DirectionRange {
    int start = 0;
    int end = 0;

    bool wraps() const { return start > end; }
};

/* Field of view of +/- half_fov_deg around the bearing back toward the
   peak, floored onto the integer-degree grid. */
DirectionRange plan_range(double bearing_to_peak,
                          double half_fov_deg = DEFAULT_HALF_FOV_DEG);

/* Break a range into sub-ranges with start <= end, in query order.
   Non-wrapping ranges come back unchanged. */
std::vector<DirectionRange> split_range(const DirectionRange& range);

} // namespace skyline
