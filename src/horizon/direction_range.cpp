#include "horizon/direction_range.h"
#include "geo/geodesy.h"
#include <cmath>

namespace skyline {

DirectionRange plan_range(double bearing_to_peak, double half_fov_deg) {
    DirectionRange r;
    r.start = static_cast<int>(std::floor(normalize_angle(bearing_to_peak - half_fov_deg)));
    r.end   = static_cast<int>(std::floor(normalize_angle(bearing_to_peak + half_fov_deg)));
    return r;
}

std::vector<DirectionRange> split_range(const DirectionRange& range) {
    if (!range.wraps()) return {range};
    return {{range.start, 359}, {0, range.end}};
}

} // namespace skyline
