#include "horizon/horizon_transform.h"
#include "geo/geodesy.h"
#include <algorithm>
#include <cmath>

namespace skyline {

std::vector<HorizonSample> to_relative(const std::vector<RawHorizonSample>& raw,
                                       double bearing_to_peak) {
    /* std::round rounds halves away from zero; bearings are non-negative
       so this matches round-half-up. */
    int center = static_cast<int>(std::round(bearing_to_peak));

    std::vector<HorizonSample> out;
    out.reserve(raw.size());
    for (const auto& s : raw) {
        HorizonSample h;
        h.relative_direction = static_cast<int>(normalize_relative(s.direction - center));
        h.elevation_angle_deg = s.elevation_angle_deg;
        h.distance_km = s.distance_km;
        out.push_back(h);
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const HorizonSample& a, const HorizonSample& b) {
                         return a.relative_direction < b.relative_direction;
                     });
    return out;
}

} // namespace skyline
