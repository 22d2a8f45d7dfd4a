#pragma once
#include "geo/geodesy.h"
#include <vector>

namespace skyline {

/* One sample as returned by an ElevationSource: absolute compass
   direction from the viewpoint. */
struct RawHorizonSample {
    int direction = 0;                  // 0..359
    double elevation_angle_deg = 0.0;
    double distance_km = 0.0;
};

/* Same sample re-expressed relative to the bearing toward the peak.
   Negative = left of the peak, positive = right. */
struct HorizonSample {
    int relative_direction = 0;         // -180..180
    double elevation_angle_deg = 0.0;
    double distance_km = 0.0;
};

struct Viewpoint {
    int angle = 0;                      // bearing from the peak, 0..359
    Coordinate location;
    double bearing_to_peak = 0.0;       // unrounded, [0, 360)
    std::vector<HorizonSample> horizon; // ascending relative_direction
};

/* Indexed by Viewpoint::angle */
using Dataset = std::vector<Viewpoint>;

} // namespace skyline
