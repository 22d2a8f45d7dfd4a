#pragma once
#include <cmath>

namespace skyline {

/* Spherical-earth geodesy. All angles are degrees unless the name says
   otherwise. Inputs used by the pipeline are small distances around a
   mid-latitude peak, so none of these functions can fail. */

constexpr double EARTH_RADIUS_KM = 6371.0;

struct Coordinate {
    double latitude = 0.0;
    double longitude = 0.0;
};

inline double to_radians(double deg) { return deg * M_PI / 180.0; }
inline double to_degrees(double rad) { return rad * 180.0 / M_PI; }

/* Approximate meters-per-degree at a given latitude */
inline double meters_per_deg_lat() { return 111320.0; }
inline double meters_per_deg_lon(double lat_rad) {
    return 111320.0 * std::cos(lat_rad);
}

/* True modulo into [0, 360) */
double normalize_angle(double deg);

/* Fold a direction difference into [-180, 180]. Inputs are expected to be
   within one turn of that interval, which holds for a difference of two
   [0, 360) values. */
double normalize_relative(double deg);

/* Great-circle destination from origin after travelling distance_km on
   the initial bearing. The bearing need not be normalized. */
Coordinate destination_point(const Coordinate& origin, double distance_km,
                             double bearing_deg);

/* Initial great-circle bearing from -> to, in [0, 360) */
double bearing(const Coordinate& from, const Coordinate& to);

} // namespace skyline
