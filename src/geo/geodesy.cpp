#include "geo/geodesy.h"

namespace skyline {

double normalize_angle(double deg) {
    double r = std::fmod(deg, 360.0);
    if (r < 0.0) r += 360.0;
    /* A tiny negative remainder can round up to exactly 360 */
    return r >= 360.0 ? 0.0 : r;
}

double normalize_relative(double deg) {
    if (deg > 180.0) return deg - 360.0;
    if (deg < -180.0) return deg + 360.0;
    return deg;
}

Coordinate destination_point(const Coordinate& origin, double distance_km,
                             double bearing_deg) {
    double ang = distance_km / EARTH_RADIUS_KM;
    double brg = to_radians(bearing_deg);
    double lat1 = to_radians(origin.latitude);
    double lon1 = to_radians(origin.longitude);

    double lat2 = std::asin(std::sin(lat1) * std::cos(ang) +
                            std::cos(lat1) * std::sin(ang) * std::cos(brg));
    double lon2 = lon1 + std::atan2(std::sin(brg) * std::sin(ang) * std::cos(lat1),
                                    std::cos(ang) - std::sin(lat1) * std::sin(lat2));

    return {to_degrees(lat2), to_degrees(lon2)};
}

double bearing(const Coordinate& from, const Coordinate& to) {
    double dlon = to_radians(to.longitude - from.longitude);
    double lat1 = to_radians(from.latitude);
    double lat2 = to_radians(to.latitude);

    double east = std::sin(dlon) * std::cos(lat2);
    double north = std::cos(lat1) * std::sin(lat2) -
                   std::sin(lat1) * std::cos(lat2) * std::cos(dlon);

    return normalize_angle(to_degrees(std::atan2(east, north)));
}

} // namespace skyline
