#pragma once
#include "geo/geodesy.h"
#include "horizon/direction_range.h"

namespace skyline {

/* Everything that defines one ring of viewpoints around one peak */
struct GenerationParams {
    Coordinate peak;
    double distance_km;
    double half_fov_deg;
    int angle_count;        // viewpoints at 360/angle_count degree spacing
};

/* Mt. Timpanogos, Utah */
constexpr GenerationParams DEFAULT_PARAMS = {
    {40.3908, -111.6458},
    8.919,
    DEFAULT_HALF_FOV_DEG,
    360,
};

constexpr const char* DEFAULT_TIF_PATH = "data/n41w112_30m.tif";
constexpr const char* DEFAULT_OUTPUT_PATH = "static/timpanogos.json";

} // namespace skyline
