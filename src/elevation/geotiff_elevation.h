#pragma once
#include "elevation/elevation_source.h"
#include "elevation/geotiff.h"
#include <memory>
#include <string>
#include <vector>

namespace skyline {

struct RayCastParams {
    double observer_height_m = 2.0;   // above ground at the viewpoint
    double max_distance_m = 50000.0;
    double refraction_k = 4.0 / 3.0;  // effective earth radius factor
};

/* GeoTIFF-backed elevation raster with a horizon ray caster.
   Immutable after load, so concurrent horizon_query() calls are safe. */
class GeoTiffElevation : public ElevationSource {
public:
    /* Read and decode a GeoTIFF. Throws DataLoadError if the file is
       missing, unreadable, or not a georeferenced single-band raster. */
    static std::shared_ptr<const GeoTiffElevation> load(const std::string& path,
                                                        const RayCastParams& params = {});

    /* Build from an in-memory row-major grid (tests, C ABI). */
    GeoTiffElevation(std::vector<float> elevation, int rows, int cols,
                     double west_lon, double north_lat,
                     double deg_per_col, double deg_per_row,
                     const RayCastParams& params = {},
                     float nodata = -32768.0f);

    const char* name() const override { return "geotiff"; }

    std::vector<RawHorizonSample> horizon_query(double lat, double lon,
                                                int start_dir, int end_dir) const override;

    /* Bilinear terrain height, or NaN outside the raster / on nodata */
    double sample(double lat, double lon) const;

    int rows() const { return m_rows; }
    int cols() const { return m_cols; }

private:
    std::vector<float> m_elevation;
    int m_rows = 0, m_cols = 0;
    double m_west = 0, m_north = 0;
    double m_deg_per_col = 0, m_deg_per_row = 0;
    RayCastParams m_params;
    float m_nodata;

    double pixel_size_m(double lat) const;
    bool is_nodata(float v) const;
    RawHorizonSample cast_ray(double lat, double lon, double observer_h,
                              int direction, double step_m) const;
};

} // namespace skyline
