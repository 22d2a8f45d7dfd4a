#include "elevation/geotiff_elevation.h"
#include "geo/geodesy.h"
#include "util/error.h"
#include "util/log.h"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <limits>

namespace skyline {

void validate_direction_bounds(int start_dir, int end_dir) {
    if (start_dir < 0 || end_dir > 359 || start_dir > end_dir) {
        throw QueryError("invalid direction range [" + std::to_string(start_dir) + ", " +
                         std::to_string(end_dir) + "]");
    }
}

static std::vector<uint8_t> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary | std::ios::ate);
    if (!f) throw DataLoadError("cannot open elevation file: " + path);

    auto size = f.tellg();
    if (size <= 0) throw DataLoadError("elevation file is empty: " + path);

    std::vector<uint8_t> data(static_cast<size_t>(size));
    f.seekg(0);
    if (!f.read(reinterpret_cast<char*>(data.data()), size))
        throw DataLoadError("short read on elevation file: " + path);
    return data;
}

std::shared_ptr<const GeoTiffElevation> GeoTiffElevation::load(const std::string& path,
                                                               const RayCastParams& params) {
    LOG_INFO("Loading elevation data: %s", path.c_str());
    auto t0 = std::chrono::steady_clock::now();

    auto raw = read_file(path);

    GeoTiffInfo info;
    if (!geotiff_parse(raw.data(), raw.size(), info))
        throw DataLoadError("not a readable TIFF: " + path);
    if (!info.has_geo)
        throw DataLoadError("TIFF has no ModelTiepoint/ModelPixelScale: " + path);

    auto elevation = geotiff_read_elevation(raw.data(), raw.size(), info);

    float nodata = info.has_nodata ? static_cast<float>(info.nodata) : -32768.0f;
    auto src = std::make_shared<const GeoTiffElevation>(
        std::move(elevation), info.height, info.width,
        info.tie_x, info.tie_y, info.scale_x, info.scale_y, params, nodata);

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
    LOG_INFO("Elevation loaded: %dx%d, lon[%.4f,%.4f] lat[%.4f,%.4f] in %lld ms",
             info.width, info.height,
             info.tie_x, info.tie_x + info.width * info.scale_x,
             info.tie_y - info.height * info.scale_y, info.tie_y,
             static_cast<long long>(ms));
    return src;
}

GeoTiffElevation::GeoTiffElevation(std::vector<float> elevation, int rows, int cols,
                                   double west_lon, double north_lat,
                                   double deg_per_col, double deg_per_row,
                                   const RayCastParams& params, float nodata)
    : m_elevation(std::move(elevation))
    , m_rows(rows)
    , m_cols(cols)
    , m_west(west_lon)
    , m_north(north_lat)
    , m_deg_per_col(deg_per_col)
    , m_deg_per_row(deg_per_row)
    , m_params(params)
    , m_nodata(nodata)
{
    if (rows < 2 || cols < 2 || m_elevation.size() != static_cast<size_t>(rows) * cols)
        throw DataLoadError("elevation grid size does not match " +
                            std::to_string(rows) + "x" + std::to_string(cols));
    if (!(deg_per_col > 0) || !(deg_per_row > 0))
        throw DataLoadError("elevation grid has non-positive pixel size");
}

bool GeoTiffElevation::is_nodata(float v) const {
    return std::isnan(v) || v == m_nodata || v <= -1.0e4f;
}

double GeoTiffElevation::sample(double lat, double lon) const {
    /* Pixel-is-area: tiepoint is the outer corner, samples sit at centers */
    double fr = (m_north - lat) / m_deg_per_row - 0.5;
    double fc = (lon - m_west) / m_deg_per_col - 0.5;
    if (fr < 0 || fc < 0 || fr > m_rows - 1 || fc > m_cols - 1)
        return std::numeric_limits<double>::quiet_NaN();

    int r0 = std::min(static_cast<int>(fr), m_rows - 2);
    int c0 = std::min(static_cast<int>(fc), m_cols - 2);
    double sr = fr - r0;
    double sc = fc - c0;

    float h00 = m_elevation[r0 * m_cols + c0];
    float h01 = m_elevation[r0 * m_cols + c0 + 1];
    float h10 = m_elevation[(r0 + 1) * m_cols + c0];
    float h11 = m_elevation[(r0 + 1) * m_cols + c0 + 1];
    if (is_nodata(h00) || is_nodata(h01) || is_nodata(h10) || is_nodata(h11))
        return std::numeric_limits<double>::quiet_NaN();

    double h0 = h00 * (1.0 - sc) + h01 * sc;
    double h1 = h10 * (1.0 - sc) + h11 * sc;
    return h0 * (1.0 - sr) + h1 * sr;
}

double GeoTiffElevation::pixel_size_m(double lat) const {
    double ns = m_deg_per_row * meters_per_deg_lat();
    double ew = m_deg_per_col * meters_per_deg_lon(to_radians(lat));
    return std::min(ns, ew);
}

RawHorizonSample GeoTiffElevation::cast_ray(double lat, double lon, double observer_h,
                                            int direction, double step_m) const {
    double az = to_radians(direction);
    double dlat_per_m = std::cos(az) / meters_per_deg_lat();
    double dlon_per_m = std::sin(az) / meters_per_deg_lon(to_radians(lat));

    /* Curvature drop d^2 / (2 k R) with refraction folded into k */
    double curve = 1.0 / (2.0 * m_params.refraction_k * EARTH_RADIUS_KM * 1000.0);

    RawHorizonSample out;
    out.direction = direction;
    double best = -std::numeric_limits<double>::infinity();

    int steps = static_cast<int>(m_params.max_distance_m / step_m);
    for (int i = 1; i <= steps; ++i) {
        double d = i * step_m;
        double plat = lat + dlat_per_m * d;
        double plon = lon + dlon_per_m * d;

        double fr = (m_north - plat) / m_deg_per_row;
        double fc = (plon - m_west) / m_deg_per_col;
        if (fr < 0 || fc < 0 || fr > m_rows || fc > m_cols) break; // left the raster

        double h = sample(plat, plon);
        if (std::isnan(h)) continue;

        double angle = std::atan2(h - d * d * curve - observer_h, d);
        if (angle > best) {
            best = angle;
            out.distance_km = d / 1000.0;
        }
    }

    if (std::isfinite(best)) out.elevation_angle_deg = to_degrees(best);
    return out;
}

std::vector<RawHorizonSample> GeoTiffElevation::horizon_query(double lat, double lon,
                                                              int start_dir, int end_dir) const {
    validate_direction_bounds(start_dir, end_dir);

    double ground = sample(lat, lon);
    if (std::isnan(ground)) {
        throw QueryError("viewpoint (" + std::to_string(lat) + ", " + std::to_string(lon) +
                         ") has no elevation data");
    }
    double observer_h = ground + m_params.observer_height_m;
    double step_m = pixel_size_m(lat);

    std::vector<RawHorizonSample> out;
    out.reserve(end_dir - start_dir + 1);
    for (int dir = start_dir; dir <= end_dir; ++dir)
        out.push_back(cast_ray(lat, lon, observer_h, dir, step_m));
    return out;
}

} // namespace skyline
