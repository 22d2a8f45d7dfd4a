#include <skyline/skyline.h>
#include "elevation/geotiff_elevation.h"
#include "geo/geodesy.h"
#include "pipeline/output_sink.h"
#include "util/error.h"
#include "util/log.h"
#include <string>

using namespace skyline;

static thread_local std::string t_last_error;

static skyline_status_t fail(skyline_status_t status, const char* what) {
    t_last_error = what;
    LOG_ERROR("%s", what);
    return status;
}

skyline_coord_t skyline_destination_point(skyline_coord_t origin, double distance_km,
                                          double bearing_deg) {
    Coordinate c = destination_point({origin.latitude, origin.longitude},
                                     distance_km, bearing_deg);
    return {c.latitude, c.longitude};
}

double skyline_bearing(skyline_coord_t from, skyline_coord_t to) {
    return bearing({from.latitude, from.longitude}, {to.latitude, to.longitude});
}

skyline_status_t skyline_generate_file(const char* tif_path, const char* output_path,
                                       int workers) {
    t_last_error.clear();
    if (!tif_path || !output_path)
        return fail(SKYLINE_ERR_INVALID_ARGUMENT, "tif_path and output_path are required");

    std::string tif(tif_path);
    try {
        FileSink sink(output_path);
        generate_to_sink([&tif] { return GeoTiffElevation::load(tif); },
                         DEFAULT_PARAMS, sink, workers > 0 ? workers : 1);
    } catch (const DataLoadError& e) {
        return fail(SKYLINE_ERR_DATA_LOAD, e.what());
    } catch (const QueryError& e) {
        return fail(SKYLINE_ERR_QUERY, e.what());
    } catch (const SerializationError& e) {
        return fail(SKYLINE_ERR_SERIALIZATION, e.what());
    } catch (const std::exception& e) {
        return fail(SKYLINE_ERR_INTERNAL, e.what());
    } catch (...) {
        return fail(SKYLINE_ERR_INTERNAL, "unknown exception");
    }
    return SKYLINE_OK;
}

const char* skyline_last_error(void) {
    return t_last_error.c_str();
}
