#include "elevation/geotiff_elevation.h"
#include "pipeline/output_sink.h"
#include "util/error.h"
#include "util/log.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>

int main(int argc, char* argv[]) {
    using namespace skyline;

    const char* env_tif = std::getenv("SKYLINE_TIF");
    std::string tif_path = env_tif ? env_tif : DEFAULT_TIF_PATH;
    std::string out_path = DEFAULT_OUTPUT_PATH;
    int workers = 1;

    /* Simple arg parsing */
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--tif") == 0 && i + 1 < argc) {
            tif_path = argv[++i];
        } else if (std::strcmp(argv[i], "--out") == 0 && i + 1 < argc) {
            out_path = argv[++i];
        } else if (std::strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
            workers = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--debug") == 0) {
            log_set_level(LogLevel::Debug);
        } else if (std::strcmp(argv[i], "--help") == 0) {
            printf("Usage: skyline-generate [options]\n"
                   "  --tif PATH        Elevation GeoTIFF (default %s, or $SKYLINE_TIF)\n"
                   "  --out PATH        Output JSON (default %s)\n"
                   "  --workers N       Threads used to build viewpoints (default 1)\n"
                   "  --debug           Enable debug logging\n",
                   DEFAULT_TIF_PATH, DEFAULT_OUTPUT_PATH);
            return 0;
        } else {
            LOG_ERROR("Unknown argument: %s (try --help)", argv[i]);
            return 2;
        }
    }
    if (workers < 1) workers = 1;

    try {
        FileSink sink(out_path);
        generate_to_sink([&tif_path] { return GeoTiffElevation::load(tif_path); },
                         DEFAULT_PARAMS, sink, workers);
    } catch (const Error& e) {
        LOG_ERROR("Generation failed: %s", e.what());
        return 1;
    } catch (const std::exception& e) {
        LOG_ERROR("Unexpected failure: %s", e.what());
        return 1;
    }
    return 0;
}
