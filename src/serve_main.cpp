#include "elevation/geotiff_elevation.h"
#include "pipeline/output_sink.h"
#include "server/http_server.h"
#include "util/error.h"
#include "util/log.h"
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>

using namespace skyline;

static HttpServer* g_server = nullptr;

static void on_signal(int) {
    if (g_server) g_server->request_stop();
}

int main(int argc, char* argv[]) {
    const char* env_tif = std::getenv("SKYLINE_TIF");
    std::string tif_path = env_tif ? env_tif : DEFAULT_TIF_PATH;
    int port = 8080;
    int workers = 1;
    int timeout_s = 0;
    bool warm = false;

    /* Simple arg parsing */
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--tif") == 0 && i + 1 < argc) {
            tif_path = argv[++i];
        } else if (std::strcmp(argv[i], "--port") == 0 && i + 1 < argc) {
            port = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--workers") == 0 && i + 1 < argc) {
            workers = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            timeout_s = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--warm") == 0) {
            warm = true;
        } else if (std::strcmp(argv[i], "--debug") == 0) {
            log_set_level(LogLevel::Debug);
        } else if (std::strcmp(argv[i], "--help") == 0) {
            printf("Usage: skyline-serve [options]\n"
                   "  --tif PATH        Elevation GeoTIFF (default %s, or $SKYLINE_TIF)\n"
                   "  --port N          Listen port (default 8080)\n"
                   "  --workers N       Threads used to build viewpoints (default 1)\n"
                   "  --timeout S       Max seconds a request waits on a running build\n"
                   "                    before getting 503 (default 0 = wait)\n"
                   "  --warm            Start building at startup instead of first request\n"
                   "  --debug           Enable debug logging\n"
                   "\nRoutes:\n"
                   "  GET /api/horizon  gzip JSON dataset\n"
                   "  GET /healthz      cache state\n",
                   DEFAULT_TIF_PATH);
            return 0;
        } else {
            LOG_ERROR("Unknown argument: %s (try --help)", argv[i]);
            return 2;
        }
    }
    if (workers < 1) workers = 1;

    DatasetCache cache([tif_path] { return GeoTiffElevation::load(tif_path); },
                       make_artifact_builder(DEFAULT_PARAMS, ArtifactEncoding::JsonAndGzip,
                                             workers));

    RouteConfig config;
    config.wait_timeout = std::chrono::seconds(timeout_s > 0 ? timeout_s : 0);

    HttpServer server(cache, config);
    if (!server.listen(port)) return 1;

    g_server = &server;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    std::thread warmer;
    if (warm) {
        warmer = std::thread([&cache] {
            try {
                cache.get();
            } catch (const std::exception& e) {
                LOG_WARN("Warm-up build failed, will retry on first request: %s", e.what());
            }
        });
    }

    server.run();

    if (warmer.joinable()) warmer.join();
    g_server = nullptr;
    return 0;
}
