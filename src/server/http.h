#pragma once
#include "pipeline/dataset_cache.h"
#include <chrono>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace skyline {

struct HttpRequest {
    std::string method;
    std::string path;      // without query string
    std::string version;
};

struct HttpResponse {
    int status = 200;
    std::vector<std::pair<std::string, std::string>> headers;
    std::vector<uint8_t> body;

    void set_text(int code, const std::string& text);
    /* Status line, headers with Content-Length, blank line, body */
    std::vector<uint8_t> serialize() const;
};

/* Parse the request line of a raw HTTP/1.x head. Returns false if the
   head is not a well-formed request line. */
bool parse_request(const std::string& head, HttpRequest& out);

const char* status_text(int status);

struct RouteConfig {
    /* 0 = wait for the build however long it takes */
    std::chrono::milliseconds wait_timeout{0};
};

/* GET /api/horizon (and the legacy /timpanogos/api) serves the cached
   gzip artifact; GET /healthz reports the cache state. */
HttpResponse handle_request(const HttpRequest& req, DatasetCache& cache,
                            const RouteConfig& config);

} // namespace skyline
