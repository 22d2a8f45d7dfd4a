#include "server/http.h"
#include "util/error.h"
#include "util/log.h"
#include <sstream>

namespace skyline {

const char* status_text(int status) {
    switch (status) {
        case 200: return "OK";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

void HttpResponse::set_text(int code, const std::string& text) {
    status = code;
    headers.emplace_back("Content-Type", "text/plain; charset=utf-8");
    body.assign(text.begin(), text.end());
    body.push_back('\n');
}

std::vector<uint8_t> HttpResponse::serialize() const {
    std::ostringstream ss;
    ss << "HTTP/1.1 " << status << " " << status_text(status) << "\r\n";
    for (const auto& [name, value] : headers)
        ss << name << ": " << value << "\r\n";
    ss << "Content-Length: " << body.size() << "\r\n";
    ss << "Connection: close\r\n\r\n";

    std::string head = ss.str();
    std::vector<uint8_t> out(head.begin(), head.end());
    out.insert(out.end(), body.begin(), body.end());
    return out;
}

bool parse_request(const std::string& head, HttpRequest& out) {
    size_t eol = head.find("\r\n");
    std::string line = head.substr(0, eol);

    std::istringstream ss(line);
    std::string target, extra;
    if (!(ss >> out.method >> target >> out.version)) return false;
    if (ss >> extra) return false;
    if (out.version.compare(0, 5, "HTTP/") != 0) return false;
    if (target.empty() || target[0] != '/') return false;

    size_t q = target.find('?');
    out.path = target.substr(0, q);
    return true;
}

static HttpResponse serve_dataset(DatasetCache& cache, const RouteConfig& config) {
    HttpResponse resp;
    DatasetCache::ArtifactPtr artifact;
    try {
        artifact = config.wait_timeout.count() > 0 ? cache.get_for(config.wait_timeout)
                                                   : cache.get();
    } catch (const std::exception& e) {
        resp.set_text(500, std::string("dataset generation failed: ") + e.what());
        return resp;
    }

    if (!artifact) {
        resp.set_text(503, "dataset is still being generated, retry shortly");
        resp.headers.emplace_back("Retry-After", "5");
        return resp;
    }
    if (artifact->gzip.empty()) {
        resp.set_text(500, "dataset artifact has no compressed body");
        return resp;
    }

    resp.status = 200;
    resp.headers.emplace_back("Content-Type", "application/json");
    resp.headers.emplace_back("Content-Encoding", "gzip");
    resp.body = artifact->gzip;
    return resp;
}

HttpResponse handle_request(const HttpRequest& req, DatasetCache& cache,
                            const RouteConfig& config) {
    HttpResponse resp;
    bool dataset_route = req.path == "/api/horizon" || req.path == "/timpanogos/api";

    if (!dataset_route && req.path != "/healthz") {
        resp.set_text(404, "not found");
    } else if (req.method != "GET") {
        resp.set_text(405, "only GET is supported");
        resp.headers.emplace_back("Allow", "GET");
    } else if (dataset_route) {
        resp = serve_dataset(cache, config);
    } else {
        resp.set_text(200, std::string("cache: ") + to_string(cache.state()));
    }

    LOG_INFO("%s %s -> %d (%zu bytes)", req.method.c_str(), req.path.c_str(),
             resp.status, resp.body.size());
    return resp;
}

} // namespace skyline
