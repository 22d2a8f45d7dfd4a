#include "pipeline/dataset_codec.h"
#include "util/error.h"
#include "util/log.h"
#include <cmath>
#include <nlohmann/json.hpp>
#include <zlib.h>

using json = nlohmann::json;

namespace skyline {

static double finite_or_throw(double v, const char* field, int angle) {
    if (!std::isfinite(v)) {
        throw SerializationError(std::string("non-finite ") + field +
                                 " in viewpoint " + std::to_string(angle));
    }
    return v;
}

static json serialize_viewpoint(const Viewpoint& vp) {
    json horizon = json::array();
    for (const auto& s : vp.horizon) {
        horizon.push_back({
            {"relativeDirection", s.relative_direction},
            {"elevationAngleDegrees", finite_or_throw(s.elevation_angle_deg, "elevation angle", vp.angle)},
            {"distanceKm", finite_or_throw(s.distance_km, "distance", vp.angle)},
        });
    }

    json item;
    item["angle"] = vp.angle;
    item["viewpoint"] = {
        {"latitude", finite_or_throw(vp.location.latitude, "latitude", vp.angle)},
        {"longitude", finite_or_throw(vp.location.longitude, "longitude", vp.angle)},
    };
    item["bearingToPeak"] = finite_or_throw(vp.bearing_to_peak, "bearing", vp.angle);
    item["horizon"] = std::move(horizon);
    return item;
}

std::string to_json(const Dataset& dataset) {
    json root = json::array();
    for (const auto& vp : dataset) root.push_back(serialize_viewpoint(vp));
    try {
        return root.dump();
    } catch (const json::exception& e) {
        throw SerializationError(std::string("JSON encode failed: ") + e.what());
    }
}

Dataset from_json(const std::string& text) {
    Dataset dataset;
    try {
        json root = json::parse(text);
        if (!root.is_array()) throw SerializationError("dataset JSON is not an array");
        for (const auto& item : root) {
            Viewpoint vp;
            vp.angle = item.at("angle").get<int>();
            vp.location.latitude = item.at("viewpoint").at("latitude").get<double>();
            vp.location.longitude = item.at("viewpoint").at("longitude").get<double>();
            vp.bearing_to_peak = item.at("bearingToPeak").get<double>();
            for (const auto& s : item.at("horizon")) {
                HorizonSample h;
                h.relative_direction = s.at("relativeDirection").get<int>();
                h.elevation_angle_deg = s.at("elevationAngleDegrees").get<double>();
                h.distance_km = s.at("distanceKm").get<double>();
                vp.horizon.push_back(h);
            }
            dataset.push_back(std::move(vp));
        }
    } catch (const json::exception& e) {
        throw SerializationError(std::string("JSON decode failed: ") + e.what());
    }
    return dataset;
}

std::vector<uint8_t> gzip_compress(const std::string& text, int level) {
    z_stream strm{};
    /* windowBits 15 + 16 selects the gzip wrapper */
    if (deflateInit2(&strm, level, Z_DEFLATED, 15 + 16, 8, Z_DEFAULT_STRATEGY) != Z_OK)
        throw SerializationError("deflateInit2 failed");

    std::vector<uint8_t> out(deflateBound(&strm, static_cast<uLong>(text.size())));
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(text.data()));
    strm.avail_in = static_cast<uInt>(text.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    int ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);
    if (ret != Z_STREAM_END) throw SerializationError("gzip compression failed");

    out.resize(strm.total_out);
    return out;
}

std::string gzip_decompress(const std::vector<uint8_t>& data) {
    z_stream strm{};
    if (inflateInit2(&strm, 15 + 16) != Z_OK)
        throw SerializationError("inflateInit2 failed");

    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());

    std::string out;
    char chunk[16384];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        strm.next_out = reinterpret_cast<Bytef*>(chunk);
        strm.avail_out = sizeof(chunk);
        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&strm);
            throw SerializationError("gzip stream is corrupt");
        }
        out.append(chunk, sizeof(chunk) - strm.avail_out);
        if (ret == Z_OK && strm.avail_in == 0 && strm.avail_out != 0) {
            inflateEnd(&strm);
            throw SerializationError("gzip stream is truncated");
        }
    }
    inflateEnd(&strm);
    return out;
}

DatasetArtifact make_artifact(const Dataset& dataset, ArtifactEncoding encoding) {
    DatasetArtifact artifact;
    artifact.viewpoint_count = static_cast<int>(dataset.size());
    artifact.json = to_json(dataset);

    if (encoding == ArtifactEncoding::JsonAndGzip) {
        artifact.gzip = gzip_compress(artifact.json);
        LOG_INFO("Encoded. JSON: %zuKB -> Gzip: %zuKB",
                 artifact.json.size() / 1024, artifact.gzip.size() / 1024);
    } else {
        LOG_INFO("Encoded. JSON: %zuKB", artifact.json.size() / 1024);
    }
    return artifact;
}

} // namespace skyline
