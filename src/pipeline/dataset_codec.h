#pragma once
#include "horizon/horizon_types.h"
#include <cstdint>
#include <string>
#include <vector>

namespace skyline {

/* Serialized dataset, ready for a file or an HTTP body */
struct DatasetArtifact {
    std::string json;
    std::vector<uint8_t> gzip;   // empty unless requested
    int viewpoint_count = 0;
};

enum class ArtifactEncoding { Json, JsonAndGzip };

/* JSON array of viewpoint objects (camelCase keys, as the chart client
   expects). Throws SerializationError on non-finite numbers. */
std::string to_json(const Dataset& dataset);

/* Inverse of to_json, for tools and tests. Throws SerializationError. */
Dataset from_json(const std::string& text);

/* gzip container (RFC 1952) via zlib. Throw SerializationError. */
std::vector<uint8_t> gzip_compress(const std::string& text, int level = 9);
std::string gzip_decompress(const std::vector<uint8_t>& data);

DatasetArtifact make_artifact(const Dataset& dataset, ArtifactEncoding encoding);

} // namespace skyline
