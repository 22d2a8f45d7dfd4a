#pragma once
#include "pipeline/dataset_cache.h"
#include "pipeline/dataset_codec.h"
#include "pipeline/generation_params.h"
#include <string>

namespace skyline {

/* Writes the uncompressed JSON, creating parent directories.
   Throws SerializationError if the file cannot be written. */
class FileSink {
public:
    explicit FileSink(std::string path) : m_path(std::move(path)) {}

    void publish(const DatasetArtifact& artifact) const;

    const std::string& path() const { return m_path; }

private:
    std::string m_path;
};

/* Builder shared by both entry points: dataset -> artifact. The batch
   tool asks for Json, the server's cache for JsonAndGzip. */
DatasetCache::Builder make_artifact_builder(const GenerationParams& params,
                                            ArtifactEncoding encoding, int workers);

/* Load, build, encode, publish. Runs once, no caching. */
void generate_to_sink(const DatasetCache::Loader& loader, const GenerationParams& params,
                      const FileSink& sink, int workers = 1);

} // namespace skyline
