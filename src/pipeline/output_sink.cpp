#include "pipeline/output_sink.h"
#include "pipeline/viewpoint_generator.h"
#include "util/error.h"
#include "util/log.h"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace skyline {

void FileSink::publish(const DatasetArtifact& artifact) const {
    fs::path p(m_path);
    fs::path dir = p.parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) throw SerializationError("cannot create " + dir.string() + ": " + ec.message());
    }

    std::ofstream f(m_path, std::ios::binary | std::ios::trunc);
    if (!f) throw SerializationError("cannot open for writing: " + m_path);

    f.write(artifact.json.data(), static_cast<std::streamsize>(artifact.json.size()));
    f.close();
    if (!f) throw SerializationError("write failed: " + m_path);

    LOG_INFO("Saved %d viewpoints to %s", artifact.viewpoint_count, m_path.c_str());
}

DatasetCache::Builder make_artifact_builder(const GenerationParams& params,
                                            ArtifactEncoding encoding, int workers) {
    return [params, encoding, workers](const ElevationSource& source) {
        Dataset dataset = build_dataset(source, params, workers);
        return make_artifact(dataset, encoding);
    };
}

void generate_to_sink(const DatasetCache::Loader& loader, const GenerationParams& params,
                      const FileSink& sink, int workers) {
    auto source = loader();
    if (!source) throw DataLoadError("elevation loader returned no source");
    auto build = make_artifact_builder(params, ArtifactEncoding::Json, workers);
    sink.publish(build(*source));
}

} // namespace skyline
