#pragma once
#include "elevation/elevation_source.h"
#include "pipeline/dataset_codec.h"
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>

namespace skyline {

/* Compute-once cache for the served artifact.

   Empty   -> the next get() caller becomes the executor: it loads the
              elevation source, builds and encodes the dataset.
   Pending -> callers attach to the executor's shared future and receive
              its result or its exception. No second build starts.
   Ready   -> the retained artifact is returned, forever.

   A failed attempt puts the cache back to Empty; every caller waiting on
   it rethrows the same exception, and the next get() starts afresh. */
class DatasetCache {
public:
    enum class State { Empty, Pending, Ready };

    using ArtifactPtr = std::shared_ptr<const DatasetArtifact>;
    using Loader = std::function<std::shared_ptr<const ElevationSource>()>;
    using Builder = std::function<DatasetArtifact(const ElevationSource&)>;

    DatasetCache(Loader loader, Builder builder);

    /* Blocks until the artifact is available. Throws whatever the load or
       build threw. */
    ArtifactPtr get();

    /* Like get(), but a caller that only joins an in-flight build gives up
       after timeout and gets nullptr. The build itself keeps running for
       everyone else. The executor always runs to completion. */
    ArtifactPtr get_for(std::chrono::milliseconds timeout);

    State state() const;

    DatasetCache(const DatasetCache&) = delete;
    DatasetCache& operator=(const DatasetCache&) = delete;

private:
    Loader m_loader;
    Builder m_builder;

    mutable std::mutex m_mutex;
    State m_state = State::Empty;
    std::shared_future<ArtifactPtr> m_inflight;
    ArtifactPtr m_ready;

    ArtifactPtr acquire(const std::chrono::milliseconds* timeout);
    ArtifactPtr execute(std::promise<ArtifactPtr>& promise);
};

const char* to_string(DatasetCache::State state);

} // namespace skyline
