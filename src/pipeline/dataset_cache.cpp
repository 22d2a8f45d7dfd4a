#include "pipeline/dataset_cache.h"
#include "util/error.h"
#include "util/log.h"
#include <exception>

namespace skyline {

DatasetCache::DatasetCache(Loader loader, Builder builder)
    : m_loader(std::move(loader))
    , m_builder(std::move(builder))
{}

DatasetCache::ArtifactPtr DatasetCache::get() {
    return acquire(nullptr);
}

DatasetCache::ArtifactPtr DatasetCache::get_for(std::chrono::milliseconds timeout) {
    return acquire(&timeout);
}

DatasetCache::State DatasetCache::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

DatasetCache::ArtifactPtr DatasetCache::acquire(const std::chrono::milliseconds* timeout) {
    std::promise<ArtifactPtr> promise;
    std::shared_future<ArtifactPtr> joined;

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        switch (m_state) {
            case State::Ready:
                return m_ready;
            case State::Pending:
                joined = m_inflight;
                break;
            case State::Empty:
                /* This caller wins the race and becomes the executor */
                m_inflight = promise.get_future().share();
                m_state = State::Pending;
                break;
        }
    }

    if (!joined.valid()) return execute(promise);

    LOG_DEBUG("DatasetCache: joining in-flight build");
    if (timeout && joined.wait_for(*timeout) != std::future_status::ready) {
        LOG_WARN("DatasetCache: gave up waiting after %lld ms",
                 static_cast<long long>(timeout->count()));
        return nullptr;
    }
    return joined.get();
}

DatasetCache::ArtifactPtr DatasetCache::execute(std::promise<ArtifactPtr>& promise) {
    LOG_INFO("DatasetCache: starting build");
    auto fail = [&](const char* what) {
        LOG_ERROR("DatasetCache: build failed: %s", what);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_state = State::Empty;
            m_inflight = {};
        }
        promise.set_exception(std::current_exception());
    };

    ArtifactPtr result;
    try {
        auto source = m_loader();
        if (!source) throw DataLoadError("elevation loader returned no source");
        result = std::make_shared<const DatasetArtifact>(m_builder(*source));
    } catch (const std::exception& e) {
        fail(e.what());
        throw;
    } catch (...) {
        fail("unknown exception");
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_ready = result;
        m_state = State::Ready;
        m_inflight = {};
    }
    promise.set_value(result);
    LOG_INFO("DatasetCache: ready (%d viewpoints)", result->viewpoint_count);
    return result;
}

const char* to_string(DatasetCache::State state) {
    switch (state) {
        case DatasetCache::State::Empty:   return "empty";
        case DatasetCache::State::Pending: return "pending";
        case DatasetCache::State::Ready:   return "ready";
    }
    return "unknown";
}

} // namespace skyline
