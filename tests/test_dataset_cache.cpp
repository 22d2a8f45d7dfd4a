#include "pipeline/dataset_cache.h"
#include "fake_elevation.h"
#include "util/error.h"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

using namespace skyline;
using skyline::test::FakeElevation;

namespace {

/* Counts loads and builds; loads block until release() so tests can pile
   callers up behind a Pending build. */
struct Harness {
    std::atomic<int> loads{0};
    std::atomic<int> builds{0};
    std::atomic<int> fail_loads{0};     // first N loads throw
    bool fail_build = false;
    std::promise<void> gate;
    std::shared_future<void> gate_future = gate.get_future().share();

    void release() { gate.set_value(); }

    DatasetCache::Loader loader() {
        return [this]() -> std::shared_ptr<const ElevationSource> {
            int n = loads.fetch_add(1);
            gate_future.wait();
            if (n < fail_loads.load()) throw DataLoadError("elevation file missing");
            return std::make_shared<const FakeElevation>();
        };
    }

    DatasetCache::Builder builder() {
        return [this](const ElevationSource&) {
            builds.fetch_add(1);
            if (fail_build) throw SerializationError("cannot encode");
            DatasetArtifact a;
            a.json = "[]";
            a.gzip = {0x1f, 0x8b};
            a.viewpoint_count = 360;
            return a;
        };
    }
};

void wait_for_state(const DatasetCache& cache, DatasetCache::State state) {
    for (int i = 0; i < 2000 && cache.state() != state; ++i)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    ASSERT_EQ(cache.state(), state);
}

} // namespace

TEST(DatasetCache, StartsEmpty) {
    Harness h;
    DatasetCache cache(h.loader(), h.builder());
    EXPECT_EQ(cache.state(), DatasetCache::State::Empty);
    EXPECT_STREQ(to_string(cache.state()), "empty");
    h.release();
}

TEST(DatasetCache, ConcurrentCallersShareOneBuild) {
    Harness h;
    DatasetCache cache(h.loader(), h.builder());

    constexpr int N = 8;
    std::vector<std::future<DatasetCache::ArtifactPtr>> results;
    for (int i = 0; i < N; ++i)
        results.push_back(std::async(std::launch::async, [&cache] { return cache.get(); }));

    wait_for_state(cache, DatasetCache::State::Pending);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    h.release();

    std::vector<DatasetCache::ArtifactPtr> artifacts;
    for (auto& f : results) artifacts.push_back(f.get());

    EXPECT_EQ(h.loads.load(), 1);
    EXPECT_EQ(h.builds.load(), 1);
    for (const auto& a : artifacts) {
        ASSERT_NE(a, nullptr);
        EXPECT_EQ(a.get(), artifacts[0].get());
    }
    EXPECT_EQ(cache.state(), DatasetCache::State::Ready);
}

TEST(DatasetCache, ReadyResultIsReusedForever) {
    Harness h;
    h.release();
    DatasetCache cache(h.loader(), h.builder());

    auto first = cache.get();
    for (int i = 0; i < 5; ++i) EXPECT_EQ(cache.get().get(), first.get());
    EXPECT_EQ(h.loads.load(), 1);
    EXPECT_EQ(h.builds.load(), 1);
    EXPECT_EQ(first->viewpoint_count, 360);
}

TEST(DatasetCache, FailedLoadReturnsToEmptyAndRetries) {
    Harness h;
    h.fail_loads = 1;
    h.release();
    DatasetCache cache(h.loader(), h.builder());

    EXPECT_THROW(cache.get(), DataLoadError);
    EXPECT_EQ(cache.state(), DatasetCache::State::Empty);
    EXPECT_EQ(h.builds.load(), 0);

    auto artifact = cache.get();
    ASSERT_NE(artifact, nullptr);
    EXPECT_EQ(h.loads.load(), 2);
    EXPECT_EQ(h.builds.load(), 1);
    EXPECT_EQ(cache.state(), DatasetCache::State::Ready);
}

TEST(DatasetCache, FailedBuildIsNotCached) {
    Harness h;
    h.fail_build = true;
    h.release();
    DatasetCache cache(h.loader(), h.builder());

    EXPECT_THROW(cache.get(), SerializationError);
    EXPECT_EQ(cache.state(), DatasetCache::State::Empty);
    EXPECT_THROW(cache.get(), SerializationError);
    EXPECT_EQ(h.builds.load(), 2);
}

TEST(DatasetCache, AllWaitersObserveTheFailure) {
    Harness h;
    h.fail_loads = 1000;
    DatasetCache cache(h.loader(), h.builder());

    constexpr int N = 6;
    std::vector<std::future<DatasetCache::ArtifactPtr>> results;
    for (int i = 0; i < N; ++i)
        results.push_back(std::async(std::launch::async, [&cache] { return cache.get(); }));

    wait_for_state(cache, DatasetCache::State::Pending);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    h.release();

    int failures = 0;
    for (auto& f : results) {
        try {
            f.get();
        } catch (const DataLoadError&) {
            ++failures;
        }
    }
    EXPECT_EQ(failures, N);
    EXPECT_EQ(h.builds.load(), 0);
    EXPECT_EQ(cache.state(), DatasetCache::State::Empty);
}

TEST(DatasetCache, TimedOutWaiterDoesNotAbortBuild) {
    Harness h;
    DatasetCache cache(h.loader(), h.builder());

    auto executor = std::async(std::launch::async, [&cache] { return cache.get(); });
    wait_for_state(cache, DatasetCache::State::Pending);

    EXPECT_EQ(cache.get_for(std::chrono::milliseconds(20)), nullptr);
    EXPECT_EQ(cache.state(), DatasetCache::State::Pending);

    h.release();
    auto built = executor.get();
    ASSERT_NE(built, nullptr);
    EXPECT_EQ(cache.get_for(std::chrono::milliseconds(20)).get(), built.get());
    EXPECT_EQ(h.builds.load(), 1);
}
