#include "pipeline/viewpoint_generator.h"
#include "horizon/direction_range.h"
#include "horizon/horizon_transform.h"
#include "util/log.h"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <mutex>
#include <thread>

namespace skyline {

Viewpoint generate_viewpoint(const ElevationSource& source, int angle,
                             const GenerationParams& params) {
    double step = 360.0 / params.angle_count;

    Viewpoint vp;
    vp.angle = angle;
    vp.location = destination_point(params.peak, params.distance_km, angle * step);
    vp.bearing_to_peak = bearing(vp.location, params.peak);

    DirectionRange range = plan_range(vp.bearing_to_peak, params.half_fov_deg);

    std::vector<RawHorizonSample> raw;
    for (const auto& sub : split_range(range)) {
        auto part = source.horizon_query(vp.location.latitude, vp.location.longitude,
                                         sub.start, sub.end);
        raw.insert(raw.end(), part.begin(), part.end());
    }

    vp.horizon = to_relative(raw, vp.bearing_to_peak);
    return vp;
}

static void report_progress(int done, int total) {
    if (done % 60 == 0 || done == total)
        LOG_INFO("Generated %d/%d", done, total);
}

Dataset build_dataset(const ElevationSource& source, const GenerationParams& params,
                      int workers) {
    int total = params.angle_count;
    LOG_INFO("Generating %d viewpoints from '%s' (%d worker%s)...",
             total, source.name(), workers, workers == 1 ? "" : "s");
    auto t0 = std::chrono::steady_clock::now();

    Dataset dataset(total);

    if (workers <= 1) {
        for (int angle = 0; angle < total; ++angle) {
            dataset[angle] = generate_viewpoint(source, angle, params);
            report_progress(angle + 1, total);
        }
    } else {
        /* Each worker claims the next angle and writes its own slot */
        std::atomic<int> next{0};
        std::atomic<int> done{0};
        std::atomic<bool> failed{false};
        std::exception_ptr first_error;
        std::mutex error_mutex;

        auto worker = [&] {
            while (!failed.load()) {
                int angle = next.fetch_add(1);
                if (angle >= total) break;
                try {
                    dataset[angle] = generate_viewpoint(source, angle, params);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error) first_error = std::current_exception();
                    failed.store(true);
                    break;
                }
                report_progress(done.fetch_add(1) + 1, total);
            }
        };

        std::vector<std::thread> threads;
        int n = std::min(workers, total);
        threads.reserve(n);
        for (int i = 0; i < n; ++i) threads.emplace_back(worker);
        for (auto& t : threads) t.join();

        if (first_error) std::rethrow_exception(first_error);
    }

    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
    LOG_INFO("Dataset built: %d viewpoints in %lld ms", total, static_cast<long long>(ms));
    return dataset;
}

} // namespace skyline
