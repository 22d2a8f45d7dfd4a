#include "horizon/horizon_transform.h"
#include "horizon/direction_range.h"
#include <gtest/gtest.h>
#include <set>

using namespace skyline;

static std::vector<RawHorizonSample> raw_for(const DirectionRange& range) {
    std::vector<RawHorizonSample> raw;
    for (const auto& part : split_range(range)) {
        for (int d = part.start; d <= part.end; ++d)
            raw.push_back({d, d * 0.5, d / 10.0});
    }
    return raw;
}

TEST(HorizonTransform, WrappedWindowBecomesContiguousAroundZero) {
    auto horizon = to_relative(raw_for(plan_range(10.0)), 10.0);

    ASSERT_EQ(horizon.size(), 91u);
    for (size_t i = 0; i < horizon.size(); ++i)
        EXPECT_EQ(horizon[i].relative_direction, static_cast<int>(i) - 45);

    /* 325 (left edge) carries its own values through */
    EXPECT_DOUBLE_EQ(horizon.front().elevation_angle_deg, 325 * 0.5);
    EXPECT_DOUBLE_EQ(horizon.front().distance_km, 32.5);
    EXPECT_DOUBLE_EQ(horizon.back().elevation_angle_deg, 55 * 0.5);
}

TEST(HorizonTransform, OutputIsSortedAndUnique) {
    for (double b : {0.0, 0.4, 44.6, 133.2, 180.0, 271.5, 359.6}) {
        auto horizon = to_relative(raw_for(plan_range(b)), b);
        std::set<int> seen;
        for (size_t i = 0; i < horizon.size(); ++i) {
            EXPECT_TRUE(seen.insert(horizon[i].relative_direction).second) << b;
            if (i > 0) EXPECT_LT(horizon[i - 1].relative_direction, horizon[i].relative_direction) << b;
            EXPECT_GE(horizon[i].relative_direction, -180);
            EXPECT_LE(horizon[i].relative_direction, 180);
        }
    }
}

TEST(HorizonTransform, RoundsBearingBeforeSubtracting) {
    std::vector<RawHorizonSample> raw = {{181, 1.0, 1.0}, {180, 2.0, 2.0}};

    /* 180.6 rounds to 181: direction 181 is dead center */
    auto up = to_relative(raw, 180.6);
    EXPECT_EQ(up[0].relative_direction, -1);
    EXPECT_EQ(up[1].relative_direction, 0);
    EXPECT_DOUBLE_EQ(up[1].elevation_angle_deg, 1.0);

    /* 180.4 rounds to 180 */
    auto down = to_relative(raw, 180.4);
    EXPECT_EQ(down[0].relative_direction, 0);
    EXPECT_EQ(down[1].relative_direction, 1);
    EXPECT_DOUBLE_EQ(down[0].elevation_angle_deg, 2.0);

    /* Halves round up */
    auto half = to_relative(raw, 180.5);
    EXPECT_EQ(half[1].relative_direction, 0);
    EXPECT_EQ(half[1].distance_km, 1.0);
}

TEST(HorizonTransform, BearingRoundingUpToFullTurn) {
    std::vector<RawHorizonSample> raw = {{0, 3.0, 4.0}, {359, 1.0, 1.0}, {1, 5.0, 5.0}};
    auto horizon = to_relative(raw, 359.6);
    ASSERT_EQ(horizon.size(), 3u);
    EXPECT_EQ(horizon[0].relative_direction, -1);
    EXPECT_EQ(horizon[1].relative_direction, 0);
    EXPECT_EQ(horizon[2].relative_direction, 1);
    EXPECT_DOUBLE_EQ(horizon[1].elevation_angle_deg, 3.0);
}

TEST(HorizonTransform, EmptyInput) {
    EXPECT_TRUE(to_relative({}, 42.0).empty());
}
