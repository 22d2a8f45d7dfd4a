#include "elevation/geotiff.h"
#include "elevation/geotiff_elevation.h"
#include "tiff_fixture.h"
#include "util/error.h"
#include <gtest/gtest.h>
#include <cmath>
#include <filesystem>
#include <fstream>

using namespace skyline;
using skyline::test::TiffWriter;

static TiffWriter grid_4x3() {
    TiffWriter w;
    w.width = 4;
    w.height = 3;
    w.west = -112.0;
    w.north = 41.0;
    w.deg_per_col = 0.25;
    w.deg_per_row = 0.5;
    for (int r = 0; r < 3; ++r)
        for (int c = 0; c < 4; ++c)
            w.samples.push_back(static_cast<int16_t>(r * 10 + c - 5));
    return w;
}

static void expect_grid_4x3(const std::vector<uint8_t>& bytes) {
    GeoTiffInfo info;
    ASSERT_TRUE(geotiff_parse(bytes.data(), bytes.size(), info));
    EXPECT_EQ(info.width, 4);
    EXPECT_EQ(info.height, 3);
    EXPECT_TRUE(info.has_geo);
    EXPECT_DOUBLE_EQ(info.tie_x, -112.0);
    EXPECT_DOUBLE_EQ(info.tie_y, 41.0);
    EXPECT_DOUBLE_EQ(info.scale_x, 0.25);
    EXPECT_DOUBLE_EQ(info.scale_y, 0.5);

    auto elev = geotiff_read_elevation(bytes.data(), bytes.size(), info);
    ASSERT_EQ(elev.size(), 12u);
    for (int r = 0; r < 3; ++r)
        for (int c = 0; c < 4; ++c)
            EXPECT_FLOAT_EQ(elev[r * 4 + c], static_cast<float>(r * 10 + c - 5)) << r << "," << c;
}

TEST(GeoTiff, ReadsSingleUncompressedStrip) {
    expect_grid_4x3(grid_4x3().build());
}

TEST(GeoTiff, ReadsMultipleDeflateStrips) {
    TiffWriter w = grid_4x3();
    w.compression = 8;
    w.rows_per_strip = 2;
    expect_grid_4x3(w.build());
}

TEST(GeoTiff, ReadsMaximalRowsPerStripAsSingleStrip) {
    TiffWriter w = grid_4x3();
    w.rows_per_strip_max = true;
    auto bytes = w.build();

    GeoTiffInfo info;
    ASSERT_TRUE(geotiff_parse(bytes.data(), bytes.size(), info));
    EXPECT_EQ(info.rows_per_strip, 3);
    expect_grid_4x3(bytes);
}

TEST(GeoTiff, ClampsOversizedRowsPerStrip) {
    TiffWriter w = grid_4x3();
    w.compression = 8;
    w.rows_per_strip = 100;
    auto bytes = w.build();

    GeoTiffInfo info;
    ASSERT_TRUE(geotiff_parse(bytes.data(), bytes.size(), info));
    EXPECT_EQ(info.rows_per_strip, 3);
    expect_grid_4x3(bytes);
}

TEST(GeoTiff, ReadsPaddedTiles) {
    TiffWriter w = grid_4x3();
    w.tile_width = 2;
    w.tile_height = 2;
    expect_grid_4x3(w.build());

    w.compression = 8;
    expect_grid_4x3(w.build());
}

TEST(GeoTiff, ParsesGdalNodata) {
    TiffWriter w = grid_4x3();
    w.nodata = "-32767";
    auto bytes = w.build();
    GeoTiffInfo info;
    ASSERT_TRUE(geotiff_parse(bytes.data(), bytes.size(), info));
    EXPECT_TRUE(info.has_nodata);
    EXPECT_DOUBLE_EQ(info.nodata, -32767.0);
}

TEST(GeoTiff, RejectsNonTiff) {
    std::vector<uint8_t> png = {0x89, 'P', 'N', 'G', 0x0d, 0x0a, 0x1a, 0x0a, 0, 0};
    GeoTiffInfo info;
    EXPECT_FALSE(geotiff_parse(png.data(), png.size(), info));
}

TEST(GeoTiff, RejectsUnsupportedCompression) {
    TiffWriter w = grid_4x3();
    auto bytes = w.build();
    GeoTiffInfo info;
    ASSERT_TRUE(geotiff_parse(bytes.data(), bytes.size(), info));
    info.compression = 5;  // LZW
    EXPECT_THROW(geotiff_read_elevation(bytes.data(), bytes.size(), info), DataLoadError);
}

TEST(GeoTiff, RejectsTruncatedFile) {
    auto bytes = grid_4x3().build();
    GeoTiffInfo info;
    ASSERT_TRUE(geotiff_parse(bytes.data(), bytes.size(), info));
    EXPECT_THROW(geotiff_read_elevation(bytes.data(), 12, info), DataLoadError);
}

TEST(GeoTiffElevation, LoadMissingFileThrowsDataLoadError) {
    EXPECT_THROW(GeoTiffElevation::load("/nonexistent/skyline/n41w112_30m.tif"), DataLoadError);
}

TEST(GeoTiffElevation, LoadsFromDisk) {
    auto path = std::filesystem::temp_directory_path() / "skyline_test_grid.tif";
    {
        auto bytes = grid_4x3().build();
        std::ofstream f(path, std::ios::binary);
        f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }
    auto src = GeoTiffElevation::load(path.string());
    EXPECT_EQ(src->rows(), 3);
    EXPECT_EQ(src->cols(), 4);
    /* Center of pixel (1, 2) */
    EXPECT_NEAR(src->sample(41.0 - 0.75, -112.0 + 0.625), 7.0, 1e-6);
    std::filesystem::remove(path);
}

/* 201 x 201 flat plain at 1000 m with a 2000 m wall along the north edge */
static GeoTiffElevation walled_plain() {
    const int n = 201;
    std::vector<float> grid(n * n, 1000.0f);
    for (int r = 0; r < 5; ++r)
        for (int c = 0; c < n; ++c) grid[r * n + c] = 2000.0f;
    return GeoTiffElevation(std::move(grid), n, n, -112.0, 41.0, 0.001, 0.001);
}

TEST(GeoTiffElevation, RayCasterFindsWallToTheNorth) {
    GeoTiffElevation src = walled_plain();
    double lat = 41.0 - 0.1005;   // center row
    double lon = -112.0 + 0.1005; // center column

    auto north = src.horizon_query(lat, lon, 0, 0);
    ASSERT_EQ(north.size(), 1u);
    EXPECT_EQ(north[0].direction, 0);
    /* ~998 m of relief at ~10.6 km */
    EXPECT_GT(north[0].elevation_angle_deg, 4.0);
    EXPECT_LT(north[0].elevation_angle_deg, 6.0);
    EXPECT_GT(north[0].distance_km, 9.5);
    EXPECT_LT(north[0].distance_km, 11.5);

    auto south = src.horizon_query(lat, lon, 180, 180);
    EXPECT_LT(south[0].elevation_angle_deg, 0.0);
    EXPECT_GT(south[0].elevation_angle_deg, -1.0);
}

TEST(GeoTiffElevation, QueryReturnsOneSamplePerDirection) {
    GeoTiffElevation src = walled_plain();
    auto samples = src.horizon_query(40.9, -111.9, 350, 359);
    ASSERT_EQ(samples.size(), 10u);
    for (size_t i = 0; i < samples.size(); ++i)
        EXPECT_EQ(samples[i].direction, 350 + static_cast<int>(i));
}

TEST(GeoTiffElevation, RejectsMalformedRanges) {
    GeoTiffElevation src = walled_plain();
    EXPECT_THROW(src.horizon_query(40.9, -111.9, 325, 55), QueryError);
    EXPECT_THROW(src.horizon_query(40.9, -111.9, -1, 10), QueryError);
    EXPECT_THROW(src.horizon_query(40.9, -111.9, 0, 360), QueryError);
}

TEST(GeoTiffElevation, RejectsViewpointOutsideRaster) {
    GeoTiffElevation src = walled_plain();
    EXPECT_THROW(src.horizon_query(10.0, 10.0, 0, 10), QueryError);
}

TEST(GeoTiffElevation, RejectsMismatchedGrid) {
    EXPECT_THROW(GeoTiffElevation(std::vector<float>(10, 0.0f), 4, 4, 0, 0, 1, 1), DataLoadError);
}
