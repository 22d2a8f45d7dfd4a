#pragma once
#include <vector>
#include <string>
#include <cstdint>
#include <cstddef>

namespace skyline {

/* Minimal GeoTIFF parser for single-band elevation rasters.
   Handles strip and tile layouts, uncompressed or deflate-compressed,
   int16/uint16/float32/float64 samples, no predictor.
   Does NOT handle LZW, multi-band, BigTIFF, or projected CRSs: pixel
   scale and tiepoint are assumed to be in degrees (EPSG:4326/4269).
   Convert other inputs with gdal_translate -co COMPRESS=DEFLATE. */

struct GeoTiffInfo {
    int width = 0;
    int height = 0;
    int bits_per_sample = 0;
    int sample_format = 1;     // 1=uint, 2=int, 3=float
    int compression = 1;       // 1=none, 8/32946=deflate
    int predictor = 1;
    int samples_per_pixel = 1;
    int rows_per_strip = 0;

    /* Tiled layout (tile_width > 0) */
    int tile_width = 0;
    int tile_height = 0;

    /* Geo metadata (ModelTiepoint/ModelPixelScale) */
    double tie_x = 0, tie_y = 0;       // upper-left corner (lon, lat)
    double scale_x = 0, scale_y = 0;   // pixel size in degrees
    bool has_geo = false;

    /* GDAL_NODATA tag, if present */
    bool has_nodata = false;
    double nodata = 0.0;

    /* Strip or tile offsets and byte counts */
    std::vector<uint64_t> block_offsets;
    std::vector<uint64_t> block_byte_counts;

    bool tiled() const { return tile_width > 0 && tile_height > 0; }
};

/* Parse GeoTIFF header and extract metadata.
   Returns false if the file is not a valid TIFF or cannot be parsed. */
bool geotiff_parse(const uint8_t* data, size_t size, GeoTiffInfo& info);

/* Read elevation data from a parsed GeoTIFF as a row-major float array
   (height x width). Throws DataLoadError on unsupported layouts or
   corrupt blocks; never returns a partially filled raster. */
std::vector<float> geotiff_read_elevation(const uint8_t* data, size_t size,
                                          const GeoTiffInfo& info);

} // namespace skyline
