#include "elevation/geotiff.h"
#include "util/error.h"
#include "util/log.h"
#include <cstring>
#include <cstdlib>
#include <algorithm>
#include <zlib.h>

namespace skyline {

/* ── TIFF parsing helpers ──────────────────────────────────────────── */

static bool is_little_endian(const uint8_t* data) {
    return data[0] == 'I' && data[1] == 'I';
}

template<typename T>
static T read_val(const uint8_t* p, bool le) {
    T v = 0;
    if (le) {
        for (int i = sizeof(T) - 1; i >= 0; --i)
            v = (v << 8) | p[i];
    } else {
        for (size_t i = 0; i < sizeof(T); ++i)
            v = (v << 8) | p[i];
    }
    return v;
}

static uint16_t r16(const uint8_t* p, bool le) { return read_val<uint16_t>(p, le); }
static uint32_t r32(const uint8_t* p, bool le) { return read_val<uint32_t>(p, le); }
static uint64_t r64(const uint8_t* p, bool le) { return read_val<uint64_t>(p, le); }

static double r_double(const uint8_t* p, bool le) {
    uint64_t bits = r64(p, le);
    double v;
    std::memcpy(&v, &bits, 8);
    return v;
}

static float r_float(const uint8_t* p, bool le) {
    uint32_t bits = r32(p, le);
    float v;
    std::memcpy(&v, &bits, 4);
    return v;
}

/* TIFF tag IDs */
enum {
    TAG_WIDTH             = 256,
    TAG_HEIGHT            = 257,
    TAG_BITS_PER_SAMPLE   = 258,
    TAG_COMPRESSION       = 259,
    TAG_STRIP_OFFSETS     = 273,
    TAG_SAMPLES_PER_PIXEL = 277,
    TAG_ROWS_PER_STRIP    = 278,
    TAG_STRIP_BYTE_CNT    = 279,
    TAG_PREDICTOR         = 317,
    TAG_TILE_WIDTH        = 322,
    TAG_TILE_LENGTH       = 323,
    TAG_TILE_OFFSETS      = 324,
    TAG_TILE_BYTE_CNT     = 325,
    TAG_SAMPLE_FORMAT     = 339,
    TAG_MODEL_PIXSCALE    = 33550,
    TAG_MODEL_TIEPOINT    = 33922,
    TAG_GDAL_NODATA       = 42113,
};

enum {
    COMPRESSION_NONE         = 1,
    COMPRESSION_DEFLATE      = 8,
    COMPRESSION_DEFLATE_OLD  = 32946,
};

struct IFDEntry {
    uint16_t tag;
    uint16_t type;
    uint32_t count;
    const uint8_t* field;   // the 4-byte value/offset field
    uint32_t value_offset;
};

static size_t type_size(uint16_t type) {
    switch (type) {
        case 1: return 1; // BYTE
        case 2: return 1; // ASCII
        case 3: return 2; // SHORT
        case 4: return 4; // LONG
        case 5: return 8; // RATIONAL
        case 6: return 1; // SBYTE
        case 7: return 1; // UNDEFINED
        case 8: return 2; // SSHORT
        case 9: return 4; // SLONG
        case 10: return 8; // SRATIONAL
        case 11: return 4; // FLOAT
        case 12: return 8; // DOUBLE
        case 16: return 8; // LONG8 (BigTIFF)
        default: return 1;
    }
}

/* Pointer to an entry's payload: inline when it fits in 4 bytes,
   otherwise at value_offset. nullptr if it runs past the buffer. */
static const uint8_t* entry_payload(const uint8_t* data, size_t size, const IFDEntry& e) {
    uint64_t total = static_cast<uint64_t>(type_size(e.type)) * e.count;
    if (total <= 4) return e.field;
    if (e.value_offset + total > size) return nullptr;
    return data + e.value_offset;
}

static uint32_t single_val(const IFDEntry& e, bool le) {
    if (e.type == 3) return r16(e.field, le);
    return r32(e.field, le);
}

static std::vector<uint64_t> read_offset_array(const uint8_t* data, size_t size,
                                               const IFDEntry& e, bool le) {
    std::vector<uint64_t> result;
    const uint8_t* p = entry_payload(data, size, e);
    if (!p) return result;

    result.reserve(e.count);
    for (uint32_t i = 0; i < e.count; ++i) {
        if (e.type == 3)
            result.push_back(r16(p + i * 2, le));
        else if (e.type == 4)
            result.push_back(r32(p + i * 4, le));
        else if (e.type == 16)
            result.push_back(r64(p + i * 8, le));
        else
            result.push_back(p[i]);
    }
    return result;
}

static std::vector<double> read_double_array(const uint8_t* data, size_t size,
                                             const IFDEntry& e, bool le) {
    std::vector<double> result;
    if (e.type != 12) return result; // DOUBLE only
    const uint8_t* p = entry_payload(data, size, e);
    if (!p) return result;
    for (uint32_t i = 0; i < e.count; ++i) {
        result.push_back(r_double(p + i * 8, le));
    }
    return result;
}

static std::string read_ascii(const uint8_t* data, size_t size, const IFDEntry& e) {
    if (e.type != 2) return {};
    const uint8_t* p = entry_payload(data, size, e);
    if (!p) return {};
    std::string s(reinterpret_cast<const char*>(p), e.count);
    size_t nul = s.find('\0');
    if (nul != std::string::npos) s.resize(nul);
    return s;
}

bool geotiff_parse(const uint8_t* data, size_t size, GeoTiffInfo& info) {
    if (size < 8) return false;
    if (!(data[0] == 'I' && data[1] == 'I') && !(data[0] == 'M' && data[1] == 'M')) {
        LOG_WARN("GeoTIFF: bad byte-order mark");
        return false;
    }

    bool le = is_little_endian(data);
    uint16_t magic = r16(data + 2, le);
    if (magic != 42) {
        LOG_WARN("GeoTIFF: not a classic TIFF file (magic=%d)", magic);
        return false;
    }

    uint32_t ifd_offset = r32(data + 4, le);
    if (static_cast<uint64_t>(ifd_offset) + 2 > size) return false;

    uint16_t num_entries = r16(data + ifd_offset, le);
    const uint8_t* entry_p = data + ifd_offset + 2;

    for (uint16_t i = 0; i < num_entries; ++i) {
        if (entry_p + 12 > data + size) break;

        IFDEntry e;
        e.tag = r16(entry_p, le);
        e.type = r16(entry_p + 2, le);
        e.count = r32(entry_p + 4, le);
        e.field = entry_p + 8;
        e.value_offset = r32(entry_p + 8, le);
        entry_p += 12;

        switch (e.tag) {
            case TAG_WIDTH:
                info.width = static_cast<int>(single_val(e, le));
                break;
            case TAG_HEIGHT:
                info.height = static_cast<int>(single_val(e, le));
                break;
            case TAG_BITS_PER_SAMPLE:
                info.bits_per_sample = static_cast<int>(single_val(e, le));
                break;
            case TAG_COMPRESSION:
                info.compression = static_cast<int>(single_val(e, le));
                break;
            case TAG_SAMPLES_PER_PIXEL:
                info.samples_per_pixel = static_cast<int>(single_val(e, le));
                break;
            case TAG_ROWS_PER_STRIP: {
                /* 2^32-1 (the default) means the whole image is one strip */
                uint32_t rps = single_val(e, le);
                info.rows_per_strip = rps > 0x7FFFFFFFu ? 0 : static_cast<int>(rps);
                break;
            }
            case TAG_PREDICTOR:
                info.predictor = static_cast<int>(single_val(e, le));
                break;
            case TAG_TILE_WIDTH:
                info.tile_width = static_cast<int>(single_val(e, le));
                break;
            case TAG_TILE_LENGTH:
                info.tile_height = static_cast<int>(single_val(e, le));
                break;
            case TAG_SAMPLE_FORMAT:
                info.sample_format = static_cast<int>(single_val(e, le));
                break;
            case TAG_STRIP_OFFSETS:
            case TAG_TILE_OFFSETS:
                info.block_offsets = read_offset_array(data, size, e, le);
                break;
            case TAG_STRIP_BYTE_CNT:
            case TAG_TILE_BYTE_CNT:
                info.block_byte_counts = read_offset_array(data, size, e, le);
                break;
            case TAG_MODEL_TIEPOINT: {
                auto vals = read_double_array(data, size, e, le);
                if (vals.size() >= 6) {
                    info.tie_x = vals[3]; // lon of (0,0) pixel
                    info.tie_y = vals[4]; // lat of (0,0) pixel
                    info.has_geo = true;
                }
                break;
            }
            case TAG_MODEL_PIXSCALE: {
                auto vals = read_double_array(data, size, e, le);
                if (vals.size() >= 2) {
                    info.scale_x = vals[0];
                    info.scale_y = vals[1];
                }
                break;
            }
            case TAG_GDAL_NODATA: {
                std::string s = read_ascii(data, size, e);
                if (!s.empty()) {
                    char* end = nullptr;
                    double v = std::strtod(s.c_str(), &end);
                    if (end != s.c_str()) {
                        info.nodata = v;
                        info.has_nodata = true;
                    }
                }
                break;
            }
        }
    }

    if (info.rows_per_strip <= 0 || info.rows_per_strip > info.height)
        info.rows_per_strip = info.height;
    if (info.scale_x == 0 || info.scale_y == 0) info.has_geo = false;

    return info.width > 0 && info.height > 0;
}

static std::vector<uint8_t> decompress_deflate(const uint8_t* src, size_t src_len,
                                               size_t expected_len) {
    std::vector<uint8_t> out(expected_len);
    z_stream strm{};
    strm.next_in = const_cast<Bytef*>(src);
    strm.avail_in = static_cast<uInt>(src_len);
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());

    if (inflateInit(&strm) != Z_OK) return {};
    int ret = inflate(&strm, Z_FINISH);
    inflateEnd(&strm);

    /* A block may legitimately fill the buffer exactly without the
       decoder having seen the stream end marker yet. */
    if (ret != Z_STREAM_END && !(ret == Z_BUF_ERROR && strm.avail_out == 0)) return {};
    out.resize(strm.total_out);
    return out;
}

static bool sample_format_supported(const GeoTiffInfo& info) {
    if (info.sample_format == 3)
        return info.bits_per_sample == 32 || info.bits_per_sample == 64;
    if (info.sample_format == 1 || info.sample_format == 2)
        return info.bits_per_sample == 16;
    return false;
}

static float read_sample(const uint8_t* p, bool le, const GeoTiffInfo& info) {
    if (info.sample_format == 3) {
        if (info.bits_per_sample == 32) return r_float(p, le);
        return static_cast<float>(r_double(p, le));
    }
    if (info.sample_format == 2) return static_cast<float>(static_cast<int16_t>(r16(p, le)));
    return static_cast<float>(r16(p, le));
}

std::vector<float> geotiff_read_elevation(const uint8_t* data, size_t size,
                                          const GeoTiffInfo& info) {
    if (info.samples_per_pixel != 1)
        throw DataLoadError("GeoTIFF: only single-band rasters are supported");
    if (!sample_format_supported(info))
        throw DataLoadError("GeoTIFF: unsupported sample format " +
                            std::to_string(info.sample_format) + "/" +
                            std::to_string(info.bits_per_sample) + " bits");
    if (info.compression != COMPRESSION_NONE && info.compression != COMPRESSION_DEFLATE &&
        info.compression != COMPRESSION_DEFLATE_OLD)
        throw DataLoadError("GeoTIFF: unsupported compression " +
                            std::to_string(info.compression));
    if (info.predictor != 1)
        throw DataLoadError("GeoTIFF: unsupported predictor " + std::to_string(info.predictor));
    if (info.block_offsets.empty())
        throw DataLoadError("GeoTIFF: no strip or tile offsets");

    bool le = is_little_endian(data);
    int bytes_per_sample = info.bits_per_sample / 8;

    /* Block grid: strips are full-width tiles of rows_per_strip rows */
    int block_w = info.tiled() ? info.tile_width : info.width;
    int block_h = info.tiled() ? info.tile_height : info.rows_per_strip;
    int blocks_across = (info.width + block_w - 1) / block_w;
    int blocks_down = (info.height + block_h - 1) / block_h;
    size_t needed = static_cast<size_t>(blocks_across) * blocks_down;
    if (info.block_offsets.size() < needed || info.block_byte_counts.size() < needed)
        throw DataLoadError("GeoTIFF: block table is shorter than the raster");

    size_t block_bytes = static_cast<size_t>(block_w) * block_h * bytes_per_sample;
    std::vector<float> elev(static_cast<size_t>(info.width) * info.height, 0.0f);

    for (size_t b = 0; b < needed; ++b) {
        uint64_t offset = info.block_offsets[b];
        uint64_t byte_count = info.block_byte_counts[b];
        if (offset + byte_count > size)
            throw DataLoadError("GeoTIFF: block " + std::to_string(b) + " runs past end of file");

        const uint8_t* block = data + offset;
        size_t block_len = byte_count;
        std::vector<uint8_t> inflated;

        if (info.compression != COMPRESSION_NONE) {
            inflated = decompress_deflate(block, byte_count, block_bytes);
            if (inflated.empty())
                throw DataLoadError("GeoTIFF: deflate decompression failed at block " +
                                    std::to_string(b));
            block = inflated.data();
            block_len = inflated.size();
        }

        int row0 = static_cast<int>(b / blocks_across) * block_h;
        int col0 = static_cast<int>(b % blocks_across) * block_w;
        int rows = std::min(block_h, info.height - row0);
        int cols = std::min(block_w, info.width - col0);

        for (int r = 0; r < rows; ++r) {
            size_t row_start = static_cast<size_t>(r) * block_w * bytes_per_sample;
            /* Last strip may be stored short */
            if (row_start + static_cast<size_t>(cols) * bytes_per_sample > block_len)
                throw DataLoadError("GeoTIFF: truncated block " + std::to_string(b));

            const uint8_t* row_p = block + row_start;
            float* dst = elev.data() + static_cast<size_t>(row0 + r) * info.width + col0;
            for (int c = 0; c < cols; ++c)
                dst[c] = read_sample(row_p + c * bytes_per_sample, le, info);
        }
    }

    return elev;
}

} // namespace skyline
