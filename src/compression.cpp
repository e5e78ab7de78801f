#include "litevox/compression.hpp"
#include "litevox/nbt.hpp"

#include <lz4.h>
#include <zlib.h>

#include <cctype>
#include <cstring>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>

namespace litevox {

namespace {

constexpr uint8_t LZ4_MAGIC[4] = {'L', 'V', 'Z', '4'};
constexpr size_t LZ4_HEADER_SIZE = 12;
constexpr size_t INFLATE_CHUNK = 64 * 1024;

// zlib windowBits: +16 selects the gzip wrapper
constexpr int ZLIB_WINDOW = 15;
constexpr int GZIP_WINDOW = 15 + 16;

[[noreturn]] void malformed(const std::string& message) {
    throw NbtError(NbtError::Kind::Malformed, message);
}

void writeU32LE(std::vector<uint8_t>& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value));
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value >> 16));
    out.push_back(static_cast<uint8_t>(value >> 24));
}

uint32_t readU32LE(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) |
           (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) |
           (static_cast<uint32_t>(p[3]) << 24);
}

// ============================================================================
// zlib (gzip and zlib wrappers)
// ============================================================================

struct InflateStream {
    z_stream strm{};
    bool initialized = false;

    ~InflateStream() {
        if (initialized) inflateEnd(&strm);
    }
};

struct DeflateStream {
    z_stream strm{};
    bool initialized = false;

    ~DeflateStream() {
        if (initialized) deflateEnd(&strm);
    }
};

std::vector<uint8_t> deflateBytes(std::span<const uint8_t> data, int windowBits) {
    if (data.size() > std::numeric_limits<uInt>::max()) {
        throw std::runtime_error("Document too large to compress");
    }

    DeflateStream stream;
    if (deflateInit2(&stream.strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, windowBits, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("zlib deflateInit2 failed");
    }
    stream.initialized = true;

    std::vector<uint8_t> out(deflateBound(&stream.strm, static_cast<uLong>(data.size())));
    stream.strm.next_in = const_cast<Bytef*>(data.data());
    stream.strm.avail_in = static_cast<uInt>(data.size());
    stream.strm.next_out = out.data();
    stream.strm.avail_out = static_cast<uInt>(out.size());

    if (deflate(&stream.strm, Z_FINISH) != Z_STREAM_END) {
        throw std::runtime_error("zlib deflate failed");
    }

    out.resize(stream.strm.total_out);
    return out;
}

std::vector<uint8_t> inflateBytes(std::span<const uint8_t> data, int windowBits) {
    if (data.size() > std::numeric_limits<uInt>::max()) {
        malformed("Compressed document too large");
    }

    InflateStream stream;
    if (inflateInit2(&stream.strm, windowBits) != Z_OK) {
        throw std::runtime_error("zlib inflateInit2 failed");
    }
    stream.initialized = true;

    stream.strm.next_in = const_cast<Bytef*>(data.data());
    stream.strm.avail_in = static_cast<uInt>(data.size());

    std::vector<uint8_t> out;
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        size_t used = out.size();
        out.resize(used + INFLATE_CHUNK);
        stream.strm.next_out = out.data() + used;
        stream.strm.avail_out = static_cast<uInt>(INFLATE_CHUNK);

        ret = inflate(&stream.strm, Z_NO_FLUSH);
        out.resize(used + (INFLATE_CHUNK - stream.strm.avail_out));

        if (ret != Z_OK && ret != Z_STREAM_END) {
            malformed(std::string("Decompression failed: ") +
                      (stream.strm.msg ? stream.strm.msg : "truncated stream"));
        }
        if (ret == Z_OK && stream.strm.avail_in == 0 && stream.strm.avail_out != 0) {
            malformed("Decompression failed: truncated stream");
        }
    }

    return out;
}

// ============================================================================
// LZ4
// ============================================================================

std::vector<uint8_t> lz4Compress(std::span<const uint8_t> data) {
    if (data.size() > static_cast<size_t>(LZ4_MAX_INPUT_SIZE)) {
        throw std::runtime_error("Document too large for LZ4");
    }

    int srcSize = static_cast<int>(data.size());
    int maxCompressed = LZ4_compressBound(srcSize);
    std::vector<uint8_t> compressed(static_cast<size_t>(maxCompressed));

    int compressedSize = LZ4_compress_default(
        reinterpret_cast<const char*>(data.data()),
        reinterpret_cast<char*>(compressed.data()),
        srcSize,
        maxCompressed);

    if (compressedSize <= 0) {
        throw std::runtime_error("LZ4 compression failed");
    }

    std::vector<uint8_t> out;
    out.reserve(LZ4_HEADER_SIZE + static_cast<size_t>(compressedSize));
    out.insert(out.end(), std::begin(LZ4_MAGIC), std::end(LZ4_MAGIC));
    writeU32LE(out, static_cast<uint32_t>(srcSize));
    writeU32LE(out, static_cast<uint32_t>(compressedSize));
    out.insert(out.end(), compressed.begin(), compressed.begin() + compressedSize);
    return out;
}

std::vector<uint8_t> lz4Decompress(std::span<const uint8_t> data) {
    if (data.size() < LZ4_HEADER_SIZE) {
        malformed("LZ4 frame too small");
    }
    if (std::memcmp(data.data(), LZ4_MAGIC, sizeof(LZ4_MAGIC)) != 0) {
        malformed("Invalid LZ4 frame magic");
    }

    uint32_t uncompressedSize = readU32LE(data.data() + 4);
    uint32_t compressedSize = readU32LE(data.data() + 8);

    if (compressedSize > data.size() - LZ4_HEADER_SIZE ||
        uncompressedSize > static_cast<uint32_t>(std::numeric_limits<int>::max()) ||
        compressedSize > static_cast<uint32_t>(std::numeric_limits<int>::max())) {
        malformed("LZ4 frame sizes out of range");
    }

    std::vector<uint8_t> out(uncompressedSize);
    int result = LZ4_decompress_safe(
        reinterpret_cast<const char*>(data.data() + LZ4_HEADER_SIZE),
        reinterpret_cast<char*>(out.data()),
        static_cast<int>(compressedSize),
        static_cast<int>(uncompressedSize));

    if (result < 0 || static_cast<uint32_t>(result) != uncompressedSize) {
        malformed("LZ4 decompression failed");
    }
    return out;
}

}  // namespace

std::string_view compressionName(Compression compression) {
    switch (compression) {
        case Compression::None: return "none";
        case Compression::Gzip: return "gzip";
        case Compression::Zlib: return "zlib";
        case Compression::Lz4: return "lz4";
        case Compression::Auto: return "auto";
    }
    return "unknown";
}

std::optional<Compression> parseCompression(std::string_view name) {
    std::string lower;
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lower == "none" || lower == "uncompressed") return Compression::None;
    if (lower == "gzip" || lower == "gz") return Compression::Gzip;
    if (lower == "zlib") return Compression::Zlib;
    if (lower == "lz4") return Compression::Lz4;
    if (lower == "auto") return Compression::Auto;
    return std::nullopt;
}

Compression detectCompression(std::span<const uint8_t> data) {
    if (data.size() >= 2 && data[0] == 0x1f && data[1] == 0x8b) {
        return Compression::Gzip;
    }
    if (data.size() >= sizeof(LZ4_MAGIC) &&
        std::memcmp(data.data(), LZ4_MAGIC, sizeof(LZ4_MAGIC)) == 0) {
        return Compression::Lz4;
    }
    // zlib header: CM = 8 (deflate) and (CMF * 256 + FLG) divisible by 31
    if (data.size() >= 2 && (data[0] & 0x0f) == 8 &&
        ((static_cast<unsigned>(data[0]) << 8) | data[1]) % 31 == 0) {
        return Compression::Zlib;
    }
    return Compression::None;
}

std::vector<uint8_t> compress(std::span<const uint8_t> data, Compression compression) {
    switch (compression) {
        case Compression::None: return std::vector<uint8_t>(data.begin(), data.end());
        case Compression::Gzip: return deflateBytes(data, GZIP_WINDOW);
        case Compression::Zlib: return deflateBytes(data, ZLIB_WINDOW);
        case Compression::Lz4: return lz4Compress(data);
        case Compression::Auto: break;
    }
    throw std::invalid_argument("A concrete compression must be chosen for writing");
}

std::vector<uint8_t> decompress(std::span<const uint8_t> data, Compression compression) {
    if (compression == Compression::Auto) {
        compression = detectCompression(data);
    }
    switch (compression) {
        case Compression::None: return std::vector<uint8_t>(data.begin(), data.end());
        case Compression::Gzip: return inflateBytes(data, GZIP_WINDOW);
        case Compression::Zlib: return inflateBytes(data, ZLIB_WINDOW);
        case Compression::Lz4: return lz4Decompress(data);
        case Compression::Auto: break;
    }
    malformed("Unknown compression");
}

}  // namespace litevox
