#include <gtest/gtest.h>
#include "litevox/compression.hpp"
#include "litevox/nbt.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace litevox;

namespace {

std::vector<uint8_t> sampleData() {
    std::vector<uint8_t> data;
    // Repetitive enough to compress, varied enough to be a real test
    for (int i = 0; i < 20000; ++i) {
        data.push_back(static_cast<uint8_t>((i * 7) % 13 + (i / 1000)));
    }
    return data;
}

}  // namespace

TEST(CompressionTest, Names) {
    EXPECT_EQ(compressionName(Compression::Gzip), "gzip");
    EXPECT_EQ(parseCompression("GZIP"), Compression::Gzip);
    EXPECT_EQ(parseCompression("zlib"), Compression::Zlib);
    EXPECT_EQ(parseCompression("lz4"), Compression::Lz4);
    EXPECT_EQ(parseCompression("none"), Compression::None);
    EXPECT_EQ(parseCompression("auto"), Compression::Auto);
    EXPECT_FALSE(parseCompression("bzip2").has_value());
}

TEST(CompressionTest, RoundTripEveryEnvelope) {
    std::vector<uint8_t> data = sampleData();
    for (Compression c : {Compression::None, Compression::Gzip, Compression::Zlib, Compression::Lz4}) {
        std::vector<uint8_t> packed = compress(data, c);
        EXPECT_EQ(decompress(packed, c), data) << compressionName(c);
        if (c != Compression::None) {
            EXPECT_LT(packed.size(), data.size()) << compressionName(c);
        }
    }
}

TEST(CompressionTest, RoundTripEmpty) {
    std::vector<uint8_t> empty;
    for (Compression c : {Compression::Gzip, Compression::Zlib}) {
        EXPECT_TRUE(decompress(compress(empty, c), c).empty()) << compressionName(c);
    }
}

TEST(CompressionTest, DetectsEnvelope) {
    std::vector<uint8_t> data = sampleData();
    EXPECT_EQ(detectCompression(compress(data, Compression::Gzip)), Compression::Gzip);
    EXPECT_EQ(detectCompression(compress(data, Compression::Zlib)), Compression::Zlib);
    EXPECT_EQ(detectCompression(compress(data, Compression::Lz4)), Compression::Lz4);

    // Uncompressed NBT starts with a compound tag id
    std::vector<uint8_t> nbt = {0x0a, 0x00, 0x00, 0x00};
    EXPECT_EQ(detectCompression(nbt), Compression::None);
    EXPECT_EQ(detectCompression(std::vector<uint8_t>{}), Compression::None);
}

TEST(CompressionTest, AutoDecompress) {
    std::vector<uint8_t> data = sampleData();
    for (Compression c : {Compression::Gzip, Compression::Zlib, Compression::Lz4}) {
        EXPECT_EQ(decompress(compress(data, c), Compression::Auto), data) << compressionName(c);
    }
}

TEST(CompressionTest, AutoIsNotAWriteFormat) {
    std::vector<uint8_t> data = {1, 2, 3};
    EXPECT_THROW((void)compress(data, Compression::Auto), std::invalid_argument);
}

TEST(CompressionTest, TruncatedGzipIsMalformed) {
    std::vector<uint8_t> packed = compress(sampleData(), Compression::Gzip);
    packed.resize(packed.size() / 2);
    try {
        (void)decompress(packed, Compression::Gzip);
        FAIL() << "Expected NbtError";
    } catch (const NbtError& e) {
        EXPECT_EQ(e.kind(), NbtError::Kind::Malformed);
    }
}

TEST(CompressionTest, CorruptZlibIsMalformed) {
    std::vector<uint8_t> garbage = {0x78, 0x9c, 0xff, 0xff, 0xff, 0xff, 0x00, 0x01};
    EXPECT_THROW((void)decompress(garbage, Compression::Zlib), NbtError);
}

TEST(CompressionTest, BadLz4FrameIsMalformed) {
    std::vector<uint8_t> packed = compress(sampleData(), Compression::Lz4);

    std::vector<uint8_t> shortFrame(packed.begin(), packed.begin() + 8);
    EXPECT_THROW((void)decompress(shortFrame, Compression::Lz4), NbtError);

    std::vector<uint8_t> badMagic = packed;
    badMagic[0] = 'X';
    EXPECT_THROW((void)decompress(badMagic, Compression::Lz4), NbtError);

    std::vector<uint8_t> truncated = packed;
    truncated.resize(truncated.size() - 10);
    EXPECT_THROW((void)decompress(truncated, Compression::Lz4), NbtError);
}
