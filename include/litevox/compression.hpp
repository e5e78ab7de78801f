#pragma once

/**
 * @file compression.hpp
 * @brief Compression envelopes for serialized documents
 *
 * Gzip and Zlib use zlib's deflate streams. Lz4 uses a small frame:
 * magic "LVZ4" (4 bytes) + uncompressed size (4 bytes LE)
 * + compressed size (4 bytes LE) + LZ4 block.
 */

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace litevox {

enum class Compression : uint8_t {
    None,
    Gzip,
    Zlib,
    Lz4,
    Auto,  ///< Read side only: detect from the leading bytes
};

[[nodiscard]] std::string_view compressionName(Compression compression);

/// Parse "none", "gzip", "zlib", "lz4" or "auto"
[[nodiscard]] std::optional<Compression> parseCompression(std::string_view name);

/// Guess the envelope of data (never returns Auto)
[[nodiscard]] Compression detectCompression(std::span<const uint8_t> data);

/// Wrap data. Throws std::invalid_argument for Auto, std::runtime_error if
/// the compressor fails.
[[nodiscard]] std::vector<uint8_t> compress(std::span<const uint8_t> data, Compression compression);

/// Unwrap data. Throws NbtError (Malformed) if the payload is corrupt.
[[nodiscard]] std::vector<uint8_t> decompress(std::span<const uint8_t> data, Compression compression);

}  // namespace litevox
