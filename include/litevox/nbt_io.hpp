#pragma once

/**
 * @file nbt_io.hpp
 * @brief Binary NBT encoding and decoding
 *
 * Java edition layout: big-endian integers and IEEE floats, strings as a
 * u16 length followed by raw bytes, lists as element tag id + i32 count,
 * compounds terminated by an End tag. A document is one named compound.
 */

#include "litevox/compression.hpp"
#include "litevox/nbt.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace litevox {

// Deepest list/compound nesting accepted on read
constexpr int MAX_NBT_DEPTH = 512;

struct NbtDocument {
    std::string rootName;
    NbtCompound root;
};

/// Encode a root compound (uncompressed)
[[nodiscard]] std::vector<uint8_t> encodeNbt(const NbtCompound& root, std::string_view rootName = "");

/// Decode an uncompressed document. Throws NbtError (Malformed) on truncated
/// or invalid input, or if the root tag is not a compound.
[[nodiscard]] NbtDocument decodeNbt(std::span<const uint8_t> data);

/// Decompress (per envelope) then decode
[[nodiscard]] NbtDocument readNbt(std::span<const uint8_t> data, Compression compression = Compression::Auto);

/// Encode then compress
[[nodiscard]] std::vector<uint8_t> writeNbt(const NbtCompound& root, std::string_view rootName,
                                            Compression compression = Compression::Gzip);

}  // namespace litevox
