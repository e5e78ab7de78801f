#pragma once

/**
 * @file position.hpp
 * @brief Integer block coordinates and hashing for sparse block maps
 */

#include <cstdint>
#include <cstddef>
#include <glm/glm.hpp>

namespace litevox {

// Block coordinate (region-space, signed on every axis)
using BlockPos = glm::ivec3;

// Pack into 64-bit value for hashing
// Layout: [x:22][y:20][z:22], offset binary so negative values pack cleanly.
// Coordinates beyond the packed range still work as keys, they only collide.
[[nodiscard]] uint64_t packBlockPos(const BlockPos& pos);

// |x * y * z| as a scalar count. Never a geometric size.
// The product must fit in int64; Region::fromNbt rejects sizes where it doesn't.
[[nodiscard]] constexpr int64_t cellCount(const BlockPos& v) {
    int64_t product = static_cast<int64_t>(v.x) * v.y * v.z;
    return product < 0 ? -product : product;
}

// Hash functor for BlockPos keys in unordered containers
struct BlockPosHash {
    size_t operator()(const BlockPos& pos) const noexcept;
};

}  // namespace litevox
