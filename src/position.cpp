#include "litevox/position.hpp"

#include <functional>

namespace litevox {

// Schematic regions rarely exceed a few thousand blocks per axis, so the
// horizontal axes get the wider fields.
static constexpr int32_t XZ_BITS = 22;
static constexpr int32_t Y_BITS = 20;

static constexpr int32_t XZ_OFFSET = 1 << (XZ_BITS - 1);
static constexpr int32_t Y_OFFSET = 1 << (Y_BITS - 1);

static constexpr uint64_t XZ_MASK = (1ULL << XZ_BITS) - 1;
static constexpr uint64_t Y_MASK = (1ULL << Y_BITS) - 1;

uint64_t packBlockPos(const BlockPos& pos) {
    uint64_t px = static_cast<uint64_t>(static_cast<int64_t>(pos.x) + XZ_OFFSET) & XZ_MASK;
    uint64_t py = static_cast<uint64_t>(static_cast<int64_t>(pos.y) + Y_OFFSET) & Y_MASK;
    uint64_t pz = static_cast<uint64_t>(static_cast<int64_t>(pos.z) + XZ_OFFSET) & XZ_MASK;
    // Layout: [x:22][y:20][z:22] = 64 bits
    return (px << 42) | (py << 22) | pz;
}

size_t BlockPosHash::operator()(const BlockPos& pos) const noexcept {
    return std::hash<uint64_t>{}(packBlockPos(pos));
}

}  // namespace litevox
