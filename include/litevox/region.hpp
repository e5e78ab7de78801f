#pragma once

/**
 * @file region.hpp
 * @brief One rectangular area of a schematic: sparse blocks plus payloads
 *
 * Blocks are held in a sparse map keyed by absolute position. Air is never
 * stored; an absent key means air. The packed on-disk form is produced and
 * consumed only by toNbt()/fromNbt().
 *
 * On disk a region is:
 *   Position          {x, y, z}   origin of the block array
 *   Size              {x, y, z}   extent (may be negative in files we read)
 *   BlockStatePalette [ {Name, Properties?}, ... ]   air at index 0 on write
 *   BlockStates       long[]      packed palette indices, x fastest, then z, then y
 *   Entities, PendingBlockTicks, PendingFluidTicks, TileEntities   (optional lists)
 *
 * The optional lists are carried through as-is and never interpreted.
 */

#include "litevox/block_state.hpp"
#include "litevox/nbt.hpp"
#include "litevox/position.hpp"
#include "litevox/volume.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <utility>

namespace litevox {

/// {x, y, z} int compound
[[nodiscard]] NbtCompound blockPosToNbt(const BlockPos& pos);

/// Read the {x, y, z} compound stored under field. Throws NbtError naming
/// the field if it is absent or not a compound of ints.
[[nodiscard]] BlockPos blockPosFromNbt(const NbtCompound& parent, std::string_view field);

// Opaque per-region lists
enum class RegionPayload : uint8_t {
    Entities,
    PendingBlockTicks,
    PendingFluidTicks,
    TileEntities,
};

inline constexpr std::array<RegionPayload, 4> ALL_REGION_PAYLOADS = {
    RegionPayload::Entities,
    RegionPayload::PendingBlockTicks,
    RegionPayload::PendingFluidTicks,
    RegionPayload::TileEntities,
};

/// Field name of a payload in the region compound
[[nodiscard]] std::string_view regionPayloadName(RegionPayload payload);

class Region {
public:
    using BlockMap = std::unordered_map<BlockPos, BlockState, BlockPosHash>;

    /// Empty region with no declared volume. Its effective volume is the
    /// bounding box of the blocks set on it.
    Region() = default;

    /// Empty region whose effective volume always covers declared
    explicit Region(const Volume& declared);

    Region(Region&&) noexcept = default;
    Region& operator=(Region&&) noexcept = default;
    Region(const Region&) = delete;
    Region& operator=(const Region&) = delete;

    /// Deep copy (payload lists included)
    [[nodiscard]] Region clone() const;

    // ---- Blocks ----

    /// Air removes the entry at pos, anything else inserts or overwrites
    void setBlock(const BlockPos& pos, const BlockState& state);

    /// Stored state at pos, or air
    [[nodiscard]] const BlockState& block(const BlockPos& pos) const;

    /// Non-air blocks
    [[nodiscard]] const BlockMap& blocks() const { return blocks_; }
    [[nodiscard]] size_t totalBlocks() const { return blocks_.size(); }

    // ---- Geometry ----

    /// Volume given at construction or read from the file
    [[nodiscard]] const std::optional<Volume>& declaredVolume() const { return declared_; }

    /// Declared volume grown to fit every stored block. Without a declared
    /// volume the fold starts from the unit cell of the first block, and an
    /// empty region has an empty volume at the origin. Recomputed on each call.
    [[nodiscard]] Volume volume() const;

    // ---- Opaque payloads ----

    /// nullptr when the payload is absent
    [[nodiscard]] const NbtList* payload(RegionPayload which) const;

    /// Replace a payload; nullopt makes it absent
    void setPayload(RegionPayload which, std::optional<NbtList> list);

    // ---- NBT ----

    /// Decode a region compound. Blocks are placed at the normalized declared
    /// origin plus their position in the array. Throws SchematicError.
    [[nodiscard]] static Region fromNbt(const NbtCompound& data);

    /// Encode to a region compound, returning it with the effective
    /// (normalized) volume it was written with
    [[nodiscard]] std::pair<NbtCompound, Volume> toNbt() const;

private:
    [[nodiscard]] std::optional<NbtList>& payloadSlot(RegionPayload which);
    [[nodiscard]] const std::optional<NbtList>& payloadSlot(RegionPayload which) const;

    std::optional<Volume> declared_;
    BlockMap blocks_;
    std::optional<NbtList> entities_;
    std::optional<NbtList> pendingBlockTicks_;
    std::optional<NbtList> pendingFluidTicks_;
    std::optional<NbtList> tileEntities_;
};

}  // namespace litevox
