#pragma once

/**
 * @file palette.hpp
 * @brief Per-region block state palette
 */

#include "litevox/block_state.hpp"
#include "litevox/nbt.hpp"

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace litevox {

// Ordered, de-duplicated list of block states for one region.
// Maps each state to the index written into the packed block array.
//
// Design:
// - Air is always at index 0, whether or not any cell uses it
// - Indices are handed out in insertion order and never reused
// - bitsForSerialization() is the packed field width for this palette
//
class BlockStatePalette {
public:
    using Index = uint32_t;
    static constexpr Index INVALID_INDEX = UINT32_MAX;

    BlockStatePalette();

    // Add a state, returning its index
    // Returns the existing index if already present
    [[nodiscard]] Index addState(const BlockState& state);

    // Index of a state, or INVALID_INDEX if not in the palette
    [[nodiscard]] Index indexOf(const BlockState& state) const;

    // State at an index, or nullptr if the index is out of range
    [[nodiscard]] const BlockState* stateAt(Index index) const;

    [[nodiscard]] bool contains(const BlockState& state) const;

    // Number of entries, air included
    [[nodiscard]] size_t size() const { return states_.size(); }

    // Field width for the packed block array (never less than 2)
    [[nodiscard]] int bitsForSerialization() const;

    [[nodiscard]] const std::vector<BlockState>& entries() const { return states_; }

    // Reset to just air
    void clear();

    // ---- NBT ----

    // List of {Name, Properties?} compounds in index order
    [[nodiscard]] NbtList toNbt() const;

    // Parse a palette list, keeping the on-disk order.
    // Entries are not de-duplicated: two entries that normalize to the same
    // state keep their own indices, and indexOf() returns the first one.
    // Throws SchematicError (MalformedBlockState) for an invalid entry.
    [[nodiscard]] static BlockStatePalette fromNbt(const NbtList& list);

private:
    std::vector<BlockState> states_;  // Index -> state
    std::unordered_map<BlockState, Index, BlockStateHash> reverse_;  // State -> first index
};

}  // namespace litevox
