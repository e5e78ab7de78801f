#pragma once

/**
 * @file volume.hpp
 * @brief Axis-aligned block volumes with signed extents
 *
 * A Volume is spanned by two corners. pos2 = pos1 + size always holds, and
 * size may be negative on any axis (pos2 lies "before" pos1). The cells
 * covered are the half-open range between the two corners on each axis.
 *
 * Linear cell order (x fastest, then z, then y) matches the on-disk layout
 * of a region's packed block-state array.
 */

#include "litevox/position.hpp"

#include <cstdint>
#include <iterator>
#include <optional>

namespace litevox {

// ============================================================================
// Linear index <-> coordinate mapping
// ============================================================================

/// Index of a cell inside a volume of the given non-negative size.
/// nullopt if the point is outside [0, size) on any axis.
[[nodiscard]] std::optional<uint64_t> coordinateToIndex(const BlockPos& size, const BlockPos& point);

/// Inverse of coordinateToIndex. nullopt if index >= cellCount(size).
[[nodiscard]] std::optional<BlockPos> indexToCoordinate(const BlockPos& size, uint64_t index);

// ============================================================================
// VolumeRange - lazy enumeration of every cell in a volume
// ============================================================================

class VolumeRange {
public:
    class Iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = BlockPos;
        using difference_type = std::ptrdiff_t;
        using pointer = const BlockPos*;
        using reference = BlockPos;

        Iterator() = default;
        Iterator(BlockPos origin, BlockPos size, uint64_t index)
            : origin_(origin), size_(size), index_(index) {}

        [[nodiscard]] BlockPos operator*() const;

        Iterator& operator++() {
            ++index_;
            return *this;
        }

        Iterator operator++(int) {
            Iterator tmp = *this;
            ++index_;
            return tmp;
        }

        bool operator==(const Iterator& other) const { return index_ == other.index_; }
        bool operator!=(const Iterator& other) const { return index_ != other.index_; }

    private:
        BlockPos origin_{0};
        BlockPos size_{0};
        uint64_t index_ = 0;
    };

    VolumeRange(BlockPos origin, BlockPos size)
        : origin_(origin), size_(size) {}

    [[nodiscard]] Iterator begin() const { return Iterator(origin_, size_, 0); }
    [[nodiscard]] Iterator end() const {
        return Iterator(origin_, size_, static_cast<uint64_t>(cellCount(size_)));
    }

    [[nodiscard]] uint64_t size() const { return static_cast<uint64_t>(cellCount(size_)); }
    [[nodiscard]] bool empty() const { return size() == 0; }

private:
    BlockPos origin_;
    BlockPos size_;
};

// ============================================================================
// Volume
// ============================================================================

class Volume {
public:
    /// Empty volume at the origin
    Volume() = default;

    /// pos2 = origin + size. Size components may be negative.
    Volume(BlockPos origin, BlockPos size)
        : pos1_(origin), pos2_(origin + size) {}

    /// Build from two explicit corners
    [[nodiscard]] static Volume fromCorners(BlockPos pos1, BlockPos pos2);

    [[nodiscard]] BlockPos origin() const { return pos1_; }
    [[nodiscard]] BlockPos size() const { return pos2_ - pos1_; }
    [[nodiscard]] BlockPos pos1() const { return pos1_; }
    [[nodiscard]] BlockPos pos2() const { return pos2_; }

    /// Number of cells covered
    [[nodiscard]] int64_t cellCount() const { return litevox::cellCount(size()); }
    [[nodiscard]] bool empty() const { return cellCount() == 0; }

    /// Smallest covered coordinate on each axis
    [[nodiscard]] BlockPos minCorner() const { return glm::min(pos1_, pos2_); }

    /// One past the largest covered coordinate on each axis
    [[nodiscard]] BlockPos maxCorner() const { return glm::max(pos1_, pos2_); }

    [[nodiscard]] bool contains(const BlockPos& point) const;

    // ---- Derived volumes (this is never modified) ----

    /// Grow to include the unit cell anchored at point
    [[nodiscard]] Volume expandToFit(const BlockPos& point) const;

    /// Grow to include every cell of other
    [[nodiscard]] Volume expandToFitVolume(const Volume& other) const;

    /// Same cell set, non-negative size on every axis
    [[nodiscard]] Volume makeSizePositive() const;

    /// Same size, new origin
    [[nodiscard]] Volume moveTo(const BlockPos& origin) const;

    /// Same origin, new size
    [[nodiscard]] Volume changeSize(const BlockPos& size) const;

    /// Every cell of the normalized volume, x fastest, then z, then y
    [[nodiscard]] VolumeRange iterate() const;

    bool operator==(const Volume& other) const = default;

private:
    BlockPos pos1_{0};
    BlockPos pos2_{0};
};

}  // namespace litevox
