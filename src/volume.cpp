#include "litevox/volume.hpp"

#include <utility>

namespace litevox {

// ============================================================================
// Index mapping
// ============================================================================

std::optional<uint64_t> coordinateToIndex(const BlockPos& size, const BlockPos& point) {
    if (point.x < 0 || point.y < 0 || point.z < 0 ||
        point.x >= size.x || point.y >= size.y || point.z >= size.z) {
        return std::nullopt;
    }
    uint64_t sx = static_cast<uint64_t>(size.x);
    uint64_t sz = static_cast<uint64_t>(size.z);
    return (static_cast<uint64_t>(point.y) * sz + static_cast<uint64_t>(point.z)) * sx +
           static_cast<uint64_t>(point.x);
}

std::optional<BlockPos> indexToCoordinate(const BlockPos& size, uint64_t index) {
    if (size.x <= 0 || size.y <= 0 || size.z <= 0) {
        return std::nullopt;
    }
    if (index >= static_cast<uint64_t>(cellCount(size))) {
        return std::nullopt;
    }
    uint64_t sx = static_cast<uint64_t>(size.x);
    uint64_t layer = sx * static_cast<uint64_t>(size.z);
    uint64_t inLayer = index % layer;
    return BlockPos(static_cast<int32_t>(inLayer % sx),
                    static_cast<int32_t>(index / layer),
                    static_cast<int32_t>(inLayer / sx));
}

BlockPos VolumeRange::Iterator::operator*() const {
    // Range sizes are non-negative and index_ < cellCount(size_) for any
    // dereferenceable iterator, so the mapping always succeeds here.
    return origin_ + *indexToCoordinate(size_, index_);
}

// ============================================================================
// Volume
// ============================================================================

Volume Volume::fromCorners(BlockPos pos1, BlockPos pos2) {
    Volume v;
    v.pos1_ = pos1;
    v.pos2_ = pos2;
    return v;
}

bool Volume::contains(const BlockPos& point) const {
    BlockPos lo = minCorner();
    BlockPos hi = maxCorner();
    return point.x >= lo.x && point.x < hi.x &&
           point.y >= lo.y && point.y < hi.y &&
           point.z >= lo.z && point.z < hi.z;
}

Volume Volume::expandToFit(const BlockPos& point) const {
    BlockPos p1 = pos1_;
    BlockPos p2 = pos2_;

    for (int axis = 0; axis < 3; ++axis) {
        int32_t& a = p1[axis];
        int32_t& b = p2[axis];
        int32_t c = point[axis];

        if (a < b) {
            // Positive extent: pos1 is the near corner
            if (c + 1 > b) b = c + 1;
            if (c < a) a = c;
        } else if (a > b) {
            // Negative extent: roles of the corners swap
            if (c + 1 > a) a = c + 1;
            if (c < b) b = c;
        } else {
            // Empty on this axis: pos1 stays, pos2 decides the direction
            b = (c >= a) ? c + 1 : c;
        }
    }

    return fromCorners(p1, p2);
}

Volume Volume::expandToFitVolume(const Volume& other) const {
    if (other.empty()) {
        return *this;
    }
    Volume normalized = other.makeSizePositive();
    return expandToFit(normalized.pos1_).expandToFit(normalized.pos2_ - BlockPos(1));
}

Volume Volume::makeSizePositive() const {
    BlockPos p1 = pos1_;
    BlockPos p2 = pos2_;
    for (int axis = 0; axis < 3; ++axis) {
        if (p1[axis] > p2[axis]) {
            std::swap(p1[axis], p2[axis]);
        }
    }
    return fromCorners(p1, p2);
}

Volume Volume::moveTo(const BlockPos& origin) const {
    return Volume(origin, size());
}

Volume Volume::changeSize(const BlockPos& size) const {
    return Volume(pos1_, size);
}

VolumeRange Volume::iterate() const {
    Volume normalized = makeSizePositive();
    return VolumeRange(normalized.origin(), normalized.size());
}

}  // namespace litevox
