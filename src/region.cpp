#include "litevox/region.hpp"
#include "litevox/error.hpp"
#include "litevox/log.hpp"
#include "litevox/packed_array.hpp"
#include "litevox/palette.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <stdexcept>
#include <vector>

namespace litevox {

NbtCompound blockPosToNbt(const BlockPos& pos) {
    NbtCompound out;
    out.insert("x", pos.x);
    out.insert("y", pos.y);
    out.insert("z", pos.z);
    return out;
}

BlockPos blockPosFromNbt(const NbtCompound& parent, std::string_view field) {
    const NbtCompound& vec = parent.getCompound(field);
    try {
        return BlockPos(vec.getInt("x"), vec.getInt("y"), vec.getInt("z"));
    } catch (const NbtError& e) {
        // Report the enclosing field, e.g. "Size.y"
        throw NbtError(e.kind(), e.what(), std::string(field) + "." + e.field());
    }
}

namespace {

uint64_t axisLength(int32_t v) {
    return static_cast<uint64_t>(v < 0 ? -static_cast<int64_t>(v) : static_cast<int64_t>(v));
}

// Both corners and the axis lengths must fit in int32, the cell count in int64
void checkDeclaredVolume(const BlockPos& position, const BlockPos& size) {
    for (int axis = 0; axis < 3; ++axis) {
        int64_t end = static_cast<int64_t>(position[axis]) + size[axis];
        if (size[axis] == std::numeric_limits<int32_t>::min() ||
            end < std::numeric_limits<int32_t>::min() || end > std::numeric_limits<int32_t>::max()) {
            throw SchematicError(ErrorKind::MalformedDocument,
                                 "Region Position + Size leaves the coordinate range on axis " +
                                     std::to_string(axis),
                                 "Size");
        }
    }

    // Each axis is below 2^31, so x*y cannot overflow
    uint64_t layer = axisLength(size.x) * axisLength(size.y);
    uint64_t height = axisLength(size.z);
    if (height != 0 && layer > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) / height) {
        throw SchematicError(ErrorKind::MalformedDocument, "Region Size has too many cells", "Size");
    }
}

}  // namespace

std::string_view regionPayloadName(RegionPayload payload) {
    switch (payload) {
        case RegionPayload::Entities: return "Entities";
        case RegionPayload::PendingBlockTicks: return "PendingBlockTicks";
        case RegionPayload::PendingFluidTicks: return "PendingFluidTicks";
        case RegionPayload::TileEntities: return "TileEntities";
    }
    return "Unknown";
}

// ============================================================================
// Region
// ============================================================================

Region::Region(const Volume& declared)
    : declared_(declared) {}

Region Region::clone() const {
    Region copy;
    copy.declared_ = declared_;
    copy.blocks_ = blocks_;
    for (RegionPayload which : ALL_REGION_PAYLOADS) {
        if (const NbtList* list = payload(which)) {
            copy.payloadSlot(which) = list->clone();
        }
    }
    return copy;
}

void Region::setBlock(const BlockPos& pos, const BlockState& state) {
    if (state.isAir()) {
        blocks_.erase(pos);
    } else {
        blocks_.insert_or_assign(pos, state);
    }
}

const BlockState& Region::block(const BlockPos& pos) const {
    auto it = blocks_.find(pos);
    if (it == blocks_.end()) {
        return BlockState::air();
    }
    return it->second;
}

Volume Region::volume() const {
    std::optional<Volume> result = declared_;
    for (const auto& [pos, state] : blocks_) {
        result = result ? result->expandToFit(pos) : Volume(pos, BlockPos(1));
    }
    return result.value_or(Volume());
}

std::optional<NbtList>& Region::payloadSlot(RegionPayload which) {
    switch (which) {
        case RegionPayload::Entities: return entities_;
        case RegionPayload::PendingBlockTicks: return pendingBlockTicks_;
        case RegionPayload::PendingFluidTicks: return pendingFluidTicks_;
        case RegionPayload::TileEntities: return tileEntities_;
    }
    throw std::invalid_argument("Unknown region payload");
}

const std::optional<NbtList>& Region::payloadSlot(RegionPayload which) const {
    switch (which) {
        case RegionPayload::Entities: return entities_;
        case RegionPayload::PendingBlockTicks: return pendingBlockTicks_;
        case RegionPayload::PendingFluidTicks: return pendingFluidTicks_;
        case RegionPayload::TileEntities: return tileEntities_;
    }
    throw std::invalid_argument("Unknown region payload");
}

const NbtList* Region::payload(RegionPayload which) const {
    const auto& slot = payloadSlot(which);
    return slot ? &*slot : nullptr;
}

void Region::setPayload(RegionPayload which, std::optional<NbtList> list) {
    payloadSlot(which) = std::move(list);
}

// ============================================================================
// Decode
// ============================================================================

Region Region::fromNbt(const NbtCompound& data) {
    try {
        BlockStatePalette palette = BlockStatePalette::fromNbt(data.getList("BlockStatePalette"));
        const std::vector<int64_t>& words = data.getLongArray("BlockStates");

        BlockPos position = blockPosFromNbt(data, "Position");
        BlockPos size = blockPosFromNbt(data, "Size");
        checkDeclaredVolume(position, size);

        Volume declared(position, size);
        Volume normalized = declared.makeSizePositive();

        Region region(declared);

        int bits = palette.bitsForSerialization();
        uint64_t cells = static_cast<uint64_t>(normalized.cellCount());
        uint64_t capacity = fieldCapacity(words.size(), bits);
        if (capacity < cells) {
            logWarning("BlockStates holds " + std::to_string(capacity) + " of " +
                       std::to_string(cells) + " cells, the rest are air");
        } else if (uint64_t expectedWords = requiredWordCount(cells, bits); words.size() > expectedWords) {
            logWarning("BlockStates has " + std::to_string(words.size() - expectedWords) +
                       " padding words past the region volume");
        }

        uint64_t count = std::min(capacity, cells);
        std::span<const int64_t> span(words);
        for (uint64_t i = 0; i < count; ++i) {
            uint64_t value = getField(span, i, bits);
            const BlockState* state = palette.stateAt(static_cast<BlockStatePalette::Index>(
                std::min<uint64_t>(value, BlockStatePalette::INVALID_INDEX)));
            if (!state) {
                throw SchematicError(ErrorKind::MalformedDocument,
                                     "BlockStates entry " + std::to_string(i) + " refers to palette index " +
                                         std::to_string(value) + ", palette has " +
                                         std::to_string(palette.size()) + " entries",
                                     "BlockStates");
            }
            if (state->isAir()) {
                continue;
            }
            std::optional<BlockPos> offset = indexToCoordinate(normalized.size(), i);
            region.blocks_.emplace(normalized.origin() + *offset, *state);
        }

        for (RegionPayload which : ALL_REGION_PAYLOADS) {
            std::string_view name = regionPayloadName(which);
            if (const NbtList* list = data.findList(name)) {
                region.payloadSlot(which) = list->clone();
            } else if (const NbtTag* other = data.find(name)) {
                logWarning(std::string(name) + " is a " + std::string(nbtTypeName(other->type())) +
                           ", expected a list; dropping it");
            }
        }

        return region;
    } catch (const NbtError& e) {
        throw toSchematicError(e);
    }
}

// ============================================================================
// Encode
// ============================================================================

std::pair<NbtCompound, Volume> Region::toNbt() const {
    // Air at 0, then the distinct states in sorted order
    std::vector<BlockState> states;
    states.reserve(blocks_.size());
    for (const auto& [pos, state] : blocks_) {
        states.push_back(state);
    }
    std::sort(states.begin(), states.end());
    states.erase(std::unique(states.begin(), states.end()), states.end());

    BlockStatePalette palette;
    std::vector<BlockStatePalette::Index> paletteMapping;
    paletteMapping.reserve(states.size());
    for (const auto& state : states) {
        paletteMapping.push_back(palette.addState(state));
    }

    Volume effective = volume().makeSizePositive();
    int bits = palette.bitsForSerialization();
    std::vector<int64_t> words(requiredWordCount(static_cast<uint64_t>(effective.cellCount()), bits), 0);

    for (const auto& [pos, state] : blocks_) {
        std::optional<uint64_t> index = coordinateToIndex(effective.size(), pos - effective.origin());
        if (!index) {
            throw std::logic_error("Block outside the region's effective volume");
        }
        auto it = std::lower_bound(states.begin(), states.end(), state);
        setField(words, *index, bits, paletteMapping[static_cast<size_t>(it - states.begin())]);
    }

    NbtCompound out;
    out.insert("Position", blockPosToNbt(effective.origin()));
    out.insert("Size", blockPosToNbt(effective.size()));
    out.insert("BlockStatePalette", palette.toNbt());
    out.insert("BlockStates", std::move(words));

    for (RegionPayload which : ALL_REGION_PAYLOADS) {
        if (const NbtList* list = payload(which)) {
            out.insert(std::string(regionPayloadName(which)), list->clone());
        }
    }

    return {std::move(out), effective};
}

}  // namespace litevox
