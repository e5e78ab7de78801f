#include "litevox/palette.hpp"
#include "litevox/log.hpp"
#include "litevox/packed_array.hpp"

namespace litevox {

BlockStatePalette::BlockStatePalette() {
    // Air is always at index 0
    states_.push_back(BlockState::air());
    reverse_[BlockState::air()] = 0;
}

BlockStatePalette::Index BlockStatePalette::addState(const BlockState& state) {
    auto it = reverse_.find(state);
    if (it != reverse_.end()) {
        return it->second;
    }

    Index index = static_cast<Index>(states_.size());
    states_.push_back(state);
    reverse_[state] = index;
    return index;
}

BlockStatePalette::Index BlockStatePalette::indexOf(const BlockState& state) const {
    auto it = reverse_.find(state);
    if (it != reverse_.end()) {
        return it->second;
    }
    return INVALID_INDEX;
}

const BlockState* BlockStatePalette::stateAt(Index index) const {
    if (index >= states_.size()) {
        return nullptr;
    }
    return &states_[index];
}

bool BlockStatePalette::contains(const BlockState& state) const {
    return reverse_.contains(state);
}

int BlockStatePalette::bitsForSerialization() const {
    return requiredBits(states_.size());
}

void BlockStatePalette::clear() {
    states_.clear();
    reverse_.clear();
    states_.push_back(BlockState::air());
    reverse_[BlockState::air()] = 0;
}

NbtList BlockStatePalette::toNbt() const {
    NbtList list(NbtType::Compound);
    for (const auto& state : states_) {
        list.push(state.toNbt());
    }
    return list;
}

BlockStatePalette BlockStatePalette::fromNbt(const NbtList& list) {
    BlockStatePalette palette;
    palette.states_.clear();
    palette.reverse_.clear();
    palette.states_.reserve(list.size());

    for (const auto& entry : list) {
        BlockState state = BlockState::fromNbt(entry);
        Index index = static_cast<Index>(palette.states_.size());
        if (!palette.reverse_.emplace(state, index).second) {
            logWarning("Palette entry " + std::to_string(index) + " duplicates " +
                       state.identifier());
        }
        palette.states_.push_back(std::move(state));
    }
    return palette;
}

}  // namespace litevox
