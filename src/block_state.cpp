#include "litevox/block_state.hpp"
#include "litevox/error.hpp"

#include <cctype>
#include <functional>
#include <tuple>

namespace litevox {

std::string normalizeBlockName(std::string_view name) {
    std::string result;
    if (name.find(':') == std::string_view::npos) {
        result.reserve(DEFAULT_NAMESPACE.size() + 1 + name.size());
        result.append(DEFAULT_NAMESPACE);
        result.push_back(':');
    } else {
        result.reserve(name.size());
    }
    for (char c : name) {
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return result;
}

BlockState::BlockState()
    : identifier_(AIR_IDENTIFIER) {}

BlockState::BlockState(std::string_view identifier, Properties properties)
    : identifier_(normalizeBlockName(identifier)), properties_(std::move(properties)) {}

const BlockState& BlockState::air() {
    static const BlockState instance;
    return instance;
}

std::optional<std::string> BlockState::property(std::string_view key) const {
    auto it = properties_.find(std::string(key));
    if (it == properties_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void BlockState::setIdentifier(std::string_view identifier) {
    identifier_ = normalizeBlockName(identifier);
}

void BlockState::setProperty(std::string_view key, std::string_view value) {
    properties_[std::string(key)] = std::string(value);
}

bool BlockState::removeProperty(std::string_view key) {
    return properties_.erase(std::string(key)) > 0;
}

NbtCompound BlockState::toNbt() const {
    NbtCompound entry;
    entry.insert("Name", identifier_);
    if (!properties_.empty()) {
        NbtCompound props;
        for (const auto& [key, value] : properties_) {
            props.insert(key, value);
        }
        entry.insert("Properties", std::move(props));
    }
    return entry;
}

BlockState BlockState::fromNbt(const NbtTag& tag) {
    const NbtCompound* entry = tag.asCompound();
    if (!entry) {
        throw SchematicError(ErrorKind::MalformedBlockState,
                             std::string("Palette entry is a ") +
                                 std::string(nbtTypeName(tag.type())) + ", expected a compound");
    }

    const NbtTag* name = entry->find("Name");
    if (!name) {
        throw SchematicError(ErrorKind::MalformedBlockState,
                             "Palette entry has no Name", "Name");
    }
    const std::string* identifier = name->getIf<std::string>();
    if (!identifier) {
        throw SchematicError(ErrorKind::MalformedBlockState,
                             "Palette entry Name is not a string", "Name");
    }

    Properties properties;
    if (const NbtTag* props = entry->find("Properties")) {
        const NbtCompound* compound = props->asCompound();
        if (!compound) {
            throw SchematicError(ErrorKind::MalformedBlockState,
                                 "Properties of " + *identifier + " is not a compound",
                                 "Properties");
        }
        for (const auto& [key, value] : *compound) {
            const std::string* str = value.getIf<std::string>();
            if (!str) {
                throw SchematicError(ErrorKind::MalformedBlockState,
                                     "Property " + key + " of " + *identifier + " is not a string",
                                     key);
            }
            properties[key] = *str;
        }
    }

    return BlockState(*identifier, std::move(properties));
}

bool BlockState::operator<(const BlockState& other) const {
    return std::tie(identifier_, properties_) < std::tie(other.identifier_, other.properties_);
}

size_t BlockStateHash::operator()(const BlockState& state) const noexcept {
    // Properties iterate in key order, so the hash does not depend on the
    // order they were inserted in
    std::hash<std::string> hasher;
    size_t h = hasher(state.identifier());
    for (const auto& [key, value] : state.properties()) {
        h ^= hasher(key) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
        h ^= hasher(value) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2);
    }
    return h;
}

}  // namespace litevox
