#pragma once

/**
 * @file block_state.hpp
 * @brief Block identifier plus property map, as stored in a region palette
 *
 * Identifiers are kept normalized: lowercase and namespaced. A name without
 * a ':' separator lives in the "minecraft" namespace, so "Stone",
 * "stone" and "minecraft:stone" all refer to the same block.
 */

#include "litevox/nbt.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace litevox {

inline constexpr std::string_view DEFAULT_NAMESPACE = "minecraft";
inline constexpr std::string_view AIR_IDENTIFIER = "minecraft:air";

/// Lowercase and prefix with the default namespace if none is given
[[nodiscard]] std::string normalizeBlockName(std::string_view name);

class BlockState {
public:
    using Properties = std::map<std::string, std::string>;

    /// The air state
    BlockState();

    explicit BlockState(std::string_view identifier, Properties properties = {});

    /// The implicit default of every unset coordinate
    [[nodiscard]] static const BlockState& air();

    [[nodiscard]] const std::string& identifier() const { return identifier_; }
    [[nodiscard]] const Properties& properties() const { return properties_; }

    [[nodiscard]] std::optional<std::string> property(std::string_view key) const;

    [[nodiscard]] bool isAir() const { return *this == air(); }

    // ---- Mutation ----

    void setIdentifier(std::string_view identifier);
    void setProperty(std::string_view key, std::string_view value);

    /// Returns true if the property was present
    bool removeProperty(std::string_view key);

    // ---- Palette entry conversion ----

    /// {Name: string, Properties: compound of strings}; Properties is omitted
    /// when there are none.
    [[nodiscard]] NbtCompound toNbt() const;

    /// Parse a palette entry. Throws SchematicError (MalformedBlockState) if
    /// the tag is not a compound, Name is missing or not a string, or a
    /// property value is not a string.
    [[nodiscard]] static BlockState fromNbt(const NbtTag& tag);

    bool operator==(const BlockState& other) const = default;

    /// Identifier first, then properties (gives palettes a stable order)
    bool operator<(const BlockState& other) const;

private:
    std::string identifier_;
    Properties properties_;
};

struct BlockStateHash {
    size_t operator()(const BlockState& state) const noexcept;
};

}  // namespace litevox
