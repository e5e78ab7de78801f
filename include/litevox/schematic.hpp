#pragma once

/**
 * @file schematic.hpp
 * @brief Litematica schematic: named regions plus metadata
 *
 * Document layout (root compound, unnamed):
 *   Version               int    must be LITEMATIC_VERSION
 *   MinecraftDataVersion  int    carried through
 *   Metadata              {Name, Author, Description, TimeCreated, TimeModified,
 *                          RegionCount, TotalBlocks, EnclosingSize, TotalVolume}
 *   Regions               {name: region compound, ...}
 *
 * RegionCount, TotalBlocks, EnclosingSize and TotalVolume are derived on
 * write and ignored on read.
 */

#include "litevox/compression.hpp"
#include "litevox/nbt.hpp"
#include "litevox/region.hpp"
#include "litevox/volume.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace litevox {

inline constexpr int32_t LITEMATIC_VERSION = 5;

class Schematic {
public:
    using RegionMap = std::map<std::string, Region, std::less<>>;

    Schematic() = default;
    explicit Schematic(std::string_view name) : name_(name) {}

    Schematic(Schematic&&) noexcept = default;
    Schematic& operator=(Schematic&&) noexcept = default;
    Schematic(const Schematic&) = delete;
    Schematic& operator=(const Schematic&) = delete;

    [[nodiscard]] Schematic clone() const;

    // ---- Metadata ----

    void setName(std::string_view name) { name_ = name; }
    [[nodiscard]] const std::string& name() const { return name_; }
    void setAuthor(std::string_view author) { author_ = author; }
    [[nodiscard]] const std::string& author() const { return author_; }
    void setDescription(std::string_view description) { description_ = description; }
    [[nodiscard]] const std::string& description() const { return description_; }

    /// Milliseconds since the Unix epoch
    void setTimeCreated(int64_t millis) { timeCreated_ = millis; }
    [[nodiscard]] int64_t timeCreated() const { return timeCreated_; }
    void setTimeModified(int64_t millis) { timeModified_ = millis; }
    [[nodiscard]] int64_t timeModified() const { return timeModified_; }

    void setDataVersion(int32_t version) { dataVersion_ = version; }
    [[nodiscard]] int32_t dataVersion() const { return dataVersion_; }

    // ---- Regions ----

    /// Insert or replace a region, returning the stored one
    Region& addRegion(std::string_view name, Region region);

    /// Returns true if a region was removed
    bool removeRegion(std::string_view name);

    /// nullptr if there is no region with that name
    [[nodiscard]] Region* region(std::string_view name);
    [[nodiscard]] const Region* region(std::string_view name) const;

    [[nodiscard]] const RegionMap& regions() const { return regions_; }
    [[nodiscard]] size_t regionCount() const { return regions_.size(); }

    /// Non-air blocks across all regions
    [[nodiscard]] size_t totalBlocks() const;

    /// Smallest volume containing every region's effective volume
    [[nodiscard]] Volume enclosingVolume() const;

    // ---- Document conversion ----

    /// Throws SchematicError (UnsupportedVersionError for a Version other
    /// than LITEMATIC_VERSION). A failure in any region fails the whole
    /// schematic, and the message names the region.
    [[nodiscard]] static Schematic fromNbt(const NbtCompound& root);

    [[nodiscard]] NbtCompound toNbt() const;

    /// Decompress and decode. Throws SchematicError.
    [[nodiscard]] static Schematic fromBuffer(std::span<const uint8_t> data,
                                              Compression compression = Compression::Auto);

    [[nodiscard]] std::vector<uint8_t> toBuffer(Compression compression = Compression::Gzip) const;

    // ---- Files ----

    /// Throws std::runtime_error if the file cannot be read, SchematicError
    /// if it cannot be decoded
    [[nodiscard]] static Schematic fromFile(const std::filesystem::path& path);

    /// Throws std::runtime_error if the file cannot be written
    void toFile(const std::filesystem::path& path, Compression compression = Compression::Gzip) const;

private:
    std::string name_;
    std::string author_;
    std::string description_;
    int64_t timeCreated_ = 0;
    int64_t timeModified_ = 0;
    int32_t dataVersion_ = 0;
    RegionMap regions_;
};

}  // namespace litevox
