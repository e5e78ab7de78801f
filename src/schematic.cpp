#include "litevox/schematic.hpp"
#include "litevox/error.hpp"
#include "litevox/log.hpp"
#include "litevox/nbt_io.hpp"

#include <fstream>
#include <iterator>
#include <limits>
#include <optional>
#include <stdexcept>

namespace litevox {

namespace {

int32_t clampToInt(int64_t value) {
    if (value > std::numeric_limits<int32_t>::max()) {
        logWarning("Value " + std::to_string(value) + " does not fit an int field, clamping");
        return std::numeric_limits<int32_t>::max();
    }
    return static_cast<int32_t>(value);
}

// Grow the running union by one region's volume; empty volumes are skipped
void addToEnclosing(std::optional<Volume>& enclosing, const Volume& volume) {
    if (volume.empty()) {
        return;
    }
    Volume normalized = volume.makeSizePositive();
    enclosing = enclosing ? enclosing->expandToFitVolume(normalized) : normalized;
}

}  // namespace

Schematic Schematic::clone() const {
    Schematic copy(name_);
    copy.author_ = author_;
    copy.description_ = description_;
    copy.timeCreated_ = timeCreated_;
    copy.timeModified_ = timeModified_;
    copy.dataVersion_ = dataVersion_;
    for (const auto& [regionName, region] : regions_) {
        copy.regions_.emplace(regionName, region.clone());
    }
    return copy;
}

// ============================================================================
// Regions
// ============================================================================

Region& Schematic::addRegion(std::string_view name, Region region) {
    auto it = regions_.find(name);
    if (it != regions_.end()) {
        it->second = std::move(region);
        return it->second;
    }
    return regions_.emplace(std::string(name), std::move(region)).first->second;
}

bool Schematic::removeRegion(std::string_view name) {
    auto it = regions_.find(name);
    if (it == regions_.end()) {
        return false;
    }
    regions_.erase(it);
    return true;
}

Region* Schematic::region(std::string_view name) {
    auto it = regions_.find(name);
    return it != regions_.end() ? &it->second : nullptr;
}

const Region* Schematic::region(std::string_view name) const {
    auto it = regions_.find(name);
    return it != regions_.end() ? &it->second : nullptr;
}

size_t Schematic::totalBlocks() const {
    size_t total = 0;
    for (const auto& [regionName, region] : regions_) {
        total += region.totalBlocks();
    }
    return total;
}

Volume Schematic::enclosingVolume() const {
    std::optional<Volume> result;
    for (const auto& [regionName, region] : regions_) {
        addToEnclosing(result, region.volume());
    }
    return result.value_or(Volume());
}

// ============================================================================
// Decode
// ============================================================================

Schematic Schematic::fromNbt(const NbtCompound& root) {
    Schematic result;
    try {
        int32_t version = root.getInt("Version");
        if (version != LITEMATIC_VERSION) {
            throw UnsupportedVersionError(version);
        }

        const NbtCompound& metadata = root.getCompound("Metadata");
        result.name_ = metadata.getString("Name");
        result.author_ = metadata.getString("Author");
        result.description_ = metadata.getString("Description");
        result.timeCreated_ = metadata.getLong("TimeCreated");
        result.timeModified_ = metadata.getLong("TimeModified");
        result.dataVersion_ = root.getInt("MinecraftDataVersion");

        const NbtCompound& regions = root.getCompound("Regions");
        for (const auto& [regionName, tag] : regions) {
            const NbtCompound* data = tag.asCompound();
            if (!data) {
                throw SchematicError(ErrorKind::WrongType,
                                     "Region \"" + regionName + "\" is a " +
                                         std::string(nbtTypeName(tag.type())) + ", expected a compound",
                                     regionName);
            }
            try {
                result.regions_.emplace(regionName, Region::fromNbt(*data));
            } catch (const SchematicError& e) {
                throw SchematicError(e.kind(), "Region \"" + regionName + "\": " + e.what(), e.field());
            }
        }
    } catch (const NbtError& e) {
        throw toSchematicError(e);
    }
    return result;
}

Schematic Schematic::fromBuffer(std::span<const uint8_t> data, Compression compression) {
    NbtDocument doc;
    try {
        doc = readNbt(data, compression);
    } catch (const NbtError& e) {
        throw toSchematicError(e);
    }
    return fromNbt(doc.root);
}

// ============================================================================
// Encode
// ============================================================================

NbtCompound Schematic::toNbt() const {
    NbtCompound regions;
    std::optional<Volume> enclosing;
    size_t totalBlocks = 0;

    for (const auto& [regionName, region] : regions_) {
        auto [encoded, volume] = region.toNbt();
        addToEnclosing(enclosing, volume);
        totalBlocks += region.totalBlocks();
        regions.insert(regionName, std::move(encoded));
    }

    Volume total = enclosing.value_or(Volume());

    NbtCompound metadata;
    metadata.insert("Name", name_);
    metadata.insert("Author", author_);
    metadata.insert("Description", description_);
    metadata.insert("RegionCount", clampToInt(static_cast<int64_t>(regions_.size())));
    metadata.insert("TimeCreated", timeCreated_);
    metadata.insert("TimeModified", timeModified_);
    metadata.insert("TotalBlocks", clampToInt(static_cast<int64_t>(totalBlocks)));
    metadata.insert("EnclosingSize", blockPosToNbt(total.size()));
    metadata.insert("TotalVolume", clampToInt(total.cellCount()));

    NbtCompound root;
    root.insert("Metadata", std::move(metadata));
    root.insert("MinecraftDataVersion", dataVersion_);
    root.insert("Version", LITEMATIC_VERSION);
    root.insert("Regions", std::move(regions));
    return root;
}

std::vector<uint8_t> Schematic::toBuffer(Compression compression) const {
    return writeNbt(toNbt(), "", compression);
}

// ============================================================================
// Files
// ============================================================================

Schematic Schematic::fromFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Failed to open schematic file: " + path.string());
    }

    std::vector<uint8_t> data((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw std::runtime_error("Failed to read schematic file: " + path.string());
    }

    return fromBuffer(data);
}

void Schematic::toFile(const std::filesystem::path& path, Compression compression) const {
    std::vector<uint8_t> data = toBuffer(compression);

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Failed to open file for writing: " + path.string());
    }

    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!file) {
        throw std::runtime_error("Failed to write schematic file: " + path.string());
    }
}

}  // namespace litevox
