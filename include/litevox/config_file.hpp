#pragma once

/**
 * @file config_file.hpp
 * @brief "key: value" config files and the writer settings read from them
 */

#include "litevox/compression.hpp"
#include "litevox/log.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace litevox {

class Schematic;

// ============================================================================
// ConfigFile - flat key/value settings
// ============================================================================
//
// Format:
//   # comment
//   compression: gzip
//   author: Someone
//
// Blank lines and lines starting with '#' are ignored. Keys and values are
// trimmed. A later line overrides an earlier one with the same key.
//
class ConfigFile {
public:
    ConfigFile() = default;

    // Load from file (returns false if the file can't be read)
    [[nodiscard]] bool load(const std::filesystem::path& path);

    // Parse config text directly
    void parse(std::string_view content);

    [[nodiscard]] bool isLoaded() const { return loaded_; }
    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    [[nodiscard]] bool has(std::string_view key) const;

    [[nodiscard]] std::string getString(std::string_view key,
                                        std::string_view defaultVal = "") const;

    // Decimal or 0x-prefixed hex; defaultVal if absent or not a number
    [[nodiscard]] int64_t getInt(std::string_view key, int64_t defaultVal = 0) const;

    // true/yes/on/1 and false/no/off/0; defaultVal otherwise
    [[nodiscard]] bool getBool(std::string_view key, bool defaultVal = false) const;

    void set(std::string_view key, std::string_view value);

    [[nodiscard]] size_t size() const { return values_.size(); }

private:
    std::filesystem::path path_;
    std::unordered_map<std::string, std::string> values_;
    bool loaded_ = false;
};

// ============================================================================
// WriterSettings
// ============================================================================

/// Options applied when writing schematics
struct WriterSettings {
    Compression compression = Compression::Gzip;
    std::string author;                     ///< Empty keeps the schematic's own
    std::optional<int32_t> dataVersion;     ///< Unset keeps the schematic's own
    LogLevel logLevel = LogLevel::Info;

    /// Keys: compression, author, data_version, log_level.
    /// Throws std::invalid_argument for an unrecognized compression or log
    /// level, or a compression of "auto".
    [[nodiscard]] static WriterSettings fromConfig(const ConfigFile& config);

    /// Stamp author and data version onto a schematic
    void apply(Schematic& schematic) const;
};

}  // namespace litevox
