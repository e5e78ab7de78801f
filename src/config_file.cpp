#include "litevox/config_file.hpp"
#include "litevox/schematic.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace litevox {

namespace {

std::string_view trim(std::string_view str) {
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.front()))) {
        str.remove_prefix(1);
    }
    while (!str.empty() && std::isspace(static_cast<unsigned char>(str.back()))) {
        str.remove_suffix(1);
    }
    return str;
}

std::string toLower(std::string_view str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return result;
}

}  // namespace

bool ConfigFile::load(const std::filesystem::path& path) {
    path_ = path;
    values_.clear();
    loaded_ = false;

    std::ifstream file(path);
    if (!file.is_open()) {
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    parse(buffer.str());

    loaded_ = true;
    return true;
}

void ConfigFile::parse(std::string_view content) {
    size_t pos = 0;
    while (pos < content.size()) {
        size_t lineEnd = content.find('\n', pos);
        std::string_view line;
        if (lineEnd == std::string_view::npos) {
            line = content.substr(pos);
            pos = content.size();
        } else {
            line = content.substr(pos, lineEnd - pos);
            pos = lineEnd + 1;
        }

        line = trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        auto colonPos = line.find(':');
        if (colonPos == std::string_view::npos) {
            logWarning("Ignoring config line without ':': " + std::string(line));
            continue;
        }

        std::string_view key = trim(line.substr(0, colonPos));
        std::string_view value = trim(line.substr(colonPos + 1));
        if (key.empty()) {
            logWarning("Ignoring config line with empty key: " + std::string(line));
            continue;
        }
        values_[std::string(key)] = std::string(value);
    }
}

bool ConfigFile::has(std::string_view key) const {
    return values_.find(std::string(key)) != values_.end();
}

std::string ConfigFile::getString(std::string_view key, std::string_view defaultVal) const {
    auto it = values_.find(std::string(key));
    if (it == values_.end()) {
        return std::string(defaultVal);
    }
    return it->second;
}

int64_t ConfigFile::getInt(std::string_view key, int64_t defaultVal) const {
    auto it = values_.find(std::string(key));
    if (it == values_.end() || it->second.empty()) {
        return defaultVal;
    }

    const std::string& str = it->second;
    char* end = nullptr;
    long long value;
    if (str.size() > 2 && str[0] == '0' && (str[1] == 'x' || str[1] == 'X')) {
        value = std::strtoll(str.c_str(), &end, 16);
    } else {
        value = std::strtoll(str.c_str(), &end, 10);
    }

    if (end != str.c_str() + str.size()) {
        return defaultVal;
    }
    return static_cast<int64_t>(value);
}

bool ConfigFile::getBool(std::string_view key, bool defaultVal) const {
    auto it = values_.find(std::string(key));
    if (it == values_.end()) {
        return defaultVal;
    }

    std::string value = toLower(it->second);
    if (value == "true" || value == "yes" || value == "on" || value == "1") {
        return true;
    }
    if (value == "false" || value == "no" || value == "off" || value == "0") {
        return false;
    }
    return defaultVal;
}

void ConfigFile::set(std::string_view key, std::string_view value) {
    values_[std::string(key)] = std::string(value);
}

// ============================================================================
// WriterSettings
// ============================================================================

WriterSettings WriterSettings::fromConfig(const ConfigFile& config) {
    WriterSettings settings;

    if (config.has("compression")) {
        std::string name = config.getString("compression");
        auto compression = parseCompression(name);
        if (!compression || *compression == Compression::Auto) {
            throw std::invalid_argument("Invalid compression in config: " + name);
        }
        settings.compression = *compression;
    }

    settings.author = config.getString("author");

    if (config.has("data_version")) {
        int64_t version = config.getInt("data_version", -1);
        if (version < 0 || version > std::numeric_limits<int32_t>::max()) {
            throw std::invalid_argument("Invalid data_version in config: " +
                                        config.getString("data_version"));
        }
        settings.dataVersion = static_cast<int32_t>(version);
    }

    if (config.has("log_level")) {
        std::string name = config.getString("log_level");
        auto level = parseLogLevel(name);
        if (!level) {
            throw std::invalid_argument("Invalid log_level in config: " + name);
        }
        settings.logLevel = *level;
    }

    return settings;
}

void WriterSettings::apply(Schematic& schematic) const {
    if (!author.empty()) {
        schematic.setAuthor(author);
    }
    if (dataVersion) {
        schematic.setDataVersion(*dataVersion);
    }
}

}  // namespace litevox
