#pragma once

/**
 * @file log.hpp
 * @brief Console logging with a [litevox] prefix
 *
 * Info goes to stdout, warnings and errors to stderr.
 */

#include <cstdint>
#include <optional>
#include <string_view>

namespace litevox {

enum class LogLevel : uint8_t {
    Info = 0,
    Warning = 1,
    Error = 2,
    Off = 3,
};

/// Messages below this level are dropped (default: Info)
void setLogLevel(LogLevel level);
[[nodiscard]] LogLevel logLevel();

/// Parse "info", "warning", "error" or "off" (case-insensitive)
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

void logInfo(std::string_view message);
void logWarning(std::string_view message);
void logError(std::string_view message);

}  // namespace litevox
