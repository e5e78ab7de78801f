#include "litevox/log.hpp"

#include <atomic>
#include <cctype>
#include <iostream>
#include <string>

namespace litevox {

namespace {

std::atomic<LogLevel> g_level{LogLevel::Info};

bool enabled(LogLevel level) {
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(g_level.load());
}

}  // namespace

void setLogLevel(LogLevel level) {
    g_level.store(level);
}

LogLevel logLevel() {
    return g_level.load();
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower == "info") return LogLevel::Info;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off" || lower == "none") return LogLevel::Off;
    return std::nullopt;
}

void logInfo(std::string_view message) {
    if (!enabled(LogLevel::Info)) return;
    std::cout << "[litevox] " << message << "\n";
}

void logWarning(std::string_view message) {
    if (!enabled(LogLevel::Warning)) return;
    std::cerr << "[litevox] WARNING: " << message << "\n";
}

void logError(std::string_view message) {
    if (!enabled(LogLevel::Error)) return;
    std::cerr << "[litevox] ERROR: " << message << "\n";
}

}  // namespace litevox
