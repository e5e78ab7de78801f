/**
 * @file litematic_info.cpp
 * @brief Print a schematic's metadata and region statistics, optionally re-encode it
 *
 * Usage:
 *   litematic_info <file.litematic> [--blocks] [--config <file>] [--write <out>]
 *
 *   --blocks          list palette usage per region
 *   --config <file>   writer settings (compression, author, data_version, log_level)
 *   --write <out>     re-encode to <out> using the writer settings
 */

#include "litevox/config_file.hpp"
#include "litevox/error.hpp"
#include "litevox/log.hpp"
#include "litevox/schematic.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <string>
#include <vector>

using namespace litevox;

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program
              << " <file.litematic> [--blocks] [--config <file>] [--write <out>]\n";
}

std::string formatPos(const BlockPos& pos) {
    return "(" + std::to_string(pos.x) + ", " + std::to_string(pos.y) + ", " +
           std::to_string(pos.z) + ")";
}

std::string formatState(const BlockState& state) {
    std::string result = state.identifier();
    if (!state.properties().empty()) {
        result += "[";
        bool first = true;
        for (const auto& [key, value] : state.properties()) {
            if (!first) result += ",";
            result += key + "=" + value;
            first = false;
        }
        result += "]";
    }
    return result;
}

void printRegion(const std::string& name, const Region& region, bool listBlocks) {
    Volume volume = region.volume().makeSizePositive();
    std::cout << "  Region \"" << name << "\"\n";
    std::cout << "    Origin:  " << formatPos(volume.origin()) << "\n";
    std::cout << "    Size:    " << formatPos(volume.size()) << "\n";
    std::cout << "    Blocks:  " << region.totalBlocks() << " of " << volume.cellCount() << "\n";

    for (RegionPayload which : ALL_REGION_PAYLOADS) {
        if (const NbtList* list = region.payload(which)) {
            std::cout << "    " << regionPayloadName(which) << ": " << list->size() << "\n";
        }
    }

    if (listBlocks) {
        std::map<std::string, size_t> counts;
        for (const auto& [pos, state] : region.blocks()) {
            counts[formatState(state)]++;
        }
        std::vector<std::pair<std::string, size_t>> sorted(counts.begin(), counts.end());
        std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
            return a.second > b.second;
        });
        for (const auto& [state, count] : sorted) {
            std::cout << "      " << count << "  " << state << "\n";
        }
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string inputPath;
    std::string outputPath;
    std::string configPath;
    bool listBlocks = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--blocks") {
            listBlocks = true;
        } else if (arg == "--write" && i + 1 < argc) {
            outputPath = argv[++i];
        } else if (arg == "--config" && i + 1 < argc) {
            configPath = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << "\n";
            printUsage(argv[0]);
            return 2;
        } else {
            inputPath = arg;
        }
    }

    if (inputPath.empty()) {
        printUsage(argv[0]);
        return 2;
    }

    WriterSettings settings;
    if (!configPath.empty()) {
        ConfigFile config;
        if (!config.load(configPath)) {
            logError("Cannot read config file: " + configPath);
            return 1;
        }
        try {
            settings = WriterSettings::fromConfig(config);
        } catch (const std::invalid_argument& e) {
            logError(e.what());
            return 1;
        }
        setLogLevel(settings.logLevel);
    }

    Schematic schematic;
    try {
        schematic = Schematic::fromFile(inputPath);
    } catch (const SchematicError& e) {
        logError(std::string(errorKindName(e.kind())) + ": " + e.what());
        return 1;
    } catch (const std::runtime_error& e) {
        logError(e.what());
        return 1;
    }

    std::cout << "Name:         " << schematic.name() << "\n";
    std::cout << "Author:       " << schematic.author() << "\n";
    std::cout << "Description:  " << schematic.description() << "\n";
    std::cout << "Data version: " << schematic.dataVersion() << "\n";
    std::cout << "Created:      " << schematic.timeCreated() << "\n";
    std::cout << "Modified:     " << schematic.timeModified() << "\n";
    std::cout << "Enclosing:    " << formatPos(schematic.enclosingVolume().size()) << "\n";
    std::cout << "Total blocks: " << schematic.totalBlocks() << "\n";
    std::cout << "Regions:      " << schematic.regionCount() << "\n";

    for (const auto& [name, region] : schematic.regions()) {
        printRegion(name, region, listBlocks);
    }

    if (!outputPath.empty()) {
        settings.apply(schematic);
        try {
            schematic.toFile(outputPath, settings.compression);
        } catch (const std::runtime_error& e) {
            logError(e.what());
            return 1;
        }
        logInfo("Wrote " + outputPath + " (" + std::string(compressionName(settings.compression)) + ")");
    }

    return 0;
}
