/**
 * @file noise_config.cpp
 * @brief NoiseFieldConfig from seed / grid_size entries
 */

#include "ndnoise/noise_config.hpp"
#include "ndnoise/errors.hpp"

#include <cmath>
#include <iostream>
#include <limits>

namespace ndnoise {

namespace {

std::string where(const ConfigEntry& entry) {
    return "'" + entry.key + "' (line " + std::to_string(entry.line) + ")";
}

int32_t toCellCount(const ConfigEntry& entry, double value) {
    if (value != std::floor(value) ||
        value < static_cast<double>(std::numeric_limits<int32_t>::min()) ||
        value > static_cast<double>(std::numeric_limits<int32_t>::max())) {
        throw ConfigurationError("Invalid cell count in " + where(entry));
    }
    return static_cast<int32_t>(value);
}

std::vector<int32_t> parseGridSize(const ConfigEntry& entry) {
    std::vector<int32_t> gridSize;

    if (!entry.value.empty()) {
        auto values = entry.value.asIntList();
        if (!values) {
            throw ConfigurationError("Expected integers in " + where(entry) + ", got '" +
                                     std::string(entry.value.asString()) + "'");
        }
        for (int64_t v : *values) {
            gridSize.push_back(toCellCount(entry, static_cast<double>(v)));
        }
    }
    if (!entry.malformedDataLines.empty()) {
        throw ConfigurationError("Expected integers in " + where(entry) + ", data line " +
                                 std::to_string(entry.malformedDataLines.front()) +
                                 " is not numeric");
    }
    for (const auto& line : entry.dataLines) {
        for (double v : line) {
            gridSize.push_back(toCellCount(entry, v));
        }
    }

    if (gridSize.empty()) {
        throw ConfigurationError("No cell counts given in " + where(entry));
    }
    return gridSize;
}

}  // namespace

NoiseFieldConfig noiseConfigFromDocument(const ConfigDocument& doc) {
    NoiseFieldConfig config;

    if (const auto* entry = doc.get("seed")) {
        auto seed = entry->value.asUnsigned();
        if (!seed) {
            throw ConfigurationError("Expected an unsigned integer in " + where(*entry) +
                                     ", got '" + std::string(entry->value.asString()) + "'");
        }
        config.seed = *seed;
    }

    if (const auto* entry = doc.get("grid_size")) {
        config.gridSize = parseGridSize(*entry);
    }

    for (const auto& entry : doc) {
        if (entry.key != "seed" && entry.key != "grid_size") {
            std::cerr << "[NoiseConfig] WARNING: ignoring unknown key " << where(entry) << "\n";
        }
    }

    return config;
}

NoiseFieldConfig parseNoiseConfig(std::string_view content) {
    ConfigParser parser;
    return noiseConfigFromDocument(parser.parseString(content));
}

std::optional<NoiseFieldConfig> loadNoiseConfig(const std::string& path) {
    ConfigParser parser;
    auto doc = parser.parseFile(path);
    if (!doc) {
        std::cerr << "[NoiseConfig] WARNING: cannot read config file '" << path << "'\n";
        return std::nullopt;
    }
    return noiseConfigFromDocument(*doc);
}

}  // namespace ndnoise
