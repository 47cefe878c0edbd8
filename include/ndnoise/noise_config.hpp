/**
 * @file noise_config.hpp
 * @brief Loading NoiseFieldConfig from configuration files
 *
 * Recognized keys:
 *   seed: <unsigned 64-bit integer>
 *   grid_size: <cells per axis, whitespace separated>
 *
 * grid_size may also be given as indented data lines under "grid_size:";
 * all data lines are concatenated. Keys that are absent leave the matching
 * NoiseFieldConfig member unset, so NoiseField applies its defaults.
 */

#pragma once

#include "ndnoise/config_parser.hpp"
#include "ndnoise/noise_field.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace ndnoise {

/**
 * @brief Map a parsed document onto a NoiseFieldConfig
 * @throws ConfigurationError if seed or grid_size is malformed
 */
[[nodiscard]] NoiseFieldConfig noiseConfigFromDocument(const ConfigDocument& doc);

/// Parse config text; throws ConfigurationError like noiseConfigFromDocument
[[nodiscard]] NoiseFieldConfig parseNoiseConfig(std::string_view content);

/**
 * @brief Load a config file
 * @return Config, or nullopt if the file cannot be read
 * @throws ConfigurationError if the file contents are malformed
 */
[[nodiscard]] std::optional<NoiseFieldConfig> loadNoiseConfig(const std::string& path);

}  // namespace ndnoise
