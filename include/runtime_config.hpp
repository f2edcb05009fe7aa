#pragma once

#include <string>
#include <unordered_map>

#include "base_layer_normalizer.hpp"
#include "logging.hpp"
#include "projection_normalizer.hpp"

/**
 * @file runtime_config.hpp
 * @brief Run configuration for a projection + base-layer normalization.
 *
 * Reads the indented key/value YAML subset used by the runtime layer,
 * flattens nested sections into dotted keys, and converts them into a
 * typed `RunConfig`. Relative paths resolve against the config file's
 * directory.
 */

namespace lcn
{

struct RunConfig
{
    LogProfile log_profile = LogProfile::normal;

    std::string projection_file;
    std::string projection_allocation_file;
    std::string projection_allocation_target_column = "category";
    std::string region_reference_file;
    bool region_reference_has_header = true;
    ProjectionSettings projection;

    std::string base_layer_file;
    std::string spatial_allocation_file;
    std::string spatial_allocation_target_column = "category";
    BaseLayerConfig base_layer;
};

/**
 * @brief Parses a simple key-value YAML file.
 * @param filename Input file path.
 * @return Parsed map with nested sections flattened as `section.key`.
 * @throws FileAccessError when the file cannot be opened.
 */
std::unordered_map<std::string, std::string> parse_yaml_simple(const std::string& filename);

/**
 * @brief Converts a flattened key map into a run configuration.
 * @param values Flattened configuration keys.
 * @param base_dir Directory that relative paths are resolved against.
 * @throws ConfigError on a missing required key or invalid value.
 */
RunConfig run_config_from_values(const std::unordered_map<std::string, std::string>& values,
                                 const std::string& base_dir = "");

/**
 * @brief Loads and validates a run configuration from disk.
 * @param config_path Path to configuration file.
 * @throws FileAccessError, ConfigError.
 */
RunConfig load_run_config(const std::string& config_path);

} // namespace lcn
