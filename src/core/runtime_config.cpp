/**
 * @file runtime_config.cpp
 * @brief Run configuration parsing for the normalization driver.
 *
 * Provides the flattened YAML reader and the conversion of its keys into
 * typed projection and base-layer settings.
 */

#include "runtime_config.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <utility>
#include <vector>

#include "errors.hpp"
#include "string_utils.hpp"

namespace lcn
{
namespace
{

/**
 * @brief Removes matching single or double quotes around a string value.
 */
std::string strip_wrapping_quotes(std::string value)
{
    if (value.size() >= 2)
    {
        const char first = value.front();
        const char last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\''))
        {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

/**
 * @brief Emits a standardized warning for invalid optional configuration values.
 */
void warn_invalid_config_value(const std::string& key,
                               const std::string& value,
                               const char* expected)
{
    std::cerr << "Warning: Invalid " << key << " '" << value
              << "'; expected " << expected
              << ". Keeping previous/default value." << std::endl;
}

class ConfigValues
{
public:
    ConfigValues(const std::unordered_map<std::string, std::string>& values, std::string base_dir)
        : values_(values), base_dir_(std::move(base_dir))
    {
    }

    bool has(const std::string& key) const { return values_.count(key) != 0; }

    const std::string& require(const std::string& key) const
    {
        const auto it = values_.find(key);
        if (it == values_.end() || it->second.empty())
        {
            throw ConfigError("Missing required configuration key '" + key + "'");
        }
        return it->second;
    }

    std::string require_path(const std::string& key) const { return resolve(require(key)); }

    std::string optional_path(const std::string& key) const
    {
        return has(key) && !values_.at(key).empty() ? resolve(values_.at(key)) : std::string();
    }

    int require_int(const std::string& key) const
    {
        int parsed = 0;
        if (!strutil::try_parse_int(require(key), parsed))
        {
            throw ConfigError("Configuration key '" + key + "' must be an integer, got '" + require(key) + "'");
        }
        return parsed;
    }

    double require_double(const std::string& key) const
    {
        double parsed = 0.0;
        if (!strutil::try_parse_double(require(key), parsed))
        {
            throw ConfigError("Configuration key '" + key + "' must be a number, got '" + require(key) + "'");
        }
        return parsed;
    }

    template <typename T>
    void read_optional(const std::string& key, T& target, T (ConfigValues::*reader)(const std::string&) const) const
    {
        if (has(key))
        {
            target = (this->*reader)(key);
        }
    }

    void read_optional_string(const std::string& key, std::string& target) const
    {
        if (has(key) && !values_.at(key).empty())
        {
            target = values_.at(key);
        }
    }

    const std::string& raw(const std::string& key) const { return values_.at(key); }

private:
    std::string resolve(const std::string& value) const
    {
        const std::filesystem::path path(value);
        if (path.is_absolute() || base_dir_.empty())
        {
            return path.string();
        }
        return (std::filesystem::path(base_dir_) / path).lexically_normal().string();
    }

    const std::unordered_map<std::string, std::string>& values_;
    std::string base_dir_;
};

} // namespace

std::unordered_map<std::string, std::string> parse_yaml_simple(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file.is_open())
    {
        throw FileAccessError(filename);
    }

    std::unordered_map<std::string, std::string> config;
    std::string line;
    std::vector<std::string> section_stack;

    while (std::getline(file, line))
    {
        const std::size_t comment_pos = line.find('#');
        if (comment_pos != std::string::npos)
        {
            line = line.substr(0, comment_pos);
        }

        std::size_t indent = 0;
        while (indent < line.size() && line[indent] == ' ') indent++;
        const std::size_t indent_level = indent / 2;

        line = strutil::trim_copy(line);
        if (line.empty()) continue;

        if (line.back() == ':')
        {
            const std::string section_name = line.substr(0, line.size() - 1);

            while (section_stack.size() > indent_level)
            {
                section_stack.pop_back();
            }

            if (section_stack.size() == indent_level)
            {
                section_stack.push_back(section_name);
            }
            else
            {
                section_stack[indent_level] = section_name;
            }

            continue;
        }

        const std::size_t colon_pos = line.find(':');
        if (colon_pos != std::string::npos)
        {
            while (section_stack.size() > indent_level)
            {
                section_stack.pop_back();
            }

            const std::string key = strutil::trim_copy(line.substr(0, colon_pos));
            const std::string value = strip_wrapping_quotes(strutil::trim_copy(line.substr(colon_pos + 1)));

            std::string full_key;
            for (const auto& section : section_stack)
            {
                if (!full_key.empty()) full_key += ".";
                full_key += section;
            }
            if (!full_key.empty()) full_key += ".";
            full_key += key;
            config[full_key] = value;
        }
    }

    return config;
}

RunConfig run_config_from_values(const std::unordered_map<std::string, std::string>& values,
                                 const std::string& base_dir)
{
    const ConfigValues config(values, base_dir);
    RunConfig run;

    if (config.has("logging.profile"))
    {
        bool valid = false;
        const LogProfile parsed = parse_log_profile(config.raw("logging.profile"), &valid);
        if (valid)
        {
            run.log_profile = parsed;
        }
        else
        {
            warn_invalid_config_value("logging.profile", config.raw("logging.profile"), "quiet, normal or debug");
        }
    }

    run.projection_file = config.require_path("projection.file");
    run.projection_allocation_file = config.require_path("projection.allocation_file");
    config.read_optional_string("projection.allocation_target_column", run.projection_allocation_target_column);
    run.region_reference_file = config.optional_path("projection.region_reference");
    if (config.has("projection.region_reference_header"))
    {
        run.region_reference_has_header = strutil::parse_bool(config.raw("projection.region_reference_header"));
    }
    run.projection.start_year = config.require_int("projection.start_year");
    run.projection.end_year = config.require_int("projection.end_year");
    config.read_optional_string("projection.scenario", run.projection.scenario);
    config.read_optional("projection.area_factor", run.projection.area_factor, &ConfigValues::require_double);

    run.base_layer_file = config.require_path("base_layer.file");
    run.spatial_allocation_file = config.require_path("base_layer.allocation_file");
    config.read_optional_string("base_layer.allocation_target_column", run.spatial_allocation_target_column);
    run.base_layer.resolution_degrees = config.require_double("base_layer.resolution_degrees");
    config.read_optional("base_layer.aggregation_level", run.base_layer.aggregation_level, &ConfigValues::require_int);
    config.read_optional_string("base_layer.metric", run.base_layer.metric_name);
    config.read_optional_string("base_layer.primary_key", run.base_layer.primary_key_column);
    config.read_optional_string("base_layer.model", run.base_layer.model_name);
    run.base_layer.validate();

    // Both normalizers must agree on the aggregation level.
    run.projection.aggregation_level = run.base_layer.aggregation_level;

    return run;
}

RunConfig load_run_config(const std::string& config_path)
{
    const auto values = parse_yaml_simple(config_path);
    const std::string base_dir = std::filesystem::path(config_path).parent_path().string();
    return run_config_from_values(values, base_dir);
}

} // namespace lcn
