/**
 * @file projection_normalizer.cpp
 * @brief Projection table reconciliation into sequential region/metric indices.
 */

#include "projection_normalizer.hpp"
#include "delimited_table.hpp"
#include "errors.hpp"
#include "logging.hpp"
#include "string_utils.hpp"
#include "time_steps.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace lcn
{
namespace
{

constexpr const char* kLandClassColumn = "landclass";
constexpr const char* kMetricColumn = "metric_id";
constexpr const char* kRegionColumn = "region";

std::vector<std::string> trimmed_column(const DelimitedTable& table, std::size_t column)
{
    std::vector<std::string> out = table.string_column(column);
    for (std::string& value : out)
    {
        value = strutil::trim_copy(value);
    }
    return out;
}

/**
 * @brief Returns true when the rows hold one distinct region and it equals 1.
 */
bool is_single_global_region(const std::vector<std::string>& raw_regions)
{
    std::set<std::string> distinct;
    for (const std::string& region : raw_regions)
    {
        distinct.insert(strutil::trim_copy(region));
    }
    if (distinct.size() != 1)
    {
        return false;
    }
    double value = 0.0;
    return strutil::try_parse_double(*distinct.begin(), value) && value == 1.0;
}

template <typename T>
std::vector<T> sorted_unique(std::vector<T> values)
{
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    return values;
}

} // namespace

MetricIndexMap MetricIndexMap::build(const std::vector<std::string>& raw_identifiers)
{
    MetricIndexMap map;
    map.numeric_ = true;
    std::map<double, std::string> numeric_first_text;
    std::set<std::string> text_ids;
    for (const std::string& raw : raw_identifiers)
    {
        const std::string id = strutil::trim_copy(raw);
        text_ids.insert(id);
        double value = 0.0;
        if (map.numeric_ && strutil::try_parse_double(id, value))
        {
            numeric_first_text.emplace(value, id);
        }
        else
        {
            map.numeric_ = false;
        }
    }

    int next = 1;
    if (map.numeric_)
    {
        for (const auto& [value, text] : numeric_first_text)
        {
            map.numeric_index_[value] = next++;
            map.identifiers_.push_back(text);
        }
    }
    else
    {
        for (const std::string& id : text_ids)
        {
            map.text_index_[id] = next++;
            map.identifiers_.push_back(id);
        }
    }
    return map;
}

int MetricIndexMap::index_of(const std::string& raw_identifier) const
{
    const std::string id = strutil::trim_copy(raw_identifier);
    if (numeric_)
    {
        double value = 0.0;
        if (strutil::try_parse_double(id, value))
        {
            const auto it = numeric_index_.find(value);
            if (it != numeric_index_.end())
            {
                return it->second;
            }
        }
    }
    else
    {
        const auto it = text_index_.find(id);
        if (it != text_index_.end())
        {
            return it->second;
        }
    }
    throw KeyLookupError(id, "metric index map");
}

std::vector<int> derive_region_numbers(const std::vector<std::string>& raw_regions,
                                       const std::unordered_map<std::string, std::string>& region_reference)
{
    if (is_single_global_region(raw_regions))
    {
        return std::vector<int>(raw_regions.size(), 1);
    }

    std::vector<int> out;
    out.reserve(raw_regions.size());
    for (const std::string& raw : raw_regions)
    {
        const std::string region = strutil::trim_copy(raw);
        const auto it = region_reference.find(region);
        if (it == region_reference.end())
        {
            throw KeyLookupError(region);
        }
        int number = 0;
        if (!strutil::try_parse_int(it->second, number))
        {
            throw ParseError("Region number '" + it->second + "' for region '" + region +
                             "' is not an integer");
        }
        out.push_back(number);
    }
    return out;
}

ProjectionData normalize_projection(Logger& log,
                                    const DelimitedTable& table,
                                    const std::vector<std::string>& allocation_classes,
                                    const ProjectionSettings& settings,
                                    const std::unordered_map<std::string, std::string>& region_reference,
                                    const AdministrativeMergePolicy& merge)
{
    std::vector<std::string> missing;
    for (const char* name : {kLandClassColumn, kMetricColumn, kRegionColumn})
    {
        if (!table.find_column(name))
        {
            missing.emplace_back(name);
        }
    }
    if (!missing.empty())
    {
        throw MissingFieldError("Projection file " + table.source + " is missing fields", missing);
    }

    const std::vector<std::string> raw_land_class = trimmed_column(table, *table.find_column(kLandClassColumn));
    const std::vector<std::string> raw_metric = trimmed_column(table, *table.find_column(kMetricColumn));
    const std::vector<std::string> raw_region = trimmed_column(table, *table.find_column(kRegionColumn));
    const std::size_t nrows = table.row_count();

    ProjectionData out;
    out.constraints = check_constraints(log, allocation_classes, raw_land_class);
    out.scenario = settings.scenario;

    const std::vector<TimeStepColumn> steps =
        select_time_step_columns(table.header, settings.start_year, settings.end_year);
    out.area = Array2D(nrows, steps.size());
    for (std::size_t s = 0; s < steps.size(); ++s)
    {
        out.time_steps.push_back(steps[s].step);
        for (std::size_t r = 0; r < nrows; ++r)
        {
            out.area(r, s) = table.numeric_cell(r, steps[s].column) * settings.area_factor;
        }
    }

    out.land_class.reserve(nrows);
    for (const std::string& name : raw_land_class)
    {
        out.land_class.push_back(strutil::lower_copy(name));
    }

    const MetricIndexMap metric_map = MetricIndexMap::build(raw_metric);
    out.metric_id = raw_metric;
    out.metric_index.reserve(nrows);
    for (const std::string& id : raw_metric)
    {
        out.metric_index.push_back(metric_map.index_of(id));
    }

    out.region_number = derive_region_numbers(raw_region, region_reference);

    std::vector<std::string> regions = raw_region;
    std::vector<int> region_numbers = out.region_number;
    const bool reserve_placeholder = merge.applies_to_projection(settings.aggregation_level);
    if (reserve_placeholder)
    {
        regions.push_back(merge.region_name);
        region_numbers.push_back(merge.region_number);
    }
    out.all_regions = sorted_unique(std::move(regions));
    out.all_region_numbers = sorted_unique(std::move(region_numbers));
    out.all_metrics = sorted_unique(out.metric_index);

    std::map<int, std::set<int>> metrics_by_region;
    for (std::size_t r = 0; r < nrows; ++r)
    {
        metrics_by_region[out.region_number[r]].insert(out.metric_index[r]);
    }
    for (const auto& entry : metrics_by_region)
    {
        out.region_metrics.emplace_back(entry.second.begin(), entry.second.end());
    }

    log.info("Number of regions from projected file:  " + std::to_string(out.all_region_numbers.size()));
    log.info("Number of basins or AEZs from projected file:  " + std::to_string(out.all_metrics.size()));

    if (reserve_placeholder)
    {
        // Placeholder sits one slot before the merged region's position in the sorted name list.
        const auto name_pos = std::find(out.all_regions.begin(), out.all_regions.end(), merge.region_name);
        const std::ptrdiff_t name_index = name_pos - out.all_regions.begin();
        std::size_t insert_at = name_index > 0 ? static_cast<std::size_t>(name_index - 1) : 0;
        insert_at = std::min(insert_at, out.region_metrics.size());
        out.region_metrics.insert(out.region_metrics.begin() + static_cast<std::ptrdiff_t>(insert_at),
                                  std::vector<int>{});
    }

    return out;
}

ProjectionData normalize_projection_file(Logger& log,
                                         const std::string& path,
                                         const std::vector<std::string>& allocation_classes,
                                         const ProjectionSettings& settings,
                                         const std::unordered_map<std::string, std::string>& region_reference,
                                         const AdministrativeMergePolicy& merge)
{
    const DelimitedTable table = read_delimited_table(path);
    return normalize_projection(log, table, allocation_classes, settings, region_reference, merge);
}

} // namespace lcn
