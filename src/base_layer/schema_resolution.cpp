/**
 * @file schema_resolution.cpp
 * @brief Base-layer column resolution across naming conventions.
 */

#include "base_layer_normalizer.hpp"
#include "delimited_table.hpp"
#include "errors.hpp"
#include "string_utils.hpp"

#include <cmath>

namespace lcn
{
namespace
{

struct CoordinateNames
{
    CoordinateConvention convention;
    const char* latitude;
    const char* longitude;
};

constexpr CoordinateNames kCoordinateConventions[] = {
    {CoordinateConvention::LatCoordLonCoord, "latcoord", "loncoord"},
    {CoordinateConvention::LatitudeLongitude, "latitude", "longitude"},
};

constexpr const char* kRegionMetricColumn = "regaez";
constexpr const char* kWaterColumn = "water";
constexpr const char* kRegionColumn = "region_id";

} // namespace

void BaseLayerConfig::validate() const
{
    if (!std::isfinite(resolution_degrees) || resolution_degrees <= 0.0)
    {
        throw ConfigError("Base layer resolution must be a positive number of degrees");
    }
    if (aggregation_level != static_cast<int>(AggregationLevel::SubRegion) &&
        aggregation_level != static_cast<int>(AggregationLevel::RegionSubRegion))
    {
        throw ConfigError("Unsupported aggregation level " + std::to_string(aggregation_level) +
                          "; expected 1 (sub-region) or 2 (region and sub-region)");
    }
    if (strutil::trim_copy(metric_name).empty())
    {
        throw ConfigError("Metric name must not be empty");
    }
}

std::string BaseLayerConfig::metric_column() const
{
    return strutil::lower_copy(strutil::trim_copy(metric_name)) + "_id";
}

BaseLayerSchema resolve_base_layer_schema(const DelimitedTable& table,
                                          const std::vector<std::string>& spatial_land_classes,
                                          const BaseLayerConfig& config)
{
    config.validate();

    BaseLayerSchema schema;
    std::vector<std::string> missing;

    for (const std::string& name : spatial_land_classes)
    {
        const std::string lowered = strutil::lower_copy(strutil::trim_copy(name));
        const auto column = table.find_column(lowered);
        if (!column)
        {
            missing.push_back(lowered);
            continue;
        }
        schema.land_classes.push_back(lowered);
        schema.land_class_columns.push_back(*column);
    }

    bool have_coords = false;
    for (const CoordinateNames& names : kCoordinateConventions)
    {
        const auto lat = table.find_column(names.latitude);
        const auto lon = table.find_column(names.longitude);
        if (lat && lon)
        {
            schema.coordinate_convention = names.convention;
            schema.latitude_column = *lat;
            schema.longitude_column = *lon;
            have_coords = true;
            break;
        }
    }
    if (!have_coords)
    {
        missing.emplace_back("latcoord/loncoord or latitude/longitude");
    }

    schema.region_metric_column = table.find_column(kRegionMetricColumn);
    schema.water_column = table.find_column(kWaterColumn);

    if (const auto grid = table.find_column(config.primary_key_column))
    {
        schema.grid_id_column = *grid;
    }
    else
    {
        missing.push_back(strutil::lower_copy(config.primary_key_column));
    }

    if (config.aggregation_level == static_cast<int>(AggregationLevel::RegionSubRegion))
    {
        schema.region_column = table.find_column(kRegionColumn);
        if (!schema.region_column)
        {
            missing.emplace_back(kRegionColumn);
        }
    }

    if (const auto metric = table.find_column(config.metric_column()))
    {
        schema.metric_column = *metric;
    }
    else
    {
        missing.push_back(config.metric_column());
    }

    if (!missing.empty())
    {
        throw MissingFieldError("Fields missing from base layer " + table.source, missing);
    }
    return schema;
}

} // namespace lcn
