#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "admin_merge_policy.hpp"
#include "array2d.hpp"

/**
 * @file base_layer_normalizer.hpp
 * @brief Normalization of the fine-resolution spatial base layer.
 *
 * Resolves the base-layer column schema, derives per-cell region and
 * metric ids for the configured aggregation level, estimates each cell's
 * geodetic area, and converts land-cover fractions to km^2.
 */

namespace lcn
{

class Logger;
struct DelimitedTable;

enum class AggregationLevel : int
{
    SubRegion = 1,
    RegionSubRegion = 2,
};

struct BaseLayerConfig
{
    double resolution_degrees = 0.25;
    int aggregation_level = static_cast<int>(AggregationLevel::SubRegion);
    std::string metric_name = "basin";
    std::string primary_key_column = "fid";
    std::string model_name = "gcam";

    /**
     * @brief Rejects non-positive resolution and unsupported aggregation levels.
     * @throws ConfigError on invalid values.
     */
    void validate() const;

    /**
     * @brief Returns the `{metric}_id` column name.
     */
    std::string metric_column() const;
};

enum class CoordinateConvention
{
    LatCoordLonCoord,
    LatitudeLongitude,
};

/**
 * @brief Resolved column indices for one base-layer table.
 */
struct BaseLayerSchema
{
    std::vector<std::string> land_classes;
    std::vector<std::size_t> land_class_columns;
    CoordinateConvention coordinate_convention = CoordinateConvention::LatCoordLonCoord;
    std::size_t latitude_column = 0;
    std::size_t longitude_column = 0;
    std::optional<std::size_t> region_metric_column;
    std::size_t grid_id_column = 0;
    std::optional<std::size_t> water_column;
    std::optional<std::size_t> region_column;
    std::size_t metric_column = 0;
};

/**
 * @brief Resolves every base-layer column in one pass.
 *
 * Coordinates are looked up as `latcoord`/`loncoord` first and
 * `latitude`/`longitude` second. `region_id` is required only at
 * aggregation level 2.
 * @throws ConfigError for an invalid configuration.
 * @throws MissingFieldError listing every missing required column.
 */
BaseLayerSchema resolve_base_layer_schema(const DelimitedTable& table,
                                          const std::vector<std::string>& spatial_land_classes,
                                          const BaseLayerConfig& config);

struct BaseLayerData
{
    std::vector<std::string> land_classes;
    Array2D land_cover;                          // ngrids x classes, km^2
    std::vector<double> water;
    Array2D coords;                              // ngrids x 2: latitude, longitude
    CoordinateConvention coordinate_convention = CoordinateConvention::LatCoordLonCoord;
    std::optional<std::vector<long long>> region_metric;
    std::vector<long long> grid_id;
    std::vector<int> metric;
    std::vector<int> region;
    std::size_t ngrids = 0;
    std::vector<double> cell_area;               // km^2
    std::vector<double> cell_fraction;           // not clamped
};

/**
 * @brief Normalizes an already-read base-layer table.
 * @param log Logging collaborator for fallback warnings and errors.
 * @param table Base-layer table.
 * @param spatial_land_classes Land-cover column names to extract.
 * @param config Resolution, aggregation, and naming configuration.
 * @param merge Administrative merge policy shared with the projection.
 */
BaseLayerData normalize_base_layer(Logger& log,
                                   const DelimitedTable& table,
                                   const std::vector<std::string>& spatial_land_classes,
                                   const BaseLayerConfig& config,
                                   const AdministrativeMergePolicy& merge = gcam_taiwan_merge());

/**
 * @brief Reads a comma-delimited base-layer file and normalizes it.
 */
BaseLayerData normalize_base_layer_file(Logger& log,
                                        const std::string& path,
                                        const std::vector<std::string>& spatial_land_classes,
                                        const BaseLayerConfig& config,
                                        const AdministrativeMergePolicy& merge = gcam_taiwan_merge());

/**
 * @brief Equirectangular cell area in km^2 at a latitude.
 */
double cell_area_km2(double latitude_deg, double resolution_degrees);

} // namespace lcn
