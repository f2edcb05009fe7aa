/**
 * @file base_layer_normalizer.cpp
 * @brief Base-layer extraction, cell area, and cell truncation correction.
 *
 * Cell-wise loops are independent and run under OpenMP the same way the
 * physics column loops do; every iteration writes only its own cell.
 */

#include "base_layer_normalizer.hpp"
#include "delimited_table.hpp"
#include "errors.hpp"
#include "geodesy_constants.hpp"
#include "logging.hpp"

#include <cmath>
#include <omp.h>

namespace lcn
{
namespace
{

/**
 * @brief Computes cell area and fraction, then rescales land cover to km^2.
 */
void apply_cell_truncation(BaseLayerData& data, double resolution_degrees)
{
    const double res2 = resolution_degrees * resolution_degrees;
    const long long n = static_cast<long long>(data.ngrids);
    const std::size_t nclasses = data.land_cover.cols();

    data.cell_area.assign(data.ngrids, 0.0);
    data.cell_fraction.assign(data.ngrids, 0.0);

    #pragma omp parallel for
    for (long long i = 0; i < n; ++i)
    {
        const std::size_t cell = static_cast<std::size_t>(i);
        const double area = cell_area_km2(data.coords(cell, 0), resolution_degrees);
        data.cell_area[cell] = area;
        data.cell_fraction[cell] = (data.land_cover.row_sum(cell) + data.water[cell]) / res2;

        const double scale = area / res2;
        double* cover = data.land_cover.row(cell);
        for (std::size_t c = 0; c < nclasses; ++c)
        {
            cover[c] *= scale;
        }
    }
}

} // namespace

double cell_area_km2(double latitude_deg, double resolution_degrees)
{
    const double latitude_rad = latitude_deg * geodesy_constants::pi / 180.0;
    return std::cos(latitude_rad) * geodesy_constants::km2_per_square_degree_equator *
           resolution_degrees * resolution_degrees;
}

BaseLayerData normalize_base_layer(Logger& log,
                                   const DelimitedTable& table,
                                   const std::vector<std::string>& spatial_land_classes,
                                   const BaseLayerConfig& config,
                                   const AdministrativeMergePolicy& merge)
{
    BaseLayerSchema schema;
    try
    {
        schema = resolve_base_layer_schema(table, spatial_land_classes, config);
    }
    catch (const MissingFieldError& e)
    {
        log.error("Fields are listed in the spatial allocation file or configuration that do not exist in the base layer.");
        log.error(e.what());
        throw;
    }

    BaseLayerData data;
    data.ngrids = table.row_count();
    data.land_classes = schema.land_classes;
    data.coordinate_convention = schema.coordinate_convention;

    data.land_cover = Array2D(data.ngrids, schema.land_class_columns.size());
    for (std::size_t r = 0; r < data.ngrids; ++r)
    {
        for (std::size_t c = 0; c < schema.land_class_columns.size(); ++c)
        {
            data.land_cover(r, c) = table.numeric_cell(r, schema.land_class_columns[c]);
        }
    }

    data.coords = Array2D(data.ngrids, 2);
    for (std::size_t r = 0; r < data.ngrids; ++r)
    {
        data.coords(r, 0) = table.numeric_cell(r, schema.latitude_column);
        data.coords(r, 1) = table.numeric_cell(r, schema.longitude_column);
    }

    if (schema.region_metric_column)
    {
        data.region_metric = table.integer_column(*schema.region_metric_column);
    }
    else
    {
        log.debug("Combined region/metric field 'regaez' not present in base layer.");
    }

    data.grid_id = table.integer_column(schema.grid_id_column);

    if (schema.water_column)
    {
        data.water = table.numeric_column(*schema.water_column);
    }
    else
    {
        log.warning("Water not represented in base layer.  Representing water as 0 percent of grid.");
        data.water.assign(data.grid_id.size(), 0.0);
    }

    data.metric = table.int_column(schema.metric_column);
    if (config.aggregation_level == static_cast<int>(AggregationLevel::RegionSubRegion))
    {
        data.region = table.int_column(*schema.region_column);
    }
    else
    {
        data.region.assign(data.ngrids, 1);
    }

    if (merge.applies_to_cells(config.model_name, config.aggregation_level))
    {
        for (int& region : data.region)
        {
            if (region == merge.region_number)
            {
                region = merge.parent_region_number;
            }
        }
    }

    apply_cell_truncation(data, config.resolution_degrees);

    log.info("Number of grid cells from base layer:  " + std::to_string(data.ngrids));
    return data;
}

BaseLayerData normalize_base_layer_file(Logger& log,
                                        const std::string& path,
                                        const std::vector<std::string>& spatial_land_classes,
                                        const BaseLayerConfig& config,
                                        const AdministrativeMergePolicy& merge)
{
    const DelimitedTable table = read_delimited_table(path);
    return normalize_base_layer(log, table, spatial_land_classes, config, merge);
}

} // namespace lcn
