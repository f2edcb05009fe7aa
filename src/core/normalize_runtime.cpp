/**
 * @file normalize_runtime.cpp
 * @brief Argument handling and orchestration for a normalization run.
 *
 * Reads the allocation files for land-class vocabularies, normalizes the
 * projection and the base layer, and prints a summary of the shared
 * coordinate system handed to spatial allocation.
 */

#include "normalize_runtime.hpp"

#include <iomanip>
#include <numeric>
#include <ostream>
#include <unordered_map>

#include "errors.hpp"
#include "readers.hpp"
#include "runtime_config.hpp"

namespace lcn
{
namespace
{

void print_usage(std::ostream& out)
{
    out << "Land Cover Normalizer\n"
        << "Usage:\n"
        << "  landcover_normalize --config <file.yaml> [--log quiet|normal|debug]\n";
}

void run(const RunConfig& config, Logger& log, std::ostream& out)
{
    const AllocationMatrix projected_alloc =
        read_allocation_matrix(config.projection_allocation_file, config.projection_allocation_target_column);
    const AllocationMatrix spatial_alloc =
        read_allocation_matrix(config.spatial_allocation_file, config.spatial_allocation_target_column);

    std::unordered_map<std::string, std::string> regions;
    if (!config.region_reference_file.empty())
    {
        regions = read_key_value(config.region_reference_file, config.region_reference_has_header);
    }

    const ProjectionData projection = normalize_projection_file(
        log, config.projection_file, projected_alloc.final_classes, config.projection, regions);

    const BaseLayerData base =
        normalize_base_layer_file(log, config.base_layer_file, spatial_alloc.final_classes, config.base_layer);

    double total_land_km2 = 0.0;
    for (std::size_t i = 0; i < base.ngrids; ++i)
    {
        total_land_km2 += base.land_cover.row_sum(i);
    }
    const double mean_fraction = base.ngrids == 0
        ? 0.0
        : std::accumulate(base.cell_fraction.begin(), base.cell_fraction.end(), 0.0) /
              static_cast<double>(base.ngrids);

    out << "[landcover-normalize] scenario=" << projection.scenario
        << " time_steps=" << projection.time_steps.size()
        << " projection_rows=" << projection.row_count()
        << " regions=" << projection.all_region_numbers.size()
        << " metrics=" << projection.all_metrics.size()
        << " constraint_mismatch=" << (projection.constraints.consistent() ? "no" : "yes")
        << "\n";
    out << "[landcover-normalize] grid_cells=" << base.ngrids
        << " land_classes=" << base.land_classes.size()
        << std::fixed << std::setprecision(3)
        << " land_area_km2=" << total_land_km2
        << " mean_cell_fraction=" << mean_fraction
        << "\n";
}

} // namespace

ParseArgsResult parse_normalize_args(const std::vector<std::string>& args,
                                     NormalizeRunOptions& options,
                                     std::ostream& out,
                                     std::ostream& err)
{
    for (std::size_t i = 1; i < args.size(); ++i)
    {
        const std::string& arg = args[i];
        auto require_value = [&](const std::string& option) -> const std::string*
        {
            if (i + 1 >= args.size())
            {
                err << "Missing value for " << option << "\n";
                return nullptr;
            }
            return &args[++i];
        };

        if (arg == "--help" || arg == "-h")
        {
            print_usage(out);
            return ParseArgsResult::Help;
        }
        if (arg == "--config")
        {
            const std::string* value = require_value(arg);
            if (value == nullptr)
            {
                return ParseArgsResult::Error;
            }
            options.config_path = *value;
            continue;
        }
        if (arg == "--log")
        {
            const std::string* value = require_value(arg);
            if (value == nullptr)
            {
                return ParseArgsResult::Error;
            }
            bool valid = false;
            const LogProfile profile = parse_log_profile(*value, &valid);
            if (!valid)
            {
                err << "--log must be quiet, normal or debug\n";
                return ParseArgsResult::Error;
            }
            options.log_override = profile;
            continue;
        }

        err << "Unknown argument: " << arg << "\n";
        return ParseArgsResult::Error;
    }

    if (options.config_path.empty())
    {
        err << "--config is required\n";
        return ParseArgsResult::Error;
    }
    return ParseArgsResult::Ok;
}

int run_normalization(const NormalizeRunOptions& options, std::ostream& out, std::ostream& err)
{
    StreamLogger log(options.log_override.value_or(LogProfile::normal), out, err);
    try
    {
        const RunConfig config = load_run_config(options.config_path);
        if (!options.log_override)
        {
            log.set_profile(config.log_profile);
        }
        run(config, log, out);
    }
    catch (const NormalizationError& e)
    {
        log.error(e.what());
        return exit_status::normalization_failed;
    }
    return exit_status::ok;
}

int run_normalize_command(const std::vector<std::string>& args, std::ostream& out, std::ostream& err)
{
    NormalizeRunOptions options;
    switch (parse_normalize_args(args, options, out, err))
    {
    case ParseArgsResult::Help:
        return exit_status::ok;
    case ParseArgsResult::Error:
        return exit_status::bad_arguments;
    case ParseArgsResult::Ok:
        break;
    }
    return run_normalization(options, out, err);
}

} // namespace lcn
