#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

#include "admin_merge_policy.hpp"
#include "array2d.hpp"
#include "constraint_checker.hpp"
#include "geodesy_constants.hpp"

/**
 * @file projection_normalizer.hpp
 * @brief Normalization of the coarse land-allocation projection table.
 *
 * Converts arbitrary metric identifiers to dense 1-based indices, maps
 * region names to region numbers, scales projected areas to km^2, and
 * lists the legal (region, metric) combinations for spatial allocation.
 *
 * Required projection columns: `landclass`, `metric_id`, `region`, plus
 * any number of integer-labelled time-step columns.
 */

namespace lcn
{

class Logger;
struct DelimitedTable;

/**
 * @brief Dense 1-based indices for raw metric identifiers.
 *
 * Indices follow ascending order of the raw identifiers: numeric order
 * when every identifier parses as a number, text order otherwise.
 */
class MetricIndexMap
{
public:
    /**
     * @brief Builds the map from per-row identifiers; duplicates collapse.
     */
    static MetricIndexMap build(const std::vector<std::string>& raw_identifiers);

    /**
     * @brief Returns the 1-based index of a raw identifier.
     * @throws KeyLookupError when the identifier was not in the source rows.
     */
    int index_of(const std::string& raw_identifier) const;

    std::size_t size() const { return identifiers_.size(); }
    bool numeric() const { return numeric_; }

    /**
     * @brief Distinct identifiers; element i carries index i + 1.
     */
    const std::vector<std::string>& identifiers() const { return identifiers_; }

private:
    bool numeric_ = true;
    std::vector<std::string> identifiers_;
    std::map<double, int> numeric_index_;
    std::map<std::string, int> text_index_;
};

/**
 * @brief Per-row region numbers for raw region values.
 *
 * When the rows carry exactly one distinct region equal to 1, every row
 * is region 1 and the reference is not consulted.
 * @throws KeyLookupError when a region name is absent from the reference.
 * @throws ParseError when a reference value is not an integer.
 */
std::vector<int> derive_region_numbers(const std::vector<std::string>& raw_regions,
                                       const std::unordered_map<std::string, std::string>& region_reference);

struct ProjectionSettings
{
    int start_year = 0;
    int end_year = 0;
    std::string scenario;
    int aggregation_level = 1;
    double area_factor = geodesy_constants::default_projection_area_factor;
};

struct ProjectionData
{
    std::string scenario;
    ConstraintReport constraints;

    std::vector<int> time_steps;
    Array2D area;                                 // rows x time_steps, km^2
    std::vector<int> metric_index;                // per row, 1-based
    std::vector<std::string> land_class;          // per row, lowercased
    std::vector<int> region_number;               // per row
    std::vector<std::string> all_regions;         // sorted unique names
    std::vector<int> all_region_numbers;          // sorted unique numbers
    std::vector<std::vector<int>> region_metrics; // metric indices per region
    std::vector<int> all_metrics;                 // sorted unique indices
    std::vector<std::string> metric_id;           // per row, raw identifier

    std::size_t row_count() const { return land_class.size(); }
};

/**
 * @brief Normalizes an already-read projection table.
 * @param log Logging collaborator for constraint warnings and counts.
 * @param table Projection table.
 * @param allocation_classes Land classes declared by the projected allocation file.
 * @param settings Year range, scenario label, aggregation level and unit factor.
 * @param region_reference Region name to region number mapping.
 * @param merge Administrative merge policy shared with the base layer.
 */
ProjectionData normalize_projection(Logger& log,
                                    const DelimitedTable& table,
                                    const std::vector<std::string>& allocation_classes,
                                    const ProjectionSettings& settings,
                                    const std::unordered_map<std::string, std::string>& region_reference,
                                    const AdministrativeMergePolicy& merge = gcam_taiwan_merge());

/**
 * @brief Reads a comma-delimited projection file and normalizes it.
 */
ProjectionData normalize_projection_file(Logger& log,
                                         const std::string& path,
                                         const std::vector<std::string>& allocation_classes,
                                         const ProjectionSettings& settings,
                                         const std::unordered_map<std::string, std::string>& region_reference,
                                         const AdministrativeMergePolicy& merge = gcam_taiwan_merge());

} // namespace lcn
