#pragma once

#include <string>

/**
 * @file admin_merge_policy.hpp
 * @brief Administrative merge of a dependent territory into its parent region.
 *
 * The projection source accounts for one territory under its own region
 * code while the spatial computation folds it into a parent region. The
 * projection normalizer reserves an empty placeholder for the territory and
 * the base layer normalizer remaps its cells to the parent. Both read the
 * numbers from the single policy object below so the two remaps agree.
 */

namespace lcn
{

struct AdministrativeMergePolicy
{
    std::string region_name;
    int region_number = 0;
    int parent_region_number = 0;
    std::string model_name;
    int aggregation_level = 2;

    /**
     * @brief Returns whether the cell-level remap applies to a run.
     * @param model Configured model name, compared case-insensitively.
     * @param level Configured aggregation level.
     */
    bool applies_to_cells(const std::string& model, int level) const;

    /**
     * @brief Returns whether the projection placeholder applies.
     * @param level Configured aggregation level.
     */
    bool applies_to_projection(int level) const { return level == aggregation_level; }
};

/**
 * @brief Taiwan (region 30) folded into China (region 11) for GCAM runs.
 */
const AdministrativeMergePolicy& gcam_taiwan_merge();

} // namespace lcn
