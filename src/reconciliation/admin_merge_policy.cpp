/**
 * @file admin_merge_policy.cpp
 * @brief Named administrative merge policy shared by both normalizers.
 */

#include "admin_merge_policy.hpp"
#include "string_utils.hpp"

namespace lcn
{

bool AdministrativeMergePolicy::applies_to_cells(const std::string& model, int level) const
{
    return level == aggregation_level && strutil::lower_copy(model) == strutil::lower_copy(model_name);
}

const AdministrativeMergePolicy& gcam_taiwan_merge()
{
    static const AdministrativeMergePolicy policy{"Taiwan", 30, 11, "gcam", 2};
    return policy;
}

} // namespace lcn
