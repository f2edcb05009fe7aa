#pragma once

#include <string>
#include <vector>

/**
 * @file constraint_checker.hpp
 * @brief Land-class agreement check between allocation and projection sources.
 *
 * The check is observational: differences are logged as warnings and
 * returned for inspection, never raised.
 */

namespace lcn
{

class Logger;

/**
 * @brief Lowercased, sorted land classes present on only one side.
 */
struct ConstraintReport
{
    std::vector<std::string> projection_only;
    std::vector<std::string> allocation_only;

    bool consistent() const { return projection_only.empty() && allocation_only.empty(); }
};

/**
 * @brief Compares allocation land classes with those used by the projection.
 * @param log Logging collaborator receiving one warning per non-empty side.
 * @param allocation_classes Land classes declared by the allocation file.
 * @param actual_classes Land classes referenced by the projection table.
 * @return Both set differences, case-insensitive.
 */
ConstraintReport check_constraints(Logger& log,
                                   const std::vector<std::string>& allocation_classes,
                                   const std::vector<std::string>& actual_classes);

} // namespace lcn
