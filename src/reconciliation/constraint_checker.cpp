/**
 * @file constraint_checker.cpp
 * @brief Case-insensitive land-class set comparison.
 */

#include "constraint_checker.hpp"
#include "logging.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <iterator>
#include <set>

namespace lcn
{
namespace
{

std::set<std::string> lowered_set(const std::vector<std::string>& values)
{
    std::set<std::string> out;
    for (const std::string& value : values)
    {
        out.insert(strutil::lower_copy(value));
    }
    return out;
}

std::vector<std::string> difference(const std::set<std::string>& a, const std::set<std::string>& b)
{
    std::vector<std::string> out;
    std::set_difference(a.begin(), a.end(), b.begin(), b.end(), std::back_inserter(out));
    return out;
}

} // namespace

ConstraintReport check_constraints(Logger& log,
                                   const std::vector<std::string>& allocation_classes,
                                   const std::vector<std::string>& actual_classes)
{
    const std::set<std::string> alloc = lowered_set(allocation_classes);
    const std::set<std::string> actual = lowered_set(actual_classes);

    ConstraintReport report;
    report.projection_only = difference(actual, alloc);
    report.allocation_only = difference(alloc, actual);

    if (!report.projection_only.empty())
    {
        log.warning("Land classes in projected model data but not in allocation file:  [" +
                    strutil::join(report.projection_only) + "]");
    }
    if (!report.allocation_only.empty())
    {
        log.warning("Land classes in allocation file but not in projected model data:  [" +
                    strutil::join(report.allocation_only) + "]");
    }
    return report;
}

} // namespace lcn
