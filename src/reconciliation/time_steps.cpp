/**
 * @file time_steps.cpp
 * @brief Integer header selection for projected time steps.
 */

#include "time_steps.hpp"
#include "string_utils.hpp"

namespace lcn
{

std::vector<TimeStepColumn> select_time_step_columns(const std::vector<std::string>& column_labels,
                                                     int start,
                                                     int end)
{
    std::vector<TimeStepColumn> out;
    for (std::size_t i = 0; i < column_labels.size(); ++i)
    {
        int step = 0;
        if (!strutil::try_parse_int(column_labels[i], step))
        {
            continue;
        }
        if (start <= step && step <= end)
        {
            out.push_back(TimeStepColumn{step, i});
        }
    }
    return out;
}

std::vector<int> select_time_steps(const std::vector<std::string>& column_labels, int start, int end)
{
    std::vector<int> steps;
    for (const TimeStepColumn& selected : select_time_step_columns(column_labels, start, end))
    {
        steps.push_back(selected.step);
    }
    return steps;
}

} // namespace lcn
