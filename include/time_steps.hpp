#pragma once

#include <cstddef>
#include <string>
#include <vector>

/**
 * @file time_steps.hpp
 * @brief Selection of integer time-step columns from a table header.
 *
 * Labels that do not parse as integers are skipped without a record:
 * projection headers mix identifier columns with year columns and only the
 * years matter here. Selection keeps the header's left-to-right order.
 */

namespace lcn
{

struct TimeStepColumn
{
    int step = 0;
    std::size_t column = 0;
};

/**
 * @brief Selects time steps in `[start, end]` from column labels.
 * @param column_labels Header labels in original order.
 * @param start First time step, inclusive.
 * @param end Last time step, inclusive; `start > end` selects nothing.
 * @return Selected steps in header order.
 */
std::vector<int> select_time_steps(const std::vector<std::string>& column_labels, int start, int end);

/**
 * @brief Same selection as `select_time_steps`, keeping each step's column index.
 */
std::vector<TimeStepColumn> select_time_step_columns(const std::vector<std::string>& column_labels,
                                                     int start,
                                                     int end);

} // namespace lcn
