#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "array2d.hpp"

/**
 * @file readers.hpp
 * @brief Leaf readers for reference, allocation, and numeric array files.
 *
 * These readers return raw, un-reconciled values. The normalizers build
 * the shared region/metric/land-class coordinate system on top of them.
 */

namespace lcn
{

/**
 * @brief Return shapes supported by `read_allocation_matrix`.
 */
enum class AllocationOutputLevel : int
{
    ArrayOnly = 1,
    TargetsAndArray = 2,
    Full = 3,
};

/**
 * @brief Allocation/crosswalk weights between target and final land classes.
 *
 * Rows follow `target_classes`; columns follow `final_classes`. Fields not
 * requested by the output level are left empty.
 */
struct AllocationMatrix
{
    std::vector<std::string> final_classes;
    std::vector<std::string> target_classes;
    Array2D values;

    bool empty() const { return values.empty() && final_classes.empty() && target_classes.empty(); }
};

/**
 * @brief Reads two-field lines into a key/value map.
 * @param path Input file path.
 * @param has_header Skip the first line unconditionally.
 * @param delimiter Field delimiter.
 * @param swap Map field 1 to field 0 instead of field 0 to field 1.
 * @return Map where later duplicate keys overwrite earlier ones.
 * @throws ParseError when a non-blank line has fewer than two fields.
 */
std::unordered_map<std::string, std::string> read_key_value(const std::string& path,
                                                            bool has_header = false,
                                                            char delimiter = ',',
                                                            bool swap = false);

/**
 * @brief Reads the integer in field 1 of every line.
 * @param path Input file path.
 * @param has_header Skip the first line unconditionally.
 * @param delimiter Field delimiter.
 * @return Values in file order.
 * @throws ParseError when field 1 is missing or not an integer.
 */
std::vector<int> read_key_list(const std::string& path, bool has_header = true, char delimiter = ',');

/**
 * @brief Reads an allocation file into class lists and a weight array.
 * @param path Input file with header.
 * @param target_column Header name of the target land-class column.
 * @param output_level 1 array only, 2 target classes and array, 3 everything.
 * @param delimiter Field delimiter.
 * @return Allocation matrix; a zero-byte file yields an empty result.
 * @throws ConfigError for an unrecognized output level.
 * @throws MissingFieldError when the target column is absent.
 * @throws ParseError on a non-numeric weight.
 */
AllocationMatrix read_allocation_matrix(const std::string& path,
                                        const std::string& target_column,
                                        int output_level = 3,
                                        char delimiter = ',');

/**
 * @brief Reads a headerless numeric file and slices out one column.
 * @throws MissingFieldError when the column index is out of range.
 * @throws ParseError on any non-numeric cell or ragged row.
 */
std::vector<double> read_column_as_array(const std::string& path,
                                         std::size_t column_index,
                                         char delimiter = ',');

/**
 * @brief Reads a headerless comma-separated numeric file.
 * @throws ParseError on any non-numeric cell or ragged row.
 */
Array2D read_csv_as_array(const std::string& path);

} // namespace lcn
