#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

/**
 * @file delimited_table.hpp
 * @brief In-memory delimited text table with header.
 *
 * Rows are kept as raw string cells; typed extraction happens per column
 * so each caller decides which columns must be numeric. Column lookup is
 * case-insensitive because the spatial and projection sources disagree on
 * header capitalization.
 */

namespace lcn
{

struct DelimitedTable
{
    std::string source;
    std::vector<std::string> header;
    std::vector<std::vector<std::string>> rows;
    std::vector<std::size_t> line_numbers;

    std::size_t row_count() const { return rows.size(); }
    std::size_t column_count() const { return header.size(); }

    /**
     * @brief Finds a column by name, ignoring case and surrounding spaces.
     * @param name Column name.
     * @return Column index, or empty when absent.
     */
    std::optional<std::size_t> find_column(const std::string& name) const;

    /**
     * @brief Finds a column by name or throws `MissingFieldError`.
     */
    std::size_t require_column(const std::string& name) const;

    /**
     * @brief Returns the header with every name lowercased and trimmed.
     */
    std::vector<std::string> lower_header() const;

    /**
     * @brief Copies one column's raw cells.
     */
    std::vector<std::string> string_column(std::size_t column) const;

    /**
     * @brief Parses one column as finite doubles.
     * @throws ParseError naming the column and line of the first bad cell.
     */
    std::vector<double> numeric_column(std::size_t column) const;

    /**
     * @brief Parses one column as integers.
     *
     * Integral floating text such as `12.0` is accepted since numeric
     * columns exported from spreadsheets often carry a decimal point.
     * @throws ParseError naming the column and line of the first bad cell,
     *         including values that do not fit a `long long`.
     */
    std::vector<long long> integer_column(std::size_t column) const;

    /**
     * @brief Parses one column as `int` identifiers.
     * @throws ParseError for non-integers and values outside the `int` range.
     */
    std::vector<int> int_column(std::size_t column) const;

    /**
     * @brief Parses one numeric cell.
     * @throws ParseError naming the column and line.
     */
    double numeric_cell(std::size_t row, std::size_t column) const;
};

/**
 * @brief Reads a delimited file whose first line is the header.
 * @param path Input file path.
 * @param delimiter Field delimiter.
 * @return Parsed table; blank lines are skipped.
 * @throws FileAccessError when the file cannot be opened.
 * @throws ParseError on a missing header or a row whose width differs from it.
 */
DelimitedTable read_delimited_table(const std::string& path, char delimiter = ',');

} // namespace lcn
