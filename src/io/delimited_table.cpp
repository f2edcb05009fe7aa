/**
 * @file delimited_table.cpp
 * @brief Header-aware delimited table reader and typed column extraction.
 */

#include "delimited_table.hpp"
#include "errors.hpp"
#include "string_utils.hpp"

#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

namespace lcn
{
namespace
{

std::string cell_location(const DelimitedTable& table, std::size_t row, std::size_t column)
{
    std::ostringstream oss;
    oss << table.source << " line " << table.line_numbers[row]
        << " column '" << table.header[column] << "'";
    return oss.str();
}

} // namespace

std::optional<std::size_t> DelimitedTable::find_column(const std::string& name) const
{
    const std::string wanted = strutil::lower_copy(strutil::trim_copy(name));
    for (std::size_t i = 0; i < header.size(); ++i)
    {
        if (strutil::lower_copy(strutil::trim_copy(header[i])) == wanted)
        {
            return i;
        }
    }
    return std::nullopt;
}

std::size_t DelimitedTable::require_column(const std::string& name) const
{
    const std::optional<std::size_t> index = find_column(name);
    if (!index)
    {
        throw MissingFieldError("Required field missing from " + source, {name});
    }
    return *index;
}

std::vector<std::string> DelimitedTable::lower_header() const
{
    std::vector<std::string> out;
    out.reserve(header.size());
    for (const std::string& name : header)
    {
        out.push_back(strutil::lower_copy(strutil::trim_copy(name)));
    }
    return out;
}

std::vector<std::string> DelimitedTable::string_column(std::size_t column) const
{
    std::vector<std::string> out;
    out.reserve(rows.size());
    for (const auto& row : rows)
    {
        out.push_back(row[column]);
    }
    return out;
}

double DelimitedTable::numeric_cell(std::size_t row, std::size_t column) const
{
    double value = 0.0;
    if (!strutil::try_parse_double(rows[row][column], value))
    {
        throw ParseError("Non-numeric value '" + rows[row][column] + "' at " +
                         cell_location(*this, row, column));
    }
    return value;
}

std::vector<double> DelimitedTable::numeric_column(std::size_t column) const
{
    std::vector<double> out(rows.size());
    for (std::size_t r = 0; r < rows.size(); ++r)
    {
        out[r] = numeric_cell(r, column);
    }
    return out;
}

std::vector<long long> DelimitedTable::integer_column(std::size_t column) const
{
    std::vector<long long> out(rows.size());
    for (std::size_t r = 0; r < rows.size(); ++r)
    {
        long long parsed = 0;
        if (strutil::try_parse_int(rows[r][column], parsed))
        {
            out[r] = parsed;
            continue;
        }
        double as_double = 0.0;
        if (strutil::try_parse_double(rows[r][column], as_double) && std::floor(as_double) == as_double)
        {
            // -2^63 is exact as a double; 2^63 is the first value past the top.
            const double lowest = static_cast<double>(std::numeric_limits<long long>::min());
            if (as_double < lowest || as_double >= -lowest)
            {
                throw ParseError("Integer value '" + rows[r][column] + "' out of range at " +
                                 cell_location(*this, r, column));
            }
            out[r] = static_cast<long long>(as_double);
            continue;
        }
        throw ParseError("Non-integer value '" + rows[r][column] + "' at " +
                         cell_location(*this, r, column));
    }
    return out;
}

std::vector<int> DelimitedTable::int_column(std::size_t column) const
{
    const std::vector<long long> wide = integer_column(column);
    std::vector<int> out(wide.size());
    for (std::size_t r = 0; r < wide.size(); ++r)
    {
        if (wide[r] < std::numeric_limits<int>::min() || wide[r] > std::numeric_limits<int>::max())
        {
            throw ParseError("Integer value '" + rows[r][column] + "' out of range at " +
                             cell_location(*this, r, column));
        }
        out[r] = static_cast<int>(wide[r]);
    }
    return out;
}

DelimitedTable read_delimited_table(const std::string& path, char delimiter)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        throw FileAccessError(path);
    }

    DelimitedTable table;
    table.source = path;

    std::string line;
    std::size_t line_no = 0;
    bool have_header = false;
    while (std::getline(file, line))
    {
        ++line_no;
        if (strutil::is_blank(line))
        {
            continue;
        }

        std::vector<std::string> fields = strutil::split_delimited(line, delimiter);
        if (!have_header)
        {
            table.header = std::move(fields);
            have_header = true;
            continue;
        }

        if (fields.size() != table.header.size())
        {
            std::ostringstream oss;
            oss << path << " line " << line_no << " has " << fields.size()
                << " fields; header has " << table.header.size();
            throw ParseError(oss.str());
        }
        table.rows.push_back(std::move(fields));
        table.line_numbers.push_back(line_no);
    }

    if (!have_header)
    {
        throw ParseError(path + " has no header row");
    }
    return table;
}

} // namespace lcn
