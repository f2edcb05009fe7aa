/**
 * @file readers.cpp
 * @brief Reference, allocation, and numeric array readers.
 */

#include "readers.hpp"
#include "delimited_table.hpp"
#include "errors.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace lcn
{
namespace
{

std::ifstream open_input(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        throw FileAccessError(path);
    }
    return file;
}

std::string line_location(const std::string& path, std::size_t line_no)
{
    std::ostringstream oss;
    oss << path << " line " << line_no;
    return oss.str();
}

/**
 * @brief Parses a headerless numeric file, skipping blank and `#` lines.
 */
Array2D load_numeric_text(const std::string& path, char delimiter)
{
    std::ifstream file = open_input(path);

    std::vector<double> values;
    std::size_t cols = 0;
    std::size_t rows = 0;
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(file, line))
    {
        ++line_no;
        const std::string trimmed = strutil::trim_copy(line);
        if (trimmed.empty() || trimmed.front() == '#')
        {
            continue;
        }

        const std::vector<std::string> fields = strutil::split_delimited(trimmed, delimiter);
        if (rows == 0)
        {
            cols = fields.size();
        }
        else if (fields.size() != cols)
        {
            std::ostringstream oss;
            oss << line_location(path, line_no) << " has " << fields.size()
                << " values; expected " << cols;
            throw ParseError(oss.str());
        }

        for (const std::string& field : fields)
        {
            double parsed = 0.0;
            if (!strutil::try_parse_double(field, parsed))
            {
                throw ParseError("Non-numeric value '" + field + "' at " + line_location(path, line_no));
            }
            values.push_back(parsed);
        }
        ++rows;
    }

    Array2D out(rows, cols);
    std::copy(values.begin(), values.end(), out.data());
    return out;
}

} // namespace

std::unordered_map<std::string, std::string> read_key_value(const std::string& path,
                                                            bool has_header,
                                                            char delimiter,
                                                            bool swap)
{
    std::ifstream file = open_input(path);

    std::unordered_map<std::string, std::string> out;
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(file, line))
    {
        ++line_no;
        if (has_header && line_no == 1)
        {
            continue;
        }
        const std::string trimmed = strutil::trim_copy(line);
        if (trimmed.empty())
        {
            continue;
        }

        const std::vector<std::string> item = strutil::split_delimited(trimmed, delimiter);
        if (item.size() < 2)
        {
            throw ParseError("Expected key and value at " + line_location(path, line_no));
        }
        if (swap)
        {
            out[item[1]] = item[0];
        }
        else
        {
            out[item[0]] = item[1];
        }
    }
    return out;
}

std::vector<int> read_key_list(const std::string& path, bool has_header, char delimiter)
{
    std::ifstream file = open_input(path);

    std::vector<int> out;
    std::string line;
    std::size_t line_no = 0;
    while (std::getline(file, line))
    {
        ++line_no;
        if (has_header && line_no == 1)
        {
            continue;
        }
        const std::string trimmed = strutil::trim_copy(line);
        if (trimmed.empty())
        {
            continue;
        }

        const std::vector<std::string> item = strutil::split_delimited(trimmed, delimiter);
        int value = 0;
        if (item.size() < 2 || !strutil::try_parse_int(item[1], value))
        {
            throw ParseError("Expected an integer in field 1 at " + line_location(path, line_no));
        }
        out.push_back(value);
    }
    return out;
}

AllocationMatrix read_allocation_matrix(const std::string& path,
                                        const std::string& target_column,
                                        int output_level,
                                        char delimiter)
{
    if (output_level < static_cast<int>(AllocationOutputLevel::ArrayOnly) ||
        output_level > static_cast<int>(AllocationOutputLevel::Full))
    {
        throw ConfigError("Unsupported allocation output level " + std::to_string(output_level) +
                          "; expected 1, 2 or 3");
    }
    const auto level = static_cast<AllocationOutputLevel>(output_level);

    std::error_code ec;
    const auto file_size = std::filesystem::file_size(path, ec);
    if (ec)
    {
        throw FileAccessError(path);
    }
    if (file_size == 0)
    {
        return AllocationMatrix{};
    }

    const DelimitedTable table = read_delimited_table(path, delimiter);
    const std::size_t target_index = table.require_column(target_column);
    const std::vector<std::string> header = table.lower_header();

    std::vector<std::size_t> final_indices;
    AllocationMatrix out;
    for (std::size_t c = 0; c < header.size(); ++c)
    {
        if (c != target_index)
        {
            final_indices.push_back(c);
            out.final_classes.push_back(header[c]);
        }
    }

    out.target_classes.reserve(table.row_count());
    out.values = Array2D(table.row_count(), final_indices.size());
    for (std::size_t r = 0; r < table.row_count(); ++r)
    {
        out.target_classes.push_back(strutil::lower_copy(strutil::trim_copy(table.rows[r][target_index])));
        for (std::size_t c = 0; c < final_indices.size(); ++c)
        {
            out.values(r, c) = table.numeric_cell(r, final_indices[c]);
        }
    }

    if (level != AllocationOutputLevel::Full)
    {
        out.final_classes.clear();
    }
    if (level == AllocationOutputLevel::ArrayOnly)
    {
        out.target_classes.clear();
    }
    return out;
}

std::vector<double> read_column_as_array(const std::string& path, std::size_t column_index, char delimiter)
{
    const Array2D arr = load_numeric_text(path, delimiter);
    if (column_index >= arr.cols())
    {
        throw MissingFieldError("Column index out of range in " + path,
                                {"column " + std::to_string(column_index)});
    }
    return arr.column(column_index);
}

Array2D read_csv_as_array(const std::string& path)
{
    return load_numeric_text(path, ',');
}

} // namespace lcn
