#pragma once

#include <algorithm>
#include <cctype>
#include <cmath>
#include <exception>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file string_utils.hpp
 * @brief Lightweight string helpers shared by readers and config parsing.
 *
 * Provides case normalization, trimming, delimiter splitting, and
 * full-token numeric parsing. Functions are header-inline because they
 * are small and reused on every table cell.
 */

namespace lcn
{
namespace strutil
{

/**
 * @brief Returns a lowercase copy of the input string.
 * @param value Source string view.
 * @return Lowercased string.
 */
inline std::string lower_copy(std::string_view value)
{
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c)
    {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

/**
 * @brief Trims leading and trailing ASCII whitespace.
 */
inline std::string trim_copy(std::string_view value)
{
    const auto first = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    if (first == value.end())
    {
        return "";
    }
    const auto last = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
    return std::string(first, last);
}

/**
 * @brief Parses common truthy boolean spellings.
 * @param value Input string view.
 * @return True for 1/true/yes/on (case-insensitive), false otherwise.
 */
inline bool parse_bool(std::string_view value)
{
    const std::string normalized = lower_copy(trim_copy(value));
    return normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on";
}

/**
 * @brief Splits one delimited line into fields.
 *
 * A field wrapped in double quotes may contain the delimiter; a doubled
 * quote inside a quoted field yields one literal quote. A trailing
 * carriage return is dropped.
 */
inline std::vector<std::string> split_delimited(std::string_view line, char delimiter)
{
    if (!line.empty() && line.back() == '\r')
    {
        line.remove_suffix(1);
    }

    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;
    for (std::size_t i = 0; i < line.size(); ++i)
    {
        const char c = line[i];
        if (in_quotes)
        {
            if (c == '"')
            {
                if (i + 1 < line.size() && line[i + 1] == '"')
                {
                    current.push_back('"');
                    ++i;
                }
                else
                {
                    in_quotes = false;
                }
            }
            else
            {
                current.push_back(c);
            }
        }
        else if (c == '"')
        {
            in_quotes = true;
        }
        else if (c == delimiter)
        {
            fields.push_back(current);
            current.clear();
        }
        else
        {
            current.push_back(c);
        }
    }
    fields.push_back(current);
    return fields;
}

/**
 * @brief Returns true when the line holds nothing but whitespace.
 */
inline bool is_blank(std::string_view line)
{
    return std::all_of(line.begin(), line.end(), [](unsigned char c) { return std::isspace(c) != 0; });
}

/**
 * @brief Parses an integer, surrounding whitespace allowed, full token required.
 */
inline bool try_parse_int(std::string_view value, long long& out)
{
    const std::string token = trim_copy(value);
    if (token.empty())
    {
        return false;
    }
    try
    {
        std::size_t consumed = 0;
        const long long parsed = std::stoll(token, &consumed);
        if (consumed != token.size())
        {
            return false;
        }
        out = parsed;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

/**
 * @brief Parses an integer that must fit in `int`.
 */
inline bool try_parse_int(std::string_view value, int& out)
{
    long long parsed = 0;
    if (!try_parse_int(value, parsed) ||
        parsed < static_cast<long long>(std::numeric_limits<int>::min()) ||
        parsed > static_cast<long long>(std::numeric_limits<int>::max()))
    {
        return false;
    }
    out = static_cast<int>(parsed);
    return true;
}

/**
 * @brief Parses a finite floating-point value, full token required.
 */
inline bool try_parse_double(std::string_view value, double& out)
{
    const std::string token = trim_copy(value);
    if (token.empty())
    {
        return false;
    }
    try
    {
        std::size_t consumed = 0;
        const double parsed = std::stod(token, &consumed);
        if (consumed != token.size() || !std::isfinite(parsed))
        {
            return false;
        }
        out = parsed;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

/**
 * @brief Joins values with a separator for log messages.
 */
inline std::string join(const std::vector<std::string>& values, std::string_view separator = ", ")
{
    std::string out;
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        if (i > 0)
        {
            out += separator;
        }
        out += values[i];
    }
    return out;
}

} // namespace strutil
} // namespace lcn
