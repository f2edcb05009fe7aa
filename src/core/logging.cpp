/**
 * @file logging.cpp
 * @brief Console logger and log-profile parsing.
 */

#include "logging.hpp"
#include "string_utils.hpp"

#include <iostream>

namespace lcn
{

/**
 * @brief Returns string label for runtime logging profile.
 */
const char* log_profile_name(LogProfile profile)
{
    switch (profile)
    {
        case LogProfile::quiet:
            return "quiet";
        case LogProfile::debug:
            return "debug";
        case LogProfile::normal:
        default:
            return "normal";
    }
}

/**
 * @brief Parses logging profile text into enum representation.
 */
LogProfile parse_log_profile(const std::string& value, bool* valid)
{
    const std::string normalized = strutil::lower_copy(strutil::trim_copy(value));
    if (valid != nullptr)
    {
        *valid = true;
    }
    if (normalized == "quiet" || normalized == "0")
    {
        return LogProfile::quiet;
    }
    if (normalized == "normal" || normalized == "1")
    {
        return LogProfile::normal;
    }
    if (normalized == "debug" || normalized == "verbose" || normalized == "2")
    {
        return LogProfile::debug;
    }
    if (valid != nullptr)
    {
        *valid = false;
    }
    return LogProfile::normal;
}

StreamLogger::StreamLogger(LogProfile profile) : StreamLogger(profile, std::cout, std::cerr) {}

StreamLogger::StreamLogger(LogProfile profile, std::ostream& out, std::ostream& err)
    : profile_(profile), out_(&out), err_(&err)
{
}

void StreamLogger::debug(const std::string& message)
{
    if (at_least(LogProfile::debug))
    {
        *out_ << "[debug] " << message << std::endl;
    }
}

void StreamLogger::info(const std::string& message)
{
    if (at_least(LogProfile::normal))
    {
        *out_ << message << std::endl;
    }
}

void StreamLogger::warning(const std::string& message)
{
    if (at_least(LogProfile::normal))
    {
        *err_ << "Warning: " << message << std::endl;
    }
}

void StreamLogger::error(const std::string& message)
{
    *err_ << "Error: " << message << std::endl;
}

} // namespace lcn
