#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * @file errors.hpp
 * @brief Exception taxonomy raised by readers and normalizers.
 *
 * Every fatal condition derives from `NormalizationError` so callers can
 * abort a whole normalization call with a single handler. Non-fatal
 * conditions are never thrown; they go to the logging collaborator.
 */

namespace lcn
{

class NormalizationError : public std::runtime_error
{
public:
    explicit NormalizationError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief A field expected to be numeric or integer could not be parsed.
 */
class ParseError : public NormalizationError
{
public:
    explicit ParseError(const std::string& message) : NormalizationError(message) {}
};

/**
 * @brief One or more required columns are absent from a table.
 */
class MissingFieldError : public NormalizationError
{
public:
    MissingFieldError(const std::string& message, std::vector<std::string> missing_fields)
        : NormalizationError(message + ": " + join_fields(missing_fields)),
          missing_fields_(std::move(missing_fields))
    {
    }

    const std::vector<std::string>& missing_fields() const { return missing_fields_; }

private:
    static std::string join_fields(const std::vector<std::string>& fields)
    {
        std::string out;
        for (const std::string& field : fields)
        {
            if (!out.empty())
            {
                out += ", ";
            }
            out += field;
        }
        return out;
    }

    std::vector<std::string> missing_fields_;
};

/**
 * @brief A key, usually a region name, has no entry in a reference mapping.
 */
class KeyLookupError : public NormalizationError
{
public:
    explicit KeyLookupError(const std::string& key, const std::string& reference = "region reference")
        : NormalizationError("'" + key + "' not found in " + reference), key_(key)
    {
    }

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

/**
 * @brief Unsupported or malformed configuration value.
 */
class ConfigError : public NormalizationError
{
public:
    explicit ConfigError(const std::string& message) : NormalizationError(message) {}
};

/**
 * @brief An input file could not be opened for reading.
 */
class FileAccessError : public NormalizationError
{
public:
    explicit FileAccessError(const std::string& path)
        : NormalizationError("Could not open input file: " + path), path_(path)
    {
    }

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace lcn
