#pragma once

#include <iosfwd>
#include <string>

/**
 * @file logging.hpp
 * @brief Logging collaborator handed to readers and normalizers.
 *
 * Normalizers report constraint mismatches, fallback paths, and summary
 * counts through a `Logger` supplied by the caller. The default
 * `StreamLogger` mirrors the console conventions of the runtime layer:
 * info/debug on stdout gated by profile, warnings/errors on stderr.
 */

namespace lcn
{

enum class LogProfile : int
{
    quiet = 0,
    normal = 1,
    debug = 2
};

/**
 * @brief Returns a string label for a log profile.
 * @param profile Log profile enum value.
 * @return Profile name string.
 */
const char* log_profile_name(LogProfile profile);

/**
 * @brief Parses a log profile string.
 * @param value Input profile string.
 * @param valid Optional parse-success output flag.
 * @return Parsed log profile, `normal` when unrecognized.
 */
LogProfile parse_log_profile(const std::string& value, bool* valid = nullptr);

class Logger
{
public:
    virtual ~Logger() = default;

    virtual void debug(const std::string& message) = 0;
    virtual void info(const std::string& message) = 0;
    virtual void warning(const std::string& message) = 0;
    virtual void error(const std::string& message) = 0;
};

class StreamLogger : public Logger
{
public:
    explicit StreamLogger(LogProfile profile = LogProfile::normal);
    StreamLogger(LogProfile profile, std::ostream& out, std::ostream& err);

    void debug(const std::string& message) override;
    void info(const std::string& message) override;
    void warning(const std::string& message) override;
    void error(const std::string& message) override;

    LogProfile profile() const { return profile_; }
    void set_profile(LogProfile profile) { profile_ = profile; }

private:
    bool at_least(LogProfile level) const
    {
        return static_cast<int>(profile_) >= static_cast<int>(level);
    }

    LogProfile profile_;
    std::ostream* out_;
    std::ostream* err_;
};

} // namespace lcn
