#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

#include "logging.hpp"

/**
 * @file normalize_runtime.hpp
 * @brief Command-line entry point for a full normalization run.
 *
 * The `landcover_normalize` executable forwards its arguments here so the
 * same path can be driven from tests with captured streams.
 */

namespace lcn
{

struct NormalizeRunOptions
{
    std::string config_path;
    std::optional<LogProfile> log_override;
};

enum class ParseArgsResult
{
    Ok,
    Help,
    Error,
};

/// Exit statuses returned by `run_normalize_command`.
namespace exit_status
{
constexpr int ok = 0;
constexpr int normalization_failed = 1;
constexpr int bad_arguments = 2;
} // namespace exit_status

/**
 * @brief Parses `--config` and `--log` (argument 0 is the program name).
 * @param err Receives diagnostics for bad arguments.
 */
ParseArgsResult parse_normalize_args(const std::vector<std::string>& args,
                                     NormalizeRunOptions& options,
                                     std::ostream& out,
                                     std::ostream& err);

/**
 * @brief Loads the run config, normalizes projection and base layer, and
 *        writes two `[landcover-normalize]` summary lines to `out`.
 * @return `exit_status::ok`, or `exit_status::normalization_failed` when a
 *         NormalizationError is raised (the message is logged as an error).
 */
int run_normalization(const NormalizeRunOptions& options, std::ostream& out, std::ostream& err);

/**
 * @brief Parses arguments and runs; bad arguments yield `exit_status::bad_arguments`.
 */
int run_normalize_command(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

} // namespace lcn
