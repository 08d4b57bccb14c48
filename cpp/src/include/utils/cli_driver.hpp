#pragma once
/**
 * @file cli_driver.hpp
 * @brief Argument parsing and execution of the `leapcal` command-line tool.
 *
 * ## Usage
 *
 *     leapcal [options] YEAR...            # classify the given years
 *     leapcal [options] < years.txt        # classify whitespace-separated years from stdin
 *     leapcal --range <first> <last>       # count leap years in [first, last]
 *
 * ## Exit status
 *
 *     0  every input was classified
 *     1  at least one input was rejected as InvalidArgument
 *     2  usage or configuration error
 *
 * The driver writes only to the streams it is given, so it can run in-process
 * under test. Logger configuration is a separate step (configure_logger()).
 */
#include "leapcal_utils_export.h"
#include "utils/cli_config.hpp"

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace leapcal
{

inline constexpr int kExitOk = 0;
inline constexpr int kExitRejected = 1;
inline constexpr int kExitUsage = 2;

/**
 * @struct CliArgs
 * @brief Parsed command line. Unset optionals defer to the config file.
 */
struct CliArgs
{
    std::string program{"leapcal"};
    std::string config_path;
    std::optional<InputMode> input_mode;
    std::optional<OutputFormat> output_format;
    std::optional<utils::Logger::Level> log_level;
    std::optional<std::string> log_file;
    std::optional<std::pair<std::string, std::string>> range; ///< Raw bounds text
    bool show_help{false};
    bool show_version{false};
    std::vector<std::string> years;
};

/// Writes the usage text for @p program to @p out.
LEAPCAL_UTILS_EXPORT void print_usage(std::ostream &out, std::string_view program);

/**
 * @brief Parses the command line.
 *
 * Arguments that do not start with "--" are years; "--" ends option parsing so
 * that negative years can follow ("leapcal -- -400"). A single '-' followed by a
 * digit is also treated as a year.
 *
 * @return The parsed arguments, or std::nullopt after writing a diagnostic and the
 *         usage text to @p err.
 */
LEAPCAL_UTILS_EXPORT std::optional<CliArgs> parse_cli_args(int argc, const char *const argv[],
                                                           std::ostream &err);

/**
 * @brief Combines defaults, the config file, the environment and flags.
 * @throws std::runtime_error if the config file or the environment is invalid.
 */
LEAPCAL_UTILS_EXPORT CliConfig resolve_config(const CliArgs &args);

/// Applies level and sink settings to the global Logger.
LEAPCAL_UTILS_EXPORT void configure_logger(const CliConfig &config);

/**
 * @brief Runs the tool.
 *
 * In text input mode stdin is read as whitespace-separated tokens; in JSON input
 * mode as one JSON value per non-empty line.
 *
 * @return kExitOk, kExitRejected or kExitUsage.
 */
LEAPCAL_UTILS_EXPORT int run_cli(const CliArgs &args, const CliConfig &config, std::istream &in,
                                 std::ostream &out, std::ostream &err);

} // namespace leapcal
