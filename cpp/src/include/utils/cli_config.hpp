#pragma once
/**
 * @file cli_config.hpp
 * @brief Configuration of the `leapcal` command-line tool, loaded from JSON.
 *
 * ## JSON format
 *
 * @code{.json}
 * {
 *   "logging": { "level": "info", "file": "/tmp/leapcal.log", "flock": false },
 *   "output":  { "format": "text" },
 *   "input":   { "mode": "text" }
 * }
 * @endcode
 *
 * Every section and key is optional; absent keys keep their defaults.
 *
 * ## Priority (low -> high)
 *
 *  1. Built-in defaults
 *  2. `--config <path.json>`
 *  3. `LEAPCAL_LOG_LEVEL` environment variable (see apply_env_overrides())
 *  4. Command-line flags
 */
#include "leapcal_utils_export.h"
#include "utils/logger.hpp"

#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

namespace leapcal
{

/// How verdicts are written to stdout.
enum class OutputFormat
{
    Text, ///< "2024: leap year"
    Json  ///< One JSON array of {"input", "leap" | "error"} objects
};

/// How input tokens are interpreted.
enum class InputMode
{
    Text, ///< Decimal integer text, any length
    Json  ///< One JSON value per token; only JSON integers are years
};

/// Environment variable that overrides `logging.level`.
inline constexpr const char *kLogLevelEnvVar = "LEAPCAL_LOG_LEVEL";

/**
 * @struct CliConfig
 * @brief Settings of the leapcal tool.
 */
struct LEAPCAL_UTILS_EXPORT CliConfig
{
    utils::Logger::Level log_level{utils::Logger::Level::L_WARNING};
    std::string log_file;  ///< Empty: log to the console
    bool log_flock{false}; ///< Advisory lock around each file write
    OutputFormat output_format{OutputFormat::Text};
    InputMode input_mode{InputMode::Text};

    /**
     * @brief Builds a config from an already parsed JSON document.
     * @param origin Name used in error messages (usually the file path).
     * @throws std::runtime_error if the root or a section is not an object, a key
     *         has the wrong type, or a level, format or mode name is unknown.
     */
    static CliConfig from_json(const nlohmann::json &j, std::string_view origin);

    /**
     * @brief Loads and validates a JSON config file.
     * @throws std::runtime_error on file-not-found, parse error, or invalid content.
     */
    static CliConfig from_json_file(const std::string &path);

    /**
     * @brief Applies `LEAPCAL_LOG_LEVEL` if it is set and non-empty.
     * @throws std::runtime_error if the variable names an unknown level.
     */
    void apply_env_overrides();
};

LEAPCAL_UTILS_EXPORT const char *to_string(OutputFormat format) noexcept;
LEAPCAL_UTILS_EXPORT const char *to_string(InputMode mode) noexcept;

} // namespace leapcal
