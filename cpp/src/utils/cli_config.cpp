/**
 * @file cli_config.cpp
 * @brief CliConfig JSON parsing.
 */
#include "lcal_service.hpp"

#include <cstdlib>
#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

namespace leapcal
{

namespace
{

[[noreturn]] void fail(std::string_view origin, const std::string &what)
{
    throw std::runtime_error(fmt::format("leapcal config '{}': {}", origin, what));
}

// Returns j[section] as an object, or nullptr if the section is absent.
const nlohmann::json *find_section(const nlohmann::json &j, const char *section,
                                   std::string_view origin)
{
    const auto it = j.find(section);
    if (it == j.end())
        return nullptr;
    if (!it->is_object())
        fail(origin, fmt::format("section '{}' must be a JSON object", section));
    return &*it;
}

std::string get_string(const nlohmann::json &section, const char *key, std::string fallback,
                       std::string_view origin)
{
    const auto it = section.find(key);
    if (it == section.end())
        return fallback;
    if (!it->is_string())
        fail(origin, fmt::format("'{}' must be a string", key));
    return it->get<std::string>();
}

bool get_bool(const nlohmann::json &section, const char *key, bool fallback,
              std::string_view origin)
{
    const auto it = section.find(key);
    if (it == section.end())
        return fallback;
    if (!it->is_boolean())
        fail(origin, fmt::format("'{}' must be a boolean", key));
    return it->get<bool>();
}

utils::Logger::Level parse_level_or_throw(const std::string &s, std::string_view origin)
{
    if (auto lvl = utils::parse_level(s))
        return *lvl;
    fail(origin, fmt::format("invalid log level '{}' (must be 'trace', 'debug', 'info', "
                             "'warn', 'error' or 'system')",
                             s));
}

OutputFormat parse_output_format(const std::string &s, std::string_view origin)
{
    if (s == "text") return OutputFormat::Text;
    if (s == "json") return OutputFormat::Json;
    fail(origin, fmt::format("invalid output format '{}' (must be 'text' or 'json')", s));
}

InputMode parse_input_mode(const std::string &s, std::string_view origin)
{
    if (s == "text") return InputMode::Text;
    if (s == "json") return InputMode::Json;
    fail(origin, fmt::format("invalid input mode '{}' (must be 'text' or 'json')", s));
}

} // namespace

CliConfig CliConfig::from_json(const nlohmann::json &j, std::string_view origin)
{
    if (!j.is_object())
        fail(origin, "root must be a JSON object");

    CliConfig cfg;

    if (const auto *logging = find_section(j, "logging", origin))
    {
        cfg.log_level =
            parse_level_or_throw(get_string(*logging, "level", "warn", origin), origin);
        cfg.log_file = get_string(*logging, "file", std::string{}, origin);
        cfg.log_flock = get_bool(*logging, "flock", false, origin);
    }

    if (const auto *output = find_section(j, "output", origin))
    {
        cfg.output_format =
            parse_output_format(get_string(*output, "format", "text", origin), origin);
    }

    if (const auto *input = find_section(j, "input", origin))
    {
        cfg.input_mode = parse_input_mode(get_string(*input, "mode", "text", origin), origin);
    }

    return cfg;
}

CliConfig CliConfig::from_json_file(const std::string &path)
{
    std::ifstream f(path);
    if (!f.is_open())
        fail(path, "cannot open file");

    nlohmann::json j;
    try
    {
        j = nlohmann::json::parse(f);
    }
    catch (const nlohmann::json::parse_error &e)
    {
        fail(path, fmt::format("JSON parse error: {}", e.what()));
    }
    return from_json(j, path);
}

void CliConfig::apply_env_overrides()
{
    const char *value = std::getenv(kLogLevelEnvVar);
    if (value == nullptr || *value == '\0')
        return;
    log_level = parse_level_or_throw(value, kLogLevelEnvVar);
}

const char *to_string(OutputFormat format) noexcept
{
    switch (format)
    {
    case OutputFormat::Text: return "text";
    case OutputFormat::Json: return "json";
    default: return "unknown";
    }
}

const char *to_string(InputMode mode) noexcept
{
    switch (mode)
    {
    case InputMode::Text: return "text";
    case InputMode::Json: return "json";
    default: return "unknown";
    }
}

} // namespace leapcal
