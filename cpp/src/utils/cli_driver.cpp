/**
 * @file cli_driver.cpp
 * @brief The `leapcal` command line: argument parsing, evaluation and output.
 */
#include "lcal_service.hpp"

#include <istream>
#include <ostream>

#include <nlohmann/json.hpp>

namespace leapcal
{

namespace
{

using calendar::YearResult;

bool looks_like_negative_year(std::string_view arg)
{
    return arg.size() > 1 && arg[0] == '-' && arg[1] >= '0' && arg[1] <= '9';
}

std::optional<CliArgs> usage_error(std::ostream &err, std::string_view program,
                                   const std::string &message)
{
    err << "Error: " << message << "\n\n";
    print_usage(err, program);
    return std::nullopt;
}

// True for a JSON integer literal: optional '-', then digits only.
bool is_json_integer_literal(std::string_view token)
{
    if (!token.empty() && token.front() == '-')
        token.remove_prefix(1);
    if (token.empty())
        return false;
    for (const char c : token)
    {
        if (c < '0' || c > '9')
            return false;
    }
    return true;
}

YearResult<bool> evaluate_token(const std::string &token, InputMode mode)
{
    if (mode == InputMode::Json)
    {
        // A token that is not valid JSON parses to a discarded value, which
        // evaluate() rejects like any other non-integer.
        const auto value = nlohmann::json::parse(token, nullptr, /*allow_exceptions=*/false);
        // nlohmann stores integer literals beyond UINT64_MAX as number_float.
        if (value.is_number_float() && is_json_integer_literal(token))
            return calendar::evaluate_text(token);
        return calendar::evaluate(value);
    }
    return calendar::evaluate_text(token);
}

std::vector<std::string> read_tokens(std::istream &in, InputMode mode)
{
    std::vector<std::string> tokens;
    if (mode == InputMode::Json)
    {
        std::string line;
        while (std::getline(in, line))
        {
            const auto trimmed = format_tools::trim(line);
            if (!trimmed.empty())
                tokens.emplace_back(trimmed);
        }
    }
    else
    {
        std::string token;
        while (in >> token)
            tokens.push_back(std::move(token));
    }
    return tokens;
}

int run_range(const CliArgs &args, const CliConfig &config, std::ostream &out,
              std::ostream &err)
{
    const auto &[first_text, last_text] = *args.range;
    auto first = calendar::parse_year(first_text);
    auto last = calendar::parse_year(last_text);
    if (first.is_error() || last.is_error())
    {
        const auto &bad = first.is_error() ? first_text : last_text;
        err << "Error: invalid range bound '" << bad << "'\n";
        return kExitUsage;
    }
    if (first.content() > last.content())
    {
        err << "Error: range start " << first.content() << " is after range end "
            << last.content() << "\n";
        return kExitUsage;
    }

    const auto count = calendar::count_leap_years(first.content(), last.content());
    LOGGER_DEBUG("range [{}, {}] holds {} leap years", first.content(), last.content(), count);

    if (config.output_format == OutputFormat::Json)
    {
        nlohmann::json doc = {{"first", first.content()},
                              {"last", last.content()},
                              {"leap_years", count}};
        out << doc.dump() << '\n';
    }
    else
    {
        out << fmt::format("leap years in [{}, {}]: {}\n", first.content(), last.content(), count);
    }
    return kExitOk;
}

} // namespace

void print_usage(std::ostream &out, std::string_view program)
{
    const auto name = format_tools::filename_only(program);
    out << "Usage:\n"
        << "  " << name << " [options] YEAR...\n"
        << "  " << name << " [options] < years.txt\n"
        << "  " << name << " [options] --range <first> <last>\n\n"
        << "Options:\n"
        << "  --config <path.json>   Load settings from a JSON config file\n"
        << "  --json-input           Treat each input as a JSON value (one per line on stdin)\n"
        << "  --json-output          Print results as a JSON document\n"
        << "  --log-level <lvl>      trace, debug, info, warn, error or system\n"
        << "  --log-file <path>      Append log output to <path> instead of stderr\n"
        << "  --range <first> <last> Count the leap years in [first, last]\n"
        << "  --version              Print the version and exit\n"
        << "  --help, -h             Show this message\n"
        << "  --                     End of options; negative years may follow\n\n"
        << "Environment:\n"
        << "  " << kLogLevelEnvVar << "      Overrides logging.level from the config file\n\n"
        << "Exit status: 0 all inputs classified, 1 some input rejected, 2 usage error\n";
}

std::optional<CliArgs> parse_cli_args(int argc, const char *const argv[], std::ostream &err)
{
    CliArgs args;
    if (argc > 0 && argv[0] != nullptr)
        args.program = argv[0];

    bool options_done = false;
    for (int i = 1; i < argc; ++i)
    {
        const std::string_view arg = argv[i];

        if (options_done || looks_like_negative_year(arg) || arg.empty() || arg[0] != '-')
        {
            args.years.emplace_back(arg);
            continue;
        }

        const auto next_value = [&]() -> std::optional<std::string>
        {
            if (i + 1 >= argc)
                return std::nullopt;
            return std::string(argv[++i]);
        };

        if (arg == "--")
        {
            options_done = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            args.show_help = true;
        }
        else if (arg == "--version")
        {
            args.show_version = true;
        }
        else if (arg == "--json-input")
        {
            args.input_mode = InputMode::Json;
        }
        else if (arg == "--json-output")
        {
            args.output_format = OutputFormat::Json;
        }
        else if (arg == "--config")
        {
            auto value = next_value();
            if (!value)
                return usage_error(err, args.program, "--config requires a path");
            args.config_path = std::move(*value);
        }
        else if (arg == "--log-file")
        {
            auto value = next_value();
            if (!value)
                return usage_error(err, args.program, "--log-file requires a path");
            args.log_file = std::move(*value);
        }
        else if (arg == "--log-level")
        {
            auto value = next_value();
            if (!value)
                return usage_error(err, args.program, "--log-level requires a level");
            const auto level = utils::parse_level(*value);
            if (!level)
                return usage_error(err, args.program,
                                   fmt::format("unknown log level '{}'", *value));
            args.log_level = *level;
        }
        else if (arg == "--range")
        {
            if (i + 2 >= argc)
                return usage_error(err, args.program, "--range requires <first> <last>");
            args.range.emplace(argv[i + 1], argv[i + 2]);
            i += 2;
        }
        else
        {
            return usage_error(err, args.program, fmt::format("unknown option '{}'", arg));
        }
    }

    if (args.range && !args.years.empty())
        return usage_error(err, args.program, "--range cannot be combined with YEAR arguments");

    return args;
}

CliConfig resolve_config(const CliArgs &args)
{
    CliConfig config = args.config_path.empty() ? CliConfig{}
                                                : CliConfig::from_json_file(args.config_path);
    config.apply_env_overrides();

    if (args.log_level)
        config.log_level = *args.log_level;
    if (args.log_file)
        config.log_file = *args.log_file;
    if (args.input_mode)
        config.input_mode = *args.input_mode;
    if (args.output_format)
        config.output_format = *args.output_format;
    return config;
}

void configure_logger(const CliConfig &config)
{
    auto &logger = utils::Logger::instance();
    logger.set_level(config.log_level);
    if (!config.log_file.empty())
        logger.set_logfile(config.log_file, config.log_flock);
}

int run_cli(const CliArgs &args, const CliConfig &config, std::istream &in, std::ostream &out,
            std::ostream &err)
{
    if (args.show_help)
    {
        print_usage(out, args.program);
        return kExitOk;
    }
    if (args.show_version)
    {
        out << "leapcal " << platform::get_version_string() << '\n';
        return kExitOk;
    }
    if (args.range)
        return run_range(args, config, out, err);

    const auto tokens =
        args.years.empty() ? read_tokens(in, config.input_mode) : args.years;
    LOGGER_DEBUG("evaluating {} input(s) in {} mode", tokens.size(), to_string(config.input_mode));

    const bool json_output = config.output_format == OutputFormat::Json;
    auto results = nlohmann::json::array();
    std::size_t rejected = 0;

    for (const auto &token : tokens)
    {
        const auto verdict = evaluate_token(token, config.input_mode);
        if (verdict.is_error())
        {
            ++rejected;
            const char *reason = calendar::to_string(verdict.error());
            LOGGER_WARN("rejected input '{}': {} (code {})", token, reason, verdict.error_code());
            if (json_output)
                results.push_back({{"input", token}, {"error", reason}});
            else
                err << "error: invalid year '" << token << "': " << reason << '\n';
            continue;
        }

        const bool leap = verdict.content();
        LOGGER_DEBUG("{} -> {}", token, leap);
        if (json_output)
            results.push_back({{"input", token}, {"leap", leap}});
        else
            out << token << ": " << (leap ? "leap year" : "not a leap year") << '\n';
    }

    // Rejected tokens are echoed verbatim and may hold invalid UTF-8.
    if (json_output)
        out << results.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << '\n';

    if (rejected != 0)
    {
        LOGGER_INFO("{} of {} input(s) rejected", rejected, tokens.size());
        return kExitRejected;
    }
    return kExitOk;
}

} // namespace leapcal
