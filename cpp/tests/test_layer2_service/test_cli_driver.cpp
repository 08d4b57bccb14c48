/**
 * @file test_cli_driver.cpp
 * @brief In-process tests of the leapcal command line (parse_cli_args, resolve_config, run_cli).
 */
#include "lcal_service.hpp"
#include "shared_test_helpers.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

using namespace leapcal;
using namespace leapcal::tests::helper;
using leapcal::utils::Logger;
using nlohmann::json;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::StartsWith;

namespace
{

struct CliRun
{
    int exit_code;
    std::string out;
    std::string err;
};

std::vector<const char *> make_argv(const std::vector<std::string> &args)
{
    std::vector<const char *> argv{"/usr/bin/leapcal"};
    for (const auto &a : args)
        argv.push_back(a.c_str());
    return argv;
}

// Mirrors main(): parse, resolve config, run.
CliRun run(const std::vector<std::string> &args, const std::string &stdin_text = "")
{
    std::istringstream in(stdin_text);
    std::ostringstream out;
    std::ostringstream err;

    const auto argv = make_argv(args);
    const auto parsed = parse_cli_args(static_cast<int>(argv.size()), argv.data(), err);
    if (!parsed)
        return {kExitUsage, out.str(), err.str()};

    CliConfig config;
    try
    {
        config = resolve_config(*parsed);
    }
    catch (const std::runtime_error &e)
    {
        err << "Config error: " << e.what() << "\n";
        return {kExitUsage, out.str(), err.str()};
    }

    const int code = run_cli(*parsed, config, in, out, err);
    return {code, out.str(), err.str()};
}

} // namespace

/**
 * @class CliDriverTest
 * @brief Clears LEAPCAL_LOG_LEVEL so the caller's environment cannot leak into results.
 */
class CliDriverTest : public TempFileTest
{
  protected:
    ScopedEnvVar clear_env_{kLogLevelEnvVar, nullptr};
};

// ============================================================================
// Year Classification
// ============================================================================

TEST_F(CliDriverTest, ClassifiesPositionalYears)
{
    const auto r = run({"2000", "1900", "2024", "2023"});
    EXPECT_EQ(r.exit_code, kExitOk);
    EXPECT_EQ(r.out, "2000: leap year\n"
                     "1900: not a leap year\n"
                     "2024: leap year\n"
                     "2023: not a leap year\n");
    EXPECT_THAT(r.err, IsEmpty());
}

TEST_F(CliDriverTest, RejectedInputSetsExitCodeOne)
{
    const auto r = run({"2024", "abc", "1900"});
    EXPECT_EQ(r.exit_code, kExitRejected);
    EXPECT_EQ(r.out, "2024: leap year\n1900: not a leap year\n");
    EXPECT_EQ(r.err, "error: invalid year 'abc': InvalidArgument\n");
}

TEST_F(CliDriverTest, NegativeYears)
{
    const auto direct = run({"-4", "-100"});
    EXPECT_EQ(direct.exit_code, kExitOk);
    EXPECT_EQ(direct.out, "-4: leap year\n-100: not a leap year\n");

    const auto after_separator = run({"--", "-400", "-1"});
    EXPECT_EQ(after_separator.out, "-400: leap year\n-1: not a leap year\n");
}

TEST_F(CliDriverTest, YearsBeyondInt64AreClassified)
{
    const auto r = run({"1000000000000000000000000000000400", "1000000000000000000000000000000100"});
    EXPECT_EQ(r.exit_code, kExitOk);
    EXPECT_EQ(r.out, "1000000000000000000000000000000400: leap year\n"
                     "1000000000000000000000000000000100: not a leap year\n");
}

TEST_F(CliDriverTest, ReadsWhitespaceSeparatedTokensFromStdin)
{
    const auto r = run({}, "2000 1900\n\t2024\n\n");
    EXPECT_EQ(r.exit_code, kExitOk);
    EXPECT_EQ(r.out, "2000: leap year\n1900: not a leap year\n2024: leap year\n");
}

TEST_F(CliDriverTest, EmptyStdinIsNotAnError)
{
    const auto text = run({}, "");
    EXPECT_EQ(text.exit_code, kExitOk);
    EXPECT_THAT(text.out, IsEmpty());

    const auto as_json = run({"--json-output"}, "   \n");
    EXPECT_EQ(as_json.exit_code, kExitOk);
    EXPECT_EQ(as_json.out, "[]\n");
}

// ============================================================================
// JSON Input and Output
// ============================================================================

TEST_F(CliDriverTest, JsonOutput)
{
    const auto r = run({"--json-output", "2024", "x1900"});
    EXPECT_EQ(r.exit_code, kExitRejected);
    EXPECT_THAT(r.err, IsEmpty());

    const auto doc = json::parse(r.out);
    ASSERT_TRUE(doc.is_array());
    ASSERT_EQ(doc.size(), 2u);
    EXPECT_EQ(doc[0]["input"], "2024");
    EXPECT_EQ(doc[0]["leap"], true);
    EXPECT_EQ(doc[1]["input"], "x1900");
    EXPECT_EQ(doc[1]["error"], "InvalidArgument");
    EXPECT_FALSE(doc[1].contains("leap"));
}

TEST_F(CliDriverTest, JsonInputAcceptsOnlyIntegers)
{
    const auto r = run({"--json-input", "--json-output"},
                       "2024\n\"2024\"\n2024.5\nnull\n[]\n{}\nnot json\n\n-400\n");
    EXPECT_EQ(r.exit_code, kExitRejected);

    const auto doc = json::parse(r.out);
    ASSERT_EQ(doc.size(), 8u);
    EXPECT_EQ(doc[0]["leap"], true);
    for (std::size_t i = 1; i <= 6; ++i)
    {
        SCOPED_TRACE(doc[i].dump());
        EXPECT_EQ(doc[i]["error"], "InvalidArgument");
    }
    EXPECT_EQ(doc[6]["input"], "not json");
    EXPECT_EQ(doc[7]["input"], "-400");
    EXPECT_EQ(doc[7]["leap"], true);
}

TEST_F(CliDriverTest, JsonInputFromArguments)
{
    const auto r = run({"--json-input", "2000", "\"2000\""});
    EXPECT_EQ(r.exit_code, kExitRejected);
    EXPECT_EQ(r.out, "2000: leap year\n");
    EXPECT_EQ(r.err, "error: invalid year '\"2000\"': InvalidArgument\n");
}

TEST_F(CliDriverTest, JsonOutputSurvivesInvalidUtf8Input)
{
    const auto r = run({"--json-output", "2024", "\xff"});
    EXPECT_EQ(r.exit_code, kExitRejected);

    const auto doc = json::parse(r.out, nullptr, /*allow_exceptions=*/false);
    ASSERT_TRUE(doc.is_array()) << r.out;
    ASSERT_EQ(doc.size(), 2u);
    EXPECT_EQ(doc[0]["leap"], true);
    EXPECT_EQ(doc[1]["error"], "InvalidArgument");
    EXPECT_EQ(doc[1]["input"], "\xef\xbf\xbd"); // U+FFFD replacement character
}

TEST_F(CliDriverTest, JsonOutputSurvivesInvalidUtf8OnStdin)
{
    const auto r = run({"--json-output"}, "2024 \xff\xfe 1900\n");
    EXPECT_EQ(r.exit_code, kExitRejected);

    const auto doc = json::parse(r.out, nullptr, /*allow_exceptions=*/false);
    ASSERT_TRUE(doc.is_array()) << r.out;
    ASSERT_EQ(doc.size(), 3u);
    EXPECT_EQ(doc[1]["error"], "InvalidArgument");
    EXPECT_EQ(doc[2]["leap"], false);
}

TEST_F(CliDriverTest, JsonInputIntegersBeyondUint64AreClassified)
{
    // 10^20 and -(10^20 + 100) do not fit in 64 bits; nlohmann reads them as floats.
    const auto r = run({"--json-input"}, "100000000000000000000\n-100000000000000000100\n");
    EXPECT_EQ(r.exit_code, kExitOk);
    EXPECT_EQ(r.out, "100000000000000000000: leap year\n"
                     "-100000000000000000100: not a leap year\n");

    // Real floats stay rejected whatever their size.
    const auto floats = run({"--json-input"}, "1e20\n100000000000000000000.0\n");
    EXPECT_EQ(floats.exit_code, kExitRejected);
    EXPECT_THAT(floats.out, IsEmpty());
}

// ============================================================================
// Range Mode
// ============================================================================

TEST_F(CliDriverTest, RangeCountsLeapYears)
{
    const auto r = run({"--range", "1900", "2100"});
    EXPECT_EQ(r.exit_code, kExitOk);
    EXPECT_EQ(r.out, "leap years in [1900, 2100]: 49\n");
}

TEST_F(CliDriverTest, RangeAcceptsNegativeBounds)
{
    const auto r = run({"--range", "-400", "400"});
    EXPECT_EQ(r.exit_code, kExitOk);
    EXPECT_EQ(r.out, "leap years in [-400, 400]: 195\n");
}

TEST_F(CliDriverTest, RangeJsonOutput)
{
    const auto r = run({"--json-output", "--range", "1600", "1999"});
    EXPECT_EQ(r.exit_code, kExitOk);
    const auto doc = json::parse(r.out);
    EXPECT_EQ(doc["first"], 1600);
    EXPECT_EQ(doc["last"], 1999);
    EXPECT_EQ(doc["leap_years"], 97);
}

TEST_F(CliDriverTest, RangeUsageErrors)
{
    const auto reversed = run({"--range", "2100", "1900"});
    EXPECT_EQ(reversed.exit_code, kExitUsage);
    EXPECT_THAT(reversed.err, HasSubstr("is after range end"));
    EXPECT_THAT(reversed.out, IsEmpty());

    const auto malformed = run({"--range", "19x0", "2000"});
    EXPECT_EQ(malformed.exit_code, kExitUsage);
    EXPECT_THAT(malformed.err, HasSubstr("invalid range bound '19x0'"));

    const auto overflow = run({"--range", "0", "9223372036854775808"});
    EXPECT_EQ(overflow.exit_code, kExitUsage);

    const auto missing = run({"--range", "1900"});
    EXPECT_EQ(missing.exit_code, kExitUsage);
    EXPECT_THAT(missing.err, HasSubstr("--range requires <first> <last>"));

    const auto mixed = run({"--range", "1900", "2000", "2024"});
    EXPECT_EQ(mixed.exit_code, kExitUsage);
    EXPECT_THAT(mixed.err, HasSubstr("cannot be combined"));
}

// ============================================================================
// Argument Parsing
// ============================================================================

TEST_F(CliDriverTest, UnknownOptionPrintsUsage)
{
    const auto r = run({"--bogus"});
    EXPECT_EQ(r.exit_code, kExitUsage);
    EXPECT_THAT(r.err, HasSubstr("unknown option '--bogus'"));
    EXPECT_THAT(r.err, HasSubstr("Usage:"));
    EXPECT_THAT(r.err, HasSubstr("  leapcal [options] YEAR..."));
}

TEST_F(CliDriverTest, OptionsRequiringValues)
{
    EXPECT_EQ(run({"--config"}).exit_code, kExitUsage);
    EXPECT_EQ(run({"--log-file"}).exit_code, kExitUsage);
    EXPECT_EQ(run({"--log-level"}).exit_code, kExitUsage);

    const auto bad_level = run({"--log-level", "loud", "2024"});
    EXPECT_EQ(bad_level.exit_code, kExitUsage);
    EXPECT_THAT(bad_level.err, HasSubstr("unknown log level 'loud'"));
}

TEST_F(CliDriverTest, ParsesAllOptions)
{
    std::ostringstream err;
    const auto argv = make_argv({"--config", "c.json", "--json-input", "--json-output",
                                 "--log-level", "debug", "--log-file", "l.log", "2024", "-8"});
    const auto args = parse_cli_args(static_cast<int>(argv.size()), argv.data(), err);
    ASSERT_TRUE(args.has_value()) << err.str();

    EXPECT_EQ(args->program, "/usr/bin/leapcal");
    EXPECT_EQ(args->config_path, "c.json");
    EXPECT_EQ(args->input_mode, InputMode::Json);
    EXPECT_EQ(args->output_format, OutputFormat::Json);
    EXPECT_EQ(args->log_level, Logger::Level::L_DEBUG);
    EXPECT_EQ(args->log_file, std::string("l.log"));
    EXPECT_FALSE(args->range.has_value());
    EXPECT_THAT(args->years, ::testing::ElementsAre("2024", "-8"));
    EXPECT_THAT(err.str(), IsEmpty());
}

TEST_F(CliDriverTest, HelpAndVersion)
{
    const auto help = run({"--help"});
    EXPECT_EQ(help.exit_code, kExitOk);
    EXPECT_THAT(help.out, StartsWith("Usage:\n"));
    EXPECT_THAT(help.out, HasSubstr("--range <first> <last>"));
    EXPECT_THAT(help.out, HasSubstr(kLogLevelEnvVar));

    EXPECT_EQ(run({"-h"}).exit_code, kExitOk);

    const auto version = run({"--version"});
    EXPECT_EQ(version.exit_code, kExitOk);
    EXPECT_EQ(version.out, std::string("leapcal ") + platform::get_version_string() + "\n");
}

// ============================================================================
// Configuration Precedence
// ============================================================================

TEST_F(CliDriverTest, ConfigFileSelectsFormats)
{
    const auto path = GetUniqueTempPath("driver_config", ".json");
    ASSERT_TRUE(write_file_contents(path, R"({"output": {"format": "json"}, "input": {"mode": "json"}})"));

    const auto r = run({"--config", path.string(), "2024"});
    EXPECT_EQ(r.exit_code, kExitOk);
    const auto doc = json::parse(r.out);
    ASSERT_EQ(doc.size(), 1u);
    EXPECT_EQ(doc[0]["leap"], true);
}

TEST_F(CliDriverTest, PrecedenceDefaultsFileEnvFlags)
{
    const auto path = GetUniqueTempPath("precedence", ".json");
    ASSERT_TRUE(write_file_contents(path, R"({"logging": {"level": "error", "file": "from_file.log"}})"));

    std::ostringstream err;
    auto resolve = [&](const std::vector<std::string> &extra)
    {
        std::vector<std::string> all{"--config", path.string()};
        all.insert(all.end(), extra.begin(), extra.end());
        const auto argv = make_argv(all);
        const auto args = parse_cli_args(static_cast<int>(argv.size()), argv.data(), err);
        EXPECT_TRUE(args.has_value()) << err.str();
        return resolve_config(*args);
    };

    EXPECT_EQ(resolve({}).log_level, Logger::Level::L_ERROR);
    EXPECT_EQ(resolve({}).log_file, "from_file.log");
    {
        ScopedEnvVar env(kLogLevelEnvVar, "debug");
        EXPECT_EQ(resolve({}).log_level, Logger::Level::L_DEBUG);
        EXPECT_EQ(resolve({"--log-level", "trace"}).log_level, Logger::Level::L_TRACE);
        EXPECT_EQ(resolve({"--log-file", "flag.log"}).log_file, "flag.log");
    }
}

TEST_F(CliDriverTest, ConfigErrorsAreUsageErrors)
{
    const auto missing = run({"--config", GetUniqueTempPath("absent", ".json").string(), "2024"});
    EXPECT_EQ(missing.exit_code, kExitUsage);
    EXPECT_THAT(missing.err, HasSubstr("cannot open file"));
    EXPECT_THAT(missing.out, IsEmpty());

    ScopedEnvVar env(kLogLevelEnvVar, "chatty");
    const auto bad_env = run({"2024"});
    EXPECT_EQ(bad_env.exit_code, kExitUsage);
    EXPECT_THAT(bad_env.err, HasSubstr("chatty"));
}

// ============================================================================
// Logger Configuration
// ============================================================================

TEST_F(CliDriverTest, ConfigureLoggerAppliesLevelAndFile)
{
    auto &logger = Logger::instance();
    const auto saved_level = logger.level();
    const auto path = GetUniqueTempPath("configure_logger");

    CliConfig config;
    config.log_level = Logger::Level::L_DEBUG;
    config.log_file = path.string();
    configure_logger(config);

    EXPECT_EQ(logger.level(), Logger::Level::L_DEBUG);
    const auto r = run({"2024", "bad"});
    EXPECT_EQ(r.exit_code, kExitRejected);
    logger.flush();

    const std::string contents = read_file_contents(path);
    EXPECT_THAT(contents, HasSubstr("2024 -> true"));
    EXPECT_THAT(contents, HasSubstr("rejected input 'bad': InvalidArgument"));

    logger.set_console();
    logger.set_level(saved_level);
    logger.flush();
}
