/**
 * @file leapcal_main.cpp
 * @brief Entry point of the `leapcal` command-line tool.
 *
 * See utils/cli_driver.hpp for usage and exit status.
 */
#include "lcal_service.hpp"

#include <iostream>

int main(int argc, char *argv[])
{
    // ── Logger is drained on every exit path ─────────────────────────────────
    auto logger_guard =
        leapcal::basics::make_scope_guard([] { leapcal::utils::Logger::instance().shutdown(); });

    // ── Parse arguments ───────────────────────────────────────────────────────
    const auto args = leapcal::parse_cli_args(argc, argv, std::cerr);
    if (!args)
        return leapcal::kExitUsage;

    // ── Load config ───────────────────────────────────────────────────────────
    leapcal::CliConfig config;
    try
    {
        config = leapcal::resolve_config(*args);
    }
    catch (const std::exception &e)
    {
        std::cerr << "Config error: " << e.what() << "\n";
        return leapcal::kExitUsage;
    }

    leapcal::configure_logger(config);
    LOGGER_DEBUG("leapcal {} starting (input={}, output={})",
                 leapcal::platform::get_version_string(), leapcal::to_string(config.input_mode),
                 leapcal::to_string(config.output_format));

    return leapcal::run_cli(*args, config, std::cin, std::cout, std::cerr);
}
