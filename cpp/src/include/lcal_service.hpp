#pragma once
/**
 * @file lcal_service.hpp
 * @brief Layer 2: Service modules built on lcal_base.
 *
 * Provides the asynchronous Logger, the leap-year evaluator and its input
 * boundaries, the JSON-backed CLI configuration and the CLI driver.
 * Include this single header for the complete leapcal API.
 */
#include "lcal_base.hpp"

#include "utils/logger.hpp"
#include "utils/leap_year.hpp"
#include "utils/cli_config.hpp"
#include "utils/cli_driver.hpp"
