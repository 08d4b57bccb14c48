#pragma once
/**
 * @file lcal_base.hpp
 * @brief Layer 1: Basic modules built on lcal_platform.
 *
 * Provides format_tools, the ScopeGuard RAII helper and the Result<T, E> type used
 * for expected failures. Include this when you need formatting or basic RAII guards.
 */
#include "lcal_platform.hpp"

#include <chrono>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/result.hpp"
#include "utils/scope_guard.hpp"
