#pragma once
/**
 * @file leap_year.hpp
 * @brief Gregorian leap-year classification.
 *
 * The core rule is a `constexpr` function over a statically typed `Year`, so the
 * compiler rejects non-integer arguments and no runtime type check is needed there.
 * Values that arrive untyped (JSON documents, command-line text) go through the
 * `evaluate*` boundaries, which report a non-integer input as
 * `CalendarError::InvalidArgument` before any arithmetic is done.
 *
 * ## Sign handling
 *
 * C++ `%` truncates toward zero, so `year % 400` carries the sign of `year`
 * (`-1 % 4 == -1`). The rules only ever compare a remainder with `== 0`, and zero
 * has no sign, so negative years classify exactly like their absolute value:
 * `-400` is a leap year, `-100` is not.
 *
 * All functions are pure and hold no state; they may be called concurrently from
 * any number of threads.
 */
#include "leapcal_utils_export.h"
#include "utils/result.hpp"

#include <cstdint>
#include <string_view>
#include <type_traits>

#include <nlohmann/json_fwd.hpp>

namespace leapcal::calendar
{

/// A calendar year. Every representable value is a valid year.
using Year = std::int64_t;

/// The single failure kind of the evaluator.
enum class CalendarError
{
    InvalidArgument ///< The supplied value is not an integer year.
};

/// Result type of the untyped evaluation boundaries.
template <typename T>
using YearResult = Result<T, CalendarError>;

/// Length of one full Gregorian cycle, in years.
inline constexpr Year cycle_length = 400;

/// Number of leap years in any window of `cycle_length` consecutive years.
inline constexpr std::int64_t leap_years_per_cycle = 97;

/**
 * @brief Convert CalendarError to string for logging/diagnostics
 */
LEAPCAL_UTILS_EXPORT const char *to_string(CalendarError err) noexcept;

/**
 * @brief Returns whether @p year is a Gregorian leap year.
 *
 * Rules are applied in order and the first match wins:
 *  1. divisible by 400 -> leap
 *  2. divisible by 100 -> common
 *  3. divisible by 4   -> leap
 *  4. otherwise        -> common
 */
constexpr bool is_leap_year(Year year) noexcept
{
    if (year % 400 == 0)
    {
        return true;
    }
    if (year % 100 == 0)
    {
        return false;
    }
    if (year % 4 == 0)
    {
        return true;
    }
    return false;
}

static_assert(std::is_same_v<decltype(is_leap_year(Year{})), bool>);
static_assert(is_leap_year(2000) && !is_leap_year(1900) && is_leap_year(2024) && !is_leap_year(2023));
static_assert(is_leap_year(-400) && !is_leap_year(-100) && is_leap_year(-4) && !is_leap_year(-1));

/**
 * @brief Classifies a year supplied as an untyped JSON value.
 *
 * Only JSON integers are years. Signed and unsigned integers are both accepted;
 * unsigned values above `INT64_MAX` are classified with unsigned arithmetic.
 * Strings (even "2024"), floating-point numbers (even 2024.0), booleans, null,
 * arrays, objects and binary values yield `CalendarError::InvalidArgument`.
 */
LEAPCAL_UTILS_EXPORT YearResult<bool> evaluate(const nlohmann::json &value);

/**
 * @brief Classifies a year written as decimal text.
 *
 * Accepts optional surrounding whitespace, an optional leading '+' or '-', and one
 * or more ASCII digits. The number is reduced modulo 400 digit by digit, so text of
 * any length is classified without overflow.
 *
 * @return The verdict, or `CalendarError::InvalidArgument` for anything that is not
 *         a decimal integer ("", "+", "2024.5", "1e3", "0x7E8", "20 24", "abc").
 */
LEAPCAL_UTILS_EXPORT YearResult<bool> evaluate_text(std::string_view text);

/**
 * @brief Parses decimal text into a `Year`.
 *
 * Same grammar as evaluate_text(), additionally limited to the range of `Year`.
 * @return The parsed year, or `CalendarError::InvalidArgument` when the text is
 *         malformed or out of range.
 */
LEAPCAL_UTILS_EXPORT YearResult<Year> parse_year(std::string_view text);

/**
 * @brief Counts the leap years in the closed interval [first, last].
 *
 * Computed in constant time; exact for negative years and for the full range of
 * `Year`, including both extremes.
 * @return Number of leap years, or 0 if `first > last`.
 */
LEAPCAL_UTILS_EXPORT std::int64_t count_leap_years(Year first, Year last) noexcept;

} // namespace leapcal::calendar
