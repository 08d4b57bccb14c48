/**
 * @file leap_year.cpp
 * @brief Input boundaries and interval counting for the leap-year evaluator.
 */
#include "lcal_service.hpp"

#include <charconv>
#include <system_error>

#include <nlohmann/json.hpp>

namespace leapcal::calendar
{

namespace
{

// Same rule set as is_leap_year(), for JSON integers above INT64_MAX.
constexpr bool is_leap_year_unsigned(std::uint64_t year) noexcept
{
    if (year % 400 == 0)
    {
        return true;
    }
    if (year % 100 == 0)
    {
        return false;
    }
    return year % 4 == 0;
}

// Division rounding toward negative infinity.
constexpr Year floor_div(Year a, Year b) noexcept
{
    Year q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0)))
    {
        --q;
    }
    return q;
}

// Leap years in (0, y] for y > 0, minus those in (y, 0] for y < 0.
// leaps_through(y) - leaps_through(y - 1) == is_leap_year(y) for every y.
constexpr std::int64_t leaps_through(Year y) noexcept
{
    return floor_div(y, 4) - floor_div(y, 100) + floor_div(y, 400);
}

static_assert(leaps_through(400) - leaps_through(0) == leap_years_per_cycle);
static_assert(leaps_through(-1) - leaps_through(-401) == leap_years_per_cycle);

// Splits "  -0042 " into sign and digit run; false when the text is not a decimal integer.
bool split_decimal(std::string_view text, bool &negative, std::string_view &digits) noexcept
{
    std::string_view body = format_tools::trim(text);
    negative = false;
    if (!body.empty() && (body.front() == '+' || body.front() == '-'))
    {
        negative = body.front() == '-';
        body.remove_prefix(1);
    }
    if (body.empty())
    {
        return false;
    }
    for (const char c : body)
    {
        if (c < '0' || c > '9')
        {
            return false;
        }
    }
    digits = body;
    return true;
}

} // namespace

const char *to_string(CalendarError err) noexcept
{
    switch (err)
    {
    case CalendarError::InvalidArgument:
        return "InvalidArgument";
    default:
        return "Unknown";
    }
}

YearResult<bool> evaluate(const nlohmann::json &value)
{
    switch (value.type())
    {
    case nlohmann::json::value_t::number_integer:
        return YearResult<bool>::ok(is_leap_year(value.get<Year>()));
    case nlohmann::json::value_t::number_unsigned:
        return YearResult<bool>::ok(is_leap_year_unsigned(value.get<std::uint64_t>()));
    default:
        // string, number_float, boolean, null, array, object, binary, discarded
        return YearResult<bool>::error(CalendarError::InvalidArgument,
                                       static_cast<int>(value.type()));
    }
}

YearResult<bool> evaluate_text(std::string_view text)
{
    bool negative = false;
    std::string_view digits;
    if (!split_decimal(text, negative, digits))
    {
        return YearResult<bool>::error(CalendarError::InvalidArgument);
    }

    // 4, 100 and 400 all divide 400, so the residue decides every rule. The sign
    // cannot change divisibility and is ignored.
    Year residue = 0;
    for (const char c : digits)
    {
        residue = (residue * 10 + (c - '0')) % cycle_length;
    }
    return YearResult<bool>::ok(is_leap_year(residue));
}

YearResult<Year> parse_year(std::string_view text)
{
    bool negative = false;
    std::string_view digits;
    if (!split_decimal(text, negative, digits))
    {
        return YearResult<Year>::error(CalendarError::InvalidArgument);
    }

    // Parse the magnitude unsigned so that INT64_MIN is reachable.
    std::uint64_t magnitude = 0;
    const auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), magnitude);
    if (ec != std::errc{} || ptr != digits.data() + digits.size())
    {
        return YearResult<Year>::error(CalendarError::InvalidArgument);
    }

    constexpr auto kMaxPositive = static_cast<std::uint64_t>(INT64_MAX);
    if (!negative)
    {
        if (magnitude > kMaxPositive)
        {
            return YearResult<Year>::error(CalendarError::InvalidArgument);
        }
        return YearResult<Year>::ok(static_cast<Year>(magnitude));
    }
    if (magnitude > kMaxPositive + 1)
    {
        return YearResult<Year>::error(CalendarError::InvalidArgument);
    }
    if (magnitude == kMaxPositive + 1)
    {
        return YearResult<Year>::ok(INT64_MIN);
    }
    return YearResult<Year>::ok(-static_cast<Year>(magnitude));
}

std::int64_t count_leap_years(Year first, Year last) noexcept
{
    if (first > last)
    {
        return 0;
    }
    // first - 1 would overflow at INT64_MIN; back out first's own contribution instead.
    const std::int64_t before_first = leaps_through(first) - (is_leap_year(first) ? 1 : 0);
    return leaps_through(last) - before_first;
}

} // namespace leapcal::calendar
