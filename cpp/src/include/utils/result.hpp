#pragma once
/**
 * @file result.hpp
 * @brief Value-or-error return type for expected failures.
 *
 * The calendar boundaries return `Result<bool, CalendarError>` (see YearResult in
 * leap_year.hpp): a verdict when the input is an integer year, otherwise the error
 * enum plus a small integer detail (the JSON type tag for `evaluate`).
 *
 * @code
 * auto r = leapcal::calendar::evaluate_text(token);
 * if (r.is_error())
 *     return report(r.error(), r.error_code());
 * use(r.content());
 * @endcode
 *
 * Move-only and `[[nodiscard]]`; asking for the wrong side throws std::logic_error.
 */
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace leapcal
{

template <typename T, typename E>
class [[nodiscard]] Result
{
    static_assert(std::is_enum_v<E>, "Result error type must be an enum");

  public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value)
    {
        Result r;
        r.m_data.template emplace<T>(std::move(value));
        return r;
    }

    /// @param code Optional detail for diagnostics; 0 when unused.
    [[nodiscard]] static Result error(E err, int code = 0)
    {
        Result r;
        r.m_data.template emplace<Failure>(Failure{err, code});
        return r;
    }

    /// A default-constructed Result holds the error `E{}`.
    Result() : m_data(Failure{E{}, 0}) {}

    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return m_data.index() == 0; }
    [[nodiscard]] bool is_error() const noexcept { return m_data.index() == 1; }

    // --- Success side ---

    [[nodiscard]] T &content() &
    {
        require_ok("content");
        return std::get<0>(m_data);
    }

    [[nodiscard]] const T &content() const &
    {
        require_ok("content");
        return std::get<0>(m_data);
    }

    [[nodiscard]] T &&content() &&
    {
        require_ok("content");
        return std::get<0>(std::move(m_data));
    }

    [[nodiscard]] T value_or(T fallback) const &
    {
        return is_ok() ? std::get<0>(m_data) : std::move(fallback);
    }

    // --- Error side ---

    [[nodiscard]] E error() const
    {
        require_error("error");
        return std::get<1>(m_data).kind;
    }

    [[nodiscard]] int error_code() const
    {
        require_error("error_code");
        return std::get<1>(m_data).code;
    }

  private:
    struct Failure
    {
        E kind;
        int code;
    };

    void require_ok(const char *accessor) const
    {
        if (!is_ok())
            throw std::logic_error(std::string("Result::") + accessor + "() on an error result");
    }

    void require_error(const char *accessor) const
    {
        if (!is_error())
            throw std::logic_error(std::string("Result::") + accessor + "() on a success result");
    }

    std::variant<T, Failure> m_data;
};

} // namespace leapcal
