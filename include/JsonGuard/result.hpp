#pragma once

#include <functional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace JsonGuard {

template<class T>
struct Success {
    T value;
};
template<class T>
Success(T) -> Success<T>;

struct Failure {
    std::string message;
};

// Outcome of one decode: the typed value, or a finished error message.
template<class T>
class Result {
    std::variant<Success<T>, Failure> m_state;

public:
    using value_type = T;

    template<class U>
        requires std::is_constructible_v<T, U&&>
    constexpr Result(Success<U> s)
        : m_state(std::in_place_index<0>, Success<T>{T(std::move(s.value))})
    {}
    constexpr Result(Failure f)
        : m_state(std::in_place_index<1>, std::move(f))
    {}

    constexpr bool ok() const noexcept {
        return m_state.index() == 0;
    }
    constexpr explicit operator bool() const noexcept {
        return ok();
    }

    constexpr T & value() & {
        return std::get<0>(m_state).value;
    }
    constexpr const T & value() const & {
        return std::get<0>(m_state).value;
    }
    constexpr T && value() && {
        return std::move(std::get<0>(m_state).value);
    }

    constexpr const std::string & error() const {
        return std::get<1>(m_state).message;
    }

    template<class F>
    constexpr auto map(F && f) const & -> Result<std::remove_cvref_t<std::invoke_result_t<F, const T &>>> {
        using U = std::remove_cvref_t<std::invoke_result_t<F, const T &>>;
        if (ok()) return Success<U>{std::invoke(std::forward<F>(f), value())};
        return Failure{error()};
    }

    template<class F>
    constexpr auto map(F && f) && -> Result<std::remove_cvref_t<std::invoke_result_t<F, T &&>>> {
        using U = std::remove_cvref_t<std::invoke_result_t<F, T &&>>;
        if (ok()) return Success<U>{std::invoke(std::forward<F>(f), std::move(*this).value())};
        return Failure{std::move(std::get<1>(m_state).message)};
    }
};

} // namespace JsonGuard
