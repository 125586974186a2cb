#pragma once

#include <string>
#include <type_traits>
#include <utility>

#include "decoder.hpp"
#include "errors.hpp"
#include "value.hpp"

namespace JsonGuard {

namespace exact_detail {

template<class T>
using stored_t = std::conditional_t<std::is_convertible_v<std::decay_t<T>, const char *>, std::string, std::decay_t<T>>;

template<class T>
concept Scalar =
    std::is_same_v<T, Null> || std::is_same_v<T, Undefined> ||
    std::is_same_v<T, std::string> || std::is_arithmetic_v<T>;

} // namespace exact_detail

template<class T>
Decoder<exact_detail::stored_t<T>> is_null(T default_value) {
    using S = exact_detail::stored_t<T>;
    return Decoder<S>([value = S(std::move(default_value))](const Value & json) -> Result<S> {
        if (json.is_null()) return Success<S>{value};
        return Failure{errors::null(json)};
    });
}

template<class T>
Decoder<exact_detail::stored_t<T>> is_undefined(T default_value) {
    using S = exact_detail::stored_t<T>;
    return Decoder<S>([value = S(std::move(default_value))](const Value & json) -> Result<S> {
        if (json.is_undefined()) return Success<S>{value};
        return Failure{errors::undefined(json)};
    });
}

// Succeeds with `expected` only when the input is the same scalar; 1 and "1"
// are different.
template<class T>
    requires exact_detail::Scalar<exact_detail::stored_t<T>>
Decoder<exact_detail::stored_t<T>> is_exactly(T expected) {
    using S = exact_detail::stored_t<T>;
    S stored(std::move(expected));
    Value expected_json = to_value(stored);
    return Decoder<S>([stored = std::move(stored), expected_json = std::move(expected_json)]
                      (const Value & json) -> Result<S> {
        if (json == expected_json) return Success<S>{stored};
        return Failure{errors::exactly(json, expected_json)};
    });
}

template<class T>
Decoder<exact_detail::stored_t<T>> constant(T value) {
    using S = exact_detail::stored_t<T>;
    return Decoder<S>([value = S(std::move(value))](const Value &) -> Result<S> {
        return Success<S>{value};
    });
}

// Passes the input through untouched.
inline Decoder<Value> succeed() {
    return Decoder<Value>([](const Value & json) -> Result<Value> {
        return Success<Value>{json};
    });
}

template<class T>
Decoder<T> fail(std::string message) {
    return Decoder<T>([message = std::move(message)](const Value &) -> Result<T> {
        return Failure{message};
    });
}

} // namespace JsonGuard
