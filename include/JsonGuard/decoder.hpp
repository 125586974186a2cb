#pragma once

#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <type_traits>
#include <utility>

#include "errors.hpp"
#include "result.hpp"
#include "value.hpp"

namespace JsonGuard {

template<class T>
class Decoder;

namespace decoder_detail {

template<class U, class T>
concept Widens =
    !std::is_same_v<U, T> &&
    !(std::is_arithmetic_v<U> && std::is_arithmetic_v<T>) &&
    (std::is_convertible_v<U, T> || (std::is_same_v<T, Value> && ValueConvertible<U>));

template<class T> struct is_decoder : std::false_type {};
template<class T> struct is_decoder<Decoder<T>> : std::true_type {};

} // namespace decoder_detail

// A decoder is an immutable handle to a function `const Value& -> Result<T>`.
// Copies share the same function; nothing is cached between calls, so one
// decoder may be applied concurrently to any number of inputs.
template<class T>
class Decoder {
public:
    using value_type = T;
    using DecodeFn   = std::function<Result<T>(const Value &)>;

    explicit Decoder(DecodeFn fn)
        : m_fn(std::make_shared<const DecodeFn>(std::move(fn)))
    {}

    // Decoder<std::string> -> Decoder<std::variant<std::string, double>>,
    // Decoder<U> -> Decoder<std::optional<U>>, Decoder<U> -> Decoder<Value>, ...
    template<class U>
        requires decoder_detail::Widens<U, T>
    Decoder(const Decoder<U> & other)
        : Decoder(other.map([](U && v) -> T {
              if constexpr (std::is_convertible_v<U, T>) {
                  return T(std::move(v));
              } else {
                  return to_value(v);
              }
          }))
    {}

    Result<T> decode(const Value & json) const {
        return (*m_fn)(json);
    }

    /// Decodes `json` and folds the outcome through exactly one continuation.
    template<class OnOk, class OnErr>
    auto on_decode(const Value & json, OnOk && on_ok, OnErr && on_err) const
        -> std::invoke_result_t<OnOk, T &&>
    {
        auto result = decode(json);
        if (result) {
            return std::invoke(std::forward<OnOk>(on_ok), std::move(result).value());
        }
        return std::invoke(std::forward<OnErr>(on_err), result.error());
    }

    /// Decodes `json` into an already satisfied future. A failure is stored as
    /// a DecodeError carrying the message.
    std::future<T> decode_future(const Value & json) const {
        std::promise<T> promise;
        auto result = decode(json);
        if (result) {
            promise.set_value(std::move(result).value());
        } else {
            promise.set_exception(std::make_exception_ptr(DecodeError(result.error())));
        }
        return promise.get_future();
    }

    template<class F>
    auto map(F f) const -> Decoder<std::remove_cvref_t<std::invoke_result_t<const F &, T &&>>> {
        using U = std::remove_cvref_t<std::invoke_result_t<const F &, T &&>>;
        return Decoder<U>([self = *this, f = std::move(f)](const Value & json) -> Result<U> {
            return self.decode(json).map(f);
        });
    }

    // `f` picks the next decoder from the decoded value; that decoder is then
    // applied to the same raw input.
    template<class F>
    auto then(F f) const -> std::remove_cvref_t<std::invoke_result_t<const F &, T &&>> {
        using Next = std::remove_cvref_t<std::invoke_result_t<const F &, T &&>>;
        static_assert(decoder_detail::is_decoder<Next>::value, "then() expects a function returning a Decoder");
        using U = typename Next::value_type;
        return Next([self = *this, f = std::move(f)](const Value & json) -> Result<U> {
            auto result = self.decode(json);
            if (!result) return Failure{result.error()};
            const Next next = std::invoke(f, std::move(result).value());
            return next.decode(json);
        });
    }

private:
    std::shared_ptr<const DecodeFn> m_fn;
};

} // namespace JsonGuard
