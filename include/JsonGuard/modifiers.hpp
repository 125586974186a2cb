#pragma once

#include <functional>
#include <optional>
#include <type_traits>
#include <utility>

#include "decoder.hpp"
#include "value.hpp"

namespace JsonGuard {

// Never fails: a failure of `decoder` becomes a success holding `default_value`.
template<class T>
Decoder<T> failover(std::type_identity_t<T> default_value, Decoder<T> decoder) {
    return Decoder<T>([default_value = std::move(default_value), decoder = std::move(decoder)]
                      (const Value & json) -> Result<T> {
        auto r = decoder.decode(json);
        if (r) return r;
        return Success<T>{default_value};
    });
}

// null and absent input succeed with nullopt; `decoder` is not consulted for them.
template<class T>
Decoder<std::optional<T>> optional(Decoder<T> decoder) {
    return Decoder<std::optional<T>>([decoder = std::move(decoder)](const Value & json) -> Result<std::optional<T>> {
        if (json.is_null() || json.is_undefined()) return Success<std::optional<T>>{std::nullopt};
        auto r = decoder.decode(json);
        if (!r) return Failure{r.error()};
        return Success<std::optional<T>>{std::move(r).value()};
    });
}

// `make_decoder` is called on every decode, so a decoder may refer to itself
// through it.
template<class MakeDecoder>
auto lazy(MakeDecoder make_decoder) -> std::remove_cvref_t<std::invoke_result_t<const MakeDecoder &>> {
    using D = std::remove_cvref_t<std::invoke_result_t<const MakeDecoder &>>;
    static_assert(decoder_detail::is_decoder<D>::value, "[[[ JsonGuard ]]] lazy() expects a function returning a Decoder");
    using T = typename D::value_type;
    return D([make_decoder = std::move(make_decoder)](const Value & json) -> Result<T> {
        return std::invoke(make_decoder).decode(json);
    });
}

} // namespace JsonGuard
