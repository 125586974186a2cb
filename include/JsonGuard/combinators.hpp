#pragma once

#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

#include "decoder.hpp"
#include "errors.hpp"
#include "value.hpp"

namespace JsonGuard {

// Tries each candidate in order against the same input and keeps the first
// success. When every candidate fails their messages are dropped in favour of
// a single error naming the input.
template<class T>
Decoder<T> one_of(std::vector<Decoder<T>> candidates, std::string decoder_name) {
    return Decoder<T>(
        [candidates = std::move(candidates), name = std::move(decoder_name)]
        (const Value & json) -> Result<T> {
            for (const auto & candidate : candidates) {
                auto r = candidate.decode(json);
                if (r) return r;
            }
            return Failure{errors::one_of(name, json)};
        });
}

template<class T>
Decoder<T> one_of(std::initializer_list<Decoder<T>> candidates, std::string decoder_name) {
    return one_of(std::vector<Decoder<T>>(candidates), std::move(decoder_name));
}

namespace combinators_detail {

template<class A, class B>
Decoder<B> pipe(Decoder<A> first, Decoder<B> second) {
    static_assert(ValueConvertible<A>,
                  "[[[ JsonGuard ]]] all_of: an intermediate stage must produce a type convertible to Value");
    return Decoder<B>([first = std::move(first), second = std::move(second)](const Value & json) -> Result<B> {
        auto r = first.decode(json);
        if (!r) return Failure{r.error()};
        return second.decode(to_value(r.value()));
    });
}

} // namespace combinators_detail

template<class T>
Decoder<T> all_of(Decoder<T> decoder) {
    return decoder;
}

// Feeds the raw input to the first decoder and every success value, turned
// back into a Value, to the next one. The first failure is returned as is.
template<class A, class B, class... Rest>
auto all_of(Decoder<A> first, Decoder<B> second, Decoder<Rest>... rest) {
    return all_of(combinators_detail::pipe(std::move(first), std::move(second)), std::move(rest)...);
}

} // namespace JsonGuard
