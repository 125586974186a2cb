#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

#include "decoder.hpp"
#include "errors.hpp"
#include "value.hpp"

namespace JsonGuard {

/// Decodes every element with `element`, in index order. The first element
/// that fails stops the decode and its index is reported.
template<class T>
Decoder<std::vector<T>> array(Decoder<T> element, std::string decoder_name) {
    return Decoder<std::vector<T>>(
        [element = std::move(element), name = std::move(decoder_name)]
        (const Value & json) -> Result<std::vector<T>> {
            if (!json.is_array()) return Failure{errors::primitive(json, "array")};
            const Array & items = json.as_array();
            std::vector<T> out;
            out.reserve(items.size());
            for (std::size_t i = 0; i < items.size(); ++i) {
                auto r = element.decode(items[i]);
                if (!r) return Failure{errors::array(name, i, r.error())};
                out.push_back(std::move(r).value());
            }
            return Success{std::move(out)};
        });
}

/// Decodes every member value with `item`, keeping the source keys and order.
template<class T>
Decoder<Dictionary<T>> dictionary(Decoder<T> item, std::string decoder_name) {
    return Decoder<Dictionary<T>>(
        [item = std::move(item), name = std::move(decoder_name)]
        (const Value & json) -> Result<Dictionary<T>> {
            if (!json.is_object()) return Failure{errors::primitive(json, "dictionary")};
            Dictionary<T> out;
            for (const auto & [key, member] : json.as_object()) {
                auto r = item.decode(member);
                if (!r) return Failure{errors::dictionary(name, key, r.error())};
                out.insert_or_assign(key, std::move(r).value());
            }
            return Success{std::move(out)};
        });
}

} // namespace JsonGuard
