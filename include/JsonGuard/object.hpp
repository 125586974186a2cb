#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "decoder.hpp"
#include "errors.hpp"
#include "struct_fields.hpp"
#include "value.hpp"

namespace JsonGuard {

namespace object_detail {

template<class Record>
Result<Record> decode_fields(const Object & source, const Fields<Record> & fields,
                             std::string_view decoder_name, const KeyMap & key_map) {
    Record record{};
    for (const auto & f : fields) {
        auto mapped = key_map.find(f.name);
        if (mapped == key_map.end()) {
            if (auto err = f.assign(lookup(source, f.name), record)) {
                return Failure{errors::object(decoder_name, f.name, *err)};
            }
        } else {
            if (auto err = f.assign(lookup(source, mapped->second), record)) {
                return Failure{errors::object_json_key(decoder_name, f.name, mapped->second, *err)};
            }
        }
    }
    return Success{std::move(record)};
}

template<class Record>
bool is_configured(const Fields<Record> & fields, std::string_view key) {
    for (const auto & f : fields) {
        if (f.name == key) return true;
    }
    return false;
}

} // namespace object_detail

/// Decodes an object into a fresh `Record` holding only the configured fields.
/// `key_map` renames fields: field name -> source key. Keys outside the field
/// list are ignored.
template<class Record>
Decoder<Record> object(Fields<Record> fields, std::string decoder_name, KeyMap key_map = {}) {
    return Decoder<Record>(
        [fields = std::move(fields), name = std::move(decoder_name), key_map = std::move(key_map)]
        (const Value & json) -> Result<Record> {
            if (!json.is_object()) return Failure{errors::primitive(json, name)};
            return object_detail::decode_fields(json.as_object(), fields, name, key_map);
        });
}

/// Like object(), but an input key that is not a configured field fails the
/// decode before any field is looked at.
template<class Record>
Decoder<Record> object_strict(Fields<Record> fields, std::string decoder_name) {
    return Decoder<Record>(
        [fields = std::move(fields), name = std::move(decoder_name)]
        (const Value & json) -> Result<Record> {
            if (!json.is_object()) return Failure{errors::primitive(json, name)};
            const Object & source = json.as_object();
            for (const auto & [key, _] : source) {
                if (!object_detail::is_configured(fields, key)) {
                    return Failure{errors::object_strict_unknown_key(name, key)};
                }
            }
            return object_detail::decode_fields(source, fields, name, KeyMap{});
        });
}

} // namespace JsonGuard
