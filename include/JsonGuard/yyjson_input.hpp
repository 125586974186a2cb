#pragma once
#include <yyjson.h>
#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>

#include "result.hpp"
#include "value.hpp"

#ifndef JSONGUARD_YYJSON_READ_FLAGS
#define JSONGUARD_YYJSON_READ_FLAGS YYJSON_READ_NOFLAG
#endif

namespace JsonGuard {

namespace yyjson_detail {

// RAW nodes only carry number text (YYJSON_READ_NUMBER_AS_RAW,
// YYJSON_READ_BIGNUM_AS_RAW). Out of range text becomes +-HUGE_VAL or 0.
inline double raw_number(yyjson_val* val) {
    const std::string text(yyjson_get_raw(val), yyjson_get_len(val));
    return std::strtod(text.c_str(), nullptr);
}

} // namespace yyjson_detail

// Converts a yyjson DOM node into a Value tree. A null node is the absent
// sentinel. All numbers become doubles.
inline Value from_yyjson(yyjson_val* val) {
    if (!val) {
        return Undefined{};
    }
    switch (yyjson_get_type(val)) {
    case YYJSON_TYPE_NULL:
        return Null{};
    case YYJSON_TYPE_BOOL:
        return yyjson_get_bool(val) != 0;
    case YYJSON_TYPE_NUM:
        if (yyjson_is_real(val)) {
            return yyjson_get_real(val);
        } else if (yyjson_is_sint(val)) {
            return static_cast<double>(yyjson_get_sint(val));
        }
        return static_cast<double>(yyjson_get_uint(val));
    case YYJSON_TYPE_RAW:
        return yyjson_detail::raw_number(val);
    case YYJSON_TYPE_STR:
        return std::string(yyjson_get_str(val), yyjson_get_len(val));
    case YYJSON_TYPE_ARR: {
        Array items;
        items.reserve(yyjson_arr_size(val));
        std::size_t idx, max;
        yyjson_val* item;
        yyjson_arr_foreach(val, idx, max, item) {
            items.push_back(from_yyjson(item));
        }
        return items;
    }
    case YYJSON_TYPE_OBJ: {
        Object members;
        std::size_t idx, max;
        yyjson_val *key, *item;
        yyjson_obj_foreach(val, idx, max, key, item) {
            members.insert_or_assign(std::string(yyjson_get_str(key), yyjson_get_len(key)), from_yyjson(item));
        }
        return members;
    }
    default:
        return Undefined{};
    }
}

// Parses JSON text into a Value. Malformed text is a failed result carrying
// yyjson's position and message. `flags` must not include YYJSON_READ_INSITU.
inline Result<Value> parse_json(std::string_view text, yyjson_read_flag flags) {
    yyjson_read_err err{};
    std::unique_ptr<yyjson_doc, decltype(&yyjson_doc_free)> doc(
        yyjson_read_opts(const_cast<char*>(text.data()), text.size(), flags, nullptr, &err),
        &yyjson_doc_free);
    if (!doc) {
        return Failure{"JSON parse error at position " + std::to_string(err.pos) + ": "
                       + (err.msg ? err.msg : "unknown error")};
    }
    return Success<Value>{from_yyjson(yyjson_doc_get_root(doc.get()))};
}

inline Result<Value> parse_json(std::string_view text) {
    return parse_json(text, JSONGUARD_YYJSON_READ_FLAGS);
}

} // namespace JsonGuard
