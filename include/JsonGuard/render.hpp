#pragma once

#include <string>
#include <string_view>

#include "number_format.hpp"
#include "value.hpp"

namespace JsonGuard {

namespace render_detail {

inline void append_escaped(std::string & out, std::string_view s) {
    static constexpr char hex[] = "0123456789abcdef";
    out += '"';
    const char * p = s.data();
    const char * e = p + s.size();
    while (p < e) {
        // Copy the run that needs no escaping in one go
        const char * run = p;
        while (run < e) {
            unsigned char uc = static_cast<unsigned char>(*run);
            if (*run == '"' || *run == '\\' || uc < 0x20) break;
            ++run;
        }
        if (run != p) {
            out.append(p, run);
            p = run;
            continue;
        }

        unsigned char uc = static_cast<unsigned char>(*p++);
        switch (uc) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\b': out += "\\b";  break;
        case '\f': out += "\\f";  break;
        case '\n': out += "\\n";  break;
        case '\r': out += "\\r";  break;
        case '\t': out += "\\t";  break;
        default:
            out += "\\u00";
            out += hex[(uc >> 4) & 0xF];
            out += hex[uc & 0xF];
            break;
        }
    }
    out += '"';
}

inline void append_value(std::string & out, const Value & v) {
    switch (v.kind()) {
    case Value::Kind::Undefined:    // only reached inside arrays
    case Value::Kind::Null:
        out += "null";
        break;
    case Value::Kind::Bool:
        out += v.as_bool() ? "true" : "false";
        break;
    case Value::Kind::Number:
        number_format_detail::append_number(out, v.as_number());
        break;
    case Value::Kind::String:
        append_escaped(out, v.as_string());
        break;
    case Value::Kind::Array: {
        out += '[';
        bool first = true;
        for (const auto & item : v.as_array()) {
            if (!first) out += ',';
            first = false;
            append_value(out, item);
        }
        out += ']';
        break;
    }
    case Value::Kind::Object: {
        out += '{';
        bool first = true;
        for (const auto & [key, item] : v.as_object()) {
            if (item.is_undefined()) continue;
            if (!first) out += ',';
            first = false;
            append_escaped(out, key);
            out += ':';
            append_value(out, item);
        }
        out += '}';
        break;
    }
    }
}

} // namespace render_detail

// Literal text of a value as it appears in error messages: its JSON
// spelling, or `undefined` for the absent sentinel.
inline std::string render(const Value & v) {
    if (v.is_undefined()) return "undefined";
    std::string out;
    render_detail::append_value(out, v);
    return out;
}

} // namespace JsonGuard
