#pragma once

#include <string>

#include "decoder.hpp"
#include "errors.hpp"
#include "value.hpp"

namespace JsonGuard {

inline Decoder<std::string> string() {
    return Decoder<std::string>([](const Value & json) -> Result<std::string> {
        if (json.kind() == Value::Kind::String) return Success{json.as_string()};
        return Failure{errors::primitive(json, "string")};
    });
}

inline Decoder<double> number() {
    return Decoder<double>([](const Value & json) -> Result<double> {
        if (json.kind() == Value::Kind::Number) return Success{json.as_number()};
        return Failure{errors::primitive(json, "number")};
    });
}

inline Decoder<bool> boolean() {
    return Decoder<bool>([](const Value & json) -> Result<bool> {
        if (json.kind() == Value::Kind::Bool) return Success{json.as_bool()};
        return Failure{errors::primitive(json, "boolean")};
    });
}

} // namespace JsonGuard
