#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include "render.hpp"
#include "value.hpp"

namespace JsonGuard {

// Carries a decode failure message through decode_future.
class DecodeError : public std::runtime_error {
public:
    explicit DecodeError(const std::string & message)
        : std::runtime_error(message)
    {}
};

// ============================================================================
// Error messages
// ============================================================================
//
// Failures are plain strings. Structural decoders wrap the nested message
// of the child that failed; the texts below are relied upon verbatim.

namespace errors {

inline std::string primitive(const Value & json, std::string_view kind) {
    return render(json) + " is not a valid " + std::string(kind);
}

inline std::string exactly(const Value & json, const Value & expected) {
    return render(json) + " is not exactly " + render(expected);
}

inline std::string undefined(const Value & json) {
    return render(json) + " is not undefined";
}

inline std::string null(const Value & json) {
    return render(json) + " is not null";
}

inline std::string object(std::string_view decoder_name, std::string_view key, std::string_view error) {
    return "<" + std::string(decoder_name) + "> decoder failed at key \"" + std::string(key)
           + "\" with error: " + std::string(error);
}

inline std::string object_json_key(std::string_view decoder_name, std::string_view key,
                                   std::string_view json_key, std::string_view error) {
    return "<" + std::string(decoder_name) + "> decoder failed at key \"" + std::string(key)
           + "\" (mapped from the JSON key \"" + std::string(json_key)
           + "\") with error: " + std::string(error);
}

inline std::string object_strict_unknown_key(std::string_view decoder_name, std::string_view key) {
    return "<" + std::string(decoder_name) + "> decoder failed because of unexpected key \""
           + std::string(key) + "\"";
}

inline std::string array(std::string_view decoder_name, std::size_t index, std::string_view error) {
    return "<" + std::string(decoder_name) + "> decoder failed at index \"" + std::to_string(index)
           + "\" with error: " + std::string(error);
}

inline std::string dictionary(std::string_view decoder_name, std::string_view key, std::string_view error) {
    return "<" + std::string(decoder_name) + "> dictionary decoder failed at key \"" + std::string(key)
           + "\" with error: " + std::string(error);
}

inline std::string one_of(std::string_view decoder_name, const Value & json) {
    return "<" + std::string(decoder_name) + "> decoder failed because " + render(json)
           + " can't be decoded with any of the provided oneOf decoders";
}

} // namespace errors

} // namespace JsonGuard
