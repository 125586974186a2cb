#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <pfr/core.hpp>
#include <pfr/core_name.hpp>
#include <pfr/tuple_size.hpp>

#include "ordered_map.hpp"

namespace JsonGuard {

struct Null {
    friend constexpr bool operator==(Null, Null) noexcept { return true; }
};

// The absent sentinel: a key that is not present, as opposed to an explicit null.
struct Undefined {
    friend constexpr bool operator==(Undefined, Undefined) noexcept { return true; }
};

class Value;

using Array  = std::vector<Value>;
using Object = OrderedMap<Value>;

template<class T>
using Dictionary = OrderedMap<T>;

// Already-decoded, untyped JSON-like data. The set of alternatives is closed;
// decoders switch over kind() rather than probing types.
class Value {
public:
    enum class Kind {
        Undefined,
        Null,
        Bool,
        Number,
        String,
        Array,
        Object
    };

    using Storage = std::variant<Undefined, Null, bool, double, std::string, Array, Object>;

    Value() = default;
    Value(Undefined) {}
    Value(Null) : m_storage(Null{}) {}
    Value(std::nullptr_t) : m_storage(Null{}) {}
    Value(bool b) : m_storage(b) {}

    template<class N>
        requires (std::is_arithmetic_v<N> && !std::is_same_v<N, bool>)
    Value(N n) : m_storage(static_cast<double>(n)) {}

    Value(const char * s) : m_storage(std::string(s)) {}
    Value(std::string s) : m_storage(std::move(s)) {}
    Value(std::string_view s) : m_storage(std::string(s)) {}
    Value(Array a) : m_storage(std::move(a)) {}
    Value(Object o) : m_storage(std::move(o)) {}

    Kind kind() const noexcept { return static_cast<Kind>(m_storage.index()); }

    bool is_undefined() const noexcept { return kind() == Kind::Undefined; }
    bool is_null()      const noexcept { return kind() == Kind::Null; }
    bool is_bool()      const noexcept { return kind() == Kind::Bool; }
    bool is_number()    const noexcept { return kind() == Kind::Number; }
    bool is_string()    const noexcept { return kind() == Kind::String; }
    bool is_array()     const noexcept { return kind() == Kind::Array; }
    bool is_object()    const noexcept { return kind() == Kind::Object; }

    // Checked accessors; std::bad_variant_access on a kind mismatch.
    bool                as_bool()   const { return std::get<bool>(m_storage); }
    double              as_number() const { return std::get<double>(m_storage); }
    const std::string & as_string() const { return std::get<std::string>(m_storage); }
    const Array &       as_array()  const { return std::get<Array>(m_storage); }
    const Object &      as_object() const { return std::get<Object>(m_storage); }

    // Member lookup. Yields the absent sentinel for a missing key or a non-object.
    const Value & member(std::string_view key) const;

    const Storage & storage() const noexcept { return m_storage; }

    static const Value & undefined() {
        static const Value absent;
        return absent;
    }

    // Same kind and equal payload; composite values compare deeply.
    friend bool operator==(const Value & lhs, const Value & rhs) {
        return lhs.m_storage == rhs.m_storage;
    }

private:
    Storage m_storage;
};

inline const Value & lookup(const Object & object, std::string_view key) {
    auto it = object.find(key);
    return it == object.end() ? Value::undefined() : it->second;
}

inline const Value & Value::member(std::string_view key) const {
    if (!is_object()) return undefined();
    return lookup(as_object(), key);
}

namespace value_detail {

template<class T> struct is_vector : std::false_type {};
template<class T, class A> struct is_vector<std::vector<T, A>> : std::true_type {};

template<class T> struct is_optional : std::false_type {};
template<class T> struct is_optional<std::optional<T>> : std::true_type {};

template<class T> struct is_ordered_map : std::false_type {};
template<class T> struct is_ordered_map<OrderedMap<T>> : std::true_type {};

// Plain aggregates with named members, as produced by object().
template<class T>
concept is_record = std::is_class_v<T> && std::is_aggregate_v<T>
    && !std::is_same_v<T, Null> && !std::is_same_v<T, Undefined>
    && !requires(const T & t) { t.begin(); };

template<class T>
constexpr bool convertible() {
    using U = std::remove_cvref_t<T>;
    if constexpr (std::is_same_v<U, Value> || std::is_same_v<U, Null> || std::is_same_v<U, Undefined>
                  || std::is_same_v<U, std::string> || std::is_arithmetic_v<U>) {
        return true;
    } else if constexpr (is_vector<U>::value || is_optional<U>::value) {
        return convertible<typename U::value_type>();
    } else if constexpr (is_ordered_map<U>::value) {
        return convertible<typename U::mapped_type>();
    } else if constexpr (is_record<U>) {
        // Members are checked when converted: a record may contain itself.
        return true;
    } else {
        return false;
    }
}

} // namespace value_detail

// Types a decoded value can be turned back into a Value from (all_of stages,
// Decoder<Value> widening).
template<class T>
concept ValueConvertible = value_detail::convertible<T>();

template<ValueConvertible T>
Value to_value(const T & v);

namespace value_detail {

template<class M>
Value member_to_value(const M & member) {
    static_assert(ValueConvertible<M>, "[[[ JsonGuard ]]] record member cannot be converted to Value");
    return to_value(member);
}

} // namespace value_detail

// Records become objects keyed by member name, in declaration order. An empty
// optional member becomes the absent sentinel.
template<ValueConvertible T>
Value to_value(const T & v) {
    using U = std::remove_cvref_t<T>;
    if constexpr (std::is_same_v<U, Value>) {
        return v;
    } else if constexpr (value_detail::is_optional<U>::value) {
        if (!v) return Undefined{};
        return to_value(*v);
    } else if constexpr (value_detail::is_vector<U>::value) {
        Array items;
        items.reserve(v.size());
        for (const auto & item : v) {
            items.push_back(to_value(item));
        }
        return items;
    } else if constexpr (value_detail::is_ordered_map<U>::value) {
        Object members;
        for (const auto & [key, item] : v) {
            members.insert_or_assign(key, to_value(item));
        }
        return members;
    } else if constexpr (value_detail::is_record<U>) {
        Object members;
        [&]<std::size_t... I>(std::index_sequence<I...>) {
            (members.insert_or_assign(std::string(pfr::get_name<I, U>()),
                                      value_detail::member_to_value(pfr::get<I>(v))), ...);
        }(std::make_index_sequence<pfr::tuple_size_v<U>>{});
        return members;
    } else {
        return Value(v);
    }
}

} // namespace JsonGuard
