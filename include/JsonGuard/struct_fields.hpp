#pragma once

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include <pfr/core.hpp>
#include <pfr/core_name.hpp>
#include <pfr/tuple_size.hpp>

#include "decoder.hpp"
#include "value.hpp"

namespace JsonGuard {

// One configured field of a record decoder: the target field name and the
// binding that decodes a value into the matching member.
template<class Record>
struct FieldDecoder {
    // Returns the decoder's failure message, or nullopt once the member is assigned.
    using AssignFn = std::function<std::optional<std::string>(const Value &, Record &)>;

    std::string name;
    AssignFn    assign;
};

// Fields in declaration order; object decoders visit them in this order.
template<class Record>
using Fields = std::vector<FieldDecoder<Record>>;

// Target field name -> source JSON key.
using KeyMap = std::map<std::string, std::string, std::less<>>;

template<class Record, class Member, class T>
    requires std::is_assignable_v<Member &, T &&>
FieldDecoder<Record> field(Member Record::* member, std::string name, Decoder<T> decoder) {
    return {
        std::move(name),
        [member, decoder = std::move(decoder)](const Value & json, Record & record) -> std::optional<std::string> {
            auto result = decoder.decode(json);
            if (!result) return result.error();
            record.*member = std::move(result).value();
            return std::nullopt;
        }
    };
}

namespace introspection {

template<class Record>
inline constexpr std::size_t structureElementsCount = pfr::tuple_size_v<Record>;

template<std::size_t Index, class Record>
using structureElementTypeByIndex = pfr::tuple_element_t<Index, Record>;

template<std::size_t Index, class Record>
inline constexpr std::string_view structureElementNameByIndex = pfr::get_name<Index, Record>();

} // namespace introspection

namespace fields_detail {

template<std::size_t Index, class Record, class T>
FieldDecoder<Record> indexed_field(Decoder<T> decoder) {
    using Member = introspection::structureElementTypeByIndex<Index, Record>;
    static_assert(std::is_assignable_v<Member &, T &&>,
                  "[[[ JsonGuard ]]] decoder output cannot be assigned to the aggregate member");
    return {
        std::string(introspection::structureElementNameByIndex<Index, Record>),
        [decoder = std::move(decoder)](const Value & json, Record & record) -> std::optional<std::string> {
            auto result = decoder.decode(json);
            if (!result) return result.error();
            pfr::get<Index>(record) = std::move(result).value();
            return std::nullopt;
        }
    };
}

template<class Record, std::size_t... I, class... Ts>
Fields<Record> by_index(std::index_sequence<I...>, Decoder<Ts>... decoders) {
    return Fields<Record>{ indexed_field<I, Record>(std::move(decoders))... };
}

} // namespace fields_detail

// One decoder per aggregate member, in declaration order. Field names are the
// member names.
template<class Record, class... Ts>
Fields<Record> fields_of(Decoder<Ts>... decoders) {
    static_assert(std::is_aggregate_v<Record>, "[[[ JsonGuard ]]] fields_of needs an aggregate record type");
    static_assert(sizeof...(Ts) == introspection::structureElementsCount<Record>,
                  "[[[ JsonGuard ]]] fields_of needs exactly one decoder per aggregate member");
    return fields_detail::by_index<Record>(std::index_sequence_for<Ts...>{}, std::move(decoders)...);
}

} // namespace JsonGuard
