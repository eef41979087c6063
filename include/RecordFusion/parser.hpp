#pragma once

#include <array>
#include <cstddef>
#include <string_view>
#include <utility>
#include <variant>

#include "static_schema.hpp"
#include "options.hpp"
#include "struct_introspection.hpp"
#include "field_converters.hpp"
#include "schema_builder.hpp"
#include "schema_errors.hpp"
#include "errors.hpp"
#include "parse_result.hpp"

namespace RecordFusion {

namespace parser_details {

// Schema defects of the typed front-end are build errors.
template<class V>
consteval bool AssertValidLayout() {
    constexpr SchemaDefect d = RecordLayout<V>::diagnostic.defect();
    static_assert(d != SchemaDefect::NOT_A_TAGGED_VARIANT,
                  "[[[ RecordFusion ]]] Record parsers can only be built from a std::variant of record structs.");
    static_assert(d != SchemaDefect::UNEXPECTED_VARIANT_ATTRIBUTE,
                  "[[[ RecordFusion ]]] Only the record_type<> option is expected on a record alternative.");
    static_assert(d != SchemaDefect::EMPTY_RECORD_TYPE,
                  "[[[ RecordFusion ]]] record_type<> must not be empty.");
    static_assert(d != SchemaDefect::RECORD_TYPE_LENGTH_MISMATCH,
                  "[[[ RecordFusion ]]] All record_type<> tags must be the same length.");
    static_assert(d != SchemaDefect::NO_RECORD_TYPES,
                  "[[[ RecordFusion ]]] No record_type<> has been specified, so the parser cannot be built.");
    static_assert(d != SchemaDefect::ZERO_LENGTH_FIELD,
                  "[[[ RecordFusion ]]] A record field resolves to zero length: give it length<>, ends_at<> or a starts_at<> after a length.");
    static_assert(d != SchemaDefect::FIELD_ENDS_BEFORE_START,
                  "[[[ RecordFusion ]]] A record field has ends_at<> before its start.");
    static_assert(d != SchemaDefect::FIELD_RANGE_OVERFLOW,
                  "[[[ RecordFusion ]]] A record field starts_at<> + length<> does not fit in std::size_t.");
    static_assert(d == SchemaDefect::NONE,
                  "[[[ RecordFusion ]]] Record model does not compile, see RecordLayout<V>::diagnostic.");
    return true;
}

template <class Rec, std::size_t Index>
constexpr bool ParseField(Rec & rec, std::string_view line, std::string_view recordType,
                          offset_resolver::FieldRange range, ParseResult & result) {
    using Meta = options::detail::aggregate_field_meta_getter<Rec, Index>;
    using ValueT = typename Meta::value_t;
    static_assert(field_converters::ConvertibleFromText<ValueT>,
                  "[[[ RecordFusion ]]] Field type cannot be converted from text: use an integer, floating point, "
                  "bool, char or std::string field, or a type with bool transform_from(std::string_view).");

    auto & storage = Meta::getRef(introspection::getStructElementByIndex<Index>(rec));

    // A line too short to hold the field fails like an unconvertible slice.
    if(range.to > line.size()
        || !field_converters::FromText(line.substr(range.from, range.length()), storage)) {
        result = ParseResult::fieldParseFailure(recordType, introspection::structureElementNameByIndex<Index, Rec>, Index, range);
        return false;
    }
    return true;
}

// Fields left to right; the first failure stops the record.
template <class V, std::size_t Is>
constexpr ParseResult ParseAlternative(V & out, std::string_view line, std::string_view recordType) {
    using Layout = RecordLayout<V>;
    using Alt    = std::variant_alternative_t<Is, V>;
    using Meta   = static_schema::annotation_meta_getter<Alt>;
    using Rec    = typename Meta::value_t;

    Alt candidate{};
    Rec & rec = Meta::getRef(candidate);
    ParseResult result;

    const bool ok = [&]<std::size_t... Fi>(std::index_sequence<Fi...>) {
        return (ParseField<Rec, Fi>(rec, line, recordType, Layout::template ranges<Is>[Fi], result) && ...);
    }(std::make_index_sequence<Layout::template fieldsCount<Is>>{});

    if(!ok) {
        return result;
    }
    out.template emplace<Is>(std::move(candidate));
    return result;
}

template <class V, std::size_t... Is>
constexpr ParseResult ParseArm(V & out, std::string_view line, const LayoutArm & arm, std::index_sequence<Is...>) {
    ParseResult result = ParseResult::invalidRecordType();
    ((arm.alternative == Is ? (result = ParseAlternative<V, Is>(out, line, arm.tag), true) : false) || ...);
    return result;
}

} // namespace parser_details


/*
 * Parses one line into the record model V, a std::variant of record
 * structs. The leading tag selects the alternative (first declared match
 * wins), every field of it is sliced from its resolved range and converted.
 * `out` is only assigned when the whole record converted.
 */
template <class V>
constexpr ParseResult Parse(V & out, std::string_view line) {
    static_assert(parser_details::AssertValidLayout<V>());

    if constexpr (!static_schema::RecordModel<V>) {
        return ParseResult::invalidRecordType();
    } else {
        using Layout = RecordLayout<V>;

        if(line.size() < Layout::tagLength) {
            return ParseResult::invalidRecordType();
        }
        const std::string_view tag = line.substr(0, Layout::tagLength);

        for(const LayoutArm & arm : Layout::arms) {
            if(arm.tag == tag) {
                return parser_details::ParseArm(out, line, arm, std::make_index_sequence<std::variant_size_v<V>>{});
            }
        }
        return ParseResult::invalidRecordType();
    }
}

} // namespace RecordFusion
