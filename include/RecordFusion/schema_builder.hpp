#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "options.hpp"
#include "static_schema.hpp"
#include "struct_introspection.hpp"
#include "schema.hpp"
#include "schema_errors.hpp"
#include "compiler.hpp"
#include "offset_resolver.hpp"

namespace RecordFusion {

// Name used for the schema's targetName (and so for <Name>ParseError in
// diagnostics). Specialize for a model to change it.
template<class V>
struct RecordFormatName {
    static constexpr std::string_view value = "Record";
};

// Front-end adapter: C++ record model types -> schema::SchemaDecl.
namespace schema_builder {

namespace schema_builder_detail {

template<class Opt>
constexpr void append_hint(std::vector<schema::PositionHint> & hints) {
    using namespace options::detail;
    if constexpr (option_matches_tag<Opt, starts_at_tag>::value) {
        hints.push_back(schema::StartsAt{Opt::value});
    } else if constexpr (option_matches_tag<Opt, ends_at_tag>::value) {
        hints.push_back(schema::EndsAt{Opt::value});
    } else if constexpr (option_matches_tag<Opt, length_tag>::value) {
        hints.push_back(schema::Length{Opt::value});
    }
    // anything else (description, future options) does not position the field
}

template<class... Opts>
constexpr std::vector<schema::PositionHint> hints_of(OptionsPack<Opts...>) {
    std::vector<schema::PositionHint> hints;
    (append_hint<Opts>(hints), ...);
    return hints;
}

template<class Opt>
constexpr void append_attribute(std::vector<schema::VariantAttribute> & attributes) {
    if constexpr (options::detail::is_record_type_v<Opt>) {
        attributes.push_back(schema::record_type(Opt::desc.toStringView()));
    } else if constexpr (requires { Opt::to_string(); }) {
        attributes.push_back(schema::VariantAttribute{std::string(Opt::to_string()),
                                                      schema::AttributeValue{schema::AttributeValueKind::expression, {}}});
    } else {
        attributes.push_back(schema::VariantAttribute{"<unknown option>",
                                                      schema::AttributeValue{schema::AttributeValueKind::expression, {}}});
    }
}

template<class... Opts>
constexpr std::vector<schema::VariantAttribute> attributes_of(OptionsPack<Opts...>) {
    std::vector<schema::VariantAttribute> attributes;
    (append_attribute<Opts>(attributes), ...);
    return attributes;
}

template<class T>
constexpr schema::ValueKind value_kind_of() {
    if constexpr (std::is_same_v<T, bool>) {
        return schema::ValueKind::boolean;
    } else if constexpr (std::is_same_v<T, char>) {
        return schema::ValueKind::character;
    } else if constexpr (std::is_integral_v<T> && std::is_signed_v<T>) {
        return schema::ValueKind::signed_integer;
    } else if constexpr (std::is_integral_v<T>) {
        return schema::ValueKind::unsigned_integer;
    } else if constexpr (std::is_floating_point_v<T>) {
        return schema::ValueKind::floating_point;
    } else {
        // strings and transformer types see the raw slice
        return schema::ValueKind::text;
    }
}

template<class Rec, std::size_t I>
constexpr schema::FieldDecl field_of() {
    using Meta = options::detail::aggregate_field_meta_getter<Rec, I>;
    return schema::FieldDecl{
        std::string(introspection::structureElementNameByIndex<I, Rec>),
        hints_of(typename Meta::OptionsP{}),
        value_kind_of<typename Meta::value_t>()
    };
}

constexpr std::string alternative_name(std::size_t index) {
    std::string digits;
    do {
        digits.insert(digits.begin(), static_cast<char>('0' + index % 10));
        index /= 10;
    } while(index != 0);
    return "alternative " + digits;
}

template<class Alt>
constexpr schema::VariantDecl variant_of(std::size_t index) {
    using Meta = static_schema::annotation_meta_getter<Alt>;
    using Rec  = typename Meta::value_t;

    schema::VariantDecl v;
    v.name = alternative_name(index);
    v.attributes = attributes_of(typename Meta::OptionsP{});
    [&]<std::size_t... I>(std::index_sequence<I...>) {
        (v.fields.push_back(field_of<Rec, I>()), ...);
    }(std::make_index_sequence<introspection::structureElementsCount<Rec>>{});
    return v;
}

} // namespace schema_builder_detail

template<class V>
constexpr schema::SchemaDecl BuildSchema() {
    schema::SchemaDecl s;
    s.targetName = std::string(RecordFormatName<V>::value);
    if constexpr (!static_schema::RecordModel<V>) {
        s.sourceKind = schema::SourceKind::aggregate;
    } else {
        s.sourceKind = schema::SourceKind::tagged_variant;
        [&]<std::size_t... Is>(std::index_sequence<Is...>) {
            (s.variants.push_back(schema_builder_detail::variant_of<std::variant_alternative_t<Is, V>>(Is)), ...);
        }(std::make_index_sequence<std::variant_size_v<V>>{});
    }
    return s;
}

} // namespace schema_builder


struct LayoutArm {
    std::string_view tag;
    std::size_t alternative;
};

namespace schema_builder {
namespace layout_detail {

template<class V, std::size_t Is>
inline constexpr std::size_t tags_of_alternative =
    static_schema::annotation_meta_getter<std::variant_alternative_t<Is, V>>::options::template count_option<options::detail::record_type_tag>;

template<class V>
inline constexpr std::size_t arms_count = []<std::size_t... Is>(std::index_sequence<Is...>) {
    return (std::size_t{0} + ... + tags_of_alternative<V, Is>);
}(std::make_index_sequence<std::variant_size_v<V>>{});

template<std::size_t N, class... Opts>
constexpr void append_arms(OptionsPack<Opts...>, std::size_t alternative, std::array<LayoutArm, N> & out, std::size_t & pos) {
    auto add_one = [&]<class Opt>(Opt *) {
        if constexpr (options::detail::is_record_type_v<Opt>) {
            out[pos++] = LayoutArm{Opt::desc.toStringView(), alternative};
        }
    };
    (add_one(static_cast<Opts*>(nullptr)), ...);
}

// Dispatch order: alternatives in declaration order, tags of one
// alternative in declaration order. Same order Compile() emits arms in.
template<class V>
constexpr std::array<LayoutArm, arms_count<V>> build_arms() {
    std::array<LayoutArm, arms_count<V>> out{};
    std::size_t pos = 0;
    [&]<std::size_t... Is>(std::index_sequence<Is...>) {
        (append_arms(typename static_schema::annotation_meta_getter<std::variant_alternative_t<Is, V>>::OptionsP{}, Is, out, pos), ...);
    }(std::make_index_sequence<std::variant_size_v<V>>{});
    return out;
}

template<class V, std::size_t Is, std::size_t N>
constexpr std::array<offset_resolver::FieldRange, N> build_ranges() {
    std::array<offset_resolver::FieldRange, N> out{};
    CompileResult compiled = Compile(BuildSchema<V>());
    if(!compiled) {
        return out;
    }
    for(const CompiledVariant & arm : compiled.schema().arms) {
        if(arm.variantIndex != Is) continue;
        for(std::size_t i = 0; i < N && i < arm.fields.size(); i ++) {
            out[i] = offset_resolver::FieldRange{arm.fields[i].from, arm.fields[i].to};
        }
        break;
    }
    return out;
}

} // namespace layout_detail
} // namespace schema_builder


// Compile-time result of compiling the model V: what the typed dispatcher
// in parser.hpp is instantiated from.
template<class V>
struct RecordLayout {
    static constexpr SchemaDiagnostic diagnostic = Compile(schema_builder::BuildSchema<V>()).diagnostic();

    static constexpr std::size_t tagLength = validator::TagLength(schema_builder::BuildSchema<V>());

    static constexpr std::size_t armsCount = schema_builder::layout_detail::arms_count<V>;

    static constexpr std::array<LayoutArm, armsCount> arms = schema_builder::layout_detail::build_arms<V>();

    template<std::size_t Is>
    using record_t = static_schema::AnnotatedValue<std::variant_alternative_t<Is, V>>;

    template<std::size_t Is>
    static constexpr std::size_t fieldsCount = introspection::structureElementsCount<record_t<Is>>;

    // Resolved [from, to) per field of alternative Is; zeros if the schema
    // does not compile or the alternative has no record_type.
    template<std::size_t Is>
    static constexpr std::array<offset_resolver::FieldRange, fieldsCount<Is>> ranges =
        schema_builder::layout_detail::build_ranges<V, Is, fieldsCount<Is>>();
};

// Models that are not a std::variant of record structs only get a diagnostic.
template<class V>
    requires (!static_schema::RecordModel<V>)
struct RecordLayout<V> {
    static constexpr SchemaDiagnostic diagnostic = Compile(schema_builder::BuildSchema<V>()).diagnostic();
    static constexpr std::size_t tagLength = 0;
    static constexpr std::size_t armsCount = 0;
};

} // namespace RecordFusion
