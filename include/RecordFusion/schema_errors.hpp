#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "schema.hpp"

namespace RecordFusion {

// ============================================================================
// Schema defects: found while compiling a schema, before any parser exists.
// ============================================================================

enum class SchemaDefect {
    NONE,
    NOT_A_TAGGED_VARIANT,
    DISCRIMINANT_NOT_ALLOWED,
    UNEXPECTED_VARIANT_ATTRIBUTE,
    NON_LITERAL_RECORD_TYPE,
    EMPTY_RECORD_TYPE,
    RECORD_TYPE_LENGTH_MISMATCH,
    UNNAMED_FIELD,
    NO_RECORD_TYPES,
    ZERO_LENGTH_FIELD,
    FIELD_ENDS_BEFORE_START,
    FIELD_RANGE_OVERFLOW
};

constexpr std::string_view schema_defect_to_string(SchemaDefect e) {
    switch(e) {
    case SchemaDefect::NONE: return "NONE"; break;
    case SchemaDefect::NOT_A_TAGGED_VARIANT: return "NOT_A_TAGGED_VARIANT"; break;
    case SchemaDefect::DISCRIMINANT_NOT_ALLOWED: return "DISCRIMINANT_NOT_ALLOWED"; break;
    case SchemaDefect::UNEXPECTED_VARIANT_ATTRIBUTE: return "UNEXPECTED_VARIANT_ATTRIBUTE"; break;
    case SchemaDefect::NON_LITERAL_RECORD_TYPE: return "NON_LITERAL_RECORD_TYPE"; break;
    case SchemaDefect::EMPTY_RECORD_TYPE: return "EMPTY_RECORD_TYPE"; break;
    case SchemaDefect::RECORD_TYPE_LENGTH_MISMATCH: return "RECORD_TYPE_LENGTH_MISMATCH"; break;
    case SchemaDefect::UNNAMED_FIELD: return "UNNAMED_FIELD"; break;
    case SchemaDefect::NO_RECORD_TYPES: return "NO_RECORD_TYPES"; break;
    case SchemaDefect::ZERO_LENGTH_FIELD: return "ZERO_LENGTH_FIELD"; break;
    case SchemaDefect::FIELD_ENDS_BEFORE_START: return "FIELD_ENDS_BEFORE_START"; break;
    case SchemaDefect::FIELD_RANGE_OVERFLOW: return "FIELD_RANGE_OVERFLOW"; break;
    }
    return "N/A";
}

inline constexpr std::size_t NO_INDEX = static_cast<std::size_t>(-1);

// Literal type so the annotation front-end can keep it in a static constexpr
// member and static_assert on it. Indexes refer to the SchemaDecl that was
// validated.
struct SchemaDiagnostic {
    SchemaDefect m_defect = SchemaDefect::NONE;
    std::size_t variantIndex = NO_INDEX;
    std::size_t attributeIndex = NO_INDEX;
    std::size_t fieldIndex = NO_INDEX;

    constexpr operator bool() const {
        return m_defect == SchemaDefect::NONE;
    }
    constexpr SchemaDefect defect() const {
        return m_defect;
    }
};

namespace schema_errors_detail {

inline std::string variant_name(const schema::SchemaDecl & s, std::size_t v) {
    if(v >= s.variants.size()) return "?";
    return s.variants[v].name;
}

inline std::string field_name(const schema::SchemaDecl & s, std::size_t v, std::size_t f) {
    if(v >= s.variants.size() || f >= s.variants[v].fields.size()) return "?";
    return s.variants[v].fields[f].name;
}

inline std::string attribute_name(const schema::SchemaDecl & s, std::size_t v, std::size_t a) {
    if(v >= s.variants.size() || a >= s.variants[v].attributes.size()) return "?";
    return s.variants[v].attributes[a].name;
}

inline std::string attribute_text(const schema::SchemaDecl & s, std::size_t v, std::size_t a) {
    if(v >= s.variants.size() || a >= s.variants[v].attributes.size()) return "";
    return s.variants[v].attributes[a].value.text;
}

// Length fixed by the first literal record_type, if any.
inline std::size_t first_tag_length(const schema::SchemaDecl & s) {
    for(const auto & v : s.variants) {
        for(const auto & a : v.attributes) {
            if(a.name == schema::RecordTypeAttribute
                && a.value.kind == schema::AttributeValueKind::string_literal
                && !a.value.text.empty()) {
                return a.value.text.size();
            }
        }
    }
    return 0;
}

}

// Human readable description of a defect, naming the offending declaration.
inline std::string DiagnosticToString(const schema::SchemaDecl & s, const SchemaDiagnostic & d) {
    using namespace schema_errors_detail;
    const std::string variant = "`" + variant_name(s, d.variantIndex) + "`";
    const std::string field = "`" + field_name(s, d.variantIndex, d.fieldIndex) + "`";

    switch(d.defect()) {
    case SchemaDefect::NONE:
        return "no error";
    case SchemaDefect::NOT_A_TAGGED_VARIANT:
        return "`" + s.targetName + "` is not a tagged variant: a record parser can only be built from mutually exclusive record alternatives";
    case SchemaDefect::DISCRIMINANT_NOT_ALLOWED:
        return "variant " + variant + " must not have an explicit discriminant";
    case SchemaDefect::UNEXPECTED_VARIANT_ATTRIBUTE:
        return "only the `record_type` declaration is expected on variant " + variant
               + ", found `" + attribute_name(s, d.variantIndex, d.attributeIndex) + "`";
    case SchemaDefect::NON_LITERAL_RECORD_TYPE:
        return "`record_type` of variant " + variant + " must specify a string literal, e.g. record_type<\"HD\">";
    case SchemaDefect::EMPTY_RECORD_TYPE:
        return "`record_type` of variant " + variant + " is empty";
    case SchemaDefect::RECORD_TYPE_LENGTH_MISMATCH: {
        const std::string tag = attribute_text(s, d.variantIndex, d.attributeIndex);
        return "all `record_type`s must be the same length: variant " + variant + " declares \"" + tag
               + "\" (" + std::to_string(tag.size()) + " characters), expected "
               + std::to_string(first_tag_length(s));
    }
    case SchemaDefect::UNNAMED_FIELD:
        return "field #" + std::to_string(d.fieldIndex) + " of variant " + variant
               + " has no name; record variants must declare named fields";
    case SchemaDefect::NO_RECORD_TYPES:
        return "no `record_type`s have been specified, so the parser cannot be built";
    case SchemaDefect::ZERO_LENGTH_FIELD:
        return field + " field length is zero in variant " + variant;
    case SchemaDefect::FIELD_ENDS_BEFORE_START:
        return field + " field of variant " + variant + " ends before it starts";
    case SchemaDefect::FIELD_RANGE_OVERFLOW:
        return field + " field of variant " + variant + " ends past the largest addressable column";
    }
    return "N/A";
}

} // namespace RecordFusion
