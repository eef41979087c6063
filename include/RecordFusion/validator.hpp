#pragma once

#include <cstddef>

#include "schema.hpp"
#include "schema_errors.hpp"

namespace RecordFusion {
namespace validator {

namespace validator_detail {

constexpr SchemaDiagnostic defect_at(SchemaDefect d, std::size_t variant, std::size_t attribute = NO_INDEX, std::size_t field = NO_INDEX) {
    return SchemaDiagnostic{d, variant, attribute, field};
}

constexpr bool has_record_type(const schema::VariantDecl & v) {
    for(const auto & a : v.attributes) {
        if(a.name == schema::RecordTypeAttribute) return true;
    }
    return false;
}

} // namespace validator_detail

// Schema-wide checks that must hold before any offset is resolved. The first
// defect in declaration order is reported; nothing after it is looked at.
constexpr SchemaDiagnostic Validate(const schema::SchemaDecl & s) {
    using namespace validator_detail;

    if(s.sourceKind != schema::SourceKind::tagged_variant) {
        return SchemaDiagnostic{SchemaDefect::NOT_A_TAGGED_VARIANT};
    }

    std::size_t tagLength = 0;

    for(std::size_t vi = 0; vi < s.variants.size(); vi ++) {
        const schema::VariantDecl & v = s.variants[vi];

        // discriminants are reserved for a future tag -> index mapping
        if(v.discriminant.has_value()) {
            return defect_at(SchemaDefect::DISCRIMINANT_NOT_ALLOWED, vi);
        }

        for(std::size_t ai = 0; ai < v.attributes.size(); ai ++) {
            const schema::VariantAttribute & a = v.attributes[ai];
            if(a.name != schema::RecordTypeAttribute) {
                return defect_at(SchemaDefect::UNEXPECTED_VARIANT_ATTRIBUTE, vi, ai);
            }
            if(a.value.kind != schema::AttributeValueKind::string_literal) {
                return defect_at(SchemaDefect::NON_LITERAL_RECORD_TYPE, vi, ai);
            }
            if(a.value.text.empty()) {
                return defect_at(SchemaDefect::EMPTY_RECORD_TYPE, vi, ai);
            }
            if(tagLength == 0) {
                tagLength = a.value.text.size();
            } else if(tagLength != a.value.text.size()) {
                return defect_at(SchemaDefect::RECORD_TYPE_LENGTH_MISMATCH, vi, ai);
            }
        }

        // Untagged variants never get a dispatch arm, their fields are not compiled.
        if(!has_record_type(v)) continue;

        for(std::size_t fi = 0; fi < v.fields.size(); fi ++) {
            if(v.fields[fi].name.empty()) {
                return defect_at(SchemaDefect::UNNAMED_FIELD, vi, NO_INDEX, fi);
            }
        }
    }

    if(tagLength == 0) {
        return SchemaDiagnostic{SchemaDefect::NO_RECORD_TYPES};
    }
    return SchemaDiagnostic{};
}

// L: the common length of every record_type. 0 if there is none.
constexpr std::size_t TagLength(const schema::SchemaDecl & s) {
    for(const auto & v : s.variants) {
        for(const auto & a : v.attributes) {
            if(a.name == schema::RecordTypeAttribute) return a.value.text.size();
        }
    }
    return 0;
}

} // namespace validator
} // namespace RecordFusion
