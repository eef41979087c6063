#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "schema.hpp"
#include "schema_errors.hpp"
#include "validator.hpp"
#include "offset_resolver.hpp"

namespace RecordFusion {

struct ResolvedField {
    std::string name;
    std::size_t from = 0;
    std::size_t to   = 0;
    std::string recordType;   // tag of the owning arm, for error reporting
    schema::ValueKind valueKind = schema::ValueKind::text;

    constexpr std::size_t length() const { return to - from; }
};

// One dispatch arm: a tag and the fields of the variant it selects.
struct CompiledVariant {
    std::string tag;
    std::string variantName;
    std::size_t variantIndex = 0;
    std::vector<ResolvedField> fields;
};

struct CompiledSchema {
    std::string targetName;
    std::string errorTypeName;
    std::size_t tagLength = 0;
    std::vector<CompiledVariant> arms;   // declaration order

    // First declared arm wins when tags repeat.
    constexpr const CompiledVariant * findArm(std::string_view tag) const {
        for(const CompiledVariant & arm : arms) {
            if(arm.tag == tag) return &arm;
        }
        return nullptr;
    }
};

class CompileResult {
    SchemaDiagnostic m_diagnostic;
    CompiledSchema m_schema;
public:
    constexpr CompileResult(SchemaDiagnostic d, CompiledSchema s = {}):
        m_diagnostic(d), m_schema(std::move(s))
    {}
    constexpr operator bool() const {
        return static_cast<bool>(m_diagnostic);
    }
    constexpr SchemaDefect defect() const {
        return m_diagnostic.defect();
    }
    constexpr const SchemaDiagnostic & diagnostic() const {
        return m_diagnostic;
    }
    constexpr const CompiledSchema & schema() const {
        return m_schema;
    }
    constexpr CompiledSchema && take() {
        return std::move(m_schema);
    }
};

constexpr std::string ErrorTypeName(std::string_view targetName) {
    return std::string(targetName) + "ParseError";
}

/*
 * Validator, then offset resolution per tagged variant. Each record_type of
 * a variant becomes its own arm; all arms of a variant share the ranges
 * resolved from cursor 0.
 */
constexpr CompileResult Compile(const schema::SchemaDecl & s) {
    if(SchemaDiagnostic d = validator::Validate(s); !d) {
        return CompileResult(d);
    }

    CompiledSchema out;
    out.targetName    = s.targetName;
    out.errorTypeName = ErrorTypeName(s.targetName);
    out.tagLength     = validator::TagLength(s);

    std::vector<offset_resolver::FieldRange> ranges;
    for(std::size_t vi = 0; vi < s.variants.size(); vi ++) {
        const schema::VariantDecl & v = s.variants[vi];
        if(v.attributes.empty()) continue;

        if(SchemaDiagnostic d = offset_resolver::ResolveVariant(v, vi, ranges); !d) {
            return CompileResult(d);
        }

        for(const schema::VariantAttribute & a : v.attributes) {
            CompiledVariant arm;
            arm.tag          = a.value.text;
            arm.variantName  = v.name;
            arm.variantIndex = vi;
            arm.fields.reserve(v.fields.size());
            for(std::size_t fi = 0; fi < v.fields.size(); fi ++) {
                arm.fields.push_back(ResolvedField{
                    v.fields[fi].name,
                    ranges[fi].from,
                    ranges[fi].to,
                    a.value.text,
                    v.fields[fi].valueKind
                });
            }
            out.arms.push_back(std::move(arm));
        }
    }
    return CompileResult(SchemaDiagnostic{}, std::move(out));
}

} // namespace RecordFusion
