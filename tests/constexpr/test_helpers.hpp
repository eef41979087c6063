#pragma once

#include <RecordFusion/parser.hpp>
#include <RecordFusion/compiler.hpp>
#include <RecordFusion/schema.hpp>
#include <initializer_list>
#include <string_view>
#include <cstddef>
#include <variant>
#include <vector>

namespace TestHelpers {

using namespace RecordFusion;

// ============================================================================
// Typed parse helpers
// ============================================================================

/// Check that parsing succeeds
template<typename V>
constexpr bool ParseSucceeds(V& out, std::string_view line) {
    return static_cast<bool>(RecordFusion::Parse(out, line));
}

/// Check that parsing fails with specific error code
template<typename V>
constexpr bool ParseFailsWith(std::string_view line, RecordError expected_error) {
    V out{};
    auto result = RecordFusion::Parse(out, line);
    return !result && result.error() == expected_error;
}

/// Check that parsing fails on the given field of the given record type,
/// and that the rendered message names both
template<typename V>
constexpr bool ParseFailsAtField(std::string_view line, std::string_view recordType, std::string_view field) {
    V out{};
    auto result = RecordFusion::Parse(out, line);
    if(result) return false;
    if(result.error() != RecordError::FIELD_PARSE_FAILURE) return false;
    if(result.recordType() != recordType || result.field() != field) return false;
    std::string expected = "failed to parse field `";
    expected += field;
    expected += "` in ";
    expected += recordType;
    expected += " record.";
    return result.message() == expected;
}

/// One-line parse test: selects alternative Alt, then runs the verifier on it
template<typename V, std::size_t Alt, typename Verifier>
constexpr bool TestParse(std::string_view line, Verifier&& verify) {
    V out{};
    if(!RecordFusion::Parse(out, line)) return false;
    if(out.index() != Alt) return false;
    using Meta = static_schema::annotation_meta_getter<std::variant_alternative_t<Alt, V>>;
    return verify(Meta::getRef(std::get<Alt>(out)));
}

/// Parse selects alternative Alt, no field checks
template<typename V, std::size_t Alt>
constexpr bool ParsesAs(std::string_view line) {
    return TestParse<V, Alt>(line, [](const auto &) { return true; });
}

/// Resolved ranges of alternative Alt as seen by the typed dispatcher
template<typename V, std::size_t Alt>
constexpr bool LayoutIs(std::initializer_list<offset_resolver::FieldRange> expected) {
    const auto & ranges = RecordLayout<V>::template ranges<Alt>;
    if(ranges.size() != expected.size()) return false;
    std::size_t i = 0;
    for(const auto & r : expected) {
        if(!(ranges[i++] == r)) return false;
    }
    return true;
}

template<typename V>
constexpr bool LayoutDefect(SchemaDefect expected) {
    return RecordLayout<V>::diagnostic.defect() == expected;
}

// ============================================================================
// Structured schema helpers
// ============================================================================

constexpr schema::FieldDecl FieldOf(std::string_view name, std::initializer_list<schema::PositionHint> hints,
                                    schema::ValueKind kind = schema::ValueKind::text) {
    return schema::FieldDecl{std::string(name), std::vector<schema::PositionHint>(hints), kind};
}

constexpr schema::VariantDecl VariantOf(std::string_view name, std::initializer_list<std::string_view> tags,
                                        std::initializer_list<schema::FieldDecl> fields) {
    schema::VariantDecl v;
    v.name = std::string(name);
    for(std::string_view t : tags) {
        v.attributes.push_back(schema::record_type(t));
    }
    v.fields = std::vector<schema::FieldDecl>(fields);
    return v;
}

constexpr schema::SchemaDecl SchemaOf(std::initializer_list<schema::VariantDecl> variants) {
    return schema::SchemaDecl{"Record", schema::SourceKind::tagged_variant, std::vector<schema::VariantDecl>(variants)};
}

/// Compile fails with the expected defect at the expected place
constexpr bool CompileFailsWith(const schema::SchemaDecl & s, SchemaDefect expected,
                                std::size_t variantIndex = NO_INDEX, std::size_t fieldIndex = NO_INDEX) {
    CompileResult r = Compile(s);
    if(r) return false;
    if(r.defect() != expected) return false;
    if(variantIndex != NO_INDEX && r.diagnostic().variantIndex != variantIndex) return false;
    if(fieldIndex != NO_INDEX && r.diagnostic().fieldIndex != fieldIndex) return false;
    return true;
}

/// ResolveVariant succeeds and yields exactly the expected ranges
constexpr bool ResolvesTo(const schema::VariantDecl & v, std::initializer_list<offset_resolver::FieldRange> expected) {
    std::vector<offset_resolver::FieldRange> out;
    if(!offset_resolver::ResolveVariant(v, 0, out)) return false;
    if(out.size() != expected.size()) return false;
    std::size_t i = 0;
    for(const auto & r : expected) {
        if(!(out[i++] == r)) return false;
    }
    return true;
}

} // namespace TestHelpers
