#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace RecordFusion {

// Structured description of a fixed-length tagged record format. This is
// the only thing the compiler consumes: the annotation front-end
// (schema_builder.hpp) produces it from C++ types, other front-ends may
// build it by hand.
namespace schema {

inline constexpr std::string_view RecordTypeAttribute = "record_type";

struct StartsAt { std::size_t value; };
struct EndsAt   { std::size_t value; };   // exclusive
struct Length   { std::size_t value; };

using PositionHint = std::variant<StartsAt, EndsAt, Length>;

// Value type the table-driven interpreter converts a field's slice into.
// The typed front-end derives it from the member type; there the member
// type also picks the converter.
enum class ValueKind : std::uint8_t {
    text,
    signed_integer,
    unsigned_integer,
    floating_point,
    boolean,
    character
};

constexpr std::string_view value_kind_to_string(ValueKind k) {
    switch(k) {
    case ValueKind::text:             return "text"; break;
    case ValueKind::signed_integer:   return "signed_integer"; break;
    case ValueKind::unsigned_integer: return "unsigned_integer"; break;
    case ValueKind::floating_point:   return "floating_point"; break;
    case ValueKind::boolean:          return "boolean"; break;
    case ValueKind::character:        return "character"; break;
    }
    return "N/A";
}

enum class AttributeValueKind : std::uint8_t {
    string_literal,
    integer_literal,
    expression
};

struct AttributeValue {
    AttributeValueKind kind = AttributeValueKind::string_literal;
    std::string text;
};

// Declaration attached to a variant; `record_type = "HD"` is the only one
// the validator accepts.
struct VariantAttribute {
    std::string name;
    AttributeValue value;
};

struct FieldDecl {
    std::string name;
    std::vector<PositionHint> hints;
    ValueKind valueKind = ValueKind::text;
};

struct VariantDecl {
    std::string name;
    std::optional<std::int64_t> discriminant;
    std::vector<VariantAttribute> attributes;
    std::vector<FieldDecl> fields;
};

enum class SourceKind : std::uint8_t {
    tagged_variant,
    aggregate
};

struct SchemaDecl {
    std::string targetName;
    SourceKind sourceKind = SourceKind::tagged_variant;
    std::vector<VariantDecl> variants;
};

constexpr VariantAttribute record_type(std::string_view tag) {
    return VariantAttribute{std::string(RecordTypeAttribute), AttributeValue{AttributeValueKind::string_literal, std::string(tag)}};
}

} // namespace schema
} // namespace RecordFusion
