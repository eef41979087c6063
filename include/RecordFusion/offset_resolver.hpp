#pragma once

#include <cstddef>
#include <limits>
#include <variant>
#include <vector>

#include "schema.hpp"
#include "schema_errors.hpp"

namespace RecordFusion {
namespace offset_resolver {

// Half-open [from, to) range of a field, in characters from the start of the
// line (the tag included).
struct FieldRange {
    std::size_t from = 0;
    std::size_t to   = 0;

    constexpr std::size_t length() const { return to - from; }
    constexpr bool operator==(const FieldRange &) const = default;
};

enum class ResolveStatus {
    ok,
    zero_length,
    ends_before_start,
    past_addressable_end
};

struct FieldResolution {
    ResolveStatus status = ResolveStatus::ok;
    FieldRange range;

    constexpr operator bool() const {
        return status == ResolveStatus::ok;
    }
};

/*
 * Folds the field's hints in declaration order, starting from the running
 * cursor of its variant:
 *
 *   starts_at(N)  from = N, to = from + length          cursor untouched
 *   ends_at(N)    to = N,   length = to - from          cursor = to
 *   length(N)     length = N, to = from + length        cursor = to
 *
 * Later hints override earlier ones. The result must not be empty, and
 * from + length must stay representable.
 */
template<class HintRange>
constexpr FieldResolution ResolveField(const HintRange & hints, std::size_t & cursor) {
    constexpr std::size_t Max = std::numeric_limits<std::size_t>::max();

    std::size_t from   = cursor;
    std::size_t length = 0;
    std::size_t to     = cursor;

    for(const schema::PositionHint & hint : hints) {
        if(const auto * s = std::get_if<schema::StartsAt>(&hint)) {
            from = s->value;
            if(length > Max - from) {
                return FieldResolution{ResolveStatus::past_addressable_end, FieldRange{from, from}};
            }
            to   = from + length;
        } else if(const auto * e = std::get_if<schema::EndsAt>(&hint)) {
            if(e->value < from) {
                return FieldResolution{ResolveStatus::ends_before_start, FieldRange{from, e->value}};
            }
            to     = e->value;
            length = to - from;
            cursor = to;
        } else if(const auto * l = std::get_if<schema::Length>(&hint)) {
            length = l->value;
            if(length > Max - from) {
                return FieldResolution{ResolveStatus::past_addressable_end, FieldRange{from, from}};
            }
            to     = from + length;
            cursor = to;
        }
    }

    if(to <= from) {
        return FieldResolution{ResolveStatus::zero_length, FieldRange{from, to}};
    }
    return FieldResolution{ResolveStatus::ok, FieldRange{from, to}};
}

// Resolves every field of one variant with a cursor local to this call.
// `out` receives one range per field on success.
constexpr SchemaDiagnostic ResolveVariant(const schema::VariantDecl & v, std::size_t variantIndex, std::vector<FieldRange> & out) {
    std::size_t cursor = 0;
    out.clear();
    out.reserve(v.fields.size());

    for(std::size_t fi = 0; fi < v.fields.size(); fi ++) {
        FieldResolution r = ResolveField(v.fields[fi].hints, cursor);
        switch(r.status) {
        case ResolveStatus::ok:
            out.push_back(r.range);
            break;
        case ResolveStatus::zero_length:
            return SchemaDiagnostic{SchemaDefect::ZERO_LENGTH_FIELD, variantIndex, NO_INDEX, fi};
        case ResolveStatus::ends_before_start:
            return SchemaDiagnostic{SchemaDefect::FIELD_ENDS_BEFORE_START, variantIndex, NO_INDEX, fi};
        case ResolveStatus::past_addressable_end:
            return SchemaDiagnostic{SchemaDefect::FIELD_RANGE_OVERFLOW, variantIndex, NO_INDEX, fi};
        }
    }
    return SchemaDiagnostic{};
}

} // namespace offset_resolver
} // namespace RecordFusion
