#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "schema.hpp"
#include "compiler.hpp"
#include "errors.hpp"
#include "parse_result.hpp"
#include "field_converters.hpp"

namespace RecordFusion {

// Table-driven counterpart of Parse(): walks a CompiledSchema at call time
// instead of instantiating a dispatcher per model type. Dispatch and error
// semantics are the same.

using FieldValue = std::variant<std::string, std::int64_t, std::uint64_t, double, bool, char>;

struct LineField {
    std::string name;
    FieldValue value;
};

struct LineRecord {
    std::string recordType;
    std::string variantName;
    std::size_t variantIndex = 0;
    std::vector<LineField> fields;

    const LineField * find(std::string_view name) const {
        for(const LineField & f : fields) {
            if(f.name == name) return &f;
        }
        return nullptr;
    }
};

class LineParseResult {
    ParseResult m_status;
    LineRecord m_record;
public:
    LineParseResult(ParseResult status, LineRecord record = {}):
        m_status(std::move(status)), m_record(std::move(record))
    {}
    operator bool() const {
        return static_cast<bool>(m_status);
    }
    RecordError error() const {
        return m_status.error();
    }
    const ParseResult & status() const {
        return m_status;
    }
    const LineRecord & record() const {
        return m_record;
    }
};

namespace interpreter_detail {

template<class T>
bool convert_as(std::string_view text, FieldValue & out) {
    T v{};
    if(!field_converters::FromText(text, v)) {
        return false;
    }
    out = std::move(v);
    return true;
}

inline bool convert(schema::ValueKind kind, std::string_view text, FieldValue & out) {
    switch(kind) {
    case schema::ValueKind::text:             return convert_as<std::string>(text, out);
    case schema::ValueKind::signed_integer:   return convert_as<std::int64_t>(text, out);
    case schema::ValueKind::unsigned_integer: return convert_as<std::uint64_t>(text, out);
    case schema::ValueKind::floating_point:   return convert_as<double>(text, out);
    case schema::ValueKind::boolean:          return convert_as<bool>(text, out);
    case schema::ValueKind::character:        return convert_as<char>(text, out);
    }
    return false;
}

} // namespace interpreter_detail

inline LineParseResult ParseLine(const CompiledSchema & s, std::string_view line) {
    if(line.size() < s.tagLength) {
        return LineParseResult(ParseResult::invalidRecordType());
    }
    const CompiledVariant * arm = s.findArm(line.substr(0, s.tagLength));
    if(arm == nullptr) {
        return LineParseResult(ParseResult::invalidRecordType());
    }

    LineRecord record;
    record.recordType   = arm->tag;
    record.variantName  = arm->variantName;
    record.variantIndex = arm->variantIndex;
    record.fields.reserve(arm->fields.size());

    for(std::size_t i = 0; i < arm->fields.size(); i ++) {
        const ResolvedField & f = arm->fields[i];
        FieldValue value;
        if(f.to > line.size()
            || !interpreter_detail::convert(f.valueKind, line.substr(f.from, f.length()), value)) {
            return LineParseResult(ParseResult::fieldParseFailure(f.recordType, f.name, i,
                                                                  offset_resolver::FieldRange{f.from, f.to}));
        }
        record.fields.push_back(LineField{f.name, std::move(value)});
    }
    return LineParseResult(ParseResult{}, std::move(record));
}

} // namespace RecordFusion
