#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "errors.hpp"
#include "offset_resolver.hpp"
#include "schema_errors.hpp"

namespace RecordFusion {


class ParseResult {
    RecordError m_error = RecordError::NO_ERROR;
    std::string m_recordType;
    std::string m_field;
    std::size_t m_fieldIndex = NO_INDEX;
    offset_resolver::FieldRange m_range;

public:
    constexpr ParseResult() = default;
    constexpr ParseResult(RecordError err, std::string_view recordType = {}, std::string_view field = {},
                          std::size_t fieldIndex = NO_INDEX, offset_resolver::FieldRange range = {}):
        m_error(err), m_recordType(recordType), m_field(field), m_fieldIndex(fieldIndex), m_range(range)
    {}

    static constexpr ParseResult invalidRecordType() {
        return ParseResult(RecordError::INVALID_RECORD_TYPE);
    }
    static constexpr ParseResult fieldParseFailure(std::string_view recordType, std::string_view field,
                                                   std::size_t fieldIndex, offset_resolver::FieldRange range) {
        return ParseResult(RecordError::FIELD_PARSE_FAILURE, recordType, field, fieldIndex, range);
    }

    constexpr operator bool() const {
        return m_error == RecordError::NO_ERROR;
    }
    constexpr RecordError error() const {
        return m_error;
    }
    // Tag of the matched record, FIELD_PARSE_FAILURE only.
    constexpr std::string_view recordType() const {
        return m_recordType;
    }
    constexpr std::string_view field() const {
        return m_field;
    }
    constexpr std::size_t fieldIndex() const {
        return m_fieldIndex;
    }
    constexpr offset_resolver::FieldRange fieldRange() const {
        return m_range;
    }

    constexpr std::string message() const {
        switch(m_error) {
        case RecordError::NO_ERROR:
            return "no error";
        case RecordError::INVALID_RECORD_TYPE:
            return "invalid record type";
        case RecordError::FIELD_PARSE_FAILURE:
            return "failed to parse field `" + m_field + "` in " + m_recordType + " record.";
        }
        return "N/A";
    }
};

} // namespace RecordFusion
