#pragma once

#include <string_view>
namespace RecordFusion {


// Data errors reported by a generated parser for one input line.
enum class RecordError {
    NO_ERROR,
    INVALID_RECORD_TYPE,
    FIELD_PARSE_FAILURE
};

constexpr std::string_view error_to_string(RecordError e) {
    switch(e) {
    case RecordError::NO_ERROR: return "NO_ERROR"; break;
    case RecordError::INVALID_RECORD_TYPE: return "INVALID_RECORD_TYPE"; break;
    case RecordError::FIELD_PARSE_FAILURE: return "FIELD_PARSE_FAILURE"; break;
    }
    return "N/A";
}

} // namespace RecordFusion
