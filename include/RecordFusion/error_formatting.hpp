#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "errors.hpp"
#include "parse_result.hpp"

namespace RecordFusion {

namespace error_formatting_detail {

inline std::string quoted_range(std::string_view line, std::size_t from, std::size_t to) {
    if(from > line.size()) from = line.size();
    if(to > line.size())   to   = line.size();
    return std::string(line.substr(from, to - from));
}

} // namespace error_formatting_detail

/*
 * Human-readable form of a failed parse. For a field failure the line is
 * shown with the field's slice bracketed, e.g.
 *   failed to parse field `age` in HD record. [5, 8): 'HDAlice  >>>0x3<<<'
 * A window of characters before the slice is kept; the rest is elided.
 */
inline std::string ParseResultToString(const ParseResult & res, std::string_view line, std::size_t window = 40) {
    if(res) {
        return res.message();
    }
    if(res.error() == RecordError::INVALID_RECORD_TYPE) {
        return res.message() + ": '" + std::string(line.substr(0, window)) + (line.size() > window ? "...'" : "'");
    }

    const offset_resolver::FieldRange r = res.fieldRange();
    const std::size_t start = r.from > window ? r.from - window : 0;

    std::string fragment = start > 0 ? "..." : "";
    fragment += error_formatting_detail::quoted_range(line, start, r.from);
    fragment += ">>>";
    fragment += error_formatting_detail::quoted_range(line, r.from, r.to);
    fragment += "<<<";
    if(r.to > line.size()) {
        fragment += "<line ends at " + std::to_string(line.size()) + ">";
    }

    return res.message() + " [" + std::to_string(r.from) + ", " + std::to_string(r.to) + "): '" + fragment + "'";
}

} // namespace RecordFusion
