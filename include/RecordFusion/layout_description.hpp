#pragma once

#include <cstddef>
#include <string>

#include "compiler.hpp"
#include "schema_builder.hpp"

namespace RecordFusion {

namespace layout_description_detail {

constexpr void append_unsigned(std::string & out, std::size_t value) {
    char buf[24];
    char * p = buf + sizeof(buf);
    do {
        *--p = static_cast<char>('0' + value % 10u);
        value /= 10u;
    } while(value != 0);
    out.append(p, static_cast<std::size_t>(buf + sizeof(buf) - p));
}

} // namespace layout_description_detail

/*
 * One block per dispatch arm, in dispatch order:
 *
 *   "HD" Header
 *     name [2, 12) len 10
 *     age [12, 15) len 3
 */
constexpr std::string DescribeLayout(const CompiledSchema & s) {
    using layout_description_detail::append_unsigned;
    std::string out;
    for(const CompiledVariant & arm : s.arms) {
        out += '"';
        out += arm.tag;
        out += "\" ";
        out += arm.variantName;
        out += '\n';
        for(const ResolvedField & f : arm.fields) {
            out += "  ";
            out += f.name;
            out += " [";
            append_unsigned(out, f.from);
            out += ", ";
            append_unsigned(out, f.to);
            out += ") len ";
            append_unsigned(out, f.length());
            out += '\n';
        }
    }
    return out;
}

// Typed model: empty when the model does not compile.
template<class V>
constexpr std::string DescribeLayout() {
    CompileResult compiled = Compile(schema_builder::BuildSchema<V>());
    if(!compiled) {
        return {};
    }
    return DescribeLayout(compiled.schema());
}

} // namespace RecordFusion
