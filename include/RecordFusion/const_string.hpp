#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace RecordFusion {

// Literal usable as a non-type template parameter: record_type<"HD">, Field<&S::m, "name">.
template <std::size_t N> struct ConstString
{
    constexpr ConstString(const char (&literal)[N+1]) {
        for(std::size_t i = 0; i < N+1; i ++) {
            m_data[i] = literal[i];
        }
    }
    char m_data[N+1];
    static constexpr std::size_t Length = N;

    // Tags and field names are compared byte-wise against the input line,
    // so control characters in them are almost certainly a typo.
    constexpr bool isPrintable() const {
        for(std::size_t i = 0; i < N; i ++) {
            if(std::uint8_t(m_data[i]) < 32 || std::uint8_t(m_data[i]) == 127) return false;
        }
        return true;
    }
    constexpr std::string_view toStringView() const {
        return {&m_data[0], N};
    }
    constexpr bool operator==(std::string_view other) const {
        return toStringView() == other;
    }
};
template <std::size_t N>
ConstString(const char (&str)[N])->ConstString<N-1>;

} // namespace RecordFusion
