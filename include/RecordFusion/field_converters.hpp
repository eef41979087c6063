#pragma once

#include <concepts>
#include <cstddef>
#include <limits>
#include <string>
#include <string_view>
#include <type_traits>

#ifndef RECORDFUSION_USE_FAST_FLOAT
#define RECORDFUSION_USE_FAST_FLOAT 1  // desktop default
#endif

#if RECORDFUSION_USE_FAST_FLOAT
#include <fast_double_parser.h>
#else
#include <cstdlib>
#endif

namespace RecordFusion {

// Converts the slice of a line that belongs to one field into the field's
// C++ type. A converter never trims: padding is part of the slice, so a
// space-padded number is a conversion failure unless the target type is a
// string.
namespace field_converters {

#ifndef RECORDFUSION_NUMBER_BUF_SIZE
constexpr std::size_t NumberBufSize = 64;
#else
constexpr std::size_t NumberBufSize = RECORDFUSION_NUMBER_BUF_SIZE;
#endif

// Optional sign, then one or more decimal digits and nothing else.
template <class Int>
constexpr bool parse_decimal_integer(std::string_view text, Int& out) noexcept {
    static_assert(std::is_integral_v<Int>, "[[[ RecordFusion ]]] Int must be an integral type");

    using Limits   = std::numeric_limits<Int>;
    using Unsigned = std::make_unsigned_t<Int>;

    std::size_t i = 0;
    bool negative = false;

    if(i < text.size() && (text[i] == '+' || text[i] == '-')) {
        negative = (text[i] == '-');
        ++i;
    }
    if constexpr (!std::is_signed_v<Int>) {
        if(negative) return false;
    }
    if(i == text.size()) {
        return false;
    }

    // Absolute-value limit we must not exceed while parsing
    Unsigned limit;
    if constexpr (std::is_signed_v<Int>) {
        limit = negative ? Unsigned(Limits::max()) + 1u
                         : Unsigned(Limits::max());
    } else {
        limit = Limits::max();
    }

    Unsigned value = 0;
    for(; i < text.size(); ++i) {
        if(text[i] < '0' || text[i] > '9') {
            return false;
        }
        unsigned digit = static_cast<unsigned>(text[i] - '0');
        if(value > (limit - digit) / 10u) {
            return false; // overflow
        }
        value = static_cast<Unsigned>(value * 10u + digit);
    }

    if constexpr (std::is_signed_v<Int>) {
        if(negative) {
            // -(limit) may not be representable before the cast
            out = value == Unsigned(Limits::max()) + 1u ? Limits::min()
                                                         : static_cast<Int>(-static_cast<Int>(value));
            return true;
        }
    }
    out = static_cast<Int>(value);
    return true;
}

// Whole slice must be a number; runtime only.
inline bool parse_floating(std::string_view text, double& out) {
    if(text.empty() || text.size() >= NumberBufSize) {
        return false;
    }
    char buf[NumberBufSize];
    std::size_t n = 0;
    // fast_double_parser does not take an explicit '+'
    std::size_t i = (text[0] == '+' && text.size() > 1) ? 1 : 0;
    // one sign at most
    if(i == 1 && (text[1] == '+' || text[1] == '-')) {
        return false;
    }
    for(; i < text.size(); i ++) {
        buf[n++] = text[i];
    }
    buf[n] = 0;

#if RECORDFUSION_USE_FAST_FLOAT
    const char* endp = fast_double_parser::parse_number(buf, &out);
    return endp != nullptr && endp == buf + n;
#else
    char* endp = nullptr;
    double x = std::strtod(buf, &endp);
    if(endp != buf + n) {
        return false;
    }
    out = x;
    return true;
#endif
}

template<class T>
struct text_converter;

template<class T>
    requires (std::is_integral_v<T> && !std::is_same_v<T, bool> && !std::is_same_v<T, char>)
struct text_converter<T> {
    static constexpr bool convert(std::string_view text, T & out) {
        return parse_decimal_integer<T>(text, out);
    }
};

template<class T>
    requires std::is_floating_point_v<T>
struct text_converter<T> {
    static bool convert(std::string_view text, T & out) {
        double x;
        if(!parse_floating(text, x)) {
            return false;
        }
        if constexpr (!std::is_same_v<T, double>) {
            if(static_cast<double>(std::numeric_limits<T>::lowest()) > x
                || static_cast<double>(std::numeric_limits<T>::max()) < x) {
                return false;
            }
        }
        out = static_cast<T>(x);
        return true;
    }
};

template<>
struct text_converter<bool> {
    static constexpr bool convert(std::string_view text, bool & out) {
        if(text == "true")  { out = true;  return true; }
        if(text == "false") { out = false; return true; }
        return false;
    }
};

template<>
struct text_converter<char> {
    static constexpr bool convert(std::string_view text, char & out) {
        if(text.size() != 1) return false;
        out = text[0];
        return true;
    }
};

template<>
struct text_converter<std::string> {
    static constexpr bool convert(std::string_view text, std::string & out) {
        out.assign(text.data(), text.size());
        return true;
    }
};

// User types: constexpr bool transform_from(std::string_view)
template<class T>
concept TextTransformer = requires(T & t, std::string_view sv) {
    { t.transform_from(sv) } -> std::convertible_to<bool>;
};

template<class T>
    requires TextTransformer<T>
struct text_converter<T> {
    static constexpr bool convert(std::string_view text, T & out) {
        return static_cast<bool>(out.transform_from(text));
    }
};

template<class T>
concept ConvertibleFromText = requires(std::string_view sv, T & t) {
    { text_converter<T>::convert(sv, t) } -> std::same_as<bool>;
};

template<ConvertibleFromText T>
constexpr bool FromText(std::string_view text, T & out) {
    return text_converter<T>::convert(text, out);
}

} // namespace field_converters
} // namespace RecordFusion
