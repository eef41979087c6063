#pragma once
#include <cstddef>
#include <string_view>
#include <type_traits>
#include "annotated.hpp"
#include "const_string.hpp"
#include "struct_introspection.hpp"

namespace RecordFusion {


namespace options {

namespace detail {

struct record_type_tag{};
struct starts_at_tag{};
struct ends_at_tag{};
struct length_tag{};
struct description_tag{};

}

// Tag literal identifying a record alternative. May be repeated on the same
// alternative to accept several spellings of the tag.
template<ConstString Tag>
struct record_type {
    static_assert(Tag.isPrintable(), "[[[ RecordFusion ]]] record_type contains control characters");
    using tag = detail::record_type_tag;
    static constexpr auto desc = Tag;
    static constexpr std::string_view to_string() {
        return "record_type";
    }
};

// Position hints. Folded in declaration order, see offset_resolver.hpp.
template<std::size_t N>
struct starts_at {
    using tag = detail::starts_at_tag;
    static constexpr std::size_t value = N;
    static constexpr std::string_view to_string() {
        return "starts_at";
    }
};

template<std::size_t N>
struct ends_at {
    using tag = detail::ends_at_tag;
    static constexpr std::size_t value = N;
    static constexpr std::string_view to_string() {
        return "ends_at";
    }
};

template<std::size_t N>
struct length {
    using tag = detail::length_tag;
    static constexpr std::size_t value = N;
    static constexpr std::string_view to_string() {
        return "length";
    }
};

// Free-form documentation of a field; never affects layout.
template<ConstString Desc>
struct description {
    static_assert(Desc.isPrintable(), "[[[ RecordFusion ]]] description contains control characters");
    using tag = detail::description_tag;
    static constexpr auto desc = Desc;
    static constexpr std::string_view to_string() {
        return "description";
    }
};

namespace detail {


template<class Opt, class Tag, class = void>
struct option_matches_tag : std::false_type {};

template<class Opt, class Tag>
struct option_matches_tag<Opt, Tag, std::void_t<typename Opt::tag>>
    : std::bool_constant<std::is_same_v<typename Opt::tag, Tag>> {};

template<class Opt>
inline constexpr bool is_record_type_v = option_matches_tag<Opt, record_type_tag>::value;


template<class OptPack> struct field_options;
template<class... Opts>
struct field_options<OptionsPack<Opts...>> {

    template<class Tag>
    static constexpr std::size_t count_option = (std::size_t{0} + ... + (option_matches_tag<Opts, Tag>::value ? 1 : 0));
};


template<class T>
struct is_options_pack : std::false_type {};

template<class... Opts>
struct is_options_pack<OptionsPack<Opts...>> : std::true_type {};

template<class T>
inline constexpr bool is_options_pack_v = is_options_pack<T>::value;


// Externally annotated types: template<> struct Annotated<Header> { using Options = OptionsPack<...>; };
template<class T, class = void>
struct has_annotation_specialization_impl : std::false_type {};

template<class T>
struct has_annotation_specialization_impl<T,
                                          std::void_t<typename Annotated<T>::Options>
                                          > : std::bool_constant<
                                                                 is_options_pack_v<typename Annotated<T>::Options>
                                                                    && (Annotated<T>::Options::Count > 0)
                                                                 > {};

template<class T>
inline constexpr bool has_annotation_specialization =
    has_annotation_specialization_impl<T>::value;

template<class Field>
struct annotation_meta{};

template<class T>
    requires (!has_annotation_specialization<T>)
struct annotation_meta<T> {
    using value_t = T;
    using OptionsP = OptionsPack<>;
    using options  = field_options<OptionsP>;
    static constexpr decltype(auto) getRef(T & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }
};

template<class T, class... Opts>
struct annotation_meta<Annotated<T, Opts...>> {
    using value_t  = T;
    using OptionsP = OptionsPack<Opts...>;
    using options  = field_options<OptionsP>;

    static constexpr decltype(auto) getRef(Annotated<T, Opts...> & f) {
        return (f.value);
    }
    static constexpr decltype(auto) getRef(const Annotated<T, Opts...> & f) {
        return (f.value);
    }

    // StructMeta registered fields hand out the bare member, the
    // annotation only exists at the type level.
    static constexpr decltype(auto) getRef(T & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }
};

template<class T> requires has_annotation_specialization<T>
struct annotation_meta<T> {
    using value_t  = T;
    using OptionsP = typename Annotated<T>::Options;
    using options  = field_options<OptionsP>;

    static constexpr decltype(auto) getRef(T & f) {
        return (f);
    }
    static constexpr decltype(auto) getRef(const T & f) {
        return (f);
    }
};

template<class Field>
struct annotation_meta_getter : annotation_meta<std::remove_cvref_t<Field>> {};


template<class AggregateT, std::size_t Index>
struct aggregate_field_meta {
    using FieldT = introspection::structureElementTypeByIndex<Index, AggregateT>;
    using Meta   = annotation_meta_getter<FieldT>;
};

template<class AggregateT, std::size_t Index>
using aggregate_field_meta_getter = typename aggregate_field_meta<std::remove_cvref_t<AggregateT>, Index>::Meta;

} // namespace detail


} //namespace options


} // namespace RecordFusion
