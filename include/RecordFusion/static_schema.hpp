#pragma once
#include <type_traits>
#include <variant>

#include "options.hpp"
#include "struct_introspection.hpp"

namespace RecordFusion {

namespace static_schema {

template<class T, template<class...> class Template>
struct is_specialization_of : std::false_type {};

template<template<class...> class Template, class... Args>
struct is_specialization_of<Template<Args...>, Template> : std::true_type {};

template<class T, template<class...> class Template>
constexpr bool is_specialization_of_v =
    is_specialization_of<std::remove_cvref_t<T>, Template>::value;


using options::detail::annotation_meta_getter;

template<class Field>
using AnnotatedValue = typename annotation_meta_getter<Field>::value_t;


// A record alternative is a plain aggregate, optionally wrapped in or
// externally specialized with Annotated<> carrying its record_type.
template<class T>
concept RecordStruct =
    std::is_class_v<T>
    && std::is_aggregate_v<T>
    && !is_specialization_of_v<T, Annotated>
    && std::is_default_constructible_v<T>;

template<class Alt>
concept RecordAlternative = RecordStruct<AnnotatedValue<Alt>>;

template<class V>
concept TaggedRecordModel = is_specialization_of_v<V, std::variant>;

template<class V>
struct variant_alternatives_ok : std::false_type {};

template<class... Alts>
struct variant_alternatives_ok<std::variant<Alts...>> : std::bool_constant<(RecordAlternative<Alts> && ...)> {};

template<class V>
concept RecordModel = TaggedRecordModel<V> && variant_alternatives_ok<std::remove_cvref_t<V>>::value;

} // namespace static_schema
} // namespace RecordFusion
