#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <utility>

namespace RecordFusion {

template <class... Opts>
struct OptionsPack {
    static constexpr std::size_t Count = sizeof...(Opts);
};

// Attaches options (position hints, record_type, ...) to a field or to a
// record alternative. The wrapped value behaves like T for the user.
template <class T, typename... Options>
struct Annotated {
    T value{};
    using value_type = T;

    constexpr Annotated() = default;
    constexpr Annotated(const Annotated&) = default;
    constexpr Annotated(Annotated&&) = default;
    constexpr Annotated& operator=(const Annotated&) = default;
    constexpr Annotated& operator=(Annotated&&) = default;

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated(U&& u) : value(std::forward<U>(u)) {}

    template<class U>
        requires std::convertible_to<U, T>
    constexpr Annotated& operator=(U&& u) {
        value = std::forward<U>(u);
        return *this;
    }

    constexpr operator T&()             { return value; }
    constexpr operator const T&() const { return value; }

    constexpr T*       operator->()       { return std::addressof(value); }
    constexpr const T* operator->() const { return std::addressof(value); }

    constexpr T&       get()       { return value; }
    constexpr const T& get() const { return value; }
};

template <class T, typename... Options>
using A = Annotated<T, Options...>;

template<class T, class... OptsL, class... OptsR>
constexpr bool operator==(const Annotated<T, OptsL...>& lhs,
                const Annotated<T, OptsR...>& rhs)
    noexcept(noexcept(lhs.value == rhs.value))
{
    return lhs.value == rhs.value;
}

template<class T, class... Opts, class U>
    requires requires (const T& t, const U& u) { t == u; }
constexpr bool operator==(const Annotated<T, Opts...>& lhs,
                const U& rhs)
    noexcept(noexcept(std::declval<const T&>() == std::declval<const U&>()))
{
    return lhs.value == rhs;
}

} // namespace RecordFusion
