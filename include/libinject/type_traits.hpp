#pragma once

#include <concepts>
#include <cstddef>
#include <memory>
#include <tuple>
#include <type_traits>

namespace libinject {

// ---------------------------------------------------------------
// Core concepts
// ---------------------------------------------------------------

/// TDerived derives from TBase (or TDerived == TBase for self-registration).
template <typename TDerived, typename TBase>
concept derived_from_base = std::is_base_of_v<TBase, TDerived>;

/// T is default-constructible (zero value available).
template <typename T>
concept default_constructible = std::is_default_constructible_v<T>;

/// T can be compared against its zero value.
template <typename T>
concept zero_comparable = default_constructible<T> && std::equality_comparable<T>;

// ---------------------------------------------------------------
// dependency_traits: map a declared type to the service it names
// ---------------------------------------------------------------

/// Primary: a value dependency.  `int` asks the resolver for `int`.
template <typename D>
struct dependency_traits {
    using service_type = D;
    using storage_type = D;
    static constexpr bool is_reference = false;
};

/// `std::shared_ptr<T>` → reference dependency on service `T`.
template <typename T>
struct dependency_traits<std::shared_ptr<T>> {
    using service_type = T;
    using storage_type = std::shared_ptr<T>;
    static constexpr bool is_reference = true;
};

/// Helper alias.
template <typename D>
using service_type_t = typename dependency_traits<D>::service_type;

/// Declared parameter types are stored without cv/ref qualifiers, so a
/// method taking `const std::shared_ptr<T>&` resolves the same as one
/// taking `std::shared_ptr<T>`.
template <typename A>
using storage_of_t = std::remove_cvref_t<A>;

// ---------------------------------------------------------------
// Member pointer traits
// ---------------------------------------------------------------

template <typename M>
struct field_traits;

template <typename C, typename F>
struct field_traits<F C::*> {
    using class_type = C;
    using field_type = F;
};

template <typename M>
struct method_traits;

template <typename C, typename R, typename... A>
struct method_traits<R (C::*)(A...)> {
    using class_type = C;
    using return_type = R;
    using args = std::tuple<A...>;
    static constexpr std::size_t arity = sizeof...(A);
};

template <typename C, typename R, typename... A>
struct method_traits<R (C::*)(A...) const> : method_traits<R (C::*)(A...)> {};

template <typename C, typename R, typename... A>
struct method_traits<R (C::*)(A...) noexcept> : method_traits<R (C::*)(A...)> {};

template <typename C, typename R, typename... A>
struct method_traits<R (C::*)(A...) const noexcept> : method_traits<R (C::*)(A...)> {};

template <typename M, std::size_t I>
using method_arg_t = storage_of_t<std::tuple_element_t<I, typename method_traits<M>::args>>;

} // namespace libinject
