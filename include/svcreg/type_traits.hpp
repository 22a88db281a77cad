#pragma once

#include <memory>
#include <tuple>
#include <type_traits>

namespace svcreg {

class factory_base;
template <typename T>
class factory;

// ---------------------------------------------------------------
// Core concepts
// ---------------------------------------------------------------

/// TDerived derives from TBase (or TDerived == TBase).
template <typename TDerived, typename TBase>
concept derived_from_base = std::is_base_of_v<TBase, TDerived>;

// ---------------------------------------------------------------
// Declared service ancestry
// ---------------------------------------------------------------

/// Compile-time list of the direct bases a service type is known by.
template <typename... Bases>
struct base_list {};

/// Customization point: the direct bases a request for T may be satisfied
/// through.  Specialize with SVCREG_BASES.  Types without a specialization
/// only satisfy requests for themselves and for `void`.
template <typename T>
struct service_bases {
    using type = base_list<>;
};

/// Variance bounds for factory requests: `factory<extends<number>>` accepts
/// any factory whose product is-a number, `factory<super<integer>>` any
/// factory whose product integer is-a.
template <typename T>
struct extends { using type = T; };

template <typename T>
struct super { using type = T; };

// ---------------------------------------------------------------
// Factory detection
// ---------------------------------------------------------------

template <typename T>
struct is_factory_specialization : std::false_type {};

template <typename P>
struct is_factory_specialization<factory<P>> : std::true_type {
    using product_type = P;
};

/// T is a concrete factory: it derives from factory<T::product_type>.
template <typename T>
concept factory_type = requires { typename T::product_type; }
    && std::is_base_of_v<factory<typename T::product_type>, T>;

// ---------------------------------------------------------------
// member_function_traits: decompose a provider method pointer
// ---------------------------------------------------------------

template <typename Fn>
struct member_function_traits;

template <typename R, typename C, typename... Args>
struct member_function_traits<R (C::*)(Args...)> {
    using return_type = R;
    using class_type  = C;
    using args        = std::tuple<Args...>;
    static constexpr std::size_t arity = sizeof...(Args);
};

template <typename R, typename C, typename... Args>
struct member_function_traits<R (C::*)(Args...) const>
    : member_function_traits<R (C::*)(Args...)> {};

template <typename R, typename C, typename... Args>
struct member_function_traits<R (C::*)(Args...) noexcept>
    : member_function_traits<R (C::*)(Args...)> {};

template <typename R, typename C, typename... Args>
struct member_function_traits<R (C::*)(Args...) const noexcept>
    : member_function_traits<R (C::*)(Args...)> {};

/// Provider methods must return std::shared_ptr<X>.
template <typename R>
struct provided_type;

template <typename X>
struct provided_type<std::shared_ptr<X>> {
    using type = X;
};

template <typename R>
concept provider_return = requires { typename provided_type<R>::type; }
    && !std::is_const_v<typename provided_type<R>::type>;

} // namespace svcreg

/// Declare the direct bases a service type is known by.  Must be used at
/// global scope, after the type is complete:
///
///     SVCREG_BASES(integer, number);
///     SVCREG_BASES(file_cache, cache, svcreg::closeable);
#define SVCREG_BASES(service_type, ...)                               \
    template <>                                                       \
    struct svcreg::service_bases<service_type> {                      \
        using type = ::svcreg::base_list<__VA_ARGS__>;                \
    }
