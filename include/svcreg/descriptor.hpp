#pragma once

#include "export.hpp"
#include "service_ref.hpp"
#include "type_key.hpp"
#include "type_node.hpp"
#include "type_traits.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace svcreg {

class service_registry;

// ---------------------------------------------------------------
// registry_options
// ---------------------------------------------------------------

struct registry_options {
    /// Name used in messages.  Empty means the demangled dynamic type of the
    /// registry.
    std::string display_name;

    /// Record where each provider method was bound and attach the trace to
    /// lookup failures (requires stacktrace support).
    bool capture_stacktraces = false;
};

// ---------------------------------------------------------------
// parameter_source: what a bound method resolves its arguments from
// ---------------------------------------------------------------

/// Implemented by the registry for each bound method being created.
class SVCREG_EXPORT parameter_source {
public:
    virtual ~parameter_source() = default;

    /// Resolve an ordinary parameter against the owning registry.
    virtual service_ref resolve(const type_key& key) = 0;

    /// Resolve the first parameter of a decorator from the parent registries.
    virtual service_ref resolve_decorated(const type_key& key) = 0;

    /// The owning registry, for `service_registry&` parameters.
    virtual service_registry& registry() = 0;

    /// Run the method body once its arguments are resolved.
    virtual service_ref invoke(const std::function<service_ref()>& body) = 0;
};

// ---------------------------------------------------------------
// method_binding: one provider method, ready to be turned into a service
// ---------------------------------------------------------------

struct method_binding {
    std::string method_name;                 // "provider::create_x()"
    const type_node* service_type = nullptr;
    bool is_decorator = false;
    std::function<service_ref(parameter_source&)> invoke;
};

/// A provider member function and the name it is reported under.
template <typename Fn>
struct method_ref {
    Fn fn;
    std::string_view name;
};

template <typename Fn>
    requires std::is_member_function_pointer_v<Fn>
constexpr method_ref<Fn> method(Fn fn, std::string_view name) noexcept {
    return method_ref<Fn>{fn, name};
}

namespace detail {

template <typename>
inline constexpr bool always_false = false;

// ---------------------------------------------------------------
// param_traits: how each supported parameter form is injected
// ---------------------------------------------------------------

template <typename A>
struct param_traits {
    static_assert(always_false<A>,
        "provider method parameters must be T&, const T&, std::shared_ptr<T>, "
        "const std::shared_ptr<T>& or service_registry&");
};

/// T& / const T&: the value is kept alive by the stored shared_ptr.
template <typename T>
struct param_traits<T&> {
    using service_type = std::remove_const_t<T>;
    using stored_type  = std::shared_ptr<service_type>;
    static constexpr bool is_registry = false;
    static T& unwrap(stored_type& s) { return *s; }
};

template <typename T>
struct param_traits<std::shared_ptr<T>> {
    using service_type = std::remove_const_t<T>;
    using stored_type  = std::shared_ptr<service_type>;
    static constexpr bool is_registry = false;
    static stored_type& unwrap(stored_type& s) { return s; }
};

template <typename T>
struct param_traits<const std::shared_ptr<T>&> : param_traits<std::shared_ptr<T>> {};

/// service_registry&: the owning registry itself.
template <>
struct param_traits<service_registry&> {
    using service_type = service_registry;
    using stored_type  = service_registry*;
    static constexpr bool is_registry = true;
    static service_registry& unwrap(stored_type s) { return *s; }
};

/// A method whose first parameter is the type it returns wraps the value
/// the parent registries hold for that type.
template <typename X, typename... Args>
struct decorates : std::false_type {};

template <typename X, typename First, typename... Rest>
struct decorates<X, First, Rest...>
    : std::bool_constant<!param_traits<First>::is_registry
                         && std::is_same_v<typename param_traits<First>::service_type, X>> {};

template <typename A>
typename param_traits<A>::stored_type inject(parameter_source& src, bool from_parents) {
    using traits = param_traits<A>;
    if constexpr (traits::is_registry) {
        return &src.registry();
    } else {
        using S = typename traits::service_type;
        auto key = type_key::service(type_of<S>());
        service_ref ref = from_parents ? src.resolve_decorated(key) : src.resolve(key);
        return ref.template as<S>();
    }
}

template <typename P, typename Fn, typename... Args, std::size_t... Is>
service_ref call_method(P* self, Fn fn, parameter_source& src, bool is_decorator,
                        std::index_sequence<Is...>) {
    // Braced initialization resolves the parameters left to right.
    std::tuple<typename param_traits<Args>::stored_type...> args{
        inject<Args>(src, is_decorator && Is == 0)...};
    return src.invoke([&]() -> service_ref {
        return service_ref(std::invoke(fn, self, param_traits<Args>::unwrap(std::get<Is>(args))...));
    });
}

template <typename X, typename P, typename Fn, typename... Args>
method_binding make_binding(P* self, Fn fn, std::string method_name, std::tuple<Args...>*) {
    constexpr bool is_decorator = decorates<X, Args...>::value;
    return method_binding{
        .method_name  = std::move(method_name),
        .service_type = &type_of<X>(),
        .is_decorator = is_decorator,
        .invoke = [self, fn](parameter_source& src) {
            return call_method<P, Fn, Args...>(self, fn, src, is_decorator,
                                               std::index_sequence_for<Args...>{});
        }};
}

/// Bind one method of `self`, reporting it as "provider_name::name()".
template <typename P, typename Fn>
method_binding bind_method(P* self, const std::string& provider_name,
                           const method_ref<Fn>& ref) {
    using traits = member_function_traits<Fn>;
    static_assert(derived_from_base<P, typename traits::class_type>,
                  "method does not belong to the provider");
    static_assert(provider_return<typename traits::return_type>,
                  "provider methods must return std::shared_ptr<T>");
    using X = typename provided_type<typename traits::return_type>::type;
    return make_binding<X>(self, ref.fn,
                           provider_name + "::" + std::string(ref.name) + "()",
                           static_cast<typename traits::args*>(nullptr));
}

} // namespace detail

} // namespace svcreg

/// Name a provider method for add_provider / add_own_methods:
///
///     reg.add_provider(p, SVCREG_METHOD(my_provider, create_cache));
#define SVCREG_METHOD(provider_type, name) \
    ::svcreg::method(&provider_type::name, #name)
