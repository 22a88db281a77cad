#pragma once

#include "export.hpp"
#include "factory.hpp"
#include "service_ref.hpp"
#include "type_key.hpp"
#include "type_node.hpp"
#include "type_traits.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace svcreg {

namespace detail {

// ---------------------------------------------------------------
// request_traits: how get<T>() phrases and converts a request
// ---------------------------------------------------------------

/// Primary: plain request for T, returned as std::shared_ptr<T>.  This
/// covers factory<U> (an exact factory request) and void (any service).
template <typename T>
struct request_traits {
    using result_type = std::shared_ptr<T>;
    static type_key key() { return type_key::service(type_of<T>()); }
    static result_type convert(const service_ref& ref) { return ref.as<T>(); }
};

/// Arrays are never resolvable; the key is rejected before any lookup.
template <typename T>
struct request_traits<T[]> {
    using result_type = std::shared_ptr<std::remove_all_extents_t<T>>;
    static type_key key() { return type_key::service(type_of<T[]>()); }
    static result_type convert(const service_ref&) { return nullptr; }
};

template <typename T, std::size_t N>
struct request_traits<T[N]> {
    using result_type = std::shared_ptr<std::remove_all_extents_t<T>>;
    static type_key key() { return type_key::service(type_of<T[N]>()); }
    static result_type convert(const service_ref&) { return nullptr; }
};

template <typename U>
struct request_traits<factory<extends<U>>> {
    using result_type = std::shared_ptr<factory_base>;
    static type_key key() { return type_key::factory(type_of<U>(), variance::extends); }
    static result_type convert(const service_ref& ref) { return ref.as<factory_base>(); }
};

template <typename U>
struct request_traits<factory<super<U>>> {
    using result_type = std::shared_ptr<factory_base>;
    static type_key key() { return type_key::factory(type_of<U>(), variance::super); }
    static result_type convert(const service_ref& ref) { return ref.as<factory_base>(); }
};

template <typename T>
using request_result_t = typename request_traits<T>::result_type;

} // namespace detail

// ---------------------------------------------------------------
// service_registry: the query interface
// ---------------------------------------------------------------

/// Read side of a registry.  Parents and nested registries are consulted
/// through this interface only, so any implementation can take part in a
/// registry hierarchy.
class SVCREG_EXPORT service_registry {
public:
    virtual ~service_registry() = default;

    /// Locate the single service matching `key`.  Throws unknown_service
    /// when nothing matches.
    virtual service_ref get_service(const type_key& key) = 0;

    /// Every service matching `key`; empty when nothing matches.
    virtual std::vector<service_ref> get_all_services(const type_key& key) = 0;

    /// Locate the single factory whose product is-a `product`.  Throws
    /// unknown_service when there is none.
    virtual service_ref get_factory_service(const type_node& product) = 0;

    template <typename T>
    detail::request_result_t<T> get() {
        using traits = detail::request_traits<T>;
        return traits::convert(get_service(traits::key()));
    }

    template <typename T>
    std::vector<detail::request_result_t<T>> get_all() {
        using traits = detail::request_traits<T>;
        auto refs = get_all_services(traits::key());
        std::vector<detail::request_result_t<T>> result;
        result.reserve(refs.size());
        for (const auto& ref : refs) result.push_back(traits::convert(ref));
        return result;
    }

    /// A factory producing T or any descendant of T.
    template <typename T>
    std::shared_ptr<factory_base> get_factory() {
        return get_factory_service(type_of<T>()).template as<factory_base>();
    }

    /// A new T from the factory located by get_factory<T>().  Only the
    /// factory lookup is cached; every call creates a new value.
    template <typename T>
    std::shared_ptr<T> new_instance() {
        return get_factory<T>()->template create_as<T>();
    }
};

} // namespace svcreg
