#pragma once

#include "export.hpp"
#include "exceptions.hpp"
#include "type_traits.hpp"

#include <string>
#include <typeindex>
#include <type_traits>
#include <vector>

namespace svcreg {

struct type_node;

/// One edge of the declared service ancestry.  `upcast` converts a pointer
/// to the derived type into a pointer to `type`.
struct base_link {
    const type_node* type;
    void* (*upcast)(void*) noexcept;
};

// ---------------------------------------------------------------
// type_node: runtime view of a service type
// ---------------------------------------------------------------

/// Runtime identity of a C++ type together with the ancestry a registry
/// matches requests against.  Nodes are created once per type by type_of<T>()
/// and live for the rest of the program.
struct SVCREG_EXPORT type_node {
    std::type_index id = std::type_index(typeid(void));
    std::string name;
    std::vector<base_link> bases;

    /// Set on factory<P> nodes: the node of P.
    const type_node* product = nullptr;

    bool is_top = false;          // void: every service is-a void
    bool is_array = false;        // T[] and T[N]
    bool is_raw_factory = false;  // factory_base

    /// True when a value declared as this type satisfies a request for
    /// `other`.
    bool is_a(const type_node& other) const;

    /// Convert `p`, pointing at an object of this type, into a pointer to
    /// `target`.  Returns nullptr when `target` is not an ancestor.
    void* cast(void* p, const type_node& target) const;

    /// Products of every factory<P> this type is, in ancestry order.
    std::vector<const type_node*> factory_products() const;
};

template <typename T>
const type_node& type_of();

namespace detail {

template <typename T, typename Base>
    requires derived_from_base<T, Base>
base_link make_base_link() {
    return base_link{
        &type_of<Base>(),
        [](void* p) noexcept -> void* {
            return static_cast<Base*>(static_cast<T*>(p));
        }};
}

template <typename T, typename... Bases>
void append_bases(std::vector<base_link>& out, base_list<Bases...>) {
    (out.push_back(make_base_link<T, Bases>()), ...);
}

template <typename T>
type_node make_type_node() {
    type_node node;
    if constexpr (std::is_void_v<T>) {
        node.name = "void";
        node.is_top = true;
    } else if constexpr (std::is_array_v<T>) {
        // typeid of an array of unknown bound is not portable; the node only
        // exists to be rejected, so key it on the pointer type.
        node.id = std::type_index(typeid(std::add_pointer_t<T>));
        node.name = internal::display_name(typeid(std::remove_all_extents_t<T>)) + "[]";
        node.is_array = true;
    } else {
        static_assert(!std::is_const_v<T> && !std::is_reference_v<T>,
                      "service types are plain, non-const object types");
        node.id = std::type_index(typeid(T));
        node.name = internal::display_name(typeid(T));

        if constexpr (std::is_same_v<T, factory_base>) {
            node.name = "factory";
            node.is_raw_factory = true;
        } else if constexpr (is_factory_specialization<T>::value) {
            using P = typename is_factory_specialization<T>::product_type;
            node.product = &type_of<P>();
            node.bases.push_back(make_base_link<T, factory_base>());
        } else if constexpr (factory_type<T>) {
            node.bases.push_back(make_base_link<T, factory<typename T::product_type>>());
        }
        append_bases<T>(node.bases, typename service_bases<T>::type{});
    }
    return node;
}

} // namespace detail

/// The node for T.  Safe to call concurrently.
template <typename T>
const type_node& type_of() {
    static const type_node node = detail::make_type_node<T>();
    return node;
}

} // namespace svcreg
