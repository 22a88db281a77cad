#pragma once

/// @file fwd.hpp
/// Forward declarations for all public svcreg symbols.
/// Include this header when you only need to name a type (pointers,
/// references, function parameters) without requiring its full definition.

#include "export.hpp"

namespace svcreg {

// lookup_kind.hpp
enum class lookup_kind;

// lifecycle.hpp
class closeable;
class stoppable;

// type_node.hpp
struct base_link;
struct type_node;

// type_key.hpp
enum class request_shape;
enum class variance;
class type_key;

// service_ref.hpp
class service_ref;

// factory.hpp
class factory_base;
template <typename T>
class factory;

// exceptions.hpp
class registry_error;
class invalid_request;
class unknown_service;
class closed_registry;
class service_lookup_error;
class ambiguous_service;
class missing_dependency;
class cyclic_dependency;
class creation_failed;
class decorator_without_parent;
class close_error;

// service_registry.hpp
class service_registry;

// descriptor.hpp
struct registry_options;
struct method_binding;
class parameter_source;

// registry.hpp
class service_registration;
class default_service_registry;

} // namespace svcreg
