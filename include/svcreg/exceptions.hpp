#pragma once

#include "export.hpp"
#include "lookup_kind.hpp"

#include <exception>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <typeindex>
#include <vector>

namespace svcreg {

namespace internal {
/// Demangle a type_index to human-readable name (GCC/Clang ABI-based).
SVCREG_EXPORT std::string demangle(std::type_index type);

/// demangle() with "(anonymous namespace)::" qualifiers removed; used for
/// every type and registry name that appears in a message.
SVCREG_EXPORT std::string display_name(std::type_index type);
} // namespace internal

class SVCREG_EXPORT registry_error : public std::runtime_error {
public:
    explicit registry_error(const std::string& message,
                            std::source_location loc = std::source_location::current());

    const std::source_location& location() const noexcept { return location_; }

    /// Set extended diagnostic detail (e.g. registration stacktrace).
    void set_diagnostic_detail(std::string detail);

    /// Get extended diagnostic detail (empty if none).
    const std::string& diagnostic_detail() const noexcept { return diagnostic_detail_; }

    /// Return what() plus diagnostic detail (if present), separated by newline.
    std::string full_diagnostic() const;

private:
    std::source_location location_;
    std::string diagnostic_detail_;

    static std::string format_message(const std::string& msg,
                                      const std::source_location& loc);
};

// ---------------------------------------------------------------
// Request-level failures
// ---------------------------------------------------------------

/// The request itself can never be satisfied (array or raw factory type).
class SVCREG_EXPORT invalid_request : public registry_error {
public:
    using registry_error::registry_error;
};

/// Nothing in the registry, its nested registries or its parents matched.
/// This is the only failure a registry swallows when delegating.
class SVCREG_EXPORT unknown_service : public registry_error {
public:
    unknown_service(lookup_kind kind, std::string_view type_name,
                    std::string_view registry_name,
                    std::source_location loc = std::source_location::current());

    lookup_kind kind() const noexcept { return kind_; }
    const std::string& type_name() const noexcept { return type_name_; }

private:
    lookup_kind kind_;
    std::string type_name_;
};

class SVCREG_EXPORT closed_registry : public registry_error {
public:
    closed_registry(lookup_kind kind, std::string_view type_name,
                    std::string_view registry_name,
                    std::source_location loc = std::source_location::current());

    /// For registration and composition calls on a closed registry.
    closed_registry(std::string_view action, std::string_view registry_name,
                    std::source_location loc = std::source_location::current());
};

// ---------------------------------------------------------------
// Service lookup failures
// ---------------------------------------------------------------

class SVCREG_EXPORT service_lookup_error : public registry_error {
public:
    using registry_error::registry_error;
};

class SVCREG_EXPORT ambiguous_service : public service_lookup_error {
public:
    ambiguous_service(lookup_kind kind, std::string_view type_name,
                      std::string_view registry_name,
                      std::source_location loc = std::source_location::current());
};

/// A parameter of a provider method could not be resolved.
class SVCREG_EXPORT missing_dependency : public service_lookup_error {
public:
    missing_dependency(std::string_view service_type, std::string_view method,
                       std::string_view required_type, bool from_parents,
                       std::source_location loc = std::source_location::current());

    const std::string& required_type() const noexcept { return required_type_; }

private:
    std::string required_type_;
};

class SVCREG_EXPORT cyclic_dependency : public service_lookup_error {
public:
    cyclic_dependency(std::string_view service_type, std::string_view method,
                      std::source_location loc = std::source_location::current());
};

/// A provider method threw, or returned an empty pointer.
class SVCREG_EXPORT creation_failed : public service_lookup_error {
public:
    /// The method threw `cause`.
    creation_failed(std::string_view service_type, std::string_view method,
                    std::exception_ptr cause,
                    std::source_location loc = std::source_location::current());

    /// The method returned null.
    creation_failed(std::string_view service_type, std::string_view method,
                    std::source_location loc = std::source_location::current());

    /// The exception thrown by the method; null for the null-return case.
    std::exception_ptr cause() const noexcept { return cause_; }

private:
    std::exception_ptr cause_;
};

class SVCREG_EXPORT decorator_without_parent : public service_lookup_error {
public:
    explicit decorator_without_parent(std::source_location loc = std::source_location::current());
};

// ---------------------------------------------------------------
// Teardown
// ---------------------------------------------------------------

/// One or more services or nested registries failed to close.  Every close
/// step still ran; the individual failures are kept in order.
class SVCREG_EXPORT close_error : public registry_error {
public:
    close_error(std::string_view registry_name,
                std::vector<std::exception_ptr> inner,
                std::source_location loc = std::source_location::current());

    const std::vector<std::exception_ptr>& inner_exceptions() const noexcept { return inner_; }
    std::size_t inner_exception_count() const noexcept { return inner_.size(); }

private:
    std::vector<std::exception_ptr> inner_;
};

} // namespace svcreg
