#include "svcreg/exceptions.hpp"

#include <cstdlib>
#include <memory>
#include <string>
#include <typeindex>

#if defined(__GNUC__)
#include <cxxabi.h>
#endif

namespace svcreg {

namespace internal {

std::string demangle(std::type_index type) {
#if defined(__GNUC__)
    int status = 0;
    std::unique_ptr<char, decltype(&std::free)> demangled(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status),
        &std::free);
    if (status == 0 && demangled) {
        return std::string(demangled.get());
    }
#endif
    return std::string(type.name());
}

std::string display_name(std::type_index type) {
    static constexpr std::string_view anonymous = "(anonymous namespace)::";
    std::string name = demangle(type);
    for (auto pos = name.find(anonymous); pos != std::string::npos;
         pos = name.find(anonymous, pos)) {
        name.erase(pos, anonymous.size());
    }
    return name;
}

} // namespace internal

std::string registry_error::format_message(const std::string& msg,
                                           const std::source_location& loc) {
    return msg + " [at " + loc.file_name() + ":"
           + std::to_string(loc.line()) + "]";
}

registry_error::registry_error(const std::string& message, std::source_location loc)
    : std::runtime_error(format_message(message, loc))
    , location_(loc)
{}

void registry_error::set_diagnostic_detail(std::string detail) {
    diagnostic_detail_ = std::move(detail);
}

std::string registry_error::full_diagnostic() const {
    if (diagnostic_detail_.empty()) {
        return what();
    }
    return std::string(what()) + "\n" + diagnostic_detail_;
}

namespace {

/// "service of type X" / "factory for objects of type X" / "all services of type X"
std::string describe(lookup_kind kind, std::string_view type_name) {
    switch (kind) {
    case lookup_kind::factory:
        return "factory for objects of type " + std::string(type_name);
    case lookup_kind::all_services:
        return "all services of type " + std::string(type_name);
    case lookup_kind::service:
        break;
    }
    return "service of type " + std::string(type_name);
}

} // namespace

unknown_service::unknown_service(lookup_kind kind, std::string_view type_name,
                                 std::string_view registry_name,
                                 std::source_location loc)
    : registry_error("No " + describe(kind, type_name) + " available in "
                     + std::string(registry_name) + ".", loc)
    , kind_(kind)
    , type_name_(type_name)
{}

closed_registry::closed_registry(lookup_kind kind, std::string_view type_name,
                                 std::string_view registry_name,
                                 std::source_location loc)
    : registry_error("Cannot locate " + describe(kind, type_name) + ", as "
                     + std::string(registry_name) + " has been closed.", loc)
{}

closed_registry::closed_registry(std::string_view action,
                                 std::string_view registry_name,
                                 std::source_location loc)
    : registry_error("Cannot " + std::string(action) + ", as "
                     + std::string(registry_name) + " has been closed.", loc)
{}

ambiguous_service::ambiguous_service(lookup_kind kind, std::string_view type_name,
                                     std::string_view registry_name,
                                     std::source_location loc)
    : service_lookup_error(
          (kind == lookup_kind::factory
               ? "Multiple factories for objects of type "
               : "Multiple services of type ")
          + std::string(type_name) + " available in "
          + std::string(registry_name) + ".", loc)
{}

missing_dependency::missing_dependency(std::string_view service_type,
                                       std::string_view method,
                                       std::string_view required_type,
                                       bool from_parents,
                                       std::source_location loc)
    : service_lookup_error("Cannot create service of type " + std::string(service_type)
                           + " using " + std::string(method)
                           + " as required service of type " + std::string(required_type)
                           + (from_parents ? " is not available in parent registries."
                                           : " is not available."), loc)
    , required_type_(required_type)
{}

cyclic_dependency::cyclic_dependency(std::string_view service_type,
                                     std::string_view method,
                                     std::source_location loc)
    : service_lookup_error("Cannot create service of type " + std::string(service_type)
                           + " using " + std::string(method)
                           + " as there is a cycle in its dependencies.", loc)
{}

creation_failed::creation_failed(std::string_view service_type,
                                 std::string_view method,
                                 std::exception_ptr cause,
                                 std::source_location loc)
    : service_lookup_error("Could not create service of type " + std::string(service_type)
                           + " using " + std::string(method) + ".", loc)
    , cause_(std::move(cause))
{}

creation_failed::creation_failed(std::string_view service_type,
                                 std::string_view method,
                                 std::source_location loc)
    : service_lookup_error("Could not create service of type " + std::string(service_type)
                           + " using " + std::string(method)
                           + " as this method returned null.", loc)
{}

decorator_without_parent::decorator_without_parent(std::source_location loc)
    : service_lookup_error("Cannot use decorator methods when no parent registry is provided.", loc)
{}

close_error::close_error(std::string_view registry_name,
                         std::vector<std::exception_ptr> inner,
                         std::source_location loc)
    : registry_error("Could not close " + std::string(registry_name) + ": "
                     + std::to_string(inner.size()) + " close operation(s) failed.", loc)
    , inner_(std::move(inner))
{}

} // namespace svcreg
