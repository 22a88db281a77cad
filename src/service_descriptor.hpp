#pragma once

// Internal: one resolvable unit of a registry.  Not installed.

#include "svcreg/descriptor.hpp"
#include "svcreg/service_ref.hpp"
#include "svcreg/type_node.hpp"

#include <any>
#include <atomic>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace svcreg {

class default_service_registry;
class service_registry;

namespace internal {

/// Thrown by service_descriptor::get() when resolving would wait on the
/// calling thread itself.  Never leaves the library: the innermost
/// descriptor being created on that thread turns it into cyclic_dependency.
class reentrant_resolution : public std::exception {
public:
    const char* what() const noexcept override;
};

// ---------------------------------------------------------------
// service_descriptor
// ---------------------------------------------------------------

class service_descriptor {
public:
    virtual ~service_descriptor() = default;

    service_descriptor(const service_descriptor&) = delete;
    service_descriptor& operator=(const service_descriptor&) = delete;

    const type_node& declared_type() const noexcept { return type_; }

    /// The value, creating it on first call.  Concurrent first calls create
    /// it once; a failure is recorded and rethrown on every later call.
    service_ref get();

    /// The value if it has been created, else an empty ref.
    service_ref created() const;

protected:
    explicit service_descriptor(const type_node& type);
    service_descriptor(const type_node& type, service_ref value);

    virtual service_ref create() = 0;

    /// The error reported when creating this descriptor closes a cycle.
    virtual std::exception_ptr cycle_error() const = 0;

private:
    enum class state { unresolved, resolving, resolved, failed };

    void wait_for_resolution(std::unique_lock<std::mutex>& lock);

    const type_node& type_;

    mutable std::mutex mutex_;
    std::condition_variable resolved_cv_;
    state state_;
    std::atomic<std::thread::id> resolving_thread_{};
    service_ref value_;
    std::exception_ptr failure_;
};

/// A value registered with add().
class instance_service final : public service_descriptor {
public:
    explicit instance_service(service_ref value);

protected:
    service_ref create() override;
    std::exception_ptr cycle_error() const override;
};

/// A bound provider method.
class method_service final : public service_descriptor, private parameter_source {
public:
    method_service(default_service_registry& owner,
                   std::vector<service_registry*> parents,
                   method_binding binding,
                   std::any registration_trace);

protected:
    service_ref create() override;
    std::exception_ptr cycle_error() const override;

private:
    service_ref resolve(const type_key& key) override;
    service_ref resolve_decorated(const type_key& key) override;
    service_registry& registry() override;
    service_ref invoke(const std::function<service_ref()>& body) override;

    /// Attach the registration trace to an error raised for this method.
    template <typename E>
    E with_trace(E error) const;

    default_service_registry& owner_;
    std::vector<service_registry*> parents_;
    method_binding binding_;
    std::any registration_trace_;
};

} // namespace internal
} // namespace svcreg
