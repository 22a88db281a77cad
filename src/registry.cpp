#include "svcreg/registry.hpp"
#include "svcreg/exceptions.hpp"
#include "log.hpp"
#include "service_descriptor.hpp"
#include "stacktrace_utils.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <typeinfo>
#include <utility>
#include <vector>

namespace svcreg {

using internal::instance_service;
using internal::method_service;
using internal::service_descriptor;

namespace {

/// Registries with a lookup in progress on this thread, innermost last.
thread_local std::vector<const default_service_registry*> active_lookups;

bool in_lookup(const default_service_registry* reg) {
    return std::find(active_lookups.begin(), active_lookups.end(), reg)
           != active_lookups.end();
}

/// The type a message names for a request of the given kind.
std::string request_name(lookup_kind kind, const type_key& key) {
    return kind == lookup_kind::factory ? key.type().name : key.display_name();
}

} // namespace

// ---------------------------------------------------------------
// Impl
// ---------------------------------------------------------------

struct default_service_registry::impl {
    enum class state { open, closing, closed };

    registry_options options;
    std::vector<service_registry*> parents;

    // Registrations; held only while scanning, never while resolving.
    mutable std::shared_mutex services_mutex;
    std::vector<std::shared_ptr<service_descriptor>> services;
    std::vector<std::shared_ptr<service_registry>> nested;
    std::vector<std::shared_ptr<void>> providers;

    // Lifecycle
    mutable std::mutex state_mutex;
    std::condition_variable state_cv;
    state current = state::open;
    std::size_t lookups_in_flight = 0;

    impl(std::vector<service_registry*> parent_list, registry_options opts)
        : options(std::move(opts))
        , parents(std::move(parent_list))
    {}

    std::vector<std::shared_ptr<service_descriptor>> matching(const type_key& key) const {
        std::shared_lock lock(services_mutex);
        std::vector<std::shared_ptr<service_descriptor>> result;
        for (const auto& d : services) {
            if (key.matches(d->declared_type())) result.push_back(d);
        }
        return result;
    }

    std::vector<std::shared_ptr<service_registry>> nested_snapshot() const {
        std::shared_lock lock(services_mutex);
        return nested;
    }
};

// ---------------------------------------------------------------
// lookup_scope: counts a lookup in and out, refusing closed registries
// ---------------------------------------------------------------

class default_service_registry::lookup_scope {
public:
    lookup_scope(const default_service_registry& reg, lookup_kind kind, const type_key& key)
        : reg_(reg)
    {
        auto& s = *reg.impl_;
        std::lock_guard lock(s.state_mutex);
        // A lookup made while resolving another one on the same registry is
        // still allowed once close() has started waiting for it.
        if (s.current == impl::state::closed
            || (s.current == impl::state::closing && !in_lookup(&reg))) {
            throw closed_registry(kind, request_name(kind, key), reg.display_name());
        }
        ++s.lookups_in_flight;
        active_lookups.push_back(&reg);
    }

    ~lookup_scope() {
        active_lookups.pop_back();
        auto& s = *reg_.impl_;
        std::lock_guard lock(s.state_mutex);
        if (--s.lookups_in_flight == 0) s.state_cv.notify_all();
    }

    lookup_scope(const lookup_scope&) = delete;
    lookup_scope& operator=(const lookup_scope&) = delete;

private:
    const default_service_registry& reg_;
};

// ---------------------------------------------------------------
// Constructors / Destructor
// ---------------------------------------------------------------

default_service_registry::default_service_registry()
    : default_service_registry(std::vector<service_registry*>{}, registry_options{})
{}

default_service_registry::default_service_registry(registry_options options)
    : default_service_registry(std::vector<service_registry*>{}, std::move(options))
{}

default_service_registry::default_service_registry(service_registry* parent,
                                                   registry_options options)
    : default_service_registry(std::vector<service_registry*>{parent}, std::move(options))
{}

default_service_registry::default_service_registry(std::vector<service_registry*> parents,
                                                   registry_options options)
{
    if (std::find(parents.begin(), parents.end(), nullptr) != parents.end()) {
        throw registry_error("Parent registry must not be null.");
    }
    impl_ = std::make_unique<impl>(std::move(parents), std::move(options));
}

default_service_registry::~default_service_registry() {
    close_on_destruction();
}

void default_service_registry::close_on_destruction() noexcept {
    try {
        close();
    } catch (const std::exception& e) {
        internal::logger()->error("{}: {}", display_name(), e.what());
    }
}

std::string default_service_registry::display_name() const {
    if (!impl_->options.display_name.empty()) return impl_->options.display_name;
    return internal::display_name(typeid(*this));
}

// ---------------------------------------------------------------
// Registration
// ---------------------------------------------------------------

void default_service_registry::register_instance(service_ref value) {
    if (!value) throw registry_error("Cannot add an empty service to " + display_name() + ".");
    const auto& type = *value.type();
    {
        std::lock_guard lock(impl_->state_mutex);
        if (impl_->current != impl::state::open) {
            throw closed_registry("add service of type " + type.name, display_name());
        }
    }
    {
        std::unique_lock lock(impl_->services_mutex);
        impl_->services.push_back(std::make_shared<instance_service>(std::move(value)));
    }
    internal::logger()->debug("{}: added service of type {}", display_name(), type.name);
}

void default_service_registry::register_provider(const std::string& provider_name,
                                                 std::vector<method_binding> bindings,
                                                 std::shared_ptr<void> owner) {
    {
        std::lock_guard lock(impl_->state_mutex);
        if (impl_->current != impl::state::open) {
            throw closed_registry("add provider " + provider_name, display_name());
        }
    }
    const bool has_decorator = std::any_of(bindings.begin(), bindings.end(),
        [](const method_binding& b) { return b.is_decorator; });
    if (has_decorator && impl_->parents.empty()) {
        throw decorator_without_parent();
    }

    std::any trace;
    if (impl_->options.capture_stacktraces) trace = internal::capture_stacktrace();

    std::vector<std::shared_ptr<service_descriptor>> created;
    created.reserve(bindings.size());
    for (auto& binding : bindings) {
        internal::logger()->debug("{}: binding {} for service of type {}{}",
                                  display_name(), binding.method_name,
                                  binding.service_type->name,
                                  binding.is_decorator ? " (decorator)" : "");
        created.push_back(std::make_shared<method_service>(
            *this, impl_->parents, std::move(binding), trace));
    }

    std::unique_lock lock(impl_->services_mutex);
    impl_->services.insert(impl_->services.end(), created.begin(), created.end());
    if (owner) impl_->providers.push_back(std::move(owner));
}

default_service_registry& default_service_registry::add_registry(
    std::shared_ptr<service_registry> nested) {
    if (!nested) throw registry_error("Cannot add a null registry to " + display_name() + ".");
    {
        std::lock_guard lock(impl_->state_mutex);
        if (impl_->current != impl::state::open) {
            throw closed_registry("add a nested registry", display_name());
        }
    }
    std::unique_lock lock(impl_->services_mutex);
    impl_->nested.push_back(std::move(nested));
    return *this;
}

default_service_registry& default_service_registry::register_services(
    const std::function<void(service_registration&)>& action) {
    action(*this);
    return *this;
}

// ---------------------------------------------------------------
// Lookup
// ---------------------------------------------------------------

service_ref default_service_registry::get_service(const type_key& key) {
    key.validate();
    lookup_scope scope(*this, lookup_kind::service, key);

    auto candidates = impl_->matching(key);
    if (candidates.size() > 1) {
        throw ambiguous_service(lookup_kind::service, key.display_name(), display_name());
    }
    if (candidates.size() == 1) return candidates.front()->get();

    for (const auto& nested : impl_->nested_snapshot()) {
        try {
            return nested->get_service(key);
        } catch (const unknown_service&) {
            // not there; keep looking
        }
    }
    for (auto* parent : impl_->parents) {
        try {
            return parent->get_service(key);
        } catch (const unknown_service&) {
            // not there; keep looking
        }
    }
    throw unknown_service(lookup_kind::service, key.display_name(), display_name());
}

std::vector<service_ref> default_service_registry::get_all_services(const type_key& key) {
    key.validate();
    lookup_scope scope(*this, lookup_kind::all_services, key);

    std::vector<service_ref> result;
    for (const auto& d : impl_->matching(key)) {
        result.push_back(d->get());
    }
    for (const auto& nested : impl_->nested_snapshot()) {
        auto more = nested->get_all_services(key);
        result.insert(result.end(), more.begin(), more.end());
    }
    for (auto* parent : impl_->parents) {
        auto more = parent->get_all_services(key);
        result.insert(result.end(), more.begin(), more.end());
    }
    return result;
}

service_ref default_service_registry::get_factory_service(const type_node& product) {
    const auto key = type_key::factory(product, variance::extends);
    key.validate();
    lookup_scope scope(*this, lookup_kind::factory, key);

    auto candidates = impl_->matching(key);
    if (candidates.size() > 1) {
        throw ambiguous_service(lookup_kind::factory, product.name, display_name());
    }
    if (candidates.size() == 1) return candidates.front()->get();

    for (const auto& nested : impl_->nested_snapshot()) {
        try {
            return nested->get_factory_service(product);
        } catch (const unknown_service&) {
            // not there; keep looking
        }
    }
    for (auto* parent : impl_->parents) {
        try {
            return parent->get_factory_service(product);
        } catch (const unknown_service&) {
            // not there; keep looking
        }
    }
    throw unknown_service(lookup_kind::factory, product.name, display_name());
}

// ---------------------------------------------------------------
// Close
// ---------------------------------------------------------------

namespace {

template <typename Fn>
void run_close_step(const std::string& registry, const std::string& what, Fn&& step,
                    std::vector<std::exception_ptr>& failures) {
    try {
        step();
    } catch (const std::exception& e) {
        internal::logger()->warn("{}: failed to close {}: {}", registry, what, e.what());
        failures.push_back(std::current_exception());
    } catch (...) {
        internal::logger()->warn("{}: failed to close {}", registry, what);
        failures.push_back(std::current_exception());
    }
}

} // namespace

void default_service_registry::close() {
    {
        std::unique_lock lock(impl_->state_mutex);
        if (impl_->current == impl::state::closed) return;
        if (in_lookup(this)) {
            throw registry_error("Cannot close " + display_name()
                                 + " from within a lookup on it.");
        }
        if (impl_->current == impl::state::closing) {
            // Another thread is closing; return once it is done.
            impl_->state_cv.wait(lock, [this] { return impl_->current == impl::state::closed; });
            return;
        }
        impl_->current = impl::state::closing;
        impl_->state_cv.wait(lock, [this] { return impl_->lookups_in_flight == 0; });
    }

    const std::string name = display_name();
    internal::logger()->debug("{}: closing", name);

    std::vector<std::shared_ptr<service_descriptor>> services;
    std::vector<std::shared_ptr<service_registry>> nested;
    std::vector<std::shared_ptr<void>> providers;
    {
        std::unique_lock lock(impl_->services_mutex);
        services.swap(impl_->services);
        nested.swap(impl_->nested);
        providers.swap(impl_->providers);
    }

    std::vector<std::exception_ptr> failures;
    for (const auto& d : services) {
        service_ref value = d->created();
        if (!value) continue;
        const std::string what = "service of type " + d->declared_type().name;
        if (auto* c = value.as_closeable()) {
            run_close_step(name, what, [c] { c->close(); }, failures);
        } else if (auto* s = value.as_stoppable()) {
            run_close_step(name, what, [s] { s->stop(); }, failures);
        }
    }
    for (const auto& n : nested) {
        if (auto* c = dynamic_cast<closeable*>(n.get())) {
            run_close_step(name, "nested registry " + internal::display_name(typeid(*n)),
                           [c] { c->close(); }, failures);
        }
    }

    // Release values before providers, which their methods may reference.
    services.clear();
    nested.clear();
    providers.clear();

    {
        std::lock_guard lock(impl_->state_mutex);
        impl_->current = impl::state::closed;
    }
    impl_->state_cv.notify_all();

    if (!failures.empty()) {
        throw close_error(name, std::move(failures));
    }
}

bool default_service_registry::is_closed() const {
    std::lock_guard lock(impl_->state_mutex);
    return impl_->current == impl::state::closed;
}

} // namespace svcreg
