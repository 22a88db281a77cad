#include "service_descriptor.hpp"
#include "log.hpp"
#include "stacktrace_utils.hpp"

#include "svcreg/exceptions.hpp"
#include "svcreg/registry.hpp"

#include <cstddef>
#include <unordered_map>
#include <utility>

namespace svcreg::internal {

const char* reentrant_resolution::what() const noexcept {
    return "service is already being resolved by this thread";
}

namespace {

// ---------------------------------------------------------------
// Wait graph: which descriptor each blocked thread is waiting for
// ---------------------------------------------------------------

struct wait_graph {
    std::mutex mutex;
    std::unordered_map<std::thread::id, const service_descriptor*> waiting_on;
};

wait_graph& waits() {
    static wait_graph graph;
    return graph;
}

} // namespace

service_descriptor::service_descriptor(const type_node& type)
    : type_(type)
    , state_(state::unresolved)
{}

service_descriptor::service_descriptor(const type_node& type, service_ref value)
    : type_(type)
    , state_(state::resolved)
    , value_(std::move(value))
{}

service_ref service_descriptor::created() const {
    std::lock_guard lock(mutex_);
    return state_ == state::resolved ? value_ : service_ref{};
}

service_ref service_descriptor::get() {
    const auto self = std::this_thread::get_id();
    std::unique_lock lock(mutex_);
    while (state_ == state::resolving) {
        if (resolving_thread_.load() == self) throw reentrant_resolution();
        wait_for_resolution(lock);
    }
    if (state_ == state::resolved) return value_;
    if (state_ == state::failed) std::rethrow_exception(failure_);

    state_ = state::resolving;
    resolving_thread_.store(self);
    lock.unlock();

    service_ref result;
    std::exception_ptr failure;
    try {
        result = create();
    } catch (const reentrant_resolution&) {
        failure = cycle_error();
    } catch (...) {
        failure = std::current_exception();
    }

    lock.lock();
    resolving_thread_.store(std::thread::id{});
    if (failure) {
        state_ = state::failed;
        failure_ = failure;
    } else {
        state_ = state::resolved;
        value_ = std::move(result);
    }
    resolved_cv_.notify_all();
    if (failure) std::rethrow_exception(failure);
    return value_;
}

void service_descriptor::wait_for_resolution(std::unique_lock<std::mutex>& lock) {
    const auto self = std::this_thread::get_id();
    auto& graph = waits();
    {
        // Follow resolving thread -> descriptor it waits for -> its resolving
        // thread ...  Reaching this thread means waiting would never end.
        std::lock_guard guard(graph.mutex);
        const service_descriptor* d = this;
        for (std::size_t hops = 0; d != nullptr && hops <= graph.waiting_on.size(); ++hops) {
            const auto owner = d->resolving_thread_.load();
            if (owner == self) throw reentrant_resolution();
            auto it = graph.waiting_on.find(owner);
            d = it == graph.waiting_on.end() ? nullptr : it->second;
        }
        graph.waiting_on[self] = this;
    }
    resolved_cv_.wait(lock, [this] { return state_ != state::resolving; });
    std::lock_guard guard(graph.mutex);
    graph.waiting_on.erase(self);
}

// ---------------------------------------------------------------
// instance_service
// ---------------------------------------------------------------

instance_service::instance_service(service_ref value)
    : service_descriptor(*value.type(), value)
{}

service_ref instance_service::create() {
    // Registered values start out resolved.
    return created();
}

std::exception_ptr instance_service::cycle_error() const {
    return std::make_exception_ptr(
        registry_error("Registered service of type " + declared_type().name
                       + " cannot take part in a cycle."));
}

// ---------------------------------------------------------------
// method_service
// ---------------------------------------------------------------

method_service::method_service(default_service_registry& owner,
                               std::vector<service_registry*> parents,
                               method_binding binding,
                               std::any registration_trace)
    : service_descriptor(*binding.service_type)
    , owner_(owner)
    , parents_(std::move(parents))
    , binding_(std::move(binding))
    , registration_trace_(std::move(registration_trace))
{}

template <typename E>
E method_service::with_trace(E error) const {
    auto trace = format_registration_trace(binding_.method_name, registration_trace_);
    if (!trace.empty()) error.set_diagnostic_detail(std::move(trace));
    return error;
}

service_ref method_service::create() {
    logger()->debug("creating service of type {} using {}",
                    declared_type().name, binding_.method_name);
    return binding_.invoke(*this);
}

std::exception_ptr method_service::cycle_error() const {
    return std::make_exception_ptr(
        with_trace(cyclic_dependency(declared_type().name, binding_.method_name)));
}

service_ref method_service::resolve(const type_key& key) {
    try {
        return owner_.get_service(key);
    } catch (const unknown_service&) {
        throw with_trace(missing_dependency(declared_type().name, binding_.method_name,
                                            key.display_name(), false));
    }
}

service_ref method_service::resolve_decorated(const type_key& key) {
    for (auto* parent : parents_) {
        try {
            // A decorated factory<P> is whatever factory the parent hands out
            // for P.
            if (const type_node* product = key.type().product) {
                return parent->get_factory_service(*product);
            }
            return parent->get_service(key);
        } catch (const unknown_service&) {
            continue;
        }
    }
    throw with_trace(missing_dependency(declared_type().name, binding_.method_name,
                                        key.display_name(), true));
}

service_registry& method_service::registry() {
    return owner_;
}

service_ref method_service::invoke(const std::function<service_ref()>& body) {
    service_ref result;
    try {
        result = body();
    } catch (const reentrant_resolution&) {
        throw;
    } catch (...) {
        throw with_trace(creation_failed(declared_type().name, binding_.method_name,
                                         std::current_exception()));
    }
    if (!result) {
        throw with_trace(creation_failed(declared_type().name, binding_.method_name));
    }
    return result;
}

} // namespace svcreg::internal
