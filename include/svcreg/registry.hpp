#pragma once

#include "export.hpp"
#include "descriptor.hpp"
#include "exceptions.hpp"
#include "lifecycle.hpp"
#include "service_ref.hpp"
#include "service_registry.hpp"
#include "type_traits.hpp"

#include <functional>
#include <memory>
#include <string>
#include <type_traits>
#include <typeinfo>
#include <vector>

namespace svcreg {

namespace detail {
/// Placeholder for "declare the service as its own type".
struct deduced {};
} // namespace detail

// ---------------------------------------------------------------
// service_registration: the write side
// ---------------------------------------------------------------

class SVCREG_EXPORT service_registration {
public:
    virtual ~service_registration() = default;

    /// Register an existing value.  `add(p)` declares it as its own type;
    /// `add<TService>(p)` declares it as TService.
    template <typename TService = detail::deduced, typename TImpl>
    service_registration& add(std::shared_ptr<TImpl> value) {
        if constexpr (std::is_same_v<TService, detail::deduced>) {
            register_instance(service_ref(std::move(value)));
        } else {
            static_assert(derived_from_base<TImpl, TService>,
                          "add<TService>(value): value must derive from TService");
            register_instance(service_ref(std::shared_ptr<TService>(std::move(value))));
        }
        return *this;
    }

    /// Bind the listed methods of `provider`.  Each becomes a service of its
    /// return type; a method whose first parameter is its return type
    /// decorates the parents' value instead.  The provider is kept alive for
    /// as long as the registry is.
    template <typename P, typename... Fns>
    service_registration& add_provider(std::shared_ptr<P> provider,
                                       const method_ref<Fns>&... methods) {
        static_assert(sizeof...(Fns) > 0, "add_provider needs at least one method");
        std::string name = internal::display_name(typeid(P));
        std::vector<method_binding> bindings;
        bindings.reserve(sizeof...(Fns));
        (bindings.push_back(detail::bind_method(provider.get(), name, methods)), ...);
        register_provider(name, std::move(bindings), std::shared_ptr<void>(std::move(provider)));
        return *this;
    }

protected:
    virtual void register_instance(service_ref value) = 0;
    virtual void register_provider(const std::string& provider_name,
                                   std::vector<method_binding> bindings,
                                   std::shared_ptr<void> owner) = 0;
};

// ---------------------------------------------------------------
// default_service_registry
// ---------------------------------------------------------------

/// A registry node.  Services are looked up among the node's own instances
/// and bound methods, then in nested registries in the order added, then in
/// parents in the order given.  Parents are referenced, never owned or
/// closed; nested registries are closed with the node.
///
/// Thread-safe: lookups may run concurrently with each other and with
/// registration; close() waits for in-flight lookups.
class SVCREG_EXPORT default_service_registry
    : public service_registry
    , public service_registration
    , public closeable {
public:
    default_service_registry();
    explicit default_service_registry(registry_options options);
    /// `parent` is referenced, not owned, and must outlive this registry.
    explicit default_service_registry(service_registry* parent,
                                      registry_options options = {});
    explicit default_service_registry(std::vector<service_registry*> parents,
                                      registry_options options = {});

    /// Closes the registry if still open.  Close failures are logged.
    ~default_service_registry() override;

    default_service_registry(const default_service_registry&) = delete;
    default_service_registry& operator=(const default_service_registry&) = delete;

    // ---------------------------------------------------------------
    // Query
    // ---------------------------------------------------------------

    service_ref get_service(const type_key& key) override;
    std::vector<service_ref> get_all_services(const type_key& key) override;
    service_ref get_factory_service(const type_node& product) override;

    // ---------------------------------------------------------------
    // Composition and registration
    // ---------------------------------------------------------------

    /// Attach a nested registry, searched after this node's own services and
    /// before its parents.  Closed with this node when it is closeable.
    default_service_registry& add_registry(std::shared_ptr<service_registry> nested);

    /// Run `action` against this registry's registration surface.
    default_service_registry& register_services(
        const std::function<void(service_registration&)>& action);

    // ---------------------------------------------------------------
    // Lifecycle
    // ---------------------------------------------------------------

    /// Close or stop every value this node holds or created, then close
    /// nested registries.  All steps run; failures are rethrown together as
    /// close_error.  Idempotent.
    void close() override;

    bool is_closed() const;

    /// Name used in messages.
    std::string display_name() const;

protected:
    /// Bind methods of a registry subclass.  Virtual methods dispatch to the
    /// most derived override.  Call from the subclass constructor.
    ///
    /// The bound methods run on the subclass object, so a subclass that binds
    /// its own methods must call close_on_destruction() from its destructor.
    /// The base destructor runs only after the subclass part is gone.
    template <typename Self, typename... Fns>
    void add_own_methods(Self* self, const method_ref<Fns>&... methods) {
        std::string name = internal::display_name(typeid(Self));
        std::vector<method_binding> bindings;
        bindings.reserve(sizeof...(Fns));
        (bindings.push_back(detail::bind_method(self, name, methods)), ...);
        register_provider(name, std::move(bindings), nullptr);
    }

    /// close(), logging instead of throwing.  Waits for in-flight lookups.
    void close_on_destruction() noexcept;

    void register_instance(service_ref value) override;
    void register_provider(const std::string& provider_name,
                           std::vector<method_binding> bindings,
                           std::shared_ptr<void> owner) override;

private:
    struct impl;
    class lookup_scope;

    std::unique_ptr<impl> impl_;
};

} // namespace svcreg
