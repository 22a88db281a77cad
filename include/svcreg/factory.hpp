#pragma once

#include "export.hpp"
#include "service_ref.hpp"

#include <functional>
#include <memory>
#include <utility>

namespace svcreg {

// ---------------------------------------------------------------
// Factory capability
// ---------------------------------------------------------------

/// Untyped view of a factory.  Requesting factory_base itself (the raw
/// factory type) is rejected; ask for factory<T> or use get_factory<T>().
class SVCREG_EXPORT factory_base {
public:
    virtual ~factory_base() = default;

    /// Produce a new value.  Every call creates a new one.
    virtual service_ref create_service() = 0;

    /// create_service() converted to T.
    template <typename T>
    std::shared_ptr<T> create_as() {
        return create_service().as<T>();
    }
};

/// A service that produces new T values on demand.  Register an
/// implementation like any other service; it is then found by
/// get<factory<T>>(), get_factory<U>() for every ancestor U of T, and
/// new_instance<U>().
template <typename T>
class factory : public factory_base {
public:
    using product_type = T;

    virtual std::shared_ptr<T> create() = 0;

    service_ref create_service() final { return service_ref(create()); }
};

/// factory<T> backed by a callable.
template <typename T>
class function_factory final : public factory<T> {
public:
    explicit function_factory(std::function<std::shared_ptr<T>()> fn)
        : fn_(std::move(fn)) {}

    std::shared_ptr<T> create() override { return fn_(); }

private:
    std::function<std::shared_ptr<T>()> fn_;
};

template <typename T, typename Fn>
std::shared_ptr<factory<T>> make_factory(Fn&& fn) {
    return std::make_shared<function_factory<T>>(std::forward<Fn>(fn));
}

} // namespace svcreg
