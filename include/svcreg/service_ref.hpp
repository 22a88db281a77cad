#pragma once

#include "export.hpp"
#include "lifecycle.hpp"
#include "type_node.hpp"

#include <memory>
#include <type_traits>

namespace svcreg {

// ---------------------------------------------------------------
// service_ref: type-erased shared handle to a service value
// ---------------------------------------------------------------

/// Shared-ownership handle to a service, erased to its declared type.
/// The stored pointer points at the value *as the declared type*, so
/// conversions walk the declared ancestry from there.  Close and stop
/// capabilities are discovered once, when the handle is made from a typed
/// pointer.
class SVCREG_EXPORT service_ref {
public:
    service_ref() = default;

    template <typename T>
    service_ref(std::shared_ptr<T> value)  // NOLINT: implicit by intent
        : type_(&type_of<T>())
    {
        static_assert(!std::is_const_v<T>, "services are held as non-const");
        if constexpr (std::is_base_of_v<closeable, T>) {
            closeable_ = value.get();
        } else if constexpr (std::is_polymorphic_v<T>) {
            closeable_ = dynamic_cast<closeable*>(value.get());
        }
        if constexpr (std::is_base_of_v<stoppable, T>) {
            stoppable_ = value.get();
        } else if constexpr (std::is_polymorphic_v<T>) {
            stoppable_ = dynamic_cast<stoppable*>(value.get());
        }
        value_ = std::shared_ptr<void>(std::move(value));
    }

    explicit operator bool() const noexcept { return value_ != nullptr; }

    /// Declared type; null for an empty handle.
    const type_node* type() const noexcept { return type_; }

    /// Pointer to the value as its declared type.
    void* get() const noexcept { return value_.get(); }

    closeable* as_closeable() const noexcept { return closeable_; }
    stoppable* as_stoppable() const noexcept { return stoppable_; }

    /// The value as T, sharing ownership; nullptr when empty or when the
    /// declared type is not a T.
    template <typename T>
    std::shared_ptr<T> try_as() const {
        if (!value_) return nullptr;
        void* p = type_->cast(value_.get(), type_of<std::remove_cv_t<T>>());
        if (!p) return nullptr;
        return std::shared_ptr<T>(value_, static_cast<T*>(p));
    }

    /// The value as T.  Throws registry_error when the handle holds a value
    /// that is not a T; returns nullptr for an empty handle.
    template <typename T>
    std::shared_ptr<T> as() const {
        auto p = try_as<T>();
        if (!p && value_) throw_not_assignable(type_of<std::remove_cv_t<T>>());
        return p;
    }

private:
    [[noreturn]] void throw_not_assignable(const type_node& target) const;

    std::shared_ptr<void> value_;
    const type_node* type_ = nullptr;
    closeable* closeable_ = nullptr;
    stoppable* stoppable_ = nullptr;
};

} // namespace svcreg
