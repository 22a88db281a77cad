#pragma once

#include "export.hpp"
#include "type_node.hpp"

#include <string>

namespace svcreg {

/// What a request asks for.  `raw_factory` and `array` are never
/// resolvable; they exist so the rejection can name the request.
enum class request_shape {
    service,
    factory,
    raw_factory,
    array
};

/// Bound on the product type of a factory request.
enum class variance {
    exact,
    extends,
    super
};

// ---------------------------------------------------------------
// type_key: a request, as seen by the matcher
// ---------------------------------------------------------------

class SVCREG_EXPORT type_key {
public:
    /// Plain request for `type`.  The shape follows from the node, so a
    /// request for an array or for factory_base is built the same way and
    /// rejected by validate().
    static type_key service(const type_node& type) noexcept;

    /// Request for a factory whose product satisfies `bound` against
    /// `product`.
    static type_key factory(const type_node& product, variance bound) noexcept;

    request_shape shape() const noexcept { return shape_; }

    /// The requested type; for factory requests, the product bound.
    const type_node& type() const noexcept { return *type_; }

    variance bound() const noexcept { return bound_; }

    /// Throws invalid_request for array and raw factory requests.
    void validate() const;

    /// True when a candidate declared as `declared` satisfies this request.
    bool matches(const type_node& declared) const;

    /// Name used in messages: "number", "factory<? extends number>", ...
    std::string display_name() const;

private:
    type_key(request_shape shape, const type_node* type, variance bound) noexcept
        : shape_(shape), type_(type), bound_(bound) {}

    request_shape shape_;
    const type_node* type_;
    variance bound_;
};

} // namespace svcreg
