#pragma once

// A hand-rolled service_registry for parent and nested registry tests.

#include <svcreg.hpp>

#include <string>
#include <utility>
#include <vector>

namespace testing_support {

class fake_registry : public svcreg::service_registry {
public:
    explicit fake_registry(std::vector<svcreg::service_ref> services = {})
        : services_(std::move(services)) {}

    svcreg::service_ref get_service(const svcreg::type_key& key) override {
        ++lookups;
        for (const auto& s : services_) {
            if (key.matches(*s.type())) return s;
        }
        throw svcreg::unknown_service(svcreg::lookup_kind::service,
                                      key.display_name(), "fake_registry");
    }

    std::vector<svcreg::service_ref> get_all_services(const svcreg::type_key& key) override {
        ++lookups;
        std::vector<svcreg::service_ref> result;
        for (const auto& s : services_) {
            if (key.matches(*s.type())) result.push_back(s);
        }
        return result;
    }

    svcreg::service_ref get_factory_service(const svcreg::type_node& product) override {
        ++lookups;
        auto key = svcreg::type_key::factory(product, svcreg::variance::extends);
        for (const auto& s : services_) {
            if (key.matches(*s.type())) return s;
        }
        throw svcreg::unknown_service(svcreg::lookup_kind::factory,
                                      product.name, "fake_registry");
    }

    int lookups = 0;

private:
    std::vector<svcreg::service_ref> services_;
};

/// A parent whose every lookup fails with something other than not-found.
class broken_registry : public svcreg::service_registry {
public:
    svcreg::service_ref get_service(const svcreg::type_key& key) override {
        throw svcreg::ambiguous_service(svcreg::lookup_kind::service,
                                        key.display_name(), "broken_registry");
    }

    std::vector<svcreg::service_ref> get_all_services(const svcreg::type_key& key) override {
        throw svcreg::ambiguous_service(svcreg::lookup_kind::service,
                                        key.display_name(), "broken_registry");
    }

    svcreg::service_ref get_factory_service(const svcreg::type_node& product) override {
        throw svcreg::ambiguous_service(svcreg::lookup_kind::factory,
                                        product.name, "broken_registry");
    }
};

} // namespace testing_support
