#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <svcreg.hpp>

#include "fake_registry.hpp"

#include <memory>
#include <string>
#include <utility>

using Catch::Matchers::StartsWith;
using testing_support::fake_registry;

namespace {

struct long_value {
    long v;
};

struct text {
    std::string s;
};

struct test_registry : svcreg::default_service_registry {
    using default_service_registry::default_service_registry;
};

struct decorating_provider {
    int calls = 0;

    std::shared_ptr<long_value> create_long(std::shared_ptr<long_value> parent_value) {
        ++calls;
        return std::make_shared<long_value>(long_value{parent_value->v + 2});
    }
};

struct decorating_provider_with_deps {
    std::shared_ptr<text> create_text() { return std::make_shared<text>(text{"+"}); }

    std::shared_ptr<long_value> create_long(const long_value& parent_value, const text& suffix) {
        return std::make_shared<long_value>(long_value{parent_value.v + static_cast<long>(suffix.s.size())});
    }
};

struct null_decorator {
    std::shared_ptr<text> create_text(const text&) { return nullptr; }
};

struct text_decorator {
    std::shared_ptr<text> create_text(const text& parent_value) {
        return std::make_shared<text>(text{parent_value.s + " decorated"});
    }
};

/// Wraps a parent factory and adds to every value it makes.
struct adding_factory : svcreg::factory<long_value> {
    adding_factory(std::shared_ptr<svcreg::factory<long_value>> inner, long delta)
        : inner(std::move(inner)), delta(delta) {}

    std::shared_ptr<long_value> create() override {
        auto value = inner->create();
        return std::make_shared<long_value>(long_value{value->v + delta});
    }

    std::shared_ptr<svcreg::factory<long_value>> inner;
    long delta;
};

struct factory_decorator {
    std::shared_ptr<svcreg::factory<long_value>> create_long_factory(
        std::shared_ptr<svcreg::factory<long_value>> parent_factory) {
        return std::make_shared<adding_factory>(std::move(parent_factory), 2);
    }
};

struct registry_with_decorator : svcreg::default_service_registry {
    registry_with_decorator() {
        add_own_methods(this, SVCREG_METHOD(registry_with_decorator, create_long));
    }

    ~registry_with_decorator() override { close_on_destruction(); }

    std::shared_ptr<long_value> create_long(const long_value& v) {
        return std::make_shared<long_value>(long_value{v.v * 2});
    }
};

} // namespace

TEST_CASE("decorator wraps the value held by the parent", "[decorator]") {
    svcreg::default_service_registry parent;
    parent.add(std::make_shared<long_value>(long_value{110}));

    test_registry reg(&parent);
    auto provider = std::make_shared<decorating_provider>();
    reg.add_provider(provider, SVCREG_METHOD(decorating_provider, create_long));

    auto first = reg.get<long_value>();
    REQUIRE(first->v == 112);
    REQUIRE(reg.get<long_value>() == first);
    REQUIRE(provider->calls == 1);

    // The parent still hands out its own value.
    REQUIRE(parent.get<long_value>()->v == 110);
}

TEST_CASE("decorator takes additional parameters from its own registry", "[decorator]") {
    svcreg::default_service_registry parent;
    parent.add(std::make_shared<long_value>(long_value{10}));

    test_registry reg(&parent);
    reg.add_provider(std::make_shared<decorating_provider_with_deps>(),
                     SVCREG_METHOD(decorating_provider_with_deps, create_text),
                     SVCREG_METHOD(decorating_provider_with_deps, create_long));

    REQUIRE(reg.get<long_value>()->v == 11);
}

TEST_CASE("decorator without a parent is rejected when bound", "[decorator]") {
    test_registry reg;

    try {
        reg.add_provider(std::make_shared<decorating_provider>(),
                         SVCREG_METHOD(decorating_provider, create_long));
        FAIL("Expected decorator_without_parent");
    } catch (const svcreg::decorator_without_parent& e) {
        REQUIRE_THAT(std::string(e.what()),
                     StartsWith("Cannot use decorator methods when no parent registry is provided."));
    }

    // Nothing from the provider was bound.
    REQUIRE_THROWS_AS(reg.get<long_value>(), svcreg::unknown_service);
}

TEST_CASE("registry subclass with a decorator needs a parent", "[decorator]") {
    REQUIRE_THROWS_AS(registry_with_decorator(), svcreg::decorator_without_parent);
}

TEST_CASE("decorator fails when no parent has the value", "[decorator]") {
    fake_registry parent;
    test_registry reg(&parent);
    reg.add_provider(std::make_shared<decorating_provider>(),
                     SVCREG_METHOD(decorating_provider, create_long));

    try {
        reg.get<long_value>();
        FAIL("Expected missing_dependency");
    } catch (const svcreg::missing_dependency& e) {
        REQUIRE_THAT(std::string(e.what()),
                     StartsWith("Cannot create service of type long_value using "
                                "decorating_provider::create_long() as required service of "
                                "type long_value is not available in parent registries."));
    }
}

TEST_CASE("decorator returning null fails", "[decorator]") {
    fake_registry parent({svcreg::service_ref(std::make_shared<text>(text{"parent"}))});
    test_registry reg(&parent);
    reg.add_provider(std::make_shared<null_decorator>(),
                     SVCREG_METHOD(null_decorator, create_text));

    try {
        reg.get<text>();
        FAIL("Expected creation_failed");
    } catch (const svcreg::creation_failed& e) {
        REQUIRE_THAT(std::string(e.what()),
                     StartsWith("Could not create service of type text using "
                                "null_decorator::create_text() as this method returned null."));
    }
}

TEST_CASE("decorator looks through parents in order", "[decorator]") {
    fake_registry empty_parent;
    fake_registry parent({svcreg::service_ref(std::make_shared<text>(text{"second"}))});
    test_registry reg(std::vector<svcreg::service_registry*>{&empty_parent, &parent});
    reg.add_provider(std::make_shared<text_decorator>(),
                     SVCREG_METHOD(text_decorator, create_text));

    REQUIRE(reg.get<text>()->s == "second decorated");
    REQUIRE(empty_parent.lookups == 1);
}

TEST_CASE("decorators chain across registry levels", "[decorator]") {
    svcreg::default_service_registry root;
    root.add(std::make_shared<text>(text{"root"}));

    test_registry middle(&root);
    middle.add_provider(std::make_shared<text_decorator>(),
                        SVCREG_METHOD(text_decorator, create_text));

    test_registry leaf(&middle);
    leaf.add_provider(std::make_shared<text_decorator>(),
                      SVCREG_METHOD(text_decorator, create_text));

    REQUIRE(leaf.get<text>()->s == "root decorated decorated");
}

TEST_CASE("factory decorator wraps the parent's factory", "[decorator][factory]") {
    svcreg::default_service_registry parent;
    long next = 0;
    parent.add(svcreg::make_factory<long_value>([&next] {
        return std::make_shared<long_value>(long_value{++next});
    }));

    test_registry reg(&parent);
    reg.add_provider(std::make_shared<factory_decorator>(),
                     SVCREG_METHOD(factory_decorator, create_long_factory));

    REQUIRE(reg.new_instance<long_value>()->v == 3);
    REQUIRE(reg.new_instance<long_value>()->v == 4);
    REQUIRE(parent.new_instance<long_value>()->v == 3);
}
