#include <catch2/catch_test_macros.hpp>
#include <svcdi.hpp>
#include <memory>

using namespace svcdi;

// ---------------------------------------------------------------
// Test interfaces and implementations
// ---------------------------------------------------------------

struct ISimple {
    virtual ~ISimple() = default;
    virtual int Value() const = 0;
};

struct SimpleImpl : ISimple {
    int Value() const override { return 42; }
};

struct AnotherImpl : ISimple {
    int Value() const override { return 99; }
};

// ---------------------------------------------------------------
// Tests
// ---------------------------------------------------------------

TEST_CASE("Registration: register and build succeeds", "[registration]") {
    registry registry;
    registry.add_singleton<ISimple, SimpleImpl>();
    auto resolver = registry.build();
    REQUIRE(resolver != nullptr);
    REQUIRE(resolver->is_registered<ISimple>());
}

TEST_CASE("Registration: empty registry build succeeds", "[registration]") {
    registry registry;
    auto resolver = registry.build();
    REQUIRE(resolver != nullptr);
    REQUIRE(registry.descriptors().empty());
}

TEST_CASE("Registration: re-registration overwrites", "[registration]") {
    registry registry;
    registry.add_singleton<ISimple, SimpleImpl>();
    registry.add_singleton<ISimple, AnotherImpl>();
    auto resolver = registry.build();

    REQUIRE(registry.descriptors().size() == 1);
    REQUIRE(resolver->resolve<ISimple>()->Value() == 99);
}

TEST_CASE("Registration: overwrite may change the lifetime", "[registration]") {
    registry registry;
    registry.add_singleton<ISimple, SimpleImpl>();
    registry.add_transient<ISimple, SimpleImpl>();
    auto resolver = registry.build();

    auto a = resolver->resolve<ISimple>();
    auto b = resolver->resolve<ISimple>();
    REQUIRE(a.get() != b.get());
}

TEST_CASE("Registration: registrations after build are visible", "[registration]") {
    registry registry;
    auto resolver = registry.build();
    REQUIRE(resolver->try_resolve<ISimple>() == nullptr);

    registry.add_singleton<ISimple, SimpleImpl>();
    REQUIRE(resolver->resolve<ISimple>()->Value() == 42);
}

TEST_CASE("Registration: overwrite after resolution rebuilds the singleton", "[registration]") {
    registry registry;
    registry.add_singleton<ISimple, SimpleImpl>();
    auto resolver = registry.build();
    auto first = resolver->resolve<ISimple>();
    REQUIRE(first->Value() == 42);

    registry.add_singleton<ISimple, AnotherImpl>();
    auto second = resolver->resolve<ISimple>();
    REQUIRE(second->Value() == 99);
    REQUIRE(resolver->resolve<ISimple>().get() == second.get());
}

TEST_CASE("Registration: self-registration without interface", "[registration]") {
    registry registry;
    registry.add_singleton<SimpleImpl>();
    auto resolver = registry.build();
    REQUIRE(resolver->resolve<SimpleImpl>()->Value() == 42);
}

TEST_CASE("Registration: runtime lifetime via add()", "[registration]") {
    registry registry;
    registry.add<ISimple, SimpleImpl>(lifetime_kind::transient);
    registry.add<ISimple, AnotherImpl>("other", lifetime_kind::singleton);
    auto resolver = registry.build();

    REQUIRE(resolver->resolve<ISimple>().get() != resolver->resolve<ISimple>().get());
    REQUIRE(resolver->resolve<ISimple>("other").get()
            == resolver->resolve<ISimple>("other").get());
}

TEST_CASE("Registration: empty key is rejected", "[registration]") {
    registry registry;
    REQUIRE_THROWS_AS(registry.add_singleton<ISimple, SimpleImpl>(""), invalid_registration);
    REQUIRE_THROWS_AS(
        registry.add_instance<ISimple>("", std::make_shared<SimpleImpl>()),
        invalid_registration);
    REQUIRE(registry.descriptors().empty());
}

TEST_CASE("Registration: null instance is rejected", "[registration]") {
    registry registry;
    REQUIRE_THROWS_AS(registry.add_instance<ISimple>(nullptr), invalid_registration);
    REQUIRE_FALSE(registry.is_registered<ISimple>());
}

TEST_CASE("Registration: descriptors record what was registered", "[registration]") {
    registry registry;
    registry.add_scoped<ISimple, SimpleImpl>("k");
    registry.add_instance<ISimple>(std::make_shared<AnotherImpl>());

    auto descs = registry.descriptors();
    REQUIRE(descs.size() == 2);

    REQUIRE(descs[0]->component_type == std::type_index(typeid(ISimple)));
    REQUIRE(descs[0]->key == "k");
    REQUIRE(descs[0]->lifetime == lifetime_kind::scoped);
    REQUIRE(descs[0]->impl_type() == std::type_index(typeid(SimpleImpl)));
    REQUIRE(descs[0]->api_name == "add_scoped");

    REQUIRE(descs[1]->key.empty());
    REQUIRE(std::holds_alternative<prebuilt_instance>(descs[1]->strategy));
    REQUIRE_FALSE(descs[1]->impl_type().has_value());
}

TEST_CASE("Registration: clear drops everything", "[registration]") {
    registry registry;
    registry.add_singleton<ISimple, SimpleImpl>();
    auto resolver = registry.build();

    registry.clear();
    REQUIRE_FALSE(registry.is_registered<ISimple>());
    REQUIRE_THROWS_AS(resolver->resolve<ISimple>(), not_found);
}

TEST_CASE("Registration: moved registry keeps its registrations", "[registration]") {
    registry a;
    a.add_singleton<ISimple, SimpleImpl>();
    registry b = std::move(a);
    REQUIRE(b.is_registered<ISimple>());
    REQUIRE(b.build()->resolve<ISimple>()->Value() == 42);
}
