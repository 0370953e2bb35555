#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <svcdi.hpp>
#include <memory>
#include <string>
#include <vector>

using namespace svcdi;

namespace {

struct IA { virtual ~IA() = default; };
struct IB { virtual ~IB() = default; };
struct IC { virtual ~IC() = default; };
struct ILeaf { virtual ~ILeaf() = default; };

struct A : IA { explicit A(std::shared_ptr<IB>) {} };
struct B : IB { explicit B(std::shared_ptr<IA>) {} };
struct Leaf : ILeaf {};
struct PlainA : IA {};

struct BToC : IB { explicit BToC(std::shared_ptr<IC>) {} };
struct CToA : IC { explicit CToA(std::shared_ptr<IA>) {} };

struct SelfLoop : IA { explicit SelfLoop(std::shared_ptr<IA>) {} };

service_key key_of(std::type_index t, std::string k = {}) {
    return service_key{t, std::move(k)};
}

} // namespace

TEST_CASE("Cycles: two-node cycle reported at resolve time", "[cycles]") {
    registry reg;
    reg.add_transient<IA, A>(deps<IB>);
    reg.add_transient<IB, B>(deps<IA>);
    auto r = reg.build({.validate_on_build = false});

    try {
        r->resolve<IA>();
        FAIL("Expected cyclic_dependency");
    } catch (const cyclic_dependency& e) {
        const std::vector<service_key> expected{
            key_of(typeid(IA)), key_of(typeid(IB)), key_of(typeid(IA))};
        REQUIRE(e.cycle() == expected);
    }
}

TEST_CASE("Cycles: self dependency", "[cycles]") {
    registry reg;
    reg.add_transient<IA, SelfLoop>(deps<IA>);
    auto r = reg.build({.validate_on_build = false});

    try {
        r->resolve<IA>();
        FAIL("Expected cyclic_dependency");
    } catch (const cyclic_dependency& e) {
        REQUIRE(e.cycle() == std::vector<service_key>{key_of(typeid(IA)), key_of(typeid(IA))});
    }
}

TEST_CASE("Cycles: three-node cycle starting mid-chain", "[cycles]") {
    registry reg;
    reg.add_transient<IA, A>(deps<IB>);
    reg.add_transient<IB, BToC>(deps<IC>);
    reg.add_transient<IC, CToA>(deps<IA>);
    auto r = reg.build({.validate_on_build = false});

    try {
        r->resolve<IB>();
        FAIL("Expected cyclic_dependency");
    } catch (const cyclic_dependency& e) {
        const std::vector<service_key> expected{
            key_of(typeid(IB)), key_of(typeid(IC)), key_of(typeid(IA)), key_of(typeid(IB))};
        REQUIRE(e.cycle() == expected);
    }
}

TEST_CASE("Cycles: singleton cycle does not deadlock", "[cycles]") {
    registry reg;
    reg.add_singleton<IA, A>(deps<IB>);
    reg.add_singleton<IB, B>(deps<IA>);
    auto r = reg.build({.validate_on_build = false});

    REQUIRE_THROWS_AS(r->resolve<IA>(), cyclic_dependency);
    REQUIRE_THROWS_AS(r->resolve<IB>(), cyclic_dependency);
}

TEST_CASE("Cycles: keyed slots are distinct nodes", "[cycles]") {
    registry reg;
    reg.add_transient<IA, PlainA>();
    reg.add_transient<IA, SelfLoop>("inner", deps<IA>);
    reg.add_transient<IA, SelfLoop>("outer", deps<keyed<IA, "inner">>);
    auto r = reg.build();

    REQUIRE_NOTHROW(r->resolve<IA>("outer"));
}

TEST_CASE("Cycles: keyed cycle reports the keys", "[cycles]") {
    registry reg;
    reg.add_transient<IA, SelfLoop>("ping", deps<keyed<IA, "pong">>);
    reg.add_transient<IA, SelfLoop>("pong", deps<keyed<IA, "ping">>);
    auto r = reg.build({.validate_on_build = false});

    try {
        r->resolve<IA>("ping");
        FAIL("Expected cyclic_dependency");
    } catch (const cyclic_dependency& e) {
        const std::vector<service_key> expected{
            key_of(typeid(IA), "ping"), key_of(typeid(IA), "pong"), key_of(typeid(IA), "ping")};
        REQUIRE(e.cycle() == expected);
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("key=\"pong\""));
    }
}

TEST_CASE("Cycles: stack unwinds after a failed resolution", "[cycles]") {
    registry reg;
    reg.add_transient<IA, A>(deps<IB>);
    reg.add_transient<IB, B>(deps<IA>);
    reg.add_transient<ILeaf, Leaf>();
    auto r = reg.build({.validate_on_build = false});

    REQUIRE_THROWS_AS(r->resolve<IA>(), cyclic_dependency);
    // A stale stack would report IA or IB here.
    REQUIRE_NOTHROW(r->resolve<ILeaf>());
    REQUIRE_THROWS_AS(r->resolve<IB>(), cyclic_dependency);
}

TEST_CASE("Cycles: breaking the cycle by overwrite", "[cycles]") {
    registry reg;
    reg.add_singleton<IA, A>(deps<IB>);
    reg.add_singleton<IB, B>(deps<IA>);
    auto r = reg.build({.validate_on_build = false});
    REQUIRE_THROWS_AS(r->resolve<IA>(), cyclic_dependency);

    reg.add_singleton<IA, PlainA>();
    REQUIRE_NOTHROW(r->resolve<IB>());
    REQUIRE_NOTHROW(r->resolve<IA>());
}

TEST_CASE("Cycles: shared dependency is not a cycle", "[cycles]") {
    struct Diamond : IA {
        Diamond(std::shared_ptr<ILeaf>, std::shared_ptr<ILeaf>) {}
    };

    registry reg;
    reg.add_transient<ILeaf, Leaf>();
    reg.add_transient<IA, Diamond>(deps<ILeaf, ILeaf>);
    auto r = reg.build();

    REQUIRE_NOTHROW(r->resolve<IA>());
}

TEST_CASE("Cycles: cycle through a collection dependency", "[cycles]") {
    struct Aggregator : IA {
        explicit Aggregator(std::vector<std::shared_ptr<IA>>) {}
    };

    registry reg;
    reg.add_transient<IA, Aggregator>(deps<collection<IA>>);
    auto r = reg.build({.validate_on_build = false});

    REQUIRE_THROWS_AS(r->resolve<IA>(), cyclic_dependency);
}

TEST_CASE("Cycles: try_resolve still reports a cycle", "[cycles]") {
    registry reg;
    reg.add_transient<IA, A>(deps<IB>);
    reg.add_transient<IB, B>(deps<IA>);
    auto r = reg.build({.validate_on_build = false});

    REQUIRE_THROWS_AS(r->try_resolve<IA>(), cyclic_dependency);
    REQUIRE_THROWS_AS(r->try_resolve<IB>(), cyclic_dependency);
}

TEST_CASE("Cycles: keyed try_resolve still reports a cycle", "[cycles]") {
    registry reg;
    reg.add_transient<IA, SelfLoop>("ping", deps<keyed<IA, "pong">>);
    reg.add_transient<IA, SelfLoop>("pong", deps<keyed<IA, "ping">>);
    auto r = reg.build({.validate_on_build = false});

    REQUIRE_THROWS_AS(r->try_resolve<IA>("ping"), cyclic_dependency);
    REQUIRE(r->try_resolve<IA>("absent") == nullptr);
}
