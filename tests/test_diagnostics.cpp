#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <svcdi.hpp>
#include <stdexcept>
#include <string>

namespace {

struct IService {
    virtual ~IService() = default;
};
struct ServiceImpl : IService {};

} // namespace

TEST_CASE("not_found includes type name", "[diagnostics]") {
    svcdi::registry reg;
    auto r = reg.build();

    try {
        r->resolve<IService>();
        FAIL("Expected not_found");
    } catch (const svcdi::not_found& e) {
        std::string msg = e.what();
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("IService"));
    }
}

TEST_CASE("not_found with key includes key string", "[diagnostics]") {
    svcdi::registry reg;
    auto r = reg.build();

    try {
        r->resolve<IService>("my_key");
        FAIL("Expected not_found");
    } catch (const svcdi::not_found& e) {
        std::string msg = e.what();
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("my_key"));
    }
}

TEST_CASE("not_found lists the keys that do exist", "[diagnostics]") {
    svcdi::registry reg;
    reg.add_singleton<IService, ServiceImpl>("primary");
    auto r = reg.build();

    try {
        r->resolve<IService>();
        FAIL("Expected not_found");
    } catch (const svcdi::not_found& e) {
        std::string msg = e.what();
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("\"primary\""));
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("unkeyed"));
    }
}

TEST_CASE("cyclic_dependency message format is correct", "[diagnostics]") {
    struct IX { virtual ~IX() = default; };
    struct IY { virtual ~IY() = default; };
    struct XImpl : IX { explicit XImpl(std::shared_ptr<IY>) {} };
    struct YImpl : IY { explicit YImpl(std::shared_ptr<IX>) {} };

    svcdi::registry reg;
    reg.add_singleton<IX, XImpl>(svcdi::deps<IY>);
    reg.add_singleton<IY, YImpl>(svcdi::deps<IX>);

    try {
        reg.build();
        FAIL("Expected cyclic_dependency");
    } catch (const svcdi::cyclic_dependency& e) {
        std::string msg = e.what();
        // Cycle path should be [X -> Y -> X], not [X -> Y -> X -> X]
        std::size_t arrow_count = 0;
        std::size_t pos = 0;
        while ((pos = msg.find(" -> ", pos)) != std::string::npos) {
            ++arrow_count;
            pos += 4;
        }
        REQUIRE(arrow_count == 2);
    }
}

TEST_CASE("di_error carries source_location", "[diagnostics]") {
    try {
        throw svcdi::di_error("test error");
    } catch (const svcdi::di_error& e) {
        std::string loc = e.location().file_name();
        REQUIRE_THAT(loc, Catch::Matchers::ContainsSubstring("test_diagnostics"));
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("test error"));
    }
}

TEST_CASE("lifetime_mismatch includes consumer and dependency", "[diagnostics]") {
    struct ISingleton {
        virtual ~ISingleton() = default;
    };
    struct IScopedDep {
        virtual ~IScopedDep() = default;
    };
    struct ScopedDep : IScopedDep {};
    struct SingletonImpl : ISingleton {
        explicit SingletonImpl(std::shared_ptr<IScopedDep> /*d*/) {}
    };

    svcdi::registry reg;
    reg.add_scoped<IScopedDep, ScopedDep>();
    reg.add_singleton<ISingleton, SingletonImpl>(svcdi::deps<IScopedDep>);

    try {
        reg.build();
        FAIL("Expected lifetime_mismatch");
    } catch (const svcdi::lifetime_mismatch& e) {
        std::string msg = e.what();
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("singleton"));
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("scoped"));
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("SingletonImpl"));
    }
}

TEST_CASE("resolution_error includes type and inner message", "[diagnostics]") {
    struct IFailing {
        virtual ~IFailing() = default;
    };
    struct FailingImpl : IFailing {
        FailingImpl() { throw std::runtime_error("intentional failure"); }
    };

    svcdi::registry reg;
    reg.add_singleton<IFailing, FailingImpl>();
    auto r = reg.build();

    try {
        r->resolve<IFailing>();
        FAIL("Expected resolution_error");
    } catch (const svcdi::resolution_error& e) {
        std::string msg = e.what();
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("intentional failure"));
        REQUIRE_THAT(msg, Catch::Matchers::ContainsSubstring("IFailing"));
        // Points at the registration, not at library internals
        std::string file = e.location().file_name();
        REQUIRE_THAT(file, Catch::Matchers::ContainsSubstring("test_diagnostics"));
    }
}

TEST_CASE("invalid_registration source_location points to user code", "[diagnostics]") {
    svcdi::registry reg;

    try {
        reg.add_singleton<IService, ServiceImpl>("");  // this line
        FAIL("Expected invalid_registration");
    } catch (const svcdi::invalid_registration& e) {
        std::string file = e.location().file_name();
        REQUIRE_THAT(file, Catch::Matchers::ContainsSubstring("test_diagnostics"));
    }
}

TEST_CASE("build() validation error points to the build call", "[diagnostics]") {
    struct IConsumer { virtual ~IConsumer() = default; };
    struct Consumer : IConsumer { explicit Consumer(std::shared_ptr<IService>) {} };

    svcdi::registry reg;
    reg.add_singleton<IConsumer, Consumer>(svcdi::deps<IService>);

    try {
        reg.build();  // this line
        FAIL("Expected not_found");
    } catch (const svcdi::di_error& e) {
        std::string file = e.location().file_name();
        REQUIRE_THAT(file, Catch::Matchers::ContainsSubstring("test_diagnostics"));
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("required by"));
    }
}

TEST_CASE("descriptor records registration site", "[diagnostics]") {
    svcdi::registry reg;
    reg.add_singleton<IService, ServiceImpl>();

    auto descs = reg.descriptors();
    REQUIRE(descs.size() == 1);
    std::string file = descs[0]->registration_location.file_name();
    REQUIRE_THAT(file, Catch::Matchers::ContainsSubstring("test_diagnostics"));
    REQUIRE(descs[0]->api_name == "add_singleton");
}

TEST_CASE("full_diagnostic appends detail", "[diagnostics]") {
    svcdi::di_error e("base");
    REQUIRE(e.full_diagnostic() == std::string(e.what()));

    e.set_diagnostic_detail("extra");
    REQUIRE_THAT(e.full_diagnostic(), Catch::Matchers::EndsWith("\nextra"));
}

TEST_CASE("resolution context accumulates in what()", "[diagnostics]") {
    svcdi::di_error e("inner");
    e.append_resolution_context("B");
    e.append_resolution_context("A");
    REQUIRE_THAT(std::string(e.what()),
                 Catch::Matchers::ContainsSubstring("(while resolving B -> A)"));
}

TEST_CASE("demangle yields readable names", "[diagnostics]") {
    auto name = svcdi::internal::demangle(typeid(IService));
    REQUIRE_THAT(name, Catch::Matchers::ContainsSubstring("IService"));

    auto keyed = svcdi::internal::describe(svcdi::service_key{typeid(IService), "k"});
    REQUIRE_THAT(keyed, Catch::Matchers::EndsWith("(key=\"k\")"));
}
