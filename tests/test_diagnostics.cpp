#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include "test_support.hpp"

#include <memory>
#include <stdexcept>
#include <string>

using namespace libinject;
using Catch::Matchers::ContainsSubstring;

namespace {

struct IMissing {
    virtual ~IMissing() = default;
};

struct Leaf {
    explicit Leaf(std::shared_ptr<IMissing>) {}

    static void describe(type_builder<Leaf>& b) {
        b.constructor<std::shared_ptr<IMissing>>({"missing"});
    }
};

struct Root {
    std::shared_ptr<Leaf> leaf;

    static void describe(type_builder<Root>& b) {
        b.field<&Root::leaf>("leaf", {.inject = true});
    }
};

struct Exploding {
    Exploding() { throw std::logic_error("boom"); }
};

struct ThrowsCode {
    explicit ThrowsCode(int code) { throw code; }

    static void describe(type_builder<ThrowsCode>& b) {
        b.constructor<int>({"code"});
    }
};

struct ThrowsCodeByDefault {
    ThrowsCodeByDefault() { throw 42; }
};

struct ThrowsCodeOnInit {
    int code = 0;

    void init() { throw code; }
    void set_code(int c) {
        if (c < 0) throw c;
        code = c;
    }
    int get_code() const { return code; }

    static void describe(type_builder<ThrowsCodeOnInit>& b) {
        b.property<&ThrowsCodeOnInit::get_code, &ThrowsCodeOnInit::set_code>("code", {.inject = true})
         .method<&ThrowsCodeOnInit::init>("init", {}, {.inject = true});
    }
};

} // namespace

TEST_CASE("di_error records where it was raised", "[diagnostics]") {
    di_error e("something failed");
    REQUIRE_THAT(std::string(e.what()), ContainsSubstring("something failed"));
    REQUIRE_THAT(std::string(e.what()), ContainsSubstring("test_diagnostics.cpp"));
    REQUIRE(std::string(e.location().file_name()).find("test_diagnostics.cpp") != std::string::npos);
}

TEST_CASE("Resolution context accumulates", "[diagnostics]") {
    not_found e(typeid(int));
    e.append_resolution_context("Inner");
    e.append_resolution_context("Outer");
    REQUIRE_THAT(std::string(e.what()), ContainsSubstring("(while resolving Inner -> Outer)"));
}

TEST_CASE("full_diagnostic appends the detail", "[diagnostics]") {
    di_error e("failed");
    REQUIRE(e.full_diagnostic() == std::string(e.what()));

    e.set_diagnostic_detail("extra lines");
    REQUIRE(e.diagnostic_detail() == "extra lines");
    REQUIRE(e.full_diagnostic() == std::string(e.what()) + "\nextra lines");
}

TEST_CASE("Exception messages name their subject", "[diagnostics]") {
    REQUIRE_THAT(std::string(not_found(typeid(int), "port").what()),
                 ContainsSubstring("key=\"port\""));
    REQUIRE_THAT(std::string(no_parent_container(typeid(int), "limit").what()),
                 ContainsSubstring("'limit'"));
    REQUIRE_THAT(std::string(argument_error("resolver").what()),
                 ContainsSubstring("resolver"));
    REQUIRE_THAT(std::string(not_constructible("Widget", "type is abstract").what()),
                 ContainsSubstring("Cannot instantiate Widget: type is abstract"));
    REQUIRE_THAT(std::string(duplicate_registration(typeid(int)).what()),
                 ContainsSubstring("Duplicate registration"));
}

TEST_CASE("All errors derive from di_error", "[diagnostics]") {
    REQUIRE_THROWS_AS(throw not_found(typeid(int)), di_error);
    REQUIRE_THROWS_AS(throw no_parent_container(typeid(int), "x"), di_error);
    REQUIRE_THROWS_AS(throw argument_error("x"), di_error);
    REQUIRE_THROWS_AS(throw not_constructible("X", "y"), di_error);
    REQUIRE_THROWS_AS(throw duplicate_registration(typeid(int)), di_error);
    REQUIRE_THROWS_AS(throw cyclic_dependency({typeid(int), typeid(int)}), di_error);
}

TEST_CASE("Nested failures carry the full chain", "[diagnostics]") {
    registry reg;
    reg.add_type<Leaf>().add_type<Root>();
    auto r = reg.build({.validate_on_build = false});

    try {
        r->create<Root>();
        FAIL("Expected not_found");
    } catch (const not_found& e) {
        REQUIRE(e.component_type() == std::type_index(typeid(IMissing)));
        std::string msg = e.what();
        REQUIRE_THAT(msg, ContainsSubstring("IMissing"));
        REQUIRE_THAT(msg, ContainsSubstring("Leaf"));
        REQUIRE_THAT(msg, ContainsSubstring("Root::leaf"));
    }
}

TEST_CASE("Invocation failures keep the original exception", "[diagnostics]") {
    test::map_resolver r;
    injector inj;
    try {
        inj.create<Exploding>(r);
        FAIL("Expected resolution_error");
    } catch (const resolution_error& e) {
        REQUIRE_THAT(e.type_name(), ContainsSubstring("Exploding"));
        REQUIRE(e.member_name().empty());
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("boom"));
        REQUIRE_THROWS_AS(std::rethrow_exception(e.cause()), std::logic_error);
    }
}

TEST_CASE("Non-standard exceptions from constructors are wrapped", "[diagnostics]") {
    test::map_resolver r;
    r.add(42);
    injector inj;

    try {
        inj.create<ThrowsCode>(r);
        FAIL("Expected resolution_error");
    } catch (const resolution_error& e) {
        REQUIRE_THAT(e.type_name(), ContainsSubstring("ThrowsCode"));
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("unknown exception"));
        REQUIRE_THROWS_AS(std::rethrow_exception(e.cause()), int);
    }
    REQUIRE(inj.pool().outstanding() == 0);

    try {
        inj.create<ThrowsCodeByDefault>(r);
        FAIL("Expected resolution_error");
    } catch (const resolution_error& e) {
        REQUIRE_THAT(e.type_name(), ContainsSubstring("ThrowsCodeByDefault"));
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("unknown exception"));
    }
}

TEST_CASE("Non-standard exceptions from members and methods are wrapped", "[diagnostics]") {
    injector inj;

    test::map_resolver negative;
    negative.add(-1);
    ThrowsCodeOnInit a;
    try {
        inj.inject(a, negative);
        FAIL("Expected resolution_error");
    } catch (const resolution_error& e) {
        REQUIRE(e.member_name() == "code");
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("unknown exception"));
        REQUIRE_THROWS_AS(std::rethrow_exception(e.cause()), int);
    }

    test::map_resolver positive;
    positive.add(7);
    ThrowsCodeOnInit b;
    try {
        inj.inject(b, positive);
        FAIL("Expected resolution_error");
    } catch (const resolution_error& e) {
        REQUIRE(e.member_name() == "init");
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("Failed to inject"));
        REQUIRE_THAT(std::string(e.what()), ContainsSubstring("unknown exception"));
    }
    REQUIRE(b.code == 7);
    REQUIRE(inj.pool().outstanding() == 0);
}

#ifdef LIBINJECT_HAS_STACKTRACE
TEST_CASE("Wrapped failures carry a stack trace when enabled", "[diagnostics]") {
    test::map_resolver r;

    injector quiet;
    try {
        quiet.create<Exploding>(r);
        FAIL("Expected resolution_error");
    } catch (const resolution_error& e) {
        REQUIRE(e.diagnostic_detail().empty());
    }

    injector traced({.capture_stacktrace = true});
    try {
        traced.create<Exploding>(r);
        FAIL("Expected resolution_error");
    } catch (const resolution_error& e) {
        REQUIRE_THAT(e.diagnostic_detail(), ContainsSubstring("Stacktrace at"));
        REQUIRE_THAT(e.full_diagnostic(), ContainsSubstring("boom"));
    }
}

TEST_CASE("Registration traces are attached to container failures", "[diagnostics]") {
    registry reg;
    reg.add_type<Leaf>();
    try {
        reg.build();
        FAIL("Expected not_found");
    } catch (const not_found& e) {
        REQUIRE_THAT(e.diagnostic_detail(), ContainsSubstring("called via add_type"));
    }
}
#endif
