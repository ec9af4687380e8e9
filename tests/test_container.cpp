#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <libinject.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace libinject;

namespace {

struct IClock {
    virtual ~IClock() = default;
    virtual int now() const = 0;
};

struct FixedClock : IClock {
    int t = 100;
    int now() const override { return t; }
};

struct Reporter {
    std::shared_ptr<IClock> clock;
    std::string prefix;

    Reporter(std::shared_ptr<IClock> c, std::string p)
        : clock(std::move(c)), prefix(std::move(p)) {}

    std::string report() const { return prefix + std::to_string(clock->now()); }

    static void describe(type_builder<Reporter>& b) {
        b.constructor<std::shared_ptr<IClock>, std::string>({"clock", "prefix"});
    }
};

struct ParentOnly {
    int from_parent = 0;
    int local = 0;

    static void describe(type_builder<ParentOnly>& b) {
        b.field<&ParentOnly::from_parent>("from_parent", {.inject = true, .from_parent = true})
         .field<&ParentOnly::local>("local", {.inject = true});
    }
};

} // namespace

TEST_CASE("Values, instances and factories resolve", "[container]") {
    auto clock = std::make_shared<FixedClock>();
    int calls = 0;

    registry reg;
    reg.add_value(42)
       .add_value(std::string("name"), "label")
       .add_instance<IClock>(clock)
       .add_factory<double>([&](resolver&) { return ++calls * 1.5; });
    auto r = reg.build();

    REQUIRE(r->get<int>() == 42);
    REQUIRE(r->get<std::string>("label") == "name");
    REQUIRE(r->get<std::shared_ptr<IClock>>() == clock);
    REQUIRE(r->get<double>() == 1.5);
    REQUIRE(r->get<double>() == 3.0);
    REQUIRE(calls == 2);

    const auto& descs = r->descriptors();
    REQUIRE(descs.size() == 4);
    REQUIRE(descs[0].kind == registration_kind::value);
    REQUIRE(descs[1].key == "label");
    REQUIRE(descs[2].kind == registration_kind::instance);
    REQUIRE(descs[3].kind == registration_kind::factory);
}

TEST_CASE("Keyed and non-keyed registrations are separate", "[container]") {
    registry reg;
    reg.add_value(1).add_value(2, "two");
    auto r = reg.build();

    REQUIRE(r->get<int>() == 1);
    REQUIRE(r->get<int>("two") == 2);
    REQUIRE_THROWS_AS(r->get<int>("three"), not_found);
    REQUIRE(r->contains(typeid(int)));
    REQUIRE(r->contains(typeid(int), "two"));
    REQUIRE_FALSE(r->contains(typeid(int), "three"));
}

TEST_CASE("add_type builds through the injector", "[container]") {
    registry reg;
    reg.add_instance<IClock>(std::make_shared<FixedClock>())
       .add_value(std::string("t="))
       .add_type<Reporter>();
    auto r = reg.build();

    auto a = r->get<std::shared_ptr<Reporter>>();
    auto b = r->get<std::shared_ptr<Reporter>>();
    REQUIRE(a->report() == "t=100");
    REQUIRE(a != b);
    REQUIRE(a->clock == b->clock);
}

TEST_CASE("add_type maps an interface to an implementation", "[container]") {
    registry reg;
    reg.add_type<IClock, FixedClock>("fixed");
    auto r = reg.build();

    auto c = r->get<std::shared_ptr<IClock>>("fixed");
    REQUIRE(c->now() == 100);
    REQUIRE_FALSE(r->try_get<std::shared_ptr<IClock>>().has_value());
}

TEST_CASE("add_type overrides are applied to every resolution", "[container]") {
    registry reg;
    reg.add_instance<IClock>(std::make_shared<FixedClock>())
       .add_type<Reporter>({}, {with_parameter<std::string>("prefix", std::string("at "))});
    auto r = reg.build();

    REQUIRE(r->get<std::shared_ptr<Reporter>>()->report() == "at 100");
}

TEST_CASE("Duplicate registrations are rejected", "[container]") {
    registry reg;
    reg.add_value(1);
    REQUIRE_THROWS_AS(reg.add_value(2), duplicate_registration);
    REQUIRE_NOTHROW(reg.add_value(2, "other"));
    REQUIRE_THROWS_AS(reg.add_value(3, "other"), duplicate_registration);
    REQUIRE_THROWS_AS(reg.add_factory<int>([](resolver&) { return 4; }), duplicate_registration);
    REQUIRE(reg.descriptors().size() == 2);
}

TEST_CASE("Null instances are rejected", "[container]") {
    registry reg;
    REQUIRE_THROWS_AS(reg.add_instance<IClock>(nullptr), argument_error);
}

TEST_CASE("A registry builds once", "[container]") {
    registry reg;
    reg.add_value(1);
    auto r = reg.build();
    REQUIRE_THROWS_AS(reg.build(), di_error);
    REQUIRE_THROWS_AS(reg.add_value(2.0), di_error);
}

TEST_CASE("Child resolvers fall back to the parent", "[container]") {
    registry root_reg;
    root_reg.add_value(1).add_value(std::string("root"));
    auto root = root_reg.build();

    registry child_reg;
    child_reg.add_value(2);
    auto child = child_reg.build({.parent = root});

    REQUIRE(child->get<int>() == 2);
    REQUIRE(child->get<std::string>() == "root");
    REQUIRE(child->parent() == root.get());
    REQUIRE(child->parent_resolver() == root);
    REQUIRE(root->parent() == nullptr);
    REQUIRE(child->contains(typeid(std::string)));
}

TEST_CASE("Children share the parent's injector unless given one", "[container]") {
    registry root_reg;
    auto root = root_reg.build();

    registry shared_reg;
    auto shared = shared_reg.build({.parent = root});
    REQUIRE(&shared->get_injector() == &root->get_injector());

    registry own_reg;
    auto own = own_reg.build({.parent = root, .injector = std::make_shared<injector>()});
    REQUIRE(&own->get_injector() != &root->get_injector());
}

TEST_CASE("From-parent members read the parent scope", "[container]") {
    registry root_reg;
    root_reg.add_value(1);
    auto root = root_reg.build();

    registry child_reg;
    child_reg.add_value(2).add_type<ParentOnly>();
    auto child = child_reg.build({.parent = root});

    auto p = child->get<std::shared_ptr<ParentOnly>>();
    REQUIRE(p->from_parent == 1);
    REQUIRE(p->local == 2);

    auto created = child->create<ParentOnly>();
    REQUIRE(created->from_parent == 1);

    ParentOnly existing;
    child->inject(existing);
    REQUIRE(existing.local == 2);
}

TEST_CASE("Factory failures are not swallowed by try_resolve", "[container]") {
    registry reg;
    reg.add_factory<int>([](resolver&) -> int { throw std::runtime_error("broken"); });
    auto r = reg.build();

    REQUIRE_FALSE(r->try_get<double>().has_value());
    REQUIRE_THROWS_AS(r->try_get<int>(), resolution_error);
}

TEST_CASE("Factories throwing non-standard exceptions are wrapped", "[container]") {
    registry reg;
    reg.add_factory<int>([](resolver&) -> int { throw 42; });
    auto r = reg.build();

    try {
        r->get<int>();
        FAIL("Expected resolution_error");
    } catch (const resolution_error& e) {
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("unknown exception"));
        REQUIRE_THROWS_AS(std::rethrow_exception(e.cause()), int);
    }
}

TEST_CASE("Resolution failures name the chain of registrations", "[container]") {
    registry reg;
    reg.add_value(std::string("p")).add_type<Reporter>();
    auto r = reg.build({.validate_on_build = false});

    try {
        r->get<std::shared_ptr<Reporter>>();
        FAIL("Expected not_found");
    } catch (const not_found& e) {
        REQUIRE(e.component_type() == std::type_index(typeid(IClock)));
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("while resolving"));
        REQUIRE_THAT(std::string(e.what()), Catch::Matchers::ContainsSubstring("Reporter"));
    }
}
