#include <catch2/catch_test_macros.hpp>
#include "test_support.hpp"

#include <stdexcept>
#include <string>
#include <utility>

using namespace libinject;

namespace {

struct NeedsTwo {
    NeedsTwo(int, std::string) {}

    static void describe(type_builder<NeedsTwo>& b) {
        b.constructor<int, std::string>({"count", "label"});
    }
};

struct ThrowingCtor {
    explicit ThrowingCtor(int v) {
        if (v < 0) throw std::runtime_error("negative");
    }

    static void describe(type_builder<ThrowingCtor>& b) {
        b.constructor<int>({"v"});
    }
};

} // namespace

TEST_CASE("Rented buffers have the requested size", "[pool]") {
    argument_pool pool;
    auto l = pool.rent(3);
    REQUIRE(l.size() == 3);
    REQUIRE(l.args().size() == 3);
    for (auto& v : l.args()) REQUIRE_FALSE(v.has_value());
    REQUIRE(pool.outstanding() == 1);
}

TEST_CASE("Returned buffers are cleared and reused", "[pool]") {
    argument_pool pool;
    {
        auto l = pool.rent(2);
        l.args()[0] = 1;
        l.args()[1] = std::string("held");
    }
    REQUIRE(pool.outstanding() == 0);
    REQUIRE(pool.available(2) == 1);

    auto again = pool.rent(2);
    REQUIRE(pool.available(2) == 0);
    REQUIRE_FALSE(again.args()[0].has_value());
    REQUIRE_FALSE(again.args()[1].has_value());
}

TEST_CASE("Idle buffers are capped per arity", "[pool]") {
    argument_pool pool(2);
    {
        auto a = pool.rent(1);
        auto b = pool.rent(1);
        auto c = pool.rent(1);
        REQUIRE(pool.outstanding() == 3);
    }
    REQUIRE(pool.outstanding() == 0);
    REQUIRE(pool.available(1) == 2);
    REQUIRE(pool.available(0) == 0);
}

TEST_CASE("A moved lease is returned once", "[pool]") {
    argument_pool pool;
    {
        auto a = pool.rent(1);
        auto b = std::move(a);
        REQUIRE(pool.outstanding() == 1);

        auto c = pool.rent(1);
        c = std::move(b);
        REQUIRE(pool.outstanding() == 1);
        REQUIRE(pool.available(1) == 1);
    }
    REQUIRE(pool.outstanding() == 0);
    REQUIRE(pool.available(1) == 2);
}

TEST_CASE("Buffer is returned when parameter resolution fails", "[pool]") {
    test::map_resolver r;
    r.add(1);   // no std::string registered

    injector inj;
    REQUIRE(inj.pool().available(2) == 0);
    REQUIRE_THROWS_AS(inj.create<NeedsTwo>(r), not_found);
    REQUIRE(inj.pool().outstanding() == 0);
    REQUIRE(inj.pool().available(2) == 1);

    REQUIRE_THROWS_AS(inj.create<NeedsTwo>(r), not_found);
    REQUIRE(inj.pool().available(2) == 1);
}

TEST_CASE("Buffer is returned when the constructor throws", "[pool]") {
    test::map_resolver r;
    r.add(-1);

    injector inj;
    REQUIRE_THROWS_AS(inj.create<ThrowingCtor>(r), resolution_error);
    REQUIRE(inj.pool().outstanding() == 0);
    REQUIRE(inj.pool().available(1) == 1);
}

TEST_CASE("Pool size follows the injector options", "[pool]") {
    injector inj({.pooled_buffers_per_arity = 0});
    test::map_resolver r;
    r.add(1).add(std::string("x"));
    inj.create<NeedsTwo>(r);
    REQUIRE(inj.pool().available(2) == 0);
    REQUIRE(inj.pool().outstanding() == 0);
}
