// quarry_ecs Entity tests

#include <catch2/catch_test_macros.hpp>
#include <quarry/ecs/entity.hpp>
#include <string>
#include <unordered_set>

using namespace quarry_ecs;

// =============================================================================
// Entity Tests
// =============================================================================

TEST_CASE("Entity null handle", "[ecs][entity]") {
    Entity e;
    REQUIRE(e.is_null());
    REQUIRE_FALSE(e.is_valid());
    REQUIRE(e == Entity::null());
    REQUIRE(e.to_string() == "null");
}

TEST_CASE("Entity bits round trip", "[ecs][entity]") {
    Entity e(42, 7);
    REQUIRE(e.to_bits() == ((std::uint64_t(7) << 32) | 42));
    REQUIRE(Entity::from_bits(e.to_bits()) == e);
}

TEST_CASE("Entity ordering and hashing", "[ecs][entity]") {
    Entity a(1, 0);
    Entity b(1, 1);
    Entity c(2, 0);

    REQUIRE(a < b);
    REQUIRE(b < c);
    REQUIRE(a != b);

    std::unordered_set<Entity> set{a, b};
    REQUIRE(set.count(Entity(1, 1)) == 1);
    REQUIRE(set.count(c) == 0);

    REQUIRE(Entity(5, 2).to_string() == "5v2");
}

// =============================================================================
// EntityAllocator Tests
// =============================================================================

TEST_CASE("EntityAllocator allocate", "[ecs][entity]") {
    EntityAllocator alloc;

    Entity e1 = alloc.allocate();
    Entity e2 = alloc.allocate();

    REQUIRE(e1.index == 0);
    REQUIRE(e2.index == 1);
    REQUIRE(e1.generation == 0);
    REQUIRE(alloc.alive_count() == 2);
    REQUIRE(alloc.capacity() == 2);
    REQUIRE(alloc.is_alive(e1));
}

TEST_CASE("EntityAllocator recycles with a new generation", "[ecs][entity]") {
    EntityAllocator alloc;

    Entity e = alloc.allocate();
    REQUIRE(alloc.deallocate(e));
    REQUIRE_FALSE(alloc.is_alive(e));
    REQUIRE_FALSE(alloc.deallocate(e));

    Entity reused = alloc.allocate();
    REQUIRE(reused.index == e.index);
    REQUIRE(reused.generation == e.generation + 1);
    REQUIRE(alloc.is_alive(reused));
    REQUIRE_FALSE(alloc.is_alive(e));
    REQUIRE(alloc.current_generation(e.index) == reused.generation);
}

TEST_CASE("EntityAllocator clear keeps stale handles dead", "[ecs][entity]") {
    EntityAllocator alloc;
    Entity a = alloc.allocate();
    Entity b = alloc.allocate();

    alloc.clear();
    REQUIRE(alloc.alive_count() == 0);
    REQUIRE_FALSE(alloc.is_alive(a));
    REQUIRE_FALSE(alloc.is_alive(b));

    Entity next = alloc.allocate();
    REQUIRE(next.index == 0);
    REQUIRE(next.generation == 1);
}
