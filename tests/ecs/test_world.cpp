// quarry_ecs World tests

#include <catch2/catch_test_macros.hpp>
#include <quarry/ecs/ecs.hpp>
#include <string>

using namespace quarry_ecs;

namespace {

struct Position { float x, y; };
struct Velocity { float x, y; };
struct Health { int current, max; };
struct Tag {
    static constexpr StorageType storage_type = StorageType::SparseSet;
    std::string label;
};

} // namespace

// =============================================================================
// World Entity Tests
// =============================================================================

TEST_CASE("World spawn and despawn", "[ecs][world]") {
    World world;
    REQUIRE(world.entity_count() == 0);

    Entity e1 = world.spawn();
    Entity e2 = world.spawn();
    REQUIRE(world.entity_count() == 2);
    REQUIRE(world.is_alive(e1));

    auto loc = world.entity_location(e1);
    REQUIRE(loc.has_value());
    REQUIRE(loc->archetype_id == ArchetypeId::empty());
    REQUIRE(loc->table_id == TableId::empty());

    REQUIRE(world.despawn(e1));
    REQUIRE_FALSE(world.despawn(e1));
    REQUIRE_FALSE(world.is_alive(e1));
    REQUIRE_FALSE(world.entity_location(e1).has_value());
    REQUIRE(world.is_alive(e2));
    REQUIRE(world.entity_count() == 1);
}

TEST_CASE("World ids are unique", "[ecs][world]") {
    World a;
    World b;
    REQUIRE(a.id() != b.id());
}

// =============================================================================
// World Component Tests
// =============================================================================

TEST_CASE("World add and get components", "[ecs][world]") {
    World world;
    Entity e = world.spawn();

    REQUIRE(world.add_component(e, Position{1.0f, 2.0f}));
    REQUIRE(world.add_component(e, Velocity{3.0f, 4.0f}));

    REQUIRE(world.has_component<Position>(e));
    REQUIRE(world.has_component<Velocity>(e));
    REQUIRE_FALSE(world.has_component<Health>(e));

    const Position* pos = world.get_component<Position>(e);
    REQUIRE(pos != nullptr);
    REQUIRE(pos->x == 1.0f);
    REQUIRE(world.get_component<Velocity>(e)->y == 4.0f);
    REQUIRE(world.get_component<Health>(e) == nullptr);

    SECTION("replacing keeps the archetype") {
        ArchetypeId before = world.entity_location(e)->archetype_id;
        REQUIRE(world.add_component(e, Position{9.0f, 9.0f}));
        REQUIRE(world.entity_location(e)->archetype_id == before);
        REQUIRE(world.get_component<Position>(e)->x == 9.0f);
    }

    SECTION("dead entity") {
        REQUIRE(world.despawn(e));
        REQUIRE_FALSE(world.add_component(e, Health{1, 1}));
        REQUIRE(world.get_component<Position>(e) == nullptr);
    }
}

TEST_CASE("World remove component", "[ecs][world]") {
    World world;
    Entity e = world.build_entity()
        .with(Position{1.0f, 2.0f})
        .with(Velocity{3.0f, 4.0f})
        .build();

    auto removed = world.remove_component<Position>(e);
    REQUIRE(removed.has_value());
    REQUIRE(removed->y == 2.0f);
    REQUIRE_FALSE(world.has_component<Position>(e));
    REQUIRE(world.get_component<Velocity>(e)->x == 3.0f);

    REQUIRE_FALSE(world.remove_component<Position>(e).has_value());
    REQUIRE_FALSE(world.remove_component<Health>(e).has_value());
}

TEST_CASE("World keeps rows consistent across swap removal", "[ecs][world]") {
    World world;
    Entity a = world.build_entity().with(Health{1, 10});
    Entity b = world.build_entity().with(Health{2, 10});
    Entity c = world.build_entity().with(Health{3, 10});

    REQUIRE(world.despawn(a));
    REQUIRE(world.get_component<Health>(b)->current == 2);
    REQUIRE(world.get_component<Health>(c)->current == 3);

    REQUIRE(world.add_component(b, Position{0, 0}));
    REQUIRE(world.get_component<Health>(c)->current == 3);
    REQUIRE(world.get_component<Health>(b)->current == 2);
}

TEST_CASE("World sparse-set components", "[ecs][world][sparse]") {
    World world;
    Entity e = world.build_entity().with(Position{1, 1}).with(Tag{"boss"});

    auto loc = world.entity_location(e);
    const Archetype& arch = world.archetypes()[loc->archetype_id];
    REQUIRE(arch.sparse_components().size() == 1);
    REQUIRE(arch.table_components().size() == 1);

    // Sparse components do not change the table
    Entity plain = world.build_entity().with(Position{2, 2});
    REQUIRE(world.entity_location(plain)->table_id == loc->table_id);
    REQUIRE(world.entity_location(plain)->archetype_id != loc->archetype_id);

    REQUIRE(world.get_component<Tag>(e)->label == "boss");
    auto removed = world.remove_component<Tag>(e);
    REQUIRE(removed->label == "boss");
    REQUIRE_FALSE(world.has_component<Tag>(e));
    REQUIRE(world.get_component<Position>(e)->x == 1);
}

TEST_CASE("World clear", "[ecs][world]") {
    World world;
    Entity e = world.build_entity().with(Position{0, 0});
    world.clear();

    REQUIRE(world.entity_count() == 0);
    REQUIRE_FALSE(world.is_alive(e));
    REQUIRE(world.component_id<Position>().has_value());

    Entity fresh = world.build_entity().with(Position{5, 5});
    REQUIRE(world.get_component<Position>(fresh)->x == 5);
}

// =============================================================================
// Structural Changes While Borrowed
// =============================================================================

TEST_CASE("World refuses structural changes while borrowed", "[ecs][world][access]") {
    World world;
    Entity e = world.build_entity().with(Position{0, 0});
    QueryState<Data<const Position&>> positions(world);

    auto iter = positions.iter(world);
    REQUIRE(world.has_active_borrows());

    SECTION("spawn") {
        REQUIRE_THROWS_AS(world.spawn(), quarry_core::UsageError);
    }

    SECTION("despawn") {
        REQUIRE_THROWS_AS(world.despawn(e), quarry_core::UsageError);
    }

    SECTION("add component") {
        try {
            world.add_component(e, Velocity{1, 1});
            FAIL("add_component succeeded during iteration");
        } catch (const quarry_core::UsageError& err) {
            REQUIRE(err.error().as<quarry_core::QueryError>()->kind ==
                    quarry_core::QueryError::Kind::StructuralChange);
        }
    }

    SECTION("remove component") {
        REQUIRE_THROWS_AS(world.remove_component<Position>(e), quarry_core::UsageError);
    }

    SECTION("allowed again after the iterator is gone") {
        { auto done = std::move(iter); }
        REQUIRE_FALSE(world.has_active_borrows());
        REQUIRE(world.add_component(e, Velocity{1, 1}));
    }
}
