// quarry_ecs Query tests

#include <catch2/catch_test_macros.hpp>
#include <quarry/ecs/ecs.hpp>
#include <algorithm>
#include <vector>

using namespace quarry_ecs;

namespace {

struct Position { float x, y; };
struct Velocity { float x, y; };
struct Health { int current, max; };
struct Static {};
struct Shield {
    static constexpr StorageType storage_type = StorageType::SparseSet;
    int strength;
};

} // namespace

// =============================================================================
// QueryDescriptor Tests
// =============================================================================

TEST_CASE("QueryDescriptor building", "[ecs][query]") {
    World world;
    ComponentId pos_id = world.register_component<Position>();
    ComponentId vel_id = world.register_component<Velocity>();
    ComponentId health_id = world.register_component<Health>();

    SECTION("simple read query") {
        auto desc = QueryDescriptor().read(pos_id).build();
        REQUIRE(desc.accesses().size() == 1);
        REQUIRE(desc.accesses()[0].id == pos_id);
        REQUIRE(desc.accesses()[0].access == Access::Read);
        REQUIRE(desc.is_read_only());
    }

    SECTION("write makes it mutable") {
        auto desc = QueryDescriptor().read(pos_id).write(vel_id).build();
        REQUIRE_FALSE(desc.is_read_only());
        REQUIRE(desc.required_mask().contains(pos_id.id));
        REQUIRE(desc.required_mask().contains(vel_id.id));
    }

    SECTION("optional terms are not required") {
        auto desc = QueryDescriptor().read(pos_id).optional_read(health_id).build();
        REQUIRE_FALSE(desc.required_mask().contains(health_id.id));
    }

    SECTION("without goes to the excluded mask") {
        auto desc = QueryDescriptor().read(pos_id).without(health_id).build();
        REQUIRE(desc.excluded_mask().contains(health_id.id));
        REQUIRE_FALSE(desc.is_contradictory());
    }

    SECTION("required and excluded is contradictory") {
        auto desc = QueryDescriptor().read(pos_id).without(pos_id).build();
        REQUIRE(desc.is_contradictory());
    }
}

TEST_CASE("QueryDescriptor self conflicts", "[ecs][query]") {
    ComponentId a{0};
    ComponentId b{1};

    REQUIRE_FALSE(QueryDescriptor().read(a).read(a).build().self_conflict().has_value());
    REQUIRE(QueryDescriptor().read(a).write(a).build().self_conflict() == a);
    REQUIRE(QueryDescriptor().write(b).optional_write(b).build().self_conflict() == b);

    // Filters never conflict with data terms
    REQUIRE_FALSE(QueryDescriptor().write(a).with(a).build().self_conflict().has_value());
    REQUIRE_FALSE(QueryDescriptor().write(a).tick_read(a).build().self_conflict().has_value());
}

TEST_CASE("QueryDescriptor conflicts between queries", "[ecs][query]") {
    ComponentId a{0};
    ComponentId b{1};

    auto reads_a = QueryDescriptor().read(a).build();
    auto writes_a = QueryDescriptor().write(a).build();
    auto writes_b = QueryDescriptor().write(b).with(a).build();

    REQUIRE_FALSE(reads_a.conflicts_with(reads_a));
    REQUIRE(reads_a.conflicts_with(writes_a));
    REQUIRE_FALSE(writes_a.conflicts_with(writes_b));
}

// =============================================================================
// Typed Query Iteration
// =============================================================================

TEST_CASE("QueryState iterates every matching entity", "[ecs][query]") {
    World world;
    Entity moving = world.build_entity().with(Position{0, 0}).with(Velocity{1, 2});
    Entity still = world.build_entity().with(Position{5, 5});
    world.build_entity().with(Velocity{3, 3});

    SECTION("required terms") {
        QueryState<Data<Entity, const Position&, const Velocity&>> query(world);
        std::vector<Entity> seen;
        for (auto [entity, pos, vel] : query.iter(world)) {
            seen.push_back(entity);
            REQUIRE(vel.x == 1);
        }
        REQUIRE(seen == std::vector<Entity>{moving});
    }

    SECTION("write through references") {
        QueryState<Data<const Velocity&, Position&>> query(world);
        for (auto [vel, pos] : query.iter_mut(world)) {
            pos.x += vel.x;
            pos.y += vel.y;
        }
        REQUIRE(world.get_component<Position>(moving)->x == 1);
        REQUIRE(world.get_component<Position>(moving)->y == 2);
        REQUIRE(world.get_component<Position>(still)->x == 5);
    }

    SECTION("optional terms") {
        QueryState<Data<Entity, const Position&, const Velocity*>> query(world);
        std::size_t with_velocity = 0;
        std::size_t total = 0;
        query.iter(world).for_each([&](auto item) {
            auto [entity, pos, vel] = item;
            ++total;
            if (vel) {
                ++with_velocity;
                REQUIRE(entity == moving);
            }
        });
        REQUIRE(total == 2);
        REQUIRE(with_velocity == 1);
    }

    SECTION("With and Without filters") {
        world.add_component(still, Static{});
        QueryState<Data<Entity>, Filter<With<Position>, Without<Static>>> query(world);
        auto entities = query.iter(world).fold(std::vector<Entity>{}, [](std::vector<Entity> acc, auto item) {
            acc.push_back(std::get<0>(item));
            return acc;
        });
        REQUIRE(entities == std::vector<Entity>{moving});
    }

    SECTION("entity-only query sees every entity") {
        QueryState<Data<Entity>> query(world);
        REQUIRE(query.iter(world).count() == 3);
    }
}

TEST_CASE("QueryState picks up archetypes created later", "[ecs][query]") {
    World world;
    QueryState<Data<const Health&>> query(world);
    REQUIRE(query.iter(world).count() == 0);
    REQUIRE(query.matched_storage_ids().empty());

    world.build_entity().with(Health{1, 1});
    world.build_entity().with(Health{2, 2}).with(Position{0, 0});

    REQUIRE(query.iter(world).count() == 2);
    REQUIRE(query.matched_storage_ids().size() == 2);
}

TEST_CASE("QueryState over sparse components", "[ecs][query][sparse]") {
    World world;
    Entity a = world.build_entity().with(Position{1, 0}).with(Shield{10});
    Entity b = world.build_entity().with(Position{2, 0});
    Entity c = world.build_entity().with(Position{3, 0}).with(Shield{30});

    SECTION("required sparse term") {
        QueryState<Data<Entity, Shield&>> query(world);
        REQUIRE_FALSE(QueryState<Data<Entity, Shield&>>::is_dense);
        for (auto [entity, shield] : query.iter_mut(world)) {
            shield.strength += 1;
        }
        REQUIRE(world.get_component<Shield>(a)->strength == 11);
        REQUIRE(world.get_component<Shield>(c)->strength == 31);
    }

    SECTION("optional sparse term") {
        QueryState<Data<Entity, const Shield*>> query(world);
        std::size_t shielded = 0;
        for (auto [entity, shield] : query.iter(world)) {
            if (shield) {
                ++shielded;
                REQUIRE(entity != b);
            }
        }
        REQUIRE(shielded == 2);
    }

    SECTION("sparse filter") {
        QueryState<Data<const Position&>, Filter<Without<Shield>>> query(world);
        float sum = 0;
        for (auto [pos] : query.iter(world)) {
            sum += pos.x;
        }
        REQUIRE(sum == 2.0f);
    }
}

TEST_CASE("QueryState get and iter_many", "[ecs][query]") {
    World world;
    Entity a = world.build_entity().with(Health{1, 10});
    Entity b = world.build_entity().with(Position{0, 0});
    Entity c = world.build_entity().with(Health{3, 10});
    Entity dead = world.build_entity().with(Health{4, 10});
    REQUIRE(world.despawn(dead));

    QueryState<Data<Entity, const Health&>> query(world);

    SECTION("get") {
        {
            auto item = query.get(world, a);
            REQUIRE(item.has_value());
            REQUIRE(std::get<1>(*item).current == 1);
            REQUIRE(world.has_active_borrows());
        }
        REQUIRE_FALSE(query.get(world, b).has_value());
        REQUIRE_FALSE(query.get(world, dead).has_value());
        REQUIRE_FALSE(world.has_active_borrows());
    }

    SECTION("iter_many over a temporary list") {
        std::vector<int> seen;
        for (auto [entity, health] : query.iter_many(world, std::vector<Entity>{c, a})) {
            seen.push_back(health.current);
        }
        REQUIRE(seen == std::vector<int>{3, 1});
    }

    SECTION("iter_many_unique_mut over a temporary set") {
        QueryState<Data<Health&>> writer(world);
        for (auto [health] : writer.iter_many_unique_mut(world, UniqueEntityVec::from_vec({c, a}).unwrap())) {
            health.current += 100;
        }
        REQUIRE(world.get_component<Health>(a)->current == 101);
        REQUIRE(world.get_component<Health>(c)->current == 103);
    }

    SECTION("the iterator keeps its own copy of the list") {
        std::vector<Entity> list{a, c};
        auto iter = query.iter_many(world, list);
        list.assign(64, b);
        REQUIRE(iter.count() == 2);
    }

    SECTION("iter_many keeps list order and skips misses") {
        std::vector<Entity> list{c, b, dead, a, c};
        std::vector<int> seen;
        for (auto [entity, health] : query.iter_many(world, list)) {
            seen.push_back(health.current);
        }
        REQUIRE(seen == std::vector<int>{3, 1, 3});
    }

    SECTION("iter_many_unique_mut") {
        QueryState<Data<Health&>> writer(world);
        auto unique = UniqueEntityVec::from_vec({a, c}).unwrap();
        for (auto [health] : writer.iter_many_unique_mut(world, unique)) {
            health.current = 0;
        }
        REQUIRE(world.get_component<Health>(a)->current == 0);
        REQUIRE(world.get_component<Health>(c)->current == 0);
    }

    SECTION("get_mut") {
        QueryState<Data<Health&>> writer(world);
        auto item = writer.get_mut(world, c);
        REQUIRE(item.has_value());
        std::get<0>(*item).current = 99;
        REQUIRE(world.get_component<Health>(c)->current == 99);
    }

    SECTION("get_mut keeps its borrow while the item lives") {
        QueryState<Data<Health&>> writer(world);
        auto first = writer.get_mut(world, c);
        REQUIRE(first.has_value());

        try {
            (void)writer.get_mut(world, c);
            FAIL("second mutable item for the same entity was granted");
        } catch (const quarry_core::UsageError& e) {
            const auto* err = e.error().as<quarry_core::QueryError>();
            REQUIRE(err != nullptr);
            REQUIRE(err->kind == quarry_core::QueryError::Kind::AccessConflict);
        }
        REQUIRE_THROWS_AS(query.get(world, c), quarry_core::UsageError);
        REQUIRE_THROWS_AS(world.despawn(c), quarry_core::UsageError);

        first.reset();
        REQUIRE_FALSE(world.has_active_borrows());
        auto second = writer.get_mut(world, c);
        REQUIRE(second.has_value());
        REQUIRE(std::get<0>(*second).current == 3);
    }
}

TEST_CASE("QueryState iterator bookkeeping", "[ecs][query]") {
    World world;
    for (int i = 0; i < 5; ++i) {
        world.build_entity().with(Health{i, 5});
    }

    QueryState<Data<const Health&>> query(world);
    auto iter = query.iter(world);
    REQUIRE(iter.max_remaining() == 5);
    (void)iter.next();
    REQUIRE(iter.max_remaining() == 4);
    REQUIRE(iter.count() == 4);
    REQUIRE_FALSE(iter.next().has_value());
}

TEST_CASE("QueryState iteration is repeatable", "[ecs][query]") {
    World world;
    for (int i = 0; i < 12; ++i) {
        auto builder = world.build_entity().with(Position{float(i), 0}).with(Health{i, 12});
        if (i % 3 == 0) {
            builder.with(Static{});
        }
        if (i % 2 == 0) {
            builder.with(Shield{i});
        }
    }

    auto collect = [&world](auto& query) {
        return query.iter(world).fold(std::vector<Entity>{}, [](std::vector<Entity> acc, auto item) {
            acc.push_back(std::get<0>(item));
            return acc;
        });
    };

    SECTION("dense") {
        QueryState<Data<Entity, const Health&>, Filter<With<Position>>> query(world);
        std::vector<Entity> first = collect(query);
        std::vector<Entity> second = collect(query);
        REQUIRE(first.size() == 12);
        REQUIRE(first == second);
    }

    SECTION("sparse") {
        QueryState<Data<Entity, const Shield&>> query(world);
        std::vector<Entity> first = collect(query);
        std::vector<Entity> second = collect(query);
        REQUIRE(first.size() == 6);
        REQUIRE(first == second);
    }
}

TEST_CASE("QueryState rejects invalid queries", "[ecs][query]") {
    World world;

    SECTION("component written and read by two terms") {
        try {
            QueryState<Data<Position&, const Position&>> query(world);
            FAIL("self-conflicting query was accepted");
        } catch (const quarry_core::UsageError& e) {
            REQUIRE(e.error().as<quarry_core::QueryError>()->kind ==
                    quarry_core::QueryError::Kind::InvalidQuery);
        }
    }

    SECTION("state used with another world") {
        World other;
        QueryState<Data<const Position&>> query(world);
        REQUIRE_THROWS_AS(query.iter(other), quarry_core::UsageError);
    }

    SECTION("contradictory filters match nothing") {
        world.build_entity().with(Position{0, 0});
        QueryState<Data<const Position&>, Filter<Without<Position>>> query(world);
        REQUIRE(query.iter(world).count() == 0);
    }
}
