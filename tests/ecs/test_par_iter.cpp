// quarry_ecs parallel iteration tests

#include <catch2/catch_test_macros.hpp>
#include <quarry/ecs/ecs.hpp>
#include <quarry/tasks/parallel.hpp>
#include <quarry/tasks/task_pool.hpp>

#include <algorithm>
#include <atomic>
#include <numeric>
#include <stdexcept>
#include <vector>

using namespace quarry_ecs;
using quarry_tasks::Parallel;
using quarry_tasks::TaskPool;
using quarry_tasks::TaskPoolConfig;

// Builds without threads always take the sequential path
constexpr bool threaded = quarry_tasks::multi_threaded;

namespace {

struct Position { float x, y; };
struct Velocity { float x, y; };
struct Health { int current, max; };
struct Frozen {};
struct Tag {
    static constexpr StorageType storage_type = StorageType::SparseSet;
    int value;
};

/// Entities spread over three tables
std::vector<Entity> populate(World& world, int per_table) {
    std::vector<Entity> entities;
    for (int i = 0; i < per_table; ++i) {
        entities.push_back(world.build_entity().with(Position{0, 0}).with(Velocity{1, 2}));
        entities.push_back(world.build_entity().with(Position{0, 0}).with(Velocity{1, 2}).with(Frozen{}));
        entities.push_back(world.build_entity().with(Position{0, 0}).with(Velocity{1, 2}).with(Health{i, 100}));
    }
    return entities;
}

struct Red {};
struct Green {};
struct Blue {};

/// One large table (40) and four small ones (3, 2, 5, 1); every entity is tagged
void populate_uneven(World& world) {
    auto spawn = [&world](int count, auto... markers) {
        for (int i = 0; i < count; ++i) {
            auto builder = world.build_entity().with(Position{float(i), 0}).with(Tag{i});
            (builder.with(markers), ...);
        }
    };
    spawn(40);
    spawn(3, Red{});
    spawn(2, Green{});
    spawn(5, Red{}, Green{});
    spawn(1, Blue{});
}

/// Sorted entities visited by a parallel iterator
template<typename ParIter>
std::vector<Entity> collect_parallel(ParIter&& iter) {
    Parallel<std::vector<Entity>> seen;
    std::forward<ParIter>(iter).for_each_init(
        [&seen] { return &seen.borrow_local_mut(); },
        [](std::vector<Entity>* local, auto item) { local->push_back(std::get<0>(item)); });

    std::vector<Entity> all;
    for (auto& part : seen.drain()) {
        all.insert(all.end(), part.begin(), part.end());
    }
    std::sort(all.begin(), all.end());
    return all;
}

/// Sorted entities visited by sequential iteration
template<typename State>
std::vector<Entity> collect_sequential(State& query, const World& world) {
    auto all = query.iter(world).fold(std::vector<Entity>{}, [](std::vector<Entity> acc, auto item) {
        acc.push_back(std::get<0>(item));
        return acc;
    });
    std::sort(all.begin(), all.end());
    return all;
}

} // namespace

TEST_CASE("par_iter visits the same entities as iter", "[ecs][par_iter]") {
    TaskPool pool(TaskPoolConfig{4, "par-test"});
    World world;
    populate_uneven(world);

    // 8 per batch splits the large chunk and merges the small ones
    BatchingStrategy strategy = BatchingStrategy::fixed(8);

    SECTION("dense") {
        QueryState<Data<Entity, const Position&>> query(world);
        REQUIRE(QueryState<Data<Entity, const Position&>>::is_dense);

        std::vector<Entity> sequential = collect_sequential(query, world);
        REQUIRE(sequential.size() == 51);
        REQUIRE(collect_parallel(query.par_iter(world).batching_strategy(strategy).task_pool(pool)) == sequential);
        // Again over the unchanged world
        REQUIRE(collect_parallel(query.par_iter(world).batching_strategy(strategy).task_pool(pool)) == sequential);
    }

    SECTION("dense with a filter") {
        QueryState<Data<Entity>, Filter<Without<Green>>> query(world);
        std::vector<Entity> sequential = collect_sequential(query, world);
        REQUIRE(sequential.size() == 44);
        REQUIRE(collect_parallel(query.par_iter(world).batching_strategy(strategy).task_pool(pool)) == sequential);
    }

    SECTION("sparse") {
        QueryState<Data<Entity, const Tag&>> query(world);
        REQUIRE_FALSE(QueryState<Data<Entity, const Tag&>>::is_dense);

        std::vector<Entity> sequential = collect_sequential(query, world);
        REQUIRE(sequential.size() == 51);
        REQUIRE(collect_parallel(query.par_iter(world).batching_strategy(strategy).task_pool(pool)) == sequential);
        REQUIRE(collect_parallel(query.par_iter(world).batching_strategy(strategy).task_pool(pool)) == sequential);
    }

    SECTION("entity lists") {
        QueryState<Data<Entity, const Tag&>> query(world);
        std::vector<Entity> sequential = collect_sequential(query, world);
        std::vector<Entity> listed = collect_parallel(
            query.par_iter_many(world, sequential).batching_strategy(BatchingStrategy::fixed(3)).task_pool(pool));
        REQUIRE(listed == sequential);
    }

    REQUIRE_FALSE(world.has_active_borrows());
}

TEST_CASE("par_iter_many over a temporary list", "[ecs][par_iter][many]") {
    TaskPool pool(TaskPoolConfig{4, "par-test"});
    World world;
    Entity a = world.build_entity().with(Health{10, 10});
    Entity b = world.build_entity().with(Health{20, 20});

    std::atomic<int> sum{0};
    {
        QueryState<Data<const Health&>> query(world);
        auto iter = query.par_iter_many(world, std::vector<Entity>{a, b, a});
        std::move(iter)
            .batching_strategy(BatchingStrategy::fixed(1))
            .task_pool(pool)
            .for_each([&sum](auto item) { sum.fetch_add(std::get<0>(item).current); });
    }
    REQUIRE(sum.load() == 40);

    {
        QueryState<Data<Health&>> writer(world);
        auto unique = writer.par_iter_many_unique_mut(world, UniqueEntityVec::from_vec({b}).unwrap());
        std::move(unique).task_pool(pool).for_each([](auto item) { std::get<0>(item).current = 0; });
    }
    REQUIRE_FALSE(world.has_active_borrows());
    REQUIRE(world.get_component<Health>(b)->current == 0);
}

TEST_CASE("par_iter_mut writes every matched row", "[ecs][par_iter]") {
    TaskPool pool(TaskPoolConfig{4, "par-test"});
    World world;
    std::vector<Entity> entities = populate(world, 100);

    QueryState<Data<const Velocity&, Position&>> query(world);

    SECTION("estimated batch size") {
        query.par_iter_mut(world).task_pool(pool).for_each([](auto item) {
            auto& [vel, pos] = item;
            pos.x += vel.x;
            pos.y += vel.y;
        });
    }

    SECTION("small fixed batches") {
        query.par_iter_mut(world)
            .batching_strategy(BatchingStrategy::fixed(7))
            .task_pool(pool)
            .for_each([](auto item) {
                auto& [vel, pos] = item;
                pos.x += vel.x;
                pos.y += vel.y;
            });
    }

    for (Entity entity : entities) {
        const Position* pos = world.get_component<Position>(entity);
        REQUIRE(pos != nullptr);
        REQUIRE(pos->x == 1.0f);
        REQUIRE(pos->y == 2.0f);
    }
    REQUIRE_FALSE(world.has_active_borrows());
    REQUIRE(pool.stats().scopes_run == (threaded ? 1u : 0u));
}

TEST_CASE("par_iter honors filters", "[ecs][par_iter]") {
    TaskPool pool(TaskPoolConfig{3, "par-test"});
    World world;
    populate(world, 50);

    QueryState<Data<Entity>, Filter<Without<Frozen>>> active(world);
    std::atomic<int> visited{0};
    active.par_iter(world)
        .batching_strategy(BatchingStrategy::fixed(4))
        .task_pool(pool)
        .for_each([&visited](auto) { visited.fetch_add(1, std::memory_order_relaxed); });

    REQUIRE(visited.load() == 100);
}

TEST_CASE("par_iter for_each_init accumulates per task", "[ecs][par_iter]") {
    TaskPool pool(TaskPoolConfig{4, "par-test"});
    World world;
    populate(world, 200);

    QueryState<Data<const Health&>> query(world);
    Parallel<long> partial_sums;
    std::atomic<int> inits{0};

    query.par_iter(world)
        .batching_strategy(BatchingStrategy::fixed(16))
        .task_pool(pool)
        .for_each_init(
            [&] {
                inits.fetch_add(1, std::memory_order_relaxed);
                return &partial_sums.borrow_local_mut();
            },
            [](long* sum, auto item) {
                *sum += std::get<0>(item).current;
            });

    long total = 0;
    partial_sums.for_each([&total](long value) { total += value; });

    // 0 + 1 + ... + 199
    REQUIRE(total == 199L * 200L / 2L);
    // 200 rows in one table, 16 per batch
    REQUIRE(inits.load() == (threaded ? 13 : 1));
}

TEST_CASE("par_iter on a single worker runs sequentially", "[ecs][par_iter]") {
    TaskPool pool(TaskPoolConfig{1, "par-test"});
    World world;
    populate(world, 20);

    QueryState<Data<const Position&>> query(world);
    int inits = 0;
    int visited = 0;

    query.par_iter(world)
        .batching_strategy(BatchingStrategy::fixed(1))
        .task_pool(pool)
        .for_each_init([&inits] { return ++inits; }, [&visited](int, auto) { ++visited; });

    REQUIRE(inits == 1);
    REQUIRE(visited == 60);
    REQUIRE(pool.stats().scopes_run == 0);
}

TEST_CASE("par_iter over an empty query", "[ecs][par_iter]") {
    TaskPool pool(TaskPoolConfig{4, "par-test"});
    World world;
    populate(world, 5);

    QueryState<Data<const Position&>, Filter<With<Tag>>> query(world);
    int inits = 0;
    query.par_iter(world).task_pool(pool).for_each_init([&inits] { return ++inits; }, [](int, auto) {});

    REQUIRE(inits == (threaded ? 0 : 1));
    REQUIRE(pool.stats().tasks_spawned == 0);
}

TEST_CASE("par_iter failure isolation", "[ecs][par_iter]") {
    TaskPool pool(TaskPoolConfig{4, "par-test"});
    World world;
    std::vector<Entity> entities = populate(world, 10);
    Entity poisoned = entities[7];

    QueryState<Data<Entity, Position&>> query(world);
    std::atomic<int> visited{0};

    REQUIRE_THROWS_AS(
        query.par_iter_mut(world)
            .batching_strategy(BatchingStrategy::fixed(1))
            .task_pool(pool)
            .for_each([&](auto item) {
                auto& [entity, pos] = item;
                if (entity == poisoned) {
                    throw std::runtime_error("bad entity");
                }
                pos.x = 5.0f;
                visited.fetch_add(1, std::memory_order_relaxed);
            }),
        std::runtime_error);

    if constexpr (threaded) {
        // One batch per entity: only the poisoned one is lost
        REQUIRE(visited.load() == 29);
        REQUIRE(pool.stats().tasks_failed == 1);
    }
    REQUIRE_FALSE(world.has_active_borrows());
    REQUIRE(world.get_component<Position>(poisoned)->x == 0.0f);

    // The world is usable again
    REQUIRE_NOTHROW((void)world.spawn());
}

TEST_CASE("par_iter borrow checking", "[ecs][par_iter]") {
    TaskPool pool(TaskPoolConfig{2, "par-test"});
    World world;
    populate(world, 4);

    QueryState<Data<const Position&>> readers(world);
    QueryState<Data<Position&>> writers(world);

    SECTION("writer refused while a reader is live") {
        auto reading = readers.iter(world);
        try {
            writers.par_iter_mut(world).task_pool(pool).for_each([](auto) {});
            FAIL("conflicting borrow was granted");
        } catch (const quarry_core::UsageError& e) {
            const auto* err = e.error().as<quarry_core::QueryError>();
            REQUIRE(err != nullptr);
            REQUIRE(err->kind == quarry_core::QueryError::Kind::AccessConflict);
        }
    }

    SECTION("parallel readers share") {
        auto reading = readers.iter(world);
        std::atomic<int> visited{0};
        readers.par_iter(world).task_pool(pool).for_each([&visited](auto) { visited.fetch_add(1); });
        REQUIRE(visited.load() == 12);
    }

    SECTION("structural changes refused while the iterator is alive") {
        auto par = writers.par_iter_mut(world);
        REQUIRE(world.has_active_borrows());
        REQUIRE_THROWS_AS(world.spawn(), quarry_core::UsageError);
    }

    REQUIRE_FALSE(world.has_active_borrows());
}

TEST_CASE("par_iter without a ComputeTaskPool", "[ecs][par_iter][tasks]") {
    if constexpr (quarry_tasks::multi_threaded) {
        quarry_tasks::ComputeTaskPool::shutdown();

        World world;
        populate(world, 2);
        QueryState<Data<const Position&>> query(world);

        try {
            query.par_iter(world).for_each([](auto) {});
            FAIL("par_iter ran without a pool");
        } catch (const quarry_core::UsageError& e) {
            const auto* err = e.error().as<quarry_core::TaskPoolError>();
            REQUIRE(err != nullptr);
            REQUIRE(err->kind == quarry_core::TaskPoolError::Kind::NotInitialized);
        }
        REQUIRE_FALSE(world.has_active_borrows());

        quarry_tasks::ComputeTaskPool::init(TaskPoolConfig{2, "compute-test"});
        std::atomic<int> visited{0};
        query.par_iter(world).for_each([&visited](auto) { visited.fetch_add(1); });
        REQUIRE(visited.load() == 6);
        quarry_tasks::ComputeTaskPool::shutdown();
    }
}

TEST_CASE("par_iter over sparse components", "[ecs][par_iter][sparse]") {
    TaskPool pool(TaskPoolConfig{4, "par-test"});
    World world;
    std::vector<Entity> entities = populate(world, 30);
    for (std::size_t i = 0; i < entities.size(); i += 2) {
        REQUIRE(world.add_component(entities[i], Tag{0}));
    }

    QueryState<Data<Entity, Tag&>> query(world);
    query.par_iter_mut(world)
        .batching_strategy(BatchingStrategy::fixed(5))
        .task_pool(pool)
        .for_each([](auto item) {
            auto& [entity, tag] = item;
            tag.value = static_cast<int>(entity.index) + 1;
        });

    for (std::size_t i = 0; i < entities.size(); ++i) {
        const Tag* tag = world.get_component<Tag>(entities[i]);
        if (i % 2 == 0) {
            REQUIRE(tag != nullptr);
            REQUIRE(tag->value == static_cast<int>(entities[i].index) + 1);
        } else {
            REQUIRE(tag == nullptr);
        }
    }
}

TEST_CASE("par_iter_many", "[ecs][par_iter][many]") {
    TaskPool pool(TaskPoolConfig{4, "par-test"});
    World world;
    Entity a = world.build_entity().with(Health{10, 10});
    Entity b = world.build_entity().with(Health{20, 20});
    Entity dead = world.build_entity().with(Health{1000, 1000});
    REQUIRE(world.despawn(dead));

    QueryState<Data<const Health&>> query(world);

    SECTION("read-only lists may repeat entities") {
        std::vector<Entity> list{a, b, a, dead, a};
        std::atomic<int> sum{0};
        query.par_iter_many(world, list)
            .batching_strategy(BatchingStrategy::fixed(2))
            .task_pool(pool)
            .for_each([&sum](auto item) { sum.fetch_add(std::get<0>(item).current); });
        REQUIRE(sum.load() == 50);
    }

    SECTION("batches follow the list") {
        std::vector<Entity> list{a, b, a, b, a};
        std::atomic<int> inits{0};
        query.par_iter_many(world, list)
            .batching_strategy(BatchingStrategy::fixed(2))
            .task_pool(pool)
            .for_each_init([&inits] { return inits.fetch_add(1); }, [](int, auto) {});
        REQUIRE(inits.load() == (threaded ? 3 : 1));
    }
}

TEST_CASE("par_iter_many_unique_mut", "[ecs][par_iter][many]") {
    TaskPool pool(TaskPoolConfig{4, "par-test"});
    World world;
    Entity e1 = world.build_entity().with(Health{1, 10});
    Entity e2 = world.build_entity().with(Health{2, 10});
    Entity e3 = world.build_entity().with(Health{3, 10}).with(Position{0, 0});
    Entity untouched = world.build_entity().with(Health{4, 10});

    auto unique = UniqueEntityVec::from_vec({e1, e2, e3}).unwrap();

    QueryState<Data<Health&>> query(world);
    query.par_iter_many_unique_mut(world, unique)
        .batching_strategy(BatchingStrategy::fixed(2))
        .task_pool(pool)
        .for_each([](auto item) { std::get<0>(item).current *= 10; });

    REQUIRE(world.get_component<Health>(e1)->current == 10);
    REQUIRE(world.get_component<Health>(e2)->current == 20);
    REQUIRE(world.get_component<Health>(e3)->current == 30);
    REQUIRE(world.get_component<Health>(untouched)->current == 4);

    SECTION("a read-only query over a unique slice") {
        QueryState<Data<const Health&>> reader(world);
        std::atomic<int> sum{0};
        reader.par_iter_many_unique(world, unique.subslice(1, 2))
            .task_pool(pool)
            .for_each([&sum](auto item) { sum.fetch_add(std::get<0>(item).current); });
        REQUIRE(sum.load() == 50);
    }
}
