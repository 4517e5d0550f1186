/// @file main.cpp
/// @brief Parallel Update Demo
///
/// Spawns a world of moving bodies and integrates their positions with
/// par_iter_mut on the ComputeTaskPool, then reduces per-thread statistics.
///
/// Options (also read from QUARRY_* environment variables):
///   --tasks.worker_threads N       worker count, 0 for one per core
///   --batching.min_batch_size N    lower bound on entities per task
///   --batching.batches_per_thread N
///   --log.level LEVEL
///   --entities N                   bodies to spawn (default 100000)
///   --steps N                      integration steps (default 10)

#include <quarry/core/config.hpp>
#include <quarry/core/log.hpp>
#include <quarry/ecs/ecs.hpp>
#include <quarry/tasks/parallel.hpp>
#include <quarry/tasks/task_pool.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cmath>
#include <cstdlib>
#include <exception>

namespace {

struct Position { float x, y; };
struct Velocity { float x, y; };
struct Mass { float value; };

/// Tracked bodies live in sparse storage so adding the tag does not move rows
struct Tracked {
    static constexpr quarry_ecs::StorageType storage_type = quarry_ecs::StorageType::SparseSet;
    std::uint32_t samples = 0;
};

struct StepStats {
    std::size_t bodies = 0;
    double kinetic_energy = 0.0;
};

void populate(quarry_ecs::World& world, std::int64_t count) {
    for (std::int64_t i = 0; i < count; ++i) {
        float f = static_cast<float>(i);
        auto builder = world.build_entity()
            .with(Position{f, 0.0f})
            .with(Velocity{std::cos(f), std::sin(f)});
        // Every third body has mass, so the query spans two tables
        if (i % 3 == 0) {
            builder.with(Mass{1.0f + static_cast<float>(i % 7)});
        }
        quarry_ecs::Entity entity = builder.build();
        if (i % 1000 == 0) {
            world.add_component(entity, Tracked{});
        }
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    quarry_core::init_logging();

    quarry_core::ConfigManager config;
    config.setup_defaults();
    config.load_environment();
    if (auto parsed = config.parse_args(argc, argv); parsed.is_err()) {
        spdlog::error("Invalid arguments: {}", parsed.error().message());
        return EXIT_FAILURE;
    }
    quarry_core::configure_logging(quarry_core::LogConfig::from_config(config));

    auto pool_config = quarry_tasks::TaskPoolConfig::from_config(config);
    if (pool_config.is_err()) {
        spdlog::error("Invalid task pool configuration: {}", quarry_core::build_error_chain(pool_config.error()));
        return EXIT_FAILURE;
    }
    auto strategy = quarry_ecs::BatchingStrategy::from_config(config);
    if (strategy.is_err()) {
        spdlog::error("Invalid batching configuration: {}", quarry_core::build_error_chain(strategy.error()));
        return EXIT_FAILURE;
    }

    std::int64_t entity_count = config.get_int("entities", 100000);
    std::int64_t steps = config.get_int("steps", 10);

    try {
        quarry_tasks::ComputeTaskPool::init(pool_config.value());
        quarry_ecs::log_startup_info();

        quarry_ecs::World world;
        populate(world, entity_count);
        spdlog::info("Spawned {} entities in {} table(s)", world.entity_count(), world.tables().size());

        quarry_ecs::QueryState<quarry_ecs::Data<const Velocity&, Position&>> movers(world);
        quarry_ecs::QueryState<quarry_ecs::Data<const Velocity&, const Mass*>> energy(world);
        quarry_ecs::QueryState<quarry_ecs::Data<Tracked&>,
                               quarry_ecs::Filter<quarry_ecs::Changed<Position>>> tracked(world);

        const float dt = 1.0f / 60.0f;
        for (std::int64_t step = 0; step < steps; ++step) {
            auto start = std::chrono::steady_clock::now();

            movers.par_iter_mut(world)
                .batching_strategy(strategy.value())
                .for_each([dt](auto item) {
                    auto& [vel, pos] = item;
                    pos.x += vel.x * dt;
                    pos.y += vel.y * dt;
                });

            quarry_tasks::Parallel<StepStats> stats;
            energy.par_iter(world)
                .batching_strategy(strategy.value())
                .for_each_init(
                    [&stats] { return &stats.borrow_local_mut(); },
                    [](StepStats* local, auto item) {
                        auto& [vel, mass] = item;
                        float m = mass ? mass->value : 1.0f;
                        local->bodies += 1;
                        local->kinetic_energy += 0.5 * m * (vel.x * vel.x + vel.y * vel.y);
                    });

            StepStats total;
            std::size_t partials = stats.size();
            stats.for_each([&total](const StepStats& local) {
                total.bodies += local.bodies;
                total.kinetic_energy += local.kinetic_energy;
            });

            std::size_t samples = 0;
            tracked.iter_mut(world).for_each([&samples](auto item) {
                std::get<0>(item).samples += 1;
                ++samples;
            });

            auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);
            spdlog::info("Step {}: {} bodies, energy {:.3f}, {} partial(s), {} tracked, {:.2f} ms",
                step, total.bodies, total.kinetic_energy, partials, samples, elapsed.count());

            world.clear_trackers();
            world.check_change_ticks();
        }

        auto pool_stats = quarry_tasks::ComputeTaskPool::get().stats();
        spdlog::info("Task pool ran {} scope(s) and {} task(s), {} failed",
            pool_stats.scopes_run, pool_stats.tasks_spawned, pool_stats.tasks_failed);
    } catch (const quarry_core::UsageError& e) {
        spdlog::error("Usage error: {}", quarry_core::build_error_chain(e.error()));
        quarry_tasks::ComputeTaskPool::shutdown();
        quarry_core::shutdown_logging();
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        quarry_tasks::ComputeTaskPool::shutdown();
        quarry_core::shutdown_logging();
        return EXIT_FAILURE;
    }

    quarry_tasks::ComputeTaskPool::shutdown();
    quarry_core::shutdown_logging();
    return EXIT_SUCCESS;
}
