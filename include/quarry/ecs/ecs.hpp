#pragma once

/// @file ecs.hpp
/// @brief Main include for quarry_ecs
///
/// This header includes all quarry_ecs components:
/// - World: entities, table and sparse-set storage, change ticks
/// - QueryState: typed queries with Entity, `const T&`, `T&`, `const T*`, `T*` terms
/// - QueryParIter: batched parallel iteration on a TaskPool
/// - UniqueEntityVec: duplicate-free entity lists for mutable `iter_many`
///
/// @example Basic usage:
/// @code
/// #include <quarry/ecs/ecs.hpp>
///
/// using namespace quarry_ecs;
///
/// struct Position { float x, y; };
/// struct Velocity { float x, y; };
///
/// int main() {
///     quarry_core::init_logging();
///     quarry_tasks::ComputeTaskPool::init();
///
///     World world;
///     for (int i = 0; i < 10000; ++i) {
///         world.build_entity()
///             .with(Position{0, 0})
///             .with(Velocity{1, 0});
///     }
///
///     QueryState<Data<const Velocity&, Position&>> movers(world);
///     movers.par_iter_mut(world).for_each([](auto item) {
///         auto [vel, pos] = item;
///         pos.x += vel.x;
///         pos.y += vel.y;
///     });
///
///     quarry_tasks::ComputeTaskPool::shutdown();
/// }
/// @endcode

#include "fwd.hpp"
#include "tick.hpp"
#include "entity.hpp"
#include "component.hpp"
#include "table.hpp"
#include "sparse_storage.hpp"
#include "archetype.hpp"
#include "access.hpp"
#include "world.hpp"
#include "query.hpp"
#include "query_data.hpp"
#include "matched_storage.hpp"
#include "batching.hpp"
#include "query_iter.hpp"
#include "par_iter.hpp"
#include "unique_entity.hpp"
#include "query_state.hpp"

namespace quarry_ecs {

/// Version information
struct Version {
    static constexpr int MAJOR = 0;
    static constexpr int MINOR = 3;
    static constexpr int PATCH = 0;
};

/// "MAJOR.MINOR.PATCH"
[[nodiscard]] const char* version() noexcept;

/// Module name for log prefixes
[[nodiscard]] const char* module_name() noexcept;

/// Log the module banner and the ComputeTaskPool state on the ecs logger
void log_startup_info();

} // namespace quarry_ecs
