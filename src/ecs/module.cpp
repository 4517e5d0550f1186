/// @file module.cpp
/// @brief Module information for quarry_ecs
///
/// Most of quarry_ecs is templated on component types and lives in headers.
/// The non-template parts (world bookkeeping, borrow registry, batch
/// planning) have their own translation units.

#include <quarry/ecs/ecs.hpp>
#include <quarry/core/log.hpp>
#include <quarry/tasks/task_pool.hpp>

#include <string>

namespace quarry_ecs {

const char* version() noexcept {
    return "0.3.0";
}

const char* module_name() noexcept {
    return "quarry_ecs";
}

void log_startup_info() {
    auto logger = quarry_core::ecs_logger();
    logger->info("{} {}", module_name(), version());

    if constexpr (!quarry_tasks::multi_threaded) {
        logger->info("Built without worker threads; parallel iteration runs on the calling thread");
        return;
    }

    if (quarry_tasks::TaskPool* pool = quarry_tasks::ComputeTaskPool::try_get()) {
        logger->info("ComputeTaskPool: {} worker(s) named '{}'", pool->thread_count(), pool->name());
    } else {
        logger->warn("ComputeTaskPool not initialized; call ComputeTaskPool::init() before par_iter");
    }
}

} // namespace quarry_ecs
