/// @file batching.cpp
/// @brief BatchingStrategy construction and configuration

#include <quarry/ecs/batching.hpp>
#include <quarry/core/config.hpp>
#include <quarry/core/error.hpp>

#include <string>

namespace quarry_ecs {

BatchingStrategy BatchingStrategy::fixed(std::size_t batch_size) {
    BatchingStrategy strategy;
    strategy.min_ = batch_size;
    strategy.max_ = batch_size;
    return strategy;
}

BatchingStrategy& BatchingStrategy::with_batches_per_thread(std::size_t batches_per_thread) {
    if (batches_per_thread == 0) {
        quarry_core::fail_usage(
            quarry_core::Error(quarry_core::ErrorCode::InvalidArgument, "batches_per_thread must be at least 1"),
            "quarry_ecs");
    }
    batches_per_thread_ = batches_per_thread;
    return *this;
}

quarry_core::Result<BatchingStrategy> BatchingStrategy::from_config(const quarry_core::ConfigManager& config) {
    namespace keys = quarry_core::config_keys;

    std::int64_t min = config.get_int(keys::BATCHING_MIN_BATCH_SIZE, 1);
    std::int64_t max = config.get_int(keys::BATCHING_MAX_BATCH_SIZE, 0);
    std::int64_t per_thread = config.get_int(keys::BATCHING_BATCHES_PER_THREAD, 1);

    if (min < 0 || max < 0) {
        return quarry_core::Err<BatchingStrategy>(quarry_core::Error(quarry_core::ErrorCode::InvalidArgument,
            "batch size limits must not be negative"));
    }
    if (per_thread < 1) {
        return quarry_core::Err<BatchingStrategy>(quarry_core::Error(quarry_core::ErrorCode::InvalidArgument,
            "batching.batches_per_thread must be at least 1 (got " + std::to_string(per_thread) + ")"));
    }

    BatchingStrategy strategy;
    strategy.min_ = static_cast<std::size_t>(min);
    if (max > 0) {
        strategy.max_ = static_cast<std::size_t>(max);
    }
    strategy.batches_per_thread_ = static_cast<std::size_t>(per_thread);
    return quarry_core::Ok(strategy);
}

} // namespace quarry_ecs
