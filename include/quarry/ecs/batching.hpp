#pragma once

/// @file batching.hpp
/// @brief Batch sizing policy for parallel query iteration
///
/// The strategy turns (largest chunk size, worker count) into the number of
/// entities one task should own. Small batches spread work evenly but cost
/// scheduling overhead; large ones do the opposite.

#include "fwd.hpp"
#include <quarry/core/fwd.hpp>
#include <quarry/core/error.hpp>

#include <algorithm>
#include <cstddef>
#include <limits>
#include <utility>

namespace quarry_ecs {

// =============================================================================
// BatchingStrategy
// =============================================================================

class BatchingStrategy {
public:
    /// Min 1, unbounded max, one batch per thread
    BatchingStrategy() = default;

    /// Every batch holds exactly `batch_size` entities (the last may hold fewer)
    [[nodiscard]] static BatchingStrategy fixed(std::size_t batch_size);

    BatchingStrategy& with_min_batch_size(std::size_t min) noexcept {
        min_ = min;
        return *this;
    }

    BatchingStrategy& with_max_batch_size(std::size_t max) noexcept {
        max_ = max;
        return *this;
    }

    /// Raises UsageError for 0
    BatchingStrategy& with_batches_per_thread(std::size_t batches_per_thread);

    /// Read `batching.*` keys; `batching.max_batch_size = 0` means unbounded
    [[nodiscard]] static quarry_core::Result<BatchingStrategy> from_config(const quarry_core::ConfigManager& config);

    [[nodiscard]] std::size_t min_batch_size() const noexcept { return min_; }
    [[nodiscard]] std::size_t max_batch_size() const noexcept { return max_; }
    [[nodiscard]] std::size_t batches_per_thread() const noexcept { return batches_per_thread_; }

    /// Limits collapse to a single size; estimation is skipped
    [[nodiscard]] bool is_fixed() const noexcept { return min_ >= max_; }

    /// Entities per batch. `max_items` is called at most once, and never when
    /// the size is fixed.
    template<typename F>
    [[nodiscard]] std::size_t calc_batch_size(F&& max_items, std::size_t thread_count) const {
        if (is_fixed()) {
            return min_;
        }
        std::size_t divisor = std::max<std::size_t>(thread_count, 1) * batches_per_thread_;
        std::size_t items = std::forward<F>(max_items)();
        std::size_t batch = items / divisor + (items % divisor != 0 ? 1 : 0);
        return std::clamp(batch, min_, max_);
    }

private:
    std::size_t min_ = 1;
    std::size_t max_ = std::numeric_limits<std::size_t>::max();
    std::size_t batches_per_thread_ = 1;
};

} // namespace quarry_ecs
