#pragma once

/// @file par_iter.hpp
/// @brief Parallel query iteration for quarry_ecs
///
/// A parallel iterator partitions the query's matched rows into batches and
/// runs one task per batch on a TaskPool. Every task starts from a fresh
/// accumulator returned by `init` and folds `func(acc, item)` over its
/// batch; accumulators are never merged by the engine (use
/// quarry_tasks::Parallel<T> to collect per-thread results).
///
/// `init` and `func` are called concurrently from several threads.
///
/// With a single worker, or when built without threads, the whole iteration
/// runs on the calling thread with a single `init()` call.
///
/// If `func` throws, the rest of that task's batch is skipped, the other
/// tasks finish, and the first exception is rethrown after the join.

#include "fwd.hpp"
#include "tick.hpp"
#include "access.hpp"
#include "batching.hpp"
#include "batch_plan.hpp"
#include "query_iter.hpp"
#include "unique_entity.hpp"
#include <quarry/core/log.hpp>
#include <quarry/tasks/task_pool.hpp>

#include <algorithm>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

namespace quarry_ecs {

namespace detail {

/// Accumulator used by for_each
struct NoAccumulator {};

/// Pool a parallel iteration runs on, or nullptr for the sequential path
[[nodiscard]] inline quarry_tasks::TaskPool* resolve_pool(quarry_tasks::TaskPool* explicit_pool) {
    if constexpr (!quarry_tasks::multi_threaded) {
        return nullptr;
    } else {
        if (explicit_pool) {
            return explicit_pool;
        }
        return &quarry_tasks::ComputeTaskPool::get();
    }
}

} // namespace detail

// =============================================================================
// QueryParIter
// =============================================================================

/// Parallel iterator over every entity a query matches
template<typename State>
class QueryParIter {
public:
    using Item = typename State::Item;

    QueryParIter(const State& state, detail::WorldCell cell, Ticks ticks, QueryBorrow borrow)
        : state_(&state)
        , cell_(cell)
        , ticks_(ticks)
        , borrow_(std::move(borrow)) {}

    QueryParIter(QueryParIter&&) noexcept = default;
    QueryParIter& operator=(QueryParIter&&) noexcept = default;
    QueryParIter(const QueryParIter&) = delete;
    QueryParIter& operator=(const QueryParIter&) = delete;

    // =========================================================================
    // Builders
    // =========================================================================

    QueryParIter& batching_strategy(BatchingStrategy strategy) & {
        strategy_ = strategy;
        return *this;
    }

    QueryParIter&& batching_strategy(BatchingStrategy strategy) && {
        strategy_ = strategy;
        return std::move(*this);
    }

    /// Run on `pool` instead of the ComputeTaskPool
    QueryParIter& task_pool(quarry_tasks::TaskPool& pool) & {
        pool_ = &pool;
        return *this;
    }

    QueryParIter&& task_pool(quarry_tasks::TaskPool& pool) && {
        pool_ = &pool;
        return std::move(*this);
    }

    /// Override the (last_run, this_run) window
    QueryParIter& ticks(Ticks ticks) & {
        ticks_ = ticks;
        return *this;
    }

    QueryParIter&& ticks(Ticks ticks) && {
        ticks_ = ticks;
        return std::move(*this);
    }

    [[nodiscard]] const BatchingStrategy& strategy() const noexcept { return strategy_; }

    // =========================================================================
    // Consumers
    // =========================================================================

    template<typename Init, typename F>
    void for_each_init(Init&& init, F&& func) && {
        using Acc = std::decay_t<std::invoke_result_t<Init&>>;

        const World& world = cell_.world();
        const MatchedStorage& matched = state_->matched_storage();
        quarry_tasks::TaskPool* pool = detail::resolve_pool(pool_);

        if (pool == nullptr || pool->thread_count() <= 1) {
            Acc acc = init();
            detail::QueryCursor<State> cursor(*state_, cell_, ticks_, matched.full_ranges(world));
            while (auto item = cursor.next()) {
                func(acc, std::move(*item));
            }
            return;
        }

        std::size_t thread_count = pool->thread_count();
        std::size_t batch_size = std::max<std::size_t>(1, strategy_.calc_batch_size(
            [&] { return matched.max_chunk_size(world); }, thread_count));

        std::vector<detail::ChunkExtent> extents;
        extents.reserve(matched.storage_ids().size());
        for (std::uint32_t id : matched.storage_ids()) {
            extents.push_back(detail::ChunkExtent{id, matched.chunk_entity_count(world, id)});
        }
        std::vector<std::vector<ChunkRange>> batches = detail::plan_batches(extents, batch_size);

        quarry_core::ecs_logger()->trace("par_iter: {} batch(es) of up to {} rows over {} chunk(s) on {} thread(s)",
            batches.size(), batch_size, extents.size(), thread_count);

        pool->scope([&](quarry_tasks::Scope& scope) {
            for (auto& batch : batches) {
                scope.spawn([&, ranges = std::move(batch)]() {
                    Acc acc = init();
                    detail::QueryCursor<State> cursor(*state_, cell_, ticks_, ranges);
                    while (auto item = cursor.next()) {
                        func(acc, std::move(*item));
                    }
                });
            }
        });
    }

    template<typename F>
    void for_each(F&& func) && {
        std::move(*this).for_each_init(
            [] { return detail::NoAccumulator{}; },
            [&func](detail::NoAccumulator&, Item item) { func(std::move(item)); });
    }

private:
    const State* state_;
    detail::WorldCell cell_;
    Ticks ticks_;
    BatchingStrategy strategy_;
    quarry_tasks::TaskPool* pool_ = nullptr;
    QueryBorrow borrow_;
};

// =============================================================================
// QueryParManyIter / QueryParManyUniqueIter
// =============================================================================

/// Parallel iterator over an owned entity list, batched by list index.
/// Only read-only queries accept a list that may repeat entities.
template<typename State, bool Unique>
class QueryParManyIterImpl {
    static_assert(Unique || State::read_only,
        "par_iter_many needs a read-only query; mutable access requires a UniqueEntityVec (par_iter_many_unique_mut)");

public:
    using Item = typename State::Item;

    QueryParManyIterImpl(const State& state, detail::WorldCell cell, Ticks ticks,
                         std::vector<Entity> entities, QueryBorrow borrow)
        : state_(&state)
        , cell_(cell)
        , ticks_(ticks)
        , entities_(std::move(entities))
        , borrow_(std::move(borrow)) {}

    QueryParManyIterImpl(QueryParManyIterImpl&&) noexcept = default;
    QueryParManyIterImpl& operator=(QueryParManyIterImpl&&) noexcept = default;
    QueryParManyIterImpl(const QueryParManyIterImpl&) = delete;
    QueryParManyIterImpl& operator=(const QueryParManyIterImpl&) = delete;

    QueryParManyIterImpl& batching_strategy(BatchingStrategy strategy) & {
        strategy_ = strategy;
        return *this;
    }

    QueryParManyIterImpl&& batching_strategy(BatchingStrategy strategy) && {
        strategy_ = strategy;
        return std::move(*this);
    }

    QueryParManyIterImpl& task_pool(quarry_tasks::TaskPool& pool) & {
        pool_ = &pool;
        return *this;
    }

    QueryParManyIterImpl&& task_pool(quarry_tasks::TaskPool& pool) && {
        pool_ = &pool;
        return std::move(*this);
    }

    QueryParManyIterImpl& ticks(Ticks ticks) & {
        ticks_ = ticks;
        return *this;
    }

    QueryParManyIterImpl&& ticks(Ticks ticks) && {
        ticks_ = ticks;
        return std::move(*this);
    }

    template<typename Init, typename F>
    void for_each_init(Init&& init, F&& func) && {
        using Acc = std::decay_t<std::invoke_result_t<Init&>>;

        quarry_tasks::TaskPool* pool = detail::resolve_pool(pool_);

        if (pool == nullptr || pool->thread_count() <= 1) {
            Acc acc = init();
            detail::ManyCursor<State> cursor(*state_, cell_, ticks_, std::span<const Entity>(entities_));
            while (auto item = cursor.next()) {
                func(acc, std::move(*item));
            }
            return;
        }

        std::size_t thread_count = pool->thread_count();
        std::size_t batch_size = std::max<std::size_t>(1, strategy_.calc_batch_size(
            [this] { return entities_.size(); }, thread_count));
        auto slices = detail::plan_slices(entities_.size(), batch_size);

        quarry_core::ecs_logger()->trace("par_iter_many: {} batch(es) of up to {} entities on {} thread(s)",
            slices.size(), batch_size, thread_count);

        pool->scope([&](quarry_tasks::Scope& scope) {
            for (const auto& [begin, end] : slices) {
                std::span<const Entity> slice = std::span<const Entity>(entities_).subspan(begin, end - begin);
                scope.spawn([&, slice]() {
                    Acc acc = init();
                    detail::ManyCursor<State> cursor(*state_, cell_, ticks_, slice);
                    while (auto item = cursor.next()) {
                        func(acc, std::move(*item));
                    }
                });
            }
        });
    }

    template<typename F>
    void for_each(F&& func) && {
        std::move(*this).for_each_init(
            [] { return detail::NoAccumulator{}; },
            [&func](detail::NoAccumulator&, Item item) { func(std::move(item)); });
    }

private:
    const State* state_;
    detail::WorldCell cell_;
    Ticks ticks_;
    std::vector<Entity> entities_;
    BatchingStrategy strategy_;
    quarry_tasks::TaskPool* pool_ = nullptr;
    QueryBorrow borrow_;
};

template<typename State>
using QueryParManyIter = QueryParManyIterImpl<State, false>;

template<typename State>
using QueryParManyUniqueIter = QueryParManyIterImpl<State, true>;

} // namespace quarry_ecs
