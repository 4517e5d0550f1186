#pragma once

/// @file query_state.hpp
/// @brief Typed queries for quarry_ecs
///
/// Example:
/// @code
/// QueryState<Data<Entity, const Velocity&, Position&>, Filter<Without<Frozen>>> movers(world);
///
/// for (auto [entity, vel, pos] : movers.iter_mut(world)) {
///     pos.x += vel.x;
/// }
///
/// movers.par_iter_mut(world)
///     .batching_strategy(BatchingStrategy().with_min_batch_size(256))
///     .for_each([](auto item) {
///         auto [entity, vel, pos] = item;
///         pos.x += vel.x;
///     });
/// @endcode
///
/// A QueryState caches the chunks its query matches and picks up new ones
/// lazily at every iteration call. It is bound to the World it was created
/// for.

#include "fwd.hpp"
#include "tick.hpp"
#include "entity.hpp"
#include "world.hpp"
#include "query.hpp"
#include "query_data.hpp"
#include "matched_storage.hpp"
#include "query_iter.hpp"
#include "par_iter.hpp"
#include "unique_entity.hpp"
#include <quarry/core/error.hpp>
#include <quarry/core/log.hpp>

#include <optional>
#include <span>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace quarry_ecs {

// =============================================================================
// QueryState
// =============================================================================

template<typename... Ts, typename... Fs>
class QueryState<Data<Ts...>, Filter<Fs...>> {
public:
    using Item = std::tuple<typename detail::TermTraits<Ts>::Item...>;
    using TermFetches = std::tuple<typename detail::TermTraits<Ts>::Fetch...>;
    using FilterFetches = std::tuple<typename detail::FilterTraits<Fs>::Fetch...>;

    /// No term writes component data
    static constexpr bool read_only = (detail::TermTraits<Ts>::read_only && ...);

    /// Every referenced component is table-stored, so whole tables are iterated
    static constexpr bool is_dense =
        (detail::TermTraits<Ts>::is_dense && ...) && (detail::FilterTraits<Fs>::is_dense && ...);

    /// Some filter is evaluated per row (Added / Changed)
    static constexpr bool has_row_filter = (detail::FilterTraits<Fs>::row_level || ...);

private:
    using TermStates = std::tuple<typename detail::TermTraits<Ts>::State...>;
    using FilterStates = std::tuple<typename detail::FilterTraits<Fs>::State...>;
    using TermIndices = std::index_sequence_for<Ts...>;
    using FilterIndices = std::index_sequence_for<Fs...>;

    std::uint64_t world_id_;
    TermStates term_states_;
    FilterStates filter_states_;
    QueryDescriptor descriptor_;
    MatchedStorage matched_;

public:
    /// Registers every referenced component. Raises UsageError
    /// (QueryError::InvalidQuery) if a component is written by one term and
    /// read or written by another.
    explicit QueryState(World& world)
        : world_id_(world.id())
        , term_states_(detail::TermTraits<Ts>::init_state(world)...)
        , filter_states_(detail::FilterTraits<Fs>::init_state(world)...)
        , matched_(is_dense)
    {
        describe(TermIndices{}, FilterIndices{});
        descriptor_.build();

        if (auto conflict = descriptor_.self_conflict()) {
            quarry_core::fail_usage(quarry_core::QueryError::invalid_query(
                world.component_registry().name_of(*conflict),
                "written by one term while read or written by another term of the same query"),
                "quarry_ecs");
        }
        if (descriptor_.is_contradictory()) {
            quarry_core::ecs_logger()->warn("Query requires and excludes the same component; it matches nothing");
        }

        matched_.update(world.archetypes(), descriptor_);
    }

    // =========================================================================
    // Matched Storage
    // =========================================================================

    [[nodiscard]] const QueryDescriptor& descriptor() const noexcept { return descriptor_; }
    [[nodiscard]] const MatchedStorage& matched_storage() const noexcept { return matched_; }

    /// Matched table ids (dense) or archetype ids
    [[nodiscard]] const std::vector<std::uint32_t>& matched_storage_ids() const noexcept {
        return matched_.storage_ids();
    }

    [[nodiscard]] std::size_t chunk_entity_count(const World& world, std::uint32_t storage) const noexcept {
        return matched_.chunk_entity_count(world, storage);
    }

    /// Pick up archetypes created since the last call
    void update_archetypes(const World& world) {
        validate_world(world);
        matched_.update(world.archetypes(), descriptor_);
    }

    // =========================================================================
    // Sequential Iteration
    // =========================================================================

    [[nodiscard]] QueryIter<QueryState> iter(const World& world) {
        return iter(world, world.default_ticks());
    }

    [[nodiscard]] QueryIter<QueryState> iter(const World& world, Ticks ticks) {
        static_assert(read_only, "iter() needs a read-only query; use iter_mut() with a mutable World");
        return make_iter(detail::WorldCell(world), ticks);
    }

    [[nodiscard]] QueryIter<QueryState> iter_mut(World& world) {
        return iter_mut(world, world.default_ticks());
    }

    [[nodiscard]] QueryIter<QueryState> iter_mut(World& world, Ticks ticks) {
        return make_iter(detail::WorldCell(world), ticks);
    }

    /// Listed entities in list order; dead or non-matching ones are skipped.
    /// The iterator keeps its own copy of the list.
    [[nodiscard]] QueryManyIter<QueryState> iter_many(const World& world, std::vector<Entity> entities) {
        return iter_many(world, std::move(entities), world.default_ticks());
    }

    [[nodiscard]] QueryManyIter<QueryState> iter_many(const World& world, std::span<const Entity> entities) {
        return iter_many(world, std::vector<Entity>(entities.begin(), entities.end()), world.default_ticks());
    }

    [[nodiscard]] QueryManyIter<QueryState> iter_many(const World& world, std::vector<Entity> entities, Ticks ticks) {
        static_assert(read_only, "iter_many() needs a read-only query; use iter_many_unique_mut()");
        return make_many_iter(detail::WorldCell(world), ticks, std::move(entities));
    }

    [[nodiscard]] QueryManyIter<QueryState> iter_many_unique_mut(World& world, UniqueEntitySlice entities) {
        return make_many_iter(detail::WorldCell(world), world.default_ticks(),
                              std::vector<Entity>(entities.begin(), entities.end()));
    }

    [[nodiscard]] QueryManyIter<QueryState> iter_many_unique_mut(World& world, UniqueEntityVec entities) {
        return make_many_iter(detail::WorldCell(world), world.default_ticks(), std::move(entities).into_vec());
    }

    /// The entity's item, empty if it is dead or does not match. The returned
    /// guard holds the query's borrow for as long as it lives.
    [[nodiscard]] QueryItem<QueryState> get(const World& world, Entity entity) {
        static_assert(read_only, "get() needs a read-only query; use get_mut()");
        return get_checked(detail::WorldCell(world), entity);
    }

    [[nodiscard]] QueryItem<QueryState> get_mut(World& world, Entity entity) {
        return get_checked(detail::WorldCell(world), entity);
    }

    // =========================================================================
    // Parallel Iteration
    // =========================================================================

    [[nodiscard]] QueryParIter<QueryState> par_iter(const World& world) {
        static_assert(read_only, "par_iter() needs a read-only query; use par_iter_mut()");
        return make_par_iter(detail::WorldCell(world), world.default_ticks());
    }

    [[nodiscard]] QueryParIter<QueryState> par_iter_mut(World& world) {
        return make_par_iter(detail::WorldCell(world), world.default_ticks());
    }

    /// Read-only queries only; the list may repeat entities
    [[nodiscard]] QueryParManyIter<QueryState> par_iter_many(const World& world, std::vector<Entity> entities) {
        static_assert(read_only,
            "par_iter_many() needs a read-only query; mutable access requires par_iter_many_unique_mut()");
        detail::WorldCell cell(world);
        QueryBorrow borrow = borrow_all(cell);
        return QueryParManyIter<QueryState>(*this, cell, world.default_ticks(), std::move(entities), std::move(borrow));
    }

    [[nodiscard]] QueryParManyIter<QueryState> par_iter_many(const World& world, std::span<const Entity> entities) {
        return par_iter_many(world, std::vector<Entity>(entities.begin(), entities.end()));
    }

    [[nodiscard]] QueryParManyUniqueIter<QueryState> par_iter_many_unique(const World& world, UniqueEntitySlice entities) {
        static_assert(read_only, "par_iter_many_unique() needs a read-only query; use par_iter_many_unique_mut()");
        return make_par_unique(detail::WorldCell(world), world.default_ticks(),
                               std::vector<Entity>(entities.begin(), entities.end()));
    }

    [[nodiscard]] QueryParManyUniqueIter<QueryState> par_iter_many_unique(const World& world, UniqueEntityVec entities) {
        static_assert(read_only, "par_iter_many_unique() needs a read-only query; use par_iter_many_unique_mut()");
        return make_par_unique(detail::WorldCell(world), world.default_ticks(), std::move(entities).into_vec());
    }

    [[nodiscard]] QueryParManyUniqueIter<QueryState> par_iter_many_unique_mut(World& world, UniqueEntitySlice entities) {
        return make_par_unique(detail::WorldCell(world), world.default_ticks(),
                               std::vector<Entity>(entities.begin(), entities.end()));
    }

    [[nodiscard]] QueryParManyUniqueIter<QueryState> par_iter_many_unique_mut(World& world, UniqueEntityVec entities) {
        return make_par_unique(detail::WorldCell(world), world.default_ticks(), std::move(entities).into_vec());
    }

    // =========================================================================
    // Fetch Machinery (used by the iterators)
    // =========================================================================

    [[nodiscard]] TermFetches init_term_fetches(detail::WorldCell cell, Ticks ticks) const {
        return init_terms(cell, ticks, TermIndices{});
    }

    [[nodiscard]] FilterFetches init_filter_fetches(detail::WorldCell cell, Ticks ticks) const {
        return init_filters(cell, ticks, FilterIndices{});
    }

    void set_table(TermFetches& terms, FilterFetches& filters, detail::WorldCell cell, TableId table) const {
        set_table_impl(terms, filters, cell, table, TermIndices{}, FilterIndices{});
    }

    void set_archetype(TermFetches& terms, FilterFetches& filters, detail::WorldCell cell,
                       const Archetype& archetype) const {
        set_archetype_impl(terms, filters, cell, archetype, TermIndices{}, FilterIndices{});
    }

    [[nodiscard]] static bool matches_row(const FilterFetches& filters, Entity entity, std::size_t table_row) noexcept {
        return matches_row_impl(filters, entity, table_row, FilterIndices{});
    }

    [[nodiscard]] static Item fetch_row(TermFetches& terms, Entity entity, std::size_t table_row) noexcept {
        return fetch_row_impl(terms, entity, table_row, TermIndices{});
    }

    /// Fetch one entity through caller-owned fetch state
    [[nodiscard]] std::optional<Item> fetch_entity(detail::WorldCell cell, TermFetches& terms,
                                                   FilterFetches& filters, Entity entity) const {
        auto loc = cell.world().entity_location(entity);
        if (!loc || !matched_.contains_archetype(loc->archetype_id)) {
            return std::nullopt;
        }
        if constexpr (is_dense) {
            set_table(terms, filters, cell, loc->table_id);
        } else {
            set_archetype(terms, filters, cell, cell.world().archetypes()[loc->archetype_id]);
        }
        if (!matches_row(filters, entity, loc->table_row)) {
            return std::nullopt;
        }
        return fetch_row(terms, entity, loc->table_row);
    }

private:
    void validate_world(const World& world) const {
        if (world.id() != world_id_) {
            quarry_core::fail_usage(quarry_core::QueryError::invalid_query("<world>",
                "query state created for world " + std::to_string(world_id_) +
                " was used with world " + std::to_string(world.id())),
                "quarry_ecs");
        }
    }

    [[nodiscard]] QueryBorrow borrow_all(detail::WorldCell cell) {
        update_archetypes(cell.world());
        return cell.world().borrow(matched_.borrow_requests(cell.world(), descriptor_));
    }

    [[nodiscard]] QueryIter<QueryState> make_iter(detail::WorldCell cell, Ticks ticks) {
        QueryBorrow borrow = borrow_all(cell);
        return QueryIter<QueryState>(*this, cell, ticks, matched_.full_ranges(cell.world()), std::move(borrow));
    }

    [[nodiscard]] QueryManyIter<QueryState> make_many_iter(detail::WorldCell cell, Ticks ticks,
                                                          std::vector<Entity> entities) {
        QueryBorrow borrow = borrow_all(cell);
        return QueryManyIter<QueryState>(*this, cell, ticks, std::move(entities), std::move(borrow));
    }

    [[nodiscard]] QueryParIter<QueryState> make_par_iter(detail::WorldCell cell, Ticks ticks) {
        QueryBorrow borrow = borrow_all(cell);
        return QueryParIter<QueryState>(*this, cell, ticks, std::move(borrow));
    }

    [[nodiscard]] QueryParManyUniqueIter<QueryState> make_par_unique(detail::WorldCell cell, Ticks ticks,
                                                                     std::vector<Entity> entities) {
        QueryBorrow borrow = borrow_all(cell);
        return QueryParManyUniqueIter<QueryState>(*this, cell, ticks, std::move(entities), std::move(borrow));
    }

    [[nodiscard]] QueryItem<QueryState> get_checked(detail::WorldCell cell, Entity entity) {
        QueryBorrow borrow = borrow_all(cell);
        Ticks ticks = cell.world().default_ticks();
        TermFetches terms = init_term_fetches(cell, ticks);
        FilterFetches filters = init_filter_fetches(cell, ticks);
        if (auto item = fetch_entity(cell, terms, filters, entity)) {
            return QueryItem<QueryState>(std::move(*item), std::move(borrow));
        }
        return QueryItem<QueryState>();
    }

    template<std::size_t... I, std::size_t... J>
    void describe(std::index_sequence<I...>, std::index_sequence<J...>) {
        (detail::TermTraits<Ts>::describe(std::get<I>(term_states_), descriptor_), ...);
        (detail::FilterTraits<Fs>::describe(std::get<J>(filter_states_), descriptor_), ...);
    }

    template<std::size_t... I>
    TermFetches init_terms(detail::WorldCell cell, Ticks ticks, std::index_sequence<I...>) const {
        return TermFetches{detail::TermTraits<Ts>::init_fetch(std::get<I>(term_states_), cell, ticks)...};
    }

    template<std::size_t... J>
    FilterFetches init_filters(detail::WorldCell cell, Ticks ticks, std::index_sequence<J...>) const {
        return FilterFetches{detail::FilterTraits<Fs>::init_fetch(std::get<J>(filter_states_), cell, ticks)...};
    }

    template<std::size_t... I, std::size_t... J>
    void set_table_impl(TermFetches& terms, FilterFetches& filters, detail::WorldCell cell, TableId table,
                        std::index_sequence<I...>, std::index_sequence<J...>) const {
        (detail::TermTraits<Ts>::set_table(std::get<I>(terms), std::get<I>(term_states_), cell, table), ...);
        (detail::FilterTraits<Fs>::set_table(std::get<J>(filters), std::get<J>(filter_states_), cell, table), ...);
    }

    template<std::size_t... I, std::size_t... J>
    void set_archetype_impl(TermFetches& terms, FilterFetches& filters, detail::WorldCell cell,
                            const Archetype& archetype,
                            std::index_sequence<I...>, std::index_sequence<J...>) const {
        (detail::TermTraits<Ts>::set_archetype(std::get<I>(terms), std::get<I>(term_states_), cell, archetype), ...);
        (detail::FilterTraits<Fs>::set_archetype(std::get<J>(filters), std::get<J>(filter_states_), cell, archetype), ...);
    }

    template<std::size_t... J>
    static bool matches_row_impl(const FilterFetches& filters, Entity entity, std::size_t table_row,
                                 std::index_sequence<J...>) noexcept {
        return (detail::FilterTraits<Fs>::matches(std::get<J>(filters), entity, table_row) && ...);
    }

    template<std::size_t... I>
    static Item fetch_row_impl(TermFetches& terms, Entity entity, std::size_t table_row,
                               std::index_sequence<I...>) noexcept {
        return Item{detail::TermTraits<Ts>::fetch(std::get<I>(terms), entity, table_row)...};
    }
};

} // namespace quarry_ecs
