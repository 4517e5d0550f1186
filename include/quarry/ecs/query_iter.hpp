#pragma once

/// @file query_iter.hpp
/// @brief Sequential query iterators for quarry_ecs
///
/// QueryIter walks row ranges of matched chunks; QueryManyIter walks an
/// explicit entity list it owns. Both hold the query's borrows until
/// destroyed and yield `State::Item` tuples. The cursors underneath carry no borrow and are
/// what parallel tasks run on.

#include "fwd.hpp"
#include "tick.hpp"
#include "entity.hpp"
#include "access.hpp"
#include "matched_storage.hpp"
#include "query_data.hpp"

#include <cstddef>
#include <iterator>
#include <optional>
#include <span>
#include <utility>
#include <vector>

namespace quarry_ecs {

namespace detail {

// =============================================================================
// QueryCursor
// =============================================================================

/// Unchecked walk over chunk row ranges
template<typename State>
class QueryCursor {
public:
    using Item = typename State::Item;

    QueryCursor(const State& state, WorldCell cell, Ticks ticks, std::vector<ChunkRange> ranges)
        : state_(&state)
        , cell_(cell)
        , terms_(state.init_term_fetches(cell, ticks))
        , filters_(state.init_filter_fetches(cell, ticks))
        , ranges_(std::move(ranges)) {}

    [[nodiscard]] std::optional<Item> next() {
        for (;;) {
            if (row_ < end_) {
                std::size_t row = row_++;
                Entity entity;
                std::size_t table_row;
                if constexpr (State::is_dense) {
                    entity = (*table_entities_)[row];
                    table_row = row;
                } else {
                    const ArchetypeEntity& slot = (*archetype_entities_)[row];
                    entity = slot.entity;
                    table_row = slot.table_row;
                }
                if (!State::matches_row(filters_, entity, table_row)) {
                    continue;
                }
                return State::fetch_row(terms_, entity, table_row);
            }
            if (next_range_ == ranges_.size()) {
                return std::nullopt;
            }
            enter(ranges_[next_range_++]);
        }
    }

    /// Rows not yet visited; exact unless a row-level filter is present
    [[nodiscard]] std::size_t remaining() const noexcept {
        std::size_t total = end_ - row_;
        for (std::size_t i = next_range_; i < ranges_.size(); ++i) {
            total += ranges_[i].size();
        }
        return total;
    }

private:
    void enter(const ChunkRange& range) {
        if constexpr (State::is_dense) {
            TableId table{range.storage};
            state_->set_table(terms_, filters_, cell_, table);
            table_entities_ = &cell_.world().tables()[table].entities();
        } else {
            const Archetype& archetype = cell_.world().archetypes()[ArchetypeId{range.storage}];
            state_->set_archetype(terms_, filters_, cell_, archetype);
            archetype_entities_ = &archetype.entities();
        }
        row_ = range.begin;
        end_ = range.end;
    }

    const State* state_;
    WorldCell cell_;
    typename State::TermFetches terms_;
    typename State::FilterFetches filters_;
    std::vector<ChunkRange> ranges_;
    std::size_t next_range_ = 0;
    std::size_t row_ = 0;
    std::size_t end_ = 0;
    const std::vector<Entity>* table_entities_ = nullptr;
    const std::vector<ArchetypeEntity>* archetype_entities_ = nullptr;
};

// =============================================================================
// ManyCursor
// =============================================================================

/// Unchecked walk over an entity list; dead and non-matching entities are skipped
template<typename State>
class ManyCursor {
public:
    using Item = typename State::Item;

    ManyCursor(const State& state, WorldCell cell, Ticks ticks, std::span<const Entity> entities)
        : state_(&state)
        , cell_(cell)
        , terms_(state.init_term_fetches(cell, ticks))
        , filters_(state.init_filter_fetches(cell, ticks))
        , entities_(entities) {}

    [[nodiscard]] std::optional<Item> next() {
        while (pos_ < entities_.size()) {
            if (auto item = state_->fetch_entity(cell_, terms_, filters_, entities_[pos_++])) {
                return item;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] std::size_t remaining() const noexcept { return entities_.size() - pos_; }

private:
    const State* state_;
    WorldCell cell_;
    typename State::TermFetches terms_;
    typename State::FilterFetches filters_;
    std::span<const Entity> entities_;
    std::size_t pos_ = 0;
};

// =============================================================================
// IterOps
// =============================================================================

/// Range-for support and consuming helpers over `Derived::next()`
template<typename Derived, typename Item>
class IterOps {
public:
    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Item;
        using difference_type = std::ptrdiff_t;
        using reference = Item;

        iterator() = default;
        explicit iterator(Derived* owner) : owner_(owner) { advance(); }

        [[nodiscard]] Item operator*() const { return *current_; }

        iterator& operator++() {
            advance();
            return *this;
        }

        void operator++(int) { advance(); }

        /// Only exhausted iterators compare equal
        [[nodiscard]] bool operator==(const iterator& other) const noexcept {
            return !current_ && !other.current_;
        }

        [[nodiscard]] bool operator!=(const iterator& other) const noexcept {
            return !(*this == other);
        }

    private:
        void advance() {
            // Item may hold references; rebind instead of assigning through them
            current_.reset();
            if (auto item = owner_->next()) {
                current_.emplace(std::move(*item));
            }
        }

        Derived* owner_ = nullptr;
        std::optional<Item> current_;
    };

    [[nodiscard]] iterator begin() { return iterator(self()); }
    [[nodiscard]] iterator end() { return iterator(); }

    /// Thread `init` through every remaining item
    template<typename Acc, typename F>
    Acc fold(Acc init, F&& func) {
        while (auto item = self()->next()) {
            init = func(std::move(init), std::move(*item));
        }
        return init;
    }

    template<typename F>
    void for_each(F&& func) {
        while (auto item = self()->next()) {
            func(std::move(*item));
        }
    }

    /// Consume the iterator, counting items
    std::size_t count() {
        std::size_t n = 0;
        while (self()->next()) {
            ++n;
        }
        return n;
    }

private:
    Derived* self() noexcept { return static_cast<Derived*>(this); }
};

} // namespace detail

// =============================================================================
// QueryIter
// =============================================================================

/// Borrow-checked iterator over every entity a query matches
template<typename State>
class QueryIter : public detail::IterOps<QueryIter<State>, typename State::Item> {
public:
    using Item = typename State::Item;

    QueryIter(const State& state, detail::WorldCell cell, Ticks ticks,
              std::vector<ChunkRange> ranges, QueryBorrow borrow)
        : cursor_(state, cell, ticks, std::move(ranges))
        , borrow_(std::move(borrow)) {}

    QueryIter(QueryIter&&) noexcept = default;
    QueryIter& operator=(QueryIter&&) noexcept = default;
    QueryIter(const QueryIter&) = delete;
    QueryIter& operator=(const QueryIter&) = delete;

    [[nodiscard]] std::optional<Item> next() { return cursor_.next(); }

    /// Upper bound on the items still to come
    [[nodiscard]] std::size_t max_remaining() const noexcept { return cursor_.remaining(); }

private:
    detail::QueryCursor<State> cursor_;
    QueryBorrow borrow_;
};

// =============================================================================
// QueryManyIter
// =============================================================================

/// Borrow-checked iterator over the listed entities a query matches, in list order.
/// The list is owned, so a temporary list outlives the loop over it.
template<typename State>
class QueryManyIter : public detail::IterOps<QueryManyIter<State>, typename State::Item> {
public:
    using Item = typename State::Item;

    QueryManyIter(const State& state, detail::WorldCell cell, Ticks ticks,
                  std::vector<Entity> entities, QueryBorrow borrow)
        : entities_(std::move(entities))
        , cursor_(state, cell, ticks, entities_)
        , borrow_(std::move(borrow)) {}

    QueryManyIter(QueryManyIter&&) noexcept = default;
    QueryManyIter& operator=(QueryManyIter&&) noexcept = default;
    QueryManyIter(const QueryManyIter&) = delete;
    QueryManyIter& operator=(const QueryManyIter&) = delete;

    [[nodiscard]] std::optional<Item> next() { return cursor_.next(); }

    [[nodiscard]] std::size_t max_remaining() const noexcept { return cursor_.remaining(); }

private:
    // Moving a vector keeps its buffer, so the cursor's view survives a move
    std::vector<Entity> entities_;
    detail::ManyCursor<State> cursor_;
    QueryBorrow borrow_;
};

// =============================================================================
// QueryItem
// =============================================================================

/// Result of QueryState::get / get_mut. The item's references stay covered by
/// the query's borrow until the guard is destroyed or reset; an empty guard
/// (dead or non-matching entity) holds no borrow.
template<typename State>
class QueryItem {
public:
    using Item = typename State::Item;

    QueryItem() = default;

    QueryItem(Item item, QueryBorrow borrow)
        : item_(std::in_place, std::move(item))
        , borrow_(std::move(borrow)) {}

    QueryItem(QueryItem&&) noexcept = default;
    // Item may hold references; assigning would write through them
    QueryItem& operator=(QueryItem&&) = delete;
    QueryItem(const QueryItem&) = delete;
    QueryItem& operator=(const QueryItem&) = delete;

    [[nodiscard]] bool has_value() const noexcept { return item_.has_value(); }
    explicit operator bool() const noexcept { return item_.has_value(); }

    [[nodiscard]] Item& operator*() noexcept { return *item_; }
    [[nodiscard]] const Item& operator*() const noexcept { return *item_; }
    [[nodiscard]] Item* operator->() noexcept { return &*item_; }
    [[nodiscard]] const Item* operator->() const noexcept { return &*item_; }

    /// Drop the item and release its borrow
    void reset() noexcept {
        item_.reset();
        borrow_.reset();
    }

private:
    std::optional<Item> item_;
    QueryBorrow borrow_;
};

} // namespace quarry_ecs
