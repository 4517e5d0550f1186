#pragma once

/// @file query_data.hpp
/// @brief Query terms and filters for quarry_ecs
///
/// A typed query is `QueryState<Data<Terms...>, Filter<Filters...>>`.
///
/// Data terms:
/// - `Entity`        the entity id
/// - `const T&`      required read
/// - `T&`            required write; stamps the row changed at `this_run`
/// - `const T*`      optional read, nullptr when absent
/// - `T*`            optional write, nullptr when absent
///
/// Filters: `With<T>`, `Without<T>` (per chunk) and `Added<T>`,
/// `Changed<T>` (per row, against the call's tick window).

#include "fwd.hpp"
#include "tick.hpp"
#include "entity.hpp"
#include "component.hpp"
#include "query.hpp"
#include "world.hpp"

#include <type_traits>

namespace quarry_ecs {

template<typename... Terms>
struct Data {};

template<typename... Filters>
struct Filter {};

/// Entity must have T
template<typename T>
struct With {};

/// Entity must not have T
template<typename T>
struct Without {};

/// T was added inside the tick window
template<typename T>
struct Added {};

/// T was added or mutably fetched inside the tick window
template<typename T>
struct Changed {};

namespace detail {

template<typename>
inline constexpr bool unsupported_term = false;

// =============================================================================
// WorldCell
// =============================================================================

/// Unchecked world handle shared by the tasks of one parallel iteration.
/// Aliasing is enforced by the borrow registry and the batch plan, not here.
class WorldCell {
public:
    explicit WorldCell(World& world) noexcept : world_(&world) {}

    /// Read-only queries never write through the cell
    explicit WorldCell(const World& world) noexcept : world_(const_cast<World*>(&world)) {}

    [[nodiscard]] World& world() const noexcept { return *world_; }

private:
    World* world_;
};

// =============================================================================
// Component Term Base
// =============================================================================

template<typename T, bool Mutable>
struct ComponentTerm {
    static constexpr bool is_dense = storage_type_of<T>() == StorageType::Table;

    struct State {
        ComponentId id;
    };

    struct Fetch {
        std::conditional_t<Mutable, ComponentStorage, const ComponentStorage>* column = nullptr;
        std::conditional_t<Mutable, ComponentSparseSet, const ComponentSparseSet>* sparse = nullptr;
        bool present = false;
        Tick this_run;
    };

    static State init_state(World& world) {
        return State{world.register_component<T>()};
    }

    static Fetch init_fetch(const State& state, WorldCell cell, Ticks ticks) {
        Fetch fetch;
        fetch.this_run = ticks.this_run;
        if constexpr (!is_dense) {
            fetch.sparse = cell.world().sparse_sets().get(state.id);
        }
        return fetch;
    }

    static void set_table(Fetch& fetch, const State& state, WorldCell cell, TableId table) {
        if constexpr (is_dense) {
            fetch.column = cell.world().tables()[table].column(state.id);
            fetch.present = fetch.column != nullptr;
        }
    }

    static void set_archetype(Fetch& fetch, const State& state, WorldCell cell, const Archetype& archetype) {
        if constexpr (is_dense) {
            set_table(fetch, state, cell, archetype.table_id());
        } else {
            fetch.present = fetch.sparse != nullptr && archetype.has_component(state.id);
        }
    }

    static auto* get(Fetch& fetch, Entity entity, std::size_t table_row) noexcept {
        if constexpr (is_dense) {
            return &fetch.column->template get<T>(table_row);
        } else if constexpr (Mutable) {
            return fetch.sparse->template get_mut<T>(entity);
        } else {
            return fetch.sparse->template get<T>(entity);
        }
    }

    static void mark_changed(Fetch& fetch, Entity entity, std::size_t table_row) noexcept {
        if constexpr (is_dense) {
            fetch.column->ticks(table_row).set_changed(fetch.this_run);
        } else {
            fetch.sparse->ticks_mut(entity)->set_changed(fetch.this_run);
        }
    }
};

// =============================================================================
// TermTraits
// =============================================================================

template<typename Term>
struct TermTraits {
    static_assert(unsupported_term<Term>,
        "query data terms are Entity, const T&, T&, const T* or T*");
};

template<>
struct TermTraits<Entity> {
    using Item = Entity;
    static constexpr bool read_only = true;
    static constexpr bool is_dense = true;

    struct State {};
    struct Fetch {};

    static State init_state(World&) { return {}; }
    static void describe(const State&, QueryDescriptor&) {}
    static Fetch init_fetch(const State&, WorldCell, Ticks) { return {}; }
    static void set_table(Fetch&, const State&, WorldCell, TableId) {}
    static void set_archetype(Fetch&, const State&, WorldCell, const Archetype&) {}

    static Item fetch(Fetch&, Entity entity, std::size_t) noexcept { return entity; }
};

template<typename T>
struct TermTraits<const T&> : ComponentTerm<T, false> {
    using Base = ComponentTerm<T, false>;
    using Item = const T&;
    static constexpr bool read_only = true;

    static void describe(const typename Base::State& state, QueryDescriptor& descriptor) {
        descriptor.read(state.id);
    }

    static Item fetch(typename Base::Fetch& fetch, Entity entity, std::size_t table_row) noexcept {
        return *Base::get(fetch, entity, table_row);
    }
};

template<typename T>
struct TermTraits<T&> : ComponentTerm<T, true> {
    using Base = ComponentTerm<T, true>;
    using Item = T&;
    static constexpr bool read_only = false;

    static void describe(const typename Base::State& state, QueryDescriptor& descriptor) {
        descriptor.write(state.id);
    }

    static Item fetch(typename Base::Fetch& fetch, Entity entity, std::size_t table_row) noexcept {
        Base::mark_changed(fetch, entity, table_row);
        return *Base::get(fetch, entity, table_row);
    }
};

template<typename T>
struct TermTraits<const T*> : ComponentTerm<T, false> {
    using Base = ComponentTerm<T, false>;
    using Item = const T*;
    static constexpr bool read_only = true;

    static void describe(const typename Base::State& state, QueryDescriptor& descriptor) {
        descriptor.optional_read(state.id);
    }

    static Item fetch(typename Base::Fetch& fetch, Entity entity, std::size_t table_row) noexcept {
        if (!fetch.present) return nullptr;
        return Base::get(fetch, entity, table_row);
    }
};

template<typename T>
struct TermTraits<T*> : ComponentTerm<T, true> {
    using Base = ComponentTerm<T, true>;
    using Item = T*;
    static constexpr bool read_only = false;

    static void describe(const typename Base::State& state, QueryDescriptor& descriptor) {
        descriptor.optional_write(state.id);
    }

    static Item fetch(typename Base::Fetch& fetch, Entity entity, std::size_t table_row) noexcept {
        if (!fetch.present) return nullptr;
        Base::mark_changed(fetch, entity, table_row);
        return Base::get(fetch, entity, table_row);
    }
};

// =============================================================================
// FilterTraits
// =============================================================================

template<typename F>
struct FilterTraits {
    static_assert(unsupported_term<F>,
        "query filters are With<T>, Without<T>, Added<T> or Changed<T>");
};

/// Shared shape of With / Without: decided per chunk, nothing fetched
template<typename T>
struct ArchetypeFilter {
    static constexpr bool is_dense = storage_type_of<T>() == StorageType::Table;
    static constexpr bool row_level = false;

    struct State {
        ComponentId id;
    };
    struct Fetch {};

    static State init_state(World& world) { return State{world.register_component<T>()}; }
    static Fetch init_fetch(const State&, WorldCell, Ticks) { return {}; }
    static void set_table(Fetch&, const State&, WorldCell, TableId) {}
    static void set_archetype(Fetch&, const State&, WorldCell, const Archetype&) {}
    static bool matches(const Fetch&, Entity, std::size_t) noexcept { return true; }
};

template<typename T>
struct FilterTraits<With<T>> : ArchetypeFilter<T> {
    static void describe(const typename ArchetypeFilter<T>::State& state, QueryDescriptor& descriptor) {
        descriptor.with(state.id);
    }
};

template<typename T>
struct FilterTraits<Without<T>> : ArchetypeFilter<T> {
    static void describe(const typename ArchetypeFilter<T>::State& state, QueryDescriptor& descriptor) {
        descriptor.without(state.id);
    }
};

/// Shared shape of Added / Changed: requires T, tests its row ticks
template<typename T>
struct TickFilter {
    using Term = ComponentTerm<T, false>;
    static constexpr bool is_dense = Term::is_dense;
    static constexpr bool row_level = true;

    using State = typename Term::State;

    struct Fetch {
        typename Term::Fetch term;
        Ticks ticks;
    };

    static State init_state(World& world) { return Term::init_state(world); }

    static void describe(const State& state, QueryDescriptor& descriptor) {
        descriptor.tick_read(state.id);
    }

    static Fetch init_fetch(const State& state, WorldCell cell, Ticks ticks) {
        return Fetch{Term::init_fetch(state, cell, ticks), ticks};
    }

    static void set_table(Fetch& fetch, const State& state, WorldCell cell, TableId table) {
        Term::set_table(fetch.term, state, cell, table);
    }

    static void set_archetype(Fetch& fetch, const State& state, WorldCell cell, const Archetype& archetype) {
        Term::set_archetype(fetch.term, state, cell, archetype);
    }

    [[nodiscard]] static const ComponentTicks& row_ticks(const Fetch& fetch, Entity entity, std::size_t table_row) noexcept {
        if constexpr (is_dense) {
            return fetch.term.column->ticks(table_row);
        } else {
            return *fetch.term.sparse->ticks(entity);
        }
    }
};

template<typename T>
struct FilterTraits<Added<T>> : TickFilter<T> {
    static bool matches(const typename TickFilter<T>::Fetch& fetch, Entity entity, std::size_t table_row) noexcept {
        return TickFilter<T>::row_ticks(fetch, entity, table_row).is_added(fetch.ticks.last_run, fetch.ticks.this_run);
    }
};

template<typename T>
struct FilterTraits<Changed<T>> : TickFilter<T> {
    static bool matches(const typename TickFilter<T>::Fetch& fetch, Entity entity, std::size_t table_row) noexcept {
        return TickFilter<T>::row_ticks(fetch, entity, table_row).is_changed(fetch.ticks.last_run, fetch.ticks.this_run);
    }
};

} // namespace detail

} // namespace quarry_ecs
