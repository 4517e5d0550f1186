#pragma once

/// @file world.hpp
/// @brief Main ECS container for quarry_ecs
///
/// World owns every entity, component column and sparse set. Queries reach
/// component data only through it, and it refuses structural changes while
/// any query borrow is live.

#include "fwd.hpp"
#include "tick.hpp"
#include "entity.hpp"
#include "component.hpp"
#include "table.hpp"
#include "sparse_storage.hpp"
#include "archetype.hpp"
#include "access.hpp"

#include <atomic>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace quarry_ecs {

// =============================================================================
// World
// =============================================================================

/// The main ECS container
class World {
public:
    using size_type = std::size_t;

private:
    std::uint64_t id_;
    EntityAllocator entities_;
    std::vector<EntityLocation> locations_;  // entity.index -> location
    ComponentRegistry components_;
    Tables tables_;
    Archetypes archetypes_;
    SparseSets sparse_sets_;
    std::atomic<std::uint32_t> change_tick_{1};
    Tick last_change_tick_{0};
    Tick last_check_tick_{0};
    mutable AccessRegistry access_;

public:
    World();
    ~World();

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    /// Process-unique id, used to catch a QueryState applied to the wrong world
    [[nodiscard]] std::uint64_t id() const noexcept { return id_; }

    // =========================================================================
    // Entity Management
    // =========================================================================

    /// Spawn a new entity without components
    [[nodiscard]] Entity spawn();

    /// Despawn an entity, dropping its components
    /// @return true if entity was alive and is now dead
    bool despawn(Entity entity);

    [[nodiscard]] bool is_alive(Entity entity) const noexcept {
        return entities_.is_alive(entity);
    }

    [[nodiscard]] size_type entity_count() const noexcept {
        return entities_.alive_count();
    }

    [[nodiscard]] std::optional<EntityLocation> entity_location(Entity entity) const noexcept {
        if (!is_alive(entity) || entity.index >= locations_.size()) {
            return std::nullopt;
        }
        EntityLocation loc = locations_[entity.index];
        if (!loc.is_valid()) {
            return std::nullopt;
        }
        return loc;
    }

    /// Fluent spawn: `world.build_entity().with(Position{}).build()`
    [[nodiscard]] EntityBuilder<World> build_entity();

    // =========================================================================
    // Component Registration
    // =========================================================================

    template<Component T>
    ComponentId register_component() {
        return components_.register_component<T>();
    }

    template<typename T>
    [[nodiscard]] std::optional<ComponentId> component_id() const {
        return components_.get_id<T>();
    }

    [[nodiscard]] const ComponentInfo* component_info(ComponentId id) const noexcept {
        return components_.get_info(id);
    }

    [[nodiscard]] const ComponentRegistry& component_registry() const noexcept {
        return components_;
    }

    // =========================================================================
    // Component Access
    // =========================================================================

    /// Insert a component, replacing (and marking changed) an existing one
    /// @return false if the entity is dead
    template<Component T>
    bool add_component(Entity entity, T component) {
        ensure_no_borrows("add a component");
        if (!is_alive(entity)) {
            return false;
        }

        ComponentId comp_id = components_.register_component<T>();
        Tick tick = change_tick();
        EntityLocation loc = locations_[entity.index];

        if (archetypes_[loc.archetype_id].has_component(comp_id)) {
            if constexpr (storage_type_of<T>() == StorageType::SparseSet) {
                sparse_sets_.get(comp_id)->insert(entity, std::move(component), tick);
            } else {
                ComponentStorage* column = tables_[loc.table_id].column(comp_id);
                column->replace_moved_from(loc.table_row, &component);
                column->ticks(loc.table_row).set_changed(tick);
            }
            return true;
        }

        ArchetypeId target = archetype_with(loc.archetype_id, comp_id);
        EntityLocation new_loc = move_entity(entity, loc, target);

        if constexpr (storage_type_of<T>() == StorageType::SparseSet) {
            sparse_sets_.get_or_insert(*components_.get_info(comp_id)).insert(entity, std::move(component), tick);
        } else {
            tables_[new_loc.table_id].column(comp_id)->push(std::move(component), ComponentTicks{tick});
        }
        return true;
    }

    /// Remove a component
    /// @return The removed value, or nullopt if absent
    template<Component T>
    std::optional<T> remove_component(Entity entity) {
        ensure_no_borrows("remove a component");
        auto comp_id = components_.get_id<T>();
        if (!is_alive(entity) || !comp_id) {
            return std::nullopt;
        }

        EntityLocation loc = locations_[entity.index];
        if (!archetypes_[loc.archetype_id].has_component(*comp_id)) {
            return std::nullopt;
        }

        std::optional<T> removed;
        if constexpr (storage_type_of<T>() == StorageType::SparseSet) {
            ComponentSparseSet* set = sparse_sets_.get(*comp_id);
            removed.emplace(std::move(*set->get_mut<T>(entity)));
            set->remove(entity);
        } else {
            // The moved-from value is dropped when the row leaves the table
            removed.emplace(std::move(tables_[loc.table_id].column(*comp_id)->template get<T>(loc.table_row)));
        }

        ArchetypeId target = archetype_without(loc.archetype_id, *comp_id);
        move_entity(entity, loc, target);
        return removed;
    }

    template<typename T>
    [[nodiscard]] const T* get_component(Entity entity) const {
        auto comp_id = components_.get_id<T>();
        auto loc = entity_location(entity);
        if (!comp_id || !loc || !archetypes_[loc->archetype_id].has_component(*comp_id)) {
            return nullptr;
        }
        if constexpr (storage_type_of<T>() == StorageType::SparseSet) {
            return sparse_sets_.get(*comp_id)->template get<T>(entity);
        } else {
            return &tables_[loc->table_id].column(*comp_id)->template get<T>(loc->table_row);
        }
    }

    /// Mutable access; marks the component changed at the current tick
    template<typename T>
    [[nodiscard]] T* get_component_mut(Entity entity) {
        ComponentTicks* ticks = component_ticks_mut<T>(entity);
        if (!ticks) {
            return nullptr;
        }
        ticks->set_changed(change_tick());
        return const_cast<T*>(std::as_const(*this).get_component<T>(entity));
    }

    template<typename T>
    [[nodiscard]] bool has_component(Entity entity) const {
        auto comp_id = components_.get_id<T>();
        auto loc = entity_location(entity);
        return comp_id && loc && archetypes_[loc->archetype_id].has_component(*comp_id);
    }

    /// Added/changed ticks of an entity's component
    template<typename T>
    [[nodiscard]] std::optional<ComponentTicks> component_ticks(Entity entity) const {
        auto comp_id = components_.get_id<T>();
        auto loc = entity_location(entity);
        if (!comp_id || !loc || !archetypes_[loc->archetype_id].has_component(*comp_id)) {
            return std::nullopt;
        }
        if constexpr (storage_type_of<T>() == StorageType::SparseSet) {
            return *sparse_sets_.get(*comp_id)->ticks(entity);
        } else {
            return tables_[loc->table_id].column(*comp_id)->ticks(loc->table_row);
        }
    }

    // =========================================================================
    // Change Ticks
    // =========================================================================

    [[nodiscard]] Tick change_tick() const noexcept {
        return Tick{change_tick_.load(std::memory_order_acquire)};
    }

    /// Advance the change tick
    /// @return The tick before the increment
    Tick increment_change_tick() noexcept {
        return Tick{change_tick_.fetch_add(1, std::memory_order_acq_rel)};
    }

    [[nodiscard]] Tick last_change_tick() const noexcept { return last_change_tick_; }

    /// The window a query call sees by default
    [[nodiscard]] Ticks default_ticks() const noexcept {
        return Ticks{last_change_tick_, change_tick()};
    }

    /// End a frame: changes so far stop being reported as added/changed
    void clear_trackers() noexcept {
        last_change_tick_ = increment_change_tick();
    }

    /// Clamp stored ticks once the counter has advanced CHECK_TICK_THRESHOLD
    /// since the last pass
    /// @return true if a pass ran
    bool check_change_ticks();

    // =========================================================================
    // Storage Access
    // =========================================================================

    [[nodiscard]] const Archetypes& archetypes() const noexcept { return archetypes_; }
    [[nodiscard]] const Tables& tables() const noexcept { return tables_; }
    [[nodiscard]] Tables& tables() noexcept { return tables_; }
    [[nodiscard]] const SparseSets& sparse_sets() const noexcept { return sparse_sets_; }
    [[nodiscard]] SparseSets& sparse_sets() noexcept { return sparse_sets_; }

    // =========================================================================
    // Borrows
    // =========================================================================

    /// Acquire query borrows; raises UsageError (QueryError::AccessConflict)
    /// when any request overlaps a live conflicting borrow
    [[nodiscard]] QueryBorrow borrow(std::vector<BorrowRequest> requests) const;

    [[nodiscard]] bool has_active_borrows() const { return access_.has_active(); }

    [[nodiscard]] std::size_t active_borrow_count() const { return access_.active_count(); }

    // =========================================================================
    // Maintenance
    // =========================================================================

    /// Despawn every entity; layouts and registrations survive
    void clear();

private:
    template<typename T>
    [[nodiscard]] ComponentTicks* component_ticks_mut(Entity entity) {
        auto comp_id = components_.get_id<T>();
        auto loc = entity_location(entity);
        if (!comp_id || !loc || !archetypes_[loc->archetype_id].has_component(*comp_id)) {
            return nullptr;
        }
        if constexpr (storage_type_of<T>() == StorageType::SparseSet) {
            return sparse_sets_.get(*comp_id)->ticks_mut(entity);
        } else {
            return &tables_[loc->table_id].column(*comp_id)->ticks(loc->table_row);
        }
    }

    /// Raise UsageError (QueryError::StructuralChange) if a borrow is live
    void ensure_no_borrows(const char* operation) const;

    [[nodiscard]] ArchetypeId get_or_create_archetype(const std::vector<ComponentId>& sorted_components);
    [[nodiscard]] ArchetypeId archetype_with(ArchetypeId from, ComponentId added);
    [[nodiscard]] ArchetypeId archetype_without(ArchetypeId from, ComponentId removed);

    /// Move an entity into `target`. Table columns shared with the source are
    /// moved; a new table column is left for the caller to push.
    EntityLocation move_entity(Entity entity, EntityLocation loc, ArchetypeId target);
};

// =============================================================================
// EntityBuilder
// =============================================================================

/// Fluent API for building entities with components
template<typename WorldT>
class EntityBuilder {
private:
    WorldT* world_;
    Entity entity_;

public:
    explicit EntityBuilder(WorldT* world)
        : world_(world)
        , entity_(world->spawn()) {}

    template<typename T>
    EntityBuilder& with(T component) {
        world_->add_component(entity_, std::move(component));
        return *this;
    }

    [[nodiscard]] Entity id() const noexcept { return entity_; }

    [[nodiscard]] Entity build() { return entity_; }

    operator Entity() const noexcept { return entity_; }
};

inline EntityBuilder<World> World::build_entity() {
    return EntityBuilder<World>(this);
}

} // namespace quarry_ecs
