#pragma once

/// @file sparse_storage.hpp
/// @brief Sparse-set component storage for quarry_ecs
///
/// Components declared with StorageType::SparseSet live outside tables, one
/// sparse set per component keyed by entity index. Adding or removing them
/// changes the entity's archetype but never moves its table row.

#include "fwd.hpp"
#include "entity.hpp"
#include "component.hpp"
#include <quarry/structures/sparse_set.hpp>

#include <memory>
#include <unordered_map>
#include <utility>

namespace quarry_ecs {

// =============================================================================
// ComponentSparseSet
// =============================================================================

/// One component type's values for the entities that have it
class ComponentSparseSet {
public:
    using size_type = std::size_t;

private:
    ComponentStorage dense_;                          // Row = dense index
    quarry_structures::SparseSet<Entity> entities_;   // Entity index -> dense index

public:
    explicit ComponentSparseSet(const ComponentInfo& info) : dense_(info) {}

    [[nodiscard]] ComponentId id() const noexcept { return dense_.id(); }
    [[nodiscard]] size_type size() const noexcept { return entities_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entities_.empty(); }

    [[nodiscard]] bool contains(Entity entity) const noexcept {
        const Entity* stored = entities_.get(entity.index);
        return stored && *stored == entity;
    }

    /// Insert a new value, or replace and mark changed if present
    template<typename T>
    void insert(Entity entity, T&& value, Tick tick) {
        if (auto dense = entities_.dense_index_of(entity.index)) {
            using U = std::remove_cvref_t<T>;
            U tmp(std::forward<T>(value));
            dense_.replace_moved_from(*dense, &tmp);
            dense_.ticks(*dense).set_changed(tick);
            return;
        }
        entities_.insert(entity.index, entity);
        dense_.push(std::forward<T>(value), ComponentTicks{tick});
    }

    /// Drop the entity's value
    /// @return false if the entity had none
    bool remove(Entity entity) {
        if (!contains(entity)) return false;
        auto removed = entities_.remove(entity.index);
        dense_.swap_remove(removed->dense_index);
        return true;
    }

    [[nodiscard]] std::optional<size_type> dense_index(Entity entity) const noexcept {
        if (!contains(entity)) return std::nullopt;
        return entities_.dense_index_of(entity.index);
    }

    template<typename T>
    [[nodiscard]] const T* get(Entity entity) const noexcept {
        auto dense = dense_index(entity);
        return dense ? &dense_.get<T>(*dense) : nullptr;
    }

    template<typename T>
    [[nodiscard]] T* get_mut(Entity entity) noexcept {
        auto dense = dense_index(entity);
        return dense ? &dense_.get<T>(*dense) : nullptr;
    }

    [[nodiscard]] const ComponentTicks* ticks(Entity entity) const noexcept {
        auto dense = dense_index(entity);
        return dense ? &dense_.ticks(*dense) : nullptr;
    }

    [[nodiscard]] ComponentTicks* ticks_mut(Entity entity) noexcept {
        auto dense = dense_index(entity);
        return dense ? &dense_.ticks(*dense) : nullptr;
    }

    void check_change_ticks(Tick current) noexcept { dense_.check_change_ticks(current); }

    void clear() {
        dense_.clear();
        entities_.clear();
    }
};

// =============================================================================
// SparseSets
// =============================================================================

/// Every sparse-set component storage of a world
class SparseSets {
private:
    std::unordered_map<ComponentId, std::unique_ptr<ComponentSparseSet>> sets_;

public:
    [[nodiscard]] ComponentSparseSet* get(ComponentId id) noexcept {
        auto it = sets_.find(id);
        return it != sets_.end() ? it->second.get() : nullptr;
    }

    [[nodiscard]] const ComponentSparseSet* get(ComponentId id) const noexcept {
        auto it = sets_.find(id);
        return it != sets_.end() ? it->second.get() : nullptr;
    }

    ComponentSparseSet& get_or_insert(const ComponentInfo& info) {
        auto& slot = sets_[info.id];
        if (!slot) {
            slot = std::make_unique<ComponentSparseSet>(info);
        }
        return *slot;
    }

    [[nodiscard]] std::size_t size() const noexcept { return sets_.size(); }

    void check_change_ticks(Tick current) noexcept {
        for (auto& [id, set] : sets_) {
            set->check_change_ticks(current);
        }
    }

    void clear() {
        for (auto& [id, set] : sets_) {
            set->clear();
        }
    }
};

} // namespace quarry_ecs
