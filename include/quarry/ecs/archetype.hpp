#pragma once

/// @file archetype.hpp
/// @brief Archetype bookkeeping for quarry_ecs
///
/// An archetype is the exact component set of a group of entities. It records
/// which entities it holds and where each one's table row is; component data
/// itself lives in the archetype's table and in the sparse sets.

#include "fwd.hpp"
#include "entity.hpp"
#include "component.hpp"
#include <quarry/structures/bitset.hpp>

#include <algorithm>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace quarry_ecs {

// =============================================================================
// ArchetypeEntity
// =============================================================================

/// An entity and its row in the archetype's table
struct ArchetypeEntity {
    Entity entity;
    std::size_t table_row;
};

// =============================================================================
// ArchetypeEdge
// =============================================================================

/// Edge in the archetype graph for fast component add/remove transitions
struct ArchetypeEdge {
    ArchetypeId add{ArchetypeId::INVALID_ID};     // Archetype when adding this component
    ArchetypeId remove{ArchetypeId::INVALID_ID};  // Archetype when removing this component
};

// =============================================================================
// Archetype
// =============================================================================

/// Entities with identical component sets
///
/// Rows are swap-removed, so archetype row order is not stable.
class Archetype {
public:
    using size_type = std::size_t;

private:
    ArchetypeId id_;
    TableId table_id_;
    std::vector<ComponentId> components_;           // Sorted, all components
    std::vector<ComponentId> table_components_;     // Sorted, table-stored
    std::vector<ComponentId> sparse_components_;    // Sorted, sparse-set stored
    quarry_structures::BitSet component_mask_;      // For fast matching
    std::vector<ArchetypeEntity> entities_;
    std::map<ComponentId, ArchetypeEdge> edges_;

public:
    Archetype(ArchetypeId arch_id, TableId table_id,
              std::vector<ComponentId> table_components,
              std::vector<ComponentId> sparse_components)
        : id_(arch_id)
        , table_id_(table_id)
        , table_components_(std::move(table_components))
        , sparse_components_(std::move(sparse_components))
    {
        components_.reserve(table_components_.size() + sparse_components_.size());
        components_.insert(components_.end(), table_components_.begin(), table_components_.end());
        components_.insert(components_.end(), sparse_components_.begin(), sparse_components_.end());
        std::sort(components_.begin(), components_.end());
        for (ComponentId id : components_) {
            component_mask_.insert(id.id);
        }
    }

    // =========================================================================
    // Properties
    // =========================================================================

    [[nodiscard]] ArchetypeId id() const noexcept { return id_; }
    [[nodiscard]] TableId table_id() const noexcept { return table_id_; }

    [[nodiscard]] const std::vector<ComponentId>& components() const noexcept { return components_; }
    [[nodiscard]] const std::vector<ComponentId>& table_components() const noexcept { return table_components_; }
    [[nodiscard]] const std::vector<ComponentId>& sparse_components() const noexcept { return sparse_components_; }

    /// Component mask for fast matching
    [[nodiscard]] const quarry_structures::BitSet& component_mask() const noexcept {
        return component_mask_;
    }

    [[nodiscard]] bool has_component(ComponentId id) const noexcept {
        return component_mask_.contains(id.id);
    }

    [[nodiscard]] size_type entity_count() const noexcept { return entities_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entities_.empty(); }

    [[nodiscard]] const std::vector<ArchetypeEntity>& entities() const noexcept {
        return entities_;
    }

    // =========================================================================
    // Entity Operations
    // =========================================================================

    /// @return Archetype row of the new entity
    size_type allocate(Entity entity, size_type table_row) {
        entities_.push_back(ArchetypeEntity{entity, table_row});
        return entities_.size() - 1;
    }

    /// Remove the row, swapping the last row into it
    /// @return Entity that now occupies `row`, if one moved
    std::optional<Entity> swap_remove(size_type row) {
        size_type last = entities_.size() - 1;
        std::optional<Entity> swapped;
        if (row != last) {
            entities_[row] = entities_[last];
            swapped = entities_[row].entity;
        }
        entities_.pop_back();
        return swapped;
    }

    void set_entity_table_row(size_type row, size_type table_row) noexcept {
        entities_[row].table_row = table_row;
    }

    void clear_entities() noexcept { entities_.clear(); }

    // =========================================================================
    // Graph Edges
    // =========================================================================

    [[nodiscard]] const ArchetypeEdge* edge(ComponentId id) const noexcept {
        auto it = edges_.find(id);
        if (it == edges_.end()) return nullptr;
        return &it->second;
    }

    ArchetypeEdge& edge_mut(ComponentId id) {
        return edges_[id];
    }
};

// =============================================================================
// Archetypes
// =============================================================================

/// All archetypes of a world; archetype 0 is empty and lives in table 0
class Archetypes {
public:
    using size_type = std::size_t;

private:
    std::vector<std::unique_ptr<Archetype>> archetypes_;
    std::map<std::vector<ComponentId>, ArchetypeId> signature_map_;

public:
    Archetypes() {
        archetypes_.push_back(std::make_unique<Archetype>(
            ArchetypeId::empty(), TableId::empty(), std::vector<ComponentId>{}, std::vector<ComponentId>{}));
        signature_map_[{}] = ArchetypeId::empty();
    }

    /// Number of archetypes; only ever grows
    [[nodiscard]] size_type size() const noexcept { return archetypes_.size(); }

    [[nodiscard]] Archetype& operator[](ArchetypeId id) noexcept { return *archetypes_[id.id]; }
    [[nodiscard]] const Archetype& operator[](ArchetypeId id) const noexcept { return *archetypes_[id.id]; }

    [[nodiscard]] const Archetype* get(ArchetypeId id) const noexcept {
        return id.id < archetypes_.size() ? archetypes_[id.id].get() : nullptr;
    }

    [[nodiscard]] std::optional<ArchetypeId> find(const std::vector<ComponentId>& sorted_components) const {
        auto it = signature_map_.find(sorted_components);
        if (it != signature_map_.end()) {
            return it->second;
        }
        return std::nullopt;
    }

    /// @param components Sorted full component set
    ArchetypeId get_or_create(const std::vector<ComponentId>& components, TableId table_id,
                              std::vector<ComponentId> table_components,
                              std::vector<ComponentId> sparse_components) {
        auto it = signature_map_.find(components);
        if (it != signature_map_.end()) {
            return it->second;
        }

        ArchetypeId new_id{static_cast<std::uint32_t>(archetypes_.size())};
        archetypes_.push_back(std::make_unique<Archetype>(
            new_id, table_id, std::move(table_components), std::move(sparse_components)));
        signature_map_.emplace(components, new_id);
        return new_id;
    }

    void clear_entities() noexcept {
        for (auto& archetype : archetypes_) {
            archetype->clear_entities();
        }
    }

    [[nodiscard]] auto begin() const noexcept { return archetypes_.begin(); }
    [[nodiscard]] auto end() const noexcept { return archetypes_.end(); }
};

} // namespace quarry_ecs

template<>
struct std::hash<quarry_ecs::ArchetypeId> {
    [[nodiscard]] std::size_t operator()(const quarry_ecs::ArchetypeId& id) const noexcept {
        return std::hash<std::uint32_t>{}(id.id);
    }
};
