#pragma once

/// @file table.hpp
/// @brief Dense columnar tables for quarry_ecs
///
/// A table holds one column per table-stored component and one row per
/// entity. Every archetype maps to exactly one table; archetypes that differ
/// only in sparse-set components share it.

#include "fwd.hpp"
#include "entity.hpp"
#include "component.hpp"

#include <algorithm>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace quarry_ecs {

/// Result of moving a row to another table
struct TableMoveResult {
    std::size_t new_row;
    /// Entity that was swapped into the vacated source row, if any
    std::optional<Entity> swapped_entity;
};

// =============================================================================
// Table
// =============================================================================

class Table {
public:
    using size_type = std::size_t;

private:
    TableId id_;
    std::vector<ComponentId> component_ids_;   // Sorted, parallel to columns_
    std::vector<ComponentStorage> columns_;
    std::vector<Entity> entities_;

    [[nodiscard]] std::optional<size_type> column_index(ComponentId id) const noexcept {
        auto it = std::lower_bound(component_ids_.begin(), component_ids_.end(), id);
        if (it == component_ids_.end() || *it != id) return std::nullopt;
        return static_cast<size_type>(it - component_ids_.begin());
    }

public:
    /// @param infos Component infos, sorted by id
    Table(TableId table_id, const std::vector<const ComponentInfo*>& infos)
        : id_(table_id)
    {
        component_ids_.reserve(infos.size());
        columns_.reserve(infos.size());
        for (const ComponentInfo* info : infos) {
            component_ids_.push_back(info->id);
            columns_.emplace_back(*info);
        }
    }

    Table(const Table&) = delete;
    Table& operator=(const Table&) = delete;

    // =========================================================================
    // Properties
    // =========================================================================

    [[nodiscard]] TableId id() const noexcept { return id_; }
    [[nodiscard]] size_type entity_count() const noexcept { return entities_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entities_.empty(); }
    [[nodiscard]] const std::vector<Entity>& entities() const noexcept { return entities_; }
    [[nodiscard]] const std::vector<ComponentId>& component_ids() const noexcept { return component_ids_; }

    [[nodiscard]] bool has_column(ComponentId id) const noexcept {
        return column_index(id).has_value();
    }

    [[nodiscard]] ComponentStorage* column(ComponentId id) noexcept {
        auto idx = column_index(id);
        return idx ? &columns_[*idx] : nullptr;
    }

    [[nodiscard]] const ComponentStorage* column(ComponentId id) const noexcept {
        auto idx = column_index(id);
        return idx ? &columns_[*idx] : nullptr;
    }

    // =========================================================================
    // Row Operations
    // =========================================================================

    /// Append an entity row. Every column must receive a value before the
    /// next structural operation on this table.
    size_type allocate(Entity entity) {
        entities_.push_back(entity);
        return entities_.size() - 1;
    }

    /// Drop the row's components and swap the last row into it
    /// @return Entity now occupying `row`, if one moved
    std::optional<Entity> swap_remove(size_type row) {
        for (auto& column : columns_) {
            column.swap_remove(row);
        }
        return swap_remove_entity(row);
    }

    /// Move the row's shared columns into `dst`, dropping the rest.
    /// Columns `dst` has but this table lacks are left for the caller to fill.
    TableMoveResult move_to(size_type row, Table& dst) {
        size_type new_row = dst.allocate(entities_[row]);
        for (size_type i = 0; i < columns_.size(); ++i) {
            if (ComponentStorage* target = dst.column(component_ids_[i])) {
                target->push_moved_from(columns_[i].get_raw(row), columns_[i].ticks(row));
            }
            columns_[i].swap_remove(row);
        }
        return TableMoveResult{new_row, swap_remove_entity(row)};
    }

    void check_change_ticks(Tick current) noexcept {
        for (auto& column : columns_) {
            column.check_change_ticks(current);
        }
    }

    void clear() noexcept {
        for (auto& column : columns_) {
            column.clear();
        }
        entities_.clear();
    }

private:
    std::optional<Entity> swap_remove_entity(size_type row) {
        size_type last = entities_.size() - 1;
        std::optional<Entity> swapped;
        if (row != last) {
            entities_[row] = entities_[last];
            swapped = entities_[row];
        }
        entities_.pop_back();
        return swapped;
    }
};

// =============================================================================
// Tables
// =============================================================================

/// All tables of a world; table 0 has no columns
class Tables {
public:
    using size_type = std::size_t;

private:
    std::vector<std::unique_ptr<Table>> tables_;
    std::map<std::vector<ComponentId>, TableId> signature_map_;

public:
    Tables() {
        tables_.push_back(std::make_unique<Table>(TableId::empty(), std::vector<const ComponentInfo*>{}));
        signature_map_[{}] = TableId::empty();
    }

    [[nodiscard]] size_type size() const noexcept { return tables_.size(); }

    [[nodiscard]] Table& operator[](TableId id) noexcept { return *tables_[id.id]; }
    [[nodiscard]] const Table& operator[](TableId id) const noexcept { return *tables_[id.id]; }

    [[nodiscard]] const Table* get(TableId id) const noexcept {
        return id.id < tables_.size() ? tables_[id.id].get() : nullptr;
    }

    /// @param component_ids Sorted table-stored component ids
    TableId get_or_create(const std::vector<ComponentId>& component_ids, const ComponentRegistry& registry) {
        auto it = signature_map_.find(component_ids);
        if (it != signature_map_.end()) {
            return it->second;
        }

        std::vector<const ComponentInfo*> infos;
        infos.reserve(component_ids.size());
        for (ComponentId id : component_ids) {
            infos.push_back(registry.get_info(id));
        }

        TableId new_id{static_cast<std::uint32_t>(tables_.size())};
        tables_.push_back(std::make_unique<Table>(new_id, infos));
        signature_map_.emplace(component_ids, new_id);
        return new_id;
    }

    void check_change_ticks(Tick current) noexcept {
        for (auto& table : tables_) {
            table->check_change_ticks(current);
        }
    }

    /// Empty every table, keeping the layouts
    void clear() noexcept {
        for (auto& table : tables_) {
            table->clear();
        }
    }

    [[nodiscard]] auto begin() const noexcept { return tables_.begin(); }
    [[nodiscard]] auto end() const noexcept { return tables_.end(); }
};

} // namespace quarry_ecs
