/// @file world.cpp
/// @brief World structural operations

#include <quarry/ecs/world.hpp>
#include <quarry/core/error.hpp>
#include <quarry/core/log.hpp>

#include <algorithm>

namespace quarry_ecs {

namespace {

std::atomic<std::uint64_t> g_next_world_id{0};

} // anonymous namespace

World::World()
    : id_(g_next_world_id.fetch_add(1, std::memory_order_relaxed)) {}

World::~World() = default;

// =============================================================================
// Entity Management
// =============================================================================

Entity World::spawn() {
    ensure_no_borrows("spawn an entity");

    Entity entity = entities_.allocate();
    if (entity.index >= locations_.size()) {
        locations_.resize(entity.index + 1, EntityLocation::invalid());
    }

    std::size_t table_row = tables_[TableId::empty()].allocate(entity);
    std::size_t arch_row = archetypes_[ArchetypeId::empty()].allocate(entity, table_row);
    locations_[entity.index] = EntityLocation{ArchetypeId::empty(), arch_row, TableId::empty(), table_row};
    return entity;
}

bool World::despawn(Entity entity) {
    ensure_no_borrows("despawn an entity");
    if (!is_alive(entity)) {
        return false;
    }

    EntityLocation loc = locations_[entity.index];
    Archetype& arch = archetypes_[loc.archetype_id];

    for (ComponentId id : arch.sparse_components()) {
        sparse_sets_.get(id)->remove(entity);
    }

    if (auto swapped = tables_[loc.table_id].swap_remove(loc.table_row)) {
        EntityLocation& moved = locations_[swapped->index];
        moved.table_row = loc.table_row;
        archetypes_[moved.archetype_id].set_entity_table_row(moved.archetype_row, loc.table_row);
    }

    if (auto swapped = arch.swap_remove(loc.archetype_row)) {
        locations_[swapped->index].archetype_row = loc.archetype_row;
    }

    locations_[entity.index] = EntityLocation::invalid();
    entities_.deallocate(entity);
    return true;
}

// =============================================================================
// Change Ticks
// =============================================================================

bool World::check_change_ticks() {
    Tick current = change_tick();
    if (current.get() - last_check_tick_.get() < CHECK_TICK_THRESHOLD) {
        return false;
    }

    tables_.check_change_ticks(current);
    sparse_sets_.check_change_ticks(current);
    last_change_tick_.check_tick(current);
    last_check_tick_ = current;
    quarry_core::ecs_logger()->debug("Clamped change ticks at tick {}", current.get());
    return true;
}

// =============================================================================
// Borrows
// =============================================================================

QueryBorrow World::borrow(std::vector<BorrowRequest> requests) const {
    requests = normalize_requests(std::move(requests));

    if (auto conflict = access_.try_acquire(requests)) {
        std::string chunk = conflict->chunk == SPARSE_CHUNK
            ? std::string("sparse storage")
            : "table " + std::to_string(conflict->chunk);
        quarry_core::fail_usage(
            quarry_core::QueryError::access_conflict(
                components_.name_of(conflict->component),
                std::string(borrow_mode_name(conflict->mode)) + " borrow of " + chunk +
                    " overlaps a live borrow held by another iterator"),
            "quarry_ecs");
    }

    return QueryBorrow(access_, std::move(requests));
}

void World::ensure_no_borrows(const char* operation) const {
    if (access_.has_active()) {
        quarry_core::fail_usage(quarry_core::QueryError::structural_change(operation), "quarry_ecs");
    }
}

// =============================================================================
// Maintenance
// =============================================================================

void World::clear() {
    ensure_no_borrows("clear the world");

    tables_.clear();
    sparse_sets_.clear();
    archetypes_.clear_entities();
    entities_.clear();
    std::fill(locations_.begin(), locations_.end(), EntityLocation::invalid());
}

// =============================================================================
// Archetype Transitions
// =============================================================================

ArchetypeId World::get_or_create_archetype(const std::vector<ComponentId>& sorted_components) {
    if (auto existing = archetypes_.find(sorted_components)) {
        return *existing;
    }

    std::vector<ComponentId> table_components;
    std::vector<ComponentId> sparse_components;
    for (ComponentId id : sorted_components) {
        if (components_.get_info(id)->storage == StorageType::SparseSet) {
            sparse_components.push_back(id);
            sparse_sets_.get_or_insert(*components_.get_info(id));
        } else {
            table_components.push_back(id);
        }
    }

    TableId table_id = tables_.get_or_create(table_components, components_);
    ArchetypeId arch_id = archetypes_.get_or_create(
        sorted_components, table_id, std::move(table_components), std::move(sparse_components));

    quarry_core::ecs_logger()->debug("Created archetype {} ({} components) in table {}",
        arch_id.id, sorted_components.size(), table_id.id);
    return arch_id;
}

ArchetypeId World::archetype_with(ArchetypeId from, ComponentId added) {
    if (const ArchetypeEdge* edge = archetypes_[from].edge(added); edge && edge->add.is_valid()) {
        return edge->add;
    }

    std::vector<ComponentId> components = archetypes_[from].components();
    components.insert(std::lower_bound(components.begin(), components.end(), added), added);

    ArchetypeId target = get_or_create_archetype(components);
    archetypes_[from].edge_mut(added).add = target;
    archetypes_[target].edge_mut(added).remove = from;
    return target;
}

ArchetypeId World::archetype_without(ArchetypeId from, ComponentId removed) {
    if (const ArchetypeEdge* edge = archetypes_[from].edge(removed); edge && edge->remove.is_valid()) {
        return edge->remove;
    }

    std::vector<ComponentId> components = archetypes_[from].components();
    components.erase(std::remove(components.begin(), components.end(), removed), components.end());

    ArchetypeId target = get_or_create_archetype(components);
    archetypes_[from].edge_mut(removed).remove = target;
    archetypes_[target].edge_mut(removed).add = from;
    return target;
}

EntityLocation World::move_entity(Entity entity, EntityLocation loc, ArchetypeId target) {
    Archetype& old_arch = archetypes_[loc.archetype_id];
    Archetype& new_arch = archetypes_[target];

    std::size_t table_row = loc.table_row;
    if (new_arch.table_id() != loc.table_id) {
        TableMoveResult moved = tables_[loc.table_id].move_to(loc.table_row, tables_[new_arch.table_id()]);
        if (moved.swapped_entity) {
            EntityLocation& swapped = locations_[moved.swapped_entity->index];
            swapped.table_row = loc.table_row;
            archetypes_[swapped.archetype_id].set_entity_table_row(swapped.archetype_row, loc.table_row);
        }
        table_row = moved.new_row;
    }

    if (auto swapped = old_arch.swap_remove(loc.archetype_row)) {
        locations_[swapped->index].archetype_row = loc.archetype_row;
    }

    std::size_t arch_row = new_arch.allocate(entity, table_row);
    EntityLocation new_loc{target, arch_row, new_arch.table_id(), table_row};
    locations_[entity.index] = new_loc;
    return new_loc;
}

} // namespace quarry_ecs
