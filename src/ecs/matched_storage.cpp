/// @file matched_storage.cpp
/// @brief Storage locator implementation

#include <quarry/ecs/matched_storage.hpp>
#include <quarry/ecs/world.hpp>

#include <algorithm>

namespace quarry_ecs {

void MatchedStorage::update(const Archetypes& archetypes, const QueryDescriptor& descriptor) {
    for (std::size_t i = archetype_generation_; i < archetypes.size(); ++i) {
        const Archetype& archetype = archetypes[ArchetypeId{static_cast<std::uint32_t>(i)}];
        if (!descriptor.matches_archetype(archetype)) {
            continue;
        }

        matched_archetypes_.insert(archetype.id().id);
        std::uint32_t table = archetype.table_id().id;
        if (dense_) {
            if (!matched_tables_.contains(table)) {
                matched_tables_.insert(table);
                storage_ids_.push_back(table);
            }
        } else {
            matched_tables_.insert(table);
            storage_ids_.push_back(archetype.id().id);
        }
    }
    archetype_generation_ = archetypes.size();
}

std::size_t MatchedStorage::chunk_entity_count(const World& world, std::uint32_t storage) const noexcept {
    if (dense_) {
        return world.tables()[TableId{storage}].entity_count();
    }
    return world.archetypes()[ArchetypeId{storage}].entity_count();
}

std::size_t MatchedStorage::max_chunk_size(const World& world) const noexcept {
    std::size_t largest = 0;
    for (std::uint32_t id : storage_ids_) {
        largest = std::max(largest, chunk_entity_count(world, id));
    }
    return largest;
}

std::vector<ChunkRange> MatchedStorage::full_ranges(const World& world) const {
    std::vector<ChunkRange> ranges;
    ranges.reserve(storage_ids_.size());
    for (std::uint32_t id : storage_ids_) {
        std::size_t count = chunk_entity_count(world, id);
        if (count > 0) {
            ranges.push_back(ChunkRange{id, 0, count});
        }
    }
    return ranges;
}

std::vector<BorrowRequest> MatchedStorage::borrow_requests(const World& world, const QueryDescriptor& descriptor) const {
    std::vector<BorrowRequest> requests;

    for (const auto& access : descriptor.accesses()) {
        if (!access.needs_borrow()) continue;

        BorrowMode mode = access.is_write() ? BorrowMode::Exclusive : BorrowMode::Shared;
        const ComponentInfo* info = world.component_info(access.id);
        if (info->storage == StorageType::SparseSet) {
            if (!storage_ids_.empty()) {
                requests.push_back(BorrowRequest{access.id, SPARSE_CHUNK, mode});
            }
            continue;
        }

        for (std::size_t table : matched_tables_.iter_ones()) {
            if (world.tables()[TableId{static_cast<std::uint32_t>(table)}].has_column(access.id)) {
                requests.push_back(BorrowRequest{access.id, static_cast<std::uint32_t>(table), mode});
            }
        }
    }
    return requests;
}

} // namespace quarry_ecs
