#pragma once

/// @file matched_storage.hpp
/// @brief Storage locator for quarry_ecs queries
///
/// Tracks which storage chunks hold entities a query can match. A dense query
/// (every referenced component is table-stored) iterates whole tables; any
/// other query iterates archetypes. The cache only grows: archetypes are never
/// destroyed, so a chunk that matched once keeps matching.

#include "fwd.hpp"
#include "entity.hpp"
#include "query.hpp"
#include "access.hpp"
#include <quarry/structures/bitset.hpp>

#include <cstdint>
#include <vector>

namespace quarry_ecs {

/// A row range inside one chunk (table in dense mode, archetype otherwise)
struct ChunkRange {
    std::uint32_t storage;
    std::size_t begin;
    std::size_t end;

    [[nodiscard]] std::size_t size() const noexcept { return end - begin; }

    [[nodiscard]] bool operator==(const ChunkRange& other) const noexcept {
        return storage == other.storage && begin == other.begin && end == other.end;
    }
};

// =============================================================================
// MatchedStorage
// =============================================================================

class MatchedStorage {
public:
    explicit MatchedStorage(bool dense) : dense_(dense) {}

    /// Examine archetypes created since the previous call
    void update(const Archetypes& archetypes, const QueryDescriptor& descriptor);

    [[nodiscard]] bool is_dense() const noexcept { return dense_; }

    /// Matched table ids (dense) or archetype ids, in discovery order
    [[nodiscard]] const std::vector<std::uint32_t>& storage_ids() const noexcept { return storage_ids_; }

    [[nodiscard]] bool contains_archetype(ArchetypeId id) const noexcept {
        return matched_archetypes_.contains(id.id);
    }

    [[nodiscard]] bool contains_table(TableId id) const noexcept {
        return matched_tables_.contains(id.id);
    }

    /// Number of archetypes examined so far
    [[nodiscard]] std::size_t archetype_generation() const noexcept { return archetype_generation_; }

    /// Entities currently in one matched chunk
    [[nodiscard]] std::size_t chunk_entity_count(const World& world, std::uint32_t storage) const noexcept;

    /// Entity count of the largest matched chunk
    [[nodiscard]] std::size_t max_chunk_size(const World& world) const noexcept;

    /// One range per non-empty matched chunk, covering every row
    [[nodiscard]] std::vector<ChunkRange> full_ranges(const World& world) const;

    /// Borrow requests covering every matched chunk
    [[nodiscard]] std::vector<BorrowRequest> borrow_requests(const World& world, const QueryDescriptor& descriptor) const;

private:
    bool dense_;
    quarry_structures::BitSet matched_archetypes_;
    quarry_structures::BitSet matched_tables_;
    std::vector<std::uint32_t> storage_ids_;
    std::size_t archetype_generation_ = 0;
};

} // namespace quarry_ecs
