#pragma once

/// @file entity.hpp
/// @brief Entity handles, allocation and location for quarry_ecs
///
/// Entity uses generational indices to detect use-after-free errors.
/// When an entity is despawned, its generation is incremented so old
/// references become invalid.

#include "fwd.hpp"
#include <vector>
#include <limits>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace quarry_ecs {

// =============================================================================
// Entity
// =============================================================================

/// Entity handle with generational index
struct Entity {
    EntityIndex index;
    Generation generation;

    constexpr Entity(EntityIndex idx, Generation gen) noexcept
        : index(idx), generation(gen) {}

    /// Null entity
    constexpr Entity() noexcept
        : index(std::numeric_limits<EntityIndex>::max())
        , generation(std::numeric_limits<Generation>::max()) {}

    [[nodiscard]] static constexpr Entity null() noexcept {
        return Entity{};
    }

    [[nodiscard]] constexpr bool is_null() const noexcept {
        return index == std::numeric_limits<EntityIndex>::max() &&
               generation == std::numeric_limits<Generation>::max();
    }

    [[nodiscard]] constexpr bool is_valid() const noexcept {
        return !is_null();
    }

    /// Generation in the high 32 bits, index in the low 32
    [[nodiscard]] constexpr std::uint64_t to_bits() const noexcept {
        return (static_cast<std::uint64_t>(generation) << 32) |
               static_cast<std::uint64_t>(index);
    }

    [[nodiscard]] static constexpr Entity from_bits(std::uint64_t bits) noexcept {
        return Entity{
            static_cast<EntityIndex>(bits & 0xFFFFFFFF),
            static_cast<Generation>(bits >> 32)
        };
    }

    [[nodiscard]] constexpr bool operator==(const Entity& other) const noexcept {
        return index == other.index && generation == other.generation;
    }

    [[nodiscard]] constexpr bool operator!=(const Entity& other) const noexcept {
        return !(*this == other);
    }

    [[nodiscard]] constexpr bool operator<(const Entity& other) const noexcept {
        if (index != other.index) return index < other.index;
        return generation < other.generation;
    }

    /// "5v2" or "null"
    [[nodiscard]] std::string to_string() const {
        if (is_null()) {
            return "null";
        }
        return std::to_string(index) + "v" + std::to_string(generation);
    }
};

} // namespace quarry_ecs

template<>
struct std::hash<quarry_ecs::Entity> {
    [[nodiscard]] std::size_t operator()(const quarry_ecs::Entity& e) const noexcept {
        return std::hash<std::uint64_t>{}(e.to_bits());
    }
};

namespace quarry_ecs {

// =============================================================================
// EntityAllocator
// =============================================================================

/// Allocates and tracks entity lifetimes.
///
/// Freed indices are recycled from a free list with a bumped generation.
class EntityAllocator {
public:
    using size_type = std::size_t;

private:
    std::vector<Generation> generations_;
    std::vector<EntityIndex> free_list_;
    size_type alive_count_{0};

public:
    EntityAllocator() = default;

    [[nodiscard]] size_type alive_count() const noexcept { return alive_count_; }

    /// Total allocated slots
    [[nodiscard]] size_type capacity() const noexcept { return generations_.size(); }

    [[nodiscard]] Entity allocate() {
        EntityIndex index;
        Generation generation;

        if (!free_list_.empty()) {
            index = free_list_.back();
            free_list_.pop_back();
            generation = generations_[index];
        } else {
            index = static_cast<EntityIndex>(generations_.size());
            generations_.push_back(0);
            generation = 0;
        }

        ++alive_count_;
        return Entity{index, generation};
    }

    /// @return true if entity was alive and is now dead
    bool deallocate(Entity entity) {
        if (!is_alive(entity)) {
            return false;
        }

        ++generations_[entity.index];
        free_list_.push_back(entity.index);
        --alive_count_;
        return true;
    }

    [[nodiscard]] bool is_alive(Entity entity) const noexcept {
        if (entity.is_null() || entity.index >= generations_.size()) {
            return false;
        }
        return generations_[entity.index] == entity.generation;
    }

    [[nodiscard]] std::optional<Generation> current_generation(EntityIndex index) const noexcept {
        if (index >= generations_.size()) {
            return std::nullopt;
        }
        return generations_[index];
    }

    /// Free every slot; generations survive so stale handles stay dead
    void clear() {
        free_list_.clear();
        for (std::size_t i = generations_.size(); i-- > 0;) {
            ++generations_[i];
            free_list_.push_back(static_cast<EntityIndex>(i));
        }
        alive_count_ = 0;
    }
};

// =============================================================================
// ArchetypeId / TableId
// =============================================================================

/// Identifier of an archetype (full component set)
struct ArchetypeId {
    std::uint32_t id;

    static constexpr std::uint32_t INVALID_ID = std::numeric_limits<std::uint32_t>::max();

    constexpr explicit ArchetypeId(std::uint32_t i = INVALID_ID) noexcept : id(i) {}

    [[nodiscard]] constexpr std::uint32_t value() const noexcept { return id; }
    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != INVALID_ID; }

    /// The archetype without components
    [[nodiscard]] static constexpr ArchetypeId empty() noexcept { return ArchetypeId{0}; }

    [[nodiscard]] constexpr bool operator==(const ArchetypeId& other) const noexcept { return id == other.id; }
    [[nodiscard]] constexpr bool operator!=(const ArchetypeId& other) const noexcept { return id != other.id; }
    [[nodiscard]] constexpr bool operator<(const ArchetypeId& other) const noexcept { return id < other.id; }
};

/// Identifier of a table (set of table-stored components)
struct TableId {
    std::uint32_t id;

    static constexpr std::uint32_t INVALID_ID = std::numeric_limits<std::uint32_t>::max();

    constexpr explicit TableId(std::uint32_t i = INVALID_ID) noexcept : id(i) {}

    [[nodiscard]] constexpr std::uint32_t value() const noexcept { return id; }
    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != INVALID_ID; }

    /// The table without columns
    [[nodiscard]] static constexpr TableId empty() noexcept { return TableId{0}; }

    [[nodiscard]] constexpr bool operator==(const TableId& other) const noexcept { return id == other.id; }
    [[nodiscard]] constexpr bool operator!=(const TableId& other) const noexcept { return id != other.id; }
    [[nodiscard]] constexpr bool operator<(const TableId& other) const noexcept { return id < other.id; }
};

// =============================================================================
// EntityLocation
// =============================================================================

/// Where an entity's data lives
struct EntityLocation {
    ArchetypeId archetype_id;
    std::size_t archetype_row;
    TableId table_id;
    std::size_t table_row;

    [[nodiscard]] static constexpr EntityLocation invalid() noexcept {
        return EntityLocation{ArchetypeId{}, std::numeric_limits<std::size_t>::max(),
                              TableId{}, std::numeric_limits<std::size_t>::max()};
    }

    [[nodiscard]] constexpr bool is_valid() const noexcept {
        return archetype_id.is_valid();
    }
};

} // namespace quarry_ecs
