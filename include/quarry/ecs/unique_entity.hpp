#pragma once

/// @file unique_entity.hpp
/// @brief Duplicate-free entity collections
///
/// Mutable iteration over an explicit entity list is only sound when no
/// entity appears twice, otherwise two live items would alias one row.
/// UniqueEntityVec carries that guarantee; the only ways to build one check it.

#include "fwd.hpp"
#include "entity.hpp"
#include <quarry/core/error.hpp>

#include <cstddef>
#include <span>
#include <unordered_set>
#include <vector>

namespace quarry_ecs {

using EntityHashSet = std::unordered_set<Entity>;

// =============================================================================
// UniqueEntitySlice
// =============================================================================

/// Non-owning view of a duplicate-free entity range
class UniqueEntitySlice {
public:
    UniqueEntitySlice() = default;

    [[nodiscard]] std::size_t size() const noexcept { return entities_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entities_.empty(); }
    [[nodiscard]] Entity operator[](std::size_t i) const noexcept { return entities_[i]; }
    [[nodiscard]] auto begin() const noexcept { return entities_.begin(); }
    [[nodiscard]] auto end() const noexcept { return entities_.end(); }
    [[nodiscard]] std::span<const Entity> as_span() const noexcept { return entities_; }

    /// Any sub-range of a unique range is unique
    [[nodiscard]] UniqueEntitySlice subslice(std::size_t offset, std::size_t count) const noexcept {
        return UniqueEntitySlice(entities_.subspan(offset, count));
    }

private:
    friend class UniqueEntityVec;

    explicit UniqueEntitySlice(std::span<const Entity> entities) noexcept : entities_(entities) {}

    std::span<const Entity> entities_;
};

// =============================================================================
// UniqueEntityVec
// =============================================================================

/// Ordered entity list with no duplicates
class UniqueEntityVec {
public:
    UniqueEntityVec() = default;

    /// Take ownership of `entities`
    /// @return DuplicateEntity error naming the first repeated entity
    [[nodiscard]] static quarry_core::Result<UniqueEntityVec> from_vec(std::vector<Entity> entities) {
        UniqueEntityVec result;
        result.index_.reserve(entities.size());
        for (Entity entity : entities) {
            if (!result.index_.insert(entity).second) {
                return quarry_core::Err<UniqueEntityVec>(
                    quarry_core::QueryError::duplicate_entity(entity.to_string()));
            }
        }
        result.entities_ = std::move(entities);
        return quarry_core::Ok(std::move(result));
    }

    /// Build from a set; iteration order follows the set
    [[nodiscard]] static UniqueEntityVec from_set(const EntityHashSet& set) {
        UniqueEntityVec result;
        result.entities_.assign(set.begin(), set.end());
        result.index_ = set;
        return result;
    }

    /// Append unless already present
    /// @return false for a duplicate
    bool push(Entity entity) {
        if (!index_.insert(entity).second) {
            return false;
        }
        entities_.push_back(entity);
        return true;
    }

    [[nodiscard]] bool contains(Entity entity) const { return index_.count(entity) != 0; }

    [[nodiscard]] std::size_t size() const noexcept { return entities_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entities_.empty(); }
    [[nodiscard]] Entity operator[](std::size_t i) const noexcept { return entities_[i]; }
    [[nodiscard]] auto begin() const noexcept { return entities_.begin(); }
    [[nodiscard]] auto end() const noexcept { return entities_.end(); }

    [[nodiscard]] std::span<const Entity> as_span() const noexcept { return entities_; }

    [[nodiscard]] UniqueEntitySlice as_slice() const noexcept { return UniqueEntitySlice(entities_); }

    [[nodiscard]] UniqueEntitySlice subslice(std::size_t offset, std::size_t count) const noexcept {
        return as_slice().subslice(offset, count);
    }

    [[nodiscard]] const std::vector<Entity>& as_vec() const noexcept { return entities_; }

    /// Give up the list; this vector is left empty
    [[nodiscard]] std::vector<Entity> into_vec() && {
        index_.clear();
        return std::move(entities_);
    }

private:
    std::vector<Entity> entities_;
    EntityHashSet index_;
};

} // namespace quarry_ecs
