#pragma once

/// @file query.hpp
/// @brief Type-erased query descriptions for quarry_ecs
///
/// A QueryDescriptor lists which components a query reads, writes, requires
/// or excludes. Archetype matching is a bitmask test against it, and its
/// access list is what the borrow registry is asked for.

#include "fwd.hpp"
#include "component.hpp"
#include "archetype.hpp"
#include <quarry/structures/bitset.hpp>

#include <optional>
#include <vector>

namespace quarry_ecs {

// =============================================================================
// Access
// =============================================================================

/// Component access mode for queries
enum class Access : std::uint8_t {
    Read,           // Immutable component access (required)
    Write,          // Mutable component access (required)
    OptionalRead,   // Component may or may not exist (read if present)
    OptionalWrite,  // Component may or may not exist (write if present)
    With,           // Component must be present, data untouched
    Without,        // Component must NOT be present
    TickRead,       // Component must be present, its ticks are read
};

// =============================================================================
// ComponentAccess
// =============================================================================

/// Single component access requirement
struct ComponentAccess {
    ComponentId id;
    Access access;

    ComponentAccess(ComponentId i, Access a) : id(i), access(a) {}

    [[nodiscard]] bool is_required() const noexcept {
        return access == Access::Read || access == Access::Write ||
               access == Access::With || access == Access::TickRead;
    }

    [[nodiscard]] bool is_optional() const noexcept {
        return access == Access::OptionalRead || access == Access::OptionalWrite;
    }

    [[nodiscard]] bool is_excluded() const noexcept {
        return access == Access::Without;
    }

    [[nodiscard]] bool is_write() const noexcept {
        return access == Access::Write || access == Access::OptionalWrite;
    }

    /// Touches component memory, so it must be borrowed
    [[nodiscard]] bool needs_borrow() const noexcept {
        return access != Access::With && access != Access::Without;
    }

    /// Counts toward read/write conflicts inside one query
    [[nodiscard]] bool is_data() const noexcept {
        return access == Access::Read || access == Access::Write ||
               access == Access::OptionalRead || access == Access::OptionalWrite;
    }
};

// =============================================================================
// QueryDescriptor
// =============================================================================

/// Builder for query requirements
///
/// Example:
/// @code
/// auto query = QueryDescriptor()
///     .read(position_id)
///     .write(velocity_id)
///     .without(frozen_id)
///     .build();
/// @endcode
class QueryDescriptor {
private:
    std::vector<ComponentAccess> components_;
    quarry_structures::BitSet required_mask_;
    quarry_structures::BitSet excluded_mask_;

public:
    QueryDescriptor() = default;

    // =========================================================================
    // Builder Methods
    // =========================================================================

    QueryDescriptor& read(ComponentId id) {
        components_.emplace_back(id, Access::Read);
        return *this;
    }

    QueryDescriptor& write(ComponentId id) {
        components_.emplace_back(id, Access::Write);
        return *this;
    }

    QueryDescriptor& optional_read(ComponentId id) {
        components_.emplace_back(id, Access::OptionalRead);
        return *this;
    }

    QueryDescriptor& optional_write(ComponentId id) {
        components_.emplace_back(id, Access::OptionalWrite);
        return *this;
    }

    QueryDescriptor& with(ComponentId id) {
        components_.emplace_back(id, Access::With);
        return *this;
    }

    QueryDescriptor& without(ComponentId id) {
        components_.emplace_back(id, Access::Without);
        return *this;
    }

    /// Require the component and read its change ticks
    QueryDescriptor& tick_read(ComponentId id) {
        components_.emplace_back(id, Access::TickRead);
        return *this;
    }

    /// Compute the matching bitmasks
    QueryDescriptor& build() {
        required_mask_.clear();
        excluded_mask_.clear();

        for (const auto& access : components_) {
            if (access.is_required()) {
                required_mask_.insert(access.id.id);
            } else if (access.is_excluded()) {
                excluded_mask_.insert(access.id.id);
            }
        }
        return *this;
    }

    // =========================================================================
    // Query Properties
    // =========================================================================

    [[nodiscard]] const std::vector<ComponentAccess>& accesses() const noexcept {
        return components_;
    }

    [[nodiscard]] const quarry_structures::BitSet& required_mask() const noexcept {
        return required_mask_;
    }

    [[nodiscard]] const quarry_structures::BitSet& excluded_mask() const noexcept {
        return excluded_mask_;
    }

    [[nodiscard]] bool is_read_only() const noexcept {
        for (const auto& access : components_) {
            if (access.is_write()) return false;
        }
        return true;
    }

    /// All required components present, no excluded component present
    [[nodiscard]] bool matches_archetype(const Archetype& archetype) const noexcept {
        const auto& arch_mask = archetype.component_mask();
        return required_mask_.is_subset(arch_mask) && excluded_mask_.is_disjoint(arch_mask);
    }

    /// A component both required and excluded; such a query matches nothing
    [[nodiscard]] bool is_contradictory() const noexcept {
        return !required_mask_.is_disjoint(excluded_mask_);
    }

    /// First component this query writes while also reading or writing it
    /// through another data term
    [[nodiscard]] std::optional<ComponentId> self_conflict() const noexcept {
        for (std::size_t i = 0; i < components_.size(); ++i) {
            if (!components_[i].is_data()) continue;
            for (std::size_t j = i + 1; j < components_.size(); ++j) {
                if (!components_[j].is_data() || components_[i].id != components_[j].id) continue;
                if (components_[i].is_write() || components_[j].is_write()) {
                    return components_[i].id;
                }
            }
        }
        return std::nullopt;
    }

    /// Check if this query conflicts with another (for parallelization)
    [[nodiscard]] bool conflicts_with(const QueryDescriptor& other) const noexcept {
        for (const auto& access : components_) {
            if (!access.needs_borrow()) continue;
            for (const auto& other_access : other.components_) {
                if (!other_access.needs_borrow() || access.id != other_access.id) continue;
                if (access.is_write() || other_access.is_write()) {
                    return true;
                }
            }
        }
        return false;
    }
};

} // namespace quarry_ecs
