#pragma once

/// @file access.hpp
/// @brief Runtime borrow tracking for quarry_ecs
///
/// Every live query iterator holds shared borrows on the (component, chunk)
/// pairs it reads and exclusive borrows on those it writes. A request that
/// overlaps an exclusive borrow, or asks for exclusivity over a shared one,
/// is refused as a whole.

#include "fwd.hpp"
#include "component.hpp"

#include <cstdint>
#include <limits>
#include <map>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace quarry_ecs {

// =============================================================================
// BorrowRequest
// =============================================================================

enum class BorrowMode : std::uint8_t {
    Shared,
    Exclusive,
};

[[nodiscard]] inline const char* borrow_mode_name(BorrowMode mode) noexcept {
    return mode == BorrowMode::Shared ? "shared" : "exclusive";
}

/// Chunk key used for sparse-set components, which are not split by table
inline constexpr std::uint32_t SPARSE_CHUNK = std::numeric_limits<std::uint32_t>::max();

/// One claim on a (component, chunk) pair
struct BorrowRequest {
    ComponentId component;
    std::uint32_t chunk;   ///< Table id, or SPARSE_CHUNK
    BorrowMode mode;
};

/// Merge duplicate (component, chunk) pairs; exclusive wins over shared
[[nodiscard]] std::vector<BorrowRequest> normalize_requests(std::vector<BorrowRequest> requests);

// =============================================================================
// AccessRegistry
// =============================================================================

/// Borrow bookkeeping owned by a World
class AccessRegistry {
public:
    AccessRegistry() = default;
    AccessRegistry(const AccessRegistry&) = delete;
    AccessRegistry& operator=(const AccessRegistry&) = delete;

    /// Acquire every request or none.
    /// @return The first conflicting request, or nullopt on success
    [[nodiscard]] std::optional<BorrowRequest> try_acquire(const std::vector<BorrowRequest>& requests);

    /// Release borrows previously acquired with the same requests
    void release(const std::vector<BorrowRequest>& requests) noexcept;

    /// True while any QueryBorrow is live, including one that claimed no
    /// component (an entity-only query still walks the entity lists)
    [[nodiscard]] bool has_active() const;

    /// Number of live QueryBorrows
    [[nodiscard]] std::size_t holder_count() const;

    /// Number of (component, chunk) pairs currently borrowed
    [[nodiscard]] std::size_t active_count() const;

private:
    struct BorrowState {
        std::uint32_t shared = 0;
        bool exclusive = false;
    };

    using Key = std::pair<std::uint32_t, std::uint32_t>;

    [[nodiscard]] static bool conflicts(const BorrowState& state, BorrowMode mode) noexcept;

    mutable std::mutex mutex_;
    std::map<Key, BorrowState> active_;
    std::size_t holders_ = 0;
};

// =============================================================================
// QueryBorrow
// =============================================================================

/// RAII holder of a set of acquired borrows
class QueryBorrow {
public:
    QueryBorrow() = default;

    QueryBorrow(AccessRegistry& registry, std::vector<BorrowRequest> requests) noexcept
        : registry_(&registry)
        , requests_(std::move(requests)) {}

    ~QueryBorrow() { reset(); }

    QueryBorrow(const QueryBorrow&) = delete;
    QueryBorrow& operator=(const QueryBorrow&) = delete;

    QueryBorrow(QueryBorrow&& other) noexcept
        : registry_(std::exchange(other.registry_, nullptr))
        , requests_(std::move(other.requests_)) {}

    QueryBorrow& operator=(QueryBorrow&& other) noexcept {
        if (this != &other) {
            reset();
            registry_ = std::exchange(other.registry_, nullptr);
            requests_ = std::move(other.requests_);
        }
        return *this;
    }

    [[nodiscard]] bool active() const noexcept { return registry_ != nullptr; }
    [[nodiscard]] const std::vector<BorrowRequest>& requests() const noexcept { return requests_; }

    /// Release early
    void reset() noexcept {
        if (registry_) {
            registry_->release(requests_);
            registry_ = nullptr;
        }
        requests_.clear();
    }

private:
    AccessRegistry* registry_ = nullptr;
    std::vector<BorrowRequest> requests_;
};

} // namespace quarry_ecs
