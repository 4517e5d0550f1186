#pragma once

/// @file sparse_set.hpp
/// @brief Sparse set for quarry_structures
///
/// Values live contiguously in a dense array; a sparse array maps external
/// indices to dense positions. Removal swaps the last dense element into the
/// hole, so a parallel array kept in lockstep (a type-erased column) can
/// mirror every operation by dense position.

#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>
#include <span>
#include <stdexcept>

namespace quarry_structures {

/// Result of a swap-remove: which dense slot was vacated and what moved into it
struct SwapRemoved {
    std::size_t dense_index;
    bool moved_last;  ///< The former last element now lives at dense_index
};

/// Sparse set keyed by a small integer index
/// @tparam T Stored value type
template<typename T>
class SparseSet {
public:
    using value_type = T;
    using size_type = std::size_t;
    using index_type = std::size_t;

private:
    std::vector<std::optional<size_type>> sparse_;  // External index -> dense index
    std::vector<T> dense_;                           // Contiguous value storage
    std::vector<index_type> indices_;                // Dense index -> external index

public:
    SparseSet() = default;

    // =========================================================================
    // Capacity
    // =========================================================================

    [[nodiscard]] size_type size() const noexcept { return dense_.size(); }
    [[nodiscard]] bool empty() const noexcept { return dense_.empty(); }

    // =========================================================================
    // Core Operations
    // =========================================================================

    /// Insert or overwrite the value at `index`
    /// @return Dense index of the value
    size_type insert(index_type index, T value) {
        if (index >= sparse_.size()) {
            sparse_.resize(index + 1, std::nullopt);
        }

        if (sparse_[index].has_value()) {
            size_type dense_idx = *sparse_[index];
            dense_[dense_idx] = std::move(value);
            return dense_idx;
        }

        size_type dense_idx = dense_.size();
        sparse_[index] = dense_idx;
        dense_.push_back(std::move(value));
        indices_.push_back(index);
        return dense_idx;
    }

    /// Swap-remove the value at `index`
    /// @return Vacated dense slot, or nullopt if absent
    std::optional<SwapRemoved> remove(index_type index) {
        if (!contains(index)) {
            return std::nullopt;
        }

        size_type dense_idx = *sparse_[index];
        size_type last_dense_idx = dense_.size() - 1;
        bool moved = dense_idx != last_dense_idx;

        if (moved) {
            index_type last_sparse_idx = indices_[last_dense_idx];
            dense_[dense_idx] = std::move(dense_[last_dense_idx]);
            indices_[dense_idx] = last_sparse_idx;
            sparse_[last_sparse_idx] = dense_idx;
        }

        dense_.pop_back();
        indices_.pop_back();
        sparse_[index] = std::nullopt;

        return SwapRemoved{dense_idx, moved};
    }

    void clear() {
        for (auto& entry : sparse_) {
            entry = std::nullopt;
        }
        dense_.clear();
        indices_.clear();
    }

    // =========================================================================
    // Lookup
    // =========================================================================

    [[nodiscard]] bool contains(index_type index) const noexcept {
        return index < sparse_.size() && sparse_[index].has_value();
    }

    [[nodiscard]] const T* get(index_type index) const noexcept {
        if (!contains(index)) {
            return nullptr;
        }
        return &dense_[*sparse_[index]];
    }

    [[nodiscard]] T* get(index_type index) noexcept {
        if (!contains(index)) {
            return nullptr;
        }
        return &dense_[*sparse_[index]];
    }

    [[nodiscard]] const T& at(index_type index) const {
        if (!contains(index)) {
            throw std::out_of_range("SparseSet: index not present");
        }
        return dense_[*sparse_[index]];
    }

    [[nodiscard]] std::optional<size_type> dense_index_of(index_type sparse_index) const noexcept {
        if (!contains(sparse_index)) {
            return std::nullopt;
        }
        return sparse_[sparse_index];
    }

    // =========================================================================
    // Dense Access
    // =========================================================================

    [[nodiscard]] std::span<const T> values() const noexcept { return {dense_.data(), dense_.size()}; }
    [[nodiscard]] std::span<T> values() noexcept { return {dense_.data(), dense_.size()}; }

    /// External indices in dense order
    [[nodiscard]] std::span<const index_type> indices() const noexcept { return {indices_.data(), indices_.size()}; }

    [[nodiscard]] const T& dense_at(size_type dense_index) const { return dense_[dense_index]; }
};

} // namespace quarry_structures
