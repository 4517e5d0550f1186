#pragma once

/// @file bitset.hpp
/// @brief Growable bit set for quarry_structures
///
/// Used for component masks (bit = ComponentId) and for the set of
/// archetypes a query has matched (bit = ArchetypeId).

#include <vector>
#include <cstdint>
#include <cstddef>
#include <algorithm>
#include <bit>
#include <iterator>

namespace quarry_structures {

/// Dynamic bit-level storage that grows on insert
class BitSet {
public:
    using word_type = std::uint64_t;
    using size_type = std::size_t;

    static constexpr size_type BITS_PER_WORD = 64;

private:
    std::vector<word_type> bits_;
    size_type len_;  // Capacity in bits

    [[nodiscard]] static constexpr size_type words_for_bits(size_type n) noexcept {
        return (n + BITS_PER_WORD - 1) / BITS_PER_WORD;
    }

    [[nodiscard]] static constexpr size_type word_index(size_type bit) noexcept {
        return bit / BITS_PER_WORD;
    }

    [[nodiscard]] static constexpr word_type bit_mask(size_type bit) noexcept {
        return word_type(1) << (bit % BITS_PER_WORD);
    }

    [[nodiscard]] word_type word_at(size_type i) const noexcept {
        return i < bits_.size() ? bits_[i] : 0;
    }

public:
    // =========================================================================
    // Constructors
    // =========================================================================

    /// Create bitset with given capacity (in bits)
    explicit BitSet(size_type capacity = 0)
        : bits_(words_for_bits(capacity), 0)
        , len_(capacity) {}

    /// Create from set bit indices
    BitSet(std::initializer_list<size_type> set_bits) : BitSet() {
        for (size_type bit : set_bits) {
            insert(bit);
        }
    }

    // =========================================================================
    // Capacity
    // =========================================================================

    /// Capacity in bits
    [[nodiscard]] size_type size() const noexcept { return len_; }

    /// Grow capacity to at least `bits`; never shrinks
    void grow(size_type bits) {
        if (bits <= len_) return;
        bits_.resize(words_for_bits(bits), 0);
        len_ = bits;
    }

    // =========================================================================
    // Bit Operations
    // =========================================================================

    /// Set bit, growing as needed
    void insert(size_type index) {
        grow(index + 1);
        bits_[word_index(index)] |= bit_mask(index);
    }

    /// Clear bit (no-op when out of range)
    void remove(size_type index) noexcept {
        if (index >= len_) return;
        bits_[word_index(index)] &= ~bit_mask(index);
    }

    [[nodiscard]] bool contains(size_type index) const noexcept {
        if (index >= len_) return false;
        return (bits_[word_index(index)] & bit_mask(index)) != 0;
    }

    [[nodiscard]] bool operator[](size_type index) const noexcept {
        return contains(index);
    }

    /// Clear all bits, keeping capacity
    void clear() noexcept {
        std::fill(bits_.begin(), bits_.end(), 0);
    }

    // =========================================================================
    // Aggregation
    // =========================================================================

    [[nodiscard]] size_type count_ones() const noexcept {
        size_type count = 0;
        for (word_type word : bits_) {
            count += static_cast<size_type>(std::popcount(word));
        }
        return count;
    }

    /// True when no bit is set
    [[nodiscard]] bool is_clear() const noexcept {
        return std::all_of(bits_.begin(), bits_.end(), [](word_type w) { return w == 0; });
    }

    // =========================================================================
    // Set Relations
    // =========================================================================

    /// Every bit set here is also set in `other`
    [[nodiscard]] bool is_subset(const BitSet& other) const noexcept {
        for (size_type i = 0; i < bits_.size(); ++i) {
            if ((bits_[i] & ~other.word_at(i)) != 0) return false;
        }
        return true;
    }

    /// No bit is set in both
    [[nodiscard]] bool is_disjoint(const BitSet& other) const noexcept {
        size_type words = std::min(bits_.size(), other.bits_.size());
        for (size_type i = 0; i < words; ++i) {
            if ((bits_[i] & other.bits_[i]) != 0) return false;
        }
        return true;
    }

    /// In-place union, growing as needed
    void union_with(const BitSet& other) {
        grow(other.len_);
        for (size_type i = 0; i < other.bits_.size(); ++i) {
            bits_[i] |= other.bits_[i];
        }
    }

    /// In-place intersection
    void intersect_with(const BitSet& other) noexcept {
        for (size_type i = 0; i < bits_.size(); ++i) {
            bits_[i] &= other.word_at(i);
        }
    }

    // =========================================================================
    // Iterator over set bits
    // =========================================================================

    /// Forward iterator over set bit indices, skipping empty words
    class OnesIterator {
        const std::vector<word_type>* words_;
        size_type word_;
        word_type pending_;

        void settle() {
            while (pending_ == 0 && ++word_ < words_->size()) {
                pending_ = (*words_)[word_];
            }
        }

    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = size_type;
        using difference_type = std::ptrdiff_t;
        using pointer = const size_type*;
        using reference = size_type;

        OnesIterator(const std::vector<word_type>* words, size_type word)
            : words_(words)
            , word_(word)
            , pending_(word < words->size() ? (*words)[word] : 0) {
            if (word_ < words_->size()) settle();
        }

        size_type operator*() const {
            return word_ * BITS_PER_WORD + static_cast<size_type>(std::countr_zero(pending_));
        }

        OnesIterator& operator++() {
            pending_ &= pending_ - 1;
            settle();
            return *this;
        }

        OnesIterator operator++(int) {
            OnesIterator tmp = *this;
            ++(*this);
            return tmp;
        }

        bool operator==(const OnesIterator& other) const {
            return word_ == other.word_ && pending_ == other.pending_;
        }

        bool operator!=(const OnesIterator& other) const {
            return !(*this == other);
        }
    };

    class OnesRange {
        const std::vector<word_type>* words_;
    public:
        explicit OnesRange(const std::vector<word_type>* words) : words_(words) {}
        OnesIterator begin() const { return OnesIterator(words_, 0); }
        OnesIterator end() const { return OnesIterator(words_, words_->size()); }
    };

    /// Iterate over indices of set bits in ascending order
    [[nodiscard]] OnesRange iter_ones() const { return OnesRange(&bits_); }

    // =========================================================================
    // Comparison
    // =========================================================================

    /// Equal when the same bits are set, regardless of capacity
    bool operator==(const BitSet& other) const noexcept {
        size_type words = std::max(bits_.size(), other.bits_.size());
        for (size_type i = 0; i < words; ++i) {
            if (word_at(i) != other.word_at(i)) return false;
        }
        return true;
    }

    bool operator!=(const BitSet& other) const noexcept {
        return !(*this == other);
    }
};

} // namespace quarry_structures
