#pragma once

/// @file batch_plan.hpp
/// @brief Partitioning of matched chunks into parallel batches

#include "matched_storage.hpp"

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>
#include <vector>

namespace quarry_ecs::detail {

/// A matched chunk and its current entity count
struct ChunkExtent {
    std::uint32_t storage;
    std::size_t count;
};

/// Upper bound on small chunks coalesced into one batch
inline constexpr std::size_t MAX_CHUNKS_PER_BATCH = 128;

/// Split chunks into batches of at most `batch_size` rows.
///
/// A chunk at least `batch_size` long is cut into `batch_size` pieces, each
/// its own batch. Smaller chunks are coalesced in order until the next one
/// would reach `batch_size` or the batch holds MAX_CHUNKS_PER_BATCH chunks.
/// Empty chunks are skipped. Every row appears in exactly one batch.
[[nodiscard]] std::vector<std::vector<ChunkRange>> plan_batches(std::span<const ChunkExtent> chunks,
                                                                std::size_t batch_size);

/// Split `[0, count)` into consecutive slices of at most `batch_size`
[[nodiscard]] std::vector<std::pair<std::size_t, std::size_t>> plan_slices(std::size_t count,
                                                                           std::size_t batch_size);

} // namespace quarry_ecs::detail
