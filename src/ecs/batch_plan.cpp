/// @file batch_plan.cpp
/// @brief Batch planner implementation

#include <quarry/ecs/batch_plan.hpp>

#include <algorithm>

namespace quarry_ecs::detail {

std::vector<std::vector<ChunkRange>> plan_batches(std::span<const ChunkExtent> chunks, std::size_t batch_size) {
    batch_size = std::max<std::size_t>(batch_size, 1);

    std::vector<std::vector<ChunkRange>> batches;
    std::vector<ChunkRange> queue;
    std::size_t queued_rows = 0;

    auto flush = [&] {
        if (!queue.empty()) {
            batches.push_back(std::move(queue));
            queue.clear();
        }
        queued_rows = 0;
    };

    for (const ChunkExtent& chunk : chunks) {
        if (chunk.count == 0) {
            continue;
        }

        if (chunk.count >= batch_size) {
            for (std::size_t begin = 0; begin < chunk.count; begin += batch_size) {
                std::size_t end = std::min(begin + batch_size, chunk.count);
                batches.push_back({ChunkRange{chunk.storage, begin, end}});
            }
            continue;
        }

        if (queued_rows + chunk.count >= batch_size || queue.size() >= MAX_CHUNKS_PER_BATCH) {
            flush();
        }
        queue.push_back(ChunkRange{chunk.storage, 0, chunk.count});
        queued_rows += chunk.count;
    }
    flush();

    return batches;
}

std::vector<std::pair<std::size_t, std::size_t>> plan_slices(std::size_t count, std::size_t batch_size) {
    batch_size = std::max<std::size_t>(batch_size, 1);

    std::vector<std::pair<std::size_t, std::size_t>> slices;
    slices.reserve(count / batch_size + 1);
    for (std::size_t begin = 0; begin < count; begin += batch_size) {
        slices.emplace_back(begin, std::min(begin + batch_size, count));
    }
    return slices;
}

} // namespace quarry_ecs::detail
