/// @file access.cpp
/// @brief Borrow registry implementation

#include <quarry/ecs/access.hpp>

#include <algorithm>

namespace quarry_ecs {

std::vector<BorrowRequest> normalize_requests(std::vector<BorrowRequest> requests) {
    std::sort(requests.begin(), requests.end(), [](const BorrowRequest& a, const BorrowRequest& b) {
        if (a.component.id != b.component.id) return a.component.id < b.component.id;
        if (a.chunk != b.chunk) return a.chunk < b.chunk;
        return a.mode > b.mode;  // Exclusive first
    });
    auto last = std::unique(requests.begin(), requests.end(), [](const BorrowRequest& a, const BorrowRequest& b) {
        return a.component == b.component && a.chunk == b.chunk;
    });
    requests.erase(last, requests.end());
    return requests;
}

bool AccessRegistry::conflicts(const BorrowState& state, BorrowMode mode) noexcept {
    if (state.exclusive) return true;
    return mode == BorrowMode::Exclusive && state.shared > 0;
}

std::optional<BorrowRequest> AccessRegistry::try_acquire(const std::vector<BorrowRequest>& requests) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (const auto& request : requests) {
        auto it = active_.find(Key{request.component.id, request.chunk});
        if (it != active_.end() && conflicts(it->second, request.mode)) {
            return request;
        }
    }

    for (const auto& request : requests) {
        auto& state = active_[Key{request.component.id, request.chunk}];
        if (request.mode == BorrowMode::Exclusive) {
            state.exclusive = true;
        } else {
            ++state.shared;
        }
    }
    ++holders_;
    return std::nullopt;
}

void AccessRegistry::release(const std::vector<BorrowRequest>& requests) noexcept {
    std::lock_guard<std::mutex> lock(mutex_);

    if (holders_ > 0) {
        --holders_;
    }
    for (const auto& request : requests) {
        auto it = active_.find(Key{request.component.id, request.chunk});
        if (it == active_.end()) continue;

        if (request.mode == BorrowMode::Exclusive) {
            it->second.exclusive = false;
        } else if (it->second.shared > 0) {
            --it->second.shared;
        }

        if (!it->second.exclusive && it->second.shared == 0) {
            active_.erase(it);
        }
    }
}

bool AccessRegistry::has_active() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return holders_ > 0;
}

std::size_t AccessRegistry::holder_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return holders_;
}

std::size_t AccessRegistry::active_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.size();
}

} // namespace quarry_ecs
