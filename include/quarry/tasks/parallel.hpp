#pragma once

/// @file parallel.hpp
/// @brief Per-thread values for reductions over parallel iteration

#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace quarry_tasks {

/// One lazily created `T` per thread that touches it.
///
/// Inside a parallel fold each thread calls `borrow_local_mut()` and works on
/// its own value; after the iteration returns the caller reduces the values
/// with `for_each`, `drain` or `values`.
template<typename T>
class Parallel {
public:
    Parallel() = default;

    Parallel(const Parallel&) = delete;
    Parallel& operator=(const Parallel&) = delete;

    /// The calling thread's value, default-constructed on first use
    [[nodiscard]] T& borrow_local_mut() {
        auto id = std::this_thread::get_id();
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = locals_.find(id);
        if (it == locals_.end()) {
            it = locals_.emplace(id, std::make_unique<T>()).first;
        }
        return *it->second;
    }

    /// Number of threads that created a value
    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return locals_.size();
    }

    /// Visit every thread's value. Not safe while workers still borrow.
    template<typename F>
    void for_each(F&& f) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, value] : locals_) {
            f(*value);
        }
    }

    /// Move every value out and reset
    [[nodiscard]] std::vector<T> drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<T> out;
        out.reserve(locals_.size());
        for (auto& [id, value] : locals_) {
            out.push_back(std::move(*value));
        }
        locals_.clear();
        return out;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        locals_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::thread::id, std::unique_ptr<T>> locals_;
};

} // namespace quarry_tasks
