#pragma once

/// @file task_pool.hpp
/// @brief Fixed-size worker pool with scoped spawn/join
///
/// `TaskPool::scope` runs a closure that spawns tasks onto the pool and
/// returns once every spawned task has finished. The calling thread helps
/// drain the queue while it waits, so a scope opened from inside a task
/// cannot starve the pool.
///
/// A task that throws does not cancel its siblings. The first exception is
/// kept and rethrown from `scope` after the join.

#include <quarry/core/fwd.hpp>
#include <quarry/core/error.hpp>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#ifndef QUARRY_MULTI_THREADED
#define QUARRY_MULTI_THREADED 1
#endif

namespace quarry_tasks {

/// False when the library is built without worker threads
inline constexpr bool multi_threaded = QUARRY_MULTI_THREADED != 0;

// =============================================================================
// TaskPoolConfig
// =============================================================================

struct TaskPoolConfig {
    /// Worker count; 0 selects std::thread::hardware_concurrency()
    std::size_t num_threads = 0;
    /// Prefix for worker thread names
    std::string thread_name = "quarry-worker";

    /// Read `tasks.*` keys; a negative worker count is an InvalidConfig error
    [[nodiscard]] static quarry_core::Result<TaskPoolConfig> from_config(const quarry_core::ConfigManager& config);

    /// Worker count after resolving 0, never below 1
    [[nodiscard]] std::size_t resolved_threads() const noexcept;
};

/// Counters for diagnostics and tests
struct TaskPoolStats {
    std::uint64_t scopes_run = 0;
    std::uint64_t tasks_spawned = 0;
    std::uint64_t tasks_failed = 0;
};

class TaskPool;

// =============================================================================
// Scope
// =============================================================================

/// Spawn handle passed to the closure given to TaskPool::scope
class Scope {
public:
    Scope(const Scope&) = delete;
    Scope& operator=(const Scope&) = delete;

    /// Queue `task` on the pool; it may start before spawn returns
    template<typename F>
    void spawn(F&& task) {
        static_assert(std::is_invocable_v<std::decay_t<F>&>, "task must be callable with no arguments");
        pending_.fetch_add(1, std::memory_order_acq_rel);
        ++spawned_;
        enqueue([this, job = std::forward<F>(task)]() mutable {
            try {
                job();
            } catch (...) {
                record_failure(std::current_exception());
            }
            finish_one();
        });
    }

    /// Tasks spawned so far in this scope
    [[nodiscard]] std::size_t spawned() const noexcept { return spawned_; }

private:
    friend class TaskPool;

    explicit Scope(TaskPool& pool) : pool_(pool) {}

    void enqueue(std::function<void()> job);
    void record_failure(std::exception_ptr error);
    void finish_one();

    /// Block until every spawned task has finished, running queued jobs meanwhile
    void join();

    TaskPool& pool_;
    std::atomic<std::size_t> pending_{0};
    std::size_t spawned_ = 0;
    std::mutex mutex_;
    std::condition_variable done_;
    std::exception_ptr first_error_;
};

// =============================================================================
// TaskPool
// =============================================================================

/// Fixed-size pool of worker threads
class TaskPool {
public:
    explicit TaskPool(TaskPoolConfig config = {});
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;
    TaskPool(TaskPool&&) = delete;
    TaskPool& operator=(TaskPool&&) = delete;

    /// Number of worker threads
    [[nodiscard]] std::size_t thread_count() const noexcept { return workers_.size(); }

    [[nodiscard]] const std::string& name() const noexcept { return config_.thread_name; }

    /// Run `body(Scope&)`, then wait for all tasks it spawned.
    /// Rethrows the first task failure, or the body's own exception, after the join.
    template<typename F>
    void scope(F&& body) {
        Scope s(*this);
        std::exception_ptr body_error;
        try {
            std::forward<F>(body)(s);
        } catch (...) {
            body_error = std::current_exception();
        }
        s.join();
        note_scope(s.spawned());
        if (body_error) {
            std::rethrow_exception(body_error);
        }
        if (s.first_error_) {
            std::rethrow_exception(s.first_error_);
        }
    }

    [[nodiscard]] TaskPoolStats stats() const noexcept;

    /// True when called from one of this pool's workers
    [[nodiscard]] bool is_worker_thread() const noexcept;

private:
    friend class Scope;

    void push_job(std::function<void()> job);

    /// Pop and run one queued job on the calling thread
    bool try_run_one();

    void worker_loop(std::size_t index);
    void note_scope(std::size_t spawned) noexcept;
    void note_failure() noexcept;

    TaskPoolConfig config_;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    bool stopping_ = false;

    std::atomic<std::uint64_t> scopes_run_{0};
    std::atomic<std::uint64_t> tasks_spawned_{0};
    std::atomic<std::uint64_t> tasks_failed_{0};
};

// =============================================================================
// ComputeTaskPool
// =============================================================================

/// Process-wide pool for parallel query iteration.
///
/// Lifecycle: call `init()` once at startup, before the first parallel
/// iteration, and `shutdown()` once no iteration is running. `get()` before
/// `init()` is a usage error.
class ComputeTaskPool {
public:
    /// Create the pool, or return the existing one unchanged
    static TaskPool& init(TaskPoolConfig config = {});

    /// The pool, or nullptr before init()
    [[nodiscard]] static TaskPool* try_get() noexcept;

    /// The pool; raises UsageError (TaskPoolError::NotInitialized) before init()
    [[nodiscard]] static TaskPool& get();

    [[nodiscard]] static bool is_initialized() noexcept { return try_get() != nullptr; }

    /// Join and destroy the pool
    static void shutdown();
};

} // namespace quarry_tasks
