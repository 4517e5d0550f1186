/// @file task_pool.cpp
/// @brief Worker pool implementation for quarry_tasks

#include <quarry/tasks/task_pool.hpp>
#include <quarry/core/config.hpp>
#include <quarry/core/error.hpp>
#include <quarry/core/log.hpp>

#include <algorithm>
#include <chrono>
#include <memory>

#if defined(__linux__)
#include <pthread.h>
#endif

namespace quarry_tasks {

namespace {

void set_current_thread_name(const std::string& name) {
#if defined(__linux__)
    // Linux limits thread names to 15 characters
    std::string truncated = name.substr(0, 15);
    pthread_setname_np(pthread_self(), truncated.c_str());
#else
    (void)name;
#endif
}

thread_local const TaskPool* t_current_pool = nullptr;

} // anonymous namespace

// =============================================================================
// TaskPoolConfig
// =============================================================================

quarry_core::Result<TaskPoolConfig> TaskPoolConfig::from_config(const quarry_core::ConfigManager& config) {
    TaskPoolConfig result;
    std::int64_t threads = config.get_int(quarry_core::config_keys::TASKS_WORKER_THREADS, 0);
    if (threads < 0) {
        return quarry_core::Err<TaskPoolConfig>(quarry_core::TaskPoolError::invalid_config(
            "TaskPool", "tasks.worker_threads must not be negative (got " + std::to_string(threads) + ")"));
    }
    result.num_threads = static_cast<std::size_t>(threads);
    result.thread_name = config.get_string(quarry_core::config_keys::TASKS_THREAD_NAME, result.thread_name);
    if (result.thread_name.empty()) {
        return quarry_core::Err<TaskPoolConfig>(quarry_core::TaskPoolError::invalid_config(
            "TaskPool", "tasks.thread_name must not be empty"));
    }
    return quarry_core::Ok(std::move(result));
}

std::size_t TaskPoolConfig::resolved_threads() const noexcept {
    if (num_threads > 0) {
        return num_threads;
    }
    return std::max<std::size_t>(1, std::thread::hardware_concurrency());
}

// =============================================================================
// Scope
// =============================================================================

void Scope::enqueue(std::function<void()> job) {
    pool_.push_job(std::move(job));
}

void Scope::record_failure(std::exception_ptr error) {
    pool_.note_failure();
    std::lock_guard<std::mutex> lock(mutex_);
    if (!first_error_) {
        first_error_ = std::move(error);
    }
}

void Scope::finish_one() {
    // The waiter may destroy this scope as soon as it sees zero, so the
    // decrement and notify happen under the lock it waits on.
    std::lock_guard<std::mutex> lock(mutex_);
    if (pending_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
        done_.notify_all();
    }
}

void Scope::join() {
    while (pending_.load(std::memory_order_acquire) != 0) {
        if (pool_.try_run_one()) {
            continue;
        }
        std::unique_lock<std::mutex> lock(mutex_);
        done_.wait_for(lock, std::chrono::milliseconds(1), [this] {
            return pending_.load(std::memory_order_acquire) == 0;
        });
    }
    // Pairs with finish_one so the last task has released the mutex
    std::lock_guard<std::mutex> lock(mutex_);
}

// =============================================================================
// TaskPool
// =============================================================================

TaskPool::TaskPool(TaskPoolConfig config)
    : config_(std::move(config))
{
    std::size_t count = config_.resolved_threads();
    workers_.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        workers_.emplace_back([this, i] { worker_loop(i); });
    }
    quarry_core::tasks_logger()->info("TaskPool '{}' started with {} worker(s)", config_.thread_name, count);
}

TaskPool::~TaskPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stopping_ = true;
    }
    queue_cv_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    quarry_core::tasks_logger()->info("TaskPool '{}' stopped ({} scopes, {} tasks, {} failed)",
        config_.thread_name, scopes_run_.load(), tasks_spawned_.load(), tasks_failed_.load());
}

TaskPoolStats TaskPool::stats() const noexcept {
    TaskPoolStats s;
    s.scopes_run = scopes_run_.load(std::memory_order_relaxed);
    s.tasks_spawned = tasks_spawned_.load(std::memory_order_relaxed);
    s.tasks_failed = tasks_failed_.load(std::memory_order_relaxed);
    return s;
}

bool TaskPool::is_worker_thread() const noexcept {
    return t_current_pool == this;
}

void TaskPool::push_job(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        queue_.push_back(std::move(job));
    }
    queue_cv_.notify_one();
}

bool TaskPool::try_run_one() {
    std::function<void()> job;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (queue_.empty()) {
            return false;
        }
        job = std::move(queue_.front());
        queue_.pop_front();
    }
    job();
    return true;
}

void TaskPool::worker_loop(std::size_t index) {
    t_current_pool = this;
    set_current_thread_name(config_.thread_name + "-" + std::to_string(index));

    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }
        job();
    }
}

void TaskPool::note_scope(std::size_t spawned) noexcept {
    scopes_run_.fetch_add(1, std::memory_order_relaxed);
    tasks_spawned_.fetch_add(spawned, std::memory_order_relaxed);
}

void TaskPool::note_failure() noexcept {
    tasks_failed_.fetch_add(1, std::memory_order_relaxed);
}

// =============================================================================
// ComputeTaskPool
// =============================================================================

namespace {

struct ComputePoolHolder {
    std::mutex mutex;
    std::unique_ptr<TaskPool> pool;
    std::atomic<TaskPool*> current{nullptr};
};

ComputePoolHolder& compute_holder() {
    static ComputePoolHolder holder;
    return holder;
}

} // anonymous namespace

TaskPool& ComputeTaskPool::init(TaskPoolConfig config) {
    auto& holder = compute_holder();
    std::lock_guard<std::mutex> lock(holder.mutex);
    if (holder.pool) {
        quarry_core::tasks_logger()->debug("ComputeTaskPool already initialized; keeping {} worker(s)",
            holder.pool->thread_count());
        return *holder.pool;
    }
    holder.pool = std::make_unique<TaskPool>(std::move(config));
    holder.current.store(holder.pool.get(), std::memory_order_release);
    return *holder.pool;
}

TaskPool* ComputeTaskPool::try_get() noexcept {
    return compute_holder().current.load(std::memory_order_acquire);
}

TaskPool& ComputeTaskPool::get() {
    TaskPool* pool = try_get();
    if (!pool) {
        quarry_core::fail_usage(quarry_core::TaskPoolError::not_initialized("ComputeTaskPool"), "quarry_tasks");
    }
    return *pool;
}

void ComputeTaskPool::shutdown() {
    std::unique_ptr<TaskPool> doomed;
    {
        auto& holder = compute_holder();
        std::lock_guard<std::mutex> lock(holder.mutex);
        holder.current.store(nullptr, std::memory_order_release);
        doomed = std::move(holder.pool);
    }
    // Destroyed outside the lock; joins the workers
}

} // namespace quarry_tasks
