/// @file error.cpp
/// @brief Error handling implementation for quarry_core
///
/// The error types are header-only templates. This file provides:
/// - Error formatting utilities
/// - The logging throw path for usage errors
/// - Error statistics

#include <quarry/core/error.hpp>
#include <quarry/core/log.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace quarry_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_query_error(const QueryError& err) {
    std::ostringstream oss;
    oss << "[QueryError] " << err.message;

    if (!err.component.empty()) {
        oss << " (component: " << err.component << ")";
    }
    if (!err.entity.empty()) {
        oss << " (entity: " << err.entity << ")";
    }

    return oss.str();
}

std::string format_task_pool_error(const TaskPoolError& err) {
    std::ostringstream oss;
    oss << "[TaskPoolError] " << err.message;
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, QueryError>) {
            oss << detail::format_query_error(err);
        } else if constexpr (std::is_same_v<T, TaskPoolError>) {
            oss << detail::format_task_pool_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Usage Errors
// =============================================================================

void fail_usage(Error error, const char* logger_name) {
    debug::record_error(error);
    get_logger(logger_name)->critical("{}", build_error_chain(error));
    throw UsageError(std::move(error));
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<std::uint64_t, Error>;
template class Result<std::string, Error>;

// =============================================================================
// Error Statistics (Debug/Development)
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> query_errors{0};
    std::atomic<std::uint64_t> task_pool_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<QueryError>()) {
        s_error_stats.query_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<TaskPoolError>()) {
        s_error_stats.task_pool_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.query_errors.store(0, std::memory_order_relaxed);
    s_error_stats.task_pool_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Query: " << s_error_stats.query_errors.load() << "\n"
        << "  TaskPool: " << s_error_stats.task_pool_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace quarry_core
