#pragma once

/// @file error.hpp
/// @brief Error handling types for quarry_core
///
/// Two kinds of failure exist:
/// - recoverable failures travel as `Result<T>` carrying an `Error`
/// - precondition violations (borrow conflicts, an uninitialized pool,
///   structural changes during iteration) are raised as `UsageError`

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace quarry_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    Conflict,
    NotInitialized,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::Conflict: return "Conflict";
        case ErrorCode::NotInitialized: return "NotInitialized";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Query and world access errors
struct QueryError {
    enum class Kind : std::uint8_t {
        AccessConflict,     // Overlapping shared/exclusive borrow
        DuplicateEntity,    // Entity repeated in a set that must be unique
        StructuralChange,   // World layout changed while borrowed
        InvalidQuery,       // Query terms contradict each other
    };

    Kind kind;
    std::string message;
    std::string component;  // For AccessConflict / InvalidQuery
    std::string entity;     // For DuplicateEntity

    [[nodiscard]] static QueryError access_conflict(const std::string& component_name, const std::string& detail) {
        return QueryError{Kind::AccessConflict,
            "Access conflict on '" + component_name + "': " + detail, component_name, {}};
    }

    [[nodiscard]] static QueryError duplicate_entity(const std::string& entity_name) {
        return QueryError{Kind::DuplicateEntity, "Duplicate entity: " + entity_name, {}, entity_name};
    }

    [[nodiscard]] static QueryError structural_change(const std::string& operation) {
        return QueryError{Kind::StructuralChange,
            "Cannot " + operation + " while queries hold borrows", {}, {}};
    }

    [[nodiscard]] static QueryError invalid_query(const std::string& component_name, const std::string& reason) {
        return QueryError{Kind::InvalidQuery,
            "Invalid query on '" + component_name + "': " + reason, component_name, {}};
    }
};

/// Worker pool errors
struct TaskPoolError {
    enum class Kind : std::uint8_t {
        NotInitialized,     // Pool accessed before init()
        InvalidConfig,      // Configuration rejected
    };

    Kind kind;
    std::string message;
    std::string pool;

    [[nodiscard]] static TaskPoolError not_initialized(const std::string& pool_name) {
        return TaskPoolError{Kind::NotInitialized,
            pool_name + " is not initialized; call " + pool_name + "::init() at startup", pool_name};
    }

    [[nodiscard]] static TaskPoolError invalid_config(const std::string& pool_name, const std::string& reason) {
        return TaskPoolError{Kind::InvalidConfig, pool_name + ": " + reason, pool_name};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        QueryError,
        TaskPoolError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(QueryError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(TaskPoolError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(QueryError::Kind kind) {
        switch (kind) {
            case QueryError::Kind::AccessConflict: return ErrorCode::Conflict;
            case QueryError::Kind::DuplicateEntity: return ErrorCode::AlreadyExists;
            case QueryError::Kind::StructuralChange: return ErrorCode::InvalidState;
            case QueryError::Kind::InvalidQuery: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(TaskPoolError::Kind kind) {
        switch (kind) {
            case TaskPoolError::Kind::NotInitialized: return ErrorCode::NotInitialized;
            case TaskPoolError::Kind::InvalidConfig: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// UsageError
// =============================================================================

/// Thrown on programmer misuse. Never meant to be handled as a contingency.
class UsageError : public std::logic_error {
public:
    explicit UsageError(Error error)
        : std::logic_error(error.message())
        , m_error(std::move(error)) {}

    [[nodiscard]] const Error& error() const noexcept { return m_error; }
    [[nodiscard]] ErrorCode code() const noexcept { return m_error.code(); }

private:
    Error m_error;
};

/// Log the error at critical level on `logger_name`, then throw it as UsageError
[[noreturn]] void fail_usage(Error error, const char* logger_name = "quarry_core");

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    explicit operator bool() const noexcept { return m_value.has_value(); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() : m_has_value(true) {}
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace quarry_core
