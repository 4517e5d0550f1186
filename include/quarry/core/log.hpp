#pragma once

/// @file log.hpp
/// @brief Logging utilities for quarry

#include "fwd.hpp"
#include <spdlog/spdlog.h>
#include <string>
#include <memory>
#include <optional>

namespace quarry_core {

// =============================================================================
// Basic Logging (Inline)
// =============================================================================

/// @brief Initialize the default logger pattern and level
inline void init_logging() {
    spdlog::set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
}

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the logging system
struct LogConfig {
    bool console_enabled = true;
    bool file_enabled = false;
    std::string log_directory;
    std::size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    std::size_t max_files = 5;
    spdlog::level::level_enum level = spdlog::level::info;

    /// Read `log.*` keys; unknown level names keep the default
    [[nodiscard]] static LogConfig from_config(const ConfigManager& config);
};

/// Configure logging system with full options
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Core module logger ("quarry_core")
std::shared_ptr<spdlog::logger> core_logger();

/// Entity store and query logger ("quarry_ecs")
std::shared_ptr<spdlog::logger> ecs_logger();

/// Worker pool logger ("quarry_tasks")
std::shared_ptr<spdlog::logger> tasks_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Set global log level
void set_global_log_level(spdlog::level::level_enum level);

/// Set log level for specific logger
void set_logger_level(const std::string& name, spdlog::level::level_enum level);

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Lifecycle
// =============================================================================

/// Flush all loggers
void flush_all_loggers();

/// Shutdown logging system
void shutdown_logging();

} // namespace quarry_core
