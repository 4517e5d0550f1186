#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for quarry_core module

#include <cstdint>

namespace quarry_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct QueryError;
struct TaskPoolError;
class Error;
class UsageError;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;

// =============================================================================
// Configuration
// =============================================================================

enum class ConfigLayerPriority : std::int32_t;
class ConfigLayer;
class ConfigManager;

} // namespace quarry_core
