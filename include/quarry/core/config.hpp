/// @file config.hpp
/// @brief Layered configuration for quarry
///
/// Values resolve from the highest priority layer holding the key:
/// command line, environment, user, project, built-in defaults.

#pragma once

#include "fwd.hpp"
#include "error.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace quarry_core {

/// Configuration value
using ConfigValue = std::variant<
    bool,
    std::int64_t,
    double,
    std::string,
    std::vector<std::string>
>;

// =============================================================================
// Config Layer
// =============================================================================

/// Configuration layer priority (lower = higher priority)
enum class ConfigLayerPriority : std::int32_t {
    CommandLine = -1000,    ///< Command-line arguments (highest)
    Environment = -500,     ///< Environment variables
    User = 0,               ///< Values set at runtime
    Project = 100,          ///< Application supplied values
    Default = 1000,         ///< Built-in defaults (lowest)
};

/// A configuration layer
class ConfigLayer {
public:
    explicit ConfigLayer(const std::string& name, ConfigLayerPriority priority = ConfigLayerPriority::User)
        : m_name(name), m_priority(priority) {}

    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] ConfigLayerPriority priority() const { return m_priority; }

    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;
    void set(const std::string& key, ConfigValue value);
    bool remove(const std::string& key);
    void clear();

    [[nodiscard]] std::vector<std::string> keys() const;
    [[nodiscard]] std::size_t size() const { return m_values.size(); }
    [[nodiscard]] bool empty() const { return m_values.empty(); }

private:
    std::string m_name;
    ConfigLayerPriority m_priority;
    std::map<std::string, ConfigValue> m_values;
};

// =============================================================================
// Config Manager
// =============================================================================

/// Layered configuration manager
class ConfigManager {
public:
    using ChangeCallback = std::function<void(const std::string& key, const ConfigValue& value)>;

    ConfigManager() = default;
    ~ConfigManager() = default;

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

    // =========================================================================
    // Layer Management
    // =========================================================================

    void add_layer(std::unique_ptr<ConfigLayer> layer);

    [[nodiscard]] ConfigLayer* get_layer(const std::string& name);
    [[nodiscard]] const ConfigLayer* get_layer(const std::string& name) const;

    bool remove_layer(const std::string& name);

    [[nodiscard]] std::size_t layer_count() const;

    // =========================================================================
    // Value Access (Merged View)
    // =========================================================================

    [[nodiscard]] bool contains(const std::string& key) const;

    /// Get value from the highest priority layer that contains it
    [[nodiscard]] std::optional<ConfigValue> get(const std::string& key) const;

    [[nodiscard]] bool get_bool(const std::string& key, bool default_value = false) const;
    [[nodiscard]] std::int64_t get_int(const std::string& key, std::int64_t default_value = 0) const;
    [[nodiscard]] double get_float(const std::string& key, double default_value = 0.0) const;
    [[nodiscard]] std::string get_string(const std::string& key, const std::string& default_value = "") const;

    // =========================================================================
    // Value Setting
    // =========================================================================

    /// Set value in a named layer (created at User priority if missing)
    void set(const std::string& key, ConfigValue value, const std::string& layer_name = "user");

    void set_bool(const std::string& key, bool value, const std::string& layer_name = "user");
    void set_int(const std::string& key, std::int64_t value, const std::string& layer_name = "user");
    void set_float(const std::string& key, double value, const std::string& layer_name = "user");
    void set_string(const std::string& key, const std::string& value, const std::string& layer_name = "user");

    // =========================================================================
    // Command Line / Environment
    // =========================================================================

    /// Parse `--key=value`, `--key value` and `--flag`; dashes in keys map to dots
    Result<void> parse_args(int argc, char** argv);
    Result<void> parse_args(const std::vector<std::string>& args);

    /// Load the known `config_keys` from `<prefix><KEY_IN_UPPER_SNAKE>` variables
    void load_environment(const std::string& prefix = "QUARRY_");

    // =========================================================================
    // Events / Defaults
    // =========================================================================

    void on_change(ChangeCallback callback);

    /// Create the standard layers and fill the defaults layer
    void setup_defaults();

    /// Create default layers (cmdline, environment, user, project, defaults)
    void create_default_layers();

private:
    [[nodiscard]] ConfigLayer* find_or_create_layer(const std::string& name, ConfigLayerPriority priority);
    [[nodiscard]] std::vector<ConfigLayer*> sorted_layers() const;
    void notify_change(const std::string& key, const ConfigValue& value);

private:
    std::vector<std::unique_ptr<ConfigLayer>> m_layers;
    mutable std::mutex m_mutex;
    std::vector<ChangeCallback> m_change_callbacks;
};

/// Convert a dotted key to its environment variable name (`tasks.worker_threads` -> `QUARRY_TASKS_WORKER_THREADS`)
[[nodiscard]] std::string env_var_name(const std::string& prefix, const std::string& key);

// =============================================================================
// Config Keys (Constants)
// =============================================================================

namespace config_keys {

// Worker pool
constexpr const char* TASKS_WORKER_THREADS = "tasks.worker_threads";
constexpr const char* TASKS_THREAD_NAME = "tasks.thread_name";

// Parallel iteration batching
constexpr const char* BATCHING_MIN_BATCH_SIZE = "batching.min_batch_size";
constexpr const char* BATCHING_MAX_BATCH_SIZE = "batching.max_batch_size";
constexpr const char* BATCHING_BATCHES_PER_THREAD = "batching.batches_per_thread";

// Logging
constexpr const char* LOG_LEVEL = "log.level";
constexpr const char* LOG_CONSOLE = "log.console";
constexpr const char* LOG_FILE_ENABLED = "log.file_enabled";
constexpr const char* LOG_DIRECTORY = "log.directory";

/// Every key above, in declaration order
inline constexpr const char* ALL[] = {
    TASKS_WORKER_THREADS, TASKS_THREAD_NAME,
    BATCHING_MIN_BATCH_SIZE, BATCHING_MAX_BATCH_SIZE, BATCHING_BATCHES_PER_THREAD,
    LOG_LEVEL, LOG_CONSOLE, LOG_FILE_ENABLED, LOG_DIRECTORY,
};

} // namespace config_keys

} // namespace quarry_core
