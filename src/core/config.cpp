/// @file config.cpp
/// @brief Layered configuration implementation for quarry_core

#include <quarry/core/config.hpp>
#include <quarry/core/log.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace quarry_core {

namespace {

/// Interpret a textual argument as bool, integer, float or string
ConfigValue infer_value(const std::string& value) {
    if (value == "true" || value == "false") {
        return ConfigValue{value == "true"};
    }

    std::int64_t int_val = 0;
    auto [int_end, int_ec] = std::from_chars(value.data(), value.data() + value.size(), int_val);
    if (int_ec == std::errc{} && int_end == value.data() + value.size() && !value.empty()) {
        return ConfigValue{int_val};
    }

    char* float_end = nullptr;
    double float_val = std::strtod(value.c_str(), &float_end);
    if (!value.empty() && float_end == value.c_str() + value.size()) {
        return ConfigValue{float_val};
    }

    return ConfigValue{value};
}

} // anonymous namespace

// =============================================================================
// ConfigLayer
// =============================================================================

bool ConfigLayer::contains(const std::string& key) const {
    return m_values.find(key) != m_values.end();
}

std::optional<ConfigValue> ConfigLayer::get(const std::string& key) const {
    auto it = m_values.find(key);
    if (it != m_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

void ConfigLayer::set(const std::string& key, ConfigValue value) {
    m_values[key] = std::move(value);
}

bool ConfigLayer::remove(const std::string& key) {
    return m_values.erase(key) > 0;
}

void ConfigLayer::clear() {
    m_values.clear();
}

std::vector<std::string> ConfigLayer::keys() const {
    std::vector<std::string> result;
    result.reserve(m_values.size());
    for (const auto& [key, _] : m_values) {
        result.push_back(key);
    }
    return result;
}

// =============================================================================
// ConfigManager
// =============================================================================

void ConfigManager::add_layer(std::unique_ptr<ConfigLayer> layer) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_layers.push_back(std::move(layer));
}

ConfigLayer* ConfigManager::get_layer(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    return nullptr;
}

const ConfigLayer* ConfigManager::get_layer(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    return nullptr;
}

bool ConfigManager::remove_layer(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = std::remove_if(m_layers.begin(), m_layers.end(),
        [&name](const std::unique_ptr<ConfigLayer>& layer) {
            return layer->name() == name;
        });
    if (it != m_layers.end()) {
        m_layers.erase(it, m_layers.end());
        return true;
    }
    return false;
}

std::size_t ConfigManager::layer_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_layers.size();
}

bool ConfigManager::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& layer : m_layers) {
        if (layer->contains(key)) {
            return true;
        }
    }
    return false;
}

std::optional<ConfigValue> ConfigManager::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto* layer : sorted_layers()) {
        auto value = layer->get(key);
        if (value) {
            return value;
        }
    }
    return std::nullopt;
}

bool ConfigManager::get_bool(const std::string& key, bool default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<bool>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        if (*v == "true" || *v == "1" || *v == "yes" || *v == "on") return true;
        if (*v == "false" || *v == "0" || *v == "no" || *v == "off") return false;
        return default_value;
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v != 0;
    }

    return default_value;
}

std::int64_t ConfigManager::get_int(const std::string& key, std::int64_t default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        std::int64_t parsed = 0;
        auto [end, ec] = std::from_chars(v->data(), v->data() + v->size(), parsed);
        if (ec == std::errc{} && end == v->data() + v->size()) {
            return parsed;
        }
        return default_value;
    }
    if (auto* v = std::get_if<double>(&*value)) {
        return static_cast<std::int64_t>(*v);
    }
    if (auto* v = std::get_if<bool>(&*value)) {
        return *v ? 1 : 0;
    }

    return default_value;
}

double ConfigManager::get_float(const std::string& key, double default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<double>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return static_cast<double>(*v);
    }
    if (auto* v = std::get_if<std::string>(&*value)) {
        char* end = nullptr;
        double parsed = std::strtod(v->c_str(), &end);
        if (!v->empty() && end == v->c_str() + v->size()) {
            return parsed;
        }
        return default_value;
    }

    return default_value;
}

std::string ConfigManager::get_string(const std::string& key, const std::string& default_value) const {
    auto value = get(key);
    if (!value) return default_value;

    if (auto* v = std::get_if<std::string>(&*value)) {
        return *v;
    }
    if (auto* v = std::get_if<bool>(&*value)) {
        return *v ? "true" : "false";
    }
    if (auto* v = std::get_if<std::int64_t>(&*value)) {
        return std::to_string(*v);
    }
    if (auto* v = std::get_if<double>(&*value)) {
        return std::to_string(*v);
    }

    return default_value;
}

void ConfigManager::set(const std::string& key, ConfigValue value, const std::string& layer_name) {
    std::vector<ChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ConfigLayer* target = nullptr;
        for (auto& layer : m_layers) {
            if (layer->name() == layer_name) {
                target = layer.get();
                break;
            }
        }
        if (!target) {
            m_layers.push_back(std::make_unique<ConfigLayer>(layer_name));
            target = m_layers.back().get();
        }
        target->set(key, value);
        callbacks = m_change_callbacks;
    }

    for (const auto& callback : callbacks) {
        callback(key, value);
    }
}

void ConfigManager::set_bool(const std::string& key, bool value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

void ConfigManager::set_int(const std::string& key, std::int64_t value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

void ConfigManager::set_float(const std::string& key, double value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

void ConfigManager::set_string(const std::string& key, const std::string& value, const std::string& layer_name) {
    set(key, ConfigValue{value}, layer_name);
}

Result<void> ConfigManager::parse_args(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return parse_args(args);
}

Result<void> ConfigManager::parse_args(const std::vector<std::string>& args) {
    ConfigLayer* layer = find_or_create_layer("cmdline", ConfigLayerPriority::CommandLine);

    for (std::size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (!arg.starts_with("--")) {
            return Err(Error(ErrorCode::InvalidArgument, "Unexpected argument: " + arg)
                .with_context("index", std::to_string(i)));
        }

        std::string key_value = arg.substr(2);
        if (key_value.empty()) {
            return Err(Error(ErrorCode::InvalidArgument, "Empty option name"));
        }

        auto eq_pos = key_value.find('=');
        std::string key;
        std::string value;

        if (eq_pos != std::string::npos) {
            key = key_value.substr(0, eq_pos);
            value = key_value.substr(eq_pos + 1);
        } else if (i + 1 < args.size() && !args[i + 1].starts_with("-")) {
            key = key_value;
            value = args[++i];
        } else {
            key = key_value;
            value = "true";
        }

        // --tasks-worker_threads -> tasks.worker_threads
        std::replace(key.begin(), key.end(), '-', '.');

        ConfigValue parsed = infer_value(value);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            layer->set(key, parsed);
        }
        notify_change(key, parsed);
    }

    return Ok();
}

void ConfigManager::load_environment(const std::string& prefix) {
    ConfigLayer* layer = find_or_create_layer("environment", ConfigLayerPriority::Environment);

    for (const char* key : config_keys::ALL) {
        std::string env_name = env_var_name(prefix, key);
        const char* value = std::getenv(env_name.c_str());
        if (!value) {
            continue;
        }

        ConfigValue parsed = infer_value(value);
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            layer->set(key, parsed);
        }
        core_logger()->debug("config: {} from {}", key, env_name);
        notify_change(key, parsed);
    }
}

void ConfigManager::on_change(ChangeCallback callback) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_change_callbacks.push_back(std::move(callback));
}

void ConfigManager::setup_defaults() {
    create_default_layers();

    auto* defaults = get_layer("defaults");
    if (!defaults) return;

    std::lock_guard<std::mutex> lock(m_mutex);

    // 0 selects the hardware concurrency
    defaults->set(config_keys::TASKS_WORKER_THREADS, ConfigValue{std::int64_t(0)});
    defaults->set(config_keys::TASKS_THREAD_NAME, ConfigValue{std::string("quarry-compute")});

    // 0 leaves the corresponding bound open
    defaults->set(config_keys::BATCHING_MIN_BATCH_SIZE, ConfigValue{std::int64_t(1)});
    defaults->set(config_keys::BATCHING_MAX_BATCH_SIZE, ConfigValue{std::int64_t(0)});
    defaults->set(config_keys::BATCHING_BATCHES_PER_THREAD, ConfigValue{std::int64_t(1)});

    defaults->set(config_keys::LOG_LEVEL, ConfigValue{std::string("info")});
    defaults->set(config_keys::LOG_CONSOLE, ConfigValue{true});
    defaults->set(config_keys::LOG_FILE_ENABLED, ConfigValue{false});
    defaults->set(config_keys::LOG_DIRECTORY, ConfigValue{std::string("logs")});
}

void ConfigManager::create_default_layers() {
    (void)find_or_create_layer("cmdline", ConfigLayerPriority::CommandLine);
    (void)find_or_create_layer("environment", ConfigLayerPriority::Environment);
    (void)find_or_create_layer("user", ConfigLayerPriority::User);
    (void)find_or_create_layer("project", ConfigLayerPriority::Project);
    (void)find_or_create_layer("defaults", ConfigLayerPriority::Default);
}

ConfigLayer* ConfigManager::find_or_create_layer(const std::string& name, ConfigLayerPriority priority) {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& layer : m_layers) {
        if (layer->name() == name) {
            return layer.get();
        }
    }
    m_layers.push_back(std::make_unique<ConfigLayer>(name, priority));
    return m_layers.back().get();
}

std::vector<ConfigLayer*> ConfigManager::sorted_layers() const {
    std::vector<ConfigLayer*> result;
    for (const auto& layer : m_layers) {
        result.push_back(layer.get());
    }

    // Lower value = higher priority; ties keep insertion order
    std::stable_sort(result.begin(), result.end(),
        [](const ConfigLayer* a, const ConfigLayer* b) {
            return static_cast<int>(a->priority()) < static_cast<int>(b->priority());
        });

    return result;
}

void ConfigManager::notify_change(const std::string& key, const ConfigValue& value) {
    std::vector<ChangeCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        callbacks = m_change_callbacks;
    }
    for (const auto& callback : callbacks) {
        callback(key, value);
    }
}

std::string env_var_name(const std::string& prefix, const std::string& key) {
    std::string name = prefix;
    name.reserve(prefix.size() + key.size());
    for (char c : key) {
        if (c == '.' || c == '-') {
            name.push_back('_');
        } else {
            name.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
        }
    }
    return name;
}

} // namespace quarry_core
