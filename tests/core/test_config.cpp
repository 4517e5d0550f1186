// quarry_core ConfigManager tests

#include <catch2/catch_test_macros.hpp>
#include <quarry/core/config.hpp>
#include <quarry/core/log.hpp>
#include <string>
#include <vector>

using namespace quarry_core;

// =============================================================================
// Layering Tests
// =============================================================================

TEST_CASE("ConfigManager defaults", "[core][config]") {
    ConfigManager config;
    config.setup_defaults();

    REQUIRE(config.layer_count() == 5);
    REQUIRE(config.get_int(config_keys::TASKS_WORKER_THREADS, -1) == 0);
    REQUIRE(config.get_string(config_keys::TASKS_THREAD_NAME) == "quarry-compute");
    REQUIRE(config.get_int(config_keys::BATCHING_MIN_BATCH_SIZE) == 1);
    REQUIRE(config.get_int(config_keys::BATCHING_MAX_BATCH_SIZE, -1) == 0);
    REQUIRE(config.get_int(config_keys::BATCHING_BATCHES_PER_THREAD) == 1);
    REQUIRE(config.get_string(config_keys::LOG_LEVEL) == "info");
}

TEST_CASE("ConfigManager layer priority", "[core][config]") {
    ConfigManager config;
    config.setup_defaults();

    SECTION("user overrides defaults") {
        config.set_int(config_keys::BATCHING_MIN_BATCH_SIZE, 64);
        REQUIRE(config.get_int(config_keys::BATCHING_MIN_BATCH_SIZE) == 64);
    }

    SECTION("command line overrides user") {
        config.set_int(config_keys::TASKS_WORKER_THREADS, 2);
        auto result = config.parse_args(std::vector<std::string>{"--tasks.worker_threads=8"});
        REQUIRE(result.is_ok());
        REQUIRE(config.get_int(config_keys::TASKS_WORKER_THREADS) == 8);
    }

    SECTION("missing key falls back to the default argument") {
        REQUIRE(config.get_int("no.such.key", 17) == 17);
        REQUIRE_FALSE(config.contains("no.such.key"));
    }
}

TEST_CASE("ConfigManager parse_args", "[core][config]") {
    ConfigManager config;

    SECTION("separate value") {
        auto result = config.parse_args(std::vector<std::string>{"--batching.min_batch_size", "32"});
        REQUIRE(result.is_ok());
        REQUIRE(config.get_int(config_keys::BATCHING_MIN_BATCH_SIZE) == 32);
    }

    SECTION("dashes map to dots") {
        auto result = config.parse_args(std::vector<std::string>{"--batching-batches_per_thread=4"});
        REQUIRE(result.is_ok());
        REQUIRE(config.get_int(config_keys::BATCHING_BATCHES_PER_THREAD) == 4);
    }

    SECTION("bare flag is true") {
        auto result = config.parse_args(std::vector<std::string>{"--log.console"});
        REQUIRE(result.is_ok());
        REQUIRE(config.get_bool(config_keys::LOG_CONSOLE));
    }

    SECTION("positional argument is rejected") {
        auto result = config.parse_args(std::vector<std::string>{"stray"});
        REQUIRE(result.is_err());
        REQUIRE(result.error().code() == ErrorCode::InvalidArgument);
        REQUIRE(result.error().get_context("index") != nullptr);
    }
}

TEST_CASE("ConfigManager change callbacks", "[core][config]") {
    ConfigManager config;
    std::vector<std::string> changed;
    config.on_change([&](const std::string& key, const ConfigValue&) { changed.push_back(key); });

    config.set_int(config_keys::TASKS_WORKER_THREADS, 3);
    REQUIRE(changed.size() == 1);
    REQUIRE(changed[0] == config_keys::TASKS_WORKER_THREADS);
}

TEST_CASE("env_var_name", "[core][config]") {
    REQUIRE(env_var_name("QUARRY_", config_keys::TASKS_WORKER_THREADS) == "QUARRY_TASKS_WORKER_THREADS");
    REQUIRE(env_var_name("QUARRY_", config_keys::BATCHING_MIN_BATCH_SIZE) == "QUARRY_BATCHING_MIN_BATCH_SIZE");
}

// =============================================================================
// LogConfig
// =============================================================================

TEST_CASE("LogConfig from_config", "[core][config][log]") {
    ConfigManager config;
    config.setup_defaults();

    SECTION("defaults") {
        LogConfig log = LogConfig::from_config(config);
        REQUIRE(log.console_enabled);
        REQUIRE_FALSE(log.file_enabled);
        REQUIRE(log.level == spdlog::level::info);
    }

    SECTION("level override") {
        config.set_string(config_keys::LOG_LEVEL, "debug");
        REQUIRE(LogConfig::from_config(config).level == spdlog::level::debug);
    }

    SECTION("unknown level keeps the default") {
        config.set_string(config_keys::LOG_LEVEL, "loud");
        REQUIRE(LogConfig::from_config(config).level == spdlog::level::info);
    }
}
