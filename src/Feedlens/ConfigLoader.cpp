// =================================================================
// src/Feedlens/ConfigLoader.cpp
// =================================================================
// Implementation for loading the orchestrator configuration from YAML.

#include "Feedlens/ConfigLoader.hpp"
#include "Feedlens/Errors.hpp"
#include "Feedlens/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>

namespace Feedlens {

namespace {

template<typename T>
void readValue(const YAML::Node& node, const char* key, T& target) {
    if (node[key]) {
        target = node[key].as<T>();
    }
}

template<typename Duration>
void readDuration(const YAML::Node& node, const char* key, Duration& target) {
    if (node[key]) {
        target = Duration(node[key].as<long>());
    }
}

template<size_t N>
void readArray(const YAML::Node& node, const char* key, std::array<size_t, N>& target) {
    if (!node[key]) {
        return;
    }
    YAML::Node list = node[key];
    if (!list.IsSequence() || list.size() != N) {
        throw ConfigError(std::string("'") + key + "' must be a list of " + std::to_string(N) + " values");
    }
    for (size_t i = 0; i < N; ++i) {
        target[i] = list[i].as<size_t>();
    }
}

} // anonymous namespace

OrchestratorConfig ConfigLoader::loadFromFile(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        Logger::getInstance().warning("ConfigLoader", "Configuration file not found, using defaults", path);
        OrchestratorConfig defaults;
        validate(defaults);
        return defaults;
    }
    
    OrchestratorConfig config;
    try {
        config = fromNode(YAML::LoadFile(path));
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse configuration file " + path + ": " + std::string(e.what()));
    }
    
    validate(config);
    Logger::getInstance().info("ConfigLoader", "Loaded configuration", path);
    return config;
}

OrchestratorConfig ConfigLoader::loadFromString(const std::string& yaml) {
    OrchestratorConfig config;
    try {
        config = fromNode(YAML::Load(yaml));
    } catch (const YAML::Exception& e) {
        throw ConfigError("Failed to parse configuration: " + std::string(e.what()));
    }
    
    validate(config);
    return config;
}

OrchestratorConfig ConfigLoader::fromNode(const YAML::Node& root) {
    OrchestratorConfig config;
    
    if (root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw ConfigError("Configuration root must be a mapping");
    }
    
    if (root["circuit_breaker"]) {
        YAML::Node node = root["circuit_breaker"];
        readValue(node, "failure_threshold", config.circuit.failure_threshold);
        readValue(node, "quota_failure_weight", config.circuit.quota_failure_weight);
        if (node["reset_timeout_seconds"]) {
            config.circuit.reset_timeout = std::chrono::seconds(node["reset_timeout_seconds"].as<long>());
        }
    }
    
    if (root["throttle"]) {
        YAML::Node node = root["throttle"];
        readDuration(node, "floor_ms", config.throttle.floor);
        readDuration(node, "ceiling_ms", config.throttle.ceiling);
        readDuration(node, "initial_interval_ms", config.throttle.initial_interval);
        readValue(node, "backoff_factor", config.throttle.backoff_factor);
        readValue(node, "quota_backoff_factor", config.throttle.quota_backoff_factor);
        readValue(node, "ease_factor", config.throttle.ease_factor);
        readDuration(node, "quota_cooldown_base_seconds", config.throttle.quota_cooldown_base);
        readDuration(node, "quota_cooldown_cap_seconds", config.throttle.quota_cooldown_cap);
    }
    
    if (root["batching"]) {
        YAML::Node node = root["batching"];
        readArray(node, "length_thresholds", config.batching.length_thresholds);
        readArray(node, "remote_batch_sizes", config.batching.remote_batch_sizes);
        readArray(node, "local_batch_sizes", config.batching.local_batch_sizes);
    }
    
    if (root["cache"]) {
        YAML::Node node = root["cache"];
        readValue(node, "sentiment_capacity", config.cache.sentiment_capacity);
        readValue(node, "insight_capacity", config.cache.insight_capacity);
        readValue(node, "summary_capacity", config.cache.summary_capacity);
        readValue(node, "long_text_threshold", config.cache.long_text_threshold);
        readValue(node, "key_prefix_length", config.cache.key_prefix_length);
        readDuration(node, "ttl_seconds", config.cache.ttl);
    }
    
    if (root["remote"]) {
        YAML::Node node = root["remote"];
        readValue(node, "server_url", config.remote.server_url);
        readValue(node, "endpoint", config.remote.endpoint);
        readValue(node, "model", config.remote.model);
        readValue(node, "enabled", config.remote.enabled);
        readValue(node, "max_concurrency", config.remote.max_concurrency);
        readDuration(node, "connect_timeout_ms", config.remote.connect_timeout);
        readDuration(node, "call_timeout_ms", config.remote.call_timeout);
    }
    
    if (root["routing"]) {
        YAML::Node node = root["routing"];
        readValue(node, "remote_sentiment", config.routing.remote_sentiment);
        readValue(node, "local_workers", config.routing.local_workers);
    }
    
    if (root["logging"]) {
        YAML::Node node = root["logging"];
        readValue(node, "log_dir", config.logging.log_dir);
        readValue(node, "console_level", config.logging.console_level);
        readValue(node, "file_level", config.logging.file_level);
        readValue(node, "console", config.logging.console_enabled);
        readValue(node, "file", config.logging.file_enabled);
        readValue(node, "max_file_size_mb", config.logging.max_file_size_mb);
        readValue(node, "max_files", config.logging.max_files);
    }
    
    return config;
}

void ConfigLoader::validate(const OrchestratorConfig& config) {
    // Circuit breaker
    if (config.circuit.failure_threshold == 0) {
        throw ConfigError("circuit_breaker.failure_threshold must be at least 1");
    }
    if (config.circuit.quota_failure_weight == 0) {
        throw ConfigError("circuit_breaker.quota_failure_weight must be at least 1");
    }
    if (config.circuit.reset_timeout.count() <= 0) {
        throw ConfigError("circuit_breaker.reset_timeout_seconds must be positive");
    }
    
    // Throttle
    const ThrottleConfig& throttle = config.throttle;
    if (throttle.floor.count() < 0 || throttle.floor > throttle.ceiling) {
        throw ConfigError("throttle.floor_ms must be between 0 and throttle.ceiling_ms");
    }
    if (throttle.initial_interval < throttle.floor || throttle.initial_interval > throttle.ceiling) {
        throw ConfigError("throttle.initial_interval_ms must lie within [floor_ms, ceiling_ms]");
    }
    if (throttle.backoff_factor < 1.0 || throttle.quota_backoff_factor < 1.0) {
        throw ConfigError("throttle backoff factors must be at least 1.0");
    }
    if (throttle.ease_factor <= 0.0 || throttle.ease_factor > 1.0) {
        throw ConfigError("throttle.ease_factor must be in (0, 1]");
    }
    if (throttle.quota_cooldown_base.count() <= 0 || throttle.quota_cooldown_base > throttle.quota_cooldown_cap) {
        throw ConfigError("throttle quota cooldown base must be positive and not exceed the cap");
    }
    
    // Batching
    const BatchPlannerConfig& batching = config.batching;
    for (size_t i = 1; i < batching.length_thresholds.size(); ++i) {
        if (batching.length_thresholds[i] <= batching.length_thresholds[i - 1]) {
            throw ConfigError("batching.length_thresholds must be strictly increasing");
        }
    }
    auto check_sizes = [](const std::array<size_t, 4>& sizes, const std::string& name) {
        for (size_t i = 0; i < sizes.size(); ++i) {
            if (sizes[i] == 0) {
                throw ConfigError("batching." + name + " entries must be at least 1");
            }
            if (i > 0 && sizes[i] > sizes[i - 1]) {
                throw ConfigError("batching." + name + " must not increase with text length");
            }
        }
    };
    check_sizes(batching.remote_batch_sizes, "remote_batch_sizes");
    check_sizes(batching.local_batch_sizes, "local_batch_sizes");
    
    // Cache
    if (config.cache.sentiment_capacity == 0 || config.cache.insight_capacity == 0 ||
        config.cache.summary_capacity == 0) {
        throw ConfigError("cache capacities must be at least 1");
    }
    if (config.cache.key_prefix_length > config.cache.long_text_threshold) {
        throw ConfigError("cache.key_prefix_length must not exceed cache.long_text_threshold");
    }
    if (config.cache.ttl.count() < 0) {
        throw ConfigError("cache.ttl_seconds must not be negative");
    }
    
    // Remote
    if (config.remote.max_concurrency == 0) {
        throw ConfigError("remote.max_concurrency must be at least 1");
    }
    if (config.remote.call_timeout.count() <= 0 || config.remote.connect_timeout.count() <= 0) {
        throw ConfigError("remote timeouts must be positive");
    }
    if (config.remote.enabled && config.remote.server_url.empty()) {
        throw ConfigError("remote.server_url is required when the remote service is enabled");
    }
    
    // Logging
    if (!Logger::parseLevel(config.logging.console_level) || !Logger::parseLevel(config.logging.file_level)) {
        throw ConfigError("logging levels must be one of DEBUG, INFO, WARNING, ERROR, CRITICAL");
    }
}

} // namespace Feedlens
