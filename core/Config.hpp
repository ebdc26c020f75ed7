#pragma once

#include "core/Logger.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdint>
#include <string>
#include <vector>

namespace securewatch {

struct PipelineConfig {
    size_t worker_threads = 4;
    size_t queue_capacity = 10000;
};

struct WindowConfig {
    size_t shard_count = 16;
    size_t max_windows_per_rule = 10000;
    uint64_t sweep_interval_ms = 2000;
};

struct ScoringConfig {
    uint32_t default_base_confidence = 50;
    uint32_t threshold_ratio_max_bonus = 20;
    uint32_t threat_intel_bonus = 15;
    std::vector<std::string> threat_intel_fields{"threat_intel_hit", "threat_intel.match"};
};

struct DeduplicationConfig {
    uint64_t suppression_interval_ms = 300000;
    uint64_t match_key_retention_ms = 3600000;
};

struct EmitConfig {
    uint32_t max_attempts = 3;
    uint64_t initial_backoff_ms = 100;
    uint64_t max_backoff_ms = 2000;
};

struct LoggingConfig {
    std::string file_path = "logs/securewatch.log";
    LogLevel level = LogLevel::INFO;
    size_t max_file_size = 10 * 1024 * 1024;
    size_t max_files = 5;
};

struct PersistenceConfig {
    bool enabled = false;
    std::string database_path = "data/securewatch.db";
};

struct EngineConfig {
    PipelineConfig pipeline;
    WindowConfig windows;
    ScoringConfig scoring;
    DeduplicationConfig deduplication;
    EmitConfig emit;
};

struct AppConfig {
    EngineConfig engine;
    LoggingConfig logging;
    PersistenceConfig persistence;
    std::string rules_path = "config/rules.yaml";
    std::string incidents_dir;              // empty disables incident files
    uint64_t incident_retention_ms = 86400000;  // resolved incidents kept in memory
};

// Loaders throw ConfigError on unreadable files, type mismatches or values
// outside their valid range. Missing keys keep their defaults.
AppConfig LoadConfig(const std::string& path);
AppConfig ParseConfig(const YAML::Node& root);
void ValidateConfig(const AppConfig& config);

} // namespace securewatch
