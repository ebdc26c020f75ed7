#include "core/Config.hpp"
#include "core/Errors.hpp"

namespace securewatch {

namespace {

template<typename T>
void Read(const YAML::Node& section, const char* key, T& target) {
    if (section && section[key]) {
        target = section[key].as<T>();
    }
}

} // namespace

AppConfig ParseConfig(const YAML::Node& root) {
    AppConfig config;

    if (root && !root.IsMap() && !root.IsNull()) {
        throw ConfigError("configuration root must be a mapping");
    }

    try {
        auto pipeline = root["pipeline"];
        Read(pipeline, "worker_threads", config.engine.pipeline.worker_threads);
        Read(pipeline, "queue_capacity", config.engine.pipeline.queue_capacity);

        auto windows = root["windows"];
        Read(windows, "shard_count", config.engine.windows.shard_count);
        Read(windows, "max_windows_per_rule", config.engine.windows.max_windows_per_rule);
        Read(windows, "sweep_interval_ms", config.engine.windows.sweep_interval_ms);

        auto scoring = root["scoring"];
        Read(scoring, "default_base_confidence", config.engine.scoring.default_base_confidence);
        Read(scoring, "threshold_ratio_max_bonus", config.engine.scoring.threshold_ratio_max_bonus);
        Read(scoring, "threat_intel_bonus", config.engine.scoring.threat_intel_bonus);
        Read(scoring, "threat_intel_fields", config.engine.scoring.threat_intel_fields);

        auto dedup = root["deduplication"];
        Read(dedup, "suppression_interval_ms", config.engine.deduplication.suppression_interval_ms);
        Read(dedup, "match_key_retention_ms", config.engine.deduplication.match_key_retention_ms);

        auto emit = root["emit"];
        Read(emit, "max_attempts", config.engine.emit.max_attempts);
        Read(emit, "initial_backoff_ms", config.engine.emit.initial_backoff_ms);
        Read(emit, "max_backoff_ms", config.engine.emit.max_backoff_ms);

        auto logging = root["logging"];
        Read(logging, "file_path", config.logging.file_path);
        Read(logging, "max_file_size", config.logging.max_file_size);
        Read(logging, "max_files", config.logging.max_files);
        if (logging && logging["level"]) {
            std::string level = logging["level"].as<std::string>();
            if (!ParseLogLevel(level, config.logging.level)) {
                throw ConfigError("unknown logging.level '" + level + "'");
            }
        }

        auto persistence = root["persistence"];
        Read(persistence, "enabled", config.persistence.enabled);
        Read(persistence, "database_path", config.persistence.database_path);

        auto rules = root["rules"];
        Read(rules, "path", config.rules_path);

        auto incidents = root["incidents"];
        Read(incidents, "directory", config.incidents_dir);
        Read(incidents, "resolved_retention_ms", config.incident_retention_ms);
    } catch (const YAML::Exception& ex) {
        throw ConfigError(std::string("invalid configuration value: ") + ex.what());
    }

    ValidateConfig(config);
    return config;
}

AppConfig LoadConfig(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& ex) {
        throw ConfigError("failed to load " + path + ": " + ex.what());
    }
    return ParseConfig(root);
}

void ValidateConfig(const AppConfig& config) {
    const auto& engine = config.engine;

    if (engine.pipeline.worker_threads == 0) {
        throw ConfigError("pipeline.worker_threads must be at least 1");
    }
    if (engine.pipeline.queue_capacity == 0) {
        throw ConfigError("pipeline.queue_capacity must be at least 1");
    }
    if (engine.windows.shard_count == 0) {
        throw ConfigError("windows.shard_count must be at least 1");
    }
    if (engine.windows.max_windows_per_rule == 0) {
        throw ConfigError("windows.max_windows_per_rule must be at least 1");
    }
    if (engine.windows.sweep_interval_ms == 0) {
        throw ConfigError("windows.sweep_interval_ms must be positive");
    }
    if (engine.scoring.default_base_confidence > 100) {
        throw ConfigError("scoring.default_base_confidence must be within 0-100");
    }
    if (engine.scoring.threshold_ratio_max_bonus > 100 || engine.scoring.threat_intel_bonus > 100) {
        throw ConfigError("scoring bonuses must be within 0-100");
    }
    if (engine.emit.max_attempts == 0) {
        throw ConfigError("emit.max_attempts must be at least 1");
    }
    if (engine.emit.max_backoff_ms < engine.emit.initial_backoff_ms) {
        throw ConfigError("emit.max_backoff_ms must not be below emit.initial_backoff_ms");
    }
    if (config.persistence.enabled && config.persistence.database_path.empty()) {
        throw ConfigError("persistence.database_path is required when persistence is enabled");
    }
}

} // namespace securewatch
