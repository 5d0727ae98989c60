// src/config/session_config.cpp
#include "config/session_config.hpp"
#include "utils/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <fstream>

namespace config {

namespace {

// Present keys must convert; absent keys keep the fallback
template <typename T>
T read(const YAML::Node& node, const char* key, const T& fallback) {
    const YAML::Node v = node[key];
    if (!v || v.IsNull())
        return fallback;
    return v.as<T>();
}

} // namespace

SessionConfig SessionConfig::load(const std::string& yaml_path) {
    // Check if file exists
    std::ifstream file_check(yaml_path);
    if (!file_check.good()) {
        LOG_WARN("[SessionConfig] File not found: %s", yaml_path.c_str());
        LOG_WARN("[SessionConfig] Using default configuration");
        return get_default();
    }
    file_check.close();

    LOG_INFO("[SessionConfig] Loading session config from: %s", yaml_path.c_str());

    try {
        YAML::Node root = YAML::LoadFile(yaml_path);

        SessionConfig cfg = get_default();

        // ====================================================================
        // Session inputs / outputs
        // ====================================================================
        if (root["session"]) {
            auto s = root["session"];
            cfg.dbc_file = read<std::string>(s, "dbc_file", cfg.dbc_file);
            cfg.unit_mapping_file = read<std::string>(s, "unit_mapping_file", cfg.unit_mapping_file);
            cfg.log_dir = read<std::string>(s, "log_dir", cfg.log_dir);
            cfg.output_dir = read<std::string>(s, "output_dir", cfg.output_dir);
            cfg.platform = read<std::string>(s, "platform", cfg.platform);
            cfg.sensor = read<std::string>(s, "sensor", cfg.sensor);
            cfg.workers = read<int>(s, "workers", cfg.workers);
            cfg.log_level = read<std::string>(s, "log_level", cfg.log_level);
            cfg.log_file = read<std::string>(s, "log_file", cfg.log_file);
        }

        // ====================================================================
        // InfluxDB sink
        // ====================================================================
        if (root["influx"]) {
            auto in = root["influx"];
            cfg.influx.enabled = read<bool>(in, "enabled", cfg.influx.enabled);
            cfg.influx.url = read<std::string>(in, "url", cfg.influx.url);
            cfg.influx.token = read<std::string>(in, "token", cfg.influx.token);
            cfg.influx.org = read<std::string>(in, "org", cfg.influx.org);
            cfg.influx.bucket = read<std::string>(in, "bucket", cfg.influx.bucket);
            cfg.influx.measurement = read<std::string>(in, "measurement", cfg.influx.measurement);
            cfg.influx.batch_lines = read<size_t>(in, "batch_lines", cfg.influx.batch_lines);
        }

        cfg.validate();

        LOG_INFO("[SessionConfig] Successfully loaded: %s", yaml_path.c_str());
        return cfg;

    } catch (const YAML::Exception& e) {
        throw ConfigurationError(
            std::string("[SessionConfig] YAML parse error: ") + e.what()
        );
    }
}

SessionConfig SessionConfig::get_default() {
    return SessionConfig();
}

void SessionConfig::validate() const {
    if (dbc_file.empty()) {
        throw ConfigurationError("Invalid dbc_file: must not be empty");
    }
    if (unit_mapping_file.empty()) {
        throw ConfigurationError("Invalid unit_mapping_file: must not be empty");
    }
    if (platform.empty() || sensor.empty()) {
        throw ConfigurationError("Invalid provenance: platform and sensor must not be empty");
    }
    if (workers < 1 || workers > 64) {
        throw ConfigurationError("Invalid workers: must be 1 <= workers <= 64");
    }

    utils::LogLevel lvl;
    if (!utils::parse_level(log_level, lvl)) {
        throw ConfigurationError("Invalid log_level: " + log_level);
    }

    if (influx.enabled && influx.url.empty()) {
        throw ConfigurationError("Invalid influx.url: required when influx is enabled");
    }
    if (influx.batch_lines == 0) {
        throw ConfigurationError("Invalid influx.batch_lines: must be > 0");
    }

    LOG_DEBUG("[SessionConfig] Validation passed");
}

void SessionConfig::print_summary() const {
    LOG_INFO("========================================");
    LOG_INFO("Session Configuration Summary");
    LOG_INFO("========================================");
    LOG_INFO("DBC:          %s", dbc_file.c_str());
    LOG_INFO("Unit mapping: %s", unit_mapping_file.c_str());
    LOG_INFO("Logs:         %s", log_dir.c_str());
    LOG_INFO("Output:       %s", output_dir.c_str());
    LOG_INFO("Platform:     %s (sensor %s)", platform.c_str(), sensor.c_str());
    LOG_INFO("Workers:      %d", workers);
    LOG_INFO("InfluxDB:     %s", influx.enabled ? influx.url.c_str() : "disabled");
    LOG_INFO("========================================");
}

} // namespace config
