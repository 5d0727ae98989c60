// src/config/session_config.hpp
#pragma once

#include <string>

#include "config/config_error.hpp"
#include "utils/influx.hpp"

namespace config {

/**
 * SessionConfig - Paths and provenance settings for one decoding session
 *
 * Usage:
 *   auto cfg = SessionConfig::load("config/session.yaml");
 *   auto session = kg::DecodeSession::open(cfg, sink);
 *
 * Falls back to defaults if the file is not found.
 */
class SessionConfig {
public:
    std::string dbc_file = "DBC/vehicle.dbc";
    std::string unit_mapping_file = "config/unit_mapping.json";

    // Root of recorded bus logs (<log_dir>/**/<sensor>.csv)
    std::string log_dir = "raw";

    // Catalog tables and signallog.csv are written here
    std::string output_dir = "owl";

    // Provenance attached to every record
    std::string platform = "can2";
    std::string sensor = "can2_sniffer";

    int workers = 1;

    std::string log_level = "info";
    std::string log_file = "";

    utils::InfluxWriter::Config influx;

    /**
     * Load session config from YAML file
     * @param yaml_path Path to YAML file (e.g., "config/session.yaml")
     * @return SessionConfig with loaded values
     * @throws ConfigurationError if file exists but is invalid
     *
     * If file doesn't exist, returns default configuration with warning.
     */
    static SessionConfig load(const std::string& yaml_path);

    static SessionConfig get_default();

    /**
     * Validate values
     * @throws ConfigurationError if any value is invalid
     */
    void validate() const;

    void print_summary() const;
};

} // namespace config
