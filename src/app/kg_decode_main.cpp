// src/app/kg_decode_main.cpp
// Decodes recorded CAN logs against a DBC catalog and writes the
// knowledge-graph tables plus the signal log.
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <string>
#include <vector>
#include <getopt.h>

#include "can/frame_log_reader.hpp"
#include "config/session_config.hpp"
#include "dbc/dbc_parser.hpp"
#include "kg/catalog_exporter.hpp"
#include "kg/decode_session.hpp"
#include "kg/record_emitter.hpp"
#include "kg/signal_log_writer.hpp"
#include "units/warning_sink.hpp"
#include "utils/influx.hpp"
#include "utils/logging.hpp"

namespace {

// Command-line values win over the YAML file
struct Overrides {
    std::string dbc_file;
    std::string unit_mapping_file;
    std::string log_dir;
    std::string output_dir;
    int workers = 0;
    bool influx = false;
    bool verbose = false;
};

void print_usage(const char* prog_name) {
    printf("Usage: %s [options]\n", prog_name);
    printf("\nOptions:\n");
    printf("  --config PATH     Session YAML (default: config/session.yaml)\n");
    printf("  --dbc PATH        DBC file (default: from config)\n");
    printf("  --units PATH      Unit mapping JSON (default: from config)\n");
    printf("  --logs DIR        Directory of recorded CSV logs (default: from config)\n");
    printf("  --out DIR         Output directory (default: from config)\n");
    printf("  --workers N       Decoder threads, 1..64 (default: from config)\n");
    printf("  --influx          Also write records to InfluxDB\n");
    printf("  --verbose         Debug logging\n");
    printf("  --help, -h        Show this help\n");
    printf("\nExamples:\n");
    printf("  %s --config config/session.yaml\n", prog_name);
    printf("  %s --dbc DBC/vehicle.dbc --logs raw --out owl --workers 4\n\n", prog_name);
}

void apply(const Overrides& o, config::SessionConfig& cfg) {
    if (!o.dbc_file.empty()) cfg.dbc_file = o.dbc_file;
    if (!o.unit_mapping_file.empty()) cfg.unit_mapping_file = o.unit_mapping_file;
    if (!o.log_dir.empty()) cfg.log_dir = o.log_dir;
    if (!o.output_dir.empty()) cfg.output_dir = o.output_dir;
    if (o.workers > 0) cfg.workers = o.workers;
    if (o.influx) cfg.influx.enabled = true;
    if (o.verbose) cfg.log_level = "debug";
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path = "config/session.yaml";
    Overrides ov;

    // ========================================================================
    // Command-line parsing
    // ========================================================================
    static struct option long_options[] = {
        {"config",  required_argument, 0, 'c'},
        {"dbc",     required_argument, 0, 'd'},
        {"units",   required_argument, 0, 'u'},
        {"logs",    required_argument, 0, 'l'},
        {"out",     required_argument, 0, 'o'},
        {"workers", required_argument, 0, 'w'},
        {"influx",  no_argument,       0, 'I'},
        {"verbose", no_argument,       0, 'v'},
        {"help",    no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "hv", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c':
                config_path = optarg;
                break;
            case 'd':
                ov.dbc_file = optarg;
                break;
            case 'u':
                ov.unit_mapping_file = optarg;
                break;
            case 'l':
                ov.log_dir = optarg;
                break;
            case 'o':
                ov.output_dir = optarg;
                break;
            case 'w':
                ov.workers = std::atoi(optarg);
                if (ov.workers < 1 || ov.workers > 64) {
                    fprintf(stderr, "Error: Invalid worker count: %s (must be 1..64)\n", optarg);
                    return 1;
                }
                break;
            case 'I':
                ov.influx = true;
                break;
            case 'v':
                ov.verbose = true;
                break;
            case 'h':
            default:
                print_usage(argv[0]);
                return (opt == 'h') ? 0 : 1;
        }
    }

    // ========================================================================
    // Session setup (any failure here aborts the session)
    // ========================================================================
    config::SessionConfig cfg;
    std::unique_ptr<kg::DecodeSession> session;
    units::LogWarningSink unit_warnings;

    try {
        cfg = config::SessionConfig::load(config_path);
        apply(ov, cfg);
        cfg.validate();

        utils::LogLevel lvl = utils::LogLevel::Info;
        utils::parse_level(cfg.log_level, lvl);
        utils::set_level(lvl);
        if (!cfg.log_file.empty() && !utils::open_log_file(cfg.log_file)) {
            LOG_WARN("Cannot open log file %s, logging to stderr only", cfg.log_file.c_str());
        }

        cfg.print_summary();
        session = kg::DecodeSession::open(cfg, unit_warnings);
    } catch (const config::ConfigurationError& e) {
        LOG_ERROR("Configuration error: %s", e.what());
        return 2;
    } catch (const dbc::MalformedCatalog& e) {
        LOG_ERROR("Malformed catalog: %s", e.what());
        return 2;
    }

    // ========================================================================
    // Catalog export
    // ========================================================================
    kg::CatalogExporter exporter(cfg.platform, cfg.sensor);
    if (!exporter.write_tables(exporter.export_tables(session->catalog()), cfg.output_dir)) {
        LOG_ERROR("Failed to write catalog tables to %s", cfg.output_dir.c_str());
        return 1;
    }

    // ========================================================================
    // Sinks
    // ========================================================================
    std::vector<kg::RecordSink*> sinks;

    kg::SignalLogWriter signal_log;
    const std::string signal_log_path = cfg.output_dir + "/signallog.csv";
    if (!signal_log.open(signal_log_path)) {
        return 1;
    }
    sinks.push_back(&signal_log);

    std::unique_ptr<utils::InfluxWriter> influx;
    if (cfg.influx.enabled) {
        try {
            influx = std::make_unique<utils::InfluxWriter>(cfg.influx);
            sinks.push_back(influx.get());
        } catch (const std::runtime_error& e) {
            LOG_WARN("[InfluxDB] Disabled: %s", e.what());
        }
    }

    // ========================================================================
    // Replay
    // ========================================================================
    kg::RecordEmitter emitter(cfg.platform, cfg.sensor);
    const std::vector<std::string> logs = can::FrameLogReader::collect_logs(cfg.log_dir);
    if (logs.empty()) {
        LOG_WARN("No CSV logs found under %s", cfg.log_dir.c_str());
    }

    size_t sink_failures = 0;
    for (const auto& path : logs) {
        can::FrameLogReader reader;
        if (!reader.open(path)) {
            continue;
        }

        const std::vector<can::Frame> frames = reader.read_all();
        const std::vector<kg::FrameOutcome> outcomes = session->decode_batch(frames);

        std::vector<kg::SignalLogRecord> records;
        for (size_t i = 0; i < frames.size(); ++i) {
            const kg::FrameOutcome& out = outcomes[i];
            if (!out.ok()) {
                LOG_DEBUG("[Session] %s: %s", kg::to_string(out.status), out.error.c_str());
                continue;
            }
            std::vector<kg::SignalLogRecord> recs =
                emitter.emit(out.observations, kg::FrameMeta::from_frame(frames[i]));
            records.insert(records.end(), recs.begin(), recs.end());
        }

        for (auto* sink : sinks) {
            if (!sink->write(records)) {
                ++sink_failures;
            }
        }

        LOG_INFO("%s: %zu frames (%zu skipped rows), %zu records",
                 path.c_str(), frames.size(), reader.rows_skipped(), records.size());
    }

    for (auto* sink : sinks) {
        if (!sink->flush()) {
            ++sink_failures;
        }
    }

    // ========================================================================
    // Summary
    // ========================================================================
    session->log_stats();
    LOG_INFO("Records emitted: %llu -> %s", (unsigned long long)emitter.emitted(),
             signal_log_path.c_str());
    if (session->unmapped_signals() > 0) {
        LOG_WARN("%zu signal(s) kept their declared unit (no mapping entry)",
                 session->unmapped_signals());
    }
    if (sink_failures > 0) {
        LOG_WARN("%zu sink write(s) failed", sink_failures);
    }

    utils::close_log_file();
    return 0;
}
