// utils/influx.hpp
#pragma once

#include "kg/record_sink.hpp"
#include "kg/signal_log_record.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace utils {

/**
 * InfluxDB writer for decoded signal records
 *
 * Buffers line protocol and POSTs it to /api/v2/write once batch_lines
 * lines are pending, on flush() and on destruction. Lines of failed sends
 * stay queued for the next attempt, up to kMaxBufferedBatches batches; past
 * that the oldest lines are dropped and counted.
 *
 * Measurement schema (default measurement "signal_log"):
 *   tags:   message, signal, ecu, unit, sensor (empty values omitted)
 *   fields: value (float), out_of_range (bool), unit_mapped (bool)
 *   time:   frame arrival, nanoseconds
 */
class InfluxWriter : public kg::RecordSink {
public:
    static constexpr size_t kMaxBufferedBatches = 4;

    struct Config {
        std::string url = "http://localhost:8086";  // InfluxDB server URL
        std::string token = "";                      // Authentication token (optional for local)
        std::string org = "vehicle-kg";              // Organization name
        std::string bucket = "can-signals";          // Bucket name
        std::string measurement = "signal_log";
        size_t batch_lines = 5000;
        bool enabled = false;                        // Only enabled with --influx flag
    };

    /**
     * @param config InfluxDB configuration
     * @throws std::runtime_error if libcurl cannot be initialised
     */
    explicit InfluxWriter(const Config& config);

    /**
     * Destructor - flushes any pending writes
     */
    ~InfluxWriter() override;

    InfluxWriter(const InfluxWriter&) = delete;
    InfluxWriter& operator=(const InfluxWriter&) = delete;

    /**
     * Queue records; sends when the batch is full
     * @return false if disabled or a send failed
     */
    bool write(const std::vector<kg::SignalLogRecord>& records) override;

    /**
     * Send pending lines immediately
     */
    bool flush() override;

    bool is_enabled() const { return config_.enabled; }

    const Config& get_config() const { return config_; }

    size_t pending_lines() const { return pending_lines_; }

    // Upper bound on pending_lines()
    size_t max_pending_lines() const;

    // Lines discarded because the server stayed unreachable
    size_t dropped_lines() const { return dropped_lines_; }

    /**
     * Line protocol for one record, empty if the value cannot be
     * represented (NaN / infinity)
     */
    static std::string build_line(const kg::SignalLogRecord& rec, const std::string& measurement);

    // Escaping rules for tag keys/values and measurement names
    static std::string escape_tag(const std::string& s);
    static std::string escape_measurement(const std::string& s);

    /**
     * http://host:8086/api/v2/write?org=..&bucket=..&precision=ns
     */
    static std::string write_url(const Config& config);

private:
    Config config_;
    std::string buffer_;
    size_t pending_lines_ = 0;
    size_t dropped_lines_ = 0;
    bool dropping_ = false;

    // Implementation details hidden (pimpl pattern)
    struct Impl;
    std::unique_ptr<Impl> impl_;

    /**
     * Send line protocol data to InfluxDB
     *
     * @param line_protocol Concatenated line protocol strings
     * @return true if write succeeded, false otherwise
     */
    bool send_to_influx(const std::string& line_protocol);

    // Drops the oldest lines beyond max_pending_lines()
    void enforce_limit();
};

} // namespace utils
