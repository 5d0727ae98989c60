// src/kg/record_emitter.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "can/frame.hpp"
#include "kg/signal_log_record.hpp"

namespace kg {

// Where a frame came from. Empty fields fall back to the emitter defaults
// (sensor) or the catalog transmitter (ECU).
struct FrameMeta {
    int64_t timestamp_ns = 0;
    std::string source_ecu;
    std::string sensor;
    std::string bus_channel;

    static FrameMeta from_frame(const can::Frame& frame);
};

/**
 * RecordEmitter - Attaches provenance to decoded observations
 *
 * Values pass through untouched. The row counter behind the record
 * identifiers is shared by every thread using the emitter.
 */
class RecordEmitter {
public:
    RecordEmitter(std::string platform, std::string sensor);

    std::vector<SignalLogRecord> emit(const std::vector<can::SignalObservation>& observations,
                                      const FrameMeta& meta);

    const std::string& platform() const { return platform_; }
    const std::string& sensor() const { return sensor_; }

    // Records emitted so far
    uint64_t emitted() const { return seq_.load(); }

private:
    std::string platform_;
    std::string sensor_;
    std::atomic<uint64_t> seq_{0};
};

} // namespace kg
