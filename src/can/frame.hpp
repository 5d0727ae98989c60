// src/can/frame.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace can {

// One frame as seen on the bus or replayed from a log
struct Frame {
    uint32_t id = 0;
    bool extended = false;
    std::vector<uint8_t> data;

    // Arrival time, nanoseconds since Unix epoch
    int64_t timestamp_ns = 0;

    // Provenance filled by the frame source, empty when unknown
    std::string source_ecu;
    std::string bus_channel;
    std::string sensor;
};

// One decoded signal value
struct SignalObservation {
    uint32_t message_id = 0;
    std::string message_name;
    std::string signal_name;

    uint64_t raw_value = 0;   // bit pattern as extracted
    double value = 0.0;       // raw * factor + offset

    std::string unit;         // canonical, or the declared unit when unmapped
    bool unit_mapped = false;
    bool out_of_range = false;

    int64_t timestamp_ns = 0;
    std::string ecu;          // transmitter of the owning message
};

} // namespace can
