// src/kg/signal_log_record.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace kg {

// One decoded value with provenance, in the shape the mapping layer binds.
// Field names of the CSV rendering are listed in signal_log_columns().
struct SignalLogRecord {
    std::string individual;        // <signal>_<YYYYmmddHHMMSS>_<seq>
    std::string signal;            // dbc:decodedFrom / sosa:observedProperty
    std::string message;           // dbc:isPartOf
    uint32_t message_id = 0;

    double value = 0.0;            // sosa:hasSimpleResult
    std::string unit;              // qudt:hasUnit
    bool unit_mapped = false;      // dbc:unitMapped
    bool out_of_range = false;     // dbc:outOfRange

    int64_t timestamp_ns = 0;      // sosa:resultTime
    std::string ecu;               // dbc:hasTransmitter
    std::string sensor;            // sosa:madeBySensor
    std::string platform;          // sosa:isHostedBy
    std::string bus_channel;       // dbc:busChannel
};

constexpr const char* kSignalLogType = "dbc:SignalLog";

const std::vector<std::string>& signal_log_columns();

// Row in signal_log_columns() order
std::vector<std::string> to_row(const SignalLogRecord& rec);

// 2024-06-10T06:13:20.125Z
std::string format_result_time(int64_t timestamp_ns);

// 20240610061320
std::string format_compact_time(int64_t timestamp_ns);

// Shortest text that reads back to the same double
std::string format_value(double v);

} // namespace kg
