// src/kg/record_emitter.cpp
#include "kg/record_emitter.hpp"

namespace kg {

FrameMeta FrameMeta::from_frame(const can::Frame& frame) {
    FrameMeta meta;
    meta.timestamp_ns = frame.timestamp_ns;
    meta.source_ecu = frame.source_ecu;
    meta.sensor = frame.sensor;
    meta.bus_channel = frame.bus_channel;
    return meta;
}

RecordEmitter::RecordEmitter(std::string platform, std::string sensor)
    : platform_(std::move(platform))
    , sensor_(std::move(sensor))
{
}

std::vector<SignalLogRecord> RecordEmitter::emit(const std::vector<can::SignalObservation>& observations,
                                                 const FrameMeta& meta) {
    std::vector<SignalLogRecord> out;
    out.reserve(observations.size());

    // One block of row numbers per frame keeps a frame's records contiguous
    uint64_t seq = seq_.fetch_add(observations.size()) + 1;
    const std::string stamp = format_compact_time(meta.timestamp_ns);

    for (const auto& obs : observations) {
        SignalLogRecord rec;
        rec.individual = obs.signal_name + "_" + stamp + "_" + std::to_string(seq++);
        rec.signal = obs.signal_name;
        rec.message = obs.message_name;
        rec.message_id = obs.message_id;
        rec.value = obs.value;
        rec.unit = obs.unit;
        rec.unit_mapped = obs.unit_mapped;
        rec.out_of_range = obs.out_of_range;
        rec.timestamp_ns = meta.timestamp_ns;
        rec.ecu = meta.source_ecu.empty() ? obs.ecu : meta.source_ecu;
        rec.sensor = meta.sensor.empty() ? sensor_ : meta.sensor;
        rec.platform = platform_;
        rec.bus_channel = meta.bus_channel;
        out.push_back(std::move(rec));
    }
    return out;
}

} // namespace kg
