// src/kg/record_sink.hpp
#pragma once

#include <vector>

#include "kg/signal_log_record.hpp"

namespace kg {

// Destination for emitted records. A failed write is reported through the
// return value, the session carries on.
class RecordSink {
public:
    virtual ~RecordSink() = default;

    virtual bool write(const std::vector<SignalLogRecord>& records) = 0;
    virtual bool flush() { return true; }
};

} // namespace kg
