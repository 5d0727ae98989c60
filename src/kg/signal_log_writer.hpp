// src/kg/signal_log_writer.hpp
#pragma once

#include <mutex>
#include <string>

#include "kg/record_sink.hpp"
#include "utils/csv.hpp"

namespace kg {

// signallog.csv: header from signal_log_columns(), ';' separated
class SignalLogWriter : public RecordSink {
public:
    SignalLogWriter() = default;
    ~SignalLogWriter() override;

    SignalLogWriter(const SignalLogWriter&) = delete;
    SignalLogWriter& operator=(const SignalLogWriter&) = delete;

    bool open(const std::string& path);
    void close();

    bool write(const std::vector<SignalLogRecord>& records) override;
    bool flush() override;

    size_t rows_written() const { return rows_; }

private:
    std::mutex mutex_;
    utils::CsvWriter csv_{';'};
    std::string path_;
    size_t rows_ = 0;
};

} // namespace kg
