// src/kg/signal_log_writer.cpp
#include "kg/signal_log_writer.hpp"

#include "utils/logging.hpp"

namespace kg {

SignalLogWriter::~SignalLogWriter() {
    close();
}

bool SignalLogWriter::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    path_ = path;
    rows_ = 0;
    if (!csv_.open(path)) {
        LOG_ERROR("[SignalLogWriter] Cannot open %s", path.c_str());
        return false;
    }
    csv_.write_row(signal_log_columns());
    LOG_INFO("[SignalLogWriter] Writing signal log to %s", path.c_str());
    return true;
}

void SignalLogWriter::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (csv_.is_open()) {
        csv_.flush();
        csv_.close();
        LOG_DEBUG("[SignalLogWriter] Closed %s (%zu rows)", path_.c_str(), rows_);
    }
}

bool SignalLogWriter::write(const std::vector<SignalLogRecord>& records) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!csv_.is_open())
        return false;
    for (const auto& rec : records) {
        csv_.write_row(to_row(rec));
        ++rows_;
    }
    return true;
}

bool SignalLogWriter::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!csv_.is_open())
        return false;
    csv_.flush();
    return true;
}

} // namespace kg
