// src/units/warning_sink.cpp
#include "units/warning_sink.hpp"

#include "utils/logging.hpp"

namespace units {

std::string UnitWarning::describe() const {
    std::string s = "Unknown unit '" + declared_unit + "'";
    if (!signal_name.empty()) {
        s += " on " + message_name + "." + signal_name;
    }
    s += " - keeping as-is";
    return s;
}

void LogWarningSink::warn(const UnitWarning& w) {
    LOG_WARN("[UnitNormalizer] %s", w.describe().c_str());
}

void CollectingWarningSink::warn(const UnitWarning& w) {
    std::lock_guard<std::mutex> lock(mutex_);
    warnings_.push_back(w);
}

std::vector<UnitWarning> CollectingWarningSink::warnings() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return warnings_;
}

size_t CollectingWarningSink::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return warnings_.size();
}

void CollectingWarningSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    warnings_.clear();
}

} // namespace units
