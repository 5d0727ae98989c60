// src/units/warning_sink.hpp
#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace units {

// A declared unit had no entry in the mapping table
struct UnitWarning {
    std::string declared_unit;
    std::string message_name;  // empty when not tied to a catalog signal
    std::string signal_name;

    std::string describe() const;
};

// Side channel for unit-mapping misses. Implementations must accept
// concurrent calls.
class WarningSink {
public:
    virtual ~WarningSink() = default;
    virtual void warn(const UnitWarning& w) = 0;
};

// Writes each warning as one log line
class LogWarningSink : public WarningSink {
public:
    void warn(const UnitWarning& w) override;
};

// Keeps every warning (tests, end-of-session summaries)
class CollectingWarningSink : public WarningSink {
public:
    void warn(const UnitWarning& w) override;

    std::vector<UnitWarning> warnings() const;
    size_t count() const;
    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<UnitWarning> warnings_;
};

} // namespace units
