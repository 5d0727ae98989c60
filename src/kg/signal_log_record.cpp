// src/kg/signal_log_record.cpp
#include "kg/signal_log_record.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <ctime>

namespace kg {

namespace {

// Floor division so pre-1970 timestamps still split into a valid second + fraction
void split_ns(int64_t ns, time_t& secs, int64_t& frac_ns) {
    int64_t s = ns / 1000000000LL;
    int64_t f = ns % 1000000000LL;
    if (f < 0) {
        f += 1000000000LL;
        s -= 1;
    }
    secs = static_cast<time_t>(s);
    frac_ns = f;
}

} // namespace

const std::vector<std::string>& signal_log_columns() {
    static const std::vector<std::string> cols = {
        "Individual",
        "rdf:type",
        "dbc:decodedFrom",
        "dbc:isPartOf",
        "sosa:hasSimpleResult",
        "qudt:hasUnit",
        "dbc:unitMapped",
        "dbc:outOfRange",
        "sosa:madeBySensor",
        "sosa:observedProperty",
        "sosa:resultTime",
        "dbc:hasTransmitter",
        "sosa:isHostedBy",
        "dbc:busChannel",
    };
    return cols;
}

std::vector<std::string> to_row(const SignalLogRecord& rec) {
    return {
        rec.individual,
        kSignalLogType,
        rec.signal,
        rec.message,
        format_value(rec.value),
        rec.unit,
        rec.unit_mapped ? "true" : "false",
        rec.out_of_range ? "true" : "false",
        rec.sensor,
        rec.signal,
        format_result_time(rec.timestamp_ns),
        rec.ecu,
        rec.platform,
        rec.bus_channel,
    };
}

std::string format_result_time(int64_t timestamp_ns) {
    time_t secs = 0;
    int64_t frac_ns = 0;
    split_ns(timestamp_ns, secs, frac_ns);

    std::tm tm{};
    gmtime_r(&secs, &tm);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec,
                  static_cast<int>(frac_ns / 1000000));
    return buf;
}

std::string format_compact_time(int64_t timestamp_ns) {
    time_t secs = 0;
    int64_t frac_ns = 0;
    split_ns(timestamp_ns, secs, frac_ns);

    std::tm tm{};
    gmtime_r(&secs, &tm);

    char buf[24];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d%02d%02d%02d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);
    return buf;
}

std::string format_value(double v) {
    if (std::isnan(v))
        return "NaN";
    if (std::isinf(v))
        return v > 0 ? "INF" : "-INF";

    char buf[32];
    for (int precision = 6; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, v);
        if (std::strtod(buf, nullptr) == v)
            break;
    }
    return buf;
}

} // namespace kg
