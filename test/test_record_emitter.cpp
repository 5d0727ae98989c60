// test/test_record_emitter.cpp
/**
 * Unit Test: Record Emitter
 *
 * Tests provenance attached to decoded observations and the signal log
 * row layout.
 *
 * Test Coverage:
 *   1. Record fields and individual names
 *   2. Provenance fallbacks (sensor, ECU)
 *   3. Row layout and value / time formatting
 *   4. Sequence numbers under concurrent emitters
 *   5. Signal log CSV writer
 */

#include "kg/record_emitter.hpp"
#include "kg/signal_log_writer.hpp"
#include "utils/csv.hpp"
#include <iostream>
#include <set>
#include <mutex>
#include <thread>

// ANSI color codes
#define COLOR_GREEN  "\033[32m"
#define COLOR_RED    "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_RESET  "\033[0m"

struct TestResult {
    int passed = 0;
    int failed = 0;

    void pass(const std::string& msg) {
        std::cout << COLOR_GREEN << "  ✓ " << msg << COLOR_RESET << "\n";
        ++passed;
    }

    void fail(const std::string& msg) {
        std::cout << COLOR_RED << "  ✗ " << msg << COLOR_RESET << "\n";
        ++failed;
    }

    void summary() {
        std::cout << "\n========================================\n";
        if (failed == 0) {
            std::cout << COLOR_GREEN << "ALL TESTS PASSED" << COLOR_RESET;
        } else {
            std::cout << COLOR_RED << "SOME TESTS FAILED" << COLOR_RESET;
        }
        std::cout << " (" << passed << " passed, " << failed << " failed)\n";
        std::cout << "========================================\n";
    }
};

// 2024-06-10T06:13:20.125Z
static const int64_t kTimestamp = 1718000000125000000LL;

std::vector<can::SignalObservation> sample_observations() {
    can::SignalObservation speed;
    speed.message_id = 0x100;
    speed.message_name = "VehicleSpeed";
    speed.signal_name = "Speed";
    speed.raw_value = 10000;
    speed.value = 100.0;
    speed.unit = "KM-PER-HR";
    speed.unit_mapped = true;
    speed.timestamp_ns = kTimestamp;
    speed.ecu = "ABS";

    can::SignalObservation press = speed;
    press.signal_name = "Pressure";
    press.value = 2.55;
    press.unit = "bar";
    press.unit_mapped = false;
    press.out_of_range = true;

    return {speed, press};
}

// ============================================================================
// Test 1: Record fields
// ============================================================================
void test_fields(TestResult& result) {
    std::cout << "\n" << COLOR_YELLOW << "Test 1: Record fields" << COLOR_RESET << "\n";

    kg::RecordEmitter emitter("can2", "can2_sniffer");
    kg::FrameMeta meta;
    meta.timestamp_ns = kTimestamp;
    meta.bus_channel = "can0";

    auto recs = emitter.emit(sample_observations(), meta);
    if (recs.size() != 2) {
        result.fail("Expected 2 records");
        return;
    }

    if (recs[0].individual == "Speed_20240610061320_1" &&
        recs[1].individual == "Pressure_20240610061320_2") {
        result.pass("Individuals: " + recs[0].individual + ", " + recs[1].individual);
    } else {
        result.fail("Individual names wrong: " + recs[0].individual);
    }

    const kg::SignalLogRecord& r = recs[0];
    if (r.signal == "Speed" && r.message == "VehicleSpeed" && r.message_id == 0x100 &&
        r.value == 100.0 && r.unit == "KM-PER-HR" && r.unit_mapped && !r.out_of_range &&
        r.timestamp_ns == kTimestamp && r.platform == "can2" && r.bus_channel == "can0") {
        result.pass("Values pass through unchanged");
    } else {
        result.fail("Record fields wrong");
    }

    if (recs[1].out_of_range && !recs[1].unit_mapped && recs[1].unit == "bar") {
        result.pass("Flags preserved on the unmapped, out-of-range record");
    } else {
        result.fail("Flags lost");
    }

    auto more = emitter.emit(sample_observations(), meta);
    if (more.size() == 2 && more[0].individual == "Speed_20240610061320_3" && emitter.emitted() == 4) {
        result.pass("Row numbers continue across frames");
    } else {
        result.fail("Row numbering wrong");
    }

    if (emitter.emit({}, meta).empty() && emitter.emitted() == 4) {
        result.pass("Empty frame emits nothing");
    } else {
        result.fail("Empty frame changed state");
    }
}

// ============================================================================
// Test 2: Provenance fallbacks
// ============================================================================
void test_provenance(TestResult& result) {
    std::cout << "\n" << COLOR_YELLOW << "Test 2: Provenance" << COLOR_RESET << "\n";

    kg::RecordEmitter emitter("can2", "can2_sniffer");

    kg::FrameMeta meta;
    meta.timestamp_ns = kTimestamp;
    auto recs = emitter.emit(sample_observations(), meta);
    if (recs[0].sensor == "can2_sniffer" && recs[0].ecu == "ABS") {
        result.pass("Defaults: configured sensor, catalog transmitter");
    } else {
        result.fail("Default provenance wrong");
    }

    can::Frame frame;
    frame.timestamp_ns = kTimestamp;
    frame.sensor = "front_logger";
    frame.source_ecu = "GATEWAY";
    frame.bus_channel = "can1";
    recs = emitter.emit(sample_observations(), kg::FrameMeta::from_frame(frame));
    if (recs[0].sensor == "front_logger" && recs[0].ecu == "GATEWAY" && recs[0].bus_channel == "can1") {
        result.pass("Frame source provenance overrides defaults");
    } else {
        result.fail("Frame provenance ignored");
    }
}

// ============================================================================
// Test 3: Row layout
// ============================================================================
void test_row(TestResult& result) {
    std::cout << "\n" << COLOR_YELLOW << "Test 3: Row layout" << COLOR_RESET << "\n";

    kg::RecordEmitter emitter("can2", "can2_sniffer");
    kg::FrameMeta meta;
    meta.timestamp_ns = kTimestamp;
    auto recs = emitter.emit(sample_observations(), meta);
    const auto row = kg::to_row(recs[0]);
    const auto& cols = kg::signal_log_columns();

    if (row.size() == cols.size() && cols.size() == 14 && cols[0] == "Individual" &&
        cols[4] == "sosa:hasSimpleResult" && cols[10] == "sosa:resultTime") {
        result.pass("14 columns in the fixed order");
    } else {
        result.fail("Column layout wrong");
    }

    if (row[1] == "dbc:SignalLog" && row[2] == "Speed" && row[3] == "VehicleSpeed" &&
        row[4] == "100" && row[5] == "KM-PER-HR" && row[6] == "true" && row[7] == "false" &&
        row[8] == "can2_sniffer" && row[9] == "Speed" &&
        row[10] == "2024-06-10T06:13:20.125Z" && row[11] == "ABS" && row[12] == "can2") {
        result.pass("Row: " + row[0] + " " + row[4] + " " + row[10]);
    } else {
        result.fail("Row contents wrong");
    }

    if (kg::format_value(2.55) == "2.55" && kg::format_value(-0.25) == "-0.25" &&
        kg::format_value(655.35) == "655.35" && kg::format_value(0.1 + 0.2) == "0.30000000000000004") {
        result.pass("Shortest round-trip value text");
    } else {
        result.fail("format_value wrong: " + kg::format_value(0.1 + 0.2));
    }

    if (kg::format_result_time(0) == "1970-01-01T00:00:00.000Z" &&
        kg::format_compact_time(kTimestamp) == "20240610061320") {
        result.pass("Time formats");
    } else {
        result.fail("Time formats wrong");
    }
}

// ============================================================================
// Test 4: Concurrent emit
// ============================================================================
void test_concurrent(TestResult& result) {
    std::cout << "\n" << COLOR_YELLOW << "Test 4: Concurrent emitters" << COLOR_RESET << "\n";

    kg::RecordEmitter emitter("can2", "can2_sniffer");
    const auto obs = sample_observations();
    std::mutex mtx;
    std::set<std::string> names;

    std::vector<std::thread> pool;
    for (int t = 0; t < 8; ++t) {
        pool.emplace_back([&]() {
            kg::FrameMeta meta;
            meta.timestamp_ns = kTimestamp;
            for (int i = 0; i < 100; ++i) {
                auto recs = emitter.emit(obs, meta);
                std::lock_guard<std::mutex> lock(mtx);
                for (const auto& r : recs)
                    names.insert(r.individual);
            }
        });
    }
    for (auto& th : pool)
        th.join();

    if (emitter.emitted() == 1600 && names.size() == 1600) {
        result.pass("1600 records, 1600 distinct individuals");
    } else {
        result.fail("Duplicate individuals: " + std::to_string(names.size()) + " distinct");
    }
}

// ============================================================================
// Test 5: Signal log writer
// ============================================================================
void test_writer(TestResult& result) {
    std::cout << "\n" << COLOR_YELLOW << "Test 5: signallog.csv" << COLOR_RESET << "\n";

    const std::string path = "/tmp/cankg_test_signallog.csv";
    kg::RecordEmitter emitter("can2", "can2_sniffer");
    kg::FrameMeta meta;
    meta.timestamp_ns = kTimestamp;

    {
        kg::SignalLogWriter writer;
        if (!writer.open(path)) {
            result.fail("Cannot open " + path);
            return;
        }
        writer.write(emitter.emit(sample_observations(), meta));
        writer.write(emitter.emit(sample_observations(), meta));
        if (writer.rows_written() == 4) {
            result.pass("4 rows written");
        } else {
            result.fail("Row count wrong");
        }
    }

    utils::CsvReader csv(';');
    if (!csv.open(path)) {
        result.fail("Cannot read back " + path);
        return;
    }
    std::vector<std::string> row;
    int rows = 0;
    std::string first_value;
    while (csv.read_row(row)) {
        if (rows == 0)
            first_value = csv.get(row, "sosa:hasSimpleResult");
        ++rows;
    }
    if (rows == 4 && csv.header() == kg::signal_log_columns() && first_value == "100") {
        result.pass("Header and rows read back with ';' delimiter");
    } else {
        result.fail("signallog.csv content wrong");
    }

    kg::SignalLogWriter closed;
    if (!closed.write(emitter.emit(sample_observations(), meta))) {
        result.pass("Write on an unopened writer reports failure");
    } else {
        result.fail("Unopened writer accepted records");
    }
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║              Record Emitter Unit Tests                      ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    TestResult result;

    test_fields(result);
    test_provenance(result);
    test_row(result);
    test_concurrent(result);
    test_writer(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
