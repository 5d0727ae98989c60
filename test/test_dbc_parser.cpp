// test/test_dbc_parser.cpp
/**
 * Unit Test: DBC Catalog Parser
 *
 * Tests catalog construction from DBC text and rejection of malformed input.
 *
 * Test Coverage:
 *   1. Messages, signals, nodes and declaration order
 *   2. Extended identifiers and byte order / signedness
 *   3. Multiplex index
 *   4. SIG_VALTYPE_ float signals
 *   5. Skipped constructs (NS_, CM_, independent signal message)
 *   6. Malformed input (line numbers reported)
 *   7. Unreadable file
 */

#include "dbc/dbc_parser.hpp"
#include "config/config_error.hpp"
#include <iostream>
#include <cmath>
#include <string>

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

static const char* kVehicleDbc =
    "VERSION \"\"\n"
    "\n"
    "NS_ :\n"
    "\tNS_DESC_\n"
    "\tCM_\n"
    "\tBA_DEF_\n"
    "\tSIG_VALTYPE_\n"
    "\n"
    "BS_:\n"
    "\n"
    "BU_: ECU1 ABS DASH\n"
    "\n"
    "BO_ 256 VehicleSpeed: 8 ABS\n"
    " SG_ Speed : 0|16@1+ (0.01,0) [0|250] \"km/h\" DASH,ECU1\n"
    " SG_ Counter : 16|4@1+ (1,0) [0|0] \"\" Vector__XXX\n"
    "\n"
    "BO_ 2566844672 ExtStatus: 8 ECU1\n"
    " SG_ Temp : 7|8@0- (1,-40) [-40|215] \"degC\" DASH\n"
    "\n"
    "BO_ 512 MuxMsg: 8 ECU1\n"
    " SG_ Mode M : 0|8@1+ (1,0) [0|0] \"\" DASH\n"
    " SG_ Volt m1 : 8|16@1+ (0.1,0) [0|100] \"V\" DASH\n"
    " SG_ Press m2 : 8|16@1+ (0.01,0) [0|10] \"bar\" DASH\n"
    "\n"
    "BO_ 768 FloatMsg: 8 Vector__XXX\n"
    " SG_ Ratio : 0|32@1+ (1,0) [0|0] \"\" DASH\n"
    "\n"
    "BO_ 3221225472 VECTOR__INDEPENDENT_SIG_MSG: 0 Vector__XXX\n"
    " SG_ Orphan : 0|8@1+ (1,0) [0|0] \"\" Vector__XXX\n"
    "\n"
    "CM_ SG_ 256 Speed \"Vehicle speed,\n"
    "reported by ABS\";\n"
    "BA_DEF_ BO_ \"GenMsgCycleTime\" INT 0 10000;\n"
    "VAL_ 512 Mode 1 \"Voltage\" 2 \"Pressure\" ;\n"
    "SIG_VALTYPE_ 768 Ratio : 1;\n";

// Parses text expected to fail; returns the reported line or -1 if accepted
int reject_line(const std::string& text, std::string& what) {
    try {
        dbc::DbcParser::parse(text);
    } catch (const dbc::MalformedCatalog& e) {
        what = e.what();
        return e.line();
    }
    return -1;
}

// ============================================================================
// Test 1: Messages, signals, nodes
// ============================================================================
void test_catalog_contents(TestResult& result) {
    std::cout << "\n" << COLOR_YELLOW << "Test 1: Catalog contents" << COLOR_RESET << "\n";

    dbc::Catalog cat = dbc::DbcParser::parse(kVehicleDbc);

    if (cat.size() == 4 && cat.signal_count() == 7) {
        result.pass("4 messages, 7 signals");
    } else {
        result.fail("Expected 4 messages / 7 signals, got " + std::to_string(cat.size()) +
                    " / " + std::to_string(cat.signal_count()));
    }

    const auto& msgs = cat.messages();
    if (msgs.size() == 4 && msgs[0].name == "VehicleSpeed" && msgs[1].name == "ExtStatus" &&
        msgs[2].name == "MuxMsg" && msgs[3].name == "FloatMsg") {
        result.pass("Messages kept in declaration order");
    } else {
        result.fail("Message order wrong");
    }

    const dbc::Message* vs = cat.find(0x100);
    if (vs && vs->length == 8 && vs->transmitter == "ABS" && !vs->extended) {
        const dbc::Signal* speed = vs->find_signal("Speed");
        if (speed && speed->start_bit == 0 && speed->bit_length == 16 &&
            speed->endianness == utils::Endianness::Little && !speed->is_signed &&
            speed->factor == 0.01 && speed->offset == 0.0 &&
            speed->has_range && speed->min == 0.0 && speed->max == 250.0 &&
            speed->unit == "km/h" && speed->receivers.size() == 2 &&
            speed->receivers[0] == "DASH" && speed->receivers[1] == "ECU1") {
            result.pass("Speed signal attributes");
        } else {
            result.fail("Speed signal attributes wrong");
        }

        const dbc::Signal* counter = vs->find_signal("Counter");
        if (counter && !counter->has_range && counter->unit.empty() &&
            counter->receivers.size() == 1 && counter->receivers[0] == dbc::kUnknownNode) {
            result.pass("[0|0] means no range, Vector__XXX receiver is Unknown");
        } else {
            result.fail("Counter signal attributes wrong");
        }
    } else {
        result.fail("VehicleSpeed (0x100) missing or wrong");
    }

    const std::vector<std::string> expected_nodes = {"ABS", "DASH", "ECU1", "Unknown"};
    if (cat.nodes == expected_nodes) {
        result.pass("Nodes: BU_ list plus transmitters / receivers, sorted");
    } else {
        result.fail("Node list wrong");
    }

    const dbc::Message* fm = cat.find(0x300);
    if (fm && fm->transmitter == dbc::kUnknownNode) {
        result.pass("Vector__XXX transmitter recorded as Unknown");
    } else {
        result.fail("FloatMsg transmitter wrong");
    }
}

// ============================================================================
// Test 2: Extended ids and Motorola signed signals
// ============================================================================
void test_extended_and_motorola(TestResult& result) {
    std::cout << "\n" << COLOR_YELLOW << "Test 2: Extended id / Motorola" << COLOR_RESET << "\n";

    dbc::Catalog cat = dbc::DbcParser::parse(kVehicleDbc);

    const dbc::Message* ext = cat.find(0x18FEF100);
    if (ext && ext->extended && ext->id == 0x18FEF100) {
        result.pass("Bit 31 marks extended, id stored as 29 bits");
    } else {
        result.fail("Extended message not found under 0x18FEF100");
    }

    if (cat.find(0x98FEF100) == ext) {
        result.pass("Lookup with the flag bit set finds the same message");
    } else {
        result.fail("Lookup with flag bit failed");
    }

    const dbc::Signal* temp = ext ? ext->find_signal("Temp") : nullptr;
    if (temp && temp->endianness == utils::Endianness::Big && temp->is_signed &&
        temp->offset == -40.0 && temp->required_bytes() == 1) {
        result.pass("Temp: Motorola, signed, offset -40");
    } else {
        result.fail("Temp attributes wrong");
    }

    // Standard 0x100 and extended 0x00000100 are different messages
    try {
        dbc::Catalog mixed = dbc::DbcParser::parse(
            "BO_ 256 Std: 8 E\n"
            " SG_ A : 0|8@1+ (1,0) [0|0] \"\" E\n"
            "BO_ 2147483904 Ext: 8 E\n"
            " SG_ B : 0|32@1+ (1,0) [0|0] \"\" E\n"
            "SIG_VALTYPE_ 2147483904 B : 1;\n");
        const dbc::Message* std_msg = mixed.find(0x100);
        const dbc::Message* ext_msg = mixed.find(0x100, true);
        if (mixed.size() == 2 && std_msg && ext_msg && std_msg->name == "Std" && !std_msg->extended &&
            ext_msg->name == "Ext" && ext_msg->extended && ext_msg->id == 0x100 &&
            mixed.find(0x80000100) == ext_msg) {
            result.pass("Std 0x100 and Ext 0x00000100 kept apart");
        } else {
            result.fail("Standard / extended 0x100 mixed up");
        }

        if (ext_msg && ext_msg->signals[0].value_type == dbc::ValueType::Float32 &&
            std_msg && std_msg->signals[0].value_type == dbc::ValueType::Integer) {
            result.pass("SIG_VALTYPE_ applies to the extended message only");
        } else {
            result.fail("SIG_VALTYPE_ hit the wrong message");
        }
    } catch (const dbc::MalformedCatalog& e) {
        result.fail(std::string("Standard + extended 0x100 rejected: ") + e.what());
    }
}

// ============================================================================
// Test 3: Multiplexing
// ============================================================================
void test_multiplex_index(TestResult& result) {
    std::cout << "\n" << COLOR_YELLOW << "Test 3: Multiplex index" << COLOR_RESET << "\n";

    dbc::Catalog cat = dbc::DbcParser::parse(kVehicleDbc);
    const dbc::Message* mux = cat.find(0x200);
    if (!mux) {
        result.fail("MuxMsg missing");
        return;
    }

    if (mux->mux.is_multiplexed() && mux->mux.multiplexer == 0 &&
        mux->signals[0].mux_role == dbc::MuxRole::Multiplexer) {
        result.pass("Mode is the multiplexer");
    } else {
        result.fail("Multiplexer not recorded");
    }

    auto g1 = mux->mux.groups.find(1);
    auto g2 = mux->mux.groups.find(2);
    if (mux->mux.groups.size() == 2 &&
        g1 != mux->mux.groups.end() && g1->second == std::vector<size_t>{1} &&
        g2 != mux->mux.groups.end() && g2->second == std::vector<size_t>{2}) {
        result.pass("Groups m1 → Volt, m2 → Press");
    } else {
        result.fail("Multiplex groups wrong");
    }

    if (mux->signals[2].mux_role == dbc::MuxRole::Multiplexed && mux->signals[2].mux_value == 2) {
        result.pass("Overlapping bits allowed across different groups");
    } else {
        result.fail("Press mux attributes wrong");
    }
}

// ============================================================================
// Test 4: Float signals and skipped constructs
// ============================================================================
void test_value_types_and_skips(TestResult& result) {
    std::cout << "\n" << COLOR_YELLOW << "Test 4: SIG_VALTYPE_ and skipped constructs" << COLOR_RESET << "\n";

    dbc::Catalog cat = dbc::DbcParser::parse(kVehicleDbc);
    const dbc::Message* fm = cat.find(0x300);
    const dbc::Signal* ratio = fm ? fm->find_signal("Ratio") : nullptr;
    if (ratio && ratio->value_type == dbc::ValueType::Float32) {
        result.pass("Ratio is float32");
    } else {
        result.fail("SIG_VALTYPE_ not applied");
    }

    bool orphan_found = false;
    for (const auto& msg : cat.messages()) {
        if (msg.find_signal("Orphan"))
            orphan_found = true;
    }
    if (!orphan_found && !cat.contains(0)) {
        result.pass("VECTOR__INDEPENDENT_SIG_MSG dropped");
    } else {
        result.fail("Independent signal message leaked into the catalog");
    }

    std::string what;
    if (reject_line("BO_ 1 M: 8 E\n SG_ S : 0|16@1+ (1,0) [0|0] \"\" E\nSIG_VALTYPE_ 1 S : 1;\n", what) == 3) {
        result.pass("float32 on a 16-bit signal rejected");
    } else {
        result.fail("float32 width check missing");
    }
}

// ============================================================================
// Test 5: Malformed input
// ============================================================================
void test_malformed(TestResult& result) {
    std::cout << "\n" << COLOR_YELLOW << "Test 5: Malformed catalogs" << COLOR_RESET << "\n";

    struct Case {
        const char* name;
        std::string text;
        int line;
    };

    const Case cases[] = {
        {"Signal past message length",
         "BO_ 1 M: 2 E\n SG_ S : 8|16@1+ (1,0) [0|0] \"\" E\n", 2},
        {"Overlapping signals",
         "BO_ 1 M: 8 E\n SG_ A : 0|8@1+ (1,0) [0|0] \"\" E\n SG_ B : 4|8@1+ (1,0) [0|0] \"\" E\n", 3},
        {"Multiplexed signal overlapping a base signal",
         "BO_ 1 M: 8 E\n SG_ Sel M : 0|8@1+ (1,0) [0|0] \"\" E\n SG_ X m1 : 4|8@1+ (1,0) [0|0] \"\" E\n", 3},
        {"Overlap within one multiplex group",
         "BO_ 1 M: 8 E\n SG_ Sel M : 0|8@1+ (1,0) [0|0] \"\" E\n"
         " SG_ X m1 : 8|8@1+ (1,0) [0|0] \"\" E\n SG_ Y m1 : 12|8@1+ (1,0) [0|0] \"\" E\n", 4},
        {"Unparseable SG_",
         "BO_ 1 M: 8 E\n SG_ S : zero|8@1+ (1,0) [0|0] \"\" E\n", 2},
        {"Standard id above 11 bits",
         "BO_ 4096 M: 8 E\n", 1},
        {"Duplicate message id",
         "BO_ 1 A: 8 E\nBO_ 1 B: 8 E\n", 2},
        {"Duplicate extended message id",
         "BO_ 2147483649 A: 8 E\nBO_ 2147483649 B: 8 E\n", 2},
        {"Duplicate signal name",
         "BO_ 1 M: 8 E\n SG_ S : 0|8@1+ (1,0) [0|0] \"\" E\n SG_ S : 8|8@1+ (1,0) [0|0] \"\" E\n", 3},
        {"Zero factor",
         "BO_ 1 M: 8 E\n SG_ S : 0|8@1+ (0,0) [0|0] \"\" E\n", 2},
        {"Bit length 0",
         "BO_ 1 M: 8 E\n SG_ S : 0|0@1+ (1,0) [0|0] \"\" E\n", 2},
        {"Extended multiplexing",
         "BO_ 1 M: 8 E\n SG_ Sel M : 0|8@1+ (1,0) [0|0] \"\" E\n SG_ X m1M : 8|8@1+ (1,0) [0|0] \"\" E\n", 3},
        {"Multiplexed signal without multiplexer",
         "BO_ 1 M: 8 E\n SG_ X m1 : 8|8@1+ (1,0) [0|0] \"\" E\n", 2},
        {"Two multiplexers",
         "BO_ 1 M: 8 E\n SG_ A M : 0|8@1+ (1,0) [0|0] \"\" E\n SG_ B M : 8|8@1+ (1,0) [0|0] \"\" E\n", 3},
        {"Message longer than 64 bytes",
         "BO_ 1 M: 65 E\n", 1},
        {"Signal before any message",
         " SG_ S : 0|8@1+ (1,0) [0|0] \"\" E\n", 1},
        {"Unterminated string",
         "BO_ 1 M: 8 E\nCM_ \"never closed\n", 2},
    };

    for (const auto& c : cases) {
        std::string what;
        const int line = reject_line(c.text, what);
        if (line == c.line) {
            result.pass(std::string(c.name) + " → line " + std::to_string(line));
        } else if (line < 0) {
            result.fail(std::string(c.name) + " was accepted");
        } else {
            result.fail(std::string(c.name) + " reported line " + std::to_string(line) +
                        " (expected " + std::to_string(c.line) + "): " + what);
        }
    }

    // No partial catalog: a bad message after good ones still fails the parse
    std::string what;
    std::string text = std::string(kVehicleDbc) + "BO_ 9 Bad: 1 E\n SG_ S : 0|16@1+ (1,0) [0|0] \"\" E\n";
    if (reject_line(text, what) > 0) {
        result.pass("One bad message rejects the whole catalog");
    } else {
        result.fail("Partial catalog accepted");
    }
}

// ============================================================================
// Test 6: Unreadable file
// ============================================================================
void test_missing_file(TestResult& result) {
    std::cout << "\n" << COLOR_YELLOW << "Test 6: Missing DBC file" << COLOR_RESET << "\n";

    try {
        dbc::DbcParser::load("/nonexistent/path/vehicle.dbc");
        result.fail("Missing file should throw");
    } catch (const config::ConfigurationError& e) {
        result.pass(std::string("Missing file → ConfigurationError: ") + e.what());
    }
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║              DBC Parser Unit Tests                          ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    TestResult result;

    try {
        test_catalog_contents(result);
        test_extended_and_motorola(result);
        test_multiplex_index(result);
        test_value_types_and_skips(result);
        test_malformed(result);
        test_missing_file(result);
    } catch (const std::exception& e) {
        result.fail(std::string("Unexpected exception: ") + e.what());
    }

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
