// test/test_bitpack.cpp
/**
 * Unit Test: Bit packing
 *
 * Tests raw field extraction and insertion for both DBC byte orders.
 *
 * Test Coverage:
 *   1. Intel (little endian) fields across byte boundaries
 *   2. Motorola (big endian) sawtooth walk
 *   3. Payload size checks
 *   4. Value masking on insert
 *   5. Sign extension
 */

#include "utils/bitpack.hpp"
#include <iostream>
#include <cstring>
#include <vector>

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

using utils::Endianness;

// ============================================================================
// Test 1: Intel 16-bit field
// ============================================================================
void test_intel_16bit(TestResult& result) {
    std::cout << "\n" << COLOR_YELLOW << "Test 1: Intel 16-bit field" << COLOR_RESET << "\n";

    const uint8_t data[8] = {0x10, 0x27, 0, 0, 0, 0, 0, 0};
    uint64_t raw = 0;
    if (utils::get_bits(data, 8, 0, 16, Endianness::Little, raw) && raw == 0x2710) {
        result.pass("0|16@1 reads 0x2710");
    } else {
        result.fail("0|16@1 expected 0x2710, got " + std::to_string(raw));
    }

    // 12 bits starting mid-byte: bits 4..15
    const uint8_t data2[2] = {0xB0, 0xA5};
    if (utils::get_bits(data2, 2, 4, 12, Endianness::Little, raw) && raw == 0xA5B) {
        result.pass("4|12@1 crosses the byte boundary");
    } else {
        result.fail("4|12@1 expected 0xA5B, got " + std::to_string(raw));
    }
}

// ============================================================================
// Test 2: Motorola walk
// ============================================================================
void test_motorola_walk(TestResult& result) {
    std::cout << "\n" << COLOR_YELLOW << "Test 2: Motorola sawtooth walk" << COLOR_RESET << "\n";

    // 7|16@0: MSB at bit 7 of byte 0, continues at bit 15 (MSB of byte 1)
    const uint8_t data[2] = {0x27, 0x10};
    uint64_t raw = 0;
    if (utils::get_bits(data, 2, 7, 16, Endianness::Big, raw) && raw == 0x2710) {
        result.pass("7|16@0 reads 0x2710 from big-endian bytes");
    } else {
        result.fail("7|16@0 expected 0x2710, got " + std::to_string(raw));
    }

    // 3|12@0 covers bits 3..0 of byte 0 then 15..8
    std::vector<int> pos = utils::field_bit_positions(3, 12, Endianness::Big);
    std::vector<int> expected = {8, 9, 10, 11, 12, 13, 14, 15, 0, 1, 2, 3};
    if (pos == expected) {
        result.pass("3|12@0 bit positions follow the sawtooth");
    } else {
        result.fail("3|12@0 bit positions wrong");
    }

    if (utils::required_bytes(3, 12, Endianness::Big) == 2) {
        result.pass("3|12@0 needs 2 bytes");
    } else {
        result.fail("3|12@0 byte count wrong");
    }
}

// ============================================================================
// Test 3: Payload bounds
// ============================================================================
void test_bounds(TestResult& result) {
    std::cout << "\n" << COLOR_YELLOW << "Test 3: Payload bounds" << COLOR_RESET << "\n";

    const uint8_t data[1] = {0x10};
    uint64_t raw = 0;
    if (!utils::get_bits(data, 1, 0, 16, Endianness::Little, raw)) {
        result.pass("16-bit field rejected on a 1-byte payload");
    } else {
        result.fail("16-bit field read past the payload");
    }

    if (utils::required_bytes(56, 8, Endianness::Little) == 8 &&
        utils::required_bytes(0, 0, Endianness::Little) == 0 &&
        utils::required_bytes(0, 65, Endianness::Little) == 0) {
        result.pass("required_bytes handles last byte and invalid lengths");
    } else {
        result.fail("required_bytes edge cases wrong");
    }

    uint8_t buf[8] = {0};
    if (!utils::set_bits(buf, 4, 24, 16, Endianness::Little, 1)) {
        result.pass("set_bits refuses a field past the buffer");
    } else {
        result.fail("set_bits wrote past the buffer");
    }
}

// ============================================================================
// Test 4: Insert masks and preserves neighbours
// ============================================================================
void test_set_bits(TestResult& result) {
    std::cout << "\n" << COLOR_YELLOW << "Test 4: Insert" << COLOR_RESET << "\n";

    uint8_t buf[2] = {0xFF, 0xFF};
    utils::set_bits(buf, 2, 4, 8, Endianness::Little, 0x1A5);  // masked to 0xA5
    if (buf[0] == 0x5F && buf[1] == 0xFA) {
        result.pass("Value masked to 8 bits, neighbouring bits untouched");
    } else {
        result.fail("Unexpected bytes after insert");
    }

    uint8_t be[8] = {0};
    uint64_t raw = 0;
    utils::set_bits(be, 8, 23, 20, Endianness::Big, 0xABCDE);
    if (utils::get_bits(be, 8, 23, 20, Endianness::Big, raw) && raw == 0xABCDE) {
        result.pass("Motorola 23|20 insert reads back");
    } else {
        result.fail("Motorola 23|20 read back mismatch");
    }

    uint8_t full[8] = {0};
    utils::set_bits(full, 8, 0, 64, Endianness::Little, 0x0123456789ABCDEFULL);
    if (utils::get_bits(full, 8, 0, 64, Endianness::Little, raw) &&
        raw == 0x0123456789ABCDEFULL && full[0] == 0xEF && full[7] == 0x01) {
        result.pass("Full 64-bit Intel field");
    } else {
        result.fail("Full 64-bit Intel field mismatch");
    }
}

// ============================================================================
// Test 5: Sign extension
// ============================================================================
void test_sign_extend(TestResult& result) {
    std::cout << "\n" << COLOR_YELLOW << "Test 5: Sign extension" << COLOR_RESET << "\n";

    if (utils::sign_extend(0xFF, 8) == -1 &&
        utils::sign_extend(0x7F, 8) == 127 &&
        utils::sign_extend(0x800, 12) == -2048 &&
        utils::sign_extend(0xFFFFFFFFFFFFFFFFULL, 64) == -1) {
        result.pass("Two's complement widths 8, 12 and 64");
    } else {
        result.fail("sign_extend returned wrong values");
    }
}

int main() {
    std::cout << "\n";
    std::cout << "╔══════════════════════════════════════════════════════════════╗\n";
    std::cout << "║              Bit Packing Unit Tests                         ║\n";
    std::cout << "╚══════════════════════════════════════════════════════════════╝\n";

    TestResult result;

    test_intel_16bit(result);
    test_motorola_walk(result);
    test_bounds(result);
    test_set_bits(result);
    test_sign_extend(result);

    result.summary();

    return (result.failed == 0) ? 0 : 1;
}
