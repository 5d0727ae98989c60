#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace utils
{

    // Bit numbering convention: absolute index = byte * 8 + bit
    // - index 0 is the LSB of byte[0]
    // - index 7 is the MSB of byte[0]
    // - index 8 is the LSB of byte[1]
    // etc. This is the numbering DBC files use for start bits.
    enum class Endianness
    {
        Little, // Intel: start bit is the field LSB, bits ascend through the payload
        Big     // Motorola: start bit is the field MSB, bits walk the DBC "sawtooth"
    };

    // Absolute bit index of every field bit, LSB of the field first.
    // Empty if bit_length is outside 1..64 or start_bit is negative.
    std::vector<int> field_bit_positions(int start_bit, int bit_length, Endianness e);

    // Smallest payload size (bytes) that covers the field, 0 if the field is invalid
    size_t required_bytes(int start_bit, int bit_length, Endianness e);

    // Read up to 64 bits; false if the field does not fit in data_len bytes
    bool get_bits(const uint8_t *data, size_t data_len,
                  int start_bit, int bit_length, Endianness e,
                  uint64_t &out);

    // Write up to 64 bits (value is masked to bit_length)
    bool set_bits(uint8_t *data, size_t data_len,
                  int start_bit, int bit_length, Endianness e,
                  uint64_t value);

    // Helpers for signed conversion
    int64_t sign_extend(uint64_t v, int bit_length);

} // namespace utils
