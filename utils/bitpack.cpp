#include "bitpack.hpp"

namespace utils
{

    static inline uint8_t get_bit(const uint8_t *data, int bit_index)
    {
        const int byte_i = bit_index / 8;
        const int bit_i = bit_index % 8; // 0 = LSB
        return (data[byte_i] >> bit_i) & 0x1u;
    }

    static inline void set_bit(uint8_t *data, int bit_index, uint8_t bit_val)
    {
        const int byte_i = bit_index / 8;
        const int bit_i = bit_index % 8;
        const uint8_t mask = static_cast<uint8_t>(1u << bit_i);
        if (bit_val)
            data[byte_i] |= mask;
        else
            data[byte_i] &= static_cast<uint8_t>(~mask);
    }

    std::vector<int> field_bit_positions(int start_bit, int bit_length, Endianness e)
    {
        std::vector<int> positions;
        if (bit_length <= 0 || bit_length > 64 || start_bit < 0)
            return positions;

        positions.resize(static_cast<size_t>(bit_length));

        if (e == Endianness::Little)
        {
            // field bit k is at absolute bit start_bit + k
            for (int k = 0; k < bit_length; ++k)
                positions[static_cast<size_t>(k)] = start_bit + k;
            return positions;
        }

        // Big: start_bit holds the field MSB. Walking towards the LSB goes down
        // inside a byte, then continues at bit 7 of the following byte.
        int pos = start_bit;
        for (int i = 0; i < bit_length; ++i)
        {
            positions[static_cast<size_t>(bit_length - 1 - i)] = pos;
            if (pos % 8 == 0)
                pos += 15;
            else
                pos -= 1;
        }
        return positions;
    }

    size_t required_bytes(int start_bit, int bit_length, Endianness e)
    {
        const std::vector<int> positions = field_bit_positions(start_bit, bit_length, e);
        int max_bit = -1;
        for (int p : positions)
        {
            if (p > max_bit)
                max_bit = p;
        }
        if (max_bit < 0)
            return 0;
        return static_cast<size_t>(max_bit / 8 + 1);
    }

    bool get_bits(const uint8_t *data, size_t data_len,
                  int start_bit, int bit_length, Endianness e,
                  uint64_t &out)
    {
        const size_t need = required_bytes(start_bit, bit_length, e);
        if (need == 0 || need > data_len)
            return false;

        const std::vector<int> positions = field_bit_positions(start_bit, bit_length, e);
        uint64_t value = 0;
        for (int k = 0; k < bit_length; ++k)
        {
            const uint64_t b = static_cast<uint64_t>(get_bit(data, positions[static_cast<size_t>(k)]));
            // out bit k is always LSB-first in returned integer
            value |= (b << k);
        }
        out = value;
        return true;
    }

    bool set_bits(uint8_t *data, size_t data_len,
                  int start_bit, int bit_length, Endianness e,
                  uint64_t value)
    {
        const size_t need = required_bytes(start_bit, bit_length, e);
        if (need == 0 || need > data_len)
            return false;

        // mask value to bit_length
        if (bit_length < 64)
        {
            const uint64_t mask = (1ULL << bit_length) - 1ULL;
            value &= mask;
        }

        const std::vector<int> positions = field_bit_positions(start_bit, bit_length, e);
        for (int k = 0; k < bit_length; ++k)
        {
            const uint8_t b = static_cast<uint8_t>((value >> k) & 0x1ULL);
            set_bit(data, positions[static_cast<size_t>(k)], b);
        }
        return true;
    }

    int64_t sign_extend(uint64_t v, int bit_length)
    {
        if (bit_length <= 0 || bit_length > 64)
            return static_cast<int64_t>(v);
        if (bit_length == 64)
            return static_cast<int64_t>(v);

        const uint64_t sign_bit = 1ULL << (bit_length - 1);
        if (v & sign_bit)
        {
            const uint64_t mask = (~0ULL) << bit_length;
            v |= mask;
        }
        return static_cast<int64_t>(v);
    }

} // namespace utils
