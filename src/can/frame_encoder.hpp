// src/can/frame_encoder.hpp
#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>

#include "can/frame.hpp"
#include "dbc/dbc_catalog.hpp"

namespace can {

// Physical values by signal name
using SignalValues = std::unordered_map<std::string, double>;

/**
 * FrameEncoder - Builds payloads from physical values
 *
 * Inverse of FrameDecoder, used to synthesise traffic and to check decode
 * round trips.
 */
class FrameEncoder {
public:
    // Encode a frame for msg from physical values (missing values use 0,
    // or the declared min when 0 is outside the range)
    // - Clamps to [min,max] when a range is declared
    // - Applies factor/offset and rounds to the nearest raw step
    // - For multiplexed messages, writes mux_value into the multiplexer and
    //   encodes only the signals of that group
    static Frame encode(const dbc::Message& msg, const SignalValues& values,
                        uint64_t mux_value = 0, int64_t timestamp_ns = 0);

    // Physical → raw bit pattern for one signal
    static uint64_t to_raw(const dbc::Signal& sig, double physical);

    // Convenience
    static bool has(const SignalValues& m, const std::string& key);
    static double get_or(const SignalValues& m, const std::string& key, double fallback);

private:
    static double clamp(double v, double lo, double hi);
    static int64_t round_to_i64(double v);
};

} // namespace can
