// src/can/frame_encoder.cpp
#include "can/frame_encoder.hpp"

#include <cmath>
#include <cstring>
#include <stdexcept>

#include "utils/bitpack.hpp"

namespace can {

bool FrameEncoder::has(const SignalValues& m, const std::string& key) {
    return m.find(key) != m.end();
}

double FrameEncoder::get_or(const SignalValues& m, const std::string& key, double fallback) {
    auto it = m.find(key);
    return (it == m.end()) ? fallback : it->second;
}

double FrameEncoder::clamp(double v, double lo, double hi) {
    if (lo > hi) return v;
    if (v < lo) return lo;
    if (v > hi) return hi;
    return v;
}

int64_t FrameEncoder::round_to_i64(double v) {
    // symmetric rounding
    return static_cast<int64_t>(std::llround(v));
}

uint64_t FrameEncoder::to_raw(const dbc::Signal& sig, double physical) {
    double eng = physical;
    if (sig.has_range)
        eng = clamp(eng, sig.min, sig.max);

    // raw = (eng - offset) / factor
    const double raw_f = (eng - sig.offset) / sig.factor;

    if (sig.value_type == dbc::ValueType::Float32) {
        const float f = static_cast<float>(raw_f);
        uint32_t bits = 0;
        std::memcpy(&bits, &f, sizeof(bits));
        return bits;
    }
    if (sig.value_type == dbc::ValueType::Float64) {
        uint64_t bits = 0;
        std::memcpy(&bits, &raw_f, sizeof(bits));
        return bits;
    }

    uint64_t raw_u = 0;
    if (sig.is_signed) {
        const int64_t raw_s = round_to_i64(raw_f);
        raw_u = static_cast<uint64_t>(raw_s);
    } else if (raw_f <= 0.0) {
        raw_u = 0;
    } else if (raw_f >= 18446744073709551615.0) {
        raw_u = ~0ULL;
    } else {
        raw_u = static_cast<uint64_t>(std::round(raw_f));
    }

    // mask to bit_length two's complement form
    if (sig.bit_length < 64) {
        const uint64_t mask = (1ULL << sig.bit_length) - 1ULL;
        raw_u &= mask;
    }
    return raw_u;
}

Frame FrameEncoder::encode(const dbc::Message& msg, const SignalValues& values,
                           uint64_t mux_value, int64_t timestamp_ns) {
    Frame out;
    out.id = msg.id;
    out.extended = msg.extended;
    out.timestamp_ns = timestamp_ns;
    out.data.assign(static_cast<size_t>(msg.length), 0);

    for (const auto& sig : msg.signals) {
        uint64_t raw = 0;
        if (sig.mux_role == dbc::MuxRole::Multiplexer) {
            raw = mux_value;
            if (sig.bit_length < 64)
                raw &= (1ULL << sig.bit_length) - 1ULL;
        } else {
            if (sig.mux_role == dbc::MuxRole::Multiplexed && sig.mux_value != mux_value)
                continue;

            double fallback = 0.0;
            if (sig.has_range && (fallback < sig.min || fallback > sig.max))
                fallback = sig.min;
            raw = to_raw(sig, get_or(values, sig.name, fallback));
        }

        if (!utils::set_bits(out.data.data(), out.data.size(),
                             sig.start_bit, sig.bit_length, sig.endianness, raw)) {
            throw std::out_of_range("[FrameEncoder] signal " + sig.name +
                                    " does not fit message " + msg.name);
        }
    }
    return out;
}

} // namespace can
