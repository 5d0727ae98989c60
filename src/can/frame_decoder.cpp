// src/can/frame_decoder.cpp
#include "can/frame_decoder.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>

#include "utils/bitpack.hpp"

namespace can {

namespace {

std::string hex_id(uint32_t id) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "0x%X", id);
    return buf;
}

} // namespace

UnknownMessage::UnknownMessage(uint32_t message_id)
    : FrameError(message_id, "[FrameDecoder] Unknown message " + hex_id(message_id))
{
}

TruncatedFrame::TruncatedFrame(uint32_t message_id, const std::string& signal_name,
                               size_t required, size_t actual)
    : FrameError(message_id,
                 "[FrameDecoder] Truncated frame " + hex_id(message_id) + ": signal " + signal_name +
                 " needs " + std::to_string(required) + " bytes, payload has " + std::to_string(actual))
    , signal_name_(signal_name)
    , required_(required)
    , actual_(actual)
{
}

FrameDecoder::FrameDecoder(std::shared_ptr<const dbc::Catalog> catalog)
    : catalog_(std::move(catalog))
{
    if (!catalog_) {
        throw std::invalid_argument("[FrameDecoder] catalog must not be null");
    }
}

std::vector<SignalObservation> FrameDecoder::decode(const Frame& frame) const {
    const dbc::Message* msg = catalog_->find(frame.id, frame.extended);
    if (!msg) {
        throw UnknownMessage(dbc::normalize_id(frame.id));
    }
    return decode_message(*msg, frame);
}

double FrameDecoder::to_physical(const dbc::Signal& sig, uint64_t raw) {
    double base = 0.0;
    switch (sig.value_type) {
    case dbc::ValueType::Float32: {
        const uint32_t bits = static_cast<uint32_t>(raw);
        float f = 0.0f;
        std::memcpy(&f, &bits, sizeof(f));
        base = static_cast<double>(f);
        break;
    }
    case dbc::ValueType::Float64: {
        double d = 0.0;
        std::memcpy(&d, &raw, sizeof(d));
        base = d;
        break;
    }
    case dbc::ValueType::Integer:
    default:
        if (sig.is_signed) {
            base = static_cast<double>(utils::sign_extend(raw, sig.bit_length));
        } else {
            base = static_cast<double>(raw);
        }
        break;
    }
    return base * sig.factor + sig.offset;
}

bool FrameDecoder::is_out_of_range(const dbc::Signal& sig, double value) {
    if (!sig.has_range)
        return false;
    if (std::isnan(value))
        return true;

    // Tolerate the last-digit error of raw * factor
    const double lo_eps = 1e-9 * std::max(1.0, std::fabs(sig.min));
    const double hi_eps = 1e-9 * std::max(1.0, std::fabs(sig.max));
    return value < sig.min - lo_eps || value > sig.max + hi_eps;
}

std::vector<SignalObservation> FrameDecoder::decode_message(const dbc::Message& msg, const Frame& frame) {
    const uint8_t* data = frame.data.data();
    const size_t len = frame.data.size();

    // Resolve the active group first
    const std::vector<size_t>* group = nullptr;
    if (msg.mux.is_multiplexed()) {
        const dbc::Signal& mux_sig = msg.signals[static_cast<size_t>(msg.mux.multiplexer)];
        uint64_t mux_raw = 0;
        if (!utils::get_bits(data, len, mux_sig.start_bit, mux_sig.bit_length, mux_sig.endianness, mux_raw)) {
            throw TruncatedFrame(msg.id, mux_sig.name, mux_sig.required_bytes(), len);
        }
        auto it = msg.mux.groups.find(mux_raw);
        if (it != msg.mux.groups.end())
            group = &it->second;
    }

    std::vector<const dbc::Signal*> active;
    active.reserve(msg.signals.size());
    for (size_t i = 0; i < msg.signals.size(); ++i) {
        const dbc::Signal& sig = msg.signals[i];
        if (sig.mux_role == dbc::MuxRole::Multiplexed) {
            if (!group)
                continue;
            bool in_group = false;
            for (size_t idx : *group) {
                if (idx == i) {
                    in_group = true;
                    break;
                }
            }
            if (!in_group)
                continue;
        }
        active.push_back(&sig);
    }

    // All-or-nothing: a frame that cannot cover every active signal yields nothing
    for (const dbc::Signal* sig : active) {
        const size_t need = sig->required_bytes();
        if (need > len) {
            throw TruncatedFrame(msg.id, sig->name, need, len);
        }
    }

    std::vector<SignalObservation> out;
    out.reserve(active.size());

    for (const dbc::Signal* sig : active) {
        uint64_t raw = 0;
        if (!utils::get_bits(data, len, sig->start_bit, sig->bit_length, sig->endianness, raw)) {
            throw TruncatedFrame(msg.id, sig->name, sig->required_bytes(), len);
        }

        SignalObservation obs;
        obs.message_id = msg.id;
        obs.message_name = msg.name;
        obs.signal_name = sig->name;
        obs.raw_value = raw;
        obs.value = to_physical(*sig, raw);
        obs.unit = sig->canonical_unit;
        obs.unit_mapped = sig->unit_mapped;
        obs.out_of_range = is_out_of_range(*sig, obs.value);
        obs.timestamp_ns = frame.timestamp_ns;
        obs.ecu = msg.transmitter;
        out.push_back(std::move(obs));
    }

    return out;
}

} // namespace can
