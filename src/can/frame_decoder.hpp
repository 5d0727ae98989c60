// src/can/frame_decoder.hpp
#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "can/frame.hpp"
#include "dbc/dbc_catalog.hpp"

namespace can {

// Per-frame decode failure. The session keeps going with the next frame.
class FrameError : public std::runtime_error {
public:
    FrameError(uint32_t message_id, const std::string& what)
        : std::runtime_error(what), message_id_(message_id) {}

    uint32_t message_id() const { return message_id_; }

private:
    uint32_t message_id_;
};

// Identifier not present in the catalog
class UnknownMessage : public FrameError {
public:
    explicit UnknownMessage(uint32_t message_id);
};

// Payload too short for a signal that is active in this frame
class TruncatedFrame : public FrameError {
public:
    TruncatedFrame(uint32_t message_id, const std::string& signal_name,
                   size_t required, size_t actual);

    const std::string& signal_name() const { return signal_name_; }
    size_t required_bytes() const { return required_; }
    size_t actual_bytes() const { return actual_; }

private:
    std::string signal_name_;
    size_t required_;
    size_t actual_;
};

/**
 * FrameDecoder - Turns frames into signal observations
 *
 * Holds the session catalog read-only; decode() is const and touches no
 * shared mutable state, so one decoder may serve many threads.
 *
 * Units come from the catalog annotation (units::UnitNormalizer::annotate).
 */
class FrameDecoder {
public:
    explicit FrameDecoder(std::shared_ptr<const dbc::Catalog> catalog);

    // Observations for every active signal, in catalog order.
    // @throws UnknownMessage, TruncatedFrame
    std::vector<SignalObservation> decode(const Frame& frame) const;

    // Same, for an already resolved message
    // @throws TruncatedFrame
    static std::vector<SignalObservation> decode_message(const dbc::Message& msg, const Frame& frame);

    // Raw bit pattern → physical value (integer or IEEE float per the signal)
    static double to_physical(const dbc::Signal& sig, uint64_t raw);

    static bool is_out_of_range(const dbc::Signal& sig, double value);

    const dbc::Catalog& catalog() const { return *catalog_; }

private:
    std::shared_ptr<const dbc::Catalog> catalog_;
};

} // namespace can
