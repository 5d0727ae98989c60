// src/kg/decode_session.hpp
#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "can/frame.hpp"
#include "can/frame_decoder.hpp"
#include "config/session_config.hpp"
#include "dbc/dbc_catalog.hpp"
#include "units/warning_sink.hpp"

namespace kg {

// Result of decoding one frame. Errors stay with their frame.
struct FrameOutcome {
    enum class Status { Decoded, UnknownMessage, TruncatedFrame };

    Status status = Status::Decoded;
    std::vector<can::SignalObservation> observations;
    std::string error;

    bool ok() const { return status == Status::Decoded; }
};

const char* to_string(FrameOutcome::Status s);

/**
 * DecodeSession - One catalog, one unit mapping, many frames
 *
 * open() does all the fallible setup: unit mapping, DBC parse and unit
 * annotation. After that the catalog is shared read-only and
 * decode_batch() may be called from any thread.
 */
class DecodeSession {
public:
    // @throws config::ConfigurationError (unit mapping or DBC unreadable)
    // @throws dbc::MalformedCatalog
    static std::unique_ptr<DecodeSession> open(const config::SessionConfig& cfg,
                                               units::WarningSink& warnings);

    // Build around an already annotated catalog
    DecodeSession(std::shared_ptr<const dbc::Catalog> catalog, int workers);

    DecodeSession(const DecodeSession&) = delete;
    DecodeSession& operator=(const DecodeSession&) = delete;

    // One outcome per frame, same order as the input
    std::vector<FrameOutcome> decode_batch(const std::vector<can::Frame>& frames);

    FrameOutcome decode_one(const can::Frame& frame);

    const dbc::Catalog& catalog() const { return *catalog_; }
    std::shared_ptr<const dbc::Catalog> shared_catalog() const { return catalog_; }
    const can::FrameDecoder& decoder() const { return decoder_; }

    int workers() const { return workers_; }
    size_t unmapped_signals() const { return unmapped_signals_; }

    // Counters
    uint64_t frames_decoded() const { return frames_decoded_.load(); }
    uint64_t frames_unknown() const { return frames_unknown_.load(); }
    uint64_t frames_truncated() const { return frames_truncated_.load(); }
    uint64_t observations() const { return observations_.load(); }

    void log_stats() const;

private:
    std::shared_ptr<const dbc::Catalog> catalog_;
    can::FrameDecoder decoder_;
    int workers_;
    size_t unmapped_signals_ = 0;

    std::atomic<uint64_t> frames_decoded_{0};
    std::atomic<uint64_t> frames_unknown_{0};
    std::atomic<uint64_t> frames_truncated_{0};
    std::atomic<uint64_t> observations_{0};
};

} // namespace kg
