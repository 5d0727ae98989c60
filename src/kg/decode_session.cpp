// src/kg/decode_session.cpp
#include "kg/decode_session.hpp"

#include <algorithm>
#include <thread>

#include "dbc/dbc_parser.hpp"
#include "units/unit_mapping.hpp"
#include "units/unit_normalizer.hpp"
#include "utils/logging.hpp"

namespace kg {

// Below this many frames per worker threads cost more than they save
static constexpr size_t kMinFramesPerWorker = 256;

const char* to_string(FrameOutcome::Status s) {
    switch (s) {
        case FrameOutcome::Status::Decoded:        return "Decoded";
        case FrameOutcome::Status::UnknownMessage: return "UnknownMessage";
        case FrameOutcome::Status::TruncatedFrame: return "TruncatedFrame";
    }
    return "?";
}

std::unique_ptr<DecodeSession> DecodeSession::open(const config::SessionConfig& cfg,
                                                   units::WarningSink& warnings) {
    LOG_INFO("[Session] Opening: dbc=%s units=%s", cfg.dbc_file.c_str(),
             cfg.unit_mapping_file.c_str());

    units::UnitNormalizer normalizer(units::UnitMapping::load(cfg.unit_mapping_file));

    dbc::Catalog catalog = dbc::DbcParser::load(cfg.dbc_file);
    const size_t unmapped = normalizer.annotate(catalog, warnings);

    auto shared = std::make_shared<const dbc::Catalog>(std::move(catalog));
    auto session = std::make_unique<DecodeSession>(shared, cfg.workers);
    session->unmapped_signals_ = unmapped;

    LOG_INFO("[Session] Ready: %zu messages, %zu signals (%zu unmapped units), %d worker(s)",
             shared->size(), shared->signal_count(), unmapped, session->workers_);
    return session;
}

DecodeSession::DecodeSession(std::shared_ptr<const dbc::Catalog> catalog, int workers)
    : catalog_(catalog),
      decoder_(catalog),
      workers_(std::max(1, workers))
{
}

FrameOutcome DecodeSession::decode_one(const can::Frame& frame) {
    FrameOutcome out;
    try {
        out.observations = decoder_.decode(frame);
        out.status = FrameOutcome::Status::Decoded;
        frames_decoded_.fetch_add(1, std::memory_order_relaxed);
        observations_.fetch_add(out.observations.size(), std::memory_order_relaxed);
    } catch (const can::UnknownMessage& e) {
        out.status = FrameOutcome::Status::UnknownMessage;
        out.error = e.what();
        frames_unknown_.fetch_add(1, std::memory_order_relaxed);
    } catch (const can::TruncatedFrame& e) {
        out.status = FrameOutcome::Status::TruncatedFrame;
        out.error = e.what();
        frames_truncated_.fetch_add(1, std::memory_order_relaxed);
    }
    return out;
}

std::vector<FrameOutcome> DecodeSession::decode_batch(const std::vector<can::Frame>& frames) {
    std::vector<FrameOutcome> outcomes(frames.size());
    if (frames.empty())
        return outcomes;

    size_t threads = std::min<size_t>(static_cast<size_t>(workers_),
                                      (frames.size() + kMinFramesPerWorker - 1) / kMinFramesPerWorker);
    threads = std::max<size_t>(threads, 1);

    if (threads == 1) {
        for (size_t i = 0; i < frames.size(); ++i)
            outcomes[i] = decode_one(frames[i]);
        return outcomes;
    }

    // Contiguous slices, each worker writes only its own outcome slots
    const size_t chunk = (frames.size() + threads - 1) / threads;
    std::vector<std::thread> pool;
    pool.reserve(threads);
    for (size_t t = 0; t < threads; ++t) {
        const size_t begin = t * chunk;
        const size_t end = std::min(frames.size(), begin + chunk);
        if (begin >= end)
            break;
        pool.emplace_back([this, &frames, &outcomes, begin, end]() {
            for (size_t i = begin; i < end; ++i)
                outcomes[i] = decode_one(frames[i]);
        });
    }
    for (auto& th : pool)
        th.join();

    LOG_DEBUG("[Session] Batch of %zu frames on %zu threads", frames.size(), pool.size());
    return outcomes;
}

void DecodeSession::log_stats() const {
    LOG_INFO("[Session] Frames decoded=%llu unknown=%llu truncated=%llu, observations=%llu",
             (unsigned long long)frames_decoded(),
             (unsigned long long)frames_unknown(),
             (unsigned long long)frames_truncated(),
             (unsigned long long)observations());
}

} // namespace kg
