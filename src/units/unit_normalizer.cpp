// src/units/unit_normalizer.cpp
#include "units/unit_normalizer.hpp"

#include "utils/logging.hpp"

namespace units {

UnitNormalizer::UnitNormalizer(UnitMapping mapping)
    : mapping_(std::move(mapping))
{
}

NormalizedUnit UnitNormalizer::normalize(const std::string& declared) const {
    NormalizedUnit out;

    if (UnitMapping::normalize_key(declared).empty()) {
        out.unit = "";
        out.mapped = true;
        return out;
    }

    if (const std::string* hit = mapping_.find_exact(declared)) {
        out.unit = *hit;
        out.mapped = true;
        return out;
    }
    if (const std::string* hit = mapping_.find_normalized(declared)) {
        out.unit = *hit;
        out.mapped = true;
        return out;
    }

    out.unit = declared;
    out.mapped = false;
    UnitWarning w;
    w.declared_unit = declared;
    out.warning = w;
    return out;
}

size_t UnitNormalizer::annotate(dbc::Catalog& catalog, WarningSink& sink) const {
    size_t unmapped = 0;
    for (auto& msg : catalog.messages_mutable()) {
        for (auto& sig : msg.signals) {
            NormalizedUnit nu = normalize(sig.unit);
            sig.canonical_unit = nu.unit;
            sig.unit_mapped = nu.mapped;
            if (nu.warning) {
                nu.warning->message_name = msg.name;
                nu.warning->signal_name = sig.name;
                sink.warn(*nu.warning);
                ++unmapped;
            }
        }
    }

    LOG_INFO("[UnitNormalizer] Resolved units for %zu signals (%zu unmapped)",
             catalog.signal_count(), unmapped);
    return unmapped;
}

} // namespace units
