// src/units/unit_normalizer.hpp
#pragma once

#include <optional>
#include <string>

#include "dbc/dbc_catalog.hpp"
#include "units/unit_mapping.hpp"
#include "units/warning_sink.hpp"

namespace units {

// Result of one lookup. On a miss the declared unit passes through,
// mapped is false and the warning is set; the caller decides where it goes.
struct NormalizedUnit {
    std::string unit;
    bool mapped = false;
    std::optional<UnitWarning> warning;
};

class UnitNormalizer {
public:
    explicit UnitNormalizer(UnitMapping mapping);

    // Exact key, then trimmed + lowercased key, then pass-through.
    // An empty declared unit maps to an empty unit without a warning.
    NormalizedUnit normalize(const std::string& declared) const;

    // Resolves every signal's canonical unit once; one warning per unmapped
    // signal goes to the sink. Returns the number of unmapped signals.
    size_t annotate(dbc::Catalog& catalog, WarningSink& sink) const;

    const UnitMapping& mapping() const { return mapping_; }

private:
    UnitMapping mapping_;
};

} // namespace units
