// src/units/unit_mapping.hpp
#pragma once

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "config/config_error.hpp"

namespace units {

/**
 * UnitMapping - Declared unit string → canonical unit identifier
 *
 * File format is a flat JSON object (read with yaml-cpp, so a flat YAML
 * map works too):
 *   { "km/h": "unit:KiloM-PER-HR", "v": "unit:V", "%": "unit:PERCENT" }
 *
 * Loaded once per session and read-only afterwards.
 */
class UnitMapping {
public:
    UnitMapping() = default;

    // @throws config::ConfigurationError (missing, unreadable, malformed)
    static UnitMapping load(const std::string& path);

    // Same rules as load(), from in-memory text
    static UnitMapping parse(const std::string& text, const std::string& origin = "<memory>");

    // @throws config::ConfigurationError on empty or duplicate keys
    static UnitMapping from_entries(const std::vector<std::pair<std::string, std::string>>& entries);

    // Exact key match
    const std::string* find_exact(const std::string& declared) const;

    // Trimmed + lowercased key match
    const std::string* find_normalized(const std::string& declared) const;

    size_t size() const { return exact_.size(); }
    bool empty() const { return exact_.empty(); }

    static std::string normalize_key(const std::string& s);

private:
    void insert(const std::string& key, const std::string& value, const std::string& origin);

    std::unordered_map<std::string, std::string> exact_;
    std::unordered_map<std::string, std::string> normalized_;
};

} // namespace units
