// src/units/unit_mapping.cpp
#include "units/unit_mapping.hpp"

#include <cctype>
#include <fstream>

#include <yaml-cpp/yaml.h>

#include "utils/logging.hpp"

namespace units {

namespace {

void collect_entries(const YAML::Node& root, const std::string& origin,
                     std::vector<std::pair<std::string, std::string>>& entries) {
    if (!root || root.IsNull()) {
        throw config::ConfigurationError("[UnitMapping] Empty mapping: " + origin);
    }
    if (!root.IsMap()) {
        throw config::ConfigurationError("[UnitMapping] Mapping must be a key/value object: " + origin);
    }

    for (const auto& kv : root) {
        if (!kv.first.IsScalar() || !kv.second.IsScalar()) {
            throw config::ConfigurationError(
                "[UnitMapping] Non-scalar entry in " + origin + " (key '" +
                (kv.first.IsScalar() ? kv.first.Scalar() : std::string("?")) + "')");
        }
        entries.emplace_back(kv.first.Scalar(), kv.second.Scalar());
    }
}

} // namespace

std::string UnitMapping::normalize_key(const std::string& s) {
    size_t b = 0;
    while (b < s.size() && std::isspace(static_cast<unsigned char>(s[b])))
        b++;
    size_t e = s.size();
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])))
        e--;

    std::string out;
    out.reserve(e - b);
    for (size_t i = b; i < e; ++i)
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(s[i]))));
    return out;
}

UnitMapping UnitMapping::load(const std::string& path) {
    std::ifstream file_check(path);
    if (!file_check.good()) {
        throw config::ConfigurationError("[UnitMapping] Unit mapping file not found: " + path);
    }
    file_check.close();

    LOG_INFO("[UnitMapping] Loading unit mapping from: %s", path.c_str());

    std::vector<std::pair<std::string, std::string>> entries;
    try {
        collect_entries(YAML::LoadFile(path), path, entries);
    } catch (const YAML::Exception& e) {
        throw config::ConfigurationError(
            std::string("[UnitMapping] Parse error in ") + path + ": " + e.what());
    }

    UnitMapping mapping;
    for (const auto& kv : entries)
        mapping.insert(kv.first, kv.second, path);

    LOG_INFO("[UnitMapping] Loaded %zu unit mappings", mapping.size());
    return mapping;
}

UnitMapping UnitMapping::parse(const std::string& text, const std::string& origin) {
    std::vector<std::pair<std::string, std::string>> entries;
    try {
        collect_entries(YAML::Load(text), origin, entries);
    } catch (const YAML::Exception& e) {
        throw config::ConfigurationError(
            std::string("[UnitMapping] Parse error in ") + origin + ": " + e.what());
    }

    UnitMapping mapping;
    for (const auto& kv : entries)
        mapping.insert(kv.first, kv.second, origin);
    return mapping;
}

UnitMapping UnitMapping::from_entries(const std::vector<std::pair<std::string, std::string>>& entries) {
    UnitMapping mapping;
    for (const auto& kv : entries)
        mapping.insert(kv.first, kv.second, "<entries>");
    return mapping;
}

void UnitMapping::insert(const std::string& key, const std::string& value, const std::string& origin) {
    if (key.empty()) {
        throw config::ConfigurationError("[UnitMapping] Empty unit key in " + origin);
    }
    if (!exact_.emplace(key, value).second) {
        throw config::ConfigurationError("[UnitMapping] Duplicate unit key '" + key + "' in " + origin);
    }

    const std::string norm = normalize_key(key);
    if (!normalized_.emplace(norm, value).second) {
        LOG_DEBUG("[UnitMapping] '%s' shadowed by an earlier key for lookup '%s'",
                  key.c_str(), norm.c_str());
    }
}

const std::string* UnitMapping::find_exact(const std::string& declared) const {
    auto it = exact_.find(declared);
    return (it == exact_.end()) ? nullptr : &it->second;
}

const std::string* UnitMapping::find_normalized(const std::string& declared) const {
    auto it = normalized_.find(normalize_key(declared));
    return (it == normalized_.end()) ? nullptr : &it->second;
}

} // namespace units
