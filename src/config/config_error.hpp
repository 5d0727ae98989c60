// src/config/config_error.hpp
#pragma once

#include <stdexcept>
#include <string>

namespace config {

// Fatal at session start: a required input (unit mapping, session YAML) is
// missing, unreadable or malformed.
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace config
