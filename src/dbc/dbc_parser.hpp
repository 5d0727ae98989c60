// src/dbc/dbc_parser.hpp
#pragma once

#include <stdexcept>
#include <string>

#include "dbc/dbc_catalog.hpp"

namespace dbc {

// DBC text violates a structural assumption (bad bit range, overlapping
// signals, unparseable BO_/SG_ line, ...). Fatal to session start.
class MalformedCatalog : public std::runtime_error {
public:
    MalformedCatalog(int line, const std::string& construct, const std::string& detail);

    // 1-based line in the DBC text, 0 when the error is not tied to a line
    int line() const { return line_; }
    const std::string& construct() const { return construct_; }

private:
    int line_;
    std::string construct_;
};

/**
 * DbcParser - Builds a Catalog from DBC source text
 *
 * Only the constructs needed for decoding are interpreted:
 *   BU_            node list
 *   BO_            message (id, name, length, transmitter)
 *   SG_            signal (layout, scaling, range, unit, receivers, M / mN)
 *   SIG_VALTYPE_   IEEE float signals
 * Everything else (CM_, BA_*, VAL_*, NS_ block, ...) is skipped.
 *
 * Every message is validated before it enters the catalog: bit ranges must
 * fit the declared length and signals must not overlap within a multiplex
 * context. No partial catalog is ever returned.
 */
class DbcParser {
public:
    // @throws MalformedCatalog
    static Catalog parse(const std::string& text);

    // @throws config::ConfigurationError if the file cannot be read
    // @throws MalformedCatalog
    static Catalog load(const std::string& path);
};

} // namespace dbc
