// src/kg/catalog_exporter.hpp
#pragma once

#include <string>
#include <vector>

#include "dbc/dbc_catalog.hpp"

namespace kg {

// Named table, cells as text. Multi-valued cells are joined with ", ".
struct Table {
    std::string name;
    std::vector<std::string> columns;
    std::vector<std::vector<std::string>> rows;

    int column(const std::string& col) const;
};

/**
 * CatalogExporter - Tabular snapshot of the catalog for the mapping layer
 *
 * Produced once per DBC load. Column names are the mapping layer's
 * bindings and must not change (dbc:bitLenght included).
 *
 *   Signal          one row per signal, with the canonical unit
 *   Message         one row per message
 *   SignalEncoding  bit layout and scaling per signal
 *   Node            every transmitter / receiver
 *   Platform        the bus platform hosting the sniffing sensor
 *   Sensor          the sniffing sensor and the messages it observes
 */
class CatalogExporter {
public:
    CatalogExporter(std::string platform, std::string sensor);

    Table signal_table(const dbc::Catalog& catalog) const;
    Table message_table(const dbc::Catalog& catalog) const;
    Table encoding_table(const dbc::Catalog& catalog) const;
    Table node_table(const dbc::Catalog& catalog) const;
    Table platform_table() const;
    Table sensor_table(const dbc::Catalog& catalog) const;

    // All six, in the order above
    std::vector<Table> export_tables(const dbc::Catalog& catalog) const;

    // <dir>/<Table>.csv, ';' separated, multi-valued cells exploded into
    // one row per value. Creates dir. False on any I/O failure.
    bool write_tables(const std::vector<Table>& tables, const std::string& dir) const;

    // Lists paired by index, single values broadcast to every row
    static std::vector<std::vector<std::string>> explode_row(const std::vector<std::string>& row);

    static std::string join(const std::vector<std::string>& values);
    static std::vector<std::string> split(const std::string& cell);

private:
    std::string platform_;
    std::string sensor_;
};

} // namespace kg
