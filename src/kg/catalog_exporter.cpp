// src/kg/catalog_exporter.cpp
#include "kg/catalog_exporter.hpp"

#include <algorithm>
#include <filesystem>
#include <set>

#include "kg/signal_log_record.hpp"
#include "utils/csv.hpp"
#include "utils/logging.hpp"

namespace kg {

namespace fs = std::filesystem;

namespace {

std::string encoding_name(const dbc::Signal& sig) {
    return sig.name + "Encoding";
}

} // namespace

int Table::column(const std::string& col) const {
    for (size_t i = 0; i < columns.size(); ++i) {
        if (columns[i] == col)
            return static_cast<int>(i);
    }
    return -1;
}

CatalogExporter::CatalogExporter(std::string platform, std::string sensor)
    : platform_(std::move(platform))
    , sensor_(std::move(sensor))
{
}

std::string CatalogExporter::join(const std::vector<std::string>& values) {
    std::string out;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0)
            out += ", ";
        out += values[i];
    }
    return out;
}

std::vector<std::string> CatalogExporter::split(const std::string& cell) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        const size_t comma = cell.find(',', start);
        std::string part = cell.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
        utils::CsvReader::trim_inplace(part);
        out.push_back(part);
        if (comma == std::string::npos)
            break;
        start = comma + 1;
    }
    return out;
}

std::vector<std::vector<std::string>> CatalogExporter::explode_row(const std::vector<std::string>& row) {
    std::vector<std::vector<std::string>> parts;
    parts.reserve(row.size());
    size_t n = 1;
    for (const auto& cell : row) {
        parts.push_back(split(cell));
        n = std::max(n, parts.back().size());
    }

    std::vector<std::vector<std::string>> out(n, std::vector<std::string>(row.size()));
    for (size_t r = 0; r < n; ++r) {
        for (size_t c = 0; c < row.size(); ++c) {
            const auto& values = parts[c];
            if (values.size() == 1)
                out[r][c] = values[0];
            else if (r < values.size())
                out[r][c] = values[r];
        }
    }
    return out;
}

Table CatalogExporter::signal_table(const dbc::Catalog& catalog) const {
    Table t;
    t.name = "Signal";
    t.columns = {"Individual", "rdf:type", "dbc:decodedVia", "dbc:hasReceiver",
                 "dbc:isPartOf", "qudt:hasUnit", "sosa:isObservedBy"};

    for (const auto& msg : catalog.messages()) {
        for (const auto& sig : msg.signals) {
            t.rows.push_back({
                sig.name,
                "dbc:Signal",
                encoding_name(sig),
                join(sig.receivers),
                msg.name,
                sig.canonical_unit,
                sensor_,
            });
        }
    }
    return t;
}

Table CatalogExporter::message_table(const dbc::Catalog& catalog) const {
    Table t;
    t.name = "Message";
    t.columns = {"Individual", "rdf:type", "dbc:dataLength", "dbc:encodedVia",
                 "dbc:hasDecID", "dbc:hasSignal", "dbc:hasTransmitter", "sosa:isObservedBy"};

    for (const auto& msg : catalog.messages()) {
        std::vector<std::string> names;
        std::vector<std::string> encodings;
        for (const auto& sig : msg.signals) {
            names.push_back(sig.name);
            encodings.push_back(encoding_name(sig));
        }
        t.rows.push_back({
            msg.name,
            "dbc:Message",
            std::to_string(msg.length),
            join(encodings),
            std::to_string(msg.id),
            join(names),
            msg.transmitter,
            sensor_,
        });
    }
    return t;
}

Table CatalogExporter::encoding_table(const dbc::Catalog& catalog) const {
    Table t;
    t.name = "SignalEncoding";
    t.columns = {"Individual", "rdf:type", "dbc:bitLenght", "dbc:bitStart", "dbc:signed",
                 "qudt:byteOrder", "qudt:conversionMultiplier", "qudt:conversionOffset",
                 "qudt:maxInclusive", "qudt:minInclusive"};

    for (const auto& msg : catalog.messages()) {
        for (const auto& sig : msg.signals) {
            t.rows.push_back({
                encoding_name(sig),
                "dbc:SignalEncoding",
                std::to_string(sig.bit_length),
                std::to_string(sig.start_bit),
                sig.is_signed ? "true" : "false",
                sig.endianness == utils::Endianness::Little ? "LittleEndian" : "BigEndian",
                format_value(sig.factor),
                format_value(sig.offset),
                sig.has_range ? format_value(sig.max) : "",
                sig.has_range ? format_value(sig.min) : "",
            });
        }
    }
    return t;
}

Table CatalogExporter::node_table(const dbc::Catalog& catalog) const {
    Table t;
    t.name = "Node";
    t.columns = {"Individual", "rdf:type"};

    std::set<std::string> names(catalog.nodes.begin(), catalog.nodes.end());
    for (const auto& name : names)
        t.rows.push_back({name, "dbc:Node"});
    return t;
}

Table CatalogExporter::platform_table() const {
    Table t;
    t.name = "Platform";
    t.columns = {"Individual", "rdf:type", "sosa:hosts"};
    t.rows.push_back({platform_, "sosa:Platform", sensor_});
    return t;
}

Table CatalogExporter::sensor_table(const dbc::Catalog& catalog) const {
    Table t;
    t.name = "Sensor";
    t.columns = {"Individual", "rdf:type", "sosa:isHostedBy", "sosa:madeObservation", "sosa:observes"};

    std::vector<std::string> observed;
    for (const auto& msg : catalog.messages())
        observed.push_back(msg.name);

    t.rows.push_back({sensor_, "sosa:Sensor", platform_, "NA", join(observed)});
    return t;
}

std::vector<Table> CatalogExporter::export_tables(const dbc::Catalog& catalog) const {
    return {
        signal_table(catalog),
        message_table(catalog),
        encoding_table(catalog),
        node_table(catalog),
        platform_table(),
        sensor_table(catalog),
    };
}

bool CatalogExporter::write_tables(const std::vector<Table>& tables, const std::string& dir) const {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        LOG_ERROR("[CatalogExporter] Cannot create %s: %s", dir.c_str(), ec.message().c_str());
        return false;
    }

    for (const auto& table : tables) {
        const std::string path = (fs::path(dir) / (table.name + ".csv")).string();
        utils::CsvWriter csv(';');
        if (!csv.open(path)) {
            LOG_ERROR("[CatalogExporter] Cannot write %s", path.c_str());
            return false;
        }

        csv.write_row(table.columns);
        size_t written = 0;
        for (const auto& row : table.rows) {
            for (const auto& exploded : explode_row(row)) {
                csv.write_row(exploded);
                ++written;
            }
        }
        csv.close();
        LOG_INFO("[CatalogExporter] Sheet '%s' exported to '%s' (%zu rows)",
                 table.name.c_str(), path.c_str(), written);
    }
    return true;
}

} // namespace kg
