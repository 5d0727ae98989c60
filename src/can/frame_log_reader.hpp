// src/can/frame_log_reader.hpp
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "can/frame.hpp"
#include "utils/csv.hpp"

namespace can {

/**
 * FrameLogReader - Replays recorded bus traffic from CSV
 *
 * Expected header (extra columns are ignored):
 *   timestamp,busChannel,ide,data
 *
 *   timestamp   epoch seconds ("1718000000.125") or UTC date-time
 *               ("2024-06-10 06:13:20.125", 'T' separator and 'Z' accepted)
 *   busChannel  free text, copied to Frame::bus_channel
 *   ide         hex identifier, optional 0x prefix; > 0x7FF means extended
 *   data        hex payload, two digits per byte, spaces ignored
 *
 * The file stem names the sensor (raw/2024/06/10/can2_sniffer.csv →
 * "can2_sniffer"). Malformed rows are skipped with a warning.
 */
class FrameLogReader {
public:
    FrameLogReader() = default;

    FrameLogReader(const FrameLogReader&) = delete;
    FrameLogReader& operator=(const FrameLogReader&) = delete;

    bool open(const std::string& path);

    // Next well-formed frame; false at end of file
    bool next(Frame& out);

    std::vector<Frame> read_all();

    const std::string& path() const { return path_; }
    const std::string& sensor() const { return sensor_; }
    size_t rows_read() const { return rows_read_; }
    size_t rows_skipped() const { return rows_skipped_; }

    static bool parse_timestamp(const std::string& s, int64_t& ns_out);
    static bool parse_identifier(const std::string& s, uint32_t& id_out, bool& extended_out);
    static bool parse_payload(const std::string& s, std::vector<uint8_t>& out);

    // Every *.csv below dir, sorted by path
    static std::vector<std::string> collect_logs(const std::string& dir);

private:
    utils::CsvReader csv_{','};
    std::string path_;
    std::string sensor_;
    size_t rows_read_ = 0;
    size_t rows_skipped_ = 0;
};

} // namespace can
