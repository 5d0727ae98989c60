// src/can/frame_log_reader.cpp
#include "can/frame_log_reader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <limits>

#include "utils/logging.hpp"

namespace can {

namespace fs = std::filesystem;

namespace {

constexpr int64_t kNanosPerSecond = 1000000000LL;

// Largest whole second whose nanosecond count fits in int64_t
constexpr int64_t kMaxEpochSeconds = std::numeric_limits<int64_t>::max() / kNanosPerSecond;

// secs + frac_ns as nanoseconds since the epoch; false if negative or too large
bool to_epoch_ns(int64_t secs, int64_t frac_ns, int64_t& ns_out) {
    if (secs < 0 || secs > kMaxEpochSeconds)
        return false;
    if (secs > (std::numeric_limits<int64_t>::max() - frac_ns) / kNanosPerSecond)
        return false;
    ns_out = secs * kNanosPerSecond + frac_ns;
    return true;
}

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

bool FrameLogReader::open(const std::string& path) {
    path_ = path;
    sensor_ = fs::path(path).stem().string();
    rows_read_ = 0;
    rows_skipped_ = 0;

    if (!csv_.open(path)) {
        LOG_ERROR("[FrameLogReader] Cannot open log: %s", path.c_str());
        return false;
    }

    for (const char* col : {"timestamp", "ide", "data"}) {
        if (!csv_.has_column(col)) {
            LOG_ERROR("[FrameLogReader] %s: missing column '%s'", path.c_str(), col);
            return false;
        }
    }
    return true;
}

bool FrameLogReader::next(Frame& out) {
    std::vector<std::string> row;
    while (csv_.read_row(row)) {
        Frame f;
        const std::string ts = csv_.get(row, "timestamp");
        const std::string ide = csv_.get(row, "ide");
        const std::string data = csv_.get(row, "data");

        if (!parse_timestamp(ts, f.timestamp_ns) ||
            !parse_identifier(ide, f.id, f.extended) ||
            !parse_payload(data, f.data)) {
            ++rows_skipped_;
            LOG_WARN("[FrameLogReader] %s:%d: skipping malformed row (timestamp='%s' ide='%s' data='%s')",
                     path_.c_str(), csv_.line_no(), ts.c_str(), ide.c_str(), data.c_str());
            continue;
        }

        f.bus_channel = csv_.get(row, "busChannel");
        f.sensor = sensor_;
        ++rows_read_;
        out = std::move(f);
        return true;
    }
    return false;
}

std::vector<Frame> FrameLogReader::read_all() {
    std::vector<Frame> frames;
    Frame f;
    while (next(f))
        frames.push_back(f);

    LOG_INFO("[FrameLogReader] %s: %zu frames (%zu rows skipped)",
             path_.c_str(), rows_read_, rows_skipped_);
    return frames;
}

bool FrameLogReader::parse_timestamp(const std::string& s, int64_t& ns_out) {
    if (s.empty())
        return false;

    // Epoch seconds, digits only so nanoseconds survive
    {
        size_t pos = 0;
        int64_t secs = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            secs = secs * 10 + (s[pos] - '0');
            if (secs > kMaxEpochSeconds)
                return false;
            ++pos;
        }
        if (pos > 0 && (pos == s.size() || s[pos] == '.')) {
            int64_t frac_ns = 0;
            if (pos < s.size()) {
                ++pos;
                int64_t scale = 100000000;
                while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
                    frac_ns += (s[pos] - '0') * scale;
                    scale /= 10;
                    ++pos;
                }
            }
            if (pos != s.size())
                return false;
            return to_epoch_ns(secs, frac_ns, ns_out);
        }
    }

    // YYYY-MM-DD[ T]HH:MM:SS[.fff][Z]
    int year = 0, mon = 0, day = 0, hour = 0, min = 0, sec = 0;
    char sep = 0;
    int consumed = 0;
    if (std::sscanf(s.c_str(), "%4d-%2d-%2d%c%2d:%2d:%2d%n",
                    &year, &mon, &day, &sep, &hour, &min, &sec, &consumed) != 7) {
        return false;
    }
    if (sep != ' ' && sep != 'T')
        return false;
    if (mon < 1 || mon > 12 || day < 1 || day > 31 || hour > 23 || min > 59 || sec > 60)
        return false;

    int64_t frac_ns = 0;
    size_t pos = static_cast<size_t>(consumed);
    if (pos < s.size() && s[pos] == '.') {
        ++pos;
        int64_t scale = 100000000;
        bool any = false;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            frac_ns += (s[pos] - '0') * scale;
            scale /= 10;
            any = true;
            ++pos;
        }
        if (!any)
            return false;
    }
    if (pos < s.size() && s[pos] == 'Z')
        ++pos;
    if (pos != s.size())
        return false;

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = mon - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    const time_t t = timegm(&tm);
    if (t == static_cast<time_t>(-1))
        return false;

    return to_epoch_ns(static_cast<int64_t>(t), frac_ns, ns_out);
}

bool FrameLogReader::parse_identifier(const std::string& s, uint32_t& id_out, bool& extended_out) {
    std::string hex = s;
    if (hex.size() > 2 && hex[0] == '0' && (hex[1] == 'x' || hex[1] == 'X'))
        hex = hex.substr(2);
    if (hex.empty() || hex.size() > 8)
        return false;

    uint32_t v = 0;
    for (char c : hex) {
        const int d = hex_digit(c);
        if (d < 0)
            return false;
        v = (v << 4) | static_cast<uint32_t>(d);
    }
    if (v > 0x1FFFFFFFu)
        return false;

    // Eight digits is the 29-bit notation even for small identifiers
    id_out = v;
    extended_out = v > 0x7FFu || hex.size() == 8;
    return true;
}

bool FrameLogReader::parse_payload(const std::string& s, std::vector<uint8_t>& out) {
    std::string hex;
    hex.reserve(s.size());
    for (char c : s) {
        if (!std::isspace(static_cast<unsigned char>(c)))
            hex.push_back(c);
    }
    if (hex.size() % 2 != 0 || hex.size() > 128)
        return false;

    out.clear();
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        const int hi = hex_digit(hex[i]);
        const int lo = hex_digit(hex[i + 1]);
        if (hi < 0 || lo < 0)
            return false;
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return true;
}

std::vector<std::string> FrameLogReader::collect_logs(const std::string& dir) {
    std::vector<std::string> paths;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        LOG_WARN("[FrameLogReader] Log directory not found: %s", dir.c_str());
        return paths;
    }

    for (fs::recursive_directory_iterator it(dir, ec), end; it != end; it.increment(ec)) {
        if (ec) {
            LOG_WARN("[FrameLogReader] Error walking %s: %s", dir.c_str(), ec.message().c_str());
            break;
        }
        if (it->is_regular_file(ec) && it->path().extension() == ".csv")
            paths.push_back(it->path().string());
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

} // namespace can
