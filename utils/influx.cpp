// utils/influx.cpp
#include "influx.hpp"
#include "logging.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace utils {

// ============================================================================
// Private Implementation (Pimpl)
// ============================================================================

struct InfluxWriter::Impl {
    CURL* curl = nullptr;
    struct curl_slist* headers = nullptr;
    std::string write_url;
    std::string auth_header;
    int write_count = 0;

    Impl() {
        curl = curl_easy_init();
        if (!curl) {
            throw std::runtime_error("Failed to initialize libcurl");
        }
    }

    ~Impl() {
        if (headers) {
            curl_slist_free_all(headers);
        }
        if (curl) {
            curl_easy_cleanup(curl);
        }
    }
};

// ============================================================================
// Callback for ignoring HTTP response body
// ============================================================================

static size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    // Discard response body (we only care about HTTP status code)
    (void)contents;
    (void)userp;
    return size * nmemb;
}

// ============================================================================
// Constructor / Destructor
// ============================================================================

InfluxWriter::InfluxWriter(const Config& config)
    : config_(config)
{
    if (!config_.enabled) {
        LOG_INFO("[InfluxDB] Writer created but disabled (use --influx flag to enable)");
        return;
    }

    impl_ = std::make_unique<Impl>();
    impl_->write_url = write_url(config_);

    // Setup headers
    impl_->headers = curl_slist_append(impl_->headers, "Content-Type: text/plain; charset=utf-8");

    // Add authentication if token provided
    if (!config_.token.empty()) {
        impl_->auth_header = "Authorization: Token " + config_.token;
        impl_->headers = curl_slist_append(impl_->headers, impl_->auth_header.c_str());
        LOG_INFO("[InfluxDB] Authentication enabled (token configured)");
    } else {
        LOG_WARN("[InfluxDB] No authentication token provided - writes may fail!");
    }

    // Configure curl
    curl_easy_setopt(impl_->curl, CURLOPT_URL, impl_->write_url.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_HTTPHEADER, impl_->headers);
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT, 5L);  // 5 second timeout

    LOG_INFO("[InfluxDB] Writer initialized: url=%s org=%s bucket=%s batch=%zu lines",
             config_.url.c_str(), config_.org.c_str(), config_.bucket.c_str(),
             config_.batch_lines);
}

InfluxWriter::~InfluxWriter() {
    if (config_.enabled) {
        if (!flush()) {
            LOG_WARN("[InfluxDB] %zu lines dropped at shutdown", pending_lines_);
        }
        if (dropped_lines_ > 0) {
            LOG_WARN("[InfluxDB] %zu lines dropped while the server was unreachable", dropped_lines_);
        }
        LOG_INFO("[InfluxDB] Writer shutdown");
    }
}

// ============================================================================
// Public Interface
// ============================================================================

bool InfluxWriter::write(const std::vector<kg::SignalLogRecord>& records) {
    if (!config_.enabled) {
        return false;
    }

    for (const auto& rec : records) {
        const std::string line = build_line(rec, config_.measurement);
        if (line.empty()) {
            LOG_DEBUG("[InfluxDB] Skipping non-finite value for %s", rec.individual.c_str());
            continue;
        }
        buffer_ += line;
        buffer_ += '\n';
        ++pending_lines_;
    }
    enforce_limit();

    if (pending_lines_ >= config_.batch_lines) {
        return flush();
    }
    return true;
}

bool InfluxWriter::flush() {
    if (!config_.enabled || pending_lines_ == 0) {
        return true;
    }

    const bool ok = send_to_influx(buffer_);
    if (ok) {
        buffer_.clear();
        pending_lines_ = 0;
        if (dropping_) {
            LOG_WARN("[InfluxDB] Writes resumed; %zu lines dropped so far", dropped_lines_);
            dropping_ = false;
        }
    }
    return ok;
}

size_t InfluxWriter::max_pending_lines() const {
    return std::max<size_t>(config_.batch_lines, 1) * kMaxBufferedBatches;
}

void InfluxWriter::enforce_limit() {
    const size_t limit = max_pending_lines();
    if (pending_lines_ <= limit) {
        return;
    }

    const size_t excess = pending_lines_ - limit;
    size_t cut = 0;
    for (size_t i = 0; i < excess; ++i) {
        cut = buffer_.find('\n', cut) + 1;
    }
    buffer_.erase(0, cut);
    pending_lines_ = limit;
    dropped_lines_ += excess;

    if (!dropping_) {
        LOG_WARN("[InfluxDB] Buffer full (%zu lines), dropped %zu oldest lines; "
                 "dropping continues until a write succeeds", limit, excess);
        dropping_ = true;
    }
}

// ============================================================================
// Line Protocol
// ============================================================================

std::string InfluxWriter::escape_tag(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == ',' || c == '=' || c == ' ') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

std::string InfluxWriter::escape_measurement(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == ',' || c == ' ') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

std::string InfluxWriter::build_line(const kg::SignalLogRecord& rec, const std::string& measurement) {
    if (!std::isfinite(rec.value)) {
        return "";
    }

    std::ostringstream line;

    // Measurement name
    line << escape_measurement(measurement);

    // Tags (InfluxDB rejects empty tag values)
    const std::pair<const char*, const std::string*> tags[] = {
        {"message", &rec.message},
        {"signal", &rec.signal},
        {"ecu", &rec.ecu},
        {"unit", &rec.unit},
        {"sensor", &rec.sensor},
    };
    for (const auto& tag : tags) {
        if (!tag.second->empty()) {
            line << "," << tag.first << "=" << escape_tag(*tag.second);
        }
    }

    // Fields
    line << " "
         << "value=" << kg::format_value(rec.value) << ","
         << "out_of_range=" << (rec.out_of_range ? "true" : "false") << ","
         << "unit_mapped=" << (rec.unit_mapped ? "true" : "false");

    // Timestamp
    line << " " << rec.timestamp_ns;

    return line.str();
}

std::string InfluxWriter::write_url(const Config& config) {
    // http://localhost:8086/api/v2/write?org=vehicle-kg&bucket=can-signals&precision=ns
    std::ostringstream url_builder;
    url_builder << config.url << "/api/v2/write"
                << "?org=" << config.org
                << "&bucket=" << config.bucket
                << "&precision=ns";  // Nanosecond precision
    return url_builder.str();
}

// ============================================================================
// HTTP Communication
// ============================================================================

bool InfluxWriter::send_to_influx(const std::string& line_protocol) {
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDS, line_protocol.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(line_protocol.size()));

    CURLcode res = curl_easy_perform(impl_->curl);

    if (res != CURLE_OK) {
        LOG_ERROR("[InfluxDB] Write failed: CURL error: %s", curl_easy_strerror(res));
        return false;
    }

    long http_code = 0;
    curl_easy_getinfo(impl_->curl, CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code != 204) {  // InfluxDB returns 204 No Content on success
        LOG_ERROR("[InfluxDB] Write failed: HTTP %ld (expected 204)", http_code);
        return false;
    }

    impl_->write_count++;
    if (impl_->write_count == 1) {
        LOG_INFO("[InfluxDB] First write successful (%zu lines)", pending_lines_);
    } else if (impl_->write_count % 20 == 0) {
        LOG_INFO("[InfluxDB] Successfully wrote %d batches", impl_->write_count);
    }

    return true;
}

} // namespace utils
