// utils/influx.cpp
#include "influx.hpp"
#include "logging.hpp"
#include <curl/curl.h>
#include <chrono>
#include <cstdio>
#include <sstream>
#include <stdexcept>

namespace utils {

// ============================================================================
// Private Implementation (Pimpl)
// ============================================================================

struct InfluxClient::Impl {
    CURL* curl = nullptr;
    struct curl_slist* headers = nullptr;
    std::string write_url;
    std::string auth_header;

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

namespace {

size_t discard_body(void* contents, size_t size, size_t nmemb, void* userp) {
    (void)contents;
    (void)userp;
    return size * nmemb;
}

std::string escape_key(const std::string& key) {
    std::string out;
    out.reserve(key.size());
    for (char c : key) {
        if (c == ',' || c == '=' || c == ' ') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

std::string quote_string(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    out.push_back('"');
    return out;
}

} // namespace

// ============================================================================
// Constructor / Destructor
// ============================================================================

InfluxClient::InfluxClient(const Config& config)
    : config_(config)
    , last_write_time_(-1.0)
    , impl_(std::make_unique<Impl>())
{
    if (!config_.enabled) {
        LOG_INFO("[InfluxDB] Client created but disabled");
        return;
    }

    // http://localhost:8086/api/v2/write?org=...&bucket=...&precision=ns
    std::ostringstream url_builder;
    url_builder << config_.url << "/api/v2/write"
                << "?org=" << config_.org
                << "&bucket=" << config_.bucket
                << "&precision=ns";
    impl_->write_url = url_builder.str();

    impl_->headers = curl_slist_append(impl_->headers, "Content-Type: text/plain; charset=utf-8");

    if (!config_.token.empty()) {
        impl_->auth_header = "Authorization: Token " + config_.token;
        impl_->headers = curl_slist_append(impl_->headers, impl_->auth_header.c_str());
    } else {
        LOG_WARN("[InfluxDB] No authentication token provided - writes may fail!");
    }

    curl_easy_setopt(impl_->curl, CURLOPT_URL, impl_->write_url.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_HTTPHEADER, impl_->headers);
    curl_easy_setopt(impl_->curl, CURLOPT_WRITEFUNCTION, discard_body);
    curl_easy_setopt(impl_->curl, CURLOPT_TIMEOUT, 5L);

    LOG_INFO("[InfluxDB] Client initialized: url=%s org=%s bucket=%s interval=%.2fs",
             config_.url.c_str(), config_.org.c_str(), config_.bucket.c_str(),
             config_.write_interval_s);
}

InfluxClient::~InfluxClient() {
    if (config_.enabled) {
        LOG_INFO("[InfluxDB] Client shutdown (%zu ok, %zu failed)", writes_ok_, writes_failed_);
    }
}

// ============================================================================
// Public Interface
// ============================================================================

bool InfluxClient::write_snapshot(const ship::FieldList& snapshot, double sim_time) {
    if (!config_.enabled) {
        return false;
    }

    // Rate limiting on simulation time
    if (last_write_time_ >= 0.0 && (sim_time - last_write_time_) < config_.write_interval_s) {
        return false;
    }
    last_write_time_ = sim_time;

    const std::string line = build_line(kMeasurement, snapshot, wall_clock_time_ns());
    if (line.empty()) {
        return false;
    }
    return send_to_influx(line);
}

std::string InfluxClient::build_line(const std::string& measurement,
                                     const ship::FieldList& snapshot,
                                     int64_t timestamp_ns)
{
    if (snapshot.empty()) {
        return "";
    }

    std::ostringstream line;
    line << escape_key(measurement) << ' ';

    for (size_t i = 0; i < snapshot.size(); ++i) {
        const auto& key = snapshot[i].first;
        const auto& value = snapshot[i].second;

        if (i) line << ',';
        line << escape_key(key) << '=';

        if (const bool* b = std::get_if<bool>(&value)) {
            line << (*b ? "true" : "false");
        } else if (const double* d = std::get_if<double>(&value)) {
            char buf[64];
            std::snprintf(buf, sizeof(buf), "%.10g", *d);
            line << buf;
        } else {
            line << quote_string(std::get<std::string>(value));
        }
    }

    line << ' ' << timestamp_ns;
    return line.str();
}

// ============================================================================
// HTTP Communication
// ============================================================================

bool InfluxClient::send_to_influx(const std::string& line_protocol) {
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDS, line_protocol.c_str());
    curl_easy_setopt(impl_->curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(line_protocol.size()));

    CURLcode res = curl_easy_perform(impl_->curl);
    if (res != CURLE_OK) {
        ++writes_failed_;
        LOG_ERROR("[InfluxDB] Write failed: CURL error: %s", curl_easy_strerror(res));
        return false;
    }

    long http_code = 0;
    curl_easy_getinfo(impl_->curl, CURLINFO_RESPONSE_CODE, &http_code);

    if (http_code != 204) {  // InfluxDB returns 204 No Content on success
        ++writes_failed_;
        LOG_ERROR("[InfluxDB] Write failed: HTTP %ld (expected 204)", http_code);
        return false;
    }

    ++writes_ok_;
    if (writes_ok_ == 1) {
        LOG_INFO("[InfluxDB] First write successful");
    } else if (writes_ok_ % 20 == 0) {
        LOG_INFO("[InfluxDB] Successfully wrote %zu data points", writes_ok_);
    }
    return true;
}

int64_t InfluxClient::wall_clock_time_ns() {
    auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
}

} // namespace utils
