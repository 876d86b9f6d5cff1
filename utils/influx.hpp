// utils/influx.hpp
#pragma once

#include "ship/field_visitor.hpp"
#include <cstdint>
#include <memory>
#include <string>

namespace utils {

/**
 * InfluxDB Client for time-series logging of ship telemetry
 *
 * Pushes the same snapshots the CSV logger writes, one line-protocol record
 * per write, for live monitoring. Disabled unless --influx is given or the
 * scenario enables it.
 *
 * Measurement schema:
 *   - ship_telemetry: every snapshot key as a field (no tags)
 */
class InfluxClient {
public:
    struct Config {
        std::string url = "http://localhost:8086";  // InfluxDB server URL
        std::string token = "";                      // Authentication token (optional for local)
        std::string org = "";                        // Organization name
        std::string bucket = "shipsim";              // Bucket name
        double write_interval_s = 1.0;               // sim-time spacing between writes
        bool enabled = false;
    };

    static constexpr const char* kMeasurement = "ship_telemetry";

    /**
     * @throws std::runtime_error if libcurl cannot be initialised
     */
    explicit InfluxClient(const Config& config);

    ~InfluxClient();

    InfluxClient(const InfluxClient&) = delete;
    InfluxClient& operator=(const InfluxClient&) = delete;

    /**
     * Write one telemetry snapshot
     *
     * Only writes if enabled and at least write_interval_s of simulation
     * time has passed since the last write.
     *
     * @return true if data was written, false if skipped or failed
     */
    bool write_snapshot(const ship::FieldList& snapshot, double sim_time);

    bool is_enabled() const { return config_.enabled; }

    const Config& get_config() const { return config_; }

    size_t writes_ok() const { return writes_ok_; }
    size_t writes_failed() const { return writes_failed_; }

    /**
     * Build one line-protocol record
     *
     *   <measurement> key=1.5,flag=true,label="text" <timestamp_ns>
     *
     * Keys have spaces, commas and '=' escaped; strings are quoted with '"'
     * and '\' escaped. Returns "" for an empty snapshot.
     */
    static std::string build_line(const std::string& measurement,
                                  const ship::FieldList& snapshot,
                                  int64_t timestamp_ns);

private:
    Config config_;
    double last_write_time_;
    size_t writes_ok_ = 0;
    size_t writes_failed_ = 0;

    // Implementation details hidden (pimpl pattern)
    struct Impl;
    std::unique_ptr<Impl> impl_;

    bool send_to_influx(const std::string& line_protocol);

    // Wall clock, so points land at "now" in the InfluxDB UI
    static int64_t wall_clock_time_ns();
};

} // namespace utils
