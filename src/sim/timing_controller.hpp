// src/sim/timing_controller.hpp
#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <thread>

namespace sim {

/**
 * TimingController - Wall-clock pacing for real-time runs
 *
 * Deadlines are absolute (epoch + n * dt), so lateness never accumulates.
 * Sleeps until shortly before the deadline, then spins the remainder.
 */
class TimingController {
public:
    struct Stats {
        size_t total_steps = 0;
        size_t deadline_misses = 0;
        double max_lateness_us = 0.0;
        double avg_lateness_us = 0.0;
    };

    explicit TimingController(double dt_s)
        : dt_ns_(static_cast<int64_t>(dt_s * 1e9)),
          spin_threshold_ns_(50000)
    {
        reset();
    }

    void reset() {
        step_count_ = 0;
        total_lateness_us_ = 0.0;
        stats_ = Stats{};
        epoch_ = std::chrono::steady_clock::now();
    }

    /**
     * Wait until next timestep deadline
     *
     * Returns false if deadline was missed (loop too slow)
     */
    bool wait_for_next_step() {
        using namespace std::chrono;

        step_count_++;
        stats_.total_steps = step_count_;

        const auto deadline = epoch_ + nanoseconds(static_cast<int64_t>(step_count_) * dt_ns_);
        const int64_t remaining_ns = duration_cast<nanoseconds>(deadline - steady_clock::now()).count();

        if (remaining_ns < 0) {
            stats_.deadline_misses++;
            const double lateness_us = -remaining_ns / 1000.0;
            stats_.max_lateness_us = std::max(stats_.max_lateness_us, lateness_us);
            total_lateness_us_ += lateness_us;
            stats_.avg_lateness_us = total_lateness_us_ / stats_.deadline_misses;
            return false;
        }

        if (remaining_ns > spin_threshold_ns_) {
            std::this_thread::sleep_until(deadline - nanoseconds(spin_threshold_ns_));
        }
        while (steady_clock::now() < deadline) {
            std::this_thread::yield();
        }
        return true;
    }

    double get_sim_time() const {
        return step_count_ * (dt_ns_ / 1e9);
    }

    double get_wall_time() const {
        return std::chrono::duration<double>(std::chrono::steady_clock::now() - epoch_).count();
    }

    // wall_time - sim_time (positive = running slow)
    double get_time_drift() const {
        return get_wall_time() - get_sim_time();
    }

    const Stats& get_stats() const { return stats_; }

    // Typical values: 20-100 us
    void set_spin_threshold_us(double us) {
        spin_threshold_ns_ = static_cast<int64_t>(us * 1000.0);
    }

private:
    int64_t dt_ns_;
    int64_t spin_threshold_ns_;

    size_t step_count_ = 0;
    double total_lateness_us_ = 0.0;

    std::chrono::steady_clock::time_point epoch_;

    Stats stats_;
};

} // namespace sim
