// src/sim/sim_app.cpp
#include "sim/sim_app.hpp"
#include "sim/timing_controller.hpp"
#include "ship/weapons_subsystem.hpp"
#include "utils/csv.hpp"
#include "utils/influx.hpp"
#include "utils/logging.hpp"

#include <algorithm>
#include <cmath>

namespace sim {

namespace {

// Absorbs accumulated floating-point error in total_time
constexpr double kTimeEps = 1e-9;

} // namespace

SimApp::SimApp(SimAppConfig cfg) : cfg_(std::move(cfg)), lua_() {
    if (cfg_.enable_debug_log_file && !cfg_.scenario.debug_log_path.empty()) {
        if (!utils::open_log_file(cfg_.scenario.debug_log_path)) {
            LOG_WARN("[SimApp] Could not open debug log: %s", cfg_.scenario.debug_log_path.c_str());
        }
    }
}

SimApp::~SimApp() {
    if (cfg_.enable_debug_log_file) {
        utils::close_log_file();
    }
}

void SimApp::build() {
    if (built_) return;

    const auto& sc = cfg_.scenario;

    // ========================================================================
    // World
    // ========================================================================
    world_.set_obstacles(sc.obstacles);

    // ========================================================================
    // Ship + standard fit-out
    // ========================================================================
    auto model = std::make_unique<ship::ShipModel>(sc.ship);
    ship::attach_default_subsystems(*model, sc.engine);
    ship_ = &world_.add_ship(std::move(model));

    ship_->state().current_speed_mps = sc.initial_speed_mps;
    ship_->state().desired_speed_mps = sc.initial_speed_mps;

    for (const auto& wp : sc.waypoints) {
        if (!ship_->dispatch(Command::add_waypoint(wp.x, wp.y))) {
            LOG_WARN("[SimApp] Initial waypoint (%.1f, %.1f) not accepted", wp.x, wp.y);
        }
    }

    // ========================================================================
    // Lua command script
    // ========================================================================
    if (!sc.lua_script_path.empty()) {
        if (lua_.init(sc.lua_script_path)) {
            lua_ready_ = true;
            LOG_INFO("[SimApp] Lua commands enabled: %s", sc.lua_script_path.c_str());
        } else {
            LOG_WARN("[SimApp] Failed to init Lua runtime, continuing without scripted commands");
        }
    }

    built_ = true;
}

void SimApp::dispatch_due_commands(double t) {
    const auto& cmds = cfg_.scenario.commands;
    while (next_command_ < cmds.size() && cmds[next_command_].t_s <= t + kTimeEps) {
        const auto& tc = cmds[next_command_++];
        LOG_DEBUG("[SimApp] t=%.2f dispatch %s", t, tc.cmd.c_str());
        if (ship_->dispatch(tc.cmd, tc.args)) {
            summary_.commands_dispatched++;
        } else {
            summary_.commands_rejected++;
        }
    }
}

void SimApp::poll_lua(double t) {
    if (!lua_ready_) return;

    std::vector<ScriptedCommand> cmds;
    if (!lua_.get_commands(t, ship_->state(), cmds)) {
        LOG_WARN("[t=%.2f] Lua scenario_commands failed, scripting disabled", t);
        lua_ready_ = false;
        return;
    }

    for (const auto& c : cmds) {
        if (ship_->dispatch(c.cmd, c.args)) {
            summary_.commands_dispatched++;
        } else {
            summary_.commands_rejected++;
        }
    }
}

bool SimApp::orders_pending() const {
    return lua_ready_ || next_command_ < cfg_.scenario.commands.size();
}

int SimApp::run() {
    build();

    const auto& sc = cfg_.scenario;
    const double dt = sc.dt_s;
    const double steps = sc.duration_s / dt;
    if (!(dt > 0.0 && steps >= 0.0 && steps <= config::kMaxSimSteps)) {
        LOG_ERROR("Invalid timing: duration=%.3fs, dt=%.4fs", sc.duration_s, dt);
        return 1;
    }

    // ========================================================================
    // Timing controller
    // ========================================================================
    TimingController timer(dt);
    double spin_threshold_us = (dt * 1e6) * 0.05;
    spin_threshold_us = std::max(20.0, std::min(100.0, spin_threshold_us));
    timer.set_spin_threshold_us(spin_threshold_us);

    // ---- CSV logging ----
    utils::CsvWriter csv;
    if (cfg_.enable_csv) {
        if (!csv.open(sc.csv_log_path)) {
            LOG_ERROR("Failed to open CSV: %s", sc.csv_log_path.c_str());
            return 1;
        }
    }

    // ---- InfluxDB ----
    utils::InfluxClient::Config influx_cfg;
    influx_cfg.enabled = sc.influx.enabled;
    influx_cfg.url = sc.influx.url;
    influx_cfg.token = sc.influx.token;
    influx_cfg.org = sc.influx.org;
    influx_cfg.bucket = sc.influx.bucket;
    influx_cfg.write_interval_s = sc.influx.write_interval_s;
    utils::InfluxClient influx(influx_cfg);

    // ---- Loop control ----
    const size_t max_iters = static_cast<size_t>(std::ceil(steps - kTimeEps));
    const double log_period_s = (sc.log_hz > 0.0) ? 1.0 / sc.log_hz : 0.0;
    double next_log = 0.0;

    LOG_INFO("Starting simulation loop (duration=%.1fs, dt=%.4fs, %zu steps)",
             sc.duration_s, dt, max_iters);

    timer.reset();

    for (size_t iter = 0; iter < max_iters; ++iter) {
        const double t = world_.total_time();

        // ---- Orders ----
        dispatch_due_commands(t);
        poll_lua(t);

        // ---- Step world ----
        world_.update(dt);
        summary_.ticks++;

        // ---- Telemetry ----
        const double t_now = world_.total_time();
        const bool log_due = csv.is_open() && t_now + kTimeEps >= next_log;
        if (log_due || influx.is_enabled()) {
            const TelemetrySnapshot snap = world_.telemetry();
            if (log_due) {
                if (!csv.write_row(snap)) {
                    LOG_ERROR("[SimApp] CSV write failed at t=%.2f, logging stopped", t_now);
                    csv.close();
                }
                next_log = (log_period_s > 0.0) ? next_log + log_period_s : t_now;
            }
            influx.write_snapshot(snap, t_now);
        }

        if (sc.stop_when_idle && world_.all_idle() && !orders_pending()) {
            LOG_INFO("[SimApp] All ships idle at t=%.2f, stopping", t_now);
            summary_.stopped_idle = true;
            break;
        }

        // ---- Real-time pacing ----
        if (sc.real_time_mode) {
            bool on_time = timer.wait_for_next_step();
            if (!on_time && (iter % 1000 == 0)) {
                auto stats = timer.get_stats();
                LOG_WARN("[t=%.2f] Deadline miss! Total misses: %zu, Max lateness: %.1f us",
                         t_now, stats.deadline_misses, stats.max_lateness_us);
            }
        }
    }

    summary_.sim_time_s = world_.total_time();
    summary_.csv_rows = csv.rows_written();
    csv.close();

    if (sc.real_time_mode) {
        auto stats = timer.get_stats();
        LOG_INFO("Deadline misses: %zu of %zu steps, max lateness %.1f us, drift %.3f ms",
                 stats.deadline_misses, stats.total_steps, stats.max_lateness_us,
                 timer.get_time_drift() * 1000.0);
    }

    print_summary();
    return 0;
}

void SimApp::print_summary() const {
    const auto& s = ship_->state();

    LOG_INFO("========================================");
    LOG_INFO("Run Summary");
    LOG_INFO("========================================");
    LOG_INFO("Ticks: %zu, sim time: %.2f s%s", summary_.ticks, summary_.sim_time_s,
             summary_.stopped_idle ? " (stopped idle)" : "");
    LOG_INFO("Final pose: (%.1f, %.1f) heading %.1f deg, speed %.2f m/s",
             s.x_m, s.y_m, s.heading_deg, s.current_speed_mps);
    LOG_INFO("Waypoints pending: %zu", s.path.size() > 1 ? s.path.size() - 1 : size_t{0});
    LOG_INFO("Commands: %zu dispatched, %zu rejected",
             summary_.commands_dispatched, summary_.commands_rejected);
    LOG_INFO("Ticks in safety margin: %zu, ticks in collision: %zu",
             ship_->warning_ticks(), ship_->collision_ticks());

    if (const auto* weapons = dynamic_cast<const ship::WeaponsSubsystem*>(ship_->find_subsystem("Weapons"))) {
        LOG_INFO("Salvos fired: %d", weapons->shots_fired());
    }
    if (cfg_.enable_csv) {
        LOG_INFO("CSV: %zu rows written to %s", summary_.csv_rows, cfg_.scenario.csv_log_path.c_str());
    }
    LOG_INFO("========================================");
}

} // namespace sim
