// src/sim/sim_app.hpp
#pragma once

#include <string>
#include <vector>

#include "config/scenario_config.hpp"
#include "sim/lua_runtime.hpp"
#include "sim/world.hpp"

namespace sim {

struct SimAppConfig {
    // Everything the run needs: timing, ship, obstacles, orders, sinks
    config::ScenarioConfig scenario = config::ScenarioConfig::get_default();

    // Output files
    bool enable_csv = true;
    bool enable_debug_log_file = true;
};

struct RunSummary {
    size_t ticks = 0;
    double sim_time_s = 0.0;
    size_t commands_dispatched = 0;
    size_t commands_rejected = 0;
    size_t csv_rows = 0;
    bool stopped_idle = false;
};

/**
 * SimApp - Headless driver
 *
 * Builds the World from a scenario (one ship with the standard fit-out),
 * then runs a fixed-dt loop:
 *   timed commands -> Lua commands -> World::update -> CSV / InfluxDB -> pacing
 */
class SimApp {
public:
    explicit SimApp(SimAppConfig cfg);
    ~SimApp();

    SimApp(const SimApp&) = delete;
    SimApp& operator=(const SimApp&) = delete;

    /**
     * build() - Assemble world and ship from the scenario
     *
     * @throws ship::DuplicateCommandError on conflicting command ownership
     * @throws std::invalid_argument on malformed geometry
     */
    void build();

    // Builds if needed. Returns a process exit code.
    int run();

    World& world() { return world_; }
    const World& world() const { return world_; }

    // nullptr before build()
    ship::ShipModel* ship() { return ship_; }

    const RunSummary& summary() const { return summary_; }

private:
    SimAppConfig cfg_;
    World world_;
    ship::ShipModel* ship_ = nullptr;
    bool built_ = false;

    LuaRuntime lua_;
    bool lua_ready_ = false;

    size_t next_command_ = 0;
    RunSummary summary_;

    void dispatch_due_commands(double t);
    void poll_lua(double t);
    bool orders_pending() const;
    void print_summary() const;
};

} // namespace sim
