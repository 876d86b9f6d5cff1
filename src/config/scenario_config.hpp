// src/config/scenario_config.hpp
#pragma once

#include <string>
#include <vector>

#include "geom/polygon.hpp"
#include "ship/engine_subsystem.hpp"
#include "ship/ship_model.hpp"

namespace config {

// Upper bound on duration_s / dt_s for one run
constexpr double kMaxSimSteps = 1e8;

// One operator order issued at a fixed simulation time.
struct TimedCommand {
    double t_s = 0.0;
    std::string cmd;             // token, e.g. "SET_SPEED"
    std::vector<double> args;
};

struct InfluxSettings {
    bool enabled = false;
    std::string url = "http://localhost:8086";
    std::string token;
    std::string org;
    std::string bucket = "shipsim";
    double write_interval_s = 1.0;
};

/**
 * ScenarioConfig - Loads a simulation scenario from YAML
 *
 * Usage:
 *   auto scenario = ScenarioConfig::load("config/scenarios/default.yaml");
 *   ship::ShipModel ship(scenario.ship);
 *
 * Falls back to the built-in battleship scenario if the file is not found.
 */
class ScenarioConfig {
public:
    std::string name = "Default";
    std::string description;

    // Simulation timing and outputs
    double dt_s = 0.1;
    double duration_s = 60.0;
    double log_hz = 10.0;
    bool real_time_mode = false;
    bool stop_when_idle = false;
    std::string csv_log_path = "ship_out.csv";
    std::string debug_log_path = "ship_debug.log";

    // Ship
    ship::ShipParams ship;
    ship::EngineParams engine;
    double initial_speed_mps = 0.0;
    std::vector<geom::Point2D> waypoints;

    // World
    std::vector<geom::Polygon> obstacles;

    // Orders, sorted by t_s after load
    std::vector<TimedCommand> commands;

    // Empty = no scripting
    std::string lua_script_path;

    InfluxSettings influx;

    /**
     * Load scenario from YAML file
     * @param yaml_path Path to YAML file (e.g., "config/scenarios/default.yaml")
     * @throws std::runtime_error if file exists but is invalid
     *
     * If file doesn't exist, returns default scenario with warning.
     */
    static ScenarioConfig load(const std::string& yaml_path);

    // Parse from an in-memory YAML document (same rules as load())
    static ScenarioConfig parse(const std::string& yaml_text);

    /**
     * Built-in scenario: 20 x 154 m battleship at the origin, one triangular
     * obstacle, 100 m clearance.
     */
    static ScenarioConfig get_default();

    /**
     * @throws std::runtime_error if any parameter is invalid
     */
    void validate() const;

    void print_summary() const;
};

} // namespace config
