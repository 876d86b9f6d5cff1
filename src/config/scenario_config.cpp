// src/config/scenario_config.cpp
#include "config/scenario_config.hpp"
#include "utils/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace config {

namespace {

geom::Point2D parse_point(const YAML::Node& node, const char* what) {
    if (!node.IsSequence() || node.size() != 2) {
        throw std::runtime_error(std::string("Invalid ") + what + ": expected [x, y]");
    }
    return {node[0].as<double>(), node[1].as<double>()};
}

bool all_finite(const std::vector<geom::Point2D>& points) {
    for (const auto& p : points) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) {
            return false;
        }
    }
    return true;
}

std::vector<geom::Point2D> parse_points(const YAML::Node& node, const char* what) {
    std::vector<geom::Point2D> out;
    if (!node) {
        return out;
    }
    if (!node.IsSequence()) {
        throw std::runtime_error(std::string("Invalid ") + what + ": expected a list of [x, y]");
    }
    for (const auto& p : node) {
        out.push_back(parse_point(p, what));
    }
    return out;
}

// Fills `scenario` from a parsed document; absent keys keep their defaults
void apply(const YAML::Node& root, ScenarioConfig& scenario) {
    // ====================================================================
    // Parse scenario metadata
    // ====================================================================
    if (root["scenario"]) {
        auto s = root["scenario"];
        scenario.name = s["name"].as<std::string>(scenario.name);
        scenario.description = s["description"].as<std::string>("");
    }

    // ====================================================================
    // Parse simulation
    // ====================================================================
    if (root["simulation"]) {
        auto sim = root["simulation"];
        scenario.dt_s = sim["dt_s"].as<double>(scenario.dt_s);
        scenario.duration_s = sim["duration_s"].as<double>(scenario.duration_s);
        scenario.log_hz = sim["log_hz"].as<double>(scenario.log_hz);
        scenario.real_time_mode = sim["real_time_mode"].as<bool>(scenario.real_time_mode);
        scenario.stop_when_idle = sim["stop_when_idle"].as<bool>(scenario.stop_when_idle);
        scenario.csv_log_path = sim["csv_log_path"].as<std::string>(scenario.csv_log_path);
        scenario.debug_log_path = sim["debug_log_path"].as<std::string>(scenario.debug_log_path);
    }

    // ====================================================================
    // Parse ship
    // ====================================================================
    if (root["ship"]) {
        auto sh = root["ship"];
        scenario.ship.name = sh["name"].as<std::string>(scenario.ship.name);
        scenario.ship.safety_clearance_m = sh["safety_clearance_m"].as<double>(scenario.ship.safety_clearance_m);
        scenario.initial_speed_mps = sh["initial_speed_mps"].as<double>(scenario.initial_speed_mps);

        if (sh["initial_pose"]) {
            auto pose = sh["initial_pose"];
            scenario.ship.x_m = pose["x"].as<double>(scenario.ship.x_m);
            scenario.ship.y_m = pose["y"].as<double>(scenario.ship.y_m);
            scenario.ship.heading_deg = pose["heading_deg"].as<double>(scenario.ship.heading_deg);
        }

        if (sh["hull"]) {
            scenario.ship.hull = parse_points(sh["hull"], "hull vertex");
        }

        if (sh["engine"]) {
            auto eng = sh["engine"];
            scenario.engine.min_speed_mps = eng["min_speed_mps"].as<double>(scenario.engine.min_speed_mps);
            scenario.engine.max_speed_mps = eng["max_speed_mps"].as<double>(scenario.engine.max_speed_mps);
            scenario.engine.acceleration_mps2 = eng["acceleration_mps2"].as<double>(scenario.engine.acceleration_mps2);
        }

        if (sh["waypoints"]) {
            scenario.waypoints = parse_points(sh["waypoints"], "waypoint");
        }
    }

    // ====================================================================
    // Parse world
    // ====================================================================
    if (root["world"] && root["world"]["obstacles"]) {
        auto obs = root["world"]["obstacles"];
        if (!obs.IsSequence()) {
            throw std::runtime_error("Invalid world.obstacles: expected a list of polygons");
        }
        scenario.obstacles.clear();
        for (const auto& poly : obs) {
            scenario.obstacles.push_back(parse_points(poly, "obstacle vertex"));
        }
    }

    // ====================================================================
    // Parse timed commands
    // ====================================================================
    if (root["commands"]) {
        auto cmds = root["commands"];
        if (!cmds.IsSequence()) {
            throw std::runtime_error("Invalid commands: expected a list");
        }
        scenario.commands.clear();
        for (const auto& c : cmds) {
            TimedCommand tc;
            tc.t_s = c["t_s"].as<double>(0.0);
            tc.cmd = c["cmd"].as<std::string>("");
            if (c["args"]) {
                tc.args = c["args"].as<std::vector<double>>();
            }
            scenario.commands.push_back(std::move(tc));
        }
        std::stable_sort(scenario.commands.begin(), scenario.commands.end(),
                         [](const TimedCommand& a, const TimedCommand& b) { return a.t_s < b.t_s; });
    }

    // ====================================================================
    // Parse scripting / telemetry
    // ====================================================================
    if (root["scripting"]) {
        scenario.lua_script_path = root["scripting"]["lua_script"].as<std::string>("");
    }

    if (root["influx"]) {
        auto inf = root["influx"];
        scenario.influx.enabled = inf["enabled"].as<bool>(scenario.influx.enabled);
        scenario.influx.url = inf["url"].as<std::string>(scenario.influx.url);
        scenario.influx.token = inf["token"].as<std::string>(scenario.influx.token);
        scenario.influx.org = inf["org"].as<std::string>(scenario.influx.org);
        scenario.influx.bucket = inf["bucket"].as<std::string>(scenario.influx.bucket);
        scenario.influx.write_interval_s = inf["write_interval_s"].as<double>(scenario.influx.write_interval_s);
    }
}

ScenarioConfig from_node(const YAML::Node& root) {
    ScenarioConfig scenario = ScenarioConfig::get_default();
    try {
        apply(root, scenario);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("[ScenarioConfig] YAML parse error: ") + e.what());
    }
    scenario.validate();
    return scenario;
}

} // namespace

ScenarioConfig ScenarioConfig::load(const std::string& yaml_path) {
    // Check if file exists
    std::ifstream file_check(yaml_path);
    if (!file_check.good()) {
        LOG_WARN("[ScenarioConfig] File not found: %s", yaml_path.c_str());
        LOG_WARN("[ScenarioConfig] Using default scenario");
        return get_default();
    }
    file_check.close();

    LOG_INFO("[ScenarioConfig] Loading scenario from: %s", yaml_path.c_str());

    YAML::Node root;
    try {
        root = YAML::LoadFile(yaml_path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("[ScenarioConfig] YAML parse error: ") + e.what());
    }

    ScenarioConfig scenario = from_node(root);
    LOG_INFO("[ScenarioConfig] Successfully loaded: %s", scenario.name.c_str());
    return scenario;
}

ScenarioConfig ScenarioConfig::parse(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error(std::string("[ScenarioConfig] YAML parse error: ") + e.what());
    }
    return from_node(root);
}

ScenarioConfig ScenarioConfig::get_default() {
    ScenarioConfig scenario;

    scenario.name = "Default";
    scenario.description = "Battleship at the origin, one triangular obstacle";

    // Ship
    scenario.ship.name = "Battleship";
    scenario.ship.hull = ship::default_hull(20.0, 154.0);
    scenario.ship.safety_clearance_m = geom::kDefaultSafetyClearanceM;
    scenario.ship.x_m = 0.0;
    scenario.ship.y_m = 0.0;
    scenario.ship.heading_deg = 0.0;

    // Engine
    scenario.engine.min_speed_mps = 0.0;
    scenario.engine.max_speed_mps = 15.0;
    scenario.engine.acceleration_mps2 = 1.0;

    // World
    scenario.obstacles = {
        {{260.0, 320.0}, {365.0, 350.0}, {270.0, 440.0}},
    };

    return scenario;
}

void ScenarioConfig::validate() const {
    // Timing validation (comparisons written so NaN fails them)
    if (!(dt_s > 0.0 && dt_s <= 1.0)) {
        throw std::runtime_error("Invalid dt_s: must be 0 < dt <= 1.0");
    }
    if (!(duration_s > 0.0 && std::isfinite(duration_s))) {
        throw std::runtime_error("Invalid duration_s: must be > 0 and finite");
    }
    if (!(duration_s / dt_s <= kMaxSimSteps)) {
        throw std::runtime_error("Invalid duration_s: more than 1e8 steps at this dt_s");
    }
    if (!(log_hz >= 0.0 && std::isfinite(log_hz))) {
        throw std::runtime_error("Invalid log_hz: must be >= 0 and finite");
    }

    // Ship validation
    if (ship.name.empty()) {
        throw std::runtime_error("Invalid ship name: must not be empty");
    }
    if (!(ship.safety_clearance_m > 0.0 && std::isfinite(ship.safety_clearance_m))) {
        throw std::runtime_error("Invalid safety_clearance_m: must be > 0 and finite");
    }
    if (!std::isfinite(ship.x_m) || !std::isfinite(ship.y_m) || !std::isfinite(ship.heading_deg)) {
        throw std::runtime_error("Invalid initial_pose: x, y and heading_deg must be finite");
    }
    if (!all_finite(ship.hull) || !all_finite(waypoints)) {
        throw std::runtime_error("Invalid geometry: hull and waypoint coordinates must be finite");
    }
    for (const auto& obstacle : obstacles) {
        if (!all_finite(obstacle)) {
            throw std::runtime_error("Invalid geometry: obstacle coordinates must be finite");
        }
    }
    try {
        geom::validate_polygon(ship.hull, "hull");
        for (const auto& obstacle : obstacles) {
            geom::validate_polygon(obstacle, "obstacle");
        }
    } catch (const std::invalid_argument& e) {
        throw std::runtime_error(std::string("Invalid geometry: ") + e.what());
    }

    // Engine validation
    if (!(engine.min_speed_mps >= 0.0 && engine.min_speed_mps <= engine.max_speed_mps) ||
        !std::isfinite(engine.max_speed_mps)) {
        throw std::runtime_error("Invalid speed range: 0 <= min_speed_mps <= max_speed_mps, finite");
    }
    if (!(engine.acceleration_mps2 > 0.0 && std::isfinite(engine.acceleration_mps2))) {
        throw std::runtime_error("Invalid acceleration_mps2: must be > 0 and finite");
    }
    if (!(initial_speed_mps >= engine.min_speed_mps && initial_speed_mps <= engine.max_speed_mps)) {
        throw std::runtime_error("Invalid initial_speed_mps: outside engine speed range");
    }

    // Commands validation
    for (const auto& c : commands) {
        if (!(c.t_s >= 0.0 && std::isfinite(c.t_s))) {
            throw std::runtime_error("Invalid command time for '" + c.cmd + "': must be >= 0 and finite");
        }
        if (c.cmd.empty()) {
            throw std::runtime_error("Invalid command: missing 'cmd'");
        }
        for (double a : c.args) {
            if (!std::isfinite(a)) {
                throw std::runtime_error("Invalid arguments for '" + c.cmd + "': must be finite");
            }
        }
    }

    // Telemetry validation
    if (influx.enabled && !(influx.write_interval_s > 0.0 && std::isfinite(influx.write_interval_s))) {
        throw std::runtime_error("Invalid influx.write_interval_s: must be > 0 and finite");
    }

    LOG_DEBUG("[ScenarioConfig] Validation passed");
}

void ScenarioConfig::print_summary() const {
    LOG_INFO("========================================");
    LOG_INFO("Scenario Configuration Summary");
    LOG_INFO("========================================");
    LOG_INFO("Name: %s", name.c_str());
    if (!description.empty()) {
        LOG_INFO("Description: %s", description.c_str());
    }
    LOG_INFO("----------------------------------------");
    LOG_INFO("Ship: %s at (%.1f, %.1f), heading %.1f deg",
             ship.name.c_str(), ship.x_m, ship.y_m, ship.heading_deg);
    LOG_INFO("Hull: %zu vertices, clearance %.0f m", ship.hull.size(), ship.safety_clearance_m);
    LOG_INFO("Engine: %.1f .. %.1f m/s, %.2f m/s^2",
             engine.min_speed_mps, engine.max_speed_mps, engine.acceleration_mps2);
    LOG_INFO("Waypoints: %zu, obstacles: %zu, timed commands: %zu",
             waypoints.size(), obstacles.size(), commands.size());
    if (!lua_script_path.empty()) {
        LOG_INFO("Lua script: %s", lua_script_path.c_str());
    }
    LOG_INFO("InfluxDB: %s", influx.enabled ? influx.url.c_str() : "disabled");
    LOG_INFO("========================================");
}

} // namespace config
