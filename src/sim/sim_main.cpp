// src/sim/sim_main.cpp
#include "sim/sim_app.hpp"
#include "config/scenario_config.hpp"
#include "ship/ship_errors.hpp"
#include "utils/logging.hpp"
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>
#include <getopt.h>

void print_usage(const char* prog_name) {
    printf("Usage: %s [options] [scenario.yaml]\n", prog_name);
    printf("\nOptions:\n");
    printf("  --scenario PATH       Scenario YAML (default: config/scenarios/default.yaml)\n");
    printf("  --dt SEC              Timestep in seconds (default: from scenario)\n");
    printf("  --duration SEC        Simulation duration in seconds (default: from scenario)\n");
    printf("  --real-time           Pace ticks against the wall clock\n");
    printf("  --fast                Run as fast as possible (no real-time pacing)\n");
    printf("  --csv PATH            Telemetry CSV output (default: from scenario)\n");
    printf("  --no-csv              Disable CSV output\n");
    printf("  --lua PATH            Lua command script (overrides scenario)\n");
    printf("  --influx              Push telemetry to InfluxDB\n");
    printf("  --log-level LEVEL     trace|debug|info|warn|error|off (default: info)\n");
    printf("  --help, -h            Show this help\n");
    printf("\nExit codes: 0 ok, 1 bad arguments or configuration, 2 conflicting subsystem commands\n");
    printf("\nExamples:\n");
    printf("  %s config/scenarios/default.yaml\n", prog_name);
    printf("  %s --fast --duration 120 --lua config/lua/patrol.lua\n", prog_name);
}

int main(int argc, char** argv) {
    // ========================================================================
    // Command-line parsing
    // ========================================================================
    std::string scenario_path = "config/scenarios/default.yaml";

    // Overrides applied after the scenario is loaded
    double dt_override = 0.0;
    double duration_override = 0.0;
    int real_time_override = -1;
    std::string csv_override;
    std::string lua_override;
    bool influx_override = false;
    bool no_csv = false;
    utils::LogLevel log_level = utils::LogLevel::Info;

    static struct option long_options[] = {
        {"scenario",  required_argument, 0, 's'},
        {"dt",        required_argument, 0, 'd'},
        {"duration",  required_argument, 0, 'D'},
        {"real-time", no_argument,       0, 'R'},
        {"fast",      no_argument,       0, 'F'},
        {"csv",       required_argument, 0, 'c'},
        {"no-csv",    no_argument,       0, 'C'},
        {"lua",       required_argument, 0, 'l'},
        {"influx",    no_argument,       0, 'i'},
        {"log-level", required_argument, 0, 'L'},
        {"help",      no_argument,       0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "h", long_options, &option_index)) != -1) {
        switch (opt) {
            case 's':
                scenario_path = optarg;
                break;
            case 'd':
                dt_override = std::atof(optarg);
                if (!(dt_override > 0.0 && dt_override <= 1.0)) {
                    fprintf(stderr, "Error: Invalid timestep: %s (must be 0 < dt <= 1.0)\n", optarg);
                    return 1;
                }
                break;
            case 'D':
                duration_override = std::atof(optarg);
                if (!(duration_override > 0.0 && std::isfinite(duration_override))) {
                    fprintf(stderr, "Error: Invalid duration: %s\n", optarg);
                    return 1;
                }
                break;
            case 'R':
                real_time_override = 1;
                break;
            case 'F':
                real_time_override = 0;
                break;
            case 'c':
                csv_override = optarg;
                break;
            case 'C':
                no_csv = true;
                break;
            case 'l':
                lua_override = optarg;
                break;
            case 'i':
                influx_override = true;
                break;
            case 'L':
                if (!utils::parse_level(optarg, log_level)) {
                    fprintf(stderr, "Error: Invalid log level: %s\n", optarg);
                    return 1;
                }
                break;
            case 'h':
            default:
                print_usage(argv[0]);
                return (opt == 'h') ? 0 : 1;
        }
    }

    // Positional argument: scenario file
    if (optind < argc) {
        scenario_path = argv[optind];
    }

    utils::set_level(log_level);

    // ========================================================================
    // Load scenario
    // ========================================================================
    sim::SimAppConfig cfg{};
    try {
        cfg.scenario = config::ScenarioConfig::load(scenario_path);

        if (dt_override > 0.0) cfg.scenario.dt_s = dt_override;
        if (duration_override > 0.0) cfg.scenario.duration_s = duration_override;
        if (real_time_override >= 0) cfg.scenario.real_time_mode = (real_time_override == 1);
        if (!csv_override.empty()) cfg.scenario.csv_log_path = csv_override;
        if (!lua_override.empty()) cfg.scenario.lua_script_path = lua_override;
        if (influx_override) cfg.scenario.influx.enabled = true;

        cfg.scenario.validate();
    } catch (const std::runtime_error& e) {
        LOG_ERROR("%s", e.what());
        return 1;
    }
    cfg.enable_csv = !no_csv;

    cfg.scenario.print_summary();

    // ========================================================================
    // Print configuration summary
    // ========================================================================
    const auto& sc = cfg.scenario;
    char timestep_str[50], duration_str[50];
    snprintf(timestep_str, sizeof(timestep_str), "%.4f seconds", sc.dt_s);
    snprintf(duration_str, sizeof(duration_str), "%.1f seconds", sc.duration_s);

    printf("\n");
    printf("╔════════════════════════════════════════════════════════════╗\n");
    printf("║              SHIP SIMULATION CONFIGURATION                 ║\n");
    printf("╠════════════════════════════════════════════════════════════╣\n");
    printf("║ Scenario:   %-48s║\n", sc.name.c_str());
    printf("║ Ship:       %-48s║\n", sc.ship.name.c_str());
    printf("║ Timestep:   %-48s║\n", timestep_str);
    printf("║ Duration:   %-48s║\n", duration_str);
    printf("║ Real-time:  %-48s║\n", sc.real_time_mode ? "yes (1:1 wall clock)" : "no (fast-forward)");
    printf("║ CSV:        %-48s║\n", cfg.enable_csv ? sc.csv_log_path.c_str() : "disabled");
    printf("║ Lua:        %-48s║\n", sc.lua_script_path.empty() ? "none" : sc.lua_script_path.c_str());
    printf("║ InfluxDB:   %-48s║\n", sc.influx.enabled ? sc.influx.url.c_str() : "disabled");
    printf("╚════════════════════════════════════════════════════════════╝\n");
    printf("\n");

    // ========================================================================
    // Run simulation
    // ========================================================================
    sim::SimApp app(cfg);
    try {
        app.build();
    } catch (const ship::DuplicateCommandError& e) {
        LOG_ERROR("[SimApp] Ship assembly failed: %s", e.what());
        return 2;
    } catch (const std::exception& e) {
        LOG_ERROR("[SimApp] Ship assembly failed: %s", e.what());
        return 1;
    }

    return app.run();
}
