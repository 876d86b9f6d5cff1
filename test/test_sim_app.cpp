// test/test_sim_app.cpp
#include "sim/sim_app.hpp"
#include "sim/lua_runtime.hpp"
#include "ship/weapons_subsystem.hpp"
#include "utils/csv.hpp"
#include <iostream>
#include <iomanip>
#include <cmath>
#include <cstdio>
#include <fstream>

// ANSI color codes
#define COLOR_GREEN "\033[32m"
#define COLOR_RED "\033[31m"
#define COLOR_YELLOW "\033[33m"
#define COLOR_RESET "\033[0m"

// Headless, file-free base configuration
static sim::SimAppConfig quiet_config() {
    sim::SimAppConfig cfg;
    cfg.scenario = config::ScenarioConfig::get_default();
    cfg.scenario.dt_s = 0.1;
    cfg.scenario.duration_s = 60.0;
    cfg.enable_csv = false;
    cfg.enable_debug_log_file = false;
    return cfg;
}

static void print_result(bool pass) {
    std::cout << "  Result: " << (pass ? COLOR_GREEN "PASS" : COLOR_RED "FAIL") << COLOR_RESET << "\n";
}

bool test_timed_commands_and_idle_stop() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 1: Timed Commands + Idle Stop ===" << COLOR_RESET << "\n";

    auto cfg = quiet_config();
    cfg.scenario.stop_when_idle = true;
    cfg.scenario.waypoints = {{0.0, 20.0}};
    cfg.scenario.commands = {
        {0.0, "SET_SPEED", {10.0}},
        {0.2, "SET_SPEED", {1000.0}},   // routed, ignored by the engine
        {0.3, "SELF_DESTRUCT", {}},     // no such command
        {0.5, "FIRE", {}},
    };

    sim::SimApp app(cfg);
    int rc = app.run();
    const auto& sum = app.summary();
    const auto& s = app.ship()->state();

    auto* weapons = app.ship()->find<ship::WeaponsSubsystem>("Weapons");

    std::cout << "  Exit code: " << rc << "\n";
    std::cout << "  Ticks: " << sum.ticks << ", sim time " << sum.sim_time_s << " s\n";
    std::cout << "  Final position: (" << s.x_m << ", " << s.y_m << ")\n";
    std::cout << "  Commands: " << sum.commands_dispatched << " dispatched, "
              << sum.commands_rejected << " rejected\n";

    bool pass = rc == 0 &&
                sum.stopped_idle &&
                sum.ticks > 50 && sum.ticks < 600 &&
                std::abs(s.y_m - 20.0) < 1e-9 && std::abs(s.x_m) < 1e-9 &&
                sum.commands_dispatched == 3 && sum.commands_rejected == 1 &&
                s.desired_speed_mps == 10.0 &&
                weapons != nullptr && weapons->shots_fired() == 1 &&
                std::get<double>(app.ship()->get_attribute("Engine:rejected_orders")) == 1.0;
    print_result(pass);
    return pass;
}

bool test_full_duration() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 2: Runs For Full Duration ===" << COLOR_RESET << "\n";

    auto cfg = quiet_config();
    cfg.scenario.duration_s = 2.0;
    cfg.scenario.stop_when_idle = false;

    sim::SimApp app(cfg);
    int rc = app.run();
    const auto& sum = app.summary();

    std::cout << "  Ticks: " << sum.ticks << ", sim time " << sum.sim_time_s << " s\n";

    bool pass = rc == 0 && sum.ticks == 20 && !sum.stopped_idle &&
                std::abs(sum.sim_time_s - 2.0) < 1e-9 &&
                std::abs(app.world().timedelta() - 0.1) < 1e-12;
    print_result(pass);
    return pass;
}

bool test_csv_output() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 3: CSV Output Rate ===" << COLOR_RESET << "\n";

    const char* path = "test_sim_app_out.csv";

    auto cfg = quiet_config();
    cfg.enable_csv = true;
    cfg.scenario.csv_log_path = path;
    cfg.scenario.duration_s = 3.0;
    cfg.scenario.log_hz = 2.0;

    sim::SimApp app(cfg);
    int rc = app.run();

    utils::CsvReader reader;
    bool opened = reader.open(path);
    int rows = 0;
    std::vector<std::string> row;
    std::string first_time;
    while (opened && reader.read_row(row)) {
        if (rows == 0) first_time = reader.get(row, "total_time");
        ++rows;
    }

    std::cout << "  Rows in file: " << rows << " (summary says " << app.summary().csv_rows << ")\n";
    std::cout << "  First row total_time: " << first_time << "\n";

    // Rows at t = 0.1 (first tick), then every 0.5 s up to 3.0
    bool pass = rc == 0 && opened && rows == 7 && app.summary().csv_rows == 7 &&
                first_time == "0.1" &&
                reader.col("Battleship.Engine.max_speed") >= 0 &&
                reader.col("Battleship.collision_event") >= 0;
    print_result(pass);

    std::remove(path);
    return pass;
}

bool test_csv_open_failure() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 4: Unwritable CSV Path ===" << COLOR_RESET << "\n";

    auto cfg = quiet_config();
    cfg.enable_csv = true;
    cfg.scenario.csv_log_path = "no_such_dir_12345/out.csv";

    sim::SimApp app(cfg);
    int rc = app.run();

    std::cout << "  Exit code: " << rc << "\n";

    bool pass = rc == 1 && app.summary().ticks == 0;
    print_result(pass);
    return pass;
}

bool test_non_finite_timing() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 5: Non-Finite Timing ===" << COLOR_RESET << "\n";

    auto cfg = quiet_config();
    cfg.scenario.dt_s = std::nan("");
    sim::SimApp nan_dt(cfg);
    int rc_dt = nan_dt.run();

    cfg = quiet_config();
    cfg.scenario.duration_s = std::nan("");
    sim::SimApp nan_duration(cfg);
    int rc_duration = nan_duration.run();

    cfg = quiet_config();
    cfg.scenario.duration_s = 1.0e30;
    sim::SimApp too_long(cfg);
    int rc_long = too_long.run();

    std::cout << "  Exit codes: " << rc_dt << " " << rc_duration << " " << rc_long << "\n";

    bool pass = rc_dt == 1 && nan_dt.summary().ticks == 0 &&
                rc_duration == 1 && nan_duration.summary().ticks == 0 &&
                rc_long == 1 && too_long.summary().ticks == 0;
    print_result(pass);
    return pass;
}

bool test_lua_scripted_commands() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 6: Lua Scenario Script ===" << COLOR_RESET << "\n";

    const char* script = "test_sim_app_script.lua";
    {
        std::ofstream f(script);
        f << "local fired = false\n"
          << "function scenario_commands(t, s)\n"
          << "  if t >= 0.2 and not fired then\n"
          << "    fired = true\n"
          << "    return { {cmd = \"FIRE\"}, {cmd = \"SET_SPEED\", args = {5}}, {args = {1}} }\n"
          << "  end\n"
          << "  return nil\n"
          << "end\n";
    }

    auto cfg = quiet_config();
    cfg.scenario.duration_s = 1.0;
    cfg.scenario.stop_when_idle = true;   // an active script keeps the run going
    cfg.scenario.lua_script_path = script;

    sim::SimApp app(cfg);
    int rc = app.run();
    const auto& sum = app.summary();
    auto* weapons = app.ship()->find<ship::WeaponsSubsystem>("Weapons");

    std::cout << "  Ticks: " << sum.ticks << ", dispatched " << sum.commands_dispatched << "\n";

    bool pass = rc == 0 && sum.ticks == 10 && !sum.stopped_idle &&
                sum.commands_dispatched == 2 && sum.commands_rejected == 0 &&
                weapons != nullptr && weapons->shots_fired() == 1 &&
                app.ship()->state().desired_speed_mps == 5.0;
    print_result(pass);

    std::remove(script);
    return pass;
}

bool test_lua_runtime_state_table() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 7: Lua State Table ===" << COLOR_RESET << "\n";

    sim::LuaRuntime lua;
    bool ok = lua.init_from_string(
        "initialized = false\n"
        "function scenario_init() initialized = true end\n"
        "function scenario_commands(t, s)\n"
        "  if not initialized then error('init not called') end\n"
        "  local out = {}\n"
        "  if s.collision_warning then table.insert(out, {cmd = 'FIRE'}) end\n"
        "  if s.waypoints_pending == 2 then\n"
        "    table.insert(out, {cmd = 'ADD_WAYPOINT', args = {s.x + t, s.y}})\n"
        "  end\n"
        "  table.insert(out, {cmd = 'SET_SPEED', args = {'fast'}})\n"
        "  table.insert(out, 'TURN_LEFT')\n"
        "  return out\n"
        "end\n");

    ship::ShipState st;
    st.x_m = 100.0;
    st.y_m = -50.0;
    st.collision_warning = true;
    st.path = {{100.0, -50.0}, {0.0, 0.0}, {10.0, 10.0}};

    std::vector<sim::ScriptedCommand> cmds;
    bool got = ok && lua.get_commands(2.5, st, cmds);

    for (const auto& c : cmds) {
        std::cout << "  " << c.cmd;
        for (double a : c.args) std::cout << " " << a;
        std::cout << "\n";
    }

    // Two malformed entries skipped
    bool pass = got && lua.ready() && cmds.size() == 2 &&
                cmds[0].cmd == "FIRE" && cmds[0].args.empty() &&
                cmds[1].cmd == "ADD_WAYPOINT" && cmds[1].args.size() == 2 &&
                cmds[1].args[0] == 102.5 && cmds[1].args[1] == -50.0;
    print_result(pass);
    return pass;
}

bool test_lua_runtime_failures() {
    std::cout << "\n" << COLOR_YELLOW << "=== Test 8: Lua Failure Modes ===" << COLOR_RESET << "\n";

    ship::ShipState st;
    std::vector<sim::ScriptedCommand> cmds;

    sim::LuaRuntime syntax;
    bool syntax_rejected = !syntax.init_from_string("function broken(") && !syntax.ready();

    sim::LuaRuntime missing;
    bool missing_ok = missing.init_from_string("x = 1\n");
    bool missing_fails = missing_ok && !missing.get_commands(0.0, st, cmds);

    sim::LuaRuntime raising;
    bool raising_ok = raising.init_from_string("function scenario_commands(t, s) error('boom') end\n");
    bool raising_fails = raising_ok && !raising.get_commands(0.0, st, cmds);

    sim::LuaRuntime wrong_type;
    bool wrong_ok = wrong_type.init_from_string("function scenario_commands(t, s) return 7 end\n");
    bool wrong_fails = wrong_ok && !wrong_type.get_commands(0.0, st, cmds);

    sim::LuaRuntime init_false;
    bool init_false_ok = init_false.init_from_string(
        "function scenario_init() return false end\n"
        "function scenario_commands(t, s) return {} end\n");
    bool empty_ok = init_false_ok && init_false.get_commands(0.0, st, cmds) && cmds.empty();

    sim::LuaRuntime init_error;
    bool init_error_rejected = !init_error.init_from_string("function scenario_init() error('no') end\n");

    sim::LuaRuntime no_file;
    bool no_file_rejected = !no_file.init("no_such_script_12345.lua");

    std::cout << "  Syntax error rejected: " << syntax_rejected << "\n";
    std::cout << "  Missing scenario_commands fails: " << missing_fails << "\n";
    std::cout << "  Runtime error fails: " << raising_fails << "\n";
    std::cout << "  Non-table return fails: " << wrong_fails << "\n";
    std::cout << "  scenario_init false tolerated: " << empty_ok << "\n";
    std::cout << "  scenario_init error rejected: " << init_error_rejected << "\n";
    std::cout << "  Missing file rejected: " << no_file_rejected << "\n";

    bool pass = syntax_rejected && missing_fails && raising_fails && wrong_fails &&
                empty_ok && init_error_rejected && no_file_rejected;
    print_result(pass);
    return pass;
}

int main() {
    std::cout << COLOR_YELLOW << "╔════════════════════════════════════════════════════════════╗\n";
    std::cout << "║        SimApp / Lua Integration Tests                      ║\n";
    std::cout << "╚════════════════════════════════════════════════════════════╝" << COLOR_RESET << "\n";

    int passed = 0;
    int total = 0;

    passed += test_timed_commands_and_idle_stop(); total++;
    passed += test_full_duration(); total++;
    passed += test_csv_output(); total++;
    passed += test_csv_open_failure(); total++;
    passed += test_non_finite_timing(); total++;
    passed += test_lua_scripted_commands(); total++;
    passed += test_lua_runtime_state_table(); total++;
    passed += test_lua_runtime_failures(); total++;

    std::cout << "\n" << COLOR_YELLOW << "═══════════════════════════════════════════════════════════" << COLOR_RESET << "\n";
    std::cout << "  " << COLOR_YELLOW << "Summary: " << COLOR_RESET;

    if (passed == total) {
        std::cout << COLOR_GREEN << passed << "/" << total << " tests passed ✓" << COLOR_RESET << "\n";
    } else {
        std::cout << COLOR_RED << passed << "/" << total << " tests passed ✗" << COLOR_RESET << "\n";
    }

    std::cout << COLOR_YELLOW << "═══════════════════════════════════════════════════════════" << COLOR_RESET << "\n\n";

    return (passed == total) ? 0 : 1;
}
