// src/sim/lua_runtime.hpp
#pragma once

#include <string>
#include <vector>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

#include "ship/ship_state.hpp"

namespace sim {

// Command as returned by a script: controller token plus positional args.
// Parsed and routed by ShipModel::dispatch(token, args).
struct ScriptedCommand {
    std::string cmd;
    std::vector<double> args;
};

/**
 * LuaRuntime - Scripted operator for one ship
 *
 * The script defines
 *   scenario_commands(t, state) -> { {cmd = "SET_SPEED", args = {10}}, ... }
 * and optionally scenario_init(). `state` holds the ship-level fields
 * (x, y, heading_deg, current_speed, desired_speed, collision_warning,
 * collision_event) plus waypoints_pending.
 */
class LuaRuntime {
public:
    LuaRuntime() = default;
    ~LuaRuntime();

    LuaRuntime(const LuaRuntime&) = delete;
    LuaRuntime& operator=(const LuaRuntime&) = delete;

    bool init(const std::string& lua_script_path);

    // Same as init() but from an in-memory chunk
    bool init_from_string(const std::string& chunk);

    bool ready() const { return L_ != nullptr; }

    /**
     * get_commands() - Call scenario_commands(t, state)
     *
     * Malformed entries are skipped with a warning. Returns false if the
     * script is missing the function or raised an error.
     */
    bool get_commands(double t_s,
                      const ship::ShipState& s,
                      std::vector<ScriptedCommand>& out_cmds);

private:
    lua_State* L_{nullptr};

    bool open_state_();
    bool run_init_();
    void push_state_table_(const ship::ShipState& s);
    bool read_cmd_table_(int idx, ScriptedCommand& out_cmd);
};

} // namespace sim
