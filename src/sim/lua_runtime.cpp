// src/sim/lua_runtime.cpp
#include "lua_runtime.hpp"
#include "utils/logging.hpp"

namespace sim {

namespace {

// Writes every ship-level field into the table on top of the stack
struct LuaTableWriter {
    lua_State* L;

    void visit(const char* k, double v) {
        lua_pushnumber(L, v);
        lua_setfield(L, -2, k);
    }

    void visit(const char* k, bool v) {
        lua_pushboolean(L, v ? 1 : 0);
        lua_setfield(L, -2, k);
    }
};

} // namespace

LuaRuntime::~LuaRuntime() {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }
}

bool LuaRuntime::open_state_() {
    if (L_) {
        lua_close(L_);
        L_ = nullptr;
    }

    L_ = luaL_newstate();
    if (!L_) return false;

    luaL_openlibs(L_);
    return true;
}

bool LuaRuntime::init(const std::string& lua_script_path) {
    if (!open_state_()) return false;

    if (luaL_dofile(L_, lua_script_path.c_str()) != LUA_OK) {
        LOG_ERROR("[Lua] Failed to load script: %s", lua_tostring(L_, -1));
        lua_close(L_);
        L_ = nullptr;
        return false;
    }

    LOG_INFO("[Lua] Loaded %s", lua_script_path.c_str());
    return run_init_();
}

bool LuaRuntime::init_from_string(const std::string& chunk) {
    if (!open_state_()) return false;

    if (luaL_dostring(L_, chunk.c_str()) != LUA_OK) {
        LOG_ERROR("[Lua] Failed to load chunk: %s", lua_tostring(L_, -1));
        lua_close(L_);
        L_ = nullptr;
        return false;
    }
    return run_init_();
}

bool LuaRuntime::run_init_() {
    // Call optional scenario_init() if present
    lua_getglobal(L_, "scenario_init");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        return true;
    }

    if (lua_pcall(L_, 0, 1, 0) != LUA_OK) {
        LOG_ERROR("[Lua] scenario_init failed: %s", lua_tostring(L_, -1));
        lua_close(L_);
        L_ = nullptr;
        return false;
    }

    // nil counts as success; only an explicit false is reported
    if (lua_isboolean(L_, -1) && !lua_toboolean(L_, -1)) {
        LOG_WARN("[Lua] scenario_init returned false");
    }
    lua_pop(L_, 1);
    return true;
}

void LuaRuntime::push_state_table_(const ship::ShipState& s) {
    lua_newtable(L_);

    LuaTableWriter w{L_};
    s.accept_fields(w);
    w.visit("waypoints_pending",
            s.path.size() > 1 ? static_cast<double>(s.path.size() - 1) : 0.0);
}

bool LuaRuntime::read_cmd_table_(int idx, ScriptedCommand& out_cmd) {
    if (!lua_istable(L_, idx)) return false;

    lua_getfield(L_, idx, "cmd");
    if (!lua_isstring(L_, -1)) {
        lua_pop(L_, 1);
        return false;
    }
    out_cmd.cmd = lua_tostring(L_, -1);
    lua_pop(L_, 1);

    out_cmd.args.clear();
    lua_getfield(L_, idx, "args");
    if (lua_istable(L_, -1)) {
        const lua_Integer n = static_cast<lua_Integer>(lua_rawlen(L_, -1));
        for (lua_Integer i = 1; i <= n; ++i) {
            lua_rawgeti(L_, -1, i);
            if (!lua_isnumber(L_, -1)) {
                lua_pop(L_, 2);
                return false;
            }
            out_cmd.args.push_back(lua_tonumber(L_, -1));
            lua_pop(L_, 1);
        }
    }
    lua_pop(L_, 1);

    return true;
}

bool LuaRuntime::get_commands(double t_s,
                              const ship::ShipState& s,
                              std::vector<ScriptedCommand>& out_cmds) {
    out_cmds.clear();
    if (!L_) return false;

    lua_getglobal(L_, "scenario_commands");
    if (!lua_isfunction(L_, -1)) {
        lua_pop(L_, 1);
        LOG_ERROR("[Lua] scenario_commands() missing");
        return false;
    }

    lua_pushnumber(L_, t_s);
    push_state_table_(s);

    if (lua_pcall(L_, 2, 1, 0) != LUA_OK) {
        LOG_ERROR("[Lua] scenario_commands failed: %s", lua_tostring(L_, -1));
        lua_pop(L_, 1);
        return false;
    }

    // nil = nothing to do this tick
    if (lua_isnil(L_, -1)) {
        lua_pop(L_, 1);
        return true;
    }
    if (!lua_istable(L_, -1)) {
        LOG_ERROR("[Lua] scenario_commands must return a table");
        lua_pop(L_, 1);
        return false;
    }

    const int list = lua_gettop(L_);
    const lua_Integer n = static_cast<lua_Integer>(lua_rawlen(L_, list));
    for (lua_Integer i = 1; i <= n; ++i) {
        lua_rawgeti(L_, list, i);
        ScriptedCommand cmd;
        if (read_cmd_table_(lua_gettop(L_), cmd)) {
            out_cmds.push_back(std::move(cmd));
        } else {
            LOG_WARN("[Lua] t=%.2f: skipping malformed command #%lld", t_s, static_cast<long long>(i));
        }
        lua_pop(L_, 1);
    }
    lua_pop(L_, 1);

    return true;
}

} // namespace sim
