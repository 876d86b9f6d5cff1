// src/sim/command.hpp
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace sim {

enum class CommandType {
    TurnLeft,
    TurnRight,
    SetSpeed,
    AddWaypoint,
    Fire
};

// Operator command routed to the subsystem that owns its type.
// Keep it POD-ish and deterministic.
struct Command {
    CommandType type = CommandType::Fire;

    // SetSpeed: a = target speed (m/s)
    // AddWaypoint: a = x (m), b = y (m)
    double a = 0.0;
    double b = 0.0;

    static Command turn_left() { return {CommandType::TurnLeft, 0.0, 0.0}; }
    static Command turn_right() { return {CommandType::TurnRight, 0.0, 0.0}; }
    static Command set_speed(double v) { return {CommandType::SetSpeed, v, 0.0}; }
    static Command add_waypoint(double x, double y) { return {CommandType::AddWaypoint, x, y}; }
    static Command fire() { return {CommandType::Fire, 0.0, 0.0}; }
};

// Wire token, e.g. "SET_SPEED"
const char* to_token(CommandType type);

// Number of positional arguments the token carries
size_t arg_count(CommandType type);

std::optional<CommandType> parse_token(const std::string& token);

/**
 * parse_command() - Build a command from a controller token and its arguments
 *
 * Returns std::nullopt for unknown tokens or a wrong argument count; the
 * caller decides how to report it.
 */
std::optional<Command> parse_command(const std::string& token, const std::vector<double>& args);

std::string describe(const Command& cmd);

} // namespace sim
