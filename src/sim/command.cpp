// src/sim/command.cpp
#include "sim/command.hpp"

#include <cstdio>

namespace sim {

const char* to_token(CommandType type) {
    switch (type) {
        case CommandType::TurnLeft:    return "TURN_LEFT";
        case CommandType::TurnRight:   return "TURN_RIGHT";
        case CommandType::SetSpeed:    return "SET_SPEED";
        case CommandType::AddWaypoint: return "ADD_WAYPOINT";
        case CommandType::Fire:        return "FIRE";
    }
    return "UNKNOWN";
}

size_t arg_count(CommandType type) {
    switch (type) {
        case CommandType::SetSpeed:    return 1;
        case CommandType::AddWaypoint: return 2;
        default:                       return 0;
    }
}

std::optional<CommandType> parse_token(const std::string& token) {
    static const CommandType all[] = {
        CommandType::TurnLeft,
        CommandType::TurnRight,
        CommandType::SetSpeed,
        CommandType::AddWaypoint,
        CommandType::Fire,
    };

    for (CommandType t : all) {
        if (token == to_token(t)) return t;
    }
    return std::nullopt;
}

std::optional<Command> parse_command(const std::string& token, const std::vector<double>& args) {
    const auto type = parse_token(token);
    if (!type || args.size() != arg_count(*type)) {
        return std::nullopt;
    }

    Command cmd{};
    cmd.type = *type;
    if (args.size() > 0) cmd.a = args[0];
    if (args.size() > 1) cmd.b = args[1];
    return cmd;
}

std::string describe(const Command& cmd) {
    char buf[96];
    switch (arg_count(cmd.type)) {
        case 1:
            std::snprintf(buf, sizeof(buf), "%s(%.2f)", to_token(cmd.type), cmd.a);
            break;
        case 2:
            std::snprintf(buf, sizeof(buf), "%s(%.2f, %.2f)", to_token(cmd.type), cmd.a, cmd.b);
            break;
        default:
            std::snprintf(buf, sizeof(buf), "%s", to_token(cmd.type));
            break;
    }
    return buf;
}

} // namespace sim
