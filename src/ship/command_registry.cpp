// src/ship/command_registry.cpp
#include "ship/command_registry.hpp"
#include "ship/ship_errors.hpp"
#include "utils/logging.hpp"

namespace ship {

void CommandRegistry::attach(ShipSubsystem& subsystem) {
    const auto commands = subsystem.declared_commands();

    // Validate everything before touching the table
    for (sim::CommandType type : commands) {
        auto it = owners_.find(type);
        if (it != owners_.end() && it->second != &subsystem) {
            throw DuplicateCommandError(
                "Could not attach '" + subsystem.name() + "'; command '" +
                sim::to_token(type) + "' already handled by '" + it->second->name() + "'");
        }
    }

    for (sim::CommandType type : commands) {
        owners_[type] = &subsystem;
        LOG_DEBUG("[CommandRegistry] %s -> %s", sim::to_token(type), subsystem.name().c_str());
    }
}

bool CommandRegistry::dispatch(const sim::Command& cmd, ShipState& s) const {
    ShipSubsystem* target = owner(cmd.type);
    if (!target) {
        LOG_WARN("[CommandRegistry] No system can handle the command '%s'", sim::to_token(cmd.type));
        return false;
    }
    if (!target->enabled()) {
        LOG_WARN("[CommandRegistry] Command '%s' dropped: %s is disabled",
                 sim::to_token(cmd.type), target->name().c_str());
        return false;
    }

    LOG_DEBUG("[CommandRegistry] %s -> %s", sim::describe(cmd).c_str(), target->name().c_str());
    target->handle_command(cmd, s);
    return true;
}

ShipSubsystem* CommandRegistry::owner(sim::CommandType type) const {
    auto it = owners_.find(type);
    return it == owners_.end() ? nullptr : it->second;
}

} // namespace ship
