// src/ship/command_registry.hpp
#pragma once

#include "ship/ship_subsystem.hpp"
#include "sim/command.hpp"

#include <map>

namespace ship {

/**
 * CommandRegistry - Maps each command type to its single owning subsystem
 *
 * Built at ship assembly time. Subsystems are borrowed, never owned; the
 * SubsystemManager of the same ShipModel outlives the registry entries.
 */
class CommandRegistry {
public:
    /**
     * attach() - Register every command the subsystem declares
     *
     * All-or-nothing: nothing is registered if any command clashes.
     *
     * @throws DuplicateCommandError if a command is already owned by a
     *         different subsystem
     */
    void attach(ShipSubsystem& subsystem);

    /**
     * dispatch() - Forward a command to its owner
     *
     * Returns false (and logs a warning) when no enabled subsystem owns the
     * command. Never throws for an unowned command.
     */
    bool dispatch(const sim::Command& cmd, ShipState& s) const;

    // nullptr if unowned
    ShipSubsystem* owner(sim::CommandType type) const;

    size_t command_count() const { return owners_.size(); }

private:
    std::map<sim::CommandType, ShipSubsystem*> owners_;
};

} // namespace ship
