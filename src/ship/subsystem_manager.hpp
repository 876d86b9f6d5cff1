// src/ship/subsystem_manager.hpp
#pragma once

#include "ship/ship_subsystem.hpp"
#include <memory>
#include <vector>

namespace ship {

/**
 * SubsystemManager - Owns and orchestrates a ship's subsystems
 *
 * Responsibilities:
 * - Own registered subsystems
 * - Order by priority (stable: ties keep registration order)
 * - Execute step() for enabled subsystems
 * - Initialize / reset
 *
 * Command routing lives in CommandRegistry; ShipModel::attach() keeps the
 * two in sync.
 */
class SubsystemManager {
public:
    SubsystemManager() = default;
    ~SubsystemManager() = default;

    // Non-copyable (owns unique_ptr subsystems)
    SubsystemManager(const SubsystemManager&) = delete;
    SubsystemManager& operator=(const SubsystemManager&) = delete;

    // ========================================================================
    // Registration
    // ========================================================================

    /**
     * register_subsystem() - Take ownership of a subsystem
     *
     * @return the registered subsystem, or nullptr for a null argument
     * @throws DuplicateSubsystemError if the name is already registered
     */
    ShipSubsystem* register_subsystem(std::unique_ptr<ShipSubsystem> subsystem);

    void initialize_all(ShipState& s);

    /**
     * reset_all() - Reset all enabled subsystems to initial conditions
     */
    void reset_all(ShipState& s);

    // ========================================================================
    // Execution
    // ========================================================================

    /**
     * step_all() - One tick for all enabled subsystems, in priority order
     */
    void step_all(ShipState& s, double dt);

    // ========================================================================
    // Query & Control
    // ========================================================================

    // nullptr if not found
    ShipSubsystem* find_subsystem(const std::string& name);
    const ShipSubsystem* find_subsystem(const std::string& name) const;

    // nullptr if index out of bounds
    ShipSubsystem* get_subsystem(size_t index);
    const ShipSubsystem* get_subsystem(size_t index) const;

    size_t subsystem_count() const { return subsystems_.size(); }

    size_t enabled_count() const;

private:
    std::vector<std::unique_ptr<ShipSubsystem>> subsystems_;

    void sort_by_priority();
};

} // namespace ship
