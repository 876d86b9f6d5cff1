// src/ship/ship_model.hpp
#pragma once

#include "geom/polygon.hpp"
#include "geom/safety_margin.hpp"
#include "ship/command_registry.hpp"
#include "ship/engine_subsystem.hpp"
#include "ship/ship_state.hpp"
#include "ship/subsystem_manager.hpp"
#include "sim/command.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ship {

struct ShipParams {
    std::string name = "Battleship";

    // Outline in the ship frame, bow toward +y. Re-centred on its centroid.
    geom::Polygon hull;

    double safety_clearance_m = geom::kDefaultSafetyClearanceM;

    // Initial pose
    double x_m = 0.0;
    double y_m = 0.0;
    double heading_deg = 0.0;
};

// Tapered 9-vertex battleship outline (width x length), bow toward +y,
// centred on its bounding box.
geom::Polygon default_hull(double width_m = 20.0, double length_m = 154.0);

/**
 * ShipModel - One vessel: pose, geometry, subsystems, per-tick orchestration
 *
 * Tick order (fixed):
 *   1. world-frame hull and safety margin from the current pose
 *   2. collision_warning / collision_event against every obstacle
 *   3. subsystems step (SubsystemManager order)
 *   4. path follower advances the pose if waypoints remain
 *
 * Attribute surface: ship-level keys ("x", "heading_deg", ...) or
 * "<subsystem>:<field>".
 */
class ShipModel {
public:
    /**
     * @throws std::invalid_argument on a malformed hull or clearance <= 0
     */
    explicit ShipModel(ShipParams p);

    ShipModel(const ShipModel&) = delete;
    ShipModel& operator=(const ShipModel&) = delete;

    const std::string& name() const { return p_.name; }
    const ShipParams& params() const { return p_; }

    // ========================================================================
    // Assembly
    // ========================================================================

    /**
     * attach() - Take ownership of a subsystem and route its commands
     *
     * Nothing is attached when this throws.
     *
     * @throws DuplicateCommandError if a declared command is already owned
     * @throws DuplicateSubsystemError if the name is already attached
     * @throws std::invalid_argument for a null subsystem
     */
    ShipSubsystem& attach(std::unique_ptr<ShipSubsystem> subsystem);

    ShipSubsystem* find_subsystem(const std::string& name) { return subsystems_.find_subsystem(name); }
    const ShipSubsystem* find_subsystem(const std::string& name) const { return subsystems_.find_subsystem(name); }

    template<typename T>
    T* find(const std::string& name) {
        return dynamic_cast<T*>(subsystems_.find_subsystem(name));
    }

    SubsystemManager& subsystem_manager() { return subsystems_; }
    const SubsystemManager& subsystem_manager() const { return subsystems_; }
    const CommandRegistry& command_registry() const { return registry_; }

    // ========================================================================
    // Commands
    // ========================================================================

    // false (with a warning) when no subsystem takes the command
    bool dispatch(const sim::Command& cmd);

    // Controller-facing form; unknown tokens and bad argument counts are
    // reported and return false
    bool dispatch(const std::string& token, const std::vector<double>& args = {});

    // ========================================================================
    // Simulation
    // ========================================================================

    void step(double dt, const std::vector<geom::Polygon>& obstacles);

    // Back to the initial pose, path cleared, subsystems reset
    void reset();

    bool idle() const { return !state_.has_pending_waypoints(); }

    // ========================================================================
    // State & geometry
    // ========================================================================

    const ShipState& state() const { return state_; }
    ShipState& state() { return state_; }

    // Ship frame
    const geom::Polygon& hull() const { return hull_; }
    const geom::Polygon& safety_margin() const { return margin_; }

    // World frame, as of the last collision check
    const geom::Polygon& world_hull() const { return world_hull_; }
    const geom::Polygon& world_safety_margin() const { return world_margin_; }

    size_t tick_count() const { return ticks_; }
    size_t warning_ticks() const { return warning_ticks_; }
    size_t collision_ticks() const { return collision_ticks_; }

    // ========================================================================
    // Attribute surface
    // ========================================================================

    /**
     * @throws UnknownFieldError for unknown keys
     */
    FieldValue get_attribute(const std::string& key) const;

    /**
     * @throws UnknownFieldError for unknown or read-only keys
     * @throws std::invalid_argument for a value of the wrong type
     */
    void set_attribute(const std::string& key, const FieldValue& value);

    // Ship fields, then "<subsystem>.<field>" in execution order
    FieldList telemetry() const;

private:
    ShipParams p_;
    geom::Polygon hull_;
    geom::Polygon margin_;
    geom::Polygon world_hull_;
    geom::Polygon world_margin_;

    ShipState state_;
    SubsystemManager subsystems_;
    CommandRegistry registry_;

    size_t ticks_ = 0;
    size_t warning_ticks_ = 0;
    size_t collision_ticks_ = 0;

    void update_world_geometry();
    void update_collisions(const std::vector<geom::Polygon>& obstacles);
    void follow_path(double dt);
    ShipState initial_state() const;
};

/**
 * attach_default_subsystems() - Standard fit-out
 *
 * Rudder, Engine, Navigation and Weapons, each owning its own commands.
 */
void attach_default_subsystems(ShipModel& ship, const EngineParams& engine = {});

} // namespace ship
