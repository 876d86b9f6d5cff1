// src/ship/ship_subsystem.hpp
#pragma once

#include "ship/field_visitor.hpp"
#include "ship/ship_state.hpp"
#include "sim/command.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ship {

/**
 * ShipSubsystem - Base class for all ship subsystems
 *
 * A subsystem owns a slice of ship behaviour (steering orders, propulsion,
 * navigation, weapons). It never talks to another subsystem: the owning
 * ShipModel hands it the shared ShipState on every call.
 *
 * Each subsystem declares:
 * - a command vocabulary (routed to it by CommandRegistry)
 * - a per-tick step()
 * - a field table (accept_fields / set_field) addressed from outside as
 *   "<name>:<field>" and logged as "<name>.<field>"
 *
 * Lifecycle:
 *   1. initialize() - once, right after attachment
 *   2. step()       - every tick, in SubsystemManager order
 *   3. reset()      - on explicit ShipModel::reset()
 */
class ShipSubsystem {
public:
    virtual ~ShipSubsystem() = default;

    // ========================================================================
    // Lifecycle Management
    // ========================================================================

    virtual void initialize(ShipState& s) {
        (void)s; // Default: no-op
    }

    virtual void reset(ShipState& s) {
        (void)s; // Default: no-op
    }

    /**
     * step() - Per-tick update (REQUIRED)
     *
     * Runs after the collision flags are refreshed and before the path
     * follower moves the ship, so the pose read here is the pre-motion pose.
     */
    virtual void step(ShipState& s, double dt) = 0;

    // ========================================================================
    // Commands
    // ========================================================================

    virtual std::vector<sim::CommandType> declared_commands() const { return {}; }

    bool declares(sim::CommandType type) const;

    /**
     * handle_command() - Execute one routed command
     *
     * @throws UnrecognizedCommandError if cmd is not in declared_commands()
     */
    virtual void handle_command(const sim::Command& cmd, ShipState& s);

    // ========================================================================
    // Field table
    // ========================================================================

    virtual void accept_fields(FieldVisitor& visitor) const {
        (void)visitor; // Default: no fields
    }

    /**
     * set_field() - Write one field by name
     *
     * Returns false for unknown or read-only fields.
     * @throws std::invalid_argument if the value has the wrong type or range
     */
    virtual bool set_field(const std::string& field, const FieldValue& value) {
        (void)field; (void)value;
        return false;
    }

    // Looks the field up through accept_fields()
    std::optional<FieldValue> get_field(const std::string& field) const;

    FieldList fields() const;

    // ========================================================================
    // Metadata & Control
    // ========================================================================

    const std::string& name() const { return name_; }

    virtual bool enabled() const { return enabled_; }
    virtual void set_enabled(bool enabled) { enabled_ = enabled; }

    /**
     * priority() - Execution order hint (lower = earlier)
     *
     * Ties keep attachment order.
     *   0-99:    Orders (rudder)
     *   100-149: Propulsion (engine)
     *   150-199: Navigation
     *   200+:    Payload (weapons)
     */
    virtual int priority() const { return 100; }

protected:
    explicit ShipSubsystem(std::string name) : name_(std::move(name)) {}

    [[noreturn]] void reject(const sim::Command& cmd) const;

    static double as_double(const FieldValue& value, const std::string& field);

    bool enabled_ = true;

private:
    std::string name_;
};

} // namespace ship
