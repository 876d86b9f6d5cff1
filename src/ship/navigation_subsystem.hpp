// src/ship/navigation_subsystem.hpp
#pragma once

#include "ship/ship_subsystem.hpp"

namespace ship {

/**
 * NavigationSubsystem - Waypoint entry and route display
 *
 * ADD_WAYPOINT(x, y) appends to the ship's waypoint path. When the ship is
 * idle the path is re-seeded with the current position first, so its head is
 * always where the ship is.
 *
 * Every tick the projected path (current position + pending waypoints) is
 * rebuilt for display and telemetry. It has no effect on path following.
 *
 * Fields: projected_path, waypoint_count (ro)
 */
class NavigationSubsystem : public ShipSubsystem {
public:
    explicit NavigationSubsystem(std::string name = "Navigation");

    void initialize(ShipState& s) override;
    void reset(ShipState& s) override;
    void step(ShipState& s, double dt) override;
    int priority() const override { return 150; }

    std::vector<sim::CommandType> declared_commands() const override;
    void handle_command(const sim::Command& cmd, ShipState& s) override;

    void accept_fields(FieldVisitor& visitor) const override;

    const geom::Path& projected_path() const { return projected_; }

    // "(x,y) (x,y) ..." with two decimals
    static std::string format_path(const geom::Path& path);

private:
    geom::Path projected_;

    void rebuild_projection(const ShipState& s);
};

} // namespace ship
