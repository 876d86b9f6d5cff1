// src/ship/ship_state.hpp
#pragma once

#include "geom/path_follower.hpp"

namespace ship {

// Shared ship state. Subsystems receive it by reference from the owning
// ShipModel; this is the single source of truth for telemetry.
// Units are embedded in field names.
struct ShipState {
    // --- Pose (heading: 0 = +y, angle_degrees convention, [0, 360))
    double x_m = 0.0;
    double y_m = 0.0;
    double heading_deg = 0.0;

    // --- Speed control
    double current_speed_mps = 0.0;
    double desired_speed_mps = 0.0;

    // --- Waypoint path: head is the current position, empty when idle
    geom::Path path;

    // --- Collision flags, recomputed every tick before subsystems run
    bool collision_warning = false;  // safety margin touches an obstacle
    bool collision_event = false;    // hull touches an obstacle

    geom::Point2D position() const { return {x_m, y_m}; }

    bool has_pending_waypoints() const { return path.size() >= 2; }

    /**
     * Enumerate ship-level fields under their attribute names.
     *
     * These names are the ship-level keys of ShipModel::get_attribute() and
     * the per-ship telemetry columns.
     */
    template<typename Visitor>
    void accept_fields(Visitor& visitor) const {
        visitor.visit("x", x_m);
        visitor.visit("y", y_m);
        visitor.visit("heading_deg", heading_deg);
        visitor.visit("current_speed", current_speed_mps);
        visitor.visit("desired_speed", desired_speed_mps);
        visitor.visit("collision_warning", collision_warning);
        visitor.visit("collision_event", collision_event);
    }
};

} // namespace ship
