// src/sim/world.hpp
#pragma once

#include "geom/polygon.hpp"
#include "ship/ship_model.hpp"

#include <memory>
#include <string>
#include <vector>

namespace sim {

// Flat (key, value) record for one tick: "total_time", "timedelta", then
// "<ship>.<field>" / "<ship>.<subsystem>.<field>" per ship.
using TelemetrySnapshot = ship::FieldList;

/**
 * World - Obstacle field plus the ships sailing in it
 *
 * Obstacles are static polygons validated on insertion. Each update()
 * advances the clock and steps every ship in insertion order against the
 * full obstacle set.
 */
class World {
public:
    World() = default;

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // ========================================================================
    // Obstacles
    // ========================================================================

    /**
     * @throws std::invalid_argument if the polygon is malformed
     */
    void add_obstacle(geom::Polygon obstacle);

    // Replaces the whole set; nothing changes if any polygon is malformed
    void set_obstacles(std::vector<geom::Polygon> obstacles);

    const std::vector<geom::Polygon>& obstacles() const { return obstacles_; }

    // ========================================================================
    // Ships
    // ========================================================================

    /**
     * @throws std::invalid_argument for a null ship or a duplicate name
     */
    ship::ShipModel& add_ship(std::unique_ptr<ship::ShipModel> ship);

    // nullptr if not found
    ship::ShipModel* find_ship(const std::string& name);
    const ship::ShipModel* find_ship(const std::string& name) const;

    size_t ship_count() const { return ships_.size(); }
    ship::ShipModel& ship_at(size_t index) { return *ships_.at(index); }
    const ship::ShipModel& ship_at(size_t index) const { return *ships_.at(index); }

    // ========================================================================
    // Simulation
    // ========================================================================

    /**
     * update() - Advance the world by dt seconds
     *
     * Negative dt is reported and ignored. dt = 0 still runs a tick
     * (collision flags refresh, nothing moves).
     */
    void update(double dt);

    double total_time() const { return total_time_; }
    double timedelta() const { return timedelta_; }

    // True when no ship has pending waypoints
    bool all_idle() const;

    TelemetrySnapshot telemetry() const;

private:
    std::vector<geom::Polygon> obstacles_;
    std::vector<std::unique_ptr<ship::ShipModel>> ships_;

    double total_time_ = 0.0;
    double timedelta_ = 0.0;
};

} // namespace sim
