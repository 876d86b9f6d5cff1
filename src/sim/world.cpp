// src/sim/world.cpp
#include "sim/world.hpp"
#include "utils/logging.hpp"

#include <stdexcept>

namespace sim {

void World::add_obstacle(geom::Polygon obstacle) {
    geom::validate_polygon(obstacle, "obstacle");
    obstacles_.push_back(std::move(obstacle));
    LOG_DEBUG("[World] Obstacle %zu added (%zu vertices)", obstacles_.size(), obstacles_.back().size());
}

void World::set_obstacles(std::vector<geom::Polygon> obstacles) {
    for (const auto& obstacle : obstacles) {
        geom::validate_polygon(obstacle, "obstacle");
    }
    obstacles_ = std::move(obstacles);
    LOG_INFO("[World] %zu obstacles loaded", obstacles_.size());
}

ship::ShipModel& World::add_ship(std::unique_ptr<ship::ShipModel> ship) {
    if (!ship) {
        throw std::invalid_argument("Cannot add a null ship");
    }
    if (find_ship(ship->name())) {
        throw std::invalid_argument("Ship '" + ship->name() + "' already in the world");
    }

    ships_.push_back(std::move(ship));
    LOG_INFO("[World] Ship '%s' added", ships_.back()->name().c_str());
    return *ships_.back();
}

ship::ShipModel* World::find_ship(const std::string& name) {
    for (auto& s : ships_) {
        if (s->name() == name) {
            return s.get();
        }
    }
    return nullptr;
}

const ship::ShipModel* World::find_ship(const std::string& name) const {
    for (const auto& s : ships_) {
        if (s->name() == name) {
            return s.get();
        }
    }
    return nullptr;
}

void World::update(double dt) {
    if (dt < 0.0) {
        LOG_WARN("[World] Negative dt %.4f ignored at t=%.3f", dt, total_time_);
        return;
    }

    total_time_ += dt;
    timedelta_ = dt;

    for (auto& s : ships_) {
        s->step(dt, obstacles_);
    }
}

bool World::all_idle() const {
    for (const auto& s : ships_) {
        if (!s->idle()) {
            return false;
        }
    }
    return true;
}

TelemetrySnapshot World::telemetry() const {
    TelemetrySnapshot out;
    out.emplace_back("total_time", ship::FieldValue(total_time_));
    out.emplace_back("timedelta", ship::FieldValue(timedelta_));

    for (const auto& s : ships_) {
        for (auto& kv : s->telemetry()) {
            out.emplace_back(s->name() + "." + kv.first, std::move(kv.second));
        }
    }
    return out;
}

} // namespace sim
