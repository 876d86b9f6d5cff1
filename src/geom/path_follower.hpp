// src/geom/path_follower.hpp
#pragma once

#include "geom/polygon.hpp"

#include <vector>

namespace geom {

using Path = std::vector<Point2D>;

/**
 * PathStep - Result of one advance() call
 *
 * `path` is empty once the final waypoint is reached; otherwise its head is
 * `position`. `has_facing` is false only when no segment walked this call
 * has a direction (all zero-length); callers keep their heading.
 */
struct PathStep {
    Point2D position{};
    double facing_deg = 0.0;
    bool has_facing = false;
    Path path;

    bool arrived() const { return path.empty(); }
};

/**
 * advance() - Move along a waypoint polyline for one time slice
 *
 * Covers speed * dt meters along `path` (head = current position), consuming
 * waypoints as they are passed. Facing is the bearing (angle_degrees
 * convention) of the last non-degenerate segment reached. Zero-length
 * segments are skipped. Negative speed or dt count as zero.
 *
 * The caller's path is never modified.
 *
 * @throws std::invalid_argument if path has fewer than 2 points
 */
PathStep advance(const Path& path, double speed, double dt);

} // namespace geom
