// src/geom/path_follower.cpp
#include "geom/path_follower.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>

namespace geom {

namespace {
// Segments shorter than this have no usable direction
constexpr double kMinSegmentM = 1e-9;
}

PathStep advance(const Path& path, double speed, double dt) {
    if (path.size() < 2) {
        throw std::invalid_argument("advance(): path needs a current position and at least one waypoint");
    }

    double remaining = std::max(0.0, speed) * std::max(0.0, dt);

    const size_t last = path.size() - 1;
    size_t i = 0;
    double seg_len = distance(path[0], path[1]);

    auto skip_degenerate = [&]() {
        while (seg_len <= kMinSegmentM && i + 1 < last) {
            ++i;
            seg_len = distance(path[i], path[i + 1]);
        }
    };

    // Bearing of the last real segment entered; survives a degenerate tail
    PathStep step;
    auto note_facing = [&]() {
        if (seg_len > kMinSegmentM) {
            step.facing_deg = angle_degrees(path[i].x, path[i].y, path[i + 1].x, path[i + 1].y);
            step.has_facing = true;
        }
    };

    skip_degenerate();
    note_facing();

    // Consume whole segments, always keeping the final one
    while (i + 1 < last && remaining >= seg_len) {
        remaining -= seg_len;
        ++i;
        seg_len = distance(path[i], path[i + 1]);
        skip_degenerate();
        note_facing();
    }

    const Point2D& from = path[i];
    const Point2D& to = path[i + 1];

    // Arrival: snap to the final waypoint
    if (i + 1 == last && (remaining >= seg_len || seg_len <= kMinSegmentM)) {
        step.position = to;
        return step;
    }

    const double ux = (to.x - from.x) / seg_len;
    const double uy = (to.y - from.y) / seg_len;
    step.position = {from.x + ux * remaining, from.y + uy * remaining};

    step.path.reserve(path.size() - i);
    step.path.push_back(step.position);
    step.path.insert(step.path.end(), path.begin() + static_cast<std::ptrdiff_t>(i + 1), path.end());
    return step;
}

} // namespace geom
