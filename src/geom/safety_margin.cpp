// src/geom/safety_margin.cpp
#include "geom/safety_margin.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace geom {

Polygon build_safety_margin(const Polygon& hull, double clearance_m, int segments_per_quadrant) {
    validate_polygon(hull, "hull");
    if (!(clearance_m > 0.0)) {
        throw std::invalid_argument("Invalid safety clearance: must be > 0");
    }
    if (segments_per_quadrant < 1) {
        throw std::invalid_argument("Invalid segments_per_quadrant: must be >= 1");
    }

    const Polygon ring = convex_hull(hull);
    if (ring.size() < 3) {
        // Collinear input has no interior to offset
        throw std::invalid_argument("Invalid hull: vertices are collinear");
    }

    const size_t n = ring.size();
    const double max_step_rad = (kPi / 2.0) / static_cast<double>(segments_per_quadrant);

    // Outward normal angle of edge i (ring[i] -> ring[i+1]); ring is CCW so the
    // outward side is to the right of the edge direction.
    auto edge_normal_angle = [&](size_t i) {
        const Point2D& a = ring[i];
        const Point2D& b = ring[(i + 1) % n];
        return std::atan2(-(b.x - a.x), b.y - a.y);
    };

    Polygon out;
    out.reserve(n * (static_cast<size_t>(segments_per_quadrant) * 2 + 1));

    for (size_t i = 0; i < n; ++i) {
        const Point2D& v = ring[i];
        const double start = edge_normal_angle((i + n - 1) % n);  // incoming edge
        double sweep = edge_normal_angle(i) - start;              // to outgoing edge

        // Convex CCW ring: the exterior turn is in (0, pi)
        while (sweep < 0.0) sweep += 2.0 * kPi;
        while (sweep >= 2.0 * kPi) sweep -= 2.0 * kPi;

        const int steps = std::max(1, static_cast<int>(std::ceil(sweep / max_step_rad - 1e-9)));
        for (int k = 0; k <= steps; ++k) {
            const double a = start + sweep * static_cast<double>(k) / static_cast<double>(steps);
            out.push_back({v.x + clearance_m * std::cos(a), v.y + clearance_m * std::sin(a)});
        }
    }

    return out;
}

} // namespace geom
