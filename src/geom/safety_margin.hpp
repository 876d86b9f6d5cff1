// src/geom/safety_margin.hpp
#pragma once

#include "geom/polygon.hpp"

namespace geom {

// Fixed clearance used for the minimum safe area around a hull.
constexpr double kDefaultSafetyClearanceM = 100.0;

// Chords per quarter circle in the round joins.
constexpr int kDefaultSegmentsPerQuadrant = 16;

/**
 * build_safety_margin() - Minimum safe area around a hull
 *
 * Outward Minkowski expansion of the convex hull of `hull` by a disk of radius
 * `clearance_m`: each hull edge is pushed out along its normal and
 * consecutive offset edges are joined by circular arcs centred on the shared
 * vertex. Arcs are approximated with `segments_per_quadrant` chords per 90 deg,
 * so every output vertex lies exactly `clearance_m` from the hull and chord
 * midpoints sag by at most clearance_m * (1 - cos(step / 2)).
 *
 * Output is counter-clockwise, in the same frame as the input.
 *
 * @throws std::invalid_argument on a malformed hull, clearance_m <= 0 or
 *         segments_per_quadrant < 1
 */
Polygon build_safety_margin(const Polygon& hull,
                            double clearance_m = kDefaultSafetyClearanceM,
                            int segments_per_quadrant = kDefaultSegmentsPerQuadrant);

} // namespace geom
