// src/geom/polygon.hpp
#pragma once

#include <vector>

namespace geom {

// Planar point, meters.
struct Point2D {
    double x = 0.0;
    double y = 0.0;
};

inline bool operator==(const Point2D& a, const Point2D& b) {
    return a.x == b.x && a.y == b.y;
}

inline bool operator!=(const Point2D& a, const Point2D& b) {
    return !(a == b);
}

// Implicitly closed vertex ring. Orientation is free; a repeated closing
// vertex is tolerated.
using Polygon = std::vector<Point2D>;

struct Bounds {
    double min_x = 0.0;
    double min_y = 0.0;
    double max_x = 0.0;
    double max_y = 0.0;
};

/**
 * TransformOrigin - Pivot for rotation and scaling in transform()
 *
 *   centroid()  area centroid of the polygon at that stage (default)
 *   center()    bounding-box centre of the polygon at that stage
 *   at(p)       fixed world point
 */
struct TransformOrigin {
    enum class Kind { Centroid, Center, Point };

    Kind kind = Kind::Centroid;
    Point2D point{};

    static TransformOrigin centroid() { return {Kind::Centroid, {}}; }
    static TransformOrigin center() { return {Kind::Center, {}}; }
    static TransformOrigin at(Point2D p) { return {Kind::Point, p}; }
};

constexpr double kPi = 3.14159265358979323846;

inline double deg2rad(double d) { return d * kPi / 180.0; }
inline double rad2deg(double r) { return r * 180.0 / kPi; }

// Wraps any angle into [0, 360).
double normalize_deg(double deg);

double distance(const Point2D& a, const Point2D& b);

/**
 * angle_degrees() - Bearing from (x1,y1) to (x2,y2)
 *
 * (degrees(atan2(dy, dx)) - 90) mod 360: 0 is +y, +x is 270, -x is 90.
 * Same convention as the ship heading.
 */
double angle_degrees(double x1, double y1, double x2, double y2);

/**
 * validate_polygon() - Enforce the polygon contract
 *
 * @throws std::invalid_argument if fewer than 3 distinct vertices
 */
void validate_polygon(const Polygon& poly, const char* what = "polygon");

// Shoelace area, positive for counter-clockwise rings.
double signed_area(const Polygon& poly);

// Area centroid; falls back to the vertex average for zero-area rings.
Point2D centroid(const Polygon& poly);

Bounds bounds(const Polygon& poly);

/**
 * transform() - Translate, then rotate (CCW degrees), then scale
 *
 * The origin for rotation and scaling is resolved on the polygon as it is at
 * that stage. Pure translations compose additively.
 */
Polygon transform(const Polygon& poly,
                  double dx,
                  double dy,
                  double rotation_deg = 0.0,
                  double scale = 1.0,
                  TransformOrigin origin = TransformOrigin::centroid());

// Boundary counts as inside.
bool point_in_polygon(const Point2D& p, const Polygon& poly);

// Closed segments; touching and collinear overlap count.
bool segments_intersect(const Point2D& p1, const Point2D& p2,
                        const Point2D& q1, const Point2D& q2);

/**
 * intersects() - True iff the polygons share at least one point
 *
 * Touching boundaries count. Symmetric in its arguments.
 *
 * @throws std::invalid_argument if either polygon is malformed
 */
bool intersects(const Polygon& a, const Polygon& b);

// Counter-clockwise hull without collinear points (Andrew's monotone chain).
Polygon convex_hull(const Polygon& poly);

} // namespace geom
