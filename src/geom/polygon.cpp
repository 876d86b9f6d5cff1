// src/geom/polygon.cpp
#include "geom/polygon.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace geom {

namespace {

constexpr double kEps = 1e-9;

double cross(const Point2D& o, const Point2D& a, const Point2D& b) {
    return (a.x - o.x) * (b.y - o.y) - (a.y - o.y) * (b.x - o.x);
}

int orientation(const Point2D& o, const Point2D& a, const Point2D& b) {
    const double c = cross(o, a, b);
    if (c > kEps) return 1;
    if (c < -kEps) return -1;
    return 0;
}

// r lies within the bounding box of segment pq (used after a collinearity test)
bool within_box(const Point2D& p, const Point2D& q, const Point2D& r) {
    return r.x <= std::max(p.x, q.x) + kEps && r.x >= std::min(p.x, q.x) - kEps &&
           r.y <= std::max(p.y, q.y) + kEps && r.y >= std::min(p.y, q.y) - kEps;
}

bool on_segment(const Point2D& p, const Point2D& q, const Point2D& r) {
    return orientation(p, q, r) == 0 && within_box(p, q, r);
}

size_t distinct_vertex_count(const Polygon& poly) {
    size_t count = 0;
    for (size_t i = 0; i < poly.size(); ++i) {
        bool seen = false;
        for (size_t j = 0; j < i; ++j) {
            if (poly[j] == poly[i]) {
                seen = true;
                break;
            }
        }
        if (!seen) ++count;
    }
    return count;
}

Point2D resolve_origin(const Polygon& poly, const TransformOrigin& origin) {
    switch (origin.kind) {
        case TransformOrigin::Kind::Point:
            return origin.point;
        case TransformOrigin::Kind::Center: {
            const Bounds b = bounds(poly);
            return {(b.min_x + b.max_x) * 0.5, (b.min_y + b.max_y) * 0.5};
        }
        case TransformOrigin::Kind::Centroid:
        default:
            return centroid(poly);
    }
}

} // namespace

double normalize_deg(double deg) {
    double a = std::fmod(deg, 360.0);
    if (a < 0.0) a += 360.0;
    if (a >= 360.0) a = 0.0;
    return a;
}

double distance(const Point2D& a, const Point2D& b) {
    return std::hypot(b.x - a.x, b.y - a.y);
}

double angle_degrees(double x1, double y1, double x2, double y2) {
    const double angle_rad = std::atan2(y2 - y1, x2 - x1);
    return normalize_deg(rad2deg(angle_rad) - 90.0);
}

void validate_polygon(const Polygon& poly, const char* what) {
    if (distinct_vertex_count(poly) < 3) {
        throw std::invalid_argument(
            std::string("Invalid ") + what + ": needs at least 3 distinct vertices (got " +
            std::to_string(distinct_vertex_count(poly)) + ")");
    }
}

double signed_area(const Polygon& poly) {
    const size_t n = poly.size();
    if (n < 3) return 0.0;

    double acc = 0.0;
    for (size_t i = 0; i < n; ++i) {
        const Point2D& a = poly[i];
        const Point2D& b = poly[(i + 1) % n];
        acc += a.x * b.y - b.x * a.y;
    }
    return acc * 0.5;
}

Point2D centroid(const Polygon& poly) {
    const size_t n = poly.size();
    if (n == 0) return {};

    const double area = signed_area(poly);
    if (std::abs(area) > kEps) {
        double cx = 0.0;
        double cy = 0.0;
        for (size_t i = 0; i < n; ++i) {
            const Point2D& a = poly[i];
            const Point2D& b = poly[(i + 1) % n];
            const double f = a.x * b.y - b.x * a.y;
            cx += (a.x + b.x) * f;
            cy += (a.y + b.y) * f;
        }
        return {cx / (6.0 * area), cy / (6.0 * area)};
    }

    // Degenerate (collinear) ring: vertex average
    Point2D avg{};
    for (const auto& p : poly) {
        avg.x += p.x;
        avg.y += p.y;
    }
    avg.x /= static_cast<double>(n);
    avg.y /= static_cast<double>(n);
    return avg;
}

Bounds bounds(const Polygon& poly) {
    Bounds b{};
    if (poly.empty()) return b;

    b.min_x = b.max_x = poly.front().x;
    b.min_y = b.max_y = poly.front().y;
    for (const auto& p : poly) {
        b.min_x = std::min(b.min_x, p.x);
        b.max_x = std::max(b.max_x, p.x);
        b.min_y = std::min(b.min_y, p.y);
        b.max_y = std::max(b.max_y, p.y);
    }
    return b;
}

Polygon transform(const Polygon& poly,
                  double dx,
                  double dy,
                  double rotation_deg,
                  double scale,
                  TransformOrigin origin) {
    Polygon out = poly;

    // 1. Translate
    for (auto& p : out) {
        p.x += dx;
        p.y += dy;
    }

    // 2. Rotate (counter-clockwise)
    if (rotation_deg != 0.0) {
        const Point2D o = resolve_origin(out, origin);
        const double c = std::cos(deg2rad(rotation_deg));
        const double s = std::sin(deg2rad(rotation_deg));
        for (auto& p : out) {
            const double rx = p.x - o.x;
            const double ry = p.y - o.y;
            p.x = o.x + rx * c - ry * s;
            p.y = o.y + rx * s + ry * c;
        }
    }

    // 3. Scale
    if (scale != 1.0) {
        const Point2D o = resolve_origin(out, origin);
        for (auto& p : out) {
            p.x = o.x + (p.x - o.x) * scale;
            p.y = o.y + (p.y - o.y) * scale;
        }
    }

    return out;
}

bool segments_intersect(const Point2D& p1, const Point2D& p2,
                        const Point2D& q1, const Point2D& q2) {
    const int o1 = orientation(p1, p2, q1);
    const int o2 = orientation(p1, p2, q2);
    const int o3 = orientation(q1, q2, p1);
    const int o4 = orientation(q1, q2, p2);

    if (o1 != o2 && o3 != o4) return true;

    // Collinear / touching cases
    if (o1 == 0 && within_box(p1, p2, q1)) return true;
    if (o2 == 0 && within_box(p1, p2, q2)) return true;
    if (o3 == 0 && within_box(q1, q2, p1)) return true;
    if (o4 == 0 && within_box(q1, q2, p2)) return true;

    return false;
}

bool point_in_polygon(const Point2D& p, const Polygon& poly) {
    const size_t n = poly.size();
    if (n == 0) return false;

    for (size_t i = 0; i < n; ++i) {
        if (on_segment(poly[i], poly[(i + 1) % n], p)) {
            return true;
        }
    }

    // Crossing number
    bool inside = false;
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const Point2D& a = poly[i];
        const Point2D& b = poly[j];
        if ((a.y > p.y) != (b.y > p.y)) {
            const double x_cross = a.x + (p.y - a.y) * (b.x - a.x) / (b.y - a.y);
            if (p.x < x_cross) inside = !inside;
        }
    }
    return inside;
}

bool intersects(const Polygon& a, const Polygon& b) {
    validate_polygon(a, "polygon A");
    validate_polygon(b, "polygon B");

    const size_t na = a.size();
    const size_t nb = b.size();

    for (size_t i = 0; i < na; ++i) {
        const Point2D& a1 = a[i];
        const Point2D& a2 = a[(i + 1) % na];
        for (size_t j = 0; j < nb; ++j) {
            if (segments_intersect(a1, a2, b[j], b[(j + 1) % nb])) {
                return true;
            }
        }
    }

    // No boundary contact: either disjoint or one fully inside the other
    return point_in_polygon(a.front(), b) || point_in_polygon(b.front(), a);
}

Polygon convex_hull(const Polygon& poly) {
    Polygon pts = poly;
    std::sort(pts.begin(), pts.end(), [](const Point2D& l, const Point2D& r) {
        return l.x < r.x || (l.x == r.x && l.y < r.y);
    });
    pts.erase(std::unique(pts.begin(), pts.end()), pts.end());

    if (pts.size() < 3) return pts;

    Polygon hull(2 * pts.size());
    size_t k = 0;

    // Lower chain
    for (size_t i = 0; i < pts.size(); ++i) {
        while (k >= 2 && cross(hull[k - 2], hull[k - 1], pts[i]) <= kEps) --k;
        hull[k++] = pts[i];
    }

    // Upper chain
    for (size_t i = pts.size() - 1, t = k + 1; i > 0; --i) {
        while (k >= t && cross(hull[k - 2], hull[k - 1], pts[i - 1]) <= kEps) --k;
        hull[k++] = pts[i - 1];
    }

    hull.resize(k - 1);
    return hull;
}

} // namespace geom
