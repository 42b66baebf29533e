/**
 * Planar geometry helpers.
 *
 * Coordinates are unit-agnostic: metres in a projected CRS, or lon/lat
 * degrees treated as a plane. Headings are degrees clockwise from +y.
 */

#ifndef RXNET_CORE_GEOMETRY_HPP
#define RXNET_CORE_GEOMETRY_HPP

#include <cmath>
#include <vector>

namespace rxnet {

inline constexpr double DEG_TO_RAD = M_PI / 180.0;
inline constexpr double RAD_TO_DEG = 180.0 / M_PI;

struct Point {
    double x = 0.0;
    double y = 0.0;

    Point() = default;
    Point(double x_, double y_) : x(x_), y(y_) {}

    Point operator+(const Point& o) const { return Point(x + o.x, y + o.y); }
    Point operator-(const Point& o) const { return Point(x - o.x, y - o.y); }
    Point operator*(double s) const { return Point(x * s, y * s); }

    bool operator==(const Point& o) const { return x == o.x && y == o.y; }
    bool operator!=(const Point& o) const { return !(*this == o); }
};

/** A point of a generated path plus its step index (origin = step 0). */
struct PathPoint {
    Point pos;
    int step = 0;
};

using Path = std::vector<PathPoint>;

inline double distance(const Point& a, const Point& b) {
    return std::hypot(b.x - a.x, b.y - a.y);
}

inline bool is_finite(const Point& p) {
    return std::isfinite(p.x) && std::isfinite(p.y);
}

/** a + t * (b - a) */
inline Point lerp(const Point& a, const Point& b, double t) {
    return Point(a.x + t * (b.x - a.x), a.y + t * (b.y - a.y));
}

/** Advance from p by length along a compass heading in degrees. */
inline Point advance(const Point& p, double heading_deg, double length) {
    const double h = heading_deg * DEG_TO_RAD;
    return Point(p.x + length * std::sin(h), p.y + length * std::cos(h));
}

/** Wrap a heading into [0, 360). */
inline double wrap_heading(double deg) {
    double h = std::fmod(deg, 360.0);
    if (h < 0.0) h += 360.0;
    return h;
}

/** Twice the signed area of triangle (a, b, c); > 0 when counter-clockwise. */
inline double orient(const Point& a, const Point& b, const Point& c) {
    return (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
}

/**
 * True when segments (p1,p2) and (q1,q2) cross at a single interior point
 * of both. Touching at an endpoint or collinear overlap is not a crossing.
 */
inline bool segments_cross(const Point& p1, const Point& p2,
                           const Point& q1, const Point& q2) {
    const double d1 = orient(q1, q2, p1);
    const double d2 = orient(q1, q2, p2);
    const double d3 = orient(p1, p2, q1);
    const double d4 = orient(p1, p2, q2);
    return ((d1 > 0.0 && d2 < 0.0) || (d1 < 0.0 && d2 > 0.0)) &&
           ((d3 > 0.0 && d4 < 0.0) || (d3 < 0.0 && d4 > 0.0));
}

/** Even-odd ray cast against one closed ring (last vertex joins the first). */
inline bool point_in_ring(const Point& p, const std::vector<Point>& ring) {
    bool inside = false;
    const size_t n = ring.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const Point& a = ring[i];
        const Point& b = ring[j];
        if ((a.y > p.y) != (b.y > p.y)) {
            double x_cross = a.x + (p.y - a.y) * (b.x - a.x) / (b.y - a.y);
            if (p.x < x_cross) inside = !inside;
        }
    }
    return inside;
}

/** Shoelace area of a ring (absolute value). */
inline double ring_area(const std::vector<Point>& ring) {
    double twice = 0.0;
    const size_t n = ring.size();
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        twice += (ring[j].x * ring[i].y) - (ring[i].x * ring[j].y);
    }
    return std::abs(twice) * 0.5;
}

/** Total polyline length of a path. */
inline double path_length(const Path& path) {
    double len = 0.0;
    for (size_t i = 1; i < path.size(); i++) {
        len += distance(path[i - 1].pos, path[i].pos);
    }
    return len;
}

} // namespace rxnet

#endif // RXNET_CORE_GEOMETRY_HPP
