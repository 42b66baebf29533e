/**
 * PolygonBoundary - water body as an outer ring with optional islands.
 *
 * Containment is even-odd over all rings, so a point inside a hole is on
 * land. A segment is within the region when both ends are inside and it
 * crosses no ring edge. path_between() searches a visibility graph over
 * the ring vertices (Dijkstra), giving the shortest path that hugs the
 * shoreline around obstacles.
 */

#ifndef RXNET_BOUNDARY_POLYGON_BOUNDARY_HPP
#define RXNET_BOUNDARY_POLYGON_BOUNDARY_HPP

#include "boundary/boundary_oracle.hpp"
#include <vector>

namespace rxnet {

class PolygonBoundary : public BoundaryOracle {
public:
    /**
     * @param outer  Outer shoreline, at least 3 vertices, open ring
     *               (closing vertex optional; a repeated first vertex is dropped)
     * @param holes  Islands, each at least 3 vertices
     * @throws ValidationError on short rings or non-finite vertices
     */
    explicit PolygonBoundary(std::vector<Point> outer,
                             std::vector<std::vector<Point>> holes = {});

    bool contains(const Point& p) const override;
    bool segment_within(const Point& a, const Point& b) const override;
    std::optional<Path> path_between(const Point& a, const Point& b) const override;

    /** Water area: outer ring minus holes. Zero for a degenerate polygon. */
    double area() const;

    const std::vector<Point>& outer() const { return rings_.front(); }
    size_t hole_count() const { return rings_.size() - 1; }

private:
    std::vector<std::vector<Point>> rings_;   // [0] = outer, rest = holes

    bool crosses_any_edge(const Point& a, const Point& b) const;
    bool vertices_visible(size_t ring_a, size_t idx_a,
                          size_t ring_b, size_t idx_b) const;
};

} // namespace rxnet

#endif // RXNET_BOUNDARY_POLYGON_BOUNDARY_HPP
