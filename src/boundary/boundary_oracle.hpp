/**
 * BoundaryOracle - capability interface for "is this in water?" queries.
 *
 * The simulation core only consumes this interface; a polygon test,
 * a rasterized cost surface, or anything else answering the same
 * questions can be injected.
 */

#ifndef RXNET_BOUNDARY_BOUNDARY_ORACLE_HPP
#define RXNET_BOUNDARY_BOUNDARY_ORACLE_HPP

#include "core/geometry.hpp"
#include <optional>

namespace rxnet {

class BoundaryOracle {
public:
    virtual ~BoundaryOracle() = default;

    /** True when p lies inside the permitted region. */
    virtual bool contains(const Point& p) const = 0;

    /**
     * True when the whole segment a→b stays inside the region.
     * Default: endpoint test only, for oracles with no notion of edges.
     */
    virtual bool segment_within(const Point& a, const Point& b) const {
        return contains(a) && contains(b);
    }

    /**
     * Shortest in-region path from a to b, or nullopt when the oracle
     * has no path query or no path exists.
     */
    virtual std::optional<Path> path_between(const Point& a, const Point& b) const {
        (void)a;
        (void)b;
        return std::nullopt;
    }
};

/** Unbounded water: every point and segment is permitted. */
class OpenWaterBoundary : public BoundaryOracle {
public:
    bool contains(const Point& p) const override { return is_finite(p); }

    bool segment_within(const Point& a, const Point& b) const override {
        return is_finite(a) && is_finite(b);
    }

    std::optional<Path> path_between(const Point& a, const Point& b) const override {
        return Path{ PathPoint{a, 0}, PathPoint{b, 1} };
    }
};

} // namespace rxnet

#endif // RXNET_BOUNDARY_BOUNDARY_ORACLE_HPP
