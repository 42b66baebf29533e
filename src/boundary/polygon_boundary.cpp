#include "boundary/polygon_boundary.hpp"
#include "core/sim_errors.hpp"
#include <limits>
#include <string>

namespace rxnet {

static void normalize_ring(std::vector<Point>& ring, const std::string& name) {
    if (ring.size() > 1 && ring.front() == ring.back()) {
        ring.pop_back();
    }
    if (ring.size() < 3) {
        throw ValidationError(name + " needs at least 3 vertices, got " +
                              std::to_string(ring.size()));
    }
    for (const auto& v : ring) {
        if (!is_finite(v)) {
            throw ValidationError(name + " has a non-finite vertex");
        }
    }
}

PolygonBoundary::PolygonBoundary(std::vector<Point> outer,
                                 std::vector<std::vector<Point>> holes) {
    normalize_ring(outer, "outer ring");
    rings_.push_back(std::move(outer));
    for (size_t i = 0; i < holes.size(); i++) {
        normalize_ring(holes[i], "hole " + std::to_string(i));
        rings_.push_back(std::move(holes[i]));
    }
}

bool PolygonBoundary::contains(const Point& p) const {
    if (!is_finite(p)) return false;
    if (!point_in_ring(p, rings_[0])) return false;
    for (size_t r = 1; r < rings_.size(); r++) {
        if (point_in_ring(p, rings_[r])) return false;
    }
    return true;
}

bool PolygonBoundary::crosses_any_edge(const Point& a, const Point& b) const {
    for (const auto& ring : rings_) {
        const size_t n = ring.size();
        for (size_t i = 0, j = n - 1; i < n; j = i++) {
            if (segments_cross(a, b, ring[j], ring[i])) return true;
        }
    }
    return false;
}

bool PolygonBoundary::segment_within(const Point& a, const Point& b) const {
    if (!contains(a) || !contains(b)) return false;
    if (crosses_any_edge(a, b)) return false;
    // A segment grazing a reflex vertex crosses no edge properly; the
    // midpoint catches the case where it leaves and re-enters there.
    return contains(lerp(a, b, 0.5));
}

bool PolygonBoundary::vertices_visible(size_t ring_a, size_t idx_a,
                                       size_t ring_b, size_t idx_b) const {
    if (ring_a == ring_b) {
        const size_t n = rings_[ring_a].size();
        if ((idx_a + 1) % n == idx_b || (idx_b + 1) % n == idx_a) {
            return true;   // shoreline edge
        }
    }
    const Point& u = rings_[ring_a][idx_a];
    const Point& v = rings_[ring_b][idx_b];
    if (crosses_any_edge(u, v)) return false;
    return contains(lerp(u, v, 0.5));
}

double PolygonBoundary::area() const {
    double a = ring_area(rings_[0]);
    for (size_t r = 1; r < rings_.size(); r++) {
        a -= ring_area(rings_[r]);
    }
    return a > 0.0 ? a : 0.0;
}

std::optional<Path> PolygonBoundary::path_between(const Point& a, const Point& b) const {
    if (!contains(a) || !contains(b)) return std::nullopt;
    if (segment_within(a, b)) {
        return Path{ PathPoint{a, 0}, PathPoint{b, 1} };
    }

    // Graph nodes: 0 = a, 1 = b, then every ring vertex.
    struct Node {
        Point pos;
        size_t ring;
        size_t idx;
        bool is_vertex;
    };
    std::vector<Node> nodes;
    nodes.push_back({a, 0, 0, false});
    nodes.push_back({b, 0, 0, false});
    for (size_t r = 0; r < rings_.size(); r++) {
        for (size_t i = 0; i < rings_[r].size(); i++) {
            nodes.push_back({rings_[r][i], r, i, true});
        }
    }

    auto visible = [&](size_t i, size_t j) {
        const Node& ni = nodes[i];
        const Node& nj = nodes[j];
        if (ni.is_vertex && nj.is_vertex) {
            return vertices_visible(ni.ring, ni.idx, nj.ring, nj.idx);
        }
        if (crosses_any_edge(ni.pos, nj.pos)) return false;
        return contains(lerp(ni.pos, nj.pos, 0.5));
    };

    // Dense Dijkstra; vertex counts of shoreline polygons keep this small.
    const size_t n = nodes.size();
    const double INF = std::numeric_limits<double>::infinity();
    std::vector<double> dist(n, INF);
    std::vector<size_t> prev(n, n);
    std::vector<bool> done(n, false);
    dist[0] = 0.0;

    for (size_t iter = 0; iter < n; iter++) {
        size_t u = n;
        double best = INF;
        for (size_t k = 0; k < n; k++) {
            if (!done[k] && dist[k] < best) {
                best = dist[k];
                u = k;
            }
        }
        if (u == n || u == 1) break;
        done[u] = true;

        for (size_t v = 0; v < n; v++) {
            if (done[v] || v == u) continue;
            double cand = dist[u] + distance(nodes[u].pos, nodes[v].pos);
            if (cand >= dist[v]) continue;
            if (!visible(u, v)) continue;
            dist[v] = cand;
            prev[v] = u;
        }
    }

    if (dist[1] == INF) return std::nullopt;

    std::vector<size_t> chain;
    for (size_t at = 1; at != n; at = prev[at]) {
        chain.push_back(at);
        if (at == 0) break;
    }

    Path path;
    path.reserve(chain.size());
    int step = 0;
    for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
        path.push_back(PathPoint{nodes[*it].pos, step++});
    }
    return path;
}

} // namespace rxnet
