#ifndef RXNET_TELEMETRY_RECEIVER_LAYOUT_HPP
#define RXNET_TELEMETRY_RECEIVER_LAYOUT_HPP

#include "telemetry/detection_simulator.hpp"
#include <vector>

namespace rxnet::telemetry {

/**
 * Receiver arrangement for line / grid studies.
 *
 * LINE: count receivers starting at origin, spacing apart, along the
 *       compass bearing (90 = east along +x).
 * GRID: cols x rows receivers, spacing apart in x and row_spacing apart
 *       in y (row_spacing <= 0 reuses spacing), origin at the lower left.
 * Receiver ids run 1..n, row-major for grids.
 */
struct ReceiverLayout {
    enum class Kind { LINE, GRID };

    Kind kind = Kind::LINE;
    Point origin;
    double spacing = 1000.0;
    int count = 5;              // LINE
    double bearing_deg = 90.0;  // LINE
    int cols = 3;               // GRID
    int rows = 3;               // GRID
    double row_spacing = 0.0;   // GRID

    /** @throws ValidationError */
    void validate() const;

    std::vector<Receiver> build() const;

    /** Distance from the first to the last receiver along the line axis. */
    double line_extent() const;
};

std::vector<Receiver> make_receiver_line(const Point& origin, double spacing,
                                         int count, double bearing_deg = 90.0);

std::vector<Receiver> make_receiver_grid(const Point& origin, double dx, double dy,
                                         int cols, int rows);

} // namespace rxnet::telemetry

#endif // RXNET_TELEMETRY_RECEIVER_LAYOUT_HPP
