#include "telemetry/receiver_layout.hpp"
#include "core/sim_errors.hpp"
#include <cmath>

namespace rxnet::telemetry {

void ReceiverLayout::validate() const {
    if (!is_finite(origin)) {
        throw ValidationError("receiver layout origin must be finite");
    }
    if (!(spacing > 0.0) || !std::isfinite(spacing)) {
        throw ValidationError("receiver spacing must be > 0");
    }
    if (kind == Kind::LINE) {
        if (count <= 0) throw ValidationError("receiver line needs count > 0");
        if (!std::isfinite(bearing_deg)) throw ValidationError("line bearing must be finite");
    } else {
        if (cols <= 0 || rows <= 0) {
            throw ValidationError("receiver grid needs cols > 0 and rows > 0");
        }
        if (!std::isfinite(row_spacing)) throw ValidationError("row spacing must be finite");
    }
}

std::vector<Receiver> ReceiverLayout::build() const {
    validate();
    if (kind == Kind::LINE) {
        return make_receiver_line(origin, spacing, count, bearing_deg);
    }
    double dy = row_spacing > 0.0 ? row_spacing : spacing;
    return make_receiver_grid(origin, spacing, dy, cols, rows);
}

double ReceiverLayout::line_extent() const {
    int n = (kind == Kind::LINE) ? count : cols;
    return spacing * (n - 1);
}

std::vector<Receiver> make_receiver_line(const Point& origin, double spacing,
                                         int count, double bearing_deg) {
    std::vector<Receiver> receivers;
    receivers.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; i++) {
        receivers.push_back(Receiver{i + 1, advance(origin, bearing_deg, spacing * i)});
    }
    return receivers;
}

std::vector<Receiver> make_receiver_grid(const Point& origin, double dx, double dy,
                                         int cols, int rows) {
    std::vector<Receiver> receivers;
    receivers.reserve(static_cast<size_t>(cols) * static_cast<size_t>(rows));
    int id = 1;
    for (int r = 0; r < rows; r++) {
        for (int c = 0; c < cols; c++) {
            receivers.push_back(Receiver{id++, Point(origin.x + dx * c, origin.y + dy * r)});
        }
    }
    return receivers;
}

} // namespace rxnet::telemetry
