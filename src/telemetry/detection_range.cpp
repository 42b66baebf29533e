#include "telemetry/detection_range.hpp"
#include "core/sim_errors.hpp"
#include <algorithm>
#include <cmath>

namespace rxnet::telemetry {

static void require_probability(double p, const char* what) {
    if (!(p >= 0.0 && p <= 1.0)) {
        throw ValidationError(std::string(what) + " must be in [0, 1]");
    }
}

DetectionRangeFunction constant_range(double p) {
    require_probability(p, "constant detection probability");
    return [p](double) { return p; };
}

DetectionRangeFunction step_range(double cutoff, double p_inside, double p_outside) {
    if (!(cutoff >= 0.0)) {
        throw ValidationError("step range cutoff must be >= 0");
    }
    require_probability(p_inside, "step range p_inside");
    require_probability(p_outside, "step range p_outside");
    return [=](double d) { return d <= cutoff ? p_inside : p_outside; };
}

DetectionRangeFunction logistic_range(double b0, double b1) {
    if (!std::isfinite(b0) || !std::isfinite(b1)) {
        throw ValidationError("logistic range coefficients must be finite");
    }
    return [b0, b1](double d) { return 1.0 / (1.0 + std::exp(-(b0 + b1 * d))); };
}

DetectionRangeFunction table_range(std::vector<std::pair<double, double>> knots) {
    if (knots.empty()) {
        throw ValidationError("range table needs at least one knot");
    }
    for (size_t i = 0; i < knots.size(); i++) {
        if (!(knots[i].first >= 0.0) || !std::isfinite(knots[i].first)) {
            throw ValidationError("range table distances must be finite and >= 0");
        }
        require_probability(knots[i].second, "range table probability");
        if (i > 0 && knots[i].first <= knots[i - 1].first) {
            throw ValidationError("range table distances must be strictly increasing");
        }
    }

    return [knots = std::move(knots)](double d) {
        if (d <= knots.front().first) return knots.front().second;
        if (d >= knots.back().first) return knots.back().second;
        auto hi = std::upper_bound(knots.begin(), knots.end(), d,
            [](double v, const std::pair<double, double>& k) { return v < k.first; });
        auto lo = hi - 1;
        double f = (d - lo->first) / (hi->first - lo->first);
        return lo->second + f * (hi->second - lo->second);
    };
}

} // namespace rxnet::telemetry
