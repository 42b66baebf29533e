#include "telemetry/transmission_scheduler.hpp"
#include "core/sim_errors.hpp"
#include <algorithm>
#include <cmath>

namespace rxnet::telemetry {

void TransmitterConfig::validate() const {
    if (!(velocity > 0.0) || !std::isfinite(velocity)) {
        throw ValidationError("velocity must be > 0");
    }
    if (!(delay_min > 0.0) || !std::isfinite(delay_max) || delay_min > delay_max) {
        throw ValidationError("delay range must satisfy 0 < min <= max");
    }
    if (!(burst_duration >= 0.0) || !std::isfinite(burst_duration)) {
        throw ValidationError("burst_duration must be >= 0");
    }
}

TransmissionScheduler::TransmissionScheduler(const TransmitterConfig& config)
    : config_(config) {
    config_.validate();
}

Point interpolate_along(const Path& path, const std::vector<double>& cumulative,
                        double along) {
    if (along <= 0.0) return path.front().pos;
    if (along >= cumulative.back()) return path.back().pos;

    // First vertex at or beyond the requested distance
    auto it = std::lower_bound(cumulative.begin(), cumulative.end(), along);
    size_t hi = static_cast<size_t>(it - cumulative.begin());
    size_t lo = hi - 1;

    double seg = cumulative[hi] - cumulative[lo];
    if (seg <= 0.0) return path[hi].pos;
    return lerp(path[lo].pos, path[hi].pos, (along - cumulative[lo]) / seg);
}

std::vector<TransmissionEvent> TransmissionScheduler::schedule(const Path& path,
                                                               SimRNG& rng) const {
    if (path.empty()) {
        throw ValidationError("cannot schedule transmissions on an empty path");
    }

    std::vector<double> cumulative(path.size(), 0.0);
    for (size_t i = 0; i < path.size(); i++) {
        if (!is_finite(path[i].pos)) {
            throw ValidationError("path point " + std::to_string(i) + " is not finite");
        }
        if (i > 0) {
            cumulative[i] = cumulative[i - 1] + distance(path[i - 1].pos, path[i].pos);
        }
    }

    const double total_time = cumulative.back() / config_.velocity;

    std::vector<TransmissionEvent> events;

    int id = 1;
    double t = 0.0;
    while (t <= total_time) {
        TransmissionEvent evt;
        evt.transmission_id = id++;
        evt.elapsed_time = t;
        evt.position = interpolate_along(path, cumulative, config_.velocity * t);
        events.push_back(evt);

        t += rng.uniform(config_.delay_min, config_.delay_max);
    }

    return events;
}

std::vector<TransmissionEvent> schedule_transmissions(const Path& path, double velocity,
                                                      double delay_min, double delay_max,
                                                      double burst_duration, SimRNG& rng) {
    TransmitterConfig config;
    config.velocity = velocity;
    config.delay_min = delay_min;
    config.delay_max = delay_max;
    config.burst_duration = burst_duration;
    return TransmissionScheduler(config).schedule(path, rng);
}

} // namespace rxnet::telemetry
