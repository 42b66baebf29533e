#include "telemetry/collision_estimator.hpp"
#include "core/sim_errors.hpp"
#include "core/sim_rng.hpp"
#include <algorithm>
#include <cmath>
#include <utility>

namespace rxnet::telemetry {

void CollisionParams::validate() const {
    if (num_tags < 1) {
        throw ValidationError("num_tags must be >= 1");
    }
    if (!(burst_duration > 0.0) || !std::isfinite(burst_duration)) {
        throw ValidationError("burst_duration must be > 0");
    }
    if (!(delay_min > 0.0) || !std::isfinite(delay_max) || delay_min > delay_max) {
        throw ValidationError("delay range must satisfy 0 < min <= max");
    }
}

CollisionEstimator::CollisionEstimator(const CollisionSamplingConfig& sampling)
    : sampling_(sampling) {
    if (sampling_.transmissions_per_tag <= 0) {
        throw ValidationError("transmissions_per_tag must be > 0");
    }
}

double CollisionEstimator::analytic(const CollisionParams& params) {
    params.validate();
    if (params.num_tags == 1) return 0.0;

    const double period = 0.5 * (params.delay_min + params.delay_max) + params.burst_duration;
    const double q = std::min(1.0, 2.0 * params.burst_duration / period);
    return 1.0 - std::pow(1.0 - q, params.num_tags - 1);
}

double CollisionEstimator::sampled(const CollisionParams& params) const {
    params.validate();
    if (params.num_tags == 1) return 0.0;

    const double b = params.burst_duration;
    const double period = 0.5 * (params.delay_min + params.delay_max) + b;
    const double horizon = sampling_.transmissions_per_tag * period;

    // (start time, tag) for every burst of every tag
    std::vector<std::pair<double, int>> starts;
    starts.reserve(static_cast<size_t>(params.num_tags) *
                   (static_cast<size_t>(sampling_.transmissions_per_tag) + 2));

    for (int tag = 0; tag < params.num_tags; tag++) {
        SimRNG rng(SimRNG::derive_seed(sampling_.seed, static_cast<uint32_t>(tag)));
        // Random phase before t = 0 so every tag is already cycling in [0, H].
        double t = -rng.uniform(0.0, params.delay_max + b);
        while (t <= horizon + b) {
            starts.emplace_back(t, tag);
            t += rng.uniform(params.delay_min, params.delay_max) + b;
        }
    }

    std::sort(starts.begin(), starts.end());

    long long focal = 0;
    long long collided = 0;
    const size_t n = starts.size();

    for (size_t i = 0; i < n; i++) {
        const double t = starts[i].first;
        if (t < 0.0 || t > horizon) continue;
        focal++;

        bool hit = false;
        for (size_t j = i; j-- > 0 && t - starts[j].first < b; ) {
            if (starts[j].second != starts[i].second) { hit = true; break; }
        }
        for (size_t j = i + 1; !hit && j < n && starts[j].first - t < b; j++) {
            if (starts[j].second != starts[i].second) hit = true;
        }
        if (hit) collided++;
    }

    if (focal == 0) return 0.0;
    return static_cast<double>(collided) / static_cast<double>(focal);
}

double CollisionEstimator::estimate(const CollisionParams& params, Method method) const {
    return method == Method::SAMPLED ? sampled(params) : analytic(params);
}

std::vector<CollisionRow> CollisionEstimator::sweep_tag_counts(int max_tags, double burst_duration,
                                                               double delay_min, double delay_max) const {
    if (max_tags < 1) {
        throw ValidationError("max_tags must be >= 1");
    }

    std::vector<CollisionRow> rows;
    rows.reserve(static_cast<size_t>(max_tags));
    for (int k = 1; k <= max_tags; k++) {
        CollisionParams p;
        p.num_tags = k;
        p.burst_duration = burst_duration;
        p.delay_min = delay_min;
        p.delay_max = delay_max;

        CollisionRow row;
        row.num_tags = k;
        row.analytic = analytic(p);
        row.sampled = sampled(p);
        row.detection_analytic = 1.0 - row.analytic;
        row.detection_sampled = 1.0 - row.sampled;
        rows.push_back(row);
    }
    return rows;
}

double estimate_collision_probability(int num_tags, double burst_duration,
                                      double delay_min, double delay_max) {
    CollisionParams p;
    p.num_tags = num_tags;
    p.burst_duration = burst_duration;
    p.delay_min = delay_min;
    p.delay_max = delay_max;
    return CollisionEstimator::analytic(p);
}

} // namespace rxnet::telemetry
