#include "telemetry/path_generator.hpp"
#include "core/sim_errors.hpp"
#include <algorithm>
#include <cmath>

namespace rxnet::telemetry {

static constexpr double MAX_SPREAD_DEG = 180.0;

double TurnAngleModel::sample(SimRNG& rng, double extra_spread_deg) const {
    double spread = std::min(spread_deg + extra_spread_deg, MAX_SPREAD_DEG);
    switch (distribution) {
        case Distribution::UNIFORM:
            return rng.uniform(mean_deg - spread, mean_deg + spread);
        case Distribution::NORMAL:
        default:
            return rng.gaussian(mean_deg, spread);
    }
}

void WalkConfig::validate() const {
    if (!is_finite(start)) {
        throw ValidationError("walk start must be finite");
    }
    if (!(step_length > 0.0) || !std::isfinite(step_length)) {
        throw ValidationError("step_length must be > 0");
    }
    if (num_steps <= 0) {
        throw ValidationError("num_steps must be > 0");
    }
    if (!(turn.spread_deg >= 0.0) || !std::isfinite(turn.mean_deg)) {
        throw ValidationError("turn angle spread must be >= 0 and mean finite");
    }
    if (max_attempts_per_step <= 0) {
        throw ValidationError("max_attempts_per_step must be > 0");
    }
    if (!(retry_spread_growth_deg >= 0.0)) {
        throw ValidationError("retry_spread_growth_deg must be >= 0");
    }
    if (initial_heading_deg && !std::isfinite(*initial_heading_deg)) {
        throw ValidationError("initial heading must be finite");
    }
}

PathGenerator::PathGenerator(const WalkConfig& config)
    : config_(config) {
    config_.validate();
}

Path PathGenerator::generate(const BoundaryOracle& boundary, SimRNG& rng) const {
    const WalkConfig& c = config_;

    if (!boundary.contains(c.start)) {
        throw BoundaryViolationError("start point is outside the region", 0, c.start);
    }

    Path path;
    path.reserve(static_cast<size_t>(c.num_steps) + 1);
    path.push_back(PathPoint{c.start, 0});

    double heading = c.initial_heading_deg ? wrap_heading(*c.initial_heading_deg)
                                           : rng.uniform(0.0, 360.0);
    Point current = c.start;

    for (int step = 1; step <= c.num_steps; step++) {
        Point proposal = current;
        bool accepted = false;

        for (int attempt = 0; attempt < c.max_attempts_per_step; attempt++) {
            double extra = attempt * c.retry_spread_growth_deg;
            double candidate_heading = wrap_heading(heading + c.turn.sample(rng, extra));
            proposal = advance(current, candidate_heading, c.step_length);

            if (boundary.contains(proposal) &&
                boundary.segment_within(current, proposal)) {
                heading = candidate_heading;
                accepted = true;
                break;
            }
        }

        if (!accepted) {
            throw BoundaryViolationError(
                "no in-region step after " + std::to_string(c.max_attempts_per_step) +
                " attempts", step, proposal);
        }

        current = proposal;
        path.push_back(PathPoint{current, step});
    }

    return path;
}

Path generate_path(const Point& start, double step_length, int num_steps,
                   const BoundaryOracle& boundary, const TurnAngleModel& turn,
                   SimRNG& rng) {
    WalkConfig config;
    config.start = start;
    config.step_length = step_length;
    config.num_steps = num_steps;
    config.turn = turn;
    return PathGenerator(config).generate(boundary, rng);
}

} // namespace rxnet::telemetry
