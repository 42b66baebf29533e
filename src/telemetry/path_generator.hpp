/**
 * PathGenerator - correlated random walk constrained to a water body.
 *
 * Each step turns the previous heading by a draw from the turn-angle
 * model and advances step_length. Proposals that leave the region, or
 * whose segment crosses a shoreline, are rejected and redrawn from the
 * same model. retry_spread_growth_deg > 0 widens the spread on each
 * retry. A step that exhausts its attempt budget raises
 * BoundaryViolationError; the walk is never truncated.
 */

#ifndef RXNET_TELEMETRY_PATH_GENERATOR_HPP
#define RXNET_TELEMETRY_PATH_GENERATOR_HPP

#include "boundary/boundary_oracle.hpp"
#include "core/geometry.hpp"
#include "core/sim_rng.hpp"
#include <optional>

namespace rxnet::telemetry {

struct TurnAngleModel {
    enum class Distribution { NORMAL, UNIFORM };

    Distribution distribution = Distribution::NORMAL;
    double mean_deg = 0.0;
    double spread_deg = 10.0;   // stddev (NORMAL) or half-width (UNIFORM)

    double sample(SimRNG& rng, double extra_spread_deg = 0.0) const;
};

struct WalkConfig {
    Point start;
    double step_length = 100.0;
    int num_steps = 50;
    TurnAngleModel turn;
    std::optional<double> initial_heading_deg;   // uniform [0, 360) when unset
    int max_attempts_per_step = 100;
    double retry_spread_growth_deg = 0.0;        // extra spread per rejected proposal

    /** @throws ValidationError */
    void validate() const;
};

class PathGenerator {
public:
    explicit PathGenerator(const WalkConfig& config);

    /**
     * Generate one walk of num_steps + 1 points (origin is step 0).
     * @throws BoundaryViolationError if the start is outside the region
     *         or a step runs out of attempts
     */
    Path generate(const BoundaryOracle& boundary, SimRNG& rng) const;

    const WalkConfig& config() const { return config_; }

private:
    WalkConfig config_;
};

/** Convenience wrapper over PathGenerator. */
Path generate_path(const Point& start, double step_length, int num_steps,
                   const BoundaryOracle& boundary, const TurnAngleModel& turn,
                   SimRNG& rng);

} // namespace rxnet::telemetry

#endif // RXNET_TELEMETRY_PATH_GENERATOR_HPP
