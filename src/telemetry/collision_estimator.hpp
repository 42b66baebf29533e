/**
 * CollisionEstimator - pulse-collision probability for co-located tags.
 *
 * Each tag repeats a burst of burst_duration seconds; the silent delay
 * between the end of one burst and the start of the next is uniform on
 * [delay_min, delay_max], so a tag's own bursts never overlap. Two bursts
 * collide when their on-air windows overlap. The estimate is the
 * probability that a given transmission overlaps at least one burst of
 * another tag.
 *
 *   ANALYTIC  T = (delay_min + delay_max)/2 + burst,  q = min(1, 2 burst / T)
 *             P = 1 - (1 - q)^(num_tags - 1)
 *             Assumes independent, uniformly phased tags.
 *   SAMPLED   Simulates every tag's schedule and counts overlaps directly.
 */

#ifndef RXNET_TELEMETRY_COLLISION_ESTIMATOR_HPP
#define RXNET_TELEMETRY_COLLISION_ESTIMATOR_HPP

#include <cstdint>
#include <vector>

namespace rxnet::telemetry {

struct CollisionParams {
    int num_tags = 1;
    double burst_duration = 5.0;
    double delay_min = 60.0;
    double delay_max = 180.0;

    /** @throws ValidationError */
    void validate() const;
};

struct CollisionSamplingConfig {
    int transmissions_per_tag = 10000;
    int32_t seed = 42;
};

struct CollisionRow {
    int num_tags = 0;
    double analytic = 0.0;      // collision probability
    double sampled = 0.0;
    double detection_analytic = 1.0;   // 1 - collision
    double detection_sampled = 1.0;
};

class CollisionEstimator {
public:
    enum class Method { ANALYTIC, SAMPLED };

    explicit CollisionEstimator(const CollisionSamplingConfig& sampling = CollisionSamplingConfig());

    double estimate(const CollisionParams& params, Method method = Method::ANALYTIC) const;

    /** Collision table for 1..max_tags tags, both methods. */
    std::vector<CollisionRow> sweep_tag_counts(int max_tags, double burst_duration,
                                               double delay_min, double delay_max) const;

    static double analytic(const CollisionParams& params);
    double sampled(const CollisionParams& params) const;

private:
    CollisionSamplingConfig sampling_;
};

/** Analytic estimate; num_tags == 1 gives exactly 0. */
double estimate_collision_probability(int num_tags, double burst_duration,
                                      double delay_min, double delay_max);

} // namespace rxnet::telemetry

#endif // RXNET_TELEMETRY_COLLISION_ESTIMATOR_HPP
