#include "test_harness.hpp"
#include "core/sim_errors.hpp"
#include "telemetry/collision_estimator.hpp"

using namespace rxnet;
using namespace rxnet::telemetry;

static CollisionParams params(int tags, double burst = 5.0, double dmin = 60.0, double dmax = 180.0) {
    CollisionParams p;
    p.num_tags = tags;
    p.burst_duration = burst;
    p.delay_min = dmin;
    p.delay_max = dmax;
    return p;
}

void testAnalytic() {
    TEST("single tag never collides")
        ASSERT(estimate_collision_probability(1, 5.0, 60.0, 180.0) == 0.0);
        CollisionEstimator est;
        ASSERT(est.estimate(params(1), CollisionEstimator::Method::SAMPLED) == 0.0);
    PASS()

    TEST("two tags: 2b / T")
        // T = 120 + 5, q = 10 / 125
        ASSERT_NEAR(estimate_collision_probability(2, 5.0, 60.0, 180.0), 0.08, 1e-12);
    PASS()

    TEST("five tags compound the pairwise rate")
        double expected = 1.0 - std::pow(0.92, 4);
        ASSERT_NEAR(CollisionEstimator::analytic(params(5)), expected, 1e-12);
        ASSERT_NEAR(expected, 0.2836, 1e-4);
    PASS()

    TEST("probability saturates at 1 when bursts fill the cycle")
        ASSERT_NEAR(CollisionEstimator::analytic(params(2, 100.0, 10.0, 10.0)), 1.0, 1e-12);
    PASS()

    TEST("monotone in tag count")
        CollisionSamplingConfig cfg;
        cfg.transmissions_per_tag = 500;
        auto rows = CollisionEstimator(cfg).sweep_tag_counts(6, 5.0, 60.0, 180.0);
        ASSERT(rows.size() == 6);
        ASSERT(rows[0].num_tags == 1 && rows[0].analytic == 0.0);
        for (size_t i = 1; i < rows.size(); i++) {
            ASSERT(rows[i].analytic > rows[i - 1].analytic);
            ASSERT_NEAR(rows[i].detection_analytic, 1.0 - rows[i].analytic, 1e-12);
            ASSERT_NEAR(rows[i].detection_sampled, 1.0 - rows[i].sampled, 1e-12);
        }
    PASS()
}

void testSampled() {
    TEST("sampled agrees with analytic for two tags")
        CollisionEstimator est;
        double s = est.estimate(params(2), CollisionEstimator::Method::SAMPLED);
        ASSERT_NEAR(s, 0.08, 0.015);
    PASS()

    TEST("sampled agrees with analytic for five tags")
        CollisionEstimator est;
        double s = est.sampled(params(5));
        ASSERT_NEAR(s, 0.2836, 0.02);
    PASS()

    TEST("sampled estimate is reproducible for a seed")
        CollisionSamplingConfig cfg;
        cfg.transmissions_per_tag = 2000;
        cfg.seed = 11;
        double a = CollisionEstimator(cfg).sampled(params(3));
        double b = CollisionEstimator(cfg).sampled(params(3));
        ASSERT(a == b);
    PASS()
}

void testErrors() {
    TEST("invalid collision parameters")
        ASSERT_THROWS(ValidationError, estimate_collision_probability(0, 5.0, 60.0, 180.0));
        ASSERT_THROWS(ValidationError, estimate_collision_probability(2, 0.0, 60.0, 180.0));
        ASSERT_THROWS(ValidationError, estimate_collision_probability(2, 5.0, 200.0, 180.0));
        ASSERT_THROWS(ValidationError, estimate_collision_probability(2, 5.0, 0.0, 180.0));
        CollisionEstimator est;
        ASSERT_THROWS(ValidationError, est.sweep_tag_counts(0, 5.0, 60.0, 180.0));
        CollisionSamplingConfig bad;
        bad.transmissions_per_tag = 0;
        ASSERT_THROWS(ValidationError, CollisionEstimator(bad));
    PASS()
}

int main() {
    std::cout << "=== Collision Tests ===" << std::endl;
    testAnalytic();
    testSampled();
    testErrors();
    return finish();
}
