#include "test_harness.hpp"
#include "boundary/polygon_boundary.hpp"
#include "core/sim_errors.hpp"
#include "telemetry/path_generator.hpp"
#include "telemetry/transmission_scheduler.hpp"
#include <cstdint>
#include <vector>

using namespace rxnet;
using namespace rxnet::telemetry;

static std::vector<Point> u_shape() {
    return { {0, 0}, {100, 0}, {100, 100}, {60, 100}, {60, 20}, {40, 20}, {40, 100}, {0, 100} };
}

// Water at exactly one point: every step out of it is rejected.
class SinglePointBoundary : public BoundaryOracle {
public:
    explicit SinglePointBoundary(const Point& p) : p_(p) {}
    bool contains(const Point& p) const override { return p == p_; }
private:
    Point p_;
};

static WalkConfig walk(const Point& start, double step, int steps) {
    WalkConfig c;
    c.start = start;
    c.step_length = step;
    c.num_steps = steps;
    return c;
}

void testPathGeneration() {
    TEST("open water path has num_steps + 1 points of fixed step length")
        OpenWaterBoundary open;
        SimRNG rng(7);
        Path path = PathGenerator(walk({0, 0}, 100.0, 50)).generate(open, rng);
        ASSERT(path.size() == 51);
        ASSERT(path.front().pos == Point(0, 0));
        for (size_t i = 1; i < path.size(); i++) {
            ASSERT_NEAR(distance(path[i - 1].pos, path[i].pos), 100.0, 1e-9);
            ASSERT(path[i].step == static_cast<int>(i));
        }
    PASS()

    TEST("every point and segment stays in a non-convex lake")
        PolygonBoundary lake(u_shape());
        WalkConfig c = walk({20, 50}, 5.0, 300);
        c.turn.spread_deg = 40.0;
        c.retry_spread_growth_deg = 10.0;
        SimRNG rng(123);
        Path path = PathGenerator(c).generate(lake, rng);
        ASSERT(path.size() == 301);
        for (size_t i = 0; i < path.size(); i++) {
            ASSERT(lake.contains(path[i].pos));
            if (i > 0) ASSERT(lake.segment_within(path[i - 1].pos, path[i].pos));
        }
    PASS()

    TEST("long steps stay inside a convex square over several seeds")
        PolygonBoundary square(std::vector<Point>{ {0, 0}, {100, 0}, {100, 100}, {0, 100} });
        WalkConfig c = walk({50, 50}, 60.0, 200);
        c.turn.distribution = TurnAngleModel::Distribution::UNIFORM;
        c.turn.spread_deg = 180.0;
        for (int32_t seed = 1; seed <= 5; seed++) {
            SimRNG rng(seed);
            Path path = PathGenerator(c).generate(square, rng);
            ASSERT(path.size() == 201);
            for (size_t i = 0; i < path.size(); i++) {
                ASSERT(square.contains(path[i].pos));
                if (i > 0) {
                    ASSERT(square.segment_within(path[i - 1].pos, path[i].pos));
                    ASSERT_NEAR(distance(path[i - 1].pos, path[i].pos), 60.0, 1e-9);
                }
            }
        }
    PASS()

    TEST("uniform turn model with fixed initial heading")
        OpenWaterBoundary open;
        WalkConfig c = walk({0, 0}, 10.0, 20);
        c.turn.distribution = TurnAngleModel::Distribution::UNIFORM;
        c.turn.spread_deg = 0.0;
        c.initial_heading_deg = 90.0;
        SimRNG rng(1);
        Path path = PathGenerator(c).generate(open, rng);
        ASSERT_NEAR(path.back().pos.x, 200.0, 1e-6);
        ASSERT_NEAR(path.back().pos.y, 0.0, 1e-6);
    PASS()

    TEST("same seed reproduces the path")
        PolygonBoundary lake(u_shape());
        WalkConfig c = walk({80, 50}, 4.0, 100);
        c.retry_spread_growth_deg = 10.0;
        SimRNG a(99), b(99), other(100);
        Path pa = PathGenerator(c).generate(lake, a);
        Path pb = PathGenerator(c).generate(lake, b);
        Path pc = PathGenerator(c).generate(lake, other);
        ASSERT(pa.size() == pb.size());
        for (size_t i = 0; i < pa.size(); i++) ASSERT(pa[i].pos == pb[i].pos);
        ASSERT(pa.back().pos != pc.back().pos);
    PASS()

    TEST("generate_path wrapper")
        OpenWaterBoundary open;
        SimRNG rng(3);
        Path path = generate_path({5, 5}, 1.0, 10, open, TurnAngleModel{}, rng);
        ASSERT(path.size() == 11);
    PASS()
}

void testPathErrors() {
    TEST("start outside the region raises at step 0")
        PolygonBoundary lake(u_shape());
        SimRNG rng(1);
        bool thrown = false;
        try {
            PathGenerator(walk({50, 80}, 5.0, 10)).generate(lake, rng);
        } catch (const BoundaryViolationError& e) {
            thrown = true;
            ASSERT(e.step_index() == 0);
            ASSERT(e.attempted() == Point(50, 80));
        }
        ASSERT(thrown);
    PASS()

    TEST("zero-area region rejects any start")
        PolygonBoundary flat(std::vector<Point>{ {0, 0}, {10, 0}, {20, 0} });
        SimRNG rng(1);
        ASSERT_THROWS(BoundaryViolationError,
                      PathGenerator(walk({5, 0}, 1.0, 5)).generate(flat, rng));
    PASS()

    TEST("exhausted attempt budget raises with the step index")
        SinglePointBoundary pin({0, 0});
        WalkConfig c = walk({0, 0}, 1.0, 5);
        c.max_attempts_per_step = 7;
        SimRNG rng(1);
        bool thrown = false;
        try {
            PathGenerator(c).generate(pin, rng);
        } catch (const BoundaryViolationError& e) {
            thrown = true;
            ASSERT(e.step_index() == 1);
            ASSERT_NEAR(distance(e.attempted(), Point(0, 0)), 1.0, 1e-9);
        }
        ASSERT(thrown);
    PASS()

    TEST("invalid walk parameters")
        ASSERT_THROWS(ValidationError, PathGenerator(walk({0, 0}, 0.0, 5)));
        ASSERT_THROWS(ValidationError, PathGenerator(walk({0, 0}, 1.0, 0)));
        ASSERT_THROWS(ValidationError, PathGenerator(walk({NAN, 0}, 1.0, 5)));
        WalkConfig c = walk({0, 0}, 1.0, 5);
        c.max_attempts_per_step = 0;
        ASSERT_THROWS(ValidationError, PathGenerator(c));
        c = walk({0, 0}, 1.0, 5);
        c.turn.spread_deg = -1.0;
        ASSERT_THROWS(ValidationError, PathGenerator(c));
    PASS()
}

void testTransmissionSchedule() {
    TEST("first transmission at origin, ids sequential, gaps within delay range")
        Path path{ {{0, 0}, 0}, {{1000, 0}, 1}, {{1000, 1000}, 2} };
        TransmitterConfig tx;
        tx.velocity = 2.0;
        tx.delay_min = 10.0;
        tx.delay_max = 30.0;
        SimRNG rng(5);
        auto events = TransmissionScheduler(tx).schedule(path, rng);
        ASSERT(!events.empty());
        ASSERT(events[0].transmission_id == 1);
        ASSERT(events[0].elapsed_time == 0.0);
        ASSERT(events[0].position == Point(0, 0));
        double total_time = 2000.0 / 2.0;
        for (size_t i = 1; i < events.size(); i++) {
            double gap = events[i].elapsed_time - events[i - 1].elapsed_time;
            ASSERT(gap >= 10.0 - 1e-9 && gap <= 30.0 + 1e-9);
            ASSERT(events[i].transmission_id == static_cast<int>(i) + 1);
            ASSERT(events[i].elapsed_time <= total_time);
        }
        // Next draw would pass the end of the path
        ASSERT(events.back().elapsed_time + 30.0 > total_time);
    PASS()

    TEST("positions interpolate along the polyline")
        Path path{ {{0, 0}, 0}, {{1000, 0}, 1}, {{1000, 1000}, 2} };
        TransmitterConfig tx;
        tx.velocity = 1.0;
        tx.delay_min = 100.0;
        tx.delay_max = 100.0;
        SimRNG rng(5);
        auto events = TransmissionScheduler(tx).schedule(path, rng);
        ASSERT(events.size() == 21);
        ASSERT_NEAR(events[5].position.x, 500.0, 1e-9);
        ASSERT_NEAR(events[5].position.y, 0.0, 1e-9);
        ASSERT_NEAR(events[15].position.x, 1000.0, 1e-9);
        ASSERT_NEAR(events[15].position.y, 500.0, 1e-9);
        ASSERT_NEAR(events[20].position.y, 1000.0, 1e-9);
    PASS()

    TEST("tiny minimum delay still schedules a finite stream")
        Path path{ {{0, 0}, 0}, {{100, 0}, 1} };
        TransmitterConfig tx;
        tx.velocity = 1.0;
        tx.delay_min = 1e-310;
        tx.delay_max = 50.0;
        SimRNG rng(8);
        auto events = TransmissionScheduler(tx).schedule(path, rng);
        ASSERT(events.size() >= 2);
        ASSERT(events.size() < 1000);
        for (size_t i = 1; i < events.size(); i++) {
            double gap = events[i].elapsed_time - events[i - 1].elapsed_time;
            ASSERT(gap > 0.0 && gap <= 50.0);
            ASSERT(events[i].elapsed_time <= 100.0);
        }
    PASS()

    TEST("single-point path yields one transmission")
        Path path{ {{3, 4}, 0} };
        SimRNG rng(1);
        auto events = schedule_transmissions(path, 1.0, 60.0, 180.0, 5.0, rng);
        ASSERT(events.size() == 1);
        ASSERT(events[0].position == Point(3, 4));
    PASS()

    TEST("scheduler errors")
        SimRNG rng(1);
        ASSERT_THROWS(ValidationError, schedule_transmissions(Path{}, 1.0, 60.0, 180.0, 5.0, rng));
        Path path{ {{0, 0}, 0}, {{10, 0}, 1} };
        ASSERT_THROWS(ValidationError, schedule_transmissions(path, 0.0, 60.0, 180.0, 5.0, rng));
        ASSERT_THROWS(ValidationError, schedule_transmissions(path, 1.0, 200.0, 180.0, 5.0, rng));
        ASSERT_THROWS(ValidationError, schedule_transmissions(path, 1.0, 0.0, 180.0, 5.0, rng));
        Path bad{ {{0, 0}, 0}, {{INFINITY, 0}, 1} };
        ASSERT_THROWS(ValidationError, schedule_transmissions(bad, 1.0, 60.0, 180.0, 5.0, rng));
    PASS()
}

int main() {
    std::cout << "=== Path and Transmission Tests ===" << std::endl;
    testPathGeneration();
    testPathErrors();
    testTransmissionSchedule();
    return finish();
}
