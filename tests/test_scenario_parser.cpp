#include "test_harness.hpp"
#include "core/sim_errors.hpp"
#include "io/json_reader.hpp"
#include "telemetry/scenario_parser.hpp"
#include "telemetry/sim_results.hpp"
#include <cstdint>
#include <sstream>
#include <string>

using namespace rxnet;
using namespace rxnet::telemetry;

static const char* FULL_SCENARIO = R"({
  "seed": 7,
  "threads": 2,
  "region": {
    "outer": [[0, 0], [5000, 0], [5000, 5000], [0, 5000]],
    "holes": [[[2000, 2000], [2500, 2000], [2500, 2500], [2000, 2500]]]
  },
  "receivers": [
    {"id": 10, "x": 100, "y": 200},
    {"id": 11, "x": 300, "y": 400}
  ],
  "receiverLine": {"origin": [0, 1000], "spacing": 250, "count": 8, "bearing": 90},
  "path": {
    "start": {"x": 1000, "y": 1000},
    "stepLength": 50,
    "numSteps": 40,
    "initialHeading": 45,
    "turnAngle": {"distribution": "uniform", "mean": 0, "spread": 20},
    "maxAttempts": 30
  },
  "transmitter": {"velocity": 0.8, "delayMin": 90, "delayMax": 150, "burstDuration": 3.5},
  "detectionRange": {"type": "table", "knots": [[0, 0.9], [200, 0.5], [600, 0.0]]},
  "lineSim": {"trials": 250, "movement": "randomWalk", "maxDistance": 1500, "outerLimits": [100, 200]},
  "sweep": [{"spacing": 500}, {"velocity": 1.5, "delayMax": 200}],
  "collision": {"numTags": 4, "maxTags": 10, "transmissionsPerTag": 5000}
})";

static std::string expect_error(const std::string& json) {
    try {
        ScenarioParser::parse(JsonReader::parse(json));
    } catch (const ValidationError& e) {
        return e.what();
    }
    return "";
}

void testJsonReader() {
    TEST("reader handles nesting, escapes and literals")
        JsonValue v = JsonReader::parse(R"({"a": [1, -2.5e2, true, null], "s": "x\"y\n"})");
        ASSERT(v.is_object());
        ASSERT(v["a"].size() == 4);
        ASSERT(v["a"][size_t(1)].get_number() == -250.0);
        ASSERT(v["a"][size_t(2)].get_bool());
        ASSERT(v["a"][size_t(3)].is_null());
        ASSERT(v["s"].get_string() == "x\"y\n");
        ASSERT(v["missing"].is_null());
    PASS()

    TEST("reader reports line of a syntax error")
        std::string msg;
        try {
            JsonReader::parse("{\n  \"a\": 1,\n  \"b\": }");
        } catch (const ValidationError& e) {
            msg = e.what();
        }
        ASSERT(msg.find("line 3") != std::string::npos);
        ASSERT_THROWS(ValidationError, JsonReader::parse("{\"a\": 1} extra"));
        ASSERT_THROWS(ValidationError, JsonReader::parse_file("/nonexistent/scenario.json"));
    PASS()
}

void testScenarioParse() {
    TEST("full scenario maps onto typed configuration")
        Scenario sc = ScenarioParser::parse(JsonReader::parse(FULL_SCENARIO));
        ASSERT(sc.seed == 7);
        ASSERT(sc.threads == 2);

        ASSERT(sc.region != nullptr);
        ASSERT(sc.region->hole_count() == 1);
        ASSERT(!sc.region->contains({2250, 2250}));
        ASSERT(sc.region->contains({1000, 1000}));

        ASSERT(sc.receivers.size() == 2);
        ASSERT(sc.receivers[1].receiver_id == 11);
        ASSERT(sc.resolve_receivers().size() == 2);
        ASSERT(sc.layout.has_value());
        ASSERT(sc.layout->count == 8);

        ASSERT(sc.walk.has_value());
        ASSERT(sc.walk->num_steps == 40);
        ASSERT(*sc.walk->initial_heading_deg == 45.0);
        ASSERT(sc.walk->turn.distribution == TurnAngleModel::Distribution::UNIFORM);
        ASSERT(sc.walk->max_attempts_per_step == 30);

        ASSERT(sc.transmitter.velocity == 0.8);
        ASSERT(sc.transmitter.burst_duration == 3.5);

        ASSERT(sc.range_fn);
        ASSERT_NEAR(sc.range_fn(100.0), 0.7, 1e-12);

        ASSERT(sc.line.num_trials == 250);
        ASSERT(sc.line.movement == Movement::RANDOM_WALK);
        ASSERT(sc.line.base_seed == 7);
        ASSERT(sc.line.layout.spacing == 250.0);
        ASSERT(sc.line.walk.step_length == 50.0);
        ASSERT(sc.line.outer_limit_right == 200.0);

        ASSERT(sc.sweep.size() == 2);
        ASSERT(*sc.sweep[0].spacing == 500.0);
        ASSERT(!sc.sweep[0].velocity.has_value());
        ASSERT(*sc.sweep[1].delay_max == 200.0);

        ASSERT(sc.collision.num_tags == 4);
        ASSERT(sc.collision.burst_duration == 3.5);
        ASSERT(sc.collision.delay_min == 90.0);
        ASSERT(sc.collision_max_tags == 10);
        ASSERT(sc.collision_sampling.transmissions_per_tag == 5000);
        ASSERT(sc.collision_sampling.seed == 7);
    PASS()

    TEST("grid layout and explicit transmissions")
        Scenario sc = ScenarioParser::parse(JsonReader::parse(R"({
            "receiverGrid": {"dx": 100, "dy": 300, "cols": 4, "rows": 2},
            "transmissions": [{"x": 0, "y": 0, "et": 0}, {"x": 10, "y": 0, "et": 12.5}],
            "detectionRange": {"type": "step", "cutoff": 400}
        })"));
        auto recv = sc.resolve_receivers();
        ASSERT(recv.size() == 8);
        ASSERT(recv[7].position == Point(300, 300));
        ASSERT(sc.transmissions.size() == 2);
        ASSERT(sc.transmissions[1].transmission_id == 2);
        ASSERT(sc.transmissions[1].elapsed_time == 12.5);
        ASSERT(sc.range_fn(400.0) == 1.0);
        ASSERT(sc.region == nullptr);
    PASS()

    TEST("logistic range is the default curve")
        Scenario sc = ScenarioParser::parse(JsonReader::parse(R"({"detectionRange": {}})"));
        ASSERT_NEAR(sc.range_fn(60.0), 0.5, 1e-12);
    PASS()
}

void testScenarioErrors() {
    TEST("errors name the offending field")
        std::string msg = expect_error(R"({"transmitter": {"velocity": 1, "delayMax": 10}})");
        ASSERT(msg.find("transmitter.delayMin") != std::string::npos);

        msg = expect_error(R"({"receivers": [{"x": 1, "y": "north"}]})");
        ASSERT(msg.find("receivers[0].y") != std::string::npos);

        msg = expect_error(R"({"detectionRange": {"type": "cubic"}})");
        ASSERT(msg.find("detectionRange.type") != std::string::npos);

        msg = expect_error(R"({"lineSim": {"movement": "teleport"}})");
        ASSERT(msg.find("lineSim.movement") != std::string::npos);
    PASS()

    TEST("semantic validation of parsed values")
        ASSERT(!expect_error(R"({"region": {"outer": [[0, 0], [1, 1]]}})").empty());
        ASSERT(!expect_error(R"({"transmitter": {"velocity": 1, "delayMin": 200, "delayMax": 100}})").empty());
        ASSERT(!expect_error(R"({"detectionRange": {"type": "constant", "p": 1.5}})").empty());
        ASSERT(!expect_error(R"({"receiverLine": {"spacing": 100}, "receiverGrid": {"dx": 100}})").empty());
        ASSERT(!expect_error(R"({"path": {"start": [0, 0], "stepLength": -5}})").empty());
        ASSERT(!expect_error(R"({"seed": 1.5})").empty());
        ASSERT(!expect_error(R"([1, 2, 3])").empty());
    PASS()
}

void testIntegerRanges() {
    TEST("seed accepts the full 32-bit range")
        Scenario sc = ScenarioParser::parse(JsonReader::parse(R"({"seed": 4294967295})"));
        ASSERT(sc.seed == -1);
        ASSERT(sc.line.base_seed == -1);
        ASSERT(sc.collision_sampling.seed == -1);
        sc = ScenarioParser::parse(JsonReader::parse(R"({"seed": -2147483648})"));
        ASSERT(sc.seed == INT32_MIN);
        std::string msg = expect_error(R"({"seed": 4294967296})");
        ASSERT(msg.find("seed") != std::string::npos);
        ASSERT(!expect_error(R"({"seed": -2147483649})").empty());
    PASS()

    TEST("integer fields beyond int range are rejected")
        std::string msg = expect_error(R"({"lineSim": {"trials": 3e9}})");
        ASSERT(msg.find("lineSim.trials") != std::string::npos);
        msg = expect_error(R"({"receiverGrid": {"dx": 100, "cols": -3e10}})");
        ASSERT(msg.find("receiverGrid.cols") != std::string::npos);
        msg = expect_error(R"({"threads": 1e300})");
        ASSERT(msg.find("threads") != std::string::npos);
    PASS()
}

void testResultWriters() {
    TEST("detection output parses back with flat field names")
        DetectionRecord d;
        d.transmission_id = 3;
        d.receiver_id = 2;
        d.receiver_position = Point(10, 20);
        d.transmission_position = Point(15, 25);
        d.elapsed_time = 240.5;
        std::ostringstream out;
        write_detections_json({ d }, 12, 4, 99, out);

        JsonValue v = JsonReader::parse(out.str());
        ASSERT(v["config"]["seed"].get_int() == 99);
        ASSERT(v["detectionCount"].get_int() == 1);
        const JsonValue& rec = v["detections"][size_t(0)];
        ASSERT(rec["transmission_id"].get_int() == 3);
        ASSERT(rec["receiver_id"].get_int() == 2);
        ASSERT(rec["receiver_x"].get_number() == 10.0);
        ASSERT(rec["transmission_y"].get_number() == 25.0);
        ASSERT(rec["elapsed_time"].get_number() == 240.5);
    PASS()

    TEST("line result writes undetected times as null")
        LineSimConfig cfg;
        cfg.num_trials = 1;
        LineSimResult r;
        r.status = RunStatus::CANCELLED;
        r.receivers = make_receiver_line({0, 0}, 100.0, 2);
        TrialOutcome t;
        t.detections_per_receiver = {0, 0};
        t.first_detection_time = std::nan("");
        t.last_detection_time = std::nan("");
        r.trials.push_back(t);
        r.summary.trials_completed = 1;
        r.summary.detections_per_receiver = {0, 0};
        std::ostringstream out;
        write_line_result_json(r, cfg, out);

        JsonValue v = JsonReader::parse(out.str());
        ASSERT(v["status"].get_string() == "cancelled");
        ASSERT(v["receivers"].size() == 2);
        ASSERT(v["trials"][size_t(0)]["firstDetection"].is_null());
        ASSERT(v["summary"]["trialsCompleted"].get_int() == 1);
        ASSERT(v["config"]["movement"].get_string() == "crossing");
    PASS()

    TEST("collision table output")
        CollisionRow row;
        row.num_tags = 2;
        row.analytic = 0.08;
        row.sampled = 0.079;
        row.detection_analytic = 0.92;
        row.detection_sampled = 0.921;
        std::ostringstream out;
        write_collision_json({ row }, 5.0, 60.0, 180.0, out);

        JsonValue v = JsonReader::parse(out.str());
        ASSERT(v["config"]["delayMax"].get_number() == 180.0);
        ASSERT(v["rows"].size() == 1);
        ASSERT(v["rows"][size_t(0)]["collisionAnalytic"].get_number() == 0.08);
    PASS()
}

int main() {
    std::cout << "=== Scenario and Output Tests ===" << std::endl;
    testJsonReader();
    testScenarioParse();
    testScenarioErrors();
    testIntegerRanges();
    testResultWriters();
    return finish();
}
