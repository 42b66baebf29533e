/**
 * ScenarioParser - scenario JSON into typed simulation configuration.
 *
 * Every section is optional at the document level; each run mode checks
 * for the sections it needs. Fields that are present but malformed, and
 * required fields missing from a present section, raise ValidationError
 * naming the JSON path (e.g. "transmitter.delayMin").
 */

#ifndef RXNET_TELEMETRY_SCENARIO_PARSER_HPP
#define RXNET_TELEMETRY_SCENARIO_PARSER_HPP

#include "boundary/polygon_boundary.hpp"
#include "io/json_reader.hpp"
#include "telemetry/collision_estimator.hpp"
#include "telemetry/detection_range.hpp"
#include "telemetry/detection_simulator.hpp"
#include "telemetry/path_generator.hpp"
#include "telemetry/receiver_layout.hpp"
#include "telemetry/receiver_line_sim.hpp"
#include "telemetry/transmission_scheduler.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rxnet::telemetry {

/** Command-line run settings; CLI flags override scenario values. */
struct RunConfig {
    std::string mode = "detect";    // detect | line | sweep | collision
    std::string scenario_path;
    std::string output_path;        // empty = stdout
    std::optional<int32_t> seed;
    std::optional<int> threads;
    std::optional<int> trials;
    bool verbose = false;
    bool progress = false;          // JSON-Lines progress on stderr
};

struct Scenario {
    int32_t seed = 42;
    int threads = 1;

    std::shared_ptr<const PolygonBoundary> region;   // null = open water

    std::vector<Receiver> receivers;                 // explicit list
    std::optional<ReceiverLayout> layout;            // or a generated arrangement

    std::vector<TransmissionEvent> transmissions;    // explicit input
    std::optional<WalkConfig> walk;
    TransmitterConfig transmitter;

    DetectionRangeFunction range_fn;
    std::string range_description;

    LineSimConfig line;
    std::vector<SweepPoint> sweep;

    CollisionSamplingConfig collision_sampling;
    CollisionParams collision;
    int collision_max_tags = 0;   // 0 = single estimate for collision.num_tags

    /** Receivers from the explicit list, else from the layout. */
    std::vector<Receiver> resolve_receivers() const;
};

class ScenarioParser {
public:
    /** @throws ValidationError */
    static Scenario parse(const JsonValue& doc);

    /** @throws ValidationError */
    static Scenario parse_file(const std::string& path);

    static DetectionRangeFunction parse_range(const JsonValue& def, const std::string& path,
                                              std::string* description = nullptr);
    static ReceiverLayout parse_layout(const JsonValue& def, bool grid, const std::string& path);
    static WalkConfig parse_walk(const JsonValue& def, const std::string& path);
};

} // namespace rxnet::telemetry

#endif // RXNET_TELEMETRY_SCENARIO_PARSER_HPP
