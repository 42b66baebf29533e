#include "telemetry/scenario_parser.hpp"
#include "core/sim_errors.hpp"
#include <climits>
#include <cmath>
#include <cstdint>

namespace rxnet::telemetry {

// ── Field helpers ──

static std::string join(const std::string& path, const std::string& key) {
    return path.empty() ? key : path + "." + key;
}

static std::string index_path(const std::string& path, size_t i) {
    return path + "[" + std::to_string(i) + "]";
}

static const JsonValue& require_field(const JsonValue& obj, const std::string& key,
                                      const std::string& path) {
    if (!obj.has(key)) {
        throw ValidationError("missing required field '" + join(path, key) + "'");
    }
    return obj[key];
}

static double as_number(const JsonValue& v, const std::string& path) {
    if (!v.is_number()) {
        throw ValidationError("'" + path + "' must be a number, got " + json_type_name(v.type));
    }
    return v.get_number();
}

static double require_number(const JsonValue& obj, const std::string& key,
                             const std::string& path) {
    return as_number(require_field(obj, key, path), join(path, key));
}

static double optional_number(const JsonValue& obj, const std::string& key,
                              const std::string& path, double def) {
    if (!obj.has(key) || obj[key].is_null()) return def;
    return as_number(obj[key], join(path, key));
}

static int optional_int(const JsonValue& obj, const std::string& key,
                        const std::string& path, int def) {
    double v = optional_number(obj, key, path, def);
    if (v != std::floor(v)) {
        throw ValidationError("'" + join(path, key) + "' must be an integer");
    }
    if (v < static_cast<double>(INT_MIN) || v > static_cast<double>(INT_MAX)) {
        throw ValidationError("'" + join(path, key) + "' is out of integer range");
    }
    return static_cast<int>(v);
}

// Seeds are 32-bit: anything in [INT32_MIN, UINT32_MAX] is accepted and
// values above INT32_MAX wrap to the same bit pattern.
static int32_t optional_seed(const JsonValue& obj, const std::string& key,
                             const std::string& path, int32_t def) {
    double v = optional_number(obj, key, path, def);
    if (v != std::floor(v)) {
        throw ValidationError("'" + join(path, key) + "' must be an integer");
    }
    if (v < static_cast<double>(INT32_MIN) || v > static_cast<double>(UINT32_MAX)) {
        throw ValidationError("'" + join(path, key) + "' is out of 32-bit seed range");
    }
    int64_t wide = static_cast<int64_t>(v);
    return static_cast<int32_t>(static_cast<uint32_t>(wide));
}

static std::string optional_string(const JsonValue& obj, const std::string& key,
                                   const std::string& path, const std::string& def) {
    if (!obj.has(key) || obj[key].is_null()) return def;
    if (!obj[key].is_string()) {
        throw ValidationError("'" + join(path, key) + "' must be a string");
    }
    return obj[key].get_string();
}

static const JsonValue& require_array(const JsonValue& v, const std::string& path) {
    if (!v.is_array()) {
        throw ValidationError("'" + path + "' must be an array, got " + json_type_name(v.type));
    }
    return v;
}

static const JsonValue& require_object(const JsonValue& v, const std::string& path) {
    if (!v.is_object()) {
        throw ValidationError("'" + path + "' must be an object, got " + json_type_name(v.type));
    }
    return v;
}

/** [x, y] or {"x": .., "y": ..} */
static Point parse_point(const JsonValue& v, const std::string& path) {
    if (v.is_array()) {
        if (v.size() != 2) throw ValidationError("'" + path + "' must be [x, y]");
        return Point(as_number(v[0], index_path(path, 0)), as_number(v[1], index_path(path, 1)));
    }
    if (v.is_object()) {
        return Point(require_number(v, "x", path), require_number(v, "y", path));
    }
    throw ValidationError("'" + path + "' must be [x, y] or {x, y}");
}

static std::vector<Point> parse_ring(const JsonValue& v, const std::string& path) {
    require_array(v, path);
    std::vector<Point> ring;
    ring.reserve(v.size());
    for (size_t i = 0; i < v.size(); i++) {
        ring.push_back(parse_point(v[i], index_path(path, i)));
    }
    return ring;
}

// ── Sections ──

DetectionRangeFunction ScenarioParser::parse_range(const JsonValue& def, const std::string& path,
                                                   std::string* description) {
    require_object(def, path);
    std::string type = optional_string(def, "type", path, "logistic");
    std::string desc;
    DetectionRangeFunction fn;

    if (type == "constant") {
        double p = require_number(def, "p", path);
        fn = constant_range(p);
        desc = "constant(p=" + std::to_string(p) + ")";
    } else if (type == "step") {
        double cutoff = require_number(def, "cutoff", path);
        double p_in = optional_number(def, "pInside", path, 1.0);
        double p_out = optional_number(def, "pOutside", path, 0.0);
        fn = step_range(cutoff, p_in, p_out);
        desc = "step(cutoff=" + std::to_string(cutoff) + ")";
    } else if (type == "logistic") {
        double b0 = optional_number(def, "b0", path, 0.5);
        double b1 = optional_number(def, "b1", path, -1.0 / 120.0);
        fn = logistic_range(b0, b1);
        desc = "logistic(b0=" + std::to_string(b0) + ", b1=" + std::to_string(b1) + ")";
    } else if (type == "table") {
        const auto& knots = require_array(require_field(def, "knots", path), join(path, "knots"));
        std::vector<std::pair<double, double>> table;
        for (size_t i = 0; i < knots.size(); i++) {
            Point k = parse_point(knots[i], index_path(join(path, "knots"), i));
            table.emplace_back(k.x, k.y);
        }
        fn = table_range(std::move(table));
        desc = "table(" + std::to_string(knots.size()) + " knots)";
    } else {
        throw ValidationError("'" + join(path, "type") + "' unknown range type '" + type + "'");
    }

    if (description) *description = desc;
    return fn;
}

ReceiverLayout ScenarioParser::parse_layout(const JsonValue& def, bool grid,
                                            const std::string& path) {
    require_object(def, path);
    ReceiverLayout layout;
    layout.kind = grid ? ReceiverLayout::Kind::GRID : ReceiverLayout::Kind::LINE;
    layout.origin = def.has("origin") ? parse_point(def["origin"], join(path, "origin")) : Point();

    if (grid) {
        layout.spacing = require_number(def, "dx", path);
        layout.row_spacing = optional_number(def, "dy", path, layout.spacing);
        layout.cols = optional_int(def, "cols", path, layout.cols);
        layout.rows = optional_int(def, "rows", path, layout.rows);
    } else {
        layout.spacing = require_number(def, "spacing", path);
        layout.count = optional_int(def, "count", path, layout.count);
        layout.bearing_deg = optional_number(def, "bearing", path, layout.bearing_deg);
    }
    layout.validate();
    return layout;
}

WalkConfig ScenarioParser::parse_walk(const JsonValue& def, const std::string& path) {
    require_object(def, path);
    WalkConfig walk;
    walk.start = parse_point(require_field(def, "start", path), join(path, "start"));
    walk.step_length = require_number(def, "stepLength", path);
    walk.num_steps = optional_int(def, "numSteps", path, walk.num_steps);
    if (def.has("initialHeading") && !def["initialHeading"].is_null()) {
        walk.initial_heading_deg = as_number(def["initialHeading"], join(path, "initialHeading"));
    }
    walk.max_attempts_per_step = optional_int(def, "maxAttempts", path, walk.max_attempts_per_step);
    walk.retry_spread_growth_deg = optional_number(def, "retrySpreadGrowth", path,
                                                   walk.retry_spread_growth_deg);

    if (def.has("turnAngle")) {
        const std::string tpath = join(path, "turnAngle");
        const auto& t = require_object(def["turnAngle"], tpath);
        std::string dist = optional_string(t, "distribution", tpath, "normal");
        if (dist == "normal") {
            walk.turn.distribution = TurnAngleModel::Distribution::NORMAL;
        } else if (dist == "uniform") {
            walk.turn.distribution = TurnAngleModel::Distribution::UNIFORM;
        } else {
            throw ValidationError("'" + join(tpath, "distribution") +
                                  "' must be 'normal' or 'uniform'");
        }
        walk.turn.mean_deg = optional_number(t, "mean", tpath, walk.turn.mean_deg);
        walk.turn.spread_deg = optional_number(t, "spread", tpath, walk.turn.spread_deg);
    }
    walk.validate();
    return walk;
}

static TransmitterConfig parse_transmitter(const JsonValue& def, const std::string& path) {
    require_object(def, path);
    TransmitterConfig tx;
    tx.velocity = require_number(def, "velocity", path);
    tx.delay_min = require_number(def, "delayMin", path);
    tx.delay_max = require_number(def, "delayMax", path);
    tx.burst_duration = optional_number(def, "burstDuration", path, tx.burst_duration);
    tx.validate();
    return tx;
}

static std::vector<Receiver> parse_receivers(const JsonValue& arr, const std::string& path) {
    require_array(arr, path);
    std::vector<Receiver> receivers;
    receivers.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); i++) {
        const std::string rpath = index_path(path, i);
        const auto& r = require_object(arr[i], rpath);
        Receiver rec;
        rec.receiver_id = optional_int(r, "id", rpath, static_cast<int>(i) + 1);
        rec.position = Point(require_number(r, "x", rpath), require_number(r, "y", rpath));
        receivers.push_back(rec);
    }
    return receivers;
}

static std::vector<TransmissionEvent> parse_transmissions(const JsonValue& arr,
                                                          const std::string& path) {
    require_array(arr, path);
    std::vector<TransmissionRecord> records;
    records.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); i++) {
        const std::string tpath = index_path(path, i);
        const auto& t = require_object(arr[i], tpath);
        TransmissionRecord rec;
        rec.x = require_number(t, "x", tpath);
        rec.y = require_number(t, "y", tpath);
        rec.et = require_number(t, "et", tpath);
        records.push_back(rec);
    }
    return transmissions_from_records(records);
}

static void parse_line_sim(const JsonValue& def, const std::string& path, LineSimConfig& line) {
    require_object(def, path);
    line.num_trials = optional_int(def, "trials", path, line.num_trials);

    std::string movement = optional_string(def, "movement", path, "crossing");
    if (movement == "crossing") {
        line.movement = Movement::CROSSING;
    } else if (movement == "randomWalk") {
        line.movement = Movement::RANDOM_WALK;
    } else {
        throw ValidationError("'" + join(path, "movement") +
                              "' must be 'crossing' or 'randomWalk'");
    }

    line.max_distance = optional_number(def, "maxDistance", path, line.max_distance);
    if (def.has("outerLimits")) {
        Point lim = parse_point(def["outerLimits"], join(path, "outerLimits"));
        line.outer_limit_left = lim.x;
        line.outer_limit_right = lim.y;
    }
}

static std::vector<SweepPoint> parse_sweep(const JsonValue& arr, const std::string& path) {
    require_array(arr, path);
    std::vector<SweepPoint> points;
    for (size_t i = 0; i < arr.size(); i++) {
        const std::string ppath = index_path(path, i);
        const auto& p = require_object(arr[i], ppath);
        SweepPoint sp;
        if (p.has("spacing"))  sp.spacing = as_number(p["spacing"], join(ppath, "spacing"));
        if (p.has("velocity")) sp.velocity = as_number(p["velocity"], join(ppath, "velocity"));
        if (p.has("delayMin")) sp.delay_min = as_number(p["delayMin"], join(ppath, "delayMin"));
        if (p.has("delayMax")) sp.delay_max = as_number(p["delayMax"], join(ppath, "delayMax"));
        points.push_back(sp);
    }
    return points;
}

static void parse_collision(const JsonValue& def, const std::string& path, Scenario& sc) {
    require_object(def, path);
    sc.collision.num_tags = optional_int(def, "numTags", path, sc.collision.num_tags);
    sc.collision.burst_duration = optional_number(def, "burstDuration", path,
                                                  sc.transmitter.burst_duration);
    sc.collision.delay_min = optional_number(def, "delayMin", path, sc.transmitter.delay_min);
    sc.collision.delay_max = optional_number(def, "delayMax", path, sc.transmitter.delay_max);
    sc.collision_max_tags = optional_int(def, "maxTags", path, 0);
    sc.collision_sampling.transmissions_per_tag =
        optional_int(def, "transmissionsPerTag", path, sc.collision_sampling.transmissions_per_tag);
    sc.collision.validate();
}

// ── Document ──

Scenario ScenarioParser::parse(const JsonValue& doc) {
    require_object(doc, "<root>");
    Scenario sc;

    sc.seed = optional_seed(doc, "seed", "", sc.seed);
    sc.threads = optional_int(doc, "threads", "", sc.threads);

    if (doc.has("region")) {
        const auto& region = require_object(doc["region"], "region");
        std::vector<Point> outer = parse_ring(require_field(region, "outer", "region"),
                                              "region.outer");
        std::vector<std::vector<Point>> holes;
        if (region.has("holes")) {
            const auto& h = require_array(region["holes"], "region.holes");
            for (size_t i = 0; i < h.size(); i++) {
                holes.push_back(parse_ring(h[i], index_path("region.holes", i)));
            }
        }
        sc.region = std::make_shared<PolygonBoundary>(std::move(outer), std::move(holes));
    }

    if (doc.has("receivers")) {
        sc.receivers = parse_receivers(doc["receivers"], "receivers");
    }
    if (doc.has("receiverLine") && doc.has("receiverGrid")) {
        throw ValidationError("give either 'receiverLine' or 'receiverGrid', not both");
    }
    if (doc.has("receiverLine")) {
        sc.layout = parse_layout(doc["receiverLine"], false, "receiverLine");
    } else if (doc.has("receiverGrid")) {
        sc.layout = parse_layout(doc["receiverGrid"], true, "receiverGrid");
    }

    if (doc.has("transmissions")) {
        sc.transmissions = parse_transmissions(doc["transmissions"], "transmissions");
    }
    if (doc.has("path")) {
        sc.walk = parse_walk(doc["path"], "path");
    }
    if (doc.has("transmitter")) {
        sc.transmitter = parse_transmitter(doc["transmitter"], "transmitter");
    }

    if (doc.has("detectionRange")) {
        sc.range_fn = parse_range(doc["detectionRange"], "detectionRange",
                                  &sc.range_description);
    }

    sc.line.base_seed = sc.seed;
    sc.line.num_threads = sc.threads;
    sc.line.transmitter = sc.transmitter;
    if (sc.layout) sc.line.layout = *sc.layout;
    if (sc.walk) sc.line.walk = *sc.walk;
    if (doc.has("lineSim")) {
        parse_line_sim(doc["lineSim"], "lineSim", sc.line);
    }
    if (doc.has("sweep")) {
        sc.sweep = parse_sweep(doc["sweep"], "sweep");
    }

    sc.collision.burst_duration = sc.transmitter.burst_duration > 0.0
                                      ? sc.transmitter.burst_duration
                                      : sc.collision.burst_duration;
    sc.collision.delay_min = sc.transmitter.delay_min;
    sc.collision.delay_max = sc.transmitter.delay_max;
    sc.collision_sampling.seed = sc.seed;
    if (doc.has("collision")) {
        parse_collision(doc["collision"], "collision", sc);
    }

    return sc;
}

Scenario ScenarioParser::parse_file(const std::string& path) {
    return parse(JsonReader::parse_file(path));
}

std::vector<Receiver> Scenario::resolve_receivers() const {
    if (!receivers.empty()) return receivers;
    if (layout) return layout->build();
    return {};
}

} // namespace rxnet::telemetry
