#include "telemetry/sim_results.hpp"
#include "io/json_writer.hpp"

namespace rxnet::telemetry {

static void write_line_config(JsonWriter& w, const LineSimConfig& c) {
    w.begin_object();
    w.kv("trials", c.num_trials);
    w.kv("baseSeed", c.base_seed);
    w.kv("movement", c.movement == Movement::CROSSING ? "crossing" : "randomWalk");
    w.kv("layout", c.layout.kind == ReceiverLayout::Kind::LINE ? "line" : "grid");
    w.kv("spacing", c.layout.spacing);
    w.kv("velocity", c.transmitter.velocity);
    w.kv("delayMin", c.transmitter.delay_min);
    w.kv("delayMax", c.transmitter.delay_max);
    w.kv("burstDuration", c.transmitter.burst_duration);
    if (c.movement == Movement::CROSSING) {
        w.kv("maxDistance", c.max_distance);
        w.key("outerLimits").begin_array(true)
            .value(c.outer_limit_left).value(c.outer_limit_right).end_array();
    }
    w.end_object();
}

static void write_line_body(JsonWriter& w, const LineSimResult& r) {
    w.kv("status", status_to_string(r.status));

    w.key("receivers").begin_array();
    for (const auto& rec : r.receivers) {
        w.begin_object(true);
        w.kv("id", rec.receiver_id);
        w.kv("x", rec.position.x);
        w.kv("y", rec.position.y);
        w.end_object();
    }
    w.end_array();

    const auto& s = r.summary;
    w.key("summary").begin_object();
    w.kv("trialsCompleted", s.trials_completed);
    w.kv("trialsDetected", s.trials_detected);
    w.kv("detectionEfficiency", s.detection_efficiency);
    w.kv("meanDetections", s.mean_detections);
    w.kv("meanTransmissions", s.mean_transmissions);
    w.key("detectionsPerReceiver").begin_array(true);
    for (int n : s.detections_per_receiver) w.value(n);
    w.end_array();
    w.end_object();

    w.key("trials").begin_array();
    for (const auto& t : r.trials) {
        w.begin_object(true);
        w.kv("trial", t.trial_index);
        w.kv("seed", t.seed);
        w.kv("transmissions", t.num_transmissions);
        w.kv("detections", t.num_detections);
        w.kv("detected", t.detected);
        w.kv("firstDetection", t.first_detection_time);
        w.kv("lastDetection", t.last_detection_time);
        w.key("perReceiver").begin_array(true);
        for (int n : t.detections_per_receiver) w.value(n);
        w.end_array();
        w.end_object();
    }
    w.end_array();
}

void write_detections_json(const std::vector<DetectionRecord>& detections,
                           int num_transmissions, int num_receivers, int seed,
                           std::ostream& out) {
    JsonWriter w(out);
    w.begin_object();

    w.key("config").begin_object();
    w.kv("seed", seed);
    w.kv("transmissions", num_transmissions);
    w.kv("receivers", num_receivers);
    w.end_object();

    w.kv("detectionCount", detections.size());

    w.key("detections").begin_array();
    for (const auto& d : detections) {
        w.begin_object(true);
        w.kv("transmission_id", d.transmission_id);
        w.kv("receiver_id", d.receiver_id);
        w.kv("receiver_x", d.receiver_position.x);
        w.kv("receiver_y", d.receiver_position.y);
        w.kv("transmission_x", d.transmission_position.x);
        w.kv("transmission_y", d.transmission_position.y);
        w.kv("elapsed_time", d.elapsed_time);
        w.end_object();
    }
    w.end_array();

    w.end_object();
    out << '\n';
}

void write_line_result_json(const LineSimResult& result, const LineSimConfig& config,
                            std::ostream& out) {
    JsonWriter w(out);
    w.begin_object();
    w.key("config");
    write_line_config(w, config);
    write_line_body(w, result);
    w.end_object();
    out << '\n';
}

void write_sweep_json(const SweepResult& sweep, std::ostream& out) {
    JsonWriter w(out);
    w.begin_object();
    w.kv("status", status_to_string(sweep.status));

    w.key("points").begin_array();
    for (const auto& p : sweep.points) {
        w.begin_object();
        w.key("config");
        write_line_config(w, p.config);
        write_line_body(w, p.result);
        w.end_object();
    }
    w.end_array();

    w.end_object();
    out << '\n';
}

void write_collision_json(const std::vector<CollisionRow>& rows, double burst_duration,
                          double delay_min, double delay_max, std::ostream& out) {
    JsonWriter w(out);
    w.begin_object();

    w.key("config").begin_object();
    w.kv("burstDuration", burst_duration);
    w.kv("delayMin", delay_min);
    w.kv("delayMax", delay_max);
    w.end_object();

    w.key("rows").begin_array();
    for (const auto& r : rows) {
        w.begin_object(true);
        w.kv("numTags", r.num_tags);
        w.kv("collisionAnalytic", r.analytic);
        w.kv("collisionSampled", r.sampled);
        w.kv("detectionAnalytic", r.detection_analytic);
        w.kv("detectionSampled", r.detection_sampled);
        w.end_object();
    }
    w.end_array();

    w.end_object();
    out << '\n';
}

} // namespace rxnet::telemetry
