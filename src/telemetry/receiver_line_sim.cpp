#include "telemetry/receiver_line_sim.hpp"
#include "core/sim_errors.hpp"
#include "core/sim_rng.hpp"
#include <cmath>
#include <iostream>
#include <limits>
#include <mutex>
#include <unordered_map>

namespace rxnet::telemetry {

const char* status_to_string(RunStatus status) {
    switch (status) {
        case RunStatus::COMPLETED: return "completed";
        case RunStatus::CANCELLED: return "cancelled";
    }
    return "unknown";
}

void LineSimConfig::validate() const {
    if (num_trials <= 0) {
        throw ValidationError("num_trials must be > 0");
    }
    layout.validate();
    transmitter.validate();

    if (movement == Movement::CROSSING) {
        if (!(max_distance > 0.0) || !std::isfinite(max_distance)) {
            throw ValidationError("crossing max_distance must be > 0");
        }
        if (!(outer_limit_left >= 0.0) || !(outer_limit_right >= 0.0) ||
            !std::isfinite(outer_limit_left) || !std::isfinite(outer_limit_right)) {
            throw ValidationError("outer limits must be finite and >= 0");
        }
    } else {
        walk.validate();
    }
}

LineSimConfig apply_sweep_point(const LineSimConfig& base, const SweepPoint& point) {
    LineSimConfig cfg = base;
    if (point.spacing)   cfg.layout.spacing = *point.spacing;
    if (point.velocity)  cfg.transmitter.velocity = *point.velocity;
    if (point.delay_min) cfg.transmitter.delay_min = *point.delay_min;
    if (point.delay_max) cfg.transmitter.delay_max = *point.delay_max;
    return cfg;
}

ReceiverLineSimulator::ReceiverLineSimulator(const LineSimConfig& config,
                                             std::shared_ptr<const BoundaryOracle> region,
                                             DetectionRangeFunction range_fn)
    : config_(config), region_(std::move(region)), range_fn_(std::move(range_fn)) {
    config_.validate();
    if (!range_fn_) {
        throw ValidationError("detection range function is not set");
    }
    if (config_.movement == Movement::RANDOM_WALK && !region_) {
        throw ValidationError("random-walk trials need a region");
    }
    if (!region_) {
        region_ = std::make_shared<OpenWaterBoundary>();
    }
}

Path ReceiverLineSimulator::crossing_path(SimRNG& rng) const {
    const ReceiverLayout& layout = config_.layout;

    double axis_bearing = 90.0;
    double depth = 0.0;
    if (layout.kind == ReceiverLayout::Kind::LINE) {
        axis_bearing = layout.bearing_deg;
    } else {
        double dy = layout.row_spacing > 0.0 ? layout.row_spacing : layout.spacing;
        depth = dy * (layout.rows - 1);
    }

    double along = rng.uniform(-config_.outer_limit_left,
                               layout.line_extent() + config_.outer_limit_right);
    Point on_line = advance(layout.origin, axis_bearing, along);

    // Swim direction is the line bearing turned 90 degrees anticlockwise
    // (north across an east-running line).
    double swim_heading = wrap_heading(axis_bearing - 90.0);
    Point start = advance(on_line, swim_heading, -config_.max_distance);
    Point end = advance(on_line, swim_heading, depth + config_.max_distance);

    return Path{ PathPoint{start, 0}, PathPoint{end, 1} };
}

TrialOutcome ReceiverLineSimulator::run_trial(int trial_index) const {
    return run_trial(trial_index, config_.layout.build());
}

TrialOutcome ReceiverLineSimulator::run_trial(int trial_index,
                                              const std::vector<Receiver>& receivers) const {
    TrialOutcome outcome;
    outcome.trial_index = trial_index;
    outcome.seed = SimRNG::offset_seed(config_.base_seed, trial_index);
    outcome.detections_per_receiver.assign(receivers.size(), 0);
    outcome.first_detection_time = std::numeric_limits<double>::quiet_NaN();
    outcome.last_detection_time = std::numeric_limits<double>::quiet_NaN();

    SimRNG rng(outcome.seed);

    Path path;
    if (config_.movement == Movement::CROSSING) {
        path = crossing_path(rng);
    } else {
        path = PathGenerator(config_.walk).generate(*region_, rng);
    }

    auto transmissions = TransmissionScheduler(config_.transmitter).schedule(path, rng);
    outcome.num_transmissions = static_cast<int>(transmissions.size());

    DetectionConfig det_config;
    det_config.seed = SimRNG::derive_seed(outcome.seed, 1u);
    det_config.num_threads = 1;   // trials are the parallel axis here
    auto detections = DetectionSimulator(det_config).simulate(transmissions, receivers, range_fn_);

    std::unordered_map<int, size_t> index_of;
    for (size_t i = 0; i < receivers.size(); i++) {
        index_of[receivers[i].receiver_id] = i;
    }
    for (const auto& det : detections) {
        outcome.detections_per_receiver[index_of[det.receiver_id]]++;
    }

    outcome.num_detections = static_cast<int>(detections.size());
    outcome.detected = !detections.empty();
    if (outcome.detected) {
        outcome.first_detection_time = detections.front().elapsed_time;
        outcome.last_detection_time = detections.back().elapsed_time;
    }
    return outcome;
}

LineSimSummary ReceiverLineSimulator::summarize(const std::vector<TrialOutcome>& trials,
                                                size_t num_receivers) {
    LineSimSummary s;
    s.detections_per_receiver.assign(num_receivers, 0);
    s.trials_completed = static_cast<int>(trials.size());

    long long total_detections = 0;
    long long total_transmissions = 0;
    for (const auto& t : trials) {
        if (t.detected) s.trials_detected++;
        total_detections += t.num_detections;
        total_transmissions += t.num_transmissions;
        for (size_t i = 0; i < num_receivers && i < t.detections_per_receiver.size(); i++) {
            s.detections_per_receiver[i] += t.detections_per_receiver[i];
        }
    }

    if (s.trials_completed > 0) {
        double n = static_cast<double>(s.trials_completed);
        s.detection_efficiency = s.trials_detected / n;
        s.mean_detections = static_cast<double>(total_detections) / n;
        s.mean_transmissions = static_cast<double>(total_transmissions) / n;
    }
    return s;
}

LineSimResult ReceiverLineSimulator::run(ProgressCallback on_progress,
                                         const CancelToken* cancel) const {
    LineSimResult result;
    result.receivers = config_.layout.build();

    const int n = config_.num_trials;
    std::vector<TrialOutcome> slots(static_cast<size_t>(n));
    std::vector<char> finished(static_cast<size_t>(n), 0);

    if (config_.verbose) {
        std::cerr << "Line sim: " << n << " trials, "
                  << result.receivers.size() << " receivers, spacing "
                  << config_.layout.spacing << ", velocity "
                  << config_.transmitter.velocity << ", base seed "
                  << config_.base_seed << "\n";
    }

    std::mutex progress_mutex;
    int completed = 0;

    parallel_for(static_cast<size_t>(n), config_.num_threads, [&](size_t i) {
        slots[i] = run_trial(static_cast<int>(i), result.receivers);
        finished[i] = 1;

        if (on_progress || config_.verbose) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            ++completed;
            if (config_.verbose && completed % 100 == 0) {
                std::cerr << "  " << completed << "/" << n << " trials\n";
            }
            if (on_progress) on_progress(completed, n);
        }
    }, cancel);

    for (size_t i = 0; i < slots.size(); i++) {
        if (finished[i]) result.trials.push_back(std::move(slots[i]));
    }

    if (static_cast<int>(result.trials.size()) < n) {
        result.status = RunStatus::CANCELLED;
    }
    result.summary = summarize(result.trials, result.receivers.size());

    if (config_.verbose) {
        std::cerr << "Line sim " << status_to_string(result.status) << ": "
                  << result.summary.trials_completed << " trials, efficiency "
                  << result.summary.detection_efficiency << "\n";
    }
    return result;
}

SweepResult ReceiverLineSimulator::run_sweep(const std::vector<SweepPoint>& points,
                                             ProgressCallback on_progress,
                                             const CancelToken* cancel) const {
    SweepResult sweep;
    const int total = config_.num_trials * static_cast<int>(points.size());
    int offset = 0;

    for (const auto& point : points) {
        if (cancel && cancel->cancelled()) {
            sweep.status = RunStatus::CANCELLED;
            break;
        }

        LineSimConfig cfg = apply_sweep_point(config_, point);
        ReceiverLineSimulator sim(cfg, region_, range_fn_);

        ProgressCallback point_progress = nullptr;
        if (on_progress) {
            point_progress = [&](int completed, int) {
                on_progress(offset + completed, total);
            };
        }

        SweepPointResult pr;
        pr.point = point;
        pr.config = cfg;
        pr.result = sim.run(point_progress, cancel);
        offset += cfg.num_trials;

        bool cancelled = pr.result.status == RunStatus::CANCELLED;
        sweep.points.push_back(std::move(pr));
        if (cancelled) {
            sweep.status = RunStatus::CANCELLED;
            break;
        }
    }

    return sweep;
}

} // namespace rxnet::telemetry
