/**
 * ReceiverLineSimulator - batch Monte Carlo over receiver line crossings.
 *
 * Each trial moves one simulated animal past the receiver arrangement,
 * schedules its transmissions and simulates detection. Trial i is seeded
 * with base_seed + i, so any subset of trials can be reproduced alone and
 * the batch gives the same outcomes on any number of threads.
 *
 * Sweeps rerun the batch for a list of parameter overrides (spacing,
 * velocity, delay range) against the same shared region.
 */

#ifndef RXNET_TELEMETRY_RECEIVER_LINE_SIM_HPP
#define RXNET_TELEMETRY_RECEIVER_LINE_SIM_HPP

#include "boundary/boundary_oracle.hpp"
#include "core/work_pool.hpp"
#include "telemetry/detection_range.hpp"
#include "telemetry/detection_simulator.hpp"
#include "telemetry/path_generator.hpp"
#include "telemetry/receiver_layout.hpp"
#include "telemetry/transmission_scheduler.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rxnet::telemetry {

enum class RunStatus { COMPLETED, CANCELLED };

const char* status_to_string(RunStatus status);

enum class Movement {
    CROSSING,      // straight swim perpendicular to the line
    RANDOM_WALK    // correlated random walk inside the region
};

struct LineSimConfig {
    int num_trials = 1000;
    int32_t base_seed = 42;   // trial i uses base_seed + i, wrapping at 32 bits
    int num_threads = 1;    // <= 0: hardware concurrency
    bool verbose = false;

    ReceiverLayout layout;
    TransmitterConfig transmitter;

    Movement movement = Movement::CROSSING;

    // CROSSING: start max_distance before the line, finish max_distance past
    // it, crossing anywhere from outer_limit_left before the first receiver
    // to outer_limit_right past the last.
    double max_distance = 2000.0;
    double outer_limit_left = 0.0;
    double outer_limit_right = 0.0;

    // RANDOM_WALK
    WalkConfig walk;

    /** @throws ValidationError */
    void validate() const;
};

struct TrialOutcome {
    int trial_index = 0;
    int32_t seed = 0;
    int num_transmissions = 0;
    int num_detections = 0;
    bool detected = false;
    std::vector<int> detections_per_receiver;   // parallel to the receiver list
    double first_detection_time = 0.0;          // NaN when undetected
    double last_detection_time = 0.0;
};

struct LineSimSummary {
    int trials_completed = 0;
    int trials_detected = 0;
    double detection_efficiency = 0.0;   // trials_detected / trials_completed
    double mean_detections = 0.0;
    double mean_transmissions = 0.0;
    std::vector<int> detections_per_receiver;
};

struct LineSimResult {
    RunStatus status = RunStatus::COMPLETED;
    std::vector<Receiver> receivers;
    std::vector<TrialOutcome> trials;   // completed trials, by trial index
    LineSimSummary summary;
};

/** Parameter overrides for one sweep point; unset fields keep the base value. */
struct SweepPoint {
    std::optional<double> spacing;
    std::optional<double> velocity;
    std::optional<double> delay_min;
    std::optional<double> delay_max;
};

struct SweepPointResult {
    SweepPoint point;
    LineSimConfig config;   // effective configuration
    LineSimResult result;
};

struct SweepResult {
    RunStatus status = RunStatus::COMPLETED;
    std::vector<SweepPointResult> points;   // finished (or the cancelled one)
};

class ReceiverLineSimulator {
public:
    using ProgressCallback = std::function<void(int completed, int total)>;

    /**
     * @param region  Water body for RANDOM_WALK; may be null for CROSSING
     * @throws ValidationError on invalid config, missing region or range fn
     */
    ReceiverLineSimulator(const LineSimConfig& config,
                          std::shared_ptr<const BoundaryOracle> region,
                          DetectionRangeFunction range_fn);

    /**
     * Run all trials. Stops taking new trials once cancel is set and
     * returns the finished ones with status CANCELLED.
     */
    LineSimResult run(ProgressCallback on_progress = nullptr,
                      const CancelToken* cancel = nullptr) const;

    /** Run one trial against the configured layout. */
    TrialOutcome run_trial(int trial_index) const;

    /**
     * Run the batch once per sweep point. The region and range function
     * are shared; progress counts trials across the whole sweep.
     */
    SweepResult run_sweep(const std::vector<SweepPoint>& points,
                          ProgressCallback on_progress = nullptr,
                          const CancelToken* cancel = nullptr) const;

    const LineSimConfig& config() const { return config_; }

private:
    LineSimConfig config_;
    std::shared_ptr<const BoundaryOracle> region_;
    DetectionRangeFunction range_fn_;

    TrialOutcome run_trial(int trial_index, const std::vector<Receiver>& receivers) const;

    Path crossing_path(SimRNG& rng) const;

    static LineSimSummary summarize(const std::vector<TrialOutcome>& trials,
                                    size_t num_receivers);
};

/** Apply a sweep point's overrides to a base configuration. */
LineSimConfig apply_sweep_point(const LineSimConfig& base, const SweepPoint& point);

} // namespace rxnet::telemetry

#endif // RXNET_TELEMETRY_RECEIVER_LINE_SIM_HPP
