/**
 * DetectionSimulator - stochastic detection of transmissions by receivers.
 *
 * For every (transmission, receiver) pair the receiver-to-transmitter
 * distance is mapped through the detection range function and one
 * Bernoulli trial decides detection. Receivers are the outer loop and
 * are fanned out across worker threads; each receiver draws from its own
 * generator seeded from the master seed and its index, so the merged,
 * time-sorted output is identical for any thread count.
 */

#ifndef RXNET_TELEMETRY_DETECTION_SIMULATOR_HPP
#define RXNET_TELEMETRY_DETECTION_SIMULATOR_HPP

#include "telemetry/detection_range.hpp"
#include "telemetry/transmission_scheduler.hpp"
#include "core/geometry.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace rxnet::telemetry {

struct Receiver {
    int receiver_id = 0;
    Point position;
};

struct DetectionRecord {
    int transmission_id = 0;
    int receiver_id = 0;
    Point receiver_position;
    Point transmission_position;
    double elapsed_time = 0.0;
};

/** External transmission input: x, y, elapsed time. */
struct TransmissionRecord {
    double x = 0.0;
    double y = 0.0;
    double et = 0.0;
};

struct DetectionConfig {
    std::optional<int32_t> seed;   // random_device when unset
    int num_threads = 1;           // <= 0: hardware concurrency
};

class DetectionSimulator {
public:
    using ProgressCallback = std::function<void(int completed, int total)>;

    explicit DetectionSimulator(const DetectionConfig& config = DetectionConfig());

    /**
     * Simulate detection of every transmission on every receiver.
     * Output is stable-sorted by elapsed_time.
     *
     * @throws EmptyInputError if transmissions or receivers is empty
     * @throws ValidationError on non-finite inputs, duplicate receiver ids,
     *         an empty range function or a probability outside [0, 1]
     */
    std::vector<DetectionRecord> simulate(const std::vector<TransmissionEvent>& transmissions,
                                          const std::vector<Receiver>& receivers,
                                          const DetectionRangeFunction& range_fn,
                                          ProgressCallback on_progress = nullptr) const;

    /** Master seed in effect (drawn from random_device when none was given). */
    int32_t seed() const { return seed_; }

private:
    DetectionConfig config_;
    int32_t seed_;
};

/** Convenience wrapper: single-threaded, explicit seed. */
std::vector<DetectionRecord> simulate_detections(const std::vector<TransmissionEvent>& transmissions,
                                                 const std::vector<Receiver>& receivers,
                                                 const DetectionRangeFunction& range_fn,
                                                 std::optional<int32_t> seed = std::nullopt);

/** Wrap externally supplied (x, y, et) records; ids are 1..n in input order. */
std::vector<TransmissionEvent> transmissions_from_records(const std::vector<TransmissionRecord>& records);

/** Receivers at the given positions with ids 1..n. */
std::vector<Receiver> receivers_from_points(const std::vector<Point>& positions);

} // namespace rxnet::telemetry

#endif // RXNET_TELEMETRY_DETECTION_SIMULATOR_HPP
