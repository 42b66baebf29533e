/**
 * TransmissionScheduler - emit coded transmissions along a path.
 *
 * The path is traversed at constant velocity. The first signal goes out
 * at t = 0 at the origin; each following signal waits a delay drawn
 * uniformly from [delay_min, delay_max]. Positions are interpolated
 * along the polyline. Emission stops once t passes the traversal time.
 */

#ifndef RXNET_TELEMETRY_TRANSMISSION_SCHEDULER_HPP
#define RXNET_TELEMETRY_TRANSMISSION_SCHEDULER_HPP

#include "core/geometry.hpp"
#include "core/sim_rng.hpp"
#include <vector>

namespace rxnet::telemetry {

struct TransmissionEvent {
    int transmission_id = 0;   // sequential from 1
    Point position;
    double elapsed_time = 0.0;
};

struct TransmitterConfig {
    double velocity = 1.0;         // distance units per second
    double delay_min = 60.0;       // seconds
    double delay_max = 180.0;
    double burst_duration = 5.0;   // carried for collision analysis only

    /** @throws ValidationError */
    void validate() const;
};

class TransmissionScheduler {
public:
    explicit TransmissionScheduler(const TransmitterConfig& config);

    /**
     * @throws ValidationError on an empty path or a non-finite vertex
     */
    std::vector<TransmissionEvent> schedule(const Path& path, SimRNG& rng) const;

    const TransmitterConfig& config() const { return config_; }

private:
    TransmitterConfig config_;
};

/**
 * Position at a given distance along the path, clipped to the end.
 * cumulative[i] is the distance from the origin to path[i].
 */
Point interpolate_along(const Path& path, const std::vector<double>& cumulative,
                        double along);

/** Convenience wrapper over TransmissionScheduler. */
std::vector<TransmissionEvent> schedule_transmissions(const Path& path, double velocity,
                                                      double delay_min, double delay_max,
                                                      double burst_duration, SimRNG& rng);

} // namespace rxnet::telemetry

#endif // RXNET_TELEMETRY_TRANSMISSION_SCHEDULER_HPP
