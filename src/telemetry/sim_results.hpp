/**
 * Result serialization.
 *
 * Detection records use the flat field names of the detection output
 * schema (transmission_id, receiver_id, receiver_x, ...), one record per
 * line, sorted by elapsed_time as produced by the simulator.
 */

#ifndef RXNET_TELEMETRY_SIM_RESULTS_HPP
#define RXNET_TELEMETRY_SIM_RESULTS_HPP

#include "telemetry/collision_estimator.hpp"
#include "telemetry/detection_simulator.hpp"
#include "telemetry/receiver_line_sim.hpp"
#include <ostream>
#include <vector>

namespace rxnet::telemetry {

void write_detections_json(const std::vector<DetectionRecord>& detections,
                           int num_transmissions, int num_receivers, int seed,
                           std::ostream& out);

void write_line_result_json(const LineSimResult& result, const LineSimConfig& config,
                            std::ostream& out);

void write_sweep_json(const SweepResult& sweep, std::ostream& out);

void write_collision_json(const std::vector<CollisionRow>& rows, double burst_duration,
                          double delay_min, double delay_max, std::ostream& out);

} // namespace rxnet::telemetry

#endif // RXNET_TELEMETRY_SIM_RESULTS_HPP
