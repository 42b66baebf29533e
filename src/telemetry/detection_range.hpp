/**
 * Detection range curves: distance → probability of detecting one burst.
 *
 * Any callable honouring the [0, 1] range is accepted by the detection
 * simulator; these factories cover the curves used in practice.
 */

#ifndef RXNET_TELEMETRY_DETECTION_RANGE_HPP
#define RXNET_TELEMETRY_DETECTION_RANGE_HPP

#include <functional>
#include <utility>
#include <vector>

namespace rxnet::telemetry {

using DetectionRangeFunction = std::function<double(double distance)>;

/** Same probability at every distance. */
DetectionRangeFunction constant_range(double p);

/** p_inside up to and including cutoff, p_outside beyond it. */
DetectionRangeFunction step_range(double cutoff, double p_inside = 1.0,
                                  double p_outside = 0.0);

/**
 * Logistic curve p(d) = 1 / (1 + exp(-(b0 + b1 * d))).
 * Typical fitted range test: b0 = 0.5, b1 = -1/120 per metre.
 */
DetectionRangeFunction logistic_range(double b0, double b1);

/**
 * Linear interpolation through (distance, probability) pairs sorted by
 * distance, e.g. the binned results of a range test. Flat beyond the
 * first and last knot.
 * @throws ValidationError on empty, unsorted or out-of-range tables
 */
DetectionRangeFunction table_range(std::vector<std::pair<double, double>> knots);

} // namespace rxnet::telemetry

#endif // RXNET_TELEMETRY_DETECTION_RANGE_HPP
