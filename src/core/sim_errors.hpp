/**
 * Simulation error kinds.
 *
 *   ValidationError        bad parameters, malformed input, range function
 *                          returning a value outside [0, 1]
 *   BoundaryViolationError start point outside the region, or the per-step
 *                          rejection budget exhausted
 *   EmptyInputError        zero transmissions or zero receivers
 *
 * All derive from SimError so callers can catch the family at once.
 */

#ifndef RXNET_CORE_SIM_ERRORS_HPP
#define RXNET_CORE_SIM_ERRORS_HPP

#include "core/geometry.hpp"
#include <stdexcept>
#include <string>

namespace rxnet {

class SimError : public std::runtime_error {
public:
    explicit SimError(const std::string& msg) : std::runtime_error(msg) {}
};

class ValidationError : public SimError {
public:
    explicit ValidationError(const std::string& msg)
        : SimError("validation error: " + msg) {}
};

class EmptyInputError : public SimError {
public:
    explicit EmptyInputError(const std::string& msg)
        : SimError("empty input: " + msg) {}
};

class BoundaryViolationError : public SimError {
public:
    BoundaryViolationError(const std::string& msg, int step_index, const Point& attempted)
        : SimError("boundary violation at step " + std::to_string(step_index) +
                   " (" + std::to_string(attempted.x) + ", " +
                   std::to_string(attempted.y) + "): " + msg),
          step_index_(step_index), attempted_(attempted) {}

    int step_index() const { return step_index_; }
    const Point& attempted() const { return attempted_; }

private:
    int step_index_;
    Point attempted_;
};

} // namespace rxnet

#endif // RXNET_CORE_SIM_ERRORS_HPP
