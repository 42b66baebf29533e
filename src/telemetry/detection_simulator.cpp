#include "telemetry/detection_simulator.hpp"
#include "core/sim_errors.hpp"
#include "core/sim_rng.hpp"
#include "core/work_pool.hpp"
#include <algorithm>
#include <cmath>
#include <mutex>
#include <random>
#include <unordered_set>

namespace rxnet::telemetry {

static int32_t fresh_seed() {
    std::random_device rd;
    return static_cast<int32_t>(rd());
}

DetectionSimulator::DetectionSimulator(const DetectionConfig& config)
    : config_(config),
      seed_(config.seed ? *config.seed : fresh_seed()) {}

static void validate_inputs(const std::vector<TransmissionEvent>& transmissions,
                            const std::vector<Receiver>& receivers,
                            const DetectionRangeFunction& range_fn) {
    if (transmissions.empty()) {
        throw EmptyInputError("no transmissions to simulate");
    }
    if (receivers.empty()) {
        throw EmptyInputError("no receivers to simulate");
    }
    if (!range_fn) {
        throw ValidationError("detection range function is not set");
    }

    for (const auto& t : transmissions) {
        if (!is_finite(t.position) || !std::isfinite(t.elapsed_time)) {
            throw ValidationError("transmission " + std::to_string(t.transmission_id) +
                                  " has a non-finite position or time");
        }
    }

    std::unordered_set<int> ids;
    for (const auto& r : receivers) {
        if (!is_finite(r.position)) {
            throw ValidationError("receiver " + std::to_string(r.receiver_id) +
                                  " has a non-finite position");
        }
        if (!ids.insert(r.receiver_id).second) {
            throw ValidationError("duplicate receiver id " + std::to_string(r.receiver_id));
        }
    }
}

std::vector<DetectionRecord>
DetectionSimulator::simulate(const std::vector<TransmissionEvent>& transmissions,
                             const std::vector<Receiver>& receivers,
                             const DetectionRangeFunction& range_fn,
                             ProgressCallback on_progress) const {
    validate_inputs(transmissions, receivers, range_fn);

    // One partial result per receiver; merged in receiver order afterwards.
    std::vector<std::vector<DetectionRecord>> partials(receivers.size());

    std::mutex progress_mutex;
    int completed = 0;
    const int total = static_cast<int>(receivers.size());

    parallel_for(receivers.size(), config_.num_threads, [&](size_t g) {
        const Receiver& rec = receivers[g];
        SimRNG rng(SimRNG::derive_seed(seed_, static_cast<uint32_t>(g)));
        auto& out = partials[g];

        for (const auto& trns : transmissions) {
            double d = distance(rec.position, trns.position);
            double p = range_fn(d);
            if (!(p >= 0.0 && p <= 1.0)) {
                throw ValidationError("detection range function returned " +
                                      std::to_string(p) + " at distance " +
                                      std::to_string(d));
            }
            if (!rng.bernoulli(p)) continue;

            DetectionRecord det;
            det.transmission_id = trns.transmission_id;
            det.receiver_id = rec.receiver_id;
            det.receiver_position = rec.position;
            det.transmission_position = trns.position;
            det.elapsed_time = trns.elapsed_time;
            out.push_back(det);
        }

        if (on_progress) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            on_progress(++completed, total);
        }
    });

    size_t n = 0;
    for (const auto& p : partials) n += p.size();

    std::vector<DetectionRecord> detections;
    detections.reserve(n);
    for (auto& p : partials) {
        detections.insert(detections.end(), p.begin(), p.end());
    }

    std::stable_sort(detections.begin(), detections.end(),
                     [](const DetectionRecord& a, const DetectionRecord& b) {
                         return a.elapsed_time < b.elapsed_time;
                     });
    return detections;
}

std::vector<DetectionRecord> simulate_detections(const std::vector<TransmissionEvent>& transmissions,
                                                 const std::vector<Receiver>& receivers,
                                                 const DetectionRangeFunction& range_fn,
                                                 std::optional<int32_t> seed) {
    DetectionConfig config;
    config.seed = seed;
    return DetectionSimulator(config).simulate(transmissions, receivers, range_fn);
}

std::vector<TransmissionEvent> transmissions_from_records(const std::vector<TransmissionRecord>& records) {
    std::vector<TransmissionEvent> events;
    events.reserve(records.size());
    int id = 1;
    for (const auto& r : records) {
        TransmissionEvent evt;
        evt.transmission_id = id++;
        evt.position = Point(r.x, r.y);
        evt.elapsed_time = r.et;
        events.push_back(evt);
    }
    return events;
}

std::vector<Receiver> receivers_from_points(const std::vector<Point>& positions) {
    std::vector<Receiver> receivers;
    receivers.reserve(positions.size());
    int id = 1;
    for (const auto& p : positions) {
        receivers.push_back(Receiver{id++, p});
    }
    return receivers;
}

} // namespace rxnet::telemetry
