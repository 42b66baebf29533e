/**
 * rxnet - headless receiver-network simulation driver.
 *
 * Reads a scenario JSON, runs one of the simulation modes and writes a
 * results JSON to stdout or --output.
 *
 * Usage:
 *   rxnet detect    --scenario <path> [--seed S] [--threads N] [--output <path>]
 *   rxnet line      --scenario <path> [--trials N] [--seed S] [--threads N] ...
 *   rxnet sweep     --scenario <path> [--trials N] ...
 *   rxnet collision --scenario <path> [--seed S] ...
 *
 * Ctrl-C during line/sweep stops after the running trials and writes the
 * partial results with status "cancelled".
 */

#include "core/sim_errors.hpp"
#include "core/sim_rng.hpp"
#include "core/work_pool.hpp"
#include "telemetry/collision_estimator.hpp"
#include "telemetry/detection_simulator.hpp"
#include "telemetry/path_generator.hpp"
#include "telemetry/receiver_line_sim.hpp"
#include "telemetry/scenario_parser.hpp"
#include "telemetry/sim_results.hpp"
#include "telemetry/transmission_scheduler.hpp"
#include <chrono>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>

using namespace rxnet;
using namespace rxnet::telemetry;

static CancelToken g_cancel;

static void on_sigint(int) {
    g_cancel.cancel();
}

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " <mode> --scenario <path> [options]\n"
              << "\n"
              << "Modes:\n"
              << "  detect       Detections for one path (or given transmissions)\n"
              << "  line         Receiver line / grid detection efficiency trials\n"
              << "  sweep        Line trials for each entry of the scenario 'sweep'\n"
              << "  collision    Pulse-collision probability table\n"
              << "\n"
              << "Options:\n"
              << "  --scenario <path>    Scenario JSON file (required)\n"
              << "  --seed S             Master RNG seed (overrides scenario)\n"
              << "  --threads N          Worker threads, 0 = all cores (overrides scenario)\n"
              << "  --trials N           Trials per line run (overrides scenario)\n"
              << "  --output <path>      Output JSON file (default: stdout)\n"
              << "  --verbose            Progress to stderr\n"
              << "  --progress           JSON-Lines progress to stderr (for a supervisor)\n"
              << "  --help               Show this message\n";
}

/** Parse argv into cfg; returns false after printing usage on bad input. */
static bool parse_args(int argc, char* argv[], RunConfig& cfg) {
    int i = 1;
    if (i < argc && argv[i][0] != '-') {
        cfg.mode = argv[i++];
    }

    for (; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            std::exit(0);
        } else if (arg == "--scenario" && i + 1 < argc) {
            cfg.scenario_path = argv[++i];
        } else if (arg == "--seed" && i + 1 < argc) {
            long long seed = std::stoll(argv[++i]);
            if (seed < INT32_MIN || seed > static_cast<long long>(UINT32_MAX)) {
                std::cerr << "Error: --seed must fit in 32 bits\n";
                return false;
            }
            cfg.seed = static_cast<int32_t>(static_cast<uint32_t>(seed));
        } else if (arg == "--threads" && i + 1 < argc) {
            cfg.threads = std::stoi(argv[++i]);
        } else if (arg == "--trials" && i + 1 < argc) {
            cfg.trials = std::stoi(argv[++i]);
        } else if (arg == "--output" && i + 1 < argc) {
            cfg.output_path = argv[++i];
        } else if (arg == "--verbose" || arg == "-v") {
            cfg.verbose = true;
        } else if (arg == "--progress") {
            cfg.progress = true;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            print_usage(argv[0]);
            return false;
        }
    }

    if (cfg.mode != "detect" && cfg.mode != "line" &&
        cfg.mode != "sweep" && cfg.mode != "collision") {
        std::cerr << "Error: unknown mode '" << cfg.mode << "'\n\n";
        print_usage(argv[0]);
        return false;
    }
    if (cfg.scenario_path.empty()) {
        std::cerr << "Error: --scenario is required\n\n";
        print_usage(argv[0]);
        return false;
    }
    return true;
}

static void apply_overrides(const RunConfig& cfg, Scenario& sc) {
    if (cfg.seed) {
        sc.seed = *cfg.seed;
        sc.line.base_seed = *cfg.seed;
        sc.collision_sampling.seed = *cfg.seed;
    }
    if (cfg.threads) {
        sc.threads = *cfg.threads;
        sc.line.num_threads = *cfg.threads;
    }
    if (cfg.trials) {
        sc.line.num_trials = *cfg.trials;
    }
    sc.line.verbose = cfg.verbose;
}

static void require_range(const Scenario& sc) {
    if (!sc.range_fn) {
        throw ValidationError("scenario needs a 'detectionRange' section");
    }
}

/** JSON-Lines trial progress for a supervising process. */
static ReceiverLineSimulator::ProgressCallback make_progress(const RunConfig& cfg) {
    if (!cfg.progress) return nullptr;
    return [](int completed, int total) {
        std::cerr << "{\"type\":\"trial_complete\",\"trial\":" << completed
                  << ",\"total\":" << total << "}\n" << std::flush;
    };
}

template <typename WriteFn>
static int emit(const RunConfig& cfg, WriteFn write) {
    if (cfg.output_path.empty()) {
        write(std::cout);
        return 0;
    }
    std::ofstream out(cfg.output_path);
    if (!out.is_open()) {
        std::cerr << "Error: cannot open output file: " << cfg.output_path << "\n";
        return 1;
    }
    write(out);
    if (cfg.verbose) {
        std::cerr << "Results written to: " << cfg.output_path << "\n";
    }
    return 0;
}

static int run_detect(const RunConfig& cfg, const Scenario& sc) {
    require_range(sc);
    std::vector<Receiver> receivers = sc.resolve_receivers();

    std::vector<TransmissionEvent> transmissions = sc.transmissions;
    if (transmissions.empty()) {
        if (!sc.walk) {
            throw ValidationError("detect mode needs 'transmissions' or a 'path' section");
        }
        SimRNG rng(sc.seed);
        OpenWaterBoundary open_water;
        const BoundaryOracle& region = sc.region ? static_cast<const BoundaryOracle&>(*sc.region)
                                                 : open_water;
        Path path = PathGenerator(*sc.walk).generate(region, rng);
        transmissions = TransmissionScheduler(sc.transmitter).schedule(path, rng);

        if (cfg.verbose) {
            std::cerr << "Path: " << path.size() << " points, length "
                      << path_length(path) << "\n"
                      << "Transmissions: " << transmissions.size() << "\n";
        }
    }

    DetectionConfig det_config;
    det_config.seed = SimRNG::derive_seed(sc.seed, 1u);
    det_config.num_threads = sc.threads;
    DetectionSimulator sim(det_config);

    DetectionSimulator::ProgressCallback progress = nullptr;
    if (cfg.progress) {
        progress = [](int completed, int total) {
            std::cerr << "{\"type\":\"receiver_complete\",\"receiver\":" << completed
                      << ",\"total\":" << total << "}\n" << std::flush;
        };
    }

    auto detections = sim.simulate(transmissions, receivers, sc.range_fn, progress);

    if (cfg.verbose) {
        std::cerr << "Receivers: " << receivers.size() << "\n"
                  << "Range: " << sc.range_description << "\n"
                  << "Detections: " << detections.size() << "\n";
    }

    return emit(cfg, [&](std::ostream& out) {
        write_detections_json(detections, static_cast<int>(transmissions.size()),
                              static_cast<int>(receivers.size()), sc.seed, out);
    });
}

static int run_line(const RunConfig& cfg, const Scenario& sc, bool sweep) {
    require_range(sc);
    if (!sc.layout) {
        throw ValidationError("line mode needs 'receiverLine' or 'receiverGrid'");
    }
    if (sweep && sc.sweep.empty()) {
        throw ValidationError("sweep mode needs a non-empty 'sweep' array");
    }

    ReceiverLineSimulator sim(sc.line, sc.region, sc.range_fn);
    std::signal(SIGINT, on_sigint);

    bool cancelled = false;
    int rc = 0;
    if (sweep) {
        SweepResult result = sim.run_sweep(sc.sweep, make_progress(cfg), &g_cancel);
        cancelled = result.status == RunStatus::CANCELLED;
        rc = emit(cfg, [&](std::ostream& out) { write_sweep_json(result, out); });
    } else {
        LineSimResult result = sim.run(make_progress(cfg), &g_cancel);
        cancelled = result.status == RunStatus::CANCELLED;
        rc = emit(cfg, [&](std::ostream& out) {
            write_line_result_json(result, sc.line, out);
        });
    }

    if (cancelled) {
        std::cerr << "Run cancelled; partial results written\n";
        return rc != 0 ? rc : 2;
    }
    return rc;
}

static int run_collision(const RunConfig& cfg, const Scenario& sc) {
    CollisionEstimator estimator(sc.collision_sampling);
    const CollisionParams& p = sc.collision;

    std::vector<CollisionRow> rows;
    if (sc.collision_max_tags > 0) {
        rows = estimator.sweep_tag_counts(sc.collision_max_tags, p.burst_duration,
                                          p.delay_min, p.delay_max);
    } else {
        CollisionRow row;
        row.num_tags = p.num_tags;
        row.analytic = estimator.estimate(p, CollisionEstimator::Method::ANALYTIC);
        row.sampled = estimator.estimate(p, CollisionEstimator::Method::SAMPLED);
        row.detection_analytic = 1.0 - row.analytic;
        row.detection_sampled = 1.0 - row.sampled;
        rows.push_back(row);
    }

    if (cfg.verbose) {
        std::cerr << "Collision table: " << rows.size() << " rows\n";
    }

    return emit(cfg, [&](std::ostream& out) {
        write_collision_json(rows, p.burst_duration, p.delay_min, p.delay_max, out);
    });
}

int main(int argc, char* argv[]) {
    RunConfig cfg;
    try {
        if (!parse_args(argc, argv, cfg)) return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: bad numeric argument (" << e.what() << ")\n";
        return 1;
    }

    auto t_start = std::chrono::steady_clock::now();
    int rc = 0;

    try {
        Scenario sc = ScenarioParser::parse_file(cfg.scenario_path);
        apply_overrides(cfg, sc);

        if (cfg.verbose) {
            std::cerr << "=== rxnet " << cfg.mode << " ===\n"
                      << "Scenario: " << cfg.scenario_path << "\n"
                      << "Seed: " << sc.seed << "\n"
                      << "Threads: " << sc.threads << "\n"
                      << "Output: " << (cfg.output_path.empty() ? "stdout" : cfg.output_path)
                      << "\n\n";
        }

        if (cfg.mode == "detect") {
            rc = run_detect(cfg, sc);
        } else if (cfg.mode == "line") {
            rc = run_line(cfg, sc, false);
        } else if (cfg.mode == "sweep") {
            rc = run_line(cfg, sc, true);
        } else {
            rc = run_collision(cfg, sc);
        }
    } catch (const SimError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: unexpected failure: " << e.what() << "\n";
        return 1;
    }

    double elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - t_start).count();

    if (cfg.progress) {
        std::cerr << "{\"type\":\"done\",\"mode\":\"" << cfg.mode
                  << "\",\"elapsed\":" << elapsed << "}\n" << std::flush;
    }
    if (cfg.verbose) {
        std::cerr << "\nFinished in " << elapsed << "s\n";
    }
    return rc;
}
