/**
 * traffic_engine — Runs the traffic tracking engine against synthetic traffic.
 *
 * Prints confirmed state changes, periodic snapshots and removals as
 * JSON Lines. Headless mode steps a simulated clock at the configured
 * tick rate as fast as possible; --realtime runs the scheduler thread
 * against the wall clock instead.
 *
 * Usage:
 *   traffic_engine [--config <path>] [--duration T] [--departures N]
 *                  [--arrivals N] [--seed S] [--teleport-prob P]
 *                  [--context TAG] [--no-snapshots] [--realtime]
 *                  [--output <path>] [--verbose]
 */

#include "io/json_reader.hpp"
#include "tracking/synthetic_traffic.hpp"
#include "tracking/traffic_config.hpp"
#include "tracking/traffic_output.hpp"
#include "tracking/traffic_registry.hpp"
#include "tracking/traffic_scheduler.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>
#include <thread>

namespace {

struct EngineOptions {
    std::string config_path;
    std::string output_path;        // empty = stdout
    std::string context_tag;        // empty = no final context query
    double duration = 300.0;
    bool realtime = false;
    bool snapshots = true;
    bool verbose = false;
    skytraffic::tracking::SyntheticConfig synthetic;
};

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "\n"
              << "Options:\n"
              << "  --config <path>      Config JSON with a \"traffic\" section\n"
              << "  --duration T         Seconds to run (default: 300)\n"
              << "  --departures N       Synthetic departures (default: 4)\n"
              << "  --arrivals N         Synthetic arrivals (default: 4)\n"
              << "  --seed S             Synthetic traffic seed (default: 42)\n"
              << "  --teleport-prob P    Per-aircraft position jump probability per tick\n"
              << "  --context TAG        Print a ground/tower/approach/center query at the end\n"
              << "  --no-snapshots       Suppress periodic snapshot lines\n"
              << "  --realtime           Run the scheduler thread on the wall clock\n"
              << "  --output <path>      Output file (default: stdout)\n"
              << "  --verbose            Engine diagnostics to stderr\n"
              << "  --help               Show this message\n";
}

void run_headless(skytraffic::tracking::TrafficScheduler& scheduler,
                  double duration, double tick) {
    const long steps = static_cast<long>(duration / tick);
    for (long step = 0; step <= steps; step++) {
        scheduler.run_tick(step * tick);
    }
}

void run_realtime(skytraffic::tracking::TrafficScheduler& scheduler, double duration) {
    if (!scheduler.start()) return;
    std::this_thread::sleep_for(std::chrono::duration<double>(duration));
    scheduler.stop();
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace skytraffic::tracking;

    EngineOptions opts;

    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--config" && i + 1 < argc) {
                opts.config_path = argv[++i];
            } else if (arg == "--duration" && i + 1 < argc) {
                opts.duration = std::stod(argv[++i]);
            } else if (arg == "--departures" && i + 1 < argc) {
                opts.synthetic.departures = std::stoi(argv[++i]);
            } else if (arg == "--arrivals" && i + 1 < argc) {
                opts.synthetic.arrivals = std::stoi(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                opts.synthetic.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--teleport-prob" && i + 1 < argc) {
                opts.synthetic.teleport_probability = std::stod(argv[++i]);
            } else if (arg == "--context" && i + 1 < argc) {
                opts.context_tag = argv[++i];
            } else if (arg == "--no-snapshots") {
                opts.snapshots = false;
            } else if (arg == "--realtime") {
                opts.realtime = true;
            } else if (arg == "--output" && i + 1 < argc) {
                opts.output_path = argv[++i];
            } else if (arg == "--verbose" || arg == "-v") {
                opts.verbose = true;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument (" << e.what() << ")\n";
        return 1;
    }

    TrafficConfig config;
    if (!opts.config_path.empty()) {
        try {
            config = TrafficConfigParser::parse_file(opts.config_path);
        } catch (const std::exception& e) {
            std::cerr << "Error loading config: " << e.what() << "\n";
            return 1;
        }
    }
    if (opts.verbose) config.verbose = true;

    std::ofstream file_out;
    if (!opts.output_path.empty()) {
        file_out.open(opts.output_path);
        if (!file_out.is_open()) {
            std::cerr << "Error: cannot open output file: " << opts.output_path << "\n";
            return 1;
        }
    }
    std::ostream& out = opts.output_path.empty() ? std::cout : file_out;

    if (config.verbose) {
        std::cerr << "=== Traffic Engine ===\n"
                  << "Mode: " << (opts.realtime ? "realtime" : "headless") << "\n"
                  << "Duration: " << opts.duration << "s\n"
                  << "Tick: " << config.scan_interval << "s\n"
                  << "Hysteresis: " << config.hysteresis_seconds << "s\n"
                  << "Departures/arrivals: " << opts.synthetic.departures
                  << "/" << opts.synthetic.arrivals << "\n"
                  << "Seed: " << opts.synthetic.seed << "\n\n";
    }

    try {
        TrafficRegistry registry(config);
        SyntheticTrafficSource source(opts.synthetic);
        TrafficScheduler scheduler(registry, source);

        size_t change_count = 0;
        registry.on_state_change([&](const StateChange& change) {
            change_count++;
            write_state_change_json(change, out);
        });
        registry.on_removed([&](const AircraftRemoved& removed) {
            write_removed_json(removed, out);
        });
        if (opts.snapshots) {
            scheduler.on_snapshot([&](double now, const TrafficSnapshot& snap) {
                write_snapshot_json(now, snap, out);
            });
        }

        if (opts.realtime) {
            run_realtime(scheduler, opts.duration);
        } else {
            run_headless(scheduler, opts.duration, config.scan_interval);
        }

        if (!opts.context_tag.empty()) {
            write_context_json(opts.context_tag, registry.get_in_context(opts.context_tag), out);
        }

        if (config.verbose) {
            std::cerr << "\n=== Results ===\n"
                      << "Ticks: " << scheduler.ticks() << "\n"
                      << "State changes: " << change_count << "\n"
                      << "Still tracked: " << registry.size() << "\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
