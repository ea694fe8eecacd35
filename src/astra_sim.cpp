/**
 * astra_sim: headless planetary-defense mission host.
 *
 * Drives the mission engine the way a render loop would, without the
 * rendering. One run produces a report with the event timeline, the
 * outcome and (on failure) the damage assessment; --runs N produces a
 * seeded batch with an empirical success rate.
 *
 * Usage:
 *   astra_sim [--asteroid ID] [--strategy ID|CODE] [--scenario <path>]
 *             [--seed S] [--runs N] [--dt D] [--realtime] [--time-scale F]
 *             [--output <path>] [--verbose] [--progress]
 *   astra_sim --compare [--asteroid ID | --scenario <path>]
 *   astra_sim --list
 */

#include "data/asteroid_catalog.hpp"
#include "io/json_writer.hpp"
#include "mission/defense_comparison.hpp"
#include "mission/mission_results.hpp"
#include "mission/mission_runner.hpp"
#include "mission/scenario_parser.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <string>

using namespace astra;
using namespace astra::mission;

static void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n"
              << "\n"
              << "Modes:\n"
              << "  (default)            Single mission run (or batch with --runs N)\n"
              << "  --compare            Strategy comparison for the asteroid\n"
              << "  --list               List catalog asteroids and strategies\n"
              << "\n"
              << "Options:\n"
              << "  --asteroid ID        Catalog asteroid (default: apophis)\n"
              << "  --strategy ID        Strategy id or code (default: kinetic)\n"
              << "  --scenario <path>    Scenario JSON file\n"
              << "  --runs N             Number of runs (default: 1)\n"
              << "  --seed S             Base RNG seed (default: fresh per invocation)\n"
              << "  --dt D               Model-mode frame step in seconds (default: 1/60)\n"
              << "  --realtime           Wall-clock frame timing (single run only)\n"
              << "  --time-scale F       Multiply every frame step (default: 1)\n"
              << "  --output <path>      Output JSON file (default: stdout)\n"
              << "  --verbose            Phase, cue and run log to stderr\n"
              << "  --progress           JSON-Lines progress to stderr\n"
              << "  --help               Show this message\n";
}

static void write_catalog(std::ostream& out) {
    JsonWriter w(out);
    w.begin_object();

    w.key("asteroids").begin_array();
    for (const auto& a : AsteroidCatalog::asteroids()) {
        w.begin_object();
        w.kv("id", a.id);
        w.kv("name", a.name);
        w.kv("diameter", a.diameter);
        w.kv("velocity", a.velocity);
        w.kv("torinoScale", a.torino_scale);
        w.kv("sizeClass", size_class_to_string(classify_size(a.diameter)));
        w.end_object();
    }
    w.end_array();

    w.key("strategies").begin_array();
    for (const auto& s : AsteroidCatalog::strategies()) {
        w.begin_object();
        w.kv("id", s.id);
        w.kv("code", s.code);
        w.kv("name", s.name);
        w.kv("successRate", s.success_rate);
        w.kv("techReadiness", s.tech_readiness);
        w.end_object();
    }
    w.end_array();

    w.key("presets").begin_array();
    for (const auto& p : AsteroidCatalog::presets()) {
        w.value(p.name);
    }
    w.end_array();

    w.end_object();
    out << '\n';
}

static void write_comparison(const Scenario& scenario, std::ostream& out) {
    ComparisonReport report = DefenseComparison::compare_all(scenario.asteroid);

    JsonWriter w(out);
    w.begin_object();
    w.kv("asteroid", report.asteroid_id);
    w.kv("sizeClass", size_class_to_string(report.size_class));
    w.key("unmitigated");
    write_damage_json(w, report.unmitigated);
    w.kv("livesProtectedOnSuccess", DefenseComparison::lives_protected_on_success(scenario.asteroid));

    w.key("strategies").begin_array();
    for (const auto& c : report.strategies) {
        w.begin_object();
        w.kv("id", c.strategy_id);
        w.kv("code", c.strategy_code);
        w.kv("effectiveness", c.effectiveness);
        w.kv("successProbability", c.success_probability);
        w.kv("residualMin", c.residual_casualties.min);
        w.kv("residualMax", c.residual_casualties.max);
        w.kv("livesProtectedMin", c.lives_protected_min);
        w.kv("livesProtectedMax", c.lives_protected_max);
        w.kv("verdict", c.verdict);
        w.end_object();
    }
    w.end_array();

    if (const StrategyComparison* best = report.best()) {
        w.kv("recommended", best->strategy_id);
    } else {
        w.key("recommended").null_value();
    }
    w.end_object();
    out << '\n';
}

int main(int argc, char* argv[]) {
    RunnerConfig config;
    bool compare_mode = false;
    bool list_mode = false;
    bool asteroid_set = false;
    bool strategy_set = false;
    double dt_override = 0.0;

    // Parse CLI arguments
    try {
        for (int i = 1; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--asteroid" && i + 1 < argc) {
                config.asteroid_id = argv[++i];
                asteroid_set = true;
            } else if (arg == "--strategy" && i + 1 < argc) {
                config.strategy_id = argv[++i];
                strategy_set = true;
            } else if (arg == "--scenario" && i + 1 < argc) {
                config.scenario_path = argv[++i];
            } else if (arg == "--runs" && i + 1 < argc) {
                config.num_runs = std::stoi(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                config.base_seed = static_cast<int32_t>(std::stol(argv[++i]));
                config.fixed_seed = true;
            } else if (arg == "--dt" && i + 1 < argc) {
                dt_override = std::stod(argv[++i]);
            } else if (arg == "--realtime") {
                config.mode = SimulationMode::REALTIME_MODE;
            } else if (arg == "--time-scale" && i + 1 < argc) {
                config.time_scale = std::stod(argv[++i]);
            } else if (arg == "--output" && i + 1 < argc) {
                config.output_path = argv[++i];
            } else if (arg == "--verbose" || arg == "-v") {
                config.verbose = true;
            } else if (arg == "--progress") {
                config.progress = true;
            } else if (arg == "--compare") {
                compare_mode = true;
            } else if (arg == "--list") {
                list_mode = true;
            } else {
                std::cerr << "Unknown argument: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: bad numeric argument (" << e.what() << ")\n";
        return 1;
    }

    if (config.num_runs < 1) {
        std::cerr << "Error: --runs must be at least 1\n";
        return 1;
    }
    if (config.mode == SimulationMode::REALTIME_MODE && config.num_runs > 1) {
        std::cerr << "Error: --realtime requires a single run\n";
        return 1;
    }
    if (!(config.time_scale > 0.0)) {
        std::cerr << "Error: --time-scale must be positive\n";
        return 1;
    }

    // Output stream
    std::ofstream file;
    if (!config.output_path.empty()) {
        file.open(config.output_path);
        if (!file.is_open()) {
            std::cerr << "Error: cannot open output file: " << config.output_path << "\n";
            return 1;
        }
    }
    std::ostream& out = config.output_path.empty() ? std::cout : file;

    if (list_mode) {
        write_catalog(out);
        return 0;
    }

    // Build scenario: file first, then explicit CLI overrides
    Scenario scenario;
    try {
        if (!config.scenario_path.empty()) {
            scenario = ScenarioParser::parse_file(config.scenario_path);
            if (asteroid_set) scenario.asteroid = ScenarioParser::lookup_asteroid(config.asteroid_id);
            if (strategy_set) scenario.strategy = ScenarioParser::lookup_strategy(config.strategy_id);
        } else {
            scenario = ScenarioParser::from_catalog(config.asteroid_id, config.strategy_id);
        }
        if (dt_override != 0.0) {
            scenario.config.dt = dt_override;
        }
        scenario.config.verbose = scenario.config.verbose || config.verbose;
        ScenarioParser::validate(scenario.config);
    } catch (const std::exception& e) {
        std::cerr << "Error loading scenario: " << e.what() << "\n";
        return 1;
    }

    if (compare_mode) {
        write_comparison(scenario, out);
        return 0;
    }

    MissionRunner runner(config);

    if (config.verbose) {
        std::cerr << "=== ASTRA Mission ===\n"
                  << "Scenario: " << scenario.name << "\n"
                  << "Asteroid: " << scenario.asteroid.name
                  << " (" << scenario.asteroid.diameter << " m, torino "
                  << scenario.asteroid.torino_scale << ")\n"
                  << "Strategy: " << scenario.strategy.name
                  << " (" << scenario.strategy.code << ")\n"
                  << "Runs: " << config.num_runs << "\n"
                  << "Base seed: " << runner.config().base_seed << "\n"
                  << "Mode: " << mode_to_string(config.mode)
                  << " x" << config.time_scale << "\n"
                  << "Output: " << (config.output_path.empty() ? "stdout" : config.output_path)
                  << "\n\n";
    }

    auto t_start = std::chrono::high_resolution_clock::now();

    MissionRunner::ProgressCallback progress_cb = nullptr;
    if (config.progress) {
        progress_cb = [](int completed, int total) {
            JsonWriter w(std::cerr, 0);
            w.begin_object();
            w.kv("type", "run_complete");
            w.kv("run", completed);
            w.kv("total", total);
            w.end_object();
            std::cerr << '\n' << std::flush;
        };
    }

    auto results = runner.run(scenario, progress_cb);

    auto t_end = std::chrono::high_resolution_clock::now();
    double elapsed = std::chrono::duration<double>(t_end - t_start).count();

    if (config.num_runs == 1) {
        write_run_json(results.front(), scenario, out);
    } else {
        write_batch_json(results, scenario, runner.config(), out);
    }

    BatchSummary summary = MissionRunner::summarize(results, scenario);

    if (config.verbose) {
        std::cerr << "\n=== Results ===\n"
                  << "Completed: " << summary.completed << "/" << summary.runs
                  << " runs in " << elapsed << "s\n"
                  << "Errors: " << summary.errors << "\n"
                  << "Successes: " << summary.successes
                  << " (destroyed " << summary.destroyed
                  << ", deflected " << summary.deflected << ")\n"
                  << "Success rate: " << summary.success_rate
                  << " (expected " << summary.expected_rate << ")\n";
        if (!config.output_path.empty()) {
            std::cerr << "Results written to: " << config.output_path << "\n";
        }
    }

    if (config.progress) {
        JsonWriter w(std::cerr, 0);
        w.begin_object();
        w.kv("type", "done");
        w.kv("runs", results.size());
        w.kv("elapsed", elapsed);
        w.end_object();
        std::cerr << '\n' << std::flush;
    }

    return summary.errors == 0 ? 0 : 2;
}
