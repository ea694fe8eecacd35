/**
 * MissionRunner: seeded batch of headless mission runs.
 *
 * Each run gets a fresh SimRNG seeded with base_seed + run_index, a
 * fresh orchestrator, and a SimulationEngine driving it until COMPLETE.
 * Errors inside a run are captured in RunResult::error and do not stop
 * the batch.
 */

#ifndef ASTRA_MISSION_MISSION_RUNNER_HPP
#define ASTRA_MISSION_MISSION_RUNNER_HPP

#include "core/simulation_mode.hpp"
#include "mission/mission_events.hpp"
#include "mission/scenario_parser.hpp"
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace astra::mission {

struct RunnerConfig {
    int num_runs = 1;
    int32_t base_seed = 42;
    bool fixed_seed = false;            // false: fresh entropy seed per invocation
    SimulationMode mode = SimulationMode::MODEL_MODE;
    double time_scale = 1.0;
    std::string asteroid_id = "apophis";
    std::string strategy_id = "kinetic";
    std::string scenario_path;
    std::string output_path;            // empty = stdout
    bool verbose = false;
    bool progress = false;
};

struct RunResult {
    int run_index = 0;
    int32_t seed = 0;
    Outcome outcome = Outcome::PENDING;
    bool success = false;
    bool destroyed = false;
    bool deflected = false;
    double deflection = 0.0;            // percent
    double chance = 0.0;                // resolved percent
    double draw = 0.0;
    double display_probability = 0.0;
    double intercept_time = 0.0;
    double sim_time_final = 0.0;
    long steps = 0;
    std::vector<MissionEvent> events;
    std::optional<DamageAssessment> damage;
    int64_t lives_protected = 0;
    std::string error;                  // empty = completed
};

struct BatchSummary {
    int runs = 0;
    int completed = 0;
    int errors = 0;
    int successes = 0;
    int destroyed = 0;
    int deflected = 0;
    double success_rate = 0.0;          // successes / completed
    double expected_rate = 0.0;         // resolved chance / 100
    double mean_deflection = 0.0;
};

class MissionRunner {
public:
    using ProgressCallback = std::function<void(int completed, int total)>;

    explicit MissionRunner(const RunnerConfig& config);

    std::vector<RunResult> run(const Scenario& scenario,
                               ProgressCallback on_progress = nullptr);

    RunResult run_single(const Scenario& scenario, int run_index, int32_t seed);

    static BatchSummary summarize(const std::vector<RunResult>& results,
                                  const Scenario& scenario);

    const RunnerConfig& config() const { return config_; }

private:
    RunnerConfig config_;
};

} // namespace astra::mission

#endif // ASTRA_MISSION_MISSION_RUNNER_HPP
