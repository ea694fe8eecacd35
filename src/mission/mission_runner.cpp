#include "mission/mission_runner.hpp"
#include "core/sim_rng.hpp"
#include "core/simulation_engine.hpp"
#include "mission/defense_comparison.hpp"
#include "mission/mission_orchestrator.hpp"
#include <iostream>
#include <memory>

namespace astra::mission {

MissionRunner::MissionRunner(const RunnerConfig& config)
    : config_(config) {
    if (!config_.fixed_seed) {
        config_.base_seed = SimRNG::entropy_seed();
    }
}

std::vector<RunResult> MissionRunner::run(const Scenario& scenario,
                                          ProgressCallback on_progress) {
    std::vector<RunResult> results;
    results.reserve(config_.num_runs > 0 ? config_.num_runs : 0);

    for (int i = 0; i < config_.num_runs; i++) {
        int32_t seed = static_cast<int32_t>(static_cast<uint32_t>(config_.base_seed)
                                            + static_cast<uint32_t>(i));

        if (config_.verbose) {
            std::cerr << "[RUNNER] Run " << (i + 1) << "/" << config_.num_runs
                      << " (seed=" << seed << ")...\n";
        }

        results.push_back(run_single(scenario, i, seed));

        if (config_.verbose) {
            const RunResult& r = results.back();
            std::cerr << "[RUNNER] done (t=" << r.sim_time_final << "s, "
                      << (r.error.empty() ? outcome_to_string(r.outcome) : r.error.c_str())
                      << ")\n";
        }

        if (on_progress) {
            on_progress(i + 1, config_.num_runs);
        }
    }

    return results;
}

RunResult MissionRunner::run_single(const Scenario& scenario, int run_index, int32_t seed) {
    RunResult result;
    result.run_index = run_index;
    result.seed = seed;

    try {
        MissionConfig config = scenario.config;
        config.verbose = config.verbose || config_.verbose;

        SimRNG rng(seed);
        auto sink = [&result](const MissionEvent& evt) {
            result.events.push_back(evt);
            if (evt.type == MissionEventType::OUTCOME_RESOLVED) {
                result.intercept_time = evt.time;
            } else if (evt.type == MissionEventType::COMPLETE) {
                result.success = evt.success;
                result.deflection = evt.deflection;
            }
        };

        MissionOrchestrator mission(scenario.asteroid, scenario.strategy, config, rng,
                                    std::make_unique<ConsoleEffectEngine>(config.verbose),
                                    sink);

        SimulationEngine engine;
        engine.set_mode(config_.mode);
        engine.set_time_scale(config_.time_scale);
        engine.set_fixed_dt(config.dt);
        engine.initialize();

        mission.start();
        bool finished = engine.run(mission, config.max_sim_time);

        const MissionState& state = mission.mission_state();
        result.outcome = state.outcome;
        result.chance = state.resolution.chance;
        result.draw = state.resolution.draw;
        result.display_probability = state.success_probability;
        result.destroyed = state.asteroid_destroyed;
        result.deflected = state.asteroid_deflected;
        result.sim_time_final = mission.clock();
        result.steps = engine.get_step_count();
        result.damage = mission.damage();
        result.lives_protected = result.success
            ? DefenseComparison::lives_protected_on_success(scenario.asteroid)
            : 0;

        if (!finished) {
            result.error = "Run did not complete within " +
                           std::to_string(config.max_sim_time) + "s";
        }

    } catch (const std::exception& e) {
        result.error = std::string("Run error: ") + e.what();
    }

    return result;
}

BatchSummary MissionRunner::summarize(const std::vector<RunResult>& results,
                                      const Scenario& scenario) {
    BatchSummary s;
    s.runs = static_cast<int>(results.size());
    s.expected_rate = OutcomeResolver::resolved_chance(scenario.strategy, scenario.asteroid) / 100.0;

    double deflection_sum = 0.0;
    for (const auto& r : results) {
        if (!r.error.empty()) {
            s.errors++;
            continue;
        }
        s.completed++;
        deflection_sum += r.deflection;
        if (r.success) s.successes++;
        if (r.destroyed) s.destroyed++;
        if (r.deflected) s.deflected++;
    }

    if (s.completed > 0) {
        s.success_rate = static_cast<double>(s.successes) / s.completed;
        s.mean_deflection = deflection_sum / s.completed;
    }
    return s;
}

} // namespace astra::mission
