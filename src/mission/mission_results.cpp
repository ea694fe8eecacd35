#include "mission/mission_results.hpp"
#include "io/json_writer.hpp"
#include "mission/defense_comparison.hpp"
#include "mission/outcome_resolver.hpp"

namespace astra::mission {

namespace {

void write_scenario(JsonWriter& w, const Scenario& scenario) {
    const Asteroid& a = scenario.asteroid;
    const DefenseStrategy& s = scenario.strategy;

    w.key("scenario").begin_object();
    w.kv("name", scenario.name);

    w.key("asteroid").begin_object();
    w.kv("id", a.id);
    w.kv("name", a.name);
    w.kv("designation", a.designation);
    w.kv("diameter", a.diameter);
    w.kv("velocity", a.velocity);
    w.kv("mass", a.mass);
    w.kv("impactProbability", a.impact_probability);
    w.kv("closeApproachDate", a.close_approach_date);
    w.kv("torinoScale", a.torino_scale);
    w.kv("torinoDescription", torino_description(a.torino_scale));
    w.kv("palermoScale", a.palermo_scale);
    w.kv("sizeClass", size_class_to_string(classify_size(a.diameter)));
    w.kv("isCustom", a.is_custom);
    w.end_object();

    w.key("strategy").begin_object();
    w.kv("id", s.id);
    w.kv("name", s.name);
    w.kv("code", s.code);
    w.kv("successRate", s.success_rate);
    w.kv("leadTime", s.lead_time);
    w.kv("costBillion", s.cost_billion);
    w.kv("techReadiness", s.tech_readiness);
    w.end_object();

    w.end_object();
}

void write_comparison(JsonWriter& w, const Scenario& scenario) {
    StrategyComparison c = DefenseComparison::compare(scenario.asteroid, scenario.strategy);

    w.key("comparison").begin_object();
    w.kv("effectiveness", c.effectiveness);
    w.kv("expectedSuccess", c.success_probability);
    w.kv("resolvedChance", OutcomeResolver::resolved_chance(scenario.strategy, scenario.asteroid));
    w.kv("displayProbability",
         OutcomeResolver::display_probability(scenario.strategy, scenario.asteroid));
    w.key("residualCasualties").begin_object();
    w.kv("min", c.residual_casualties.min);
    w.kv("max", c.residual_casualties.max);
    w.kv("label", c.residual_casualties.label);
    w.end_object();
    w.kv("livesProtectedMin", c.lives_protected_min);
    w.kv("livesProtectedMax", c.lives_protected_max);
    w.kv("verdict", c.verdict);
    w.end_object();
}

void write_timeline(JsonWriter& w, const std::vector<MissionEvent>& events) {
    w.key("timeline").begin_array();
    for (const auto& evt : events) {
        w.begin_object();
        w.kv("time", evt.time);
        w.kv("type", event_type_to_string(evt.type));

        switch (evt.type) {
            case MissionEventType::PHASE_CHANGED:
                w.kv("machine", evt.machine);
                w.kv("phase", evt.phase);
                break;
            case MissionEventType::OUTCOME_RESOLVED:
                w.kv("outcome", outcome_to_string(evt.outcome));
                w.kv("chance", evt.chance);
                w.kv("draw", evt.draw);
                break;
            case MissionEventType::COMPLETE:
                w.kv("success", evt.success);
                w.kv("deflection", evt.deflection);
                break;
            case MissionEventType::DAMAGE_READY:
                if (evt.damage) w.kv("casualtyLabel", evt.damage->casualties.label);
                break;
            default:
                break;
        }
        w.end_object();
    }
    w.end_array();
}

void write_run_fields(JsonWriter& w, const RunResult& run) {
    w.kv("runIndex", run.run_index);
    w.kv("seed", static_cast<int>(run.seed));

    if (run.error.empty()) {
        w.key("error").null_value();
    } else {
        w.kv("error", run.error);
    }

    w.kv("outcome", outcome_to_string(run.outcome));
    w.kv("success", run.success);
    w.kv("destroyed", run.destroyed);
    w.kv("deflected", run.deflected);
    w.kv("deflection", run.deflection);
    w.kv("chance", run.chance);
    w.kv("draw", run.draw);
    w.kv("interceptTime", run.intercept_time);
    w.kv("simTimeFinal", run.sim_time_final);
    w.kv("livesProtected", run.lives_protected);
}

} // namespace

void write_damage_json(JsonWriter& w, const DamageAssessment& d) {
    w.begin_object();
    w.kv("impactEnergyMt", d.impact_energy_mt);
    w.kv("severity", severity_to_string(DamageModel::severity(d.impact_energy_mt)));

    w.key("casualties").begin_object();
    w.kv("min", d.casualties.min);
    w.kv("max", d.casualties.max);
    w.kv("label", d.casualties.label);
    w.kv("display", format_count(d.casualties.min) + " - " + format_count(d.casualties.max));
    w.end_object();

    w.kv("destructionRadiusKm", d.destruction_radius_km);
    w.kv("craterDiameterKm", d.crater_diameter_km);
    w.kv("fireballRadiusKm", d.fireball_radius_km);
    w.kv("thermalRadiusKm", d.thermal_radius_km);
    w.kv("shockwaveRadiusKm", d.shockwave_radius_km);
    w.kv("tsunamiHeightM", d.tsunami_height_m);
    w.string_array("environmentalEffects", d.environmental_effects);
    w.kv("equivalentNukes", d.equivalent_nukes);
    w.end_object();
}

void write_run_json(const RunResult& result, const Scenario& scenario, std::ostream& out) {
    JsonWriter w(out);
    w.begin_object();

    write_scenario(w, scenario);
    write_comparison(w, scenario);

    w.key("run").begin_object();
    write_run_fields(w, result);

    // Share of the impact energy pushed off course, and the widened miss
    const Asteroid& a = scenario.asteroid;
    double energy = DamageModel::impact_energy_mt(a.mass, a.velocity);
    w.kv("energyRedirectedMt", energy * result.deflection / 100.0);
    w.kv("newMissDistanceAu", a.distance + result.deflection * 0.01);

    write_timeline(w, result.events);
    w.key("damage");
    if (result.damage) {
        write_damage_json(w, *result.damage);
    } else {
        w.null_value();
    }
    w.end_object();

    w.end_object();
    out << '\n';
}

void write_batch_json(const std::vector<RunResult>& results, const Scenario& scenario,
                      const RunnerConfig& config, std::ostream& out) {
    BatchSummary summary = MissionRunner::summarize(results, scenario);

    JsonWriter w(out);
    w.begin_object();

    write_scenario(w, scenario);

    // ── config ──
    w.key("config").begin_object();
    w.kv("numRuns", config.num_runs);
    w.kv("baseSeed", static_cast<int>(config.base_seed));
    w.kv("mode", mode_to_string(config.mode));
    w.kv("timeScale", config.time_scale);
    w.kv("dt", scenario.config.dt);
    w.end_object();

    // ── summary ──
    w.key("summary").begin_object();
    w.kv("runs", summary.runs);
    w.kv("completed", summary.completed);
    w.kv("errors", summary.errors);
    w.kv("successes", summary.successes);
    w.kv("destroyed", summary.destroyed);
    w.kv("deflected", summary.deflected);
    w.kv("successRate", summary.success_rate);
    w.kv("expectedRate", summary.expected_rate);
    w.kv("meanDeflection", summary.mean_deflection);
    w.end_object();

    // ── runs ──
    w.key("runs").begin_array();
    for (const auto& run : results) {
        w.begin_object();
        write_run_fields(w, run);
        if (run.damage) {
            w.kv("impactEnergyMt", run.damage->impact_energy_mt);
            w.kv("casualtyLabel", run.damage->casualties.label);
        }
        w.end_object();
    }
    w.end_array();

    w.end_object();
    out << '\n';
}

} // namespace astra::mission
