#include "mission/defense_comparison.hpp"
#include "mission/outcome_resolver.hpp"
#include <cmath>

namespace astra::mission {

const StrategyComparison* ComparisonReport::best() const {
    const StrategyComparison* top = nullptr;
    for (const auto& s : strategies) {
        if (!top || s.success_probability > top->success_probability) top = &s;
    }
    return top;
}

const char* DefenseComparison::verdict_for(double p) {
    if (p > 0.7) return "FAVORABLE";
    if (p > 0.4) return "UNCERTAIN";
    return "HIGH RISK";
}

StrategyComparison DefenseComparison::compare(const Asteroid& asteroid,
                                              const DefenseStrategy& strategy) {
    CasualtyEstimate casualties = DamageModel::casualties_for(
        DamageModel::impact_energy_mt(asteroid.mass, asteroid.velocity));

    StrategyComparison c;
    c.strategy_id = strategy.id;
    c.strategy_code = strategy.code;
    c.effectiveness = strategy.effectiveness.for_size(classify_size(asteroid.diameter));
    c.success_probability = OutcomeResolver::expected_success(strategy, asteroid);

    double residual = 1.0 - c.success_probability;
    c.residual_casualties.label = casualties.label;
    c.residual_casualties.min = std::llround(static_cast<double>(casualties.min) * residual);
    c.residual_casualties.max = std::llround(static_cast<double>(casualties.max) * residual);

    c.lives_protected_min = casualties.min - c.residual_casualties.min;
    c.lives_protected_max = casualties.max - c.residual_casualties.max;
    c.verdict = verdict_for(c.success_probability);
    return c;
}

ComparisonReport DefenseComparison::compare_all(const Asteroid& asteroid) {
    ComparisonReport report;
    report.asteroid_id = asteroid.id;
    report.size_class = classify_size(asteroid.diameter);
    report.unmitigated = DamageModel::assess(asteroid.mass, asteroid.velocity);

    for (const auto& strategy : AsteroidCatalog::strategies()) {
        report.strategies.push_back(compare(asteroid, strategy));
    }
    return report;
}

int64_t DefenseComparison::lives_protected_on_success(const Asteroid& asteroid) {
    return DamageModel::lives_protected(
        DamageModel::impact_energy_mt(asteroid.mass, asteroid.velocity));
}

} // namespace astra::mission
