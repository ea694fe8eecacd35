#include "mission/outcome_resolver.hpp"
#include <algorithm>
#include <cmath>

namespace astra::mission {

namespace {
    double base_percent(const DefenseStrategy& strategy) {
        return std::isfinite(strategy.success_rate) ? strategy.success_rate * 100.0 : 0.0;
    }

    bool high_torino_penalty(const DefenseStrategy& strategy, const Asteroid& asteroid) {
        return asteroid.torino_scale >= 5 && !strategy.is_nuclear();
    }
}

const char* outcome_to_string(Outcome outcome) {
    switch (outcome) {
        case Outcome::PENDING: return "pending";
        case Outcome::SUCCESS: return "success";
        case Outcome::FAILURE: return "failure";
    }
    return "pending";
}

double OutcomeResolver::unclamped_chance(const DefenseStrategy& strategy,
                                         const Asteroid& asteroid) {
    double chance = base_percent(strategy);

    if (asteroid.diameter > 500.0) chance -= 15.0;
    if (asteroid.diameter > 1000.0) chance -= 20.0;
    if (high_torino_penalty(strategy, asteroid)) chance -= 20.0;

    return chance;
}

double OutcomeResolver::resolved_chance(const DefenseStrategy& strategy,
                                        const Asteroid& asteroid) {
    return std::max(CHANCE_FLOOR, unclamped_chance(strategy, asteroid));
}

Resolution OutcomeResolver::resolve(const DefenseStrategy& strategy,
                                    const Asteroid& asteroid,
                                    RandomSource& rng) {
    Resolution r;
    r.chance = resolved_chance(strategy, asteroid);
    r.draw = rng.random() * 100.0;
    r.outcome = r.draw < r.chance ? Outcome::SUCCESS : Outcome::FAILURE;
    return r;
}

double OutcomeResolver::display_probability(const DefenseStrategy& strategy,
                                            const Asteroid& asteroid) {
    double p = base_percent(strategy);

    if (asteroid.diameter > 500.0) p -= 10.0;
    if (asteroid.diameter > 1000.0) p -= 15.0;
    if (high_torino_penalty(strategy, asteroid)) p -= 15.0;

    return std::clamp(p, DISPLAY_MIN, DISPLAY_MAX);
}

double OutcomeResolver::expected_success(const DefenseStrategy& strategy,
                                         const Asteroid& asteroid) {
    if (!std::isfinite(strategy.success_rate)) return 0.0;
    SizeClass size = classify_size(asteroid.diameter);
    return strategy.success_rate * strategy.effectiveness.for_size(size);
}

} // namespace astra::mission
