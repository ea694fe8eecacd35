/**
 * OutcomeResolver: deflection success draw.
 *
 * Authoritative schedule (decides the run):
 *   chance = success_rate * 100
 *   -15 if diameter > 500 m, a further -20 if diameter > 1000 m
 *   -20 if torino >= 5 and the strategy is not NUKE
 *   floor at 20
 *   success iff uniform[0,100) < chance
 *
 * Display schedule (HUD only): -10 / -15 / -15 with the same conditions,
 * clamped to [20, 95]. The two schedules differ on purpose and must not
 * be reconciled; only resolve() decides an outcome.
 */

#ifndef ASTRA_MISSION_OUTCOME_RESOLVER_HPP
#define ASTRA_MISSION_OUTCOME_RESOLVER_HPP

#include "core/sim_rng.hpp"
#include "data/asteroid_catalog.hpp"

namespace astra::mission {

enum class Outcome {
    PENDING,
    SUCCESS,
    FAILURE
};

const char* outcome_to_string(Outcome outcome);

struct Resolution {
    Outcome outcome = Outcome::PENDING;
    double chance = 0.0;    // percent, after penalties and floor
    double draw = 0.0;      // percent, [0, 100)
};

class OutcomeResolver {
public:
    static constexpr double CHANCE_FLOOR = 20.0;
    static constexpr double DISPLAY_MIN = 20.0;
    static constexpr double DISPLAY_MAX = 95.0;

    /** Percent chance before the floor. Non-finite success_rate counts as 0. */
    static double unclamped_chance(const DefenseStrategy& strategy, const Asteroid& asteroid);

    static double resolved_chance(const DefenseStrategy& strategy, const Asteroid& asteroid);

    /** Consumes exactly one value from rng. */
    static Resolution resolve(const DefenseStrategy& strategy, const Asteroid& asteroid,
                              RandomSource& rng);

    /** HUD estimate in percent. Never used to decide anything. */
    static double display_probability(const DefenseStrategy& strategy, const Asteroid& asteroid);

    /** success_rate * effectiveness[size class], 0-1. */
    static double expected_success(const DefenseStrategy& strategy, const Asteroid& asteroid);
};

} // namespace astra::mission

#endif // ASTRA_MISSION_OUTCOME_RESOLVER_HPP
