/**
 * DefenseComparison: pre-mission strategy trade study.
 *
 * For one asteroid, weighs each strategy by its size-class effectiveness
 * and scales the unmitigated casualty range by the residual risk
 * (1 - p). Independent of the outcome draw.
 */

#ifndef ASTRA_MISSION_DEFENSE_COMPARISON_HPP
#define ASTRA_MISSION_DEFENSE_COMPARISON_HPP

#include "data/asteroid_catalog.hpp"
#include "mission/damage_model.hpp"
#include <string>
#include <vector>

namespace astra::mission {

struct StrategyComparison {
    std::string strategy_id;
    std::string strategy_code;
    double effectiveness = 0.0;
    double success_probability = 0.0;       // success_rate * effectiveness
    CasualtyEstimate residual_casualties;   // min/max * (1 - p), rounded
    int64_t lives_protected_min = 0;
    int64_t lives_protected_max = 0;
    std::string verdict;                    // FAVORABLE / UNCERTAIN / HIGH RISK
};

struct ComparisonReport {
    std::string asteroid_id;
    SizeClass size_class = SizeClass::SMALL;
    DamageAssessment unmitigated;
    std::vector<StrategyComparison> strategies;

    /** Highest success probability; nullptr for an empty report. */
    const StrategyComparison* best() const;
};

class DefenseComparison {
public:
    static StrategyComparison compare(const Asteroid& asteroid, const DefenseStrategy& strategy);

    /** All catalog strategies, in catalog order. */
    static ComparisonReport compare_all(const Asteroid& asteroid);

    static const char* verdict_for(double success_probability);

    /** Population kept safe by a successful deflection, round(R^2 * 1000). */
    static int64_t lives_protected_on_success(const Asteroid& asteroid);
};

} // namespace astra::mission

#endif // ASTRA_MISSION_DEFENSE_COMPARISON_HPP
