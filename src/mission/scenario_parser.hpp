/**
 * ScenarioParser: scenario JSON into a runnable mission.
 *
 * {
 *   "name": "Apophis, kinetic",
 *   "asteroid": "apophis",                    // catalog id, or an object:
 *   "asteroid": { "preset": "City Killer", "name": "X", "diameter": 120, ... },
 *   "strategy": "DART",                       // id or code, or an object:
 *   "strategy": { "base": "kinetic", "successRate": 0.9, ... },
 *   "config":   { "approachDuration": 4, "track": {...}, "impact": {...} }
 * }
 *
 * Unknown ids and out-of-range values throw std::runtime_error. Missing
 * optional fields keep their defaults.
 */

#ifndef ASTRA_MISSION_SCENARIO_PARSER_HPP
#define ASTRA_MISSION_SCENARIO_PARSER_HPP

#include "data/asteroid_catalog.hpp"
#include "io/json_reader.hpp"
#include "mission/mission_config.hpp"
#include <string>

namespace astra::mission {

struct Scenario {
    std::string name;
    Asteroid asteroid;
    DefenseStrategy strategy;
    MissionConfig config;
};

class ScenarioParser {
public:
    // Custom asteroid bounds
    static constexpr double MIN_DIAMETER = 1.0;       // m
    static constexpr double MAX_DIAMETER = 10000.0;
    static constexpr double MIN_VELOCITY = 1.0;       // km/s
    static constexpr double MAX_VELOCITY = 72.0;

    static Scenario parse(const JsonValue& scenario);

    static Scenario parse_file(const std::string& path);

    /** Scenario from catalog ids, default config. */
    static Scenario from_catalog(const std::string& asteroid_id, const std::string& strategy_id);

    static Asteroid parse_asteroid(const JsonValue& def);
    static DefenseStrategy parse_strategy(const JsonValue& def);

    /** Overlay the fields present in `def` onto `config`, then validate. */
    static void apply_config(const JsonValue& def, MissionConfig& config);

    static void validate(const MissionConfig& config);

    static const Asteroid& lookup_asteroid(const std::string& id);
    static const DefenseStrategy& lookup_strategy(const std::string& id_or_code);
};

} // namespace astra::mission

#endif // ASTRA_MISSION_SCENARIO_PARSER_HPP
