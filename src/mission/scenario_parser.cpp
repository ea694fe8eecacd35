#include "mission/scenario_parser.hpp"
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace astra::mission {

namespace {
    void read_number(const JsonValue& obj, const char* key, double& field) {
        const auto& v = obj[key];
        if (v.is_null()) return;
        if (!v.is_number()) {
            throw std::runtime_error(std::string("'") + key + "' must be a number");
        }
        field = v.as_number();
    }

    void require_non_negative(double v, const char* name) {
        if (!std::isfinite(v) || v < 0.0) {
            throw std::runtime_error(std::string(name) + " must be >= 0");
        }
    }

    void require_positive(double v, const char* name) {
        if (!std::isfinite(v) || v <= 0.0) {
            throw std::runtime_error(std::string(name) + " must be > 0");
        }
    }

    void require_within(double v, double lo, double hi, const char* name, const char* unit) {
        if (!std::isfinite(v) || v < lo || v > hi) {
            std::ostringstream msg;
            msg << name << " must be within [" << lo << ", " << hi << "] " << unit;
            throw std::runtime_error(msg.str());
        }
    }

    void require_fraction(double v, const char* name) {
        if (!std::isfinite(v) || v < 0.0 || v > 1.0) {
            throw std::runtime_error(std::string(name) + " must be within [0, 1]");
        }
    }
}

const Asteroid& ScenarioParser::lookup_asteroid(const std::string& id) {
    const Asteroid* a = AsteroidCatalog::find_asteroid(id);
    if (!a) throw std::runtime_error("Unknown asteroid: " + id);
    return *a;
}

const DefenseStrategy& ScenarioParser::lookup_strategy(const std::string& id_or_code) {
    const DefenseStrategy* s = AsteroidCatalog::find_strategy(id_or_code);
    if (!s) throw std::runtime_error("Unknown defense strategy: " + id_or_code);
    return *s;
}

Scenario ScenarioParser::from_catalog(const std::string& asteroid_id,
                                      const std::string& strategy_id) {
    Scenario s;
    s.asteroid = lookup_asteroid(asteroid_id);
    s.strategy = lookup_strategy(strategy_id);
    s.name = s.asteroid.name + " / " + s.strategy.code;
    return s;
}

Scenario ScenarioParser::parse(const JsonValue& scenario) {
    if (!scenario.is_object()) {
        throw std::runtime_error("Scenario must be a JSON object");
    }

    Scenario s;

    const auto& asteroid = scenario["asteroid"];
    if (asteroid.is_string()) {
        s.asteroid = lookup_asteroid(asteroid.as_string());
    } else if (asteroid.is_object()) {
        s.asteroid = parse_asteroid(asteroid);
    } else {
        throw std::runtime_error("Scenario needs 'asteroid' (catalog id or object)");
    }

    const auto& strategy = scenario["strategy"];
    if (strategy.is_string()) {
        s.strategy = lookup_strategy(strategy.as_string());
    } else if (strategy.is_object()) {
        s.strategy = parse_strategy(strategy);
    } else {
        throw std::runtime_error("Scenario needs 'strategy' (id, code or object)");
    }

    s.name = scenario["name"].get_string(s.asteroid.name + " / " + s.strategy.code);

    const auto& config = scenario["config"];
    if (config.is_object()) {
        apply_config(config, s.config);
    } else if (!config.is_null()) {
        throw std::runtime_error("'config' must be an object");
    }
    validate(s.config);

    return s;
}

Scenario ScenarioParser::parse_file(const std::string& path) {
    return parse(JsonReader::parse_file(path));
}

Asteroid ScenarioParser::parse_asteroid(const JsonValue& def) {
    CustomAsteroidSpec spec;

    std::string preset = def["preset"].get_string("");
    if (!preset.empty() && !AsteroidCatalog::apply_preset(preset, spec)) {
        throw std::runtime_error("Unknown asteroid preset: " + preset);
    }

    spec.name = def["name"].get_string(spec.name);
    spec.close_approach_date = def["closeApproachDate"].get_string(spec.close_approach_date);
    read_number(def, "diameter", spec.diameter);
    read_number(def, "velocity", spec.velocity);
    read_number(def, "impactProbability", spec.impact_probability);
    read_number(def, "semiMajorAxis", spec.semi_major_axis);
    read_number(def, "eccentricity", spec.eccentricity);
    read_number(def, "inclination", spec.inclination);

    double torino = spec.torino_scale;
    read_number(def, "torinoScale", torino);
    if (!std::isfinite(torino) || torino < 0.0 || torino > 10.0) {
        throw std::runtime_error("torinoScale must be within [0, 10]");
    }
    spec.torino_scale = static_cast<int>(torino);

    require_within(spec.diameter, MIN_DIAMETER, MAX_DIAMETER, "diameter", "m");
    require_within(spec.velocity, MIN_VELOCITY, MAX_VELOCITY, "velocity", "km/s");
    require_fraction(spec.impact_probability, "impactProbability");

    Asteroid a = AsteroidCatalog::make_custom(spec);

    // Explicit mass wins over the density-derived one
    read_number(def, "mass", a.mass);
    require_positive(a.mass, "mass");

    std::string id = def["id"].get_string("");
    if (!id.empty()) a.id = id;
    return a;
}

DefenseStrategy ScenarioParser::parse_strategy(const JsonValue& def) {
    DefenseStrategy s;

    std::string base = def["base"].get_string("");
    if (!base.empty()) {
        s = lookup_strategy(base);
    }

    s.id = def["id"].get_string(s.id);
    s.name = def["name"].get_string(s.name);
    s.code = def["code"].get_string(s.code);
    s.description = def["description"].get_string(s.description);
    read_number(def, "successRate", s.success_rate);
    read_number(def, "leadTime", s.lead_time);
    read_number(def, "costBillion", s.cost_billion);

    double trl = s.tech_readiness;
    read_number(def, "techReadiness", trl);

    const auto& eff = def["effectiveness"];
    if (eff.is_object()) {
        read_number(eff, "small", s.effectiveness.small);
        read_number(eff, "medium", s.effectiveness.medium);
        read_number(eff, "large", s.effectiveness.large);
    }

    if (s.code.empty()) {
        throw std::runtime_error("Strategy needs a 'code' (or a 'base' to inherit one)");
    }
    if (s.id.empty()) s.id = s.code;
    if (s.name.empty()) s.name = s.code;

    require_fraction(s.success_rate, "successRate");
    require_fraction(s.effectiveness.small, "effectiveness.small");
    require_fraction(s.effectiveness.medium, "effectiveness.medium");
    require_fraction(s.effectiveness.large, "effectiveness.large");

    if (!std::isfinite(trl) || trl < 1.0 || trl > 9.0 || trl != std::floor(trl)) {
        throw std::runtime_error("techReadiness must be an integer within [1, 9]");
    }
    s.tech_readiness = static_cast<int>(trl);
    return s;
}

void ScenarioParser::apply_config(const JsonValue& def, MissionConfig& c) {
    read_number(def, "approachDuration", c.approach_duration);
    read_number(def, "launchDuration", c.launch_duration);
    read_number(def, "laserStartDelay", c.laser_start_delay);
    read_number(def, "gravityFieldDelay", c.gravity_field_delay);
    read_number(def, "verdictDelay", c.verdict_delay);
    read_number(def, "successExitDelay", c.success_exit_delay);
    read_number(def, "failureExitDelay", c.failure_exit_delay);
    read_number(def, "timeBudget", c.time_budget);
    read_number(def, "interceptThreshold", c.intercept_threshold);
    read_number(def, "launchReach", c.launch_reach);
    read_number(def, "launchArcHeight", c.launch_arc_height);
    read_number(def, "seekSpeed", c.seek_speed);
    read_number(def, "gravityTractorSpeed", c.gravity_tractor_speed);
    read_number(def, "destroyDiameter", c.destroy_diameter);
    read_number(def, "dt", c.dt);
    read_number(def, "maxSimTime", c.max_sim_time);
    c.verbose = def["verbose"].get_bool(c.verbose);

    const auto& track = def["track"];
    if (track.is_object()) {
        read_number(track, "startDistance", c.asteroid_track.start_distance);
        read_number(track, "floorDistance", c.asteroid_track.floor_distance);
        read_number(track, "duration", c.asteroid_track.duration);
    }

    const auto& impact = def["impact"];
    if (impact.is_object()) {
        read_number(impact, "approachDuration", c.impact.approach_duration);
        read_number(impact, "impactDuration", c.impact.impact_duration);
        read_number(impact, "explosionDuration", c.impact.explosion_duration);
        read_number(impact, "aftermathDuration", c.impact.aftermath_duration);
        read_number(impact, "damagedDuration", c.impact.damaged_duration);
        read_number(impact, "resetDuration", c.impact.reset_duration);
        read_number(impact, "startDistance", c.impact.start_distance);
        read_number(impact, "earthRadius", c.impact.earth_radius);
    }

    validate(c);
}

void ScenarioParser::validate(const MissionConfig& c) {
    require_non_negative(c.approach_duration, "approachDuration");
    require_non_negative(c.launch_duration, "launchDuration");
    require_non_negative(c.laser_start_delay, "laserStartDelay");
    require_non_negative(c.gravity_field_delay, "gravityFieldDelay");
    require_non_negative(c.verdict_delay, "verdictDelay");
    require_non_negative(c.success_exit_delay, "successExitDelay");
    require_non_negative(c.failure_exit_delay, "failureExitDelay");
    require_non_negative(c.time_budget, "timeBudget");
    require_positive(c.intercept_threshold, "interceptThreshold");
    require_non_negative(c.launch_reach, "launchReach");
    require_non_negative(c.launch_arc_height, "launchArcHeight");
    require_positive(c.seek_speed, "seekSpeed");
    require_positive(c.gravity_tractor_speed, "gravityTractorSpeed");
    require_positive(c.dt, "dt");
    require_positive(c.max_sim_time, "maxSimTime");

    require_non_negative(c.asteroid_track.duration, "track.duration");
    require_non_negative(c.asteroid_track.floor_distance, "track.floorDistance");
    if (!std::isfinite(c.asteroid_track.start_distance)
        || c.asteroid_track.start_distance < c.asteroid_track.floor_distance) {
        throw std::runtime_error("track.startDistance must be >= track.floorDistance");
    }

    require_non_negative(c.impact.approach_duration, "impact.approachDuration");
    require_non_negative(c.impact.impact_duration, "impact.impactDuration");
    require_non_negative(c.impact.explosion_duration, "impact.explosionDuration");
    require_non_negative(c.impact.aftermath_duration, "impact.aftermathDuration");
    require_non_negative(c.impact.damaged_duration, "impact.damagedDuration");
    require_non_negative(c.impact.reset_duration, "impact.resetDuration");
    require_positive(c.impact.earth_radius, "impact.earthRadius");
    if (!std::isfinite(c.impact.start_distance) || c.impact.start_distance < c.impact.earth_radius) {
        throw std::runtime_error("impact.startDistance must be >= impact.earthRadius");
    }
}

} // namespace astra::mission
