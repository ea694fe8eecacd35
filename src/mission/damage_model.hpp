/**
 * DamageModel: impact energy to damage estimates.
 *
 * Energy from kinetic energy at entry velocity, converted to megatons
 * of TNT (1 MT = 4.184e15 J). Radii follow nuclear-weapon style power
 * laws in energy; casualties follow a seven-rung threshold ladder.
 *
 * Pure and total: non-positive or non-finite inputs produce the
 * zero-energy Minor Event assessment, never NaN or infinity.
 */

#ifndef ASTRA_MISSION_DAMAGE_MODEL_HPP
#define ASTRA_MISSION_DAMAGE_MODEL_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace astra::mission {

struct CasualtyEstimate {
    int64_t min = 0;
    int64_t max = 0;
    std::string label;
};

struct DamageAssessment {
    double impact_energy_mt = 0.0;
    CasualtyEstimate casualties;
    double destruction_radius_km = 0.0;
    double crater_diameter_km = 0.0;
    double fireball_radius_km = 0.0;
    double thermal_radius_km = 0.0;
    double shockwave_radius_km = 0.0;
    std::optional<double> tsunami_height_m;     // ocean impacts above 10 MT
    std::vector<std::string> environmental_effects;
    int64_t equivalent_nukes = 0;               // 15 kt Hiroshima units
};

bool operator==(const DamageAssessment& a, const DamageAssessment& b);

/** Visual/audio intensity tier of an impact. */
enum class ImpactSeverity {
    MINOR,          // <= 10 MT
    SIGNIFICANT,    // > 10 MT
    MAJOR,          // > 100 MT
    EXTINCTION      // > 1000 MT
};

class DamageModel {
public:
    static constexpr double JOULES_PER_MEGATON = 4.184e15;

    /** 0.5 * m * (v * 1000)^2 / 4.184e15; zero for invalid input. */
    static double impact_energy_mt(double mass_kg, double velocity_km_s);

    /** E^(1/3) * 2.5 km */
    static double destruction_radius_km(double energy_mt);

    /** Casualty bucket, evaluated from the highest threshold down. */
    static CasualtyEstimate casualties_for(double energy_mt);

    static DamageAssessment assess(double mass_kg, double velocity_km_s);

    static ImpactSeverity severity(double energy_mt);

    /** Lives protected by a successful deflection: round(R^2 * 1000). */
    static int64_t lives_protected(double energy_mt);
};

const char* severity_to_string(ImpactSeverity severity);

/** 1.2B / 3.4M / 5.6K style; plain integer below one thousand. */
std::string format_count(int64_t value);

} // namespace astra::mission

#endif // ASTRA_MISSION_DAMAGE_MODEL_HPP
