#include "mission/damage_model.hpp"
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>

namespace astra::mission {

// Ladder rungs, highest first. Strictly-greater comparisons; the last
// rung catches everything at or below 0.01 MT, including zero.
struct CasualtyRung {
    double threshold_mt;
    int64_t min;
    int64_t max;
    const char* label;
};

static const CasualtyRung CASUALTY_LADDER[] = {
    {10000.0, 1000000000, 8000000000, "Extinction Event"},
    {1000.0,  100000000,  1000000000, "Global Catastrophe"},
    {100.0,   10000000,   100000000,  "Continental Devastation"},
    {10.0,    1000000,    10000000,   "Regional Disaster"},
    {1.0,     100000,     1000000,    "City Destroyer"},
    {0.01,    1000,       100000,     "Local Impact"},
};

// Ascending; each crossing appends one label
struct EffectRung {
    double threshold_mt;
    const char* label;
};

static const EffectRung EFFECT_LADDER[] = {
    {0.01,    "Local seismic activity"},
    {0.1,     "Widespread fires"},
    {1.0,     "Regional dust cloud"},
    {10.0,    "Atmospheric shockwave"},
    {100.0,   "Global temperature drop"},
    {1000.0,  "Impact winter (years)"},
    {10000.0, "Mass extinction event"},
};

// Rounds a non-negative count, saturating where int64_t runs out
static int64_t round_count(double v) {
    if (!(v > 0.0)) return 0;
    if (v >= std::ldexp(1.0, 63)) return std::numeric_limits<int64_t>::max();
    return static_cast<int64_t>(std::llround(v));
}

bool operator==(const DamageAssessment& a, const DamageAssessment& b) {
    return a.impact_energy_mt == b.impact_energy_mt
        && a.casualties.min == b.casualties.min
        && a.casualties.max == b.casualties.max
        && a.casualties.label == b.casualties.label
        && a.destruction_radius_km == b.destruction_radius_km
        && a.crater_diameter_km == b.crater_diameter_km
        && a.fireball_radius_km == b.fireball_radius_km
        && a.thermal_radius_km == b.thermal_radius_km
        && a.shockwave_radius_km == b.shockwave_radius_km
        && a.tsunami_height_m == b.tsunami_height_m
        && a.environmental_effects == b.environmental_effects
        && a.equivalent_nukes == b.equivalent_nukes;
}

double DamageModel::impact_energy_mt(double mass_kg, double velocity_km_s) {
    if (!std::isfinite(mass_kg) || !std::isfinite(velocity_km_s)) return 0.0;
    if (mass_kg <= 0.0 || velocity_km_s <= 0.0) return 0.0;

    double velocity_ms = velocity_km_s * 1000.0;
    double energy_j = 0.5 * mass_kg * velocity_ms * velocity_ms;
    double energy_mt = energy_j / JOULES_PER_MEGATON;
    return std::isfinite(energy_mt) ? energy_mt : 0.0;
}

double DamageModel::destruction_radius_km(double energy_mt) {
    if (!(energy_mt > 0.0)) return 0.0;
    return std::cbrt(energy_mt) * 2.5;
}

CasualtyEstimate DamageModel::casualties_for(double energy_mt) {
    for (const auto& rung : CASUALTY_LADDER) {
        if (energy_mt > rung.threshold_mt) {
            return CasualtyEstimate{rung.min, rung.max, rung.label};
        }
    }
    return CasualtyEstimate{0, 1000, "Minor Event"};
}

DamageAssessment DamageModel::assess(double mass_kg, double velocity_km_s) {
    DamageAssessment d;
    double e = impact_energy_mt(mass_kg, velocity_km_s);

    d.impact_energy_mt = e;
    d.casualties = casualties_for(e);
    d.destruction_radius_km = destruction_radius_km(e);

    if (e > 0.0) {
        d.crater_diameter_km  = std::pow(e, 0.3) * 1.5;
        d.fireball_radius_km  = std::pow(e, 0.4) * 0.5;
        d.thermal_radius_km   = std::pow(e, 0.4) * 2.0;
        d.shockwave_radius_km = std::pow(e, 0.33) * 4.0;
    }

    if (e > 10.0) {
        d.tsunami_height_m = std::sqrt(e) * 5.0;
    }

    for (const auto& rung : EFFECT_LADDER) {
        if (e > rung.threshold_mt) {
            d.environmental_effects.emplace_back(rung.label);
        }
    }
    if (d.tsunami_height_m) {
        std::ostringstream label;
        label << "Mega-tsunami (" << std::fixed << std::setprecision(0)
              << *d.tsunami_height_m << "m waves)";
        d.environmental_effects.push_back(label.str());
    }

    d.equivalent_nukes = round_count(e * 1000.0 / 0.015);
    return d;
}

ImpactSeverity DamageModel::severity(double energy_mt) {
    if (energy_mt > 1000.0) return ImpactSeverity::EXTINCTION;
    if (energy_mt > 100.0)  return ImpactSeverity::MAJOR;
    if (energy_mt > 10.0)   return ImpactSeverity::SIGNIFICANT;
    return ImpactSeverity::MINOR;
}

int64_t DamageModel::lives_protected(double energy_mt) {
    double r = destruction_radius_km(energy_mt);
    return round_count(r * r * 1000.0);
}

const char* severity_to_string(ImpactSeverity severity) {
    switch (severity) {
        case ImpactSeverity::MINOR:       return "minor";
        case ImpactSeverity::SIGNIFICANT: return "significant";
        case ImpactSeverity::MAJOR:       return "major";
        case ImpactSeverity::EXTINCTION:  return "extinction";
    }
    return "minor";
}

std::string format_count(int64_t value) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(1);
    if (value >= 1000000000) {
        out << static_cast<double>(value) / 1e9 << "B";
    } else if (value >= 1000000) {
        out << static_cast<double>(value) / 1e6 << "M";
    } else if (value >= 1000) {
        out << static_cast<double>(value) / 1e3 << "K";
    } else {
        return std::to_string(value);
    }
    return out.str();
}

} // namespace astra::mission
