#ifndef ASTRA_DATA_ASTEROID_CATALOG_HPP
#define ASTRA_DATA_ASTEROID_CATALOG_HPP

#include <string>
#include <vector>

namespace astra {

/**
 * Near-Earth object record.
 * Orbital descriptors are used for placement on orbit plots only; the
 * mission engine reads diameter, velocity, mass and torino_scale.
 */
struct Asteroid {
    std::string id;
    std::string name;
    std::string designation;
    double diameter = 0.0;              // m
    double velocity = 0.0;              // km/s
    double distance = 0.0;              // million km
    double impact_probability = 0.0;    // 0-1
    std::string close_approach_date;
    double mass = 0.0;                  // kg (sphere, 2000 kg/m³)
    std::string discovery_date;
    double orbital_period = 0.0;        // years
    double semi_major_axis = 0.0;       // AU
    double eccentricity = 0.0;
    double inclination = 0.0;           // deg from ecliptic
    int torino_scale = 0;               // 0-10
    double palermo_scale = 0.0;
    bool is_custom = false;
};

enum class SizeClass {
    SMALL,      // < 100 m
    MEDIUM,     // 100-500 m
    LARGE       // >= 500 m
};

struct Effectiveness {
    double small = 0.0;
    double medium = 0.0;
    double large = 0.0;

    double for_size(SizeClass size) const {
        switch (size) {
            case SizeClass::SMALL:  return small;
            case SizeClass::MEDIUM: return medium;
            case SizeClass::LARGE:  return large;
        }
        return large;
    }
};

struct DefenseStrategy {
    std::string id;
    std::string name;
    std::string code;                   // DART, GRAV, NUKE, LASR
    double success_rate = 0.0;          // 0-1
    double lead_time = 0.0;             // years
    double cost_billion = 0.0;          // USD billions
    std::string description;
    Effectiveness effectiveness;
    int tech_readiness = 1;             // TRL 1-9

    bool is_nuclear() const { return code == "NUKE"; }
    bool is_laser() const { return code == "LASR"; }
    bool is_gravity_tractor() const { return code == "GRAV"; }
};

/** Parameters for a user-designed asteroid. */
struct CustomAsteroidSpec {
    std::string name;                   // empty -> generated
    double diameter = 50.0;
    double velocity = 20.0;
    double impact_probability = 0.01;
    int torino_scale = 1;
    double semi_major_axis = 1.5;
    double eccentricity = 0.3;
    double inclination = 5.0;
    std::string close_approach_date = "2030-01-01";
};

struct AsteroidPreset {
    std::string name;
    double diameter;
    double velocity;
    double impact_probability;
    int torino_scale;
};

/**
 * Asteroid and defense-strategy catalog.
 *
 * Usage:
 *   const Asteroid* a = AsteroidCatalog::find_asteroid("apophis");
 *   const DefenseStrategy* s = AsteroidCatalog::find_strategy("DART");
 *   SizeClass size = classify_size(a->diameter);
 */
class AsteroidCatalog {
public:
    static const std::vector<Asteroid>& asteroids();
    static const std::vector<DefenseStrategy>& strategies();
    static const std::vector<AsteroidPreset>& presets();

    /** Lookup by id; nullptr when unknown. */
    static const Asteroid* find_asteroid(const std::string& id);

    /** Lookup by id ("kinetic") or code ("DART"), case-insensitive. */
    static const DefenseStrategy* find_strategy(const std::string& id_or_code);

    /**
     * Build a custom asteroid, deriving mass, orbital period
     * (a^1.5), Palermo scale (log10(p) + 1) and distance (a * 0.01).
     */
    static Asteroid make_custom(const CustomAsteroidSpec& spec);

    /** Custom spec pre-filled from a named preset; false if unknown. */
    static bool apply_preset(const std::string& preset_name, CustomAsteroidSpec& spec);
};

/** Sphere of uniform density 2000 kg/m³. Zero for non-positive diameter. */
double calculate_mass(double diameter_m);

SizeClass classify_size(double diameter_m);

const char* size_class_to_string(SizeClass size);

/** Public-communication description of a Torino scale value. */
std::string torino_description(int scale);

} // namespace astra

#endif // ASTRA_DATA_ASTEROID_CATALOG_HPP
