#include "data/asteroid_catalog.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <ctime>

namespace astra {

namespace {
    constexpr double PI = 3.14159265358979323846;
    constexpr double DENSITY_KG_M3 = 2000.0;

    std::string to_lower(const std::string& s) {
        std::string result = s;
        std::transform(result.begin(), result.end(), result.begin(),
                      [](unsigned char c) { return std::tolower(c); });
        return result;
    }

    Asteroid make_catalog_entry(const std::string& id, const std::string& name,
                                const std::string& designation,
                                double diameter, double velocity, double distance,
                                double impact_probability,
                                const std::string& close_approach,
                                const std::string& discovered,
                                double period, double sma, double ecc, double inc,
                                int torino, double palermo) {
        Asteroid a;
        a.id = id;
        a.name = name;
        a.designation = designation;
        a.diameter = diameter;
        a.velocity = velocity;
        a.distance = distance;
        a.impact_probability = impact_probability;
        a.close_approach_date = close_approach;
        a.mass = calculate_mass(diameter);
        a.discovery_date = discovered;
        a.orbital_period = period;
        a.semi_major_axis = sma;
        a.eccentricity = ecc;
        a.inclination = inc;
        a.torino_scale = torino;
        a.palermo_scale = palermo;
        return a;
    }

    std::string to_base36(unsigned long long v) {
        static const char digits[] = "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ";
        if (v == 0) return "0";
        std::string out;
        while (v > 0) {
            out.insert(out.begin(), digits[v % 36]);
            v /= 36;
        }
        return out;
    }

    std::string today_iso() {
        std::time_t now = std::time(nullptr);
        std::tm tm_utc{};
#if defined(_WIN32)
        gmtime_s(&tm_utc, &now);
#else
        gmtime_r(&now, &tm_utc);
#endif
        char buf[16];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d", &tm_utc);
        return buf;
    }
}

// ─────────────────────────────────────────────────────────────
// Catalog data
// ─────────────────────────────────────────────────────────────

const std::vector<Asteroid>& AsteroidCatalog::asteroids() {
    static const std::vector<Asteroid> catalog = {
        //                 id          name        designation      diam   vel   dist    P(impact)  approach      discovered    T      a     e     i    torino palermo
        make_catalog_entry("2024-yr4", "2024 YR4", "2024 YR4",      55.0,  18.5, 0.0038, 0.012,     "2032-12-22", "2024-12-27", 2.47, 1.83, 0.52, 3.4, 3, -1.8),
        make_catalog_entry("apophis",  "Apophis",  "99942 Apophis", 370.0, 30.7, 0.031,  0.000027,  "2029-04-13", "2004-06-19", 0.89, 0.92, 0.19, 3.3, 0, -3.2),
        make_catalog_entry("2023-dw",  "2023 DW",  "2023 DW",       50.0,  24.6, 0.0012, 0.0029,    "2046-02-14", "2023-02-26", 1.59, 1.36, 0.29, 0.6, 1, -2.4),
        make_catalog_entry("2021-qm1", "2021 QM1", "2021 QM1",      50.0,  19.8, 0.0052, 0.00014,   "2052-04-02", "2021-08-28", 1.23, 1.15, 0.22, 8.5, 1, -2.8),
        make_catalog_entry("2018-vp1", "2018 VP1", "2018 VP1",      2.0,   9.7,  0.0042, 0.0041,    "2024-11-02", "2018-11-03", 2.0,  1.59, 0.43, 2.1, 0, -8.5),
        make_catalog_entry("bennu",    "Bennu",    "101955 Bennu",  492.0, 28.0, 0.0037, 0.00037,   "2182-09-24", "1999-09-11", 1.20, 1.13, 0.20, 6.0, 0, -1.7),
    };
    return catalog;
}

const std::vector<DefenseStrategy>& AsteroidCatalog::strategies() {
    static const std::vector<DefenseStrategy> catalog = [] {
        std::vector<DefenseStrategy> list;

        DefenseStrategy kinetic;
        kinetic.id = "kinetic";
        kinetic.name = "Kinetic Impactor";
        kinetic.code = "DART";
        kinetic.success_rate = 0.85;
        kinetic.lead_time = 5;
        kinetic.cost_billion = 0.33;
        kinetic.description = "High-velocity spacecraft impact alters the asteroid trajectory "
                              "through momentum transfer.";
        kinetic.effectiveness = {0.95, 0.75, 0.35};
        kinetic.tech_readiness = 9;
        list.push_back(kinetic);

        DefenseStrategy gravity;
        gravity.id = "gravity";
        gravity.name = "Gravity Tractor";
        gravity.code = "GRAV";
        gravity.success_rate = 0.72;
        gravity.lead_time = 20;
        gravity.cost_billion = 1.2;
        gravity.description = "Spacecraft holds station near the asteroid and slowly tows it "
                              "with mutual gravitational attraction.";
        gravity.effectiveness = {0.90, 0.65, 0.40};
        gravity.tech_readiness = 5;
        list.push_back(gravity);

        DefenseStrategy nuclear;
        nuclear.id = "nuclear";
        nuclear.name = "Nuclear Deflection";
        nuclear.code = "NUKE";
        nuclear.success_rate = 0.78;
        nuclear.lead_time = 2;
        nuclear.cost_billion = 5.0;
        nuclear.description = "Stand-off detonation vaporizes surface material, producing "
                              "thrust. Last resort for short-warning scenarios.";
        nuclear.effectiveness = {0.70, 0.85, 0.80};
        nuclear.tech_readiness = 4;
        list.push_back(nuclear);

        DefenseStrategy laser;
        laser.id = "laser";
        laser.name = "Laser Ablation";
        laser.code = "LASR";
        laser.success_rate = 0.65;
        laser.lead_time = 10;
        laser.cost_billion = 8.5;
        laser.description = "Concentrated laser beams ablate surface material, creating "
                            "continuous thrust through mass ejection.";
        laser.effectiveness = {0.85, 0.55, 0.25};
        laser.tech_readiness = 3;
        list.push_back(laser);

        return list;
    }();
    return catalog;
}

const std::vector<AsteroidPreset>& AsteroidCatalog::presets() {
    static const std::vector<AsteroidPreset> list = {
        {"Small Rock",       10.0,   15.0, 0.001, 0},
        {"City Killer",      100.0,  20.0, 0.005, 4},
        {"Regional Threat",  300.0,  25.0, 0.01,  6},
        {"Extinction Event", 1000.0, 30.0, 0.1,   10},
    };
    return list;
}

// ─────────────────────────────────────────────────────────────
// Lookup
// ─────────────────────────────────────────────────────────────

const Asteroid* AsteroidCatalog::find_asteroid(const std::string& id) {
    std::string key = to_lower(id);
    for (const auto& a : asteroids()) {
        if (a.id == key) return &a;
    }
    return nullptr;
}

const DefenseStrategy* AsteroidCatalog::find_strategy(const std::string& id_or_code) {
    std::string key = to_lower(id_or_code);
    for (const auto& s : strategies()) {
        if (s.id == key || to_lower(s.code) == key) return &s;
    }
    return nullptr;
}

// ─────────────────────────────────────────────────────────────
// Custom asteroids
// ─────────────────────────────────────────────────────────────

Asteroid AsteroidCatalog::make_custom(const CustomAsteroidSpec& spec) {
    auto millis = static_cast<unsigned long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count());

    Asteroid a;
    a.id = "custom-" + std::to_string(millis);
    a.name = spec.name.empty() ? "Custom-" + to_base36(millis) : spec.name;
    a.designation = a.name;
    a.diameter = spec.diameter;
    a.velocity = spec.velocity;
    a.distance = spec.semi_major_axis * 0.01;
    a.impact_probability = spec.impact_probability;
    a.close_approach_date = spec.close_approach_date;
    a.mass = calculate_mass(spec.diameter);
    a.discovery_date = today_iso();
    a.orbital_period = spec.semi_major_axis > 0.0 ? std::pow(spec.semi_major_axis, 1.5) : 0.0;
    a.semi_major_axis = spec.semi_major_axis;
    a.eccentricity = spec.eccentricity;
    a.inclination = spec.inclination;
    a.torino_scale = std::clamp(spec.torino_scale, 0, 10);

    // log10 is undefined at zero; floor the probability
    double p = std::clamp(spec.impact_probability, 1e-10, 1.0);
    a.palermo_scale = std::log10(p) + 1.0;
    a.is_custom = true;
    return a;
}

bool AsteroidCatalog::apply_preset(const std::string& preset_name, CustomAsteroidSpec& spec) {
    std::string key = to_lower(preset_name);
    for (const auto& p : presets()) {
        if (to_lower(p.name) != key) continue;
        spec.diameter = p.diameter;
        spec.velocity = p.velocity;
        spec.impact_probability = p.impact_probability;
        spec.torino_scale = p.torino_scale;
        return true;
    }
    return false;
}

// ─────────────────────────────────────────────────────────────
// Free helpers
// ─────────────────────────────────────────────────────────────

double calculate_mass(double diameter_m) {
    if (!(diameter_m > 0.0) || !std::isfinite(diameter_m)) return 0.0;
    double radius = diameter_m / 2.0;
    double volume = (4.0 / 3.0) * PI * radius * radius * radius;
    return volume * DENSITY_KG_M3;
}

SizeClass classify_size(double diameter_m) {
    if (diameter_m < 100.0) return SizeClass::SMALL;
    if (diameter_m < 500.0) return SizeClass::MEDIUM;
    return SizeClass::LARGE;
}

const char* size_class_to_string(SizeClass size) {
    switch (size) {
        case SizeClass::SMALL:  return "small";
        case SizeClass::MEDIUM: return "medium";
        case SizeClass::LARGE:  return "large";
    }
    return "large";
}

std::string torino_description(int scale) {
    switch (scale) {
        case 0:  return "No hazard - likelihood of collision zero or well below chance of random object striking Earth";
        case 1:  return "Normal - a routine discovery with pass near Earth posing no unusual level of danger";
        case 2:  return "Meriting attention - somewhat close but not highly unusual encounter; collision very unlikely";
        case 3:  return "Meriting attention - close encounter with 1% or greater chance of collision causing local destruction";
        case 4:  return "Meriting attention - close encounter with 1% or greater chance of regional devastation";
        case 5:  return "Threatening - close encounter with significant threat of regional devastation";
        case 6:  return "Threatening - close encounter with significant threat of global catastrophe";
        case 7:  return "Threatening - very close encounter with extremely significant threat of global catastrophe";
        case 8:  return "Certain collision - collision capable of causing localized destruction";
        case 9:  return "Certain collision - collision capable of causing unprecedented regional devastation";
        case 10: return "Certain collision - collision capable of causing global climatic catastrophe";
        default: return "Unknown classification";
    }
}

} // namespace astra
