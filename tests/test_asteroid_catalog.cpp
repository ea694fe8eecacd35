#include "data/asteroid_catalog.hpp"
#include "test_common.hpp"

using namespace astra;

static constexpr double PI = 3.14159265358979323846;

static void runCatalogContents() {
    REQUIRE(AsteroidCatalog::asteroids().size() == 6, "six catalog asteroids");
    REQUIRE(AsteroidCatalog::strategies().size() == 4, "four strategies");

    const Asteroid* apophis = AsteroidCatalog::find_asteroid("apophis");
    REQUIRE(apophis != nullptr, "apophis present");
    REQUIRE(apophis->diameter == 370.0, "apophis diameter");
    REQUIRE(apophis->torino_scale == 0, "apophis torino");
    REQUIRE(!apophis->is_custom, "catalog entries are not custom");

    REQUIRE(AsteroidCatalog::find_asteroid("APOPHIS") == apophis, "lookup ignores case");
    REQUIRE(AsteroidCatalog::find_asteroid("ceres") == nullptr, "unknown id gives nullptr");

    const DefenseStrategy* dart = AsteroidCatalog::find_strategy("DART");
    REQUIRE(dart != nullptr && dart->id == "kinetic", "lookup by code");
    REQUIRE(AsteroidCatalog::find_strategy("kinetic") == dart, "lookup by id");
    REQUIRE(AsteroidCatalog::find_strategy("nuke")->is_nuclear(), "NUKE is nuclear-class");
    REQUIRE(!dart->is_nuclear(), "DART is not nuclear-class");
    REQUIRE(AsteroidCatalog::find_strategy("laser")->is_laser(), "LASR is laser");
    REQUIRE(AsteroidCatalog::find_strategy("GRAV")->is_gravity_tractor(), "GRAV is tractor");
    REQUIRE(AsteroidCatalog::find_strategy("sail") == nullptr, "unknown strategy");

    for (const auto& s : AsteroidCatalog::strategies()) {
        REQUIRE(s.success_rate > 0.0 && s.success_rate <= 1.0, "success rate in (0,1]");
        REQUIRE(s.tech_readiness >= 1 && s.tech_readiness <= 9, "TRL in [1,9]");
    }
    pass("catalog contents");
}

static void runMassAndSize() {
    double expected = (4.0 / 3.0) * PI * 185.0 * 185.0 * 185.0 * 2000.0;
    REQUIRE(near_rel(calculate_mass(370.0), expected, 1e-12), "sphere mass at 2000 kg/m3");
    REQUIRE(near_rel(AsteroidCatalog::find_asteroid("apophis")->mass, expected, 1e-12),
            "catalog mass derived from diameter");

    REQUIRE(calculate_mass(0.0) == 0.0, "zero diameter");
    REQUIRE(calculate_mass(-5.0) == 0.0, "negative diameter");
    REQUIRE(calculate_mass(std::nan("")) == 0.0, "NaN diameter");

    REQUIRE(classify_size(99.9) == SizeClass::SMALL, "small below 100");
    REQUIRE(classify_size(100.0) == SizeClass::MEDIUM, "medium from 100");
    REQUIRE(classify_size(499.9) == SizeClass::MEDIUM, "medium below 500");
    REQUIRE(classify_size(500.0) == SizeClass::LARGE, "large from 500");

    const DefenseStrategy* dart = AsteroidCatalog::find_strategy("kinetic");
    REQUIRE(dart->effectiveness.for_size(SizeClass::SMALL) == dart->effectiveness.small, "small lookup");
    REQUIRE(dart->effectiveness.for_size(SizeClass::LARGE) == dart->effectiveness.large, "large lookup");
    pass("mass and size class");
}

static void runCustomAsteroid() {
    CustomAsteroidSpec spec;
    spec.name = "Test Rock";
    spec.diameter = 120.0;
    spec.velocity = 22.0;
    spec.impact_probability = 0.01;
    spec.semi_major_axis = 4.0;
    spec.torino_scale = 14;

    Asteroid a = AsteroidCatalog::make_custom(spec);
    REQUIRE(a.is_custom, "flagged custom");
    REQUIRE(a.name == "Test Rock", "name kept");
    REQUIRE(a.id.rfind("custom-", 0) == 0, "custom id prefix");
    REQUIRE(near(a.orbital_period, 8.0), "period a^1.5");
    REQUIRE(near(a.palermo_scale, -1.0), "palermo log10(p)+1");
    REQUIRE(near(a.distance, 0.04), "distance a*0.01");
    REQUIRE(a.torino_scale == 10, "torino clamped to 10");
    REQUIRE(near_rel(a.mass, calculate_mass(120.0)), "mass derived");
    REQUIRE(a.discovery_date.size() == 10, "discovery date is ISO day");

    spec.name.clear();
    Asteroid unnamed = AsteroidCatalog::make_custom(spec);
    REQUIRE(unnamed.name.rfind("Custom-", 0) == 0, "generated name");

    spec.impact_probability = 0.0;
    Asteroid zero_p = AsteroidCatalog::make_custom(spec);
    REQUIRE(std::isfinite(zero_p.palermo_scale), "palermo finite at p=0");
    pass("custom asteroid");
}

static void runPresets() {
    CustomAsteroidSpec spec;
    REQUIRE(AsteroidCatalog::apply_preset("city killer", spec), "preset found");
    REQUIRE(spec.diameter == 100.0 && spec.torino_scale == 4, "preset applied");
    REQUIRE(!AsteroidCatalog::apply_preset("planet killer", spec), "unknown preset");
    REQUIRE(spec.diameter == 100.0, "failed lookup leaves spec alone");
    pass("presets");
}

static void runTorinoDescriptions() {
    for (int i = 0; i <= 10; i++) {
        REQUIRE(!torino_description(i).empty(), "description for every level");
    }
    REQUIRE(torino_description(0).rfind("No hazard", 0) == 0, "level 0");
    REQUIRE(torino_description(10).rfind("Certain collision", 0) == 0, "level 10");
    REQUIRE(torino_description(11) == "Unknown classification", "out of range");
    pass("torino descriptions");
}

int main() {
    runCatalogContents();
    runMassAndSize();
    runCustomAsteroid();
    runPresets();
    runTorinoDescriptions();
    return 0;
}
