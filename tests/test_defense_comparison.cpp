#include "mission/defense_comparison.hpp"
#include "test_common.hpp"

using namespace astra;
using namespace astra::mission;

static Asteroid rock(double diameter, double velocity) {
    Asteroid a;
    a.id = "rock";
    a.name = "Rock";
    a.diameter = diameter;
    a.velocity = velocity;
    a.mass = calculate_mass(diameter);
    return a;
}

static const StrategyComparison& entry(const ComparisonReport& r, const std::string& code) {
    for (const auto& s : r.strategies) {
        if (s.strategy_code == code) return s;
    }
    std::cerr << "[FAIL] no entry for " << code << "\n";
    std::exit(1);
}

static void runMediumBody() {
    const Asteroid& apophis = *AsteroidCatalog::find_asteroid("apophis");
    ComparisonReport r = DefenseComparison::compare_all(apophis);

    REQUIRE(r.asteroid_id == "apophis", "report names the asteroid");
    REQUIRE(r.size_class == SizeClass::MEDIUM, "370 m is medium");
    REQUIRE(r.strategies.size() == AsteroidCatalog::strategies().size(), "one row per strategy");
    REQUIRE(r.strategies[0].strategy_id == AsteroidCatalog::strategies()[0].id, "catalog order");

    REQUIRE(near(entry(r, "DART").success_probability, 0.85 * 0.75), "DART p");
    REQUIRE(near(entry(r, "DART").effectiveness, 0.75), "medium effectiveness");
    REQUIRE(entry(r, "DART").verdict == "UNCERTAIN", "DART uncertain");
    REQUIRE(entry(r, "LASR").verdict == "HIGH RISK", "laser high risk at 0.3575");
    REQUIRE(r.best() != nullptr && r.best()->strategy_code == "NUKE", "nuclear best for medium");

    REQUIRE(r.unmitigated.casualties.label == "Global Catastrophe",
            "apophis unmitigated (got " << r.unmitigated.casualties.label << ")");
    for (const auto& s : r.strategies) {
        REQUIRE(s.residual_casualties.label == r.unmitigated.casualties.label, "label carried");
        REQUIRE(s.residual_casualties.min + s.lives_protected_min == r.unmitigated.casualties.min,
                s.strategy_code << ": min partition");
        REQUIRE(s.residual_casualties.max + s.lives_protected_max == r.unmitigated.casualties.max,
                s.strategy_code << ": max partition");
        REQUIRE(s.residual_casualties.min <= s.residual_casualties.max, "residual ordered");
    }
    REQUIRE(entry(r, "DART").residual_casualties.min
                == std::llround(100000000.0 * (1.0 - 0.85 * 0.75)),
            "residual scales by 1-p");
    pass("medium body");
}

static void runSizeClasses() {
    ComparisonReport small = DefenseComparison::compare_all(*AsteroidCatalog::find_asteroid("2024-yr4"));
    REQUIRE(small.size_class == SizeClass::SMALL, "55 m is small");
    REQUIRE(small.best()->strategy_code == "DART", "kinetic best for small");
    REQUIRE(entry(small, "DART").verdict == "FAVORABLE", "0.8075 favorable");

    ComparisonReport large = DefenseComparison::compare_all(rock(1200.0, 20.0));
    REQUIRE(large.size_class == SizeClass::LARGE, "1.2 km is large");
    REQUIRE(large.best()->strategy_code == "NUKE", "nuclear best for large");
    REQUIRE(entry(large, "DART").verdict == "HIGH RISK", "kinetic poor for large");
    REQUIRE(near(entry(large, "GRAV").success_probability, 0.72 * 0.40), "tractor large");
    pass("size classes");
}

static void runVerdictBoundaries() {
    REQUIRE(std::string(DefenseComparison::verdict_for(0.71)) == "FAVORABLE", "above 0.7");
    REQUIRE(std::string(DefenseComparison::verdict_for(0.7)) == "UNCERTAIN", "0.7 not favorable");
    REQUIRE(std::string(DefenseComparison::verdict_for(0.41)) == "UNCERTAIN", "above 0.4");
    REQUIRE(std::string(DefenseComparison::verdict_for(0.4)) == "HIGH RISK", "0.4 high risk");
    REQUIRE(std::string(DefenseComparison::verdict_for(0.0)) == "HIGH RISK", "zero");
    pass("verdict boundaries");
}

static void runLivesProtected() {
    const Asteroid& bennu = *AsteroidCatalog::find_asteroid("bennu");
    double e = DamageModel::impact_energy_mt(bennu.mass, bennu.velocity);
    double r = std::cbrt(e) * 2.5;
    REQUIRE(DefenseComparison::lives_protected_on_success(bennu) == std::llround(r * r * 1000.0),
            "round(R^2 * 1000)");

    Asteroid dud = rock(0.0, 20.0);
    REQUIRE(DefenseComparison::lives_protected_on_success(dud) == 0, "massless body");
    ComparisonReport empty;
    REQUIRE(empty.best() == nullptr, "empty report has no best");
    pass("lives protected");
}

int main() {
    runMediumBody();
    runSizeClasses();
    runVerdictBoundaries();
    runLivesProtected();
    return 0;
}
