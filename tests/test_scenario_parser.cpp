#include "mission/scenario_parser.hpp"
#include "test_common.hpp"
#include <cstdio>
#include <fstream>
#include <string>

using namespace astra;
using namespace astra::mission;

static Scenario parse_text(const std::string& text) {
    return ScenarioParser::parse(JsonReader::parse(text));
}

static std::string error_of(const std::string& text) {
    try {
        parse_text(text);
    } catch (const std::runtime_error& e) {
        return e.what();
    }
    return "";
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

static void runCatalogIds() {
    Scenario s = parse_text("{\"asteroid\": \"bennu\", \"strategy\": \"NUKE\"}");
    REQUIRE(s.asteroid.id == "bennu" && s.asteroid.diameter == 492.0, "catalog asteroid");
    REQUIRE(s.strategy.id == "nuclear", "strategy by code");
    REQUIRE(s.name == "Bennu / NUKE", "default name (got " << s.name << ")");
    REQUIRE(s.config.approach_duration == 4.0 && s.config.dt == 1.0 / 60.0, "default config");

    Scenario named = parse_text(
        "{\"name\": \"Drill\", \"asteroid\": \"APOPHIS\", \"strategy\": \"gravity\"}");
    REQUIRE(named.name == "Drill", "explicit name");
    REQUIRE(named.asteroid.id == "apophis", "case-insensitive id");
    REQUIRE(named.strategy.code == "GRAV", "strategy by id");

    Scenario cat = ScenarioParser::from_catalog("2023-dw", "laser");
    REQUIRE(cat.asteroid.name == "2023 DW" && cat.strategy.code == "LASR", "from_catalog");
    pass("catalog ids");
}

static void runInlineDefinitions() {
    Scenario s = parse_text(R"({
        "asteroid": {"preset": "City Killer", "name": "Drill Rock", "velocity": 25, "id": "drill-1"},
        "strategy": {"base": "kinetic", "successRate": 0.9, "effectiveness": {"small": 0.5}}
    })");

    REQUIRE(s.asteroid.is_custom, "inline asteroid is custom");
    REQUIRE(s.asteroid.id == "drill-1", "explicit id kept");
    REQUIRE(s.asteroid.name == "Drill Rock", "name");
    REQUIRE(s.asteroid.diameter == 100.0, "preset diameter");
    REQUIRE(s.asteroid.velocity == 25.0, "override wins over preset");
    REQUIRE(s.asteroid.torino_scale == 4, "preset torino");
    REQUIRE(near_rel(s.asteroid.mass, calculate_mass(100.0)), "derived mass");

    REQUIRE(s.strategy.code == "DART" && s.strategy.id == "kinetic", "base inherited");
    REQUIRE(s.strategy.success_rate == 0.9, "success rate override");
    REQUIRE(s.strategy.effectiveness.small == 0.5, "effectiveness override");
    REQUIRE(s.strategy.effectiveness.medium == 0.75, "untouched effectiveness inherited");

    Scenario fresh = parse_text(R"({
        "asteroid": {"diameter": 80, "velocity": 12, "torinoScale": 2, "mass": 1e9},
        "strategy": {"code": "SAIL", "successRate": 0.4,
                     "effectiveness": {"small": 0.3, "medium": 0.2, "large": 0.1}}
    })");
    REQUIRE(fresh.asteroid.mass == 1e9, "explicit mass");
    REQUIRE(fresh.asteroid.name.rfind("Custom-", 0) == 0, "generated name");
    REQUIRE(fresh.strategy.id == "SAIL" && fresh.strategy.name == "SAIL", "id and name from code");
    REQUIRE(!fresh.strategy.is_nuclear() && !fresh.strategy.is_laser(), "plain strategy");
    REQUIRE(fresh.strategy.tech_readiness == 1, "default readiness");

    Scenario edge = parse_text(R"({
        "asteroid": {"diameter": 10000, "velocity": 72},
        "strategy": {"base": "laser", "techReadiness": 9}
    })");
    REQUIRE(edge.asteroid.diameter == 10000.0 && edge.asteroid.velocity == 72.0, "upper bounds accepted");
    REQUIRE(edge.strategy.tech_readiness == 9, "readiness override");
    pass("inline definitions");
}

static void runUnknownIds() {
    REQUIRE(error_of("{\"asteroid\": \"ceres\", \"strategy\": \"DART\"}") == "Unknown asteroid: ceres",
            "unknown asteroid message");
    REQUIRE(error_of("{\"asteroid\": \"bennu\", \"strategy\": \"sail\"}")
                == "Unknown defense strategy: sail",
            "unknown strategy message");
    REQUIRE(contains(error_of(
                "{\"asteroid\": {\"preset\": \"Planet Killer\"}, \"strategy\": \"DART\"}"),
                "Unknown asteroid preset"),
            "unknown preset");
    REQUIRE(contains(error_of("{\"asteroid\": \"bennu\", \"strategy\": {\"base\": \"warp\"}}"),
                     "Unknown defense strategy: warp"),
            "unknown strategy base");
    REQUIRE_THROWS(ScenarioParser::from_catalog("vesta", "DART"), "from_catalog unknown asteroid");
    pass("unknown ids");
}

static void runValidation() {
    struct Case { const char* json; const char* fragment; };
    const Case cases[] = {
        {"[]", "must be a JSON object"},
        {"{\"strategy\": \"DART\"}", "needs 'asteroid'"},
        {"{\"asteroid\": \"bennu\"}", "needs 'strategy'"},
        {"{\"asteroid\": {\"diameter\": -5}, \"strategy\": \"DART\"}", "diameter must be within [1, 10000] m"},
        {"{\"asteroid\": {\"diameter\": 1000000, \"velocity\": 72}, \"strategy\": \"DART\"}",
         "diameter must be within"},
        {"{\"asteroid\": {\"velocity\": 0.5}, \"strategy\": \"DART\"}", "velocity must be within [1, 72] km/s"},
        {"{\"asteroid\": {\"velocity\": 80}, \"strategy\": \"DART\"}", "velocity must be within"},
        {"{\"asteroid\": {\"diameter\": \"big\"}, \"strategy\": \"DART\"}", "'diameter' must be a number"},
        {"{\"asteroid\": {\"torinoScale\": 11}, \"strategy\": \"DART\"}", "torinoScale"},
        {"{\"asteroid\": {\"impactProbability\": 2}, \"strategy\": \"DART\"}", "impactProbability"},
        {"{\"asteroid\": {\"mass\": 0}, \"strategy\": \"DART\"}", "mass must be > 0"},
        {"{\"asteroid\": \"bennu\", \"strategy\": {\"successRate\": 0.5}}", "needs a 'code'"},
        {"{\"asteroid\": \"bennu\", \"strategy\": {\"base\": \"DART\", \"successRate\": 1.5}}", "successRate"},
        {"{\"asteroid\": \"bennu\", \"strategy\": {\"base\": \"DART\", \"effectiveness\": {\"large\": -0.1}}}",
         "effectiveness.large"},
        {"{\"asteroid\": \"bennu\", \"strategy\": {\"base\": \"DART\", \"techReadiness\": 12}}",
         "techReadiness must be an integer within [1, 9]"},
        {"{\"asteroid\": \"bennu\", \"strategy\": {\"base\": \"DART\", \"techReadiness\": 1e12}}",
         "techReadiness"},
        {"{\"asteroid\": \"bennu\", \"strategy\": {\"base\": \"DART\", \"techReadiness\": 3.5}}",
         "techReadiness"},
        {"{\"asteroid\": \"bennu\", \"strategy\": {\"base\": \"DART\", \"techReadiness\": \"high\"}}",
         "'techReadiness' must be a number"},
        {"{\"asteroid\": \"bennu\", \"strategy\": \"DART\", \"config\": 5}", "'config' must be an object"},
        {"{\"asteroid\": \"bennu\", \"strategy\": \"DART\", \"config\": {\"seekSpeed\": 0}}", "seekSpeed"},
        {"{\"asteroid\": \"bennu\", \"strategy\": \"DART\", \"config\": {\"dt\": -1}}", "dt must be > 0"},
        {"{\"asteroid\": \"bennu\", \"strategy\": \"DART\", \"config\": {\"verdictDelay\": -2}}",
         "verdictDelay"},
        {"{\"asteroid\": \"bennu\", \"strategy\": \"DART\", \"config\": {\"track\": {\"startDistance\": 0.5}}}",
         "track.startDistance"},
        {"{\"asteroid\": \"bennu\", \"strategy\": \"DART\", \"config\": {\"impact\": {\"earthRadius\": 0}}}",
         "impact.earthRadius"},
    };
    for (const auto& c : cases) {
        std::string e = error_of(c.json);
        REQUIRE(contains(e, c.fragment),
                c.json << " -> expected '" << c.fragment << "', got '" << e << "'");
    }
    pass("validation");
}

static void runConfigOverrides() {
    Scenario s = parse_text(R"({
        "asteroid": "apophis", "strategy": "DART",
        "config": {
            "approachDuration": 2, "launchDuration": 1.5, "interceptThreshold": 0.5,
            "seekSpeed": 4, "destroyDiameter": 400, "dt": 0.02, "verbose": true,
            "track": {"startDistance": 10, "floorDistance": 2, "duration": 20},
            "impact": {"damagedDuration": 1, "startDistance": 6}
        }
    })");

    const MissionConfig& c = s.config;
    REQUIRE(c.approach_duration == 2.0 && c.launch_duration == 1.5, "phase durations");
    REQUIRE(c.intercept_threshold == 0.5 && c.seek_speed == 4.0, "kinematics");
    REQUIRE(c.destroy_diameter == 400.0, "destroy threshold");
    REQUIRE(c.dt == 0.02 && c.verbose, "run settings");
    REQUIRE(c.asteroid_track.start_distance == 10.0 && c.asteroid_track.floor_distance == 2.0
            && c.asteroid_track.duration == 20.0, "track");
    REQUIRE(c.impact.damaged_duration == 1.0 && c.impact.start_distance == 6.0, "impact block");
    REQUIRE(c.impact.reset_duration == 0.5, "unspecified impact fields keep defaults");
    REQUIRE(c.verdict_delay == 2.0 && c.gravity_tractor_speed == 1.2, "untouched defaults");
    pass("config overrides");
}

static void runParseFile() {
    const std::string path = "test_scenario_parser_tmp.json";
    {
        std::ofstream f(path);
        f << "{\"name\": \"From disk\", \"asteroid\": \"2021-qm1\", \"strategy\": \"LASR\"}";
    }
    Scenario s = ScenarioParser::parse_file(path);
    REQUIRE(s.name == "From disk" && s.asteroid.id == "2021-qm1", "file scenario");

    {
        std::ofstream f(path);
        f << "{\"asteroid\": \"2021-qm1\",\n \"strategy\": }";
    }
    try {
        ScenarioParser::parse_file(path);
        REQUIRE(false, "malformed file should throw");
    } catch (const std::runtime_error& e) {
        REQUIRE(contains(e.what(), path), "error names the file (got " << e.what() << ")");
        REQUIRE(contains(e.what(), "line 2"), "error carries the line");
    }
    std::remove(path.c_str());

    REQUIRE_THROWS(ScenarioParser::parse_file("/nonexistent/astra.json"), "missing file");
    pass("parse file");
}

int main() {
    runCatalogIds();
    runInlineDefinitions();
    runUnknownIds();
    runValidation();
    runConfigOverrides();
    runParseFile();
    return 0;
}
