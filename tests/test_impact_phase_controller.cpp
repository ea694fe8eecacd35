#include "mission/impact_phase_controller.hpp"
#include "test_common.hpp"
#include <algorithm>
#include <limits>
#include <string>

using namespace astra;
using namespace astra::mission;

namespace {

struct Recorder {
    std::vector<MissionEvent> events;

    EventSink sink() {
        return [this](const MissionEvent& e) { events.push_back(e); };
    }

    std::vector<std::string> phases() const {
        std::vector<std::string> out;
        for (const auto& e : events) {
            if (e.type == MissionEventType::PHASE_CHANGED) out.push_back(e.phase);
        }
        return out;
    }

    int count(MissionEventType type) const {
        return static_cast<int>(std::count_if(events.begin(), events.end(),
            [type](const MissionEvent& e) { return e.type == type; }));
    }
};

} // namespace

static const Asteroid& apophis() {
    return *AsteroidCatalog::find_asteroid("apophis");
}

static void runPhaseSequence() {
    ImpactConfig config;
    RecordingEffectEngine effects;
    Recorder rec;

    ImpactPhaseController c(apophis(), config, effects, rec.sink());
    c.begin();
    REQUIRE(c.state().phase == ImpactPhase::APPROACH, "starts in approach");
    REQUIRE(near(c.state().asteroid_position.norm(), config.start_distance), "starts far out");

    int ticks = 0;
    while (!c.is_complete() && ticks < 10000) {
        c.tick(0.05);
        ticks++;
    }
    REQUIRE(c.is_complete(), "reaches complete");

    const std::vector<std::string> expected = {
        "approach", "impact", "explosion", "aftermath", "damaged", "reset", "complete"};
    REQUIRE(rec.phases() == expected, "phase order");
    for (const auto& e : rec.events) {
        if (e.type == MissionEventType::PHASE_CHANGED) {
            REQUIRE(e.machine == "impact", "impact machine tag");
        }
    }

    REQUIRE(rec.count(MissionEventType::DAMAGE_READY) == 1, "one DAMAGE_READY");
    REQUIRE(rec.count(MissionEventType::FADE_OUT) == 1, "one FADE_OUT");
    REQUIRE(rec.count(MissionEventType::IMPACT_COMPLETE) == 1, "one IMPACT_COMPLETE");
    REQUIRE(rec.events.back().type == MissionEventType::IMPACT_COMPLETE, "complete is last");

    const std::vector<EffectCue> cues = {
        EffectCue::ATMOSPHERIC_ENTRY, EffectCue::IMPACT, EffectCue::EXPLOSION, EffectCue::RUMBLE};
    REQUIRE(effects.cues() == cues, "entry cues in order");

    // 8.1 s of phases, each phase can overrun by at most one tick
    double total = c.state().total_elapsed;
    REQUIRE(total >= 8.1 - 1e-9 && total <= 8.1 + 6 * 0.05 + 1e-9,
            "total cinematic time (got " << total << ")");

    REQUIRE(near(c.state().asteroid_position.norm(), config.earth_radius, 1e-9),
            "asteroid rests at the surface");
    REQUIRE(c.state().fading, "fade flag set");
    REQUIRE(c.state().progress == 1.0, "complete reports full progress");

    size_t before = rec.events.size();
    for (int i = 0; i < 50; i++) c.tick(1.0);
    REQUIRE(rec.events.size() == before, "no events after complete");
    pass("phase sequence");
}

static void runOneTransitionPerTick() {
    ImpactConfig config;
    RecordingEffectEngine effects;
    Recorder rec;

    ImpactPhaseController c(apophis(), config, effects, rec.sink());
    c.begin();

    // A huge dt only ever advances one phase
    const ImpactPhase order[] = {ImpactPhase::IMPACT, ImpactPhase::EXPLOSION,
                                 ImpactPhase::AFTERMATH, ImpactPhase::DAMAGED,
                                 ImpactPhase::RESET, ImpactPhase::COMPLETE};
    for (ImpactPhase next : order) {
        c.tick(1000.0);
        REQUIRE(c.state().phase == next, "single step to " << impact_phase_to_string(next));
        REQUIRE(c.state().phase_elapsed == 0.0, "leftover time dropped");
    }
    REQUIRE(rec.phases().size() == 7, "seven phase announcements");
    pass("one transition per tick");
}

static void runDamageAssessedOnce() {
    for (int seed : {1, 2, 3, 4, 5}) {
        ImpactConfig config;
        RecordingEffectEngine effects;
        Recorder rec;
        int calls = 0;
        double seen_mass = 0.0, seen_velocity = 0.0;

        ImpactPhaseController c(apophis(), config, effects, rec.sink(),
            [&](double mass, double velocity) {
                calls++;
                seen_mass = mass;
                seen_velocity = velocity;
                return DamageModel::assess(mass, velocity);
            });
        c.begin();

        SimRNG dt_source(seed);
        int ticks = 0;
        while (!c.is_complete() && ticks < 100000) {
            double dt = dt_source.uniform(0.0, 0.4);
            if (ticks % 11 == 0) dt = std::numeric_limits<double>::quiet_NaN();
            if (ticks % 13 == 0) dt = -0.5;
            c.tick(dt);
            ticks++;
        }

        REQUIRE(c.is_complete(), "seed " << seed << " completes");
        REQUIRE(calls == 1, "seed " << seed << ": assessor called once (got " << calls << ")");
        REQUIRE(seen_mass == apophis().mass && seen_velocity == apophis().velocity,
                "assessor receives the asteroid's mass and velocity");
        REQUIRE(c.state().damage.has_value(), "damage latched");

        const MissionEvent* ready = nullptr;
        for (const auto& e : rec.events) {
            if (e.type == MissionEventType::DAMAGE_READY) ready = &e;
        }
        REQUIRE(ready != nullptr && ready->damage.has_value(), "DAMAGE_READY carries the assessment");
        REQUIRE(*ready->damage == *c.state().damage, "event and state agree");
    }
    pass("damage assessed once");
}

static void runNoDamageBeforeDamagedPhase() {
    ImpactConfig config;
    RecordingEffectEngine effects;
    Recorder rec;
    int calls = 0;

    ImpactPhaseController c(apophis(), config, effects, rec.sink(),
        [&](double m, double v) { calls++; return DamageModel::assess(m, v); });
    c.begin();
    while (c.state().phase != ImpactPhase::DAMAGED) {
        REQUIRE(calls == 0 && !c.state().damage, "no assessment before damaged");
        c.tick(0.1);
    }
    REQUIRE(calls == 1, "assessed on entry to damaged");
    pass("no damage before damaged phase");
}

static void runScaleClamps() {
    REQUIRE(near(ImpactPhaseController::explosion_scale(0.0), 0.3), "scale floor");
    REQUIRE(near(ImpactPhaseController::explosion_scale(-50.0), 0.3), "negative energy floors");
    REQUIRE(near(ImpactPhaseController::explosion_scale(99.0), 1.0), "log10(100)*0.5");
    REQUIRE(near(ImpactPhaseController::explosion_scale(1e9), 3.0), "scale ceiling");

    REQUIRE(near(ImpactPhaseController::sound_intensity(0.0), 0.5), "sound floor");
    REQUIRE(near(ImpactPhaseController::sound_intensity(99.0), 0.6), "log10(100)*0.3");
    REQUIRE(near(ImpactPhaseController::sound_intensity(1e9), 1.5), "sound ceiling");

    ImpactConfig config;
    RecordingEffectEngine effects;
    ImpactPhaseController c(apophis(), config, effects, EventSink{});
    c.begin();
    double e = DamageModel::impact_energy_mt(apophis().mass, apophis().velocity);
    REQUIRE(near_rel(c.state().impact_energy_mt, e), "energy from catalog mass and velocity");
    REQUIRE(near(c.state().explosion_scale, ImpactPhaseController::explosion_scale(e)),
            "scale published at begin");
    REQUIRE(c.state().severity == DamageModel::severity(e), "severity published at begin");
    pass("scale clamps");
}

static void runTickBeforeBegin() {
    ImpactConfig config;
    RecordingEffectEngine effects;
    Recorder rec;
    ImpactPhaseController c(apophis(), config, effects, rec.sink());

    c.tick(10.0);
    REQUIRE(rec.events.empty() && effects.cues().empty(), "tick before begin does nothing");
    REQUIRE(c.state().phase == ImpactPhase::APPROACH, "still approach");

    c.begin();
    c.begin();
    REQUIRE(rec.events.size() == 1, "begin announces once");
    REQUIRE(effects.cues().size() == 1 && effects.cues()[0] == EffectCue::ATMOSPHERIC_ENTRY,
            "atmospheric entry cue");
    pass("tick before begin");
}

int main() {
    runPhaseSequence();
    runOneTransitionPerTick();
    runDamageAssessedOnce();
    runNoDamageBeforeDamagedPhase();
    runScaleClamps();
    runTickBeforeBegin();
    return 0;
}
