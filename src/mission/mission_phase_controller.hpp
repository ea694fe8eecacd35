/**
 * MissionPhaseController: approach, launch, intercept, outcome.
 *
 *   approach   (4 s)   asteroid on its radial track, spacecraft parked
 *   launch     (3 s)   spacecraft climbs out on a launch arc
 *   intercept          spacecraft seeks the asteroid
 *   outcome            terminal; verdict cue, then exit
 *
 * Every tick runs in a fixed order: kinematics, distance recompute,
 * transition and outcome checks, then cue/event emission.
 *
 * The success draw happens once, on the first tick the spacecraft is
 * inside the intercept threshold. The check keeps running after that
 * (intercept and outcome phases) but the outcome latch turns it into a
 * no-op.
 *
 * Exit is either SHOW_IMPACT (failure) or COMPLETE (success); after
 * exit the ambience is stopped and further ticks do nothing.
 */

#ifndef ASTRA_MISSION_MISSION_PHASE_CONTROLLER_HPP
#define ASTRA_MISSION_MISSION_PHASE_CONTROLLER_HPP

#include "core/sim_rng.hpp"
#include "data/asteroid_catalog.hpp"
#include "mission/effect_engine.hpp"
#include "mission/mission_config.hpp"
#include "mission/mission_events.hpp"
#include "mission/outcome_resolver.hpp"
#include <vector>

namespace astra::mission {

enum class MissionPhase {
    APPROACH,
    LAUNCH,
    INTERCEPT,
    OUTCOME
};

const char* mission_phase_to_string(MissionPhase phase);

/** Read-only mission snapshot for renderers and the HUD. */
struct MissionState {
    MissionPhase phase = MissionPhase::APPROACH;
    double phase_elapsed = 0.0;
    double mission_elapsed = 0.0;

    Vec3 asteroid_position;
    Vec3 spacecraft_position;
    Vec3 explosion_position;
    double distance_to_earth = 0.0;
    double distance_to_target = 0.0;
    double time_remaining = 0.0;

    Outcome outcome = Outcome::PENDING;
    Resolution resolution;

    bool show_explosion = false;
    bool show_laser = false;
    bool show_gravity_field = false;
    bool asteroid_destroyed = false;
    bool asteroid_deflected = false;

    double success_probability = 0.0;   // display estimate, percent
    bool exited = false;
};

class MissionPhaseController {
public:
    MissionPhaseController(const Asteroid& asteroid, const DefenseStrategy& strategy,
                           const MissionConfig& config, RandomSource& rng,
                           EffectEngine& effects, EventSink sink);

    /** Place bodies, start ambience, announce the approach phase. */
    void begin();

    /** Advance by dt seconds. Non-finite or negative dt counts as zero. */
    void tick(double dt);

    const MissionState& state() const { return state_; }

    bool outcome_determined() const { return latches_.outcome_determined; }
    int resolution_count() const { return resolution_count_; }

private:
    // Once-only guards
    struct Latches {
        bool begun = false;
        bool launch_cue = false;
        bool laser_started = false;
        bool outcome_determined = false;
        bool verdict_emitted = false;
        bool exit_emitted = false;
    };

    const Asteroid& asteroid_;
    const DefenseStrategy& strategy_;
    const MissionConfig& config_;
    RandomSource& rng_;
    EffectEngine& effects_;
    EventSink sink_;

    MissionState state_;
    Latches latches_;
    int resolution_count_ = 0;
    double seek_speed_;

    std::vector<EffectCue> pending_cues_;
    std::vector<MissionEvent> pending_events_;

    void update_kinematics(double dt);
    void update_distances();
    void check_phase();
    void check_intercept();
    void check_outcome_timers();
    void enter_phase(MissionPhase phase);
    void exit_mission(const MissionEvent& exit_event);
    void flush();
};

} // namespace astra::mission

#endif // ASTRA_MISSION_MISSION_PHASE_CONTROLLER_HPP
