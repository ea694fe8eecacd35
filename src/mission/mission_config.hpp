/**
 * MissionConfig: timings, speeds and scene geometry for one run.
 *
 * Defaults reproduce the standard mission cinematic. Scenario files and
 * CLI flags override individual fields (see ScenarioParser).
 * Durations are seconds of host time, distances are scene units.
 */

#ifndef ASTRA_MISSION_MISSION_CONFIG_HPP
#define ASTRA_MISSION_MISSION_CONFIG_HPP

#include "physics/kinematics.hpp"
#include <string>

namespace astra::mission {

struct ImpactConfig {
    double approach_duration = 2.0;
    double impact_duration = 0.1;
    double explosion_duration = 1.5;
    double aftermath_duration = 1.0;
    double damaged_duration = 3.0;
    double reset_duration = 0.5;

    double start_distance = 8.0;
    double earth_radius = 0.5;
    Vec3 approach_direction = normalized(Vec3{1.0, 0.3, 0.5});
};

struct MissionConfig {
    // ── Mission phases ──
    double approach_duration = 4.0;
    double launch_duration = 3.0;
    double laser_start_delay = 1.0;         // into launch, LASR only
    double gravity_field_delay = 2.0;       // into launch, GRAV only
    double verdict_delay = 2.0;             // outcome entry -> success/failure cue
    double success_exit_delay = 4.0;        // verdict -> complete
    double failure_exit_delay = 3.0;        // verdict -> impact sequence

    double time_budget = 30.0;              // HUD countdown
    double intercept_threshold = 0.3;

    // ── Kinematics ──
    RadialTrack asteroid_track;             // start 8, floor 1, 30 s
    double launch_reach = 2.0;
    double launch_arc_height = 0.5;
    double seek_speed = 3.0;                // units/s
    double gravity_tractor_speed = 1.2;     // station keeping

    // ── Destroyed vs deflected ──
    double destroy_diameter = 200.0;        // m; smaller bodies break up

    // ── Narrative deflection amount (percent) ──
    double success_deflection_min = 50.0;
    double success_deflection_max = 100.0;
    double failure_deflection_min = 0.0;
    double failure_deflection_max = 30.0;

    ImpactConfig impact;

    // ── Host loop ──
    double dt = 1.0 / 60.0;                 // model-mode frame step
    double max_sim_time = 120.0;            // runaway guard for model mode

    bool verbose = false;
};

} // namespace astra::mission

#endif // ASTRA_MISSION_MISSION_CONFIG_HPP
