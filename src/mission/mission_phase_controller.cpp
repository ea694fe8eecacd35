#include "mission/mission_phase_controller.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace astra::mission {

const char* mission_phase_to_string(MissionPhase phase) {
    switch (phase) {
        case MissionPhase::APPROACH:  return "approach";
        case MissionPhase::LAUNCH:    return "launch";
        case MissionPhase::INTERCEPT: return "intercept";
        case MissionPhase::OUTCOME:   return "outcome";
    }
    return "approach";
}

MissionPhaseController::MissionPhaseController(const Asteroid& asteroid,
                                               const DefenseStrategy& strategy,
                                               const MissionConfig& config,
                                               RandomSource& rng,
                                               EffectEngine& effects,
                                               EventSink sink)
    : asteroid_(asteroid),
      strategy_(strategy),
      config_(config),
      rng_(rng),
      effects_(effects),
      sink_(std::move(sink)),
      seek_speed_(strategy.is_gravity_tractor() ? config.gravity_tractor_speed
                                                : config.seek_speed) {}

void MissionPhaseController::begin() {
    if (latches_.begun) return;
    latches_.begun = true;

    state_ = MissionState{};
    state_.asteroid_position = KinematicsIntegrator::radial_approach(config_.asteroid_track, 0.0);
    state_.spacecraft_position = config_.asteroid_track.origin;
    state_.time_remaining = config_.time_budget;
    state_.success_probability = OutcomeResolver::display_probability(strategy_, asteroid_);
    update_distances();

    if (config_.verbose) {
        std::cerr << "[MISSION] " << strategy_.code << " vs " << asteroid_.name
                  << " (d=" << asteroid_.diameter << "m, torino=" << asteroid_.torino_scale
                  << ", est=" << state_.success_probability << "%)\n";
    }

    pending_cues_.push_back(EffectCue::SPACE_AMBIENCE_START);

    MissionEvent evt;
    evt.type = MissionEventType::PHASE_CHANGED;
    evt.machine = "mission";
    evt.phase = mission_phase_to_string(state_.phase);
    pending_events_.push_back(evt);

    flush();
}

void MissionPhaseController::tick(double dt) {
    if (!latches_.begun || state_.exited) return;
    if (!std::isfinite(dt) || dt < 0.0) dt = 0.0;

    state_.phase_elapsed += dt;
    state_.mission_elapsed += dt;

    // Order: kinematics -> distances -> checks -> emission
    update_kinematics(dt);
    update_distances();

    check_phase();
    if (state_.phase == MissionPhase::INTERCEPT || state_.phase == MissionPhase::OUTCOME) {
        check_intercept();
    }
    if (state_.phase == MissionPhase::OUTCOME) {
        check_outcome_timers();
    }

    state_.time_remaining = state_.phase == MissionPhase::OUTCOME
        ? 0.0
        : std::max(0.0, config_.time_budget - state_.mission_elapsed);

    flush();
}

void MissionPhaseController::update_kinematics(double dt) {
    const Vec3& earth = config_.asteroid_track.origin;

    state_.asteroid_position =
        KinematicsIntegrator::radial_approach(config_.asteroid_track, state_.mission_elapsed);

    switch (state_.phase) {
        case MissionPhase::APPROACH:
            state_.spacecraft_position = earth;
            break;

        case MissionPhase::LAUNCH: {
            Vec3 dir = normalized(state_.asteroid_position - earth);
            double p = KinematicsIntegrator::progress(state_.phase_elapsed, config_.launch_duration);
            state_.spacecraft_position = KinematicsIntegrator::launch_arc(
                earth, dir, p, config_.launch_reach, config_.launch_arc_height);
            break;
        }

        case MissionPhase::INTERCEPT: {
            SeekResult step = KinematicsIntegrator::seek(
                state_.spacecraft_position, state_.asteroid_position, seek_speed_, dt);
            state_.spacecraft_position = step.position;
            break;
        }

        case MissionPhase::OUTCOME:
            break;
    }
}

void MissionPhaseController::update_distances() {
    state_.distance_to_earth = distance(state_.asteroid_position, config_.asteroid_track.origin);
    state_.distance_to_target = distance(state_.asteroid_position, state_.spacecraft_position);
}

void MissionPhaseController::check_phase() {
    switch (state_.phase) {
        case MissionPhase::APPROACH:
            if (state_.phase_elapsed >= config_.approach_duration) {
                enter_phase(MissionPhase::LAUNCH);
            }
            break;

        case MissionPhase::LAUNCH:
            if (strategy_.is_laser() && state_.phase_elapsed > config_.laser_start_delay
                && !latches_.laser_started) {
                latches_.laser_started = true;
                state_.show_laser = true;
                pending_cues_.push_back(EffectCue::LASER_BEAM_START);
            }
            if (strategy_.is_gravity_tractor() && state_.phase_elapsed > config_.gravity_field_delay) {
                state_.show_gravity_field = true;
            }
            if (state_.phase_elapsed >= config_.launch_duration) {
                enter_phase(MissionPhase::INTERCEPT);
            }
            break;

        case MissionPhase::INTERCEPT:
        case MissionPhase::OUTCOME:
            break;
    }
}

void MissionPhaseController::check_intercept() {
    if (latches_.outcome_determined) return;
    if (!(state_.distance_to_target < config_.intercept_threshold)) return;

    latches_.outcome_determined = true;
    resolution_count_++;

    state_.resolution = OutcomeResolver::resolve(strategy_, asteroid_, rng_);
    state_.outcome = state_.resolution.outcome;
    state_.show_explosion = true;
    state_.explosion_position = state_.asteroid_position;

    if (strategy_.is_laser()) {
        state_.show_laser = false;
        pending_cues_.push_back(EffectCue::LASER_BEAM_STOP);
    }
    pending_cues_.push_back(strategy_.is_nuclear() ? EffectCue::NUCLEAR_EXPLOSION
                                                   : EffectCue::IMPACT);

    bool success = state_.outcome == Outcome::SUCCESS;
    if (success) {
        if (strategy_.is_nuclear() || asteroid_.diameter < config_.destroy_diameter) {
            state_.asteroid_destroyed = true;
        } else {
            state_.asteroid_deflected = true;
        }
    }

    if (config_.verbose) {
        std::cerr << "[MISSION] intercept at t=" << state_.mission_elapsed
                  << "s: draw=" << state_.resolution.draw
                  << " chance=" << state_.resolution.chance
                  << " -> " << outcome_to_string(state_.outcome) << "\n";
    }

    MissionEvent evt;
    evt.type = MissionEventType::OUTCOME_RESOLVED;
    evt.outcome = state_.outcome;
    evt.chance = state_.resolution.chance;
    evt.draw = state_.resolution.draw;
    evt.success = success;
    pending_events_.push_back(evt);

    enter_phase(MissionPhase::OUTCOME);
}

void MissionPhaseController::check_outcome_timers() {
    bool success = state_.outcome == Outcome::SUCCESS;

    if (!latches_.verdict_emitted && state_.phase_elapsed >= config_.verdict_delay) {
        latches_.verdict_emitted = true;
        pending_cues_.push_back(success ? EffectCue::SUCCESS : EffectCue::FAILURE);
    }

    if (!latches_.verdict_emitted || latches_.exit_emitted) return;

    if (success) {
        if (state_.phase_elapsed >= config_.verdict_delay + config_.success_exit_delay) {
            MissionEvent evt;
            evt.type = MissionEventType::COMPLETE;
            evt.outcome = Outcome::SUCCESS;
            evt.success = true;
            exit_mission(evt);
        }
    } else {
        if (state_.phase_elapsed >= config_.verdict_delay + config_.failure_exit_delay) {
            MissionEvent evt;
            evt.type = MissionEventType::SHOW_IMPACT;
            evt.outcome = Outcome::FAILURE;
            exit_mission(evt);
        }
    }
}

void MissionPhaseController::enter_phase(MissionPhase phase) {
    state_.phase = phase;
    state_.phase_elapsed = 0.0;

    if (phase == MissionPhase::LAUNCH && !latches_.launch_cue) {
        latches_.launch_cue = true;
        pending_cues_.push_back(EffectCue::LAUNCH);
    }

    if (config_.verbose) {
        std::cerr << "[MISSION] phase -> " << mission_phase_to_string(phase)
                  << " (t=" << state_.mission_elapsed << "s)\n";
    }

    MissionEvent evt;
    evt.type = MissionEventType::PHASE_CHANGED;
    evt.machine = "mission";
    evt.phase = mission_phase_to_string(phase);
    pending_events_.push_back(evt);
}

void MissionPhaseController::exit_mission(const MissionEvent& exit_event) {
    latches_.exit_emitted = true;
    state_.exited = true;
    pending_cues_.push_back(EffectCue::SPACE_AMBIENCE_STOP);
    pending_events_.push_back(exit_event);
}

void MissionPhaseController::flush() {
    // The sink must not destroy this controller; MissionOrchestrator queues
    std::vector<EffectCue> cues;
    std::vector<MissionEvent> events;
    cues.swap(pending_cues_);
    events.swap(pending_events_);

    for (EffectCue cue : cues) {
        effects_.trigger(cue);
    }
    if (!sink_) return;
    for (const auto& evt : events) {
        sink_(evt);
    }
}

} // namespace astra::mission
