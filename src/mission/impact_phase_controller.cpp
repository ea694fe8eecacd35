#include "mission/impact_phase_controller.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace astra::mission {

const char* impact_phase_to_string(ImpactPhase phase) {
    switch (phase) {
        case ImpactPhase::APPROACH:  return "approach";
        case ImpactPhase::IMPACT:    return "impact";
        case ImpactPhase::EXPLOSION: return "explosion";
        case ImpactPhase::AFTERMATH: return "aftermath";
        case ImpactPhase::DAMAGED:   return "damaged";
        case ImpactPhase::RESET:     return "reset";
        case ImpactPhase::COMPLETE:  return "complete";
    }
    return "approach";
}

ImpactPhaseController::ImpactPhaseController(const Asteroid& asteroid,
                                             const ImpactConfig& config,
                                             EffectEngine& effects,
                                             EventSink sink,
                                             DamageAssessor assessor,
                                             bool verbose)
    : asteroid_(asteroid),
      config_(config),
      effects_(effects),
      sink_(std::move(sink)),
      assessor_(std::move(assessor)),
      verbose_(verbose) {
    track_.origin = Vec3::Zero();
    track_.direction = config.approach_direction;
    track_.start_distance = config.start_distance;
    track_.floor_distance = config.earth_radius;
    track_.duration = config.approach_duration;
}

double ImpactPhaseController::phase_duration(ImpactPhase phase) const {
    switch (phase) {
        case ImpactPhase::APPROACH:  return config_.approach_duration;
        case ImpactPhase::IMPACT:    return config_.impact_duration;
        case ImpactPhase::EXPLOSION: return config_.explosion_duration;
        case ImpactPhase::AFTERMATH: return config_.aftermath_duration;
        case ImpactPhase::DAMAGED:   return config_.damaged_duration;
        case ImpactPhase::RESET:     return config_.reset_duration;
        case ImpactPhase::COMPLETE:  return 0.0;
    }
    return 0.0;
}

double ImpactPhaseController::explosion_scale(double energy_mt) {
    double e = std::max(0.0, energy_mt);
    return std::clamp(std::log10(e + 1.0) * 0.5, 0.3, 3.0);
}

double ImpactPhaseController::sound_intensity(double energy_mt) {
    double e = std::max(0.0, energy_mt);
    return std::clamp(std::log10(e + 1.0) * 0.3, 0.5, 1.5);
}

void ImpactPhaseController::begin() {
    if (begun_) return;
    begun_ = true;

    state_ = ImpactState{};
    state_.impact_energy_mt = DamageModel::impact_energy_mt(asteroid_.mass, asteroid_.velocity);
    state_.explosion_scale = explosion_scale(state_.impact_energy_mt);
    state_.sound_intensity = sound_intensity(state_.impact_energy_mt);
    state_.severity = DamageModel::severity(state_.impact_energy_mt);
    state_.asteroid_position = KinematicsIntegrator::radial_approach(track_, 0.0);

    if (verbose_) {
        std::cerr << "[IMPACT] " << asteroid_.name << " E=" << state_.impact_energy_mt
                  << " MT (" << severity_to_string(state_.severity) << ")\n";
    }

    pending_cues_.push_back(EffectCue::ATMOSPHERIC_ENTRY);

    MissionEvent evt;
    evt.type = MissionEventType::PHASE_CHANGED;
    evt.machine = "impact";
    evt.phase = impact_phase_to_string(state_.phase);
    pending_events_.push_back(evt);

    flush();
}

void ImpactPhaseController::tick(double dt) {
    if (!begun_ || is_complete()) return;
    if (!std::isfinite(dt) || dt < 0.0) dt = 0.0;

    state_.phase_elapsed += dt;
    state_.total_elapsed += dt;

    double duration = phase_duration(state_.phase);
    state_.progress = KinematicsIntegrator::progress(state_.phase_elapsed, duration);

    if (state_.phase == ImpactPhase::APPROACH) {
        state_.asteroid_position = KinematicsIntegrator::radial_approach(track_, state_.phase_elapsed);
    } else {
        state_.asteroid_position = KinematicsIntegrator::radial_approach(track_, track_.duration);
    }

    // One transition per tick
    if (state_.phase_elapsed >= duration) {
        switch (state_.phase) {
            case ImpactPhase::APPROACH:  enter_phase(ImpactPhase::IMPACT);    break;
            case ImpactPhase::IMPACT:    enter_phase(ImpactPhase::EXPLOSION); break;
            case ImpactPhase::EXPLOSION: enter_phase(ImpactPhase::AFTERMATH); break;
            case ImpactPhase::AFTERMATH: enter_phase(ImpactPhase::DAMAGED);   break;
            case ImpactPhase::DAMAGED:   enter_phase(ImpactPhase::RESET);     break;
            case ImpactPhase::RESET:     enter_phase(ImpactPhase::COMPLETE);  break;
            case ImpactPhase::COMPLETE:  break;
        }
    }

    flush();
}

void ImpactPhaseController::enter_phase(ImpactPhase phase) {
    state_.phase = phase;
    state_.phase_elapsed = 0.0;
    state_.progress = 0.0;

    if (verbose_) {
        std::cerr << "[IMPACT] phase -> " << impact_phase_to_string(phase)
                  << " (t=" << state_.total_elapsed << "s)\n";
    }

    MissionEvent changed;
    changed.type = MissionEventType::PHASE_CHANGED;
    changed.machine = "impact";
    changed.phase = impact_phase_to_string(phase);
    pending_events_.push_back(changed);

    switch (phase) {
        case ImpactPhase::IMPACT:
            pending_cues_.push_back(EffectCue::IMPACT);
            break;

        case ImpactPhase::EXPLOSION:
            pending_cues_.push_back(EffectCue::EXPLOSION);
            break;

        case ImpactPhase::AFTERMATH:
            pending_cues_.push_back(EffectCue::RUMBLE);
            break;

        case ImpactPhase::DAMAGED: {
            if (damage_assessed_) break;
            damage_assessed_ = true;
            state_.damage = assessor_(asteroid_.mass, asteroid_.velocity);

            if (verbose_) {
                std::cerr << "[IMPACT] damage: " << state_.damage->casualties.label
                          << ", radius " << state_.damage->destruction_radius_km << " km\n";
            }

            MissionEvent ready;
            ready.type = MissionEventType::DAMAGE_READY;
            ready.outcome = Outcome::FAILURE;
            ready.damage = state_.damage;
            pending_events_.push_back(ready);
            break;
        }

        case ImpactPhase::RESET: {
            state_.fading = true;
            MissionEvent fade;
            fade.type = MissionEventType::FADE_OUT;
            pending_events_.push_back(fade);
            break;
        }

        case ImpactPhase::COMPLETE: {
            state_.progress = 1.0;
            MissionEvent done;
            done.type = MissionEventType::IMPACT_COMPLETE;
            done.outcome = Outcome::FAILURE;
            pending_events_.push_back(done);
            break;
        }

        case ImpactPhase::APPROACH:
            break;
    }
}

void ImpactPhaseController::flush() {
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
