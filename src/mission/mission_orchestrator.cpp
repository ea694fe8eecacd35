#include "mission/mission_orchestrator.hpp"
#include <cmath>
#include <iostream>
#include <utility>

namespace astra::mission {

const char* run_stage_to_string(RunStage stage) {
    switch (stage) {
        case RunStage::IDLE:      return "idle";
        case RunStage::MISSION:   return "mission";
        case RunStage::IMPACT:    return "impact";
        case RunStage::DONE:      return "done";
        case RunStage::CANCELLED: return "cancelled";
    }
    return "idle";
}

MissionOrchestrator::MissionOrchestrator(const Asteroid& asteroid,
                                         const DefenseStrategy& strategy,
                                         const MissionConfig& config,
                                         RandomSource& rng,
                                         std::unique_ptr<EffectEngine> effects,
                                         EventSink sink)
    : asteroid_(asteroid),
      strategy_(strategy),
      config_(config),
      rng_(rng),
      effects_(std::move(effects)),
      sink_(std::move(sink)) {
    if (!effects_) {
        effects_ = std::make_unique<ConsoleEffectEngine>(false);
    }

    mission_ = std::make_unique<MissionPhaseController>(
        asteroid_, strategy_, config_, rng_, *effects_,
        [this](const MissionEvent& evt) { queue_.push_back({false, evt}); });
}

MissionOrchestrator::~MissionOrchestrator() {
    cancel();
}

void MissionOrchestrator::start() {
    if (stage_ != RunStage::IDLE) return;
    stage_ = RunStage::MISSION;

    effects_->start();
    mission_->begin();
    deliver();
}

void MissionOrchestrator::tick(double dt) {
    if (!std::isfinite(dt) || dt < 0.0) dt = 0.0;

    switch (stage_) {
        case RunStage::MISSION:
            clock_ += dt;
            mission_->tick(dt);
            deliver();
            break;

        case RunStage::IMPACT:
            clock_ += dt;
            impact_->tick(dt);
            deliver();
            break;

        case RunStage::IDLE:
        case RunStage::DONE:
        case RunStage::CANCELLED:
            break;
    }
}

void MissionOrchestrator::cancel() {
    if (stage_ == RunStage::CANCELLED) return;

    if (config_.verbose && stage_ != RunStage::DONE) {
        std::cerr << "[MISSION] cancelled at t=" << clock_ << "s ("
                  << run_stage_to_string(stage_) << ")\n";
    }

    stage_ = RunStage::CANCELLED;
    queue_.clear();
    effects_->dispose();
}

const ImpactState* MissionOrchestrator::impact_state() const {
    return impact_ ? &impact_->state() : nullptr;
}

std::optional<DamageAssessment> MissionOrchestrator::damage() const {
    if (!impact_) return std::nullopt;
    return impact_->state().damage;
}

void MissionOrchestrator::set_damage_assessor(ImpactPhaseController::DamageAssessor assessor) {
    assessor_ = std::move(assessor);
}

void MissionOrchestrator::deliver() {
    while (!queue_.empty()) {
        std::vector<Queued> batch;
        batch.swap(queue_);
        for (const auto& q : batch) {
            bool alive = q.from_impact ? on_impact_event(q.evt) : on_mission_event(q.evt);
            if (!alive) return;   // this is gone; touch nothing
        }
    }
}

bool MissionOrchestrator::on_mission_event(const MissionEvent& evt) {
    if (stage_ != RunStage::MISSION) return true;

    switch (evt.type) {
        case MissionEventType::COMPLETE:
            return finish(true);

        case MissionEventType::SHOW_IMPACT:
            if (!dispatch(evt)) return false;
            if (stage_ != RunStage::MISSION) return true;   // host cancelled

            stage_ = RunStage::IMPACT;
            impact_ = std::make_unique<ImpactPhaseController>(
                asteroid_, config_.impact, *effects_,
                [this](const MissionEvent& e) { queue_.push_back({true, e}); },
                assessor_, config_.verbose);
            impact_->begin();
            return true;

        default:
            return dispatch(evt);
    }
}

bool MissionOrchestrator::on_impact_event(const MissionEvent& evt) {
    if (stage_ != RunStage::IMPACT) return true;

    if (!dispatch(evt)) return false;
    if (evt.type == MissionEventType::IMPACT_COMPLETE && stage_ == RunStage::IMPACT) {
        return finish(false);
    }
    return true;
}

bool MissionOrchestrator::finish(bool success) {
    MissionEvent done;
    done.type = MissionEventType::COMPLETE;
    done.success = success;
    done.outcome = success ? Outcome::SUCCESS : Outcome::FAILURE;
    done.deflection = success
        ? rng_.uniform(config_.success_deflection_min, config_.success_deflection_max)
        : rng_.uniform(config_.failure_deflection_min, config_.failure_deflection_max);

    stage_ = RunStage::DONE;
    effects_->stop();

    if (config_.verbose) {
        std::cerr << "[MISSION] complete at t=" << clock_ << "s: "
                  << (success ? "SUCCESS" : "FAILURE")
                  << ", deflection " << done.deflection << "%\n";
    }

    return dispatch(done);
}

// Returns false when the sink destroyed the orchestrator.
bool MissionOrchestrator::dispatch(MissionEvent evt) {
    if (stage_ == RunStage::CANCELLED || !sink_) return true;
    evt.time = clock_;

    std::weak_ptr<bool> alive = alive_;
    EventSink sink = sink_;   // the member dies with the orchestrator
    sink(evt);
    return !alive.expired();
}

} // namespace astra::mission
