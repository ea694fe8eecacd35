/**
 * MissionOrchestrator: one mission run, end to end.
 *
 * Owns the effect engine and both phase machines. Forwards their events
 * to the host sink stamped with the run clock, and handles the handoffs:
 *
 *   mission COMPLETE  -> host COMPLETE(success, deflection in [50, 100))
 *   mission SHOW_IMPACT -> impact machine starts
 *   IMPACT_COMPLETE   -> host COMPLETE(failure, deflection in [0, 30))
 *
 * A null effect engine is replaced by a quiet ConsoleEffectEngine.
 *
 * cancel() (also run by the destructor) disposes the effect engine and
 * silences everything: no event is delivered afterwards, not even the
 * rest of a batch that was being dispatched when cancel() was called.
 *
 * Machine events are queued while a machine runs and delivered to the
 * host only after its begin() or tick() has returned. The host may
 * destroy the orchestrator from inside the sink; delivery stops there.
 *
 * Not copyable or movable; the controllers hold references into it.
 */

#ifndef ASTRA_MISSION_MISSION_ORCHESTRATOR_HPP
#define ASTRA_MISSION_MISSION_ORCHESTRATOR_HPP

#include "core/sim_rng.hpp"
#include "core/simulation_engine.hpp"
#include "data/asteroid_catalog.hpp"
#include "mission/effect_engine.hpp"
#include "mission/impact_phase_controller.hpp"
#include "mission/mission_config.hpp"
#include "mission/mission_events.hpp"
#include "mission/mission_phase_controller.hpp"
#include <memory>
#include <vector>

namespace astra::mission {

enum class RunStage {
    IDLE,
    MISSION,
    IMPACT,
    DONE,
    CANCELLED
};

const char* run_stage_to_string(RunStage stage);

class MissionOrchestrator : public SimulationClient {
public:
    MissionOrchestrator(const Asteroid& asteroid, const DefenseStrategy& strategy,
                        const MissionConfig& config, RandomSource& rng,
                        std::unique_ptr<EffectEngine> effects, EventSink sink);
    ~MissionOrchestrator() override;

    MissionOrchestrator(const MissionOrchestrator&) = delete;
    MissionOrchestrator& operator=(const MissionOrchestrator&) = delete;

    /** Start effects and the mission machine. */
    void start();

    /** Advance the active machine. No-op unless started and not finished. */
    void tick(double dt) override;

    void cancel();

    RunStage stage() const { return stage_; }
    bool is_finished() const override { return stage_ == RunStage::DONE || stage_ == RunStage::CANCELLED; }
    double clock() const { return clock_; }

    const Asteroid& asteroid() const { return asteroid_; }
    const DefenseStrategy& strategy() const { return strategy_; }
    const MissionConfig& config() const { return config_; }

    const MissionState& mission_state() const { return mission_->state(); }
    const MissionPhaseController& mission() const { return *mission_; }

    /** nullptr until the impact sequence has started. */
    const ImpactState* impact_state() const;

    /** Stays valid after cancel(), in the disposed state. */
    const EffectEngine& effects() const { return *effects_; }

    /** Assessment from the impact sequence, if it ran that far. */
    std::optional<DamageAssessment> damage() const;

    /** Lets tests count or replace damage assessments. */
    void set_damage_assessor(ImpactPhaseController::DamageAssessor assessor);

private:
    const Asteroid asteroid_;
    const DefenseStrategy strategy_;
    const MissionConfig config_;
    RandomSource& rng_;
    std::unique_ptr<EffectEngine> effects_;
    EventSink sink_;

    RunStage stage_ = RunStage::IDLE;
    double clock_ = 0.0;
    ImpactPhaseController::DamageAssessor assessor_ = &DamageModel::assess;

    std::unique_ptr<MissionPhaseController> mission_;
    std::unique_ptr<ImpactPhaseController> impact_;

    // Event from one of the machines, waiting for delivery
    struct Queued {
        bool from_impact = false;
        MissionEvent evt;
    };
    std::vector<Queued> queue_;

    // Expires with the orchestrator; checked after every host callback
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);

    void deliver();
    bool on_mission_event(const MissionEvent& evt);
    bool on_impact_event(const MissionEvent& evt);
    bool finish(bool success);
    bool dispatch(MissionEvent evt);
};

} // namespace astra::mission

#endif // ASTRA_MISSION_MISSION_ORCHESTRATOR_HPP
