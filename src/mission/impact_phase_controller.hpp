/**
 * ImpactPhaseController: failure cinematic.
 *
 *   approach (2 s) -> impact (0.1 s) -> explosion (1.5 s)
 *   -> aftermath (1 s) -> damaged (3 s) -> reset (0.5 s) -> complete
 *
 * Purely elapsed-gated. At most one transition per tick; the phase
 * timer restarts at zero on every entry, leftover time is dropped.
 *
 * Entry actions:
 *   approach   ATMOSPHERIC_ENTRY
 *   impact     IMPACT
 *   explosion  EXPLOSION
 *   aftermath  RUMBLE
 *   damaged    damage assessment (exactly once) + DAMAGE_READY
 *   reset      fade flag + FADE_OUT
 *   complete   IMPACT_COMPLETE
 */

#ifndef ASTRA_MISSION_IMPACT_PHASE_CONTROLLER_HPP
#define ASTRA_MISSION_IMPACT_PHASE_CONTROLLER_HPP

#include "data/asteroid_catalog.hpp"
#include "mission/damage_model.hpp"
#include "mission/effect_engine.hpp"
#include "mission/mission_config.hpp"
#include "mission/mission_events.hpp"
#include <functional>
#include <optional>
#include <vector>

namespace astra::mission {

enum class ImpactPhase {
    APPROACH,
    IMPACT,
    EXPLOSION,
    AFTERMATH,
    DAMAGED,
    RESET,
    COMPLETE
};

const char* impact_phase_to_string(ImpactPhase phase);

struct ImpactState {
    ImpactPhase phase = ImpactPhase::APPROACH;
    double phase_elapsed = 0.0;
    double total_elapsed = 0.0;
    double progress = 0.0;              // 0-1 through the current phase

    Vec3 asteroid_position;
    double impact_energy_mt = 0.0;
    double explosion_scale = 0.3;
    double sound_intensity = 0.5;
    ImpactSeverity severity = ImpactSeverity::MINOR;

    bool fading = false;
    std::optional<DamageAssessment> damage;
};

class ImpactPhaseController {
public:
    /** (mass kg, velocity km/s) -> assessment */
    using DamageAssessor = std::function<DamageAssessment(double, double)>;

    ImpactPhaseController(const Asteroid& asteroid, const ImpactConfig& config,
                          EffectEngine& effects, EventSink sink,
                          DamageAssessor assessor = &DamageModel::assess,
                          bool verbose = false);

    void begin();
    void tick(double dt);

    const ImpactState& state() const { return state_; }
    bool is_complete() const { return state_.phase == ImpactPhase::COMPLETE; }

    double phase_duration(ImpactPhase phase) const;

    static double explosion_scale(double energy_mt);
    static double sound_intensity(double energy_mt);

private:
    const Asteroid& asteroid_;
    const ImpactConfig& config_;
    EffectEngine& effects_;
    EventSink sink_;
    DamageAssessor assessor_;
    bool verbose_;

    ImpactState state_;
    bool begun_ = false;
    bool damage_assessed_ = false;
    RadialTrack track_;

    std::vector<EffectCue> pending_cues_;
    std::vector<MissionEvent> pending_events_;

    void enter_phase(ImpactPhase phase);
    void flush();
};

} // namespace astra::mission

#endif // ASTRA_MISSION_IMPACT_PHASE_CONTROLLER_HPP
