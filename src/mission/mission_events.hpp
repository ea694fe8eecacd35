/**
 * MissionEvent: typed host notifications.
 *
 * One channel, one enum. The orchestrator stamps `time` with the
 * cumulative run clock before dispatch.
 */

#ifndef ASTRA_MISSION_MISSION_EVENTS_HPP
#define ASTRA_MISSION_MISSION_EVENTS_HPP

#include "mission/damage_model.hpp"
#include "mission/outcome_resolver.hpp"
#include <functional>
#include <optional>
#include <string>

namespace astra::mission {

enum class MissionEventType {
    PHASE_CHANGED,
    OUTCOME_RESOLVED,
    SHOW_IMPACT,
    DAMAGE_READY,
    FADE_OUT,
    IMPACT_COMPLETE,
    COMPLETE
};

struct MissionEvent {
    MissionEventType type = MissionEventType::PHASE_CHANGED;
    double time = 0.0;

    // PHASE_CHANGED
    std::string machine;            // "mission" or "impact"
    std::string phase;

    // OUTCOME_RESOLVED, COMPLETE
    Outcome outcome = Outcome::PENDING;
    double chance = 0.0;
    double draw = 0.0;

    // COMPLETE
    bool success = false;
    double deflection = 0.0;        // percent

    // DAMAGE_READY
    std::optional<DamageAssessment> damage;
};

using EventSink = std::function<void(const MissionEvent&)>;

inline const char* event_type_to_string(MissionEventType type) {
    switch (type) {
        case MissionEventType::PHASE_CHANGED:    return "PHASE_CHANGED";
        case MissionEventType::OUTCOME_RESOLVED: return "OUTCOME_RESOLVED";
        case MissionEventType::SHOW_IMPACT:      return "SHOW_IMPACT";
        case MissionEventType::DAMAGE_READY:     return "DAMAGE_READY";
        case MissionEventType::FADE_OUT:         return "FADE_OUT";
        case MissionEventType::IMPACT_COMPLETE:  return "IMPACT_COMPLETE";
        case MissionEventType::COMPLETE:         return "COMPLETE";
    }
    return "UNKNOWN";
}

} // namespace astra::mission

#endif // ASTRA_MISSION_MISSION_EVENTS_HPP
