#include "mission/effect_engine.hpp"
#include <iostream>

namespace astra::mission {

const char* cue_to_string(EffectCue cue) {
    switch (cue) {
        case EffectCue::SPACE_AMBIENCE_START: return "SPACE_AMBIENCE_START";
        case EffectCue::SPACE_AMBIENCE_STOP:  return "SPACE_AMBIENCE_STOP";
        case EffectCue::LAUNCH:               return "LAUNCH";
        case EffectCue::LASER_BEAM_START:     return "LASER_BEAM_START";
        case EffectCue::LASER_BEAM_STOP:      return "LASER_BEAM_STOP";
        case EffectCue::IMPACT:               return "IMPACT";
        case EffectCue::NUCLEAR_EXPLOSION:    return "NUCLEAR_EXPLOSION";
        case EffectCue::SUCCESS:              return "SUCCESS";
        case EffectCue::FAILURE:              return "FAILURE";
        case EffectCue::ATMOSPHERIC_ENTRY:    return "ATMOSPHERIC_ENTRY";
        case EffectCue::EXPLOSION:            return "EXPLOSION";
        case EffectCue::RUMBLE:               return "RUMBLE";
    }
    return "UNKNOWN";
}

void ConsoleEffectEngine::start() {
    if (disposed_ || running_) return;
    running_ = true;
    if (verbose_) std::cerr << "[EFFECT] engine started\n";
}

void ConsoleEffectEngine::stop() {
    if (disposed_ || !running_) return;
    running_ = false;
    if (verbose_) std::cerr << "[EFFECT] engine stopped\n";
}

void ConsoleEffectEngine::dispose() {
    if (disposed_) return;
    running_ = false;
    disposed_ = true;
    if (verbose_) std::cerr << "[EFFECT] engine disposed\n";
}

void ConsoleEffectEngine::trigger(EffectCue cue) {
    if (disposed_) return;
    if (verbose_) std::cerr << "[EFFECT] " << cue_to_string(cue) << "\n";
}

} // namespace astra::mission
