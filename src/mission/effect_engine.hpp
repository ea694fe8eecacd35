/**
 * EffectEngine: audio/visual cue sink.
 *
 * The phase controllers never synthesize sound or draw anything; they
 * fire zero-argument cues at an EffectEngine. The orchestrator owns the
 * engine and drives its lifecycle:
 *
 *   start()    before the first tick
 *   stop()     when the mission exits (ambience off)
 *   dispose()  on teardown; idempotent, and no cue is accepted afterwards
 */

#ifndef ASTRA_MISSION_EFFECT_ENGINE_HPP
#define ASTRA_MISSION_EFFECT_ENGINE_HPP

#include <vector>

namespace astra::mission {

enum class EffectCue {
    SPACE_AMBIENCE_START,
    SPACE_AMBIENCE_STOP,
    LAUNCH,
    LASER_BEAM_START,
    LASER_BEAM_STOP,
    IMPACT,
    NUCLEAR_EXPLOSION,
    SUCCESS,
    FAILURE,
    ATMOSPHERIC_ENTRY,
    EXPLOSION,
    RUMBLE
};

const char* cue_to_string(EffectCue cue);

class EffectEngine {
public:
    virtual ~EffectEngine() = default;

    virtual void start() = 0;
    virtual void stop() = 0;
    virtual void dispose() = 0;
    virtual void trigger(EffectCue cue) = 0;

    virtual bool is_disposed() const = 0;
};

/**
 * Logs cues to stderr as "[EFFECT] <cue>" when verbose. Used by the
 * headless host in place of an audio backend.
 */
class ConsoleEffectEngine : public EffectEngine {
public:
    explicit ConsoleEffectEngine(bool verbose = false) : verbose_(verbose) {}

    void start() override;
    void stop() override;
    void dispose() override;
    void trigger(EffectCue cue) override;

    bool is_disposed() const override { return disposed_; }
    bool is_running() const { return running_; }

private:
    bool verbose_;
    bool running_ = false;
    bool disposed_ = false;
};

/** Records every accepted cue in order. */
class RecordingEffectEngine : public EffectEngine {
public:
    void start() override { if (!disposed_) started_ = true; }
    void stop() override { if (!disposed_) stopped_ = true; }
    void dispose() override { disposed_ = true; }
    void trigger(EffectCue cue) override {
        if (!disposed_) cues_.push_back(cue);
    }

    bool is_disposed() const override { return disposed_; }
    bool was_started() const { return started_; }
    bool was_stopped() const { return stopped_; }

    const std::vector<EffectCue>& cues() const { return cues_; }

private:
    std::vector<EffectCue> cues_;
    bool started_ = false;
    bool stopped_ = false;
    bool disposed_ = false;
};

} // namespace astra::mission

#endif // ASTRA_MISSION_EFFECT_ENGINE_HPP
