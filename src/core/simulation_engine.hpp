#ifndef ASTRA_CORE_SIMULATION_ENGINE_HPP
#define ASTRA_CORE_SIMULATION_ENGINE_HPP

#include "core/simulation_mode.hpp"
#include <chrono>

namespace astra {

/**
 * @brief Anything the engine can drive with a frame Δt
 */
class SimulationClient {
public:
    virtual ~SimulationClient() = default;

    virtual void tick(double dt) = 0;
    virtual bool is_finished() const = 0;
};

/**
 * @brief Host tick loop
 *
 * Plays the role of the render loop: produces a Δt per frame and hands
 * it to a client until the client reports finished.
 *
 * MODEL_MODE: fixed Δt, no sleeping
 * REALTIME_MODE: Δt measured from the wall clock between frames
 *
 * The time scale multiplies every Δt before the client sees it.
 */
class SimulationEngine {
public:
    SimulationEngine();
    ~SimulationEngine() = default;

    // Mode control
    void set_mode(SimulationMode mode) { mode_ = mode; }
    void set_time_scale(double scale);
    void set_fixed_dt(double dt);

    // Simulation control
    void initialize();
    void step(SimulationClient& client, double dt);

    /**
     * Run until the client finishes or simulation time reaches max_time.
     * @return true if the client finished
     */
    bool run(SimulationClient& client, double max_time);

    long get_step_count() const { return step_count_; }

private:
    SimulationMode mode_;
    double time_scale_;
    double fixed_dt_;
    double sim_time_;           // scaled seconds delivered to the client
    long step_count_;

    // Timing for real-time mode
    std::chrono::steady_clock::time_point last_update_time_;
};

} // namespace astra

#endif // ASTRA_CORE_SIMULATION_ENGINE_HPP
