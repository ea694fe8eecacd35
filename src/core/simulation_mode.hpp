#ifndef ASTRA_CORE_SIMULATION_MODE_HPP
#define ASTRA_CORE_SIMULATION_MODE_HPP

namespace astra {

/**
 * @brief Host loop execution modes
 *
 * MODEL_MODE: fixed Δt, as fast as possible (batch runs, tests)
 * REALTIME_MODE: Δt measured from the wall clock between frames
 */
enum class SimulationMode {
    MODEL_MODE,
    REALTIME_MODE
};

inline const char* mode_to_string(SimulationMode mode) {
    return mode == SimulationMode::MODEL_MODE ? "MODEL" : "REALTIME";
}

} // namespace astra

#endif // ASTRA_CORE_SIMULATION_MODE_HPP
