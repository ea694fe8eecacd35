#include "core/simulation_engine.hpp"
#include <cmath>
#include <stdexcept>
#include <thread>

namespace astra {

SimulationEngine::SimulationEngine()
    : mode_(SimulationMode::MODEL_MODE),
      time_scale_(1.0),
      fixed_dt_(1.0 / 60.0),
      sim_time_(0.0),
      step_count_(0) {
}

void SimulationEngine::set_time_scale(double scale) {
    if (!std::isfinite(scale) || scale <= 0.0) {
        throw std::invalid_argument("time scale must be positive");
    }
    time_scale_ = scale;
}

void SimulationEngine::set_fixed_dt(double dt) {
    if (!std::isfinite(dt) || dt <= 0.0) {
        throw std::invalid_argument("fixed dt must be positive");
    }
    fixed_dt_ = dt;
}

void SimulationEngine::initialize() {
    sim_time_ = 0.0;
    step_count_ = 0;
    last_update_time_ = std::chrono::steady_clock::now();
}

void SimulationEngine::step(SimulationClient& client, double dt) {
    double scaled_dt = dt * time_scale_;

    client.tick(scaled_dt);

    sim_time_ += scaled_dt;
    step_count_++;
}

bool SimulationEngine::run(SimulationClient& client, double max_time) {
    if (mode_ == SimulationMode::MODEL_MODE) {
        // Model mode: run as fast as possible
        while (!client.is_finished() && sim_time_ < max_time) {
            step(client, fixed_dt_);
        }
    } else {
        // Real-time mode: Δt from the wall clock
        last_update_time_ = std::chrono::steady_clock::now();
        while (!client.is_finished() && sim_time_ < max_time) {
            auto now = std::chrono::steady_clock::now();
            double elapsed = std::chrono::duration<double>(now - last_update_time_).count();

            if (elapsed > 0.0) {
                step(client, elapsed);
                last_update_time_ = now;
            }

            // Small sleep to prevent CPU spinning
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    return client.is_finished();
}

} // namespace astra
