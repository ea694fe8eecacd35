/**
 * KinematicsIntegrator: scripted body motion for the mission scene.
 *
 * Three motion modes, all pure functions of their inputs:
 *
 *   radial_approach  body slides from a start distance to a floor
 *                    distance along a fixed unit direction, driven by
 *                    progress = min(elapsed / duration, 1)
 *   seek             body closes on a live target at constant speed
 *   launch_arc       spacecraft climbs out of the origin toward a
 *                    direction with a sinusoidal lift
 *
 * No dynamics: these are visualization paths, not trajectories.
 */

#ifndef ASTRA_PHYSICS_KINEMATICS_HPP
#define ASTRA_PHYSICS_KINEMATICS_HPP

#include "core/vec3.hpp"

namespace astra {

struct RadialTrack {
    Vec3 origin;                        // body converges on this point
    Vec3 direction{0, 0, -1};           // unit vector, origin -> body
    double start_distance = 8.0;
    double floor_distance = 1.0;
    double duration = 30.0;             // s to go from start to floor
};

struct SeekResult {
    Vec3 position;
    double remaining;                   // distance to target after the step
    bool arrived;
};

class KinematicsIntegrator {
public:
    /** Separations below this count as "arrived". */
    static constexpr double ARRIVAL_EPSILON = 1e-9;

    /** min(elapsed / duration, 1); 1 for a non-positive duration. */
    static double progress(double elapsed, double duration);

    /** Position on a radial track after `elapsed` seconds. */
    static Vec3 radial_approach(const RadialTrack& track, double elapsed);

    /**
     * Step toward `target` by speed * dt along the separation.
     * Never overshoots: a step that would pass the target, or a
     * sub-epsilon separation, lands exactly on it.
     */
    static SeekResult seek(const Vec3& position, const Vec3& target,
                           double speed, double dt);

    /**
     * Launch arc from `origin` toward unit `direction`:
     * origin + direction * (p * reach) + up * sin(p * pi) * arc_height.
     */
    static Vec3 launch_arc(const Vec3& origin, const Vec3& direction,
                           double progress, double reach, double arc_height,
                           const Vec3& up = Vec3{0, 1, 0});
};

} // namespace astra

#endif // ASTRA_PHYSICS_KINEMATICS_HPP
