#include "physics/kinematics.hpp"
#include <algorithm>
#include <cmath>

namespace astra {

static constexpr double PI = 3.14159265358979323846;

double KinematicsIntegrator::progress(double elapsed, double duration) {
    if (!(duration > 0.0)) return 1.0;
    return std::clamp(elapsed / duration, 0.0, 1.0);
}

Vec3 KinematicsIntegrator::radial_approach(const RadialTrack& track, double elapsed) {
    double p = progress(elapsed, track.duration);
    double dist = track.start_distance - (track.start_distance - track.floor_distance) * p;
    return track.origin + normalized(track.direction) * dist;
}

SeekResult KinematicsIntegrator::seek(const Vec3& position, const Vec3& target,
                                      double speed, double dt) {
    Vec3 separation = target - position;
    double dist = separation.norm();

    if (dist < ARRIVAL_EPSILON) {
        return SeekResult{target, 0.0, true};
    }

    double step = std::max(0.0, speed * dt);
    if (step >= dist) {
        return SeekResult{target, 0.0, true};
    }

    Vec3 dir = separation * (1.0 / dist);
    return SeekResult{position + dir * step, dist - step, false};
}

Vec3 KinematicsIntegrator::launch_arc(const Vec3& origin, const Vec3& direction,
                                      double p, double reach, double arc_height,
                                      const Vec3& up) {
    p = std::clamp(p, 0.0, 1.0);
    return origin
         + normalized(direction) * (p * reach)
         + up * (std::sin(p * PI) * arc_height);
}

} // namespace astra
