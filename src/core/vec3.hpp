/**
 * Vec3: 3D vector in scene units, plus free-function operators.
 *
 * Header-only. The scene frame is Earth-centred: Earth sits at the
 * origin, one unit is an arbitrary visual distance (not metres).
 */

#ifndef ASTRA_CORE_VEC3_HPP
#define ASTRA_CORE_VEC3_HPP

#include <cmath>

namespace astra {

struct Vec3 {
    double x, y, z;

    Vec3() : x(0), y(0), z(0) {}
    Vec3(double x_, double y_, double z_) : x(x_), y(y_), z(z_) {}

    double norm() const {
        return std::sqrt(x*x + y*y + z*z);
    }

    static Vec3 Zero() { return Vec3(0, 0, 0); }
};

// ═══════════════════════════════════════════════════════════════
// Operators
// ═══════════════════════════════════════════════════════════════

inline Vec3 operator+(const Vec3& a, const Vec3& b) {
    return Vec3{a.x + b.x, a.y + b.y, a.z + b.z};
}

inline Vec3 operator-(const Vec3& a, const Vec3& b) {
    return Vec3{a.x - b.x, a.y - b.y, a.z - b.z};
}

inline Vec3 operator-(const Vec3& a) {
    return Vec3{-a.x, -a.y, -a.z};
}

inline Vec3 operator*(double s, const Vec3& v) {
    return Vec3{s * v.x, s * v.y, s * v.z};
}

inline Vec3 operator*(const Vec3& v, double s) {
    return Vec3{v.x * s, v.y * s, v.z * s};
}

inline Vec3& operator+=(Vec3& a, const Vec3& b) {
    a.x += b.x; a.y += b.y; a.z += b.z;
    return a;
}

inline bool operator==(const Vec3& a, const Vec3& b) {
    return a.x == b.x && a.y == b.y && a.z == b.z;
}

inline bool operator!=(const Vec3& a, const Vec3& b) {
    return !(a == b);
}

// ═══════════════════════════════════════════════════════════════
// Functions
// ═══════════════════════════════════════════════════════════════

// Zero vector for sub-epsilon input
inline Vec3 normalized(const Vec3& v) {
    double n = v.norm();
    if (n < 1e-15) return Vec3::Zero();
    double inv = 1.0 / n;
    return Vec3{v.x * inv, v.y * inv, v.z * inv};
}

inline double distance(const Vec3& a, const Vec3& b) {
    return (a - b).norm();
}

} // namespace astra

#endif // ASTRA_CORE_VEC3_HPP
