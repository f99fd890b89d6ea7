#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>
#include <glm/gtc/constants.hpp>
#include <cmath>

namespace horde::core {

// Vector types
using Vec2 = glm::vec2;
using Vec3 = glm::vec3;
using Vec4 = glm::vec4;

// Matrix types
using Mat3 = glm::mat3;
using Mat4 = glm::mat4;

// Quaternion
using Quat = glm::quat;

constexpr float PI = glm::pi<float>();
constexpr float TWO_PI = glm::two_pi<float>();

// ============================================================================
// Ground-plane helpers
// Social distances and steering ignore height: everything runs on X/Z.
// ============================================================================

inline float distance_xz(const Vec3& a, const Vec3& b) {
    float dx = a.x - b.x;
    float dz = a.z - b.z;
    return std::sqrt(dx * dx + dz * dz);
}

inline float distance_xz(float ax, float az, float bx, float bz) {
    float dx = ax - bx;
    float dz = az - bz;
    return std::sqrt(dx * dx + dz * dz);
}

// Yaw (rotation about +Y) that turns +Z towards (dx, dz)
inline float yaw_towards(float dx, float dz) {
    return std::atan2(dx, dz);
}

inline float yaw_towards(const Vec3& from, const Vec3& to) {
    return std::atan2(to.x - from.x, to.z - from.z);
}

// Wrap an angle into [-PI, PI]
inline float wrap_angle(float angle) {
    while (angle > PI) angle -= TWO_PI;
    while (angle < -PI) angle += TWO_PI;
    return angle;
}

inline Quat yaw_rotation(float yaw) {
    return glm::angleAxis(yaw, Vec3{0.0f, 1.0f, 0.0f});
}

inline Quat euler_rotation(const Vec3& euler) {
    return Quat(euler);
}

} // namespace horde::core
