#pragma once

#include <horde/core/math.hpp>
#include <glm/gtc/matrix_transform.hpp>

namespace horde::scene {

using namespace horde::core;

// Pose of a scene node, written by the Director after each update.
// Characters turn about +Y only; rocks spin freely.
struct LocalTransform {
    Vec3 position{0.0f};
    Quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    Vec3 scale{1.0f};

    LocalTransform() = default;
    explicit LocalTransform(const Vec3& pos) : position(pos) {}

    // Translate * rotate * scale
    Mat4 matrix() const {
        return glm::translate(Mat4{1.0f}, position) * glm::mat4_cast(rotation) *
               glm::scale(Mat4{1.0f}, scale);
    }

    // +Z turned by the rotation
    Vec3 heading() const { return rotation * Vec3{0.0f, 0.0f, 1.0f}; }

    void set_yaw(float yaw) { rotation = yaw_rotation(yaw); }

    // Yaw of the heading projected on the ground plane
    float yaw() const {
        Vec3 h = heading();
        return yaw_towards(h.x, h.z);
    }

    // Pitch, yaw, roll in radians
    void set_euler(const Vec3& euler) { rotation = core::euler_rotation(euler); }
};

} // namespace horde::scene
