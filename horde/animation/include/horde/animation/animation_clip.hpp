#pragma once

#include <horde/core/math.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace horde::animation {

using namespace horde::core;

// Interpolation mode for animation keyframes
enum class AnimationInterpolation {
    Step,       // No interpolation, snap to keyframe
    Linear      // Linear (slerp for rotations)
};

// A single keyframe in an animation channel
template<typename T>
struct Keyframe {
    float time;
    T value;
};

// Local transform of one bone
struct BonePose {
    Vec3 position{0.0f};
    Quat rotation{1.0f, 0.0f, 0.0f, 0.0f};
    Vec3 scale{1.0f};

    static BonePose lerp(const BonePose& a, const BonePose& b, float t);
};

// Sampled pose keyed by bone name
using Pose = std::unordered_map<std::string, BonePose>;

// Animation channel - animates a single property of a single named bone
class AnimationChannel {
public:
    enum class TargetType {
        Translation,
        Rotation,
        Scale
    };

    AnimationChannel() = default;

    void set_target(const std::string& bone_name, TargetType target_type);
    const std::string& get_bone_name() const { return m_bone_name; }
    void set_bone_name(const std::string& bone_name) { m_bone_name = bone_name; }
    TargetType get_target_type() const { return m_target_type; }

    void set_interpolation(AnimationInterpolation interp) { m_interpolation = interp; }
    AnimationInterpolation get_interpolation() const { return m_interpolation; }

    // Add keyframes (kept sorted by time)
    void add_position_keyframe(float time, const Vec3& position);
    void add_rotation_keyframe(float time, const Quat& rotation);
    void add_scale_keyframe(float time, const Vec3& scale);

    // Sample the channel at a given time (clamped to the key range)
    Vec3 sample_position(float time) const;
    Quat sample_rotation(float time) const;
    Vec3 sample_scale(float time) const;

    // Time of the last keyframe
    float get_duration() const;

    size_t get_keyframe_count() const;

private:
    template<typename T>
    T sample_channel(const std::vector<Keyframe<T>>& keyframes, float time) const;

    std::string m_bone_name;
    TargetType m_target_type = TargetType::Translation;
    AnimationInterpolation m_interpolation = AnimationInterpolation::Linear;

    std::vector<Keyframe<Vec3>> m_position_keys;
    std::vector<Keyframe<Quat>> m_rotation_keys;
    std::vector<Keyframe<Vec3>> m_scale_keys;
};

// Animation clip - a complete animation (idle, walk, dance, ...)
class AnimationClip {
public:
    AnimationClip() = default;
    AnimationClip(const std::string& name, float duration);

    const std::string& get_name() const { return m_name; }

    float get_duration() const { return m_duration; }
    void set_duration(float duration) { m_duration = duration; }

    AnimationChannel& add_channel();
    const std::vector<AnimationChannel>& get_channels() const { return m_channels; }
    std::vector<AnimationChannel>& get_channels() { return m_channels; }

    // Write every channel's value at time into out_pose
    void sample(float time, Pose& out_pose) const;
    void sample_looped(float time, Pose& out_pose) const;

    // Derive the duration from the longest channel when none was authored
    void recalculate_duration();

private:
    std::string m_name;
    float m_duration = 0.0f;
    std::vector<AnimationChannel> m_channels;
};

} // namespace horde::animation
