#include <horde/animation/animation_clip.hpp>
#include <algorithm>
#include <cmath>
#include <type_traits>

namespace horde::animation {

BonePose BonePose::lerp(const BonePose& a, const BonePose& b, float t) {
    BonePose result;
    result.position = glm::mix(a.position, b.position, t);
    result.rotation = glm::slerp(a.rotation, b.rotation, t);
    result.scale = glm::mix(a.scale, b.scale, t);
    return result;
}

// ============================================================================
// AnimationChannel implementation
// ============================================================================

void AnimationChannel::set_target(const std::string& bone_name, TargetType target_type) {
    m_bone_name = bone_name;
    m_target_type = target_type;
}

namespace {

template<typename T>
void insert_sorted(std::vector<Keyframe<T>>& keys, float time, const T& value) {
    Keyframe<T> key{time, value};
    auto it = std::lower_bound(keys.begin(), keys.end(), key,
        [](const Keyframe<T>& a, const Keyframe<T>& b) { return a.time < b.time; });
    keys.insert(it, key);
}

} // anonymous namespace

void AnimationChannel::add_position_keyframe(float time, const Vec3& position) {
    insert_sorted(m_position_keys, time, position);
}

void AnimationChannel::add_rotation_keyframe(float time, const Quat& rotation) {
    insert_sorted(m_rotation_keys, time, rotation);
}

void AnimationChannel::add_scale_keyframe(float time, const Vec3& scale) {
    insert_sorted(m_scale_keys, time, scale);
}

template<typename T>
T AnimationChannel::sample_channel(const std::vector<Keyframe<T>>& keyframes, float time) const {
    if (keyframes.empty()) {
        return T{};
    }

    if (time <= keyframes.front().time) {
        return keyframes.front().value;
    }
    if (time >= keyframes.back().time) {
        return keyframes.back().value;
    }

    auto next = std::upper_bound(keyframes.begin(), keyframes.end(), time,
        [](float t, const Keyframe<T>& k) { return t < k.time; });
    const auto& next_key = *next;
    const auto& prev_key = *(next - 1);

    if (m_interpolation == AnimationInterpolation::Step) {
        return prev_key.value;
    }

    float t = (time - prev_key.time) / (next_key.time - prev_key.time);
    if constexpr (std::is_same_v<T, Quat>) {
        return glm::slerp(prev_key.value, next_key.value, t);
    } else {
        return glm::mix(prev_key.value, next_key.value, t);
    }
}

Vec3 AnimationChannel::sample_position(float time) const {
    return sample_channel(m_position_keys, time);
}

Quat AnimationChannel::sample_rotation(float time) const {
    if (m_rotation_keys.empty()) {
        return Quat{1.0f, 0.0f, 0.0f, 0.0f};
    }
    return sample_channel(m_rotation_keys, time);
}

Vec3 AnimationChannel::sample_scale(float time) const {
    if (m_scale_keys.empty()) {
        return Vec3{1.0f};
    }
    return sample_channel(m_scale_keys, time);
}

float AnimationChannel::get_duration() const {
    float duration = 0.0f;

    if (!m_position_keys.empty()) {
        duration = std::max(duration, m_position_keys.back().time);
    }
    if (!m_rotation_keys.empty()) {
        duration = std::max(duration, m_rotation_keys.back().time);
    }
    if (!m_scale_keys.empty()) {
        duration = std::max(duration, m_scale_keys.back().time);
    }

    return duration;
}

size_t AnimationChannel::get_keyframe_count() const {
    return m_position_keys.size() + m_rotation_keys.size() + m_scale_keys.size();
}

// ============================================================================
// AnimationClip implementation
// ============================================================================

AnimationClip::AnimationClip(const std::string& name, float duration)
    : m_name(name)
    , m_duration(duration)
{
}

AnimationChannel& AnimationClip::add_channel() {
    m_channels.emplace_back();
    return m_channels.back();
}

void AnimationClip::sample(float time, Pose& out_pose) const {
    for (const auto& channel : m_channels) {
        if (channel.get_keyframe_count() == 0) {
            continue;
        }

        BonePose& bone = out_pose[channel.get_bone_name()];

        switch (channel.get_target_type()) {
            case AnimationChannel::TargetType::Translation:
                bone.position = channel.sample_position(time);
                break;
            case AnimationChannel::TargetType::Rotation:
                bone.rotation = channel.sample_rotation(time);
                break;
            case AnimationChannel::TargetType::Scale:
                bone.scale = channel.sample_scale(time);
                break;
        }
    }
}

void AnimationClip::sample_looped(float time, Pose& out_pose) const {
    if (m_duration > 0.0f) {
        time = std::fmod(time, m_duration);
        if (time < 0.0f) {
            time += m_duration;
        }
    }
    sample(time, out_pose);
}

void AnimationClip::recalculate_duration() {
    float duration = 0.0f;
    for (const auto& channel : m_channels) {
        duration = std::max(duration, channel.get_duration());
    }
    m_duration = duration;
}

} // namespace horde::animation
