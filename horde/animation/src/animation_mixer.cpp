#include <horde/animation/animation_mixer.hpp>
#include <algorithm>
#include <cmath>

namespace horde::animation {

void AnimationMixer::play(std::shared_ptr<const AnimationClip> clip, const PlayOptions& options) {
    if (!clip) return;

    if (options.crossfade > 0.0f && m_current.clip && m_current.weight > 0.0f) {
        m_fading = m_current;
        m_fade_duration = options.crossfade;
        m_fade_progress = 0.0f;
    } else {
        m_fading = AnimationAction{};
        m_fade_duration = 0.0f;
    }

    m_current = AnimationAction{};
    m_current.clip = std::move(clip);
    m_current.looping = options.loop;
    m_current.clamp_when_finished = options.clamp_when_finished;
    m_current.playing = true;
    m_current.weight = m_fade_duration > 0.0f ? 0.0f : 1.0f;
}

void AnimationMixer::stop() {
    m_current = AnimationAction{};
    m_fading = AnimationAction{};
    m_fade_duration = 0.0f;
    m_fade_progress = 0.0f;
}

void AnimationMixer::update(float delta_time) {
    m_elapsed += delta_time;

    if (m_fading.clip) {
        advance(m_fading, delta_time);
        m_fade_progress += delta_time / m_fade_duration;
        if (m_fade_progress >= 1.0f) {
            m_fade_progress = 1.0f;
            m_fading = AnimationAction{};
            m_fade_duration = 0.0f;
        } else {
            m_fading.weight = 1.0f - m_fade_progress;
        }
    }

    if (m_current.clip) {
        advance(m_current, delta_time);
        if (m_current.playing || m_current.clamp_when_finished) {
            m_current.weight = m_fading.clip ? m_fade_progress : 1.0f;
        } else {
            m_current.weight = 0.0f;
        }
    }
}

void AnimationMixer::advance(AnimationAction& action, float delta_time) {
    if (!action.playing) return;

    action.time += delta_time;

    float duration = action.clip->get_duration();
    if (duration <= 0.0f || action.time < duration) return;

    if (action.looping) {
        action.time = std::fmod(action.time, duration);
    } else {
        action.time = duration;
        action.playing = false;
        action.finished = true;
    }
}

void AnimationMixer::sample(Pose& out_pose) const {
    auto apply = [&out_pose](const AnimationAction& action) {
        if (!action.clip || action.weight <= 0.0f) return;

        Pose anim_pose;
        if (action.looping) {
            action.clip->sample_looped(action.time, anim_pose);
        } else {
            action.clip->sample(action.time, anim_pose);
        }

        for (const auto& [bone, pose] : anim_pose) {
            auto it = out_pose.find(bone);
            if (it == out_pose.end() || action.weight >= 1.0f) {
                out_pose[bone] = pose;
            } else {
                it->second = BonePose::lerp(it->second, pose, action.weight);
            }
        }
    };

    apply(m_fading);
    apply(m_current);
}

bool AnimationMixer::is_playing() const {
    return m_current.playing;
}

bool AnimationMixer::is_playing(const std::string& name) const {
    return m_current.playing && m_current.clip && m_current.clip->get_name() == name;
}

const std::string& AnimationMixer::get_current_clip_name() const {
    static const std::string empty;
    return m_current.clip ? m_current.clip->get_name() : empty;
}

float AnimationMixer::get_normalized_time() const {
    if (m_current.clip && m_current.clip->get_duration() > 0.0f) {
        return m_current.time / m_current.clip->get_duration();
    }
    return 0.0f;
}

} // namespace horde::animation
