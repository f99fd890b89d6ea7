#pragma once

#include <horde/animation/animation_clip.hpp>
#include <memory>
#include <string>

namespace horde::animation {

struct PlayOptions {
    bool loop = true;
    float crossfade = 0.0f;             // Seconds; 0 is a hard cut
    bool clamp_when_finished = false;   // One-shots hold their last frame
};

// Playback state of one clip on a mixer
struct AnimationAction {
    std::shared_ptr<const AnimationClip> clip;
    float time = 0.0f;
    float weight = 0.0f;
    bool looping = true;
    bool clamp_when_finished = false;
    bool playing = false;
    bool finished = false;
};

// Per-character animation clock. Holds one current action and at most one
// action fading out; any play() crossfades out whatever was current.
class AnimationMixer {
public:
    AnimationMixer() = default;

    void play(std::shared_ptr<const AnimationClip> clip, const PlayOptions& options = {});
    void stop();

    // Advance clocks and fade weights
    void update(float delta_time);

    // Blend the fading and current actions into out_pose
    void sample(Pose& out_pose) const;

    bool is_playing() const;
    bool is_playing(const std::string& name) const;

    // True once a non-looping action has reached its end
    bool is_finished() const { return m_current.finished; }
    bool is_fading() const { return m_fading.clip != nullptr; }

    std::shared_ptr<const AnimationClip> get_current_clip() const { return m_current.clip; }
    const std::string& get_current_clip_name() const;
    float get_current_time() const { return m_current.time; }
    float get_normalized_time() const;  // 0-1 range
    float get_weight() const { return m_current.weight; }

    // Total time this mixer has been advanced
    float get_elapsed() const { return m_elapsed; }

private:
    void advance(AnimationAction& action, float delta_time);

    AnimationAction m_current;
    AnimationAction m_fading;
    float m_fade_duration = 0.0f;
    float m_fade_progress = 0.0f;

    float m_elapsed = 0.0f;
};

} // namespace horde::animation
