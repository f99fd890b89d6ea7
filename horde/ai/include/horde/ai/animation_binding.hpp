#pragma once

#include <horde/ai/agent.hpp>
#include <horde/animation/animation_library.hpp>
#include <horde/animation/animation_mixer.hpp>
#include <horde/animation/clip_source.hpp>
#include <horde/animation/retarget.hpp>
#include <string>
#include <vector>

namespace horde::ai {

// Clip names the goblins are authored with
namespace clips {

inline constexpr const char* Idle = "idle";
inline constexpr const char* RunForward = "run_forward";
inline constexpr const char* RunBackward = "run_backward";
inline constexpr const char* RunLeft = "run_left";
inline constexpr const char* RunRight = "run_right";
inline constexpr const char* Impact = "impact";
inline constexpr const char* Dying = "dying";
inline constexpr const char* Tripping = "tripping";
inline constexpr const char* Throw = "throw";

const std::vector<std::string>& dance_names();
const std::vector<std::string>& attack_names();

// Every clip init() asks the source for
std::vector<std::string> all_names();

} // namespace clips

// ============================================================================
// Animation Binding
// Owns the shared clip catalog and routes every state transition's clip
// request to the agent's own mixer.
// ============================================================================

class AnimationBinding {
public:
    AnimationBinding() = default;

    // Pulls every known clip from source, retargeting Mixamo rigs on the way.
    // Missing clips are logged and skipped. Returns the number loaded.
    size_t load(animation::IClipSource& source);

    // Crossfades agent to the named clip. A missing clip falls back to idle
    // when idle exists; returns false whenever the requested clip was not played.
    bool play(Agent& agent, const std::string& name, const animation::PlayOptions& options);

    bool has(const std::string& name) const { return m_library.has(name); }
    float duration_or(const std::string& name, float fallback) const;

    // Dance and attack clips that were actually loaded
    const std::vector<std::string>& dances() const { return m_dances; }
    const std::vector<std::string>& attacks() const { return m_attacks; }

    animation::RetargetOptions& retarget_options() { return m_retarget; }

    animation::AnimationLibrary& library() { return m_library; }
    const animation::AnimationLibrary& library() const { return m_library; }

private:
    animation::AnimationLibrary m_library;
    animation::RetargetOptions m_retarget;
    std::vector<std::string> m_dances;
    std::vector<std::string> m_attacks;
};

} // namespace horde::ai
