#pragma once

#include <horde/animation/animation_clip.hpp>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace horde::animation {

// Catalog of clips shared by every agent, keyed by name
class AnimationLibrary {
public:
    AnimationLibrary() = default;

    // Registers under the clip's own name
    void add(std::shared_ptr<AnimationClip> clip);
    void add(const std::string& name, std::shared_ptr<AnimationClip> clip);
    void remove(const std::string& name);
    void clear();

    std::shared_ptr<const AnimationClip> get(const std::string& name) const;
    bool has(const std::string& name) const;

    // Clip duration, or fallback when the clip is missing or has no length
    float duration_or(const std::string& name, float fallback) const;

    // Subset of names that are present, in the given order
    std::vector<std::string> filter_available(const std::vector<std::string>& names) const;

    std::vector<std::string> names() const;
    size_t size() const { return m_clips.size(); }
    bool empty() const { return m_clips.empty(); }

private:
    std::unordered_map<std::string, std::shared_ptr<const AnimationClip>> m_clips;
};

} // namespace horde::animation
