#include <horde/animation/animation_library.hpp>
#include <algorithm>

namespace horde::animation {

void AnimationLibrary::add(std::shared_ptr<AnimationClip> clip) {
    if (!clip) return;
    std::string name = clip->get_name();
    m_clips[name] = std::move(clip);
}

void AnimationLibrary::add(const std::string& name, std::shared_ptr<AnimationClip> clip) {
    if (!clip) return;
    m_clips[name] = std::move(clip);
}

void AnimationLibrary::remove(const std::string& name) {
    m_clips.erase(name);
}

void AnimationLibrary::clear() {
    m_clips.clear();
}

std::shared_ptr<const AnimationClip> AnimationLibrary::get(const std::string& name) const {
    auto it = m_clips.find(name);
    if (it != m_clips.end()) {
        return it->second;
    }
    return nullptr;
}

bool AnimationLibrary::has(const std::string& name) const {
    return m_clips.find(name) != m_clips.end();
}

float AnimationLibrary::duration_or(const std::string& name, float fallback) const {
    auto it = m_clips.find(name);
    if (it == m_clips.end() || it->second->get_duration() <= 0.0f) {
        return fallback;
    }
    return it->second->get_duration();
}

std::vector<std::string> AnimationLibrary::filter_available(const std::vector<std::string>& names) const {
    std::vector<std::string> result;
    for (const auto& name : names) {
        if (has(name)) {
            result.push_back(name);
        }
    }
    return result;
}

std::vector<std::string> AnimationLibrary::names() const {
    std::vector<std::string> result;
    result.reserve(m_clips.size());
    for (const auto& [name, clip] : m_clips) {
        result.push_back(name);
    }
    std::sort(result.begin(), result.end());
    return result;
}

} // namespace horde::animation
