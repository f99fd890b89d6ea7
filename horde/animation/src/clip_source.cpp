#include <horde/animation/clip_source.hpp>
#include <horde/core/filesystem.hpp>
#include <horde/core/log.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <vector>

namespace horde::animation {

using json = nlohmann::json;

// ============================================================================
// MemoryClipSource
// ============================================================================

void MemoryClipSource::add(const AnimationClip& clip) {
    m_clips[clip.get_name()] = clip;
}

void MemoryClipSource::add(const std::string& name, float duration) {
    m_clips[name] = AnimationClip(name, duration);
}

bool MemoryClipSource::has_clip(const std::string& name) const {
    return m_clips.find(name) != m_clips.end();
}

std::shared_ptr<AnimationClip> MemoryClipSource::load_clip(const std::string& name) {
    auto it = m_clips.find(name);
    if (it == m_clips.end()) {
        return nullptr;
    }
    return std::make_shared<AnimationClip>(it->second);
}

// ============================================================================
// ManifestClipSource
// ============================================================================

namespace {

bool parse_target(const std::string& text, AnimationChannel::TargetType& out) {
    if (text == "translation" || text == "position") {
        out = AnimationChannel::TargetType::Translation;
    } else if (text == "rotation" || text == "quaternion") {
        out = AnimationChannel::TargetType::Rotation;
    } else if (text == "scale") {
        out = AnimationChannel::TargetType::Scale;
    } else {
        return false;
    }
    return true;
}

void parse_channel(const json& jc, AnimationClip& clip) {
    AnimationChannel::TargetType target;
    if (!parse_target(jc.value("target", std::string()), target)) {
        core::log(core::LogLevel::Warn, "[AnimationLibrary] Skipping channel with unknown target in clip: " + clip.get_name());
        return;
    }

    auto& channel = clip.add_channel();
    channel.set_target(jc.value("bone", std::string()), target);
    if (jc.value("interpolation", std::string("linear")) == "step") {
        channel.set_interpolation(AnimationInterpolation::Step);
    }

    std::vector<float> times = jc.value("times", std::vector<float>{});
    std::vector<float> values = jc.value("values", std::vector<float>{});

    size_t stride = target == AnimationChannel::TargetType::Rotation ? 4 : 3;
    size_t count = std::min(times.size(), values.size() / stride);

    for (size_t i = 0; i < count; ++i) {
        const float* v = &values[i * stride];
        switch (target) {
            case AnimationChannel::TargetType::Translation:
                channel.add_position_keyframe(times[i], Vec3{v[0], v[1], v[2]});
                break;
            case AnimationChannel::TargetType::Rotation:
                // Stored xyzw, glm takes wxyz
                channel.add_rotation_keyframe(times[i], Quat{v[3], v[0], v[1], v[2]});
                break;
            case AnimationChannel::TargetType::Scale:
                channel.add_scale_keyframe(times[i], Vec3{v[0], v[1], v[2]});
                break;
        }
    }
}

} // anonymous namespace

bool ManifestClipSource::load(const std::string& path) {
    std::string content = core::FileSystem::read_text(path);
    if (content.empty()) {
        core::log(core::LogLevel::Warn, "[AnimationLibrary] Clip manifest not found: " + path);
        return false;
    }
    return load_from_string(content);
}

bool ManifestClipSource::load_from_string(const std::string& text) {
    try {
        json j = json::parse(text);
        if (!j.contains("clips") || !j["clips"].is_array()) {
            core::log(core::LogLevel::Warn, "[AnimationLibrary] Clip manifest has no 'clips' array");
            return false;
        }

        std::unordered_map<std::string, AnimationClip> clips;
        for (const auto& jclip : j["clips"]) {
            std::string name = jclip.value("name", std::string());
            if (name.empty()) {
                core::log(core::LogLevel::Warn, "[AnimationLibrary] Skipping unnamed clip in manifest");
                continue;
            }

            AnimationClip clip(name, jclip.value("duration", 0.0f));
            if (jclip.contains("channels") && jclip["channels"].is_array()) {
                for (const auto& jc : jclip["channels"]) {
                    parse_channel(jc, clip);
                }
            }
            if (clip.get_duration() <= 0.0f) {
                clip.recalculate_duration();
            }

            clips[name] = std::move(clip);
        }

        m_clips = std::move(clips);
        core::log(core::LogLevel::Debug, "[AnimationLibrary] Manifest lists " + std::to_string(m_clips.size()) + " clips");
        return true;
    } catch (const json::exception& e) {
        core::log(core::LogLevel::Error, std::string("[AnimationLibrary] Failed to parse clip manifest: ") + e.what());
        return false;
    }
}

bool ManifestClipSource::has_clip(const std::string& name) const {
    return m_clips.find(name) != m_clips.end();
}

std::shared_ptr<AnimationClip> ManifestClipSource::load_clip(const std::string& name) {
    auto it = m_clips.find(name);
    if (it == m_clips.end()) {
        return nullptr;
    }
    return std::make_shared<AnimationClip>(it->second);
}

} // namespace horde::animation
