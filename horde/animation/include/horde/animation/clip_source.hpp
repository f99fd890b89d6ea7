#pragma once

#include <horde/animation/animation_clip.hpp>
#include <memory>
#include <string>
#include <unordered_map>

namespace horde::animation {

// Supplies clips by name. Each call returns a fresh copy the caller may modify.
class IClipSource {
public:
    virtual ~IClipSource() = default;

    // nullptr when the source has no clip of that name
    virtual std::shared_ptr<AnimationClip> load_clip(const std::string& name) = 0;
};

// Clips registered by the host in memory
class MemoryClipSource : public IClipSource {
public:
    void add(const AnimationClip& clip);

    // Keyframe-less clip of a given length
    void add(const std::string& name, float duration);

    bool has_clip(const std::string& name) const;
    size_t size() const { return m_clips.size(); }

    std::shared_ptr<AnimationClip> load_clip(const std::string& name) override;

private:
    std::unordered_map<std::string, AnimationClip> m_clips;
};

// Clips described by a JSON manifest:
//
//   { "clips": [ { "name": "idle", "duration": 2.0,
//                  "channels": [ { "bone": "mixamorig:Hips", "target": "rotation",
//                                  "interpolation": "linear",
//                                  "times": [0.0, 1.0], "values": [x,y,z,w, x,y,z,w] } ] } ] }
//
// Vector values are flat xyz triples, rotations xyzw quaternions. A missing
// duration is derived from the keyframes.
class ManifestClipSource : public IClipSource {
public:
    bool load(const std::string& path);
    bool load_from_string(const std::string& text);

    bool has_clip(const std::string& name) const;
    size_t size() const { return m_clips.size(); }

    std::shared_ptr<AnimationClip> load_clip(const std::string& name) override;

private:
    std::unordered_map<std::string, AnimationClip> m_clips;
};

} // namespace horde::animation
