#pragma once

#include <horde/animation/animation_clip.hpp>
#include <string>
#include <unordered_map>

namespace horde::animation {

// Source bone short name (prefix removed) -> target skeleton bone
using BoneMap = std::unordered_map<std::string, std::string>;

struct RetargetOptions {
    // Bones whose name starts with this (optionally followed by ':') are rewritten
    std::string source_prefix = "mixamorig";

    // Drop translation channels so positions stay under gameplay control
    bool strip_translation = true;
};

struct RetargetResult {
    bool matched = false;        // At least one channel carried the source prefix
    size_t renamed = 0;
    size_t unmapped = 0;         // Prefixed bones missing from the map (kept as-is)
    size_t stripped = 0;
};

// Mixamo rig -> goblin skeleton (Hips, Spine_01..03, Neck, Head, limbs _L/_R)
const BoneMap& mixamo_bone_map();

// Short bone name when name starts with prefix or prefix + ':'; empty otherwise
std::string strip_bone_prefix(const std::string& name, const std::string& prefix);

// Rewrites a clip authored on the source rig in place. Clips with no prefixed
// bone are left untouched.
RetargetResult retarget_clip(AnimationClip& clip, const BoneMap& bone_map,
                             const RetargetOptions& options = {});

} // namespace horde::animation
