#include <horde/animation/retarget.hpp>
#include <algorithm>
#include <iterator>

namespace horde::animation {

const BoneMap& mixamo_bone_map() {
    static const BoneMap map = {
        {"Hips", "Hips"},
        {"Spine", "Spine_01"},
        {"Spine1", "Spine_02"},
        {"Spine2", "Spine_03"},
        {"Neck", "Neck"},
        {"Head", "Head"},
        {"LeftShoulder", "Clavicle_L"},
        {"LeftArm", "Shoulder_L"},
        {"LeftForeArm", "Elbow_L"},
        {"LeftHand", "Hand_L"},
        {"RightShoulder", "Clavicle_R"},
        {"RightArm", "Shoulder_R"},
        {"RightForeArm", "Elbow_R"},
        {"RightHand", "Hand_R"},
        {"LeftUpLeg", "UpperLeg_L"},
        {"LeftLeg", "LowerLeg_L"},
        {"LeftFoot", "Ankle_L"},
        {"LeftToeBase", "Toes_L"},
        {"RightUpLeg", "UpperLeg_R"},
        {"RightLeg", "LowerLeg_R"},
        {"RightFoot", "Ankle_R"},
        {"RightToeBase", "Toes_R"},
    };
    return map;
}

std::string strip_bone_prefix(const std::string& name, const std::string& prefix) {
    if (prefix.empty() || name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
        return {};
    }

    size_t start = prefix.size();
    if (name[start] == ':') {
        ++start;
    }
    return name.substr(start);
}

RetargetResult retarget_clip(AnimationClip& clip, const BoneMap& bone_map,
                             const RetargetOptions& options) {
    RetargetResult result;
    auto& channels = clip.get_channels();

    for (const auto& channel : channels) {
        if (!strip_bone_prefix(channel.get_bone_name(), options.source_prefix).empty()) {
            result.matched = true;
            break;
        }
    }
    if (!result.matched) {
        return result;
    }

    if (options.strip_translation) {
        auto it = std::remove_if(channels.begin(), channels.end(), [](const AnimationChannel& c) {
            return c.get_target_type() == AnimationChannel::TargetType::Translation;
        });
        result.stripped = static_cast<size_t>(std::distance(it, channels.end()));
        channels.erase(it, channels.end());
    }

    for (auto& channel : channels) {
        std::string short_name = strip_bone_prefix(channel.get_bone_name(), options.source_prefix);
        if (short_name.empty()) {
            continue;
        }

        auto mapped = bone_map.find(short_name);
        if (mapped != bone_map.end()) {
            channel.set_bone_name(mapped->second);
            result.renamed++;
        } else {
            result.unmapped++;
        }
    }

    return result;
}

} // namespace horde::animation
