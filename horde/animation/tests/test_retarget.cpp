#include <catch2/catch_test_macros.hpp>
#include <horde/animation/retarget.hpp>

using namespace horde::animation;
using namespace horde::core;

namespace {

void add_rotation(AnimationClip& clip, const std::string& bone) {
    auto& channel = clip.add_channel();
    channel.set_target(bone, AnimationChannel::TargetType::Rotation);
    channel.add_rotation_keyframe(0.0f, Quat{1.0f, 0.0f, 0.0f, 0.0f});
}

void add_translation(AnimationClip& clip, const std::string& bone) {
    auto& channel = clip.add_channel();
    channel.set_target(bone, AnimationChannel::TargetType::Translation);
    channel.add_position_keyframe(0.0f, Vec3{0.0f, 1.0f, 0.0f});
}

} // namespace

TEST_CASE("strip_bone_prefix", "[animation][retarget]") {
    REQUIRE(strip_bone_prefix("mixamorigHips", "mixamorig") == "Hips");
    REQUIRE(strip_bone_prefix("mixamorig:Spine1", "mixamorig") == "Spine1");
    REQUIRE(strip_bone_prefix("Hips", "mixamorig").empty());
    REQUIRE(strip_bone_prefix("mixamorig", "mixamorig").empty());
}

TEST_CASE("Mixamo bone map", "[animation][retarget]") {
    const auto& map = mixamo_bone_map();

    REQUIRE(map.size() == 22);
    REQUIRE(map.at("Spine") == "Spine_01");
    REQUIRE(map.at("Spine1") == "Spine_02");
    REQUIRE(map.at("Spine2") == "Spine_03");
    REQUIRE(map.at("LeftForeArm") == "Elbow_L");
    REQUIRE(map.at("RightToeBase") == "Toes_R");
}

TEST_CASE("retarget_clip rewrites Mixamo clips", "[animation][retarget]") {
    AnimationClip clip("Booty_Hip_Hop_Dance", 4.0f);
    add_translation(clip, "mixamorig:Hips");
    add_rotation(clip, "mixamorig:Hips");
    add_rotation(clip, "mixamorig:Spine1");
    add_rotation(clip, "mixamorigLeftArm");
    add_rotation(clip, "mixamorig:LeftHandThumb1");

    SECTION("Renames bones and strips translation") {
        RetargetResult result = retarget_clip(clip, mixamo_bone_map());

        REQUIRE(result.matched);
        REQUIRE(result.stripped == 1);
        REQUIRE(result.renamed == 3);
        REQUIRE(result.unmapped == 1);

        const auto& channels = clip.get_channels();
        REQUIRE(channels.size() == 4);
        REQUIRE(channels[0].get_bone_name() == "Hips");
        REQUIRE(channels[1].get_bone_name() == "Spine_02");
        REQUIRE(channels[2].get_bone_name() == "Shoulder_L");
        REQUIRE(channels[3].get_bone_name() == "mixamorig:LeftHandThumb1");

        for (const auto& channel : channels) {
            REQUIRE(channel.get_target_type() != AnimationChannel::TargetType::Translation);
        }
    }

    SECTION("Translation can be kept") {
        RetargetOptions options;
        options.strip_translation = false;
        RetargetResult result = retarget_clip(clip, mixamo_bone_map(), options);

        REQUIRE(result.stripped == 0);
        REQUIRE(clip.get_channels().size() == 5);
        REQUIRE(clip.get_channels()[0].get_bone_name() == "Hips");
    }
}

TEST_CASE("retarget_clip leaves native clips alone", "[animation][retarget]") {
    AnimationClip clip("Walk", 1.0f);
    add_translation(clip, "Hips");
    add_rotation(clip, "Spine_01");

    RetargetResult result = retarget_clip(clip, mixamo_bone_map());

    REQUIRE_FALSE(result.matched);
    REQUIRE(clip.get_channels().size() == 2);
    REQUIRE(clip.get_channels()[0].get_target_type() == AnimationChannel::TargetType::Translation);
}
