#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <horde/ai/animation_binding.hpp>
#include <horde/animation/clip_source.hpp>
#include <algorithm>

using namespace horde;
using namespace horde::ai;
using namespace horde::animation;
using Catch::Matchers::WithinAbs;

TEST_CASE("Clip name tables", "[ai][animation]") {
    REQUIRE(clips::dance_names().size() == 7);
    REQUIRE(clips::attack_names().size() == 2);

    auto all = clips::all_names();
    REQUIRE(all.size() == 9 + 2 + 7);
    REQUIRE(std::find(all.begin(), all.end(), "throw") != all.end());
    REQUIRE(std::find(all.begin(), all.end(), "Thriller_Part_4") != all.end());
}

TEST_CASE("AnimationBinding load", "[ai][animation]") {
    MemoryClipSource source;
    AnimationBinding binding;

    SECTION("Full catalog") {
        for (const auto& name : clips::all_names()) {
            source.add(name, 1.5f);
        }

        REQUIRE(binding.load(source) == clips::all_names().size());
        REQUIRE(binding.dances().size() == 7);
        REQUIRE(binding.attacks().size() == 2);
        REQUIRE(binding.has(clips::Throw));
        REQUIRE_THAT(binding.duration_or(clips::Throw, 9.0f), WithinAbs(1.5f, 0.001f));
    }

    SECTION("Partial catalog degrades") {
        source.add(clips::Idle, 2.0f);
        source.add("attack_kick", 1.0f);
        source.add("Thriller_Part_2", 3.0f);

        REQUIRE(binding.load(source) == 3);
        REQUIRE(binding.dances() == std::vector<std::string>{"Thriller_Part_2"});
        REQUIRE(binding.attacks() == std::vector<std::string>{"attack_kick"});
        REQUIRE_FALSE(binding.has(clips::Throw));
        REQUIRE_THAT(binding.duration_or(clips::Impact, 0.5f), WithinAbs(0.5f, 0.001f));
        REQUIRE_THAT(binding.duration_or("attack_slash", 1.2f), WithinAbs(1.2f, 0.001f));
    }

    SECTION("Mixamo clips are retargeted on load") {
        AnimationClip dance("Tut_Hip_Hop_Dance", 4.0f);
        auto& hips_pos = dance.add_channel();
        hips_pos.set_target("mixamorig:Hips", AnimationChannel::TargetType::Translation);
        hips_pos.add_position_keyframe(0.0f, Vec3{0.0f, 1.0f, 0.0f});
        auto& hips_rot = dance.add_channel();
        hips_rot.set_target("mixamorig:Hips", AnimationChannel::TargetType::Rotation);
        hips_rot.add_rotation_keyframe(0.0f, Quat{1.0f, 0.0f, 0.0f, 0.0f});
        source.add(dance);

        binding.load(source);
        auto clip = binding.library().get("Tut_Hip_Hop_Dance");

        REQUIRE(clip != nullptr);
        REQUIRE(clip->get_channels().size() == 1);
        REQUIRE(clip->get_channels()[0].get_bone_name() == "Hips");
    }

    SECTION("Root motion kept when stripping is off") {
        AnimationClip dance("Tut_Hip_Hop_Dance", 4.0f);
        auto& hips_pos = dance.add_channel();
        hips_pos.set_target("mixamorig:Hips", AnimationChannel::TargetType::Translation);
        hips_pos.add_position_keyframe(0.0f, Vec3{0.0f, 1.0f, 0.0f});
        source.add(dance);

        binding.retarget_options().strip_translation = false;
        binding.load(source);
        auto clip = binding.library().get("Tut_Hip_Hop_Dance");

        REQUIRE(clip != nullptr);
        REQUIRE(clip->get_channels().size() == 1);
        REQUIRE(clip->get_channels()[0].get_target_type() == AnimationChannel::TargetType::Translation);
    }
}

TEST_CASE("AnimationBinding play", "[ai][animation]") {
    MemoryClipSource source;
    source.add(clips::Idle, 2.0f);
    source.add(clips::Impact, 0.8f);

    AnimationBinding binding;
    binding.load(source);

    Agent agent;

    SECTION("Plays the named clip") {
        REQUIRE(binding.play(agent, clips::Impact, PlayOptions{false, 0.0f, true}));
        REQUIRE(agent.current_clip == clips::Impact);
        REQUIRE(agent.mixer.get_current_clip_name() == clips::Impact);
    }

    SECTION("Missing clip falls back to idle") {
        REQUIRE_FALSE(binding.play(agent, clips::Throw, PlayOptions{false, 0.15f, true}));
        REQUIRE(agent.current_clip == clips::Idle);
        REQUIRE(agent.mixer.get_current_clip_name() == clips::Idle);
    }

    SECTION("Crossfade replaces the current clip") {
        binding.play(agent, clips::Idle, PlayOptions{true, 0.0f, false});
        binding.play(agent, clips::Impact, PlayOptions{false, 0.2f, true});

        REQUIRE(agent.mixer.get_current_clip_name() == clips::Impact);
        REQUIRE(agent.mixer.is_fading());
    }
}

TEST_CASE("AnimationBinding without idle", "[ai][animation]") {
    MemoryClipSource source;
    AnimationBinding binding;
    binding.load(source);

    Agent agent;
    REQUIRE_FALSE(binding.play(agent, clips::Dying, PlayOptions{false, 0.0f, true}));
    REQUIRE(agent.current_clip.empty());
    REQUIRE_FALSE(agent.mixer.is_playing());
}
