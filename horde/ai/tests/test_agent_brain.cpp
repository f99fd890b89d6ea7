#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "director_fixture.hpp"
#include <algorithm>
#include <string>
#include <vector>

using namespace horde;
using namespace horde::ai;
using namespace horde::ai::test;
using Catch::Matchers::WithinAbs;

TEST_CASE("AgentState names", "[ai][brain]") {
    REQUIRE(std::string(to_string(AgentState::Idle)) == "idle");
    REQUIRE(std::string(to_string(AgentState::Scrambling)) == "scrambling");
    REQUIRE(std::string(to_string(AgentState::Dying)) == "dying");
}

TEST_CASE("Solo dance completes to idle", "[ai][brain][dance]") {
    DirectorFixture fx;
    fx.init();
    scene::Entity id = fx.spawn_at(0.0f, 0.0f);
    fx.agent(id).idle_timer = 0.0f;

    // Dance roll, solo roll, clip pick (index 3), length factor 0.5 + 0.5
    fx.rng.push({0.0f, 0.0f, 0.5f, 0.5f});
    fx.tick();

    REQUIRE(fx.agent(id).state == AgentState::Dancing);
    REQUIRE(fx.agent(id).current_dance == "Step_Hip_Hop_Dance");
    REQUIRE_THAT(fx.agent(id).max_dance_duration, WithinAbs(2.0f, 0.001f));
    REQUIRE_FALSE(fx.agent(id).has_partner());

    fx.tick(121);

    Agent& agent = fx.agent(id);
    REQUIRE(agent.state == AgentState::Idle);
    REQUIRE(agent.mixer.get_current_clip_name() == clips::Idle);
    REQUIRE(agent.current_dance.empty());
    REQUIRE(agent.dance_partner == scene::NullEntity);

    // Crossfade done: nothing of the dance is left on the mixer
    fx.tick_for(0.5f);
    REQUIRE(fx.agent(id).state == AgentState::Idle);
    REQUIRE_FALSE(fx.agent(id).mixer.is_fading());
}

TEST_CASE("Idle agents pair up to dance", "[ai][brain][dance]") {
    DirectorFixture fx;
    fx.init();
    scene::Entity a = fx.spawn_at(0.0f, 0.0f);
    scene::Entity b = fx.spawn_at(2.0f, 0.0f);

    fx.rng.push({0.0f});
    fx.tick();

    REQUIRE(fx.agent(a).state == AgentState::Dancing);
    REQUIRE(fx.agent(b).state == AgentState::Dancing);
    REQUIRE(fx.agent(a).dance_partner == b);
    REQUIRE(fx.agent(b).dance_partner == a);
}

TEST_CASE("Pair dance interrupted by proximity", "[ai][brain][dance]") {
    DirectorFixture fx;
    fx.init();
    scene::Entity a = fx.spawn_at(0.0f, 0.0f);
    scene::Entity b = fx.spawn_at(2.0f, 0.0f);
    REQUIRE(fx.director.start_dance(a, b));

    std::vector<DanceStoppedEvent> stops;
    auto conn = fx.director.events().subscribe<DanceStoppedEvent>(
        [&](const DanceStoppedEvent& e) { stops.push_back(e); });

    fx.tick(9);
    REQUIRE(fx.agent(a).state == AgentState::Dancing);
    REQUIRE(fx.agent(b).state == AgentState::Dancing);
    REQUIRE(stops.empty());

    fx.player.set_position(Vec3{0.0f});
    fx.tick();

    REQUIRE(stops.size() == 2);
    for (const auto& stop : stops) {
        REQUIRE(stop.reason == "player too close");
    }

    for (scene::Entity id : {a, b}) {
        const Agent& agent = fx.agent(id);
        REQUIRE(agent.state == AgentState::Scrambling);
        REQUIRE(agent.mixer.get_current_clip_name() == clips::Impact);
        REQUIRE_FALSE(agent.has_partner());
        REQUIRE(agent.has_noticed_player);
    }
}

TEST_CASE("Throw emits at 60 percent", "[ai][brain][throw]") {
    DirectorFixture fx;
    add_all_clips(fx.source);
    fx.source.add(clips::Throw, 1.5f);
    fx.init();

    scene::Entity id = fx.spawn_at(0.0f, 0.0f);
    fx.player.set_position(Vec3{10.0f, 0.0f, 0.0f});

    int launched = 0;
    auto conn = fx.director.events().subscribe<ProjectileLaunchedEvent>(
        [&](const ProjectileLaunchedEvent& e) {
            REQUIRE(e.thrower == id);
            ++launched;
        });

    fx.director.brain().enter_throwing(fx.agent(id));
    REQUIRE(fx.agent(id).mixer.get_current_clip_name() == clips::Throw);

    fx.tick(53);
    REQUIRE(launched == 0);

    fx.tick(3);
    REQUIRE(launched == 1);
    REQUIRE(fx.agent(id).state == AgentState::Throwing);

    fx.tick(24);
    REQUIRE(fx.agent(id).state == AgentState::Throwing);

    fx.tick(3);
    REQUIRE(fx.agent(id).state == AgentState::Circling);
    REQUIRE(launched == 1);
}

TEST_CASE("Throwing is disabled without a throw clip", "[ai][brain][throw]") {
    settings::AgentSettings s;
    s.throw_rate = 1000.0f;
    DirectorFixture fx(s);
    for (const auto& name : clips::all_names()) {
        if (name != clips::Throw) fx.source.add(name, 2.0f);
    }
    fx.init();

    scene::Entity id = fx.spawn_at(5.0f, 0.0f);
    fx.agent(id).can_throw = true;
    fx.agent(id).flank_angle = PI;
    fx.player.set_position(Vec3{10.0f, 0.0f, 0.0f});
    fx.director.brain().enter_circling(fx.agent(id), 0.2f);

    fx.tick(30);
    REQUIRE(fx.agent(id).state == AgentState::Circling);
    REQUIRE(fx.director.projectiles().empty());
}

TEST_CASE("Scramble dispatch by courage", "[ai][brain][scramble]") {
    settings::AgentSettings s;
    s.ally_courage_bonus = 0.0f;
    s.rally_base_chance = 1.0f;
    DirectorFixture fx(s);
    fx.init();

    scene::Entity id = fx.spawn_at(0.0f, 0.0f);
    fx.player.set_position(Vec3{10.0f, 0.0f, 0.0f});

    SECTION("Still reacting before 70% of the impact clip") {
        fx.director.brain().enter_scrambling(fx.agent(id));
        fx.tick_for(1.3f);
        REQUIRE(fx.agent(id).state == AgentState::Scrambling);
    }

    SECTION("Low courage flees") {
        fx.agent(id).base_courage = 0.2f;
        fx.director.brain().enter_scrambling(fx.agent(id));
        fx.tick_for(1.5f);

        REQUIRE(fx.agent(id).state == AgentState::Fleeing);
        REQUIRE(fx.agent(id).target.x < 0.0f);
    }

    SECTION("Middling courage circles") {
        fx.agent(id).base_courage = 0.5f;
        fx.director.brain().enter_scrambling(fx.agent(id));
        fx.tick_for(1.5f);

        REQUIRE(fx.agent(id).state == AgentState::Circling);
    }

    SECTION("High courage charges and rallies") {
        scene::Entity b = fx.spawn_at(-2.0f, 0.0f);
        scene::Entity c = fx.spawn_at(0.0f, -3.0f);
        fx.agent(id).base_courage = 0.8f;

        int rallied = 0;
        auto conn = fx.director.events().subscribe<AgentRalliedEvent>(
            [&](const AgentRalliedEvent& e) {
                REQUIRE(e.rallied_by == id);
                ++rallied;
            });

        fx.director.brain().enter_scrambling(fx.agent(id));
        fx.tick_for(1.5f);

        const Agent& agent = fx.agent(id);
        REQUIRE(agent.state == AgentState::Walking);
        REQUIRE_THAT(agent.target.x, WithinAbs(10.0f, 0.001f));
        REQUIRE(rallied == 2);
        REQUIRE(fx.agent(b).rallied);
        REQUIRE(fx.agent(c).rallied);
    }

    SECTION("Oblivious agents shrug it off") {
        fx.agent(id).personality = 0.95f;
        fx.agent(id).base_courage = 0.8f;
        fx.director.brain().enter_scrambling(fx.agent(id));
        fx.tick_for(1.5f);

        REQUIRE(fx.agent(id).state == AgentState::Idle);
        REQUIRE_FALSE(fx.agent(id).has_noticed_player);
    }
}

TEST_CASE("Trip cooldown while idle", "[ai][brain][trip]") {
    DirectorFixture fx;
    fx.init();
    scene::Entity id = fx.spawn_at(0.0f, 0.0f);
    fx.agent(id).trip_chance = 1000.0f;

    std::vector<float> trips;
    auto conn = fx.director.events().subscribe<AgentStateChangedEvent>(
        [&](const AgentStateChangedEvent& e) {
            if (e.current == AgentState::Tripping) trips.push_back(fx.director.elapsed_time());
        });

    fx.tick_for(40.0f);

    REQUIRE(trips.size() >= 2);
    for (size_t i = 1; i < trips.size(); ++i) {
        REQUIRE(trips[i] - trips[i - 1] >= 15.0f - 0.001f);
    }
}

TEST_CASE("Trip cooldown while circling", "[ai][brain][trip]") {
    settings::AgentSettings s;
    s.flank_angle_step = 0.002f;
    DirectorFixture fx(s);
    fx.init();

    scene::Entity id = fx.spawn_at(5.0f, 0.0f);
    fx.player.set_position(Vec3{10.0f, 0.0f, 0.0f});
    {
        Agent& agent = fx.agent(id);
        agent.trip_chance = 1000.0f;
        agent.has_noticed_player = true;
        agent.flank_angle = PI;
    }

    std::vector<float> trips;
    auto conn = fx.director.events().subscribe<AgentStateChangedEvent>(
        [&](const AgentStateChangedEvent& e) {
            if (e.current == AgentState::Tripping) trips.push_back(fx.director.elapsed_time());
        });

    fx.director.brain().enter_circling(fx.agent(id), 0.2f);
    fx.tick_for(30.0f);

    REQUIRE(trips.size() >= 2);
    for (size_t i = 1; i < trips.size(); ++i) {
        REQUIRE(trips[i] - trips[i - 1] >= 10.0f - 0.001f);
    }
    REQUIRE(fx.agent(id).state != AgentState::Attacking);
}

TEST_CASE("Melee engage and combos", "[ai][brain][attack]") {
    DirectorFixture fx;
    fx.init();
    scene::Entity id = fx.spawn_at(0.0f, 0.0f);
    fx.player.set_position(Vec3{1.0f, 0.0f, 0.0f});

    std::vector<std::string> attacks;
    auto conn = fx.director.events().subscribe<AgentAttackEvent>(
        [&](const AgentAttackEvent& e) { attacks.push_back(e.attack); });

    fx.tick();
    REQUIRE(fx.agent(id).state == AgentState::Attacking);
    REQUIRE(fx.agent(id).has_noticed_player);
    REQUIRE(attacks.size() == 1);
    REQUIRE((attacks[0] == "attack_slash" || attacks[0] == "attack_kick"));
    REQUIRE(fx.agent(id).mixer.get_current_clip_name() == attacks[0]);

    // Faces the player
    REQUIRE_THAT(fx.agent(id).yaw, WithinAbs(PI * 0.5f, 0.001f));

    fx.tick_for(1.0f);
    REQUIRE(attacks.size() == 1);

    // First swing ends at 90% of its clip; player still in reach
    fx.tick_for(1.0f);
    REQUIRE(fx.agent(id).state == AgentState::Attacking);
    REQUIRE(fx.agent(id).attack_count == 1);
    REQUIRE(attacks.size() == 2);

    fx.player.set_position(Vec3{20.0f, 0.0f, 0.0f});
    fx.tick_for(2.0f);
    REQUIRE(fx.agent(id).state == AgentState::Idle);
    REQUIRE(fx.agent(id).attack_count == 0);
}

TEST_CASE("Walking", "[ai][brain][walking]") {
    settings::AgentSettings s;
    DirectorFixture fx(s);

    SECTION("Arrives and idles") {
        fx.init();
        scene::Entity id = fx.spawn_at(0.0f, 0.0f);
        fx.director.brain().enter_walking(fx.agent(id), Vec3{2.0f, 0.0f, 0.0f}, 0.2f);
        REQUIRE(fx.agent(id).mixer.get_current_clip_name() == clips::RunForward);

        fx.tick_for(1.0f);

        REQUIRE(fx.agent(id).state == AgentState::Idle);
        REQUIRE(distance_xz(fx.agent(id).position, Vec3{2.0f, 0.0f, 0.0f}) < 0.5f + 0.001f);
    }

    SECTION("Follows the terrain") {
        fx.ground.set_height(3.0f);
        fx.init();
        scene::Entity id = fx.spawn_at(0.0f, 0.0f);
        fx.director.brain().enter_walking(fx.agent(id), Vec3{5.0f, 0.0f, 0.0f}, 0.2f);

        fx.tick();
        REQUIRE_THAT(fx.agent(id).position.y, WithinAbs(3.0f, 0.001f));
    }

    SECTION("Wanders when the idle timer runs out, even without a player") {
        fx.init();
        scene::Entity id = fx.spawn_at(0.0f, 0.0f);
        fx.director.set_player(nullptr);
        fx.agent(id).idle_timer = 0.0f;

        fx.tick();
        REQUIRE(fx.agent(id).state == AgentState::Walking);
        REQUIRE(distance_xz(fx.agent(id).target, fx.agent(id).position) <= 10.0f);
    }

    SECTION("Pushes other agents apart") {
        fx.init();
        scene::Entity a = fx.spawn_at(0.0f, 0.0f);
        scene::Entity b = fx.spawn_at(0.6f, 0.0f);
        fx.director.brain().enter_walking(fx.agent(a), Vec3{10.0f, 0.0f, 0.0f}, 0.2f);

        fx.tick();
        REQUIRE_THAT(distance_xz(fx.agent(a).position, fx.agent(b).position), WithinAbs(1.0f, 0.001f));
    }

    SECTION("Dead agents do not collide") {
        fx.init();
        scene::Entity a = fx.spawn_at(0.0f, 0.0f);
        scene::Entity b = fx.spawn_at(0.6f, 0.0f);
        fx.director.damage(b, 1000.0f);
        fx.director.brain().enter_walking(fx.agent(a), Vec3{10.0f, 0.0f, 0.0f}, 0.2f);

        fx.tick();
        REQUIRE(distance_xz(fx.agent(a).position, fx.agent(b).position) < 0.6f);
    }
}

TEST_CASE("Walking pushes away from the player", "[ai][brain][walking]") {
    settings::AgentSettings s;
    s.melee_range = 0.1f;
    DirectorFixture fx(s);
    fx.init();

    scene::Entity id = fx.spawn_at(0.0f, 0.0f);
    fx.player.set_position(Vec3{0.5f, 0.0f, 0.0f});
    fx.director.brain().enter_walking(fx.agent(id), Vec3{10.0f, 0.0f, 0.0f}, 0.2f);

    fx.tick();
    REQUIRE_THAT(distance_xz(fx.agent(id).position, fx.player.position()), WithinAbs(1.0f, 0.001f));
}

TEST_CASE("Fleeing", "[ai][brain][flee]") {
    DirectorFixture fx;
    fx.init();
    scene::Entity id = fx.spawn_at(0.0f, 0.0f);
    fx.player.set_position(Vec3{10.0f, 0.0f, 0.0f});

    fx.director.brain().enter_fleeing(fx.agent(id), 1.0f, 15.0f, 0.2f);
    REQUIRE_THAT(fx.agent(id).target.x, WithinAbs(-15.0f, 0.001f));

    fx.tick_for(0.5f);
    REQUIRE(fx.agent(id).state == AgentState::Fleeing);
    REQUIRE(fx.agent(id).position.x < -1.0f);

    fx.tick_for(0.6f);
    REQUIRE(fx.agent(id).state == AgentState::Idle);
}

TEST_CASE("Strafe clip classification", "[ai][brain][circling]") {
    // Facing +X, yaw PI/2
    float facing = PI * 0.5f;

    REQUIRE(AgentBrain::strafe_clip(PI * 0.5f, facing) == clips::RunForward);
    REQUIRE(AgentBrain::strafe_clip(-PI * 0.5f, facing) == clips::RunBackward);
    REQUIRE(AgentBrain::strafe_clip(PI, facing) == clips::RunRight);
    REQUIRE(AgentBrain::strafe_clip(0.0f, facing) == clips::RunLeft);
    REQUIRE(AgentBrain::strafe_clip(0.14f, facing) == clips::RunLeft);

    SECTION("Difference wraps across PI") {
        REQUIRE(AgentBrain::strafe_clip(-PI * 0.9f, PI * 0.9f) == clips::RunForward);
        REQUIRE(AgentBrain::strafe_clip(-PI * 0.5f, PI * 0.9f) == clips::RunRight);
    }
}

TEST_CASE("Circling", "[ai][brain][circling]") {
    DirectorFixture fx;
    fx.init();
    scene::Entity id = fx.spawn_at(5.0f, 0.0f);
    fx.player.set_position(Vec3{10.0f, 0.0f, 0.0f});

    SECTION("Strafes while facing the player") {
        fx.agent(id).flank_angle = PI - 0.3f;
        fx.director.brain().enter_circling(fx.agent(id), 0.2f);
        fx.tick();

        const Agent& agent = fx.agent(id);
        REQUIRE(agent.state == AgentState::Circling);
        REQUIRE(agent.current_strafe_clip == clips::RunLeft);
        REQUIRE(agent.mixer.get_current_clip_name() == clips::RunLeft);
        REQUIRE_THAT(agent.yaw, WithinAbs(yaw_towards(agent.position, fx.player.position()), 0.001f));
    }

    SECTION("Charges a distracted player") {
        fx.agent(id).flank_angle = PI;
        fx.player.set_attacking(true);
        fx.director.brain().enter_circling(fx.agent(id), 0.2f);
        fx.tick();

        REQUIRE(fx.agent(id).state == AgentState::Walking);
        REQUIRE_THAT(fx.agent(id).target.x, WithinAbs(10.0f, 0.001f));
    }

    SECTION("Gives up without a player") {
        fx.director.brain().enter_circling(fx.agent(id), 0.2f);
        fx.director.set_player(nullptr);
        fx.tick();

        REQUIRE(fx.agent(id).state == AgentState::Idle);
    }

    SECTION("Idle agents that noticed the player start circling") {
        fx.agent(id).has_noticed_player = true;
        fx.tick();

        REQUIRE(fx.agent(id).state == AgentState::Circling);
    }
}

TEST_CASE("Taunting", "[ai][brain][taunt]") {
    settings::AgentSettings s;
    s.taunt_rate = 1000.0f;
    DirectorFixture fx(s);
    fx.init();

    scene::Entity id = fx.spawn_at(5.0f, 0.0f);
    fx.agent(id).flank_angle = PI;
    fx.player.set_position(Vec3{10.0f, 0.0f, 0.0f});
    fx.director.brain().enter_circling(fx.agent(id), 0.2f);

    fx.tick();
    REQUIRE(fx.agent(id).state == AgentState::Taunting);

    const auto& dances = fx.director.animation().dances();
    std::string clip = fx.agent(id).mixer.get_current_clip_name();
    REQUIRE(std::find(dances.begin(), dances.end(), clip) != dances.end());

    SECTION("Flees when the player closes in") {
        Vec3 pos = fx.agent(id).position;
        fx.player.set_position(Vec3{pos.x + 5.0f, 0.0f, pos.z});
        fx.tick();

        REQUIRE(fx.agent(id).state == AgentState::Fleeing);
        REQUIRE_THAT(distance_xz(fx.agent(id).target, pos), WithinAbs(12.0f, 0.01f));
    }

    SECTION("Flee distance follows taunt_radius") {
        settings::AgentSettings tuned = fx.director.settings();
        tuned.taunt_radius = 7.0f;
        fx.director.set_settings(tuned);

        Vec3 pos = fx.agent(id).position;
        fx.player.set_position(Vec3{pos.x, 0.0f, pos.z + 4.0f});
        fx.tick();

        REQUIRE(fx.agent(id).state == AgentState::Fleeing);
        REQUIRE_THAT(distance_xz(fx.agent(id).target, pos), WithinAbs(7.0f, 0.01f));
        REQUIRE(fx.agent(id).target.z < pos.z);
    }

    SECTION("Returns to circling when the taunt ends") {
        bool returned = false;
        auto conn = fx.director.events().subscribe<AgentStateChangedEvent>(
            [&](const AgentStateChangedEvent& e) {
                if (e.previous == AgentState::Taunting && e.current == AgentState::Circling) returned = true;
            });

        fx.tick_for(3.1f);
        REQUIRE(returned);
    }
}
