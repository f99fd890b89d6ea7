#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <horde/combat/damage_indicator.hpp>
#include <horde/scene/transform.hpp>

using namespace horde;
using namespace horde::combat;
using namespace horde::core;
using Catch::Matchers::WithinAbs;

namespace {

class FixedRandom : public Random {
public:
    explicit FixedRandom(float value) : m_value(value) {}
    float uniform() override { return m_value; }

private:
    float m_value;
};

} // namespace

TEST_CASE("Damage indicator spawn", "[combat][indicator]") {
    scene::World world;
    FixedRandom rng(0.5f);
    DamageIndicatorSystem indicators(world, rng);

    const DamageIndicator& d = indicators.spawn(Vec3{1.0f, 0.0f, 2.0f}, 25.0f);

    REQUIRE(indicators.size() == 1);
    REQUIRE_THAT(d.position.y, WithinAbs(2.0f, 0.0001f));
    REQUIRE_THAT(d.rise_speed, WithinAbs(2.5f, 0.0001f));
    REQUIRE(world.valid(d.node));
    REQUIRE(world.get<FloatingText>(d.node).text == "25");
}

TEST_CASE("Damage indicator rises, fades and expires", "[combat][indicator]") {
    scene::World world;
    FixedRandom rng(0.0f);
    DamageIndicatorSystem indicators(world, rng);
    indicators.spawn(Vec3{0.0f}, 10.0f);
    scene::Entity node = indicators.indicators()[0].node;

    Quat camera = yaw_rotation(0.3f);
    indicators.update(0.5f, camera);

    const DamageIndicator& d = indicators.indicators()[0];
    REQUIRE_THAT(d.position.y, WithinAbs(3.0f, 0.0001f));
    REQUIRE_THAT(d.opacity, WithinAbs(0.5f, 0.0001f));
    REQUIRE_THAT(d.scale, WithinAbs(1.25f, 0.0001f));

    const auto& text = world.get<FloatingText>(node);
    REQUIRE_THAT(text.opacity, WithinAbs(0.5f, 0.0001f));
    REQUIRE_THAT(text.orientation.y, WithinAbs(camera.y, 0.0001f));
    REQUIRE_THAT(world.get<scene::LocalTransform>(node).position.y, WithinAbs(3.0f, 0.0001f));

    indicators.update(0.5f, camera);
    REQUIRE(indicators.size() == 0);
    REQUIRE_FALSE(world.valid(node));
}

TEST_CASE("Damage indicator clear", "[combat][indicator]") {
    scene::World world;
    Random rng(3u);
    DamageIndicatorSystem indicators(world, rng);
    indicators.spawn(Vec3{0.0f}, 1.0f);
    indicators.spawn(Vec3{0.0f}, 2.0f);

    for (const auto& d : indicators.indicators()) {
        REQUIRE(d.rise_speed >= 2.0f);
        REQUIRE(d.rise_speed <= 3.0f);
    }

    indicators.clear();
    REQUIRE(indicators.size() == 0);
    REQUIRE(world.empty());
}
