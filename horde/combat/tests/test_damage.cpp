#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <horde/combat/damage.hpp>
#include <horde/combat/health_bar.hpp>

using namespace horde::combat;
using namespace horde::core;
using Catch::Matchers::WithinAbs;

TEST_CASE("Health defaults", "[combat][damage]") {
    Health health;

    REQUIRE_THAT(health.current, WithinAbs(100.0f, 0.0001f));
    REQUIRE(health.is_full());
    REQUIRE_FALSE(health.is_depleted());
    REQUIRE_THAT(health.fraction(), WithinAbs(1.0f, 0.0001f));
}

TEST_CASE("apply_damage", "[combat][damage]") {
    Health health{10.0f, 100.0f};

    SECTION("Non-lethal hit") {
        DamageInfo info = apply_damage(health, 4.0f);
        REQUIRE_THAT(health.current, WithinAbs(6.0f, 0.0001f));
        REQUIRE_THAT(info.final_damage, WithinAbs(4.0f, 0.0001f));
        REQUIRE_FALSE(info.lethal);
    }

    SECTION("Overkill clamps at zero") {
        DamageInfo info = apply_damage(health, 15.0f);
        REQUIRE_THAT(health.current, WithinAbs(0.0f, 0.0001f));
        REQUIRE_THAT(info.raw_damage, WithinAbs(15.0f, 0.0001f));
        REQUIRE_THAT(info.final_damage, WithinAbs(10.0f, 0.0001f));
        REQUIRE(info.lethal);
    }

    SECTION("Depleted health takes no further damage") {
        apply_damage(health, 15.0f);
        DamageInfo info = apply_damage(health, 5.0f);
        REQUIRE_THAT(info.final_damage, WithinAbs(0.0f, 0.0001f));
        REQUIRE_FALSE(info.lethal);
        REQUIRE(health.current >= 0.0f);
    }

    SECTION("Negative amounts are ignored") {
        apply_damage(health, -5.0f);
        REQUIRE_THAT(health.current, WithinAbs(10.0f, 0.0001f));
    }
}

TEST_CASE("Health bar colour thresholds", "[combat][health_bar]") {
    REQUIRE(health_bar_color(1.0f) == HealthBarColor::Green);
    REQUIRE(health_bar_color(0.51f) == HealthBarColor::Green);
    REQUIRE(health_bar_color(0.5f) == HealthBarColor::Yellow);
    REQUIRE(health_bar_color(0.26f) == HealthBarColor::Yellow);
    REQUIRE(health_bar_color(0.25f) == HealthBarColor::Red);
    REQUIRE(health_bar_color(0.0f) == HealthBarColor::Red);
}

TEST_CASE("Health bar visibility and billboarding", "[combat][health_bar]") {
    HealthBar bar;
    Quat camera = yaw_rotation(1.0f);

    SECTION("Hidden at full health") {
        update_health_bar(bar, Health{100.0f, 100.0f}, false, camera);
        REQUIRE_FALSE(bar.visible);
    }

    SECTION("Shown when damaged and faces the camera") {
        update_health_bar(bar, Health{40.0f, 100.0f}, false, camera);
        REQUIRE(bar.visible);
        REQUIRE_THAT(bar.fill, WithinAbs(0.4f, 0.0001f));
        REQUIRE(bar.color == HealthBarColor::Yellow);
        REQUIRE_THAT(bar.orientation.w, WithinAbs(camera.w, 0.0001f));
        REQUIRE_THAT(bar.orientation.y, WithinAbs(camera.y, 0.0001f));
    }

    SECTION("Hidden once dead") {
        update_health_bar(bar, Health{0.0f, 100.0f}, true, camera);
        REQUIRE_FALSE(bar.visible);
    }
}
