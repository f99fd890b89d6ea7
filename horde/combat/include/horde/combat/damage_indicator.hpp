#pragma once

#include <horde/core/math.hpp>
#include <horde/core/random.hpp>
#include <horde/scene/world.hpp>
#include <string>
#include <vector>

namespace horde::combat {

using namespace horde::core;

// Text sprite component carried by indicator nodes
struct FloatingText {
    std::string text;
    float opacity = 1.0f;
    float scale = 1.0f;
    Quat orientation{1.0f, 0.0f, 0.0f, 0.0f};
};

// Floating damage number
struct DamageIndicator {
    scene::Entity node = scene::NullEntity;
    Vec3 position{0.0f};
    float rise_speed = 2.0f;    // Units per second upward
    float age = 0.0f;
    float lifetime = 1.0f;
    float amount = 0.0f;
    float opacity = 1.0f;
    float scale = 1.0f;
};

struct DamageIndicatorConfig {
    float spawn_height = 2.0f;
    float min_rise_speed = 2.0f;
    float max_rise_speed = 3.0f;
    float lifetime = 1.0f;
    float end_scale = 1.5f;
};

// Spawns, animates and removes damage numbers. Owns one scene node per number.
class DamageIndicatorSystem {
public:
    DamageIndicatorSystem(scene::World& world, Random& random);
    ~DamageIndicatorSystem();

    DamageIndicatorSystem(const DamageIndicatorSystem&) = delete;
    DamageIndicatorSystem& operator=(const DamageIndicatorSystem&) = delete;

    // Number appears above position
    const DamageIndicator& spawn(const Vec3& position, float amount);

    // Rise, fade and grow; faded numbers are removed
    void update(float delta_time, const Quat& camera_orientation);

    void clear();

    const std::vector<DamageIndicator>& indicators() const { return m_indicators; }
    size_t size() const { return m_indicators.size(); }

    void set_random(Random& random) { m_random = &random; }

    DamageIndicatorConfig& config() { return m_config; }
    const DamageIndicatorConfig& config() const { return m_config; }

private:
    scene::World& m_world;
    Random* m_random;
    DamageIndicatorConfig m_config;
    std::vector<DamageIndicator> m_indicators;
};

} // namespace horde::combat
