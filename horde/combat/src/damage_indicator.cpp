#include <horde/combat/damage_indicator.hpp>
#include <horde/scene/transform.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>

namespace horde::combat {

DamageIndicatorSystem::DamageIndicatorSystem(scene::World& world, Random& random)
    : m_world(world)
    , m_random(&random)
{
}

DamageIndicatorSystem::~DamageIndicatorSystem() {
    clear();
}

const DamageIndicator& DamageIndicatorSystem::spawn(const Vec3& position, float amount) {
    DamageIndicator indicator;
    indicator.position = position + Vec3{0.0f, m_config.spawn_height, 0.0f};
    indicator.rise_speed = m_random->range(m_config.min_rise_speed, m_config.max_rise_speed);
    indicator.lifetime = m_config.lifetime;
    indicator.amount = amount;

    indicator.node = m_world.create("DamageNumber");
    m_world.emplace<scene::LocalTransform>(indicator.node, indicator.position);

    FloatingText text;
    text.text = std::to_string(static_cast<int>(std::round(amount)));
    m_world.emplace<FloatingText>(indicator.node, text);

    m_indicators.push_back(indicator);
    return m_indicators.back();
}

void DamageIndicatorSystem::update(float delta_time, const Quat& camera_orientation) {
    for (auto& indicator : m_indicators) {
        indicator.age += delta_time;
        indicator.position.y += indicator.rise_speed * delta_time;

        float progress = std::min(indicator.age / indicator.lifetime, 1.0f);
        indicator.opacity = 1.0f - progress;
        indicator.scale = 1.0f + progress * (m_config.end_scale - 1.0f);

        if (auto* tf = m_world.try_get<scene::LocalTransform>(indicator.node)) {
            tf->position = indicator.position;
            tf->scale = Vec3{indicator.scale};
        }
        if (auto* text = m_world.try_get<FloatingText>(indicator.node)) {
            text->opacity = indicator.opacity;
            text->scale = indicator.scale;
            text->orientation = camera_orientation;
        }
    }

    for (size_t i = m_indicators.size(); i-- > 0;) {
        if (m_indicators[i].age >= m_indicators[i].lifetime) {
            m_world.destroy(m_indicators[i].node);
            m_indicators.erase(m_indicators.begin() + static_cast<std::ptrdiff_t>(i));
        }
    }
}

void DamageIndicatorSystem::clear() {
    for (const auto& indicator : m_indicators) {
        m_world.destroy(indicator.node);
    }
    m_indicators.clear();
}

} // namespace horde::combat
