#include <horde/combat/damage.hpp>
#include <algorithm>

namespace horde::combat {

DamageInfo apply_damage(Health& health, float amount,
                        scene::Entity source, scene::Entity target,
                        const Vec3& hit_point) {
    DamageInfo info;
    info.source = source;
    info.target = target;
    info.raw_damage = amount;
    info.hit_point = hit_point;

    if (amount <= 0.0f || health.is_depleted()) {
        return info;
    }

    float before = health.current;
    health.current = std::clamp(health.current - amount, 0.0f, health.max);
    info.final_damage = before - health.current;
    info.lethal = health.is_depleted();

    return info;
}

} // namespace horde::combat
