#pragma once

#include <horde/core/math.hpp>
#include <horde/scene/entity.hpp>

namespace horde::combat {

using namespace horde::core;

// Hit points clamped to [0, max]
struct Health {
    float current = 100.0f;
    float max = 100.0f;

    float fraction() const { return max > 0.0f ? current / max : 0.0f; }
    bool is_full() const { return current >= max; }
    bool is_depleted() const { return current <= 0.0f; }
};

// Outcome of one hit
struct DamageInfo {
    scene::Entity source = scene::NullEntity;   // Who dealt the damage
    scene::Entity target = scene::NullEntity;   // Who received it

    float raw_damage = 0.0f;                    // Requested amount
    float final_damage = 0.0f;                  // Amount actually removed
    Vec3 hit_point{0.0f};

    bool lethal = false;                        // Health reached 0 on this hit
};

// Subtracts amount from health, clamping at 0. Negative amounts are ignored.
DamageInfo apply_damage(Health& health, float amount,
                        scene::Entity source = scene::NullEntity,
                        scene::Entity target = scene::NullEntity,
                        const Vec3& hit_point = Vec3{0.0f});

} // namespace horde::combat
