#pragma once

#include <horde/combat/damage.hpp>
#include <horde/core/math.hpp>

namespace horde::combat {

enum class HealthBarColor {
    Green,
    Yellow,
    Red
};

// Billboarded bar floating above a character
struct HealthBar {
    bool visible = false;
    float fill = 1.0f;                          // 0-1, left aligned
    HealthBarColor color = HealthBarColor::Green;
    Quat orientation{1.0f, 0.0f, 0.0f, 0.0f};  // Copied from the camera
    float height_offset = 2.2f;                 // Above the character's origin
};

// Green above half, yellow above a quarter, red otherwise
HealthBarColor health_bar_color(float fraction);

// Hidden at full health and once dead; otherwise fill, colour and facing follow
// the health and the camera.
void update_health_bar(HealthBar& bar, const Health& health, bool dead,
                       const Quat& camera_orientation);

} // namespace horde::combat
