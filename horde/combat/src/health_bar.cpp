#include <horde/combat/health_bar.hpp>
#include <algorithm>

namespace horde::combat {

HealthBarColor health_bar_color(float fraction) {
    if (fraction > 0.5f) return HealthBarColor::Green;
    if (fraction > 0.25f) return HealthBarColor::Yellow;
    return HealthBarColor::Red;
}

void update_health_bar(HealthBar& bar, const Health& health, bool dead,
                       const Quat& camera_orientation) {
    float fraction = std::clamp(health.fraction(), 0.0f, 1.0f);

    bar.visible = fraction < 1.0f && !dead;
    if (!bar.visible) return;

    bar.fill = fraction;
    bar.color = health_bar_color(fraction);
    bar.orientation = camera_orientation;
}

} // namespace horde::combat
