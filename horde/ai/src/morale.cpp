#include <horde/ai/morale.hpp>
#include <horde/ai/spatial.hpp>
#include <algorithm>

namespace horde::ai {

float compute_courage(float base_courage, int allies, float health_fraction, bool rallied,
                      const settings::AgentSettings& settings) {
    float ally_bonus = std::min(settings.ally_courage_bonus * static_cast<float>(allies),
                                settings.max_ally_courage_bonus);
    float injury = settings.injury_courage_penalty * (1.0f - std::clamp(health_fraction, 0.0f, 1.0f));
    float rally = rallied ? settings.rally_courage_bonus : 0.0f;

    return std::clamp(base_courage + ally_bonus - injury + rally, 0.0f, 1.0f);
}

void update_morale(Agent& agent, const std::vector<Agent>& roster,
                   const settings::AgentSettings& settings, float delta_time) {
    if (agent.rallied) {
        agent.rally_timer -= delta_time;
        if (agent.rally_timer <= 0.0f) {
            agent.rallied = false;
            agent.rally_timer = 0.0f;
        }
    }

    int allies = count_allies_within(roster, agent, settings.ally_detection_radius);
    agent.courage = compute_courage(agent.base_courage, allies, agent.health.fraction(),
                                    agent.rallied, settings);
}

float alert_delay(const Agent& agent, const settings::AgentSettings& settings) {
    float placid = 1.0f - std::clamp(agent.personality, 0.0f, 1.0f);
    return settings.alert_delay_min + placid * (settings.alert_delay_max - settings.alert_delay_min);
}

} // namespace horde::ai
