#pragma once

#include <horde/ai/agent.hpp>
#include <horde/settings/agent_settings.hpp>
#include <vector>

namespace horde::ai {

// ============================================================================
// Morale
//
// courage = clamp(base + min(ally_bonus * allies, max_ally_bonus)
//                 - injury_penalty * (1 - health / max_health)
//                 + (rallied ? rally_bonus : 0), 0, 1)
// ============================================================================

float compute_courage(float base_courage, int allies, float health_fraction, bool rallied,
                      const settings::AgentSettings& settings);

// Ticks the rally timer, then recomputes and caches agent.courage
void update_morale(Agent& agent, const std::vector<Agent>& roster,
                   const settings::AgentSettings& settings, float delta_time);

// Seconds an alerted agent takes to react; excitable (high personality) agents are fastest
float alert_delay(const Agent& agent, const settings::AgentSettings& settings);

} // namespace horde::ai
