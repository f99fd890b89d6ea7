#pragma once

#include <horde/ai/agent.hpp>
#include <horde/ai/host.hpp>
#include <horde/scene/entity.hpp>
#include <optional>
#include <vector>

namespace horde::ai {

// ============================================================================
// Spatial Queries
// Linear scans over the roster on the X/Z plane. Self and dead agents are
// always skipped.
// ============================================================================

// Ground distance to the player; infinity when there is no player
float distance_to_player(const Agent& agent, const IPlayerHandle* player);

// Living agents other than agent within radius
int count_allies_within(const std::vector<Agent>& roster, const Agent& agent, float radius);

// First agent in roster order that could join agent in a dance: alive, not
// dancing, attacking or staggered, and without a partner. nullptr when none
// qualifies or when no dances are available.
Agent* find_dance_partner(std::vector<Agent>& roster, const Agent& agent,
                          float radius, bool dances_available);

// Advances agent.flank_angle by step and returns the orbit point at radius
// around the player. nullopt without a player.
std::optional<Vec3> flank_target(Agent& agent, const IPlayerHandle* player,
                                 float radius, float step);

// Player is busy: swinging, or already engaged by a living attacker in melee range
bool is_player_distracted(const std::vector<Agent>& roster, const IPlayerHandle* player,
                          float melee_range);

Agent* find_agent(std::vector<Agent>& roster, scene::Entity id);
const Agent* find_agent(const std::vector<Agent>& roster, scene::Entity id);

} // namespace horde::ai
