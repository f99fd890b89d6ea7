#include <horde/ai/spatial.hpp>
#include <cmath>
#include <limits>

namespace horde::ai {

float distance_to_player(const Agent& agent, const IPlayerHandle* player) {
    if (!player) {
        return std::numeric_limits<float>::infinity();
    }
    return distance_xz(agent.position, player->position());
}

int count_allies_within(const std::vector<Agent>& roster, const Agent& agent, float radius) {
    int count = 0;
    for (const auto& other : roster) {
        if (other.id == agent.id || other.dead) continue;
        if (distance_xz(agent.position, other.position) < radius) {
            ++count;
        }
    }
    return count;
}

Agent* find_dance_partner(std::vector<Agent>& roster, const Agent& agent,
                          float radius, bool dances_available) {
    if (!dances_available) return nullptr;

    for (auto& other : roster) {
        if (other.id == agent.id || other.dead) continue;
        if (other.state == AgentState::Dancing ||
            other.state == AgentState::Attacking ||
            other.state == AgentState::Staggered) continue;
        if (other.has_partner()) continue;

        if (distance_xz(agent.position, other.position) < radius) {
            return &other;
        }
    }
    return nullptr;
}

std::optional<Vec3> flank_target(Agent& agent, const IPlayerHandle* player,
                                 float radius, float step) {
    if (!player) return std::nullopt;

    agent.flank_angle += step;

    Vec3 center = player->position();
    return Vec3{center.x + std::cos(agent.flank_angle) * radius,
                center.y,
                center.z + std::sin(agent.flank_angle) * radius};
}

bool is_player_distracted(const std::vector<Agent>& roster, const IPlayerHandle* player,
                          float melee_range) {
    if (!player) return false;
    if (player->is_attacking()) return true;

    Vec3 player_pos = player->position();
    for (const auto& other : roster) {
        if (other.dead || other.state != AgentState::Attacking) continue;
        if (distance_xz(other.position, player_pos) < melee_range) {
            return true;
        }
    }
    return false;
}

Agent* find_agent(std::vector<Agent>& roster, scene::Entity id) {
    if (id == scene::NullEntity) return nullptr;
    for (auto& agent : roster) {
        if (agent.id == id) return &agent;
    }
    return nullptr;
}

const Agent* find_agent(const std::vector<Agent>& roster, scene::Entity id) {
    if (id == scene::NullEntity) return nullptr;
    for (const auto& agent : roster) {
        if (agent.id == id) return &agent;
    }
    return nullptr;
}

} // namespace horde::ai
