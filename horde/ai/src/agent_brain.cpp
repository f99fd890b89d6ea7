#include <horde/ai/agent_brain.hpp>
#include <horde/ai/director.hpp>
#include <horde/ai/morale.hpp>
#include <horde/ai/spatial.hpp>
#include <horde/core/log.hpp>
#include <algorithm>
#include <cmath>

namespace horde::ai {

namespace {

constexpr float QUARTER_PI = PI * 0.25f;
constexpr float THREE_QUARTER_PI = PI * 0.75f;

animation::PlayOptions looped(float crossfade) {
    return animation::PlayOptions{true, crossfade, false};
}

animation::PlayOptions once(float crossfade) {
    return animation::PlayOptions{false, crossfade, true};
}

} // anonymous namespace

AgentBrain::AgentBrain(Director& director)
    : m_director(director)
{
}

// ============================================================================
// Update
// ============================================================================

void AgentBrain::update(Agent& agent, float delta_time) {
    if (agent.dead) return;

    update_morale(agent, m_director.agents(), m_director.settings(), delta_time);

    if (agent.time_since_throw < NeverHappened) agent.time_since_throw += delta_time;
    if (agent.time_since_trip < NeverHappened) agent.time_since_trip += delta_time;
    if (agent.alerted_by != scene::NullEntity) agent.alert_timer += delta_time;

    switch (agent.state) {
        case AgentState::Idle: update_idle(agent, delta_time); break;
        case AgentState::Walking: update_walking(agent, delta_time); break;
        case AgentState::Dancing: update_dancing(agent, delta_time); break;
        case AgentState::Scrambling: update_scrambling(agent, delta_time); break;
        case AgentState::Fleeing: update_fleeing(agent, delta_time); break;
        case AgentState::Circling: update_circling(agent, delta_time); break;
        case AgentState::Taunting: update_taunting(agent, delta_time); break;
        case AgentState::Throwing: update_throwing(agent, delta_time); break;
        case AgentState::Tripping: update_tripping(agent, delta_time); break;
        case AgentState::Attacking: update_attacking(agent, delta_time); break;
        case AgentState::Staggered: update_staggered(agent, delta_time); break;
        case AgentState::Dying: break;
    }
}

void AgentBrain::update_idle(Agent& agent, float dt) {
    const auto& s = m_director.settings();
    auto& rng = m_director.random();

    agent.idle_timer -= dt;

    if (check_melee_engage(agent)) return;

    if (alert_due(agent)) {
        core::log(core::LogLevel::Debug, "[Brain] Idle goblin reacting to alert");
        enter_scrambling(agent);
        return;
    }

    float dist = distance_to_player(agent, m_director.player());

    if (agent.has_noticed_player && dist > s.melee_range && dist < s.player_alert_radius &&
        agent.courage > s.engage_courage) {
        enter_circling(agent, 0.2f);
        return;
    }

    const auto& dances = m_director.animation().dances();
    if (!dances.empty() && dist > s.player_alert_radius && rng.chance(s.dance_rate * dt)) {
        Agent* partner = find_dance_partner(m_director.agents(), agent, s.dance_detection_radius, true);
        if (partner && partner->state == AgentState::Idle) {
            m_director.start_dance(agent.id, partner->id);
            return;
        }
        if (rng.chance(s.solo_dance_chance)) {
            m_director.start_solo_dance(agent.id);
            return;
        }
    }

    if (m_director.animation().has(clips::Tripping) &&
        agent.time_since_trip >= s.trip_cooldown_idle &&
        rng.chance(agent.trip_chance * s.idle_trip_factor * dt)) {
        enter_tripping(agent);
        return;
    }

    if (agent.idle_timer <= 0.0f) {
        float angle = rng.angle();
        float dist_out = rng.uniform() * s.wander_radius;
        Vec3 target{agent.position.x + std::cos(angle) * dist_out,
                    agent.position.y,
                    agent.position.z + std::sin(angle) * dist_out};
        enter_walking(agent, target, 0.2f);
    }
}

void AgentBrain::update_walking(Agent& agent, float dt) {
    const auto& s = m_director.settings();

    if (check_melee_engage(agent)) return;

    if (distance_xz(agent.position, agent.target) < s.arrive_distance) {
        enter_idle(agent, m_director.random().range(1.0f, 5.0f), 0.2f);
        return;
    }

    move_towards(agent, agent.target, agent.speed * dt);
    resolve_collisions(agent);
}

void AgentBrain::update_dancing(Agent& agent, float dt) {
    const auto& s = m_director.settings();
    auto& rng = m_director.random();

    agent.dance_timer += dt;

    float dist = distance_to_player(agent, m_director.player());

    if (dist < s.player_danger_radius) {
        m_director.stop_dance(agent.id, "player too close");
        enter_scrambling(agent);
        return;
    }

    if (!agent.has_noticed_player && dist < s.player_alert_radius) {
        float notice = (s.player_alert_radius - dist) / s.player_alert_radius * dt * s.notice_rate;
        if (rng.chance(notice)) {
            m_director.stop_dance(agent.id, "player spotted");
            m_director.alert_nearby(agent.id);
            enter_scrambling(agent);
            return;
        }
    }

    if (alert_due(agent)) {
        m_director.stop_dance(agent.id, "alerted by friend");
        enter_scrambling(agent);
        return;
    }

    if (agent.dance_timer >= agent.max_dance_duration) {
        m_director.stop_dance(agent.id, "finished");
        float idle_time = rng.range(1.0f, 3.0f);
        if (rng.chance(s.chain_dance_chance)) {
            idle_time = 0.5f;
        }
        enter_idle(agent, idle_time, 0.4f);
    }
}

void AgentBrain::update_scrambling(Agent& agent, float dt) {
    const auto& s = m_director.settings();
    auto& rng = m_director.random();

    agent.scramble_timer += dt;

    float reaction = s.scramble_fraction * m_director.animation().duration_or(clips::Impact, s.impact_fallback);
    if (agent.scramble_timer <= reaction) return;

    core::log(core::LogLevel::Debug, "[Brain] Scramble dispatch at courage " + std::to_string(agent.courage));

    if (agent.personality > s.oblivious_personality) {
        agent.has_noticed_player = false;
        enter_idle(agent, rng.range(1.0f, 3.0f), 0.3f);
    } else if (agent.courage < s.flee_courage) {
        enter_fleeing(agent, rng.range(s.flee_duration_min, s.flee_duration_max), s.flee_distance, 0.2f);
    } else if (agent.courage < s.circle_courage) {
        enter_circling(agent, 0.2f);
    } else if (const IPlayerHandle* player = m_director.player()) {
        enter_walking(agent, player->position(), 0.2f);
        m_director.rally_nearby(agent.id);
    } else {
        enter_idle(agent, rng.range(1.0f, 3.0f), 0.3f);
    }
}

void AgentBrain::update_fleeing(Agent& agent, float dt) {
    const auto& s = m_director.settings();

    agent.flee_timer -= dt;
    if (agent.flee_timer <= 0.0f) {
        enter_idle(agent, m_director.random().range(2.0f, 5.0f), 0.3f);
        return;
    }

    if (distance_xz(agent.position, agent.target) > s.arrive_distance) {
        move_towards(agent, agent.target, agent.speed * s.flee_speed_factor * dt);
    }
}

void AgentBrain::update_circling(Agent& agent, float dt) {
    const auto& s = m_director.settings();
    auto& rng = m_director.random();
    auto& anim = m_director.animation();
    const IPlayerHandle* player = m_director.player();

    auto flank = flank_target(agent, player, s.flanking_radius, s.flank_angle_step);
    if (!flank) {
        enter_idle(agent, rng.range(1.0f, 3.0f), 0.3f);
        return;
    }

    float to_x = flank->x - agent.position.x;
    float to_z = flank->z - agent.position.z;
    if (std::sqrt(to_x * to_x + to_z * to_z) > s.arrive_distance) {
        move_towards(agent, *flank, agent.speed * s.circling_speed_factor * dt);
        face_player(agent);

        std::string clip = strafe_clip(yaw_towards(to_x, to_z), agent.yaw);
        if (clip != agent.current_strafe_clip) {
            agent.current_strafe_clip = clip;
            anim.play(agent, clip, looped(0.2f));
        }
    }

    float dist = distance_to_player(agent, player);

    if (agent.can_throw && anim.has(clips::Throw) &&
        agent.time_since_throw >= agent.throw_cooldown &&
        dist >= s.throw_min_range && dist <= s.throw_range &&
        rng.chance(s.throw_rate * dt)) {
        enter_throwing(agent);
    } else if (!anim.dances().empty() && rng.chance(s.taunt_rate * dt)) {
        enter_taunting(agent);
    } else if (anim.has(clips::Tripping) &&
               agent.time_since_trip >= s.trip_cooldown_circling &&
               rng.chance(agent.trip_chance * dt)) {
        enter_tripping(agent);
    } else if (is_player_distracted(m_director.agents(), player, s.melee_range) &&
               agent.courage > s.engage_courage) {
        enter_walking(agent, player->position(), 0.2f);
    } else if (agent.courage > s.charge_courage && rng.chance(s.charge_rate * dt)) {
        enter_walking(agent, player->position(), 0.2f);
        m_director.rally_nearby(agent.id);
    } else if (agent.courage < s.retreat_courage && rng.chance(s.retreat_rate * dt)) {
        enter_fleeing(agent, rng.range(s.flee_duration_min, s.flee_duration_max), s.flee_distance, 0.2f);
    }
}

void AgentBrain::update_taunting(Agent& agent, float dt) {
    const auto& s = m_director.settings();
    auto& rng = m_director.random();

    agent.taunt_timer -= dt;
    face_player(agent);

    if (distance_to_player(agent, m_director.player()) < s.player_danger_radius) {
        enter_fleeing(agent, rng.range(s.taunt_flee_duration_min, s.taunt_flee_duration_max),
                      s.taunt_radius, 0.2f);
        return;
    }

    if (agent.taunt_timer <= 0.0f) {
        enter_circling(agent, 0.3f);
    }
}

void AgentBrain::update_throwing(Agent& agent, float dt) {
    const auto& s = m_director.settings();

    agent.throw_timer += dt;
    float duration = m_director.animation().duration_or(clips::Throw, s.throw_fallback);

    if (!agent.throw_released && agent.throw_timer >= s.throw_release_fraction * duration) {
        agent.throw_released = true;
        m_director.launch_projectile(agent.id);
    }

    if (agent.throw_timer >= s.throw_end_fraction * duration) {
        enter_circling(agent, 0.2f);
    }
}

void AgentBrain::update_tripping(Agent& agent, float dt) {
    const auto& s = m_director.settings();

    agent.stagger_timer += dt;
    float duration = m_director.animation().duration_or(clips::Tripping, s.trip_fallback);

    if (agent.stagger_timer >= s.trip_end_fraction * duration) {
        enter_idle(agent, m_director.random().range(0.5f, 1.0f), 0.3f);
    }
}

void AgentBrain::update_attacking(Agent& agent, float dt) {
    const auto& s = m_director.settings();
    auto& rng = m_director.random();

    agent.attack_timer += dt;
    float duration = m_director.animation().duration_or(agent.current_attack, s.attack_fallback);
    if (agent.attack_timer < s.attack_end_fraction * duration) return;

    if (distance_to_player(agent, m_director.player()) < s.melee_range) {
        agent.attack_count++;
        int combo_limit = 2 + static_cast<int>(std::floor(rng.uniform() * 2.0f));
        if (agent.attack_count >= combo_limit) {
            agent.attack_count = 0;
            enter_idle(agent, rng.range(0.3f, 0.8f), 0.3f);
        } else {
            enter_attacking(agent, false);
        }
    } else {
        agent.attack_count = 0;
        enter_idle(agent, rng.range(0.5f, 1.5f), 0.4f);
    }
}

void AgentBrain::update_staggered(Agent& agent, float dt) {
    const auto& s = m_director.settings();

    agent.stagger_timer += dt;
    float duration = m_director.animation().duration_or(clips::Impact, s.impact_fallback);

    if (agent.stagger_timer > s.stagger_end_fraction * duration) {
        enter_idle(agent, m_director.random().range(0.2f, 0.5f), 0.2f);
    }
}

// ============================================================================
// Transitions
// ============================================================================

void AgentBrain::set_state(Agent& agent, AgentState state) {
    AgentState previous = agent.state;
    agent.state = state;

    if (previous != state) {
        core::log(core::LogLevel::Trace, std::string("[Brain] ") + to_string(previous) + " -> " + to_string(state));
        m_director.events().dispatch(AgentStateChangedEvent{agent.id, previous, state});
    }
}

void AgentBrain::enter_idle(Agent& agent, float idle_time, float crossfade) {
    set_state(agent, AgentState::Idle);
    agent.idle_timer = idle_time;
    m_director.animation().play(agent, clips::Idle, looped(crossfade));
}

void AgentBrain::enter_walking(Agent& agent, const Vec3& target, float crossfade) {
    set_state(agent, AgentState::Walking);
    agent.target = target;
    m_director.animation().play(agent, clips::RunForward, looped(crossfade));
}

void AgentBrain::enter_scrambling(Agent& agent) {
    set_state(agent, AgentState::Scrambling);
    agent.scramble_timer = 0.0f;
    agent.has_noticed_player = true;
    agent.alerted_by = scene::NullEntity;
    agent.alert_timer = 0.0f;

    face_player(agent);
    m_director.animation().play(agent, clips::Impact, once(0.0f));
}

void AgentBrain::enter_fleeing(Agent& agent, float duration, float distance, float crossfade) {
    set_state(agent, AgentState::Fleeing);
    agent.flee_timer = duration;

    float away_x = -std::sin(agent.yaw);
    float away_z = -std::cos(agent.yaw);
    if (const IPlayerHandle* player = m_director.player()) {
        Vec3 player_pos = player->position();
        float dx = agent.position.x - player_pos.x;
        float dz = agent.position.z - player_pos.z;
        float len = std::sqrt(dx * dx + dz * dz);
        if (len > 0.0001f) {
            away_x = dx / len;
            away_z = dz / len;
        }
    }

    agent.target = Vec3{agent.position.x + away_x * distance,
                        agent.position.y,
                        agent.position.z + away_z * distance};
    m_director.animation().play(agent, clips::RunForward, looped(crossfade));
}

void AgentBrain::enter_circling(Agent& agent, float crossfade) {
    set_state(agent, AgentState::Circling);
    agent.current_strafe_clip = clips::RunForward;
    m_director.animation().play(agent, clips::RunForward, looped(crossfade));
}

void AgentBrain::enter_taunting(Agent& agent) {
    auto& rng = m_director.random();
    const auto& s = m_director.settings();
    const auto& dances = m_director.animation().dances();

    set_state(agent, AgentState::Taunting);
    agent.taunt_timer = rng.range(s.taunt_duration_min, s.taunt_duration_max);
    face_player(agent);

    if (!dances.empty()) {
        m_director.animation().play(agent, dances[rng.index(dances.size())], looped(0.2f));
    }
}

void AgentBrain::enter_throwing(Agent& agent) {
    set_state(agent, AgentState::Throwing);
    agent.throw_timer = 0.0f;
    agent.throw_released = false;

    face_player(agent);
    m_director.animation().play(agent, clips::Throw, once(0.15f));
}

void AgentBrain::enter_tripping(Agent& agent) {
    set_state(agent, AgentState::Tripping);
    agent.stagger_timer = 0.0f;
    agent.time_since_trip = 0.0f;

    m_director.animation().play(agent, clips::Tripping, once(0.0f));
}

void AgentBrain::enter_attacking(Agent& agent, bool engage) {
    auto& rng = m_director.random();
    const auto& attacks = m_director.animation().attacks();

    set_state(agent, AgentState::Attacking);
    agent.attack_timer = 0.0f;
    face_player(agent);

    if (engage) {
        agent.has_noticed_player = true;
        agent.attack_count = 0;
        m_director.rally_nearby(agent.id);
    }

    agent.current_attack = attacks.empty() ? std::string() : attacks[rng.index(attacks.size())];
    m_director.animation().play(agent, agent.current_attack, once(0.15f));
    m_director.events().dispatch(AgentAttackEvent{agent.id, agent.current_attack});
}

void AgentBrain::enter_staggered(Agent& agent) {
    if (agent.is_dancing() || agent.has_partner()) {
        m_director.stop_dance(agent.id, "hit");
    }

    set_state(agent, AgentState::Staggered);
    agent.stagger_timer = 0.0f;
    m_director.animation().play(agent, clips::Impact, once(0.0f));
}

void AgentBrain::enter_dying(Agent& agent) {
    const auto& s = m_director.settings();

    if (agent.is_dancing() || agent.has_partner()) {
        m_director.stop_dance(agent.id, "died");
    }

    agent.dead = true;
    agent.rallied = false;
    set_state(agent, AgentState::Dying);
    agent.dying_timer = 0.0f;
    agent.dying_duration = m_director.animation().duration_or(clips::Dying, s.dying_fallback);

    m_director.animation().play(agent, clips::Dying, once(0.0f));
}

// ============================================================================
// Helpers
// ============================================================================

bool AgentBrain::check_melee_engage(Agent& agent) {
    if (distance_to_player(agent, m_director.player()) >= m_director.settings().melee_range) {
        return false;
    }
    enter_attacking(agent, true);
    return true;
}

bool AgentBrain::alert_due(const Agent& agent) const {
    return agent.alerted_by != scene::NullEntity && !agent.has_noticed_player &&
           agent.alert_timer >= alert_delay(agent, m_director.settings());
}

void AgentBrain::face_player(Agent& agent) {
    if (const IPlayerHandle* player = m_director.player()) {
        Vec3 player_pos = player->position();
        if (distance_xz(agent.position, player_pos) > 0.0001f) {
            agent.yaw = yaw_towards(agent.position, player_pos);
        }
    }
}

void AgentBrain::move_towards(Agent& agent, const Vec3& target, float step) {
    float dx = target.x - agent.position.x;
    float dz = target.z - agent.position.z;
    float len = std::sqrt(dx * dx + dz * dz);
    if (len < 0.0001f) return;

    float travel = std::min(step, len);
    agent.position.x += dx / len * travel;
    agent.position.z += dz / len * travel;
    agent.yaw = yaw_towards(dx, dz);

    snap_to_terrain(agent);
}

void AgentBrain::snap_to_terrain(Agent& agent) {
    const terrain::ITerrainOracle* terrain = m_director.terrain();
    if (!terrain) return;

    if (auto height = terrain->height_at(agent.position.x, agent.position.z)) {
        agent.position.y = *height;
    }
}

void AgentBrain::resolve_collisions(Agent& agent) {
    const auto& s = m_director.settings();

    if (const IPlayerHandle* player = m_director.player()) {
        Vec3 player_pos = player->position();
        float min_dist = s.player_collision_radius + s.agent_collision_radius;
        float dx = agent.position.x - player_pos.x;
        float dz = agent.position.z - player_pos.z;
        float dist = std::sqrt(dx * dx + dz * dz);
        if (dist < min_dist && dist > 0.0001f) {
            agent.position.x = player_pos.x + dx / dist * min_dist;
            agent.position.z = player_pos.z + dz / dist * min_dist;
        }
    }

    float min_dist = s.agent_collision_radius * 2.0f;
    for (auto& other : m_director.agents()) {
        if (other.id == agent.id || other.dead) continue;

        float dx = agent.position.x - other.position.x;
        float dz = agent.position.z - other.position.z;
        float dist = std::sqrt(dx * dx + dz * dz);
        if (dist >= min_dist || dist < 0.0001f) continue;

        float push = (min_dist - dist) * 0.5f;
        float nx = dx / dist;
        float nz = dz / dist;
        agent.position.x += nx * push;
        agent.position.z += nz * push;
        other.position.x -= nx * push;
        other.position.z -= nz * push;
    }
}

std::string AgentBrain::strafe_clip(float move_yaw, float facing_yaw) {
    float diff = wrap_angle(move_yaw - facing_yaw);

    if (diff > QUARTER_PI && diff < THREE_QUARTER_PI) return clips::RunRight;
    if (diff < -QUARTER_PI && diff > -THREE_QUARTER_PI) return clips::RunLeft;
    if (std::abs(diff) >= THREE_QUARTER_PI) return clips::RunBackward;
    return clips::RunForward;
}

} // namespace horde::ai
