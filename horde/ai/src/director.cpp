#include <horde/ai/director.hpp>
#include <horde/ai/morale.hpp>
#include <horde/ai/spatial.hpp>
#include <horde/combat/health_bar.hpp>
#include <horde/core/job_system.hpp>
#include <horde/core/log.hpp>
#include <horde/scene/transform.hpp>
#include <cmath>

namespace horde::ai {

namespace {

combat::ProjectileConfig projectile_config(const settings::AgentSettings& s) {
    combat::ProjectileConfig config;
    config.speed = s.projectile_speed;
    config.gravity = s.projectile_gravity;
    config.lifetime = s.projectile_lifetime;
    config.hit_radius = s.projectile_hit_radius;
    config.damage = s.projectile_damage;
    config.launch_height = s.projectile_launch_height;
    config.arc_factor = s.projectile_arc_factor;
    return config;
}

// Node name for logs, or the raw handle once the node is gone
std::string node_name(const scene::World& world, scene::Entity e) {
    const std::string& name = world.name_of(e);
    return name.empty() ? "#" + std::to_string(static_cast<uint32_t>(e)) : name;
}

} // anonymous namespace

Director::Director(scene::World& world, const settings::AgentSettings& settings)
    : m_world(world)
    , m_settings(settings)
    , m_random(&m_default_random)
    , m_projectiles(world, projectile_config(settings))
    , m_indicators(world, m_default_random)
    , m_brain(*this)
{
    m_settings.validate();
    m_projectiles.config() = projectile_config(m_settings);
}

Director::~Director() {
    if (m_loading.load()) {
        core::JobSystem::wait_all();
    }
    remove_all();
}

// ============================================================================
// Ready gate
// ============================================================================

bool Director::init(animation::IClipSource& source) {
    size_t loaded = m_animation.load(source);
    size_t expected = clips::all_names().size();

    m_ready = true;

    if (loaded < expected) {
        core::log(core::LogLevel::Warn, "[Director] Ready with " + std::to_string(expected - loaded) +
            " missing clips");
        return false;
    }

    core::log(core::LogLevel::Info, "[Director] Ready");
    return true;
}

std::future<bool> Director::init_async(std::shared_ptr<animation::IClipSource> source) {
    m_loading = true;
    return core::JobSystem::submit_with_result([this, source]() {
        bool result = init(*source);
        m_loading = false;
        return result;
    });
}

// ============================================================================
// Population
// ============================================================================

size_t Director::spawn(int count, float center_x, float center_z, float radius) {
    if (!is_ready()) {
        core::log(core::LogLevel::Error, "[Director] spawn called before init completed");
        return 0;
    }

    size_t spawned = 0;
    for (int i = 0; i < count; ++i) {
        float angle = m_random->angle();
        float dist = m_random->uniform() * radius;
        float x = center_x + std::cos(angle) * dist;
        float z = center_z + std::sin(angle) * dist;

        if (spawn_agent(x, z) != scene::NullEntity) {
            ++spawned;
        }
    }

    core::log(core::LogLevel::Info, "[Director] Spawned " + std::to_string(spawned) + " goblins");
    return spawned;
}

scene::Entity Director::spawn_agent(float x, float z) {
    if (!is_ready()) {
        core::log(core::LogLevel::Error, "[Director] spawn_agent called before init completed");
        return scene::NullEntity;
    }

    auto& s = m_settings;
    auto& rng = *m_random;

    Agent agent;
    agent.id = m_world.create("Goblin_" + std::to_string(++m_spawned_total));

    float y = 0.0f;
    if (m_terrain) {
        y = m_terrain->height_at(x, z).value_or(0.0f);
    }
    agent.position = Vec3{x, y, z};
    agent.target = agent.position;

    agent.speed = rng.range(s.speed_min, s.speed_max);
    agent.idle_timer = rng.uniform() * 3.0f;
    agent.health.max = s.max_health;
    agent.health.current = s.max_health;
    agent.personality = rng.uniform();
    agent.base_courage = rng.range(s.base_courage_min, s.base_courage_max);
    agent.courage = agent.base_courage;
    agent.flank_angle = rng.angle();
    agent.trip_chance = rng.range(s.trip_chance_min, s.trip_chance_max);
    agent.throw_cooldown = rng.range(s.throw_cooldown_min, s.throw_cooldown_max);
    agent.can_throw = rng.chance(0.5f);

    m_world.emplace<scene::LocalTransform>(agent.id, agent.position);
    m_world.emplace<combat::HealthBar>(agent.id);

    m_animation.play(agent, clips::Idle, animation::PlayOptions{true, 0.0f, false});

    scene::Entity id = agent.id;
    Vec3 position = agent.position;
    m_agents.push_back(std::move(agent));

    m_events.dispatch(AgentSpawnedEvent{id, position});
    return id;
}

bool Director::damage(scene::Entity id, float amount) {
    Agent* agent = find_agent(id);
    if (!agent) {
        core::log(core::LogLevel::Warn, "[Director] damage: unknown agent " + node_name(m_world, id));
        return false;
    }
    if (agent->dead || amount <= 0.0f) {
        return false;
    }

    auto info = combat::apply_damage(agent->health, amount, scene::NullEntity, id, agent->position);
    m_indicators.spawn(agent->position, amount);
    m_events.dispatch(AgentDamagedEvent{id, info.final_damage, agent->health.current});

    if (info.lethal) {
        core::log(core::LogLevel::Info, "[Director] " + node_name(m_world, id) + " died");
        m_brain.enter_dying(*agent);
        m_events.dispatch(AgentDiedEvent{id});
    } else {
        m_brain.enter_staggered(*agent);
    }
    return true;
}

void Director::tick(float delta_time, const scene::CameraView& camera) {
    m_elapsed += delta_time;

    // Index loop: brains read and write other agents, but never add or remove
    for (size_t i = 0; i < m_agents.size(); ++i) {
        Agent& agent = m_agents[i];

        agent.mixer.update(delta_time);

        if (agent.dead) {
            agent.dying_timer += delta_time;
        } else {
            m_brain.update(agent, delta_time);
        }

        sync_node(agent, camera);
    }

    remove_finished_agents();

    Vec3 player_pos{0.0f};
    if (m_player) {
        player_pos = m_player->position();
    }
    auto impacts = m_projectiles.update(delta_time, m_terrain, m_player ? &player_pos : nullptr);
    handle_impacts(impacts);

    m_indicators.update(delta_time, camera.orientation);
}

void Director::remove_all() {
    for (const auto& agent : m_agents) {
        m_world.destroy(agent.id);
    }
    if (!m_agents.empty()) {
        core::log(core::LogLevel::Info, "[Director] Removed " + std::to_string(m_agents.size()) + " goblins");
    }
    m_agents.clear();
    m_projectiles.clear();
    m_indicators.clear();
}

Agent* Director::find_agent(scene::Entity id) {
    return ai::find_agent(m_agents, id);
}

const Agent* Director::find_agent(scene::Entity id) const {
    return ai::find_agent(m_agents, id);
}

// ============================================================================
// Cross-agent signals
// ============================================================================

bool Director::start_dance(scene::Entity a_id, scene::Entity b_id) {
    const auto& dances = m_animation.dances();
    Agent* a = find_agent(a_id);
    Agent* b = find_agent(b_id);
    if (!a || !b || a == b || a->dead || b->dead || dances.empty()) {
        return false;
    }

    if (a->has_partner()) stop_dance(a_id, "new partner");
    if (b->has_partner()) stop_dance(b_id, "new partner");

    const std::string& clip = dances[m_random->index(dances.size())];
    float duration = m_animation.duration_or(clip, 1.0f) * (1.0f + m_random->uniform());

    for (Agent* dancer : {a, b}) {
        m_brain.set_state(*dancer, AgentState::Dancing);
        dancer->current_dance = clip;
        dancer->dance_timer = 0.0f;
        dancer->max_dance_duration = duration;
    }
    a->dance_partner = b_id;
    b->dance_partner = a_id;

    a->yaw = yaw_towards(a->position, b->position);
    b->yaw = a->yaw + PI;

    animation::PlayOptions options{true, 0.3f, false};
    m_animation.play(*a, clip, options);
    m_animation.play(*b, clip, options);

    core::log(core::LogLevel::Info, "[Director] " + node_name(m_world, a_id) + " and " +
        node_name(m_world, b_id) + " dancing " + clip);
    m_events.dispatch(DanceStartedEvent{a_id, b_id, clip});
    return true;
}

bool Director::start_solo_dance(scene::Entity id) {
    const auto& dances = m_animation.dances();
    Agent* agent = find_agent(id);
    if (!agent || agent->dead || dances.empty()) {
        return false;
    }

    if (agent->has_partner()) stop_dance(id, "going solo");

    const std::string& clip = dances[m_random->index(dances.size())];

    m_brain.set_state(*agent, AgentState::Dancing);
    agent->current_dance = clip;
    agent->dance_timer = 0.0f;
    agent->max_dance_duration = m_animation.duration_or(clip, 1.0f) * (0.5f + m_random->uniform());

    m_animation.play(*agent, clip, animation::PlayOptions{true, 0.3f, false});

    core::log(core::LogLevel::Info, "[Director] " + node_name(m_world, id) + " dancing solo " + clip);
    m_events.dispatch(DanceStartedEvent{id, scene::NullEntity, clip});
    return true;
}

bool Director::stop_dance(scene::Entity id, const std::string& reason) {
    Agent* agent = find_agent(id);
    if (!agent) return false;

    scene::Entity partner_id = agent->dance_partner;
    if (Agent* partner = find_agent(partner_id)) {
        if (partner->dance_partner == id) {
            partner->dance_partner = scene::NullEntity;
        }
    }

    agent->dance_partner = scene::NullEntity;
    agent->current_dance.clear();

    core::log(core::LogLevel::Info, "[Director] Dance stopped for " + node_name(m_world, id) + ": " + reason);
    m_events.dispatch(DanceStoppedEvent{id, partner_id, reason});
    return true;
}

int Director::alert_nearby(scene::Entity alerter_id) {
    const Agent* alerter = find_agent(alerter_id);
    if (!alerter) return 0;

    int count = 0;
    for (auto& other : m_agents) {
        if (other.id == alerter_id || other.dead) continue;
        if (other.has_noticed_player || other.alerted_by != scene::NullEntity) continue;
        if (distance_xz(alerter->position, other.position) >= m_settings.alert_radius) continue;

        other.alerted_by = alerter_id;
        other.alert_timer = 0.0f;
        ++count;
        m_events.dispatch(AgentAlertedEvent{other.id, alerter_id});
    }

    if (count > 0) {
        core::log(core::LogLevel::Info, "[Director] " + node_name(m_world, alerter_id) + " alerted " +
            std::to_string(count) + " friends");
    }
    return count;
}

int Director::rally_nearby(scene::Entity rallier_id) {
    const Agent* rallier = find_agent(rallier_id);
    if (!rallier) return 0;

    int count = 0;
    for (auto& other : m_agents) {
        if (other.id == rallier_id || other.dead) continue;
        if (other.state == AgentState::Attacking || other.state == AgentState::Dancing) continue;
        if (distance_xz(rallier->position, other.position) >= m_settings.rally_radius) continue;

        float chance = m_settings.rally_base_chance + m_settings.rally_courage_chance * other.courage;
        if (!m_random->chance(chance)) continue;

        other.rallied = true;
        other.rally_timer = m_random->range(m_settings.rally_duration_min, m_settings.rally_duration_max);
        ++count;
        m_events.dispatch(AgentRalliedEvent{other.id, rallier_id, other.rally_timer});
    }

    if (count > 0) {
        core::log(core::LogLevel::Debug, "[Director] " + node_name(m_world, rallier_id) + " rallied " +
            std::to_string(count) + " friends");
    }
    return count;
}

bool Director::launch_projectile(scene::Entity thrower_id) {
    Agent* thrower = find_agent(thrower_id);
    if (!thrower || !m_player) return false;

    Vec3 target = m_player->position();
    const auto& projectile = m_projectiles.launch(thrower->position, target, thrower_id);
    thrower->time_since_throw = 0.0f;

    core::log(core::LogLevel::Info, "[Director] " + node_name(m_world, thrower_id) + " threw a rock");
    m_events.dispatch(ProjectileLaunchedEvent{thrower_id, projectile.position, target});
    return true;
}

// ============================================================================
// Services
// ============================================================================

void Director::set_settings(const settings::AgentSettings& settings) {
    m_settings = settings;
    m_settings.validate();
    m_projectiles.config() = projectile_config(m_settings);
}

void Director::set_random(core::Random& random) {
    m_random = &random;
    m_indicators.set_random(random);
}

// ============================================================================
// Internals
// ============================================================================

void Director::sync_node(const Agent& agent, const scene::CameraView& camera) {
    if (auto* transform = m_world.try_get<scene::LocalTransform>(agent.id)) {
        transform->position = agent.position;
        transform->set_yaw(agent.yaw);
    }
    if (auto* bar = m_world.try_get<combat::HealthBar>(agent.id)) {
        combat::update_health_bar(*bar, agent.health, agent.dead, camera.orientation);
    }
}

void Director::remove_finished_agents() {
    auto it = m_agents.begin();
    while (it != m_agents.end()) {
        if (!it->dead || it->dying_timer < it->dying_duration) {
            ++it;
            continue;
        }

        scene::Entity id = it->id;
        core::log(core::LogLevel::Info, "[Director] Removed " + node_name(m_world, id));
        m_world.destroy(id);
        it = m_agents.erase(it);

        // Drop weak references to the removed agent
        for (auto& other : m_agents) {
            if (other.dance_partner == id) other.dance_partner = scene::NullEntity;
            if (other.alerted_by == id) other.alerted_by = scene::NullEntity;
        }

        m_events.dispatch(AgentRemovedEvent{id});
    }
}

void Director::handle_impacts(const std::vector<combat::ProjectileImpact>& impacts) {
    for (const auto& impact : impacts) {
        if (impact.kind != combat::ProjectileImpactKind::PlayerHit) continue;

        core::log(core::LogLevel::Info, "[Director] Rock hit the player for " +
            std::to_string(static_cast<int>(impact.damage)) + " damage");
        m_events.dispatch(PlayerHitEvent{impact.thrower, impact.damage, impact.position});
    }
}

} // namespace horde::ai
