#include <horde/combat/projectile.hpp>
#include <horde/core/log.hpp>
#include <horde/scene/transform.hpp>
#include <string>
#include <utility>

namespace horde::combat {

const char* to_string(ProjectileImpactKind kind) {
    switch (kind) {
        case ProjectileImpactKind::Ground: return "hit the ground";
        case ProjectileImpactKind::PlayerHit: return "hit the player";
        case ProjectileImpactKind::Expired: return "expired";
    }
    return "?";
}

ProjectileSimulator::ProjectileSimulator(scene::World& world, const ProjectileConfig& config)
    : m_world(world)
    , m_config(config)
{
}

ProjectileSimulator::~ProjectileSimulator() {
    clear();
}

Vec3 ProjectileSimulator::launch_velocity(const Vec3& origin, const Vec3& target,
                                          float speed, float arc_factor) {
    Vec3 direction = target - origin;
    float distance = glm::length(direction);
    if (distance <= 0.0f) {
        return Vec3{0.0f, speed, 0.0f};
    }

    direction.y += distance * arc_factor;
    return glm::normalize(direction) * speed;
}

const Projectile& ProjectileSimulator::launch(const Vec3& thrower_position, const Vec3& target,
                                              scene::Entity thrower) {
    Projectile projectile;
    projectile.thrower = thrower;
    projectile.position = thrower_position + Vec3{0.0f, m_config.launch_height, 0.0f};
    projectile.velocity = launch_velocity(projectile.position, target, m_config.speed, m_config.arc_factor);
    projectile.gravity = m_config.gravity;
    projectile.lifetime = m_config.lifetime;
    projectile.damage = m_config.damage;

    projectile.node = m_world.create("Rock_" + std::to_string(++m_launched_total));
    m_world.emplace<scene::LocalTransform>(projectile.node, projectile.position);

    m_projectiles.push_back(projectile);
    return m_projectiles.back();
}

std::vector<ProjectileImpact> ProjectileSimulator::update(float delta_time,
                                                          const terrain::ITerrainOracle* terrain,
                                                          const Vec3* player_position) {
    std::vector<ProjectileImpact> impacts;
    std::vector<Projectile> remaining;
    remaining.reserve(m_projectiles.size());

    for (auto& proj : m_projectiles) {
        if (!proj.armed) {
            proj.armed = true;
            remaining.push_back(proj);
            continue;
        }

        proj.age += delta_time;
        proj.velocity.y += proj.gravity * delta_time;
        proj.position += proj.velocity * delta_time;
        proj.rotation += m_config.spin * delta_time;

        if (auto* tf = m_world.try_get<scene::LocalTransform>(proj.node)) {
            tf->position = proj.position;
            tf->set_euler(proj.rotation);
        }

        float ground = 0.0f;
        if (terrain) {
            ground = terrain->height_at(proj.position.x, proj.position.z).value_or(0.0f);
        }

        ProjectileImpact impact;
        impact.thrower = proj.thrower;
        impact.position = proj.position;
        impact.damage = proj.damage;

        // Ground, then player, then lifetime
        bool terminated = true;
        if (proj.position.y < ground) {
            impact.kind = ProjectileImpactKind::Ground;
        } else if (player_position &&
                   glm::length(proj.position - (*player_position + Vec3{0.0f, m_config.player_center_height, 0.0f}))
                       < m_config.hit_radius) {
            impact.kind = ProjectileImpactKind::PlayerHit;
        } else if (proj.age > proj.lifetime) {
            impact.kind = ProjectileImpactKind::Expired;
        } else {
            terminated = false;
        }

        if (terminated) {
            core::log(core::LogLevel::Trace, "[Projectile] " + m_world.name_of(proj.node) + " " +
                to_string(impact.kind) + " after " + std::to_string(proj.age) + "s");
            m_world.destroy(proj.node);
            impacts.push_back(impact);
        } else {
            remaining.push_back(proj);
        }
    }

    m_projectiles = std::move(remaining);

    return impacts;
}

void ProjectileSimulator::clear() {
    for (const auto& proj : m_projectiles) {
        m_world.destroy(proj.node);
    }
    m_projectiles.clear();
}

} // namespace horde::combat
