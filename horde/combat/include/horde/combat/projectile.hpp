#pragma once

#include <horde/core/math.hpp>
#include <horde/scene/world.hpp>
#include <horde/terrain/terrain_oracle.hpp>
#include <cstdint>
#include <vector>

namespace horde::combat {

using namespace horde::core;

struct ProjectileConfig {
    float speed = 12.0f;
    float gravity = -15.0f;
    float lifetime = 3.0f;
    float hit_radius = 0.8f;
    float damage = 10.0f;
    float launch_height = 1.2f;         // Hand height above the thrower
    float arc_factor = 0.3f;            // Aim above the target by distance * arc_factor
    float player_center_height = 1.0f;  // Hit test point above the player's feet
    Vec3 spin{8.0f, 0.0f, 5.0f};        // Cosmetic, radians per second
};

// Rock in flight
struct Projectile {
    scene::Entity node = scene::NullEntity;
    scene::Entity thrower = scene::NullEntity;   // Weak; may no longer exist
    Vec3 position{0.0f};
    Vec3 velocity{0.0f};
    Vec3 rotation{0.0f};                         // Euler angles, spin only
    float gravity = -15.0f;
    float age = 0.0f;
    float lifetime = 3.0f;
    float damage = 10.0f;
    bool armed = false;                          // Integrated from the update after launch
};

enum class ProjectileImpactKind {
    Ground,
    PlayerHit,
    Expired
};

const char* to_string(ProjectileImpactKind kind);

// Why and where a projectile ended
struct ProjectileImpact {
    ProjectileImpactKind kind = ProjectileImpactKind::Expired;
    scene::Entity thrower = scene::NullEntity;
    Vec3 position{0.0f};
    float damage = 0.0f;
};

// Ballistic rocks. Each projectile owns one scene node; the node is destroyed
// when the projectile terminates.
class ProjectileSimulator {
public:
    explicit ProjectileSimulator(scene::World& world, const ProjectileConfig& config = {});
    ~ProjectileSimulator();

    ProjectileSimulator(const ProjectileSimulator&) = delete;
    ProjectileSimulator& operator=(const ProjectileSimulator&) = delete;

    // Launch from launch_height above thrower_position towards target.
    // The new projectile is not integrated until the next update().
    const Projectile& launch(const Vec3& thrower_position, const Vec3& target,
                             scene::Entity thrower = scene::NullEntity);

    // Integrate and terminate. terrain and player may be null; a missing or
    // undefined terrain height counts as ground level 0.
    std::vector<ProjectileImpact> update(float delta_time,
                                         const terrain::ITerrainOracle* terrain,
                                         const Vec3* player_position);

    void clear();

    const std::vector<Projectile>& projectiles() const { return m_projectiles; }
    size_t size() const { return m_projectiles.size(); }

    ProjectileConfig& config() { return m_config; }
    const ProjectileConfig& config() const { return m_config; }

    // Initial velocity for a throw from origin at target
    static Vec3 launch_velocity(const Vec3& origin, const Vec3& target,
                                float speed, float arc_factor);

private:
    scene::World& m_world;
    ProjectileConfig m_config;
    std::vector<Projectile> m_projectiles;
    uint32_t m_launched_total = 0;
};

} // namespace horde::combat
