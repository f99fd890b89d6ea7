#pragma once

#include <horde/ai/agent.hpp>
#include <horde/ai/agent_brain.hpp>
#include <horde/ai/ai_events.hpp>
#include <horde/ai/animation_binding.hpp>
#include <horde/ai/host.hpp>
#include <horde/animation/clip_source.hpp>
#include <horde/combat/damage_indicator.hpp>
#include <horde/combat/projectile.hpp>
#include <horde/core/event_dispatcher.hpp>
#include <horde/core/random.hpp>
#include <horde/scene/camera.hpp>
#include <horde/scene/world.hpp>
#include <horde/settings/agent_settings.hpp>
#include <horde/terrain/terrain_oracle.hpp>
#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace horde::ai {

// ============================================================================
// Director
// Owns the goblin roster, the projectiles and the damage numbers, and
// advances all of them once per tick. Single-threaded: every call except
// init_async's background load happens on the tick thread.
// ============================================================================

class Director {
public:
    explicit Director(scene::World& world, const settings::AgentSettings& settings = {});
    ~Director();

    Director(const Director&) = delete;
    Director& operator=(const Director&) = delete;

    // ------------------------------------------------------------------------
    // Ready gate
    // ------------------------------------------------------------------------

    // Loads the clip catalog and opens the gate. Returns false when any known
    // clip is missing; the gate opens regardless and affected branches degrade.
    bool init(animation::IClipSource& source);

    // init() on the worker pool
    std::future<bool> init_async(std::shared_ptr<animation::IClipSource> source);

    bool is_ready() const { return m_ready.load(); }

    // ------------------------------------------------------------------------
    // Host collaborators (not owned, may be null)
    // ------------------------------------------------------------------------

    void set_player(const IPlayerHandle* player) { m_player = player; }
    const IPlayerHandle* player() const { return m_player; }

    void set_terrain(const terrain::ITerrainOracle* terrain) { m_terrain = terrain; }
    const terrain::ITerrainOracle* terrain() const { return m_terrain; }

    // ------------------------------------------------------------------------
    // Population
    // ------------------------------------------------------------------------

    // count agents at random points of the disk around (center_x, center_z).
    // Returns how many were spawned; none before the ready gate opens.
    size_t spawn(int count, float center_x, float center_z, float radius);

    // One agent at exactly (x, z); NullEntity before the ready gate opens
    scene::Entity spawn_agent(float x, float z);

    // Hit an agent. Spawns a damage number; lethal hits start dying, others
    // stagger. Unknown, dead or non-positive hits are ignored (returns false).
    bool damage(scene::Entity agent, float amount);

    // One frame: every agent in roster order, then projectiles, then damage numbers
    void tick(float delta_time, const scene::CameraView& camera);

    void remove_all();

    Agent* find_agent(scene::Entity id);
    const Agent* find_agent(scene::Entity id) const;

    std::vector<Agent>& agents() { return m_agents; }
    const std::vector<Agent>& agents() const { return m_agents; }
    size_t agent_count() const { return m_agents.size(); }

    const std::vector<combat::Projectile>& projectiles() const { return m_projectiles.projectiles(); }
    const std::vector<combat::DamageIndicator>& damage_indicators() const { return m_indicators.indicators(); }

    float elapsed_time() const { return m_elapsed; }

    // ------------------------------------------------------------------------
    // Cross-agent signals
    // ------------------------------------------------------------------------

    // Both agents dance the same random clip facing each other
    bool start_dance(scene::Entity a, scene::Entity b);
    bool start_solo_dance(scene::Entity agent);

    // Clears the partner link on both sides. The agent's state is left to the caller.
    bool stop_dance(scene::Entity agent, const std::string& reason);

    // Marks living peers within the alert radius that have not noticed the
    // player and are not already alerted. Returns how many were marked.
    int alert_nearby(scene::Entity alerter);

    // Rolls rally for living peers within the rally radius that are neither
    // attacking nor dancing. Returns how many were rallied.
    int rally_nearby(scene::Entity rallier);

    // Rock from thrower at the player's current position
    bool launch_projectile(scene::Entity thrower);

    // ------------------------------------------------------------------------
    // Services
    // ------------------------------------------------------------------------

    core::EventDispatcher& events() { return m_events; }

    const settings::AgentSettings& settings() const { return m_settings; }
    void set_settings(const settings::AgentSettings& settings);

    core::Random& random() { return *m_random; }
    void set_random(core::Random& random);

    AnimationBinding& animation() { return m_animation; }
    const AnimationBinding& animation() const { return m_animation; }

    AgentBrain& brain() { return m_brain; }

private:
    void sync_node(const Agent& agent, const scene::CameraView& camera);
    void remove_finished_agents();
    void handle_impacts(const std::vector<combat::ProjectileImpact>& impacts);

    scene::World& m_world;
    settings::AgentSettings m_settings;

    core::Random m_default_random;
    core::Random* m_random;

    core::EventDispatcher m_events;
    AnimationBinding m_animation;
    std::atomic<bool> m_ready{false};
    std::atomic<bool> m_loading{false};

    const IPlayerHandle* m_player = nullptr;
    const terrain::ITerrainOracle* m_terrain = nullptr;

    std::vector<Agent> m_agents;
    combat::ProjectileSimulator m_projectiles;
    combat::DamageIndicatorSystem m_indicators;

    AgentBrain m_brain;
    float m_elapsed = 0.0f;
    uint32_t m_spawned_total = 0;
};

} // namespace horde::ai
