// Goblin Camp - Headless run of the goblin horde around a scripted player
//
// Usage:
//   goblin_camp [settings.json] [clips.json]
//
// The player strolls into the camp, swings at the nearest goblin every few
// seconds, then backs off. Without a clip manifest every clip is a 2 second
// placeholder so all behaviors are available.

#include <horde/ai/ai_events.hpp>
#include <horde/ai/animation_binding.hpp>
#include <horde/ai/director.hpp>
#include <horde/ai/host.hpp>
#include <horde/animation/clip_source.hpp>
#include <horde/core/job_system.hpp>
#include <horde/core/log.hpp>
#include <horde/scene/entity.hpp>
#include <horde/scene/world.hpp>
#include <horde/settings/agent_settings.hpp>
#include <horde/terrain/heightmap.hpp>

#include <algorithm>
#include <cmath>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace horde::core;
using namespace horde::scene;
namespace ai = horde::ai;
namespace animation = horde::animation;
namespace settings = horde::settings;
namespace terrain = horde::terrain;

class GoblinCampApp {
public:
    bool init(int argc, char** argv) {
        log(LogLevel::Info, "[GoblinCamp] Goblin camp starting...");

        settings::AgentSettings agent_settings;
        if (argc > 1) {
            agent_settings.load(argv[1]);
        }

        auto source = create_clip_source(argc > 2 ? argv[2] : nullptr);

        // Rolling hills under the camp
        auto hills = terrain::Heightmap::from_function(65, 65, [](float u, float v) {
            return 0.5f + 0.25f * std::sin(u * 6.0f) * std::cos(v * 6.0f);
        });
        m_terrain = std::make_unique<terrain::HeightmapTerrain>(
            std::move(hills), Vec3{-40.0f, -1.0f, -40.0f}, Vec3{80.0f, 2.0f, 80.0f});

        m_player.set_position(Vec3{0.0f, 0.0f, 30.0f});

        m_director = std::make_unique<ai::Director>(m_world, agent_settings);
        m_director->set_terrain(m_terrain.get());
        m_director->set_player(&m_player);
        subscribe_events();

        auto ready = m_director->init_async(source);
        if (!ready.get()) {
            log(LogLevel::Warn, "[GoblinCamp] Some clips are missing, behaviors will degrade");
        }

        size_t spawned = m_director->spawn(12, 0.0f, 0.0f, 10.0f);
        log(LogLevel::Info, "[GoblinCamp] Spawned " + std::to_string(spawned) + " goblins");
        return spawned > 0;
    }

    void run(float duration, float dt) {
        int steps = static_cast<int>(duration / dt);
        for (int i = 0; i < steps; ++i) {
            update_player(dt);
            m_director->tick(dt, m_camera);

            if (i % static_cast<int>(1.0f / dt) == 0) {
                report();
            }
            if (m_director->agent_count() == 0) {
                log(LogLevel::Info, "[GoblinCamp] The camp is empty");
                break;
            }
        }
    }

    void shutdown() {
        log(LogLevel::Info, "[GoblinCamp] Took " + std::to_string(m_player_hits) +
                            " rock hits, defeated " + std::to_string(m_defeated) + " goblins");
        for (const auto& [state, count] : m_state_changes) {
            log(LogLevel::Info, "[GoblinCamp]   entered " + std::string(ai::to_string(state)) +
                                " " + std::to_string(count) + " times");
        }
        m_connections.clear();
        m_director.reset();
    }

private:
    std::shared_ptr<animation::IClipSource> create_clip_source(const char* manifest_path) {
        if (manifest_path) {
            auto manifest = std::make_shared<animation::ManifestClipSource>();
            if (manifest->load(manifest_path)) {
                return manifest;
            }
            log(LogLevel::Warn, "[GoblinCamp] Falling back to placeholder clips");
        }

        auto memory = std::make_shared<animation::MemoryClipSource>();
        for (const auto& name : ai::clips::all_names()) {
            memory->add(name, 2.0f);
        }
        return memory;
    }

    void subscribe_events() {
        auto& events = m_director->events();

        m_connections.push_back(events.subscribe<ai::AgentStateChangedEvent>(
            [this](const ai::AgentStateChangedEvent& e) {
                m_state_changes[e.current]++;
            }));

        m_connections.push_back(events.subscribe<ai::DanceStartedEvent>(
            [this](const ai::DanceStartedEvent& e) {
                log(LogLevel::Info, "[GoblinCamp] " + name_of(e.agent) + " dances " + e.clip);
            }));

        m_connections.push_back(events.subscribe<ai::AgentRalliedEvent>(
            [this](const ai::AgentRalliedEvent& e) {
                log(LogLevel::Info, "[GoblinCamp] " + name_of(e.rallied_by) + " rallies " + name_of(e.agent));
            }));

        m_connections.push_back(events.subscribe<ai::PlayerHitEvent>(
            [this](const ai::PlayerHitEvent& e) {
                m_player_hits++;
                log(LogLevel::Info, "[GoblinCamp] Player hit by a rock for " + std::to_string(e.damage));
            }));

        m_connections.push_back(events.subscribe<ai::AgentDiedEvent>(
            [this](const ai::AgentDiedEvent& e) {
                m_defeated++;
                log(LogLevel::Info, "[GoblinCamp] " + name_of(e.agent) + " goes down");
            }));
    }

    // Walks in, fights for a while, retreats
    void update_player(float dt) {
        m_time += dt;

        Vec3 pos = m_player.position();
        Vec3 goal = m_time < 40.0f ? Vec3{0.0f, 0.0f, 4.0f} : Vec3{0.0f, 0.0f, 35.0f};
        Vec3 to = goal - pos;
        to.y = 0.0f;
        float dist = glm::length(to);
        if (dist > 0.1f) {
            pos += to / dist * std::min(dist, 3.0f * dt);
        }
        if (auto h = m_terrain->height_at(pos.x, pos.z)) {
            pos.y = *h;
        }
        m_player.set_position(pos);

        m_swing_timer -= dt;
        m_player.set_attacking(m_swing_timer > 0.0f);
        if (m_swing_timer <= -2.0f) {
            m_swing_timer = 0.5f;
            swing();
        }
    }

    void swing() {
        Entity nearest = NullEntity;
        float best = 4.0f;
        for (const auto& agent : m_director->agents()) {
            if (!agent.is_alive()) continue;
            float d = distance_xz(agent.position, m_player.position());
            if (d < best) {
                best = d;
                nearest = agent.id;
            }
        }
        if (nearest != NullEntity) {
            m_director->damage(nearest, 35.0f);
        }
    }

    void report() {
        std::map<ai::AgentState, int> counts;
        for (const auto& agent : m_director->agents()) {
            counts[agent.state]++;
        }

        std::string line = "[GoblinCamp] t=" + std::to_string(static_cast<int>(m_time)) + "s";
        for (const auto& [state, count] : counts) {
            line += " " + std::string(ai::to_string(state)) + "=" + std::to_string(count);
        }
        log(LogLevel::Debug, line);
    }

    std::string name_of(Entity e) const {
        const std::string& name = m_world.name_of(e);
        return name.empty() ? "goblin" : name;
    }

    World m_world;
    CameraView m_camera;
    ai::PlayerProxy m_player;
    std::unique_ptr<terrain::HeightmapTerrain> m_terrain;
    std::unique_ptr<ai::Director> m_director;
    std::vector<ScopedConnection> m_connections;

    std::map<ai::AgentState, int> m_state_changes;
    float m_time = 0.0f;
    float m_swing_timer = 0.0f;
    int m_player_hits = 0;
    int m_defeated = 0;
};

int main(int argc, char** argv) {
    set_log_level(LogLevel::Info);
    JobSystem::init(2);

    GoblinCampApp app;
    if (app.init(argc, argv)) {
        app.run(60.0f, 1.0f / 60.0f);
    }
    app.shutdown();

    JobSystem::shutdown();
    return 0;
}
