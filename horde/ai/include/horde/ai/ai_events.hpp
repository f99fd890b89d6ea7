#pragma once

#include <horde/ai/agent.hpp>
#include <horde/core/math.hpp>
#include <horde/scene/entity.hpp>
#include <string>

namespace horde::ai {

// ============================================================================
// Director Events
// Dispatched synchronously from inside Director calls.
// ============================================================================

struct AgentSpawnedEvent {
    scene::Entity agent;
    Vec3 position;
};

struct AgentStateChangedEvent {
    scene::Entity agent;
    AgentState previous;
    AgentState current;
};

struct DanceStartedEvent {
    scene::Entity agent;
    scene::Entity partner;      // NullEntity for a solo dance
    std::string clip;
};

struct DanceStoppedEvent {
    scene::Entity agent;
    scene::Entity partner;
    std::string reason;
};

struct AgentAlertedEvent {
    scene::Entity agent;
    scene::Entity alerted_by;
};

struct AgentRalliedEvent {
    scene::Entity agent;
    scene::Entity rallied_by;
    float duration;
};

struct AgentAttackEvent {
    scene::Entity agent;
    std::string attack;
};

struct AgentDamagedEvent {
    scene::Entity agent;
    float amount;
    float health;
};

struct AgentDiedEvent {
    scene::Entity agent;
};

struct AgentRemovedEvent {
    scene::Entity agent;
};

struct ProjectileLaunchedEvent {
    scene::Entity thrower;
    Vec3 origin;
    Vec3 target;
};

// The core only reports the hit; applying it to the player is up to the host
struct PlayerHitEvent {
    scene::Entity thrower;
    float damage;
    Vec3 position;
};

} // namespace horde::ai
