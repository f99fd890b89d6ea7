#pragma once

#include <horde/animation/animation_mixer.hpp>
#include <horde/combat/damage.hpp>
#include <horde/core/math.hpp>
#include <horde/scene/entity.hpp>
#include <cstdint>
#include <limits>
#include <string>

namespace horde::ai {

using namespace horde::core;

// ============================================================================
// Agent State
// ============================================================================

enum class AgentState : uint8_t {
    Idle,
    Walking,
    Dancing,
    Scrambling,     // Short "oh no" reaction before choosing by courage
    Fleeing,
    Circling,       // Orbiting the player
    Taunting,
    Throwing,
    Tripping,
    Attacking,
    Staggered,
    Dying
};

const char* to_string(AgentState state);

// Cooldown accumulators start here so the first throw or trip is never blocked
constexpr float NeverHappened = std::numeric_limits<float>::max();

// ============================================================================
// Agent
// One goblin. Owned by the Director's roster; other agents are referenced
// by scene entity only and resolved through the roster.
// ============================================================================

struct Agent {
    scene::Entity id = scene::NullEntity;       // Scene node, also the agent's identity

    // Placement
    Vec3 position{0.0f};
    float yaw = 0.0f;                           // Facing, 0 looks down +Z

    // Animation
    animation::AnimationMixer mixer;
    std::string current_clip;

    // Health
    combat::Health health;
    bool dead = false;

    // Finite state machine
    AgentState state = AgentState::Idle;
    float idle_timer = 0.0f;                    // Counts down
    float scramble_timer = 0.0f;
    float flee_timer = 0.0f;                    // Counts down
    float taunt_timer = 0.0f;                   // Counts down
    float throw_timer = 0.0f;
    float stagger_timer = 0.0f;                 // Staggered and tripping
    float attack_timer = 0.0f;
    float dying_timer = 0.0f;
    float dying_duration = 0.0f;

    // Locomotion
    Vec3 target{0.0f};                          // Walk and flee destination (X/Z)
    float speed = 3.0f;
    std::string current_strafe_clip;

    // Temperament
    float personality = 0.5f;                   // > 0.9 shrugs the player off
    float base_courage = 0.5f;
    float courage = 0.5f;                       // Derived each tick
    bool rallied = false;
    float rally_timer = 0.0f;

    // Dancing
    scene::Entity dance_partner = scene::NullEntity;
    std::string current_dance;
    float dance_timer = 0.0f;
    float max_dance_duration = 0.0f;

    // Awareness
    bool has_noticed_player = false;
    scene::Entity alerted_by = scene::NullEntity;
    float alert_timer = 0.0f;                   // Time since alerted_by was set

    // Melee
    std::string current_attack;
    int attack_count = 0;                       // Attacks in the current combo

    // Ranged
    bool can_throw = false;
    bool throw_released = false;
    float time_since_throw = NeverHappened;
    float throw_cooldown = 5.0f;

    // Circling
    float flank_angle = 0.0f;

    // Tripping
    float trip_chance = 0.03f;                  // Per second while circling
    float time_since_trip = NeverHappened;

    bool is_alive() const { return !dead; }
    bool is_dancing() const { return state == AgentState::Dancing; }
    bool has_partner() const { return dance_partner != scene::NullEntity; }
};

} // namespace horde::ai
