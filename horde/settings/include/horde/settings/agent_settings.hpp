#pragma once

#include <string>

namespace horde::settings {

// ============================================================================
// Agent Settings
// Tunables for the goblin director. Defaults are the shipping values.
// ============================================================================

struct AgentSettings {
    // ========================================================================
    // Perception
    // ========================================================================

    float dance_detection_radius = 4.0f;    // Partner search radius
    float player_alert_radius = 15.0f;      // Dancers may notice the player inside this
    float player_danger_radius = 8.0f;      // Dancers always react inside this
    float taunt_radius = 12.0f;             // Also how far a taunting agent flees from the player
    float flanking_radius = 5.0f;           // Orbit radius around the player
    float flank_angle_step = 0.02f;         // Radians added per circling tick
    float ally_detection_radius = 8.0f;
    float alert_radius = 8.0f;
    float rally_radius = 6.0f;
    float notice_rate = 2.0f;               // Notice roll scale per second

    // ========================================================================
    // Combat
    // ========================================================================

    float max_health = 100.0f;
    float melee_range = 3.0f;
    float throw_range = 15.0f;
    float throw_min_range = 5.0f;
    float throw_rate = 0.5f;                // Per second while eligible
    float throw_cooldown_min = 4.0f;
    float throw_cooldown_max = 7.0f;
    float throw_release_fraction = 0.6f;    // Of the throw clip
    float throw_end_fraction = 0.9f;
    float attack_end_fraction = 0.9f;
    float stagger_end_fraction = 0.8f;
    float trip_end_fraction = 0.9f;
    float scramble_fraction = 0.7f;         // Of the impact clip before dispatch
    float taunt_rate = 0.15f;
    float taunt_duration_min = 1.5f;
    float taunt_duration_max = 3.0f;
    float trip_chance_min = 0.02f;          // Per second while circling
    float trip_chance_max = 0.05f;
    float idle_trip_factor = 0.1f;
    float trip_cooldown_circling = 10.0f;
    float trip_cooldown_idle = 15.0f;

    // Durations used when a clip is missing
    float impact_fallback = 0.5f;
    float attack_fallback = 1.2f;
    float throw_fallback = 1.5f;
    float trip_fallback = 2.0f;
    float dying_fallback = 0.5f;

    // ========================================================================
    // Projectile
    // ========================================================================

    float projectile_speed = 12.0f;
    float projectile_gravity = -15.0f;
    float projectile_lifetime = 3.0f;
    float projectile_hit_radius = 0.8f;
    float projectile_damage = 10.0f;
    float projectile_launch_height = 1.2f;
    float projectile_arc_factor = 0.3f;

    // ========================================================================
    // Morale
    // ========================================================================

    float base_courage_min = 0.3f;
    float base_courage_max = 0.7f;
    float ally_courage_bonus = 0.15f;       // Per ally in range
    float max_ally_courage_bonus = 0.6f;
    float injury_courage_penalty = 0.3f;    // At zero health
    float rally_courage_bonus = 0.3f;
    float rally_duration_min = 3.0f;
    float rally_duration_max = 5.0f;
    float rally_base_chance = 0.4f;
    float rally_courage_chance = 0.4f;      // Scaled by the peer's courage
    float oblivious_personality = 0.9f;
    float flee_courage = 0.3f;              // Scramble: below flees
    float circle_courage = 0.6f;            // Scramble: below circles, else charges
    float engage_courage = 0.4f;            // Idle engage and distracted strike
    float charge_courage = 0.7f;
    float charge_rate = 0.3f;
    float retreat_courage = 0.2f;
    float retreat_rate = 0.5f;
    float alert_delay_min = 0.3f;           // Most excitable
    float alert_delay_max = 1.0f;           // Most placid

    // ========================================================================
    // Locomotion
    // ========================================================================

    float speed_min = 2.0f;
    float speed_max = 4.0f;
    float circling_speed_factor = 0.7f;
    float flee_speed_factor = 1.5f;
    float flee_distance = 15.0f;
    float flee_duration_min = 3.0f;
    float flee_duration_max = 5.0f;
    float taunt_flee_duration_min = 2.0f;
    float taunt_flee_duration_max = 4.0f;
    float wander_radius = 10.0f;
    float arrive_distance = 0.5f;
    float agent_collision_radius = 0.5f;
    float player_collision_radius = 0.5f;

    // ========================================================================
    // Dancing
    // ========================================================================

    float dance_rate = 0.3f;                // Per second while idle and unbothered
    float solo_dance_chance = 0.3f;
    float chain_dance_chance = 0.2f;

    // Loads from JSON; missing keys keep their current value
    bool load(const std::string& path);
    bool load_from_string(const std::string& text);
    bool save(const std::string& path) const;
    std::string to_json_string() const;

    // Clamp all values into usable ranges
    void validate();
};

} // namespace horde::settings
