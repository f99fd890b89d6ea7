#include <horde/settings/agent_settings.hpp>
#include <horde/core/filesystem.hpp>
#include <horde/core/log.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>

namespace horde::settings {

using json = nlohmann::json;

namespace {

// Every persisted float, grouped the way the JSON file is laid out.
// Works for both const and mutable settings.
template<typename S, typename Fn>
void for_each_field(S& s, Fn&& fn) {
    fn("perception", "dance_detection_radius", s.dance_detection_radius);
    fn("perception", "player_alert_radius", s.player_alert_radius);
    fn("perception", "player_danger_radius", s.player_danger_radius);
    fn("perception", "taunt_radius", s.taunt_radius);
    fn("perception", "flanking_radius", s.flanking_radius);
    fn("perception", "flank_angle_step", s.flank_angle_step);
    fn("perception", "ally_detection_radius", s.ally_detection_radius);
    fn("perception", "alert_radius", s.alert_radius);
    fn("perception", "rally_radius", s.rally_radius);
    fn("perception", "notice_rate", s.notice_rate);

    fn("combat", "max_health", s.max_health);
    fn("combat", "melee_range", s.melee_range);
    fn("combat", "throw_range", s.throw_range);
    fn("combat", "throw_min_range", s.throw_min_range);
    fn("combat", "throw_rate", s.throw_rate);
    fn("combat", "throw_cooldown_min", s.throw_cooldown_min);
    fn("combat", "throw_cooldown_max", s.throw_cooldown_max);
    fn("combat", "throw_release_fraction", s.throw_release_fraction);
    fn("combat", "throw_end_fraction", s.throw_end_fraction);
    fn("combat", "attack_end_fraction", s.attack_end_fraction);
    fn("combat", "stagger_end_fraction", s.stagger_end_fraction);
    fn("combat", "trip_end_fraction", s.trip_end_fraction);
    fn("combat", "scramble_fraction", s.scramble_fraction);
    fn("combat", "taunt_rate", s.taunt_rate);
    fn("combat", "taunt_duration_min", s.taunt_duration_min);
    fn("combat", "taunt_duration_max", s.taunt_duration_max);
    fn("combat", "trip_chance_min", s.trip_chance_min);
    fn("combat", "trip_chance_max", s.trip_chance_max);
    fn("combat", "idle_trip_factor", s.idle_trip_factor);
    fn("combat", "trip_cooldown_circling", s.trip_cooldown_circling);
    fn("combat", "trip_cooldown_idle", s.trip_cooldown_idle);
    fn("combat", "impact_fallback", s.impact_fallback);
    fn("combat", "attack_fallback", s.attack_fallback);
    fn("combat", "throw_fallback", s.throw_fallback);
    fn("combat", "trip_fallback", s.trip_fallback);
    fn("combat", "dying_fallback", s.dying_fallback);

    fn("projectile", "speed", s.projectile_speed);
    fn("projectile", "gravity", s.projectile_gravity);
    fn("projectile", "lifetime", s.projectile_lifetime);
    fn("projectile", "hit_radius", s.projectile_hit_radius);
    fn("projectile", "damage", s.projectile_damage);
    fn("projectile", "launch_height", s.projectile_launch_height);
    fn("projectile", "arc_factor", s.projectile_arc_factor);

    fn("morale", "base_courage_min", s.base_courage_min);
    fn("morale", "base_courage_max", s.base_courage_max);
    fn("morale", "ally_courage_bonus", s.ally_courage_bonus);
    fn("morale", "max_ally_courage_bonus", s.max_ally_courage_bonus);
    fn("morale", "injury_courage_penalty", s.injury_courage_penalty);
    fn("morale", "rally_courage_bonus", s.rally_courage_bonus);
    fn("morale", "rally_duration_min", s.rally_duration_min);
    fn("morale", "rally_duration_max", s.rally_duration_max);
    fn("morale", "rally_base_chance", s.rally_base_chance);
    fn("morale", "rally_courage_chance", s.rally_courage_chance);
    fn("morale", "oblivious_personality", s.oblivious_personality);
    fn("morale", "flee_courage", s.flee_courage);
    fn("morale", "circle_courage", s.circle_courage);
    fn("morale", "engage_courage", s.engage_courage);
    fn("morale", "charge_courage", s.charge_courage);
    fn("morale", "charge_rate", s.charge_rate);
    fn("morale", "retreat_courage", s.retreat_courage);
    fn("morale", "retreat_rate", s.retreat_rate);
    fn("morale", "alert_delay_min", s.alert_delay_min);
    fn("morale", "alert_delay_max", s.alert_delay_max);

    fn("locomotion", "speed_min", s.speed_min);
    fn("locomotion", "speed_max", s.speed_max);
    fn("locomotion", "circling_speed_factor", s.circling_speed_factor);
    fn("locomotion", "flee_speed_factor", s.flee_speed_factor);
    fn("locomotion", "flee_distance", s.flee_distance);
    fn("locomotion", "flee_duration_min", s.flee_duration_min);
    fn("locomotion", "flee_duration_max", s.flee_duration_max);
    fn("locomotion", "taunt_flee_duration_min", s.taunt_flee_duration_min);
    fn("locomotion", "taunt_flee_duration_max", s.taunt_flee_duration_max);
    fn("locomotion", "wander_radius", s.wander_radius);
    fn("locomotion", "arrive_distance", s.arrive_distance);
    fn("locomotion", "agent_collision_radius", s.agent_collision_radius);
    fn("locomotion", "player_collision_radius", s.player_collision_radius);

    fn("dancing", "dance_rate", s.dance_rate);
    fn("dancing", "solo_dance_chance", s.solo_dance_chance);
    fn("dancing", "chain_dance_chance", s.chain_dance_chance);
}

// Keep an ordered [lo, hi] pair after clamping both ends
void clamp_range(float& lo, float& hi, float min, float max) {
    lo = std::clamp(lo, min, max);
    hi = std::clamp(hi, min, max);
    if (hi < lo) hi = lo;
}

} // anonymous namespace

// ============================================================================
// Load / Save
// ============================================================================

bool AgentSettings::load(const std::string& path) {
    if (!core::FileSystem::exists(path)) {
        core::log(core::LogLevel::Warn, "[Settings] Settings file not found: " + path);
        return false;
    }

    if (!load_from_string(core::FileSystem::read_text(path))) {
        return false;
    }

    core::log(core::LogLevel::Info, "[Settings] Loaded settings from: " + path);
    return true;
}

bool AgentSettings::load_from_string(const std::string& text) {
    try {
        json j = json::parse(text);

        for_each_field(*this, [&j](const char* group, const char* key, float& value) {
            if (!j.contains(group)) return;
            const auto& g = j[group];
            if (g.contains(key)) value = g[key].get<float>();
        });

        validate();
        return true;

    } catch (const json::exception& e) {
        core::log(core::LogLevel::Error, std::string("[Settings] Failed to load settings: ") + e.what());
        return false;
    }
}

std::string AgentSettings::to_json_string() const {
    json j;
    for_each_field(*this, [&j](const char* group, const char* key, const float& value) {
        j[group][key] = value;
    });
    return j.dump(4);
}

bool AgentSettings::save(const std::string& path) const {
    if (!core::FileSystem::write_text(path, to_json_string())) {
        core::log(core::LogLevel::Error, "[Settings] Failed to open file for writing: " + path);
        return false;
    }

    core::log(core::LogLevel::Info, "[Settings] Saved settings to: " + path);
    return true;
}

// ============================================================================
// Validation
// ============================================================================

void AgentSettings::validate() {
    dance_detection_radius = std::clamp(dance_detection_radius, 0.0f, 100.0f);
    player_alert_radius = std::clamp(player_alert_radius, 0.0f, 200.0f);
    player_danger_radius = std::clamp(player_danger_radius, 0.0f, player_alert_radius);
    taunt_radius = std::clamp(taunt_radius, 0.0f, 100.0f);
    flanking_radius = std::clamp(flanking_radius, 0.5f, 50.0f);
    flank_angle_step = std::clamp(flank_angle_step, 0.0f, 1.0f);
    ally_detection_radius = std::clamp(ally_detection_radius, 0.0f, 100.0f);
    alert_radius = std::clamp(alert_radius, 0.0f, 100.0f);
    rally_radius = std::clamp(rally_radius, 0.0f, 100.0f);
    notice_rate = std::clamp(notice_rate, 0.0f, 100.0f);

    max_health = std::clamp(max_health, 1.0f, 100000.0f);
    melee_range = std::clamp(melee_range, 0.1f, 50.0f);
    throw_range = std::clamp(throw_range, 0.0f, 200.0f);
    throw_min_range = std::clamp(throw_min_range, 0.0f, throw_range);
    throw_rate = std::clamp(throw_rate, 0.0f, 100.0f);
    clamp_range(throw_cooldown_min, throw_cooldown_max, 0.0f, 600.0f);
    throw_release_fraction = std::clamp(throw_release_fraction, 0.0f, 1.0f);
    throw_end_fraction = std::clamp(throw_end_fraction, throw_release_fraction, 1.0f);
    attack_end_fraction = std::clamp(attack_end_fraction, 0.0f, 1.0f);
    stagger_end_fraction = std::clamp(stagger_end_fraction, 0.0f, 1.0f);
    trip_end_fraction = std::clamp(trip_end_fraction, 0.0f, 1.0f);
    scramble_fraction = std::clamp(scramble_fraction, 0.0f, 1.0f);
    taunt_rate = std::clamp(taunt_rate, 0.0f, 100.0f);
    clamp_range(taunt_duration_min, taunt_duration_max, 0.0f, 600.0f);
    clamp_range(trip_chance_min, trip_chance_max, 0.0f, 100.0f);
    idle_trip_factor = std::clamp(idle_trip_factor, 0.0f, 1.0f);
    trip_cooldown_circling = std::clamp(trip_cooldown_circling, 0.0f, 600.0f);
    trip_cooldown_idle = std::clamp(trip_cooldown_idle, 0.0f, 600.0f);
    impact_fallback = std::clamp(impact_fallback, 0.01f, 60.0f);
    attack_fallback = std::clamp(attack_fallback, 0.01f, 60.0f);
    throw_fallback = std::clamp(throw_fallback, 0.01f, 60.0f);
    trip_fallback = std::clamp(trip_fallback, 0.01f, 60.0f);
    dying_fallback = std::clamp(dying_fallback, 0.0f, 60.0f);

    projectile_speed = std::clamp(projectile_speed, 0.1f, 500.0f);
    projectile_gravity = std::clamp(projectile_gravity, -500.0f, 0.0f);
    projectile_lifetime = std::clamp(projectile_lifetime, 0.1f, 60.0f);
    projectile_hit_radius = std::clamp(projectile_hit_radius, 0.0f, 50.0f);
    projectile_damage = std::clamp(projectile_damage, 0.0f, 100000.0f);
    projectile_launch_height = std::clamp(projectile_launch_height, 0.0f, 50.0f);
    projectile_arc_factor = std::clamp(projectile_arc_factor, 0.0f, 10.0f);

    clamp_range(base_courage_min, base_courage_max, 0.0f, 1.0f);
    ally_courage_bonus = std::clamp(ally_courage_bonus, 0.0f, 1.0f);
    max_ally_courage_bonus = std::clamp(max_ally_courage_bonus, 0.0f, 1.0f);
    injury_courage_penalty = std::clamp(injury_courage_penalty, 0.0f, 1.0f);
    rally_courage_bonus = std::clamp(rally_courage_bonus, 0.0f, 1.0f);
    clamp_range(rally_duration_min, rally_duration_max, 0.0f, 600.0f);
    rally_base_chance = std::clamp(rally_base_chance, 0.0f, 1.0f);
    rally_courage_chance = std::clamp(rally_courage_chance, 0.0f, 1.0f);
    oblivious_personality = std::clamp(oblivious_personality, 0.0f, 1.0f);
    flee_courage = std::clamp(flee_courage, 0.0f, 1.0f);
    circle_courage = std::clamp(circle_courage, flee_courage, 1.0f);
    engage_courage = std::clamp(engage_courage, 0.0f, 1.0f);
    charge_courage = std::clamp(charge_courage, 0.0f, 1.0f);
    charge_rate = std::clamp(charge_rate, 0.0f, 100.0f);
    retreat_courage = std::clamp(retreat_courage, 0.0f, 1.0f);
    retreat_rate = std::clamp(retreat_rate, 0.0f, 100.0f);
    clamp_range(alert_delay_min, alert_delay_max, 0.0f, 60.0f);

    clamp_range(speed_min, speed_max, 0.0f, 100.0f);
    circling_speed_factor = std::clamp(circling_speed_factor, 0.0f, 10.0f);
    flee_speed_factor = std::clamp(flee_speed_factor, 0.0f, 10.0f);
    flee_distance = std::clamp(flee_distance, 0.0f, 500.0f);
    clamp_range(flee_duration_min, flee_duration_max, 0.0f, 600.0f);
    clamp_range(taunt_flee_duration_min, taunt_flee_duration_max, 0.0f, 600.0f);
    wander_radius = std::clamp(wander_radius, 0.0f, 500.0f);
    arrive_distance = std::clamp(arrive_distance, 0.01f, 10.0f);
    agent_collision_radius = std::clamp(agent_collision_radius, 0.0f, 10.0f);
    player_collision_radius = std::clamp(player_collision_radius, 0.0f, 10.0f);

    dance_rate = std::clamp(dance_rate, 0.0f, 100.0f);
    solo_dance_chance = std::clamp(solo_dance_chance, 0.0f, 1.0f);
    chain_dance_chance = std::clamp(chain_dance_chance, 0.0f, 1.0f);
}

} // namespace horde::settings
