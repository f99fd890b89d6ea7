#pragma once

#include <horde/ai/agent.hpp>
#include <horde/core/math.hpp>
#include <string>

namespace horde::ai {

class Director;

// ============================================================================
// Agent Brain
// Per-agent finite state machine. Each update() is one behaviour step for
// one living agent; the first matching branch of the current state wins.
// Cross-agent signals (alert, rally, dancing, projectiles) go through the
// Director so every other agent sees them within the same tick.
// ============================================================================

class AgentBrain {
public:
    explicit AgentBrain(Director& director);

    // Morale, cooldowns, then the current state's branch
    void update(Agent& agent, float delta_time);

    // ------------------------------------------------------------------------
    // Transitions. Each sets the state, resets its timers and requests the clip.
    // ------------------------------------------------------------------------

    void enter_idle(Agent& agent, float idle_time, float crossfade);
    void enter_walking(Agent& agent, const Vec3& target, float crossfade);
    void enter_scrambling(Agent& agent);
    void enter_fleeing(Agent& agent, float duration, float distance, float crossfade);
    void enter_circling(Agent& agent, float crossfade);
    void enter_taunting(Agent& agent);
    void enter_throwing(Agent& agent);
    void enter_tripping(Agent& agent);

    // engage: first swing from the proximity check (notices and rallies);
    // otherwise the next hit of a combo
    void enter_attacking(Agent& agent, bool engage);
    void enter_staggered(Agent& agent);
    void enter_dying(Agent& agent);

    // State bookkeeping shared by every transition
    void set_state(Agent& agent, AgentState state);

    // Locomotion clip for moving along move_yaw while facing facing_yaw
    static std::string strafe_clip(float move_yaw, float facing_yaw);

private:
    void update_idle(Agent& agent, float dt);
    void update_walking(Agent& agent, float dt);
    void update_dancing(Agent& agent, float dt);
    void update_scrambling(Agent& agent, float dt);
    void update_fleeing(Agent& agent, float dt);
    void update_circling(Agent& agent, float dt);
    void update_taunting(Agent& agent, float dt);
    void update_throwing(Agent& agent, float dt);
    void update_tripping(Agent& agent, float dt);
    void update_attacking(Agent& agent, float dt);
    void update_staggered(Agent& agent, float dt);

    // Player within melee range of an idle or walking agent. Returns true
    // when the agent started attacking.
    bool check_melee_engage(Agent& agent);

    // Alerted agent whose reaction delay has passed
    bool alert_due(const Agent& agent) const;

    void face_player(Agent& agent);
    void move_towards(Agent& agent, const Vec3& target, float step);
    void snap_to_terrain(Agent& agent);
    void resolve_collisions(Agent& agent);

    Director& m_director;
};

} // namespace horde::ai
