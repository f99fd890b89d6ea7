#include <horde/ai/agent.hpp>

namespace horde::ai {

const char* to_string(AgentState state) {
    switch (state) {
        case AgentState::Idle: return "idle";
        case AgentState::Walking: return "walking";
        case AgentState::Dancing: return "dancing";
        case AgentState::Scrambling: return "scrambling";
        case AgentState::Fleeing: return "fleeing";
        case AgentState::Circling: return "circling";
        case AgentState::Taunting: return "taunting";
        case AgentState::Throwing: return "throwing";
        case AgentState::Tripping: return "tripping";
        case AgentState::Attacking: return "attacking";
        case AgentState::Staggered: return "staggered";
        case AgentState::Dying: return "dying";
    }
    return "unknown";
}

} // namespace horde::ai
