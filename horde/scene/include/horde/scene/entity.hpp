#pragma once

#include <entt/entt.hpp>
#include <cstdint>
#include <string>

namespace horde::scene {

// Scene node handle. Also the identity of agents, projectiles and damage
// numbers, and the form every cross-reference between them takes.
using Entity = entt::entity;

constexpr Entity NullEntity = entt::null;

// Attached to every node by World::create
struct NodeInfo {
    std::string name;
    uint64_t serial = 0;    // Creation order, never reused
};

} // namespace horde::scene
