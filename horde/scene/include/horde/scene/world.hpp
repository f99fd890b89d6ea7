#pragma once

#include <horde/scene/entity.hpp>
#include <entt/entt.hpp>
#include <string>
#include <unordered_map>
#include <utility>

namespace horde::scene {

// The host scene as the horde sees it: named nodes with components,
// backed by an EnTT registry. Tick thread only.
class World {
public:
    World() = default;

    World(const World&) = delete;
    World& operator=(const World&) = delete;

    // Adds a node. An empty name becomes "Node_<serial>". Names are expected
    // to be unique; a duplicate shadows the earlier node in find_by_name.
    Entity create(const std::string& name = {});

    // Removes a node and all its components. Stale handles are ignored.
    void destroy(Entity e);

    bool valid(Entity e) const { return m_registry.valid(e); }

    // "" for stale handles
    const std::string& name_of(Entity e) const;

    Entity find_by_name(const std::string& name) const;

    size_t size() const { return m_count; }
    bool empty() const { return m_count == 0; }

    void clear();

    // Components
    template<typename T, typename... Args>
    T& emplace(Entity e, Args&&... args) {
        return m_registry.emplace_or_replace<T>(e, std::forward<Args>(args)...);
    }

    template<typename T>
    void remove(Entity e) { m_registry.remove<T>(e); }

    template<typename T>
    bool has(Entity e) const { return m_registry.all_of<T>(e); }

    template<typename T>
    T& get(Entity e) { return m_registry.get<T>(e); }

    template<typename T>
    const T& get(Entity e) const { return m_registry.get<T>(e); }

    template<typename T>
    T* try_get(Entity e) { return m_registry.try_get<T>(e); }

    template<typename T>
    const T* try_get(Entity e) const { return m_registry.try_get<T>(e); }

private:
    entt::registry m_registry;
    std::unordered_map<std::string, Entity> m_names;
    uint64_t m_next_serial = 1;
    size_t m_count = 0;
};

} // namespace horde::scene
