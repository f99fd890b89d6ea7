#include <horde/scene/world.hpp>

namespace horde::scene {

Entity World::create(const std::string& name) {
    Entity e = m_registry.create();
    uint64_t serial = m_next_serial++;

    NodeInfo& info = m_registry.emplace<NodeInfo>(e);
    info.serial = serial;
    info.name = name.empty() ? "Node_" + std::to_string(serial) : name;

    m_names[info.name] = e;
    ++m_count;
    return e;
}

void World::destroy(Entity e) {
    if (!m_registry.valid(e)) return;

    auto it = m_names.find(m_registry.get<NodeInfo>(e).name);
    if (it != m_names.end() && it->second == e) {
        m_names.erase(it);
    }
    m_registry.destroy(e);
    --m_count;
}

const std::string& World::name_of(Entity e) const {
    static const std::string none;
    if (!m_registry.valid(e)) return none;
    return m_registry.get<NodeInfo>(e).name;
}

Entity World::find_by_name(const std::string& name) const {
    auto it = m_names.find(name);
    return it != m_names.end() ? it->second : NullEntity;
}

void World::clear() {
    m_registry.clear();
    m_names.clear();
    m_next_serial = 1;
    m_count = 0;
}

} // namespace horde::scene
