#pragma once

#include <horde/core/math.hpp>

namespace horde::ai {

using namespace horde::core;

// Read-only view of the player avatar
class IPlayerHandle {
public:
    virtual ~IPlayerHandle() = default;

    // Feet position
    virtual Vec3 position() const = 0;

    // True while the player is swinging
    virtual bool is_attacking() const = 0;
};

// Player handle backed by plain values, for hosts that push state each frame
class PlayerProxy : public IPlayerHandle {
public:
    PlayerProxy() = default;
    explicit PlayerProxy(const Vec3& position) : m_position(position) {}

    Vec3 position() const override { return m_position; }
    bool is_attacking() const override { return m_attacking; }

    void set_position(const Vec3& position) { m_position = position; }
    void set_attacking(bool attacking) { m_attacking = attacking; }

private:
    Vec3 m_position{0.0f};
    bool m_attacking = false;
};

} // namespace horde::ai
