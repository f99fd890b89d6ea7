#pragma once

#include <optional>

namespace horde::terrain {

// Ground height lookup consumed by agents and projectiles.
// nullopt means "no terrain here"; callers keep their previous height.
class ITerrainOracle {
public:
    virtual ~ITerrainOracle() = default;
    virtual std::optional<float> height_at(float x, float z) const = 0;
};

// Infinite plane at a fixed height
class FlatTerrain : public ITerrainOracle {
public:
    explicit FlatTerrain(float height = 0.0f) : m_height(height) {}

    std::optional<float> height_at(float, float) const override { return m_height; }

    void set_height(float height) { m_height = height; }

private:
    float m_height;
};

} // namespace horde::terrain
