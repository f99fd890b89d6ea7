#pragma once

#include <horde/core/math.hpp>
#include <horde/terrain/terrain_oracle.hpp>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace horde::terrain {

using namespace horde::core;

// Regular grid of ground heights, row-major along X then Z.
// Sampled in normalized coordinates: (0,0) is the first sample, (1,1) the last.
class Heightmap {
public:
    Heightmap() = default;

    // width x depth samples, all at fill. Fewer than 2 per axis gives an empty map.
    Heightmap(uint32_t width, uint32_t depth, float fill = 0.0f);

    // Empty when samples.size() != width * depth
    static Heightmap from_samples(std::vector<float> samples, uint32_t width, uint32_t depth);

    // fn(u, v) evaluated at every sample position
    static Heightmap from_function(uint32_t width, uint32_t depth,
                                   const std::function<float(float u, float v)>& fn);

    bool empty() const { return m_samples.empty(); }
    uint32_t width() const { return m_width; }
    uint32_t depth() const { return m_depth; }

    // Out-of-range cells read 0 and ignore writes
    float at(uint32_t x, uint32_t z) const;
    void set(uint32_t x, uint32_t z, float height);

    // Bilinear, with u and v clamped to [0, 1]; 0 on an empty map
    float sample(float u, float v) const;

    // Lowest and highest sample
    std::pair<float, float> range() const;

private:
    std::vector<float> m_samples;
    uint32_t m_width = 0;
    uint32_t m_depth = 0;
};

// Heightmap laid over [origin.x, origin.x + size.x] by [origin.z, origin.z + size.z].
// Heights are origin.y + sample * size.y. Outside the footprint the ground is undefined.
class HeightmapTerrain : public ITerrainOracle {
public:
    HeightmapTerrain(Heightmap heightmap, const Vec3& origin, const Vec3& size);

    std::optional<float> height_at(float x, float z) const override;

    const Heightmap& heightmap() const { return m_heightmap; }

private:
    Heightmap m_heightmap;
    Vec3 m_origin;
    Vec3 m_size;
};

} // namespace horde::terrain
