#include <horde/terrain/heightmap.hpp>
#include <algorithm>
#include <cmath>

namespace horde::terrain {

Heightmap::Heightmap(uint32_t width, uint32_t depth, float fill) {
    if (width < 2 || depth < 2) return;
    m_width = width;
    m_depth = depth;
    m_samples.assign(static_cast<size_t>(width) * depth, fill);
}

Heightmap Heightmap::from_samples(std::vector<float> samples, uint32_t width, uint32_t depth) {
    Heightmap map;
    if (width < 2 || depth < 2 || samples.size() != static_cast<size_t>(width) * depth) {
        return map;
    }
    map.m_width = width;
    map.m_depth = depth;
    map.m_samples = std::move(samples);
    return map;
}

Heightmap Heightmap::from_function(uint32_t width, uint32_t depth,
                                   const std::function<float(float u, float v)>& fn) {
    Heightmap map(width, depth);
    if (map.empty()) return map;

    float du = 1.0f / static_cast<float>(width - 1);
    float dv = 1.0f / static_cast<float>(depth - 1);
    for (uint32_t z = 0; z < depth; ++z) {
        for (uint32_t x = 0; x < width; ++x) {
            map.m_samples[static_cast<size_t>(z) * width + x] = fn(x * du, z * dv);
        }
    }
    return map;
}

float Heightmap::at(uint32_t x, uint32_t z) const {
    if (x >= m_width || z >= m_depth) return 0.0f;
    return m_samples[static_cast<size_t>(z) * m_width + x];
}

void Heightmap::set(uint32_t x, uint32_t z, float height) {
    if (x >= m_width || z >= m_depth) return;
    m_samples[static_cast<size_t>(z) * m_width + x] = height;
}

float Heightmap::sample(float u, float v) const {
    if (empty()) return 0.0f;

    float gx = std::clamp(u, 0.0f, 1.0f) * static_cast<float>(m_width - 1);
    float gz = std::clamp(v, 0.0f, 1.0f) * static_cast<float>(m_depth - 1);

    // Last row and column fold back into the previous cell with t = 1
    uint32_t x0 = std::min(static_cast<uint32_t>(gx), m_width - 2);
    uint32_t z0 = std::min(static_cast<uint32_t>(gz), m_depth - 2);
    float tx = gx - static_cast<float>(x0);
    float tz = gz - static_cast<float>(z0);

    float near_row = glm::mix(at(x0, z0), at(x0 + 1, z0), tx);
    float far_row = glm::mix(at(x0, z0 + 1), at(x0 + 1, z0 + 1), tx);
    return glm::mix(near_row, far_row, tz);
}

std::pair<float, float> Heightmap::range() const {
    if (empty()) return {0.0f, 0.0f};
    auto [lo, hi] = std::minmax_element(m_samples.begin(), m_samples.end());
    return {*lo, *hi};
}

// ============================================================================
// HeightmapTerrain
// ============================================================================

HeightmapTerrain::HeightmapTerrain(Heightmap heightmap, const Vec3& origin, const Vec3& size)
    : m_heightmap(std::move(heightmap))
    , m_origin(origin)
    , m_size(size)
{
}

std::optional<float> HeightmapTerrain::height_at(float x, float z) const {
    if (m_heightmap.empty() || m_size.x <= 0.0f || m_size.z <= 0.0f) {
        return std::nullopt;
    }

    float u = (x - m_origin.x) / m_size.x;
    float v = (z - m_origin.z) / m_size.z;
    if (u < 0.0f || u > 1.0f || v < 0.0f || v > 1.0f) {
        return std::nullopt;
    }

    return m_origin.y + m_heightmap.sample(u, v) * m_size.y;
}

} // namespace horde::terrain
