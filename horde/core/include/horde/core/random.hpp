#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

namespace horde::core {

// Random number source for gameplay rolls.
// uniform() is the single primitive; everything else derives from it so a
// subclass can script outcomes deterministically.
class Random {
public:
    explicit Random(uint32_t seed = 5489u);
    virtual ~Random() = default;

    Random(const Random&) = delete;
    Random& operator=(const Random&) = delete;

    void seed(uint32_t value);

    // Uniform in [0, 1)
    virtual float uniform();

    // Uniform in [min, max)
    float range(float min, float max);

    // True with probability p
    bool chance(float p);

    // Uniform index in [0, count); 0 when count is 0
    size_t index(size_t count);

    // Uniform angle in [0, 2*PI)
    float angle();

private:
    std::mt19937 m_engine;
    std::uniform_real_distribution<float> m_dist{0.0f, 1.0f};
};

} // namespace horde::core
