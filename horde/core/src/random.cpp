#include <horde/core/random.hpp>
#include <horde/core/math.hpp>
#include <algorithm>

namespace horde::core {

Random::Random(uint32_t seed)
    : m_engine(seed)
{
}

void Random::seed(uint32_t value) {
    m_engine.seed(value);
    m_dist.reset();
}

float Random::uniform() {
    return m_dist(m_engine);
}

float Random::range(float min, float max) {
    return min + uniform() * (max - min);
}

bool Random::chance(float p) {
    return uniform() < p;
}

size_t Random::index(size_t count) {
    if (count == 0) return 0;
    size_t i = static_cast<size_t>(uniform() * static_cast<float>(count));
    return std::min(i, count - 1);
}

float Random::angle() {
    return uniform() * TWO_PI;
}

} // namespace horde::core
