#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <horde/core/random.hpp>
#include <horde/core/math.hpp>
#include <deque>

using namespace horde::core;
using Catch::Matchers::WithinAbs;

namespace {

class FixedRandom : public Random {
public:
    explicit FixedRandom(float value) : m_value(value) {}
    float uniform() override { return m_value; }

private:
    float m_value;
};

} // namespace

TEST_CASE("Random uniform stays in [0, 1)", "[core][random]") {
    Random rng(1234u);
    for (int i = 0; i < 1000; ++i) {
        float u = rng.uniform();
        REQUIRE(u >= 0.0f);
        REQUIRE(u < 1.0f);
    }
}

TEST_CASE("Random is reproducible for a seed", "[core][random]") {
    Random a(42u);
    Random b(42u);
    for (int i = 0; i < 32; ++i) {
        REQUIRE(a.uniform() == b.uniform());
    }

    SECTION("Reseeding restarts the sequence") {
        Random c(7u);
        float first = c.uniform();
        c.uniform();
        c.seed(7u);
        REQUIRE(c.uniform() == first);
    }
}

TEST_CASE("Random helpers derive from uniform", "[core][random]") {
    SECTION("range maps onto the interval") {
        FixedRandom rng(0.5f);
        REQUIRE_THAT(rng.range(2.0f, 4.0f), WithinAbs(3.0f, 0.0001f));
    }

    SECTION("chance compares against p") {
        FixedRandom low(0.1f);
        REQUIRE(low.chance(0.2f));
        REQUIRE_FALSE(low.chance(0.05f));
    }

    SECTION("index never reaches count") {
        FixedRandom high(0.9999999f);
        REQUIRE(high.index(3) == 2);
        REQUIRE(high.index(0) == 0);

        FixedRandom zero(0.0f);
        REQUIRE(zero.index(5) == 0);
    }

    SECTION("angle covers a full turn") {
        FixedRandom half(0.5f);
        REQUIRE_THAT(half.angle(), WithinAbs(PI, 0.0001f));
    }
}
