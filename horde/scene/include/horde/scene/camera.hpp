#pragma once

#include <horde/core/math.hpp>

namespace horde::scene {

using namespace horde::core;

// Host camera as seen by billboards
struct CameraView {
    Vec3 position{0.0f};
    Quat orientation{1.0f, 0.0f, 0.0f, 0.0f};
};

} // namespace horde::scene
