#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstddef>
#include <cstdint>

namespace astrolabe
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Vector types (double precision for chart geometry)
    using Vec2d = glm::dvec2;
    using Vec3d = glm::dvec3;

    // Ecliptic / zodiac constants
    namespace zodiac_constants
    {
        constexpr f64 kPi               = glm::pi<f64>();
        constexpr f64 kTwoPi            = 2.0 * kPi;
        constexpr f64 kDegToRad         = kPi / 180.0;
        constexpr f64 kRadToDeg         = 180.0 / kPi;
        constexpr f64 kDegreesPerCircle = 360.0;
        constexpr f64 kHalfCircle       = 180.0;
        constexpr f64 kDegreesPerSign   = 30.0;
        constexpr std::size_t kSignCount   = 12;
        constexpr std::size_t kHouseCount  = 12;
    }
}
