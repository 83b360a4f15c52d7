/// @file chart_wheel.cpp
/// @brief Implementation of chart wheel placement.

#include "wheel/chart_wheel.hpp"

#include <glm/trigonometric.hpp>

#include <cmath>

namespace astrolabe::wheel
{

// -----------------------------------------------------------------
// Wheel angle
//
// Natural: θ = longitude + 180°
// Natal:   θ = longitude - ascendant + 180°
//
// Measured counter-clockwise from +x, so the anchor lands at 180° (9 o'clock)
// and increasing longitude moves counter-clockwise.
// -----------------------------------------------------------------

f64 ChartWheel::wheel_angle(f64 longitude, WheelOrientation orientation, f64 ascendant)
{
    f64 degrees = longitude + zodiac_constants::kHalfCircle;
    if (orientation == WheelOrientation::Natal)
    {
        degrees -= ascendant;
    }

    degrees = std::fmod(degrees, zodiac_constants::kDegreesPerCircle);
    if (degrees < 0.0)
    {
        degrees += zodiac_constants::kDegreesPerCircle;
    }

    return glm::radians(degrees);
}

Vec2d ChartWheel::project(f64 longitude, WheelOrientation orientation, f64 ascendant)
{
    const f64 theta = wheel_angle(longitude, orientation, ascendant);
    return Vec2d{glm::cos(theta), glm::sin(theta)};
}

Vec2d ChartWheel::project(f64 longitude, f64 radius, WheelOrientation orientation, f64 ascendant)
{
    return project(longitude, orientation, ascendant) * radius;
}

std::array<Vec2d, zodiac_constants::kSignCount> ChartWheel::sign_cusps(
    WheelOrientation orientation, f64 ascendant)
{
    std::array<Vec2d, zodiac_constants::kSignCount> cusps{};
    for (std::size_t sign = 0; sign < cusps.size(); ++sign)
    {
        const f64 longitude = static_cast<f64>(sign) * zodiac_constants::kDegreesPerSign;
        cusps[sign] = project(longitude, orientation, ascendant);
    }
    return cusps;
}

} // namespace astrolabe::wheel
