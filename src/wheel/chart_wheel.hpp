#pragma once

/// @file chart_wheel.hpp
/// @brief Placement of ecliptic longitudes on a unit chart wheel.

#include "core/types.hpp"

#include <array>

namespace astrolabe::wheel
{
    enum class WheelOrientation : u8
    {
        Natural,  ///< 0° Aries at 9 o'clock
        Natal,    ///< Ascendant at 9 o'clock
    };

    /// @brief Static utility class mapping longitudes to wheel directions.
    ///
    /// The wheel is the unit circle with +x to the right and +y up. The zodiac
    /// runs counter-clockwise from the 9 o'clock anchor.
    class ChartWheel
    {
    public:
        ChartWheel() = delete;

        /// @brief Angle of a longitude on the wheel, measured counter-clockwise from +x (radians, 0..2π).
        /// @param longitude Ecliptic longitude (degrees).
        /// @param orientation Which point sits at 9 o'clock.
        /// @param ascendant Ascendant longitude (degrees); used only for WheelOrientation::Natal.
        [[nodiscard]] static f64 wheel_angle(f64 longitude, WheelOrientation orientation, f64 ascendant = 0.0);

        /// @brief Unit vector pointing at a longitude on the wheel.
        [[nodiscard]] static Vec2d project(f64 longitude, WheelOrientation orientation, f64 ascendant = 0.0);

        /// @brief Point at @p radius (wheel radius = 1) along the longitude's direction.
        [[nodiscard]] static Vec2d project(f64 longitude, f64 radius,
                                           WheelOrientation orientation, f64 ascendant);

        /// @brief Directions of the twelve sign cusps (0°, 30°, … 330°).
        [[nodiscard]] static std::array<Vec2d, zodiac_constants::kSignCount> sign_cusps(
            WheelOrientation orientation, f64 ascendant = 0.0);
    };

} // namespace astrolabe::wheel
