#pragma once

/// @file chart_positions.hpp
/// @brief Chart input as delivered by the position provider, plus entry validation.

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace astrolabe::chart
{
    /// @brief A chart point with a known position. Names are canonical registry ids.
    struct CelestialPoint
    {
        std::string        name;
        f64                longitude{0.0};  ///< Ecliptic longitude [degrees, 0..360)
        i32                sign{0};         ///< floor(longitude / 30), 0..11
        bool               retrograde{false};
        std::optional<f64> speed;           ///< Daily motion in longitude [deg/day], if supplied
    };

    /// @brief One provider record. Either position field may be absent; a record
    /// with neither is kept but contributes nothing.
    struct PointEntry
    {
        std::string        name;
        std::optional<f64> longitude;
        std::optional<i32> sign;
        bool               retrograde{false};
        std::optional<f64> speed;
    };

    /// @brief Full provider output for one chart.
    struct ChartPositions
    {
        std::vector<PointEntry> bodies;     ///< Celestial bodies, in provider order
        std::optional<f64>      ascendant;  ///< Ascendant longitude [degrees]
        std::optional<f64>      midheaven;  ///< Midheaven (MC) longitude [degrees]

        /// @brief Append a body with a full position.
        ChartPositions& add(std::string name, f64 longitude, bool retrograde = false,
                            std::optional<f64> speed = std::nullopt);

        /// @brief Append a body whose longitude is unknown but whose sign is.
        ChartPositions& add_sign_only(std::string name, i32 sign);

        /// @brief Append a body with no position data at all.
        ChartPositions& add_missing(std::string name);

        /// @brief Reject the input if any entry breaks an invariant.
        ///
        /// Checks: names are registered bodies (not angles) and unique;
        /// longitudes finite and in [0, 360); signs in [0, 11] and consistent
        /// with the longitude; speeds finite.
        /// @throws core::InvalidInputError on the first violation.
        void validate() const;

        /// @brief Bodies with a known longitude, in provider order.
        [[nodiscard]] std::vector<CelestialPoint> located_bodies() const;

        /// @brief Bodies followed by the ascendant and MC, each only when known.
        /// This is the point set used for aspect detection.
        [[nodiscard]] std::vector<CelestialPoint> aspect_points() const;

        /// @brief (name, sign) for every body whose sign is known, in provider order.
        [[nodiscard]] std::vector<std::pair<std::string, i32>> body_signs() const;

        /// @brief Sign of the ascendant, when known.
        [[nodiscard]] std::optional<i32> ascendant_sign() const;
    };

    /// @brief Throw core::InvalidInputError unless the value is a finite longitude in [0, 360).
    void require_longitude(f64 longitude, std::string_view what);

} // namespace astrolabe::chart
