#pragma once

/// @file aspect_detector.hpp
/// @brief Pairwise angular separations between chart points, classified against an aspect table.

#include "aspects/aspect_definition.hpp"
#include "chart/chart_positions.hpp"
#include "core/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <vector>

namespace astrolabe::aspects
{
    /// @brief Result of testing one separation against one aspect angle.
    struct AspectMatch
    {
        f64                 angle;    ///< Actual separation [degrees, 0..180]
        f64                 orb;      ///< angle - aspect angle (signed)
        f64                 orb_abs;  ///< |angle - aspect angle|
        std::optional<bool> applying; ///< Unknown without velocity data
    };

    /// @brief A detected aspect between two named chart points.
    struct Aspect
    {
        std::string         point1;
        std::string         point2;
        AspectType          type;
        f64                 angle;       ///< Exact angle of the aspect definition [degrees]
        f64                 separation;  ///< Actual separation between the points [degrees]
        f64                 orb;
        f64                 orb_abs;
        std::optional<bool> applying;
    };

    /// @brief First major aspect found between two longitudes.
    struct MajorAspectHit
    {
        AspectType type;
        f64        separation;  ///< Actual separation [degrees]
        f64        orb;         ///< |separation - aspect angle|
        bool       exact;       ///< Within 1° of exact
    };

    /// @brief Stateless aspect detection.
    ///
    /// Every function is a pure function of its arguments.
    class AspectDetector
    {
    public:
        AspectDetector() = delete;

        /// @brief Within this many degrees an aspect is reported as exact.
        static constexpr f64 kExactThreshold = 1.0;

        /// @brief Shortest arc between two longitudes [degrees, 0..180].
        [[nodiscard]] static f64 separation(f64 long1, f64 long2);

        /// @brief Test whether two longitudes form an aspect of the given angle.
        ///
        /// diff = (long2 - long1) mod 360, folded into (-180, 180]; angle = |diff|.
        /// The orb boundary is inclusive.
        /// @return The match, or std::nullopt if |angle - aspect_angle| > orb.
        [[nodiscard]] static std::optional<AspectMatch> calculate_aspect(
            f64 long1, f64 long2, f64 aspect_angle, f64 orb);

        /// @brief All aspects among a set of located points.
        ///
        /// Each unordered pair (i < j) is visited once and tested against every
        /// definition in @p aspect_set; a pair may match several definitions.
        /// When both points carry a speed the applying flag is filled in.
        /// @throws core::InvalidInputError if a longitude lies outside [0, 360)
        /// or the aspect table is malformed.
        [[nodiscard]] static std::vector<Aspect> calculate_all_aspects(
            std::span<const chart::CelestialPoint> points,
            std::span<const AspectDefinition> aspect_set);

        /// @brief All aspects among the bodies and angles of a chart.
        ///
        /// Validates the positions and the table first. Bodies without a
        /// longitude are left out of the pair search.
        /// @throws core::InvalidInputError
        [[nodiscard]] static std::vector<Aspect> calculate_all_aspects(
            const chart::ChartPositions& positions,
            std::span<const AspectDefinition> aspect_set);

        /// @brief Applying (true) / separating (false) state of an aspect from
        /// the two points' daily motions. Empty when either speed is unknown or
        /// the points have no relative motion.
        [[nodiscard]] static std::optional<bool> is_applying(
            const chart::CelestialPoint& p1,
            const chart::CelestialPoint& p2,
            f64 aspect_angle);

        /// @brief First of conjunction, sextile, square, trine, opposition within orb.
        ///
        /// Default orbs are 8/6/8/8/8 degrees; @p orbs replaces them per type.
        [[nodiscard]] static std::optional<MajorAspectHit> find_major_aspect(
            f64 long1, f64 long2, std::span<const OrbOverride> orbs = {});

    private:
        /// @brief (long2 - long1) folded into (-180, 180].
        [[nodiscard]] static f64 signed_difference(f64 long1, f64 long2);
    };

} // namespace astrolabe::aspects
