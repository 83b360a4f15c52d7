/// @file aspect_detector.cpp
/// @brief Implementation of pairwise aspect detection.

#include "aspects/aspect_detector.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace astrolabe::aspects
{

// -----------------------------------------------------------------
// Circular difference
//
// diff = (long2 - long1) mod 360, with the result of mod in [0, 360)
// if diff > 180: diff -= 360
//
// Exact 0° and 180° both stay on the non-negative side.
// -----------------------------------------------------------------

f64 AspectDetector::signed_difference(f64 long1, f64 long2)
{
    f64 diff = std::fmod(long2 - long1, zodiac_constants::kDegreesPerCircle);
    if (diff < 0.0)
    {
        diff += zodiac_constants::kDegreesPerCircle;
    }
    if (diff > zodiac_constants::kHalfCircle)
    {
        diff -= zodiac_constants::kDegreesPerCircle;
    }
    return diff;
}

f64 AspectDetector::separation(f64 long1, f64 long2)
{
    return std::abs(signed_difference(long1, long2));
}

std::optional<AspectMatch> AspectDetector::calculate_aspect(
    f64 long1, f64 long2, f64 aspect_angle, f64 orb)
{
    const f64 angle = separation(long1, long2);
    const f64 deviation = std::abs(angle - aspect_angle);

    // A NaN deviation never matches
    if (!(deviation <= orb))
    {
        return std::nullopt;
    }

    return AspectMatch{
        .angle    = angle,
        .orb      = angle - aspect_angle,
        .orb_abs  = deviation,
        .applying = std::nullopt,
    };
}

std::vector<Aspect> AspectDetector::calculate_all_aspects(
    std::span<const chart::CelestialPoint> points,
    std::span<const AspectDefinition> aspect_set)
{
    for (const chart::CelestialPoint& point : points)
    {
        chart::require_longitude(point.longitude, point.name);
    }
    AspectTable::validate(aspect_set);

    std::vector<Aspect> aspects;

    for (std::size_t i = 0; i < points.size(); ++i)
    {
        for (std::size_t j = i + 1; j < points.size(); ++j)
        {
            const chart::CelestialPoint& p1 = points[i];
            const chart::CelestialPoint& p2 = points[j];

            for (const AspectDefinition& def : aspect_set)
            {
                const auto match = calculate_aspect(p1.longitude, p2.longitude, def.angle, def.orb);
                if (!match)
                {
                    continue;
                }

                aspects.push_back(Aspect{
                    .point1     = p1.name,
                    .point2     = p2.name,
                    .type       = def.type,
                    .angle      = def.angle,
                    .separation = match->angle,
                    .orb        = match->orb,
                    .orb_abs    = match->orb_abs,
                    .applying   = is_applying(p1, p2, def.angle),
                });

                ALB_CORE_TRACE("AspectDetector: {} {} {} (orb {:.2f})",
                               p1.name, AspectTable::name(def.type), p2.name, match->orb);
            }
        }
    }

    ALB_CORE_DEBUG("AspectDetector: {} aspects among {} points ({} definitions)",
                   aspects.size(), points.size(), aspect_set.size());

    return aspects;
}

std::vector<Aspect> AspectDetector::calculate_all_aspects(
    const chart::ChartPositions& positions,
    std::span<const AspectDefinition> aspect_set)
{
    positions.validate();
    AspectTable::validate(aspect_set);

    const std::vector<chart::CelestialPoint> points = positions.aspect_points();

    const auto missing = std::count_if(positions.bodies.begin(), positions.bodies.end(),
                                       [](const chart::PointEntry& entry) { return !entry.longitude; });
    if (missing > 0)
    {
        ALB_CORE_DEBUG("AspectDetector: {} bodies without a longitude skipped", missing);
    }

    return calculate_all_aspects(points, aspect_set);
}

// -----------------------------------------------------------------
// Applying / separating
//
// d  = signed difference p2 - p1, angle = |d|
// d' = speed2 - speed1
// angle' = sign(d) * d', except at d == 0 (angle can only grow)
//          and |d| == 180 (angle can only shrink)
// deviation = |angle - A|, deviation' = sign(angle - A) * angle'
//
// Applying while the deviation shrinks. At the exact angle any relative
// motion separates.
// -----------------------------------------------------------------

std::optional<bool> AspectDetector::is_applying(
    const chart::CelestialPoint& p1,
    const chart::CelestialPoint& p2,
    f64 aspect_angle)
{
    if (!p1.speed || !p2.speed)
    {
        return std::nullopt;
    }

    const f64 relative_speed = *p2.speed - *p1.speed;
    if (relative_speed == 0.0)
    {
        return std::nullopt;
    }

    const f64 diff = signed_difference(p1.longitude, p2.longitude);
    const f64 angle = std::abs(diff);

    f64 angle_rate = 0.0;
    if (diff == 0.0)
    {
        angle_rate = std::abs(relative_speed);
    }
    else if (angle == zodiac_constants::kHalfCircle)
    {
        angle_rate = -std::abs(relative_speed);
    }
    else
    {
        angle_rate = (diff > 0.0) ? relative_speed : -relative_speed;
    }

    const f64 offset = angle - aspect_angle;
    if (offset == 0.0)
    {
        return false;
    }

    const f64 deviation_rate = (offset > 0.0) ? angle_rate : -angle_rate;
    return deviation_rate < 0.0;
}

// -----------------------------------------------------------------
// Quick major-aspect classification
// -----------------------------------------------------------------

std::optional<MajorAspectHit> AspectDetector::find_major_aspect(
    f64 long1, f64 long2, std::span<const OrbOverride> orbs)
{
    constexpr std::array<AspectDefinition, 5> kDefaults = {{
        {AspectType::Conjunction,   0.0, 8.0},
        {AspectType::Sextile,      60.0, 6.0},
        {AspectType::Square,       90.0, 8.0},
        {AspectType::Trine,       120.0, 8.0},
        {AspectType::Opposition,  180.0, 8.0},
    }};

    const f64 angle = separation(long1, long2);

    for (const AspectDefinition& def : kDefaults)
    {
        f64 orb = def.orb;
        const auto it = std::find_if(orbs.begin(), orbs.end(), [&](const OrbOverride& o) {
            return o.type == def.type;
        });
        if (it != orbs.end())
        {
            orb = it->orb;
        }

        const f64 deviation = std::abs(angle - def.angle);
        if (deviation <= orb)
        {
            return MajorAspectHit{
                .type       = def.type,
                .separation = angle,
                .orb        = deviation,
                .exact      = deviation <= kExactThreshold,
            };
        }
    }

    return std::nullopt;
}

} // namespace astrolabe::aspects
