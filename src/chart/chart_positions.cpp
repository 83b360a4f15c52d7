/// @file chart_positions.cpp
/// @brief Chart input helpers and validation.

#include "chart/chart_positions.hpp"

#include "core/error.hpp"
#include "core/text.hpp"
#include "zodiac/body_registry.hpp"
#include "zodiac/zodiac.hpp"

#include <spdlog/fmt/fmt.h>

#include <cmath>
#include <unordered_set>

namespace astrolabe::chart
{

namespace
{

std::string canonical_name(std::string_view name)
{
    const auto body = zodiac::BodyRegistry::find(name);
    return body ? std::string(body->id) : core::to_lower(name);
}

CelestialPoint make_angle(std::string_view id, f64 longitude)
{
    return CelestialPoint{
        .name       = std::string(id),
        .longitude  = longitude,
        .sign       = zodiac::Zodiac::sign_index(longitude),
        .retrograde = false,
        .speed      = std::nullopt,
    };
}

} // anonymous namespace

void require_longitude(f64 longitude, std::string_view what)
{
    if (!std::isfinite(longitude)
        || longitude < 0.0
        || longitude >= zodiac_constants::kDegreesPerCircle)
    {
        throw core::InvalidInputError(
            fmt::format("{}: longitude {} is outside [0, 360)", what, longitude));
    }
}

ChartPositions& ChartPositions::add(std::string name, f64 longitude, bool retrograde,
                                    std::optional<f64> speed)
{
    bodies.push_back(PointEntry{
        .name       = std::move(name),
        .longitude  = longitude,
        .sign       = std::nullopt,
        .retrograde = retrograde,
        .speed      = speed,
    });
    return *this;
}

ChartPositions& ChartPositions::add_sign_only(std::string name, i32 sign)
{
    bodies.push_back(PointEntry{.name = std::move(name), .sign = sign});
    return *this;
}

ChartPositions& ChartPositions::add_missing(std::string name)
{
    bodies.push_back(PointEntry{.name = std::move(name)});
    return *this;
}

void ChartPositions::validate() const
{
    std::unordered_set<std::string> seen;

    for (const PointEntry& entry : bodies)
    {
        const auto body = zodiac::BodyRegistry::find(entry.name);
        if (!body)
        {
            throw core::InvalidInputError(fmt::format("unknown point name '{}'", entry.name));
        }
        if (body->category == zodiac::BodyCategory::Angle)
        {
            throw core::InvalidInputError(fmt::format(
                "'{}' is a chart angle and must be supplied as ascendant/midheaven", entry.name));
        }
        if (!seen.insert(std::string(body->id)).second)
        {
            throw core::InvalidInputError(fmt::format("duplicate point '{}'", entry.name));
        }

        if (entry.longitude)
        {
            require_longitude(*entry.longitude, entry.name);
        }

        if (entry.sign)
        {
            const i32 sign = *entry.sign;
            if (sign < 0 || sign >= static_cast<i32>(zodiac::kSignCount))
            {
                throw core::InvalidInputError(
                    fmt::format("{}: sign index {} is outside [0, 11]", entry.name, sign));
            }
            if (entry.longitude && zodiac::Zodiac::sign_index(*entry.longitude) != sign)
            {
                throw core::InvalidInputError(fmt::format(
                    "{}: sign index {} does not match longitude {}",
                    entry.name, sign, *entry.longitude));
            }
        }

        if (entry.speed && !std::isfinite(*entry.speed))
        {
            throw core::InvalidInputError(fmt::format("{}: speed is not finite", entry.name));
        }
    }

    if (ascendant)
    {
        require_longitude(*ascendant, zodiac::kAscendantId);
    }
    if (midheaven)
    {
        require_longitude(*midheaven, zodiac::kMidheavenId);
    }
}

std::vector<CelestialPoint> ChartPositions::located_bodies() const
{
    std::vector<CelestialPoint> points;
    points.reserve(bodies.size());

    for (const PointEntry& entry : bodies)
    {
        if (!entry.longitude)
        {
            continue;
        }

        points.push_back(CelestialPoint{
            .name       = canonical_name(entry.name),
            .longitude  = *entry.longitude,
            .sign       = zodiac::Zodiac::sign_index(*entry.longitude),
            .retrograde = entry.retrograde,
            .speed      = entry.speed,
        });
    }

    return points;
}

std::vector<CelestialPoint> ChartPositions::aspect_points() const
{
    std::vector<CelestialPoint> points = located_bodies();

    if (ascendant)
    {
        points.push_back(make_angle(zodiac::kAscendantId, *ascendant));
    }
    if (midheaven)
    {
        points.push_back(make_angle(zodiac::kMidheavenId, *midheaven));
    }

    return points;
}

std::vector<std::pair<std::string, i32>> ChartPositions::body_signs() const
{
    std::vector<std::pair<std::string, i32>> signs;
    signs.reserve(bodies.size());

    for (const PointEntry& entry : bodies)
    {
        if (entry.sign)
        {
            signs.emplace_back(canonical_name(entry.name), *entry.sign);
        }
        else if (entry.longitude)
        {
            signs.emplace_back(canonical_name(entry.name), zodiac::Zodiac::sign_index(*entry.longitude));
        }
    }

    return signs;
}

std::optional<i32> ChartPositions::ascendant_sign() const
{
    if (!ascendant)
    {
        return std::nullopt;
    }
    return zodiac::Zodiac::sign_index(*ascendant);
}

} // namespace astrolabe::chart
