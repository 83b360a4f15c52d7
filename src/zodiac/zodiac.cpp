/// @file zodiac.cpp
/// @brief Zodiac name tables and longitude helpers.

#include "zodiac/zodiac.hpp"

#include "core/text.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>

namespace astrolabe::zodiac
{

namespace
{

constexpr std::array<std::string_view, kSignCount> kSignNames = {
    "Aries", "Taurus", "Gemini", "Cancer", "Leo", "Virgo",
    "Libra", "Scorpio", "Sagittarius", "Capricorn", "Aquarius", "Pisces",
};

constexpr std::array<std::string_view, kPlanetCount> kPlanetNames = {
    "Sun", "Moon", "Mars", "Mercury", "Jupiter", "Venus", "Saturn",
};

constexpr std::array<std::string_view, kReferenceCount> kReferenceKeys = {
    "sun", "moon", "mars", "mercury", "jupiter", "venus", "saturn", "ascendant",
};

} // anonymous namespace

f64 Zodiac::normalize_degrees(f64 degrees)
{
    degrees = std::fmod(degrees, zodiac_constants::kDegreesPerCircle);
    if (degrees < 0.0)
    {
        degrees += zodiac_constants::kDegreesPerCircle;
    }
    // fmod of a tiny negative value can round up to exactly 360
    if (degrees >= zodiac_constants::kDegreesPerCircle)
    {
        degrees = 0.0;
    }
    return degrees;
}

i32 Zodiac::sign_index(f64 longitude)
{
    const auto index = static_cast<i32>(std::floor(longitude / zodiac_constants::kDegreesPerSign));
    return std::clamp(index, 0, static_cast<i32>(kSignCount) - 1);
}

Sign Zodiac::sign_of(f64 longitude)
{
    return static_cast<Sign>(sign_index(longitude));
}

f64 Zodiac::degree_in_sign(f64 longitude)
{
    return std::fmod(longitude, zodiac_constants::kDegreesPerSign);
}

Sign Zodiac::sign_from_index(i32 index)
{
    const i32 count = static_cast<i32>(kSignCount);
    return static_cast<Sign>(((index % count) + count) % count);
}

std::string_view Zodiac::sign_name(Sign sign)
{
    return kSignNames[index_of(sign)];
}

std::string_view Zodiac::sign_name(i32 index)
{
    return sign_name(sign_from_index(index));
}

std::string_view Zodiac::planet_name(Planet planet)
{
    return kPlanetNames[index_of(planet)];
}

std::string_view Zodiac::planet_key(Planet planet)
{
    return kReferenceKeys[index_of(planet)];
}

std::string_view Zodiac::reference_key(ReferencePoint ref)
{
    return kReferenceKeys[index_of(ref)];
}

std::optional<Planet> Zodiac::parse_planet(std::string_view key)
{
    for (const Planet planet : kPlanets)
    {
        if (core::equals_ignore_case(key, planet_key(planet)))
        {
            return planet;
        }
    }
    return std::nullopt;
}

std::string Zodiac::format_degree(f64 longitude)
{
    const f64 within = degree_in_sign(longitude);
    const auto degrees = static_cast<i32>(within);
    const auto minutes = static_cast<i32>((within - degrees) * 60.0);

    return fmt::format("{}°{:02d}' {}", degrees, minutes, sign_name(sign_index(longitude)));
}

} // namespace astrolabe::zodiac
