/// @file body_registry.cpp
/// @brief Built-in table of chart points.

#include "zodiac/body_registry.hpp"

#include "core/text.hpp"

#include <algorithm>
#include <array>

namespace astrolabe::zodiac
{

namespace
{

constexpr std::array<BodyInfo, 25> kBodies = {{
    {"sun",         "Sun",         BodyCategory::Luminary},
    {"moon",        "Moon",        BodyCategory::Luminary},
    {"mercury",     "Mercury",     BodyCategory::Planet},
    {"venus",       "Venus",       BodyCategory::Planet},
    {"mars",        "Mars",        BodyCategory::Planet},
    {"jupiter",     "Jupiter",     BodyCategory::Planet},
    {"saturn",      "Saturn",      BodyCategory::Planet},
    {"uranus",      "Uranus",      BodyCategory::Planet},
    {"neptune",     "Neptune",     BodyCategory::Planet},
    {"pluto",       "Pluto",       BodyCategory::Planet},
    {"north_node",  "North Node",  BodyCategory::Node},
    {"south_node",  "South Node",  BodyCategory::Node},
    {"mean_node",   "Mean Node",   BodyCategory::Node},
    {"chiron",      "Chiron",      BodyCategory::Centaur},
    {"ceres",       "Ceres",       BodyCategory::Asteroid},
    {"pallas",      "Pallas",      BodyCategory::Asteroid},
    {"juno",        "Juno",        BodyCategory::Asteroid},
    {"vesta",       "Vesta",       BodyCategory::Asteroid},
    {"lilith",      "Lilith",      BodyCategory::Calculated},
    {"lilith_true", "True Lilith", BodyCategory::Calculated},
    {"regulus",     "Regulus",     BodyCategory::FixedStar},
    {"spica",       "Spica",       BodyCategory::FixedStar},
    {"algol",       "Algol",       BodyCategory::FixedStar},
    {kAscendantId,  "Ascendant",   BodyCategory::Angle},
    {kMidheavenId,  "Midheaven",   BodyCategory::Angle},
}};

} // anonymous namespace

std::span<const BodyInfo> BodyRegistry::all()
{
    return kBodies;
}

std::optional<BodyInfo> BodyRegistry::find(std::string_view id)
{
    if (core::equals_ignore_case(id, "midheaven"))
    {
        id = kMidheavenId;
    }

    const auto it = std::find_if(kBodies.begin(), kBodies.end(), [id](const BodyInfo& body) {
        return core::equals_ignore_case(body.id, id);
    });

    if (it == kBodies.end())
    {
        return std::nullopt;
    }
    return *it;
}

bool BodyRegistry::is_known(std::string_view id)
{
    return find(id).has_value();
}

bool BodyRegistry::is_angle(std::string_view id)
{
    const auto body = find(id);
    return body && body->category == BodyCategory::Angle;
}

const char* BodyRegistry::category_name(BodyCategory category)
{
    switch (category)
    {
        case BodyCategory::Luminary:   return "luminary";
        case BodyCategory::Planet:     return "planet";
        case BodyCategory::Node:       return "node";
        case BodyCategory::Centaur:    return "centaur";
        case BodyCategory::Asteroid:   return "asteroid";
        case BodyCategory::Calculated: return "calculated";
        case BodyCategory::FixedStar:  return "fixed_star";
        case BodyCategory::Angle:      return "angle";
        default:                       return "unknown";
    }
}

} // namespace astrolabe::zodiac
