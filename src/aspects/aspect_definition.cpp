/// @file aspect_definition.cpp
/// @brief Aspect tables and configuration.

#include "aspects/aspect_definition.hpp"

#include "core/error.hpp"
#include "core/text.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <string>

namespace astrolabe::aspects
{

namespace
{

constexpr std::array<std::string_view, 11> kAspectNames = {
    "conjunction", "opposition", "trine", "square", "sextile",
    "semi_sextile", "semi_square", "sesqui_square", "quincunx", "quintile", "bi_quintile",
};

void require_orb(f64 orb, AspectType type)
{
    if (!std::isfinite(orb) || orb < 0.0)
    {
        throw core::InvalidInputError(
            fmt::format("aspect '{}': orb {} must be a non-negative number",
                        AspectTable::name(type), orb));
    }
}

} // anonymous namespace

std::vector<AspectDefinition> AspectTable::build(const AspectConfig& config)
{
    std::vector<AspectDefinition> table(kMajorAspects.begin(), kMajorAspects.end());
    if (config.include_minor)
    {
        table.insert(table.end(), kMinorAspects.begin(), kMinorAspects.end());
    }

    for (const OrbOverride& entry : config.orb_overrides)
    {
        require_orb(entry.orb, entry.type);

        auto it = std::find_if(table.begin(), table.end(), [&](const AspectDefinition& def) {
            return def.type == entry.type;
        });
        if (it != table.end())
        {
            it->orb = entry.orb;
        }
    }

    return table;
}

void AspectTable::validate(std::span<const AspectDefinition> table)
{
    std::array<bool, kAspectNames.size()> seen{};

    for (const AspectDefinition& def : table)
    {
        const auto index = static_cast<std::size_t>(def.type);
        if (index >= kAspectNames.size())
        {
            throw core::InvalidInputError(fmt::format("aspect table: unknown aspect type {}", index));
        }
        if (!std::isfinite(def.angle) || def.angle < 0.0 || def.angle > zodiac_constants::kHalfCircle)
        {
            throw core::InvalidInputError(
                fmt::format("aspect '{}': angle {} is outside [0, 180]", name(def.type), def.angle));
        }
        require_orb(def.orb, def.type);

        if (seen[index])
        {
            throw core::InvalidInputError(
                fmt::format("aspect table lists '{}' more than once", name(def.type)));
        }
        seen[index] = true;
    }
}

std::string_view AspectTable::name(AspectType type)
{
    const auto index = static_cast<std::size_t>(type);
    return index < kAspectNames.size() ? kAspectNames[index] : std::string_view("unknown");
}

std::optional<AspectType> AspectTable::parse(std::string_view name)
{
    std::string key = core::to_lower(core::trim(name));
    std::replace(key.begin(), key.end(), '-', '_');
    std::replace(key.begin(), key.end(), ' ', '_');

    for (std::size_t i = 0; i < kAspectNames.size(); ++i)
    {
        if (key == kAspectNames[i])
        {
            return static_cast<AspectType>(i);
        }
    }
    return std::nullopt;
}

bool AspectTable::is_major(AspectType type)
{
    return std::any_of(kMajorAspects.begin(), kMajorAspects.end(), [type](const AspectDefinition& def) {
        return def.type == type;
    });
}

} // namespace astrolabe::aspects
