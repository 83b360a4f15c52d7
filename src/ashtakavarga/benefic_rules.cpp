/// @file benefic_rules.cpp
/// @brief Structural checks for benefic rule tables.

#include "ashtakavarga/benefic_rules.hpp"

#include "core/error.hpp"

#include <spdlog/fmt/fmt.h>

namespace astrolabe::ashtakavarga
{

void validate_rule_table(const BeneficRuleTable& table)
{
    for (const zodiac::Planet target : zodiac::kPlanets)
    {
        for (const zodiac::ReferencePoint ref : zodiac::kReferencePoints)
        {
            const BeneficHouses& cell = table[zodiac::index_of(target)][zodiac::index_of(ref)];
            std::array<bool, zodiac::kSignCount> seen{};

            if (cell.count > cell.houses.size())
            {
                throw core::InvalidInputError(fmt::format(
                    "rule table: {} from {} lists {} houses",
                    zodiac::Zodiac::planet_key(target), zodiac::Zodiac::reference_key(ref), cell.count));
            }

            for (const u8 house : cell.view())
            {
                if (house < 1 || house > zodiac::kSignCount)
                {
                    throw core::InvalidInputError(fmt::format(
                        "rule table: {} from {} has house {} outside 1..12",
                        zodiac::Zodiac::planet_key(target), zodiac::Zodiac::reference_key(ref), house));
                }
                if (seen[house - 1])
                {
                    throw core::InvalidInputError(fmt::format(
                        "rule table: {} from {} lists house {} twice",
                        zodiac::Zodiac::planet_key(target), zodiac::Zodiac::reference_key(ref), house));
                }
                seen[house - 1] = true;
            }
        }
    }
}

} // namespace astrolabe::ashtakavarga
