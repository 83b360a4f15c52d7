#pragma once

/// @file benefic_rules.hpp
/// @brief Classical Ashtakavarga benefic-place table, fixed at compile time.
///
/// For each target planet and each of the eight reference points (seven
/// planets + ascendant), the table lists the houses counted from the reference
/// point's sign that award the target planet one bindu.

#include "core/types.hpp"
#include "zodiac/zodiac.hpp"

#include <array>
#include <initializer_list>
#include <span>

namespace astrolabe::ashtakavarga
{
    /// @brief Houses (1..12) counted from a reference point that award a bindu.
    struct BeneficHouses
    {
        std::array<u8, zodiac::kSignCount> houses{};
        std::size_t count = 0;

        constexpr BeneficHouses() = default;

        constexpr BeneficHouses(std::initializer_list<u8> list)
        {
            for (const u8 house : list)
            {
                houses[count++] = house;
            }
        }

        [[nodiscard]] constexpr std::span<const u8> view() const
        {
            return {houses.data(), count};
        }
    };

    /// @brief table[target planet][reference point]
    using BeneficRuleTable =
        std::array<std::array<BeneficHouses, zodiac::kReferenceCount>, zodiac::kPlanetCount>;

    // Reference point order in every row:
    //   Sun, Moon, Mars, Mercury, Jupiter, Venus, Saturn, Ascendant
    inline constexpr BeneficRuleTable kBeneficRules = {{
        // Sun
        {{
            {1, 2, 4, 7, 8, 9, 10, 11},
            {3, 6, 10, 11},
            {1, 2, 4, 7, 8, 9, 10, 11},
            {3, 5, 6, 9, 10, 11, 12},
            {5, 6, 9, 11},
            {6, 7, 12},
            {1, 2, 4, 7, 8, 9, 10, 11},
            {3, 4, 6, 10, 11, 12},
        }},
        // Moon
        {{
            {3, 6, 7, 8, 10, 11},
            {1, 3, 6, 7, 10, 11},
            {2, 3, 5, 6, 9, 10, 11},
            {1, 3, 4, 5, 7, 8, 10, 11},
            {1, 4, 7, 8, 10, 11, 12},
            {3, 4, 5, 7, 9, 10, 11},
            {3, 5, 6, 11},
            {3, 6, 10, 11},
        }},
        // Mars
        {{
            {3, 5, 6, 10, 11},
            {3, 6, 11},
            {1, 2, 4, 7, 8, 10, 11},
            {3, 5, 6, 11},
            {6, 10, 11, 12},
            {6, 8, 11, 12},
            {1, 4, 7, 8, 9, 10, 11},
            {1, 3, 6, 10, 11},
        }},
        // Mercury
        {{
            {5, 6, 9, 11, 12},
            {2, 4, 6, 8, 10, 11},
            {1, 2, 4, 7, 8, 9, 10, 11},
            {1, 3, 5, 6, 9, 10, 11, 12},
            {6, 8, 11, 12},
            {1, 2, 3, 4, 5, 8, 9, 11},
            {1, 2, 4, 7, 8, 9, 10, 11},
            {1, 2, 4, 6, 8, 10, 11},
        }},
        // Jupiter
        {{
            {1, 2, 3, 4, 7, 8, 9, 10, 11},
            {2, 5, 7, 9, 11},
            {1, 2, 4, 7, 8, 10, 11},
            {1, 2, 4, 5, 6, 9, 10, 11},
            {1, 2, 3, 4, 7, 8, 10, 11},
            {2, 5, 6, 9, 10, 11},
            {3, 5, 6, 12},
            {1, 2, 4, 5, 6, 7, 9, 10, 11},
        }},
        // Venus
        {{
            {8, 11, 12},
            {1, 2, 3, 4, 5, 8, 9, 11, 12},
            {3, 5, 6, 9, 11, 12},
            {3, 5, 6, 9, 11},
            {5, 8, 9, 10, 11},
            {1, 2, 3, 4, 5, 8, 9, 10, 11},
            {3, 4, 5, 8, 9, 10, 11},
            {1, 2, 3, 4, 5, 8, 9, 11},
        }},
        // Saturn
        {{
            {1, 2, 4, 7, 8, 10, 11},
            {3, 6, 11},
            {3, 5, 6, 10, 11, 12},
            {6, 8, 9, 10, 11, 12},
            {5, 6, 11, 12},
            {6, 11, 12},
            {3, 5, 6, 11},
            {1, 3, 4, 6, 10, 11},
        }},
    }};

    /// @brief Number of bindus a target planet can receive with every reference known.
    [[nodiscard]] constexpr std::size_t planet_rule_count(const BeneficRuleTable& table,
                                                          zodiac::Planet planet)
    {
        std::size_t total = 0;
        for (const BeneficHouses& houses : table[zodiac::index_of(planet)])
        {
            total += houses.count;
        }
        return total;
    }

    /// @brief Total bindus across all target planets with complete input.
    [[nodiscard]] constexpr std::size_t total_rule_count(const BeneficRuleTable& table)
    {
        std::size_t total = 0;
        for (const zodiac::Planet planet : zodiac::kPlanets)
        {
            total += planet_rule_count(table, planet);
        }
        return total;
    }

    /// @brief Classical Sarvashtakavarga total.
    inline constexpr std::size_t kClassicalBinduTotal = 337;

    static_assert(total_rule_count(kBeneficRules) == kClassicalBinduTotal,
                  "benefic rule table must sum to the classical 337 bindus");

    /// @brief Reject a table with a house outside 1..12 or a house listed twice
    /// for the same (target, reference) cell.
    /// @throws core::InvalidInputError
    void validate_rule_table(const BeneficRuleTable& table);

} // namespace astrolabe::ashtakavarga
