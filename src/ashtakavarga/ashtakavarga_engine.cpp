/// @file ashtakavarga_engine.cpp
/// @brief Implementation of Bhinna/Sarva Ashtakavarga and their summaries.

#include "ashtakavarga/ashtakavarga_engine.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <numeric>

namespace astrolabe::ashtakavarga
{

namespace
{

constexpr i32 kSigns = static_cast<i32>(zodiac::kSignCount);

void require_sign(i32 sign, std::string_view what)
{
    if (sign < 0 || sign >= kSigns)
    {
        throw core::InvalidInputError(fmt::format("{}: sign index {} is outside [0, 11]", what, sign));
    }
}

/// Unchecked accumulation; inputs are validated by the public entry points.
BinduVector accumulate_bindus(zodiac::Planet target, const SignPositions& positions, const BeneficRuleTable& rules)
{
    BinduVector bindus{};

    for (const zodiac::ReferencePoint ref : zodiac::kReferencePoints)
    {
        const std::optional<i32>& ref_sign = positions[zodiac::index_of(ref)];
        if (!ref_sign)
        {
            continue;
        }

        for (const u8 house : rules[zodiac::index_of(target)][zodiac::index_of(ref)].view())
        {
            const i32 target_sign = (*ref_sign + house - 1) % kSigns;
            ++bindus[static_cast<std::size_t>(target_sign)];
        }
    }

    return bindus;
}

i32 sum(const BinduVector& bindus)
{
    return std::accumulate(bindus.begin(), bindus.end(), 0);
}

f64 mean(const BinduVector& bindus)
{
    return static_cast<f64>(sum(bindus)) / static_cast<f64>(zodiac::kSignCount);
}

} // anonymous namespace

SignPositions AshtakavargaEngine::sign_positions_from(const chart::ChartPositions& positions)
{
    SignPositions signs{};

    for (const auto& [name, sign] : positions.body_signs())
    {
        if (const auto planet = zodiac::Zodiac::parse_planet(name))
        {
            signs[zodiac::index_of(zodiac::as_reference(*planet))] = sign;
        }
    }

    signs[zodiac::index_of(zodiac::ReferencePoint::Ascendant)] = positions.ascendant_sign();

    return signs;
}

void AshtakavargaEngine::validate(const SignPositions& positions)
{
    for (const zodiac::ReferencePoint ref : zodiac::kReferencePoints)
    {
        if (const auto& sign = positions[zodiac::index_of(ref)])
        {
            require_sign(*sign, zodiac::Zodiac::reference_key(ref));
        }
    }
}

BinduVector AshtakavargaEngine::calculate_bhinna_for_planet(
    zodiac::Planet target,
    const SignPositions& positions,
    const BeneficRuleTable& rules)
{
    validate(positions);
    validate_rule_table(rules);
    return accumulate_bindus(target, positions, rules);
}

BhinnaMap AshtakavargaEngine::calculate_bhinna(const SignPositions& positions, const BeneficRuleTable& rules)
{
    validate(positions);
    validate_rule_table(rules);

    BhinnaMap bhinna{};
    for (const zodiac::Planet planet : zodiac::kPlanets)
    {
        BhinnaAshtakavarga& entry = bhinna[zodiac::index_of(planet)];
        entry.planet          = planet;
        entry.planet_name     = std::string(zodiac::Zodiac::planet_name(planet));
        entry.bindus_by_sign  = accumulate_bindus(planet, positions, rules);
        entry.total           = sum(entry.bindus_by_sign);
        entry.strongest_signs = strongest_signs(entry.bindus_by_sign);
        entry.weakest_signs   = weakest_signs(entry.bindus_by_sign);
    }

    return bhinna;
}

Sarvashtakavarga AshtakavargaEngine::calculate_sarvashtakavarga(const BhinnaMap& bhinna,
                                                                std::optional<f64> threshold)
{
    Sarvashtakavarga sarva;

    for (const BhinnaAshtakavarga& entry : bhinna)
    {
        for (std::size_t sign = 0; sign < zodiac::kSignCount; ++sign)
        {
            sarva.bindus_by_sign[sign] += entry.bindus_by_sign[sign];
        }
    }

    const f64 average = mean(sarva.bindus_by_sign);
    const f64 cut = threshold.value_or(average);

    sarva.total           = sum(sarva.bindus_by_sign);
    sarva.average         = std::round(average * 10.0) / 10.0;
    sarva.strongest_signs = strongest_signs(sarva.bindus_by_sign, cut);
    sarva.weakest_signs   = weakest_signs(sarva.bindus_by_sign, cut);

    return sarva;
}

std::vector<std::string> AshtakavargaEngine::strongest_signs(const BinduVector& bindus,
                                                             std::optional<f64> threshold)
{
    const f64 cut = threshold.value_or(mean(bindus));

    std::vector<std::string> signs;
    for (i32 sign = 0; sign < kSigns; ++sign)
    {
        if (static_cast<f64>(bindus[static_cast<std::size_t>(sign)]) > cut)
        {
            signs.emplace_back(zodiac::Zodiac::sign_name(sign));
        }
    }
    return signs;
}

std::vector<std::string> AshtakavargaEngine::weakest_signs(const BinduVector& bindus,
                                                           std::optional<f64> threshold)
{
    const f64 cut = threshold.value_or(mean(bindus));

    std::vector<std::string> signs;
    for (i32 sign = 0; sign < kSigns; ++sign)
    {
        if (static_cast<f64>(bindus[static_cast<std::size_t>(sign)]) < cut)
        {
            signs.emplace_back(zodiac::Zodiac::sign_name(sign));
        }
    }
    return signs;
}

// -----------------------------------------------------------------
// Transit score: classical Sarvashtakavarga bands
// -----------------------------------------------------------------

TransitScore AshtakavargaEngine::transit_score(const BinduVector& sarva, i32 sign)
{
    require_sign(sign, "transit sign");

    const i32 bindus = sarva[static_cast<std::size_t>(sign)];

    TransitQuality quality = TransitQuality::Difficult;
    const char* description = "Difficult transit, delays and obstacles possible";

    if (bindus >= kExcellentBindus)
    {
        quality = TransitQuality::Excellent;
        description = "Highly favorable transit, expect positive results";
    }
    else if (bindus >= kGoodBindus)
    {
        quality = TransitQuality::Good;
        description = "Favorable transit with good results";
    }
    else if (bindus >= kAverageBindus)
    {
        quality = TransitQuality::Average;
        description = "Mixed results, moderate influence";
    }
    else if (bindus >= kBelowAverageBindus)
    {
        quality = TransitQuality::BelowAverage;
        description = "Challenging transit, exercise caution";
    }

    return TransitScore{
        .sign        = sign,
        .sign_name   = std::string(zodiac::Zodiac::sign_name(sign)),
        .bindus      = bindus,
        .quality     = quality,
        .description = description,
    };
}

std::array<HouseStrengthEntry, zodiac_constants::kHouseCount>
AshtakavargaEngine::house_strength(const BinduVector& sarva, i32 ascendant_sign)
{
    require_sign(ascendant_sign, zodiac::Zodiac::reference_key(zodiac::ReferencePoint::Ascendant));

    std::array<HouseStrengthEntry, zodiac_constants::kHouseCount> houses{};

    for (i32 house = 1; house <= static_cast<i32>(houses.size()); ++house)
    {
        const i32 sign = (ascendant_sign + house - 1) % kSigns;
        const i32 bindus = sarva[static_cast<std::size_t>(sign)];

        HouseStrength strength = HouseStrength::Challenging;
        if (bindus >= kExcellentBindus)
        {
            strength = HouseStrength::Excellent;
        }
        else if (bindus >= kGoodBindus)
        {
            strength = HouseStrength::Good;
        }
        else if (bindus >= kAverageBindus)
        {
            strength = HouseStrength::Average;
        }

        houses[static_cast<std::size_t>(house - 1)] = HouseStrengthEntry{
            .house     = house,
            .sign      = sign,
            .sign_name = std::string(zodiac::Zodiac::sign_name(sign)),
            .bindus    = bindus,
            .strength  = strength,
        };
    }

    return houses;
}

// -----------------------------------------------------------------
// Summary
//
// Planets are ranked by total with a stable descending sort, so the
// strongest is the first planet (in Sun..Saturn order) holding the maximum
// and the weakest is the last planet holding the minimum.
// -----------------------------------------------------------------

AshtakavargaSummary AshtakavargaEngine::summarize(const BhinnaMap& bhinna,
                                                  const Sarvashtakavarga& sarva,
                                                  i32 ascendant_sign)
{
    std::vector<const BhinnaAshtakavarga*> ranked;
    ranked.reserve(bhinna.size());
    for (const BhinnaAshtakavarga& entry : bhinna)
    {
        ranked.push_back(&entry);
    }
    std::stable_sort(ranked.begin(), ranked.end(), [](const auto* a, const auto* b) {
        return a->total > b->total;
    });

    const BinduVector& sav = sarva.bindus_by_sign;
    const auto max_it = std::max_element(sav.begin(), sav.end());
    const auto min_it = std::min_element(sav.begin(), sav.end());
    const auto strongest_sign = static_cast<i32>(std::distance(sav.begin(), max_it));
    const auto weakest_sign = static_cast<i32>(std::distance(sav.begin(), min_it));

    AshtakavargaSummary summary;
    summary.strongest_planet        = ranked.front()->planet_name;
    summary.strongest_planet_bindus = ranked.front()->total;
    summary.weakest_planet          = ranked.back()->planet_name;
    summary.weakest_planet_bindus   = ranked.back()->total;
    summary.strongest_sign          = std::string(zodiac::Zodiac::sign_name(strongest_sign));
    summary.strongest_sign_bindus   = *max_it;
    summary.weakest_sign            = std::string(zodiac::Zodiac::sign_name(weakest_sign));
    summary.weakest_sign_bindus     = *min_it;

    for (i32 sign = 0; sign < kSigns; ++sign)
    {
        if (sav[static_cast<std::size_t>(sign)] >= kGoodBindus)
        {
            summary.transit_favorable_signs.emplace_back(zodiac::Zodiac::sign_name(sign));
        }
    }

    summary.house_strength = house_strength(sav, ascendant_sign);

    return summary;
}

AshtakavargaResult AshtakavargaEngine::calculate(const SignPositions& positions, const BeneficRuleTable& rules)
{
    const auto& ascendant = positions[zodiac::index_of(zodiac::ReferencePoint::Ascendant)];
    if (!ascendant)
    {
        throw core::InvalidInputError("ashtakavarga: ascendant sign is required");
    }

    AshtakavargaResult result;
    result.bhinnashtakavarga = calculate_bhinna(positions, rules);
    result.sarvashtakavarga  = calculate_sarvashtakavarga(result.bhinnashtakavarga);

    result.calculation_info.ascendant_sign = std::string(zodiac::Zodiac::sign_name(*ascendant));
    for (const zodiac::Planet planet : zodiac::kPlanets)
    {
        if (const auto& sign = positions[zodiac::index_of(zodiac::as_reference(planet))])
        {
            result.calculation_info.planet_positions.emplace_back(
                std::string(zodiac::Zodiac::planet_key(planet)),
                std::string(zodiac::Zodiac::sign_name(*sign)));
        }
    }

    result.summary = summarize(result.bhinnashtakavarga, result.sarvashtakavarga, *ascendant);

    ALB_CORE_DEBUG("AshtakavargaEngine: {} bindus total, strongest sign {} ({})",
                   result.sarvashtakavarga.total,
                   result.summary.strongest_sign,
                   result.summary.strongest_sign_bindus);

    return result;
}

const char* AshtakavargaEngine::quality_name(TransitQuality quality)
{
    switch (quality)
    {
        case TransitQuality::Excellent:    return "excellent";
        case TransitQuality::Good:         return "good";
        case TransitQuality::Average:      return "average";
        case TransitQuality::BelowAverage: return "below_average";
        case TransitQuality::Difficult:    return "difficult";
        default:                           return "unknown";
    }
}

const char* AshtakavargaEngine::strength_name(HouseStrength strength)
{
    switch (strength)
    {
        case HouseStrength::Excellent:   return "excellent";
        case HouseStrength::Good:        return "good";
        case HouseStrength::Average:     return "average";
        case HouseStrength::Challenging: return "challenging";
        default:                         return "unknown";
    }
}

} // namespace astrolabe::ashtakavarga
