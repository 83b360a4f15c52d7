/// @file pattern_recognizer.cpp
/// @brief Implementation of aspect pattern detection.

#include "patterns/pattern_recognizer.hpp"

#include "core/error.hpp"
#include "core/logger.hpp"
#include "zodiac/zodiac.hpp"

#include <spdlog/fmt/fmt.h>
#include <spdlog/fmt/ranges.h>

#include <algorithm>
#include <array>
#include <iterator>
#include <set>

namespace astrolabe::patterns
{

namespace
{

using PairKey = std::pair<std::string, std::string>;

/// Unordered pair key: the two names in lexicographic order.
PairKey pair_key(const std::string& a, const std::string& b)
{
    return (a < b) ? PairKey{a, b} : PairKey{b, a};
}

/// Unordered pairs linked by the given aspect type.
std::set<PairKey> pairs_of_type(std::span<const aspects::Aspect> aspects, aspects::AspectType type)
{
    std::set<PairKey> pairs;
    for (const aspects::Aspect& aspect : aspects)
    {
        if (aspect.type == type)
        {
            pairs.insert(pair_key(aspect.point1, aspect.point2));
        }
    }
    return pairs;
}

/// Sorted participant list identifying an unordered point set.
std::vector<std::string> canonical_key(std::vector<std::string> points)
{
    std::sort(points.begin(), points.end());
    return points;
}

} // anonymous namespace

// -----------------------------------------------------------------
// Grand Trine
// -----------------------------------------------------------------

std::vector<Pattern> PatternRecognizer::detect_grand_trines(std::span<const aspects::Aspect> aspects)
{
    std::vector<Pattern> patterns;

    const std::set<PairKey> trines = pairs_of_type(aspects, aspects::AspectType::Trine);

    std::vector<std::string> pool;
    for (const aspects::Aspect& aspect : aspects)
    {
        if (aspect.type != aspects::AspectType::Trine)
        {
            continue;
        }
        for (const std::string* name : {&aspect.point1, &aspect.point2})
        {
            if (std::find(pool.begin(), pool.end(), *name) == pool.end())
            {
                pool.push_back(*name);
            }
        }
    }

    const auto in_trine = [&trines](const std::string& a, const std::string& b) {
        return trines.contains(pair_key(a, b));
    };

    for (std::size_t i = 0; i < pool.size(); ++i)
    {
        for (std::size_t j = i + 1; j < pool.size(); ++j)
        {
            if (!in_trine(pool[i], pool[j]))
            {
                continue;
            }
            for (std::size_t k = j + 1; k < pool.size(); ++k)
            {
                if (in_trine(pool[j], pool[k]) && in_trine(pool[i], pool[k]))
                {
                    std::vector<std::string> points{pool[i], pool[j], pool[k]};
                    std::string description = fmt::format("Grand Trine: {}", fmt::join(points, ", "));

                    patterns.push_back(Pattern{
                        .type        = PatternType::GrandTrine,
                        .points      = std::move(points),
                        .description = std::move(description),
                    });
                }
            }
        }
    }

    return patterns;
}

// -----------------------------------------------------------------
// T-Square
//
// For each opposition (p1, p2), every square touching one end proposes
// its other point as apex; the apex must also square the other end.
// -----------------------------------------------------------------

std::vector<Pattern> PatternRecognizer::detect_t_squares(std::span<const aspects::Aspect> aspects)
{
    std::vector<Pattern> patterns;
    std::set<std::vector<std::string>> emitted;

    const std::set<PairKey> squares = pairs_of_type(aspects, aspects::AspectType::Square);

    for (const aspects::Aspect& opposition : aspects)
    {
        if (opposition.type != aspects::AspectType::Opposition)
        {
            continue;
        }

        const std::string& p1 = opposition.point1;
        const std::string& p2 = opposition.point2;

        for (const aspects::Aspect& square : aspects)
        {
            if (square.type != aspects::AspectType::Square)
            {
                continue;
            }

            const std::string* apex = nullptr;
            const std::string* other_end = nullptr;

            if (square.point1 == p1 || square.point2 == p1)
            {
                apex = (square.point1 == p1) ? &square.point2 : &square.point1;
                other_end = &p2;
            }
            else if (square.point1 == p2 || square.point2 == p2)
            {
                apex = (square.point1 == p2) ? &square.point2 : &square.point1;
                other_end = &p1;
            }

            if (apex == nullptr || *apex == p1 || *apex == p2)
            {
                continue;
            }
            if (!squares.contains(pair_key(*apex, *other_end)))
            {
                continue;
            }

            std::vector<std::string> points{p1, p2, *apex};
            if (!emitted.insert(canonical_key(points)).second)
            {
                continue;
            }

            patterns.push_back(Pattern{
                .type        = PatternType::TSquare,
                .points      = std::move(points),
                .apex        = *apex,
                .description = fmt::format("T-Square with apex at {}", *apex),
            });
        }
    }

    return patterns;
}

std::vector<Pattern> PatternRecognizer::detect_grand_crosses(std::span<const aspects::Aspect> /*aspects*/)
{
    return {};
}

std::vector<Pattern> PatternRecognizer::detect_yods(std::span<const aspects::Aspect> /*aspects*/)
{
    return {};
}

// -----------------------------------------------------------------
// Stellium
// -----------------------------------------------------------------

std::vector<Pattern> PatternRecognizer::detect_stelliums(std::span<const SignPlacement> placements)
{
    constexpr std::size_t kMinimumMembers = 3;

    std::array<std::vector<std::string>, zodiac::kSignCount> by_sign;
    for (const auto& [name, sign] : placements)
    {
        if (sign < 0 || sign >= static_cast<i32>(zodiac::kSignCount))
        {
            throw core::InvalidInputError(
                fmt::format("Sign index for '{}' must be 0..11, got {}", name, sign));
        }
        by_sign[static_cast<std::size_t>(sign)].push_back(name);
    }

    std::vector<Pattern> patterns;
    for (std::size_t sign = 0; sign < by_sign.size(); ++sign)
    {
        std::vector<std::string>& members = by_sign[sign];
        if (members.size() < kMinimumMembers)
        {
            continue;
        }

        const std::string sign_name(zodiac::Zodiac::sign_name(static_cast<i32>(sign)));
        std::string description = fmt::format("Stellium in {}: {}", sign_name, fmt::join(members, ", "));

        patterns.push_back(Pattern{
            .type        = PatternType::Stellium,
            .points      = std::move(members),
            .sign        = static_cast<i32>(sign),
            .sign_name   = sign_name,
            .description = std::move(description),
        });
    }

    return patterns;
}

std::vector<Pattern> PatternRecognizer::detect_all(
    std::span<const aspects::Aspect> aspects,
    std::span<const SignPlacement> placements)
{
    std::vector<Pattern> patterns = detect_grand_trines(aspects);

    const auto append = [&patterns](std::vector<Pattern> found) {
        patterns.insert(patterns.end(),
                        std::make_move_iterator(found.begin()),
                        std::make_move_iterator(found.end()));
    };

    append(detect_t_squares(aspects));
    append(detect_grand_crosses(aspects));
    append(detect_yods(aspects));
    append(detect_stelliums(placements));

    ALB_CORE_DEBUG("PatternRecognizer: {} patterns from {} aspects", patterns.size(), aspects.size());

    return patterns;
}

const char* PatternRecognizer::type_name(PatternType type)
{
    switch (type)
    {
        case PatternType::GrandTrine: return "grand_trine";
        case PatternType::TSquare:    return "t_square";
        case PatternType::Stellium:   return "stellium";
        case PatternType::GrandCross: return "grand_cross";
        case PatternType::Yod:        return "yod";
        default:                      return "unknown";
    }
}

} // namespace astrolabe::patterns
