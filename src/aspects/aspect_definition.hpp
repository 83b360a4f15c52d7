#pragma once

/// @file aspect_definition.hpp
/// @brief Aspect vocabulary, built-in angle/orb tables and caller configuration.

#include "core/types.hpp"

#include <array>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace astrolabe::aspects
{
    enum class AspectType : u8
    {
        // Major
        Conjunction,
        Opposition,
        Trine,
        Square,
        Sextile,
        // Minor
        SemiSextile,
        SemiSquare,
        SesquiSquare,
        Quincunx,
        Quintile,
        BiQuintile,
    };

    /// @brief One entry of an aspect table.
    struct AspectDefinition
    {
        AspectType type;
        f64        angle;  ///< Exact angle [degrees, 0..180]
        f64        orb;    ///< Allowed deviation from the exact angle [degrees]
    };

    /// @brief Replacement orb for one aspect type.
    struct OrbOverride
    {
        AspectType type;
        f64        orb;
    };

    /// @brief Selects which built-in aspects are active and how wide their orbs are.
    struct AspectConfig
    {
        bool include_minor = false;
        /// Overrides for aspects outside the active set are ignored.
        std::vector<OrbOverride> orb_overrides;
    };

    inline constexpr std::array<AspectDefinition, 5> kMajorAspects = {{
        {AspectType::Conjunction,   0.0, 10.0},
        {AspectType::Opposition,  180.0, 10.0},
        {AspectType::Trine,       120.0,  8.0},
        {AspectType::Square,       90.0,  8.0},
        {AspectType::Sextile,      60.0,  6.0},
    }};

    inline constexpr std::array<AspectDefinition, 6> kMinorAspects = {{
        {AspectType::SemiSextile,   30.0, 2.0},
        {AspectType::SemiSquare,    45.0, 2.0},
        {AspectType::SesquiSquare, 135.0, 2.0},
        {AspectType::Quincunx,     150.0, 3.0},
        {AspectType::Quintile,      72.0, 2.0},
        {AspectType::BiQuintile,   144.0, 2.0},
    }};

    /// @brief Static helpers over aspect tables.
    class AspectTable
    {
    public:
        AspectTable() = delete;

        /// @brief Active aspect set for a configuration: majors, then minors if
        /// requested, with orb overrides applied.
        /// @throws core::InvalidInputError if an override orb is negative or not finite.
        [[nodiscard]] static std::vector<AspectDefinition> build(const AspectConfig& config);

        /// @brief Reject a table with an angle outside [0, 180], a negative or
        /// non-finite orb, or the same aspect type listed twice.
        /// @throws core::InvalidInputError
        static void validate(std::span<const AspectDefinition> table);

        /// @brief Snake-case key, e.g. "semi_sextile".
        [[nodiscard]] static std::string_view name(AspectType type);

        /// @brief Case-insensitive lookup; '-' and ' ' are accepted in place of '_'.
        [[nodiscard]] static std::optional<AspectType> parse(std::string_view name);

        [[nodiscard]] static bool is_major(AspectType type);
    };

} // namespace astrolabe::aspects
