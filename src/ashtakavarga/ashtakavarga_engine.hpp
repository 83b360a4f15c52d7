#pragma once

/// @file ashtakavarga_engine.hpp
/// @brief Table-driven Ashtakavarga scoring of the twelve signs.

#include "ashtakavarga/benefic_rules.hpp"
#include "chart/chart_positions.hpp"
#include "core/types.hpp"
#include "zodiac/zodiac.hpp"

#include <array>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace astrolabe::ashtakavarga
{
    /// @brief Bindus per sign, indexed by sign (0 = Aries).
    using BinduVector = std::array<i32, zodiac::kSignCount>;

    /// @brief Sign index of each reference point, indexed by ReferencePoint.
    /// An empty entry means the position is unknown.
    using SignPositions = std::array<std::optional<i32>, zodiac::kReferenceCount>;

    /// @brief One planet's distribution (Bhinnashtakavarga).
    struct BhinnaAshtakavarga
    {
        zodiac::Planet           planet;
        std::string              planet_name;
        BinduVector              bindus_by_sign{};
        i32                      total{0};
        std::vector<std::string> strongest_signs;
        std::vector<std::string> weakest_signs;
    };

    using BhinnaMap = std::array<BhinnaAshtakavarga, zodiac::kPlanetCount>;

    /// @brief Combined distribution (Sarvashtakavarga).
    struct Sarvashtakavarga
    {
        BinduVector              bindus_by_sign{};
        i32                      total{0};
        f64                      average{0.0};  ///< Rounded to one decimal
        std::vector<std::string> strongest_signs;
        std::vector<std::string> weakest_signs;
    };

    enum class TransitQuality : u8
    {
        Excellent,
        Good,
        Average,
        BelowAverage,
        Difficult,
    };

    struct TransitScore
    {
        i32            sign;
        std::string    sign_name;
        i32            bindus;
        TransitQuality quality;
        std::string    description;
    };

    enum class HouseStrength : u8
    {
        Excellent,
        Good,
        Average,
        Challenging,
    };

    struct HouseStrengthEntry
    {
        i32           house;     ///< 1..12
        i32           sign;      ///< (ascendant sign + house - 1) mod 12
        std::string   sign_name;
        i32           bindus;
        HouseStrength strength;
    };

    struct AshtakavargaSummary
    {
        std::string strongest_planet;
        i32         strongest_planet_bindus{0};
        std::string weakest_planet;
        i32         weakest_planet_bindus{0};
        std::string strongest_sign;
        i32         strongest_sign_bindus{0};
        std::string weakest_sign;
        i32         weakest_sign_bindus{0};
        std::vector<std::string> transit_favorable_signs;
        std::array<HouseStrengthEntry, zodiac_constants::kHouseCount> house_strength{};
    };

    /// @brief Sign names of the inputs the result was computed from.
    struct CalculationInfo
    {
        std::string ascendant_sign;
        /// (planet key, sign name) for each planet with a known sign
        std::vector<std::pair<std::string, std::string>> planet_positions;
    };

    struct AshtakavargaResult
    {
        BhinnaMap           bhinnashtakavarga;
        Sarvashtakavarga    sarvashtakavarga;
        CalculationInfo     calculation_info;
        AshtakavargaSummary summary;
    };

    /// @brief Stateless Ashtakavarga computation.
    ///
    /// Bindu accumulation is purely additive: every (target, reference, house)
    /// triple with a known reference sign adds exactly one bindu to exactly
    /// one sign. Unknown references contribute nothing.
    class AshtakavargaEngine
    {
    public:
        AshtakavargaEngine() = delete;

        // Sarvashtakavarga bands used for transit and house classification
        static constexpr i32 kExcellentBindus    = 30;
        static constexpr i32 kGoodBindus         = 28;
        static constexpr i32 kAverageBindus      = 25;
        static constexpr i32 kBelowAverageBindus = 22;

        /// @brief Sign positions of the seven planets and the ascendant taken
        /// from chart input. Bodies other than the seven planets are ignored.
        [[nodiscard]] static SignPositions sign_positions_from(const chart::ChartPositions& positions);

        /// @brief Reject sign indices outside 0..11.
        /// @throws core::InvalidInputError
        static void validate(const SignPositions& positions);

        /// @brief Bindus one target planet receives in each sign.
        ///
        /// For each reference with a known sign and each listed house h:
        ///   bindus[(reference sign + h - 1) mod 12] += 1
        [[nodiscard]] static BinduVector calculate_bhinna_for_planet(
            zodiac::Planet target,
            const SignPositions& positions,
            const BeneficRuleTable& rules = kBeneficRules);

        /// @brief Bhinnashtakavarga for all seven planets.
        /// @throws core::InvalidInputError if positions or rules are malformed.
        [[nodiscard]] static BhinnaMap calculate_bhinna(
            const SignPositions& positions,
            const BeneficRuleTable& rules = kBeneficRules);

        /// @brief Elementwise sum of the seven Bhinna vectors.
        ///
        /// Strongest/weakest signs use @p threshold when given, the mean otherwise.
        [[nodiscard]] static Sarvashtakavarga calculate_sarvashtakavarga(
            const BhinnaMap& bhinna,
            std::optional<f64> threshold = std::nullopt);

        /// @brief Names of signs strictly above the threshold (mean when omitted).
        [[nodiscard]] static std::vector<std::string> strongest_signs(
            const BinduVector& bindus, std::optional<f64> threshold = std::nullopt);

        /// @brief Names of signs strictly below the threshold (mean when omitted).
        [[nodiscard]] static std::vector<std::string> weakest_signs(
            const BinduVector& bindus, std::optional<f64> threshold = std::nullopt);

        /// @brief Quality of a transit through @p sign from its Sarvashtakavarga bindus.
        ///
        /// >= 30 excellent, >= 28 good, >= 25 average, >= 22 below average,
        /// otherwise difficult.
        /// @throws core::InvalidInputError if sign is outside 0..11.
        [[nodiscard]] static TransitScore transit_score(const BinduVector& sarva, i32 sign);

        /// @brief Strength of houses 1..12 counted from the ascendant sign.
        /// @throws core::InvalidInputError if ascendant_sign is outside 0..11.
        [[nodiscard]] static std::array<HouseStrengthEntry, zodiac_constants::kHouseCount>
            house_strength(const BinduVector& sarva, i32 ascendant_sign);

        [[nodiscard]] static AshtakavargaSummary summarize(
            const BhinnaMap& bhinna, const Sarvashtakavarga& sarva, i32 ascendant_sign);

        /// @brief Complete Ashtakavarga: Bhinna, Sarva, calculation info and summary.
        /// @throws core::InvalidInputError if the ascendant sign is unknown or any
        /// input is malformed.
        [[nodiscard]] static AshtakavargaResult calculate(
            const SignPositions& positions,
            const BeneficRuleTable& rules = kBeneficRules);

        [[nodiscard]] static const char* quality_name(TransitQuality quality);
        [[nodiscard]] static const char* strength_name(HouseStrength strength);
    };

} // namespace astrolabe::ashtakavarga
