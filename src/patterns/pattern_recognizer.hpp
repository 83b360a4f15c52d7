#pragma once

/// @file pattern_recognizer.hpp
/// @brief Multi-point aspect configurations: Grand Trine, T-Square, Stellium.

#include "aspects/aspect_detector.hpp"
#include "core/types.hpp"

#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace astrolabe::patterns
{
    enum class PatternType : u8
    {
        GrandTrine,
        TSquare,
        Stellium,
        GrandCross,  ///< Recognized as a type; detection returns nothing
        Yod,         ///< Recognized as a type; detection returns nothing
    };

    /// @brief A detected configuration of three or more chart points.
    struct Pattern
    {
        PatternType                type;
        std::vector<std::string>   points;      ///< Participants
        std::optional<std::string> apex;        ///< T-Square focal point
        std::optional<i32>         sign;        ///< Stellium sign index
        std::optional<std::string> sign_name;   ///< Stellium sign name
        std::string                description;
    };

    /// @brief (point name, sign index) pairs used for sign-based grouping.
    using SignPlacement = std::pair<std::string, i32>;

    /// @brief Stateless pattern search over a detected aspect set.
    ///
    /// Each detector returns an empty vector when nothing qualifies, and never
    /// reports the same unordered set of participants twice.
    class PatternRecognizer
    {
    public:
        PatternRecognizer() = delete;

        /// @brief Every triple of points mutually in trine.
        ///
        /// Candidates are the points appearing in any trine, in order of first
        /// appearance; each unordered triple is checked once.
        [[nodiscard]] static std::vector<Pattern> detect_grand_trines(
            std::span<const aspects::Aspect> aspects);

        /// @brief Oppositions whose two ends are both square to a third point (the apex).
        [[nodiscard]] static std::vector<Pattern> detect_t_squares(
            std::span<const aspects::Aspect> aspects);

        /// @brief Not detected yet: always returns an empty vector.
        [[nodiscard]] static std::vector<Pattern> detect_grand_crosses(
            std::span<const aspects::Aspect> aspects);

        /// @brief Not detected yet: always returns an empty vector.
        [[nodiscard]] static std::vector<Pattern> detect_yods(
            std::span<const aspects::Aspect> aspects);

        /// @brief One pattern per sign holding three or more points, signs in zodiac order.
        /// @throws core::InvalidInputError if a sign index lies outside 0..11.
        [[nodiscard]] static std::vector<Pattern> detect_stelliums(
            std::span<const SignPlacement> placements);

        /// @brief Grand trines, T-squares, grand crosses, yods, then stelliums.
        /// @throws core::InvalidInputError as detect_stelliums does.
        [[nodiscard]] static std::vector<Pattern> detect_all(
            std::span<const aspects::Aspect> aspects,
            std::span<const SignPlacement> placements);

        /// @brief "grand_trine", "t_square", "stellium", "grand_cross", "yod".
        [[nodiscard]] static const char* type_name(PatternType type);
    };

} // namespace astrolabe::patterns
