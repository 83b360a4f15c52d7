#pragma once

/// @file body_registry.hpp
/// @brief Registry of chart point identifiers accepted from the position provider.

#include "core/types.hpp"

#include <optional>
#include <span>
#include <string_view>

namespace astrolabe::zodiac
{
    enum class BodyCategory : u8
    {
        Luminary,
        Planet,
        Node,
        Centaur,
        Asteroid,
        Calculated,
        FixedStar,
        Angle,
    };

    /// @brief A known chart point: provider id plus display name.
    struct BodyInfo
    {
        std::string_view id;            ///< Lower-case key, e.g. "north_node"
        std::string_view display_name;  ///< e.g. "North Node"
        BodyCategory     category;
    };

    /// @brief Identifiers used for the two chart angles.
    inline constexpr std::string_view kAscendantId = "ascendant";
    inline constexpr std::string_view kMidheavenId = "mc";

    /// @brief Static lookup over the fixed vocabulary of chart points.
    class BodyRegistry
    {
    public:
        BodyRegistry() = delete;

        /// @brief All registered points, bodies first, angles last.
        [[nodiscard]] static std::span<const BodyInfo> all();

        /// @brief Find a point by id. Lookup is case-insensitive;
        /// "midheaven" is accepted as an alias of "mc".
        [[nodiscard]] static std::optional<BodyInfo> find(std::string_view id);

        [[nodiscard]] static bool is_known(std::string_view id);

        /// @brief True for the chart angles (ascendant, mc).
        [[nodiscard]] static bool is_angle(std::string_view id);

        [[nodiscard]] static const char* category_name(BodyCategory category);
    };

} // namespace astrolabe::zodiac
