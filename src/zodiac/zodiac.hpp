#pragma once

/// @file zodiac.hpp
/// @brief Fixed zodiac vocabulary: signs, Ashtakavarga planets, longitude helpers.

#include "core/types.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace astrolabe::zodiac
{
    /// @brief The twelve signs in ecliptic order (index = floor(longitude / 30)).
    enum class Sign : u8
    {
        Aries,
        Taurus,
        Gemini,
        Cancer,
        Leo,
        Virgo,
        Libra,
        Scorpio,
        Sagittarius,
        Capricorn,
        Aquarius,
        Pisces,
    };

    /// @brief The seven classical planets, in Ashtakavarga order.
    enum class Planet : u8
    {
        Sun,
        Moon,
        Mars,
        Mercury,
        Jupiter,
        Venus,
        Saturn,
    };

    /// @brief Points from which Ashtakavarga bindus are counted: the seven planets + Lagna.
    enum class ReferencePoint : u8
    {
        Sun,
        Moon,
        Mars,
        Mercury,
        Jupiter,
        Venus,
        Saturn,
        Ascendant,
    };

    inline constexpr std::size_t kSignCount      = zodiac_constants::kSignCount;
    inline constexpr std::size_t kPlanetCount    = 7;
    inline constexpr std::size_t kReferenceCount = 8;

    inline constexpr std::array<Planet, kPlanetCount> kPlanets = {
        Planet::Sun, Planet::Moon, Planet::Mars, Planet::Mercury,
        Planet::Jupiter, Planet::Venus, Planet::Saturn,
    };

    inline constexpr std::array<ReferencePoint, kReferenceCount> kReferencePoints = {
        ReferencePoint::Sun, ReferencePoint::Moon, ReferencePoint::Mars,
        ReferencePoint::Mercury, ReferencePoint::Jupiter, ReferencePoint::Venus,
        ReferencePoint::Saturn, ReferencePoint::Ascendant,
    };

    [[nodiscard]] constexpr std::size_t index_of(Sign sign) { return static_cast<std::size_t>(sign); }
    [[nodiscard]] constexpr std::size_t index_of(Planet planet) { return static_cast<std::size_t>(planet); }
    [[nodiscard]] constexpr std::size_t index_of(ReferencePoint ref) { return static_cast<std::size_t>(ref); }

    /// @brief Reference point corresponding to a planet (same ordinal).
    [[nodiscard]] constexpr ReferencePoint as_reference(Planet planet)
    {
        return static_cast<ReferencePoint>(static_cast<u8>(planet));
    }

    /// @brief Static helpers for ecliptic longitudes and zodiac names.
    class Zodiac
    {
    public:
        Zodiac() = delete;

        /// @brief Normalize an angle in degrees to [0, 360).
        [[nodiscard]] static f64 normalize_degrees(f64 degrees);

        /// @brief Sign index (0..11) of a longitude already in [0, 360).
        [[nodiscard]] static i32 sign_index(f64 longitude);

        /// @brief Sign containing a longitude already in [0, 360).
        [[nodiscard]] static Sign sign_of(f64 longitude);

        /// @brief Degrees elapsed within the sign, in [0, 30).
        [[nodiscard]] static f64 degree_in_sign(f64 longitude);

        /// @brief Sign holding the given index (taken modulo 12).
        [[nodiscard]] static Sign sign_from_index(i32 index);

        /// @brief "Aries" .. "Pisces".
        [[nodiscard]] static std::string_view sign_name(Sign sign);

        /// @brief Sign name for a raw index; the index is taken modulo 12.
        [[nodiscard]] static std::string_view sign_name(i32 index);

        /// @brief Display name, e.g. "Jupiter".
        [[nodiscard]] static std::string_view planet_name(Planet planet);

        /// @brief Lower-case key used in chart input, e.g. "jupiter".
        [[nodiscard]] static std::string_view planet_key(Planet planet);

        /// @brief Key of a reference point ("ascendant" for the Lagna).
        [[nodiscard]] static std::string_view reference_key(ReferencePoint ref);

        /// @brief Case-insensitive lookup of a planet by its key.
        [[nodiscard]] static std::optional<Planet> parse_planet(std::string_view key);

        /// @brief Format a longitude as whole degrees and minutes within its sign,
        /// e.g. 15.5 -> "15°30' Aries". Minutes are truncated, not rounded.
        [[nodiscard]] static std::string format_degree(f64 longitude);
    };

} // namespace astrolabe::zodiac
