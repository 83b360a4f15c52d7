#pragma once

/// @file text.hpp
/// @brief Small string helpers shared by name lookups and CSV loaders.

#include "core/types.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>

namespace astrolabe::core
{
    [[nodiscard]] inline bool equals_ignore_case(std::string_view a, std::string_view b)
    {
        return a.size() == b.size()
            && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x))
                       == std::tolower(static_cast<unsigned char>(y));
               });
    }

    [[nodiscard]] inline std::string to_lower(std::string_view sv)
    {
        std::string out(sv);
        std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return out;
    }

    /// @brief Trim leading and trailing whitespace from a string_view.
    [[nodiscard]] inline std::string_view trim(std::string_view sv)
    {
        const auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };

        while (!sv.empty() && is_space(sv.front()))
        {
            sv.remove_prefix(1);
        }
        while (!sv.empty() && is_space(sv.back()))
        {
            sv.remove_suffix(1);
        }
        return sv;
    }

    /// @brief Parse a single f64 value from a trimmed string_view.
    /// @return The parsed value, or std::nullopt if any character is left unconsumed.
    [[nodiscard]] inline std::optional<f64> parse_f64(std::string_view sv)
    {
        if (sv.empty())
        {
            return std::nullopt;
        }

        f64 value = 0.0;
        const auto* begin = sv.data();
        const auto* end = sv.data() + sv.size();
        const auto [ptr, ec] = std::from_chars(begin, end, value);

        if (ec != std::errc{} || ptr != end)
        {
            return std::nullopt;
        }
        return value;
    }

    /// @brief Parse "true"/"false"/"1"/"0"/"yes"/"no" (case-insensitive).
    [[nodiscard]] inline std::optional<bool> parse_bool(std::string_view sv)
    {
        if (equals_ignore_case(sv, "true") || equals_ignore_case(sv, "yes") || sv == "1")
        {
            return true;
        }
        if (equals_ignore_case(sv, "false") || equals_ignore_case(sv, "no") || sv == "0")
        {
            return false;
        }
        return std::nullopt;
    }

} // namespace astrolabe::core
