#pragma once

/// @file aspect_table_loader.hpp
/// @brief Loads a caller-supplied aspect table (angles and orbs) from CSV.

#include "aspects/aspect_definition.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace astrolabe::aspects
{
    /// @brief Static utility class for reading aspect tables.
    class AspectTableLoader
    {
    public:
        AspectTableLoader() = delete;

        /// @brief Load an aspect table from a CSV file.
        ///
        /// Expected CSV columns (header row required):
        ///   Name, Angle, Orb
        ///
        /// Name is an aspect key such as "trine" or "semi_sextile"; Angle and
        /// Orb are in degrees. Blank lines and lines starting with '#' are
        /// ignored. Any unreadable row rejects the whole file. Range checks
        /// are left to AspectTable::validate().
        ///
        /// @param path Path to the CSV file.
        /// @return The table in file order, or std::nullopt on failure.
        [[nodiscard]] static std::optional<std::vector<AspectDefinition>>
            load_csv(const std::filesystem::path& path);
    };

} // namespace astrolabe::aspects
