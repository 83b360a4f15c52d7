#pragma once

/// @file positions_loader.hpp
/// @brief Loads position-provider output (longitudes per chart point) from CSV.

#include "chart/chart_positions.hpp"

#include <filesystem>
#include <optional>

namespace astrolabe::chart
{
    /// @brief Static utility class for reading chart positions.
    class PositionsLoader
    {
    public:
        PositionsLoader() = delete;

        /// @brief Load one chart's positions from a CSV file.
        ///
        /// Expected CSV columns (header row required):
        ///   Name, Longitude[, Retrograde[, Speed]]
        ///
        /// Longitude and Speed are in degrees (per day for Speed). An empty
        /// Longitude records the point as present but without position data.
        /// Rows named "ascendant" and "mc" (or "midheaven") set the chart
        /// angles. Names and ranges are not checked here; that is left to
        /// ChartPositions::validate().
        ///
        /// @param path Path to the CSV file.
        /// @return The positions, or std::nullopt if the file can't be read or a row can't be parsed.
        [[nodiscard]] static std::optional<ChartPositions> load_csv(const std::filesystem::path& path);
    };

} // namespace astrolabe::chart
