#pragma once

/// @file chart_analyzer.hpp
/// @brief One-call chart synthesis: aspects, patterns and Ashtakavarga.

#include "ashtakavarga/ashtakavarga_engine.hpp"
#include "aspects/aspect_definition.hpp"
#include "aspects/aspect_detector.hpp"
#include "chart/chart_positions.hpp"
#include "patterns/pattern_recognizer.hpp"

#include <optional>
#include <vector>

namespace astrolabe::analysis
{
    /// @brief Caller-overridable analysis settings.
    struct AnalysisConfig
    {
        aspects::AspectConfig aspects;
        /// Replaces the built-in aspect tables (and @ref aspects) when set.
        std::optional<std::vector<aspects::AspectDefinition>> aspect_table;
    };

    struct ChartAnalysisResult
    {
        std::vector<aspects::Aspect>                    aspects;
        std::vector<patterns::Pattern>                  patterns;
        /// Present when the ascendant is known.
        std::optional<ashtakavarga::AshtakavargaResult> ashtakavarga;
    };

    /// @brief Stateless front end over the three engines.
    class ChartAnalyzer
    {
    public:
        ChartAnalyzer() = delete;

        /// @brief Aspect table selected by a configuration.
        /// @throws core::InvalidInputError if the table is malformed.
        [[nodiscard]] static std::vector<aspects::AspectDefinition> resolve_aspect_set(
            const AnalysisConfig& config);

        /// @brief Analyze one chart.
        ///
        /// All input is validated before anything is computed; the result is
        /// either complete or an exception is thrown.
        /// @throws core::InvalidInputError
        [[nodiscard]] static ChartAnalysisResult analyze(
            const chart::ChartPositions& positions,
            const AnalysisConfig& config = {});
    };

} // namespace astrolabe::analysis
