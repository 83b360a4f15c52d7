/// @file chart_analyzer.cpp
/// @brief Validation and orchestration of the chart engines.

#include "analysis/chart_analyzer.hpp"

#include "core/logger.hpp"

namespace astrolabe::analysis
{

std::vector<aspects::AspectDefinition> ChartAnalyzer::resolve_aspect_set(const AnalysisConfig& config)
{
    std::vector<aspects::AspectDefinition> table = config.aspect_table
        ? *config.aspect_table
        : aspects::AspectTable::build(config.aspects);

    aspects::AspectTable::validate(table);
    return table;
}

ChartAnalysisResult ChartAnalyzer::analyze(const chart::ChartPositions& positions,
                                           const AnalysisConfig& config)
{
    // -----------------------------------------------------------------
    // Validate everything up front
    // -----------------------------------------------------------------
    positions.validate();
    const std::vector<aspects::AspectDefinition> aspect_set = resolve_aspect_set(config);

    const ashtakavarga::SignPositions signs =
        ashtakavarga::AshtakavargaEngine::sign_positions_from(positions);
    ashtakavarga::AshtakavargaEngine::validate(signs);

    // -----------------------------------------------------------------
    // Aspects -> patterns
    // -----------------------------------------------------------------
    ChartAnalysisResult result;

    const std::vector<chart::CelestialPoint> points = positions.aspect_points();
    result.aspects = aspects::AspectDetector::calculate_all_aspects(points, aspect_set);

    const auto placements = positions.body_signs();
    result.patterns = patterns::PatternRecognizer::detect_all(result.aspects, placements);

    // -----------------------------------------------------------------
    // Ashtakavarga (needs the ascendant)
    // -----------------------------------------------------------------
    if (positions.ascendant)
    {
        result.ashtakavarga = ashtakavarga::AshtakavargaEngine::calculate(signs);
    }
    else
    {
        ALB_CORE_DEBUG("ChartAnalyzer: ascendant unknown, ashtakavarga skipped");
    }

    ALB_CORE_DEBUG("ChartAnalyzer: {} points, {} aspects, {} patterns",
                  points.size(), result.aspects.size(), result.patterns.size());

    return result;
}

} // namespace astrolabe::analysis
