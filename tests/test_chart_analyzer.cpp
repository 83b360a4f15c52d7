/// @file test_chart_analyzer.cpp
/// @brief End-to-end tests for astrolabe::analysis::ChartAnalyzer.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "analysis/chart_analyzer.hpp"
#include "aspects/aspect_definition.hpp"
#include "chart/chart_positions.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <vector>

using namespace astrolabe;
using namespace astrolabe::analysis;
using aspects::AspectType;
using patterns::PatternType;

namespace
{

/// Grand Trine Sun/Moon/Jupiter, T-Square Mars-Saturn with apex Sun,
/// Leo stellium Moon/Mercury/Venus, Ascendant in Libra.
chart::ChartPositions sample_chart()
{
    chart::ChartPositions chart;
    chart.add("Sun", 10.0)
         .add("Moon", 130.0)
         .add("Mars", 100.0)
         .add("Mercury", 135.0)
         .add("Jupiter", 250.0)
         .add("Venus", 128.0)
         .add("Saturn", 280.0);
    chart.ascendant = 190.0;
    return chart;
}

bool has_aspect(const std::vector<aspects::Aspect>& list,
                const std::string& a, const std::string& b, AspectType type)
{
    return std::any_of(list.begin(), list.end(), [&](const aspects::Aspect& aspect) {
        return aspect.type == type
            && ((aspect.point1 == a && aspect.point2 == b) || (aspect.point1 == b && aspect.point2 == a));
    });
}

const patterns::Pattern* find_pattern(const std::vector<patterns::Pattern>& list,
                                      PatternType type,
                                      const std::set<std::string>& members)
{
    for (const patterns::Pattern& pattern : list)
    {
        if (pattern.type == type && std::set<std::string>(pattern.points.begin(), pattern.points.end()) == members)
        {
            return &pattern;
        }
    }
    return nullptr;
}

} // anonymous namespace

// =================================================================
// Full pipeline
// =================================================================

TEST_CASE("Full analysis finds aspects, patterns and ashtakavarga")
{
    const ChartAnalysisResult result = ChartAnalyzer::analyze(sample_chart());

    CHECK(has_aspect(result.aspects, "sun", "moon", AspectType::Trine));
    CHECK(has_aspect(result.aspects, "moon", "jupiter", AspectType::Trine));
    CHECK(has_aspect(result.aspects, "sun", "jupiter", AspectType::Trine));
    CHECK(has_aspect(result.aspects, "sun", "mars", AspectType::Square));
    CHECK(has_aspect(result.aspects, "sun", "saturn", AspectType::Square));
    CHECK(has_aspect(result.aspects, "mars", "saturn", AspectType::Opposition));
    CHECK(has_aspect(result.aspects, "sun", "ascendant", AspectType::Opposition));

    CHECK(find_pattern(result.patterns, PatternType::GrandTrine, {"sun", "moon", "jupiter"}) != nullptr);

    const patterns::Pattern* t_square =
        find_pattern(result.patterns, PatternType::TSquare, {"mars", "saturn", "sun"});
    REQUIRE(t_square != nullptr);
    REQUIRE(t_square->apex.has_value());
    CHECK(*t_square->apex == "sun");

    const patterns::Pattern* stellium =
        find_pattern(result.patterns, PatternType::Stellium, {"moon", "mercury", "venus"});
    REQUIRE(stellium != nullptr);
    CHECK(stellium->sign == 4);
    CHECK(stellium->description == "Stellium in Leo: moon, mercury, venus");

    REQUIRE(result.ashtakavarga.has_value());
    CHECK(result.ashtakavarga->sarvashtakavarga.total == 337);
    CHECK(result.ashtakavarga->calculation_info.ascendant_sign == "Libra");
    CHECK(result.ashtakavarga->summary.house_strength[0].sign_name == "Libra");
}

TEST_CASE("Minor aspects only appear when requested")
{
    chart::ChartPositions chart;
    chart.add("sun", 0.0).add("moon", 150.5);

    const ChartAnalysisResult majors = ChartAnalyzer::analyze(chart);
    CHECK(majors.aspects.empty());

    AnalysisConfig config;
    config.aspects.include_minor = true;
    const ChartAnalysisResult minors = ChartAnalyzer::analyze(chart, config);
    REQUIRE(minors.aspects.size() == 1);
    CHECK(minors.aspects[0].type == AspectType::Quincunx);
}

TEST_CASE("Orb overrides widen the active set")
{
    chart::ChartPositions chart;
    chart.add("sun", 0.0).add("mars", 99.0);

    CHECK(ChartAnalyzer::analyze(chart).aspects.empty());

    AnalysisConfig config;
    config.aspects.orb_overrides.push_back({AspectType::Square, 10.0});
    const ChartAnalysisResult result = ChartAnalyzer::analyze(chart, config);
    REQUIRE(result.aspects.size() == 1);
    CHECK(result.aspects[0].type == AspectType::Square);
    CHECK(result.aspects[0].orb == doctest::Approx(9.0));
}

TEST_CASE("Explicit aspect table replaces the built-in set")
{
    chart::ChartPositions chart;
    chart.add("sun", 0.0).add("moon", 120.0).add("mars", 90.0);

    AnalysisConfig config;
    config.aspect_table = std::vector<aspects::AspectDefinition>{{AspectType::Square, 90.0, 1.0}};

    const ChartAnalysisResult result = ChartAnalyzer::analyze(chart, config);
    REQUIRE(result.aspects.size() == 1);
    CHECK(result.aspects[0].point1 == "sun");
    CHECK(result.aspects[0].point2 == "mars");
}

// =================================================================
// Missing data
// =================================================================

TEST_CASE("No ascendant: aspects computed, ashtakavarga skipped")
{
    chart::ChartPositions chart = sample_chart();
    chart.ascendant.reset();

    const ChartAnalysisResult result = ChartAnalyzer::analyze(chart);
    CHECK_FALSE(result.ashtakavarga.has_value());
    CHECK(has_aspect(result.aspects, "sun", "moon", AspectType::Trine));
    CHECK_FALSE(has_aspect(result.aspects, "sun", "ascendant", AspectType::Opposition));
}

TEST_CASE("Missing bodies are excluded from aspects")
{
    chart::ChartPositions chart = sample_chart();
    chart.add_missing("pluto");

    const ChartAnalysisResult result = ChartAnalyzer::analyze(chart);
    for (const aspects::Aspect& aspect : result.aspects)
    {
        CHECK(aspect.point1 != "pluto");
        CHECK(aspect.point2 != "pluto");
    }
}

TEST_CASE("Midheaven participates in aspects")
{
    chart::ChartPositions chart;
    chart.add("sun", 10.0);
    chart.midheaven = 100.0;

    const ChartAnalysisResult result = ChartAnalyzer::analyze(chart);
    CHECK(has_aspect(result.aspects, "sun", "mc", AspectType::Square));
    CHECK_FALSE(result.ashtakavarga.has_value());
}

// =================================================================
// Validation
// =================================================================

TEST_CASE("Invalid input fails before any computation")
{
    SUBCASE("Longitude out of range")
    {
        chart::ChartPositions chart = sample_chart();
        chart.add("pluto", 360.0);
        CHECK_THROWS_AS((void)ChartAnalyzer::analyze(chart), core::InvalidInputError);
    }

    SUBCASE("Unknown body")
    {
        chart::ChartPositions chart = sample_chart();
        chart.add("nibiru", 12.0);
        CHECK_THROWS_AS((void)ChartAnalyzer::analyze(chart), core::InvalidInputError);
    }

    SUBCASE("Ascendant out of range")
    {
        chart::ChartPositions chart = sample_chart();
        chart.ascendant = -1.0;
        CHECK_THROWS_AS((void)ChartAnalyzer::analyze(chart), core::InvalidInputError);
    }

    SUBCASE("Negative orb override")
    {
        AnalysisConfig config;
        config.aspects.orb_overrides.push_back({AspectType::Trine, -1.0});
        CHECK_THROWS_AS((void)ChartAnalyzer::analyze(sample_chart(), config), core::InvalidInputError);
    }

    SUBCASE("Aspect angle out of range")
    {
        AnalysisConfig config;
        config.aspect_table = std::vector<aspects::AspectDefinition>{{AspectType::Trine, 240.0, 8.0}};
        CHECK_THROWS_AS((void)ChartAnalyzer::analyze(sample_chart(), config), core::InvalidInputError);
    }
}

TEST_CASE("Analysis is idempotent")
{
    const chart::ChartPositions chart = sample_chart();
    const ChartAnalysisResult first = ChartAnalyzer::analyze(chart);
    const ChartAnalysisResult second = ChartAnalyzer::analyze(chart);

    REQUIRE(first.aspects.size() == second.aspects.size());
    for (std::size_t i = 0; i < first.aspects.size(); ++i)
    {
        CHECK(first.aspects[i].point1 == second.aspects[i].point1);
        CHECK(first.aspects[i].point2 == second.aspects[i].point2);
        CHECK(first.aspects[i].type == second.aspects[i].type);
        CHECK(first.aspects[i].orb == second.aspects[i].orb);
    }

    REQUIRE(first.patterns.size() == second.patterns.size());
    for (std::size_t i = 0; i < first.patterns.size(); ++i)
    {
        CHECK(first.patterns[i].description == second.patterns[i].description);
    }

    CHECK(first.ashtakavarga->sarvashtakavarga.bindus_by_sign
          == second.ashtakavarga->sarvashtakavarga.bindus_by_sign);
}
