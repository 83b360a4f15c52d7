/// @file test_concurrency.cpp
/// @brief Runs the chart engines from several threads at once.
///
/// No Logger::init() here: the first log call from any worker installs the
/// default loggers, so this suite also covers concurrent lazy logger setup.
/// It lives in its own executable so no earlier test case has touched the
/// logger first.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "analysis/chart_analyzer.hpp"
#include "aspects/aspect_definition.hpp"
#include "aspects/aspect_detector.hpp"
#include "chart/chart_positions.hpp"
#include "ashtakavarga/ashtakavarga_engine.hpp"

#include <cmath>
#include <cstddef>
#include <string>
#include <thread>
#include <vector>

using namespace astrolabe;

namespace
{

constexpr std::size_t kThreads    = 8;
constexpr std::size_t kIterations = 25;

chart::ChartPositions sample_chart()
{
    chart::ChartPositions chart;
    chart.add("Sun", 10.0, false, 0.9856)
         .add("Moon", 130.0, false, 13.1)
         .add("Mars", 100.0, false, 0.6)
         .add("Mercury", 135.0, true, -0.4)
         .add("Jupiter", 250.0, false, 0.08)
         .add("Venus", 128.0, false, 1.2)
         .add("Saturn", 280.0, true, -0.03);
    chart.ascendant = 190.0;
    chart.midheaven = 100.0;
    return chart;
}

/// Flattened view of a result, comparable with ==.
struct Fingerprint
{
    std::vector<std::string>  aspects;
    std::vector<std::string>  patterns;
    ashtakavarga::BinduVector sarva{};

    bool operator==(const Fingerprint&) const = default;
};

Fingerprint fingerprint(const analysis::ChartAnalysisResult& result)
{
    Fingerprint print;
    for (const aspects::Aspect& aspect : result.aspects)
    {
        print.aspects.push_back(aspect.point1 + " " + std::string(aspects::AspectTable::name(aspect.type))
                                + " " + aspect.point2);
    }
    for (const patterns::Pattern& pattern : result.patterns)
    {
        print.patterns.push_back(pattern.description);
    }
    if (result.ashtakavarga)
    {
        print.sarva = result.ashtakavarga->sarvashtakavarga.bindus_by_sign;
    }
    return print;
}

} // anonymous namespace

TEST_CASE("Parallel analyses of one chart agree")
{
    const chart::ChartPositions chart = sample_chart();

    std::vector<std::vector<Fingerprint>> per_thread(kThreads);
    std::vector<std::thread> workers;
    workers.reserve(kThreads);

    for (std::size_t t = 0; t < kThreads; ++t)
    {
        workers.emplace_back([&chart, &out = per_thread[t]] {
            for (std::size_t i = 0; i < kIterations; ++i)
            {
                out.push_back(fingerprint(analysis::ChartAnalyzer::analyze(chart)));
            }
        });
    }
    for (std::thread& worker : workers)
    {
        worker.join();
    }

    const Fingerprint expected = fingerprint(analysis::ChartAnalyzer::analyze(chart));
    CHECK_FALSE(expected.aspects.empty());
    CHECK_FALSE(expected.patterns.empty());

    for (const auto& results : per_thread)
    {
        REQUIRE(results.size() == kIterations);
        for (const Fingerprint& print : results)
        {
            CHECK(print == expected);
        }
    }
}

TEST_CASE("Parallel aspect scans over different point sets")
{
    const std::vector<aspects::AspectDefinition> table = aspects::AspectTable::build({.include_minor = true});

    std::vector<std::size_t> counts(kThreads, 0);
    std::vector<std::thread> workers;
    workers.reserve(kThreads);

    for (std::size_t t = 0; t < kThreads; ++t)
    {
        workers.emplace_back([&table, &count = counts[t], t] {
            // Each worker rotates the same ring of points by its own offset
            const f64 offset = static_cast<f64>(t) * 17.0;
            std::vector<chart::CelestialPoint> points;
            for (const f64 longitude : {0.0, 60.0, 90.0, 120.0, 180.0, 235.0})
            {
                const f64 shifted = std::fmod(longitude + offset, 360.0);
                points.push_back(chart::CelestialPoint{
                    .name      = "p" + std::to_string(points.size()),
                    .longitude = shifted,
                    .sign      = static_cast<i32>(shifted / 30.0),
                });
            }

            for (std::size_t i = 0; i < kIterations; ++i)
            {
                count = aspects::AspectDetector::calculate_all_aspects(points, table).size();
            }
        });
    }
    for (std::thread& worker : workers)
    {
        worker.join();
    }

    // Rotation preserves every separation, so every worker sees the same count
    for (const std::size_t count : counts)
    {
        CHECK(count == counts.front());
    }
    CHECK(counts.front() > 0);
}
