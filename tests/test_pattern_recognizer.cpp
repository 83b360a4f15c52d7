/// @file test_pattern_recognizer.cpp
/// @brief Unit tests for astrolabe::patterns::PatternRecognizer.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "aspects/aspect_definition.hpp"
#include "aspects/aspect_detector.hpp"
#include "chart/chart_positions.hpp"
#include "core/error.hpp"
#include "patterns/pattern_recognizer.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <vector>

using namespace astrolabe;
using namespace astrolabe::patterns;
using aspects::Aspect;
using aspects::AspectType;

namespace
{

Aspect link(const std::string& a, const std::string& b, AspectType type)
{
    return Aspect{
        .point1     = a,
        .point2     = b,
        .type       = type,
        .angle      = 0.0,
        .separation = 0.0,
        .orb        = 0.0,
        .orb_abs    = 0.0,
        .applying   = std::nullopt,
    };
}

std::vector<Aspect> detect(const std::vector<chart::CelestialPoint>& points)
{
    const std::vector<aspects::AspectDefinition> table(aspects::kMajorAspects.begin(),
                                                       aspects::kMajorAspects.end());
    return aspects::AspectDetector::calculate_all_aspects(points, table);
}

chart::CelestialPoint at(const std::string& name, f64 longitude)
{
    return chart::CelestialPoint{.name = name, .longitude = longitude, .sign = static_cast<i32>(longitude / 30.0)};
}

std::set<std::string> as_set(const std::vector<std::string>& names)
{
    return {names.begin(), names.end()};
}

} // anonymous namespace

// =================================================================
// Grand Trine
// =================================================================

TEST_CASE("Three points 120° apart form one Grand Trine")
{
    const auto aspects = detect({at("sun", 10.0), at("moon", 130.0), at("jupiter", 250.0)});
    const auto trines = PatternRecognizer::detect_grand_trines(aspects);

    REQUIRE(trines.size() == 1);
    CHECK(trines[0].type == PatternType::GrandTrine);
    CHECK(as_set(trines[0].points) == std::set<std::string>{"sun", "moon", "jupiter"});
    CHECK(trines[0].description == "Grand Trine: sun, moon, jupiter");
    CHECK_FALSE(trines[0].apex.has_value());
}

TEST_CASE("Two trines without the closing side are not a Grand Trine")
{
    const std::vector<Aspect> aspects = {
        link("sun", "moon", AspectType::Trine),
        link("moon", "mars", AspectType::Trine),
        link("sun", "mars", AspectType::Square),
    };
    CHECK(PatternRecognizer::detect_grand_trines(aspects).empty());
}

TEST_CASE("Each mutually trine triple is reported exactly once")
{
    // Four points where sun/venus are conjunct: two overlapping grand trines
    const auto aspects = detect({
        at("sun", 10.0), at("venus", 12.0), at("moon", 130.0), at("jupiter", 250.0),
    });
    const auto trines = PatternRecognizer::detect_grand_trines(aspects);

    REQUIRE(trines.size() == 2);

    std::set<std::set<std::string>> seen;
    for (const Pattern& p : trines)
    {
        CHECK(p.points.size() == 3);
        CHECK(seen.insert(as_set(p.points)).second);
    }
    CHECK(seen.contains({"sun", "moon", "jupiter"}));
    CHECK(seen.contains({"venus", "moon", "jupiter"}));
}

TEST_CASE("Duplicated trine aspects do not duplicate the pattern")
{
    const std::vector<Aspect> aspects = {
        link("sun", "moon", AspectType::Trine),
        link("moon", "sun", AspectType::Trine),
        link("moon", "mars", AspectType::Trine),
        link("sun", "mars", AspectType::Trine),
    };
    CHECK(PatternRecognizer::detect_grand_trines(aspects).size() == 1);
}

// =================================================================
// T-Square
// =================================================================

TEST_CASE("Opposition with a common square forms a T-Square")
{
    // Sun 0°, Moon 180°, Mars 90°
    const auto aspects = detect({at("sun", 0.0), at("moon", 180.0), at("mars", 90.0)});
    const auto t_squares = PatternRecognizer::detect_t_squares(aspects);

    REQUIRE(t_squares.size() == 1);
    CHECK(t_squares[0].type == PatternType::TSquare);
    REQUIRE(t_squares[0].apex.has_value());
    CHECK(*t_squares[0].apex == "mars");
    CHECK(as_set(t_squares[0].points) == std::set<std::string>{"sun", "moon", "mars"});
    CHECK(t_squares[0].description == "T-Square with apex at mars");
}

TEST_CASE("T-Square needs squares to both ends")
{
    const std::vector<Aspect> aspects = {
        link("sun", "moon", AspectType::Opposition),
        link("mars", "sun", AspectType::Square),
    };
    CHECK(PatternRecognizer::detect_t_squares(aspects).empty());
}

TEST_CASE("T-Square found from both squares is emitted once")
{
    const std::vector<Aspect> aspects = {
        link("sun", "moon", AspectType::Opposition),
        link("sun", "mars", AspectType::Square),
        link("mars", "moon", AspectType::Square),
        link("moon", "sun", AspectType::Opposition),
    };
    const auto t_squares = PatternRecognizer::detect_t_squares(aspects);
    REQUIRE(t_squares.size() == 1);
    CHECK(*t_squares[0].apex == "mars");
}

TEST_CASE("Grand-cross geometry yields one T-Square per apex")
{
    // Sun 0°, Mars 90°, Moon 180°, Saturn 270°
    const auto aspects = detect({at("sun", 0.0), at("mars", 90.0), at("moon", 180.0), at("saturn", 270.0)});
    const auto t_squares = PatternRecognizer::detect_t_squares(aspects);

    CHECK(t_squares.size() == 4);

    std::set<std::set<std::string>> seen;
    for (const Pattern& p : t_squares)
    {
        CHECK(seen.insert(as_set(p.points)).second);
    }

    CHECK(PatternRecognizer::detect_grand_crosses(aspects).empty());
}

// =================================================================
// Stellium
// =================================================================

TEST_CASE("Three bodies in one sign form a Stellium")
{
    const std::vector<SignPlacement> placements = {
        {"sun", 4}, {"mercury", 4}, {"moon", 9}, {"venus", 4}, {"mars", 9},
    };
    const auto stelliums = PatternRecognizer::detect_stelliums(placements);

    REQUIRE(stelliums.size() == 1);
    CHECK(stelliums[0].type == PatternType::Stellium);
    CHECK(stelliums[0].points == std::vector<std::string>{"sun", "mercury", "venus"});
    CHECK(stelliums[0].sign == 4);
    CHECK(stelliums[0].sign_name == "Leo");
    CHECK(stelliums[0].description == "Stellium in Leo: sun, mercury, venus");
}

TEST_CASE("One Stellium per crowded sign, in zodiac order")
{
    const std::vector<SignPlacement> placements = {
        {"saturn", 11}, {"sun", 0}, {"uranus", 11}, {"moon", 0}, {"neptune", 11},
        {"mars", 0}, {"venus", 0},
    };
    const auto stelliums = PatternRecognizer::detect_stelliums(placements);

    REQUIRE(stelliums.size() == 2);
    CHECK(stelliums[0].sign_name == "Aries");
    CHECK(stelliums[0].points.size() == 4);
    CHECK(stelliums[1].sign_name == "Pisces");
    CHECK(stelliums[1].points == std::vector<std::string>{"saturn", "uranus", "neptune"});
}

TEST_CASE("Two bodies in a sign are not a Stellium")
{
    const std::vector<SignPlacement> placements = {{"sun", 2}, {"moon", 2}};
    CHECK(PatternRecognizer::detect_stelliums(placements).empty());
}

TEST_CASE("Stellium input with a sign outside 0..11 throws")
{
    const std::vector<Aspect> none;
    const std::vector<SignPlacement> past_pisces = {{"sun", 12}, {"moon", 12}, {"mars", 12}};
    const std::vector<SignPlacement> negative = {{"sun", 0}, {"moon", 0}, {"mars", -1}};

    CHECK_THROWS_AS(PatternRecognizer::detect_stelliums(past_pisces), core::InvalidInputError);
    CHECK_THROWS_AS(PatternRecognizer::detect_stelliums(negative), core::InvalidInputError);
    CHECK_THROWS_AS(PatternRecognizer::detect_all(none, negative), core::InvalidInputError);
}

// =================================================================
// Stubs and aggregate
// =================================================================

TEST_CASE("Yod and Grand Cross detectors return empty lists")
{
    // Sextile with both ends quincunx to a third point
    const std::vector<Aspect> yod = {
        link("sun", "moon", AspectType::Sextile),
        link("sun", "pluto", AspectType::Quincunx),
        link("moon", "pluto", AspectType::Quincunx),
    };
    CHECK(PatternRecognizer::detect_yods(yod).empty());
    CHECK(PatternRecognizer::detect_grand_crosses(yod).empty());
}

TEST_CASE("Empty input gives empty results from every detector")
{
    const std::vector<Aspect> none;
    const std::vector<SignPlacement> nowhere;

    CHECK(PatternRecognizer::detect_grand_trines(none).empty());
    CHECK(PatternRecognizer::detect_t_squares(none).empty());
    CHECK(PatternRecognizer::detect_stelliums(nowhere).empty());
    CHECK(PatternRecognizer::detect_all(none, nowhere).empty());
}

TEST_CASE("detect_all orders grand trines, T-squares, then stelliums")
{
    const std::vector<Aspect> aspects = {
        link("sun", "moon", AspectType::Opposition),
        link("sun", "mars", AspectType::Square),
        link("moon", "mars", AspectType::Square),
        link("venus", "jupiter", AspectType::Trine),
        link("jupiter", "saturn", AspectType::Trine),
        link("venus", "saturn", AspectType::Trine),
    };
    const std::vector<SignPlacement> placements = {{"sun", 1}, {"mercury", 1}, {"pluto", 1}};

    const auto all = PatternRecognizer::detect_all(aspects, placements);
    REQUIRE(all.size() == 3);
    CHECK(all[0].type == PatternType::GrandTrine);
    CHECK(all[1].type == PatternType::TSquare);
    CHECK(all[2].type == PatternType::Stellium);

    CHECK(std::string(PatternRecognizer::type_name(PatternType::TSquare)) == "t_square");
    CHECK(std::string(PatternRecognizer::type_name(PatternType::Yod)) == "yod");
}
