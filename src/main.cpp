// src/main.cpp - Astrolabe command-line front end
//
// Reads one chart's positions from CSV and prints:
//  1. Positions (sign, degree, wheel direction)
//  2. Aspects
//  3. Patterns
//  4. Ashtakavarga summary (when the ascendant is known)

#include "analysis/chart_analyzer.hpp"
#include "aspects/aspect_table_loader.hpp"
#include "chart/positions_loader.hpp"
#include "core/error.hpp"
#include "core/logger.hpp"
#include "wheel/chart_wheel.hpp"
#include "zodiac/zodiac.hpp"

#include <iomanip>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

using namespace astrolabe;

namespace {

void printUsage() {
    std::cout << "usage: astrolabe_cli <positions.csv> [aspects.csv] [--minor]\n"
              << "  positions.csv  Name,Longitude[,Retrograde[,Speed]] (ascendant/mc rows set the angles)\n"
              << "  aspects.csv    Name,Angle,Orb (replaces the built-in aspect table)\n"
              << "  --minor        include minor aspects in the built-in table\n";
}

void printPositions(const chart::ChartPositions& positions) {
    std::cout << "Positions\n"
              << "----------------------------------------------------------------\n";

    const double asc = positions.ascendant.value_or(0.0);
    const auto orientation = positions.ascendant ? wheel::WheelOrientation::Natal
                                                 : wheel::WheelOrientation::Natural;

    for (const auto& p : positions.aspect_points()) {
        const Vec2d dir = wheel::ChartWheel::project(p.longitude, orientation, asc);
        std::cout << "  " << std::left << std::setw(12) << p.name << std::right
                  << std::fixed << std::setprecision(2) << std::setw(8) << p.longitude
                  << "  " << std::left << std::setw(18) << zodiac::Zodiac::format_degree(p.longitude)
                  << std::right << (p.retrograde ? " R " : "   ")
                  << " wheel(" << std::setprecision(3) << std::setw(6) << dir.x
                  << ", " << std::setw(6) << dir.y << ")\n";
    }
    std::cout << "\n";
}

void printAspects(const std::vector<aspects::Aspect>& found) {
    std::cout << "Aspects (" << found.size() << ")\n"
              << "----------------------------------------------------------------\n";
    for (const auto& a : found) {
        std::cout << "  " << std::left << std::setw(12) << a.point1
                  << std::setw(14) << aspects::AspectTable::name(a.type)
                  << std::setw(12) << a.point2 << std::right
                  << " orb " << std::showpos << std::fixed << std::setprecision(2) << a.orb
                  << std::noshowpos;
        if (a.applying) std::cout << (*a.applying ? "  applying" : "  separating");
        std::cout << "\n";
    }
    std::cout << "\n";
}

void printPatterns(const std::vector<patterns::Pattern>& found) {
    std::cout << "Patterns (" << found.size() << ")\n"
              << "----------------------------------------------------------------\n";
    for (const auto& p : found) {
        std::cout << "  [" << patterns::PatternRecognizer::type_name(p.type) << "] "
                  << p.description << "\n";
    }
    std::cout << "\n";
}

void printAshtakavarga(const ashtakavarga::AshtakavargaResult& av) {
    using ashtakavarga::AshtakavargaEngine;

    std::cout << "Ashtakavarga (ascendant " << av.calculation_info.ascendant_sign << ")\n"
              << "----------------------------------------------------------------\n"
              << "  " << std::setw(9) << " ";
    for (int s = 0; s < static_cast<int>(zodiac::kSignCount); ++s)
        std::cout << std::setw(5) << zodiac::Zodiac::sign_name(s).substr(0, 3);
    std::cout << "  total\n";

    for (const auto& b : av.bhinnashtakavarga) {
        std::cout << "  " << std::left << std::setw(9) << b.planet_name << std::right;
        for (int v : b.bindus_by_sign) std::cout << std::setw(5) << v;
        std::cout << std::setw(7) << b.total << "\n";
    }

    const auto& sarva = av.sarvashtakavarga;
    std::cout << "  " << std::left << std::setw(9) << "SAV" << std::right;
    for (int v : sarva.bindus_by_sign) std::cout << std::setw(5) << v;
    std::cout << std::setw(7) << sarva.total << "  (avg " << std::setprecision(1)
              << sarva.average << ")\n\n";

    const auto& sum = av.summary;
    std::cout << "  Strongest planet: " << sum.strongest_planet << " (" << sum.strongest_planet_bindus << ")\n"
              << "  Weakest planet:   " << sum.weakest_planet << " (" << sum.weakest_planet_bindus << ")\n"
              << "  Strongest sign:   " << sum.strongest_sign << " (" << sum.strongest_sign_bindus << ")\n"
              << "  Weakest sign:     " << sum.weakest_sign << " (" << sum.weakest_sign_bindus << ")\n"
              << "  Transit-favorable:";
    for (const auto& s : sum.transit_favorable_signs) std::cout << " " << s;
    std::cout << "\n\n  House  Sign          Bindus  Strength\n";
    for (const auto& h : sum.house_strength) {
        std::cout << "  " << std::setw(5) << h.house << "  " << std::left << std::setw(12)
                  << h.sign_name << std::right << std::setw(8) << h.bindus << "  "
                  << AshtakavargaEngine::strength_name(h.strength) << "\n";
    }
    std::cout << "\n";
}

} // namespace

int main(int argc, char** argv) {
    std::vector<std::string_view> args(argv + 1, argv + argc);

    analysis::AnalysisConfig config;
    std::vector<std::string_view> files;
    for (auto arg : args) {
        if (arg == "--minor")                       config.aspects.include_minor = true;
        else if (arg == "-h" || arg == "--help")    { printUsage(); return 0; }
        else                                        files.push_back(arg);
    }

    if (files.empty() || files.size() > 2) {
        printUsage();
        return 1;
    }

    core::Logger::init();

    int status = 0;
    try {
        const auto positions = chart::PositionsLoader::load_csv(std::string(files[0]));
        if (!positions) {
            status = 1;
        } else {
            if (files.size() == 2) {
                auto table = aspects::AspectTableLoader::load_csv(std::string(files[1]));
                if (!table) {
                    core::Logger::shutdown();
                    return 1;
                }
                config.aspect_table = std::move(*table);
            }

            const auto result = analysis::ChartAnalyzer::analyze(*positions, config);

            std::cout << "================================================================\n"
                      << "  ASTROLABE - Chart Synthesis\n"
                      << "================================================================\n\n";
            printPositions(*positions);
            printAspects(result.aspects);
            printPatterns(result.patterns);
            if (result.ashtakavarga) printAshtakavarga(*result.ashtakavarga);
        }
    } catch (const core::InvalidInputError& e) {
        ALB_ERROR("Invalid chart input: {}", e.what());
        status = 1;
    } catch (const std::exception& e) {
        ALB_CRITICAL("Unexpected error: {}", e.what());
        status = 1;
    }

    core::Logger::shutdown();
    return status;
}
