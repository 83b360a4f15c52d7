/// @file aspect_table_loader.cpp
/// @brief Implementation of the CSV aspect table loader.

#include "aspects/aspect_table_loader.hpp"

#include "core/logger.hpp"
#include "core/text.hpp"

#include <fstream>
#include <sstream>
#include <string>

namespace astrolabe::aspects
{

// -----------------------------------------------------------------
// Load aspect CSV: Name,Angle,Orb
// -----------------------------------------------------------------

std::optional<std::vector<AspectDefinition>>
AspectTableLoader::load_csv(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        ALB_ERROR("AspectTableLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::string line;

    // Skip header line
    if (!std::getline(file, line))
    {
        ALB_ERROR("AspectTableLoader: File is empty: {}", path.string());
        return std::nullopt;
    }

    std::vector<AspectDefinition> table;
    u32 line_number = 1;

    while (std::getline(file, line))
    {
        ++line_number;

        const std::string_view content = core::trim(line);
        if (content.empty() || content.front() == '#')
        {
            continue;
        }

        std::istringstream stream{std::string(content)};
        std::string name_str;
        std::string angle_str;
        std::string orb_str;

        if (!std::getline(stream, name_str, ',') ||
            !std::getline(stream, angle_str, ',') ||
            !std::getline(stream, orb_str))
        {
            ALB_ERROR("AspectTableLoader: Malformed line {}: {}", line_number, line);
            return std::nullopt;
        }

        const auto type  = AspectTable::parse(name_str);
        const auto angle = core::parse_f64(core::trim(angle_str));
        const auto orb   = core::parse_f64(core::trim(orb_str));

        if (!type)
        {
            ALB_ERROR("AspectTableLoader: Unknown aspect '{}' on line {}",
                      core::trim(name_str), line_number);
            return std::nullopt;
        }
        if (!angle || !orb)
        {
            ALB_ERROR("AspectTableLoader: Failed to parse values on line {}: {}",
                      line_number, line);
            return std::nullopt;
        }

        table.push_back(AspectDefinition{
            .type  = *type,
            .angle = *angle,
            .orb   = *orb,
        });
    }

    if (table.empty())
    {
        ALB_ERROR("AspectTableLoader: No aspects found in: {}", path.string());
        return std::nullopt;
    }

    ALB_INFO("AspectTableLoader: Loaded {} aspects from {}", table.size(), path.string());

    return table;
}

} // namespace astrolabe::aspects
