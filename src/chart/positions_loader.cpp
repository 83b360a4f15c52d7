/// @file positions_loader.cpp
/// @brief Implementation of the CSV chart positions loader.

#include "chart/positions_loader.hpp"

#include "core/logger.hpp"
#include "core/text.hpp"
#include "zodiac/body_registry.hpp"

#include <fstream>
#include <string>
#include <vector>

namespace astrolabe::chart
{

namespace
{

std::vector<std::string_view> split_fields(std::string_view line)
{
    std::vector<std::string_view> fields;
    std::size_t start = 0;
    while (true)
    {
        const std::size_t comma = line.find(',', start);
        if (comma == std::string_view::npos)
        {
            fields.push_back(core::trim(line.substr(start)));
            break;
        }
        fields.push_back(core::trim(line.substr(start, comma - start)));
        start = comma + 1;
    }
    return fields;
}

} // anonymous namespace

// -----------------------------------------------------------------
// Load positions CSV: Name,Longitude[,Retrograde[,Speed]]
// -----------------------------------------------------------------

std::optional<ChartPositions> PositionsLoader::load_csv(const std::filesystem::path& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        ALB_ERROR("PositionsLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::string line;

    // Skip header line
    if (!std::getline(file, line))
    {
        ALB_ERROR("PositionsLoader: File is empty: {}", path.string());
        return std::nullopt;
    }

    ChartPositions positions;
    u32 line_number = 1;
    bool seen_ascendant = false;
    bool seen_midheaven = false;

    while (std::getline(file, line))
    {
        ++line_number;

        const std::string_view content = core::trim(line);
        if (content.empty() || content.front() == '#')
        {
            continue;
        }

        const std::vector<std::string_view> fields = split_fields(content);
        if (fields.size() < 2 || fields.size() > 4 || fields[0].empty())
        {
            ALB_ERROR("PositionsLoader: Malformed line {}: {}", line_number, line);
            return std::nullopt;
        }

        const std::string name(fields[0]);

        std::optional<f64> longitude;
        if (!fields[1].empty())
        {
            longitude = core::parse_f64(fields[1]);
            if (!longitude)
            {
                ALB_ERROR("PositionsLoader: Bad longitude on line {}: {}", line_number, line);
                return std::nullopt;
            }
        }

        bool retrograde = false;
        if (fields.size() >= 3 && !fields[2].empty())
        {
            const auto flag = core::parse_bool(fields[2]);
            if (!flag)
            {
                ALB_ERROR("PositionsLoader: Bad retrograde flag on line {}: {}", line_number, line);
                return std::nullopt;
            }
            retrograde = *flag;
        }

        std::optional<f64> speed;
        if (fields.size() == 4 && !fields[3].empty())
        {
            speed = core::parse_f64(fields[3]);
            if (!speed)
            {
                ALB_ERROR("PositionsLoader: Bad speed on line {}: {}", line_number, line);
                return std::nullopt;
            }
        }

        const auto body = zodiac::BodyRegistry::find(name);
        if (body && (body->id == zodiac::kAscendantId || body->id == zodiac::kMidheavenId))
        {
            const bool is_ascendant = body->id == zodiac::kAscendantId;
            bool& seen = is_ascendant ? seen_ascendant : seen_midheaven;
            if (seen)
            {
                ALB_ERROR("PositionsLoader: Duplicate {} row on line {}: {}",
                          is_ascendant ? "ascendant" : "midheaven", line_number, line);
                return std::nullopt;
            }
            seen = true;
            (is_ascendant ? positions.ascendant : positions.midheaven) = longitude;
        }
        else
        {
            positions.bodies.push_back(PointEntry{
                .name       = name,
                .longitude  = longitude,
                .sign       = std::nullopt,
                .retrograde = retrograde,
                .speed      = speed,
            });
        }
    }

    ALB_INFO("PositionsLoader: Loaded {} bodies from {}", positions.bodies.size(), path.string());

    return positions;
}

} // namespace astrolabe::chart
