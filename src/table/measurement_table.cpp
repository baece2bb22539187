/**
 * @file measurement_table.cpp
 * @brief Implementation of the measurement table loader and sample selection.
 *
 * This file is part of the src/table subsystem.
 */

#include "measurement_table.hpp"

#include <cmath>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <unordered_map>

#include "angle_geometry.hpp"
#include "coefficient_errors.hpp"
#include "log_profile.hpp"
#include "physical_constants.hpp"
#include "string_utils.hpp"

namespace deckcoef
{

namespace
{
const std::array<const char*, kNumChannels> kStructuralColumns = {"cx_ls", "cy_ls", "cz_ls", "cxx_ls", "cyy_ls", "czz_ls"};

/**
 * @brief Returns the index of the first header column matching any alias, or -1.
 */
int find_column(const std::unordered_map<std::string, int>& header, std::initializer_list<const char*> aliases)
{
    for (const char* alias : aliases)
    {
        const auto it = header.find(alias);
        if (it != header.end())
        {
            return it->second;
        }
    }
    return -1;
}

/**
 * @brief Splits one CSV line on commas, keeping empty cells.
 */
std::vector<std::string> split_cells(const std::string& line)
{
    std::vector<std::string> cells;
    std::stringstream ss(line);
    std::string cell;
    while (std::getline(ss, cell, ','))
    {
        cells.push_back(strutil::trim_copy(cell));
    }
    if (!line.empty() && line.back() == ',')
    {
        cells.emplace_back();
    }
    return cells;
}

/**
 * @brief Parses one numeric cell, rejecting partial and non-finite values.
 */
double parse_cell(const std::vector<std::string>& cells, int column, std::size_t line_number, const std::string& source)
{
    std::ostringstream where;
    where << source << ":" << line_number << " column " << column + 1;
    if (column < 0 || static_cast<std::size_t>(column) >= cells.size())
    {
        throw TableLoadError("Missing value at " + where.str());
    }
    try
    {
        std::size_t consumed = 0;
        const double value = std::stod(cells[static_cast<std::size_t>(column)], &consumed);
        if (consumed != cells[static_cast<std::size_t>(column)].size() || !std::isfinite(value))
        {
            throw TableLoadError("Invalid number '" + cells[static_cast<std::size_t>(column)] + "' at " + where.str());
        }
        return value;
    }
    catch (const std::logic_error&)
    {
        throw TableLoadError("Invalid number '" + cells[static_cast<std::size_t>(column)] + "' at " + where.str());
    }
}

/**
 * @brief Copies the samples selected by a predicate on yaw.
 */
template <typename Predicate>
MeasurementTable select_samples(const MeasurementTable& table, Predicate keep)
{
    MeasurementTable out;
    out.source = table.source;
    for (std::size_t s = 0; s < table.num_samples(); ++s)
    {
        if (!keep(table.yaw_rad[s]))
        {
            continue;
        }
        out.yaw_rad.push_back(table.yaw_rad[s]);
        out.theta_rad.push_back(table.theta_rad[s]);
        if (s < table.alpha_rad.size())
        {
            out.alpha_rad.push_back(table.alpha_rad[s]);
        }
        for (std::size_t c = 0; c < kNumChannels; ++c)
        {
            out.coefficients[c].push_back(table.coefficients[c][s]);
        }
    }
    return out;
}
}

/*This function parses a CSV measurement table.
Takes the stream and a source label used in error messages.*/
MeasurementTable parse_measurement_table(std::istream& in, const std::string& source)
{
    std::string line;
    std::size_t line_number = 0;
    std::unordered_map<std::string, int> header;

    while (std::getline(in, line))
    {
        ++line_number;
        const std::string trimmed = strutil::trim_copy(line);
        if (trimmed.empty() || trimmed[0] == '#')
        {
            continue;
        }
        const auto cells = split_cells(trimmed);
        for (std::size_t k = 0; k < cells.size(); ++k)
        {
            header[strutil::lower_copy(cells[k])] = static_cast<int>(k);
        }
        break;
    }
    if (header.empty())
    {
        throw TableLoadError("Measurement table " + source + " has no header row");
    }

    const int yaw_col = find_column(header, {"beta[deg]", "yaw[deg]"});
    const int theta_col = find_column(header, {"theta[deg]"});
    const int alpha_col = find_column(header, {"alpha[deg]"});
    if (yaw_col < 0)
    {
        throw TableLoadError("Measurement table " + source + " lacks a beta[deg] column");
    }
    if (theta_col < 0 && alpha_col < 0)
    {
        throw TableLoadError("Measurement table " + source + " needs theta[deg] or alpha[deg]");
    }

    std::array<int, kNumChannels> channel_cols{};
    for (std::size_t c = 0; c < kNumChannels; ++c)
    {
        const std::string generic = strutil::lower_copy(kChannelNames[c]);
        channel_cols[c] = find_column(header, {kStructuralColumns[c], generic.c_str()});
        if (channel_cols[c] < 0)
        {
            throw TableLoadError("Measurement table " + source + " lacks column " + kStructuralColumns[c]);
        }
    }

    MeasurementTable table;
    table.source = source;
    while (std::getline(in, line))
    {
        ++line_number;
        const std::string trimmed = strutil::trim_copy(line);
        if (trimmed.empty() || trimmed[0] == '#')
        {
            continue;
        }
        const auto cells = split_cells(trimmed);

        const double yaw_value = rad(parse_cell(cells, yaw_col, line_number, source));
        const double alpha = alpha_col >= 0 ? rad(parse_cell(cells, alpha_col, line_number, source)) : 0.0;
        DeckWindAngles angles{yaw_value, 0.0};
        if (theta_col >= 0)
        {
            angles.theta = rad(parse_cell(cells, theta_col, line_number, source));
        }
        else
        {
            angles = soh_to_zhu_angles(yaw_value, alpha);
        }

        std::array<double, kNumChannels> values{};
        for (std::size_t c = 0; c < kNumChannels; ++c)
        {
            values[c] = parse_cell(cells, channel_cols[c], line_number, source);
        }
        table.add_sample(angles.yaw, angles.theta, values, alpha);
    }

    if (!table.is_valid())
    {
        throw TableLoadError("Measurement table " + source + " has no samples");
    }
    return table;
}

/*This function loads a measurement table from a CSV file.*/
MeasurementTable load_measurement_table(const std::string& path)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        throw TableLoadError("Could not open measurement table: " + path);
    }

    MeasurementTable table = parse_measurement_table(file, path);
    if (log_normal_enabled())
    {
        std::cout << "Loaded measurement table " << path << " with " << table.num_samples() << " samples" << std::endl;
    }
    return table;
}

MeasurementTable zero_yaw_slice(const MeasurementTable& table, double tolerance)
{
    return select_samples(table, [tolerance](double yaw) { return std::abs(yaw) <= tolerance; });
}

MeasurementTable canonical_domain_samples(const MeasurementTable& table, double tolerance)
{
    return select_samples(table, [tolerance](double yaw)
    {
        return yaw >= -tolerance && yaw <= physical_constants::half_pi + tolerance;
    });
}

} // namespace deckcoef
