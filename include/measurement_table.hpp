#pragma once

#include <array>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

#include "coefficient_types.hpp"

/**
 * @file measurement_table.hpp
 * @brief Wind tunnel measurement table and its CSV loader.
 *
 * One sample per row: yaw, theta, torsional rotation alpha, and the six
 * structural-frame coefficients. Angles are stored in radians. The table is
 * read once and then only passed by const reference.
 */

namespace deckcoef
{

struct MeasurementTable
{
    std::vector<double> yaw_rad;
    std::vector<double> theta_rad;
    std::vector<double> alpha_rad;
    std::array<std::vector<double>, kNumChannels> coefficients;
    std::string source;

    /**
     * @brief Checks whether all columns are non-empty and size-aligned.
     */
    bool is_valid() const
    {
        if (yaw_rad.empty() || yaw_rad.size() != theta_rad.size())
        {
            return false;
        }
        for (const auto& column : coefficients)
        {
            if (column.size() != yaw_rad.size())
            {
                return false;
            }
        }
        return alpha_rad.empty() || alpha_rad.size() == yaw_rad.size();
    }

    /**
     * @brief Returns the number of samples.
     */
    std::size_t num_samples() const { return yaw_rad.size(); }

    /**
     * @brief Appends one sample; angles in radians.
     */
    void add_sample(double yaw, double theta, const std::array<double, kNumChannels>& values, double alpha = 0.0)
    {
        yaw_rad.push_back(yaw);
        theta_rad.push_back(theta);
        alpha_rad.push_back(alpha);
        for (std::size_t c = 0; c < kNumChannels; ++c)
        {
            coefficients[c].push_back(values[c]);
        }
    }
};

/**
 * @brief Parses a CSV measurement table from a stream.
 *
 * Required header columns: beta[deg], six coefficient columns named
 * Cx_Ls, Cy_Ls, Cz_Ls, Cxx_Ls, Cyy_Ls, Czz_Ls (or C1..C6), and either
 * theta[deg] or alpha[deg]. Without theta[deg], beta[deg] is read as the
 * uncorrected wind tunnel yaw and converted together with alpha[deg].
 * @throws TableLoadError on missing columns or malformed rows.
 */
MeasurementTable parse_measurement_table(std::istream& in, const std::string& source);

/**
 * @brief Loads a CSV measurement table from disk.
 * @throws TableLoadError when the file cannot be opened or parsed.
 */
MeasurementTable load_measurement_table(const std::string& path);

/**
 * @brief Samples whose yaw lies within tolerance of zero.
 */
MeasurementTable zero_yaw_slice(const MeasurementTable& table, double tolerance = 1.0e-9);

/**
 * @brief Samples whose yaw lies in the canonical [0, 90] deg domain.
 */
MeasurementTable canonical_domain_samples(const MeasurementTable& table, double tolerance = 1.0e-9);

} // namespace deckcoef
