#pragma once

#include <vector>

#include "coefficient_types.hpp"

/**
 * @file angle_folding.hpp
 * @brief Quadrant folding of yaw angles into the canonical [0, 90] deg domain.
 *
 * The deck cross-section is assumed symmetric, so any yaw in [-180, 180] deg
 * is represented by a yaw in [0, 90] deg plus a sign per channel recording
 * which quadrant it came from. All functions are pure: they take the
 * caller's sequences by const reference and return new values.
 */

namespace deckcoef
{

/**
 * @brief Folded representative of one yaw angle.
 */
struct FoldedYaw
{
    double yaw = 0.0;
    ChannelSigns signs{};
};

/**
 * @brief Folded copies of a query sequence with one sign vector per point.
 *
 * Thetas are copied unchanged; only yaws are folded.
 */
struct FoldedQuery
{
    std::vector<double> yaws;
    std::vector<double> thetas;
    std::vector<ChannelSigns> signs;

    std::size_t size() const { return yaws.size(); }
};

/**
 * @brief Checks sequence shape, then angle ranges.
 *
 * Lengths must match (ShapeError). Every yaw must satisfy |yaw| <= 180 deg and
 * every theta |theta| <= 90 deg, all finite (DomainRangeError).
 */
void validate_query_angles(const std::vector<double>& yaws, const std::vector<double>& thetas);

/**
 * @brief Folds a single yaw in radians.
 * @throws DomainRangeError when |yaw| exceeds 180 deg or is not finite.
 */
FoldedYaw fold_yaw(double yaw);

/**
 * @brief Sign pattern of the quadrant containing yaw.
 */
ChannelSigns quadrant_signs(double yaw);

/**
 * @brief Validates and folds a query sequence.
 * @param yaws Query yaws in radians. Not modified.
 * @param thetas Query thetas in radians. Not modified.
 * @return Folded copies and per-point sign vectors.
 */
FoldedQuery fold_query(const std::vector<double>& yaws, const std::vector<double>& thetas);

/**
 * @brief Multiplies each channel value by the sign of its query point.
 */
void apply_signs(const std::vector<ChannelSigns>& signs, CoefficientSet& values);

} // namespace deckcoef
