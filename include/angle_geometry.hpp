#pragma once

#include <vector>

#include <Eigen/Dense>

#include "coefficient_types.hpp"

/**
 * @file angle_geometry.hpp
 * @brief Wind angle geometry and structural/wind-normal frame rotation.
 *
 * Structural frame axes: x along the deck, y horizontal across the deck,
 * z vertical. For yaw beta and inclination theta the unit wind vector is
 * (sin(beta) cos(theta), cos(beta) cos(theta), sin(theta)). The wind-normal
 * frame has x along the wind component normal to the deck, y along the
 * deck, and z = x cross y.
 */

namespace deckcoef
{

/**
 * @brief 6x6 operator mapping (force, moment) triplets between frames.
 */
using RotationOperator = Eigen::Matrix<double, 6, 6>;

/**
 * @brief Inclination of the deck-normal wind component within the y-z plane.
 *
 * Returns asin(Uz / Vn) in [-90, 90] deg, or 0 when the normal component
 * vanishes (wind along the deck).
 */
double skew_angle(double yaw, double theta);

/**
 * @brief Skew angles for a whole query sequence.
 */
std::vector<double> skew_angles(const std::vector<double>& yaws, const std::vector<double>& thetas);

/**
 * @brief Builds the structural-to-wind-normal operator for one query point.
 *
 * Yaw selects the side the normal wind arrives from (sign of cos(yaw)).
 */
RotationOperator build_rotation(double yaw, double skew);

/**
 * @brief Builds one operator per query point.
 */
std::vector<RotationOperator> build_rotations(const std::vector<double>& yaws, const std::vector<double>& skews);

/**
 * @brief Projects structural-frame channels into the wind-normal frame.
 * @param rotations One operator per query point.
 * @param structural Sign-corrected structural values.
 * @return Wind-normal values in the same channel order.
 */
CoefficientSet rotate_to_wind_normal(const std::vector<RotationOperator>& rotations, const CoefficientSet& structural);

/**
 * @brief Wind angles of one wind tunnel sample in the deck convention.
 */
struct DeckWindAngles
{
    double yaw = 0.0;
    double theta = 0.0;
};

/**
 * @brief Converts a wind tunnel setting (uncorrected yaw, torsional rotation
 * alpha) of the section model to deck yaw and inclination.
 */
DeckWindAngles soh_to_zhu_angles(double yaw_uncorrected, double alpha);

struct ZhuCoefficients
{
    double drag = 0.0;
    double lift = 0.0;
    double moment = 0.0;
    double axial = 0.0;
};

/**
 * @brief Renormalizes SOH report coefficients (drag on model height, lift on
 * width, moment on width squared, axial on perimeter) to the Zhu convention
 * where every force is normalized by the deck width.
 */
ZhuCoefficients soh_to_zhu_normalization(double cd, double cl, double cm, double ca);

} // namespace deckcoef
