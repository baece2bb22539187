/**
 * @file polynomial_basis.hpp
 * @brief Bivariate monomial basis used by the surface fit.
 *
 * This file is part of the src/surface_fit subsystem.
 */

#pragma once

#include <utility>
#include <vector>

#include <Eigen/Dense>

#include "surface_fit_base.hpp"

namespace polynomial_basis
{

/**
 * @brief Monomial exponent pairs (i, j) for x0^i * x1^j, ordered by i then j.
 */
std::vector<std::pair<int, int>> exponents(int degree, deckcoef::DegreeType type);

/**
 * @brief Basis row of a quantity (value or first partial) at one point.
 */
Eigen::RowVectorXd row(const std::vector<std::pair<int, int>>& terms,
                       deckcoef::ConstraintQuantity quantity,
                       double x0,
                       double x1);

/**
 * @brief Design matrix with one value row per point.
 */
Eigen::MatrixXd design_matrix(const std::vector<std::pair<int, int>>& terms,
                              const std::vector<double>& x0,
                              const std::vector<double>& x1);

} // namespace polynomial_basis
