/**
 * @file constrained_lsq.hpp
 * @brief Equality-constrained linear least squares.
 *
 * This file is part of the src/surface_fit subsystem.
 */

#pragma once

#include <Eigen/Dense>

#include "surface_fit_base.hpp"

namespace constrained_lsq
{

inline constexpr double rank_threshold = 1.0e-10;
inline constexpr double consistency_tolerance = 1.0e-8;

/**
 * @brief Solves min ||A a - y|| subject to C a = d.
 *
 * Uses the null-space method: a particular solution of the constraints plus
 * the least-squares optimum inside the constraint kernel. Redundant
 * constraint rows are tolerated; contradictory ones raise FitError.
 * An empty C reduces to plain least squares.
 */
Eigen::VectorXd solve(const Eigen::MatrixXd& A,
                      const Eigen::VectorXd& y,
                      const Eigen::MatrixXd& C,
                      const Eigen::VectorXd& d,
                      deckcoef::FitSolver solver);

/**
 * @brief Unconstrained least squares with the selected decomposition.
 */
Eigen::VectorXd least_squares(const Eigen::MatrixXd& A, const Eigen::VectorXd& y, deckcoef::FitSolver solver);

} // namespace constrained_lsq
