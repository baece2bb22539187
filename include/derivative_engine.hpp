#pragma once

#include <array>
#include <string>
#include <vector>

#include "coefficient_types.hpp"
#include "measurement_table.hpp"
#include "surface_fit_base.hpp"

/**
 * @file derivative_engine.hpp
 * @brief Centered finite-difference derivatives of the coefficient surfaces.
 *
 * Each call evaluates the coefficients five times (center, yaw +/- step,
 * theta +/- step). Folding flips channel signs at yaw = -180, -90, 0, 90
 * and 180 deg, so points closer than one step to those lines are moved
 * inward before differencing and reported in the diagnostics.
 */

namespace deckcoef
{

inline constexpr double default_derivative_step_rad = 1.0e-3;
inline constexpr double derivative_nudge_factor = 2.1;

/**
 * @brief Evaluation point after the singularity guard.
 */
struct SafeEvaluationPoint
{
    double yaw = 0.0;
    double theta = 0.0;
    bool yaw_nudged = false;
    bool theta_nudged = false;
    bool near_boundary = false;  // still within one step of a fold line after nudging
};

struct DerivativeDiagnostics
{
    std::vector<std::string> warnings;
    std::vector<bool> nudged;
    std::vector<double> evaluated_yaws;
    std::vector<double> evaluated_thetas;
};

/**
 * @brief Derivative tensor: gradient[0] is d/dyaw, gradient[1] is d/dtheta.
 */
struct DerivativeResult
{
    std::array<CoefficientSet, 2> gradient;
    DerivativeDiagnostics diagnostics;

    const CoefficientSet& d_yaw() const { return gradient[0]; }
    const CoefficientSet& d_theta() const { return gradient[1]; }
};

/**
 * @brief Moves a query point away from the fold lines and the theta limits.
 */
SafeEvaluationPoint safe_evaluation_point(double yaw, double theta, double step);

/**
 * @brief Computes d/dyaw and d/dtheta of every channel at every query point.
 * @throws ShapeError, DomainRangeError on invalid queries.
 * @throws UnsupportedConfigurationError for Frame::Both or a non-positive step.
 */
DerivativeResult coefficient_derivatives(const MeasurementTable& table,
                                         const std::vector<double>& yaws,
                                         const std::vector<double>& thetas,
                                         StrategyKind strategy,
                                         Frame frame,
                                         const ChannelFitTable& fits,
                                         double step = default_derivative_step_rad);

/**
 * @brief Token overload for strategy and frame.
 */
DerivativeResult coefficient_derivatives(const MeasurementTable& table,
                                         const std::vector<double>& yaws,
                                         const std::vector<double>& thetas,
                                         const std::string& strategy,
                                         const std::string& frame,
                                         const ChannelFitTable& fits,
                                         double step = default_derivative_step_rad);

} // namespace deckcoef
