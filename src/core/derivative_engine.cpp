/**
 * @file derivative_engine.cpp
 * @brief Finite-difference derivatives of the coefficient pipeline.
 *
 * This file belongs to the primary src/core execution layer.
 */

#include "derivative_engine.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <iostream>
#include <sstream>

#include "angle_folding.hpp"
#include "coefficient_errors.hpp"
#include "coefficient_orchestrator.hpp"
#include "log_profile.hpp"
#include "physical_constants.hpp"
#include "surface_fit/channel_fit_adapter.hpp"

namespace deckcoef
{

namespace
{
using physical_constants::folding_boundaries_rad;
using physical_constants::half_pi;
using physical_constants::pi;

constexpr int kNumEvaluations = 5;

// Evaluation offsets (yaw, theta) in units of the step.
constexpr double kOffsets[kNumEvaluations][2] = {
    {0.0, 0.0},
    {1.0, 0.0},
    {-1.0, 0.0},
    {0.0, 1.0},
    {0.0, -1.0}};

double distance_to_fold(double yaw)
{
    double nearest = 2.0 * pi;
    for (double boundary : folding_boundaries_rad)
    {
        nearest = std::min(nearest, std::abs(yaw - boundary));
    }
    return nearest;
}

void add_warning(DerivativeDiagnostics& diagnostics, const std::string& message)
{
    std::cerr << "Warning: " << message << std::endl;
    diagnostics.warnings.push_back(message);
}
}

/*This function applies the singularity guard to one point.
Yaw moves by 2.1 steps away from the nearest fold line; theta moves back inside +/-90 deg.*/
SafeEvaluationPoint safe_evaluation_point(double yaw, double theta, double step)
{
    SafeEvaluationPoint out;
    out.yaw = yaw;
    out.theta = theta;

    for (double boundary : folding_boundaries_rad)
    {
        if (std::abs(yaw - boundary) < step)
        {
            double direction = (yaw >= boundary) ? 1.0 : -1.0;
            if (boundary >= pi) direction = -1.0;
            if (boundary <= -pi) direction = 1.0;
            out.yaw = boundary + direction * derivative_nudge_factor * step;
            out.yaw_nudged = true;
            break;
        }
    }

    if (std::abs(theta) > half_pi - step)
    {
        out.theta = std::copysign(half_pi - derivative_nudge_factor * step, theta);
        out.theta_nudged = true;
    }

    out.near_boundary = distance_to_fold(out.yaw) < step;
    return out;
}

/*This function computes the centered differences.
The five evaluations are independent and run in parallel; any failure fails the whole call.*/
DerivativeResult coefficient_derivatives(const MeasurementTable& table,
                                         const std::vector<double>& yaws,
                                         const std::vector<double>& thetas,
                                         StrategyKind strategy,
                                         Frame frame,
                                         const ChannelFitTable& fits,
                                         double step)
{
    validate_query_angles(yaws, thetas);
    if (!std::isfinite(step) || step <= 0.0)
    {
        std::ostringstream oss;
        oss << "Derivative step must be a positive angle in radians (got " << step << ")";
        throw UnsupportedConfigurationError(oss.str());
    }
    if (frame == Frame::Both)
    {
        throw UnsupportedConfigurationError("Derivatives are computed in one frame at a time; use Ls");
    }

    DerivativeResult result;
    DerivativeDiagnostics& diagnostics = result.diagnostics;
    if (frame == Frame::WindNormal)
    {
        add_warning(diagnostics, "Wind-normal derivatives ignore the theta dependence of the frame rotation "
                                 "and may be wrong; use the Ls frame");
    }

    const std::size_t n = yaws.size();
    std::vector<double> center_yaws(n), center_thetas(n);
    diagnostics.nudged.assign(n, false);
    for (std::size_t i = 0; i < n; ++i)
    {
        const SafeEvaluationPoint point = safe_evaluation_point(yaws[i], thetas[i], step);
        center_yaws[i] = point.yaw;
        center_thetas[i] = point.theta;
        diagnostics.nudged[i] = point.yaw_nudged || point.theta_nudged;

        if (point.yaw_nudged)
        {
            std::ostringstream oss;
            oss << "Yaw " << yaws[i] << " rad at index " << i << " is within one step of a fold line; "
                << "derivative evaluated at " << point.yaw << " rad";
            add_warning(diagnostics, oss.str());
        }
        if (point.theta_nudged)
        {
            std::ostringstream oss;
            oss << "Theta " << thetas[i] << " rad at index " << i << " is within one step of +/-90 deg; "
                << "derivative evaluated at " << point.theta << " rad";
            add_warning(diagnostics, oss.str());
        }
        if (point.near_boundary)
        {
            std::ostringstream oss;
            oss << "Yaw " << point.yaw << " rad at index " << i
                << " is still within one step of a fold line; the derivative could be wrong";
            add_warning(diagnostics, oss.str());
        }
    }
    diagnostics.evaluated_yaws = center_yaws;
    diagnostics.evaluated_thetas = center_thetas;

    std::array<CoefficientSet, kNumEvaluations> evaluations;
    std::vector<std::exception_ptr> errors(kNumEvaluations);

    #pragma omp parallel for schedule(static)
    for (int e = 0; e < kNumEvaluations; ++e)
    {
        try
        {
            std::vector<double> eval_yaws(center_yaws);
            std::vector<double> eval_thetas(center_thetas);
            for (std::size_t i = 0; i < n; ++i)
            {
                eval_yaws[i] += kOffsets[e][0] * step;
                eval_thetas[i] += kOffsets[e][1] * step;
            }
            CoefficientResult evaluated = coefficients(table, eval_yaws, eval_thetas, strategy, frame, fits);
            evaluations[e] = (frame == Frame::WindNormal) ? std::move(*evaluated.wind_normal)
                                                          : std::move(*evaluated.structural);
        }
        catch (...)
        {
            errors[e] = std::current_exception();
        }
    }
    rethrow_first(errors);

    for (int axis = 0; axis < 2; ++axis)
    {
        const CoefficientSet& plus = evaluations[1 + 2 * axis];
        const CoefficientSet& minus = evaluations[2 + 2 * axis];
        CoefficientSet& out = result.gradient[axis];
        out.resize(n);
        for (std::size_t c = 0; c < kNumChannels; ++c)
        {
            for (std::size_t i = 0; i < n; ++i)
            {
                out.channels[c][i] = (plus.channels[c][i] - minus.channels[c][i]) / (2.0 * step);
            }
        }
    }

    if (log_debug_enabled())
    {
        std::cout << "[DERIVATIVES] " << n << " points, step=" << step << " rad, "
                  << diagnostics.warnings.size() << " warnings" << std::endl;
    }
    return result;
}

DerivativeResult coefficient_derivatives(const MeasurementTable& table,
                                         const std::vector<double>& yaws,
                                         const std::vector<double>& thetas,
                                         const std::string& strategy,
                                         const std::string& frame,
                                         const ChannelFitTable& fits,
                                         double step)
{
    return coefficient_derivatives(table, yaws, thetas, parse_strategy_kind(strategy), parse_frame(frame), fits, step);
}

} // namespace deckcoef
