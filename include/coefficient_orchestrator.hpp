#pragma once

#include <string>
#include <vector>

#include "coefficient_types.hpp"
#include "measurement_table.hpp"
#include "surface_fit_base.hpp"

/**
 * @file coefficient_orchestrator.hpp
 * @brief Public entry point for evaluating deck coefficients.
 *
 * Validates the query, folds it into the canonical domain, runs the selected
 * strategy, and rotates into the wind-normal frame when that frame is
 * requested. Inputs are never modified.
 */

namespace deckcoef
{

/**
 * @brief Evaluates the six coefficient channels at (yaw, theta) pairs.
 * @param table Measurement table used for fitting.
 * @param yaws Query yaw angles in radians, |yaw| <= pi.
 * @param thetas Query theta angles in radians, |theta| <= pi/2.
 * @param strategy Interpolation/extrapolation strategy.
 * @param frame Output frame selection.
 * @param fits Per-channel fit configuration.
 * @return Requested frames; unrequested frames are empty.
 * @throws ShapeError, DomainRangeError, UnsupportedConfigurationError, FitError.
 */
CoefficientResult coefficients(const MeasurementTable& table,
                               const std::vector<double>& yaws,
                               const std::vector<double>& thetas,
                               StrategyKind strategy,
                               Frame frame,
                               const ChannelFitTable& fits);

/**
 * @brief Token overload: strategy and frame given as configuration strings.
 */
CoefficientResult coefficients(const MeasurementTable& table,
                               const std::vector<double>& yaws,
                               const std::vector<double>& thetas,
                               const std::string& strategy,
                               const std::string& frame,
                               const ChannelFitTable& fits);

/**
 * @brief Convenience overload using the default channel fit table.
 */
CoefficientResult coefficients(const MeasurementTable& table,
                               const std::vector<double>& yaws,
                               const std::vector<double>& thetas,
                               StrategyKind strategy,
                               Frame frame);

} // namespace deckcoef
