/**
 * @file channel_fit_adapter.hpp
 * @brief Applies the polynomial surface fit to each coefficient channel.
 *
 * This file is part of the src/surface_fit subsystem.
 */

#pragma once

#include <cstddef>
#include <exception>
#include <vector>

#include "angle_folding.hpp"
#include "measurement_table.hpp"
#include "surface_fit_base.hpp"

namespace deckcoef
{

enum class FitMode
{
    Free,
    Constrained
};

/**
 * @brief Fit domain: yaw in [0, 90] deg, theta in [-90, 90] deg.
 */
DomainBounds canonical_bounds();

/**
 * @brief Fits one channel over canonical-domain samples and evaluates it at
 * the folded query points, with the quadrant signs applied.
 */
std::vector<double> fit_channel(const MeasurementTable& canonical_table,
                                std::size_t channel,
                                const FoldedQuery& query,
                                const ChannelFitConfig& config,
                                FitMode mode);

/**
 * @brief Fits all six channels with their own configuration.
 *
 * Channels are solved in parallel; any channel failure fails the call.
 */
CoefficientSet fit_all_channels(const MeasurementTable& table,
                                const FoldedQuery& query,
                                const ChannelFitTable& fits,
                                FitMode mode);

/**
 * @brief Rethrows the first captured exception of a parallel loop, if any.
 */
void rethrow_first(const std::vector<std::exception_ptr>& errors);

} // namespace deckcoef
