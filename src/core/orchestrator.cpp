/**
 * @file orchestrator.cpp
 * @brief Coefficient evaluation pipeline.
 *
 * Connects folding, the strategy schemes, and the frame rotation.
 * This file belongs to the primary src/core execution layer.
 */

#include "coefficient_orchestrator.hpp"

#include <iostream>
#include <utility>

#include "angle_folding.hpp"
#include "angle_geometry.hpp"
#include "coefficient_errors.hpp"
#include "coefficient_scheme_base.hpp"
#include "log_profile.hpp"

namespace deckcoef
{

/*This function runs the evaluation pipeline.
Validation happens before any fit so invalid input never reaches a solver.*/
CoefficientResult coefficients(const MeasurementTable& table,
                               const std::vector<double>& yaws,
                               const std::vector<double>& thetas,
                               StrategyKind strategy,
                               Frame frame,
                               const ChannelFitTable& fits)
{
    const FoldedQuery query = fold_query(yaws, thetas);
    validate_channel_fit_table(fits, strategy);

    if (!table.is_valid())
    {
        throw TableLoadError("Measurement table '" + table.source + "' is empty or has ragged columns");
    }

    const auto scheme = create_coefficient_scheme(strategy);
    if (log_debug_enabled())
    {
        std::cout << "[COEFFICIENTS] strategy=" << scheme->name() << ", frame=" << to_string(frame)
                  << ", points=" << query.size() << ", samples=" << table.num_samples() << std::endl;
    }

    CoefficientResult result;
    try
    {
        CoefficientSet structural = scheme->evaluate(query, table, fits);

        if (frame == Frame::WindNormal || frame == Frame::Both)
        {
            // The rotation depends on the side the wind comes from, so it uses the unfolded yaws.
            const std::vector<double> skews = skew_angles(yaws, thetas);
            result.wind_normal = rotate_to_wind_normal(build_rotations(yaws, skews), structural);
            if (log_debug_enabled())
            {
                std::cout << "[COEFFICIENTS] rotated " << query.size() << " points to the wind-normal frame" << std::endl;
            }
        }
        if (frame == Frame::Structural || frame == Frame::Both)
        {
            result.structural = std::move(structural);
        }
    }
    catch (const std::exception& e)
    {
        if (log_debug_enabled())
        {
            std::cerr << "Error evaluating " << scheme->name() << " coefficients: " << e.what() << std::endl;
        }
        throw;
    }
    return result;
}

CoefficientResult coefficients(const MeasurementTable& table,
                               const std::vector<double>& yaws,
                               const std::vector<double>& thetas,
                               const std::string& strategy,
                               const std::string& frame,
                               const ChannelFitTable& fits)
{
    return coefficients(table, yaws, thetas, parse_strategy_kind(strategy), parse_frame(frame), fits);
}

CoefficientResult coefficients(const MeasurementTable& table,
                               const std::vector<double>& yaws,
                               const std::vector<double>& thetas,
                               StrategyKind strategy,
                               Frame frame)
{
    return coefficients(table, yaws, thetas, strategy, frame, default_channel_fit_table());
}

} // namespace deckcoef
