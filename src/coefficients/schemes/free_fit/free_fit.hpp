/**
 * @file free_fit.hpp
 * @brief Unconstrained 2D polynomial fit scheme.
 *
 * This file is part of the src/coefficients subsystem.
 */

#pragma once
#include "coefficient_scheme_base.hpp"

/**
 * @brief Least-squares polynomial surface per channel, no boundary constraints.
 */
class FreeFitScheme : public deckcoef::CoefficientSchemeBase
{
public:
    std::string name() const override { return "2d_fit_free"; }

    deckcoef::StrategyKind kind() const override { return deckcoef::StrategyKind::FreeFit; }

    deckcoef::CoefficientSet evaluate(const deckcoef::FoldedQuery& query,
                                      const deckcoef::MeasurementTable& table,
                                      const deckcoef::ChannelFitTable& fits) const override;
};
