/**
 * @file constrained_fit.hpp
 * @brief Constrained 2D polynomial fit scheme.
 *
 * This file is part of the src/coefficients subsystem.
 */

#pragma once
#include "coefficient_scheme_base.hpp"

/**
 * @brief Polynomial surface per channel with edge value/slope constraints.
 *
 * Constraints are stated for the canonical [0, 90] deg domain; the quadrant
 * signs carry them to the full circle.
 */
class ConstrainedFitScheme : public deckcoef::CoefficientSchemeBase
{
public:
    std::string name() const override { return "2d_fit_cons"; }

    deckcoef::StrategyKind kind() const override { return deckcoef::StrategyKind::ConstrainedFit; }

    deckcoef::CoefficientSet evaluate(const deckcoef::FoldedQuery& query,
                                      const deckcoef::MeasurementTable& table,
                                      const deckcoef::ChannelFitTable& fits) const override;
};
