/**
 * @file hybrid.hpp
 * @brief Hybrid scheme combining the free fit and the cosine rule.
 *
 * This file is part of the src/coefficients subsystem.
 */

#pragma once
#include <memory>

#include "coefficient_scheme_base.hpp"

/**
 * @brief How the two component results would be blended.
 */
enum class BlendPolicy
{
    Unresolved
};

/**
 * @brief Composite of a data-fit scheme and a cosine-rule scheme.
 *
 * No blend law has been settled, so evaluation is rejected with
 * UnsupportedConfigurationError instead of returning a guessed blend.
 */
class HybridScheme : public deckcoef::CoefficientSchemeBase
{
private:
    std::unique_ptr<deckcoef::CoefficientSchemeBase> fit_scheme_;
    std::unique_ptr<deckcoef::CoefficientSchemeBase> cosine_scheme_;
    BlendPolicy policy_;

public:
    HybridScheme(std::unique_ptr<deckcoef::CoefficientSchemeBase> fit_scheme,
                 std::unique_ptr<deckcoef::CoefficientSchemeBase> cosine_scheme,
                 BlendPolicy policy = BlendPolicy::Unresolved);

    std::string name() const override { return "hybrid"; }

    deckcoef::StrategyKind kind() const override { return deckcoef::StrategyKind::Hybrid; }

    deckcoef::CoefficientSet evaluate(const deckcoef::FoldedQuery& query,
                                      const deckcoef::MeasurementTable& table,
                                      const deckcoef::ChannelFitTable& fits) const override;

    const deckcoef::CoefficientSchemeBase& fit_scheme() const { return *fit_scheme_; }
    const deckcoef::CoefficientSchemeBase& cosine_scheme() const { return *cosine_scheme_; }
    BlendPolicy policy() const { return policy_; }
};
