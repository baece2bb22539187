#include "hybrid.hpp"
#include "coefficient_errors.hpp"
#include <utility>

HybridScheme::HybridScheme(std::unique_ptr<deckcoef::CoefficientSchemeBase> fit_scheme,
                           std::unique_ptr<deckcoef::CoefficientSchemeBase> cosine_scheme,
                           BlendPolicy policy)
    : fit_scheme_(std::move(fit_scheme)),
      cosine_scheme_(std::move(cosine_scheme)),
      policy_(policy)
{
    if (!fit_scheme_ || !cosine_scheme_)
    {
        throw deckcoef::UnsupportedConfigurationError("Hybrid scheme needs both component schemes");
    }
}

/*This function rejects evaluation while the blend policy is unresolved.*/
deckcoef::CoefficientSet HybridScheme::evaluate(const deckcoef::FoldedQuery&,
                                                const deckcoef::MeasurementTable&,
                                                const deckcoef::ChannelFitTable&) const
{
    switch (policy_)
    {
        case BlendPolicy::Unresolved:
        default:
            throw deckcoef::UnsupportedConfigurationError(
                "Hybrid strategy has no blend policy between '" + fit_scheme_->name() +
                "' and '" + cosine_scheme_->name() + "'; use one of them directly");
    }
}
