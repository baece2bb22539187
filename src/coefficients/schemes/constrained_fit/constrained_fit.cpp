#include "constrained_fit.hpp"

#include "surface_fit/channel_fit_adapter.hpp"

/*This function evaluates the constrained 2D fit of every channel.*/
deckcoef::CoefficientSet ConstrainedFitScheme::evaluate(const deckcoef::FoldedQuery& query,
                                                        const deckcoef::MeasurementTable& table,
                                                        const deckcoef::ChannelFitTable& fits) const
{
    return deckcoef::fit_all_channels(table, query, fits, deckcoef::FitMode::Constrained);
}
