#include "free_fit.hpp"

#include "surface_fit/channel_fit_adapter.hpp"

/*This function evaluates the free 2D fit of every channel.
Each channel uses its own free-fit degree and basis.*/
deckcoef::CoefficientSet FreeFitScheme::evaluate(const deckcoef::FoldedQuery& query,
                                                 const deckcoef::MeasurementTable& table,
                                                 const deckcoef::ChannelFitTable& fits) const
{
    return deckcoef::fit_all_channels(table, query, fits, deckcoef::FitMode::Free);
}
