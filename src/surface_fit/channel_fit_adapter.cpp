#include "channel_fit_adapter.hpp"

#include <iostream>
#include <omp.h>

#include "coefficient_errors.hpp"
#include "log_profile.hpp"
#include "physical_constants.hpp"

/*This file contains the adapter between the coefficient channels and the surface fit.
It selects the samples of a channel, forwards its configuration, and restores the quadrant signs.*/

namespace deckcoef
{

DomainBounds canonical_bounds()
{
    DomainBounds bounds;
    bounds.x0_min = 0.0;
    bounds.x0_max = physical_constants::half_pi;
    bounds.x1_min = -physical_constants::half_pi;
    bounds.x1_max = physical_constants::half_pi;
    return bounds;
}

/*This function fits one channel and applies the quadrant signs.
Takes samples already restricted to the canonical domain.*/
std::vector<double> fit_channel(const MeasurementTable& canonical_table,
                                std::size_t channel,
                                const FoldedQuery& query,
                                const ChannelFitConfig& config,
                                FitMode mode)
{
    if (channel >= kNumChannels)
    {
        throw UnsupportedConfigurationError("Channel index out of range");
    }

    SurfaceFitRequest request;
    request.samples.x0 = canonical_table.yaw_rad;
    request.samples.x1 = canonical_table.theta_rad;
    request.samples.values = canonical_table.coefficients[channel];
    request.query_x0 = query.yaws;
    request.query_x1 = query.thetas;
    request.bounds = canonical_bounds();
    request.degree_type = config.degree_type;
    request.solver = config.solver;

    if (mode == FitMode::Free)
    {
        request.degree = config.free_degree;
    }
    else
    {
        request.degree = config.constrained_degree;
        request.inequality = config.inequality;
        request.constraints = parse_boundary_constraints(config.constraints);
    }

    const SurfaceFitResult result = fit_polynomial_surface(request);
    if (log_debug_enabled())
    {
        std::cout << "  " << kChannelNames[channel] << (mode == FitMode::Free ? " free" : " constrained")
                  << " fit: degree " << request.degree << " (" << to_string(request.degree_type)
                  << "), rms residual " << result.rms_residual << ", pinned " << result.pinned_points << std::endl;
    }

    std::vector<double> values = result.fitted;
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        values[i] *= query.signs[i][channel];
    }
    return values;
}

/*This function fits every channel.
Exceptions are captured per channel and rethrown after the parallel loop.*/
CoefficientSet fit_all_channels(const MeasurementTable& table,
                                const FoldedQuery& query,
                                const ChannelFitTable& fits,
                                FitMode mode)
{
    const MeasurementTable canonical = canonical_domain_samples(table);

    CoefficientSet out;
    out.resize(query.size());
    std::vector<std::exception_ptr> errors(kNumChannels);
    if (log_debug_enabled())
    {
        std::cout << "Fitting " << kNumChannels << " channels on " << canonical.num_samples()
                  << " samples, up to " << omp_get_max_threads() << " threads" << std::endl;
    }

    #pragma omp parallel for schedule(dynamic)
    for (int c = 0; c < static_cast<int>(kNumChannels); ++c)
    {
        const std::size_t channel = static_cast<std::size_t>(c);
        try
        {
            out.channels[channel] = fit_channel(canonical, channel, query, fits[channel], mode);
        }
        catch (...)
        {
            errors[channel] = std::current_exception();
        }
    }

    rethrow_first(errors);
    return out;
}

void rethrow_first(const std::vector<std::exception_ptr>& errors)
{
    for (const auto& error : errors)
    {
        if (error)
        {
            std::rethrow_exception(error);
        }
    }
}

} // namespace deckcoef
