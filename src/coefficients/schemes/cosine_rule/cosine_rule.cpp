#include "cosine_rule.hpp"
#include "angle_geometry.hpp"
#include "coefficient_errors.hpp"
#include "log_profile.hpp"
#include <cmath>
#include <iostream>

/*This file contains the implementation of the cosine-rule scheme.
Only the zero-yaw slice of the measurements is fitted; yaw dependence comes from the attenuation law.*/

double cosine_attenuation(CosineAttenuation attenuation, double yaw, double theta)
{
    const double cy = std::cos(yaw);
    if (attenuation == CosineAttenuation::YawAndTilt)
    {
        const double st = std::sin(theta);
        const double ct = std::cos(theta);
        return st * st + cy * cy * ct * ct;
    }
    return cy * cy;
}

CosineRuleScheme::CosineRuleScheme(CosineAttenuation attenuation)
    : attenuation_(attenuation)
{
}

std::string CosineRuleScheme::name() const
{
    return attenuation_ == CosineAttenuation::YawAndTilt ? "cos_rule_2d" : "cos_rule";
}

deckcoef::StrategyKind CosineRuleScheme::kind() const
{
    return attenuation_ == CosineAttenuation::YawAndTilt ? deckcoef::StrategyKind::CosineRule2D
                                                          : deckcoef::StrategyKind::CosineRule;
}

bool CosineRuleScheme::is_cosine_channel(std::size_t channel)
{
    return channel == static_cast<std::size_t>(deckcoef::Channel::C2) ||
           channel == static_cast<std::size_t>(deckcoef::Channel::C3) ||
           channel == static_cast<std::size_t>(deckcoef::Channel::C4);
}

/*This function evaluates the cosine rule.
Takes the folded query and returns zero-yaw fits scaled by the attenuation, with signs applied.*/
deckcoef::CoefficientSet CosineRuleScheme::evaluate(const deckcoef::FoldedQuery& query,
                                                    const deckcoef::MeasurementTable& table,
                                                    const deckcoef::ChannelFitTable& fits) const
{
    const deckcoef::MeasurementTable slice = deckcoef::zero_yaw_slice(table);
    if (slice.num_samples() == 0)
    {
        throw deckcoef::FitError("Cosine rule needs measurement samples at zero yaw");
    }

    // Thetas at which C(0, .) is read: the query thetas, or the skew angles for the tilt law.
    const std::vector<double> zero_yaw_thetas = attenuation_ == CosineAttenuation::YawAndTilt
        ? deckcoef::skew_angles(query.yaws, query.thetas)
        : query.thetas;

    std::vector<double> factor(query.size(), 0.0);
    for (std::size_t i = 0; i < query.size(); ++i)
    {
        factor[i] = cosine_attenuation(attenuation_, query.yaws[i], query.thetas[i]);
    }

    deckcoef::CoefficientSet out;
    out.resize(query.size());
    for (std::size_t c = 0; c < deckcoef::kNumChannels; ++c)
    {
        if (!is_cosine_channel(c))
        {
            continue;
        }
        const std::vector<double> at_zero_yaw = deckcoef::fit_polynomial_curve(
            slice.theta_rad, slice.coefficients[c], fits[c].free_degree, zero_yaw_thetas, fits[c].solver);
        for (std::size_t i = 0; i < query.size(); ++i)
        {
            out.channels[c][i] = at_zero_yaw[i] * query.signs[i][c] * factor[i];
        }
    }

    if (deckcoef::log_debug_enabled())
    {
        std::cout << "  " << name() << ": zero-yaw slice with " << slice.num_samples() << " samples" << std::endl;
    }
    return out;
}
