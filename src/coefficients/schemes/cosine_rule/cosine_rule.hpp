/**
 * @file cosine_rule.hpp
 * @brief Cosine-rule extrapolation scheme.
 *
 * This file is part of the src/coefficients subsystem.
 */

#pragma once
#include "coefficient_scheme_base.hpp"

enum class CosineAttenuation
{
    Yaw,         // cos^2(yaw)
    YawAndTilt   // sin^2(theta) + cos^2(yaw) cos^2(theta)
};

/**
 * @brief Attenuation factor applied to the zero-yaw coefficient.
 */
double cosine_attenuation(CosineAttenuation attenuation, double yaw, double theta);

/**
 * @brief C(yaw, theta) = C(0, theta) * attenuation(yaw, theta).
 *
 * C(0, theta) comes from a 1D polynomial fit in theta of the zero-yaw
 * measurement slice. Channels C1, C5 and C6 are zero under this model.
 * The tilt variant evaluates C(0, .) at the skew angle of the normal wind.
 */
class CosineRuleScheme : public deckcoef::CoefficientSchemeBase
{
private:
    CosineAttenuation attenuation_;

public:
    /**
     * @brief Constructs the scheme with the given attenuation law.
     */
    explicit CosineRuleScheme(CosineAttenuation attenuation = CosineAttenuation::Yaw);

    std::string name() const override;

    deckcoef::StrategyKind kind() const override;

    deckcoef::CoefficientSet evaluate(const deckcoef::FoldedQuery& query,
                                      const deckcoef::MeasurementTable& table,
                                      const deckcoef::ChannelFitTable& fits) const override;

    /**
     * @brief Returns whether the channel follows the cosine rule (otherwise zero).
     */
    static bool is_cosine_channel(std::size_t channel);
};
