/**
 * @file factory.cpp
 * @brief Implementation of the coefficient scheme factory.
 *
 * Maps strategy tokens and aliases onto scheme instances.
 * This file is part of the src/coefficients subsystem.
 */

#include "factory.hpp"
#include "schemes/free_fit/free_fit.hpp"
#include "schemes/constrained_fit/constrained_fit.hpp"
#include "schemes/cosine_rule/cosine_rule.hpp"
#include "schemes/hybrid/hybrid.hpp"
#include "coefficient_errors.hpp"
#include "string_utils.hpp"

#include <utility>

/**
 * @brief Normalizes strategy names and aliases.
 */
std::string normalize_coefficient_scheme_name(std::string scheme_name)
{
    scheme_name = deckcoef::strutil::lower_copy(deckcoef::strutil::trim_copy(scheme_name));
    if (scheme_name == "free_fit" || scheme_name == "free")
    {
        return "2d_fit_free";
    }
    if (scheme_name == "constrained_fit" || scheme_name == "constrained")
    {
        return "2d_fit_cons";
    }
    if (scheme_name == "cosine_rule" || scheme_name == "cosine")
    {
        return "cos_rule";
    }
    if (scheme_name == "2d" || scheme_name == "cosine_rule_2d")
    {
        return "cos_rule_2d";
    }
    return scheme_name;
}

namespace deckcoef
{

/**
 * @brief Creates the scheme implementing a strategy.
 */
std::unique_ptr<CoefficientSchemeBase> create_coefficient_scheme(StrategyKind kind)
{
    switch (kind)
    {
        case StrategyKind::FreeFit:
            return std::make_unique<FreeFitScheme>();
        case StrategyKind::ConstrainedFit:
            return std::make_unique<ConstrainedFitScheme>();
        case StrategyKind::CosineRule:
            return std::make_unique<CosineRuleScheme>(CosineAttenuation::Yaw);
        case StrategyKind::CosineRule2D:
            return std::make_unique<CosineRuleScheme>(CosineAttenuation::YawAndTilt);
        case StrategyKind::Hybrid:
            return std::make_unique<HybridScheme>(std::make_unique<FreeFitScheme>(),
                                                  std::make_unique<CosineRuleScheme>(CosineAttenuation::Yaw));
    }
    throw UnsupportedConfigurationError("Unknown coefficient strategy");
}

/**
 * @brief Creates a coefficient scheme instance from a configured token.
 */
std::unique_ptr<CoefficientSchemeBase> create_coefficient_scheme(const std::string& scheme_name)
{
    return create_coefficient_scheme(parse_strategy_kind(scheme_name));
}

/**
 * @brief Gets the available coefficient schemes.
 */
std::vector<std::string> get_available_coefficient_schemes()
{
    return {"2d_fit_free", "2d_fit_cons", "cos_rule", "cos_rule_2d", "hybrid"};
}

StrategyKind parse_strategy_kind(const std::string& token)
{
    const std::string normalized = normalize_coefficient_scheme_name(token);
    if (normalized == "2d_fit_free") return StrategyKind::FreeFit;
    if (normalized == "2d_fit_cons") return StrategyKind::ConstrainedFit;
    if (normalized == "cos_rule") return StrategyKind::CosineRule;
    if (normalized == "cos_rule_2d") return StrategyKind::CosineRule2D;
    if (normalized == "hybrid") return StrategyKind::Hybrid;
    throw UnsupportedConfigurationError("Unknown coefficient strategy '" + token +
                                        "' (expected 2D_fit_free, 2D_fit_cons, cos_rule, 2D or hybrid)");
}

Frame parse_frame(const std::string& token)
{
    const std::string normalized = strutil::lower_copy(strutil::trim_copy(token));
    if (normalized == "ls" || normalized == "structural") return Frame::Structural;
    if (normalized == "lnw" || normalized == "wind_normal") return Frame::WindNormal;
    if (normalized == "lnw&ls" || normalized == "ls&lnw" || normalized == "both") return Frame::Both;
    throw UnsupportedConfigurationError("Unknown coefficient frame '" + token + "' (expected Ls, Lnw or Lnw&Ls)");
}

const char* to_string(StrategyKind kind)
{
    switch (kind)
    {
        case StrategyKind::FreeFit: return "2D_fit_free";
        case StrategyKind::ConstrainedFit: return "2D_fit_cons";
        case StrategyKind::CosineRule: return "cos_rule";
        case StrategyKind::CosineRule2D: return "2D";
        case StrategyKind::Hybrid: return "hybrid";
    }
    return "unknown";
}

const char* to_string(Frame frame)
{
    switch (frame)
    {
        case Frame::Structural: return "Ls";
        case Frame::WindNormal: return "Lnw";
        case Frame::Both: return "Lnw&Ls";
    }
    return "unknown";
}

} // namespace deckcoef
