#pragma once

#include <array>
#include <string>
#include <vector>

#include "coefficient_types.hpp"

/**
 * @file surface_fit_base.hpp
 * @brief Polynomial surface fit types, per-channel configuration, and solver entry points.
 *
 * Coordinates follow the fit convention x0 = yaw and x1 = theta, both in
 * radians. Boundary constraints are named with the grammar
 *   <quantity>_is_<value>_at_<anchor>[_at_<anchor>]
 * where quantity is F, dF/dx0 or dF/dx1 and anchor is one of x0_start,
 * x0_end, x0_middle, x1_start, x1_end, x1_middle. A single anchor constrains
 * a whole edge line, two anchors constrain one point.
 */

namespace deckcoef
{

enum class DegreeType
{
    Max,   // x0^i * x1^j with i, j <= degree
    Total  // x0^i * x1^j with i + j <= degree
};

enum class InequalityKind
{
    None,
    Positivity,
    Negativity
};

enum class FitSolver
{
    Qr,  // column-pivoting Householder QR
    Svd  // divide-and-conquer SVD
};

struct DomainBounds
{
    double x0_min = 0.0;
    double x0_max = 0.0;
    double x1_min = 0.0;
    double x1_max = 0.0;
};

enum class ConstraintQuantity
{
    Value,
    DerivativeX0,
    DerivativeX1
};

enum class ConstraintAnchor
{
    Free,
    Start,
    Middle,
    End
};

/**
 * @brief One parsed equality constraint on the fitted surface.
 */
struct BoundaryConstraint
{
    ConstraintQuantity quantity = ConstraintQuantity::Value;
    double value = 0.0;
    ConstraintAnchor x0 = ConstraintAnchor::Free;
    ConstraintAnchor x1 = ConstraintAnchor::Free;
    std::string label;
};

/**
 * @brief Scattered samples of one channel.
 */
struct SurfaceSamples
{
    std::vector<double> x0;
    std::vector<double> x1;
    std::vector<double> values;
};

struct SurfaceFitRequest
{
    SurfaceSamples samples;
    std::vector<double> query_x0;
    std::vector<double> query_x1;
    DomainBounds bounds;
    int degree = 2;
    DegreeType degree_type = DegreeType::Max;
    InequalityKind inequality = InequalityKind::None;
    std::vector<BoundaryConstraint> constraints;
    FitSolver solver = FitSolver::Qr;
};

struct SurfaceFitResult
{
    std::vector<double> coefficients;
    std::vector<double> fitted;
    double rms_residual = 0.0;
    int pinned_points = 0;
};

/**
 * @brief Fit configuration of one coefficient channel.
 *
 * A negative degree means the channel has no configuration for that mode.
 */
struct ChannelFitConfig
{
    int free_degree = -1;
    int constrained_degree = -1;
    DegreeType degree_type = DegreeType::Max;
    InequalityKind inequality = InequalityKind::None;
    std::vector<std::string> constraints;
    FitSolver solver = FitSolver::Qr;
};

using ChannelFitTable = std::array<ChannelFitConfig, kNumChannels>;

/**
 * @brief Reference per-channel configuration for the SOH deck section.
 */
ChannelFitTable default_channel_fit_table();

/**
 * @brief Checks that every channel carries what the strategy needs.
 * @throws UnsupportedConfigurationError naming the first offending channel.
 */
void validate_channel_fit_table(const ChannelFitTable& table, StrategyKind strategy);

/**
 * @brief Parses a named constraint such as "dF/dx0_is_0_at_x0_end_at_x1_middle".
 * @throws UnsupportedConfigurationError for names outside the grammar.
 */
BoundaryConstraint parse_boundary_constraint(const std::string& name);

/**
 * @brief Parses every constraint name of a channel.
 */
std::vector<BoundaryConstraint> parse_boundary_constraints(const std::vector<std::string>& names);

/**
 * @brief Fits a bivariate polynomial and evaluates it at the query points.
 * @throws FitError on singular, inconsistent, or non-converging problems.
 */
SurfaceFitResult fit_polynomial_surface(const SurfaceFitRequest& request);

/**
 * @brief Fits a univariate least-squares polynomial and evaluates it at query points.
 * @throws FitError when there are not enough distinct samples for the degree.
 */
std::vector<double> fit_polynomial_curve(const std::vector<double>& x,
                                         const std::vector<double>& values,
                                         int degree,
                                         const std::vector<double>& query_x,
                                         FitSolver solver = FitSolver::Qr);

bool parse_degree_type(const std::string& value, DegreeType& out);
bool parse_inequality_kind(const std::string& value, InequalityKind& out);
bool parse_fit_solver(const std::string& value, FitSolver& out);

const char* to_string(DegreeType type);
const char* to_string(InequalityKind kind);
const char* to_string(FitSolver solver);

} // namespace deckcoef
