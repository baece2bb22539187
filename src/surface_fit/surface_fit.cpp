/**
 * @file surface_fit.cpp
 * @brief Implementation for the surface fit module.
 *
 * Provides constraint parsing, collocation of boundary constraints, the
 * active-set loop for sign constraints, and the reference channel
 * configuration. This file is part of the src/surface_fit subsystem.
 */

#include "surface_fit_base.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <sstream>

#include "base/constrained_lsq.hpp"
#include "base/polynomial_basis.hpp"
#include "coefficient_errors.hpp"
#include "log_profile.hpp"
#include "string_utils.hpp"

namespace deckcoef
{

namespace
{
constexpr int kMaxSupportedDegree = 8;
constexpr int kInequalityGridPoints = 21;
constexpr double kInequalityTolerance = 1.0e-9;

/**
 * @brief Parses one "x0_start"-style anchor and stores it on the matching axis.
 */
bool parse_anchor(const std::string& text, BoundaryConstraint& out)
{
    if (text.size() < 4 || text[0] != 'x' || text[2] != '_')
    {
        return false;
    }

    const std::string position = text.substr(3);
    ConstraintAnchor anchor = ConstraintAnchor::Free;
    if (position == "start") anchor = ConstraintAnchor::Start;
    else if (position == "end") anchor = ConstraintAnchor::End;
    else if (position == "middle") anchor = ConstraintAnchor::Middle;
    else return false;

    if (text[1] == '0' && out.x0 == ConstraintAnchor::Free)
    {
        out.x0 = anchor;
        return true;
    }
    if (text[1] == '1' && out.x1 == ConstraintAnchor::Free)
    {
        out.x1 = anchor;
        return true;
    }
    return false;
}

/**
 * @brief Returns the coordinate of an anchored position within [lo, hi].
 */
double anchor_coordinate(ConstraintAnchor anchor, double lo, double hi)
{
    switch (anchor)
    {
        case ConstraintAnchor::Start:
            return lo;
        case ConstraintAnchor::End:
            return hi;
        case ConstraintAnchor::Middle:
        case ConstraintAnchor::Free:
        default:
            return 0.5 * (lo + hi);
    }
}

/**
 * @brief Evenly spaced collocation points on [lo, hi], including both ends.
 */
std::vector<double> collocation_points(double lo, double hi, int count)
{
    std::vector<double> points;
    if (count <= 1)
    {
        points.push_back(0.5 * (lo + hi));
        return points;
    }
    points.reserve(static_cast<std::size_t>(count));
    for (int k = 0; k < count; ++k)
    {
        points.push_back(lo + (hi - lo) * static_cast<double>(k) / static_cast<double>(count - 1));
    }
    return points;
}

/**
 * @brief Appends the collocation rows of every boundary constraint.
 *
 * An edge constraint holds for a polynomial of degree d along the free axis
 * once it holds at d + 1 distinct points of that axis.
 */
void build_constraint_rows(const std::vector<std::pair<int, int>>& terms,
                           const SurfaceFitRequest& request,
                           std::vector<Eigen::RowVectorXd>& rows,
                           std::vector<double>& targets)
{
    const DomainBounds& b = request.bounds;
    const int samples_per_edge = request.degree + 1;

    for (const auto& constraint : request.constraints)
    {
        std::vector<double> x0_points;
        std::vector<double> x1_points;
        if (constraint.x0 == ConstraintAnchor::Free)
        {
            x0_points = collocation_points(b.x0_min, b.x0_max, samples_per_edge);
        }
        else
        {
            x0_points.push_back(anchor_coordinate(constraint.x0, b.x0_min, b.x0_max));
        }
        if (constraint.x1 == ConstraintAnchor::Free)
        {
            x1_points = collocation_points(b.x1_min, b.x1_max, samples_per_edge);
        }
        else
        {
            x1_points.push_back(anchor_coordinate(constraint.x1, b.x1_min, b.x1_max));
        }

        for (double x0 : x0_points)
        {
            for (double x1 : x1_points)
            {
                rows.push_back(polynomial_basis::row(terms, constraint.quantity, x0, x1));
                targets.push_back(constraint.value);
            }
        }
    }
}

/**
 * @brief Stacks constraint rows into a matrix and target vector.
 */
void stack_rows(const std::vector<Eigen::RowVectorXd>& rows,
                const std::vector<double>& targets,
                Eigen::Index n_terms,
                Eigen::MatrixXd& C,
                Eigen::VectorXd& d)
{
    C.resize(static_cast<Eigen::Index>(rows.size()), n_terms);
    d.resize(static_cast<Eigen::Index>(targets.size()));
    for (std::size_t r = 0; r < rows.size(); ++r)
    {
        C.row(static_cast<Eigen::Index>(r)) = rows[r];
        d(static_cast<Eigen::Index>(r)) = targets[r];
    }
}

/**
 * @brief Evaluates a fitted polynomial at the given points.
 */
std::vector<double> evaluate(const std::vector<std::pair<int, int>>& terms,
                             const Eigen::VectorXd& coefficients,
                             const std::vector<double>& x0,
                             const std::vector<double>& x1)
{
    std::vector<double> out(x0.size(), 0.0);
    for (std::size_t p = 0; p < x0.size(); ++p)
    {
        out[p] = polynomial_basis::row(terms, ConstraintQuantity::Value, x0[p], x1[p]).dot(coefficients);
    }
    return out;
}

/**
 * @brief Checks sample vectors for matching sizes and finite values.
 */
void check_samples(const SurfaceSamples& samples)
{
    if (samples.x0.size() != samples.values.size() || samples.x1.size() != samples.values.size())
    {
        throw FitError("Surface samples have mismatched coordinate and value counts");
    }
    if (samples.values.empty())
    {
        throw FitError("Surface fit needs at least one sample");
    }
    for (std::size_t p = 0; p < samples.values.size(); ++p)
    {
        if (!std::isfinite(samples.x0[p]) || !std::isfinite(samples.x1[p]) || !std::isfinite(samples.values[p]))
        {
            std::ostringstream oss;
            oss << "Surface sample " << p << " is not finite";
            throw FitError(oss.str());
        }
    }
}
}

/*This function parses one named boundary constraint.
Takes a name like "F_is_-2_at_x1_start" and returns the structured constraint.*/
BoundaryConstraint parse_boundary_constraint(const std::string& name)
{
    BoundaryConstraint out;
    out.label = strutil::trim_copy(name);

    const std::string is_token = "_is_";
    const std::string at_token = "_at_";
    const std::size_t is_pos = out.label.find(is_token);
    const std::size_t at_pos = out.label.find(at_token, is_pos == std::string::npos ? 0 : is_pos + is_token.size());
    if (is_pos == std::string::npos || at_pos == std::string::npos)
    {
        throw UnsupportedConfigurationError("Unrecognized boundary constraint '" + name + "'");
    }

    const std::string quantity = out.label.substr(0, is_pos);
    if (quantity == "F") out.quantity = ConstraintQuantity::Value;
    else if (quantity == "dF/dx0") out.quantity = ConstraintQuantity::DerivativeX0;
    else if (quantity == "dF/dx1") out.quantity = ConstraintQuantity::DerivativeX1;
    else throw UnsupportedConfigurationError("Unrecognized constrained quantity in '" + name + "'");

    const std::string value_text = out.label.substr(is_pos + is_token.size(), at_pos - is_pos - is_token.size());
    try
    {
        std::size_t consumed = 0;
        out.value = std::stod(value_text, &consumed);
        if (consumed != value_text.size())
        {
            throw UnsupportedConfigurationError("Invalid constraint value in '" + name + "'");
        }
    }
    catch (const std::logic_error&)
    {
        throw UnsupportedConfigurationError("Invalid constraint value in '" + name + "'");
    }

    std::size_t cursor = at_pos + at_token.size();
    while (cursor <= out.label.size())
    {
        std::size_t next = out.label.find(at_token, cursor);
        if (next == std::string::npos) next = out.label.size();
        if (!parse_anchor(out.label.substr(cursor, next - cursor), out))
        {
            throw UnsupportedConfigurationError("Invalid constraint anchor in '" + name + "'");
        }
        cursor = next + at_token.size();
    }

    if (out.x0 == ConstraintAnchor::Free && out.x1 == ConstraintAnchor::Free)
    {
        throw UnsupportedConfigurationError("Constraint '" + name + "' has no anchor");
    }
    return out;
}

std::vector<BoundaryConstraint> parse_boundary_constraints(const std::vector<std::string>& names)
{
    std::vector<BoundaryConstraint> out;
    out.reserve(names.size());
    for (const auto& name : names)
    {
        out.push_back(parse_boundary_constraint(name));
    }
    return out;
}

/*This function fits the polynomial surface of one channel.
Equality constraints are collocated along their edges; sign constraints are enforced
on a check grid by pinning the worst violation to zero until none remain.*/
SurfaceFitResult fit_polynomial_surface(const SurfaceFitRequest& request)
{
    check_samples(request.samples);
    if (request.degree < 0 || request.degree > kMaxSupportedDegree)
    {
        std::ostringstream oss;
        oss << "Unsupported polynomial degree " << request.degree;
        throw FitError(oss.str());
    }
    if (request.query_x0.size() != request.query_x1.size())
    {
        throw FitError("Query coordinate vectors have different sizes");
    }

    const auto terms = polynomial_basis::exponents(request.degree, request.degree_type);
    const Eigen::Index n_terms = static_cast<Eigen::Index>(terms.size());
    const Eigen::MatrixXd A = polynomial_basis::design_matrix(terms, request.samples.x0, request.samples.x1);
    const Eigen::VectorXd y = Eigen::Map<const Eigen::VectorXd>(request.samples.values.data(),
                                                               static_cast<Eigen::Index>(request.samples.values.size()));

    if (log_debug_enabled() && A.rows() < n_terms)
    {
        std::cout << "  surface fit: " << A.rows() << " samples for " << n_terms
                  << " terms, relying on constraints and minimum-norm solve" << std::endl;
    }

    std::vector<Eigen::RowVectorXd> rows;
    std::vector<double> targets;
    build_constraint_rows(terms, request, rows, targets);

    Eigen::MatrixXd C;
    Eigen::VectorXd d;
    stack_rows(rows, targets, n_terms, C, d);
    Eigen::VectorXd coefficients = constrained_lsq::solve(A, y, C, d, request.solver);

    int pinned = 0;
    if (request.inequality != InequalityKind::None)
    {
        const double sign = request.inequality == InequalityKind::Positivity ? 1.0 : -1.0;
        const auto grid_x0 = collocation_points(request.bounds.x0_min, request.bounds.x0_max, kInequalityGridPoints);
        const auto grid_x1 = collocation_points(request.bounds.x1_min, request.bounds.x1_max, kInequalityGridPoints);
        const int max_iterations = kInequalityGridPoints * kInequalityGridPoints;

        for (int iteration = 0;; ++iteration)
        {
            double worst = kInequalityTolerance;
            double worst_x0 = 0.0;
            double worst_x1 = 0.0;
            bool violated = false;
            for (double gx0 : grid_x0)
            {
                for (double gx1 : grid_x1)
                {
                    const double f = polynomial_basis::row(terms, ConstraintQuantity::Value, gx0, gx1).dot(coefficients);
                    const double violation = -sign * f;
                    if (violation > worst)
                    {
                        worst = violation;
                        worst_x0 = gx0;
                        worst_x1 = gx1;
                        violated = true;
                    }
                }
            }
            if (!violated)
            {
                break;
            }
            if (iteration >= max_iterations)
            {
                throw FitError("Sign constraint did not converge on the check grid");
            }

            rows.push_back(polynomial_basis::row(terms, ConstraintQuantity::Value, worst_x0, worst_x1));
            targets.push_back(0.0);
            stack_rows(rows, targets, n_terms, C, d);
            coefficients = constrained_lsq::solve(A, y, C, d, request.solver);
            ++pinned;
        }
    }

    SurfaceFitResult result;
    result.coefficients.assign(coefficients.data(), coefficients.data() + coefficients.size());
    result.fitted = evaluate(terms, coefficients, request.query_x0, request.query_x1);
    result.pinned_points = pinned;
    const Eigen::VectorXd residual = A * coefficients - y;
    result.rms_residual = std::sqrt(residual.squaredNorm() / static_cast<double>(residual.size()));
    return result;
}

/*This function fits a 1D polynomial through (x, value) samples.*/
std::vector<double> fit_polynomial_curve(const std::vector<double>& x,
                                         const std::vector<double>& values,
                                         int degree,
                                         const std::vector<double>& query_x,
                                         FitSolver solver)
{
    if (x.size() != values.size() || x.empty())
    {
        throw FitError("Curve fit needs matching, non-empty sample vectors");
    }
    if (degree < 0 || degree > kMaxSupportedDegree)
    {
        std::ostringstream oss;
        oss << "Unsupported polynomial degree " << degree;
        throw FitError(oss.str());
    }

    std::vector<double> distinct = x;
    std::sort(distinct.begin(), distinct.end());
    distinct.erase(std::unique(distinct.begin(), distinct.end()), distinct.end());
    if (static_cast<int>(distinct.size()) < degree + 1)
    {
        std::ostringstream oss;
        oss << "Curve fit of degree " << degree << " needs " << degree + 1
            << " distinct abscissae, got " << distinct.size();
        throw FitError(oss.str());
    }

    Eigen::MatrixXd A(static_cast<Eigen::Index>(x.size()), degree + 1);
    for (std::size_t p = 0; p < x.size(); ++p)
    {
        double power = 1.0;
        for (int k = 0; k <= degree; ++k)
        {
            A(static_cast<Eigen::Index>(p), k) = power;
            power *= x[p];
        }
    }
    const Eigen::VectorXd y = Eigen::Map<const Eigen::VectorXd>(values.data(), static_cast<Eigen::Index>(values.size()));
    const Eigen::VectorXd coefficients = constrained_lsq::least_squares(A, y, solver);

    std::vector<double> out(query_x.size(), 0.0);
    for (std::size_t q = 0; q < query_x.size(); ++q)
    {
        double acc = 0.0;
        for (int k = degree; k >= 0; --k)
        {
            acc = acc * query_x[q] + coefficients(k);
        }
        out[q] = acc;
    }
    return out;
}

/*This function returns the reference configuration of the six channels.*/
ChannelFitTable default_channel_fit_table()
{
    const std::vector<std::string> edge_value_constraints = {
        "F_is_0_at_x0_start", "F_is_0_at_x1_start", "F_is_0_at_x1_end", "dF/dx0_is_0_at_x0_end"};
    const std::vector<std::string> cross_wind_constraints = {
        "F_is_0_at_x0_end", "F_is_0_at_x1_start", "F_is_0_at_x1_end",
        "dF/dx0_is_0_at_x0_start", "dF/dx0_is_0_at_x0_end_at_x1_middle"};

    ChannelFitTable table;
    const int free_degrees[kNumChannels] = {2, 2, 1, 1, 3, 4};
    const int constrained_degrees[kNumChannels] = {3, 4, 4, 4, 4, 4};
    for (std::size_t c = 0; c < kNumChannels; ++c)
    {
        table[c].free_degree = free_degrees[c];
        table[c].constrained_degree = constrained_degrees[c];
        table[c].degree_type = DegreeType::Max;
        table[c].inequality = InequalityKind::None;
        table[c].solver = FitSolver::Qr;
    }

    table[0].constraints = edge_value_constraints;
    table[1].constraints = cross_wind_constraints;
    table[2].constraints = {"F_is_0_at_x0_end_at_x1_middle", "F_is_-2_at_x1_start", "F_is_2_at_x1_end",
                            "dF/dx0_is_0_at_x0_start", "dF/dx0_is_0_at_x0_end"};
    table[2].solver = FitSolver::Svd;
    table[3].constraints = cross_wind_constraints;
    table[4].constraints = edge_value_constraints;
    table[5].constraints = {"F_is_0_at_x0_start", "F_is_0_at_x0_end", "F_is_0_at_x1_start", "F_is_0_at_x1_end"};
    return table;
}

/*This function checks the channel table against the needs of a strategy.*/
void validate_channel_fit_table(const ChannelFitTable& table, StrategyKind strategy)
{
    for (std::size_t c = 0; c < kNumChannels; ++c)
    {
        const ChannelFitConfig& cfg = table[c];
        const std::string channel = kChannelNames[c];
        const bool cosine_channel = c == 1 || c == 2 || c == 3;

        switch (strategy)
        {
            case StrategyKind::FreeFit:
            case StrategyKind::Hybrid:
                if (cfg.free_degree < 0 || cfg.free_degree > kMaxSupportedDegree)
                {
                    throw UnsupportedConfigurationError("Channel " + channel + " has no valid free-fit degree");
                }
                break;
            case StrategyKind::ConstrainedFit:
                if (cfg.constrained_degree < 0 || cfg.constrained_degree > kMaxSupportedDegree)
                {
                    throw UnsupportedConfigurationError("Channel " + channel + " has no valid constrained-fit degree");
                }
                parse_boundary_constraints(cfg.constraints);
                break;
            case StrategyKind::CosineRule:
            case StrategyKind::CosineRule2D:
                if (cosine_channel && (cfg.free_degree < 0 || cfg.free_degree > kMaxSupportedDegree))
                {
                    throw UnsupportedConfigurationError("Channel " + channel + " has no valid zero-yaw fit degree");
                }
                break;
        }
    }
}

bool parse_degree_type(const std::string& value, DegreeType& out)
{
    const std::string normalized = strutil::lower_copy(strutil::trim_copy(value));
    if (normalized == "max") { out = DegreeType::Max; return true; }
    if (normalized == "total") { out = DegreeType::Total; return true; }
    return false;
}

bool parse_inequality_kind(const std::string& value, InequalityKind& out)
{
    const std::string normalized = strutil::lower_copy(strutil::trim_copy(value));
    if (normalized == "none" || normalized == "false" || normalized.empty()) { out = InequalityKind::None; return true; }
    if (normalized == "positivity") { out = InequalityKind::Positivity; return true; }
    if (normalized == "negativity") { out = InequalityKind::Negativity; return true; }
    return false;
}

bool parse_fit_solver(const std::string& value, FitSolver& out)
{
    const std::string normalized = strutil::lower_copy(strutil::trim_copy(value));
    if (normalized == "qr") { out = FitSolver::Qr; return true; }
    if (normalized == "svd") { out = FitSolver::Svd; return true; }
    return false;
}

const char* to_string(DegreeType type)
{
    return type == DegreeType::Total ? "total" : "max";
}

const char* to_string(InequalityKind kind)
{
    switch (kind)
    {
        case InequalityKind::Positivity: return "positivity";
        case InequalityKind::Negativity: return "negativity";
        case InequalityKind::None:
        default: return "none";
    }
}

const char* to_string(FitSolver solver)
{
    return solver == FitSolver::Svd ? "svd" : "qr";
}

} // namespace deckcoef
