#include "coefficient_errors.hpp"
#include "derivative_engine.hpp"
#include "physical_constants.hpp"
#include "synthetic_tables.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace deckcoef;

namespace
{
bool nearly_equal(double a, double b, double tol = 1.0e-12)
{
    return std::abs(a - b) <= tol;
}

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[derivative-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

MeasurementTable unit_cross_wind_table()
{
    return synthetic::sample_grid({
        [](double, double) { return 0.0; },
        [](double, double) { return 1.0; },
        [](double, double) { return 0.0; },
        [](double, double) { return 0.0; },
        [](double, double) { return 0.0; },
        [](double, double) { return 0.0; }});
}

int test_safe_evaluation_point()
{
    int failures = 0;
    const double step = 1.0e-3;
    const double pi = physical_constants::pi;
    const double half_pi = physical_constants::half_pi;

    SafeEvaluationPoint p = safe_evaluation_point(0.0, 0.1, step);
    failures += expect_true(p.yaw_nudged && nearly_equal(p.yaw, 2.1 * step), "zero yaw moves into the first quadrant");
    failures += expect_true(!p.theta_nudged && p.theta == 0.1, "interior theta is left alone");

    p = safe_evaluation_point(pi, 0.0, step);
    failures += expect_true(nearly_equal(p.yaw, pi - 2.1 * step), "180 deg moves inward");
    p = safe_evaluation_point(-pi + 1.0e-4, 0.0, step);
    failures += expect_true(nearly_equal(p.yaw, -pi + 2.1 * step), "-180 deg moves inward");
    p = safe_evaluation_point(half_pi - 5.0e-4, 0.0, step);
    failures += expect_true(nearly_equal(p.yaw, half_pi - 2.1 * step), "yaw just below 90 deg moves further below");
    failures += expect_true(!p.near_boundary, "nudged yaw clears the fold line");

    p = safe_evaluation_point(0.5, half_pi, step);
    failures += expect_true(p.theta_nudged && nearly_equal(p.theta, half_pi - 2.1 * step), "theta at 90 deg moves inward");
    failures += expect_true(!p.yaw_nudged && p.yaw == 0.5, "interior yaw is left alone");

    p = safe_evaluation_point(0.1, 0.0, 1.0);
    failures += expect_true(p.near_boundary, "a step wider than the fold spacing is flagged");
    return failures;
}

int test_cosine_derivative()
{
    int failures = 0;
    const MeasurementTable table = unit_cross_wind_table();
    const DerivativeResult r = coefficient_derivatives(table, {rad(30.0)}, {0.0}, StrategyKind::CosineRule,
                                                       Frame::Structural, default_channel_fit_table());
    failures += expect_true(nearly_equal(r.d_yaw()[Channel::C2][0], -std::sin(rad(60.0)), 1.0e-3),
                            "d/dyaw cos^2(yaw) at 30 deg is -sin(60 deg)");
    failures += expect_true(nearly_equal(r.d_theta()[Channel::C2][0], 0.0, 1.0e-6), "no theta dependence");
    failures += expect_true(r.diagnostics.warnings.empty(), "interior point raises no warning");
    failures += expect_true(r.d_yaw()[Channel::C1][0] == 0.0, "zero channels have zero derivatives");
    return failures;
}

int test_free_fit_derivative()
{
    int failures = 0;
    const MeasurementTable table = synthetic::low_order_table();
    const double yaw = 0.5;
    const double theta = 0.3;
    const DerivativeResult r = coefficient_derivatives(table, {yaw}, {theta}, "2D_fit_free", "Ls", default_channel_fit_table());
    failures += expect_true(nearly_equal(r.d_yaw()[Channel::C1][0], 0.3, 1.0e-6), "d C1 / dyaw of a quadratic");
    failures += expect_true(nearly_equal(r.d_theta()[Channel::C1][0], 0.4 * theta, 1.0e-6), "d C1 / dtheta of a quadratic");
    failures += expect_true(nearly_equal(r.d_theta()[Channel::C4][0], -0.2, 1.0e-6), "d C4 / dtheta of a plane");
    return failures;
}

int test_near_fold_line_warns()
{
    int failures = 0;
    const MeasurementTable table = synthetic::low_order_table();
    bool threw = false;
    DerivativeResult r;
    try
    {
        r = coefficient_derivatives(table, {physical_constants::half_pi - 5.0e-4, 0.6}, {0.1, 0.1},
                                    StrategyKind::FreeFit, Frame::Structural, default_channel_fit_table());
    }
    catch (const std::exception&)
    {
        threw = true;
    }
    failures += expect_true(!threw, "near-boundary yaw does not fail");
    failures += expect_true(!r.diagnostics.warnings.empty(), "near-boundary yaw raises a warning");
    failures += expect_true(r.diagnostics.nudged.size() == 2 && r.diagnostics.nudged[0] && !r.diagnostics.nudged[1],
                            "only the near-boundary point is nudged");
    failures += expect_true(std::isfinite(r.d_yaw()[Channel::C2][0]) && std::abs(r.d_yaw()[Channel::C2][0]) < 10.0,
                            "nudged derivative stays bounded");
    return failures;
}

int test_frame_and_step_rules()
{
    int failures = 0;
    const MeasurementTable table = synthetic::low_order_table();
    const ChannelFitTable fits = default_channel_fit_table();

    bool rejected = false;
    try
    {
        coefficient_derivatives(table, {0.4}, {0.1}, StrategyKind::FreeFit, Frame::Both, fits);
    }
    catch (const UnsupportedConfigurationError&)
    {
        rejected = true;
    }
    failures += expect_true(rejected, "derivatives in both frames are rejected");

    const DerivativeResult wind = coefficient_derivatives(table, {0.4}, {0.1}, StrategyKind::FreeFit, Frame::WindNormal, fits);
    failures += expect_true(!wind.diagnostics.warnings.empty(), "wind-normal derivatives carry a warning");

    rejected = false;
    try
    {
        coefficient_derivatives(table, {0.4}, {0.1}, StrategyKind::FreeFit, Frame::Structural, fits, 0.0);
    }
    catch (const UnsupportedConfigurationError&)
    {
        rejected = true;
    }
    failures += expect_true(rejected, "zero step is rejected");

    bool shape = false;
    try
    {
        coefficient_derivatives(table, {0.4, 0.5}, {0.1}, StrategyKind::FreeFit, Frame::Structural, fits);
    }
    catch (const ShapeError&)
    {
        shape = true;
    }
    failures += expect_true(shape, "mismatched lengths raise a shape error");
    return failures;
}
}

int main()
{
    int failures = 0;
    failures += test_safe_evaluation_point();
    failures += test_cosine_derivative();
    failures += test_free_fit_derivative();
    failures += test_near_fold_line_warns();
    failures += test_frame_and_step_rules();

    if (failures > 0)
    {
        std::cerr << "[derivative-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[derivative-regression] all checks passed" << std::endl;
    return 0;
}
