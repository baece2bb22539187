#include "coefficient_errors.hpp"
#include "coefficient_orchestrator.hpp"
#include "coefficient_scheme_base.hpp"
#include "coefficients/schemes/cosine_rule/cosine_rule.hpp"
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
        std::cerr << "[cosine-rule-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

double zero_yaw_c2(double theta) { return 1.0 + 0.5 * theta; }
double zero_yaw_c3(double theta) { return 0.2 * theta; }
double zero_yaw_c4(double theta) { return -0.3 + 0.1 * theta; }

// Off-axis samples carry values the cosine rule must ignore.
MeasurementTable cosine_table()
{
    return synthetic::sample_grid({
        [](double, double) { return 9.0; },
        [](double y, double t) { return y == 0.0 ? zero_yaw_c2(t) : 5.0; },
        [](double y, double t) { return y == 0.0 ? zero_yaw_c3(t) : 5.0; },
        [](double y, double t) { return y == 0.0 ? zero_yaw_c4(t) : 5.0; },
        [](double, double) { return 9.0; },
        [](double, double) { return 9.0; }});
}

int test_attenuation_laws()
{
    int failures = 0;
    failures += expect_true(nearly_equal(cosine_attenuation(CosineAttenuation::Yaw, rad(60.0), 0.7), 0.25, 1.0e-12),
                            "cos^2(60 deg) = 0.25");
    failures += expect_true(nearly_equal(cosine_attenuation(CosineAttenuation::YawAndTilt, rad(60.0), 0.0), 0.25, 1.0e-12),
                            "tilt law reduces to cos^2(yaw) at zero theta");
    failures += expect_true(nearly_equal(cosine_attenuation(CosineAttenuation::YawAndTilt, rad(90.0), rad(30.0)), 0.25, 1.0e-12),
                            "tilt law is sin^2(theta) at 90 deg yaw");
    failures += expect_true(nearly_equal(cosine_attenuation(CosineAttenuation::YawAndTilt, 0.0, rad(40.0)), 1.0, 1.0e-12),
                            "tilt law is one at zero yaw");
    return failures;
}

int test_plain_cosine_rule()
{
    int failures = 0;
    const MeasurementTable table = cosine_table();
    const std::vector<double> yaws = {rad(60.0), rad(120.0), rad(-60.0), 0.0};
    const std::vector<double> thetas = {0.2, 0.2, 0.2, -0.4};

    const CoefficientResult r = coefficients(table, yaws, thetas, StrategyKind::CosineRule, Frame::Structural);
    const CoefficientSet& c = *r.structural;
    failures += expect_true(!r.wind_normal.has_value(), "structural request leaves the wind-normal frame empty");

    failures += expect_true(nearly_equal(c[Channel::C2][0], zero_yaw_c2(0.2) * 0.25, 1.0e-9), "C2 follows the cosine rule");
    failures += expect_true(nearly_equal(c[Channel::C3][0], zero_yaw_c3(0.2) * 0.25, 1.0e-9), "C3 follows the cosine rule");
    failures += expect_true(nearly_equal(c[Channel::C4][0], zero_yaw_c4(0.2) * 0.25, 1.0e-9), "C4 follows the cosine rule");
    failures += expect_true(nearly_equal(c[Channel::C2][3], zero_yaw_c2(-0.4), 1.0e-9), "zero yaw returns the zero-yaw fit");

    failures += expect_true(nearly_equal(c[Channel::C2][1], -c[Channel::C2][0], 1.0e-9), "C2 flips in the second quadrant");
    failures += expect_true(nearly_equal(c[Channel::C4][1], -c[Channel::C4][0], 1.0e-9), "C4 flips in the second quadrant");
    failures += expect_true(nearly_equal(c[Channel::C3][1], c[Channel::C3][0], 1.0e-9), "C3 keeps its sign");
    failures += expect_true(nearly_equal(c[Channel::C2][2], c[Channel::C2][0], 1.0e-9), "C2 keeps its sign at negative yaw");

    for (Channel zero : {Channel::C1, Channel::C5, Channel::C6})
    {
        for (double v : c[zero])
        {
            failures += expect_true(v == 0.0, "channels outside the cosine rule are zero");
        }
    }
    return failures;
}

int test_tilt_cosine_rule()
{
    int failures = 0;
    const MeasurementTable table = cosine_table();
    const double theta = 0.3;
    const std::vector<double> yaws = {rad(45.0), physical_constants::half_pi};
    const std::vector<double> thetas = {0.0, theta};

    const CoefficientResult r = coefficients(table, yaws, thetas, "2D", "Ls", default_channel_fit_table());
    const CoefficientSet& c = *r.structural;
    failures += expect_true(nearly_equal(c[Channel::C2][0], zero_yaw_c2(0.0) * 0.5, 1.0e-9),
                            "tilt law at zero theta matches the plain rule");

    // At 90 deg yaw the normal wind is vertical, so the zero-yaw fit is read at 90 deg.
    const double expected = zero_yaw_c2(physical_constants::half_pi) * std::sin(theta) * std::sin(theta);
    failures += expect_true(nearly_equal(c[Channel::C2][1], expected, 1.0e-9), "tilt law reads the fit at the skew angle");
    return failures;
}

int test_missing_zero_yaw_samples()
{
    int failures = 0;
    const MeasurementTable off_axis = synthetic::sample_grid(synthetic::low_order_channels(), 10.0, 90.0);
    bool failed = false;
    try
    {
        coefficients(off_axis, {0.1}, {0.1}, StrategyKind::CosineRule, Frame::Structural);
    }
    catch (const FitError&)
    {
        failed = true;
    }
    failures += expect_true(failed, "cosine rule without zero-yaw samples raises FitError");
    return failures;
}

int test_factory_names()
{
    int failures = 0;
    failures += expect_true(create_coefficient_scheme("cos_rule")->name() == "cos_rule", "cos_rule token");
    failures += expect_true(create_coefficient_scheme("2D")->name() == "cos_rule_2d", "2D token selects the tilt law");
    failures += expect_true(create_coefficient_scheme(" COSINE_RULE ")->kind() == StrategyKind::CosineRule, "alias token");
    failures += expect_true(CosineRuleScheme::is_cosine_channel(1) && !CosineRuleScheme::is_cosine_channel(0),
                            "C2 follows the cosine rule, C1 does not");
    return failures;
}
}

int main()
{
    int failures = 0;
    failures += test_attenuation_laws();
    failures += test_plain_cosine_rule();
    failures += test_tilt_cosine_rule();
    failures += test_missing_zero_yaw_samples();
    failures += test_factory_names();

    if (failures > 0)
    {
        std::cerr << "[cosine-rule-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[cosine-rule-regression] all checks passed" << std::endl;
    return 0;
}
