#include "angle_geometry.hpp"
#include "coefficient_errors.hpp"
#include "physical_constants.hpp"

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
        std::cerr << "[geometry-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

int test_skew_angle()
{
    int failures = 0;
    failures += expect_true(nearly_equal(skew_angle(0.0, 0.4), 0.4), "skew equals theta at zero yaw");
    failures += expect_true(nearly_equal(skew_angle(physical_constants::pi, -0.4), -0.4), "skew equals theta at 180 deg yaw");
    failures += expect_true(nearly_equal(skew_angle(physical_constants::half_pi, 0.2), physical_constants::half_pi, 1.0e-9),
                            "wind along the deck with tilt has a vertical normal component");
    failures += expect_true(skew_angle(physical_constants::half_pi, 0.0) == 0.0, "no normal wind gives zero skew");

    const double yaw = rad(40.0);
    const double theta = rad(20.0);
    const double expected = std::atan(std::tan(theta) / std::cos(yaw));
    failures += expect_true(nearly_equal(skew_angle(yaw, theta), expected, 1.0e-12), "skew angle matches atan(tan(theta)/cos(yaw))");

    bool shape = false;
    try
    {
        skew_angles({0.1, 0.2}, {0.1});
    }
    catch (const ShapeError&)
    {
        shape = true;
    }
    failures += expect_true(shape, "skew_angles checks input lengths");
    return failures;
}

int test_rotation_is_orthogonal()
{
    int failures = 0;
    for (double yaw_deg : {-170.0, -60.0, 0.0, 35.0, 135.0})
    {
        for (double theta_deg : {-70.0, 0.0, 25.0})
        {
            const double yaw = rad(yaw_deg);
            const RotationOperator r = build_rotation(yaw, skew_angle(yaw, rad(theta_deg)));
            const double error = (r * r.transpose() - RotationOperator::Identity()).norm();
            failures += expect_true(error < 1.0e-12, "rotation operator is orthogonal");
        }
    }
    return failures;
}

int test_rotation_of_channels()
{
    int failures = 0;
    CoefficientSet s;
    s.resize(2);
    for (std::size_t c = 0; c < kNumChannels; ++c)
    {
        s.channels[c] = {static_cast<double>(c + 1), static_cast<double>(c + 1)};
    }
    const std::vector<double> yaws = {0.0, physical_constants::pi};
    const std::vector<double> thetas = {0.0, 0.0};
    const CoefficientSet w = rotate_to_wind_normal(build_rotations(yaws, skew_angles(yaws, thetas)), s);

    failures += expect_true(nearly_equal(w[Channel::C1][0], 2.0) && nearly_equal(w[Channel::C2][0], 1.0) &&
                            nearly_equal(w[Channel::C3][0], -3.0), "force triplet maps to (C2, C1, -C3) at zero yaw");
    failures += expect_true(nearly_equal(w[Channel::C4][0], 5.0) && nearly_equal(w[Channel::C5][0], 4.0) &&
                            nearly_equal(w[Channel::C6][0], -6.0), "moment triplet maps the same way");
    failures += expect_true(nearly_equal(w[Channel::C1][1], -2.0) && nearly_equal(w[Channel::C3][1], 3.0),
                            "wind from the other side reverses the drag and vertical axes");

    bool shape = false;
    try
    {
        rotate_to_wind_normal(build_rotations({0.0}, {0.0}), s);
    }
    catch (const ShapeError&)
    {
        shape = true;
    }
    failures += expect_true(shape, "one operator per point is required");
    return failures;
}

int test_section_model_conversion()
{
    int failures = 0;
    const DeckWindAngles flat = soh_to_zhu_angles(rad(30.0), 0.0);
    failures += expect_true(nearly_equal(flat.yaw, rad(30.0)) && nearly_equal(flat.theta, 0.0),
                            "zero rotation keeps yaw and gives zero theta");

    const DeckWindAngles normal = soh_to_zhu_angles(0.0, rad(5.0));
    failures += expect_true(nearly_equal(normal.yaw, 0.0) && nearly_equal(normal.theta, -rad(5.0)),
                            "at zero yaw theta is minus the rotation");

    const DeckWindAngles back = soh_to_zhu_angles(rad(150.0), rad(4.0));
    failures += expect_true(back.yaw > physical_constants::half_pi, "yaw correction keeps the quadrant");

    using namespace physical_constants;
    const ZhuCoefficients z = soh_to_zhu_normalization(1.0, 1.0, 1.0, 1.0);
    failures += expect_true(nearly_equal(z.drag, soh_model_height_m / soh_model_width_m, 1.0e-12), "drag is renormalized to the width");
    failures += expect_true(nearly_equal(z.lift, 1.0, 1.0e-12), "lift keeps its normalization");
    failures += expect_true(nearly_equal(z.moment, 1.0, 1.0e-12), "moment keeps its normalization");
    failures += expect_true(nearly_equal(z.axial, soh_model_perimeter_m / soh_model_width_m, 1.0e-12), "axial is renormalized to the width");
    return failures;
}
}

int main()
{
    int failures = 0;
    failures += test_skew_angle();
    failures += test_rotation_is_orthogonal();
    failures += test_rotation_of_channels();
    failures += test_section_model_conversion();

    if (failures > 0)
    {
        std::cerr << "[geometry-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[geometry-regression] all checks passed" << std::endl;
    return 0;
}
