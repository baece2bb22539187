/**
 * @file angle_geometry.cpp
 * @brief Implementation of wind angle geometry and frame rotation.
 *
 * This file is part of the src/geometry subsystem.
 */

#include "angle_geometry.hpp"

#include <algorithm>
#include <cmath>

#include "coefficient_errors.hpp"
#include "physical_constants.hpp"

namespace deckcoef
{

namespace
{
constexpr double kNormalWindEpsilon = 1.0e-14;
}

/*This function computes the skew angle of the deck-normal wind component.*/
double skew_angle(double yaw, double theta)
{
    const double uy = std::cos(yaw) * std::cos(theta);
    const double uz = std::sin(theta);
    const double vn = std::sqrt(uy * uy + uz * uz);
    if (vn < kNormalWindEpsilon)
    {
        return 0.0;
    }
    return std::asin(std::clamp(uz / vn, -1.0, 1.0));
}

std::vector<double> skew_angles(const std::vector<double>& yaws, const std::vector<double>& thetas)
{
    if (yaws.size() != thetas.size())
    {
        throw ShapeError("Skew angle inputs need the same size");
    }
    std::vector<double> out(yaws.size(), 0.0);
    for (std::size_t i = 0; i < yaws.size(); ++i)
    {
        out[i] = skew_angle(yaws[i], thetas[i]);
    }
    return out;
}

/*This function builds the 6x6 rotation for one point.
Rows are the wind-normal axes written in structural components, repeated for moments.*/
RotationOperator build_rotation(double yaw, double skew)
{
    const double side = std::cos(yaw) < 0.0 ? -1.0 : 1.0;
    const double a = side * std::cos(skew);
    const double b = std::sin(skew);

    Eigen::Matrix3d t;
    t << 0.0, a, b,
         1.0, 0.0, 0.0,
         0.0, b, -a;

    RotationOperator r = RotationOperator::Zero();
    r.topLeftCorner<3, 3>() = t;
    r.bottomRightCorner<3, 3>() = t;
    return r;
}

std::vector<RotationOperator> build_rotations(const std::vector<double>& yaws, const std::vector<double>& skews)
{
    if (yaws.size() != skews.size())
    {
        throw ShapeError("Rotation inputs need the same size");
    }
    std::vector<RotationOperator> out(yaws.size());
    for (std::size_t i = 0; i < yaws.size(); ++i)
    {
        out[i] = build_rotation(yaws[i], skews[i]);
    }
    return out;
}

/*This function projects each query point's six structural values through its operator.*/
CoefficientSet rotate_to_wind_normal(const std::vector<RotationOperator>& rotations, const CoefficientSet& structural)
{
    const std::size_t n = structural.size();
    if (rotations.size() != n)
    {
        throw ShapeError("One rotation operator is needed per query point");
    }

    CoefficientSet out;
    out.resize(n);
    for (std::size_t i = 0; i < n; ++i)
    {
        Eigen::Matrix<double, 6, 1> c_s;
        for (std::size_t c = 0; c < kNumChannels; ++c)
        {
            c_s(static_cast<Eigen::Index>(c)) = structural.channels[c][i];
        }
        const Eigen::Matrix<double, 6, 1> c_nw = rotations[i] * c_s;
        for (std::size_t c = 0; c < kNumChannels; ++c)
        {
            out.channels[c][i] = c_nw(static_cast<Eigen::Index>(c));
        }
    }
    return out;
}

/*This function converts section-model angles to deck wind angles.
The yaw correction keeps the quadrant of the uncorrected yaw.*/
DeckWindAngles soh_to_zhu_angles(double yaw_uncorrected, double alpha)
{
    DeckWindAngles out;
    out.yaw = std::atan2(std::sin(yaw_uncorrected), std::cos(yaw_uncorrected) * std::cos(alpha));
    out.theta = -std::asin(std::clamp(std::cos(yaw_uncorrected) * std::sin(alpha), -1.0, 1.0));
    return out;
}

/*This function renormalizes SOH coefficients to the Zhu convention.
Forces are rebuilt on the model and divided again by the deck width.*/
ZhuCoefficients soh_to_zhu_normalization(double cd, double cl, double cm, double ca)
{
    using namespace physical_constants;
    const double q = 0.5 * soh_air_density_kgm3 * soh_model_wind_speed_ms * soh_model_wind_speed_ms;
    const double length = soh_model_length_m;
    const double b = soh_model_width_m;

    const double fd = q * length * soh_model_height_m * cd;
    const double fl = q * length * b * cl;
    const double fm = q * length * b * b * cm;
    const double fa = q * length * soh_model_perimeter_m * ca;

    ZhuCoefficients out;
    out.drag = fd / length / (q * b);
    out.lift = fl / length / (q * b);
    out.moment = fm / length / (q * b * b);
    out.axial = fa / length / (q * b);
    return out;
}

} // namespace deckcoef
