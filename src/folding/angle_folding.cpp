/**
 * @file angle_folding.cpp
 * @brief Implementation of yaw quadrant folding and sign bookkeeping.
 *
 * This file is part of the src/folding subsystem.
 */

#include "angle_folding.hpp"

#include <cmath>
#include <sstream>
#include <string>

#include "coefficient_errors.hpp"
#include "physical_constants.hpp"

namespace deckcoef
{

namespace
{
using physical_constants::half_pi;
using physical_constants::pi;

// Signs for channels C1..C6 per source quadrant.
constexpr ChannelSigns kSignsFirstQuadrant = {1.0, 1.0, 1.0, 1.0, 1.0, 1.0};
constexpr ChannelSigns kSignsSecondQuadrant = {1.0, -1.0, 1.0, -1.0, 1.0, -1.0};
constexpr ChannelSigns kSignsFourthQuadrant = {-1.0, 1.0, 1.0, 1.0, -1.0, -1.0};
constexpr ChannelSigns kSignsThirdQuadrant = {-1.0, -1.0, 1.0, -1.0, -1.0, 1.0};

/**
 * @brief Brings a validated yaw inside [-pi, pi] to absorb conversion round-off.
 */
double clamp_to_circle(double yaw)
{
    if (yaw > pi) return pi;
    if (yaw < -pi) return -pi;
    return yaw;
}
}

/*This function validates the query sequences.
Shape problems are reported before range problems so that no fit runs on bad input.*/
void validate_query_angles(const std::vector<double>& yaws, const std::vector<double>& thetas)
{
    if (yaws.size() != thetas.size())
    {
        std::ostringstream oss;
        oss << "Yaw and theta sequences need the same size (got " << yaws.size()
            << " yaws and " << thetas.size() << " thetas)";
        throw ShapeError(oss.str());
    }

    for (std::size_t i = 0; i < thetas.size(); ++i)
    {
        if (!std::isfinite(thetas[i]) || std::abs(thetas[i]) > half_pi + physical_constants::angle_bound_epsilon)
        {
            std::ostringstream oss;
            oss << "Theta at index " << i << " (" << thetas[i] << " rad) is outside [-90, 90] deg";
            throw DomainRangeError(oss.str());
        }
    }
    for (std::size_t i = 0; i < yaws.size(); ++i)
    {
        if (!std::isfinite(yaws[i]) || std::abs(yaws[i]) > pi + physical_constants::angle_bound_epsilon)
        {
            std::ostringstream oss;
            oss << "Yaw at index " << i << " (" << yaws[i] << " rad) is outside [-180, 180] deg";
            throw DomainRangeError(oss.str());
        }
    }
}

/*This function returns the sign pattern for the quadrant of a yaw angle.*/
ChannelSigns quadrant_signs(double yaw)
{
    return fold_yaw(yaw).signs;
}

/*This function folds one yaw angle into [0, 90] deg.
Takes a yaw in radians and returns its canonical representative and channel signs.*/
FoldedYaw fold_yaw(double yaw)
{
    if (!std::isfinite(yaw) || std::abs(yaw) > pi + physical_constants::angle_bound_epsilon)
    {
        std::ostringstream oss;
        oss << "Yaw " << yaw << " rad is outside [-180, 180] deg";
        throw DomainRangeError(oss.str());
    }

    yaw = clamp_to_circle(yaw);
    FoldedYaw out;
    if (yaw >= 0.0 && yaw <= half_pi)
    {
        out.yaw = yaw;
        out.signs = kSignsFirstQuadrant;
    }
    else if (yaw > half_pi)
    {
        out.yaw = pi - yaw;
        out.signs = kSignsSecondQuadrant;
    }
    else if (yaw >= -half_pi)
    {
        out.yaw = -yaw;
        out.signs = kSignsFourthQuadrant;
    }
    else
    {
        out.yaw = pi + yaw;
        out.signs = kSignsThirdQuadrant;
    }
    return out;
}

/*This function folds a full query sequence.
The caller's vectors are read only; the folded values live in new storage.*/
FoldedQuery fold_query(const std::vector<double>& yaws, const std::vector<double>& thetas)
{
    validate_query_angles(yaws, thetas);

    FoldedQuery query;
    query.thetas = thetas;
    query.yaws.resize(yaws.size());
    query.signs.resize(yaws.size());

    for (std::size_t i = 0; i < yaws.size(); ++i)
    {
        const FoldedYaw folded = fold_yaw(yaws[i]);
        query.yaws[i] = folded.yaw;
        query.signs[i] = folded.signs;
    }
    return query;
}

/*This function re-applies the quadrant signs to fitted channel values.*/
void apply_signs(const std::vector<ChannelSigns>& signs, CoefficientSet& values)
{
    for (std::size_t c = 0; c < kNumChannels; ++c)
    {
        auto& channel = values.channels[c];
        if (channel.size() != signs.size())
        {
            throw ShapeError(std::string("Channel ") + kChannelNames[c] + " size does not match the sign vector");
        }
        for (std::size_t i = 0; i < channel.size(); ++i)
        {
            channel[i] *= signs[i][c];
        }
    }
}

} // namespace deckcoef
