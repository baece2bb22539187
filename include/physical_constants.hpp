#pragma once

/**
 * @file physical_constants.hpp
 * @brief Shared angular and wind-tunnel constants used across deckcoef components.
 *
 * Centralizes angle conversions, the folding boundaries of the yaw domain,
 * and the SOH section-model dimensions so that folding, fitting, geometry,
 * and derivative code agree on the same values.
 */

namespace deckcoef
{
namespace physical_constants
{
inline constexpr double pi = 3.14159265358979323846;
inline constexpr double half_pi = 0.5 * pi;

// Tolerance for angle-bound checks on radian inputs converted from degrees.
inline constexpr double angle_bound_epsilon = 1.0e-12;

// Yaw angles where quadrant folding flips coefficient signs.
inline constexpr double folding_boundaries_rad[] = {-pi, -half_pi, 0.0, half_pi, pi};

// SOH section model in the wind tunnel. Density and speed cancel in renormalization.
inline constexpr double soh_air_density_kgm3 = 1.25;
inline constexpr double soh_model_wind_speed_ms = 10.0;
inline constexpr double soh_model_height_m = 0.043;
inline constexpr double soh_model_width_m = 0.386;
inline constexpr double soh_model_length_m = 2.4;
inline constexpr double soh_model_perimeter_m = 62.4 / 80.0;
} // namespace physical_constants

/**
 * @brief Converts degrees to radians.
 */
inline constexpr double rad(double deg) { return deg * physical_constants::pi / 180.0; }

/**
 * @brief Converts radians to degrees.
 */
inline constexpr double deg(double rad_value) { return rad_value * 180.0 / physical_constants::pi; }
} // namespace deckcoef
