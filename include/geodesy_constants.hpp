#pragma once

/**
 * @file geodesy_constants.hpp
 * @brief Shared geodetic and unit constants used by the normalizers.
 *
 * Centralizes the equatorial degree lengths used for equirectangular
 * cell-area estimates and the default projection unit multiplier.
 */

namespace geodesy_constants
{
inline constexpr double pi = 3.14159265358979323846;
inline constexpr double km_per_degree_longitude_equator = 111.32;
inline constexpr double km_per_degree_latitude = 110.57;
inline constexpr double km2_per_square_degree_equator =
    km_per_degree_longitude_equator * km_per_degree_latitude;

// Projection areas arrive in thousands of km^2.
inline constexpr double default_projection_area_factor = 1000.0;
} // namespace geodesy_constants
