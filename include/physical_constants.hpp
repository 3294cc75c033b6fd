#pragma once

/**
 * @file physical_constants.hpp
 * @brief Shared physical constants used by the profile processing code.
 *
 * Centralizes geodetic, gravitational and seawater reference values so
 * that the spatial search, the equation-of-state schemes and the
 * stratification calculation agree on one set of numbers.
 */

namespace physical_constants
{
inline constexpr double pi = 3.14159265358979323846;
inline constexpr double deg_to_rad = pi / 180.0;

// American Practical Navigator (1975) series for the length of one degree.
inline constexpr double meters_per_deg_lon_c1 = 111415.13;
inline constexpr double meters_per_deg_lon_c3 = 94.55;
inline constexpr double meters_per_deg_lat_c0 = 111132.09;
inline constexpr double meters_per_deg_lat_c2 = 566.05;
inline constexpr double meters_per_deg_lat_c4 = 1.2;

// Normal gravity at the sea surface (TEOS-10 gsw_grav form).
inline constexpr double gravity_equator_ms2 = 9.780327;
inline constexpr double gravity_sin2_coeff = 5.2792e-3;
inline constexpr double gravity_sin4_coeff = 2.32e-5;
inline constexpr double gravity_height_gradient_per_m = 2.26e-7;

inline constexpr double dbar_to_pa = 1.0e4;
inline constexpr double dbar_to_bar = 0.1;

inline constexpr double reference_salinity_gkg = 35.16504;
inline constexpr double practical_to_absolute_salinity = reference_salinity_gkg / 35.0;
inline constexpr double seawater_reference_density_kgm3 = 1026.0;
} // namespace physical_constants

inline constexpr double rho0 = physical_constants::seawater_reference_density_kgm3;
inline constexpr double db2pa = physical_constants::dbar_to_pa;
