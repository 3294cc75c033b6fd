/**
 * @file equation_of_state_base.hpp
 * @brief Shared helpers for the equation-of-state schemes.
 *
 * Schemes differ only in how density and the expansion coefficients
 * depend on absolute salinity, conservative temperature and depth. The
 * conversions and the midpoint stratification are common to all of them.
 */

#pragma once
#include <equation_of_state_base.hpp>

#include <functional>

/**
 * @brief Density and expansion coefficients at one state point.
 */
struct SeawaterState
{
    double density_kgm3 = 0.0;
    double alpha_per_k = 0.0;
    double beta_per_gkg = 0.0;
};

using SeawaterStateFn = std::function<SeawaterState(double sa_gkg, double ct_c, double depth_m)>;

/**
 * @brief Gravitational acceleration at a latitude and sea pressure.
 * @param latitude_deg Latitude in degrees.
 * @param pressure_dbar Sea pressure; converted to height with the reference density.
 */
double gravity_ms2(double latitude_deg, double pressure_dbar);

/**
 * @brief Positive depth in meters for a sea pressure.
 */
double depth_from_pressure(double pressure_dbar, double latitude_deg, double reference_density_kgm3);

/**
 * @brief Potential temperature referenced to the sea surface.
 *
 * Bryden (1973) polynomial as used by the UNESCO routines.
 *
 * @param temperature_c In-situ temperature.
 * @param practical_salinity Practical salinity.
 * @param pressure_dbar Sea pressure.
 */
double potential_temperature_c(double temperature_c, double practical_salinity, double pressure_dbar);

/**
 * @brief Absolute salinity from practical salinity with the reference composition ratio.
 */
std::vector<double> reference_absolute_salinity(const std::vector<double>& practical_salinity,
                                                const std::vector<double>& pressure_dbar);

/**
 * @brief Conservative temperature approximated by potential temperature.
 */
std::vector<double> potential_temperature_profile(const std::vector<double>& absolute_salinity_gkg,
                                                  const std::vector<double>& in_situ_temperature_c,
                                                  const std::vector<double>& pressure_dbar);

/**
 * @brief Squared buoyancy frequency between consecutive levels.
 *
 * Evaluates the state at the midpoint of each level pair and forms
 * N2 = g^2 rho (beta dSA - alpha dCT) / dP. Pairs with any missing input
 * yield NaN.
 */
StratificationProfile midpoint_stratification(const std::vector<double>& absolute_salinity_gkg,
                                              const std::vector<double>& conservative_temperature_c,
                                              const std::vector<double>& pressure_dbar,
                                              double latitude_deg,
                                              double reference_density_kgm3,
                                              const SeawaterStateFn& state);
