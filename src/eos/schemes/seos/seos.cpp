/**
 * @file seos.cpp
 * @brief S-EOS density and stratification.
 */

#include "seos.hpp"

#include <stdexcept>

namespace
{

// Roquet et al. (2015), table 1.
constexpr double a0 = 1.6550e-1;
constexpr double b0 = 7.6554e-1;
constexpr double lambda1 = 5.9520e-2;
constexpr double lambda2 = 5.4914e-4;
constexpr double mu1 = 1.4970e-4;
constexpr double mu2 = 1.1090e-5;
constexpr double nu = 2.4341e-3;

}

SeosScheme::SeosScheme() : initialized_(false) {}

void SeosScheme::initialize(const EosConfig& config)
{
    if (config.reference_density_kgm3 <= 0.0)
    {
        throw std::invalid_argument("S-EOS reference density must be positive");
    }
    config_ = config;
    config_.scheme_id = "seos";
    initialized_ = true;
}

SeawaterState SeosScheme::state(double sa_gkg, double ct_c, double depth_m) const
{
    const double rho_ref = config_.reference_density_kgm3;
    const double ta = ct_c - config_.reference_ct_c;
    const double sa = sa_gkg - config_.reference_sa_gkg;

    SeawaterState out;
    out.density_kgm3 = rho_ref
                     - a0 * (1.0 + 0.5 * lambda1 * ta + mu1 * depth_m) * ta
                     + b0 * (1.0 - 0.5 * lambda2 * sa - mu2 * depth_m) * sa
                     - nu * ta * sa;
    out.alpha_per_k = (a0 * (1.0 + lambda1 * ta + mu1 * depth_m) + nu * sa) / rho_ref;
    out.beta_per_gkg = (b0 * (1.0 - lambda2 * sa - mu2 * depth_m) - nu * ta) / rho_ref;
    return out;
}

std::vector<double> SeosScheme::absolute_salinity(const std::vector<double>& practical_salinity,
                                                  const std::vector<double>& pressure_dbar,
                                                  double /*longitude_deg*/,
                                                  double /*latitude_deg*/) const
{
    return reference_absolute_salinity(practical_salinity, pressure_dbar);
}

std::vector<double> SeosScheme::conservative_temperature(const std::vector<double>& absolute_salinity_gkg,
                                                         const std::vector<double>& in_situ_temperature_c,
                                                         const std::vector<double>& pressure_dbar) const
{
    return potential_temperature_profile(absolute_salinity_gkg, in_situ_temperature_c, pressure_dbar);
}

StratificationProfile SeosScheme::buoyancy_frequency(const std::vector<double>& absolute_salinity_gkg,
                                                     const std::vector<double>& conservative_temperature_c,
                                                     const std::vector<double>& pressure_dbar,
                                                     double latitude_deg) const
{
    return midpoint_stratification(absolute_salinity_gkg, conservative_temperature_c, pressure_dbar,
                                   latitude_deg, config_.reference_density_kgm3,
                                   [this](double sa, double ct, double depth) { return state(sa, ct, depth); });
}
