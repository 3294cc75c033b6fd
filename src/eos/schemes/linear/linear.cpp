/**
 * @file linear.cpp
 * @brief Linear equation of state.
 */

#include "linear.hpp"

#include <stdexcept>

LinearEosScheme::LinearEosScheme() : initialized_(false) {}

void LinearEosScheme::initialize(const EosConfig& config)
{
    if (config.reference_density_kgm3 <= 0.0)
    {
        throw std::invalid_argument("Linear EOS reference density must be positive");
    }
    config_ = config;
    config_.scheme_id = "linear";
    initialized_ = true;
}

SeawaterState LinearEosScheme::state(double sa_gkg, double ct_c) const
{
    SeawaterState out;
    out.alpha_per_k = config_.thermal_expansion_per_k;
    out.beta_per_gkg = config_.haline_contraction_per_gkg;
    out.density_kgm3 = config_.reference_density_kgm3 *
                       (1.0 - out.alpha_per_k * (ct_c - config_.reference_ct_c)
                            + out.beta_per_gkg * (sa_gkg - config_.reference_sa_gkg));
    return out;
}

std::vector<double> LinearEosScheme::absolute_salinity(const std::vector<double>& practical_salinity,
                                                       const std::vector<double>& pressure_dbar,
                                                       double /*longitude_deg*/,
                                                       double /*latitude_deg*/) const
{
    return reference_absolute_salinity(practical_salinity, pressure_dbar);
}

std::vector<double> LinearEosScheme::conservative_temperature(const std::vector<double>& absolute_salinity_gkg,
                                                              const std::vector<double>& in_situ_temperature_c,
                                                              const std::vector<double>& pressure_dbar) const
{
    return potential_temperature_profile(absolute_salinity_gkg, in_situ_temperature_c, pressure_dbar);
}

StratificationProfile LinearEosScheme::buoyancy_frequency(const std::vector<double>& absolute_salinity_gkg,
                                                          const std::vector<double>& conservative_temperature_c,
                                                          const std::vector<double>& pressure_dbar,
                                                          double latitude_deg) const
{
    // Linear state does not depend on depth.
    return midpoint_stratification(absolute_salinity_gkg, conservative_temperature_c, pressure_dbar,
                                   latitude_deg, config_.reference_density_kgm3,
                                   [this](double sa, double ct, double) { return state(sa, ct); });
}
