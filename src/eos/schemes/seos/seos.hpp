/**
 * @file seos.hpp
 * @brief Simplified nonlinear equation of state (Roquet et al. 2015).
 */

#pragma once
#include "eos/base/equation_of_state_base.hpp"

/**
 * @brief S-EOS scheme.
 *
 * Quadratic in conservative temperature with cabbeling, thermobaric and
 * haline nonlinearity terms, around the reference state of the config.
 */
class SeosScheme : public EquationOfStateScheme
{
public:
    SeosScheme();
    ~SeosScheme() override = default;

    void initialize(const EosConfig& config) override;

    std::vector<double> absolute_salinity(const std::vector<double>& practical_salinity,
                                          const std::vector<double>& pressure_dbar,
                                          double longitude_deg,
                                          double latitude_deg) const override;

    std::vector<double> conservative_temperature(const std::vector<double>& absolute_salinity_gkg,
                                                 const std::vector<double>& in_situ_temperature_c,
                                                 const std::vector<double>& pressure_dbar) const override;

    StratificationProfile buoyancy_frequency(const std::vector<double>& absolute_salinity_gkg,
                                             const std::vector<double>& conservative_temperature_c,
                                             const std::vector<double>& pressure_dbar,
                                             double latitude_deg) const override;

    const EosConfig& get_config() const override { return config_; }
    bool is_initialized() const override { return initialized_; }

    /**
     * @brief Density and expansion coefficients at one state point.
     * @param sa_gkg Absolute salinity.
     * @param ct_c Conservative temperature.
     * @param depth_m Positive depth.
     */
    SeawaterState state(double sa_gkg, double ct_c, double depth_m) const;

private:
    EosConfig config_;
    bool initialized_;
};
