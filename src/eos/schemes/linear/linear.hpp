/**
 * @file linear.hpp
 * @brief Linear equation of state with constant expansion coefficients.
 */

#pragma once
#include "eos/base/equation_of_state_base.hpp"

/**
 * @brief Linear scheme: rho = rho0 (1 - alpha (CT - CT0) + beta (SA - SA0)).
 */
class LinearEosScheme : public EquationOfStateScheme
{
public:
    LinearEosScheme();
    ~LinearEosScheme() override = default;

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

    SeawaterState state(double sa_gkg, double ct_c) const;

private:
    EosConfig config_;
    bool initialized_;
};
