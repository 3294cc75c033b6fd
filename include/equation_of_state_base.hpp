#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "catalog.hpp"
#include "channel_contract.hpp"

/**
 * @file equation_of_state_base.hpp
 * @brief Interfaces and data structures for derived seawater variables.
 *
 * The aggregation pipeline treats the equation of state as a pluggable
 * scheme: given salinity, temperature and pressure of one cast it returns
 * absolute salinity, conservative temperature and the stratification
 * between consecutive levels. Factory construction selects the scheme.
 */

struct EosConfig
{
    std::string scheme_id = "seos";
    double reference_density_kgm3 = 1026.0;
    double reference_ct_c = 10.0;
    double reference_sa_gkg = 35.0;
    // Only used by the linear scheme, per K and per g/kg.
    double thermal_expansion_per_k = 1.6550e-1 / 1026.0;
    double haline_contraction_per_gkg = 7.6554e-1 / 1026.0;
};

/**
 * @brief Stratification on the midpoint axis of a cast.
 *
 * All four vectors hold n - 1 values for an n-level cast.
 */
struct StratificationProfile
{
    std::vector<double> n2_s2;
    std::vector<double> pressure_mid_dbar;
    std::vector<double> alpha_per_k;
    std::vector<double> beta_per_gkg;

    std::size_t num_levels() const { return pressure_mid_dbar.size(); }
};

/**
 * @brief Derived variables of one cast, levels sorted by pressure.
 */
struct DerivedProfile
{
    double longitude_deg = 0.0;
    double latitude_deg = 0.0;

    std::vector<double> pressure_dbar;
    std::vector<double> practical_salinity;
    std::vector<double> in_situ_temperature_c;
    std::vector<double> absolute_salinity_gkg;
    std::vector<double> conservative_temperature_c;

    StratificationProfile stratification;

    std::size_t num_levels() const { return pressure_dbar.size(); }
};

/**
 * @brief One channel of a derived profile together with its pressure axis.
 */
struct ChannelSeries
{
    const std::vector<double>* values = nullptr;
    const std::vector<double>* pressure_dbar = nullptr;
};

class EquationOfStateScheme
{
public:
    /**
     * @brief Virtual destructor for polymorphic cleanup.
     */
    virtual ~EquationOfStateScheme() = default;

    /**
     * @brief Initializes the scheme.
     * @param config Equation-of-state configuration.
     */
    virtual void initialize(const EosConfig& config) = 0;

    /**
     * @brief Absolute salinity from practical salinity.
     * @param practical_salinity Practical salinity per level.
     * @param pressure_dbar Sea pressure per level.
     * @param longitude_deg Cast longitude.
     * @param latitude_deg Cast latitude.
     * @return Absolute salinity in g/kg, NaN where an input is missing.
     */
    virtual std::vector<double> absolute_salinity(const std::vector<double>& practical_salinity,
                                                  const std::vector<double>& pressure_dbar,
                                                  double longitude_deg,
                                                  double latitude_deg) const = 0;

    /**
     * @brief Conservative temperature from in-situ temperature.
     * @return Conservative temperature in degrees C, NaN where an input is missing.
     */
    virtual std::vector<double> conservative_temperature(const std::vector<double>& absolute_salinity_gkg,
                                                         const std::vector<double>& in_situ_temperature_c,
                                                         const std::vector<double>& pressure_dbar) const = 0;

    /**
     * @brief Squared buoyancy frequency and expansion coefficients between levels.
     * @return Midpoint-axis profile with one value fewer than the input.
     */
    virtual StratificationProfile buoyancy_frequency(const std::vector<double>& absolute_salinity_gkg,
                                                     const std::vector<double>& conservative_temperature_c,
                                                     const std::vector<double>& pressure_dbar,
                                                     double latitude_deg) const = 0;

    /**
     * @brief Returns current scheme configuration.
     */
    virtual const EosConfig& get_config() const = 0;

    /**
     * @brief Reports whether the scheme is initialized.
     */
    virtual bool is_initialized() const = 0;
};

/**
 * @brief Creates an equation-of-state scheme by identifier.
 * @param scheme_id Scheme identifier ("seos", "linear", "none").
 * @return Owning pointer to a scheme instance, null for "none".
 * @throws std::runtime_error if the identifier is not recognized.
 */
std::unique_ptr<EquationOfStateScheme> create_equation_of_state(const std::string& scheme_id);

/**
 * @brief Runs the scheme on one catalog profile.
 *
 * Levels are sorted by pressure first, missing pressure last.
 *
 * @param scheme Initialized scheme.
 * @param profile Catalog profile.
 * @param need_stratification Also compute the midpoint-axis channels.
 * @throws std::runtime_error when the scheme is not initialized.
 */
DerivedProfile derive_profile(const EquationOfStateScheme& scheme,
                              const ProfileView& profile,
                              bool need_stratification);

/**
 * @brief Runs the scheme on raw per-level arrays.
 * @throws std::invalid_argument when the arrays differ in length.
 */
DerivedProfile derive_profile(const EquationOfStateScheme& scheme,
                              const std::vector<double>& pressure_dbar,
                              const std::vector<double>& practical_salinity,
                              const std::vector<double>& in_situ_temperature_c,
                              double longitude_deg,
                              double latitude_deg,
                              bool need_stratification);

/**
 * @brief Selects a channel's values and the pressure axis it is defined on.
 */
ChannelSeries channel_series(const DerivedProfile& derived, const wpdb::ChannelContract& contract);
