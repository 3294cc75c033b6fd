/**
 * @file equation_of_state_base.cpp
 * @brief Shared conversions, stratification and profile derivation.
 */

#include "eos/base/equation_of_state_base.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>

#include "physical_constants.hpp"

namespace
{

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

double surface_gravity_ms2(double latitude_deg)
{
    using namespace physical_constants;
    const double s = std::sin(latitude_deg * deg_to_rad);
    const double s2 = s * s;
    return gravity_equator_ms2 * (1.0 + (gravity_sin2_coeff + gravity_sin4_coeff * s2) * s2);
}

std::vector<double> reorder(const std::vector<double>& values, const std::vector<std::size_t>& order)
{
    std::vector<double> out(order.size());
    for (std::size_t k = 0; k < order.size(); ++k)
    {
        out[k] = values[order[k]];
    }
    return out;
}

}

double gravity_ms2(double latitude_deg, double pressure_dbar)
{
    const double gs = surface_gravity_ms2(latitude_deg);
    // Height is negative below the surface, so gravity grows with depth.
    const double z = -pressure_dbar * db2pa / (rho0 * gs);
    return gs * (1.0 - physical_constants::gravity_height_gradient_per_m * z);
}

double depth_from_pressure(double pressure_dbar, double latitude_deg, double reference_density_kgm3)
{
    return pressure_dbar * db2pa / (reference_density_kgm3 * surface_gravity_ms2(latitude_deg));
}

double potential_temperature_c(double temperature_c, double practical_salinity, double pressure_dbar)
{
    constexpr double a1 = 3.6504e-4;
    constexpr double a2 = 8.3198e-5;
    constexpr double a3 = 5.4065e-7;
    constexpr double a4 = 4.0274e-9;
    constexpr double b1 = 1.7439e-5;
    constexpr double b2 = 2.9778e-7;
    constexpr double c1 = 8.9309e-7;
    constexpr double c2 = 3.1628e-8;
    constexpr double c3 = 2.1987e-10;
    constexpr double d = 4.1057e-9;
    constexpr double e1 = 1.6056e-10;
    constexpr double e2 = 5.0484e-12;

    const double t = temperature_c;
    const double p = pressure_dbar * physical_constants::dbar_to_bar;
    const double s_rel = practical_salinity - 35.0;

    const double aa = a1 + t * (a2 - t * (a3 - a4 * t));
    const double bb = s_rel * (b1 - b2 * t);
    const double cc = c1 + t * (-c2 + c3 * t);
    const double cc1 = d * s_rel;
    const double dd = -e1 + e2 * t;

    return t - p * (aa + bb + p * (cc - cc1 + p * dd));
}

std::vector<double> reference_absolute_salinity(const std::vector<double>& practical_salinity,
                                                const std::vector<double>& pressure_dbar)
{
    std::vector<double> out(practical_salinity.size(), kNaN);
    for (std::size_t k = 0; k < practical_salinity.size(); ++k)
    {
        const double p = k < pressure_dbar.size() ? pressure_dbar[k] : kNaN;
        if (std::isfinite(practical_salinity[k]) && std::isfinite(p))
        {
            out[k] = practical_salinity[k] * physical_constants::practical_to_absolute_salinity;
        }
    }
    return out;
}

std::vector<double> potential_temperature_profile(const std::vector<double>& absolute_salinity_gkg,
                                                  const std::vector<double>& in_situ_temperature_c,
                                                  const std::vector<double>& pressure_dbar)
{
    const std::size_t n = in_situ_temperature_c.size();
    std::vector<double> out(n, kNaN);
    for (std::size_t k = 0; k < n; ++k)
    {
        const double sa = k < absolute_salinity_gkg.size() ? absolute_salinity_gkg[k] : kNaN;
        const double p = k < pressure_dbar.size() ? pressure_dbar[k] : kNaN;
        const double t = in_situ_temperature_c[k];
        if (std::isfinite(sa) && std::isfinite(p) && std::isfinite(t))
        {
            const double sp = sa / physical_constants::practical_to_absolute_salinity;
            out[k] = potential_temperature_c(t, sp, p);
        }
    }
    return out;
}

StratificationProfile midpoint_stratification(const std::vector<double>& absolute_salinity_gkg,
                                              const std::vector<double>& conservative_temperature_c,
                                              const std::vector<double>& pressure_dbar,
                                              double latitude_deg,
                                              double reference_density_kgm3,
                                              const SeawaterStateFn& state)
{
    const std::size_t n = pressure_dbar.size();
    if (absolute_salinity_gkg.size() != n || conservative_temperature_c.size() != n)
    {
        throw std::invalid_argument("buoyancy_frequency: SA, CT and pressure lengths differ");
    }

    StratificationProfile out;
    if (n < 2)
    {
        return out;
    }

    const std::size_t m = n - 1;
    out.n2_s2.assign(m, kNaN);
    out.pressure_mid_dbar.assign(m, kNaN);
    out.alpha_per_k.assign(m, kNaN);
    out.beta_per_gkg.assign(m, kNaN);

    for (std::size_t k = 0; k < m; ++k)
    {
        const double p_mid = 0.5 * (pressure_dbar[k] + pressure_dbar[k + 1]);
        out.pressure_mid_dbar[k] = p_mid;

        const double dsa = absolute_salinity_gkg[k + 1] - absolute_salinity_gkg[k];
        const double dct = conservative_temperature_c[k + 1] - conservative_temperature_c[k];
        const double dp = pressure_dbar[k + 1] - pressure_dbar[k];
        if (!std::isfinite(dsa) || !std::isfinite(dct) || !std::isfinite(dp))
        {
            continue;
        }

        const double sa_mid = 0.5 * (absolute_salinity_gkg[k] + absolute_salinity_gkg[k + 1]);
        const double ct_mid = 0.5 * (conservative_temperature_c[k] + conservative_temperature_c[k + 1]);
        const SeawaterState s = state(sa_mid, ct_mid,
                                      depth_from_pressure(p_mid, latitude_deg, reference_density_kgm3));
        out.alpha_per_k[k] = s.alpha_per_k;
        out.beta_per_gkg[k] = s.beta_per_gkg;

        if (dp == 0.0)
        {
            continue;
        }
        const double g = gravity_ms2(latitude_deg, p_mid);
        out.n2_s2[k] = g * g * s.density_kgm3 * (s.beta_per_gkg * dsa - s.alpha_per_k * dct) / (dp * db2pa);
    }
    return out;
}

DerivedProfile derive_profile(const EquationOfStateScheme& scheme,
                              const std::vector<double>& pressure_dbar,
                              const std::vector<double>& practical_salinity,
                              const std::vector<double>& in_situ_temperature_c,
                              double longitude_deg,
                              double latitude_deg,
                              bool need_stratification)
{
    if (!scheme.is_initialized())
    {
        throw std::runtime_error("Equation-of-state scheme '" + scheme.get_config().scheme_id +
                                 "' used before initialize()");
    }
    const std::size_t n = pressure_dbar.size();
    if (practical_salinity.size() != n || in_situ_temperature_c.size() != n)
    {
        throw std::invalid_argument("derive_profile: pressure (" + std::to_string(n) +
                                    "), salinity (" + std::to_string(practical_salinity.size()) +
                                    ") and temperature (" + std::to_string(in_situ_temperature_c.size()) +
                                    ") lengths differ");
    }

    // Sort by pressure so that midpoints pair neighbouring levels; missing pressure goes last.
    std::vector<std::size_t> order(n);
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&pressure_dbar](std::size_t a, std::size_t b)
    {
        const bool fa = std::isfinite(pressure_dbar[a]);
        const bool fb = std::isfinite(pressure_dbar[b]);
        if (fa != fb)
        {
            return fa;
        }
        return fa && pressure_dbar[a] < pressure_dbar[b];
    });

    DerivedProfile out;
    out.longitude_deg = longitude_deg;
    out.latitude_deg = latitude_deg;
    out.pressure_dbar = reorder(pressure_dbar, order);
    out.practical_salinity = reorder(practical_salinity, order);
    out.in_situ_temperature_c = reorder(in_situ_temperature_c, order);

    out.absolute_salinity_gkg =
        scheme.absolute_salinity(out.practical_salinity, out.pressure_dbar, longitude_deg, latitude_deg);
    out.conservative_temperature_c =
        scheme.conservative_temperature(out.absolute_salinity_gkg, out.in_situ_temperature_c, out.pressure_dbar);

    if (need_stratification)
    {
        out.stratification = scheme.buoyancy_frequency(out.absolute_salinity_gkg,
                                                       out.conservative_temperature_c,
                                                       out.pressure_dbar,
                                                       latitude_deg);
    }
    return out;
}

DerivedProfile derive_profile(const EquationOfStateScheme& scheme,
                              const ProfileView& profile,
                              bool need_stratification)
{
    return derive_profile(scheme,
                          profile.pressure_dbar.to_vector(),
                          profile.salinity.to_vector(),
                          profile.temperature_c.to_vector(),
                          profile.longitude_deg,
                          profile.latitude_deg,
                          need_stratification);
}

ChannelSeries channel_series(const DerivedProfile& derived, const wpdb::ChannelContract& contract)
{
    ChannelSeries out;
    out.pressure_dbar = contract.axis == wpdb::VerticalAxis::Midpoint
                            ? &derived.stratification.pressure_mid_dbar
                            : &derived.pressure_dbar;

    switch (contract.channel)
    {
        case wpdb::ChannelId::PracticalSalinity:
            out.values = &derived.practical_salinity;
            break;
        case wpdb::ChannelId::InSituTemperature:
            out.values = &derived.in_situ_temperature_c;
            break;
        case wpdb::ChannelId::AbsoluteSalinity:
            out.values = &derived.absolute_salinity_gkg;
            break;
        case wpdb::ChannelId::ConservativeTemperature:
            out.values = &derived.conservative_temperature_c;
            break;
        case wpdb::ChannelId::BuoyancyFrequencySquared:
            out.values = &derived.stratification.n2_s2;
            break;
        case wpdb::ChannelId::ThermalExpansion:
            out.values = &derived.stratification.alpha_per_k;
            break;
        case wpdb::ChannelId::HalineContraction:
            out.values = &derived.stratification.beta_per_gkg;
            break;
    }
    return out;
}
