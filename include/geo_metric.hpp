#pragma once

#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

#include "physical_constants.hpp"

/**
 * @file geo_metric.hpp
 * @brief Local conversion between angular and linear horizontal distance.
 *
 * Uses the American Practical Navigator series for the length of a degree
 * of longitude and latitude. Values depend on latitude only and are valid
 * for separations far below the Earth radius.
 */

namespace geo_metric
{

struct MetersPerDegree
{
    double lon_m = 0.0;
    double lat_m = 0.0;
};

/**
 * @brief Returns meters per degree of longitude and latitude at a latitude.
 * @param latitude_deg Latitude in degrees.
 */
inline MetersPerDegree meters_per_degree(double latitude_deg)
{
    using namespace physical_constants;
    const double rlat = latitude_deg * deg_to_rad;
    MetersPerDegree out;
    out.lon_m = meters_per_deg_lon_c1 * std::cos(rlat) - meters_per_deg_lon_c3 * std::cos(3.0 * rlat);
    out.lat_m = meters_per_deg_lat_c0 - meters_per_deg_lat_c2 * std::cos(2.0 * rlat) +
                meters_per_deg_lat_c4 * std::cos(4.0 * rlat);
    return out;
}

/**
 * @brief Converts a lon/lat increment in degrees to meters at a latitude.
 * @return Pair (dx, dy) in meters.
 */
inline std::pair<double, double> angular_delta_to_meters(double dlon_deg, double dlat_deg, double latitude_deg)
{
    const MetersPerDegree h = meters_per_degree(latitude_deg);
    return {dlon_deg * h.lon_m, dlat_deg * h.lat_m};
}

/**
 * @brief Elementwise conversion of increment arrays.
 *
 * `latitude_deg` holds either one value, applied to every element, or
 * one value per element.
 */
inline void angular_delta_to_meters(const std::vector<double>& dlon_deg,
                                    const std::vector<double>& dlat_deg,
                                    const std::vector<double>& latitude_deg,
                                    std::vector<double>& dx_m,
                                    std::vector<double>& dy_m)
{
    const std::size_t n = dlon_deg.size();
    if (dlat_deg.size() != n)
    {
        throw std::invalid_argument("angular_delta_to_meters: dlon and dlat lengths differ");
    }
    if (latitude_deg.size() != 1 && latitude_deg.size() != n)
    {
        throw std::invalid_argument("angular_delta_to_meters: latitude must be scalar or match the deltas");
    }

    dx_m.resize(n);
    dy_m.resize(n);
    const bool broadcast = latitude_deg.size() == 1;
    const MetersPerDegree shared = broadcast ? meters_per_degree(latitude_deg[0]) : MetersPerDegree{};
    for (std::size_t i = 0; i < n; ++i)
    {
        const MetersPerDegree h = broadcast ? shared : meters_per_degree(latitude_deg[i]);
        dx_m[i] = dlon_deg[i] * h.lon_m;
        dy_m[i] = dlat_deg[i] * h.lat_m;
    }
}

/**
 * @brief Wraps a longitude difference into [-180, 180].
 */
inline double wrap_longitude_delta(double dlon_deg)
{
    return std::remainder(dlon_deg, 360.0);
}

} // namespace geo_metric
