/**
 * @file spatial_filter.cpp
 * @brief Planar radius search around query points.
 */

#include "spatial_filter.hpp"

#include <cmath>
#include <stdexcept>

#include "geo_metric.hpp"

namespace
{

/**
 * @brief Planar distance in meters from the query point, using its metric.
 *
 * A NaN coordinate yields NaN, which fails every radius comparison.
 */
double planar_distance_m(double longitude_deg,
                         double latitude_deg,
                         const GeoPoint& center,
                         const geo_metric::MetersPerDegree& h,
                         bool wrap_longitude)
{
    double dlon = longitude_deg - center.longitude_deg;
    if (wrap_longitude)
    {
        dlon = geo_metric::wrap_longitude_delta(dlon);
    }
    const double dx = dlon * h.lon_m;
    const double dy = (latitude_deg - center.latitude_deg) * h.lat_m;
    return std::sqrt(dx * dx + dy * dy);
}

}

double distance_km(double longitude_deg, double latitude_deg, const GeoPoint& center, bool wrap_longitude)
{
    const geo_metric::MetersPerDegree h = geo_metric::meters_per_degree(center.latitude_deg);
    return planar_distance_m(longitude_deg, latitude_deg, center, h, wrap_longitude) * 1.0e-3;
}

std::vector<bool> within_radius(const std::vector<double>& longitudes,
                                const std::vector<double>& latitudes,
                                const GeoPoint& center,
                                double radius_km,
                                bool wrap_longitude)
{
    if (longitudes.size() != latitudes.size())
    {
        throw std::invalid_argument("within_radius: longitude and latitude arrays differ in length");
    }

    // The metric depends on the query latitude only, so it is evaluated once.
    const geo_metric::MetersPerDegree h = geo_metric::meters_per_degree(center.latitude_deg);
    const double radius_m = radius_km * 1.0e3;

    std::vector<bool> mask(longitudes.size(), false);
    for (std::size_t i = 0; i < longitudes.size(); ++i)
    {
        mask[i] = planar_distance_m(longitudes[i], latitudes[i], center, h, wrap_longitude) < radius_m;
    }
    return mask;
}

CatalogView within_radius(const CatalogView& view, const GeoPoint& center, const SearchConfig& config)
{
    const geo_metric::MetersPerDegree h = geo_metric::meters_per_degree(center.latitude_deg);
    const double radius_m = config.radius_km * 1.0e3;

    return view.filter([&](const Catalog& cat, std::size_t row)
    {
        return planar_distance_m(cat.longitude(row), cat.latitude(row), center, h, config.wrap_longitude) < radius_m;
    });
}
