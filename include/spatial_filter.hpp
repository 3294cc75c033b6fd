#pragma once

#include <vector>

#include "catalog.hpp"

/**
 * @file spatial_filter.hpp
 * @brief Radius search of catalog positions around a query point.
 *
 * Distances use the planar approximation of geo_metric evaluated at the
 * query latitude. Longitude wraparound is an explicit option: with
 * `wrap_longitude` off, points across the ±180 seam are not found.
 */

struct GeoPoint
{
    double longitude_deg = 0.0;
    double latitude_deg = 0.0;
};

struct SearchConfig
{
    double radius_km = 100.0;
    bool wrap_longitude = true;
};

/**
 * @brief Planar distance between a position and a center in kilometers.
 */
double distance_km(double longitude_deg, double latitude_deg, const GeoPoint& center, bool wrap_longitude);

/**
 * @brief Flags positions strictly closer than radius_km to the center.
 * @param longitudes Catalog longitudes in degrees.
 * @param latitudes Catalog latitudes in degrees.
 * @param center Query point.
 * @param radius_km Search radius in kilometers.
 * @param wrap_longitude Normalize longitude differences into [-180, 180].
 * @return One flag per position; empty for empty input.
 * @throws std::invalid_argument when the coordinate arrays differ in length.
 */
std::vector<bool> within_radius(const std::vector<double>& longitudes,
                                const std::vector<double>& latitudes,
                                const GeoPoint& center,
                                double radius_km,
                                bool wrap_longitude = true);

/**
 * @brief Subset of a catalog view inside the search radius, order preserved.
 */
CatalogView within_radius(const CatalogView& view, const GeoPoint& center, const SearchConfig& config);
