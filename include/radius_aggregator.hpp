#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

#include "catalog.hpp"
#include "channel_validation.hpp"
#include "equation_of_state_base.hpp"
#include "quality_gate.hpp"
#include "spatial_filter.hpp"
#include "stat_field3d.hpp"
#include "vertical_regrid.hpp"

/**
 * @file radius_aggregator.hpp
 * @brief Radius-averaged statistics of regridded profiles around query points.
 *
 * For every query point the catalog is narrowed to the casts within the
 * search radius, screened by the quality gate, passed through the
 * equation-of-state scheme, regridded onto the standard grid and reduced
 * per level and channel. Query points are independent and are processed
 * by an OpenMP parallel loop; every iteration writes its own output slot.
 */

struct AggregationConfig
{
    SearchConfig search;
    QualityCriteria quality;
    RegridOptions regrid;
    std::vector<double> standard_grid = make_standard_grid();
    std::string channel_selector = "N2";
    wpdb::ValidationPolicy guard;
    std::size_t min_valid_samples = 1;
    // 0 uses the OpenMP default, 1 runs serially.
    int num_threads = 0;
};

struct AggregateResult
{
    std::vector<std::string> channel_ids;
    std::vector<double> standard_grid;
    StatField3D median;
    StatField3D std_dev;
    StatField3D p05;
    StatField3D p95;
    std::vector<std::size_t> profile_counts;

    std::size_t num_points() const { return profile_counts.size(); }
    std::size_t num_levels() const { return standard_grid.size(); }
    std::size_t num_channels() const { return channel_ids.size(); }
};

/**
 * @brief Aggregates profiles around each query point.
 * @param view Catalog rows eligible for the search.
 * @param points Query points; output row i belongs to points[i].
 * @param config Search, quality, grid, channel and guard settings.
 * @param scheme Initialized equation-of-state scheme.
 * @return Median, std, p05 and p95 of shape (points, levels, channels).
 * @throws std::invalid_argument for a malformed channel selector or grid.
 * @throws std::runtime_error when a channel does not match its pressure axis
 *         or a strict guard rejects a channel.
 */
AggregateResult aggregate_within_radius(const CatalogView& view,
                                        const std::vector<GeoPoint>& points,
                                        const AggregationConfig& config,
                                        const EquationOfStateScheme& scheme);

/**
 * @brief Aggregates over the whole catalog.
 */
AggregateResult aggregate_within_radius(const Catalog& catalog,
                                        const std::vector<GeoPoint>& points,
                                        const AggregationConfig& config,
                                        const EquationOfStateScheme& scheme);

/**
 * @brief Aggregates for query points given as parallel lon/lat arrays.
 * @throws std::invalid_argument when the arrays differ in length.
 */
AggregateResult aggregate_within_radius(const Catalog& catalog,
                                        const std::vector<double>& longitudes,
                                        const std::vector<double>& latitudes,
                                        const AggregationConfig& config,
                                        const EquationOfStateScheme& scheme);

/**
 * @brief Regrids the selected channels of one derived profile.
 *
 * Checks at this boundary that every channel has as many values as its
 * pressure axis, then applies the guard and regrids.
 *
 * @return One regridded row per channel.
 * @throws std::runtime_error on a channel/axis length mismatch or a strict guard failure.
 */
std::vector<std::vector<double>> regrid_channels(const DerivedProfile& derived,
                                                 const std::vector<const wpdb::ChannelContract*>& channels,
                                                 const std::vector<double>& grid,
                                                 const AggregationConfig& config);

using MonthlyQueryPoints = std::array<std::vector<GeoPoint>, 12>;

/**
 * @brief Monthly climatology: month m query points see only month m casts.
 * @return Twelve results, January first.
 */
std::vector<AggregateResult> aggregate_monthly(const Catalog& catalog,
                                               const MonthlyQueryPoints& points_by_month,
                                               const AggregationConfig& config,
                                               const EquationOfStateScheme& scheme);
