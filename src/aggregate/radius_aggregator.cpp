/**
 * @file radius_aggregator.cpp
 * @brief Per-point search, derivation, regridding and level-wise reduction.
 */

#include "radius_aggregator.hpp"

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

#include "logging.hpp"
#include "nan_statistics.hpp"

#ifdef _OPENMP
#include <omp.h>
#endif

namespace
{

int resolve_thread_count(int requested)
{
    if (requested > 0)
    {
        return requested;
    }
#ifdef _OPENMP
    return omp_get_max_threads();
#else
    return 1;
#endif
}

void validate_grid(const std::vector<double>& grid)
{
    if (grid.empty())
    {
        throw std::invalid_argument("Standard grid is empty");
    }
    if (!is_strictly_increasing(grid))
    {
        throw std::invalid_argument("Standard grid must be strictly increasing");
    }
}

/**
 * @brief Aggregates one query point into row p of the result.
 */
void aggregate_point(const CatalogView& view,
                     const GeoPoint& point,
                     std::size_t p,
                     const std::vector<const wpdb::ChannelContract*>& channels,
                     bool need_stratification,
                     const AggregationConfig& config,
                     const EquationOfStateScheme& scheme,
                     AggregateResult& result)
{
    const CatalogView subset = apply_quality_gate(within_radius(view, point, config.search), config.quality);
    result.profile_counts[p] = subset.size();

    if (log_debug_enabled())
    {
        #pragma omp critical(wpdb_log)
        {
            std::cout << "[aggregate] point " << p << " (" << point.longitude_deg << ", " << point.latitude_deg
                      << "): found " << subset.size() << " good profiles in area" << std::endl;
        }
    }

    if (subset.empty())
    {
        return;
    }

    const std::vector<double>& grid = config.standard_grid;
    const std::size_t nl = grid.size();
    const std::size_t nc = channels.size();

    // regridded[k][c] is the grid row of channel c for the k-th profile.
    std::vector<std::vector<std::vector<double>>> regridded;
    regridded.reserve(subset.size());
    for (std::size_t k = 0; k < subset.size(); ++k)
    {
        const DerivedProfile derived = derive_profile(scheme, subset.profile(k), need_stratification);
        regridded.push_back(regrid_channels(derived, channels, grid, config));
    }

    std::vector<double> samples;
    samples.reserve(regridded.size());
    for (std::size_t l = 0; l < nl; ++l)
    {
        for (std::size_t c = 0; c < nc; ++c)
        {
            samples.clear();
            for (const auto& rows : regridded)
            {
                samples.push_back(rows[c][l]);
            }
            const nan_stats::LevelSummary summary = nan_stats::summarize(samples, config.min_valid_samples);
            result.median(p, l, c) = summary.median;
            result.std_dev(p, l, c) = summary.std_dev;
            result.p05(p, l, c) = summary.p05;
            result.p95(p, l, c) = summary.p95;
        }
    }
}

}

std::vector<std::vector<double>> regrid_channels(const DerivedProfile& derived,
                                                 const std::vector<const wpdb::ChannelContract*>& channels,
                                                 const std::vector<double>& grid,
                                                 const AggregationConfig& config)
{
    std::vector<std::vector<double>> out;
    out.reserve(channels.size());
    for (const wpdb::ChannelContract* contract : channels)
    {
        const ChannelSeries series = channel_series(derived, *contract);
        if (series.values->size() != series.pressure_dbar->size())
        {
            throw std::runtime_error("configuration error: channel " + contract->id + " has " +
                                     std::to_string(series.values->size()) + " values on a " +
                                     std::to_string(series.pressure_dbar->size()) + "-level " +
                                     wpdb::to_string(contract->axis) + " axis");
        }

        std::vector<double> values = *series.values;
        const wpdb::ChannelValidationResult check = wpdb::validate_channel_inplace(values, *contract, config.guard);
        if (check.failed)
        {
            throw std::runtime_error("Strict guard rejected " + check.reason);
        }
        out.push_back(regrid_one(values, *series.pressure_dbar, grid, config.regrid));
    }
    return out;
}

AggregateResult aggregate_within_radius(const CatalogView& view,
                                        const std::vector<GeoPoint>& points,
                                        const AggregationConfig& config,
                                        const EquationOfStateScheme& scheme)
{
    const std::vector<const wpdb::ChannelContract*> channels = wpdb::parse_channel_selector(config.channel_selector);
    validate_grid(config.standard_grid);
    if (!scheme.is_initialized())
    {
        throw std::runtime_error("Equation-of-state scheme must be initialized before aggregation");
    }

    const std::size_t np = points.size();
    const std::size_t nl = config.standard_grid.size();
    const std::size_t nc = channels.size();
    const bool need_stratification = wpdb::needs_midpoint_axis(channels);

    AggregateResult result;
    result.standard_grid = config.standard_grid;
    for (const wpdb::ChannelContract* contract : channels)
    {
        result.channel_ids.push_back(contract->id);
    }
    result.median.resize(np, nl, nc);
    result.std_dev.resize(np, nl, nc);
    result.p05.resize(np, nl, nc);
    result.p95.resize(np, nl, nc);
    result.profile_counts.assign(np, 0);

    const int nthreads = resolve_thread_count(config.num_threads);
    std::exception_ptr first_error = nullptr;

    #pragma omp parallel for schedule(dynamic) num_threads(nthreads)
    for (long long i = 0; i < static_cast<long long>(np); ++i)
    {
        const std::size_t p = static_cast<std::size_t>(i);
        try
        {
            aggregate_point(view, points[p], p, channels, need_stratification, config, scheme, result);
        }
        catch (...)
        {
            #pragma omp critical(wpdb_error)
            {
                if (!first_error)
                {
                    first_error = std::current_exception();
                }
            }
        }
    }

    if (first_error)
    {
        std::rethrow_exception(first_error);
    }

    if (log_normal_enabled())
    {
        std::cout << "Aggregated " << np << " points x " << nl << " levels x " << nc
                  << " channels from " << view.size() << " candidate profiles" << std::endl;
    }
    return result;
}

AggregateResult aggregate_within_radius(const Catalog& catalog,
                                        const std::vector<GeoPoint>& points,
                                        const AggregationConfig& config,
                                        const EquationOfStateScheme& scheme)
{
    return aggregate_within_radius(catalog.all(), points, config, scheme);
}

AggregateResult aggregate_within_radius(const Catalog& catalog,
                                        const std::vector<double>& longitudes,
                                        const std::vector<double>& latitudes,
                                        const AggregationConfig& config,
                                        const EquationOfStateScheme& scheme)
{
    if (longitudes.size() != latitudes.size())
    {
        throw std::invalid_argument("Query longitude and latitude arrays differ in length");
    }
    std::vector<GeoPoint> points(longitudes.size());
    for (std::size_t i = 0; i < points.size(); ++i)
    {
        points[i].longitude_deg = longitudes[i];
        points[i].latitude_deg = latitudes[i];
    }
    return aggregate_within_radius(catalog, points, config, scheme);
}
