#pragma once

#include <cstddef>
#include <vector>

/**
 * @file nan_statistics.hpp
 * @brief Reductions that ignore missing samples.
 *
 * Quantiles use linear interpolation between order statistics at
 * position q * (n - 1). Standard deviation is the population form.
 */

namespace nan_stats
{

struct LevelSummary
{
    double median = 0.0;
    double std_dev = 0.0;
    double p05 = 0.0;
    double p95 = 0.0;
    std::size_t count = 0;
};

/**
 * @brief Copies the finite samples, dropping NaN and infinities.
 */
std::vector<double> finite_values(const std::vector<double>& samples);

/**
 * @brief Quantile of already sorted finite samples.
 * @param sorted Ascending samples, non-empty.
 * @param q Quantile in [0, 1].
 */
double quantile_sorted(const std::vector<double>& sorted, double q);

double nan_quantile(const std::vector<double>& samples, double q);
double nan_median(const std::vector<double>& samples);
double nan_mean(const std::vector<double>& samples);
double nan_std(const std::vector<double>& samples);

/**
 * @brief Median, std and 5/95 percentiles of the finite samples.
 * @param samples Samples; reordered in place.
 * @param min_valid Minimum finite sample count, at least 1.
 * @return All statistics NaN when fewer than min_valid finite samples exist.
 */
LevelSummary summarize(std::vector<double>& samples, std::size_t min_valid = 1);

} // namespace nan_stats
