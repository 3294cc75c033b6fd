/**
 * @file nan_statistics.cpp
 * @brief NaN-skipping reductions used by the level-wise aggregation.
 */

#include "nan_statistics.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace nan_stats
{

namespace
{

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

double mean_of(const std::vector<double>& finite)
{
    double sum = 0.0;
    for (double v : finite) sum += v;
    return sum / static_cast<double>(finite.size());
}

double std_of(const std::vector<double>& finite)
{
    const double mean = mean_of(finite);
    double acc = 0.0;
    for (double v : finite)
    {
        const double d = v - mean;
        acc += d * d;
    }
    return std::sqrt(acc / static_cast<double>(finite.size()));
}

}

std::vector<double> finite_values(const std::vector<double>& samples)
{
    std::vector<double> out;
    out.reserve(samples.size());
    for (double v : samples)
    {
        if (std::isfinite(v))
        {
            out.push_back(v);
        }
    }
    return out;
}

double quantile_sorted(const std::vector<double>& sorted, double q)
{
    if (sorted.empty())
    {
        return kNaN;
    }
    const double pos = std::clamp(q, 0.0, 1.0) * static_cast<double>(sorted.size() - 1);
    const std::size_t lo = static_cast<std::size_t>(std::floor(pos));
    const std::size_t hi = std::min(lo + 1, sorted.size() - 1);
    const double frac = pos - static_cast<double>(lo);
    return sorted[lo] + frac * (sorted[hi] - sorted[lo]);
}

double nan_quantile(const std::vector<double>& samples, double q)
{
    std::vector<double> finite = finite_values(samples);
    std::sort(finite.begin(), finite.end());
    return quantile_sorted(finite, q);
}

double nan_median(const std::vector<double>& samples)
{
    return nan_quantile(samples, 0.5);
}

double nan_mean(const std::vector<double>& samples)
{
    const std::vector<double> finite = finite_values(samples);
    return finite.empty() ? kNaN : mean_of(finite);
}

double nan_std(const std::vector<double>& samples)
{
    const std::vector<double> finite = finite_values(samples);
    return finite.empty() ? kNaN : std_of(finite);
}

LevelSummary summarize(std::vector<double>& samples, std::size_t min_valid)
{
    auto last = std::remove_if(samples.begin(), samples.end(), [](double v) { return !std::isfinite(v); });
    samples.erase(last, samples.end());

    LevelSummary out;
    out.count = samples.size();
    if (samples.empty() || samples.size() < std::max<std::size_t>(min_valid, 1))
    {
        out.median = out.std_dev = out.p05 = out.p95 = kNaN;
        return out;
    }

    std::sort(samples.begin(), samples.end());
    out.median = quantile_sorted(samples, 0.5);
    out.p05 = quantile_sorted(samples, 0.05);
    out.p95 = quantile_sorted(samples, 0.95);
    out.std_dev = std_of(samples);
    return out;
}

} // namespace nan_stats
