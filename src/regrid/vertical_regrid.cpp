/**
 * @file vertical_regrid.cpp
 * @brief Standard grid construction and per-profile regridding.
 */

#include "vertical_regrid.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>
#include <string>
#include <utility>

std::vector<double> make_standard_grid(double pmin_dbar, double pmax_dbar, double step_dbar)
{
    if (!std::isfinite(pmin_dbar) || !std::isfinite(pmax_dbar) || !std::isfinite(step_dbar))
    {
        throw std::invalid_argument("Standard grid bounds and step must be finite");
    }
    if (step_dbar <= 0.0)
    {
        throw std::invalid_argument("Standard grid step must be positive, got " + std::to_string(step_dbar));
    }
    if (pmax_dbar < pmin_dbar)
    {
        throw std::invalid_argument("Standard grid maximum is below its minimum");
    }

    const double intervals = (pmax_dbar - pmin_dbar) / step_dbar;
    if (!std::isfinite(intervals) || intervals >= static_cast<double>(kMaxStandardGridLevels))
    {
        throw std::invalid_argument("Standard grid would exceed " + std::to_string(kMaxStandardGridLevels) +
                                    " levels");
    }

    // Levels are computed from the index to avoid accumulated rounding.
    const std::size_t count = static_cast<std::size_t>(std::floor(intervals + 1.0e-9)) + 1;
    std::vector<double> grid(count);
    for (std::size_t i = 0; i < count; ++i)
    {
        grid[i] = pmin_dbar + static_cast<double>(i) * step_dbar;
    }
    return grid;
}

bool is_strictly_increasing(const std::vector<double>& values)
{
    for (std::size_t k = 1; k < values.size(); ++k)
    {
        if (!(values[k] > values[k - 1]))
        {
            return false;
        }
    }
    return true;
}

std::vector<double> regrid_one(const std::vector<double>& values,
                               const std::vector<double>& pressure,
                               const std::vector<double>& grid,
                               const RegridOptions& options)
{
    if (values.size() != pressure.size())
    {
        throw std::invalid_argument("regrid_one: values (" + std::to_string(values.size()) +
                                    ") and pressure (" + std::to_string(pressure.size()) +
                                    ") differ in length");
    }

    std::vector<double> out(grid.size(), std::numeric_limits<double>::quiet_NaN());

    std::vector<std::pair<double, double>> samples;
    samples.reserve(values.size());
    for (std::size_t k = 0; k < values.size(); ++k)
    {
        if (std::isfinite(values[k]) && std::isfinite(pressure[k]))
        {
            samples.emplace_back(pressure[k], values[k]);
        }
    }
    if (samples.size() < 2)
    {
        return out;
    }

    const bool ordered = std::is_sorted(samples.begin(), samples.end(),
                                        [](const auto& a, const auto& b) { return a.first < b.first; });
    if (!ordered)
    {
        std::stable_sort(samples.begin(), samples.end(),
                         [](const auto& a, const auto& b) { return a.first < b.first; });
    }

    // Repeated pressures collapse to the mean of their values.
    std::vector<double> x;
    std::vector<double> y;
    x.reserve(samples.size());
    y.reserve(samples.size());
    std::size_t k = 0;
    while (k < samples.size())
    {
        std::size_t j = k;
        double sum = 0.0;
        while (j < samples.size() && samples[j].first == samples[k].first)
        {
            sum += samples[j].second;
            ++j;
        }
        x.push_back(samples[k].first);
        y.push_back(sum / static_cast<double>(j - k));
        k = j;
    }
    if (x.size() < 2)
    {
        return out;
    }

    const PchipInterpolant interpolant(std::move(x), std::move(y));
    return interpolant.evaluate(grid, options.extrapolation);
}

std::vector<std::vector<double>> regrid_batch(const std::vector<std::vector<double>>& values,
                                              const std::vector<std::vector<double>>& pressures,
                                              const std::vector<double>& grid,
                                              const RegridOptions& options)
{
    if (values.size() != pressures.size())
    {
        throw std::invalid_argument("regrid_batch: value and pressure lists differ in length");
    }
    std::vector<std::vector<double>> out;
    out.reserve(values.size());
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        out.push_back(regrid_one(values[i], pressures[i], grid, options));
    }
    return out;
}
