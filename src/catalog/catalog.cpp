/**
 * @file catalog.cpp
 * @brief Columnar catalog storage and row-index views.
 */

#include "catalog.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace
{

void append_levels(std::vector<double>& arena, const std::vector<double>& values, std::size_t n)
{
    if (values.empty())
    {
        arena.insert(arena.end(), n, std::numeric_limits<double>::quiet_NaN());
    }
    else
    {
        arena.insert(arena.end(), values.begin(), values.end());
    }
}

std::vector<std::size_t> select_rows(const std::vector<std::size_t>& rows, const std::vector<bool>& mask)
{
    if (mask.size() != rows.size())
    {
        throw std::invalid_argument("Mask length " + std::to_string(mask.size()) +
                                    " does not match view size " + std::to_string(rows.size()));
    }
    std::vector<std::size_t> out;
    out.reserve(rows.size());
    for (std::size_t k = 0; k < rows.size(); ++k)
    {
        if (mask[k])
        {
            out.push_back(rows[k]);
        }
    }
    return out;
}

}

void Catalog::append(const ProfileCast& cast)
{
    if (!cast.is_consistent())
    {
        throw std::invalid_argument("Profile level sequences have inconsistent lengths");
    }
    if (!cast.salinity_qc.has_value() || !cast.temperature_qc.has_value())
    {
        throw std::invalid_argument("Profile is missing a salinity or temperature QC code");
    }

    const std::size_t n = cast.num_levels();

    double pmin = std::numeric_limits<double>::quiet_NaN();
    double pmax = std::numeric_limits<double>::quiet_NaN();
    for (double p : cast.pressure_dbar)
    {
        if (!std::isfinite(p)) continue;
        pmin = std::isnan(pmin) ? p : std::min(pmin, p);
        pmax = std::isnan(pmax) ? p : std::max(pmax, p);
    }

    probe_type_.push_back(cast.probe_type);
    level_count_.push_back(static_cast<int>(n));
    year_.push_back(cast.year);
    month_.push_back(cast.month);
    day_.push_back(cast.day);
    timestamp_s_.push_back(cast.timestamp_s);
    latitude_deg_.push_back(cast.latitude_deg);
    longitude_deg_.push_back(cast.longitude_deg);
    pressure_min_dbar_.push_back(pmin);
    pressure_max_dbar_.push_back(pmax);
    mean_pressure_spacing_dbar_.push_back(mean_finite_spacing(cast.pressure_dbar.data(), n));
    mean_depth_spacing_m_.push_back(mean_finite_spacing(cast.depth_m.data(), n));
    salinity_qc_.push_back(*cast.salinity_qc);
    temperature_qc_.push_back(*cast.temperature_qc);

    pressure_dbar_.insert(pressure_dbar_.end(), cast.pressure_dbar.begin(), cast.pressure_dbar.end());
    salinity_.insert(salinity_.end(), cast.salinity.begin(), cast.salinity.end());
    temperature_c_.insert(temperature_c_.end(), cast.temperature_c.begin(), cast.temperature_c.end());
    depth_m_.insert(depth_m_.end(), cast.depth_m.begin(), cast.depth_m.end());
    append_levels(salinity_uncertainty_, cast.salinity_uncertainty, n);
    append_levels(temperature_uncertainty_, cast.temperature_uncertainty, n);
    append_levels(depth_uncertainty_, cast.depth_uncertainty, n);
    level_offsets_.push_back(level_offsets_.back() + n);
}

LevelSpan Catalog::span(const std::vector<double>& arena, std::size_t row) const
{
    LevelSpan out;
    out.data = arena.data() + level_offsets_[row];
    out.size = level_offsets_[row + 1] - level_offsets_[row];
    return out;
}

ProfileView Catalog::profile(std::size_t row) const
{
    if (row >= size())
    {
        throw std::out_of_range("Catalog row " + std::to_string(row) +
                                " out of range (size " + std::to_string(size()) + ")");
    }

    ProfileView view;
    view.row = row;
    view.probe_type = probe_type_[row];
    view.year = year_[row];
    view.month = month_[row];
    view.day = day_[row];
    view.timestamp_s = timestamp_s_[row];
    view.latitude_deg = latitude_deg_[row];
    view.longitude_deg = longitude_deg_[row];
    view.pressure_min_dbar = pressure_min_dbar_[row];
    view.pressure_max_dbar = pressure_max_dbar_[row];
    view.mean_pressure_spacing_dbar = mean_pressure_spacing_dbar_[row];
    view.mean_depth_spacing_m = mean_depth_spacing_m_[row];
    view.salinity_qc = salinity_qc_[row];
    view.temperature_qc = temperature_qc_[row];
    view.pressure_dbar = span(pressure_dbar_, row);
    view.salinity = span(salinity_, row);
    view.temperature_c = span(temperature_c_, row);
    view.depth_m = span(depth_m_, row);
    view.salinity_uncertainty = span(salinity_uncertainty_, row);
    view.temperature_uncertainty = span(temperature_uncertainty_, row);
    view.depth_uncertainty = span(depth_uncertainty_, row);
    return view;
}

CatalogView Catalog::all() const
{
    std::vector<std::size_t> rows(size());
    for (std::size_t i = 0; i < rows.size(); ++i)
    {
        rows[i] = i;
    }
    return CatalogView(*this, std::move(rows));
}

CatalogView Catalog::where(const std::vector<bool>& mask) const
{
    return all().where(mask);
}

CatalogView CatalogView::where(const std::vector<bool>& mask) const
{
    return CatalogView(*catalog_, select_rows(rows_, mask));
}

CatalogView CatalogView::filter(const std::function<bool(const Catalog&, std::size_t)>& predicate) const
{
    std::vector<std::size_t> out;
    out.reserve(rows_.size());
    for (std::size_t row : rows_)
    {
        if (predicate(*catalog_, row))
        {
            out.push_back(row);
        }
    }
    return CatalogView(*catalog_, std::move(out));
}

CatalogView CatalogView::with_month(int month) const
{
    return filter([month](const Catalog& catalog, std::size_t row)
    {
        return catalog.months()[row] == month;
    });
}

CatalogView CatalogView::with_years(int first_year, int last_year) const
{
    return filter([first_year, last_year](const Catalog& catalog, std::size_t row)
    {
        const int year = catalog.years()[row];
        return year >= first_year && year <= last_year;
    });
}
