#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

#include "profile_record.hpp"

/**
 * @file catalog.hpp
 * @brief Columnar in-memory catalog of quality-screened profiles.
 *
 * Scalar attributes are stored column-wise. Per-level sequences of all
 * profiles live in one flat arena per variable; `level_offsets_[i]` and
 * `level_offsets_[i + 1]` bracket the levels of row i. Rows are read
 * through non-owning views and subsets are expressed as row-index views,
 * so filtering never copies level data or mutates the catalog.
 */

/**
 * @brief Non-owning contiguous run of level values.
 */
struct LevelSpan
{
    const double* data = nullptr;
    std::size_t size = 0;

    const double& operator[](std::size_t k) const { return data[k]; }
    const double* begin() const { return data; }
    const double* end() const { return data + size; }
    bool empty() const { return size == 0; }

    std::vector<double> to_vector() const { return std::vector<double>(begin(), end()); }
};

/**
 * @brief Read-only view of one catalog row.
 */
struct ProfileView
{
    std::size_t row = 0;
    ProbeType probe_type = ProbeType::Unknown;
    int year = 0;
    int month = 0;
    int day = 0;
    std::int64_t timestamp_s = 0;
    double latitude_deg = 0.0;
    double longitude_deg = 0.0;
    double pressure_min_dbar = 0.0;
    double pressure_max_dbar = 0.0;
    double mean_pressure_spacing_dbar = 0.0;
    double mean_depth_spacing_m = 0.0;
    int salinity_qc = 0;
    int temperature_qc = 0;

    LevelSpan pressure_dbar;
    LevelSpan salinity;
    LevelSpan temperature_c;
    LevelSpan depth_m;
    LevelSpan salinity_uncertainty;
    LevelSpan temperature_uncertainty;
    LevelSpan depth_uncertainty;

    std::size_t num_levels() const { return pressure_dbar.size; }
};

class CatalogView;

class Catalog
{
public:
    Catalog() : level_offsets_{0} {}

    /**
     * @brief Appends one cast and computes its summary attributes.
     * @param cast Size-consistent cast with both QC codes present.
     * @throws std::invalid_argument when the cast is inconsistent or lacks QC codes.
     */
    void append(const ProfileCast& cast);

    std::size_t size() const { return latitude_deg_.size(); }
    bool empty() const { return latitude_deg_.empty(); }
    std::size_t total_levels() const { return pressure_dbar_.size(); }

    /**
     * @brief Returns a view of one row.
     * @throws std::out_of_range when the row does not exist.
     */
    ProfileView profile(std::size_t row) const;

    const std::vector<double>& longitudes() const { return longitude_deg_; }
    const std::vector<double>& latitudes() const { return latitude_deg_; }
    const std::vector<int>& months() const { return month_; }
    const std::vector<int>& years() const { return year_; }
    const std::vector<int>& salinity_qc() const { return salinity_qc_; }
    const std::vector<int>& temperature_qc() const { return temperature_qc_; }
    const std::vector<double>& mean_pressure_spacing() const { return mean_pressure_spacing_dbar_; }
    const std::vector<int>& level_counts() const { return level_count_; }

    double longitude(std::size_t row) const { return longitude_deg_[row]; }
    double latitude(std::size_t row) const { return latitude_deg_[row]; }

    /**
     * @brief Returns a view over every row in catalog order.
     */
    CatalogView all() const;

    /**
     * @brief Selects rows where the mask is true.
     * @throws std::invalid_argument when the mask length differs from size().
     */
    CatalogView where(const std::vector<bool>& mask) const;

private:
    LevelSpan span(const std::vector<double>& arena, std::size_t row) const;

    std::vector<ProbeType> probe_type_;
    std::vector<int> level_count_;
    std::vector<int> year_;
    std::vector<int> month_;
    std::vector<int> day_;
    std::vector<std::int64_t> timestamp_s_;
    std::vector<double> latitude_deg_;
    std::vector<double> longitude_deg_;
    std::vector<double> pressure_min_dbar_;
    std::vector<double> pressure_max_dbar_;
    std::vector<double> mean_pressure_spacing_dbar_;
    std::vector<double> mean_depth_spacing_m_;
    std::vector<int> salinity_qc_;
    std::vector<int> temperature_qc_;

    std::vector<std::size_t> level_offsets_;
    std::vector<double> pressure_dbar_;
    std::vector<double> salinity_;
    std::vector<double> temperature_c_;
    std::vector<double> depth_m_;
    std::vector<double> salinity_uncertainty_;
    std::vector<double> temperature_uncertainty_;
    std::vector<double> depth_uncertainty_;
};

/**
 * @brief Ordered subset of catalog rows.
 *
 * The view references its catalog, which must outlive it.
 */
class CatalogView
{
public:
    CatalogView(const Catalog& catalog, std::vector<std::size_t> rows)
        : catalog_(&catalog), rows_(std::move(rows))
    {
    }

    std::size_t size() const { return rows_.size(); }
    bool empty() const { return rows_.empty(); }

    /**
     * @brief Returns the catalog row index of the k-th view entry.
     */
    std::size_t row(std::size_t k) const { return rows_[k]; }
    const std::vector<std::size_t>& rows() const { return rows_; }
    const Catalog& catalog() const { return *catalog_; }

    ProfileView profile(std::size_t k) const { return catalog_->profile(rows_.at(k)); }

    /**
     * @brief Keeps entries where the mask is true, preserving order.
     * @throws std::invalid_argument when the mask length differs from size().
     */
    CatalogView where(const std::vector<bool>& mask) const;

    /**
     * @brief Keeps entries whose catalog row satisfies the predicate.
     */
    CatalogView filter(const std::function<bool(const Catalog&, std::size_t)>& predicate) const;

    /**
     * @brief Keeps profiles sampled in the given calendar month.
     */
    CatalogView with_month(int month) const;

    /**
     * @brief Keeps profiles sampled within an inclusive year range.
     */
    CatalogView with_years(int first_year, int last_year) const;

private:
    const Catalog* catalog_;
    std::vector<std::size_t> rows_;
};
