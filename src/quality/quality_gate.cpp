/**
 * @file quality_gate.cpp
 * @brief Ingestion usability policy and the per-query quality gate.
 */

#include "quality_gate.hpp"

#include <cmath>
#include <iostream>

#include "logging.hpp"

bool passes_quality_gate(const Catalog& catalog, std::size_t row, const QualityCriteria& criteria)
{
    const double dpm = catalog.mean_pressure_spacing()[row];
    // A NaN spacing fails the comparison and therefore the gate.
    return catalog.salinity_qc()[row] == criteria.accepted_qc &&
           catalog.temperature_qc()[row] == criteria.accepted_qc &&
           dpm <= criteria.max_mean_pressure_spacing_dbar;
}

CatalogView apply_quality_gate(const CatalogView& view, const QualityCriteria& criteria)
{
    return view.filter([&criteria](const Catalog& catalog, std::size_t row)
    {
        return passes_quality_gate(catalog, row, criteria);
    });
}

double joint_coverage_fraction(const ProfileCast& cast)
{
    const std::size_t n = cast.num_levels();
    if (n == 0 || cast.salinity.size() != n || cast.temperature_c.size() != n)
    {
        return 0.0;
    }
    std::size_t finite = 0;
    for (std::size_t k = 0; k < n; ++k)
    {
        if (std::isfinite(cast.pressure_dbar[k]) &&
            std::isfinite(cast.salinity[k]) &&
            std::isfinite(cast.temperature_c[k]))
        {
            ++finite;
        }
    }
    return static_cast<double>(finite) / static_cast<double>(n);
}

bool is_usable_profile(const ProfileCast& cast, const UsabilityCriteria& criteria)
{
    if (cast.num_levels() == 0 || !cast.is_consistent())
    {
        return false;
    }
    if (!cast.salinity_qc.has_value() || !cast.temperature_qc.has_value())
    {
        return false;
    }
    if (*cast.salinity_qc >= criteria.qc_threshold || *cast.temperature_qc >= criteria.qc_threshold)
    {
        return false;
    }
    return joint_coverage_fraction(cast) >= criteria.min_coverage_fraction;
}

Catalog build_catalog(const std::vector<ProfileCast>& casts,
                      const UsabilityCriteria& criteria,
                      std::size_t* rejected)
{
    Catalog catalog;
    std::size_t dropped = 0;
    for (const ProfileCast& cast : casts)
    {
        if (is_usable_profile(cast, criteria))
        {
            catalog.append(cast);
        }
        else
        {
            ++dropped;
        }
    }

    if (rejected != nullptr)
    {
        *rejected = dropped;
    }
    if (log_normal_enabled())
    {
        std::cout << "Catalog built with " << catalog.size() << " profiles ("
                  << dropped << " rejected, " << catalog.total_levels() << " levels)" << std::endl;
    }
    return catalog;
}
