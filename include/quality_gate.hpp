#pragma once

#include <cstddef>
#include <vector>

#include "catalog.hpp"
#include "profile_record.hpp"

/**
 * @file quality_gate.hpp
 * @brief Profile-level quality policies.
 *
 * Two policies apply at different stages. The usability policy decides
 * at ingestion whether a cast enters the catalog at all. The quality gate
 * narrows an already-built catalog subset to casts flagged as accepted
 * and sampled finely enough for regridding.
 */

struct QualityCriteria
{
    int accepted_qc = 0;
    double max_mean_pressure_spacing_dbar = 10.0;
};

struct UsabilityCriteria
{
    double min_coverage_fraction = 0.5;
    int qc_threshold = 3;
};

/**
 * @brief Checks one catalog row against the quality gate.
 */
bool passes_quality_gate(const Catalog& catalog, std::size_t row, const QualityCriteria& criteria);

/**
 * @brief Keeps the rows that pass the quality gate, order preserved.
 */
CatalogView apply_quality_gate(const CatalogView& view, const QualityCriteria& criteria);

/**
 * @brief Fraction of levels where pressure, salinity and temperature are all finite.
 */
double joint_coverage_fraction(const ProfileCast& cast);

/**
 * @brief Decides whether a cast may be added to the catalog.
 * @param cast Candidate cast.
 * @param criteria Coverage and QC thresholds.
 * @return True when coverage and both QC codes satisfy the criteria.
 */
bool is_usable_profile(const ProfileCast& cast, const UsabilityCriteria& criteria = UsabilityCriteria{});

/**
 * @brief Builds a catalog from the usable casts, in input order.
 * @param casts Candidate casts.
 * @param criteria Usability thresholds.
 * @param rejected Optional output with the number of rejected casts.
 */
Catalog build_catalog(const std::vector<ProfileCast>& casts,
                      const UsabilityCriteria& criteria = UsabilityCriteria{},
                      std::size_t* rejected = nullptr);
