#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @file profile_record.hpp
 * @brief Ingestion-side representation of one World Ocean Database cast.
 *
 * A ProfileCast is what a reader hands to the catalog builder: station
 * metadata, optional per-profile QC codes and the per-level sequences.
 * Missing level values are stored as quiet NaN.
 */

enum class ProbeType : int
{
    Ctd,
    Std,
    Xctd,
    Xtd,
    Float,
    Unknown,
    ReadFail,
};

struct ProfileCast
{
    ProbeType probe_type = ProbeType::Unknown;
    int year = 0;
    int month = 0;
    int day = 0;
    std::int64_t timestamp_s = 0;
    double latitude_deg = 0.0;
    double longitude_deg = 0.0;

    std::optional<int> salinity_qc;
    std::optional<int> temperature_qc;

    std::vector<double> pressure_dbar;
    std::vector<double> salinity;
    std::vector<double> temperature_c;
    std::vector<double> depth_m;
    std::vector<double> salinity_uncertainty;
    std::vector<double> temperature_uncertainty;
    std::vector<double> depth_uncertainty;

    /**
     * @brief Returns the number of levels in the cast.
     */
    std::size_t num_levels() const { return pressure_dbar.size(); }

    /**
     * @brief Checks that the per-level sequences are size-aligned.
     * @return True when pressure, salinity, temperature and depth share one
     *         length and each uncertainty sequence is empty or matches it.
     */
    bool is_consistent() const
    {
        const std::size_t n = pressure_dbar.size();
        auto optional_matches = [n](const std::vector<double>& values)
        {
            return values.empty() || values.size() == n;
        };
        return salinity.size() == n &&
               temperature_c.size() == n &&
               depth_m.size() == n &&
               optional_matches(salinity_uncertainty) &&
               optional_matches(temperature_uncertainty) &&
               optional_matches(depth_uncertainty);
    }
};

/**
 * @brief Maps a WOD probe-type code to the catalog probe category.
 * @param code Integer probe code from the WOD header.
 * @return Probe category; unrecognized codes map to ReadFail.
 */
ProbeType probe_type_from_wod_code(int code);

/**
 * @brief Returns the catalog label of a probe category.
 */
const char* to_string(ProbeType probe);

/**
 * @brief Converts a UTC civil date and time of day to Unix epoch seconds.
 * @param year Gregorian year.
 * @param month Month in 1..12.
 * @param day Day of month.
 * @param seconds_of_day Seconds elapsed since midnight.
 * @return Seconds since 1970-01-01T00:00:00Z.
 */
std::int64_t epoch_seconds_from_civil(int year, int month, int day, std::int64_t seconds_of_day = 0);

/**
 * @brief Mean of the finite consecutive differences of a sequence.
 * @return NaN when no pair of consecutive finite values exists.
 */
double mean_finite_spacing(const double* values, std::size_t count);
