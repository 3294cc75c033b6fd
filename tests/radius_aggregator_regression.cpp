#include "catalog.hpp"
#include "eos/factory.hpp"
#include "logging.hpp"
#include "radius_aggregator.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

bool nearly_equal(double a, double b, double tol = 1.0e-12)
{
    return std::abs(a - b) <= tol;
}

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[radius-aggregator-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

int expect_close(double actual, double expected, const std::string& label, double tol = 1.0e-12)
{
    if (!nearly_equal(actual, expected, tol))
    {
        std::cerr << "[radius-aggregator-regression] FAIL: " << label
                  << " actual=" << actual
                  << " expected=" << expected
                  << " tol=" << tol << std::endl;
        return 1;
    }
    return 0;
}

bool same_or_both_nan(double a, double b)
{
    return (std::isnan(a) && std::isnan(b)) || a == b;
}

ProfileCast make_cast(double lon, double lat, int month, double surface_t, double salinity = 35.0)
{
    ProfileCast cast;
    cast.probe_type = ProbeType::Ctd;
    cast.year = 2005;
    cast.month = month;
    cast.day = 1;
    cast.longitude_deg = lon;
    cast.latitude_deg = lat;
    cast.salinity_qc = 0;
    cast.temperature_qc = 0;
    for (int k = 0; k <= 20; ++k)
    {
        const double p = 5.0 * static_cast<double>(k);
        cast.pressure_dbar.push_back(p);
        cast.depth_m.push_back(p);
        cast.salinity.push_back(salinity + 0.002 * p);
        cast.temperature_c.push_back(surface_t - 0.1 * p);
    }
    return cast;
}

Catalog make_catalog()
{
    Catalog catalog;
    catalog.append(make_cast(0.00, 0.00, 1, 20.0));
    catalog.append(make_cast(0.20, 0.10, 1, 21.0));
    catalog.append(make_cast(-0.10, 0.30, 2, 19.0));
    // Rejected by the quality gate despite being inside the radius.
    ProfileCast flagged = make_cast(0.05, 0.05, 1, 25.0);
    flagged.salinity_qc = 1;
    catalog.append(flagged);
    return catalog;
}

std::unique_ptr<EquationOfStateScheme> make_scheme()
{
    std::unique_ptr<EquationOfStateScheme> scheme = create_seos_scheme();
    scheme->initialize(EosConfig{});
    return scheme;
}

int test_shape_and_empty_area()
{
    int failures = 0;
    const Catalog catalog = make_catalog();
    const std::unique_ptr<EquationOfStateScheme> scheme = make_scheme();
    AggregationConfig config;

    const std::vector<GeoPoint> points = {{0.0, 0.0}, {40.0, 40.0}, {0.1, 0.1}};
    const AggregateResult result = aggregate_within_radius(catalog, points, config, *scheme);

    failures += expect_true(result.num_points() == 3, "one row per query point");
    failures += expect_true(result.num_levels() == 1201, "default grid levels");
    failures += expect_true(result.median.size_points() == 3 && result.median.size_levels() == 1201 &&
                            result.median.size_channels() == 3, "median shape (3, 1201, 3)");
    failures += expect_true(result.p95.size() == result.median.size(), "all statistics share the shape");
    failures += expect_true(result.channel_ids == std::vector<std::string>({"N2", "alpha", "beta"}),
                            "channels in preset order");
    failures += expect_true(result.profile_counts[0] == 3, "flagged cast excluded at point 0");
    failures += expect_true(result.profile_counts[1] == 0, "remote point finds nothing");
    failures += expect_true(result.profile_counts[2] == 3, "point 2 sees the same casts");

    bool all_nan = true;
    for (std::size_t c = 0; c < result.num_channels(); ++c)
    {
        for (const double v : result.median.column(1, c))
        {
            all_nan = all_nan && std::isnan(v);
        }
        for (const double v : result.std_dev.column(1, c))
        {
            all_nan = all_nan && std::isnan(v);
        }
    }
    failures += expect_true(all_nan, "empty area is all NaN");

    // Midpoints span 2.5..97.5 dbar; grid level 1 is 5 dbar.
    failures += expect_true(std::isnan(result.median(0, 0, 0)), "surface level lies above the first midpoint");
    failures += expect_true(result.median(0, 1, 0) > 0.0, "stable stratification at 5 dbar");
    failures += expect_true(result.p05(0, 1, 0) <= result.median(0, 1, 0) &&
                            result.median(0, 1, 0) <= result.p95(0, 1, 0), "quantiles ordered");
    failures += expect_true(std::isnan(result.median(0, 200, 0)), "no values below the deepest cast");
    return failures;
}

int test_identical_profiles_reduce_exactly()
{
    int failures = 0;
    Catalog catalog;
    catalog.append(make_cast(0.0, 0.0, 3, 15.0));
    catalog.append(make_cast(0.1, 0.0, 3, 15.0));
    const std::unique_ptr<EquationOfStateScheme> scheme = make_scheme();

    AggregationConfig config;
    config.channel_selector = "SP,t";
    config.standard_grid = make_standard_grid(0.0, 100.0, 10.0);
    const AggregateResult result = aggregate_within_radius(catalog, {GeoPoint{0.0, 0.0}}, config, *scheme);

    failures += expect_close(result.median(0, 0, 0), 35.0, "SP median at the surface", 1.0e-12);
    failures += expect_close(result.median(0, 5, 1), 10.0, "t median at 50 dbar", 1.0e-10);
    failures += expect_close(result.std_dev(0, 5, 1), 0.0, "identical casts have zero spread", 1.0e-12);

    config.min_valid_samples = 3;
    const AggregateResult gated = aggregate_within_radius(catalog, {GeoPoint{0.0, 0.0}}, config, *scheme);
    failures += expect_true(result.profile_counts[0] == 2, "two casts found");
    failures += expect_true(std::isnan(gated.median(0, 0, 0)), "min_valid_samples above the count gives NaN");
    return failures;
}

int test_thread_count_does_not_change_results()
{
    int failures = 0;
    const Catalog catalog = make_catalog();
    const std::unique_ptr<EquationOfStateScheme> scheme = make_scheme();

    std::vector<GeoPoint> points;
    for (int i = 0; i < 8; ++i)
    {
        points.push_back(GeoPoint{-0.2 + 0.05 * i, 0.1});
    }

    AggregationConfig serial;
    serial.channel_selector = "all";
    serial.standard_grid = make_standard_grid(0.0, 120.0, 5.0);
    serial.num_threads = 1;
    AggregationConfig parallel = serial;
    parallel.num_threads = 4;

    const AggregateResult a = aggregate_within_radius(catalog, points, serial, *scheme);
    const AggregateResult b = aggregate_within_radius(catalog, points, parallel, *scheme);
    bool identical = a.profile_counts == b.profile_counts;
    for (std::size_t i = 0; i < a.median.size(); ++i)
    {
        identical = identical && same_or_both_nan(a.median.data()[i], b.median.data()[i]) &&
                    same_or_both_nan(a.p95.data()[i], b.p95.data()[i]);
    }
    failures += expect_true(identical, "serial and parallel runs agree");
    return failures;
}

int test_errors()
{
    int failures = 0;
    const Catalog catalog = make_catalog();
    const std::unique_ptr<EquationOfStateScheme> scheme = make_scheme();

    AggregationConfig bad_selector;
    bad_selector.channel_selector = "N2,,beta";
    bool threw = false;
    try
    {
        (void)aggregate_within_radius(catalog, {GeoPoint{0.0, 0.0}}, bad_selector, *scheme);
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    failures += expect_true(threw, "malformed selector must throw invalid_argument");

    threw = false;
    try
    {
        (void)aggregate_within_radius(catalog, std::vector<double>{0.0, 1.0}, std::vector<double>{0.0},
                                      AggregationConfig{}, *scheme);
    }
    catch (const std::invalid_argument&)
    {
        threw = true;
    }
    failures += expect_true(threw, "query array mismatch must throw");

    DerivedProfile broken;
    broken.pressure_dbar = {0.0, 10.0, 20.0};
    broken.stratification.pressure_mid_dbar = {5.0, 15.0};
    broken.stratification.n2_s2 = {1.0e-4, 1.0e-4, 1.0e-4};
    std::string message;
    try
    {
        (void)regrid_channels(broken, {&wpdb::contract_for(wpdb::ChannelId::BuoyancyFrequencySquared)},
                              make_standard_grid(0.0, 20.0, 5.0), AggregationConfig{});
    }
    catch (const std::runtime_error& e)
    {
        message = e.what();
    }
    failures += expect_true(message.find("configuration error") != std::string::npos,
                            "channel/axis mismatch is a configuration error");

    Catalog salty;
    salty.append(make_cast(0.0, 0.0, 1, 20.0, 60.0));
    AggregationConfig strict;
    strict.channel_selector = "SP";
    strict.guard.mode = wpdb::GuardMode::Strict;
    threw = false;
    try
    {
        (void)aggregate_within_radius(salty, {GeoPoint{0.0, 0.0}, GeoPoint{0.0, 0.0}}, strict, *scheme);
    }
    catch (const std::runtime_error&)
    {
        threw = true;
    }
    failures += expect_true(threw, "strict guard failure propagates out of the worker loop");

    AggregationConfig sanitize = strict;
    sanitize.guard.mode = wpdb::GuardMode::Sanitize;
    const AggregateResult masked = aggregate_within_radius(salty, {GeoPoint{0.0, 0.0}}, sanitize, *scheme);
    failures += expect_true(std::isnan(masked.median(0, 0, 0)), "sanitized values drop out of the statistics");

    const std::unique_ptr<EquationOfStateScheme> fresh = create_linear_eos_scheme();
    threw = false;
    try
    {
        (void)aggregate_within_radius(catalog, {GeoPoint{0.0, 0.0}}, AggregationConfig{}, *fresh);
    }
    catch (const std::runtime_error&)
    {
        threw = true;
    }
    failures += expect_true(threw, "uninitialized scheme must throw");
    return failures;
}

int test_monthly_climatology()
{
    int failures = 0;
    const Catalog catalog = make_catalog();
    const std::unique_ptr<EquationOfStateScheme> scheme = make_scheme();

    AggregationConfig config;
    config.standard_grid = make_standard_grid(0.0, 100.0, 10.0);
    MonthlyQueryPoints points;
    for (auto& month_points : points)
    {
        month_points = {GeoPoint{0.0, 0.0}};
    }
    points[5].clear();

    const std::vector<AggregateResult> months = aggregate_monthly(catalog, points, config, *scheme);
    failures += expect_true(months.size() == 12, "twelve monthly results");
    failures += expect_true(months[0].profile_counts[0] == 2, "January sees January casts only");
    failures += expect_true(months[1].profile_counts[0] == 1, "February sees February casts only");
    failures += expect_true(months[2].profile_counts[0] == 0, "March is empty");
    failures += expect_true(months[5].num_points() == 0, "a month without query points yields an empty result");
    return failures;
}

} // namespace

int main()
{
    global_log_profile = LogProfile::quiet;

    int failures = 0;
    failures += test_shape_and_empty_area();
    failures += test_identical_profiles_reduce_exactly();
    failures += test_thread_count_does_not_change_results();
    failures += test_errors();
    failures += test_monthly_climatology();

    if (failures > 0)
    {
        std::cerr << "[radius-aggregator-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[radius-aggregator-regression] all checks passed" << std::endl;
    return 0;
}
