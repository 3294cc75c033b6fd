#include "channel_contract.hpp"
#include "channel_validation.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace
{

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[channel-guard-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

bool selector_throws(const std::string& selector)
{
    try
    {
        (void)wpdb::parse_channel_selector(selector);
    }
    catch (const std::invalid_argument&)
    {
        return true;
    }
    return false;
}

std::vector<std::string> ids_of(const std::vector<const wpdb::ChannelContract*>& channels)
{
    std::vector<std::string> out;
    for (const auto* c : channels)
    {
        out.push_back(c->id);
    }
    return out;
}

int test_contract_table()
{
    int failures = 0;
    failures += expect_true(wpdb::channel_contracts().size() == 7, "seven channels");

    const wpdb::ChannelContract* ct = wpdb::find_channel_contract("Conservative_Temperature");
    failures += expect_true(ct != nullptr && ct->id == "CT", "alias lookup is case-insensitive");
    failures += expect_true(wpdb::find_channel_contract("sa") == &wpdb::contract_for(wpdb::ChannelId::AbsoluteSalinity),
                            "id lookup is case-insensitive");
    failures += expect_true(wpdb::find_channel_contract("rho") == nullptr, "unknown id");

    failures += expect_true(wpdb::contract_for(wpdb::ChannelId::BuoyancyFrequencySquared).axis ==
                            wpdb::VerticalAxis::Midpoint, "N2 lives on the midpoint axis");
    failures += expect_true(wpdb::contract_for(wpdb::ChannelId::AbsoluteSalinity).axis ==
                            wpdb::VerticalAxis::Native, "SA lives on the native axis");
    return failures;
}

int test_selector()
{
    int failures = 0;
    failures += expect_true(ids_of(wpdb::parse_channel_selector("N2")) ==
                            std::vector<std::string>({"N2", "alpha", "beta"}), "N2 preset order");
    failures += expect_true(ids_of(wpdb::parse_channel_selector(" ts ")) ==
                            std::vector<std::string>({"SA", "CT"}), "TS preset");
    failures += expect_true(wpdb::parse_channel_selector("all").size() == 7, "all preset");
    failures += expect_true(ids_of(wpdb::parse_channel_selector("t, SP")) ==
                            std::vector<std::string>({"t", "SP"}), "explicit list keeps order");
    failures += expect_true(ids_of(wpdb::parse_channel_selector("N2,SA")) ==
                            std::vector<std::string>({"N2", "SA"}), "N2 inside a list is the channel");

    failures += expect_true(wpdb::needs_midpoint_axis(wpdb::parse_channel_selector("SA,beta")), "beta needs midpoints");
    failures += expect_true(!wpdb::needs_midpoint_axis(wpdb::parse_channel_selector("TS")), "TS does not");

    failures += expect_true(selector_throws(""), "empty selector");
    failures += expect_true(selector_throws("SP,,t"), "empty entry");
    failures += expect_true(selector_throws("density"), "unknown channel");
    failures += expect_true(selector_throws("SA,sa"), "duplicate channel");
    failures += expect_true(selector_throws("TS,SP"), "preset mixed with channels");
    return failures;
}

int test_guard_modes()
{
    int failures = 0;
    const double inf = std::numeric_limits<double>::infinity();
    const wpdb::ChannelContract& sa = wpdb::contract_for(wpdb::ChannelId::AbsoluteSalinity);

    wpdb::ValidationPolicy sanitize;
    std::vector<double> values = {35.0, 60.0, inf, std::nan("")};
    const wpdb::ChannelValidationResult masked = wpdb::validate_channel_inplace(values, sa, sanitize);
    failures += expect_true(!masked.failed, "sanitize never fails");
    failures += expect_true(values[0] == 35.0, "plausible value kept");
    failures += expect_true(std::isnan(values[1]) && std::isnan(values[2]), "violations masked as NaN");
    failures += expect_true(masked.stats.masked_count == 2, "two samples masked");
    failures += expect_true(masked.stats.nan_count == 1, "missing sample is not a violation");
    failures += expect_true(masked.stats.above_max_count == 1 && masked.stats.inf_count == 1, "violation counts");

    wpdb::ValidationPolicy strict;
    strict.mode = wpdb::GuardMode::Strict;
    std::vector<double> strict_values = {35.0, 60.0};
    const wpdb::ChannelValidationResult rejected = wpdb::validate_channel_inplace(strict_values, sa, strict);
    failures += expect_true(rejected.failed, "strict mode fails on out-of-bounds values");
    failures += expect_true(!rejected.reason.empty(), "strict failure carries a reason");
    failures += expect_true(strict_values[1] == 60.0, "strict mode leaves values untouched");

    wpdb::ValidationPolicy widened;
    widened.channel_overrides["SA"] = wpdb::ChannelBounds{true, true, 0.0, 70.0};
    std::vector<double> widened_values = {60.0};
    (void)wpdb::validate_channel_inplace(widened_values, sa, widened);
    failures += expect_true(widened_values[0] == 60.0, "override bounds replace the defaults");

    wpdb::ValidationPolicy off;
    off.mode = wpdb::GuardMode::Off;
    std::vector<double> untouched = {inf};
    failures += expect_true(!wpdb::validate_channel_inplace(untouched, sa, off).failed, "off mode never fails");
    failures += expect_true(std::isinf(untouched[0]), "off mode leaves values untouched");

    wpdb::GuardMode mode = wpdb::GuardMode::Off;
    failures += expect_true(wpdb::parse_guard_mode(" Strict ", mode) && mode == wpdb::GuardMode::Strict,
                            "guard mode parses case-insensitively");
    failures += expect_true(!wpdb::parse_guard_mode("loose", mode), "unknown guard mode");
    return failures;
}

int test_default_bounds_keep_ocean_values()
{
    int failures = 0;
    wpdb::ValidationPolicy sanitize;

    const wpdb::ChannelContract& n2 = wpdb::contract_for(wpdb::ChannelId::BuoyancyFrequencySquared);
    std::vector<double> n2_values = {1.0e-2, 1.0e-4, -1.0e-4, 0.0, 0.2};
    const wpdb::ChannelValidationResult n2_result = wpdb::validate_channel_inplace(n2_values, n2, sanitize);
    failures += expect_true(n2_values[0] == 1.0e-2 && n2_values[2] == -1.0e-4, "pycnocline and weak overturn kept");
    failures += expect_true(std::isnan(n2_values[4]), "spike above 5e-2 masked");
    failures += expect_true(n2_result.stats.masked_count == 1, "only the spike is masked");

    const wpdb::ChannelContract& alpha = wpdb::contract_for(wpdb::ChannelId::ThermalExpansion);
    std::vector<double> alpha_values = {-1.0e-4, 4.0e-4};
    (void)wpdb::validate_channel_inplace(alpha_values, alpha, sanitize);
    failures += expect_true(alpha_values[0] == -1.0e-4 && alpha_values[1] == 4.0e-4,
                            "cold fresh and warm salty alpha kept");

    const wpdb::ChannelContract& beta = wpdb::contract_for(wpdb::ChannelId::HalineContraction);
    std::vector<double> beta_values = {7.0e-4, 8.0e-4};
    (void)wpdb::validate_channel_inplace(beta_values, beta, sanitize);
    failures += expect_true(beta_values[0] == 7.0e-4 && beta_values[1] == 8.0e-4, "typical beta kept");

    wpdb::ValidationPolicy off;
    off.mode = wpdb::GuardMode::Off;
    std::vector<double> raw = {0.2};
    (void)wpdb::validate_channel_inplace(raw, n2, off);
    failures += expect_true(raw[0] == 0.2, "off guard keeps unmasked values");
    return failures;
}

} // namespace

int main()
{
    int failures = 0;
    failures += test_contract_table();
    failures += test_selector();
    failures += test_guard_modes();
    failures += test_default_bounds_keep_ocean_values();

    if (failures > 0)
    {
        std::cerr << "[channel-guard-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[channel-guard-regression] all checks passed" << std::endl;
    return 0;
}
