#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "channel_contract.hpp"

/**
 * @file channel_validation.hpp
 * @brief Plausibility guard applied to derived channel values.
 *
 * Sanitize mode masks implausible samples as NaN so that they drop out of
 * regridding and the reductions. Strict mode reports failure and leaves
 * the values untouched so the caller can abort.
 */

namespace wpdb
{

enum class GuardMode
{
    Off,
    Sanitize,
    Strict,
};

struct ValidationPolicy
{
    GuardMode mode = GuardMode::Sanitize;
    std::unordered_map<std::string, ChannelBounds> channel_overrides;
};

struct ChannelStats
{
    std::size_t total_count = 0;
    std::size_t finite_count = 0;
    std::size_t nan_count = 0;
    std::size_t inf_count = 0;
    std::size_t below_min_count = 0;
    std::size_t above_max_count = 0;
    std::size_t masked_count = 0;
    double min_value = 0.0;
    double max_value = 0.0;
    double mean_value = 0.0;
    bool has_finite = false;
};

struct ChannelValidationResult
{
    ChannelStats stats;
    bool failed = false;
    std::string reason;
};

/**
 * @brief Parses guard mode from text.
 */
bool parse_guard_mode(const std::string& value, GuardMode& out_mode);

/**
 * @brief Converts guard mode to text.
 */
const char* to_string(GuardMode mode);

/**
 * @brief Resolves channel bounds including policy overrides.
 */
ChannelBounds effective_bounds_for_channel(const ChannelContract& contract, const ValidationPolicy& policy);

/**
 * @brief Validates and optionally masks a channel buffer.
 * @param values Channel samples; NaN means missing and is never a violation.
 * @param contract Channel contract supplying bounds.
 * @param policy Guard policy.
 */
ChannelValidationResult validate_channel_inplace(std::vector<double>& values,
                                                 const ChannelContract& contract,
                                                 const ValidationPolicy& policy);

} // namespace wpdb
