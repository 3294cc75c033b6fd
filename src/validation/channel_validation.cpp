/**
 * @file channel_validation.cpp
 * @brief Plausibility guard for derived channel samples.
 */

#include "channel_validation.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <sstream>

namespace wpdb {

/**
 * @brief Parses guard mode text into enum representation.
 */
bool parse_guard_mode(const std::string& value, GuardMode& out_mode) {
    const std::string v = strutil::normalize_id(value);
    if (v == "off") {
        out_mode = GuardMode::Off;
        return true;
    }
    if (v == "sanitize") {
        out_mode = GuardMode::Sanitize;
        return true;
    }
    if (v == "strict") {
        out_mode = GuardMode::Strict;
        return true;
    }
    return false;
}

/**
 * @brief Converts guard mode enum to stable string id.
 */
const char* to_string(GuardMode mode) {
    switch (mode) {
        case GuardMode::Off:
            return "off";
        case GuardMode::Sanitize:
            return "sanitize";
        case GuardMode::Strict:
            return "strict";
        default:
            return "off";
    }
}

/**
 * @brief Resolves effective bounds after applying policy overrides.
 */
ChannelBounds effective_bounds_for_channel(const ChannelContract& contract, const ValidationPolicy& policy) {
    auto it = policy.channel_overrides.find(contract.id);
    if (it != policy.channel_overrides.end()) {
        return it->second;
    }

    it = policy.channel_overrides.find(strutil::lower_copy(contract.id));
    if (it != policy.channel_overrides.end()) {
        return it->second;
    }

    return contract.default_bounds;
}

ChannelValidationResult validate_channel_inplace(std::vector<double>& values,
                                                 const ChannelContract& contract,
                                                 const ValidationPolicy& policy) {
    ChannelValidationResult out;
    ChannelStats& stats = out.stats;
    stats.total_count = values.size();

    if (policy.mode == GuardMode::Off) {
        return out;
    }

    const ChannelBounds bounds = effective_bounds_for_channel(contract, policy);
    const bool sanitize = policy.mode == GuardMode::Sanitize;
    const double nan = std::numeric_limits<double>::quiet_NaN();

    double finite_sum = 0.0;
    double finite_min = std::numeric_limits<double>::infinity();
    double finite_max = -std::numeric_limits<double>::infinity();

    for (double& value : values) {
        if (std::isnan(value)) {
            ++stats.nan_count;
            continue;
        }
        if (std::isinf(value)) {
            ++stats.inf_count;
            if (sanitize) {
                value = nan;
                ++stats.masked_count;
            }
            continue;
        }

        ++stats.finite_count;
        finite_sum += value;
        finite_min = std::min(finite_min, value);
        finite_max = std::max(finite_max, value);

        bool violated = false;
        if (bounds.has_min && value < bounds.min_value) {
            ++stats.below_min_count;
            violated = true;
        }
        if (bounds.has_max && value > bounds.max_value) {
            ++stats.above_max_count;
            violated = true;
        }
        if (sanitize && violated) {
            value = nan;
            ++stats.masked_count;
        }
    }

    stats.has_finite = stats.finite_count > 0;
    if (stats.has_finite) {
        stats.min_value = finite_min;
        stats.max_value = finite_max;
        stats.mean_value = finite_sum / static_cast<double>(stats.finite_count);
    }

    const std::size_t bounds_count = stats.below_min_count + stats.above_max_count;
    if (policy.mode == GuardMode::Strict && (stats.inf_count > 0 || bounds_count > 0)) {
        std::ostringstream reason;
        reason << "channel " << contract.id << ": " << stats.inf_count << " infinite, "
               << bounds_count << " out of bounds";
        out.failed = true;
        out.reason = reason.str();
    }

    return out;
}

}
