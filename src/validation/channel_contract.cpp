/**
 * @file channel_contract.cpp
 * @brief Channel inventory and selector parsing.
 */

#include "channel_contract.hpp"
#include "string_utils.hpp"

#include <algorithm>
#include <stdexcept>

namespace wpdb {
namespace {

/**
 * @brief Builds an inclusive min/max bounds descriptor.
 */
ChannelBounds bounds(double min_value, double max_value) {
    ChannelBounds out;
    out.has_min = true;
    out.has_max = true;
    out.min_value = min_value;
    out.max_value = max_value;
    return out;
}

// Default guard bounds, applied by the sanitize guard unless overridden:
//   SP, SA: 0..50 covers fresh water up to hypersaline marginal seas.
//   t, CT: -3..40 degC, sea-ice freezing point to the warmest surface water.
//   N2: -5e-3..5e-2 1/s^2. The sharpest pycnocline reaches about 1e-2 and
//       convective overturns stay well above -1e-3, so samples outside come
//       from spikes or nearly coincident pressures.
//   alpha: +-1e-3 1/K around the observed -1e-4..4e-4 range.
//   beta: 0..2e-3 kg/g around the observed 7e-4..8e-4 range.
// Samples outside these ranges are masked as NaN before regridding. The
// off guard (validation.guard_mode) reproduces unmasked statistics.
const std::vector<ChannelContract> kContracts = {
    {ChannelId::PracticalSalinity, "SP", "1", "Practical salinity", VerticalAxis::Native,
     bounds(0.0, 50.0), {"practical_salinity", "salinity"}},
    {ChannelId::InSituTemperature, "t", "degC", "In-situ temperature", VerticalAxis::Native,
     bounds(-3.0, 40.0), {"temperature", "in_situ_temperature"}},
    {ChannelId::AbsoluteSalinity, "SA", "g/kg", "Absolute salinity", VerticalAxis::Native,
     bounds(0.0, 50.0), {"absolute_salinity"}},
    {ChannelId::ConservativeTemperature, "CT", "degC", "Conservative temperature", VerticalAxis::Native,
     bounds(-3.0, 40.0), {"conservative_temperature"}},
    {ChannelId::BuoyancyFrequencySquared, "N2", "1/s^2", "Squared buoyancy frequency", VerticalAxis::Midpoint,
     bounds(-5.0e-3, 5.0e-2), {"buoyancy_frequency_squared", "n_squared"}},
    {ChannelId::ThermalExpansion, "alpha", "1/K", "Thermal expansion coefficient", VerticalAxis::Midpoint,
     bounds(-1.0e-3, 1.0e-3), {"thermal_expansion"}},
    {ChannelId::HalineContraction, "beta", "kg/g", "Haline contraction coefficient", VerticalAxis::Midpoint,
     bounds(0.0, 2.0e-3), {"haline_contraction"}},
};

std::vector<const ChannelContract*> preset(std::initializer_list<ChannelId> ids) {
    std::vector<const ChannelContract*> out;
    out.reserve(ids.size());
    for (ChannelId id : ids) {
        out.push_back(&contract_for(id));
    }
    return out;
}

}

/**
 * @brief Returns the canonical channel inventory.
 */
const std::vector<ChannelContract>& channel_contracts() {
    return kContracts;
}

/**
 * @brief Finds a channel contract by canonical id or known alias.
 */
const ChannelContract* find_channel_contract(std::string_view id_or_alias) {
    const std::string requested = strutil::normalize_id(id_or_alias);

    for (const auto& contract : kContracts) {
        if (strutil::lower_copy(contract.id) == requested) {
            return &contract;
        }

        for (const auto& alias : contract.aliases) {
            if (strutil::lower_copy(alias) == requested) {
                return &contract;
            }
        }
    }

    return nullptr;
}

const ChannelContract& contract_for(ChannelId channel) {
    for (const auto& contract : kContracts) {
        if (contract.channel == channel) {
            return contract;
        }
    }
    throw std::logic_error("Channel id missing from the contract table");
}

std::vector<const ChannelContract*> resolve_channels(const std::vector<std::string>& ids) {
    if (ids.empty()) {
        throw std::invalid_argument("Channel selector is empty");
    }

    std::vector<const ChannelContract*> out;
    out.reserve(ids.size());
    for (const auto& id : ids) {
        if (strutil::trim_copy(id).empty()) {
            throw std::invalid_argument("Channel selector contains an empty entry");
        }
        const ChannelContract* contract = find_channel_contract(id);
        if (contract == nullptr) {
            throw std::invalid_argument("Unknown channel '" + id +
                                        "'. Available channels: SP, t, SA, CT, N2, alpha, beta");
        }
        if (std::find(out.begin(), out.end(), contract) != out.end()) {
            throw std::invalid_argument("Channel '" + contract->id + "' selected more than once");
        }
        out.push_back(contract);
    }
    return out;
}

std::vector<const ChannelContract*> parse_channel_selector(const std::string& selector) {
    const std::string normalized = strutil::normalize_id(selector);
    if (normalized.empty()) {
        throw std::invalid_argument("Channel selector is empty");
    }

    // A preset name on its own wins over the channel of the same name.
    if (normalized == "n2") {
        return preset({ChannelId::BuoyancyFrequencySquared, ChannelId::ThermalExpansion,
                       ChannelId::HalineContraction});
    }
    if (normalized == "ts") {
        return preset({ChannelId::AbsoluteSalinity, ChannelId::ConservativeTemperature});
    }
    if (normalized == "all") {
        std::vector<const ChannelContract*> out;
        for (const auto& contract : kContracts) {
            out.push_back(&contract);
        }
        return out;
    }

    const std::vector<std::string> tokens = strutil::split_list(selector, ',');
    for (const auto& token : tokens) {
        const std::string t = strutil::lower_copy(token);
        if (t == "ts" || t == "all") {
            throw std::invalid_argument("Channel preset '" + token + "' cannot be combined with other channels");
        }
    }
    return resolve_channels(tokens);
}

bool needs_midpoint_axis(const std::vector<const ChannelContract*>& channels) {
    return std::any_of(channels.begin(), channels.end(), [](const ChannelContract* c) {
        return c != nullptr && c->axis == VerticalAxis::Midpoint;
    });
}

/**
 * @brief Converts vertical axis enum to stable string id.
 */
const char* to_string(VerticalAxis value) {
    switch (value) {
        case VerticalAxis::Native:
            return "native";
        case VerticalAxis::Midpoint:
            return "midpoint";
        default:
            return "unknown";
    }
}

}
