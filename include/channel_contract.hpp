#pragma once

#include <string>
#include <string_view>
#include <vector>

/**
 * @file channel_contract.hpp
 * @brief Metadata contract of the derived channels that can be aggregated.
 *
 * Each channel names the vertical axis it lives on. Native channels share
 * the pressure levels of the cast; midpoint channels are defined between
 * consecutive levels and carry one value fewer. The aggregator resolves
 * the axis from this table instead of from the channel name.
 */

namespace wpdb
{

enum class VerticalAxis
{
    Native,
    Midpoint,
};

enum class ChannelId
{
    PracticalSalinity,
    InSituTemperature,
    AbsoluteSalinity,
    ConservativeTemperature,
    BuoyancyFrequencySquared,
    ThermalExpansion,
    HalineContraction,
};

struct ChannelBounds
{
    bool has_min = false;
    bool has_max = false;
    double min_value = 0.0;
    double max_value = 0.0;
};

struct ChannelContract
{
    ChannelId channel = ChannelId::PracticalSalinity;
    std::string id;
    std::string units;
    std::string description;
    VerticalAxis axis = VerticalAxis::Native;
    ChannelBounds default_bounds{};
    std::vector<std::string> aliases;
};

/**
 * @brief Returns the complete channel contract table.
 * @return Immutable list of contracts in canonical order.
 */
const std::vector<ChannelContract>& channel_contracts();

/**
 * @brief Finds a contract by canonical id or alias, case-insensitively.
 * @return Pointer to matched contract, or null if not found.
 */
const ChannelContract* find_channel_contract(std::string_view id_or_alias);

/**
 * @brief Returns the contract of a channel enum value.
 */
const ChannelContract& contract_for(ChannelId channel);

/**
 * @brief Resolves a channel selector into an ordered list of contracts.
 *
 * Accepts comma-separated ids or aliases and the presets `N2`
 * (N2, alpha, beta), `TS` (SA, CT) and `all`. A preset may only be used
 * on its own.
 *
 * @throws std::invalid_argument for empty, unknown or duplicated entries.
 */
std::vector<const ChannelContract*> parse_channel_selector(const std::string& selector);

/**
 * @brief Resolves an already split list of channel ids.
 * @throws std::invalid_argument for empty, unknown or duplicated entries.
 */
std::vector<const ChannelContract*> resolve_channels(const std::vector<std::string>& ids);

/**
 * @brief Reports whether any of the contracts needs the midpoint axis.
 */
bool needs_midpoint_axis(const std::vector<const ChannelContract*>& channels);

/**
 * @brief Converts a vertical axis enum to text.
 */
const char* to_string(VerticalAxis value);

} // namespace wpdb
