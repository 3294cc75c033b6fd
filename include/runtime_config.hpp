#pragma once

#include <string>
#include <unordered_map>

#include "equation_of_state_base.hpp"
#include "logging.hpp"
#include "quality_gate.hpp"
#include "radius_aggregator.hpp"

/**
 * @file runtime_config.hpp
 * @brief Runtime configuration and parsing helpers.
 *
 * Reads the YAML-like key/value configuration of an aggregation run into
 * one RuntimeConfig. Invalid values are reported on std::cerr and leave
 * the default in place.
 */

struct RuntimeConfig
{
    LogProfile log_profile = LogProfile::normal;
    UsabilityCriteria usability;
    AggregationConfig aggregation;
    EosConfig eos;
    double grid_min_pressure_dbar = 0.0;
    double grid_max_pressure_dbar = 6000.0;
    double grid_step_dbar = 5.0;
};

/**
 * @brief Returns a lowercased copy of the input.
 * @param value Input string.
 * @return Lowercased string.
 */
std::string to_lower_copy(std::string value);

/**
 * @brief Parses a boolean value.
 * @param value Input string.
 * @param out Receives the parsed value on success.
 * @return False when the spelling is not a recognized boolean.
 */
bool try_parse_bool_value(const std::string& value, bool& out);

/**
 * @brief Parses an integer value.
 * @param value Input string.
 * @param out Parsed integer output.
 * @return True on successful parse.
 */
bool try_parse_int_value(const std::string& value, int& out);

/**
 * @brief Parses a non-negative integer value.
 * @param value Input string.
 * @param out Parsed integer output.
 * @return True on successful parse and non-negative result.
 */
bool try_parse_non_negative_int_value(const std::string& value, int& out);

/**
 * @brief Parses a finite floating-point value.
 * @param value Input string.
 * @param out Parsed double output.
 * @return True on successful parse.
 */
bool try_parse_double_value(const std::string& value, double& out);

/**
 * @brief Parses a simple key-value YAML file.
 *
 * Nested sections are flattened into dotted keys.
 *
 * @param filename Input file path.
 * @return Parsed key-value map, empty when the file cannot be opened.
 */
std::unordered_map<std::string, std::string> parse_yaml_simple(const std::string& filename);

/**
 * @brief Builds a runtime configuration from parsed keys.
 * @param config Flattened key-value map.
 * @return Configuration with defaults for absent or invalid keys.
 */
RuntimeConfig runtime_config_from_map(const std::unordered_map<std::string, std::string>& config);

/**
 * @brief Loads runtime configuration from disk and applies the log profile.
 * @param config_path Path to configuration file.
 * @return Parsed configuration.
 */
RuntimeConfig load_runtime_config(const std::string& config_path);
