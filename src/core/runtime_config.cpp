/**
 * @file runtime_config.cpp
 * @brief Runtime configuration loading for catalog aggregation runs.
 *
 * Parses the YAML-like configuration file and maps its keys onto the
 * search, quality, grid, channel, equation-of-state and guard settings.
 */

#include "runtime_config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <vector>

#include "channel_contract.hpp"
#include "channel_validation.hpp"
#include "string_utils.hpp"

namespace
{

/**
 * @brief Removes matching single or double quotes around a string value.
 */
std::string strip_wrapping_quotes(std::string value)
{
    if (value.size() >= 2)
    {
        const char first = value.front();
        const char last = value.back();
        if ((first == '"' && last == '"') || (first == '\'' && last == '\''))
        {
            return value.substr(1, value.size() - 2);
        }
    }
    return value;
}

/**
 * @brief Emits a standardized warning for invalid configuration values.
 */
void warn_invalid_config_value(const std::string& key,
                               const std::string& value,
                               const char* expected)
{
    std::cerr << "Warning: Invalid " << key << " '" << value
              << "'; expected " << expected
              << ". Keeping previous/default value." << std::endl;
}

const std::string* find_key(const std::unordered_map<std::string, std::string>& config, const char* key)
{
    const auto it = config.find(key);
    return it == config.end() ? nullptr : &it->second;
}

void read_positive_double(const std::unordered_map<std::string, std::string>& config,
                          const char* key,
                          double& target)
{
    const std::string* raw = find_key(config, key);
    if (raw == nullptr)
    {
        return;
    }
    double parsed = 0.0;
    if (try_parse_double_value(*raw, parsed) && parsed > 0.0)
    {
        target = parsed;
    }
    else
    {
        warn_invalid_config_value(key, *raw, "a positive number");
    }
}

void read_double(const std::unordered_map<std::string, std::string>& config,
                 const char* key,
                 double& target)
{
    const std::string* raw = find_key(config, key);
    if (raw == nullptr)
    {
        return;
    }
    double parsed = 0.0;
    if (try_parse_double_value(*raw, parsed))
    {
        target = parsed;
    }
    else
    {
        warn_invalid_config_value(key, *raw, "a finite number");
    }
}

void read_bool(const std::unordered_map<std::string, std::string>& config,
               const char* key,
               bool& target)
{
    const std::string* raw = find_key(config, key);
    if (raw == nullptr)
    {
        return;
    }
    bool parsed = false;
    if (try_parse_bool_value(*raw, parsed))
    {
        target = parsed;
    }
    else
    {
        warn_invalid_config_value(key, *raw, "true or false");
    }
}

void read_int(const std::unordered_map<std::string, std::string>& config,
              const char* key,
              int& target)
{
    const std::string* raw = find_key(config, key);
    if (raw == nullptr)
    {
        return;
    }
    int parsed = 0;
    if (try_parse_int_value(*raw, parsed))
    {
        target = parsed;
    }
    else
    {
        warn_invalid_config_value(key, *raw, "an integer");
    }
}

}

std::string to_lower_copy(std::string value)
{
    return wpdb::strutil::lower_copy(value);
}

/**
 * @brief Parses boolean-like configuration values.
 */
bool try_parse_bool_value(const std::string& value, bool& out)
{
    return wpdb::strutil::try_parse_bool(value, out);
}

/**
 * @brief Parses an integer value.
 */
bool try_parse_int_value(const std::string& value, int& out)
{
    try
    {
        size_t consumed = 0;
        const long long parsed = std::stoll(value, &consumed);
        if (consumed != value.size() ||
            parsed < static_cast<long long>(std::numeric_limits<int>::min()) ||
            parsed > static_cast<long long>(std::numeric_limits<int>::max()))
        {
            return false;
        }
        out = static_cast<int>(parsed);
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

/**
 * @brief Parses a non-negative integer value.
 */
bool try_parse_non_negative_int_value(const std::string& value, int& out)
{
    int parsed = 0;
    if (!try_parse_int_value(value, parsed))
    {
        return false;
    }
    if (parsed < 0)
    {
        return false;
    }
    out = parsed;
    return true;
}

/**
 * @brief Parses a finite floating-point value.
 */
bool try_parse_double_value(const std::string& value, double& out)
{
    try
    {
        size_t consumed = 0;
        const double parsed = std::stod(value, &consumed);
        if (consumed != value.size() || !std::isfinite(parsed))
        {
            return false;
        }
        out = parsed;
        return true;
    }
    catch (const std::exception&)
    {
        return false;
    }
}

std::unordered_map<std::string, std::string> parse_yaml_simple(const std::string& filename)
{
    std::unordered_map<std::string, std::string> config;
    std::ifstream file(filename);
    if (!file.is_open())
    {
        std::cerr << "Could not open config file: " << filename << std::endl;
        return config;
    }

    std::string line;
    std::vector<std::string> section_stack;

    while (std::getline(file, line))
    {
        size_t comment_pos = line.find('#');
        if (comment_pos != std::string::npos)
        {
            line = line.substr(0, comment_pos);
        }

        size_t indent = 0;
        while (indent < line.size() && line[indent] == ' ') indent++;

        const size_t indent_level = indent / 2;

        line = wpdb::strutil::trim_copy(line);
        if (line.empty()) continue;

        if (line.back() == ':')
        {
            std::string section_name = line.substr(0, line.size() - 1);

            while (section_stack.size() > indent_level)
            {
                section_stack.pop_back();
            }

            if (section_stack.size() == indent_level)
            {
                section_stack.push_back(section_name);
            }
            else
            {
                section_stack[indent_level] = section_name;
            }

            continue;
        }

        const size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos)
        {
            continue;
        }

        while (section_stack.size() > indent_level)
        {
            section_stack.pop_back();
        }

        const std::string key = wpdb::strutil::trim_copy(line.substr(0, colon_pos));
        const std::string value = strip_wrapping_quotes(wpdb::strutil::trim_copy(line.substr(colon_pos + 1)));

        std::string full_key;
        for (const auto& section : section_stack)
        {
            if (!full_key.empty()) full_key += ".";
            full_key += section;
        }
        if (!full_key.empty()) full_key += ".";
        full_key += key;
        config[full_key] = value;
    }

    return config;
}

RuntimeConfig runtime_config_from_map(const std::unordered_map<std::string, std::string>& config)
{
    RuntimeConfig out;

    if (const std::string* raw = find_key(config, "logging.profile"))
    {
        bool valid = false;
        const LogProfile parsed = parse_log_profile(*raw, &valid);
        if (valid)
        {
            out.log_profile = parsed;
        }
        else
        {
            std::cerr << "Warning: Invalid logging.profile '" << *raw
                      << "'. Valid values: quiet, normal, debug. Using normal." << std::endl;
        }
    }

    read_positive_double(config, "search.radius_km", out.aggregation.search.radius_km);
    read_bool(config, "search.wrap_longitude", out.aggregation.search.wrap_longitude);

    read_int(config, "quality.accepted_qc", out.aggregation.quality.accepted_qc);
    read_positive_double(config, "quality.max_mean_pressure_spacing",
                         out.aggregation.quality.max_mean_pressure_spacing_dbar);

    if (const std::string* raw = find_key(config, "ingest.min_coverage_fraction"))
    {
        double parsed = 0.0;
        if (try_parse_double_value(*raw, parsed) && parsed >= 0.0 && parsed <= 1.0)
        {
            out.usability.min_coverage_fraction = parsed;
        }
        else
        {
            warn_invalid_config_value("ingest.min_coverage_fraction", *raw, "a fraction in [0, 1]");
        }
    }
    read_int(config, "ingest.qc_threshold", out.usability.qc_threshold);

    read_double(config, "grid.min_pressure", out.grid_min_pressure_dbar);
    read_double(config, "grid.max_pressure", out.grid_max_pressure_dbar);
    read_positive_double(config, "grid.step", out.grid_step_dbar);
    try
    {
        out.aggregation.standard_grid =
            make_standard_grid(out.grid_min_pressure_dbar, out.grid_max_pressure_dbar, out.grid_step_dbar);
    }
    catch (const std::invalid_argument& e)
    {
        std::cerr << "Warning: Invalid grid settings (" << e.what()
                  << "). Using the default 0-6000 dbar grid with 5 dbar step." << std::endl;
        out.grid_min_pressure_dbar = 0.0;
        out.grid_max_pressure_dbar = 6000.0;
        out.grid_step_dbar = 5.0;
        out.aggregation.standard_grid = make_standard_grid();
    }

    bool extrapolate = out.aggregation.regrid.extrapolation == Extrapolation::Pchip;
    read_bool(config, "regrid.extrapolate", extrapolate);
    out.aggregation.regrid.extrapolation = extrapolate ? Extrapolation::Pchip : Extrapolation::None;

    if (const std::string* raw = find_key(config, "channels.selector"))
    {
        try
        {
            (void)wpdb::parse_channel_selector(*raw);
            out.aggregation.channel_selector = *raw;
        }
        catch (const std::invalid_argument& e)
        {
            warn_invalid_config_value("channels.selector", *raw, e.what());
        }
    }

    if (const std::string* raw = find_key(config, "eos.scheme"))
    {
        out.eos.scheme_id = wpdb::strutil::normalize_id(*raw);
    }
    read_positive_double(config, "eos.reference_density", out.eos.reference_density_kgm3);
    read_positive_double(config, "eos.thermal_expansion", out.eos.thermal_expansion_per_k);
    read_positive_double(config, "eos.haline_contraction", out.eos.haline_contraction_per_gkg);

    if (const std::string* raw = find_key(config, "validation.guard_mode"))
    {
        wpdb::GuardMode mode = out.aggregation.guard.mode;
        if (wpdb::parse_guard_mode(*raw, mode))
        {
            out.aggregation.guard.mode = mode;
        }
        else
        {
            std::cerr << "Warning: Invalid validation.guard_mode '" << *raw
                      << "'. Valid values: off, sanitize, strict." << std::endl;
        }
    }

    if (const std::string* raw = find_key(config, "reduction.min_valid_samples"))
    {
        int parsed = 0;
        if (try_parse_int_value(*raw, parsed) && parsed >= 1)
        {
            out.aggregation.min_valid_samples = static_cast<std::size_t>(parsed);
        }
        else
        {
            warn_invalid_config_value("reduction.min_valid_samples", *raw, "a positive integer");
        }
    }

    if (const std::string* raw = find_key(config, "parallel.num_threads"))
    {
        int parsed = 0;
        if (try_parse_non_negative_int_value(*raw, parsed))
        {
            out.aggregation.num_threads = parsed;
        }
        else
        {
            warn_invalid_config_value("parallel.num_threads", *raw, "a non-negative integer");
        }
    }

    return out;
}

RuntimeConfig load_runtime_config(const std::string& config_path)
{
    const auto config = parse_yaml_simple(config_path);
    RuntimeConfig out = runtime_config_from_map(config);
    global_log_profile = out.log_profile;

    if (log_normal_enabled())
    {
        std::cout << "Loaded config with " << config.size() << " keys"
                  << " (radius " << out.aggregation.search.radius_km << " km, "
                  << out.aggregation.standard_grid.size() << " grid levels, channels "
                  << out.aggregation.channel_selector << ", eos " << out.eos.scheme_id << ")"
                  << std::endl;
    }
    return out;
}
