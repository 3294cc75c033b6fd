/**
 * @file logging.cpp
 * @brief Process-wide log profile state and its text conversions.
 */

#include "logging.hpp"
#include "string_utils.hpp"

LogProfile global_log_profile = LogProfile::normal;

/**
 * @brief Returns display text for a logging profile.
 */
const char* log_profile_name(LogProfile profile)
{
    switch (profile)
    {
        case LogProfile::quiet:
            return "quiet";
        case LogProfile::debug:
            return "debug";
        case LogProfile::normal:
        default:
            return "normal";
    }
}

/**
 * @brief Parses runtime logging profile from text.
 */
LogProfile parse_log_profile(const std::string& value, bool* valid)
{
    const std::string normalized = wpdb::strutil::normalize_id(value);
    if (normalized == "quiet")
    {
        if (valid) *valid = true;
        return LogProfile::quiet;
    }
    if (normalized == "normal")
    {
        if (valid) *valid = true;
        return LogProfile::normal;
    }
    if (normalized == "debug")
    {
        if (valid) *valid = true;
        return LogProfile::debug;
    }

    if (valid) *valid = false;
    return LogProfile::normal;
}
