#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file string_utils.hpp
 * @brief Lightweight string helpers shared by configuration parsing.
 *
 * Provides case normalization, trimming, boolean parsing and list
 * splitting. Functions are header-inline because they are small and
 * reused by the config loader, the scheme factory and the channel
 * selector parser.
 */

namespace wpdb
{
namespace strutil
{

/**
 * @brief Returns a lowercase copy of the input string.
 * @param value Source string view.
 * @return Lowercased string.
 */
inline std::string lower_copy(std::string_view value)
{
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c)
    {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

/**
 * @brief Returns a copy with leading and trailing whitespace removed.
 */
inline std::string trim_copy(std::string_view value)
{
    std::size_t begin = 0;
    std::size_t end = value.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(value[begin])) != 0) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(value[end - 1])) != 0) --end;
    return std::string(value.substr(begin, end - begin));
}

/**
 * @brief Trims and lowercases an identifier.
 */
inline std::string normalize_id(std::string_view value)
{
    return lower_copy(trim_copy(value));
}

/**
 * @brief Parses common boolean spellings (case-insensitive).
 * @param value Input string view.
 * @param out Receives the parsed value on success.
 * @return False for anything other than 1/true/yes/on or 0/false/no/off.
 */
inline bool try_parse_bool(std::string_view value, bool& out)
{
    const std::string normalized = normalize_id(value);
    if (normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on")
    {
        out = true;
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no" || normalized == "off")
    {
        out = false;
        return true;
    }
    return false;
}

/**
 * @brief Splits a delimited list into trimmed tokens.
 *
 * Empty tokens are kept so callers can reject inputs such as "a,,b".
 */
inline std::vector<std::string> split_list(std::string_view value, char delimiter = ',')
{
    std::vector<std::string> tokens;
    std::size_t start = 0;
    while (start <= value.size())
    {
        const std::size_t pos = value.find(delimiter, start);
        if (pos == std::string_view::npos)
        {
            tokens.push_back(trim_copy(value.substr(start)));
            break;
        }
        tokens.push_back(trim_copy(value.substr(start, pos - start)));
        start = pos + 1;
    }
    return tokens;
}

} // namespace strutil
} // namespace wpdb
