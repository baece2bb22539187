#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

/**
 * @file string_utils.hpp
 * @brief Lightweight string helpers shared by token and configuration parsing.
 *
 * Provides case normalization, whitespace trimming, boolean parsing, and
 * delimiter splitting. Functions are header-inline because they are small
 * and reused by the scheme factory, the table loader, and runtime config.
 */

namespace deckcoef
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
 * @brief Trims leading and trailing ASCII whitespace.
 * @param value Source string view.
 * @return Trimmed copy.
 */
inline std::string trim_copy(std::string_view value)
{
    const auto first = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    if (first == value.end())
    {
        return "";
    }
    const auto last = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
    return std::string(first, last);
}

/**
 * @brief Parses common truthy boolean spellings.
 * @param value Input string view.
 * @return True for 1/true/yes/on (case-insensitive), false otherwise.
 */
inline bool parse_bool(std::string_view value)
{
    const std::string normalized = lower_copy(trim_copy(value));
    return normalized == "1" || normalized == "true" || normalized == "yes" || normalized == "on";
}

/**
 * @brief Splits a delimited list and trims every item.
 *
 * Empty items are dropped, so "a,,b" and "a, b" both yield {"a", "b"}.
 */
inline std::vector<std::string> split_list(std::string_view value, char delimiter = ',')
{
    std::vector<std::string> items;
    std::size_t start = 0;
    while (start <= value.size())
    {
        std::size_t end = value.find(delimiter, start);
        if (end == std::string_view::npos)
        {
            end = value.size();
        }
        std::string item = trim_copy(value.substr(start, end - start));
        if (!item.empty())
        {
            items.push_back(std::move(item));
        }
        start = end + 1;
    }
    return items;
}

} // namespace strutil
} // namespace deckcoef
