#pragma once

#include <string>

/**
 * @file log_profile.hpp
 * @brief Process-wide logging verbosity for deckcoef components.
 *
 * Messages go to std::cout, warnings and errors to std::cerr. Every
 * component checks the active profile through the helpers below before
 * printing, so a quiet profile silences informational output only.
 */

namespace deckcoef
{

enum class LogProfile : int
{
    quiet = 0,
    normal = 1,
    debug = 2
};

extern LogProfile global_log_profile;

/**
 * @brief Returns whether current logging level includes the target level.
 * @param level Minimum desired logging level.
 * @return True when logging at the requested level is enabled.
 */
inline bool log_at_least(LogProfile level)
{
    return static_cast<int>(global_log_profile) >= static_cast<int>(level);
}

/**
 * @brief Returns whether normal logging output is enabled.
 */
inline bool log_normal_enabled()
{
    return log_at_least(LogProfile::normal);
}

/**
 * @brief Returns whether debug logging output is enabled.
 */
inline bool log_debug_enabled()
{
    return log_at_least(LogProfile::debug);
}

/**
 * @brief Returns a string label for a log profile.
 * @param profile Log profile enum value.
 * @return Profile name string.
 */
const char* log_profile_name(LogProfile profile);

/**
 * @brief Parses a log profile string.
 * @param value Input profile string.
 * @param valid Optional parse-success output flag.
 * @return Parsed log profile, normal when the text is not recognized.
 */
LogProfile parse_log_profile(const std::string& value, bool* valid = nullptr);

} // namespace deckcoef
