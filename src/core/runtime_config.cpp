/**
 * @file runtime_config.cpp
 * @brief Configuration parsing for coefficient evaluation runs.
 *
 * Reads the YAML subset, validates values, and fills EvaluationConfig.
 * This file belongs to the primary src/core execution layer.
 */

#include "runtime_config.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "coefficient_errors.hpp"
#include "log_profile.hpp"
#include "physical_constants.hpp"
#include "string_utils.hpp"

namespace deckcoef
{

LogProfile global_log_profile = LogProfile::normal;

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

/**
 * @brief Parses a comma-separated (or YAML-like bracketed) string list.
 */
std::vector<std::string> parse_string_list(const std::string& value)
{
    std::string cleaned = value;
    cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '['), cleaned.end());
    cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), ']'), cleaned.end());
    cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '"'), cleaned.end());
    cleaned.erase(std::remove(cleaned.begin(), cleaned.end(), '\''), cleaned.end());
    return strutil::split_list(cleaned, ',');
}

/**
 * @brief Parses a list of numbers.
 */
bool try_parse_double_list(const std::string& value, std::vector<double>& out)
{
    std::vector<double> parsed;
    for (const std::string& item : parse_string_list(value))
    {
        double number = 0.0;
        if (!try_parse_double_value(item, number))
        {
            return false;
        }
        parsed.push_back(number);
    }
    out = std::move(parsed);
    return true;
}

/**
 * @brief Returns string label for the logging profile.
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
 * @brief Parses the logging profile from text.
 */
LogProfile parse_log_profile(const std::string& value, bool* valid)
{
    const std::string normalized = strutil::lower_copy(strutil::trim_copy(value));
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

namespace
{
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

/**
 * @brief Maps "C3"/"c3" to a channel index.
 */
bool parse_channel_token(const std::string& token, std::size_t& channel_out)
{
    const std::string normalized = strutil::lower_copy(token);
    for (std::size_t c = 0; c < kNumChannels; ++c)
    {
        if (normalized == strutil::lower_copy(kChannelNames[c]))
        {
            channel_out = c;
            return true;
        }
    }
    return false;
}

void apply_channel_value(const std::string& key,
                         const std::string& field,
                         const std::string& value,
                         ChannelFitConfig& channel)
{
    if (field == "free_degree" || field == "constrained_degree")
    {
        int parsed = 0;
        if (!try_parse_int_value(value, parsed) || parsed < 0)
        {
            warn_invalid_config_value(key, value, "a non-negative integer");
            return;
        }
        (field == "free_degree" ? channel.free_degree : channel.constrained_degree) = parsed;
    }
    else if (field == "degree_type")
    {
        if (!parse_degree_type(value, channel.degree_type))
        {
            warn_invalid_config_value(key, value, "max or total");
        }
    }
    else if (field == "inequality")
    {
        if (!parse_inequality_kind(value, channel.inequality))
        {
            warn_invalid_config_value(key, value, "none, positivity or negativity");
        }
    }
    else if (field == "solver")
    {
        if (!parse_fit_solver(value, channel.solver))
        {
            warn_invalid_config_value(key, value, "qr or svd");
        }
    }
    else if (field == "constraints")
    {
        std::vector<std::string> names = parse_string_list(value);
        if (names.size() == 1 && strutil::lower_copy(names.front()) == "none")
        {
            names.clear();
        }
        parse_boundary_constraints(names);
        channel.constraints = std::move(names);
    }
    else
    {
        std::cerr << "Warning: Unknown configuration key '" << key << "'. Ignoring." << std::endl;
    }
}
}

/**
 * @brief Parses a YAML file.
 */
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
        const size_t comment_pos = line.find('#');
        if (comment_pos != std::string::npos)
        {
            line = line.substr(0, comment_pos);
        }

        size_t indent = 0;
        while (indent < line.size() && line[indent] == ' ') indent++;
        const size_t indent_level = indent / 2;

        line = strutil::trim_copy(line);
        if (line.empty()) continue;

        if (line.back() == ':')
        {
            const std::string section_name = line.substr(0, line.size() - 1);
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

        const std::string key = strutil::trim_copy(line.substr(0, colon_pos));
        const std::string value = strip_wrapping_quotes(strutil::trim_copy(line.substr(colon_pos + 1)));

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

/*This function applies flattened keys to an evaluation config.
Channel keys take the form channels.<C1..C6>.<field>.*/
void apply_evaluation_config(const std::unordered_map<std::string, std::string>& values,
                             EvaluationConfig& config)
{
    for (const auto& [key, value] : values)
    {
        if (key == "table.path")
        {
            config.table_path = value;
        }
        else if (key == "evaluation.strategy")
        {
            config.strategy = parse_strategy_kind(value);
        }
        else if (key == "evaluation.frame")
        {
            config.frame = parse_frame(value);
        }
        else if (key == "evaluation.derivatives")
        {
            config.derivatives = strutil::parse_bool(value);
        }
        else if (key == "derivatives.step_rad")
        {
            double parsed = 0.0;
            if (try_parse_double_value(value, parsed) && parsed > 0.0)
            {
                config.derivative_step_rad = parsed;
            }
            else
            {
                warn_invalid_config_value(key, value, "a positive angle in radians");
            }
        }
        else if (key == "query.yaws_deg" || key == "query.thetas_deg")
        {
            std::vector<double> degrees;
            if (!try_parse_double_list(value, degrees))
            {
                warn_invalid_config_value(key, value, "a comma-separated list of angles in degrees");
                continue;
            }
            std::vector<double>& target = (key == "query.yaws_deg") ? config.query_yaws_rad : config.query_thetas_rad;
            target.clear();
            for (double d : degrees)
            {
                target.push_back(rad(d));
            }
        }
        else if (key.rfind("channels.", 0) == 0)
        {
            const std::string rest = key.substr(9);
            const size_t dot = rest.find('.');
            std::size_t channel = 0;
            if (dot == std::string::npos || !parse_channel_token(rest.substr(0, dot), channel))
            {
                std::cerr << "Warning: Unknown channel key '" << key << "'. Expected channels.<C1..C6>.<field>." << std::endl;
                continue;
            }
            apply_channel_value(key, rest.substr(dot + 1), value, config.fits[channel]);
        }
        else if (key == "logging.profile")
        {
            // Applied by the caller so that CLI and environment overrides keep precedence.
        }
        else
        {
            std::cerr << "Warning: Unknown configuration key '" << key << "'. Ignoring." << std::endl;
        }
    }
}

/**
 * @brief Loads the evaluation configuration from a YAML file.
 */
EvaluationConfig load_evaluation_config(const std::string& config_path)
{
    if (!std::filesystem::exists(config_path))
    {
        throw std::runtime_error("Config file not found: " + config_path);
    }

    const auto values = parse_yaml_simple(config_path);
    auto profile_it = values.find("logging.profile");
    if (profile_it != values.end())
    {
        bool valid = false;
        const LogProfile parsed = parse_log_profile(profile_it->second, &valid);
        if (valid)
        {
            global_log_profile = parsed;
        }
        else
        {
            std::cerr << "Warning: Invalid logging.profile '" << profile_it->second
                      << "'. Valid values: quiet, normal, debug. Using normal." << std::endl;
            global_log_profile = LogProfile::normal;
        }
    }

    EvaluationConfig config;
    apply_evaluation_config(values, config);

    if (log_normal_enabled())
    {
        std::cout << "Loaded config with " << values.size() << " keys" << std::endl;
    }
    return config;
}

} // namespace deckcoef
