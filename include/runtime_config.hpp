#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "coefficient_types.hpp"
#include "derivative_engine.hpp"
#include "surface_fit_base.hpp"

/**
 * @file runtime_config.hpp
 * @brief Evaluation configuration and parsing helpers.
 *
 * Configuration files use a small YAML subset: indented "key: value" lines
 * flattened into dotted keys ("channels.C3.solver"). Invalid values are
 * reported as warnings and the default is kept, except for unknown strategy
 * or frame tokens which are rejected.
 */

namespace deckcoef
{

/**
 * @brief Everything one evaluation run needs besides the measurement data.
 */
struct EvaluationConfig
{
    std::string table_path;
    StrategyKind strategy = StrategyKind::FreeFit;
    Frame frame = Frame::Structural;
    bool derivatives = false;
    double derivative_step_rad = default_derivative_step_rad;
    ChannelFitTable fits = default_channel_fit_table();
    std::vector<double> query_yaws_rad;
    std::vector<double> query_thetas_rad;
};

/**
 * @brief Removes matching single or double quotes around a value.
 */
std::string strip_wrapping_quotes(std::string value);

/**
 * @brief Parses an integer value.
 * @param value Input string.
 * @param out Parsed integer output.
 * @return True on successful parse.
 */
bool try_parse_int_value(const std::string& value, int& out);

/**
 * @brief Parses a finite floating-point value.
 * @param value Input string.
 * @param out Parsed double output.
 * @return True on successful parse.
 */
bool try_parse_double_value(const std::string& value, double& out);

/**
 * @brief Parses a comma-separated (or bracketed) list of numbers.
 * @return True when every item parsed.
 */
bool try_parse_double_list(const std::string& value, std::vector<double>& out);

/**
 * @brief Parses a comma-separated (or bracketed) string list.
 */
std::vector<std::string> parse_string_list(const std::string& value);

/**
 * @brief Parses a simple key-value YAML file.
 * @param filename Input file path.
 * @return Parsed key-value map, empty when the file cannot be opened.
 */
std::unordered_map<std::string, std::string> parse_yaml_simple(const std::string& filename);

/**
 * @brief Applies flattened configuration keys on top of an existing config.
 * @throws UnsupportedConfigurationError for unknown strategy/frame tokens or
 *         malformed constraint names.
 */
void apply_evaluation_config(const std::unordered_map<std::string, std::string>& values,
                             EvaluationConfig& config);

/**
 * @brief Loads an evaluation configuration file.
 * @throws std::runtime_error when the file does not exist.
 */
EvaluationConfig load_evaluation_config(const std::string& config_path);

} // namespace deckcoef
