/**
 * @file deckcoef_eval.cpp
 * @brief Command-line entry point for coefficient evaluation.
 *
 * Loads a configuration and a measurement table, evaluates the requested
 * strategy at the configured query points, and prints one row per point.
 * This file belongs to the primary src/core execution layer.
 */

#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <string>

#include "coefficient_orchestrator.hpp"
#include "derivative_engine.hpp"
#include "log_profile.hpp"
#include "measurement_table.hpp"
#include "physical_constants.hpp"
#include "runtime_config.hpp"

using namespace deckcoef;

namespace
{
void print_usage()
{
    std::cout << "Usage: deckcoef_eval --config=<file> [--table=<csv>] [--strategy=<name>]\n"
              << "                     [--frame=Ls|Lnw|Lnw&Ls] [--derivatives] [--step=<rad>]\n"
              << "                     [--log-profile=quiet|normal|debug]\n"
              << "Strategies: 2D_fit_free, 2D_fit_cons, cos_rule, 2D, hybrid" << std::endl;
}

void print_coefficient_rows(const char* label,
                            const CoefficientSet& values,
                            const std::vector<double>& yaws,
                            const std::vector<double>& thetas)
{
    std::cout << "# " << label << "\n# yaw[deg] theta[deg]";
    for (const char* name : kChannelNames)
    {
        std::cout << " " << name;
    }
    std::cout << "\n";
    for (std::size_t i = 0; i < values.size(); ++i)
    {
        std::cout << std::setw(9) << deg(yaws[i]) << " " << std::setw(9) << deg(thetas[i]);
        for (std::size_t c = 0; c < kNumChannels; ++c)
        {
            std::cout << " " << std::setw(13) << values.channels[c][i];
        }
        std::cout << "\n";
    }
    std::cout.flush();
}
}

/**
 * @brief Program entry point.
 * @param argc CLI argument count.
 * @param argv CLI argument vector.
 * @return Zero on success, non-zero on configuration/runtime failure.
 */
int main(int argc, char** argv)
{
    std::string config_path;
    std::string cli_table_path;
    std::string cli_strategy;
    std::string cli_frame;
    bool cli_derivatives = false;
    double cli_step = -1.0;
    bool log_profile_from_cli = false;
    LogProfile cli_log_profile = LogProfile::normal;

    if (const char* env_log_profile = std::getenv("DECKCOEF_LOG_PROFILE"))
    {
        bool valid = false;
        const LogProfile parsed = parse_log_profile(env_log_profile, &valid);
        if (valid)
        {
            global_log_profile = parsed;
        }
        else
        {
            std::cerr << "Warning: Invalid DECKCOEF_LOG_PROFILE '" << env_log_profile
                      << "'. Valid values: quiet, normal, debug." << std::endl;
        }
    }

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--help" || arg == "-h")
        {
            print_usage();
            return 0;
        }
        else if (arg.rfind("--config=", 0) == 0)
        {
            config_path = arg.substr(9);
        }
        else if (arg == "--config" && i + 1 < argc)
        {
            config_path = argv[++i];
        }
        else if (arg.rfind("--table=", 0) == 0)
        {
            cli_table_path = arg.substr(8);
        }
        else if (arg.rfind("--strategy=", 0) == 0)
        {
            cli_strategy = arg.substr(11);
        }
        else if (arg.rfind("--frame=", 0) == 0)
        {
            cli_frame = arg.substr(8);
        }
        else if (arg == "--derivatives")
        {
            cli_derivatives = true;
        }
        else if (arg.rfind("--step=", 0) == 0)
        {
            const std::string value = arg.substr(7);
            if (!try_parse_double_value(value, cli_step) || cli_step <= 0.0)
            {
                std::cerr << "Invalid --step value '" << value
                          << "'. Expected a positive angle in radians." << std::endl;
                return 1;
            }
        }
        else if (arg.rfind("--log-profile=", 0) == 0)
        {
            bool valid = false;
            cli_log_profile = parse_log_profile(arg.substr(14), &valid);
            if (!valid)
            {
                std::cerr << "Invalid --log-profile value. Use quiet, normal, or debug." << std::endl;
                return 1;
            }
            log_profile_from_cli = true;
        }
        else
        {
            std::cerr << "Unknown argument '" << arg << "'." << std::endl;
            print_usage();
            return 1;
        }
    }

    if (config_path.empty())
    {
        print_usage();
        return 1;
    }
    if (log_profile_from_cli)
    {
        global_log_profile = cli_log_profile;
    }

    try
    {
        EvaluationConfig config = load_evaluation_config(config_path);
        if (log_profile_from_cli)
        {
            global_log_profile = cli_log_profile;
        }
        if (!cli_table_path.empty()) config.table_path = cli_table_path;
        if (!cli_strategy.empty()) config.strategy = parse_strategy_kind(cli_strategy);
        if (!cli_frame.empty()) config.frame = parse_frame(cli_frame);
        if (cli_derivatives) config.derivatives = true;
        if (cli_step > 0.0) config.derivative_step_rad = cli_step;

        if (log_normal_enabled())
        {
            std::cout << "[RUN SETTINGS] log_profile=" << log_profile_name(global_log_profile)
                      << ", strategy=" << to_string(config.strategy)
                      << ", frame=" << to_string(config.frame)
                      << ", derivatives=" << (config.derivatives ? "on" : "off")
                      << ", points=" << config.query_yaws_rad.size() << std::endl;
        }

        const MeasurementTable table = load_measurement_table(config.table_path);
        if (log_normal_enabled())
        {
            std::cout << "[TABLE] " << table.source << ": " << table.num_samples() << " samples" << std::endl;
        }

        const CoefficientResult result = coefficients(table, config.query_yaws_rad, config.query_thetas_rad,
                                                      config.strategy, config.frame, config.fits);
        if (result.structural)
        {
            print_coefficient_rows("Ls", *result.structural, config.query_yaws_rad, config.query_thetas_rad);
        }
        if (result.wind_normal)
        {
            print_coefficient_rows("Lnw", *result.wind_normal, config.query_yaws_rad, config.query_thetas_rad);
        }

        if (config.derivatives)
        {
            const Frame derivative_frame = (config.frame == Frame::Both) ? Frame::Structural : config.frame;
            const DerivativeResult derivatives = coefficient_derivatives(
                table, config.query_yaws_rad, config.query_thetas_rad,
                config.strategy, derivative_frame, config.fits, config.derivative_step_rad);
            print_coefficient_rows("dC/dyaw", derivatives.d_yaw(), config.query_yaws_rad, config.query_thetas_rad);
            print_coefficient_rows("dC/dtheta", derivatives.d_theta(), config.query_yaws_rad, config.query_thetas_rad);
        }
    }
    catch (const std::exception& e)
    {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
