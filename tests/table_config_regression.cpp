#include "coefficient_errors.hpp"
#include "log_profile.hpp"
#include "measurement_table.hpp"
#include "physical_constants.hpp"
#include "runtime_config.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace deckcoef;

namespace
{
bool nearly_equal(double a, double b, double tol = 1.0e-12)
{
    return std::abs(a - b) <= tol;
}

int expect_true(bool cond, const std::string& message)
{
    if (!cond)
    {
        std::cerr << "[table-config-regression] FAIL: " << message << std::endl;
        return 1;
    }
    return 0;
}

std::string write_temp_file(const std::string& name, const std::string& contents)
{
    const std::filesystem::path path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << contents;
    return path.string();
}

int test_parse_structural_table()
{
    int failures = 0;
    std::istringstream csv(
        "# SOH section model, structural frame\n"
        "beta[deg], theta[deg], Cx_Ls, Cy_Ls, Cz_Ls, Cxx_Ls, Cyy_Ls, Czz_Ls\n"
        "0, -10, 0.01, 0.5, -0.3, 0.02, 0.0, 0.0\n"
        "\n"
        "30, 10, 0.02, 0.4, 0.3, 0.01, 0.001, -0.002\n");
    const MeasurementTable table = parse_measurement_table(csv, "inline");
    failures += expect_true(table.num_samples() == 2 && table.is_valid(), "two samples are parsed");
    failures += expect_true(nearly_equal(table.yaw_rad[1], rad(30.0)), "yaw is converted to radians");
    failures += expect_true(nearly_equal(table.theta_rad[0], rad(-10.0)), "theta is converted to radians");
    failures += expect_true(nearly_equal(table.coefficients[5][1], -0.002), "Czz_Ls lands in C6");

    const MeasurementTable slice = zero_yaw_slice(table);
    failures += expect_true(slice.num_samples() == 1 && nearly_equal(slice.coefficients[1][0], 0.5), "zero-yaw slice keeps one sample");
    return failures;
}

int test_parse_section_model_table()
{
    int failures = 0;
    std::istringstream csv(
        "yaw[deg],alpha[deg],C1,C2,C3,C4,C5,C6\n"
        "0,5,0,1,0,0,0,0\n"
        "120,2,0,1,0,0,0,0\n");
    const MeasurementTable table = parse_measurement_table(csv, "section");
    failures += expect_true(nearly_equal(table.theta_rad[0], -rad(5.0), 1.0e-12), "alpha is converted to theta");
    failures += expect_true(nearly_equal(table.alpha_rad[1], rad(2.0)), "alpha is kept");

    const MeasurementTable canonical = canonical_domain_samples(table);
    failures += expect_true(canonical.num_samples() == 1, "canonical domain drops the 120 deg sample");
    return failures;
}

int test_table_errors()
{
    int failures = 0;
    const char* bad_tables[] = {
        "",
        "beta[deg],theta[deg],C1,C2,C3,C4,C5\n0,0,1,1,1,1,1\n",
        "beta[deg],theta[deg],C1,C2,C3,C4,C5,C6\n0,0,1,1,x,1,1,1\n",
        "beta[deg],theta[deg],C1,C2,C3,C4,C5,C6\n0,0,1,1\n",
        "beta[deg],theta[deg],C1,C2,C3,C4,C5,C6\n"};
    for (const char* text : bad_tables)
    {
        std::istringstream csv(text);
        bool failed = false;
        try
        {
            parse_measurement_table(csv, "bad");
        }
        catch (const TableLoadError&)
        {
            failed = true;
        }
        failures += expect_true(failed, "malformed table raises TableLoadError");
    }

    bool missing = false;
    try
    {
        load_measurement_table("/nonexistent/deck_table.csv");
    }
    catch (const TableLoadError&)
    {
        missing = true;
    }
    failures += expect_true(missing, "missing table file raises TableLoadError");
    return failures;
}

int test_value_parsers()
{
    int failures = 0;
    int i = 0;
    failures += expect_true(try_parse_int_value("42", i) && i == 42, "integer parses");
    failures += expect_true(!try_parse_int_value("4x", i) && i == 42, "partial integer is rejected");
    double d = 0.0;
    failures += expect_true(try_parse_double_value("1e-3", d) && nearly_equal(d, 1.0e-3), "double parses");
    failures += expect_true(!try_parse_double_value("inf", d), "non-finite double is rejected");

    std::vector<double> list;
    failures += expect_true(try_parse_double_list("[0, 15.5, -30]", list) && list.size() == 3 && list[2] == -30.0,
                            "bracketed number list parses");
    failures += expect_true(!try_parse_double_list("1, two", list), "bad list item is rejected");
    failures += expect_true(strip_wrapping_quotes("'Ls'") == "Ls", "quotes are stripped");

    bool valid = false;
    failures += expect_true(parse_log_profile("DEBUG", &valid) == LogProfile::debug && valid, "log profile parses");
    parse_log_profile("loud", &valid);
    failures += expect_true(!valid, "unknown log profile is flagged");
    return failures;
}

int test_load_evaluation_config()
{
    int failures = 0;
    const std::string path = write_temp_file("deckcoef_regression.yaml",
        "# evaluation settings\n"
        "table:\n"
        "  path: data/soh_table.csv\n"
        "evaluation:\n"
        "  strategy: \"cos_rule\"\n"
        "  frame: Lnw&Ls\n"
        "  derivatives: true\n"
        "derivatives:\n"
        "  step_rad: 0.002\n"
        "logging:\n"
        "  profile: quiet\n"
        "channels:\n"
        "  C3:\n"
        "    free_degree: 3\n"
        "    solver: qr\n"
        "    constraints: F_is_0_at_x0_end, dF/dx1_is_0_at_x1_middle\n"
        "  c6:\n"
        "    inequality: negativity\n"
        "    constrained_degree: -2\n"
        "query:\n"
        "  yaws_deg: [0, 45, -90]\n"
        "  thetas_deg: [0, 10, 20]\n");

    const EvaluationConfig config = load_evaluation_config(path);
    failures += expect_true(config.table_path == "data/soh_table.csv", "table path is read");
    failures += expect_true(config.strategy == StrategyKind::CosineRule, "quoted strategy token is read");
    failures += expect_true(config.frame == Frame::Both, "frame token is read");
    failures += expect_true(config.derivatives && nearly_equal(config.derivative_step_rad, 0.002), "derivative settings are read");
    failures += expect_true(global_log_profile == LogProfile::quiet, "logging profile is applied");
    failures += expect_true(config.fits[2].free_degree == 3 && config.fits[2].solver == FitSolver::Qr, "channel C3 overrides apply");
    failures += expect_true(config.fits[2].constraints.size() == 2, "constraint list is split");
    failures += expect_true(config.fits[5].inequality == InequalityKind::Negativity, "lowercase channel key is accepted");
    failures += expect_true(config.fits[5].constrained_degree == 4, "negative degree keeps the default");
    failures += expect_true(config.fits[0].free_degree == 2, "untouched channels keep the defaults");
    failures += expect_true(config.query_yaws_rad.size() == 3 && nearly_equal(config.query_yaws_rad[2], -physical_constants::half_pi),
                            "query yaws are converted to radians");
    global_log_profile = LogProfile::normal;

    const std::string bad_path = write_temp_file("deckcoef_bad_strategy.yaml", "evaluation:\n  strategy: spline\n");
    bool rejected = false;
    try
    {
        load_evaluation_config(bad_path);
    }
    catch (const UnsupportedConfigurationError&)
    {
        rejected = true;
    }
    failures += expect_true(rejected, "unknown strategy in a config file is rejected");

    bool missing = false;
    try
    {
        load_evaluation_config("/nonexistent/deckcoef.yaml");
    }
    catch (const std::runtime_error&)
    {
        missing = true;
    }
    failures += expect_true(missing, "missing config file is an error");

    std::remove(path.c_str());
    std::remove(bad_path.c_str());
    return failures;
}
}

int main()
{
    int failures = 0;
    failures += test_parse_structural_table();
    failures += test_parse_section_model_table();
    failures += test_table_errors();
    failures += test_value_parsers();
    failures += test_load_evaluation_config();

    if (failures > 0)
    {
        std::cerr << "[table-config-regression] FAILED with " << failures << " check(s)." << std::endl;
        return 1;
    }

    std::cout << "[table-config-regression] all checks passed" << std::endl;
    return 0;
}
