#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <nlohmann/json.hpp>
#include <sys/wait.h>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <sstream>
#include <string>

#ifndef REISIM_CLI_PATH
#define REISIM_CLI_PATH "./reisim"
#endif

#ifndef REISIM_DATA_DIR
#define REISIM_DATA_DIR "../data"
#endif

using Catch::Matchers::WithinRel;

namespace {

// Helper to run CLI command and capture output
struct CommandResult {
    int exit_code;
    std::string stdout_output;
    std::string stderr_output;
};

std::string read_file(const std::string& path) {
    std::ifstream stream(path);
    std::ostringstream ss;
    if (stream) {
        ss << stream.rdbuf();
    }
    return ss.str();
}

CommandResult run_cli(const std::string& args) {
    CommandResult result;

    // One capture pair per command line
    const std::string tag = std::to_string(std::hash<std::string>{}(args));
    std::string stdout_file = "/tmp/reisim_test_stdout_" + tag + ".txt";
    std::string stderr_file = "/tmp/reisim_test_stderr_" + tag + ".txt";

    std::string full_cmd = std::string("\"") + REISIM_CLI_PATH + "\" " + args +
                           " >" + stdout_file + " 2>" + stderr_file;
    int status = std::system(full_cmd.c_str());

    result.stdout_output = read_file(stdout_file);
    result.stderr_output = read_file(stderr_file);

    // Normalize exit code (system() returns the raw wait status)
    result.exit_code = WEXITSTATUS(status);

    std::remove(stdout_file.c_str());
    std::remove(stderr_file.c_str());
    return result;
}

std::string data_file(const std::string& name) {
    return std::string(REISIM_DATA_DIR) + "/" + name;
}

std::string write_temp_request(const std::string& name, const std::string& content) {
    std::string path = "/tmp/" + name;
    std::ofstream file(path);
    file << content;
    return path;
}

} // anonymous namespace

// ============================================================================
// Usage and argument errors
// ============================================================================

TEST_CASE("CLI help shows usage", "[cli]") {
    auto result = run_cli("--help");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
    REQUIRE(result.stderr_output.find("--request") != std::string::npos);
    REQUIRE(result.stderr_output.find("--mode") != std::string::npos);
    REQUIRE(result.stderr_output.find("--simulations") != std::string::npos);
    REQUIRE(result.stderr_output.find("--seed") != std::string::npos);
    REQUIRE(result.stderr_output.find("--output") != std::string::npos);
    REQUIRE(result.stderr_output.find("--log-level") != std::string::npos);
}

TEST_CASE("CLI no args shows usage", "[cli]") {
    auto result = run_cli("");
    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Usage:") != std::string::npos);
}

TEST_CASE("CLI argument errors fail", "[cli]") {
    SECTION("Missing request") {
        auto result = run_cli("--simulations 100");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("--request is required") != std::string::npos);
    }

    SECTION("Request file not found") {
        auto result = run_cli("--request /tmp/reisim_no_such_request.json");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("not found") != std::string::npos);
    }

    SECTION("Unknown option") {
        auto result = run_cli("--unknown-option");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Unknown option") != std::string::npos);
    }

    SECTION("Unknown mode") {
        auto result = run_cli("--request " + data_file("sample_request.json") + " --mode backtest");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("--mode") != std::string::npos);
    }

    SECTION("Non-numeric simulation count") {
        auto result = run_cli("--request " + data_file("sample_request.json") + " --simulations many");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("Invalid numeric value") != std::string::npos);
    }

    SECTION("Zero simulations") {
        auto result = run_cli("--request " + data_file("sample_request.json") + " --simulations 0");
        REQUIRE(result.exit_code == 1);
    }

    SECTION("Unknown log level") {
        auto result = run_cli("--request " + data_file("sample_request.json") + " --log-level chatty");
        REQUIRE(result.exit_code == 1);
        REQUIRE(result.stderr_output.find("--log-level") != std::string::npos);
    }
}

TEST_CASE("CLI rejects an invalid request document", "[cli]") {
    std::string path = write_temp_request("reisim_bad_request.json", R"({"investment_parameters": 5})");
    auto result = run_cli("--request " + path + " --log-level ERROR");

    REQUIRE(result.exit_code == 1);
    REQUIRE(result.stderr_output.find("Error:") != std::string::npos);
    REQUIRE(result.stderr_output.find("\"event\":\"error\"") != std::string::npos);
    REQUIRE(result.stdout_output.empty());
    std::remove(path.c_str());
}

// ============================================================================
// Monte Carlo runs
// ============================================================================

TEST_CASE("CLI Monte Carlo run writes JSON to stdout", "[cli][integration]") {
    auto result = run_cli("--request " + data_file("sample_request.json") +
                          " --simulations 300 --seed 7 --compact");

    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Configuration:") != std::string::npos);
    REQUIRE(result.stderr_output.find("Results:") != std::string::npos);
    REQUIRE(result.stderr_output.find("\"event\":\"run_start\"") != std::string::npos);

    auto j = nlohmann::json::parse(result.stdout_output);
    REQUIRE(j["simulation_metadata"]["num_simulations"] == 300);
    REQUIRE(j["simulation_metadata"]["random_seed"] == 7);
    REQUIRE(j["simulation_metadata"]["seed_source"] == "request");
    REQUIRE(j["summary_statistics"].contains("irr"));
    REQUIRE(j["distributions"].contains("loan_interest_rate"));
    REQUIRE_THAT(j["distributions"]["operating_expenses"]["p50"].get<double>(), WithinRel(9750.0, 0.05));
}

TEST_CASE("CLI runs with the same seed are identical", "[cli][integration]") {
    std::string args = "--request " + data_file("sample_request.json") +
                       " --simulations 200 --seed 123 --log-level ERROR";
    auto first = run_cli(args);
    auto second = run_cli(args);

    REQUIRE(first.exit_code == 0);
    REQUIRE(second.exit_code == 0);

    auto a = nlohmann::json::parse(first.stdout_output);
    auto b = nlohmann::json::parse(second.stdout_output);
    REQUIRE(a["summary_statistics"] == b["summary_statistics"]);
    REQUIRE(a["risk_metrics"] == b["risk_metrics"]);
    REQUIRE(a["scenario_analysis"] == b["scenario_analysis"]);
}

TEST_CASE("CLI writes output and log files", "[cli][integration]") {
    const std::string output = "/tmp/reisim_test_output.json";
    const std::string log = "/tmp/reisim_test_run.log";
    std::remove(output.c_str());
    std::remove(log.c_str());

    auto result = run_cli("--request " + data_file("sample_request.json") +
                          " --simulations 100 --seed 1 --output " + output +
                          " --log-file " + log + " --log-format text");

    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stdout_output.empty());
    REQUIRE(result.stderr_output.find("Output written to") != std::string::npos);

    auto j = nlohmann::json::parse(read_file(output));
    REQUIRE(j["simulation_metadata"]["num_simulations"] == 100);

    std::string log_text = read_file(log);
    REQUIRE(log_text.find("event=run_start") != std::string::npos);
    REQUIRE(log_text.find("event=run_complete") != std::string::npos);

    std::remove(output.c_str());
    std::remove(log.c_str());
}

// ============================================================================
// Sensitivity runs
// ============================================================================

TEST_CASE("CLI sensitivity run", "[cli][integration]") {
    auto result = run_cli("--request " + data_file("sample_sensitivity.json") + " --mode sensitivity");

    REQUIRE(result.exit_code == 0);
    REQUIRE(result.stderr_output.find("Most sensitive:") != std::string::npos);

    auto j = nlohmann::json::parse(result.stdout_output);
    REQUIRE(j["base_case"]["target_metric"] == "irr");
    REQUIRE(j["tornado"]["variables"].size() == 5);
    REQUIRE(j["variables"][1]["steps"].size() == 9);
    REQUIRE(j["base_case"]["analysis_metrics"].size() == 4);
    REQUIRE(j["variables"][0]["steps"][0]["impact"].contains("monthly_cash_flow"));
    REQUIRE_FALSE(j["recommendations"].empty());
    REQUIRE(j["two_way_analysis"]["variable1"] == "rental_income");
    REQUIRE_FALSE(j["critical_values"].empty());
}

TEST_CASE("CLI sensitivity run without a sensitivity section", "[cli][integration]") {
    auto result = run_cli("--request " + data_file("sample_request.json") +
                          " --mode sensitivity --log-level WARN");

    REQUIRE(result.exit_code == 0);
    auto j = nlohmann::json::parse(result.stdout_output);
    // purchase_price, rental_income, operating_expenses, loan_interest_rate,
    // appreciation_rate and vacancy_rate are all in the sample request
    REQUIRE(j["tornado"]["variables"].size() == 6);
}
