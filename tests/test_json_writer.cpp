#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include "evaluator.hpp"
#include "io/json_writer.hpp"

using namespace reisim;
using namespace reisim::io;
using json = nlohmann::json;
using Catch::Matchers::WithinAbs;

// ============================================================================
// Test Fixtures
// ============================================================================

namespace {

SimulationRequest create_request() {
    SimulationRequest request;
    request.base_scenario = Scenario{
        {"purchase_price", 300000}, {"down_payment_percent", 25}, {"rental_income", 2400},
        {"operating_expenses", 6000}, {"vacancy_rate", 5}, {"closing_costs", 6000}
    };
    request.variable_distributions.emplace("rental_income", DistributionSpec::normal(2400, 150));
    // Zero-width input: its correlations are undefined
    request.variable_distributions.emplace("closing_costs", DistributionSpec::uniform(6000, 6000));
    request.settings.num_simulations = 500;
    request.settings.random_seed = 42;
    return request;
}

json round_trip(const SimulationResult& result, bool pretty) {
    std::ostringstream oss;
    write_simulation_result_json(oss, result, pretty);
    return json::parse(oss.str());
}

} // anonymous namespace

TEST_CASE("level_key drops trailing zeros", "[json_writer]") {
    REQUIRE(level_key("p", 5) == "p5");
    REQUIRE(level_key("var_", 2.5) == "var_2.5");
    REQUIRE(level_key("ci_", 90.0) == "ci_90");
}

// ============================================================================
// Monte Carlo output
// ============================================================================

TEST_CASE("Simulation JSON has every section", "[json_writer]") {
    RentalPropertyEvaluator evaluator;
    SimulationResult result = run_simulation(create_request(), evaluator);
    json j = round_trip(result, true);

    for (const char* key : {"summary_statistics", "distributions", "risk_metrics", "probability_analysis",
                            "correlations", "scenario_analysis", "confidence_intervals",
                            "recommendations", "simulation_metadata"}) {
        INFO(key);
        REQUIRE(j.contains(key));
    }

    REQUIRE(j["summary_statistics"]["irr"]["count"] == 500);
    REQUIRE(j["distributions"]["irr"].contains("p50"));
    REQUIRE(j["distributions"]["irr"]["histogram"].size() == 20);
    REQUIRE(j["distributions"]["rental_income"]["summary"]["count"] == 500);
    REQUIRE(j["distributions"]["irr"]["source"] == "output");
    REQUIRE(j["distributions"]["rental_income"]["source"] == "input");
    REQUIRE(j["distributions"]["rental_income"]["p50"].is_number());

    REQUIRE(j["risk_metrics"]["irr"]["value_at_risk"].contains("var_5"));
    REQUIRE(j["risk_metrics"]["irr"]["cvar"].contains("cvar_95"));
    REQUIRE(j["risk_metrics"]["sharpe_metric"] == "total_return");
    REQUIRE(j["risk_metrics"]["undefined_sharpe"] == false);
    REQUIRE(j["risk_metrics"]["sharpe_ratio"].is_number());

    REQUIRE(j["confidence_intervals"]["irr"].contains("ci_90"));
    REQUIRE(j["scenario_analysis"].contains("best_case"));
    REQUIRE(j["scenario_analysis"]["best_case"]["inputs"].contains("rental_income"));

    const json& meta = j["simulation_metadata"];
    REQUIRE(meta["num_simulations"] == 500);
    REQUIRE(meta["random_seed"] == 42);
    REQUIRE(meta["seed_source"] == "request");
    REQUIRE(meta["evaluator"] == "rental_property");
    REQUIRE(meta["degraded"] == false);
    REQUIRE(meta["excluded_by_metric"]["irr"] == 0);
    REQUIRE(meta["sampled_variables"].size() == 2);
}

TEST_CASE("Simulation JSON writes undefined values as null", "[json_writer]") {
    RentalPropertyEvaluator evaluator;
    SimulationResult result = run_simulation(create_request(), evaluator);
    json j = round_trip(result, false);

    const json& matrix = j["correlations"]["correlation_matrix"];
    REQUIRE(matrix["irr"]["closing_costs"].is_null());
    REQUIRE(matrix["irr"]["rental_income"].is_number());

    const json& ranking = j["correlations"]["sensitivity_ranking"];
    REQUIRE(ranking.size() == 2);
    REQUIRE(ranking[1]["variable"] == "closing_costs");
    REQUIRE(ranking[1]["correlation"].is_null());
    REQUIRE(ranking[1]["impact"] == "None");

    const json& constant = j["distributions"]["closing_costs"]["summary"];
    REQUIRE(constant["std_dev"] == 0.0);
    REQUIRE(constant["skewness"].is_null());
    REQUIRE(constant["kurtosis"].is_null());
}

TEST_CASE("Simulation JSON reports an undefined Sharpe ratio", "[json_writer]") {
    RentalPropertyEvaluator evaluator;
    SimulationRequest request = create_request();
    request.variable_distributions.erase("rental_income");

    json j = round_trip(run_simulation(request, evaluator), true);
    REQUIRE(j["risk_metrics"]["sharpe_ratio"].is_null());
    REQUIRE(j["risk_metrics"]["undefined_sharpe"] == true);
}

TEST_CASE("Compact output is a single line", "[json_writer]") {
    RentalPropertyEvaluator evaluator;
    SimulationResult result = run_simulation(create_request(), evaluator);

    std::ostringstream oss;
    write_simulation_result_json(oss, result, false);
    std::string text = oss.str();
    REQUIRE(text.find('\n') == text.size() - 1);
}

TEST_CASE("Simulation JSON file output", "[json_writer]") {
    RentalPropertyEvaluator evaluator;
    SimulationResult result = run_simulation(create_request(), evaluator);

    const std::string path = "test_json_writer_output.json";
    write_simulation_result_json(path, result);
    std::ifstream file(path);
    json j = json::parse(file);
    REQUIRE(j["simulation_metadata"]["num_simulations"] == 500);
    file.close();
    std::filesystem::remove(path);

    REQUIRE_THROWS_AS(write_simulation_result_json("/nonexistent_dir/out.json", result), std::runtime_error);
}

// ============================================================================
// Sensitivity output
// ============================================================================

TEST_CASE("Sensitivity JSON has every section", "[json_writer]") {
    RentalPropertyEvaluator evaluator;
    BaseScenario base = create_request().base_scenario;
    std::vector<SensitivityVariable> variables = {
        SensitivityVariable("rental_income", default_variations()),
        SensitivityVariable("vacancy_rate", {-2, 0, 2}, PerturbationMode::Absolute)
    };
    SensitivityResult result = analyze_sensitivity(base, variables, evaluator);

    std::ostringstream oss;
    write_sensitivity_result_json(oss, result);
    json j = json::parse(oss.str());

    REQUIRE(j["base_case"]["target_metric"] == "irr");
    REQUIRE(j["base_case"]["scenario"]["purchase_price"] == 300000.0);
    REQUIRE(j["base_case"]["metrics"].contains("irr"));

    REQUIRE(j["tornado"]["metric"] == "irr");
    REQUIRE(j["tornado"]["variables"].size() == 2);
    REQUIRE(j["tornado"]["variables"][0]["variable"] == "rental_income");

    REQUIRE(j["variables"].size() == 2);
    REQUIRE(j["variables"][1]["mode"] == "absolute");
    REQUIRE(j["variables"][0]["steps"].size() == 5);

    REQUIRE(j["two_way_analysis"]["data"].size() == 5);
    REQUIRE(j["two_way_analysis"]["data"][0].size() == 3);
    REQUIRE(j["critical_values"].is_array());
    REQUIRE(j["risk_assessment"].contains("overall_risk_level"));
    REQUIRE(j["risk_assessment"]["high_sensitivity_variables"].is_array());
    REQUIRE(j["risk_assessment"]["risk_factors"].is_array());
    REQUIRE(j["recommendations"].size() == result.recommendations.size());
    REQUIRE(j["recommendations"][0].contains("action"));
    REQUIRE(j["base_case"]["analysis_metrics"] == json::array({"irr"}));
    REQUIRE(j["variables"][0]["steps"][0]["metrics"].contains("irr"));
    REQUIRE(j["variables"][0]["steps"][0]["impact"].contains("irr"));
    REQUIRE(j["analysis_metadata"]["evaluations"].get<size_t>() == result.evaluations);
}

TEST_CASE("Sensitivity JSON without a two-way table", "[json_writer]") {
    RentalPropertyEvaluator evaluator;
    std::vector<SensitivityVariable> variables = {SensitivityVariable("rental_income", {-10, 0, 10})};
    SensitivityResult result = analyze_sensitivity(create_request().base_scenario, variables, evaluator);

    nlohmann::ordered_json j = sensitivity_result_to_json(result);
    REQUIRE(j["two_way_analysis"].is_null());
}
