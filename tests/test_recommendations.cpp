#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <algorithm>
#include <string>
#include "recommendations.hpp"

using namespace reisim;
using Catch::Matchers::ContainsSubstring;

namespace {

bool has_type(const std::vector<Recommendation>& recs, const std::string& type) {
    return std::any_of(recs.begin(), recs.end(),
                       [&type](const Recommendation& r) { return r.type == type; });
}

const Recommendation& find_type(const std::vector<Recommendation>& recs, const std::string& type) {
    return *std::find_if(recs.begin(), recs.end(),
                         [&type](const Recommendation& r) { return r.type == type; });
}

RecommendationInputs create_inputs(double mean_irr, double sd_irr) {
    RecommendationInputs inputs;
    inputs.irr_summary.count = 1000;
    inputs.irr_summary.mean = mean_irr;
    inputs.irr_summary.std_dev = sd_irr;
    inputs.irr_probability_of_loss = 0.0;
    inputs.irr_var_10 = 1.0;
    inputs.probabilities.positive_cash_flow = 1.0;
    inputs.probabilities.double_money = 0.0;
    inputs.num_simulations = 1000;
    return inputs;
}

} // anonymous namespace

TEST_CASE("Recommendations for a strong deal", "[recommendations]") {
    auto recs = generate_recommendations(create_inputs(18.0, 2.0));

    REQUIRE(recs.size() == 1);
    REQUIRE(recs[0].type == "Performance");
    REQUIRE(recs[0].priority == "High");
    REQUIRE_THAT(recs[0].message, ContainsSubstring("18.0%"));
}

TEST_CASE("Recommendations for a weak, risky deal", "[recommendations]") {
    RecommendationInputs inputs = create_inputs(4.0, 6.0);
    inputs.irr_probability_of_loss = 0.35;
    inputs.irr_var_10 = -3.5;
    inputs.probabilities.positive_cash_flow = 0.6;

    auto recs = generate_recommendations(inputs);

    REQUIRE(has_type(recs, "Performance"));
    REQUIRE_THAT(find_type(recs, "Performance").message, ContainsSubstring("Low expected IRR"));
    REQUIRE(has_type(recs, "Risk"));
    REQUIRE_THAT(find_type(recs, "Risk").message, ContainsSubstring("35.0%"));
    REQUIRE(has_type(recs, "Cash Flow"));
    REQUIRE_THAT(find_type(recs, "Cash Flow").message, ContainsSubstring("60.0%"));
    REQUIRE(has_type(recs, "Volatility"));
    REQUIRE(has_type(recs, "Downside Risk"));
    REQUIRE_FALSE(has_type(recs, "Upside Potential"));
}

TEST_CASE("Recommendations upside potential", "[recommendations]") {
    RecommendationInputs inputs = create_inputs(12.0, 1.0);
    inputs.probabilities.double_money = 0.7;

    auto recs = generate_recommendations(inputs);
    REQUIRE(recs.size() == 1);
    REQUIRE(recs[0].type == "Upside Potential");
    REQUIRE(recs[0].priority == "Low");
}

TEST_CASE("Recommendations flag degraded runs", "[recommendations]") {
    RecommendationInputs inputs = create_inputs(12.0, 1.0);
    inputs.degraded = true;
    inputs.excluded_trials = 250;

    auto recs = generate_recommendations(inputs);
    REQUIRE(has_type(recs, "Data Quality"));
    REQUIRE_THAT(find_type(recs, "Data Quality").message, ContainsSubstring("250 of 1000"));
}

TEST_CASE("Recommendations skip undefined inputs", "[recommendations]") {
    RecommendationInputs inputs;
    REQUIRE(generate_recommendations(inputs).empty());
}
