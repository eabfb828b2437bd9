#include <catch2/catch_test_macros.hpp>
#include <stdexcept>
#include "scenario.hpp"

using namespace reisim;

// ============================================================================
// Scenario Tests
// ============================================================================

TEST_CASE("Scenario set and get", "[scenario]") {
    Scenario scenario;
    REQUIRE(scenario.empty());

    scenario.set("purchase_price", 350000);
    scenario.set("rental_income", 2500);

    REQUIRE(scenario.size() == 2);
    REQUIRE(scenario.get("purchase_price") == 350000);
    REQUIRE(scenario.has("rental_income"));
    REQUIRE_FALSE(scenario.has("vacancy_rate"));
    REQUIRE(scenario.get_or("vacancy_rate", 5.0) == 5.0);

    scenario.set("rental_income", 2600);
    REQUIRE(scenario.get("rental_income") == 2600);
    REQUIRE(scenario.size() == 2);
}

TEST_CASE("Scenario get of an absent variable throws", "[scenario]") {
    Scenario scenario{{"purchase_price", 1.0}};
    REQUIRE_THROWS_AS(scenario.get("rental_income"), std::out_of_range);
}

TEST_CASE("Scenario iterates in name order", "[scenario]") {
    Scenario scenario{{"vacancy_rate", 5}, {"appreciation_rate", 3}, {"purchase_price", 1}};
    auto it = scenario.values().begin();
    REQUIRE(it->first == "appreciation_rate");
    ++it;
    REQUIRE(it->first == "purchase_price");
    ++it;
    REQUIRE(it->first == "vacancy_rate");
}

// ============================================================================
// Scenario generation
// ============================================================================

TEST_CASE("generate_scenario overlays sampled values on the base", "[scenario]") {
    BaseScenario base{{"purchase_price", 350000}, {"rental_income", 2500}, {"operating_expenses", 6000}};
    VariableDistributions dists;
    dists.emplace("rental_income", DistributionSpec::uniform(2000, 3000));
    dists.emplace("vacancy_rate", DistributionSpec::uniform(3, 8));

    Rng rng(42);
    Scenario scenario = generate_scenario(base, dists, rng);

    REQUIRE(scenario.get("purchase_price") == 350000);
    REQUIRE(scenario.get("operating_expenses") == 6000);
    REQUIRE(scenario.get("rental_income") >= 2000);
    REQUIRE(scenario.get("rental_income") <= 3000);
    // Variables with a distribution but no base value are added
    REQUIRE(scenario.has("vacancy_rate"));

    // The base itself is untouched
    REQUIRE(base.get("rental_income") == 2500);
    REQUIRE_FALSE(base.has("vacancy_rate"));
}

TEST_CASE("generate_scenario is deterministic for a seed", "[scenario]") {
    BaseScenario base{{"purchase_price", 350000}, {"rental_income", 2500}};
    VariableDistributions dists;
    dists.emplace("rental_income", DistributionSpec::normal(2500, 200));
    dists.emplace("purchase_price", DistributionSpec::triangular(300000, 350000, 420000));

    Rng a(123);
    Rng b(123);
    for (int i = 0; i < 50; ++i) {
        REQUIRE(generate_scenario(base, dists, a) == generate_scenario(base, dists, b));
    }
}

TEST_CASE("generate_scenario with no distributions copies the base", "[scenario]") {
    BaseScenario base{{"purchase_price", 350000}};
    Rng rng(1);
    REQUIRE(generate_scenario(base, VariableDistributions{}, rng) == base);
}

TEST_CASE("sampled_variable_names are sorted", "[scenario]") {
    VariableDistributions dists;
    dists.emplace("vacancy_rate", DistributionSpec::uniform(3, 8));
    dists.emplace("appreciation_rate", DistributionSpec::normal(3, 1));

    auto names = sampled_variable_names(dists);
    REQUIRE(names == std::vector<std::string>{"appreciation_rate", "vacancy_rate"});
}
