#ifndef REISIM_SCENARIO_HPP
#define REISIM_SCENARIO_HPP

#include "distribution.hpp"
#include "rng.hpp"
#include <initializer_list>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace reisim {

// Investment scenario: variable name -> value (purchase price, rent, expenses,
// financing terms). Ordered by name so iteration is deterministic.
class Scenario {
public:
    Scenario() = default;
    Scenario(std::initializer_list<std::pair<const std::string, double>> values);
    explicit Scenario(std::map<std::string, double> values);

    void set(const std::string& name, double value);

    // Throws std::out_of_range if the variable is absent
    double get(const std::string& name) const;
    double get_or(const std::string& name, double fallback) const;
    bool has(const std::string& name) const;

    size_t size() const { return values_.size(); }
    bool empty() const { return values_.empty(); }

    const std::map<std::string, double>& values() const { return values_; }

    bool operator==(const Scenario& other) const { return values_ == other.values_; }

private:
    std::map<std::string, double> values_;
};

// Deterministic inputs before any random overlay
using BaseScenario = Scenario;

// Which base fields are uncertain, and how
using VariableDistributions = std::map<std::string, DistributionSpec>;

// Build one trial scenario: copy `base`, then draw one value per entry of
// `distributions` in sorted-name order and overwrite (or add) that field.
// Two generators seeded identically produce bit-identical scenarios.
Scenario generate_scenario(const BaseScenario& base,
                           const VariableDistributions& distributions,
                           Rng& rng);

// Names of the sampled variables, sorted
std::vector<std::string> sampled_variable_names(const VariableDistributions& distributions);

} // namespace reisim

#endif // REISIM_SCENARIO_HPP
