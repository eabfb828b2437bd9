#include "scenario.hpp"
#include <stdexcept>

namespace reisim {

// ============================================================================
// Scenario Implementation
// ============================================================================

Scenario::Scenario(std::initializer_list<std::pair<const std::string, double>> values)
    : values_(values) {}

Scenario::Scenario(std::map<std::string, double> values)
    : values_(std::move(values)) {}

void Scenario::set(const std::string& name, double value) {
    values_[name] = value;
}

double Scenario::get(const std::string& name) const {
    auto it = values_.find(name);
    if (it == values_.end()) {
        throw std::out_of_range("Scenario variable not found: " + name);
    }
    return it->second;
}

double Scenario::get_or(const std::string& name, double fallback) const {
    auto it = values_.find(name);
    return it == values_.end() ? fallback : it->second;
}

bool Scenario::has(const std::string& name) const {
    return values_.find(name) != values_.end();
}

// ============================================================================
// Scenario generation
// ============================================================================

Scenario generate_scenario(const BaseScenario& base,
                           const VariableDistributions& distributions,
                           Rng& rng) {
    Scenario scenario = base;
    // std::map iterates in key order, which fixes the draw order
    for (const auto& [name, spec] : distributions) {
        scenario.set(name, sample(spec, rng));
    }
    return scenario;
}

std::vector<std::string> sampled_variable_names(const VariableDistributions& distributions) {
    std::vector<std::string> names;
    names.reserve(distributions.size());
    for (const auto& entry : distributions) {
        names.push_back(entry.first);
    }
    return names;
}

} // namespace reisim
