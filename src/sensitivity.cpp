#include "sensitivity.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>

namespace reisim {

// ============================================================================
// Perturbation helpers
// ============================================================================

std::string mode_to_string(PerturbationMode mode) {
    switch (mode) {
        case PerturbationMode::Relative: return "relative";
        case PerturbationMode::Absolute: return "absolute";
    }
    return "unknown";
}

PerturbationMode parse_perturbation_mode(const std::string& name) {
    if (name == "relative") return PerturbationMode::Relative;
    if (name == "absolute") return PerturbationMode::Absolute;
    throw ValidationError("Unknown perturbation mode: '" + name + "' (expected relative or absolute)");
}

double perturb(double base_value, double variation, PerturbationMode mode) {
    if (mode == PerturbationMode::Absolute) {
        return base_value + variation;
    }
    return base_value * (1.0 + variation / 100.0);
}

std::vector<double> default_variations() {
    return {-20.0, -10.0, 0.0, 10.0, 20.0};
}

std::vector<double> symmetric_range(double max_percent, double step_percent) {
    if (!std::isfinite(max_percent) || max_percent < 0.0) {
        throw ValidationError("Sensitivity range maximum must be a non-negative number");
    }
    if (!std::isfinite(step_percent) || step_percent <= 0.0) {
        throw ValidationError("Sensitivity range step must be positive");
    }

    const int steps = static_cast<int>(std::floor(max_percent / step_percent + 1e-9));
    std::vector<double> variations;
    variations.reserve(static_cast<size_t>(2 * steps + 1));
    for (int i = -steps; i <= steps; ++i) {
        variations.push_back(static_cast<double>(i) * step_percent);
    }
    return variations;
}

// ============================================================================
// Struct defaults
// ============================================================================

SensitivityVariable::SensitivityVariable()
    : mode(PerturbationMode::Relative) {}

SensitivityVariable::SensitivityVariable(std::string name,
                                         std::vector<double> variation_list,
                                         PerturbationMode perturbation_mode)
    : variable_name(std::move(name)),
      variations(std::move(variation_list)),
      mode(perturbation_mode) {}

SensitivityOptions::SensitivityOptions()
    : target_metric("irr"),
      break_even_metric("npv"),
      two_way(true),
      break_even_low(-90.0),
      break_even_high(200.0) {}

// ============================================================================
// Tornado ranking
// ============================================================================

void rank_tornado(std::vector<TornadoEntry>& entries) {
    std::sort(entries.begin(), entries.end(),
        [](const TornadoEntry& a, const TornadoEntry& b) {
            if (a.swing.has_value() != b.swing.has_value()) {
                return a.swing.has_value();
            }
            if (a.swing && *a.swing != *b.swing) {
                return *a.swing > *b.swing;
            }
            return a.variable_name < b.variable_name;
        });
}

// ============================================================================
// Analysis
// ============================================================================

namespace {

class MetricCounter {
public:
    MetricCounter(const FinancialEvaluator& evaluator, size_t& evaluations)
        : evaluator_(evaluator), evaluations_(evaluations) {}

    // Empty when the scenario cannot be evaluated
    std::optional<FinancialMetrics> evaluate(const Scenario& scenario) const {
        ++evaluations_;
        try {
            return evaluator_.evaluate(scenario);
        } catch (const EvaluationError&) {
            return std::nullopt;
        }
    }

    // Empty when the scenario cannot be evaluated or lacks the metric
    std::optional<double> operator()(const Scenario& scenario, const std::string& metric) const {
        std::optional<FinancialMetrics> metrics = evaluate(scenario);
        if (!metrics) {
            return std::nullopt;
        }
        auto it = metrics->find(metric);
        if (it == metrics->end()) {
            return std::nullopt;
        }
        return it->second;
    }

private:
    const FinancialEvaluator& evaluator_;
    size_t& evaluations_;
};

void validate_variables(const BaseScenario& base, const std::vector<SensitivityVariable>& variables) {
    if (variables.empty()) {
        throw ValidationError("Sensitivity analysis needs at least one variable");
    }

    std::set<std::string> seen;
    for (const auto& var : variables) {
        if (!base.has(var.variable_name)) {
            throw ValidationError("Unknown sensitivity variable: '" + var.variable_name + "'");
        }
        if (!seen.insert(var.variable_name).second) {
            throw ValidationError("Duplicate sensitivity variable: '" + var.variable_name + "'");
        }
        if (var.variations.empty()) {
            throw ValidationError("Sensitivity variable '" + var.variable_name + "' has no variations");
        }
        for (double v : var.variations) {
            if (!std::isfinite(v)) {
                throw ValidationError("Sensitivity variable '" + var.variable_name +
                                      "' has a non-finite variation");
            }
        }
    }
}

Scenario perturbed(const BaseScenario& base, const SensitivityVariable& var, double variation) {
    Scenario scenario = base;
    scenario.set(var.variable_name, perturb(base.get(var.variable_name), variation, var.mode));
    return scenario;
}

std::optional<double> calculate_elasticity(const VariableSensitivity& result) {
    std::vector<const SensitivityStep*> ordered;
    for (const auto& step : result.steps) {
        ordered.push_back(&step);
    }
    std::stable_sort(ordered.begin(), ordered.end(),
        [](const SensitivityStep* a, const SensitivityStep* b) { return a->variation < b->variation; });

    double total = 0.0;
    size_t count = 0;
    for (size_t i = 0; i + 1 < ordered.size(); ++i) {
        const SensitivityStep& a = *ordered[i];
        const SensitivityStep& b = *ordered[i + 1];
        if (!a.metric || !b.metric || *a.metric == 0.0) {
            continue;
        }
        double input_change = result.base_value != 0.0
            ? (b.value - a.value) / std::abs(result.base_value) * 100.0
            : b.variation - a.variation;
        if (input_change == 0.0) {
            continue;
        }
        double output_change = (*b.metric - *a.metric) / std::abs(*a.metric) * 100.0;
        total += std::abs(output_change / input_change);
        ++count;
    }

    if (count == 0) {
        return std::nullopt;
    }
    return total / static_cast<double>(count);
}

VariableSensitivity analyze_variable(const BaseScenario& base,
                                     const SensitivityVariable& var,
                                     const FinancialMetrics& base_metrics,
                                     const std::string& target_metric,
                                     const std::vector<std::string>& analysis_metrics,
                                     const MetricCounter& metric_at) {
    const double base_metric = base_metrics.at(target_metric);
    VariableSensitivity result;
    result.variable_name = var.variable_name;
    result.mode = var.mode;
    result.base_value = base.get(var.variable_name);
    result.metric_at_base = base_metric;

    for (double variation : var.variations) {
        Scenario scenario = perturbed(base, var, variation);
        SensitivityStep step;
        step.variation = variation;
        step.value = scenario.get(var.variable_name);

        std::optional<FinancialMetrics> metrics = metric_at.evaluate(scenario);
        if (metrics) {
            auto target = metrics->find(target_metric);
            if (target != metrics->end()) {
                step.metric = target->second;
            }
            for (const auto& name : analysis_metrics) {
                auto it = metrics->find(name);
                if (it != metrics->end()) {
                    step.metrics[name] = it->second;
                    step.impact[name] = metric_impact(name, base_metrics.at(name), it->second);
                }
            }
        }
        if (step.metric) {
            step.change = *step.metric - base_metric;
            result.min_value = result.min_value ? std::min(*result.min_value, *step.metric) : *step.metric;
            result.max_value = result.max_value ? std::max(*result.max_value, *step.metric) : *step.metric;
        }
        result.steps.push_back(step);
    }

    auto low = std::min_element(result.steps.begin(), result.steps.end(),
        [](const SensitivityStep& a, const SensitivityStep& b) { return a.variation < b.variation; });
    auto high = std::max_element(result.steps.begin(), result.steps.end(),
        [](const SensitivityStep& a, const SensitivityStep& b) { return a.variation < b.variation; });

    result.low_variation = low->variation;
    result.high_variation = high->variation;
    result.metric_at_low = low->metric;
    result.metric_at_high = high->metric;
    if (result.metric_at_low && result.metric_at_high) {
        result.swing = std::abs(*result.metric_at_high - *result.metric_at_low);
    }
    result.elasticity = calculate_elasticity(result);
    return result;
}

std::optional<CriticalValue> find_break_even(const BaseScenario& base,
                                             const SensitivityVariable& var,
                                             const std::string& metric,
                                             double low,
                                             double high,
                                             const MetricCounter& metric_at) {
    auto f = [&](double variation) { return metric_at(perturbed(base, var, variation), metric); };

    std::optional<double> f_low = f(low);
    std::optional<double> f_high = f(high);
    if (!f_low || !f_high) {
        return std::nullopt;
    }

    double root;
    if (*f_low == 0.0) {
        root = low;
    } else if (*f_high == 0.0) {
        root = high;
    } else if ((*f_low < 0.0) == (*f_high < 0.0)) {
        return std::nullopt;
    } else {
        // Bisection on the variation
        for (int i = 0; i < 100 && (high - low) > 1e-6; ++i) {
            double mid = 0.5 * (low + high);
            std::optional<double> f_mid = f(mid);
            if (!f_mid) {
                return std::nullopt;
            }
            if (*f_mid == 0.0) {
                low = high = mid;
                break;
            }
            if ((*f_mid < 0.0) == (*f_low < 0.0)) {
                low = mid;
                f_low = f_mid;
            } else {
                high = mid;
            }
        }
        root = 0.5 * (low + high);
    }

    CriticalValue critical;
    critical.variable_name = var.variable_name;
    critical.base_value = base.get(var.variable_name);
    critical.break_even_value = perturb(critical.base_value, root, var.mode);
    if (var.mode == PerturbationMode::Absolute && critical.base_value != 0.0) {
        critical.break_even_change_percent = root / std::abs(critical.base_value) * 100.0;
    } else {
        critical.break_even_change_percent = root;
    }
    critical.margin_of_safety = 100.0 - std::abs(critical.break_even_change_percent);
    return critical;
}

SensitivityRiskAssessment assess_risk(const std::vector<VariableSensitivity>& variables,
                                      double base_metric) {
    SensitivityRiskAssessment risk;
    double total_elasticity = 0.0;
    double max_downside = 0.0;

    for (const auto& var : variables) {
        double elasticity = var.elasticity.value_or(0.0);
        total_elasticity += elasticity;

        double downside = 0.0;
        if (base_metric != 0.0) {
            for (const auto& step : var.steps) {
                if (step.variation < 0.0 && step.metric) {
                    downside = std::max(downside, (base_metric - *step.metric) / std::abs(base_metric) * 100.0);
                }
            }
        }
        max_downside = std::max(max_downside, downside);

        if (elasticity > 1.0) {
            risk.high_sensitivity_variables.push_back(HighSensitivityVariable{var.variable_name, elasticity});
        }
        if (elasticity > 1.5 || downside > 30.0) {
            risk.critical_variables.push_back(var.variable_name);
        }
    }
    risk.risk_factors = identify_risk_factors(risk.critical_variables);

    risk.average_elasticity = variables.empty() ? 0.0 : total_elasticity / static_cast<double>(variables.size());
    risk.max_downside_risk = max_downside;

    if (risk.average_elasticity < 0.5 && max_downside < 20.0) {
        risk.overall_risk_level = "Low";
    } else if (risk.average_elasticity < 1.0 && max_downside < 40.0) {
        risk.overall_risk_level = "Medium";
    } else {
        risk.overall_risk_level = "High";
    }
    return risk;
}

std::vector<std::string> resolve_analysis_metrics(const SensitivityOptions& options,
                                                  const FinancialMetrics& base_metrics) {
    std::vector<std::string> metrics = {options.target_metric};
    for (const auto& name : options.analysis_metrics) {
        if (base_metrics.find(name) == base_metrics.end()) {
            throw ValidationError("Analysis metric '" + name + "' is not produced by the base case");
        }
        if (std::find(metrics.begin(), metrics.end(), name) == metrics.end()) {
            metrics.push_back(name);
        }
    }
    return metrics;
}

std::string format_percent(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value;
    return oss.str();
}

} // anonymous namespace

// ============================================================================
// Impact, risk factors and recommendations
// ============================================================================

double metric_impact(const std::string& metric, double base_value, double value) {
    static const std::set<std::string> currency_metrics = {
        "monthly_cash_flow", "annual_cash_flow", "noi", "npv", "total_profit", "exit_value"
    };
    if (currency_metrics.count(metric) > 0) {
        return value - base_value;
    }
    if (base_value == 0.0) {
        return 0.0;
    }
    return (value - base_value) / std::abs(base_value) * 100.0;
}

std::vector<RiskFactor> identify_risk_factors(const std::vector<std::string>& critical_variables) {
    auto critical = [&critical_variables](const char* name) {
        return std::find(critical_variables.begin(), critical_variables.end(), name) != critical_variables.end();
    };

    std::vector<RiskFactor> factors;
    if (critical("loan_interest_rate")) {
        factors.push_back({"Interest Rate Risk",
                           "Investment highly sensitive to rate changes",
                           "Consider fixed-rate financing or rate locks"});
    }
    if (critical("rental_income")) {
        factors.push_back({"Income Risk",
                           "Returns heavily dependent on rental income",
                           "Diversify tenant base, consider long-term leases"});
    }
    if (critical("purchase_price")) {
        factors.push_back({"Valuation Risk",
                           "Returns sensitive to purchase price",
                           "Thorough due diligence and conservative valuations"});
    }
    if (critical("vacancy_rate")) {
        factors.push_back({"Occupancy Risk",
                           "Performance vulnerable to vacancy",
                           "Focus on high-demand locations and tenant retention"});
    }
    return factors;
}

std::vector<Recommendation> generate_sensitivity_recommendations(const SensitivityResult& result) {
    const SensitivityRiskAssessment& risk = result.risk_assessment;
    std::vector<Recommendation> recommendations;

    if (risk.overall_risk_level == "High") {
        recommendations.push_back({"Risk Management", "High",
                                   "High sensitivity to multiple variables",
                                   "Implement hedging strategies and maintain larger reserves"});
    }

    for (const auto& variable : risk.critical_variables) {
        auto critical = std::find_if(result.critical_values.begin(), result.critical_values.end(),
            [&variable](const CriticalValue& cv) { return cv.variable_name == variable; });
        if (critical != result.critical_values.end() && critical->margin_of_safety < 20.0) {
            recommendations.push_back({"Critical Risk", "High",
                                       "Low margin of safety for " + variable + " (" +
                                           format_percent(critical->margin_of_safety) + "%)",
                                       "Monitor " + variable + " closely and develop contingency plans"});
        }
    }

    if (risk.average_elasticity > 1.5) {
        recommendations.push_back({"Volatility", "Medium",
                                   "High overall sensitivity to input changes",
                                   "Consider more stable investment alternatives or risk reduction strategies"});
    }

    if (!result.tornado.empty()) {
        const std::string& top = result.tornado.front().variable_name;
        recommendations.push_back({"Focus Area", "High",
                                   top + " has the highest impact on returns",
                                   "Prioritize managing " + top + " risk through contracts or hedging"});
    }

    std::string stable;
    for (const auto& var : result.variables) {
        if (var.elasticity && *var.elasticity < 0.5) {
            stable += (stable.empty() ? "" : ", ") + var.variable_name;
        }
    }
    if (!stable.empty()) {
        recommendations.push_back({"Strength", "Low",
                                   "Low sensitivity to " + stable,
                                   "These factors provide stability to the investment"});
    }

    return recommendations;
}

// ============================================================================
// Analysis entry point
// ============================================================================

SensitivityResult analyze_sensitivity(const BaseScenario& base,
                                      const std::vector<SensitivityVariable>& variables,
                                      const FinancialEvaluator& evaluator,
                                      const SensitivityOptions& options) {
    auto start_time = std::chrono::high_resolution_clock::now();

    validate_variables(base, variables);

    SensitivityResult result;
    result.target_metric = options.target_metric;
    result.base_scenario = base;
    result.evaluations = 1;

    // Base case failures are fatal
    result.base_metrics = evaluator.evaluate(base);

    auto target = result.base_metrics.find(options.target_metric);
    if (target == result.base_metrics.end()) {
        throw ValidationError("Target metric '" + options.target_metric +
                              "' is not produced by the base case");
    }
    if (!options.break_even_metric.empty() &&
        result.base_metrics.find(options.break_even_metric) == result.base_metrics.end()) {
        throw ValidationError("Break-even metric '" + options.break_even_metric +
                              "' is not produced by the base case");
    }
    const double base_metric = target->second;
    result.analysis_metrics = resolve_analysis_metrics(options, result.base_metrics);

    MetricCounter metric_at(evaluator, result.evaluations);

    for (const auto& var : variables) {
        VariableSensitivity analysis = analyze_variable(base, var, result.base_metrics, options.target_metric,
                                                        result.analysis_metrics, metric_at);

        TornadoEntry entry;
        entry.variable_name = analysis.variable_name;
        entry.low_variation = analysis.low_variation;
        entry.high_variation = analysis.high_variation;
        entry.metric_at_low = analysis.metric_at_low;
        entry.metric_at_base = analysis.metric_at_base;
        entry.metric_at_high = analysis.metric_at_high;
        entry.swing = analysis.swing;
        result.tornado.push_back(entry);

        result.variables.push_back(std::move(analysis));
    }
    rank_tornado(result.tornado);

    if (options.two_way && variables.size() >= 2) {
        const SensitivityVariable& first = variables[0];
        const SensitivityVariable& second = variables[1];

        TwoWayAnalysis table;
        table.variable1 = first.variable_name;
        table.variable2 = second.variable_name;
        table.metric = options.target_metric;
        table.variations1 = first.variations;
        table.variations2 = second.variations;
        for (double v1 : first.variations) {
            std::vector<std::optional<double>> row;
            Scenario row_scenario = perturbed(base, first, v1);
            for (double v2 : second.variations) {
                row.push_back(metric_at(perturbed(row_scenario, second, v2), options.target_metric));
            }
            table.values.push_back(std::move(row));
        }
        result.two_way = std::move(table);
    }

    if (!options.break_even_metric.empty()) {
        for (const auto& var : variables) {
            auto critical = find_break_even(base, var, options.break_even_metric,
                                            options.break_even_low, options.break_even_high, metric_at);
            if (critical) {
                result.critical_values.push_back(*critical);
            }
        }
    }

    result.risk_assessment = assess_risk(result.variables, base_metric);
    result.recommendations = generate_sensitivity_recommendations(result);

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    RunContext ctx("", "sensitivity");
    ctx.evaluator = evaluator.name();
    Logger::get_instance().log_sensitivity_complete(ctx, variables.size(), result.evaluations,
                                                    result.execution_time_ms);
    return result;
}

} // namespace reisim
