#ifndef REISIM_SENSITIVITY_HPP
#define REISIM_SENSITIVITY_HPP

#include "evaluator.hpp"
#include "recommendations.hpp"
#include "scenario.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace reisim {

// How a variation is applied to a base value
enum class PerturbationMode {
    Relative,   // value * (1 + v / 100)
    Absolute    // value + v
};

std::string mode_to_string(PerturbationMode mode);

// Accepts "relative" or "absolute". Throws ValidationError otherwise.
PerturbationMode parse_perturbation_mode(const std::string& name);

double perturb(double base_value, double variation, PerturbationMode mode);

// -20, -10, 0, 10, 20
std::vector<double> default_variations();

// -max_percent .. +max_percent in step_percent increments, always including 0.
// Throws ValidationError for a non-positive step or negative maximum.
std::vector<double> symmetric_range(double max_percent, double step_percent);

// One input to perturb in a one-at-a-time analysis
struct SensitivityVariable {
    std::string variable_name;
    std::vector<double> variations;
    PerturbationMode mode;

    SensitivityVariable();
    SensitivityVariable(std::string name,
                        std::vector<double> variation_list,
                        PerturbationMode perturbation_mode = PerturbationMode::Relative);
};

struct SensitivityOptions {
    std::string target_metric;          // Metric ranked in the tornado
    std::vector<std::string> analysis_metrics;  // Also reported per step; target first
    std::string break_even_metric;      // Metric searched for a zero crossing
    bool two_way;                       // Two-way table over the first two variables
    double break_even_low;              // Search bracket, in variation units
    double break_even_high;

    SensitivityOptions();
};

// Target metric at one variation of one variable
struct SensitivityStep {
    double variation;
    double value;                       // Perturbed input value
    std::optional<double> metric;       // Empty when the evaluator failed
    std::optional<double> change;       // metric - base metric
    std::map<std::string, double> metrics;  // Analysis metrics at this step
    std::map<std::string, double> impact;   // Versus base, see metric_impact
};

struct VariableSensitivity {
    std::string variable_name;
    PerturbationMode mode;
    double base_value;
    std::vector<SensitivityStep> steps;     // Request order
    double low_variation;
    double high_variation;
    std::optional<double> metric_at_low;
    std::optional<double> metric_at_base;
    std::optional<double> metric_at_high;
    std::optional<double> swing;            // |high - low|
    std::optional<double> min_value;
    std::optional<double> max_value;
    std::optional<double> elasticity;       // Mean |output % / input %| over consecutive steps
};

struct TornadoEntry {
    std::string variable_name;
    double low_variation;
    double high_variation;
    std::optional<double> metric_at_low;
    std::optional<double> metric_at_base;
    std::optional<double> metric_at_high;
    std::optional<double> swing;
};

struct TwoWayAnalysis {
    std::string variable1;
    std::string variable2;
    std::string metric;
    std::vector<double> variations1;                        // Rows
    std::vector<double> variations2;                        // Columns
    std::vector<std::vector<std::optional<double>>> values;
};

// Where break_even_metric crosses zero for one variable
struct CriticalValue {
    std::string variable_name;
    double base_value;
    double break_even_value;
    double break_even_change_percent;
    double margin_of_safety;            // 100 - |change|
};

struct HighSensitivityVariable {
    std::string variable_name;
    double elasticity;
};

struct RiskFactor {
    std::string factor;
    std::string description;
    std::string mitigation;
};

struct SensitivityRiskAssessment {
    std::string overall_risk_level;             // Low / Medium / High
    double average_elasticity;
    double max_downside_risk;                   // Worst % drop of the target metric
    std::vector<HighSensitivityVariable> high_sensitivity_variables;   // Elasticity > 1
    std::vector<std::string> critical_variables;                       // Elasticity > 1.5 or downside > 30%
    std::vector<RiskFactor> risk_factors;
};

struct SensitivityResult {
    std::string target_metric;
    Scenario base_scenario;
    FinancialMetrics base_metrics;
    std::vector<VariableSensitivity> variables;
    std::vector<TornadoEntry> tornado;
    std::optional<TwoWayAnalysis> two_way;
    std::vector<CriticalValue> critical_values;
    SensitivityRiskAssessment risk_assessment;
    std::vector<std::string> analysis_metrics;
    std::vector<Recommendation> recommendations;
    size_t evaluations;
    double execution_time_ms;
};

// Change of one metric versus the base case. Currency metrics (cash flows,
// NOI, NPV, profit, exit value) change in absolute terms; rates and ratios
// change in percent of |base|, 0 when the base is 0.
double metric_impact(const std::string& metric, double base_value, double value);

// Risk factors for critical variables with a known business meaning
// (loan_interest_rate, rental_income, purchase_price, vacancy_rate).
std::vector<RiskFactor> identify_risk_factors(const std::vector<std::string>& critical_variables);

// Rules over a finished analysis: High overall risk; a critical variable whose
// margin of safety is below 20%; average elasticity above 1.5; the top tornado
// variable; variables with elasticity below 0.5.
std::vector<Recommendation> generate_sensitivity_recommendations(const SensitivityResult& result);

// Order by swing descending; ties and undefined swings by variable name, so the
// request order of the variables never changes the ranking.
void rank_tornado(std::vector<TornadoEntry>& entries);

// One-at-a-time sensitivity of options.target_metric to each variable.
// Throws ValidationError for an empty variable list, a variable absent from
// `base`, a duplicate variable, empty or non-finite variations, or a target
// metric (or analysis metric) the base case does not produce. A base-case EvaluationError
// propagates; a failure at any other step records an empty metric.
SensitivityResult analyze_sensitivity(const BaseScenario& base,
                                      const std::vector<SensitivityVariable>& variables,
                                      const FinancialEvaluator& evaluator,
                                      const SensitivityOptions& options = SensitivityOptions());

} // namespace reisim

#endif // REISIM_SENSITIVITY_HPP
