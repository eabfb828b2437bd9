#ifndef REISIM_RISK_METRICS_HPP
#define REISIM_RISK_METRICS_HPP

#include "evaluator.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace reisim {

// Value at Risk and Conditional Value at Risk at one confidence level
struct TailRisk {
    double level;   // 0-100
    double var;     // Percentile `level` of the metric
    double cvar;    // Mean of values <= var
};

// Downside risk for one metric across the included trials.
// Everything is empty when the metric has no values.
struct MetricRisk {
    size_t count;
    std::vector<TailRisk> tail;
    std::optional<double> probability_of_loss;   // Fraction of values < 0
    std::optional<double> downside_deviation;    // RMS of negative values, 0 if none
    std::optional<double> max_drawdown;          // Worst (minimum) value

    MetricRisk();
};

struct SharpeRatio {
    std::optional<double> value;
    bool undefined;     // std_dev == 0 or no values
};

struct ConfidenceInterval {
    double level;   // e.g. 90 -> [P5, P95]
    double lower;
    double upper;
    double width;
};

// Thresholds for the probability analysis
struct TargetMetrics {
    double minimum_irr;         // percent
    double minimum_cash_flow;   // monthly
    double maximum_loss;        // total_profit must exceed this

    TargetMetrics();
};

// Event probabilities as fractions in [0, 1]. An event is measured over the
// trials that produced every metric it needs; it is empty when there are none.
struct ProbabilityAnalysis {
    std::optional<double> irr_above_target;      // irr >= minimum_irr
    std::optional<double> positive_cash_flow;    // monthly_cash_flow >= minimum_cash_flow
    std::optional<double> profitable_exit;       // total_profit > maximum_loss
    std::optional<double> double_money;          // equity_multiple >= 2
    std::optional<double> loss_probability;      // total_return < 0
    std::optional<double> meet_all_targets;      // first three together
};

// Throws std::invalid_argument for an empty series or a level outside [0, 100]
double value_at_risk(const std::vector<double>& sorted_values, double level);
double conditional_value_at_risk(const std::vector<double>& sorted_values, double level);

MetricRisk calculate_metric_risk(const std::vector<double>& values,
                                 const std::vector<double>& confidence_levels);

// (mean - risk_free_rate) / std_dev. Undefined rather than infinite when the
// series has no spread.
SharpeRatio calculate_sharpe_ratio(const std::vector<double>& values, double risk_free_rate);

std::vector<ConfidenceInterval> calculate_confidence_intervals(const std::vector<double>& values,
                                                               const std::vector<double>& levels);

ProbabilityAnalysis analyze_probabilities(const std::vector<FinancialMetrics>& trial_metrics,
                                          const TargetMetrics& targets);

} // namespace reisim

#endif // REISIM_RISK_METRICS_HPP
