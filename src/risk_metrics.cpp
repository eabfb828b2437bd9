#include "risk_metrics.hpp"
#include "statistics.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <initializer_list>
#include <stdexcept>

namespace reisim {

// ============================================================================
// Struct defaults
// ============================================================================

MetricRisk::MetricRisk()
    : count(0) {}

TargetMetrics::TargetMetrics()
    : minimum_irr(10.0),
      minimum_cash_flow(0.0),
      maximum_loss(0.0) {}

// ============================================================================
// VaR / CVaR
// ============================================================================

double value_at_risk(const std::vector<double>& sorted_values, double level) {
    return calculate_percentile(sorted_values, level);
}

double conditional_value_at_risk(const std::vector<double>& sorted_values, double level) {
    const double var = value_at_risk(sorted_values, level);
    double sum = 0.0;
    size_t n = 0;
    for (double v : sorted_values) {
        if (v > var) {
            break;
        }
        sum += v;
        ++n;
    }
    return n > 0 ? sum / static_cast<double>(n) : var;
}

MetricRisk calculate_metric_risk(const std::vector<double>& values,
                                 const std::vector<double>& confidence_levels) {
    MetricRisk risk;
    risk.count = values.size();
    if (values.empty()) {
        return risk;
    }

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    for (double level : confidence_levels) {
        risk.tail.push_back(TailRisk{
            level,
            value_at_risk(sorted, level),
            conditional_value_at_risk(sorted, level)
        });
    }

    size_t losses = 0;
    double downside_sq = 0.0;
    for (double v : values) {
        if (v < 0.0) {
            ++losses;
            downside_sq += v * v;
        }
    }

    risk.probability_of_loss = static_cast<double>(losses) / static_cast<double>(values.size());
    risk.downside_deviation = losses > 0 ? std::sqrt(downside_sq / static_cast<double>(losses)) : 0.0;
    risk.max_drawdown = sorted.front();
    return risk;
}

// ============================================================================
// Sharpe ratio and confidence intervals
// ============================================================================

SharpeRatio calculate_sharpe_ratio(const std::vector<double>& values, double risk_free_rate) {
    SharpeRatio sharpe{std::nullopt, true};
    if (values.empty()) {
        return sharpe;
    }

    RunningStats stats;
    for (double v : values) {
        stats.push(v);
    }
    double sd = stats.std_dev();
    if (sd > 0.0) {
        sharpe.value = (stats.mean() - risk_free_rate) / sd;
        sharpe.undefined = false;
    }
    return sharpe;
}

std::vector<ConfidenceInterval> calculate_confidence_intervals(const std::vector<double>& values,
                                                               const std::vector<double>& levels) {
    std::vector<ConfidenceInterval> intervals;
    if (values.empty()) {
        return intervals;
    }

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    for (double level : levels) {
        double lower = calculate_percentile(sorted, (100.0 - level) / 2.0);
        double upper = calculate_percentile(sorted, (100.0 + level) / 2.0);
        intervals.push_back(ConfidenceInterval{level, lower, upper, upper - lower});
    }
    return intervals;
}

// ============================================================================
// Probability analysis
// ============================================================================

namespace {

using MetricPredicate = std::function<bool(const FinancialMetrics&)>;

bool has_all(const FinancialMetrics& metrics, std::initializer_list<const char*> names) {
    for (const char* name : names) {
        if (metrics.find(name) == metrics.end()) {
            return false;
        }
    }
    return true;
}

std::optional<double> event_probability(const std::vector<FinancialMetrics>& trials,
                                        std::initializer_list<const char*> required,
                                        const MetricPredicate& event) {
    size_t eligible = 0;
    size_t hits = 0;
    for (const auto& metrics : trials) {
        if (!has_all(metrics, required)) {
            continue;
        }
        ++eligible;
        if (event(metrics)) {
            ++hits;
        }
    }
    if (eligible == 0) {
        return std::nullopt;
    }
    return static_cast<double>(hits) / static_cast<double>(eligible);
}

} // anonymous namespace

ProbabilityAnalysis analyze_probabilities(const std::vector<FinancialMetrics>& trial_metrics,
                                          const TargetMetrics& targets) {
    ProbabilityAnalysis result;

    result.irr_above_target = event_probability(trial_metrics, {"irr"},
        [&targets](const FinancialMetrics& m) { return m.at("irr") >= targets.minimum_irr; });

    result.positive_cash_flow = event_probability(trial_metrics, {"monthly_cash_flow"},
        [&targets](const FinancialMetrics& m) {
            return m.at("monthly_cash_flow") >= targets.minimum_cash_flow;
        });

    result.profitable_exit = event_probability(trial_metrics, {"total_profit"},
        [&targets](const FinancialMetrics& m) { return m.at("total_profit") > targets.maximum_loss; });

    result.double_money = event_probability(trial_metrics, {"equity_multiple"},
        [](const FinancialMetrics& m) { return m.at("equity_multiple") >= 2.0; });

    result.loss_probability = event_probability(trial_metrics, {"total_return"},
        [](const FinancialMetrics& m) { return m.at("total_return") < 0.0; });

    result.meet_all_targets = event_probability(trial_metrics,
        {"irr", "monthly_cash_flow", "total_profit"},
        [&targets](const FinancialMetrics& m) {
            return m.at("irr") >= targets.minimum_irr &&
                   m.at("monthly_cash_flow") >= targets.minimum_cash_flow &&
                   m.at("total_profit") > targets.maximum_loss;
        });

    return result;
}

} // namespace reisim
