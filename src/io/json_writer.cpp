#include "json_writer.hpp"
#include <cmath>
#include <fstream>
#include <sstream>
#include <stdexcept>

using ordered_json = nlohmann::ordered_json;

namespace reisim {
namespace io {

namespace {

ordered_json opt(const std::optional<double>& value) {
    if (!value) {
        return nullptr;
    }
    return *value;
}

ordered_json values_to_json(const std::map<std::string, double>& values) {
    ordered_json j = ordered_json::object();
    for (const auto& [name, value] : values) {
        j[name] = value;
    }
    return j;
}

ordered_json summary_to_json(const SummaryStatistics& s) {
    ordered_json j;
    j["count"] = s.count;
    j["mean"] = opt(s.mean);
    j["std_dev"] = opt(s.std_dev);
    j["standard_error"] = opt(s.standard_error);
    j["min"] = opt(s.min);
    j["max"] = opt(s.max);
    j["median"] = opt(s.median);
    j["skewness"] = opt(s.skewness);
    j["kurtosis"] = opt(s.kurtosis);
    return j;
}

// Percentiles sit directly under the variable: distributions.<name>.p50
ordered_json distribution_to_json(const DistributionSummary& d, const std::string& source) {
    ordered_json j;
    j["source"] = source;
    for (const auto& p : d.percentiles) {
        j[level_key("p", p.level)] = p.value;
    }

    ordered_json histogram = ordered_json::array();
    for (const auto& bin : d.histogram) {
        histogram.push_back(ordered_json{
            {"lower", bin.lower},
            {"upper", bin.upper},
            {"count", bin.count},
            {"frequency", bin.frequency}
        });
    }
    j["histogram"] = histogram;
    return j;
}

ordered_json metric_risk_to_json(const MetricRisk& risk, size_t excluded) {
    ordered_json j;
    ordered_json var = ordered_json::object();
    ordered_json cvar = ordered_json::object();
    for (const auto& tail : risk.tail) {
        var[level_key("var_", tail.level)] = tail.var;
        cvar[level_key("cvar_", tail.level)] = tail.cvar;
    }
    j["count"] = risk.count;
    j["excluded"] = excluded;
    j["value_at_risk"] = var;
    j["cvar"] = cvar;
    j["probability_of_loss"] = opt(risk.probability_of_loss);
    j["downside_deviation"] = opt(risk.downside_deviation);
    j["max_drawdown"] = opt(risk.max_drawdown);
    return j;
}

ordered_json probabilities_to_json(const ProbabilityAnalysis& p) {
    ordered_json j;
    j["irr_above_target"] = opt(p.irr_above_target);
    j["positive_cash_flow"] = opt(p.positive_cash_flow);
    j["profitable_exit"] = opt(p.profitable_exit);
    j["double_money"] = opt(p.double_money);
    j["loss_probability"] = opt(p.loss_probability);
    j["meet_all_targets"] = opt(p.meet_all_targets);
    return j;
}

ordered_json correlations_to_json(const CorrelationReport& report) {
    ordered_json j;
    ordered_json matrix = ordered_json::object();
    for (const auto& [output, row] : report.matrix) {
        ordered_json r = ordered_json::object();
        for (const auto& [input, value] : row) {
            r[input] = opt(value);
        }
        matrix[output] = r;
    }
    j["correlation_matrix"] = matrix;

    ordered_json ranking = ordered_json::array();
    for (const auto& entry : report.ranking) {
        ranking.push_back(ordered_json{
            {"variable", entry.variable},
            {"correlation", opt(entry.correlation)},
            {"impact", entry.impact}
        });
    }
    j["ranking_metric"] = report.ranking_metric;
    j["sensitivity_ranking"] = ranking;
    j["note"] = report.note;
    return j;
}

ordered_json recommendations_to_json(const std::vector<Recommendation>& recommendations) {
    ordered_json j = ordered_json::array();
    for (const auto& rec : recommendations) {
        j.push_back(ordered_json{
            {"type", rec.type},
            {"priority", rec.priority},
            {"message", rec.message},
            {"action", rec.action}
        });
    }
    return j;
}

template <typename Stream>
void dump_to(Stream& os, const ordered_json& j, bool pretty_print) {
    os << (pretty_print ? j.dump(2) : j.dump()) << "\n";
}

} // anonymous namespace

std::string level_key(const std::string& prefix, double level) {
    std::ostringstream oss;
    oss << prefix;
    if (std::floor(level) == level) {
        oss << static_cast<long long>(level);
    } else {
        oss << level;
    }
    return oss.str();
}

// ============================================================================
// Monte Carlo result
// ============================================================================

ordered_json simulation_result_to_json(const SimulationResult& result) {
    ordered_json j;

    ordered_json summary = ordered_json::object();
    for (const auto& [name, metric] : result.metrics) {
        summary[name] = summary_to_json(metric.distribution.summary);
    }
    j["summary_statistics"] = summary;

    // Output metrics first, then sampled inputs. An input named like an output
    // metric is keyed "<name>_input".
    ordered_json distributions = ordered_json::object();
    for (const auto& [name, metric] : result.metrics) {
        distributions[name] = distribution_to_json(metric.distribution, "output");
    }
    for (const auto& [name, dist] : result.input_distributions) {
        ordered_json entry = distribution_to_json(dist, "input");
        entry["summary"] = summary_to_json(dist.summary);
        distributions[distributions.contains(name) ? name + "_input" : name] = entry;
    }
    j["distributions"] = distributions;

    ordered_json risk = ordered_json::object();
    for (const auto& [name, metric] : result.metrics) {
        risk[name] = metric_risk_to_json(metric.risk, metric.excluded);
    }
    risk["sharpe_metric"] = result.sharpe_metric;
    risk["sharpe_ratio"] = opt(result.sharpe.value);
    risk["undefined_sharpe"] = result.sharpe.undefined;
    j["risk_metrics"] = risk;

    j["probability_analysis"] = probabilities_to_json(result.probabilities);
    j["correlations"] = correlations_to_json(result.correlations);

    ordered_json scenarios = ordered_json::object();
    for (const auto& key : result.key_scenarios) {
        scenarios[key.label] = {
            {"trial_index", key.trial_index},
            {"inputs", values_to_json(key.inputs)},
            {"outputs", values_to_json(key.outputs)}
        };
    }
    j["scenario_analysis"] = scenarios;

    ordered_json intervals = ordered_json::object();
    for (const auto& [name, metric] : result.metrics) {
        ordered_json per_metric = ordered_json::object();
        for (const auto& ci : metric.confidence_intervals) {
            per_metric[level_key("ci_", ci.level)] = {
                {"lower", ci.lower},
                {"upper", ci.upper},
                {"width", ci.width}
            };
        }
        intervals[name] = per_metric;
    }
    j["confidence_intervals"] = intervals;

    j["recommendations"] = recommendations_to_json(result.recommendations);

    ordered_json excluded_by_metric = ordered_json::object();
    for (const auto& [name, metric] : result.metrics) {
        excluded_by_metric[name] = metric.excluded;
    }

    ordered_json metadata;
    metadata["num_simulations"] = result.num_simulations;
    metadata["random_seed"] = result.random_seed;
    metadata["seed_source"] = result.seed_source;
    metadata["evaluator"] = result.evaluator;
    metadata["threads_used"] = result.threads_used;
    metadata["sampled_variables"] = result.sampled_variables;
    metadata["excluded_trials"] = result.excluded_trials;
    metadata["failed_trials"] = result.failed_trials;
    metadata["excluded_by_metric"] = excluded_by_metric;
    metadata["degraded"] = result.degraded;
    metadata["warnings"] = result.warnings;
    metadata["execution_time_ms"] = result.execution_time_ms;
    j["simulation_metadata"] = metadata;

    return j;
}

// ============================================================================
// Sensitivity result
// ============================================================================

ordered_json sensitivity_result_to_json(const SensitivityResult& result) {
    ordered_json j;

    j["base_case"] = {
        {"scenario", values_to_json(result.base_scenario.values())},
        {"metrics", values_to_json(result.base_metrics)},
        {"target_metric", result.target_metric},
        {"analysis_metrics", result.analysis_metrics}
    };

    ordered_json tornado = ordered_json::array();
    for (const auto& entry : result.tornado) {
        tornado.push_back(ordered_json{
            {"variable", entry.variable_name},
            {"low_variation", entry.low_variation},
            {"high_variation", entry.high_variation},
            {"metric_at_low", opt(entry.metric_at_low)},
            {"metric_at_base", opt(entry.metric_at_base)},
            {"metric_at_high", opt(entry.metric_at_high)},
            {"swing", opt(entry.swing)}
        });
    }
    j["tornado"] = {{"metric", result.target_metric}, {"variables", tornado}};

    ordered_json variables = ordered_json::array();
    for (const auto& var : result.variables) {
        ordered_json steps = ordered_json::array();
        for (const auto& step : var.steps) {
            steps.push_back(ordered_json{
                {"variation", step.variation},
                {"value", step.value},
                {"metric", opt(step.metric)},
                {"change", opt(step.change)},
                {"metrics", values_to_json(step.metrics)},
                {"impact", values_to_json(step.impact)}
            });
        }
        ordered_json entry;
        entry["variable"] = var.variable_name;
        entry["mode"] = mode_to_string(var.mode);
        entry["base_value"] = var.base_value;
        entry["steps"] = steps;
        entry["metric_at_low"] = opt(var.metric_at_low);
        entry["metric_at_base"] = opt(var.metric_at_base);
        entry["metric_at_high"] = opt(var.metric_at_high);
        entry["swing"] = opt(var.swing);
        entry["min_value"] = opt(var.min_value);
        entry["max_value"] = opt(var.max_value);
        entry["elasticity"] = opt(var.elasticity);
        variables.push_back(entry);
    }
    j["variables"] = variables;

    if (result.two_way) {
        const TwoWayAnalysis& table = *result.two_way;
        ordered_json rows = ordered_json::array();
        for (const auto& row : table.values) {
            ordered_json cells = ordered_json::array();
            for (const auto& cell : row) {
                cells.push_back(opt(cell));
            }
            rows.push_back(cells);
        }
        j["two_way_analysis"] = {
            {"variable1", table.variable1},
            {"variable2", table.variable2},
            {"metric", table.metric},
            {"variable1_changes", table.variations1},
            {"variable2_changes", table.variations2},
            {"data", rows}
        };
    } else {
        j["two_way_analysis"] = nullptr;
    }

    ordered_json critical = ordered_json::array();
    for (const auto& cv : result.critical_values) {
        critical.push_back(ordered_json{
            {"variable", cv.variable_name},
            {"base_value", cv.base_value},
            {"break_even_value", cv.break_even_value},
            {"break_even_change_percent", cv.break_even_change_percent},
            {"margin_of_safety", cv.margin_of_safety}
        });
    }
    j["critical_values"] = critical;

    const SensitivityRiskAssessment& risk = result.risk_assessment;
    ordered_json high_sensitivity = ordered_json::array();
    for (const auto& var : risk.high_sensitivity_variables) {
        high_sensitivity.push_back(ordered_json{
            {"variable", var.variable_name},
            {"elasticity", var.elasticity}
        });
    }
    ordered_json risk_factors = ordered_json::array();
    for (const auto& factor : risk.risk_factors) {
        risk_factors.push_back(ordered_json{
            {"factor", factor.factor},
            {"description", factor.description},
            {"mitigation", factor.mitigation}
        });
    }
    j["risk_assessment"] = {
        {"overall_risk_level", risk.overall_risk_level},
        {"average_elasticity", risk.average_elasticity},
        {"max_downside_risk", risk.max_downside_risk},
        {"high_sensitivity_variables", high_sensitivity},
        {"critical_variables", risk.critical_variables},
        {"risk_factors", risk_factors}
    };
    j["recommendations"] = recommendations_to_json(result.recommendations);

    j["analysis_metadata"] = {
        {"evaluations", result.evaluations},
        {"execution_time_ms", result.execution_time_ms}
    };

    return j;
}

// ============================================================================
// Writers
// ============================================================================

void write_simulation_result_json(std::ostream& os, const SimulationResult& result,
                                  bool pretty_print) {
    dump_to(os, simulation_result_to_json(result), pretty_print);
}

void write_simulation_result_json(const std::string& filepath, const SimulationResult& result,
                                  bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_simulation_result_json(file, result, pretty_print);
}

void write_sensitivity_result_json(std::ostream& os, const SensitivityResult& result,
                                   bool pretty_print) {
    dump_to(os, sensitivity_result_to_json(result), pretty_print);
}

void write_sensitivity_result_json(const std::string& filepath, const SensitivityResult& result,
                                   bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_sensitivity_result_json(file, result, pretty_print);
}

} // namespace io
} // namespace reisim
