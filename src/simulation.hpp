#ifndef REISIM_SIMULATION_HPP
#define REISIM_SIMULATION_HPP

#include "correlation.hpp"
#include "evaluator.hpp"
#include "recommendations.hpp"
#include "risk_metrics.hpp"
#include "scenario.hpp"
#include "statistics.hpp"
#include <atomic>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace reisim {

// Settings for one Monte Carlo run
struct SimulationSettings {
    size_t num_simulations;
    std::optional<uint64_t> random_seed;            // Drawn from entropy when absent
    std::vector<double> confidence_levels;          // VaR / CVaR levels, 0-100
    std::vector<double> confidence_interval_levels; // Central interval widths, 0-100
    size_t histogram_bins;
    double risk_free_rate;
    std::string sharpe_metric;
    std::string ranking_metric;                     // Key scenarios and correlation ranking
    double max_failure_fraction;                    // Above this the run is degraded
    int num_threads;                                // 0 = runtime default

    SimulationSettings();
};

struct SimulationRequest {
    BaseScenario base_scenario;
    VariableDistributions variable_distributions;
    SimulationSettings settings;
    TargetMetrics targets;
};

// One sampled scenario and what the evaluator made of it
struct Trial {
    size_t index;
    Scenario scenario;
    std::map<std::string, double> sampled_inputs;
    FinancialMetrics metrics;                   // Finite values only
    std::vector<std::string> excluded_metrics;  // Missing or non-finite for this trial
    bool evaluation_failed;
    std::string failure_reason;

    Trial();

    bool fully_included() const { return !evaluation_failed && excluded_metrics.empty(); }
};

struct MetricResult {
    DistributionSummary distribution;
    MetricRisk risk;
    std::vector<ConfidenceInterval> confidence_intervals;
    size_t excluded;                            // Trials with no value for this metric
};

struct KeyScenario {
    std::string label;
    size_t trial_index;
    std::map<std::string, double> inputs;
    FinancialMetrics outputs;
};

struct SimulationResult {
    size_t num_simulations;
    uint64_t random_seed;
    std::string seed_source;                    // "request" or "entropy"
    std::string evaluator;
    int threads_used;

    std::vector<std::string> sampled_variables;
    std::vector<std::string> metric_names;
    std::map<std::string, MetricResult> metrics;
    std::map<std::string, DistributionSummary> input_distributions;

    std::string sharpe_metric;
    SharpeRatio sharpe;
    ProbabilityAnalysis probabilities;
    CorrelationReport correlations;
    std::vector<KeyScenario> key_scenarios;
    std::vector<Recommendation> recommendations;

    size_t excluded_trials;                     // Trials missing at least one metric
    size_t failed_trials;                       // Trials the evaluator rejected outright
    bool degraded;
    std::vector<std::string> warnings;
    double execution_time_ms;

    std::vector<Trial> trials;                  // Only when RunOptions::store_trials

    SimulationResult();
};

// Caller-side controls that are not part of the request
struct RunOptions {
    const std::atomic<bool>* cancel_flag;       // Checked between trials; may be null
    bool store_trials;

    RunOptions();
};

// Throws ValidationError describing the first problem found
void validate_request(const SimulationRequest& request);

// Threads actually used for `requested` (0 = runtime default, 1 without OpenMP)
int resolve_thread_count(int requested);

// Run the Monte Carlo simulation.
//
// Trial i draws from Rng(derive_seed(seed, i)), so the trial set is identical
// for any thread count. Evaluator failures exclude the trial (or the one
// metric) and are counted; nothing is aggregated until every trial finished.
//
// Throws ValidationError, RngInitError, or SimulationCancelled when the cancel
// flag is raised. A cancelled run returns nothing.
SimulationResult run_simulation(const SimulationRequest& request,
                                const FinancialEvaluator& evaluator,
                                const RunOptions& options = RunOptions());

} // namespace reisim

#endif // REISIM_SIMULATION_HPP
