#include "simulation.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "rng.hpp"
#include <algorithm>
#include <chrono>
#include <cmath>
#include <set>
#include <sstream>
#ifdef HAVE_OPENMP
#include <omp.h>
#endif

namespace reisim {

namespace {

constexpr size_t kMaxSimulations = 10000000;
constexpr size_t kMaxHistogramBins = 10000;

} // anonymous namespace

// ============================================================================
// Struct defaults
// ============================================================================

SimulationSettings::SimulationSettings()
    : num_simulations(10000),
      confidence_levels{5, 10, 25, 50, 75, 90, 95},
      confidence_interval_levels{50, 80, 90, 95},
      histogram_bins(20),
      risk_free_rate(0.0),
      sharpe_metric("total_return"),
      ranking_metric("irr"),
      max_failure_fraction(0.10),
      num_threads(0) {}

Trial::Trial()
    : index(0),
      evaluation_failed(false) {}

SimulationResult::SimulationResult()
    : num_simulations(0),
      random_seed(0),
      threads_used(1),
      excluded_trials(0),
      failed_trials(0),
      degraded(false),
      execution_time_ms(0.0) {}

RunOptions::RunOptions()
    : cancel_flag(nullptr),
      store_trials(false) {}

// ============================================================================
// Validation
// ============================================================================

void validate_request(const SimulationRequest& request) {
    const SimulationSettings& s = request.settings;

    if (s.num_simulations == 0) {
        throw ValidationError("num_simulations must be greater than 0");
    }
    if (s.num_simulations > kMaxSimulations) {
        throw ValidationError("num_simulations must not exceed " + std::to_string(kMaxSimulations));
    }
    for (double level : s.confidence_levels) {
        if (!std::isfinite(level) || level < 0.0 || level > 100.0) {
            throw ValidationError("confidence_levels must lie within [0, 100]");
        }
    }
    for (double level : s.confidence_interval_levels) {
        if (!std::isfinite(level) || level <= 0.0 || level >= 100.0) {
            throw ValidationError("confidence_interval_levels must lie within (0, 100)");
        }
    }
    if (s.histogram_bins == 0) {
        throw ValidationError("histogram_bins must be at least 1");
    }
    if (s.histogram_bins > kMaxHistogramBins) {
        throw ValidationError("histogram_bins must not exceed " + std::to_string(kMaxHistogramBins));
    }
    if (!std::isfinite(s.risk_free_rate)) {
        throw ValidationError("risk_free_rate must be a finite number");
    }
    if (!std::isfinite(s.max_failure_fraction) || s.max_failure_fraction < 0.0 || s.max_failure_fraction > 1.0) {
        throw ValidationError("max_failure_fraction must lie within [0, 1]");
    }
    if (s.num_threads < 0) {
        throw ValidationError("num_threads must not be negative");
    }
    if (s.sharpe_metric.empty() || s.ranking_metric.empty()) {
        throw ValidationError("sharpe_metric and ranking_metric must be non-empty");
    }
    for (const auto& [name, value] : request.base_scenario.values()) {
        if (!std::isfinite(value)) {
            throw ValidationError("Investment parameter '" + name + "' must be a finite number");
        }
    }
}

int resolve_thread_count(int requested) {
#ifdef HAVE_OPENMP
    return requested > 0 ? requested : omp_get_max_threads();
#else
    (void)requested;
    return 1;
#endif
}

// ============================================================================
// Trial execution
// ============================================================================

namespace {

Trial run_trial(size_t index,
                uint64_t run_seed,
                const SimulationRequest& request,
                const FinancialEvaluator& evaluator) {
    Trial trial;
    trial.index = index;

    Rng rng(derive_seed(run_seed, index));
    trial.scenario = generate_scenario(request.base_scenario, request.variable_distributions, rng);
    for (const auto& entry : request.variable_distributions) {
        trial.sampled_inputs[entry.first] = trial.scenario.get(entry.first);
    }

    try {
        FinancialMetrics metrics = evaluator.evaluate(trial.scenario);
        for (auto& [name, value] : metrics) {
            if (std::isfinite(value)) {
                trial.metrics.emplace(name, value);
            } else {
                trial.excluded_metrics.push_back(name);
            }
        }
    } catch (const std::exception& e) {
        // Recorded on the trial; the run continues without it
        trial.evaluation_failed = true;
        trial.failure_reason = e.what();
    }

    return trial;
}

bool cancel_requested(const RunOptions& options) {
    return options.cancel_flag != nullptr && options.cancel_flag->load(std::memory_order_relaxed);
}

std::vector<double> metric_values(const std::vector<Trial>& trials, const std::string& metric) {
    std::vector<double> values;
    values.reserve(trials.size());
    for (const auto& trial : trials) {
        auto it = trial.metrics.find(metric);
        if (it != trial.metrics.end()) {
            values.push_back(it->second);
        }
    }
    return values;
}

std::vector<KeyScenario> identify_key_scenarios(const std::vector<Trial>& trials, const std::string& metric) {
    std::vector<const Trial*> ranked;
    for (const auto& trial : trials) {
        if (trial.metrics.count(metric) > 0) {
            ranked.push_back(&trial);
        }
    }
    if (ranked.empty()) {
        return {};
    }

    // Best first; equal values keep trial order
    std::stable_sort(ranked.begin(), ranked.end(),
        [&metric](const Trial* a, const Trial* b) { return a->metrics.at(metric) > b->metrics.at(metric); });

    const size_t n = ranked.size();
    auto pick = [&](const std::string& label, size_t pos) {
        const Trial* t = ranked[std::min(pos, n - 1)];
        return KeyScenario{label, t->index, t->sampled_inputs, t->metrics};
    };

    return {
        pick("best_case", 0),
        pick("worst_case", n - 1),
        pick("median_case", n / 2),
        pick("percentile_10", static_cast<size_t>(std::floor(static_cast<double>(n) * 0.9))),
        pick("percentile_90", static_cast<size_t>(std::floor(static_cast<double>(n) * 0.1)))
    };
}

} // anonymous namespace

// ============================================================================
// Simulation Implementation
// ============================================================================

SimulationResult run_simulation(const SimulationRequest& request,
                                const FinancialEvaluator& evaluator,
                                const RunOptions& options) {
    auto start_time = std::chrono::high_resolution_clock::now();

    validate_request(request);
    const SimulationSettings& settings = request.settings;

    SimulationResult result;
    result.num_simulations = settings.num_simulations;
    result.evaluator = evaluator.name();
    result.sharpe_metric = settings.sharpe_metric;
    result.sampled_variables = sampled_variable_names(request.variable_distributions);

    if (settings.random_seed) {
        result.random_seed = *settings.random_seed;
        result.seed_source = "request";
    } else {
        result.random_seed = entropy_seed();
        result.seed_source = "entropy";
    }

    Logger& logger = Logger::get_instance();
    RunContext ctx("run-" + std::to_string(result.random_seed), "monte-carlo");
    ctx.evaluator = result.evaluator;
    logger.log_run_start(ctx, settings.num_simulations, result.random_seed, result.seed_source,
                         result.sampled_variables.size());

    if (cancel_requested(options)) {
        throw SimulationCancelled("Simulation cancelled before the first trial");
    }

    const size_t n = settings.num_simulations;
    std::vector<Trial> trials(n);
    result.threads_used = resolve_thread_count(settings.num_threads);

#ifdef HAVE_OPENMP
    const long long count = static_cast<long long>(n);
    #pragma omp parallel for schedule(dynamic, 64) num_threads(result.threads_used)
    for (long long i = 0; i < count; ++i) {
        if (cancel_requested(options)) {
            continue;
        }
        trials[static_cast<size_t>(i)] = run_trial(static_cast<size_t>(i), result.random_seed, request, evaluator);
    }
#else
    // Single-threaded fallback when OpenMP not available
    for (size_t i = 0; i < n; ++i) {
        if (cancel_requested(options)) {
            break;
        }
        trials[i] = run_trial(i, result.random_seed, request, evaluator);
    }
#endif

    if (cancel_requested(options)) {
        logger.log_warning(ctx, "Simulation cancelled; partial results discarded");
        throw SimulationCancelled("Simulation cancelled after trials started");
    }

    // Every metric any trial produced is expected from every trial
    std::set<std::string> metric_set;
    for (const auto& trial : trials) {
        for (const auto& entry : trial.metrics) {
            metric_set.insert(entry.first);
        }
        metric_set.insert(trial.excluded_metrics.begin(), trial.excluded_metrics.end());
    }
    result.metric_names.assign(metric_set.begin(), metric_set.end());

    for (auto& trial : trials) {
        if (trial.evaluation_failed) {
            result.failed_trials++;
            result.excluded_trials++;
            logger.log_trial_excluded(ctx, trial.index, trial.failure_reason);
            continue;
        }
        for (const auto& name : result.metric_names) {
            if (trial.metrics.count(name) == 0 &&
                std::find(trial.excluded_metrics.begin(), trial.excluded_metrics.end(), name) ==
                    trial.excluded_metrics.end()) {
                trial.excluded_metrics.push_back(name);
            }
        }
        if (!trial.excluded_metrics.empty()) {
            std::sort(trial.excluded_metrics.begin(), trial.excluded_metrics.end());
            result.excluded_trials++;
            std::ostringstream reason;
            reason << "metrics missing or non-finite:";
            for (const auto& name : trial.excluded_metrics) {
                reason << " " << name;
            }
            logger.log_trial_excluded(ctx, trial.index, reason.str());
        }
    }

    // Aggregation starts only after every trial has completed
    for (const auto& name : result.metric_names) {
        std::vector<double> values = metric_values(trials, name);
        MetricResult metric;
        metric.excluded = n - values.size();
        metric.distribution = describe_distribution(values, settings.histogram_bins);
        metric.risk = calculate_metric_risk(values, settings.confidence_levels);
        metric.confidence_intervals = calculate_confidence_intervals(values, settings.confidence_interval_levels);
        result.metrics.emplace(name, std::move(metric));
    }

    std::vector<std::map<std::string, double>> inputs;
    std::vector<FinancialMetrics> outputs;
    inputs.reserve(n);
    outputs.reserve(n);
    for (const auto& trial : trials) {
        if (!trial.evaluation_failed) {
            inputs.push_back(trial.sampled_inputs);
            outputs.push_back(trial.metrics);
        }
    }

    for (const auto& variable : result.sampled_variables) {
        std::vector<double> values;
        values.reserve(n);
        for (const auto& trial : trials) {
            values.push_back(trial.sampled_inputs.at(variable));
        }
        result.input_distributions.emplace(variable, describe_distribution(values, settings.histogram_bins));
    }

    if (metric_set.count(settings.sharpe_metric) == 0) {
        result.warnings.push_back("Sharpe metric '" + settings.sharpe_metric + "' was not produced by any trial");
    }
    result.sharpe = calculate_sharpe_ratio(metric_values(trials, settings.sharpe_metric), settings.risk_free_rate);

    if (metric_set.count(settings.ranking_metric) == 0) {
        result.warnings.push_back("Ranking metric '" + settings.ranking_metric + "' was not produced by any trial");
    }
    result.probabilities = analyze_probabilities(outputs, request.targets);
    result.correlations = analyze_correlations(inputs, outputs, result.sampled_variables,
                                               result.metric_names, settings.ranking_metric);
    result.key_scenarios = identify_key_scenarios(trials, settings.ranking_metric);

    const double excluded_fraction = static_cast<double>(result.excluded_trials) / static_cast<double>(n);
    if (excluded_fraction > settings.max_failure_fraction) {
        result.degraded = true;
        std::ostringstream warning;
        warning << "DegradedRunWarning: " << result.excluded_trials << " of " << n
                << " trials excluded (threshold " << settings.max_failure_fraction << ")";
        result.warnings.push_back(warning.str());
        logger.log_degraded_run(ctx, result.excluded_trials, n, settings.max_failure_fraction);
    }

    RecommendationInputs rec;
    auto irr = result.metrics.find("irr");
    if (irr != result.metrics.end()) {
        rec.irr_summary = irr->second.distribution.summary;
        rec.irr_probability_of_loss = irr->second.risk.probability_of_loss;
        std::vector<double> sorted = metric_values(trials, "irr");
        if (!sorted.empty()) {
            std::sort(sorted.begin(), sorted.end());
            rec.irr_var_10 = value_at_risk(sorted, 10.0);
        }
    }
    rec.probabilities = result.probabilities;
    rec.degraded = result.degraded;
    rec.excluded_trials = result.excluded_trials;
    rec.num_simulations = n;
    result.recommendations = generate_recommendations(rec);

    if (options.store_trials) {
        result.trials = std::move(trials);
    }

    auto end_time = std::chrono::high_resolution_clock::now();
    result.execution_time_ms = std::chrono::duration<double, std::milli>(end_time - start_time).count();

    logger.log_run_complete(ctx, n - result.excluded_trials, result.excluded_trials, result.execution_time_ms);
    return result;
}

} // namespace reisim
