#ifndef REISIM_CORRELATION_HPP
#define REISIM_CORRELATION_HPP

#include "evaluator.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace reisim {

// output metric -> sampled input -> Pearson r (empty when undefined)
using CorrelationMatrix = std::map<std::string, std::map<std::string, std::optional<double>>>;

// One sampled input ranked by its correlation with the ranking metric
struct CorrelationRank {
    std::string variable;
    std::optional<double> correlation;
    std::string impact;     // "High" (|r| > 0.7), "Medium" (> 0.4), "Low", "None" if undefined
};

struct CorrelationReport {
    CorrelationMatrix matrix;
    std::string ranking_metric;
    std::vector<CorrelationRank> ranking;
    std::string note;
};

extern const char* const kCorrelationNote;

// Pearson correlation with two-pass centred sums, clamped to [-1, 1].
// Empty when there are fewer than two pairs or either series has zero variance.
// Throws std::invalid_argument if the series differ in length.
std::optional<double> pearson_correlation(const std::vector<double>& x, const std::vector<double>& y);

std::string impact_level(const std::optional<double>& correlation);

// Correlate every sampled input with every output metric over the trials that
// carry both values. `inputs[i]` and `outputs[i]` describe the same trial.
CorrelationReport analyze_correlations(const std::vector<std::map<std::string, double>>& inputs,
                                       const std::vector<FinancialMetrics>& outputs,
                                       const std::vector<std::string>& input_names,
                                       const std::vector<std::string>& output_names,
                                       const std::string& ranking_metric);

} // namespace reisim

#endif // REISIM_CORRELATION_HPP
