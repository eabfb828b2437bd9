#include "correlation.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <stdexcept>

namespace reisim {

namespace {

bool is_constant(const std::vector<double>& values) {
    return std::adjacent_find(values.begin(), values.end(), std::not_equal_to<>()) == values.end();
}

} // anonymous namespace

const char* const kCorrelationNote = "descriptive only; correlation does not imply causation";

// ============================================================================
// Pearson correlation
// ============================================================================

std::optional<double> pearson_correlation(const std::vector<double>& x, const std::vector<double>& y) {
    if (x.size() != y.size()) {
        throw std::invalid_argument("Correlation series must have the same length");
    }
    const size_t n = x.size();
    // A constant series has zero variance even when its mean does not round-trip
    if (n < 2 || is_constant(x) || is_constant(y)) {
        return std::nullopt;
    }

    double mean_x = 0.0;
    double mean_y = 0.0;
    for (size_t i = 0; i < n; ++i) {
        mean_x += x[i];
        mean_y += y[i];
    }
    mean_x /= static_cast<double>(n);
    mean_y /= static_cast<double>(n);

    double sxy = 0.0;
    double sxx = 0.0;
    double syy = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double dx = x[i] - mean_x;
        double dy = y[i] - mean_y;
        sxy += dx * dy;
        sxx += dx * dx;
        syy += dy * dy;
    }

    if (sxx <= 0.0 || syy <= 0.0) {
        return std::nullopt;
    }

    double r = sxy / std::sqrt(sxx * syy);
    if (!std::isfinite(r)) {
        return std::nullopt;
    }
    return std::clamp(r, -1.0, 1.0);
}

std::string impact_level(const std::optional<double>& correlation) {
    if (!correlation) {
        return "None";
    }
    double magnitude = std::abs(*correlation);
    if (magnitude > 0.7) return "High";
    if (magnitude > 0.4) return "Medium";
    return "Low";
}

// ============================================================================
// Input / output analysis
// ============================================================================

CorrelationReport analyze_correlations(const std::vector<std::map<std::string, double>>& inputs,
                                       const std::vector<FinancialMetrics>& outputs,
                                       const std::vector<std::string>& input_names,
                                       const std::vector<std::string>& output_names,
                                       const std::string& ranking_metric) {
    if (inputs.size() != outputs.size()) {
        throw std::invalid_argument("Correlation inputs and outputs must describe the same trials");
    }

    CorrelationReport report;
    report.ranking_metric = ranking_metric;
    report.note = kCorrelationNote;

    std::vector<double> xs;
    std::vector<double> ys;
    xs.reserve(inputs.size());
    ys.reserve(inputs.size());

    for (const auto& output : output_names) {
        auto& row = report.matrix[output];
        for (const auto& input : input_names) {
            xs.clear();
            ys.clear();
            for (size_t i = 0; i < inputs.size(); ++i) {
                auto in = inputs[i].find(input);
                auto out = outputs[i].find(output);
                if (in == inputs[i].end() || out == outputs[i].end()) {
                    continue;
                }
                xs.push_back(in->second);
                ys.push_back(out->second);
            }
            row[input] = pearson_correlation(xs, ys);
        }
    }

    auto ranked = report.matrix.find(ranking_metric);
    if (ranked != report.matrix.end()) {
        for (const auto& [variable, r] : ranked->second) {
            report.ranking.push_back(CorrelationRank{variable, r, impact_level(r)});
        }
        // Undefined correlations last; ties keep name order
        std::stable_sort(report.ranking.begin(), report.ranking.end(),
            [](const CorrelationRank& a, const CorrelationRank& b) {
                if (a.correlation.has_value() != b.correlation.has_value()) {
                    return a.correlation.has_value();
                }
                if (!a.correlation) {
                    return false;
                }
                return std::abs(*a.correlation) > std::abs(*b.correlation);
            });
    }

    return report;
}

} // namespace reisim
