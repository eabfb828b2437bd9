#include "statistics.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace reisim {

// ============================================================================
// RunningStats Implementation
// ============================================================================

RunningStats::RunningStats()
    : n_(0),
      mean_(0.0),
      m2_(0.0),
      min_(std::numeric_limits<double>::infinity()),
      max_(-std::numeric_limits<double>::infinity()) {}

void RunningStats::push(double x) {
    ++n_;
    if (x < min_) min_ = x;
    if (x > max_) max_ = x;

    const double delta = x - mean_;
    mean_ += delta / static_cast<double>(n_);
    const double delta2 = x - mean_;
    m2_ += delta * delta2;
}

double RunningStats::variance() const {
    if (n_ == 0) {
        return 0.0;
    }
    double v = m2_ / static_cast<double>(n_);
    return v < 0.0 ? 0.0 : v;
}

double RunningStats::std_dev() const {
    return std::sqrt(variance());
}

// ============================================================================
// SummaryStatistics Implementation
// ============================================================================

SummaryStatistics::SummaryStatistics()
    : count(0) {}

// ============================================================================
// Percentiles
// ============================================================================

const std::vector<double>& standard_percentile_levels() {
    static const std::vector<double> levels = {1, 5, 10, 25, 50, 75, 90, 95, 99};
    return levels;
}

double calculate_percentile(const std::vector<double>& sorted_values, double p) {
    if (sorted_values.empty()) {
        throw std::invalid_argument("Cannot take a percentile of an empty series");
    }
    if (!(p >= 0.0 && p <= 100.0)) {
        throw std::invalid_argument("Percentile must be within [0, 100]");
    }
    if (sorted_values.size() == 1) {
        return sorted_values[0];
    }

    double n = static_cast<double>(sorted_values.size());
    double pos = (p / 100.0) * (n - 1);

    size_t lower_idx = static_cast<size_t>(std::floor(pos));
    size_t upper_idx = static_cast<size_t>(std::ceil(pos));

    if (lower_idx == upper_idx || upper_idx >= sorted_values.size() ||
        sorted_values[lower_idx] == sorted_values[upper_idx]) {
        return sorted_values[lower_idx];
    }

    double frac = pos - static_cast<double>(lower_idx);
    return sorted_values[lower_idx] * (1.0 - frac) + sorted_values[upper_idx] * frac;
}

// ============================================================================
// Summary
// ============================================================================

SummaryStatistics summarize(const std::vector<double>& values) {
    SummaryStatistics stats;
    stats.count = values.size();
    if (values.empty()) {
        return stats;
    }

    RunningStats running;
    for (double v : values) {
        running.push(v);
    }

    const double mean = running.mean();
    const double sd = running.std_dev();
    const double n = static_cast<double>(values.size());

    stats.mean = mean;
    stats.std_dev = sd;
    stats.standard_error = sd / std::sqrt(n);
    stats.min = running.min();
    stats.max = running.max();

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());
    stats.median = calculate_percentile(sorted, 50.0);

    if (sd > 0.0) {
        double m3 = 0.0;
        double m4 = 0.0;
        for (double v : values) {
            double z = (v - mean) / sd;
            double z2 = z * z;
            m3 += z2 * z;
            m4 += z2 * z2;
        }
        stats.skewness = m3 / n;
        stats.kurtosis = m4 / n - 3.0;
    }

    return stats;
}

// ============================================================================
// Histogram
// ============================================================================

std::vector<HistogramBin> build_histogram(const std::vector<double>& values, size_t num_bins) {
    if (num_bins == 0) {
        throw std::invalid_argument("Histogram needs at least one bin");
    }

    std::vector<HistogramBin> bins;
    if (values.empty()) {
        return bins;
    }

    const auto [min_it, max_it] = std::minmax_element(values.begin(), values.end());
    const double lo = *min_it;
    const double hi = *max_it;
    const double total = static_cast<double>(values.size());

    if (lo == hi) {
        bins.push_back(HistogramBin{lo, hi, values.size(), 1.0});
        return bins;
    }

    const double width = (hi - lo) / static_cast<double>(num_bins);
    bins.reserve(num_bins);
    for (size_t i = 0; i < num_bins; ++i) {
        double lower = lo + width * static_cast<double>(i);
        double upper = (i + 1 == num_bins) ? hi : lo + width * static_cast<double>(i + 1);
        bins.push_back(HistogramBin{lower, upper, 0, 0.0});
    }

    for (double v : values) {
        size_t idx = static_cast<size_t>((v - lo) / width);
        if (idx >= num_bins) {
            idx = num_bins - 1;
        }
        bins[idx].count++;
    }

    for (auto& bin : bins) {
        bin.frequency = static_cast<double>(bin.count) / total;
    }
    return bins;
}

DistributionSummary describe_distribution(const std::vector<double>& values, size_t num_bins) {
    DistributionSummary result;
    result.summary = summarize(values);
    result.histogram = build_histogram(values, num_bins);

    if (!values.empty()) {
        std::vector<double> sorted = values;
        std::sort(sorted.begin(), sorted.end());
        for (double level : standard_percentile_levels()) {
            result.percentiles.push_back(PercentileValue{level, calculate_percentile(sorted, level)});
        }
    }
    return result;
}

} // namespace reisim
