#ifndef REISIM_STATISTICS_HPP
#define REISIM_STATISTICS_HPP

#include <cstddef>
#include <optional>
#include <vector>

namespace reisim {

// Single-pass mean / population variance accumulator (Welford)
class RunningStats {
public:
    RunningStats();

    void push(double x);

    size_t count() const { return n_; }
    double mean() const { return mean_; }
    double variance() const;            // Population variance; 0 when empty
    double std_dev() const;
    double min() const { return min_; }
    double max() const { return max_; }

private:
    size_t n_;
    double mean_;
    double m2_;
    double min_;
    double max_;
};

// Summary of one metric across the included trials.
// Every field is empty when count == 0; skewness and kurtosis are also empty
// when std_dev == 0.
struct SummaryStatistics {
    size_t count;
    std::optional<double> mean;
    std::optional<double> std_dev;          // Population standard deviation
    std::optional<double> standard_error;   // std_dev / sqrt(count)
    std::optional<double> min;
    std::optional<double> max;
    std::optional<double> median;
    std::optional<double> skewness;
    std::optional<double> kurtosis;         // Excess kurtosis

    SummaryStatistics();
};

struct PercentileValue {
    double level;   // 0-100
    double value;
};

struct HistogramBin {
    double lower;
    double upper;
    size_t count;
    double frequency;   // count / total
};

// Percentiles, histogram and summary for one series
struct DistributionSummary {
    SummaryStatistics summary;
    std::vector<PercentileValue> percentiles;
    std::vector<HistogramBin> histogram;
};

// 1, 5, 10, 25, 50, 75, 90, 95, 99
const std::vector<double>& standard_percentile_levels();

// Linear interpolation between closest ranks:
//   pos = p/100 * (n - 1), value = v[floor] * (1 - f) + v[ceil] * f
// sorted_values must be ascending and non-empty; p must be in [0, 100].
// Throws std::invalid_argument otherwise.
double calculate_percentile(const std::vector<double>& sorted_values, double p);

SummaryStatistics summarize(const std::vector<double>& values);

// Equal-width bins over [min, max]. The last bin is closed on the right.
// A constant series yields a single bin; an empty series yields none.
// Throws std::invalid_argument if num_bins == 0.
std::vector<HistogramBin> build_histogram(const std::vector<double>& values, size_t num_bins);

DistributionSummary describe_distribution(const std::vector<double>& values, size_t num_bins);

} // namespace reisim

#endif // REISIM_STATISTICS_HPP
