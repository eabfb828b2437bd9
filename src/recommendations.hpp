#ifndef REISIM_RECOMMENDATIONS_HPP
#define REISIM_RECOMMENDATIONS_HPP

#include "risk_metrics.hpp"
#include "statistics.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace reisim {

struct Recommendation {
    std::string type;       // Performance, Risk, Cash Flow, ...
    std::string priority;   // High, Medium, Low
    std::string message;
    std::string action;
};

// Run-level figures the rules look at
struct RecommendationInputs {
    SummaryStatistics irr_summary;
    std::optional<double> irr_probability_of_loss;
    std::optional<double> irr_var_10;
    ProbabilityAnalysis probabilities;
    bool degraded;
    size_t excluded_trials;
    size_t num_simulations;

    RecommendationInputs();
};

// Rules (percent thresholds on fractions scaled by 100):
//   mean IRR > 15 strong, < 8 weak; IRR loss probability > 20%;
//   positive cash flow probability < 80%; IRR coefficient of variation > 0.5;
//   IRR VaR-10 < 0; doubling probability > 50%; degraded run.
// A rule whose input is undefined is skipped.
std::vector<Recommendation> generate_recommendations(const RecommendationInputs& inputs);

} // namespace reisim

#endif // REISIM_RECOMMENDATIONS_HPP
