#include "recommendations.hpp"
#include <cmath>
#include <iomanip>
#include <sstream>

namespace reisim {

namespace {

std::string fixed1(double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << value;
    return oss.str();
}

} // anonymous namespace

RecommendationInputs::RecommendationInputs()
    : degraded(false),
      excluded_trials(0),
      num_simulations(0) {}

std::vector<Recommendation> generate_recommendations(const RecommendationInputs& inputs) {
    std::vector<Recommendation> recommendations;
    const auto& irr = inputs.irr_summary;
    const auto& probs = inputs.probabilities;

    if (irr.mean) {
        if (*irr.mean > 15.0) {
            recommendations.push_back({"Performance", "High",
                "Strong expected IRR of " + fixed1(*irr.mean) + "%",
                "Investment shows attractive returns across scenarios"});
        } else if (*irr.mean < 8.0) {
            recommendations.push_back({"Performance", "High",
                "Low expected IRR of " + fixed1(*irr.mean) + "%",
                "Consider alternative investments or improve deal terms"});
        }
    }

    if (inputs.irr_probability_of_loss && *inputs.irr_probability_of_loss > 0.20) {
        recommendations.push_back({"Risk", "High",
            fixed1(*inputs.irr_probability_of_loss * 100.0) + "% chance of negative returns",
            "High risk investment - ensure adequate risk tolerance"});
    }

    if (probs.positive_cash_flow && *probs.positive_cash_flow < 0.80) {
        recommendations.push_back({"Cash Flow", "Medium",
            "Only " + fixed1(*probs.positive_cash_flow * 100.0) + "% chance of positive cash flow",
            "Prepare for potential negative cash flow periods"});
    }

    if (irr.mean && irr.std_dev && *irr.mean != 0.0) {
        double cv = *irr.std_dev / std::abs(*irr.mean);
        if (cv > 0.5) {
            recommendations.push_back({"Volatility", "Medium",
                "High return volatility across scenarios",
                "Consider strategies to reduce uncertainty in key variables"});
        }
    }

    if (inputs.irr_var_10 && *inputs.irr_var_10 < 0.0) {
        recommendations.push_back({"Downside Risk", "High",
            "10% chance of IRR below " + fixed1(*inputs.irr_var_10) + "%",
            "Implement downside protection strategies"});
    }

    if (probs.double_money && *probs.double_money > 0.50) {
        recommendations.push_back({"Upside Potential", "Low",
            fixed1(*probs.double_money * 100.0) + "% chance of doubling investment",
            "Strong upside potential in favorable scenarios"});
    }

    if (inputs.degraded) {
        recommendations.push_back({"Data Quality", "High",
            std::to_string(inputs.excluded_trials) + " of " + std::to_string(inputs.num_simulations) +
                " trials were excluded from the statistics",
            "Review the input distributions for values the evaluator cannot handle"});
    }

    return recommendations;
}

} // namespace reisim
