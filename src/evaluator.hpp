#ifndef REISIM_EVALUATOR_HPP
#define REISIM_EVALUATOR_HPP

#include "scenario.hpp"
#include <map>
#include <string>
#include <vector>

namespace reisim {

// Output metric name -> value for one scenario.
// A metric the evaluator cannot determine (e.g. IRR that does not converge) is
// left out of the map rather than reported as NaN.
using FinancialMetrics = std::map<std::string, double>;

// Deterministic scenario -> metrics function shared by the Monte Carlo and
// sensitivity paths. Implementations must be side-effect free and safe to
// call concurrently from several threads.
class FinancialEvaluator {
public:
    virtual ~FinancialEvaluator() = default;

    // Throws EvaluationError when the scenario cannot be evaluated at all
    virtual FinancialMetrics evaluate(const Scenario& scenario) const = 0;

    virtual std::string name() const = 0;
};

// Result of the IRR root-find
struct IrrResult {
    double rate;        // Periodic rate as a fraction (0.12 = 12%)
    bool converged;
    int iterations;
};

// Newton-Raphson on NPV(rate) = 0, rate bounded to [-0.99, 10]
IrrResult calculate_irr(const std::vector<double>& cash_flows,
                        double guess = 0.1,
                        int max_iterations = 100,
                        double tolerance = 1e-7);

// NPV with cash_flows[0] at t = 0
double calculate_npv(const std::vector<double>& cash_flows, double rate);

// Level monthly payment on an amortizing loan. Zero rate amortizes linearly.
double monthly_payment(double principal, double annual_rate_percent, double term_years);

// Outstanding principal after `payments_made` monthly payments (never negative)
double remaining_balance(double principal, double annual_rate_percent,
                         double term_years, double payments_made);

// Leveraged buy-and-hold rental property.
//
// Inputs (default when absent):
//   purchase_price (required), down_payment_percent (20), closing_costs (0),
//   holding_period_years (5), loan_interest_rate (7), loan_term_years (30),
//   rental_income (monthly, required), vacancy_rate (5),
//   operating_expenses (annual, required), appreciation_rate (3),
//   exit_cap_rate (6, 0 disables the cap-rate exit), discount_rate (10)
//
// Outputs: monthly_cash_flow, annual_cash_flow, noi, cap_rate,
//   cash_on_cash_return, dscr (only with debt service), irr (only when the
//   root-find converges), npv, total_return, equity_multiple, total_profit,
//   exit_value. Rates and returns are in percent.
class RentalPropertyEvaluator : public FinancialEvaluator {
public:
    FinancialMetrics evaluate(const Scenario& scenario) const override;
    std::string name() const override { return "rental_property"; }

    // Names of every metric evaluate() can produce
    static const std::vector<std::string>& metric_names();
};

} // namespace reisim

#endif // REISIM_EVALUATOR_HPP
