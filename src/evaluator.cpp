#include "evaluator.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>

namespace reisim {

namespace {

constexpr double kMinIrr = -0.99;
constexpr double kMaxIrr = 10.0;

double require_input(const Scenario& scenario, const std::string& name) {
    if (!scenario.has(name)) {
        throw EvaluationError("Missing required input: " + name);
    }
    double value = scenario.get(name);
    if (!std::isfinite(value)) {
        throw EvaluationError("Input is not finite: " + name);
    }
    return value;
}

double optional_input(const Scenario& scenario, const std::string& name, double fallback) {
    double value = scenario.get_or(name, fallback);
    if (!std::isfinite(value)) {
        throw EvaluationError("Input is not finite: " + name);
    }
    return value;
}

} // anonymous namespace

// ============================================================================
// Cash flow helpers
// ============================================================================

double calculate_npv(const std::vector<double>& cash_flows, double rate) {
    double npv = 0.0;
    double factor = 1.0;
    for (double cf : cash_flows) {
        npv += cf / factor;
        factor *= (1.0 + rate);
    }
    return npv;
}

IrrResult calculate_irr(const std::vector<double>& cash_flows,
                        double guess,
                        int max_iterations,
                        double tolerance) {
    IrrResult result{guess, false, 0};
    if (cash_flows.size() < 2) {
        return result;
    }

    double scale = 0.0;
    for (double cf : cash_flows) {
        scale += std::abs(cf);
    }
    if (scale == 0.0) {
        return result;
    }

    double rate = guess;
    for (int i = 0; i < max_iterations; ++i) {
        result.iterations = i + 1;

        double npv = 0.0;
        double dnpv = 0.0;
        for (size_t t = 0; t < cash_flows.size(); ++t) {
            double discount = std::pow(1.0 + rate, static_cast<double>(t));
            npv += cash_flows[t] / discount;
            if (t > 0) {
                dnpv -= static_cast<double>(t) * cash_flows[t] / (discount * (1.0 + rate));
            }
        }

        if (!std::isfinite(npv) || !std::isfinite(dnpv) || dnpv == 0.0) {
            return result;
        }

        double next = rate - npv / dnpv;
        bool clamped = false;
        if (next < kMinIrr) {
            next = kMinIrr;
            clamped = true;
        } else if (next > kMaxIrr) {
            next = kMaxIrr;
            clamped = true;
        }

        if (!clamped && std::abs(next - rate) < tolerance) {
            // Accept only a genuine root, not a stalled iterate
            if (std::abs(calculate_npv(cash_flows, next)) <= 1e-6 * scale) {
                result.rate = next;
                result.converged = true;
            }
            return result;
        }
        rate = next;
    }

    result.rate = rate;
    return result;
}

double monthly_payment(double principal, double annual_rate_percent, double term_years) {
    if (principal <= 0.0) {
        return 0.0;
    }
    double n = term_years * 12.0;
    if (n <= 0.0) {
        throw EvaluationError("Loan term must be positive when a loan is outstanding");
    }
    double r = annual_rate_percent / 100.0 / 12.0;
    if (r == 0.0) {
        return principal / n;
    }
    double growth = std::pow(1.0 + r, n);
    return principal * (r * growth) / (growth - 1.0);
}

double remaining_balance(double principal, double annual_rate_percent,
                         double term_years, double payments_made) {
    if (principal <= 0.0) {
        return 0.0;
    }
    double n = term_years * 12.0;
    double k = std::min(payments_made, n);
    double r = annual_rate_percent / 100.0 / 12.0;
    if (r == 0.0) {
        return std::max(0.0, principal * (1.0 - k / n));
    }
    double payment = monthly_payment(principal, annual_rate_percent, term_years);
    double growth = std::pow(1.0 + r, k);
    double balance = principal * growth - payment * (growth - 1.0) / r;
    return std::max(0.0, balance);
}

// ============================================================================
// RentalPropertyEvaluator Implementation
// ============================================================================

const std::vector<std::string>& RentalPropertyEvaluator::metric_names() {
    static const std::vector<std::string> names = {
        "annual_cash_flow", "cap_rate", "cash_on_cash_return", "dscr",
        "equity_multiple", "exit_value", "irr", "monthly_cash_flow",
        "noi", "npv", "total_profit", "total_return"
    };
    return names;
}

FinancialMetrics RentalPropertyEvaluator::evaluate(const Scenario& scenario) const {
    const double purchase_price = require_input(scenario, "purchase_price");
    const double rental_income = require_input(scenario, "rental_income");
    const double operating_expenses = require_input(scenario, "operating_expenses");

    const double down_payment_percent = optional_input(scenario, "down_payment_percent", 20.0);
    const double closing_costs = optional_input(scenario, "closing_costs", 0.0);
    const double holding_period = optional_input(scenario, "holding_period_years", 5.0);
    const double loan_rate = optional_input(scenario, "loan_interest_rate", 7.0);
    const double loan_term = optional_input(scenario, "loan_term_years", 30.0);
    const double vacancy_rate = optional_input(scenario, "vacancy_rate", 5.0);
    const double appreciation_rate = optional_input(scenario, "appreciation_rate", 3.0);
    const double exit_cap_rate = optional_input(scenario, "exit_cap_rate", 6.0);
    const double discount_rate = optional_input(scenario, "discount_rate", 10.0);

    if (purchase_price <= 0.0) {
        throw EvaluationError("purchase_price must be positive");
    }

    const int holding_years = static_cast<int>(std::lround(holding_period));
    if (holding_years < 1) {
        throw EvaluationError("holding_period_years must be at least 1");
    }

    // Acquisition and financing
    const double down_payment = purchase_price * (down_payment_percent / 100.0);
    const double total_cash_invested = down_payment + closing_costs;
    if (total_cash_invested <= 0.0) {
        throw EvaluationError("Total cash invested must be positive");
    }
    const double loan_amount = purchase_price - down_payment;
    const double payment = monthly_payment(loan_amount, loan_rate, loan_term);
    const double annual_debt_service = payment * 12.0;

    // Operations
    const double effective_income = rental_income * 12.0 * (1.0 - vacancy_rate / 100.0);
    const double noi = effective_income - operating_expenses;
    const double annual_cash_flow = noi - annual_debt_service;

    // Exit: appreciated value, capped by the income approach when an exit cap rate is set
    const double future_value = purchase_price * std::pow(1.0 + appreciation_rate / 100.0, holding_years);
    double exit_value = future_value;
    if (exit_cap_rate > 0.0) {
        exit_value = std::min(future_value, noi / (exit_cap_rate / 100.0));
    }
    const double balance = remaining_balance(loan_amount, loan_rate, loan_term, holding_years * 12.0);
    const double sale_proceeds = exit_value - balance;

    std::vector<double> cash_flows;
    cash_flows.reserve(static_cast<size_t>(holding_years) + 1);
    cash_flows.push_back(-total_cash_invested);
    for (int year = 1; year <= holding_years; ++year) {
        cash_flows.push_back(year < holding_years ? annual_cash_flow : annual_cash_flow + sale_proceeds);
    }

    const double total_received = annual_cash_flow * holding_years + sale_proceeds;
    const double total_profit = total_received - total_cash_invested;

    FinancialMetrics metrics;
    metrics["monthly_cash_flow"] = annual_cash_flow / 12.0;
    metrics["annual_cash_flow"] = annual_cash_flow;
    metrics["noi"] = noi;
    metrics["cap_rate"] = noi / purchase_price * 100.0;
    metrics["cash_on_cash_return"] = annual_cash_flow / total_cash_invested * 100.0;
    metrics["npv"] = calculate_npv(cash_flows, discount_rate / 100.0);
    metrics["total_profit"] = total_profit;
    metrics["total_return"] = total_profit / total_cash_invested * 100.0;
    metrics["equity_multiple"] = total_received / total_cash_invested;
    metrics["exit_value"] = exit_value;

    if (annual_debt_service > 0.0) {
        metrics["dscr"] = noi / annual_debt_service;
    }

    IrrResult irr = calculate_irr(cash_flows);
    if (irr.converged) {
        metrics["irr"] = irr.rate * 100.0;
    }

    for (const auto& [name, value] : metrics) {
        if (!std::isfinite(value)) {
            throw EvaluationError("Metric '" + name + "' is not finite");
        }
    }

    return metrics;
}

} // namespace reisim
