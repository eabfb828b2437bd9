#ifndef REISIM_IO_REQUEST_PARSER_HPP
#define REISIM_IO_REQUEST_PARSER_HPP

#include "../sensitivity.hpp"
#include "../simulation.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace reisim {
namespace io {

/**
 * @brief Exception thrown when a request document cannot be parsed
 */
class RequestParseError : public std::runtime_error {
public:
    explicit RequestParseError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Sensitivity section of a request
 */
struct SensitivityRequest {
    std::vector<SensitivityVariable> variables;
    SensitivityOptions options;
};

/**
 * @brief Everything one request document describes
 */
struct Request {
    SimulationRequest simulation;
    std::optional<SensitivityRequest> sensitivity;
};

/**
 * @brief Parses a request from a JSON string
 *
 * Required: "investment_parameters" (name -> number) and
 * "variable_distributions" (name -> {"type", ...}, may be empty).
 * Optional: "simulation_settings", "target_metrics", "sensitivity".
 *
 * Omitted distribution parameters default from "mean" (or the investment
 * parameter of the same name): normal std_dev = 10% of mean, uniform and
 * triangular bounds = 80% / 120% of mean, triangular mode = mean.
 *
 * @throws RequestParseError if the JSON is invalid, a section is missing or a
 *         number is expected but something else is found
 * @throws InvalidDistributionError if a distribution is invalid
 * @throws ValidationError if a setting is out of range
 */
Request parse_request_from_string(const std::string& json_string);

/**
 * @brief Parses a request from a JSON file
 *
 * @throws RequestParseError if the file cannot be read
 */
Request parse_request_from_file(const std::string& file_path);

/**
 * @brief Sensitivity section used when a request carries none
 *
 * Sweeps purchase_price, rental_income, operating_expenses,
 * loan_interest_rate and appreciation_rate (relative) and vacancy_rate
 * (absolute), limited to the ones present in `base`.
 */
SensitivityRequest default_sensitivity_request(const BaseScenario& base);

} // namespace io
} // namespace reisim

#endif // REISIM_IO_REQUEST_PARSER_HPP
