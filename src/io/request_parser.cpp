#include "request_parser.hpp"
#include "../errors.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <sstream>

using json = nlohmann::json;

namespace reisim {
namespace io {

namespace {

double get_number(const json& obj, const std::string& key, const std::string& context) {
    const json& value = obj.at(key);
    if (!value.is_number()) {
        throw RequestParseError(context + "." + key + " must be a number");
    }
    return value.get<double>();
}

std::optional<double> find_number(const json& obj, const std::string& key, const std::string& context) {
    if (!obj.contains(key) || obj.at(key).is_null()) {
        return std::nullopt;
    }
    return get_number(obj, key, context);
}

int64_t get_integer(const json& obj, const std::string& key, const std::string& context) {
    const json& value = obj.at(key);
    if (!value.is_number_integer()) {
        throw RequestParseError(context + "." + key + " must be an integer");
    }
    return value.get<int64_t>();
}

std::vector<double> get_number_array(const json& obj, const std::string& key, const std::string& context) {
    const json& value = obj.at(key);
    if (!value.is_array()) {
        throw RequestParseError(context + "." + key + " must be an array of numbers");
    }
    std::vector<double> numbers;
    for (const auto& item : value) {
        if (!item.is_number()) {
            throw RequestParseError(context + "." + key + " must contain only numbers");
        }
        numbers.push_back(item.get<double>());
    }
    return numbers;
}

const json& require_object(const json& obj, const std::string& key) {
    if (!obj.contains(key)) {
        throw RequestParseError("Missing required field: " + key);
    }
    const json& value = obj.at(key);
    if (!value.is_object()) {
        throw RequestParseError("Field '" + key + "' must be an object");
    }
    return value;
}

DistributionSpec parse_distribution(const std::string& variable,
                                    const json& spec,
                                    const BaseScenario& base) {
    const std::string context = "variable_distributions." + variable;
    if (!spec.is_object()) {
        throw RequestParseError(context + " must be an object");
    }

    std::string type = "normal";
    if (spec.contains("type")) {
        if (!spec.at("type").is_string()) {
            throw RequestParseError(context + ".type must be a string");
        }
        type = spec.at("type").get<std::string>();
    }
    DistributionKind kind = parse_distribution_kind(type);

    std::optional<double> mean = find_number(spec, "mean", context);
    if (!mean && base.has(variable)) {
        mean = base.get(variable);
    }
    auto mean_or_throw = [&](const char* field) {
        if (!mean) {
            throw RequestParseError(context + " needs '" + field + "' or a mean to default it from");
        }
        return *mean;
    };

    switch (kind) {
        case DistributionKind::Normal: {
            double m = mean_or_throw("mean");
            std::optional<double> sd = find_number(spec, "std_dev", context);
            return DistributionSpec::normal(m, sd ? *sd : std::abs(m) * 0.1);
        }
        case DistributionKind::Uniform: {
            std::optional<double> lo = find_number(spec, "min", context);
            std::optional<double> hi = find_number(spec, "max", context);
            double min = lo ? *lo : mean_or_throw("min") * 0.8;
            double max = hi ? *hi : mean_or_throw("max") * 1.2;
            return DistributionSpec::uniform(min, max);
        }
        case DistributionKind::Triangular: {
            std::optional<double> lo = find_number(spec, "min", context);
            std::optional<double> hi = find_number(spec, "max", context);
            std::optional<double> mode = find_number(spec, "mode", context);
            double min = lo ? *lo : mean_or_throw("min") * 0.8;
            double max = hi ? *hi : mean_or_throw("max") * 1.2;
            double peak = mode ? *mode : mean_or_throw("mode");
            return DistributionSpec::triangular(min, peak, max);
        }
    }
    throw RequestParseError(context + " has an unsupported type");
}

void parse_settings(const json& j, SimulationSettings& settings) {
    const std::string context = "simulation_settings";
    if (!j.is_object()) {
        throw RequestParseError(context + " must be an object");
    }

    if (j.contains("num_simulations")) {
        int64_t n = get_integer(j, "num_simulations", context);
        if (n <= 0) {
            throw ValidationError("num_simulations must be greater than 0");
        }
        settings.num_simulations = static_cast<size_t>(n);
    }
    if (j.contains("random_seed") && !j.at("random_seed").is_null()) {
        const json& seed = j.at("random_seed");
        if (seed.is_number_unsigned()) {
            settings.random_seed = seed.get<uint64_t>();
        } else if (seed.is_number_integer()) {
            settings.random_seed = static_cast<uint64_t>(seed.get<int64_t>());
        } else {
            throw RequestParseError(context + ".random_seed must be an integer");
        }
    }
    if (j.contains("confidence_levels")) {
        settings.confidence_levels = get_number_array(j, "confidence_levels", context);
    }
    if (j.contains("confidence_interval_levels")) {
        settings.confidence_interval_levels = get_number_array(j, "confidence_interval_levels", context);
    }
    if (j.contains("histogram_bins")) {
        int64_t bins = get_integer(j, "histogram_bins", context);
        if (bins <= 0) {
            throw ValidationError("histogram_bins must be at least 1");
        }
        settings.histogram_bins = static_cast<size_t>(bins);
    }
    if (j.contains("risk_free_rate")) {
        settings.risk_free_rate = get_number(j, "risk_free_rate", context);
    }
    if (j.contains("sharpe_metric")) {
        settings.sharpe_metric = j.at("sharpe_metric").get<std::string>();
    }
    if (j.contains("ranking_metric")) {
        settings.ranking_metric = j.at("ranking_metric").get<std::string>();
    }
    if (j.contains("max_failure_fraction")) {
        settings.max_failure_fraction = get_number(j, "max_failure_fraction", context);
    }
    if (j.contains("num_threads")) {
        int64_t threads = get_integer(j, "num_threads", context);
        if (threads < 0 || threads > std::numeric_limits<int>::max()) {
            throw ValidationError("num_threads must be a non-negative integer");
        }
        settings.num_threads = static_cast<int>(threads);
    }
}

void parse_targets(const json& j, TargetMetrics& targets) {
    const std::string context = "target_metrics";
    if (!j.is_object()) {
        throw RequestParseError(context + " must be an object");
    }
    if (auto v = find_number(j, "minimum_irr", context)) targets.minimum_irr = *v;
    if (auto v = find_number(j, "minimum_cash_flow", context)) targets.minimum_cash_flow = *v;
    if (auto v = find_number(j, "maximum_loss", context)) targets.maximum_loss = *v;
}

SensitivityVariable parse_sensitivity_variable(const json& j) {
    if (j.is_string()) {
        return SensitivityVariable(j.get<std::string>(), default_variations());
    }
    if (!j.is_object()) {
        throw RequestParseError("sensitivity.variables entries must be objects or names");
    }

    SensitivityVariable var;
    if (j.contains("variable")) {
        var.variable_name = j.at("variable").get<std::string>();
    } else if (j.contains("variable_name")) {
        var.variable_name = j.at("variable_name").get<std::string>();
    } else {
        throw RequestParseError("sensitivity.variables entry missing required field: variable");
    }

    const std::string context = "sensitivity.variables." + var.variable_name;
    if (j.contains("mode")) {
        var.mode = parse_perturbation_mode(j.at("mode").get<std::string>());
    }

    if (j.contains("variations")) {
        var.variations = get_number_array(j, "variations", context);
    } else if (j.contains("range")) {
        const json& range = j.at("range");
        if (!range.is_object()) {
            throw RequestParseError(context + ".range must be an object");
        }
        var.variations = symmetric_range(get_number(range, "max_percent", context + ".range"),
                                         get_number(range, "step_percent", context + ".range"));
    } else {
        var.variations = default_variations();
    }
    return var;
}

SensitivityRequest parse_sensitivity(const json& j, const BaseScenario& base) {
    if (!j.is_object()) {
        throw RequestParseError("sensitivity must be an object");
    }

    SensitivityRequest request;
    if (j.contains("target_metric")) {
        request.options.target_metric = j.at("target_metric").get<std::string>();
    }
    if (j.contains("break_even_metric")) {
        const json& metric = j.at("break_even_metric");
        request.options.break_even_metric = metric.is_null() ? "" : metric.get<std::string>();
    }
    if (j.contains("analysis_metrics")) {
        const json& metrics = j.at("analysis_metrics");
        if (!metrics.is_array()) {
            throw RequestParseError("sensitivity.analysis_metrics must be an array of metric names");
        }
        for (const auto& name : metrics) {
            request.options.analysis_metrics.push_back(name.get<std::string>());
        }
    }
    if (j.contains("two_way")) {
        request.options.two_way = j.at("two_way").get<bool>();
    }

    if (j.contains("variables")) {
        const json& variables = j.at("variables");
        if (!variables.is_array()) {
            throw RequestParseError("sensitivity.variables must be an array");
        }
        for (const auto& entry : variables) {
            request.variables.push_back(parse_sensitivity_variable(entry));
        }
    } else {
        request.variables = default_sensitivity_request(base).variables;
    }
    return request;
}

} // anonymous namespace

SensitivityRequest default_sensitivity_request(const BaseScenario& base) {
    SensitivityRequest request;
    const char* relative[] = {
        "purchase_price", "rental_income", "operating_expenses", "loan_interest_rate", "appreciation_rate"
    };
    for (const char* name : relative) {
        if (base.has(name)) {
            request.variables.emplace_back(name, default_variations());
        }
    }
    if (base.has("vacancy_rate")) {
        request.variables.emplace_back("vacancy_rate", std::vector<double>{-5, -2.5, 0, 2.5, 5},
                                       PerturbationMode::Absolute);
    }
    return request;
}

Request parse_request_from_string(const std::string& json_string) {
    Request request;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw RequestParseError("Request must be a JSON object");
        }

        // Parse investment_parameters (required)
        const json& params = require_object(j, "investment_parameters");
        for (auto it = params.begin(); it != params.end(); ++it) {
            if (!it.value().is_number()) {
                throw RequestParseError("investment_parameters." + it.key() + " must be a number");
            }
            request.simulation.base_scenario.set(it.key(), it.value().get<double>());
        }

        // Parse variable_distributions (required, may be empty)
        const json& distributions = require_object(j, "variable_distributions");
        for (auto it = distributions.begin(); it != distributions.end(); ++it) {
            request.simulation.variable_distributions.emplace(
                it.key(), parse_distribution(it.key(), it.value(), request.simulation.base_scenario));
        }

        // Parse simulation_settings (optional)
        if (j.contains("simulation_settings")) {
            parse_settings(j.at("simulation_settings"), request.simulation.settings);
        }

        // Parse target_metrics (optional)
        if (j.contains("target_metrics")) {
            parse_targets(j.at("target_metrics"), request.simulation.targets);
        }

        // Parse sensitivity (optional)
        if (j.contains("sensitivity")) {
            request.sensitivity = parse_sensitivity(j.at("sensitivity"), request.simulation.base_scenario);
        }

    } catch (const json::parse_error& e) {
        throw RequestParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw RequestParseError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw RequestParseError(std::string("JSON missing field: ") + e.what());
    }

    // Validate settings
    validate_request(request.simulation);

    return request;
}

Request parse_request_from_file(const std::string& file_path) {
    // Read file
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw RequestParseError("Failed to open request file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    return parse_request_from_string(buffer.str());
}

} // namespace io
} // namespace reisim
