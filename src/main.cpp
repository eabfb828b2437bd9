#include <algorithm>
#include <atomic>
#include <cctype>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include "evaluator.hpp"
#include "logger.hpp"
#include "sensitivity.hpp"
#include "simulation.hpp"
#include "io/json_writer.hpp"
#include "io/request_parser.hpp"

namespace {

std::atomic<bool> g_cancel_requested{false};

void handle_interrupt(int) {
    g_cancel_requested.store(true);
}

struct CLIArgs {
    std::string request_path;
    std::string mode = "monte-carlo";
    long long num_simulations = -1;        // -1 = use the request
    bool has_seed = false;
    uint64_t seed = 0;
    int num_threads = -1;                  // -1 = use the request
    std::string output_path;
    bool compact = false;
    std::string log_level = "INFO";
    std::string log_file;
    std::string log_format = "json";
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "reisim v1.0.0 - Monte Carlo and sensitivity analysis for rental property investments\n\n";
    std::cerr << "Usage: " << program_name << " --request <path> [options]\n\n";
    std::cerr << "Input options:\n";
    std::cerr << "  --request <path>            JSON request (investment_parameters, variable_distributions,\n";
    std::cerr << "                              simulation_settings, target_metrics, sensitivity)\n";
    std::cerr << "  --mode <mode>               monte-carlo (default) or sensitivity\n\n";
    std::cerr << "Simulation options (override the request):\n";
    std::cerr << "  --simulations <count>       Number of trials\n";
    std::cerr << "  --seed <value>              Random seed for reproducibility\n";
    std::cerr << "  --threads <count>           Worker threads (0 = all cores)\n\n";
    std::cerr << "Output options:\n";
    std::cerr << "  --output <path>             JSON output file (default: stdout)\n";
    std::cerr << "  --compact                   Single-line JSON\n\n";
    std::cerr << "Logging options:\n";
    std::cerr << "  --log-level <level>         DEBUG, INFO, WARN or ERROR (default: INFO)\n";
    std::cerr << "  --log-file <path>           Also append log lines to a file\n";
    std::cerr << "  --log-format <format>       json (default) or text\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Examples:\n\n";
    std::cerr << "  1. Monte Carlo run with a fixed seed:\n";
    std::cerr << "     " << program_name << " --request data/sample_request.json \\\n";
    std::cerr << "         --simulations 10000 --seed 42 --output results.json\n\n";
    std::cerr << "  2. Tornado analysis:\n";
    std::cerr << "     " << program_name << " --request data/sample_sensitivity.json --mode sensitivity\n";
}

bool file_exists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help" || arg == "-h") {
                args.help = true;
                return true;
            } else if (arg == "--request" && i + 1 < argc) {
                args.request_path = argv[++i];
            } else if (arg == "--mode" && i + 1 < argc) {
                args.mode = argv[++i];
            } else if (arg == "--simulations" && i + 1 < argc) {
                args.num_simulations = std::stoll(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                args.seed = std::stoull(argv[++i]);
                args.has_seed = true;
            } else if (arg == "--threads" && i + 1 < argc) {
                args.num_threads = std::stoi(argv[++i]);
            } else if (arg == "--output" && i + 1 < argc) {
                args.output_path = argv[++i];
            } else if (arg == "--compact") {
                args.compact = true;
            } else if (arg == "--log-level" && i + 1 < argc) {
                args.log_level = to_upper(argv[++i]);
            } else if (arg == "--log-file" && i + 1 < argc) {
                args.log_file = argv[++i];
            } else if (arg == "--log-format" && i + 1 < argc) {
                args.log_format = argv[++i];
            } else {
                std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
                return false;
            }
        } catch (const std::logic_error&) {
            std::cerr << "Error: Invalid numeric value for " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

bool validate_args(const CLIArgs& args) {
    bool valid = true;

    if (args.request_path.empty()) {
        std::cerr << "Error: --request is required\n";
        valid = false;
    } else if (!file_exists(args.request_path)) {
        std::cerr << "Error: Request file not found: " << args.request_path << "\n";
        valid = false;
    }

    if (args.mode != "monte-carlo" && args.mode != "sensitivity") {
        std::cerr << "Error: --mode must be monte-carlo or sensitivity\n";
        valid = false;
    }

    if (args.num_simulations == 0 || args.num_simulations < -1) {
        std::cerr << "Error: --simulations must be greater than 0\n";
        valid = false;
    }

    if (args.num_threads < -1) {
        std::cerr << "Error: --threads must be non-negative\n";
        valid = false;
    }

    if (args.log_level != "DEBUG" && args.log_level != "INFO" &&
        args.log_level != "WARN" && args.log_level != "ERROR") {
        std::cerr << "Error: --log-level must be DEBUG, INFO, WARN or ERROR\n";
        valid = false;
    }

    if (args.log_format != "json" && args.log_format != "text") {
        std::cerr << "Error: --log-format must be json or text\n";
        valid = false;
    }

    return valid;
}

void configure_logging(const CLIArgs& args) {
    reisim::LoggerConfig config;
    config.min_level = reisim::string_to_level(args.log_level);
    config.enable_json = args.log_format == "json";
    if (!args.log_file.empty()) {
        config.enable_file = true;
        config.log_file_path = args.log_file;
    }
    reisim::Logger::get_instance().configure(config);
}

int run_monte_carlo(const CLIArgs& args, reisim::io::Request& request,
                    const reisim::FinancialEvaluator& evaluator) {
    reisim::SimulationSettings& settings = request.simulation.settings;
    if (args.num_simulations > 0) {
        settings.num_simulations = static_cast<size_t>(args.num_simulations);
    }
    if (args.has_seed) {
        settings.random_seed = args.seed;
    }
    if (args.num_threads >= 0) {
        settings.num_threads = args.num_threads;
    }

    std::cerr << "Configuration:\n";
    std::cerr << "  Request:     " << args.request_path << "\n";
    std::cerr << "  Simulations: " << settings.num_simulations << "\n";
    std::cerr << "  Variables:   " << request.simulation.variable_distributions.size() << "\n";
    std::cerr << "  Seed:        " << (settings.random_seed ? std::to_string(*settings.random_seed) : "entropy") << "\n";

    reisim::RunOptions options;
    options.cancel_flag = &g_cancel_requested;
    reisim::SimulationResult result = reisim::run_simulation(request.simulation, evaluator, options);

    std::cerr << "\nResults:\n";
    std::cerr << "  Excluded:    " << result.excluded_trials << " of " << result.num_simulations << "\n";
    auto irr = result.metrics.find("irr");
    if (irr != result.metrics.end() && irr->second.distribution.summary.mean) {
        std::cerr << "  Mean IRR:    " << *irr->second.distribution.summary.mean << "%\n";
    }
    for (const auto& warning : result.warnings) {
        std::cerr << "  Warning:     " << warning << "\n";
    }
    std::cerr << "  Execution:   " << result.execution_time_ms << " ms\n";

    if (args.output_path.empty()) {
        reisim::io::write_simulation_result_json(std::cout, result, !args.compact);
    } else {
        reisim::io::write_simulation_result_json(args.output_path, result, !args.compact);
        std::cerr << "\nOutput written to: " << args.output_path << "\n";
    }
    return 0;
}

int run_sensitivity(const CLIArgs& args, const reisim::io::Request& request,
                    const reisim::FinancialEvaluator& evaluator) {
    reisim::io::SensitivityRequest sensitivity = request.sensitivity
        ? *request.sensitivity
        : reisim::io::default_sensitivity_request(request.simulation.base_scenario);

    std::cerr << "Configuration:\n";
    std::cerr << "  Request:     " << args.request_path << "\n";
    std::cerr << "  Variables:   " << sensitivity.variables.size() << "\n";
    std::cerr << "  Target:      " << sensitivity.options.target_metric << "\n";

    reisim::SensitivityResult result = reisim::analyze_sensitivity(
        request.simulation.base_scenario, sensitivity.variables, evaluator, sensitivity.options);

    if (!result.tornado.empty()) {
        std::cerr << "\nMost sensitive: " << result.tornado.front().variable_name << "\n";
    }

    if (args.output_path.empty()) {
        reisim::io::write_sensitivity_result_json(std::cout, result, !args.compact);
    } else {
        reisim::io::write_sensitivity_result_json(args.output_path, result, !args.compact);
        std::cerr << "\nOutput written to: " << args.output_path << "\n";
    }
    return 0;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    // Parse arguments
    if (!parse_args(argc, argv, args)) {
        print_usage(argv[0]);
        return 1;
    }

    // Handle help
    if (args.help) {
        print_usage(argv[0]);
        return 0;
    }

    // If no arguments provided, show usage
    if (argc == 1) {
        print_usage(argv[0]);
        return 0;
    }

    // Validate arguments
    if (!validate_args(args)) {
        std::cerr << "\nUse --help for usage information.\n";
        return 1;
    }

    configure_logging(args);
    std::signal(SIGINT, handle_interrupt);

    reisim::RunContext ctx("", args.mode);
    try {
        reisim::io::Request request = reisim::io::parse_request_from_file(args.request_path);
        reisim::RentalPropertyEvaluator evaluator;

        if (args.mode == "sensitivity") {
            return run_sensitivity(args, request, evaluator);
        }
        return run_monte_carlo(args, request, evaluator);
    } catch (const std::exception& e) {
        reisim::Logger::get_instance().log_error(ctx, e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
