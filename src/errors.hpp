#ifndef REISIM_ERRORS_HPP
#define REISIM_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace reisim {

// Request or settings rejected before any trial runs
class ValidationError : public std::invalid_argument {
public:
    explicit ValidationError(const std::string& message)
        : std::invalid_argument(message) {}
};

// The financial evaluator could not produce metrics for one scenario.
// The orchestrator excludes the trial; the sensitivity engine records a null step.
class EvaluationError : public std::runtime_error {
public:
    explicit EvaluationError(const std::string& message)
        : std::runtime_error(message) {}
};

// No seed was supplied and the entropy source could not provide one
class RngInitError : public std::runtime_error {
public:
    explicit RngInitError(const std::string& message)
        : std::runtime_error(message) {}
};

// The caller requested cancellation; the partial run is discarded
class SimulationCancelled : public std::runtime_error {
public:
    explicit SimulationCancelled(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace reisim

#endif // REISIM_ERRORS_HPP
