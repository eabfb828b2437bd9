#ifndef REISIM_DISTRIBUTION_HPP
#define REISIM_DISTRIBUTION_HPP

#include "rng.hpp"
#include <stdexcept>
#include <string>
#include <variant>

namespace reisim {

// Thrown when distribution parameters violate their invariants.
// Raised at construction, never at sample time.
class InvalidDistributionError : public std::invalid_argument {
public:
    explicit InvalidDistributionError(const std::string& message)
        : std::invalid_argument(message) {}
};

enum class DistributionKind {
    Normal,
    Triangular,
    Uniform
};

std::string kind_to_string(DistributionKind kind);

// Accepts "normal", "triangular", "uniform" (case-insensitive).
// Throws InvalidDistributionError for anything else.
DistributionKind parse_distribution_kind(const std::string& name);

struct NormalParams {
    double mean;
    double std_dev;
};

struct TriangularParams {
    double min;
    double mode;
    double max;
};

struct UniformParams {
    double min;
    double max;
};

// Immutable, validated probability distribution for one uncertain input
class DistributionSpec {
public:
    using Params = std::variant<NormalParams, TriangularParams, UniformParams>;

    static DistributionSpec normal(double mean, double std_dev);
    static DistributionSpec triangular(double min, double mode, double max);
    static DistributionSpec uniform(double min, double max);

    DistributionKind kind() const;
    const Params& params() const { return params_; }

    // Analytic mean of the distribution
    double mean() const;

    // e.g. "normal(mean=2500, std_dev=200)"
    std::string describe() const;

    bool operator==(const DistributionSpec& other) const;

private:
    explicit DistributionSpec(Params params);

    Params params_;
};

// Draw one value. Consumes only `rng`; the result is a pure function of the
// distribution and the generator state.
//   Normal:     Box-Muller, mean + std_dev * z
//   Uniform:    min + (max - min) * u
//   Triangular: inverse CDF; min == max returns min
double sample(const DistributionSpec& spec, Rng& rng);

} // namespace reisim

#endif // REISIM_DISTRIBUTION_HPP
