#include "distribution.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace reisim {

namespace {

constexpr double kTwoPi = 6.283185307179586476925286766559;

void require_finite(double value, const char* kind, const char* field) {
    if (!std::isfinite(value)) {
        throw InvalidDistributionError(std::string(kind) + " distribution: " + field +
                                       " must be a finite number");
    }
}

// Overload set for std::visit
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

} // anonymous namespace

// ============================================================================
// Kind helpers
// ============================================================================

std::string kind_to_string(DistributionKind kind) {
    switch (kind) {
        case DistributionKind::Normal: return "normal";
        case DistributionKind::Triangular: return "triangular";
        case DistributionKind::Uniform: return "uniform";
    }
    return "unknown";
}

DistributionKind parse_distribution_kind(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "normal") return DistributionKind::Normal;
    if (lower == "triangular") return DistributionKind::Triangular;
    if (lower == "uniform") return DistributionKind::Uniform;
    throw InvalidDistributionError("Unknown distribution type: '" + name + "'");
}

// ============================================================================
// DistributionSpec Implementation
// ============================================================================

DistributionSpec::DistributionSpec(Params params) : params_(std::move(params)) {}

DistributionSpec DistributionSpec::normal(double mean, double std_dev) {
    require_finite(mean, "normal", "mean");
    require_finite(std_dev, "normal", "std_dev");
    if (std_dev < 0.0) {
        throw InvalidDistributionError("normal distribution: std_dev must be non-negative");
    }
    return DistributionSpec(NormalParams{mean, std_dev});
}

DistributionSpec DistributionSpec::triangular(double min, double mode, double max) {
    require_finite(min, "triangular", "min");
    require_finite(mode, "triangular", "mode");
    require_finite(max, "triangular", "max");
    if (min > max) {
        throw InvalidDistributionError("triangular distribution: min cannot exceed max");
    }
    if (mode < min || mode > max) {
        throw InvalidDistributionError("triangular distribution: mode must lie within [min, max]");
    }
    return DistributionSpec(TriangularParams{min, mode, max});
}

DistributionSpec DistributionSpec::uniform(double min, double max) {
    require_finite(min, "uniform", "min");
    require_finite(max, "uniform", "max");
    if (min > max) {
        throw InvalidDistributionError("uniform distribution: min cannot exceed max");
    }
    return DistributionSpec(UniformParams{min, max});
}

DistributionKind DistributionSpec::kind() const {
    return std::visit(Overloaded{
        [](const NormalParams&) { return DistributionKind::Normal; },
        [](const TriangularParams&) { return DistributionKind::Triangular; },
        [](const UniformParams&) { return DistributionKind::Uniform; },
    }, params_);
}

double DistributionSpec::mean() const {
    return std::visit(Overloaded{
        [](const NormalParams& p) { return p.mean; },
        [](const TriangularParams& p) { return (p.min + p.mode + p.max) / 3.0; },
        [](const UniformParams& p) { return 0.5 * (p.min + p.max); },
    }, params_);
}

std::string DistributionSpec::describe() const {
    std::ostringstream oss;
    std::visit(Overloaded{
        [&oss](const NormalParams& p) {
            oss << "normal(mean=" << p.mean << ", std_dev=" << p.std_dev << ")";
        },
        [&oss](const TriangularParams& p) {
            oss << "triangular(min=" << p.min << ", mode=" << p.mode << ", max=" << p.max << ")";
        },
        [&oss](const UniformParams& p) {
            oss << "uniform(min=" << p.min << ", max=" << p.max << ")";
        },
    }, params_);
    return oss.str();
}

bool DistributionSpec::operator==(const DistributionSpec& other) const {
    if (kind() != other.kind()) {
        return false;
    }
    return std::visit(Overloaded{
        [&other](const NormalParams& p) {
            const auto& o = std::get<NormalParams>(other.params_);
            return p.mean == o.mean && p.std_dev == o.std_dev;
        },
        [&other](const TriangularParams& p) {
            const auto& o = std::get<TriangularParams>(other.params_);
            return p.min == o.min && p.mode == o.mode && p.max == o.max;
        },
        [&other](const UniformParams& p) {
            const auto& o = std::get<UniformParams>(other.params_);
            return p.min == o.min && p.max == o.max;
        },
    }, params_);
}

// ============================================================================
// Sampling
// ============================================================================

double sample(const DistributionSpec& spec, Rng& rng) {
    return std::visit(Overloaded{
        [&rng](const NormalParams& p) {
            // Box-Muller: u1 in (0, 1] keeps log() finite
            double u1 = rng.uniform_open_low();
            double u2 = rng.uniform01();
            double z = std::sqrt(-2.0 * std::log(u1)) * std::cos(kTwoPi * u2);
            return p.mean + p.std_dev * z;
        },
        [&rng](const TriangularParams& p) {
            double u = rng.uniform01();
            double range = p.max - p.min;
            if (range == 0.0) {
                return p.min;
            }
            double fc = (p.mode - p.min) / range;
            if (u < fc) {
                return p.min + std::sqrt(u * range * (p.mode - p.min));
            }
            return p.max - std::sqrt((1.0 - u) * range * (p.max - p.mode));
        },
        [&rng](const UniformParams& p) {
            return p.min + (p.max - p.min) * rng.uniform01();
        },
    }, spec.params());
}

} // namespace reisim
