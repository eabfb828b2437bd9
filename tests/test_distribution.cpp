#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <algorithm>
#include <cmath>
#include <vector>
#include "distribution.hpp"
#include "statistics.hpp"

using namespace reisim;
using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;
using Catch::Matchers::ContainsSubstring;

namespace {

std::vector<double> draw(const DistributionSpec& spec, uint64_t seed, size_t n) {
    Rng rng(seed);
    std::vector<double> values;
    values.reserve(n);
    for (size_t i = 0; i < n; ++i) {
        values.push_back(sample(spec, rng));
    }
    return values;
}

} // anonymous namespace

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("DistributionSpec valid construction", "[distribution]") {
    auto normal = DistributionSpec::normal(2500, 200);
    REQUIRE(normal.kind() == DistributionKind::Normal);
    REQUIRE(normal.mean() == 2500);

    auto tri = DistributionSpec::triangular(1, 4, 10);
    REQUIRE(tri.kind() == DistributionKind::Triangular);
    REQUIRE_THAT(tri.mean(), WithinAbs(5.0, 1e-12));

    auto uni = DistributionSpec::uniform(10000, 15000);
    REQUIRE(uni.kind() == DistributionKind::Uniform);
    REQUIRE(uni.mean() == 12500);
}

TEST_CASE("DistributionSpec rejects invalid parameters", "[distribution]") {
    SECTION("Negative std_dev") {
        REQUIRE_THROWS_AS(DistributionSpec::normal(0, -1), InvalidDistributionError);
    }

    SECTION("Uniform min above max") {
        REQUIRE_THROWS_AS(DistributionSpec::uniform(5, 4), InvalidDistributionError);
    }

    SECTION("Triangular mode outside bounds") {
        REQUIRE_THROWS_AS(DistributionSpec::triangular(0, 11, 10), InvalidDistributionError);
        REQUIRE_THROWS_AS(DistributionSpec::triangular(0, -1, 10), InvalidDistributionError);
    }

    SECTION("Triangular min above max") {
        REQUIRE_THROWS_AS(DistributionSpec::triangular(10, 5, 0), InvalidDistributionError);
    }

    SECTION("Non-finite parameters") {
        REQUIRE_THROWS_AS(DistributionSpec::normal(std::nan(""), 1), InvalidDistributionError);
        REQUIRE_THROWS_AS(DistributionSpec::uniform(0, INFINITY), InvalidDistributionError);
    }
}

TEST_CASE("DistributionSpec degenerate parameters are allowed", "[distribution]") {
    REQUIRE_NOTHROW(DistributionSpec::normal(5, 0));
    REQUIRE_NOTHROW(DistributionSpec::uniform(3, 3));
    REQUIRE_NOTHROW(DistributionSpec::triangular(2, 2, 2));
}

TEST_CASE("parse_distribution_kind", "[distribution]") {
    REQUIRE(parse_distribution_kind("normal") == DistributionKind::Normal);
    REQUIRE(parse_distribution_kind("Triangular") == DistributionKind::Triangular);
    REQUIRE(parse_distribution_kind("UNIFORM") == DistributionKind::Uniform);
    REQUIRE_THROWS_AS(parse_distribution_kind("lognormal"), InvalidDistributionError);
    REQUIRE(kind_to_string(DistributionKind::Triangular) == "triangular");
}

TEST_CASE("DistributionSpec describe and equality", "[distribution]") {
    auto a = DistributionSpec::normal(2500, 200);
    auto b = DistributionSpec::normal(2500, 200);
    auto c = DistributionSpec::uniform(2500, 2700);

    REQUIRE(a == b);
    REQUIRE_FALSE(a == c);
    REQUIRE_THAT(a.describe(), ContainsSubstring("normal"));
    REQUIRE_THAT(c.describe(), ContainsSubstring("uniform"));
}

// ============================================================================
// Sampling
// ============================================================================

TEST_CASE("Sampling is reproducible for a seed", "[distribution]") {
    auto spec = DistributionSpec::triangular(0, 3, 10);
    REQUIRE(draw(spec, 99, 500) == draw(spec, 99, 500));
}

TEST_CASE("Zero-width distributions return their constant", "[distribution]") {
    Rng rng(3);
    auto normal = DistributionSpec::normal(5, 0);
    auto uniform = DistributionSpec::uniform(4, 4);
    auto tri = DistributionSpec::triangular(7, 7, 7);

    for (int i = 0; i < 100; ++i) {
        REQUIRE(sample(normal, rng) == 5.0);
        REQUIRE(sample(uniform, rng) == 4.0);
        REQUIRE(sample(tri, rng) == 7.0);
    }
}

TEST_CASE("Uniform samples stay within bounds", "[distribution]") {
    auto values = draw(DistributionSpec::uniform(10000, 15000), 11, 20000);
    for (double v : values) {
        REQUIRE(v >= 10000);
        REQUIRE(v <= 15000);
    }

    std::sort(values.begin(), values.end());
    REQUIRE_THAT(calculate_percentile(values, 50), WithinRel(12500.0, 0.05));
}

TEST_CASE("Triangular samples stay within bounds", "[distribution]") {
    auto values = draw(DistributionSpec::triangular(2, 5, 12), 5, 20000);
    for (double v : values) {
        REQUIRE(v >= 2);
        REQUIRE(v <= 12);
    }
    auto stats = summarize(values);
    REQUIRE_THAT(*stats.mean, WithinRel(19.0 / 3.0, 0.01));
}

TEST_CASE("Triangular with mode at a bound", "[distribution]") {
    auto left = draw(DistributionSpec::triangular(0, 0, 1), 8, 20000);
    auto right = draw(DistributionSpec::triangular(0, 1, 1), 8, 20000);

    REQUIRE_THAT(*summarize(left).mean, WithinAbs(1.0 / 3.0, 0.01));
    REQUIRE_THAT(*summarize(right).mean, WithinAbs(2.0 / 3.0, 0.01));
}

TEST_CASE("Normal samples match mean and std_dev", "[distribution]") {
    auto values = draw(DistributionSpec::normal(2500, 200), 42, 50000);
    auto stats = summarize(values);

    REQUIRE_THAT(*stats.mean, WithinRel(2500.0, 0.01));
    REQUIRE_THAT(*stats.std_dev, WithinRel(200.0, 0.03));
    REQUIRE_THAT(*stats.skewness, WithinAbs(0.0, 0.05));
}
