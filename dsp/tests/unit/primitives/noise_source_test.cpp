// ==============================================================================
// Additive Noise - Unit Tests
// ==============================================================================
// Layer 1: DSP Primitives
//
// Tests for: dsp/include/oscilla/dsp/primitives/noise_source.h
// Purpose: Verify seeded reproducibility and the level of each noise type
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/primitives/noise_source.h>
#include <oscilla/dsp/primitives/signal_statistics.h>

#include <cmath>
#include <limits>
#include <vector>

using namespace Oscilla::DSP;
using Catch::Approx;

namespace {

std::vector<float> noiseBlock(NoiseType type, double level, uint32_t seed, size_t count = 20000) {
    std::vector<float> block(count, 0.0f);
    addNoise(block.data(), block.size(), NoiseOptions{type, level, seed});
    return block;
}

double lagOneCorrelation(const std::vector<float>& x) {
    double num = 0.0;
    double den = 0.0;
    for (size_t i = 0; i + 1 < x.size(); ++i) {
        num += static_cast<double>(x[i]) * x[i + 1];
    }
    for (float v : x) {
        den += static_cast<double>(v) * v;
    }
    return num / den;
}

} // namespace

TEST_CASE("Gaussian noise has the requested standard deviation", "[dsp][primitives][noise]") {
    const auto block = noiseBlock(NoiseType::Gaussian, 0.1, 11);
    const auto stats = computeStatistics(block.data(), block.size());

    REQUIRE(stats.mean == Approx(0.0).margin(0.005));
    REQUIRE(stats.standardDeviation == Approx(0.1).epsilon(0.05));
    REQUIRE(lagOneCorrelation(block) == Approx(0.0).margin(0.05));
}

TEST_CASE("Uniform noise stays within the level", "[dsp][primitives][noise]") {
    const auto block = noiseBlock(NoiseType::Uniform, 0.25, 5);
    const auto stats = computeStatistics(block.data(), block.size());

    REQUIRE(stats.min >= -0.25);
    REQUIRE(stats.max <= 0.25);
    REQUIRE(stats.standardDeviation == Approx(0.25 / std::sqrt(3.0)).epsilon(0.05));
}

TEST_CASE("Colored noise is smoother than white noise", "[dsp][primitives][noise]") {
    const auto colored = noiseBlock(NoiseType::Colored, 1.0, 3);
    const auto stats = computeStatistics(colored.data(), colored.size());

    // Averaging five independent values divides the deviation by sqrt(5)
    REQUIRE(stats.standardDeviation == Approx(1.0 / std::sqrt(5.0)).epsilon(0.05));
    // Neighbouring samples share four of five terms
    REQUIRE(lagOneCorrelation(colored) == Approx(0.8).margin(0.05));
}

TEST_CASE("Noise is reproducible per seed", "[dsp][primitives][noise]") {
    SECTION("same seed, same noise") {
        REQUIRE(noiseBlock(NoiseType::Gaussian, 0.5, 77, 256) == noiseBlock(NoiseType::Gaussian, 0.5, 77, 256));
        REQUIRE(noiseBlock(NoiseType::Colored, 0.5, 77, 256) == noiseBlock(NoiseType::Colored, 0.5, 77, 256));
    }

    SECTION("different seeds, different noise") {
        REQUIRE(noiseBlock(NoiseType::Uniform, 0.5, 1, 256) != noiseBlock(NoiseType::Uniform, 0.5, 2, 256));
    }
}

TEST_CASE("Noise is added on top of the samples", "[dsp][primitives][noise]") {
    std::vector<float> block(1000, 2.0f);
    addNoise(block.data(), block.size(), NoiseOptions{NoiseType::Uniform, 0.1, 9});

    const auto stats = computeStatistics(block.data(), block.size());
    REQUIRE(stats.mean == Approx(2.0).margin(0.01));
    REQUIRE(stats.min >= 1.9 - 1e-6);
    REQUIRE(stats.max <= 2.1 + 1e-6);
}

TEST_CASE("Disabled noise leaves the samples alone", "[dsp][primitives][noise]") {
    std::vector<float> block(64, 0.5f);

    addNoise(block.data(), block.size(), NoiseOptions{});
    addNoise(block.data(), block.size(), NoiseOptions{NoiseType::Gaussian, 0.0, 1});
    addNoise(block.data(), block.size(), NoiseOptions{NoiseType::None, 1.0, 1});

    for (float x : block) {
        REQUIRE(x == 0.5f);
    }
}

TEST_CASE("Noise level must be finite and non-negative", "[dsp][primitives][noise][edge]") {
    std::vector<float> block(8, 0.0f);

    REQUIRE_THROWS_AS(addNoise(block.data(), block.size(), NoiseOptions{NoiseType::Gaussian, -0.1, 1}),
                      InvalidParameterError);
    REQUIRE_THROWS_AS(
        NoiseOptions({NoiseType::Uniform, std::numeric_limits<double>::quiet_NaN(), 1}).validate(),
        InvalidParameterError);

    try {
        NoiseOptions{NoiseType::Gaussian, -1.0, 1}.validate();
        FAIL("expected InvalidParameterError");
    } catch (const InvalidParameterError& e) {
        REQUIRE(e.parameter() == "noise_level");
    }
}

TEST_CASE("Noise type names round-trip", "[dsp][primitives][noise]") {
    for (const auto type : {NoiseType::None, NoiseType::Gaussian, NoiseType::Uniform, NoiseType::Colored}) {
        REQUIRE(parseNoiseType(noiseTypeName(type)) == type);
    }
    REQUIRE(parseNoiseType("white") == NoiseType::Gaussian);
    REQUIRE_THROWS_AS(parseNoiseType("pink"), InvalidConfigurationError);
}
