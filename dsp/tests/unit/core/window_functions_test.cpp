// ==============================================================================
// Window Functions - Unit Tests
// ==============================================================================
// Layer 0: Core Utilities
//
// Tests for: dsp/include/oscilla/dsp/core/window_functions.h
// Purpose: Verify analysis windows, their normalization sums and name parsing
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/core/window_functions.h>

#include <algorithm>
#include <array>
#include <vector>

using namespace Oscilla::DSP;
using Catch::Approx;

// ==============================================================================
// Shape Tests
// ==============================================================================

TEST_CASE("Window::generate produces periodic windows", "[dsp][core][window]") {

    constexpr size_t kSize = 1024;

    SECTION("Rectangular is all ones") {
        const auto w = Window::generate(WindowType::Rectangular, kSize);
        REQUIRE(w.size() == kSize);
        REQUIRE(std::all_of(w.begin(), w.end(), [](float x) { return x == 1.0f; }));
    }

    SECTION("Hann starts at zero and peaks at the center") {
        const auto w = Window::generate(WindowType::Hann, kSize);
        REQUIRE(w[0] == Approx(0.0f).margin(1e-7f));
        REQUIRE(w[kSize / 2] == Approx(1.0f).margin(1e-6f));
    }

    SECTION("Hamming has a 0.08 pedestal") {
        const auto w = Window::generate(WindowType::Hamming, kSize);
        REQUIRE(w[0] == Approx(0.08f).margin(1e-6f));
        REQUIRE(w[kSize / 2] == Approx(1.0f).margin(1e-6f));
    }

    SECTION("Blackman starts at zero and peaks at the center") {
        const auto w = Window::generate(WindowType::Blackman, kSize);
        REQUIRE(w[0] == Approx(0.0f).margin(1e-6f));
        REQUIRE(w[kSize / 2] == Approx(1.0f).margin(1e-6f));
    }

    SECTION("Periodic windows are symmetric about N/2") {
        for (WindowType type : {WindowType::Hann, WindowType::Hamming, WindowType::Blackman}) {
            const auto w = Window::generate(type, kSize);
            for (size_t n = 1; n < kSize / 2; ++n) {
                REQUIRE(w[n] == Approx(w[kSize - n]).margin(1e-6f));
            }
        }
    }

    SECTION("Zero size yields an empty window") {
        REQUIRE(Window::generate(WindowType::Hann, 0).empty());
    }
}

// ==============================================================================
// Normalization Sums
// ==============================================================================

TEST_CASE("Window sums match their closed forms", "[dsp][core][window]") {

    constexpr size_t kSize = 2048;
    const double N = static_cast<double>(kSize);

    SECTION("Rectangular") {
        const auto w = Window::generate(WindowType::Rectangular, kSize);
        REQUIRE(Window::coherentSum(w.data(), w.size()) == Approx(N));
        REQUIRE(Window::powerSum(w.data(), w.size()) == Approx(N));
    }

    SECTION("Hann: N/2 coherent, 3N/8 power") {
        const auto w = Window::generate(WindowType::Hann, kSize);
        REQUIRE(Window::coherentSum(w.data(), w.size()) == Approx(N / 2.0).epsilon(1e-4));
        REQUIRE(Window::powerSum(w.data(), w.size()) == Approx(3.0 * N / 8.0).epsilon(1e-4));
    }

    SECTION("Hamming: 0.54N coherent") {
        const auto w = Window::generate(WindowType::Hamming, kSize);
        REQUIRE(Window::coherentSum(w.data(), w.size()) == Approx(0.54 * N).epsilon(1e-4));
    }

    SECTION("Blackman: 0.42N coherent") {
        const auto w = Window::generate(WindowType::Blackman, kSize);
        REQUIRE(Window::coherentSum(w.data(), w.size()) == Approx(0.42 * N).epsilon(1e-4));
    }

    SECTION("Null windows sum to zero") {
        REQUIRE(Window::coherentSum(nullptr, 16) == 0.0);
        REQUIRE(Window::powerSum(nullptr, 16) == 0.0);
    }
}

TEST_CASE("Main-lobe half-width grows with sidelobe suppression", "[dsp][core][window]") {
    REQUIRE(Window::mainLobeHalfWidth(WindowType::Rectangular) == 1);
    REQUIRE(Window::mainLobeHalfWidth(WindowType::Hann) == 2);
    REQUIRE(Window::mainLobeHalfWidth(WindowType::Hamming) == 2);
    REQUIRE(Window::mainLobeHalfWidth(WindowType::Blackman) == 3);
}

// ==============================================================================
// Names
// ==============================================================================

TEST_CASE("Window names parse back to their type", "[dsp][core][window]") {

    SECTION("Canonical names round trip") {
        for (WindowType type : {WindowType::Rectangular, WindowType::Hann, WindowType::Hamming,
                                WindowType::Blackman}) {
            REQUIRE(Window::parse(Window::name(type)) == type);
        }
    }

    SECTION("Aliases are accepted") {
        REQUIRE(Window::parse("rect") == WindowType::Rectangular);
        REQUIRE(Window::parse("boxcar") == WindowType::Rectangular);
        REQUIRE(Window::parse("hanning") == WindowType::Hann);
    }

    SECTION("Unknown names are a configuration error") {
        REQUIRE_THROWS_AS(Window::parse("kaiser"), InvalidConfigurationError);
        REQUIRE_THROWS_AS(Window::parse(""), InvalidConfigurationError);
    }
}
