// ==============================================================================
// FFT - Unit Tests
// ==============================================================================
// Layer 1: DSP Primitives
//
// Tests for: dsp/include/oscilla/dsp/primitives/fft.h (pffft)
//            dsp/include/oscilla/dsp/primitives/scalar_fft.h (radix-2)
// Purpose: Verify both real transforms share one bin layout and scaling
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <oscilla/dsp/primitives/fft.h>
#include <oscilla/dsp/primitives/scalar_fft.h>

#include <test_signals.h>

#include <cmath>
#include <vector>

using namespace Oscilla::DSP;
using Catch::Approx;

// ==============================================================================
// Size Support
// ==============================================================================

TEST_CASE("isSupportedFFTSize accepts powers of two in range", "[dsp][primitives][fft]") {
    REQUIRE(isSupportedFFTSize(32));
    REQUIRE(isSupportedFFTSize(1024));
    REQUIRE(isSupportedFFTSize(kMaxFFTSize));

    REQUIRE_FALSE(isSupportedFFTSize(0));
    REQUIRE_FALSE(isSupportedFFTSize(16));
    REQUIRE_FALSE(isSupportedFFTSize(1000));
    REQUIRE_FALSE(isSupportedFFTSize(kMaxFFTSize * 2));
}

TEST_CASE("Unsupported sizes leave the transform unprepared", "[dsp][primitives][fft]") {
    FFT fft;
    fft.prepare(1000);
    REQUIRE_FALSE(fft.isPrepared());
    REQUIRE(fft.size() == 0);

    ScalarFFT scalar;
    scalar.prepare(8);
    REQUIRE_FALSE(scalar.isPrepared());
}

// ==============================================================================
// Forward Transform
// ==============================================================================

template <typename Transform>
void checkBinLayout() {
    constexpr size_t kSize = 256;
    Transform fft;
    fft.prepare(kSize);
    REQUIRE(fft.isPrepared());
    REQUIRE(fft.numBins() == kSize / 2 + 1);

    SECTION("A bin-centered cosine lands in one bin with magnitude N/2") {
        std::vector<float> input(kSize);
        for (size_t n = 0; n < kSize; ++n) {
            input[n] = static_cast<float>(std::cos(TestHelpers::kTwoPiD * 8.0 * static_cast<double>(n) / kSize));
        }
        std::vector<Complex> spectrum(fft.numBins());
        fft.forward(input.data(), spectrum.data());

        REQUIRE(spectrum[8].real == Approx(kSize / 2.0).margin(1e-3));
        REQUIRE(spectrum[8].imag == Approx(0.0).margin(1e-3));
        for (size_t k = 0; k < fft.numBins(); ++k) {
            if (k == 8) continue;
            REQUIRE(spectrum[k].magnitude() == Approx(0.0).margin(1e-3));
        }
    }

    SECTION("DC and Nyquist are real") {
        std::vector<float> input(kSize);
        for (size_t n = 0; n < kSize; ++n) {
            input[n] = 0.5f + ((n % 2 == 0) ? 0.25f : -0.25f);
        }
        std::vector<Complex> spectrum(fft.numBins());
        fft.forward(input.data(), spectrum.data());

        REQUIRE(spectrum[0].real == Approx(0.5 * kSize).margin(1e-3));
        REQUIRE(spectrum[0].imag == 0.0f);
        REQUIRE(spectrum[kSize / 2].real == Approx(0.25 * kSize).margin(1e-3));
        REQUIRE(spectrum[kSize / 2].imag == 0.0f);
    }

    SECTION("A sine has a negative imaginary part at its bin") {
        const auto input = TestHelpers::generateSine(kSize, 4.0, static_cast<double>(kSize));
        std::vector<Complex> spectrum(fft.numBins());
        fft.forward(input.data(), spectrum.data());

        REQUIRE(spectrum[4].real == Approx(0.0).margin(1e-3));
        REQUIRE(spectrum[4].imag == Approx(-(kSize / 2.0)).margin(1e-3));
    }
}

TEST_CASE("FFT forward bin layout", "[dsp][primitives][fft]") {
    checkBinLayout<FFT>();
}

TEST_CASE("ScalarFFT forward bin layout", "[dsp][primitives][fft]") {
    checkBinLayout<ScalarFFT>();
}

// ==============================================================================
// Inverse Transform
// ==============================================================================

template <typename Transform>
void checkInverseRestoresInput(size_t size) {
    Transform fft;
    fft.prepare(size);
    REQUIRE(fft.isPrepared());

    const auto input = TestHelpers::generateWhiteNoise(size, 1.0f, 7);
    std::vector<Complex> spectrum(fft.numBins());
    std::vector<float> output(size, 0.0f);

    fft.forward(input.data(), spectrum.data());
    fft.inverse(spectrum.data(), output.data());

    for (size_t n = 0; n < size; ++n) {
        REQUIRE(output[n] == Approx(input[n]).margin(1e-4));
    }
}

TEST_CASE("Inverse transform is scaled by 1/N", "[dsp][primitives][fft]") {
    SECTION("pffft") {
        checkInverseRestoresInput<FFT>(1024);
    }
    SECTION("radix-2") {
        checkInverseRestoresInput<ScalarFFT>(1024);
    }
}

TEST_CASE("FFT and ScalarFFT agree", "[dsp][primitives][fft]") {
    constexpr size_t kSize = 2048;
    const auto input = TestHelpers::generateWhiteNoise(kSize, 0.5f, 99);

    FFT fast;
    ScalarFFT reference;
    fast.prepare(kSize);
    reference.prepare(kSize);

    std::vector<Complex> a(kSize / 2 + 1);
    std::vector<Complex> b(kSize / 2 + 1);
    fast.forward(input.data(), a.data());
    reference.forward(input.data(), b.data());

    for (size_t k = 0; k < a.size(); ++k) {
        REQUIRE(a[k].real == Approx(b[k].real).margin(2e-3));
        REQUIRE(a[k].imag == Approx(b[k].imag).margin(2e-3));
    }
}

TEST_CASE("Transforms ignore null buffers", "[dsp][primitives][fft]") {
    FFT fft;
    fft.prepare(64);
    std::vector<Complex> spectrum(33, Complex{1.0f, 1.0f});

    fft.forward(nullptr, spectrum.data());
    REQUIRE(spectrum[0].real == 1.0f);

    FFT unprepared;
    std::vector<float> input(64, 1.0f);
    unprepared.forward(input.data(), spectrum.data());
    REQUIRE(spectrum[0].real == 1.0f);
}
