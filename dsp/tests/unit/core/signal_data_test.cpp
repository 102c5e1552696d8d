// ==============================================================================
// Signal Data - Unit Tests
// ==============================================================================
// Layer 0: Core Utilities
//
// Tests for: dsp/include/oscilla/dsp/core/signal_data.h
// Purpose: Verify the sample-count and time-axis invariants and CSV export
// ==============================================================================

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/core/signal_data.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace Oscilla::DSP;
using Catch::Approx;

namespace {

SignalData makeSignal(double sampleRate, double duration) {
    const size_t count = SignalData::expectedSampleCount(sampleRate, duration);
    std::vector<double> times(count);
    SignalData::fillTimes(sampleRate, 0, times.data(), count);
    std::vector<float> amplitudes(count);
    for (size_t i = 0; i < count; ++i) {
        amplitudes[i] = static_cast<float>(i) * 0.5f;
    }
    return SignalData("ramp", MathematicalLaw::sawtooth(1.0, 1.0), sampleRate, duration,
                      std::move(times), std::move(amplitudes));
}

} // namespace

// ==============================================================================
// Invariant Helpers
// ==============================================================================

TEST_CASE("expectedSampleCount rounds sampleRate * duration", "[dsp][core][signal_data]") {
    REQUIRE(SignalData::expectedSampleCount(44100.0, 1.0) == 44100);
    REQUIRE(SignalData::expectedSampleCount(1000.0, 0.0015) == 2);
    REQUIRE(SignalData::expectedSampleCount(1000.0, 0.0) == 0);
    REQUIRE(SignalData::expectedSampleCount(-1.0, 1.0) == 0);
}

TEST_CASE("fillTimes places samples at index / sampleRate", "[dsp][core][signal_data]") {
    std::vector<double> times(4);
    SignalData::fillTimes(100.0, 10, times.data(), times.size());

    REQUIRE(times[0] == 10.0 / 100.0);
    REQUIRE(times[3] == 13.0 / 100.0);
}

// ==============================================================================
// Construction
// ==============================================================================

TEST_CASE("SignalData holds a consistent signal", "[dsp][core][signal_data]") {
    const auto signal = makeSignal(1000.0, 0.01);

    REQUIRE(signal.size() == 10);
    REQUIRE_FALSE(signal.empty());
    REQUIRE(signal.name() == "ramp");
    REQUIRE_FALSE(signal.id().empty());
    REQUIRE(signal.sampleRate() == 1000.0);
    REQUIRE(signal.time(3) == Approx(0.003));
    REQUIRE(signal.amplitude(4) == 2.0f);
    REQUIRE(signal.law().kind() == LawKind::Sawtooth);
    REQUIRE_THROWS_AS(signal.amplitude(10), std::out_of_range);
}

TEST_CASE("Zero-duration signals are empty", "[dsp][core][signal_data]") {
    const auto signal = makeSignal(48000.0, 0.0);
    REQUIRE(signal.empty());
    REQUIRE(signal.size() == 0);
}

TEST_CASE("SignalData rejects broken invariants", "[dsp][core][signal_data]") {
    const auto law = MathematicalLaw::sinusoid(10.0, 1.0);

    SECTION("Wrong sample count") {
        std::vector<double> times(5);
        SignalData::fillTimes(100.0, 0, times.data(), times.size());
        REQUIRE_THROWS_AS(SignalData("bad", law, 100.0, 0.1, times, std::vector<float>(5)), EngineError);
    }

    SECTION("Mismatched array lengths") {
        std::vector<double> times(10);
        SignalData::fillTimes(100.0, 0, times.data(), times.size());
        REQUIRE_THROWS_AS(SignalData("bad", law, 100.0, 0.1, times, std::vector<float>(9)), EngineError);
    }

    SECTION("Uneven time axis") {
        std::vector<double> times(10);
        SignalData::fillTimes(100.0, 0, times.data(), times.size());
        times[5] += 1e-3;
        REQUIRE_THROWS_AS(SignalData("bad", law, 100.0, 0.1, times, std::vector<float>(10)), EngineError);
    }
}

TEST_CASE("Metadata edits update the modification time only", "[dsp][core][signal_data]") {
    auto signal = makeSignal(100.0, 0.1);
    const auto created = signal.createdAt();
    const auto id = signal.id();

    signal.setName("renamed");
    signal.setDescription("a ramp");

    REQUIRE(signal.name() == "renamed");
    REQUIRE(signal.description() == "a ramp");
    REQUIRE(signal.id() == id);
    REQUIRE(signal.createdAt() == created);
    REQUIRE(signal.modifiedAt() >= created);
}

// ==============================================================================
// CSV Export
// ==============================================================================

TEST_CASE("writeCsv emits a header and one row per sample", "[dsp][core][signal_data]") {
    const auto signal = makeSignal(4.0, 1.0);
    std::ostringstream out;

    signal.writeCsv(out);

    std::istringstream in(out.str());
    std::string line;
    std::vector<std::string> lines;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    REQUIRE(lines.size() == 5);
    REQUIRE(lines[0] == "time,signal");
    REQUIRE(lines[1] == "0,0");
    REQUIRE(lines[3] == "0.5,1");
}

TEST_CASE("exportCsv writes a file and reports unwritable paths", "[dsp][core][signal_data]") {
    const auto signal = makeSignal(4.0, 1.0);

    SECTION("Writes to a temporary file") {
        const auto path = std::filesystem::temp_directory_path() / "oscilla_signal_data_test.csv";
        signal.exportCsv(path.string());
        std::ifstream file(path);
        std::string header;
        std::getline(file, header);
        REQUIRE(header == "time,signal");
        file.close();
        std::filesystem::remove(path);
    }

    SECTION("Missing directory is an engine error") {
        const auto path = std::filesystem::temp_directory_path() / "oscilla-no-such-dir" / "x.csv";
        REQUIRE_THROWS_AS(signal.exportCsv(path.string()), EngineError);
    }
}
