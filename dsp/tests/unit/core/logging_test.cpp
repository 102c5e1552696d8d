// ==============================================================================
// Engine Logger - Unit Tests
// ==============================================================================
// Layer 0: Core Utilities
//
// Tests for: dsp/include/oscilla/dsp/core/logging.h
// Purpose: Verify the shared spdlog logger and its configuration
// ==============================================================================

#include <catch2/catch_test_macros.hpp>

#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/core/logging.h>

#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

using namespace Oscilla::DSP;

namespace {

// Restore the default logger after each test that reconfigures it
struct LoggerReset {
    ~LoggerReset() { Log::configure(LoggingConfig{}); }
};

} // namespace

TEST_CASE("Log::get returns the shared oscilla logger", "[dsp][core][logging]") {
    const auto first = Log::get();
    const auto second = Log::get();

    REQUIRE(first != nullptr);
    REQUIRE(first == second);
    REQUIRE(first->name() == Log::kLoggerName);
}

TEST_CASE("Log::configure applies the level", "[dsp][core][logging]") {
    LoggerReset reset;

    SECTION("Named levels are applied") {
        Log::configure(LoggingConfig{"debug", "", ""});
        REQUIRE(Log::get()->level() == spdlog::level::debug);

        Log::configure(LoggingConfig{"warn", "", ""});
        REQUIRE(Log::get()->level() == spdlog::level::warn);
    }

    SECTION("off is a valid level") {
        Log::configure(LoggingConfig{"off", "", ""});
        REQUIRE(Log::get()->level() == spdlog::level::off);
    }

    SECTION("Unknown levels are a configuration error") {
        REQUIRE_THROWS_AS(Log::configure(LoggingConfig{"chatty", "", ""}), InvalidConfigurationError);
    }
}

TEST_CASE("Log::configure writes to the configured file", "[dsp][core][logging]") {
    LoggerReset reset;
    const auto path = std::filesystem::temp_directory_path() / "oscilla_logging_test.log";
    std::filesystem::remove(path);

    Log::configure(LoggingConfig{"info", path.string(), "%v"});
    Log::get()->info("hello from the logging test");
    Log::get()->flush();

    std::ifstream file(path);
    REQUIRE(file.good());
    const std::string contents((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    REQUIRE(contents.find("hello from the logging test") != std::string::npos);

    file.close();
    Log::configure(LoggingConfig{});
    std::filesystem::remove(path);
}
