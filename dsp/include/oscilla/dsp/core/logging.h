// ==============================================================================
// Layer 0: Core Utility - Engine Logger
// ==============================================================================
// One named spdlog logger ("oscilla") shared by every engine component.
// Colored stdout sink by default; Log::configure() can add a file sink and
// change level and pattern.
//
// Never called from the ring buffer write path or inside FFT kernels.
// ==============================================================================

#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace Oscilla {
namespace DSP {

/// @brief Logger settings (the "logging" section of the engine configuration)
struct LoggingConfig {
    std::string level = "info";   ///< trace, debug, info, warn, error, critical, off
    std::string file;             ///< Optional log file; empty = stdout only
    std::string pattern;          ///< spdlog pattern; empty = spdlog default
};

namespace Log {

/// Name under which the engine logger is registered with spdlog
inline constexpr const char* kLoggerName = "oscilla";

/// @brief The engine logger, created with a stdout sink on first use
[[nodiscard]] std::shared_ptr<spdlog::logger> get();

/// @brief Rebuild the engine logger from settings
/// @throws InvalidConfigurationError for an unknown level or an unwritable file
void configure(const LoggingConfig& config);

} // namespace Log

}  // namespace DSP
}  // namespace Oscilla
