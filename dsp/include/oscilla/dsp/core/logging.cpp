// ==============================================================================
// Engine Logger Implementation
// ==============================================================================

#include "logging.h"

#include "engine_errors.h"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <utility>
#include <vector>

namespace Oscilla {
namespace DSP {
namespace Log {

namespace {

std::mutex& loggerMutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger>& loggerSlot() {
    static std::shared_ptr<spdlog::logger> logger;
    return logger;
}

std::shared_ptr<spdlog::logger> makeDefaultLogger() {
    auto logger = std::make_shared<spdlog::logger>(
        kLoggerName, std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    logger->set_level(spdlog::level::info);
    return logger;
}

} // namespace

std::shared_ptr<spdlog::logger> get() {
    std::lock_guard<std::mutex> lock(loggerMutex());
    auto& logger = loggerSlot();
    if (!logger) {
        logger = makeDefaultLogger();
    }
    return logger;
}

void configure(const LoggingConfig& config) {
    const auto level = spdlog::level::from_str(config.level);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && config.level != "off") {
        throw InvalidConfigurationError("unknown logging level '" + config.level + "'");
    }

    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!config.file.empty()) {
        try {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file));
        } catch (const spdlog::spdlog_ex& e) {
            throw InvalidConfigurationError("cannot open log file '" + config.file + "': " + e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    logger->set_level(level);
    if (!config.pattern.empty()) {
        logger->set_pattern(config.pattern);
    }

    std::lock_guard<std::mutex> lock(loggerMutex());
    loggerSlot() = std::move(logger);
}

} // namespace Log
}  // namespace DSP
}  // namespace Oscilla
