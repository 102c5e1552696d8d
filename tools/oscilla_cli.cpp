// ==============================================================================
// Oscilla Command-Line Tool
// ==============================================================================
// Loads an engine configuration, generates the configured signal, analyzes it
// and prints a summary. Optionally exports the signal as CSV and runs the
// streaming producer for a number of frames.
//
// Usage:
//   oscilla_cli [config.yaml] [--csv out.csv] [--stream N] [--strategy auto|gpu|cpu]
//
// Without a config file the built-in defaults are used (440 Hz sinusoid).
// Exit codes: 0 success, 1 engine error, 2 usage error.
// ==============================================================================

#include <oscilla/dsp/core/engine_errors.h>
#include <oscilla/dsp/core/logging.h>
#include <oscilla/dsp/engine/signal_engine.h>
#include <oscilla/dsp/processors/compute_strategy.h>

#include <cstdint>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

using namespace Oscilla::DSP;

namespace {

struct Options {
    std::string configPath;
    std::string csvPath;
    uint64_t streamFrames = 0;
    std::optional<ComputeStrategy> strategy;
};

void printUsage(const char* program) {
    std::cerr << "usage: " << program
              << " [config.yaml] [--csv out.csv] [--stream N] [--strategy auto|gpu|cpu]\n";
}

std::optional<Options> parseArguments(int argc, char* argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        const bool hasValue = (i + 1 < argc);

        if (arg == "--help" || arg == "-h") {
            return std::nullopt;
        }
        if (arg == "--csv" && hasValue) {
            options.csvPath = argv[++i];
        } else if (arg == "--stream" && hasValue) {
            char* end = nullptr;
            const unsigned long long frames = std::strtoull(argv[++i], &end, 10);
            if (end == nullptr || *end != '\0') return std::nullopt;
            options.streamFrames = frames;
        } else if (arg == "--strategy" && hasValue) {
            options.strategy = parseComputeStrategy(argv[++i]);
        } else if (!arg.empty() && arg.front() != '-' && options.configPath.empty()) {
            options.configPath = std::string(arg);
        } else {
            return std::nullopt;
        }
    }
    return options;
}

void printSummary(const SignalData& signal, const AnalysisSession& session) {
    std::cout << "signal   " << signal.name() << " (" << signal.id() << ")\n"
              << "         " << signal.size() << " samples at " << signal.sampleRate() << " Hz\n"
              << "session  " << session.name << ": " << analysisStatusName(session.status) << "\n";

    if (session.results.empty()) {
        if (!session.errorMessage.empty()) {
            std::cout << "error    " << session.errorMessage << "\n";
        }
        return;
    }

    const SpectralAnalysisResult& result = session.results.front();
    std::cout << std::fixed << std::setprecision(3)
              << "frames   " << result.frameCount << " (bin width " << result.binWidth << " Hz)\n";

    if (!result.hasFundamental()) {
        std::cout << "fundamental: none above the noise floor\n";
    } else {
        std::cout << "fundamental " << result.fundamentalFrequency << " Hz, amplitude "
                  << result.fundamentalAmplitude << "\n";
        for (const auto& harmonic : result.harmonics) {
            std::cout << "  H" << harmonic.order << "  " << std::setw(12) << harmonic.frequency << " Hz  "
                      << harmonic.amplitude << "\n";
        }
        std::cout << "THD      " << result.thdPercent << " %\n";
    }

    const SignalStatistics& stats = result.statistics;
    std::cout << "rms " << stats.rms << ", peak-to-peak " << stats.peakToPeak << ", crest "
              << stats.crestFactor << "\n";
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<Options> options;
    try {
        options = parseArguments(argc, argv);
    } catch (const EngineError& e) {
        std::cerr << e.what() << "\n";
        options.reset();
    }
    if (!options) {
        printUsage(argv[0]);
        return 2;
    }

    try {
        EngineConfig config = options->configPath.empty() ? EngineConfig{}
                                                          : loadEngineConfig(options->configPath);
        config = applyEnvironmentOverrides(std::move(config));
        if (options->strategy) {
            config.computeStrategy = *options->strategy;
        }

        SignalEngine engine(std::move(config));
        engine.hub().subscribe<DegradedToCpu>("cli", [](const DegradedToCpu& event) {
            std::cerr << "note: running on the CPU path (" << event.reason << ")\n";
        });

        const auto signal = engine.generate();
        const auto session = engine.analyze({signal});
        printSummary(*signal, *session);

        if (!options->csvPath.empty()) {
            signal->exportCsv(options->csvPath);
            std::cout << "wrote " << options->csvPath << "\n";
        }

        if (options->streamFrames > 0) {
            auto producer = engine.createStreamingProducer(true, options->streamFrames);
            producer->start();
            producer->join();
            std::cout << "streamed " << producer->framesProduced() << " frames ("
                      << streamingStatusName(producer->status()) << "), ring holds "
                      << engine.ringBuffer().size() << "\n";
        }

        return session->status == AnalysisStatus::Completed ? 0 : 1;
    } catch (const EngineError& e) {
        Log::get()->error("{}", e.what());
        return 1;
    }
}
