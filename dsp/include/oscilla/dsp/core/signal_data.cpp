// ==============================================================================
// Signal Data Implementation
// ==============================================================================

#include "signal_data.h"

#include "engine_errors.h"
#include "identifiers.h"

#include <cmath>
#include <fstream>
#include <limits>
#include <ostream>
#include <utility>

namespace Oscilla {
namespace DSP {

SignalData::SignalData(std::string name, MathematicalLaw law, double sampleRate, double duration,
                       std::vector<double> times, std::vector<float> amplitudes)
    : id_(generateIdentifier())
    , name_(std::move(name))
    , createdAt_(Clock::now())
    , modifiedAt_(createdAt_)
    , law_(std::move(law))
    , sampleRate_(sampleRate)
    , duration_(duration)
    , times_(std::move(times))
    , amplitudes_(std::move(amplitudes)) {
    const size_t expected = expectedSampleCount(sampleRate_, duration_);
    if (times_.size() != expected || amplitudes_.size() != expected) {
        throw EngineError("signal '" + name_ + "' holds " + std::to_string(amplitudes_.size()) +
                          " samples, expected " + std::to_string(expected));
    }
    for (size_t i = 0; i < times_.size(); ++i) {
        if (times_[i] != static_cast<double>(i) / sampleRate_) {
            throw EngineError("signal '" + name_ + "' time axis is not evenly spaced");
        }
    }
}

size_t SignalData::expectedSampleCount(double sampleRate, double duration) noexcept {
    const double product = sampleRate * duration;
    if (!(product > 0.0) || !std::isfinite(product)) return 0;
    return static_cast<size_t>(std::llround(product));
}

void SignalData::fillTimes(double sampleRate, size_t firstIndex, double* times, size_t count) noexcept {
    if (times == nullptr) return;
    for (size_t i = 0; i < count; ++i) {
        times[i] = static_cast<double>(firstIndex + i) / sampleRate;
    }
}

void SignalData::setName(std::string name) {
    name_ = std::move(name);
    touch();
}

void SignalData::setDescription(std::string description) {
    description_ = std::move(description);
    touch();
}

void SignalData::writeCsv(std::ostream& out) const {
    const auto previous = out.precision(std::numeric_limits<double>::max_digits10);
    out << "time,signal\n";
    for (size_t i = 0; i < amplitudes_.size(); ++i) {
        out << times_[i] << ',' << amplitudes_[i] << '\n';
    }
    out.precision(previous);
}

void SignalData::exportCsv(const std::string& path) const {
    std::ofstream file(path, std::ios::out | std::ios::trunc);
    if (!file) {
        throw EngineError("cannot open '" + path + "' for writing");
    }
    writeCsv(file);
    file.flush();
    if (!file) {
        throw EngineError("failed writing signal to '" + path + "'");
    }
}

}  // namespace DSP
}  // namespace Oscilla
