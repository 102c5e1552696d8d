// ==============================================================================
// Layer 0: Core Type - Signal Data
// ==============================================================================
// A discretized signal: the generating law, its sample rate and duration, and
// the ordered (time, amplitude) sample pairs.
//
// Invariants (checked at construction):
// - size() == round(sampleRate * duration)
// - time(i) == i / sampleRate (strictly increasing, evenly spaced)
//
// SignalData is owned by the generator that created it until it is handed
// downstream as std::shared_ptr<const SignalData>.
// ==============================================================================

#pragma once

#include <oscilla/dsp/core/mathematical_law.h>

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace Oscilla {
namespace DSP {

class SignalData {
public:
    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    /// @brief Construct from already evaluated samples
    /// @throws EngineError if the sample vectors break the count/spacing invariants
    SignalData(std::string name, MathematicalLaw law, double sampleRate, double duration,
               std::vector<double> times, std::vector<float> amplitudes);

    // -------------------------------------------------------------------------
    // Invariant Helpers
    // -------------------------------------------------------------------------

    /// @brief round(sampleRate * duration), the sample count of any valid signal
    [[nodiscard]] static size_t expectedSampleCount(double sampleRate, double duration) noexcept;

    /// @brief Fill times[i] = (firstIndex + i) / sampleRate
    static void fillTimes(double sampleRate, size_t firstIndex, double* times, size_t count) noexcept;

    // -------------------------------------------------------------------------
    // Query
    // -------------------------------------------------------------------------

    [[nodiscard]] const std::string& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& description() const noexcept { return description_; }
    [[nodiscard]] TimePoint createdAt() const noexcept { return createdAt_; }
    [[nodiscard]] TimePoint modifiedAt() const noexcept { return modifiedAt_; }
    [[nodiscard]] const MathematicalLaw& law() const noexcept { return law_; }
    [[nodiscard]] double sampleRate() const noexcept { return sampleRate_; }
    [[nodiscard]] double duration() const noexcept { return duration_; }

    [[nodiscard]] size_t size() const noexcept { return amplitudes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return amplitudes_.empty(); }
    [[nodiscard]] const std::vector<double>& times() const noexcept { return times_; }
    [[nodiscard]] const std::vector<float>& amplitudes() const noexcept { return amplitudes_; }
    [[nodiscard]] double time(size_t index) const { return times_.at(index); }
    [[nodiscard]] float amplitude(size_t index) const { return amplitudes_.at(index); }

    // -------------------------------------------------------------------------
    // Metadata
    // -------------------------------------------------------------------------

    void setName(std::string name);
    void setDescription(std::string description);

    // -------------------------------------------------------------------------
    // Export
    // -------------------------------------------------------------------------

    /// @brief Write "time,signal" CSV (header plus one row per sample)
    void writeCsv(std::ostream& out) const;

    /// @brief Write CSV to a file
    /// @throws EngineError if the file cannot be opened or written
    void exportCsv(const std::string& path) const;

private:
    void touch() noexcept { modifiedAt_ = Clock::now(); }

    std::string id_;
    std::string name_;
    std::string description_;
    TimePoint createdAt_;
    TimePoint modifiedAt_;
    MathematicalLaw law_;
    double sampleRate_;
    double duration_;
    std::vector<double> times_;
    std::vector<float> amplitudes_;
};

}  // namespace DSP
}  // namespace Oscilla
