// ==============================================================================
// Record Identifiers Implementation
// ==============================================================================

#include "identifiers.h"

#include <array>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <random>

namespace Oscilla {
namespace DSP {

namespace {

std::mt19937_64& identifierEngine() {
    static std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

std::mutex& identifierMutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

std::string generateIdentifier() {
    uint64_t hi = 0;
    uint64_t lo = 0;
    {
        std::lock_guard<std::mutex> lock(identifierMutex());
        hi = identifierEngine()();
        lo = identifierEngine()();
    }

    // Version 4, RFC 4122 variant
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::array<char, 37> text{};
    std::snprintf(text.data(), text.size(), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFFU),
                  static_cast<unsigned>(hi & 0xFFFFU),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return std::string(text.data());
}

} // namespace DSP
} // namespace Oscilla
