// ==============================================================================
// Layer 0: Core Utility - Record Identifiers
// ==============================================================================
// Random 128-bit identifiers rendered in the canonical 8-4-4-4-12 UUID form
// (version 4 / RFC 4122 variant bits set). Used for laws, signals, sessions
// and persisted records.
// ==============================================================================

#pragma once

#include <string>

namespace Oscilla {
namespace DSP {

/// @brief Generate a new random identifier. Thread-safe.
[[nodiscard]] std::string generateIdentifier();

}  // namespace DSP
}  // namespace Oscilla
