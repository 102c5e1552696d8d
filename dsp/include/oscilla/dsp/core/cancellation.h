// ==============================================================================
// Layer 0: Core Utility - Cooperative Cancellation
// ==============================================================================
// CancellationSource owns a shared flag; CancellationToken observes it.
// Long-running work (streaming generation, frame-by-frame analysis) polls the
// token at its natural suspension points and stops with a terminal
// "cancelled" status.
//
// A default-constructed token is never cancelled.
// ==============================================================================

#pragma once

#include <atomic>
#include <memory>
#include <utility>

namespace Oscilla {
namespace DSP {

class CancellationSource;

/// @brief Read-only view of a cancellation flag. Cheap to copy.
class CancellationToken {
public:
    CancellationToken() noexcept = default;

    /// @brief True once the owning source requested cancellation
    [[nodiscard]] bool isCancellationRequested() const noexcept {
        return flag_ != nullptr && flag_->load(std::memory_order_acquire);
    }

    /// @brief True if a source can ever cancel this token
    [[nodiscard]] bool canBeCancelled() const noexcept { return flag_ != nullptr; }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> flag) noexcept
        : flag_(std::move(flag)) {}

    std::shared_ptr<const std::atomic<bool>> flag_;
};

/// @brief Owner of a cancellation flag.
class CancellationSource {
public:
    CancellationSource() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    /// @brief Request cancellation. Idempotent, thread-safe.
    void requestCancellation() noexcept { flag_->store(true, std::memory_order_release); }

    [[nodiscard]] bool isCancellationRequested() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

    [[nodiscard]] CancellationToken token() const noexcept { return CancellationToken(flag_); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace DSP
}  // namespace Oscilla
