// ==============================================================================
// Layer 3: System Component - Analysis Worker Pool
// ==============================================================================
// Fixed set of worker threads draining a FIFO task queue. Used to run
// analysis sessions off the caller's thread.
//
// shutdown() stops accepting work, lets the workers drain what is queued and
// joins them. The destructor calls shutdown().
// ==============================================================================

#pragma once

#include <oscilla/dsp/core/engine_errors.h>

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace Oscilla {
namespace DSP {

class AnalysisWorkerPool {
public:
    /// @throws InvalidConfigurationError if workers is zero
    explicit AnalysisWorkerPool(size_t workers);
    ~AnalysisWorkerPool();

    AnalysisWorkerPool(const AnalysisWorkerPool&) = delete;
    AnalysisWorkerPool& operator=(const AnalysisWorkerPool&) = delete;

    /// @brief Queue a task; its result or exception arrives through the future
    /// @throws EngineError after shutdown()
    template <typename Task>
    auto submit(Task&& task) -> std::future<std::invoke_result_t<std::decay_t<Task>>> {
        using Result = std::invoke_result_t<std::decay_t<Task>>;
        auto packaged = std::make_shared<std::packaged_task<Result()>>(std::forward<Task>(task));
        std::future<Result> future = packaged->get_future();
        enqueue([packaged] { (*packaged)(); });
        return future;
    }

    /// @brief Drain queued tasks and join the workers. Idempotent.
    void shutdown();

    [[nodiscard]] size_t workerCount() const noexcept { return workers_.size(); }
    [[nodiscard]] size_t pendingTasks() const;

private:
    void enqueue(std::function<void()> job);
    void workerLoop();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> queue_;
    mutable std::mutex mutex_;
    std::condition_variable available_;
    bool stopping_ = false;
};

}  // namespace DSP
}  // namespace Oscilla
