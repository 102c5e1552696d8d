// ==============================================================================
// Analysis Worker Pool Implementation
// ==============================================================================

#include "analysis_worker_pool.h"

#include <oscilla/dsp/core/logging.h>

namespace Oscilla {
namespace DSP {

AnalysisWorkerPool::AnalysisWorkerPool(size_t workers) {
    if (workers == 0) {
        throw InvalidConfigurationError("analysis_workers must be at least 1");
    }
    workers_.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        workers_.emplace_back(&AnalysisWorkerPool::workerLoop, this);
    }
    Log::get()->debug("analysis worker pool started with {} workers", workers);
}

AnalysisWorkerPool::~AnalysisWorkerPool() {
    shutdown();
}

void AnalysisWorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    available_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
    workers_.clear();
}

size_t AnalysisWorkerPool::pendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

void AnalysisWorkerPool::enqueue(std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw EngineError("analysis worker pool is shut down");
        }
        queue_.push(std::move(job));
    }
    available_.notify_one();
}

void AnalysisWorkerPool::workerLoop() {
    for (;;) {
        std::function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            available_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) return;  // stopping and drained
            job = std::move(queue_.front());
            queue_.pop();
        }
        // packaged_task stores any exception in its future
        job();
    }
}

}  // namespace DSP
}  // namespace Oscilla
