#include "infrastructure/probe/WorkerPool.hpp"

#include <spdlog/spdlog.h>

namespace ftpprobe::infra {

WorkerPool::WorkerPool(size_t threadCount) : open_(asio::make_work_guard(batch_)) {
    const size_t count = threadCount > 0 ? threadCount : 1;
    threads_.reserve(count);
    for (size_t worker = 0; worker < count; ++worker) {
        threads_.emplace_back([this, worker]() { serve(worker); });
    }
    spdlog::debug("Worker pool serving with {} threads", count);
}

WorkerPool::~WorkerPool() {
    drain();
}

void WorkerPool::serve(size_t worker) {
    // run() returns normally only once the batch is closed and empty
    while (true) {
        try {
            batch_.run();
            return;
        } catch (const std::exception& e) {
            ++failedHandlers_;
            spdlog::error("Probe worker {} handler failed: {}", worker, e.what());
        }
    }
}

void WorkerPool::drain() {
    if (!open_) {
        return;
    }
    open_.reset();

    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    spdlog::debug("Worker pool drained, {} failed handlers", failedHandlers_.load());
}

} // namespace ftpprobe::infra
