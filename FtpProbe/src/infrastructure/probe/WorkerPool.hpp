/**
 * @file WorkerPool.hpp
 * @brief Single-batch thread pool used by the probe scheduler.
 */

#pragma once

#include <asio.hpp>
#include <atomic>
#include <cstddef>
#include <optional>
#include <thread>
#include <vector>

namespace ftpprobe::infra {

/**
 * @brief Threads that execute one batch of probe handlers.
 *
 * The threads are spawned by the constructor and stay alive while the batch
 * is open. drain() closes the batch: handlers already posted still run, then
 * every thread exits. A handler that throws is logged and counted; the
 * thread that ran it keeps serving the batch.
 *
 * A pool is not reusable once drained.
 */
class WorkerPool {
public:
    /**
     * @param threadCount Worker threads to spawn (at least one).
     */
    explicit WorkerPool(size_t threadCount);

    /// Drains the batch if the owner did not.
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queues a handler for the batch. Must not be called after drain().
     */
    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(batch_, std::forward<Handler>(handler));
    }

    /**
     * @brief Closes the batch and blocks until every queued handler has run.
     */
    void drain();

    size_t threadCount() const { return threads_.size(); }

    /// Handlers that ended with an exception.
    size_t failedHandlers() const { return failedHandlers_.load(); }

private:
    void serve(size_t worker);

    asio::io_context batch_;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>> open_;
    std::vector<std::thread> threads_;
    std::atomic<size_t> failedHandlers_{0};
};

} // namespace ftpprobe::infra
